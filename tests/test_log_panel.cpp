#include <gtest/gtest.h>
#include "ui/log_panel.hpp"

#include <ftxui/component/event.hpp>

#include <filesystem>
#include <fstream>
#include <unistd.h>

namespace fs = std::filesystem;

namespace {

std::string read_file(const std::string& path) {
    std::ifstream f(path);
    return std::string((std::istreambuf_iterator<char>(f)), std::istreambuf_iterator<char>());
}

} // namespace

TEST(LogPanelTest, IgnoresSentinels) {
    LogPanel panel;
    panel.push(SupervisorEvent::signal(Sentinel::Ready, "http://127.0.0.1:5000/"));
    EXPECT_EQ(panel.size(), 0u);
    panel.push(SupervisorEvent::log("Starting service..."));
    EXPECT_EQ(panel.size(), 1u);
}

TEST(LogPanelTest, PostsRefreshOnPush) {
    LogPanel panel;
    int refreshes = 0;
    panel.set_callbacks({[&] { ++refreshes; }, nullptr});
    panel.push(SupervisorEvent::log("a"));
    panel.push(SupervisorEvent::log("b", LogSource::Service));
    EXPECT_EQ(refreshes, 2);
}

TEST(LogPanelTest, FilterBySource) {
    LogPanel panel;
    panel.push(SupervisorEvent::log("supervisor 1"));
    panel.push(SupervisorEvent::log("service 1", LogSource::Service));
    panel.push(SupervisorEvent::log("service 2", LogSource::Service));

    EXPECT_EQ(panel.visible_count(), 3u);
    panel.set_filter(LogPanel::Filter::Supervisor);
    EXPECT_EQ(panel.visible_count(), 1u);
    panel.set_filter(LogPanel::Filter::Service);
    EXPECT_EQ(panel.visible_count(), 2u);
    EXPECT_EQ(panel.size(), 3u);
}

TEST(LogPanelTest, BufferIsBounded) {
    LogPanel panel;
    for (int i = 0; i < 1500; ++i) {
        panel.push(SupervisorEvent::log("line " + std::to_string(i)));
    }
    EXPECT_EQ(panel.size(), 1000u);
}

TEST(LogPanelTest, KeysDriveFilterAndFreeze) {
    LogPanel panel;
    auto comp = panel.component();

    EXPECT_TRUE(comp->OnEvent(ftxui::Event::Character('3')));
    EXPECT_EQ(panel.filter(), LogPanel::Filter::Service);
    EXPECT_TRUE(comp->OnEvent(ftxui::Event::Character('2')));
    EXPECT_EQ(panel.filter(), LogPanel::Filter::Supervisor);
    EXPECT_TRUE(comp->OnEvent(ftxui::Event::Character('1')));
    EXPECT_EQ(panel.filter(), LogPanel::Filter::All);

    EXPECT_FALSE(panel.frozen());
    EXPECT_TRUE(comp->OnEvent(ftxui::Event::Character('F')));
    EXPECT_TRUE(panel.frozen());
    panel.toggle_freeze();
    EXPECT_FALSE(panel.frozen());

    EXPECT_FALSE(comp->OnEvent(ftxui::Event::Character('s')));
}

TEST(LogPanelTest, RendersEmptyAndFull) {
    LogPanel panel;
    auto comp = panel.component();
    EXPECT_NE(comp->Render(), nullptr);
    panel.push(SupervisorEvent::log("hello", LogSource::Service));
    EXPECT_NE(comp->Render(), nullptr);
}

TEST(LogPanelTest, ExportVisibleLines) {
    LogPanel panel;
    panel.push(SupervisorEvent::log("Starting service..."));
    panel.push(SupervisorEvent::log("listening on 5000", LogSource::Service));
    panel.set_filter(LogPanel::Filter::Service);

    auto path = (fs::temp_directory_path() /
                 ("svpanel-test-export-" + std::to_string(getpid()) + ".log")).string();
    ASSERT_TRUE(panel.export_to(path));

    auto content = read_file(path);
    EXPECT_NE(content.find("[service] listening on 5000"), std::string::npos);
    EXPECT_EQ(content.find("Starting service"), std::string::npos);
    fs::remove(path);
}

TEST(LogPanelTest, ExportToBadPathFails) {
    LogPanel panel;
    panel.push(SupervisorEvent::log("x"));
    EXPECT_FALSE(panel.export_to("/nonexistent-dir/svpanel.log"));
}
