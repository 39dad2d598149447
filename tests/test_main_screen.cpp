#include <gtest/gtest.h>
#include "ui/main_screen.hpp"

#include <ftxui/component/event.hpp>

using ftxui::Event;

TEST(ActionStateTest, EnabledActionsPerStatus) {
    auto stopped = actions_for(ServiceStatus::Stopped);
    EXPECT_TRUE(stopped.start);
    EXPECT_FALSE(stopped.stop);
    EXPECT_FALSE(stopped.restart);

    auto error = actions_for(ServiceStatus::Error);
    EXPECT_TRUE(error.start);
    EXPECT_FALSE(error.stop);

    auto running = actions_for(ServiceStatus::Running);
    EXPECT_FALSE(running.start);
    EXPECT_TRUE(running.stop);
    EXPECT_TRUE(running.restart);

    for (auto s : {ServiceStatus::Starting, ServiceStatus::Stopping}) {
        auto busy = actions_for(s);
        EXPECT_FALSE(busy.start);
        EXPECT_FALSE(busy.stop);
        EXPECT_FALSE(busy.restart);
    }
}

class MainScreenTest : public ::testing::Test {
protected:
    MainScreen screen;
    ftxui::Component comp;
    int starts = 0, stops = 0, restarts = 0, refreshes = 0, kills = 0, toggles = 0;
    std::vector<MainScreen::QuitChoice> quits;

    void SetUp() override {
        MainScreen::Callbacks cb;
        cb.on_start = [this] { ++starts; };
        cb.on_stop = [this] { ++stops; };
        cb.on_restart = [this] { ++restarts; };
        cb.on_refresh = [this] { ++refreshes; };
        cb.on_kill_blocker = [this] { ++kills; };
        cb.on_toggle_lang = [this] { ++toggles; };
        cb.on_quit = [this](MainScreen::QuitChoice c) { quits.push_back(c); };
        screen.set_callbacks(cb);
        comp = screen.component();
    }
};

TEST_F(MainScreenTest, KeysGatedByStatus) {
    screen.set_status(ServiceStatus::Stopped);
    EXPECT_TRUE(comp->OnEvent(Event::Character('s')));
    EXPECT_FALSE(comp->OnEvent(Event::Character('t')));
    EXPECT_FALSE(comp->OnEvent(Event::Character('r')));
    EXPECT_EQ(starts, 1);
    EXPECT_EQ(stops, 0);

    screen.set_status(ServiceStatus::Running);
    EXPECT_FALSE(comp->OnEvent(Event::Character('S')));
    EXPECT_TRUE(comp->OnEvent(Event::Character('T')));
    EXPECT_TRUE(comp->OnEvent(Event::Character('R')));
    EXPECT_EQ(starts, 1);
    EXPECT_EQ(stops, 1);
    EXPECT_EQ(restarts, 1);

    screen.set_status(ServiceStatus::Starting);
    EXPECT_FALSE(comp->OnEvent(Event::Character('s')));
    EXPECT_FALSE(comp->OnEvent(Event::Character('t')));
    EXPECT_TRUE(comp->OnEvent(Event::Character('u')));
    EXPECT_EQ(refreshes, 1);
}

TEST_F(MainScreenTest, KillOnlyWhileBlocked) {
    EXPECT_FALSE(comp->OnEvent(Event::Character('k')));
    screen.set_port_blocker(true, "PID 42 (python3)");
    EXPECT_TRUE(comp->OnEvent(Event::Character('k')));
    EXPECT_EQ(kills, 1);
    screen.set_port_blocker(false, "");
    EXPECT_FALSE(comp->OnEvent(Event::Character('K')));
    EXPECT_EQ(kills, 1);
}

TEST_F(MainScreenTest, CtrlLTogglesLanguage) {
    EXPECT_TRUE(comp->OnEvent(Event::Special("\x0C")));
    EXPECT_EQ(toggles, 1);
}

TEST_F(MainScreenTest, QuitWhenStoppedSkipsDialog) {
    screen.set_status(ServiceStatus::Stopped);
    EXPECT_TRUE(comp->OnEvent(Event::Character('q')));
    ASSERT_EQ(quits.size(), 1u);
    EXPECT_EQ(quits[0], MainScreen::QuitChoice::LeaveRunning);
}

TEST_F(MainScreenTest, QuitDialogIsModal) {
    screen.set_status(ServiceStatus::Running);
    EXPECT_TRUE(comp->OnEvent(Event::Character('q')));
    EXPECT_TRUE(quits.empty());

    // Other keys are swallowed while the dialog is open
    EXPECT_TRUE(comp->OnEvent(Event::Character('t')));
    EXPECT_EQ(stops, 0);

    EXPECT_TRUE(comp->OnEvent(Event::Escape));
    EXPECT_TRUE(quits.empty());
    EXPECT_TRUE(comp->OnEvent(Event::Character('t')));
    EXPECT_EQ(stops, 1);
}

TEST_F(MainScreenTest, QuitDialogChoices) {
    screen.set_status(ServiceStatus::Running);
    comp->OnEvent(Event::Character('q'));
    EXPECT_TRUE(comp->OnEvent(Event::Character('n')));
    ASSERT_EQ(quits.size(), 1u);
    EXPECT_EQ(quits[0], MainScreen::QuitChoice::LeaveRunning);

    comp->OnEvent(Event::Character('q'));
    EXPECT_TRUE(comp->OnEvent(Event::Character('y')));
    ASSERT_EQ(quits.size(), 2u);
    EXPECT_EQ(quits[1], MainScreen::QuitChoice::StopAndExit);

    // While quitting, the dialog ignores further choices
    screen.set_quitting(true);
    EXPECT_TRUE(comp->OnEvent(Event::Character('n')));
    EXPECT_EQ(quits.size(), 2u);
}

TEST_F(MainScreenTest, Renders) {
    screen.set_port_blocker(true, "PID 7 (node)");
    for (auto s : {ServiceStatus::Stopped, ServiceStatus::Running, ServiceStatus::Error}) {
        screen.set_status(s);
        EXPECT_NE(comp->Render(), nullptr);
    }
    comp->OnEvent(Event::Character('q'));
    EXPECT_NE(comp->Render(), nullptr);
}
