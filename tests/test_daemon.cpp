#include <gtest/gtest.h>
#include "core/instance_lock.hpp"
#include "daemon/daemon.hpp"
#include "os/os_probe.hpp"
#include "os/process_tree_killer.hpp"
#include "supervisor/state_store.hpp"
#include "test_helpers.hpp"

#include <unistd.h>

#include <filesystem>
#include <sstream>
#include <thread>

namespace fs = std::filesystem;
using namespace std::chrono_literals;

class DaemonTest : public ::testing::Test {
protected:
    fs::path test_dir;
    Config config;
    std::unique_ptr<OsProbe> probe = make_os_probe("fake_service");
    std::ostringstream out;
    int port = 0;

    void SetUp() override {
        test_dir = fs::temp_directory_path() /
                   ("svpanel-test-daemon-" + std::to_string(getpid()) + "-" +
                    ::testing::UnitTest::GetInstance()->current_test_info()->name());
        fs::create_directories(test_dir);
        port = test::free_port();
        ASSERT_GT(port, 0);

        auto& d = config.data();
        d.service_executable = FAKE_SERVICE_PATH;
        d.service_args = {"--port", std::to_string(port)};
        d.service_port = port;
        d.health_url = test::health_url(port);
        d.pid_file = (test_dir / "service.pid").string();
        d.instance_lock_port = test::free_port();
        d.startup_timeout_ms = 5000;
        d.health_poll_interval_ms = 100;
        d.health_probe_timeout_ms = 500;
        d.graceful_stop_ms = 1000;
        d.force_kill_confirm_ms = 1000;
        d.port_free_attempts = 20;
        d.port_free_interval_ms = 100;
        d.tick_interval_ms = 200;
    }

    void TearDown() override {
        fs::remove_all(test_dir);
    }

    std::unique_ptr<ProcessHandle> spawn_external(std::vector<std::string> extra = {}) {
        std::string err;
        auto h = ProcessHandle::spawn(test::fake_service(port, std::move(extra)), err);
        EXPECT_NE(h, nullptr) << err;
        if (h) {
            EXPECT_TRUE(test::wait_until([&] { return probe->is_port_listening(port); }));
        }
        return h;
    }
};

TEST_F(DaemonTest, RunWithoutExecutableFails) {
    config.data().service_executable.clear();
    Daemon daemon(config, out);
    EXPECT_EQ(daemon.run(Daemon::Mode::Run), 1);
}

TEST_F(DaemonTest, RunSupervisesUntilInterrupted) {
    Daemon daemon(config, out);
    int code = -1;
    std::thread t([&] { code = daemon.run(Daemon::Mode::Run); });

    ASSERT_TRUE(test::wait_until([&] { return probe->is_port_listening(port); }, 8s));
    StateStore store(config.data().pid_file);
    EXPECT_TRUE(test::wait_until([&] { return store.read().has_value(); }));

    daemon.request_stop();
    t.join();

    EXPECT_EQ(code, 0);
    EXPECT_FALSE(store.read().has_value());
    EXPECT_TRUE(test::wait_until([&] { return !probe->is_port_listening(port); }));
    EXPECT_NE(out.str().find("fake_service starting"), std::string::npos);
}

TEST_F(DaemonTest, RunReportsFailedStart) {
    config.data().service_args.push_back("--never-ready");
    config.data().service_args.push_back("--exit-after-ms");
    config.data().service_args.push_back("200");
    Daemon daemon(config, out);
    EXPECT_EQ(daemon.run(Daemon::Mode::Run), 1);
}

TEST_F(DaemonTest, RunExitsWhenServiceDies) {
    config.data().service_args.push_back("--exit-after-ms");
    config.data().service_args.push_back("1500");
    Daemon daemon(config, out);
    EXPECT_EQ(daemon.run(Daemon::Mode::Run), 1);
}

TEST_F(DaemonTest, StopWhenNothingRuns) {
    Daemon daemon(config, out);
    EXPECT_EQ(daemon.run(Daemon::Mode::Stop), 0);
}

TEST_F(DaemonTest, StopAdoptedService) {
    auto external = spawn_external();
    ASSERT_NE(external, nullptr);
    StateStore store(config.data().pid_file);
    ASSERT_TRUE(store.write(external->pid()));

    Daemon daemon(config, out);
    EXPECT_EQ(daemon.run(Daemon::Mode::Stop), 0);
    EXPECT_TRUE(external->wait_for(3s));
    EXPECT_FALSE(store.read().has_value());
}

TEST_F(DaemonTest, FreePortKillsForeignTree) {
    auto foreign = spawn_external({"--tree"});
    ASSERT_NE(foreign, nullptr);

    Daemon daemon(config, out);
    EXPECT_EQ(daemon.run(Daemon::Mode::FreePort), 0);
    EXPECT_FALSE(probe->is_port_listening(port));
    foreign->wait_for(2s);
}

TEST_F(DaemonTest, FreePortOnFreePort) {
    Daemon daemon(config, out);
    EXPECT_EQ(daemon.run(Daemon::Mode::FreePort), 0);
}

TEST_F(DaemonTest, SecondInstanceRefused) {
    InstanceLock other(config.data().instance_lock_port);
    std::string err;
    ASSERT_TRUE(other.acquire(err)) << err;

    Daemon daemon(config, out);
    EXPECT_EQ(daemon.run(Daemon::Mode::Stop), 1);
}
