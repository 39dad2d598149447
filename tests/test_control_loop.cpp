#include <gtest/gtest.h>
#include "os/process_tree_killer.hpp"
#include "supervisor/control_loop.hpp"
#include "test_helpers.hpp"

#include <httplib.h>

#include <unistd.h>

#include <algorithm>
#include <atomic>
#include <filesystem>
#include <mutex>

namespace fs = std::filesystem;
using namespace std::chrono_literals;

class ControlLoopTest : public ::testing::Test {
protected:
    fs::path test_dir;
    std::unique_ptr<OsProbe> probe = make_os_probe("fake_service");
    std::unique_ptr<StateStore> store;
    HealthProber prober;
    std::unique_ptr<Supervisor> sup;
    std::unique_ptr<ControlLoop> loop;
    int port = 0;

    // Written from the loop thread in the threaded test
    std::mutex mutex;
    std::vector<ServiceStatus> statuses;
    std::vector<std::string> logs;
    std::atomic<int> ready{0};
    std::atomic<int> stopped{0};
    std::atomic<int> timeouts{0};
    std::atomic<int> blocked{0};
    std::atomic<int> freed{0};
    std::string blocked_owner;

    void SetUp() override {
        test_dir = fs::temp_directory_path() /
                   ("svpanel-test-loop-" + std::to_string(getpid()) + "-" +
                    ::testing::UnitTest::GetInstance()->current_test_info()->name());
        fs::create_directories(test_dir);
        store = std::make_unique<StateStore>((test_dir / "service.pid").string());
        port = test::free_port();
        ASSERT_GT(port, 0);
    }

    void TearDown() override {
        loop.reset();
        if (sup) {
            if (auto pid = sup->pid()) {
                ProcessTreeKiller killer(*probe, 500ms, 1s);
                killer.kill_tree(*pid);
            }
            sup.reset();
        }
        fs::remove_all(test_dir);
    }

    void make(std::chrono::milliseconds tick = 2s) {
        SupervisorOptions o;
        o.launch = test::fake_service(port);
        o.port = port;
        o.health_url = test::health_url(port);
        o.startup_timeout = 5s;
        o.health_poll_interval = 100ms;
        o.health_probe_timeout = 500ms;
        o.graceful_stop = 1s;
        o.force_kill_confirm = 1s;
        o.restart_settle = 100ms;
        sup = std::make_unique<Supervisor>(o, *probe, *store, prober);

        ControlLoop::Callbacks cb;
        cb.on_log = [this](const SupervisorEvent& e) {
            std::lock_guard<std::mutex> lock(mutex);
            logs.push_back(e.text);
        };
        cb.on_status = [this](ServiceStatus s) {
            std::lock_guard<std::mutex> lock(mutex);
            statuses.push_back(s);
        };
        cb.on_ready = [this](const std::string&) { ++ready; };
        cb.on_timeout = [this](const std::string&) { ++timeouts; };
        cb.on_stopped = [this](const std::string&) { ++stopped; };
        cb.on_port_blocked = [this](const std::string& owner) {
            std::lock_guard<std::mutex> lock(mutex);
            blocked_owner = owner;
            ++blocked;
        };
        cb.on_port_free = [this] { ++freed; };
        loop = std::make_unique<ControlLoop>(*sup, cb, tick);
    }

    bool tick_until(const std::function<bool()>& pred,
                    std::chrono::milliseconds timeout = 8s) {
        return test::wait_until([&] {
            loop->tick();
            return pred();
        }, timeout);
    }

    bool has_log(const std::string& text) {
        std::lock_guard<std::mutex> lock(mutex);
        return std::any_of(logs.begin(), logs.end(), [&](const std::string& l) {
            return l.find(text) != std::string::npos;
        });
    }
};

TEST_F(ControlLoopTest, FirstTickReportsStatusOnce) {
    make();
    loop->tick();
    loop->tick();
    ASSERT_EQ(statuses.size(), 1u);
    EXPECT_EQ(statuses[0], ServiceStatus::Stopped);
    EXPECT_EQ(loop->displayed_status(), ServiceStatus::Stopped);
}

TEST_F(ControlLoopTest, StartCommandReachesReady) {
    make();
    loop->post(ControlLoop::Command::Start);
    ASSERT_TRUE(tick_until([&] { return ready.load() == 1; }));
    loop->tick();

    EXPECT_EQ(loop->displayed_status(), ServiceStatus::Running);
    EXPECT_EQ(statuses.back(), ServiceStatus::Running);
    EXPECT_NE(std::find(statuses.begin(), statuses.end(), ServiceStatus::Starting), statuses.end());
    EXPECT_TRUE(has_log("Starting service"));
    EXPECT_EQ(timeouts.load(), 0);
}

TEST_F(ControlLoopTest, RestartStartsAgainAfterStopped) {
    make();
    loop->post(ControlLoop::Command::Start);
    ASSERT_TRUE(tick_until([&] { return ready.load() == 1; }));
    pid_t first = *sup->pid();

    loop->post(ControlLoop::Command::Restart);
    ASSERT_TRUE(tick_until([&] { return ready.load() == 2; }, 12s));
    EXPECT_EQ(stopped.load(), 1);
    ASSERT_TRUE(sup->pid().has_value());
    EXPECT_NE(*sup->pid(), first);
}

TEST_F(ControlLoopTest, PortBlockedThenFreed) {
    auto blocker = std::make_unique<httplib::Server>();
    blocker->Get("/", [](const httplib::Request&, httplib::Response& res) {
        res.set_content("foreign", "text/plain");
    });
    ASSERT_TRUE(blocker->bind_to_port("127.0.0.1", port));
    std::thread t([&] { blocker->listen_after_bind(); });
    ASSERT_TRUE(test::wait_until([&] { return probe->is_port_listening(port); }));

    make();
    loop->tick();
    EXPECT_TRUE(loop->port_blocked());
    EXPECT_EQ(blocked.load(), 1);
    EXPECT_NE(blocked_owner.find(std::to_string(getpid())), std::string::npos);

    blocker->stop();
    t.join();
    ASSERT_TRUE(test::wait_until([&] { return !probe->is_port_listening(port); }));

    loop->post(ControlLoop::Command::Refresh);
    ASSERT_TRUE(tick_until([&] { return freed.load() == 1; }));
    EXPECT_FALSE(loop->port_blocked());
    EXPECT_TRUE(has_log("Port is now free."));
}

TEST_F(ControlLoopTest, PortFreeWithoutBlockIsQuiet) {
    make();
    loop->post(ControlLoop::Command::Refresh);
    ASSERT_TRUE(tick_until([&] { return freed.load() == 1; }));
    EXPECT_FALSE(has_log("Port is now free."));
}

TEST_F(ControlLoopTest, RunThreadWakesOnPost) {
    // Long interval: only the posted command can wake the thread
    make(30s);
    loop->run();
    EXPECT_TRUE(loop->running());
    ASSERT_TRUE(test::wait_until([&] {
        std::lock_guard<std::mutex> lock(mutex);
        return !statuses.empty();
    }));

    auto begin = std::chrono::steady_clock::now();
    loop->post(ControlLoop::Command::Start);
    ASSERT_TRUE(test::wait_until([&] {
        std::lock_guard<std::mutex> lock(mutex);
        return std::find(statuses.begin(), statuses.end(), ServiceStatus::Starting) != statuses.end();
    }));
    EXPECT_LT(std::chrono::steady_clock::now() - begin, 3s);

    loop->stop();
    EXPECT_FALSE(loop->running());
    ASSERT_TRUE(test::wait_until([&] { return sup->status() != ServiceStatus::Starting; }));
}

TEST(ControlLoopCommands, Names) {
    EXPECT_STREQ(command_name(ControlLoop::Command::Start), "start");
    EXPECT_STREQ(command_name(ControlLoop::Command::ResolvePortConflict), "resolve-port-conflict");
}
