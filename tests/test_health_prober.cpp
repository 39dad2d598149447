#include <gtest/gtest.h>
#include "api/health_prober.hpp"
#include "test_helpers.hpp"

#include <httplib.h>

#include <atomic>
#include <thread>

using namespace std::chrono_literals;

// In-process server with a configurable status code
class HealthProberTest : public ::testing::Test {
protected:
    httplib::Server svr;
    std::thread server_thread;
    std::atomic<int> status{200};
    std::atomic<int> delay_ms{0};
    int port = 0;

    void SetUp() override {
        svr.Get("/health", [this](const httplib::Request&, httplib::Response& res) {
            if (delay_ms.load() > 0) {
                std::this_thread::sleep_for(std::chrono::milliseconds(delay_ms.load()));
            }
            res.status = status.load();
            res.set_content("x", "text/plain");
        });
        port = svr.bind_to_any_port("127.0.0.1");
        ASSERT_GT(port, 0);
        server_thread = std::thread([this] { svr.listen_after_bind(); });
        ASSERT_TRUE(test::wait_until([this] { return svr.is_running(); }));
    }

    void TearDown() override {
        svr.stop();
        if (server_thread.joinable()) server_thread.join();
    }
};

TEST_F(HealthProberTest, Ok200) {
    HealthProber prober;
    EXPECT_TRUE(prober.check(test::health_url(port), 1s));
}

TEST_F(HealthProberTest, Non200IsFalse) {
    HealthProber prober;
    status = 503;
    EXPECT_FALSE(prober.check(test::health_url(port), 1s));
    status = 204;
    EXPECT_FALSE(prober.check(test::health_url(port), 1s));
    status = 500;
    EXPECT_FALSE(prober.check(test::health_url(port), 1s));
}

TEST_F(HealthProberTest, NotFoundPathIsFalse) {
    HealthProber prober;
    EXPECT_FALSE(prober.check("http://127.0.0.1:" + std::to_string(port) + "/missing", 1s));
}

TEST_F(HealthProberTest, SlowAnswerTimesOut) {
    HealthProber prober;
    delay_ms = 1500;
    auto begin = std::chrono::steady_clock::now();
    EXPECT_FALSE(prober.check(test::health_url(port), 300ms));
    EXPECT_LT(std::chrono::steady_clock::now() - begin, 1400ms);
}

TEST(HealthProberNoServer, ConnectionRefusedIsFalse) {
    HealthProber prober;
    int port = test::free_port();
    EXPECT_FALSE(prober.check(test::health_url(port), 500ms));
}

TEST(HealthProberNoServer, InvalidUrlIsFalse) {
    HealthProber prober;
    EXPECT_FALSE(prober.check("not a url", 500ms));
    EXPECT_FALSE(prober.check("ftp://127.0.0.1/", 500ms));
    EXPECT_FALSE(prober.check("", 500ms));
}

// ── URL splitting ───────────────────────────────────────────

TEST(HealthUrlTest, SplitWithPath) {
    auto u = HealthProber::split_url("http://127.0.0.1:5000/api/health?x=1");
    EXPECT_TRUE(u.valid);
    EXPECT_EQ(u.base, "http://127.0.0.1:5000");
    EXPECT_EQ(u.path, "/api/health?x=1");
}

TEST(HealthUrlTest, SplitWithoutPath) {
    auto u = HealthProber::split_url("https://localhost:8443");
    EXPECT_TRUE(u.valid);
    EXPECT_EQ(u.base, "https://localhost:8443");
    EXPECT_EQ(u.path, "/");
}

TEST(HealthUrlTest, RejectsOtherSchemes) {
    EXPECT_FALSE(HealthProber::split_url("ws://127.0.0.1:5000/").valid);
    EXPECT_FALSE(HealthProber::split_url("127.0.0.1:5000").valid);
    EXPECT_FALSE(HealthProber::split_url("http:///path").valid);
}
