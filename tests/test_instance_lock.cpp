#include <gtest/gtest.h>
#include "core/instance_lock.hpp"
#include "test_helpers.hpp"

TEST(InstanceLockTest, AcquireAndRelease) {
    int port = test::free_port();
    InstanceLock lock(port);
    std::string err;
    ASSERT_TRUE(lock.acquire(err)) << err;
    EXPECT_TRUE(lock.held());
    EXPECT_EQ(lock.port(), port);

    lock.release();
    EXPECT_FALSE(lock.held());
}

TEST(InstanceLockTest, SecondInstanceIsRefused) {
    int port = test::free_port();
    InstanceLock first(port);
    std::string err;
    ASSERT_TRUE(first.acquire(err)) << err;

    InstanceLock second(port);
    EXPECT_FALSE(second.acquire(err));
    EXPECT_FALSE(second.held());
    EXPECT_NE(err.find("already running"), std::string::npos);
}

TEST(InstanceLockTest, ReacquireAfterRelease) {
    int port = test::free_port();
    std::string err;
    {
        InstanceLock first(port);
        ASSERT_TRUE(first.acquire(err)) << err;
    }

    InstanceLock second(port);
    EXPECT_TRUE(second.acquire(err)) << err;
}

TEST(InstanceLockTest, AcquireTwiceIsIdempotent) {
    InstanceLock lock(test::free_port());
    std::string err;
    ASSERT_TRUE(lock.acquire(err)) << err;
    EXPECT_TRUE(lock.acquire(err));
    EXPECT_TRUE(lock.held());
}
