#include <gtest/gtest.h>
#include "timer.hpp"

using Clock = RetransmitTimer::Clock;

TEST(RetransmitTimer, StartsStopped) {
    RetransmitTimer timer(100);
    EXPECT_FALSE(timer.running());
    EXPECT_FALSE(timer.expired());
    EXPECT_EQ(timer.get_timeout(), 100u);
}

TEST(RetransmitTimer, ExpiresAfterTimeout) {
    RetransmitTimer timer(100);
    Clock::time_point t0 = Clock::now();
    timer.start(t0);
    EXPECT_TRUE(timer.running());
    EXPECT_EQ(timer.deadline(), t0 + std::chrono::milliseconds(100));
    EXPECT_FALSE(timer.expired(t0 + std::chrono::milliseconds(99)));
    EXPECT_TRUE(timer.expired(t0 + std::chrono::milliseconds(100)));
}

TEST(RetransmitTimer, StartDoesNotMoveRunningTimer) {
    RetransmitTimer timer(100);
    Clock::time_point t0 = Clock::now();
    timer.start(t0);
    timer.start(t0 + std::chrono::milliseconds(50));
    EXPECT_EQ(timer.deadline(), t0 + std::chrono::milliseconds(100));
}

TEST(RetransmitTimer, RestartCountsFullInterval) {
    RetransmitTimer timer(100);
    Clock::time_point t0 = Clock::now();
    timer.start(t0);
    timer.restart(t0 + std::chrono::milliseconds(80));
    EXPECT_FALSE(timer.expired(t0 + std::chrono::milliseconds(150)));
    EXPECT_TRUE(timer.expired(t0 + std::chrono::milliseconds(180)));
}

TEST(RetransmitTimer, StoppedTimerNeverExpires) {
    RetransmitTimer timer(10);
    Clock::time_point t0 = Clock::now();
    timer.start(t0);
    timer.stop();
    EXPECT_FALSE(timer.running());
    EXPECT_FALSE(timer.expired(t0 + std::chrono::seconds(10)));
}
