#include <gtest/gtest.h>

#include "timers.hpp"

#include <chrono>
#include <thread>

TEST(TimerRegistry, NewTimerReportsFullDuration) {
    TimerRegistry registry;
    ASSERT_TRUE(registry.setTimer("Tea", 600).has_value());

    auto active = registry.listActive();
    ASSERT_EQ(active.size(), 1u);
    EXPECT_EQ(active[0].label, "Tea");
    EXPECT_GE(active[0].remainingSeconds, 599);
    EXPECT_LE(active[0].remainingSeconds, 600);
}

TEST(TimerRegistry, PhraseIsParsed) {
    TimerRegistry registry;
    auto timer = registry.setTimer("Pasta", "1 hour 30 minutes");
    ASSERT_TRUE(timer.has_value());
    EXPECT_EQ(timer->durationSeconds, 5400);
}

TEST(TimerRegistry, RejectsZeroDuration) {
    TimerRegistry registry;
    EXPECT_FALSE(registry.setTimer("Nope", "").has_value());
    EXPECT_FALSE(registry.setTimer("Nope", 0).has_value());
    EXPECT_TRUE(registry.listActive().empty());
}

TEST(TimerRegistry, SameLabelReplaces) {
    TimerRegistry registry;
    registry.setTimer("Tea", 600);
    registry.setTimer("Tea", 60);

    auto active = registry.listActive();
    ASSERT_EQ(active.size(), 1u);
    EXPECT_LE(active[0].remainingSeconds, 60);
}

TEST(TimerRegistry, ListedByLabel) {
    TimerRegistry registry;
    registry.setTimer("b", 100);
    registry.setTimer("a", 200);

    auto active = registry.listActive();
    ASSERT_EQ(active.size(), 2u);
    EXPECT_EQ(active[0].label, "a");
    EXPECT_EQ(active[1].label, "b");
}

TEST(TimerRegistry, ExpiredTimersArePurged) {
    TimerRegistry registry;
    registry.setTimer("Short", 1);
    registry.setTimer("Long", 600);

    std::this_thread::sleep_for(std::chrono::milliseconds(1100));

    auto active = registry.listActive();
    ASSERT_EQ(active.size(), 1u);
    EXPECT_EQ(active[0].label, "Long");
    // Purged, so cancelling it finds nothing
    EXPECT_FALSE(registry.cancel("Short"));
}

TEST(TimerRegistry, Cancel) {
    TimerRegistry registry;
    registry.setTimer("Tea", 600);
    EXPECT_TRUE(registry.cancel("Tea"));
    EXPECT_FALSE(registry.cancel("Tea"));
    EXPECT_TRUE(registry.listActive().empty());
}

TEST(ActiveTimer, RemainingNeverNegative) {
    ActiveTimer t{ "x", 10, std::chrono::steady_clock::now() - std::chrono::seconds(30) };
    EXPECT_EQ(t.remainingSeconds(), 0);
    EXPECT_TRUE(t.isExpired());
    EXPECT_EQ(t.formatRemaining(), "0s");
}
