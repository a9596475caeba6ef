#include <gtest/gtest.h>

#include "../src/db/TimerRegistry.hpp"

TEST(TimerRegistryTest, PopsDueTimersInDeadlineOrder) {
    TimerRegistry timers;
    timers.scheduleExpiry(300, "c");
    timers.scheduleWaiterTimeout(100, 42);
    timers.scheduleExpiry(200, "b");

    EXPECT_EQ(100u, *timers.nextDeadline());

    auto due = timers.popDue(250);
    ASSERT_EQ(2u, due.size());
    EXPECT_EQ(TimerKind::RESOLVE_WAITER, due[0].kind);
    EXPECT_EQ(42u, due[0].waiter_id);
    EXPECT_EQ(TimerKind::EXPIRE_STRING_KEY, due[1].kind);
    EXPECT_EQ("b", due[1].key);

    EXPECT_EQ(1u, timers.size());
    EXPECT_EQ(300u, *timers.nextDeadline());
}

TEST(TimerRegistryTest, SameDeadlineFiresInSchedulingOrder) {
    TimerRegistry timers;
    timers.scheduleWaiterTimeout(50, 1);
    timers.scheduleWaiterTimeout(50, 2);
    timers.scheduleWaiterTimeout(50, 3);

    auto due = timers.popDue(50);
    ASSERT_EQ(3u, due.size());
    EXPECT_EQ(1u, due[0].waiter_id);
    EXPECT_EQ(2u, due[1].waiter_id);
    EXPECT_EQ(3u, due[2].waiter_id);
}

TEST(TimerRegistryTest, CancelledTimersNeverFire) {
    TimerRegistry timers;
    TimerId a = timers.scheduleWaiterTimeout(10, 1);
    TimerId b = timers.scheduleWaiterTimeout(20, 2);

    EXPECT_TRUE(timers.cancel(a));
    EXPECT_FALSE(timers.cancel(a));
    EXPECT_FALSE(timers.contains(a));

    auto due = timers.popDue(1000);
    ASSERT_EQ(1u, due.size());
    EXPECT_EQ(b, due[0].id);

    // already fired
    EXPECT_FALSE(timers.cancel(b));
    EXPECT_TRUE(timers.empty());
}

TEST(TimerRegistryTest, ReportsDelayUntilNextDeadline) {
    TimerRegistry timers;
    EXPECT_FALSE(timers.millisUntilNext(0).has_value());

    timers.scheduleExpiry(1500, "k");
    EXPECT_EQ(500u, *timers.millisUntilNext(1000));
    EXPECT_EQ(0u, *timers.millisUntilNext(2000));
}
