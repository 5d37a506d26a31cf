#include <gtest/gtest.h>
#include <vector>
#include "fakes.h"
#include "local_time.h"
#include "timer_service.h"

class TimerServiceTest : public ::testing::Test {
protected:
    TimerServiceTest() : timers(clock) {
        clock.setLocal(2025, 6, 10, 12, 0);
    }

    FakeClock clock;
    TimerService timers;
};

TEST_F(TimerServiceTest, CallLaterFiresOnce) {
    int fired = 0;
    TimerHandle handle = timers.callLater(500, [&fired]() { fired++; });
    EXPECT_TRUE(handle.isActive());

    clock.advanceMs(499);
    timers.tick();
    EXPECT_EQ(0, fired);

    clock.advanceMs(1);
    timers.tick();
    EXPECT_EQ(1, fired);
    EXPECT_FALSE(handle.isActive());

    clock.advanceMs(5000);
    timers.tick();
    EXPECT_EQ(1, fired);
    EXPECT_EQ(0u, timers.pendingCount());
}

TEST_F(TimerServiceTest, CancelledTimerNeverFires) {
    int fired = 0;
    TimerHandle handle = timers.callLater(100, [&fired]() { fired++; });
    handle.cancel();
    EXPECT_FALSE(handle.isActive());

    clock.advanceMs(1000);
    timers.tick();
    EXPECT_EQ(0, fired);

    // Cancelling twice is harmless
    handle.cancel();
    TimerHandle empty;
    empty.cancel();
    EXPECT_FALSE(empty.isActive());
}

TEST_F(TimerServiceTest, IntervalRepeats) {
    int fired = 0;
    timers.trackInterval(1000, [&fired]() { fired++; });

    for (int i = 0; i < 10; i++) {
        clock.advanceMs(500);
        timers.tick();
    }
    EXPECT_EQ(5, fired);
    EXPECT_EQ(1u, timers.pendingCount());
}

TEST_F(TimerServiceTest, IntervalSurvivesMonotonicWrap) {
    clock.advanceMs(0xFFFFFFFFu - 200);
    int fired = 0;
    timers.trackInterval(1000, [&fired]() { fired++; });

    clock.advanceMs(999);
    timers.tick();
    EXPECT_EQ(0, fired);
    clock.advanceMs(1);
    timers.tick();
    EXPECT_EQ(1, fired);
}

TEST_F(TimerServiceTest, DailyFiresAtLocalTime) {
    std::vector<time_t> firedAt;
    timers.trackDaily(2, 30, [this, &firedAt]() { firedAt.push_back(clock.nowUtc()); });

    // 12:00 -> next day 02:30 is 14.5 hours
    for (int minute = 0; minute < 14 * 60 + 29; minute++) {
        clock.advanceSeconds(60);
        timers.tick();
    }
    EXPECT_TRUE(firedAt.empty());

    clock.advanceSeconds(60);
    timers.tick();
    ASSERT_EQ(1u, firedAt.size());
    EXPECT_EQ(fromLocalTime(2025, 6, 11, 2, 30, 0), firedAt[0]);

    for (int minute = 0; minute < 24 * 60; minute++) {
        clock.advanceSeconds(60);
        timers.tick();
    }
    ASSERT_EQ(2u, firedAt.size());
    EXPECT_EQ(fromLocalTime(2025, 6, 12, 2, 30, 0), firedAt[1]);
}

TEST_F(TimerServiceTest, DailyWaitsForClockSync) {
    clock.setUtc(0);
    int fired = 0;
    timers.trackDaily(0, 3, [&fired]() { fired++; });

    clock.advanceSeconds(3 * 24 * 3600);
    timers.tick();
    EXPECT_EQ(0, fired);

    // First synced tick only arms the timer
    clock.setLocal(2025, 6, 10, 23, 59);
    timers.tick();
    EXPECT_EQ(0, fired);

    clock.setLocal(2025, 6, 11, 0, 3);
    timers.tick();
    EXPECT_EQ(1, fired);
}

TEST_F(TimerServiceTest, CallbackMayCancelAnotherDueTimer) {
    int second = 0;
    TimerHandle victim;
    timers.callLater(100, [&victim]() { victim.cancel(); });
    victim = timers.callLater(100, [&second]() { second++; });

    clock.advanceMs(100);
    timers.tick();
    EXPECT_EQ(0, second);
    EXPECT_EQ(0u, timers.pendingCount());
}

TEST_F(TimerServiceTest, CallbackMayScheduleTimers) {
    int chained = 0;
    timers.callLater(100, [this, &chained]() {
        timers.callLater(100, [&chained]() { chained++; });
    });

    clock.advanceMs(100);
    timers.tick();
    EXPECT_EQ(0, chained);
    EXPECT_EQ(1u, timers.pendingCount());

    clock.advanceMs(100);
    timers.tick();
    EXPECT_EQ(1, chained);
}

TEST_F(TimerServiceTest, CancelAllClearsEverything) {
    timers.callLater(100, []() {});
    timers.trackInterval(100, []() {});
    timers.trackDaily(3, 0, []() {});
    EXPECT_EQ(3u, timers.pendingCount());

    timers.cancelAll();
    EXPECT_EQ(0u, timers.pendingCount());
}
