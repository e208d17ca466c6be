#include <gtest/gtest.h>
#include <anemo/utils/scheduler.hpp>
#include <atomic>
#include <chrono>
#include <thread>

namespace {
    bool waitFor(const std::atomic<int>& counter, int target, int timeout_ms) {
        for (int i = 0; i < timeout_ms / 5; ++i) {
            if (counter.load() >= target) {
                return true;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(5));
        }
        return counter.load() >= target;
    }
}

TEST(TimerScheduler, OneShotRunsOnce) {
    TimerScheduler scheduler;
    ASSERT_TRUE(scheduler.start());
    std::atomic<int> runs(0);
    ScheduledTaskId id = scheduler.scheduleOnce(10, [&runs]() { ++runs; });
    EXPECT_NE(invalid_task_id, id);
    EXPECT_TRUE(waitFor(runs, 1, 1000));
    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    EXPECT_EQ(1, runs.load());
    EXPECT_EQ(0u, scheduler.pendingCount());
    scheduler.stop();
}

TEST(TimerScheduler, PeriodicRepeatsUntilCancelled) {
    TimerScheduler scheduler;
    ASSERT_TRUE(scheduler.start());
    std::atomic<int> runs(0);
    ScheduledTaskId id = scheduler.schedulePeriodic(10, [&runs]() { ++runs; });
    EXPECT_TRUE(waitFor(runs, 3, 2000));
    EXPECT_TRUE(scheduler.cancel(id));
    int after_cancel = runs.load();
    std::this_thread::sleep_for(std::chrono::milliseconds(60));
    EXPECT_LE(runs.load(), after_cancel + 1);
    EXPECT_FALSE(scheduler.cancel(id));
    scheduler.stop();
}

TEST(TimerScheduler, CancelledTaskNeverRuns) {
    TimerScheduler scheduler;
    ASSERT_TRUE(scheduler.start());
    std::atomic<int> runs(0);
    ScheduledTaskId id = scheduler.scheduleOnce(200, [&runs]() { ++runs; });
    EXPECT_TRUE(scheduler.cancel(id));
    std::this_thread::sleep_for(std::chrono::milliseconds(300));
    EXPECT_EQ(0, runs.load());
    scheduler.stop();
}

TEST(TimerScheduler, ZeroPeriodRejected) {
    TimerScheduler scheduler;
    EXPECT_EQ(invalid_task_id, scheduler.schedulePeriodic(0, []() {}));
}

TEST(TimerScheduler, EarlierTaskRunsFirst) {
    TimerScheduler scheduler;
    ASSERT_TRUE(scheduler.start());
    std::atomic<int> order(0);
    std::atomic<int> first(0);
    std::atomic<int> done(0);
    scheduler.scheduleOnce(100, [&]() { if (first.load() == 0) first = 2; ++order; ++done; });
    scheduler.scheduleOnce(10, [&]() { if (first.load() == 0) first = 1; ++order; ++done; });
    EXPECT_TRUE(waitFor(done, 2, 2000));
    EXPECT_EQ(1, first.load());
    scheduler.stop();
}
