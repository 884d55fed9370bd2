#include <gtest/gtest.h>
#include "muxbus/scheduler.hpp"

#include <atomic>
#include <chrono>
#include <memory>
#include <stdexcept>
#include <thread>
#include <vector>

using namespace std::chrono_literals;

// Test that tasks run in deadline order, then scheduling order
TEST(ManualSchedulerTest, RunsInDeadlineOrder) {
    muxbus::ManualScheduler scheduler;
    std::vector<int> order;

    (void)scheduler.ScheduleAfter(30ms, [&]() { order.push_back(3); });
    (void)scheduler.ScheduleAfter(10ms, [&]() { order.push_back(1); });
    (void)scheduler.ScheduleAfter(10ms, [&]() { order.push_back(2); });
    EXPECT_EQ(scheduler.Pending(), 3u);

    // Nothing is due yet
    EXPECT_EQ(scheduler.AdvanceBy(9ms), 0u);
    EXPECT_TRUE(order.empty());

    EXPECT_EQ(scheduler.AdvanceBy(1ms), 2u);
    EXPECT_EQ(order, (std::vector<int>{1, 2}));

    EXPECT_EQ(scheduler.AdvanceBy(100ms), 1u);
    EXPECT_EQ(order, (std::vector<int>{1, 2, 3}));
    EXPECT_EQ(scheduler.Now(), 110ms);
    EXPECT_EQ(scheduler.Pending(), 0u);
}

// Test that a cancelled task never runs and cannot be cancelled twice
TEST(ManualSchedulerTest, Cancel) {
    muxbus::ManualScheduler scheduler;
    bool ran = false;

    const auto id = scheduler.ScheduleAfter(5ms, [&]() { ran = true; });
    EXPECT_NE(id, muxbus::INVALID_TIMER_ID);
    EXPECT_TRUE(scheduler.Cancel(id));
    EXPECT_FALSE(scheduler.Cancel(id));

    scheduler.AdvanceBy(10ms);
    EXPECT_FALSE(ran);
}

// Test that a task scheduled by a running task fires within the same advance
TEST(ManualSchedulerTest, NestedScheduling) {
    muxbus::ManualScheduler scheduler;
    std::vector<std::chrono::milliseconds> fired_at;

    (void)scheduler.ScheduleAfter(10ms, [&]() {
        fired_at.push_back(scheduler.Now());
        (void)scheduler.ScheduleAfter(10ms, [&]() { fired_at.push_back(scheduler.Now()); });
    });

    EXPECT_EQ(scheduler.AdvanceBy(25ms), 2u);
    ASSERT_EQ(fired_at.size(), 2u);
    EXPECT_EQ(fired_at[0], 10ms);
    EXPECT_EQ(fired_at[1], 20ms);
}

// Test that a throwing task neither escapes AdvanceBy() nor stops the
// tasks due after it
TEST(ManualSchedulerTest, ThrowingTaskDoesNotStopAdvance) {
    muxbus::ManualScheduler scheduler;
    std::vector<int> order;

    (void)scheduler.ScheduleAfter(10ms, [&]() { order.push_back(1); });
    (void)scheduler.ScheduleAfter(10ms, []() { throw std::runtime_error("boom"); });
    (void)scheduler.ScheduleAfter(20ms, [&]() { order.push_back(2); });

    size_t ran = 0;
    EXPECT_NO_THROW(ran = scheduler.AdvanceBy(30ms));
    EXPECT_EQ(ran, 3u);
    EXPECT_EQ(order, (std::vector<int>{1, 2}));
    EXPECT_EQ(scheduler.Pending(), 0u);
}

// Test that Pulse() runs everything scheduled so far, regardless of delay
TEST(TickTest, PulseRunsAllPending) {
    muxbus::Tick tick;
    int count = 0;

    (void)tick.ScheduleAfter(1ms, [&]() { ++count; });
    (void)tick.ScheduleAfter(10'000ms, [&]() { ++count; });
    EXPECT_EQ(tick.Pending(), 2u);

    EXPECT_EQ(tick.Pulse(), 2u);
    EXPECT_EQ(count, 2);
    EXPECT_EQ(tick.Pulse(), 0u);
}

// Test that tasks scheduled during a pulse wait for the next one
TEST(TickTest, RescheduleWaitsForNextPulse) {
    muxbus::Tick tick;
    int count = 0;

    (void)tick.ScheduleAfter(1ms, [&]() {
        ++count;
        (void)tick.ScheduleAfter(1ms, [&]() { ++count; });
    });

    EXPECT_EQ(tick.Pulse(), 1u);
    EXPECT_EQ(count, 1);
    EXPECT_EQ(tick.Pending(), 1u);

    EXPECT_EQ(tick.Pulse(), 1u);
    EXPECT_EQ(count, 2);
}

// Test that a throwing task neither escapes Pulse() nor drops the rest of
// the pulse
TEST(TickTest, ThrowingTaskDoesNotStopPulse) {
    muxbus::Tick tick;
    int count = 0;

    (void)tick.ScheduleAfter(1ms, [&]() { ++count; });
    (void)tick.ScheduleAfter(1ms, []() { throw std::runtime_error("boom"); });
    (void)tick.ScheduleAfter(1ms, [&]() { ++count; });

    size_t ran = 0;
    EXPECT_NO_THROW(ran = tick.Pulse());
    EXPECT_EQ(ran, 3u);
    EXPECT_EQ(count, 2);
    EXPECT_EQ(tick.Pending(), 0u);
}

TEST(TickTest, Cancel) {
    muxbus::Tick tick;
    bool ran = false;

    const auto id = tick.ScheduleAfter(1ms, [&]() { ran = true; });
    EXPECT_TRUE(tick.Cancel(id));
    EXPECT_EQ(tick.Pulse(), 0u);
    EXPECT_FALSE(ran);
}

// Test that the worker thread fires a task after its delay
TEST(ThreadSchedulerTest, FiresAfterDelay) {
    muxbus::ThreadScheduler scheduler;
    std::atomic<bool> ran{false};

    const auto start = std::chrono::steady_clock::now();
    std::atomic<long long> elapsed_ms{0};
    (void)scheduler.ScheduleAfter(20ms, [&]() {
        elapsed_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - start).count();
        ran = true;
    });

    const auto deadline = std::chrono::steady_clock::now() + 5s;
    while (!ran && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(1ms);
    }

    ASSERT_TRUE(ran);
    EXPECT_GE(elapsed_ms.load(), 20);
}

// Test that a cancelled task never runs on the worker
TEST(ThreadSchedulerTest, CancelBeforeDeadline) {
    muxbus::ThreadScheduler scheduler;
    std::atomic<bool> cancelled_ran{false};
    std::atomic<bool> marker_ran{false};

    const auto id = scheduler.ScheduleAfter(30ms, [&]() { cancelled_ran = true; });
    (void)scheduler.ScheduleAfter(60ms, [&]() { marker_ran = true; });
    EXPECT_TRUE(scheduler.Cancel(id));

    const auto deadline = std::chrono::steady_clock::now() + 5s;
    while (!marker_ran && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(1ms);
    }

    EXPECT_TRUE(marker_ran);
    EXPECT_FALSE(cancelled_ran);
}

// Test that a throwing task does not stop the worker
TEST(ThreadSchedulerTest, SurvivesThrowingTask) {
    muxbus::ThreadScheduler scheduler;
    std::atomic<bool> ran{false};

    (void)scheduler.ScheduleAfter(1ms, []() { throw std::runtime_error("boom"); });
    (void)scheduler.ScheduleAfter(5ms, [&]() { ran = true; });

    const auto deadline = std::chrono::steady_clock::now() + 5s;
    while (!ran && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(1ms);
    }
    EXPECT_TRUE(ran);
}

// Test that Cancel() on a running task waits until it returns
TEST(ThreadSchedulerTest, CancelWaitsForRunningTask) {
    muxbus::ThreadScheduler scheduler;
    std::atomic<bool> started{false};
    std::atomic<bool> finished{false};

    const auto id = scheduler.ScheduleAfter(1ms, [&]() {
        started = true;
        std::this_thread::sleep_for(50ms);
        finished = true;
    });

    const auto deadline = std::chrono::steady_clock::now() + 5s;
    while (!started && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::yield();
    }
    ASSERT_TRUE(started);

    EXPECT_FALSE(scheduler.Cancel(id));
    EXPECT_TRUE(finished);
}

// Test that a task may destroy its own scheduler; later tasks are dropped
TEST(ThreadSchedulerTest, DestroyedFromOwnTask) {
    auto owner = std::make_shared<std::unique_ptr<muxbus::ThreadScheduler>>(
        std::make_unique<muxbus::ThreadScheduler>());
    std::atomic<bool> destroyed{false};
    std::atomic<bool> late_ran{false};

    (void)(*owner)->ScheduleAfter(1ms, [owner, &destroyed]() {
        owner->reset();
        destroyed = true;
    });
    (void)(*owner)->ScheduleAfter(50ms, [&late_ran]() { late_ran = true; });

    const auto deadline = std::chrono::steady_clock::now() + 5s;
    while (!destroyed && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(1ms);
    }
    ASSERT_TRUE(destroyed);

    std::this_thread::sleep_for(100ms);
    EXPECT_FALSE(late_ran);
}
