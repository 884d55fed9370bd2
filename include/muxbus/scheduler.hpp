#ifndef MUXBUS_SCHEDULER_HPP
#define MUXBUS_SCHEDULER_HPP

#include <cstddef>
#include <cstdint>
#include <chrono>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <unordered_map>
#include <utility>

namespace muxbus {

using TimerId = uint64_t;

// Never returned by ScheduleAfter()
constexpr TimerId INVALID_TIMER_ID = 0;

/**
 * @brief One-shot timer service driving channel bundlers.
 *
 * Injected into clients so batching can run on real time, on virtual time
 * (tests), or on an external pulse (server-managed clients).
 *
 * @par Contract
 * - ScheduleAfter() never runs the task inline.
 * - Cancel() returns true if the task was still pending and will not run.
 *   A task that has already started is not interrupted.
 * - A task that throws is logged; the tasks due after it still run.
 */
class Scheduler {
public:
    using Task = std::function<void()>;

    virtual ~Scheduler() = default;

    [[nodiscard]] virtual TimerId ScheduleAfter(std::chrono::milliseconds delay, Task task) = 0;

    virtual bool Cancel(TimerId id) noexcept = 0;
};

namespace detail {

// Run `task`, logging anything it throws
void RunTask(const Scheduler::Task& task) noexcept;

} // namespace detail

/**
 * @brief Real-time scheduler backed by a single worker thread.
 *
 * Tasks run on the worker thread in deadline order. Exceptions escaping a
 * task are logged and discarded.
 *
 * @par Cancellation
 * Cancel() called from another thread while the task is running blocks
 * until the task returns, so a caller tearing down state the task uses can
 * rely on the task being finished. Called from inside the task, it returns
 * immediately.
 *
 * @par Lifetime
 * The destructor stops and joins the worker. Pending tasks are dropped.
 * Destroyed from one of its own tasks, it detaches instead; the worker
 * exits once that task returns.
 */
class ThreadScheduler final : public Scheduler {
public:
    ThreadScheduler();
    ~ThreadScheduler() override;

    ThreadScheduler(const ThreadScheduler&) = delete;
    ThreadScheduler& operator=(const ThreadScheduler&) = delete;

    [[nodiscard]] TimerId ScheduleAfter(std::chrono::milliseconds delay, Task task) override;
    bool Cancel(TimerId id) noexcept override;

    // Number of tasks waiting to run (approximate)
    [[nodiscard]] size_t Pending() const noexcept;

private:
    struct Impl;
    // Shared with the worker thread
    std::shared_ptr<Impl> pimpl_;
};

/**
 * @brief Virtual-time scheduler. Time only moves through AdvanceBy().
 *
 * Tasks due at the same instant run in scheduling order. Tasks scheduled
 * by a running task run within the same AdvanceBy() call if they fall due
 * before its end.
 */
class ManualScheduler final : public Scheduler {
public:
    [[nodiscard]] TimerId ScheduleAfter(std::chrono::milliseconds delay, Task task) override;
    bool Cancel(TimerId id) noexcept override;

    // Move virtual time forward, running every task that falls due.
    // Returns the number of tasks run.
    size_t AdvanceBy(std::chrono::milliseconds duration);

    [[nodiscard]] std::chrono::milliseconds Now() const noexcept;
    [[nodiscard]] size_t Pending() const noexcept;

private:
    using Key = std::pair<std::chrono::milliseconds, TimerId>;

    mutable std::mutex mutex_;
    std::map<Key, Task> tasks_;
    std::unordered_map<TimerId, std::chrono::milliseconds> due_;
    std::chrono::milliseconds now_{0};
    TimerId next_id_ = 1;
};

/**
 * @brief Externally driven scheduling pulse.
 *
 * A server owning many clients hands them one Tick and calls Pulse() at
 * its own cadence; every bundler armed since the previous pulse flushes
 * together. The delay given to ScheduleAfter() is ignored.
 */
class Tick final : public Scheduler {
public:
    [[nodiscard]] TimerId ScheduleAfter(std::chrono::milliseconds delay, Task task) override;
    bool Cancel(TimerId id) noexcept override;

    // Run every task scheduled before this call. Tasks scheduled while
    // pulsing wait for the next pulse. Returns the number of tasks run.
    size_t Pulse();

    [[nodiscard]] size_t Pending() const noexcept;

private:
    mutable std::mutex mutex_;
    std::map<TimerId, Task> tasks_;
    TimerId next_id_ = 1;
};

} // namespace muxbus

#endif // MUXBUS_SCHEDULER_HPP
