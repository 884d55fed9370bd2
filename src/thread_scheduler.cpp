#include "muxbus/scheduler.hpp"
#include "muxbus/log.hpp"
#include <condition_variable>
#include <exception>
#include <thread>

namespace muxbus {

struct ThreadScheduler::Impl {
    using Clock = std::chrono::steady_clock;
    using Key = std::pair<Clock::time_point, TimerId>;

    mutable std::mutex mutex_;
    std::condition_variable wake_;        // New earliest deadline or stop
    std::condition_variable finished_;    // Running task returned
    std::map<Key, Task> tasks_;           // Ordered by deadline, then id
    std::unordered_map<TimerId, Clock::time_point> deadlines_;
    TimerId next_id_ = 1;
    TimerId running_ = INVALID_TIMER_ID;
    bool stopping_ = false;
    std::thread worker_;

    void Run();
};

void ThreadScheduler::Impl::Run() {
    std::unique_lock lock(mutex_);

    while (!stopping_) {
        if (tasks_.empty()) {
            wake_.wait(lock);
            continue;
        }

        auto next = tasks_.begin();
        const Clock::time_point deadline = next->first.first;
        if (Clock::now() < deadline) {
            wake_.wait_until(lock, deadline);
            continue;
        }

        const TimerId id = next->first.second;
        Task task = std::move(next->second);
        tasks_.erase(next);
        deadlines_.erase(id);

        running_ = id;
        lock.unlock();
        detail::RunTask(task);
        lock.lock();
        running_ = INVALID_TIMER_ID;
        finished_.notify_all();
    }
}

void detail::RunTask(const Scheduler::Task& task) noexcept {
    try {
        task();
    } catch (const std::exception& e) {
        Logger()->error("scheduled task threw: {}", e.what());
    } catch (...) {
        Logger()->error("scheduled task threw a non-standard exception");
    }
}

ThreadScheduler::ThreadScheduler()
    : pimpl_(std::make_shared<Impl>())
{
    pimpl_->worker_ = std::thread([impl = pimpl_]() { impl->Run(); });
}

ThreadScheduler::~ThreadScheduler() {
    {
        std::lock_guard lock(pimpl_->mutex_);
        pimpl_->stopping_ = true;
    }
    pimpl_->wake_.notify_all();
    if (!pimpl_->worker_.joinable()) {
        return;
    }
    if (std::this_thread::get_id() == pimpl_->worker_.get_id()) {
        // Inside a task: the worker keeps Impl alive until Run() returns
        pimpl_->worker_.detach();
    } else {
        pimpl_->worker_.join();
    }
}

TimerId ThreadScheduler::ScheduleAfter(std::chrono::milliseconds delay, Task task) {
    const Impl::Clock::time_point deadline = Impl::Clock::now() + delay;
    bool earliest = false;
    TimerId id = INVALID_TIMER_ID;
    {
        std::lock_guard lock(pimpl_->mutex_);
        id = pimpl_->next_id_++;
        auto [it, inserted] = pimpl_->tasks_.emplace(Impl::Key{deadline, id}, std::move(task));
        pimpl_->deadlines_.emplace(id, deadline);
        earliest = (it == pimpl_->tasks_.begin());
    }
    // Only a new head of the queue changes how long the worker sleeps
    if (earliest) {
        pimpl_->wake_.notify_one();
    }
    return id;
}

bool ThreadScheduler::Cancel(TimerId id) noexcept {
    if (id == INVALID_TIMER_ID) {
        return false;
    }

    std::unique_lock lock(pimpl_->mutex_);
    auto found = pimpl_->deadlines_.find(id);
    if (found != pimpl_->deadlines_.end()) {
        pimpl_->tasks_.erase(Impl::Key{found->second, id});
        pimpl_->deadlines_.erase(found);
        return true;
    }

    // Already running: wait it out, unless we are that task
    if (pimpl_->running_ == id && std::this_thread::get_id() != pimpl_->worker_.get_id()) {
        pimpl_->finished_.wait(lock, [this, id]() { return pimpl_->running_ != id; });
    }
    return false;
}

size_t ThreadScheduler::Pending() const noexcept {
    std::lock_guard lock(pimpl_->mutex_);
    return pimpl_->tasks_.size();
}

} // namespace muxbus
