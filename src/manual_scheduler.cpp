#include "muxbus/scheduler.hpp"
#include <algorithm>

namespace muxbus {

TimerId ManualScheduler::ScheduleAfter(std::chrono::milliseconds delay, Task task) {
    std::lock_guard lock(mutex_);
    const TimerId id = next_id_++;
    const std::chrono::milliseconds due = now_ + std::max(delay, std::chrono::milliseconds(0));
    tasks_.emplace(Key{due, id}, std::move(task));
    due_.emplace(id, due);
    return id;
}

bool ManualScheduler::Cancel(TimerId id) noexcept {
    std::lock_guard lock(mutex_);
    auto found = due_.find(id);
    if (found == due_.end()) {
        return false;
    }
    tasks_.erase(Key{found->second, id});
    due_.erase(found);
    return true;
}

size_t ManualScheduler::AdvanceBy(std::chrono::milliseconds duration) {
    std::unique_lock lock(mutex_);
    const std::chrono::milliseconds end = now_ + duration;
    size_t ran = 0;

    while (!tasks_.empty() && tasks_.begin()->first.first <= end) {
        auto next = tasks_.begin();
        now_ = next->first.first;
        Task task = std::move(next->second);
        due_.erase(next->first.second);
        tasks_.erase(next);

        // Tasks may schedule or cancel
        lock.unlock();
        detail::RunTask(task);
        ++ran;
        lock.lock();
    }

    now_ = end;
    return ran;
}

std::chrono::milliseconds ManualScheduler::Now() const noexcept {
    std::lock_guard lock(mutex_);
    return now_;
}

size_t ManualScheduler::Pending() const noexcept {
    std::lock_guard lock(mutex_);
    return tasks_.size();
}

} // namespace muxbus
