#include "muxbus/scheduler.hpp"

namespace muxbus {

TimerId Tick::ScheduleAfter(std::chrono::milliseconds /*delay*/, Task task) {
    std::lock_guard lock(mutex_);
    const TimerId id = next_id_++;
    tasks_.emplace(id, std::move(task));
    return id;
}

bool Tick::Cancel(TimerId id) noexcept {
    std::lock_guard lock(mutex_);
    return tasks_.erase(id) > 0;
}

size_t Tick::Pulse() {
    std::map<TimerId, Task> due;
    {
        std::lock_guard lock(mutex_);
        due.swap(tasks_);
    }

    for (const auto& [id, task] : due) {
        detail::RunTask(task);
    }
    return due.size();
}

size_t Tick::Pending() const noexcept {
    std::lock_guard lock(mutex_);
    return tasks_.size();
}

} // namespace muxbus
