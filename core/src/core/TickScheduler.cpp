#include "core/TickScheduler.h"

#include <vector>

namespace sounddeck {

TickScheduler::TaskId TickScheduler::Register(const double intervalSeconds,
                                              Callback callback)
{
    if (intervalSeconds <= 0.0 || !callback) {
        return kInvalidTaskId;
    }

    const TaskId id = nextId_++;
    Task task;
    task.interval = intervalSeconds;
    task.nextDue = now_ + intervalSeconds;
    task.callback = std::move(callback);
    tasks_.emplace(id, std::move(task));
    return id;
}

bool TickScheduler::Unregister(const TaskId id)
{
    return tasks_.erase(id) > 0U;
}

bool TickScheduler::is_registered(const TaskId id) const
{
    return tasks_.find(id) != tasks_.end();
}

void TickScheduler::Advance(const double nowSeconds)
{
    if (nowSeconds < now_) {
        // Clock went backwards; keep the scheduler monotonic.
        return;
    }
    now_ = nowSeconds;

    // Snapshot the ids so callbacks can mutate the registry.
    std::vector<TaskId> due;
    due.reserve(tasks_.size());
    for (const auto& [id, task] : tasks_) {
        if (task.nextDue <= now_) {
            due.push_back(id);
        }
    }

    for (const TaskId id : due) {
        auto it = tasks_.find(id);
        if (it == tasks_.end()) {
            continue;
        }

        Task& task = it->second;
        task.nextDue += task.interval;
        if (task.nextDue <= now_) {
            // Fell behind by more than one interval: skip the missed
            // ticks instead of bursting.
            task.nextDue = now_ + task.interval;
        }

        // Copy so the task may unregister itself from its callback.
        const Callback callback = task.callback;
        callback();
    }
}

}  // namespace sounddeck
