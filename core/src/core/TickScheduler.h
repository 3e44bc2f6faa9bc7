#pragma once

#include <cstdint>
#include <functional>
#include <map>

namespace sounddeck {

// Cooperative periodic-callback registry. A single tick source (the UI
// timer in the application, synthetic timestamps in tests) calls
// Advance() with the current time; every registered task whose due time
// has passed runs once, in registration order.
//
// Everything happens on the caller's thread. Callbacks may register or
// unregister tasks, including themselves, while Advance() is running.
class TickScheduler {
public:
    using TaskId = std::uint64_t;
    using Callback = std::function<void()>;

    static constexpr TaskId kInvalidTaskId = 0;

    TickScheduler() = default;

    TickScheduler(const TickScheduler&) = delete;
    TickScheduler& operator=(const TickScheduler&) = delete;

    // Adds a task first due `intervalSeconds` after now(). Returns
    // kInvalidTaskId when the interval is not positive or the callback
    // is empty.
    TaskId Register(double intervalSeconds, Callback callback);

    // Removes a task. Returns false when the id is unknown.
    bool Unregister(TaskId id);

    void Advance(double nowSeconds);

    [[nodiscard]] bool is_registered(TaskId id) const;
    [[nodiscard]] int task_count() const noexcept
    {
        return static_cast<int>(tasks_.size());
    }

    // Timestamp passed to the most recent Advance() (0 before the first
    // one).
    [[nodiscard]] double now() const noexcept { return now_; }

private:
    struct Task {
        double interval{0.0};
        double nextDue{0.0};
        Callback callback;
    };

    std::map<TaskId, Task> tasks_;
    TaskId nextId_{1};
    double now_{0.0};
};

}  // namespace sounddeck
