#pragma once

#include <chrono>
#include <cstddef>
#include <functional>
#include <queue>
#include <unordered_set>
#include <vector>

namespace ts::engine
{

// Timer wheel for the engine thread. Nothing here is thread-safe; every
// call happens on the thread that calls tick().
class SchedulerService
{
  public:
    using Clock = std::chrono::steady_clock;
    using TaskId = std::size_t;
    using Callback = std::function<void()>;

    // Repeats every `interval` until cancelled.
    TaskId schedule(std::chrono::milliseconds interval, Callback callback);

    // Runs once, `delay` after now.
    TaskId schedule_once(std::chrono::milliseconds delay, Callback callback);

    // Returns false when the task already ran (one-shot) or was cancelled.
    bool cancel(TaskId id);
    bool is_scheduled(TaskId id) const;
    std::size_t pending() const noexcept;

    // Run pending tasks. Returns how many were executed.
    std::size_t tick(Clock::time_point now);

    // Helper for the main loop: "How long can I sleep before work is due?"
    std::chrono::milliseconds time_until_next_task(Clock::time_point now) const;

  private:
    struct Task
    {
        TaskId id;
        std::chrono::milliseconds interval;
        Clock::time_point next_run;
        Callback callback;
        bool repeat = false;

        // Min-heap priority queue needs > operator for smallest-first
        bool operator>(const Task &other) const
        {
            return next_run > other.next_run;
        }
    };

    TaskId push(std::chrono::milliseconds interval, Callback callback,
                bool repeat);
    void drop_cancelled_front();

    std::priority_queue<Task, std::vector<Task>, std::greater<Task>> tasks_;
    std::unordered_set<TaskId> live_;
    TaskId next_id_ = 1;
};

} // namespace ts::engine
