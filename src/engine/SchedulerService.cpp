#include "engine/SchedulerService.hpp"

#include <utility>

namespace ts::engine
{

auto SchedulerService::push(std::chrono::milliseconds interval,
                            Callback callback, bool repeat) -> TaskId
{
    TaskId id = next_id_++;
    auto next = Clock::now() + interval;
    tasks_.push({id, interval, next, std::move(callback), repeat});
    live_.insert(id);
    return id;
}

auto SchedulerService::schedule(std::chrono::milliseconds interval,
                                Callback callback) -> TaskId
{
    return push(interval, std::move(callback), true);
}

auto SchedulerService::schedule_once(std::chrono::milliseconds delay,
                                     Callback callback) -> TaskId
{
    return push(delay, std::move(callback), false);
}

bool SchedulerService::cancel(TaskId id)
{
    if (live_.erase(id) == 0)
    {
        return false;
    }
    drop_cancelled_front();
    return true;
}

bool SchedulerService::is_scheduled(TaskId id) const
{
    return live_.contains(id);
}

std::size_t SchedulerService::pending() const noexcept
{
    return live_.size();
}

void SchedulerService::drop_cancelled_front()
{
    while (!tasks_.empty() && !live_.contains(tasks_.top().id))
    {
        tasks_.pop();
    }
}

std::size_t SchedulerService::tick(Clock::time_point now)
{
    std::size_t executed = 0;

    // Process all tasks that are due
    while (!tasks_.empty() && tasks_.top().next_run <= now)
    {
        // 1. Extract task
        Task task = tasks_.top();
        tasks_.pop();
        if (!live_.contains(task.id))
        {
            continue;
        }
        if (!task.repeat)
        {
            live_.erase(task.id);
        }

        // 2. Execute
        if (task.callback)
        {
            task.callback();
            executed++;
        }

        // 3. Reschedule, unless the callback cancelled its own task
        if (task.repeat && live_.contains(task.id))
        {
            task.next_run = now + task.interval;
            tasks_.push(std::move(task));
        }
    }
    drop_cancelled_front();
    return executed;
}

std::chrono::milliseconds
SchedulerService::time_until_next_task(Clock::time_point now) const
{
    if (tasks_.empty())
    {
        return std::chrono::hours(24); // Infinite sleep essentially
    }
    auto next = tasks_.top().next_run;
    if (now >= next)
        return std::chrono::milliseconds(0);
    return std::chrono::duration_cast<std::chrono::milliseconds>(next - now);
}

} // namespace ts::engine
