#include "engine/SchedulerService.hpp"

#include "utils/Log.hpp"

#include <algorithm>
#include <utility>
#include <vector>

namespace fl::engine
{

auto SchedulerService::schedule(std::string name,
                                std::chrono::milliseconds interval,
                                Callback callback, Clock::time_point now)
    -> TaskId
{
    TaskId id = next_id_++;
    interval = std::max(interval, std::chrono::milliseconds(1));
    tasks_.emplace(id, Task{std::move(name), interval, now + interval,
                            std::move(callback)});
    return id;
}

bool SchedulerService::cancel(TaskId id)
{
    return tasks_.erase(id) > 0;
}

bool SchedulerService::reschedule(TaskId id, std::chrono::milliseconds interval,
                                  Clock::time_point now)
{
    auto it = tasks_.find(id);
    if (it == tasks_.end())
    {
        return false;
    }
    it->second.interval = std::max(interval, std::chrono::milliseconds(1));
    it->second.next_run = now + it->second.interval;
    FL_LOG_DEBUG("task '{}' now runs every {} ms", it->second.name,
                 it->second.interval.count());
    return true;
}

std::size_t SchedulerService::tick(Clock::time_point now)
{
    // Callbacks may cancel or add tasks, so collect the due set first.
    std::vector<std::pair<Clock::time_point, TaskId>> due;
    for (auto const &[id, task] : tasks_)
    {
        if (task.next_run <= now)
        {
            due.emplace_back(task.next_run, id);
        }
    }
    std::sort(due.begin(), due.end());

    std::size_t executed = 0;
    for (auto const &entry : due)
    {
        auto it = tasks_.find(entry.second);
        if (it == tasks_.end())
        {
            continue;
        }
        it->second.next_run = now + it->second.interval;
        auto callback = it->second.callback;
        if (callback)
        {
            callback();
            ++executed;
        }
    }
    return executed;
}

std::chrono::milliseconds
SchedulerService::time_until_next_task(Clock::time_point now) const
{
    if (tasks_.empty())
    {
        return std::chrono::hours(24);
    }
    auto next = Clock::time_point::max();
    for (auto const &entry : tasks_)
    {
        next = std::min(next, entry.second.next_run);
    }
    if (now >= next)
    {
        return std::chrono::milliseconds(0);
    }
    return std::chrono::duration_cast<std::chrono::milliseconds>(next - now);
}

} // namespace fl::engine
