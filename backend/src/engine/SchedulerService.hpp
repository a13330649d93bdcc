#pragma once

#include <chrono>
#include <cstddef>
#include <functional>
#include <string>
#include <unordered_map>

namespace fl::engine
{

class SchedulerService
{
  public:
    using Clock = std::chrono::steady_clock;
    using TaskId = std::size_t;
    using Callback = std::function<void()>;

    // First run is one interval after `now`.
    TaskId schedule(std::string name, std::chrono::milliseconds interval,
                    Callback callback, Clock::time_point now = Clock::now());
    bool cancel(TaskId id);
    // Changes the period of a task and restarts its countdown from `now`.
    bool reschedule(TaskId id, std::chrono::milliseconds interval,
                    Clock::time_point now = Clock::now());

    // Runs every due task once. Returns how many ran.
    std::size_t tick(Clock::time_point now);

    // How long the main loop may sleep before work is due.
    std::chrono::milliseconds time_until_next_task(Clock::time_point now) const;

    std::size_t task_count() const noexcept
    {
        return tasks_.size();
    }

  private:
    struct Task
    {
        std::string name;
        std::chrono::milliseconds interval;
        Clock::time_point next_run;
        Callback callback;
    };

    std::unordered_map<TaskId, Task> tasks_;
    TaskId next_id_ = 1;
};

} // namespace fl::engine
