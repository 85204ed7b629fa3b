#pragma once
#include <cstddef>
#include <ctime>
#include <functional>
#include <map>

// Cooperative periodic timer. Nothing runs on its own: the host calls
// tick(now) from its loop and every expired task runs inline.
class TaskTimer {
public:
    using Callback = std::function<void(std::time_t)>;
    using TaskId = std::size_t;

    static constexpr TaskId kNoTask = 0;

    // First run at now + periodSeconds. periodSeconds < 1 is treated as 1.
    TaskId schedule(std::time_t now, std::time_t periodSeconds, Callback cb);
    // Returns false if the task is unknown or already cancelled.
    bool cancel(TaskId id);
    // Runs every task whose deadline is <= now; returns how many ran.
    size_t tick(std::time_t now);

    bool isActive(TaskId id) const { return tasks.count(id) > 0; }
    size_t activeCount() const { return tasks.size(); }

private:
    struct Task {
        std::time_t periodSeconds;
        std::time_t nextRun;
        Callback callback;
    };

    std::map<TaskId, Task> tasks;
    TaskId nextId = 1;
};
