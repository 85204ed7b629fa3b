#include "TaskTimer.hpp"
#include <vector>
#include <spdlog/spdlog.h>

TaskTimer::TaskId TaskTimer::schedule(std::time_t now, std::time_t periodSeconds, Callback cb) {
    if (periodSeconds < 1) periodSeconds = 1;
    TaskId id = nextId++;
    tasks[id] = Task{ periodSeconds, now + periodSeconds, std::move(cb) };
    spdlog::debug("TaskTimer: scheduled task {} every {}s", id, periodSeconds);
    return id;
}

bool TaskTimer::cancel(TaskId id) {
    if (tasks.erase(id) == 0) return false;
    spdlog::debug("TaskTimer: cancelled task {}", id);
    return true;
}

size_t TaskTimer::tick(std::time_t now) {
    // Callbacks may cancel or schedule tasks, so collect first
    std::vector<TaskId> expired;
    for (const auto& p : tasks) {
        if (now >= p.second.nextRun) expired.push_back(p.first);
    }

    size_t ran = 0;
    for (TaskId id : expired) {
        auto it = tasks.find(id);
        if (it == tasks.end()) continue;

        it->second.nextRun = now + it->second.periodSeconds;
        Callback cb = it->second.callback;
        if (cb) {
            cb(now);
            ++ran;
        }
    }
    return ran;
}
