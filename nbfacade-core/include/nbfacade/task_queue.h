#pragma once

#include "api_export.h"
#include <functional>
#include <mutex>
#include <queue>
#include <string>
#include <unordered_set>

namespace nbfacade {

/**
 * Deferred work drained once per processing cycle on the owning thread.
 *
 * Post() may be called from any thread (e.g. an execution backend callback);
 * Drain() runs on the session thread. Work posted while draining runs on the
 * next cycle.
 */
class NBFACADE_API TaskQueue {
public:
    using Task = std::function<void()>;

    TaskQueue() = default;
    TaskQueue(const TaskQueue&) = delete;
    TaskQueue& operator=(const TaskQueue&) = delete;

    void Post(Task task);

    /**
     * Post unless a task with the same key is already pending.
     * @return False if the task was folded into the pending one
     */
    bool PostOnce(const std::string& key, Task task);

    // Run everything pending; returns the number of tasks run
    size_t Drain();

    size_t GetPendingCount() const;
    bool IsEmpty() const { return GetPendingCount() == 0; }

    void Clear();

private:
    struct Entry {
        std::string key;
        Task task;
    };

    mutable std::mutex mutex_;
    std::queue<Entry> pending_;
    std::unordered_set<std::string> pending_keys_;
};

} // namespace nbfacade
