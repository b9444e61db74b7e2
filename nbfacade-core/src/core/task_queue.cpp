#include "nbfacade/task_queue.h"
#include <spdlog/spdlog.h>

namespace nbfacade {

void TaskQueue::Post(Task task) {
    if (!task) {
        return;
    }
    std::lock_guard<std::mutex> lock(mutex_);
    pending_.push({std::string(), std::move(task)});
}

bool TaskQueue::PostOnce(const std::string& key, Task task) {
    if (!task) {
        return false;
    }
    std::lock_guard<std::mutex> lock(mutex_);
    if (!pending_keys_.insert(key).second) {
        return false;
    }
    pending_.push({key, std::move(task)});
    return true;
}

size_t TaskQueue::Drain() {
    std::queue<Entry> tasks;

    {
        std::lock_guard<std::mutex> lock(mutex_);
        std::swap(tasks, pending_);
        pending_keys_.clear();
    }

    size_t count = 0;
    while (!tasks.empty()) {
        try {
            tasks.front().task();
        } catch (const std::exception& e) {
            spdlog::error("Deferred task {} failed: {}", tasks.front().key, e.what());
        }
        tasks.pop();
        ++count;
    }
    return count;
}

size_t TaskQueue::GetPendingCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return pending_.size();
}

void TaskQueue::Clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    pending_ = std::queue<Entry>();
    pending_keys_.clear();
}

} // namespace nbfacade
