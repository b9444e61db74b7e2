#include "nbfacade/lsp/request_tracker.h"
#include <spdlog/spdlog.h>

namespace nbfacade {
namespace lsp {

std::optional<int64_t> RequestTracker::Track(PendingRequest request) {
    std::optional<int64_t> superseded;

    if (!request.supersede_key.empty()) {
        for (auto it = pending_.begin(); it != pending_.end(); ++it) {
            if (it->second.supersede_key == request.supersede_key) {
                superseded = it->first;
                spdlog::debug("Request {} ({}) superseded by {}", it->first, it->second.method, request.id);
                pending_.erase(it);
                break;
            }
        }
    }

    const int64_t id = request.id;
    pending_[id] = std::move(request);
    return superseded;
}

std::optional<PendingRequest> RequestTracker::Complete(int64_t id) {
    auto it = pending_.find(id);
    if (it == pending_.end()) {
        return std::nullopt;
    }
    PendingRequest request = std::move(it->second);
    pending_.erase(it);
    return request;
}

bool RequestTracker::Cancel(int64_t id) {
    return pending_.erase(id) > 0;
}

size_t RequestTracker::CancelOverlay(const NotebookSession* owner, uint64_t generation) {
    size_t count = 0;
    for (auto it = pending_.begin(); it != pending_.end();) {
        if (it->second.owner == owner && it->second.overlay_generation == generation) {
            it = pending_.erase(it);
            ++count;
        } else {
            ++it;
        }
    }
    if (count > 0) {
        spdlog::debug("Cancelled {} requests of closed overlay {}", count, generation);
    }
    return count;
}

size_t RequestTracker::CancelSession(const NotebookSession* owner) {
    size_t count = 0;
    for (auto it = pending_.begin(); it != pending_.end();) {
        if (it->second.owner == owner) {
            it = pending_.erase(it);
            ++count;
        } else {
            ++it;
        }
    }
    return count;
}

std::vector<int64_t> RequestTracker::GetPendingIds() const {
    std::vector<int64_t> ids;
    ids.reserve(pending_.size());
    for (const auto& [id, request] : pending_) {
        ids.push_back(id);
    }
    return ids;
}

} // namespace lsp
} // namespace nbfacade
