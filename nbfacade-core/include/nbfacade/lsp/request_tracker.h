#pragma once

#include "nbfacade/api_export.h"
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace nbfacade {

class NotebookSession;

namespace lsp {

// (error, result) as delivered by the backend
using ReplyCallback = std::function<void(const nlohmann::json& error, const nlohmann::json& result)>;

/**
 * In-flight backend request.
 *
 * Everything needed to handle the reply is stored here, so replies are
 * correlated by id alone and never by whatever happens to be current when
 * they arrive.
 */
struct PendingRequest {
    int64_t id = 0;
    std::string method;
    std::weak_ptr<NotebookSession> session;
    const NotebookSession* owner = nullptr;     // identity only, never dereferenced
    uint64_t overlay_generation = 0;            // 0 = not issued from an overlay
    std::string supersede_key;                  // empty = never superseded
    ReplyCallback on_reply;
};

/**
 * Table of in-flight request ids.
 *
 * Cancelling only forgets a request; a reply that arrives for a forgotten
 * id is discarded by the caller.
 */
class NBFACADE_API RequestTracker {
public:
    RequestTracker() = default;

    int64_t NextId() { return next_id_++; }

    /**
     * Start tracking a request. A pending request with the same non-empty
     * supersede key is cancelled.
     * @return Id of the superseded request, if any
     */
    std::optional<int64_t> Track(PendingRequest request);

    // Remove and return the request for a reply; nullopt if unknown or cancelled
    std::optional<PendingRequest> Complete(int64_t id);

    bool Cancel(int64_t id);

    // Cancel everything issued from one overlay
    size_t CancelOverlay(const NotebookSession* owner, uint64_t generation);

    // Cancel everything of one session
    size_t CancelSession(const NotebookSession* owner);

    bool IsPending(int64_t id) const { return pending_.count(id) > 0; }
    size_t GetPendingCount() const { return pending_.size(); }
    std::vector<int64_t> GetPendingIds() const;

private:
    int64_t next_id_ = 1;
    std::map<int64_t, PendingRequest> pending_;
};

} // namespace lsp
} // namespace nbfacade
