#pragma once

#include "nbfacade/api_export.h"
#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace nbfacade {

class NotebookSession;

namespace lsp {

/**
 * Which view of a notebook an identity names
 */
enum class OriginKind {
    Human,
    Shadow,
    Preview,
    Overlay
};

NBFACADE_API const char* OriginKindName(OriginKind kind);

struct ResolvedOrigin {
    std::shared_ptr<NotebookSession> session;
    OriginKind kind = OriginKind::Human;
    std::string cell_id;        // Overlay identities only
    int line_offset = 0;        // Added to local lines to get document lines
    bool overlay_open = false;  // Overlay identity names the currently open overlay
};

/**
 * Process-wide map from view identities to the owning notebook session.
 *
 * Holds no per-document state: every lookup reads the identities from the
 * sessions themselves, so a language change or an overlay switch is seen by
 * the next call.
 */
class NBFACADE_API SessionRegistry {
public:
    static SessionRegistry& Instance();

    SessionRegistry(const SessionRegistry&) = delete;
    SessionRegistry& operator=(const SessionRegistry&) = delete;

    void Register(const std::shared_ptr<NotebookSession>& session);
    void Unregister(const NotebookSession* session);

    // Resolve a human, shadow, preview or overlay identity
    std::optional<ResolvedOrigin> Resolve(const std::string& uri) const;

    std::shared_ptr<NotebookSession> FindByPath(const std::filesystem::path& path) const;

    size_t GetSessionCount() const;
    void Clear();

private:
    SessionRegistry() = default;
    ~SessionRegistry() = default;

    std::vector<std::shared_ptr<NotebookSession>> LiveSessions() const;

    mutable std::mutex mutex_;
    std::vector<std::weak_ptr<NotebookSession>> sessions_;
};

} // namespace lsp
} // namespace nbfacade
