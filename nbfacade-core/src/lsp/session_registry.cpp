#include "nbfacade/lsp/session_registry.h"
#include "nbfacade/notebook_session.h"
#include "nbfacade/uri.h"
#include <spdlog/spdlog.h>
#include <algorithm>

namespace nbfacade {
namespace lsp {

namespace {

bool SamePath(const std::filesystem::path& a, const std::filesystem::path& b) {
    return a.lexically_normal() == b.lexically_normal();
}

} // namespace

const char* OriginKindName(OriginKind kind) {
    switch (kind) {
        case OriginKind::Human: return "human";
        case OriginKind::Shadow: return "shadow";
        case OriginKind::Preview: return "preview";
        case OriginKind::Overlay: return "overlay";
    }
    return "human";
}

SessionRegistry& SessionRegistry::Instance() {
    static SessionRegistry instance;
    return instance;
}

void SessionRegistry::Register(const std::shared_ptr<NotebookSession>& session) {
    if (!session) {
        return;
    }

    std::lock_guard<std::mutex> lock(mutex_);

    // Drop expired entries while we are here
    sessions_.erase(std::remove_if(sessions_.begin(), sessions_.end(),
        [](const std::weak_ptr<NotebookSession>& weak) { return weak.expired(); }),
        sessions_.end());

    for (const auto& weak : sessions_) {
        if (weak.lock() == session) {
            return;
        }
    }
    sessions_.push_back(session);

    spdlog::debug("Registered notebook session {}", session->GetPath().string());
}

void SessionRegistry::Unregister(const NotebookSession* session) {
    std::lock_guard<std::mutex> lock(mutex_);
    sessions_.erase(std::remove_if(sessions_.begin(), sessions_.end(),
        [session](const std::weak_ptr<NotebookSession>& weak) {
            auto locked = weak.lock();
            return !locked || locked.get() == session;
        }),
        sessions_.end());
}

std::optional<ResolvedOrigin> SessionRegistry::Resolve(const std::string& uri) const {
    auto sessions = LiveSessions();

    for (const auto& session : sessions) {
        if (uri == session->GetShadowUri()) {
            return ResolvedOrigin{session, OriginKind::Shadow, std::string(), 0, false};
        }
        if (uri == session->GetHumanUri()) {
            return ResolvedOrigin{session, OriginKind::Human, std::string(), 0, false};
        }
    }

    if (auto path = FromPreviewUri(uri)) {
        for (const auto& session : sessions) {
            if (SamePath(session->GetPath(), *path)) {
                return ResolvedOrigin{session, OriginKind::Preview, std::string(), 0, false};
            }
        }
        return std::nullopt;
    }

    if (auto parts = FromOverlayUri(uri)) {
        for (const auto& session : sessions) {
            if (!SamePath(session->GetPath(), parts->path)) {
                continue;
            }

            auto content = session->ContentRangeOf(parts->cell_id);
            if (!content) {
                spdlog::debug("Overlay identity {} names a removed cell", uri);
                return std::nullopt;
            }

            const EditOverlay* overlay = session->GetSynchronizer().GetOverlay();
            ResolvedOrigin origin{session, OriginKind::Overlay, parts->cell_id, content->start, false};
            origin.overlay_open = overlay && overlay->GetCellId() == parts->cell_id;
            return origin;
        }
        return std::nullopt;
    }

    // Human identities spelled differently (e.g. relative segments)
    if (auto path = FromFileUri(uri)) {
        for (const auto& session : sessions) {
            if (SamePath(session->GetPath(), *path)) {
                return ResolvedOrigin{session, OriginKind::Human, std::string(), 0, false};
            }
        }
    }

    return std::nullopt;
}

std::shared_ptr<NotebookSession> SessionRegistry::FindByPath(const std::filesystem::path& path) const {
    for (const auto& session : LiveSessions()) {
        if (SamePath(session->GetPath(), path)) {
            return session;
        }
    }
    return nullptr;
}

size_t SessionRegistry::GetSessionCount() const {
    return LiveSessions().size();
}

void SessionRegistry::Clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    sessions_.clear();
}

std::vector<std::shared_ptr<NotebookSession>> SessionRegistry::LiveSessions() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::shared_ptr<NotebookSession>> live;
    for (const auto& weak : sessions_) {
        if (auto session = weak.lock()) {
            live.push_back(std::move(session));
        }
    }
    return live;
}

} // namespace lsp
} // namespace nbfacade
