#pragma once

#include "nbfacade/api_export.h"
#include "nbfacade/edit_overlay.h"
#include "nbfacade/lsp/backend.h"
#include "nbfacade/lsp/method_table.h"
#include "nbfacade/lsp/request_tracker.h"
#include "nbfacade/lsp/session_registry.h"
#include "nbfacade/lsp/text_edit.h"
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace nbfacade {

class NotebookSession;

namespace lsp {

/**
 * Makes an analysis backend see one plain document per notebook (the shadow
 * view) while requests come from the human view or the edit overlay.
 *
 * Requests are rewritten to the shadow identity at the same line number
 * (plus the overlay region start for overlay-local positions). Replies are
 * correlated by id only; a reply for a cancelled, superseded or closed-overlay
 * request is dropped. Without an available backend every call is a no-op.
 *
 * Usage:
 *   ProtocolProxy proxy;
 *   proxy.SetBackend(backend);
 *   proxy.AttachSession(session);
 *   proxy.Request(session->GetHumanUri(), "textDocument/definition", params,
 *                 [](const json& error, const json& result) { ... });
 *   // backend side:
 *   proxy.OnResponse(id, result);
 */
class NBFACADE_API ProtocolProxy {
public:
    using ResponseHandler = std::function<void(const nlohmann::json& error, const nlohmann::json& result)>;
    using DiagnosticsHandler = std::function<void(const std::string& uri, const nlohmann::json& diagnostics)>;
    using FocusHandler = std::function<void(const std::string& human_uri, const CursorPosition& cursor)>;

    explicit ProtocolProxy(MethodTable methods = MethodTable::Default(),
                           SessionRegistry& registry = SessionRegistry::Instance());
    ~ProtocolProxy();

    ProtocolProxy(const ProtocolProxy&) = delete;
    ProtocolProxy& operator=(const ProtocolProxy&) = delete;

    // ========== Backend ==========

    // Replaces the current backend; attached sessions are re-attached
    void SetBackend(std::shared_ptr<AnalysisBackend> backend);
    bool IsBackendAvailable() const;

    // ========== Sessions ==========

    void AttachSession(const std::shared_ptr<NotebookSession>& session);
    void DetachSession(const std::shared_ptr<NotebookSession>& session);
    bool IsAttached(const NotebookSession* session) const;

    // Send the shadow view if it changed since the last notification
    void SyncDocument(NotebookSession& session);

    // ========== Requests ==========

    /**
     * Issue a request from a human, shadow, preview or overlay identity.
     * @return Request id, or nullopt if nothing was sent
     */
    std::optional<int64_t> Request(const std::string& origin_uri, const std::string& method,
                                   const nlohmann::json& params, ResponseHandler handler);

    // Format one code cell through textDocument/rangeFormatting
    std::optional<int64_t> FormatCell(const std::shared_ptr<NotebookSession>& session,
                                      const std::string& cell_id, ResponseHandler handler = nullptr);

    /**
     * Deliver a backend reply.
     * @return False if the reply was discarded
     */
    bool OnResponse(int64_t id, const nlohmann::json& result, const nlohmann::json& error = nullptr);

    // ========== Notifications ==========

    // textDocument/publishDiagnostics from the backend
    void OnPublishDiagnostics(const nlohmann::json& params);

    /**
     * Focus a location (uri + selection, Location or LocationLink).
     * The overlay is closed and the human view cursor moved.
     * @return False if the identity belongs to no notebook
     */
    bool ShowDocument(const nlohmann::json& location);

    // Content shown when a preview identity is opened
    std::optional<std::vector<std::string>> PreviewLines(const std::string& uri) const;

    void SetDiagnosticsHandler(DiagnosticsHandler handler) { diagnostics_handler_ = std::move(handler); }
    void SetFocusHandler(FocusHandler handler) { focus_handler_ = std::move(handler); }

    RequestTracker& GetTracker() { return tracker_; }
    const MethodTable& GetMethodTable() const { return methods_; }

private:
    std::optional<int64_t> SendLocationRequest(const ResolvedOrigin& origin, const std::string& method,
                                               const nlohmann::json& params, RewriteStrategy strategy,
                                               bool supersede, ResponseHandler handler);
    std::optional<int64_t> SendDocumentFormat(const ResolvedOrigin& origin, ResponseHandler handler);
    std::optional<int64_t> SendRangeFormat(const ResolvedOrigin& origin, const nlohmann::json& params,
                                           ResponseHandler handler);
    std::optional<int64_t> SendRename(const ResolvedOrigin& origin, const nlohmann::json& params,
                                      ResponseHandler handler);
    std::optional<int64_t> SendFormatRange(const std::shared_ptr<NotebookSession>& session,
                                           const std::string& cell_id, uint64_t generation,
                                           ReplyCallback on_reply);

    int64_t Send(const std::shared_ptr<NotebookSession>& session, const std::string& method,
                 const nlohmann::json& params, uint64_t generation, std::string supersede_key,
                 ReplyCallback on_reply);

    nlohmann::json RewriteRequestParams(const nlohmann::json& params, const ResolvedOrigin& origin) const;
    nlohmann::json RewriteResult(const nlohmann::json& result, RewriteStrategy strategy) const;
    void RewriteIdentities(nlohmann::json& node, RewriteStrategy strategy) const;
    std::optional<std::string> MapShadowUri(const std::string& uri, RewriteStrategy strategy) const;

    // Edits in shadow coordinates applied to a copy of one cell's content
    std::optional<std::vector<std::string>> ApplyEditsToCell(const NotebookSession& session,
                                                             const std::string& cell_id,
                                                             const std::vector<TextEdit>& edits,
                                                             bool trim) const;
    std::vector<TextEdit> CollectWorkspaceEdits(const NotebookSession& session, const nlohmann::json& edit) const;

    void AttachToBackend(NotebookSession& session);
    void DetachFromBackend(NotebookSession& session);
    void OnLanguageChanged(NotebookSession& session, const std::string& old_uri);
    void RepublishDiagnostics(NotebookSession& session);
    void Publish(const std::string& uri, const nlohmann::json& diagnostics);

    MethodTable methods_;
    SessionRegistry& registry_;
    std::shared_ptr<AnalysisBackend> backend_;
    RequestTracker tracker_;
    std::vector<std::weak_ptr<NotebookSession>> attached_;

    DiagnosticsHandler diagnostics_handler_;
    FocusHandler focus_handler_;
};

} // namespace lsp
} // namespace nbfacade
