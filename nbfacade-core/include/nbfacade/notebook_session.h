#pragma once

#include "anchor_tracker.h"
#include "collaborators.h"
#include "document.h"
#include "task_queue.h"
#include "text_view.h"
#include "view_synchronizer.h"
#include <filesystem>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <nlohmann/json.hpp>

namespace nbfacade {

using ListenerId = uint64_t;

/**
 * Per-document state kept for the analysis backend connection
 */
struct BackendState {
    bool attached = false;
    std::string attached_uri;           // Shadow identity the backend knows
    int version = 0;                    // Last document version sent
    uint64_t synced_tick = 0;           // Shadow change tick matching `version`
    nlohmann::json shadow_diagnostics = nlohmann::json::array();
    std::vector<ListenerId> listeners;
};

/**
 * One open notebook: its document, anchors, views, overlay and deferred work.
 *
 * Nothing here is shared with other sessions. Identities:
 *   human view    file:///abs/path.ipynb
 *   shadow view   file://<shadow dir>/<stem>_<n>_shadow<ext>
 *   preview       nb:///abs/path.ipynb
 *   overlay       nb-cell:///abs/path.ipynb#<cell id>
 */
class NBFACADE_API NotebookSession : public std::enable_shared_from_this<NotebookSession> {
public:
    using LanguageChangedCallback = std::function<void(const std::string& old_shadow_uri,
                                                       const std::string& new_shadow_uri)>;

    static std::shared_ptr<NotebookSession> Create(const std::filesystem::path& path,
                                                   Document document = Document());
    ~NotebookSession();

    NotebookSession(const NotebookSession&) = delete;
    NotebookSession& operator=(const NotebookSession&) = delete;

    // ========== Identities ==========

    const std::filesystem::path& GetPath() const { return path_; }
    std::string GetHumanUri() const;
    const std::string& GetShadowUri() const { return shadow_uri_; }
    std::string GetPreviewUri() const;

    // Empty when no overlay is open
    std::string GetOverlayUri() const;

    // ========== Components ==========

    const Document& GetDocument() const { return document_; }
    const AnchorTracker& GetAnchors() const { return anchors_; }
    const TextView& GetHumanView() const { return human_; }
    const TextView& GetShadowView() const { return shadow_; }
    ViewSynchronizer& GetSynchronizer() { return *synchronizer_; }
    const ViewSynchronizer& GetSynchronizer() const { return *synchronizer_; }
    TaskQueue& GetTaskQueue() { return task_queue_; }
    BackendState& GetBackendState() { return backend_state_; }

    // ========== UI Queries ==========

    std::optional<std::string> CellAt(int line) const { return anchors_.CellAt(line); }
    std::optional<LineRange> RangeOf(const std::string& cell_id) const { return anchors_.RangeOf(cell_id); }
    std::optional<LineRange> ContentRangeOf(const std::string& cell_id) const { return anchors_.ContentRangeOf(cell_id); }

    // ========== Language ==========

    std::string GetLanguage() const { return document_.GetLanguage(); }

    /**
     * Change the analysis language. Produces a new shadow identity,
     * regenerates the shadow view and notifies language listeners.
     */
    void SetLanguage(const std::string& language);

    // ========== Persistence ==========

    bool LoadFrom(NotebookSerializer& serializer, const std::string& bytes);
    std::string SaveWith(NotebookSerializer& serializer) const;

    // ========== Execution & Outputs ==========

    void SetExecutionBackend(std::shared_ptr<ExecutionBackend> backend) { execution_ = std::move(backend); }
    void SetOutputRenderer(std::shared_ptr<OutputRenderer> renderer) { renderer_ = std::move(renderer); }

    /**
     * Send a code cell to the execution backend.
     * The result is stored when the task queue is next drained.
     */
    bool ExecuteCell(const std::string& cell_id);

    void ClearOutputs(const std::string& cell_id);
    void ClearAllOutputs();

    // Forward every stored output to the renderer
    void RenderAllOutputs();

    // ========== Listeners ==========

    ListenerId AddViewChangedListener(ViewChangedCallback callback);
    ListenerId AddOverlayClosedListener(OverlayClosedCallback callback);
    ListenerId AddLanguageChangedListener(LanguageChangedCallback callback);
    void RemoveListener(ListenerId id);

    // Run deferred work (view notifications, execution results)
    size_t ProcessPendingTasks() { return task_queue_.Drain(); }

private:
    NotebookSession(const std::filesystem::path& path, Document document);

    std::string MakeShadowUri() const;
    void OnExecutionResult(const std::string& cell_id, const ExecutionResult& result);
    void NotifyViewChanged(const std::vector<ViewChange>& changes);
    void NotifyOverlayClosed(const std::string& cell_id, uint64_t generation);

    std::filesystem::path path_;
    Document document_;
    AnchorTracker anchors_;
    TextView human_{true};
    TextView shadow_;
    TaskQueue task_queue_;
    std::unique_ptr<ViewSynchronizer> synchronizer_;

    std::string shadow_uri_;
    BackendState backend_state_;

    std::shared_ptr<ExecutionBackend> execution_;
    std::shared_ptr<OutputRenderer> renderer_;

    ListenerId next_listener_id_ = 1;
    std::map<ListenerId, ViewChangedCallback> view_listeners_;
    std::map<ListenerId, OverlayClosedCallback> overlay_listeners_;
    std::map<ListenerId, LanguageChangedCallback> language_listeners_;
};

} // namespace nbfacade
