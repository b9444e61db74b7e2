#pragma once

#include "anchor_tracker.h"
#include "document.h"
#include "edit_overlay.h"
#include "task_queue.h"
#include "text_view.h"
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace nbfacade {

enum class OverlayState {
    Closed,     // Human view is authoritative
    Open        // Overlay buffer is authoritative for its cell
};

enum class ViewKind {
    Human,
    Shadow,
    Overlay
};

NBFACADE_API const char* ViewKindName(ViewKind kind);

/**
 * Affected line range of one view update: lines [start, old_end) became
 * [start, new_end).
 */
struct ViewChange {
    ViewKind view = ViewKind::Human;
    int start = 0;
    int old_end = 0;
    int new_end = 0;
};

// Replacement content for one cell
struct CellUpdate {
    std::string cell_id;
    std::vector<std::string> lines;
};

using ViewChangedCallback = std::function<void(const std::vector<ViewChange>& changes)>;
using OverlayClosedCallback = std::function<void(const std::string& cell_id, uint64_t generation)>;

/**
 * Keeps the human view, the shadow view and the edit overlay of one document
 * consistent, and owns undo coordination.
 *
 * Every mutation ends with the human and shadow views at the same line count
 * and the anchors matching the human view. Undo history lives only in the
 * human view; a continuous insertion session in the overlay is one undo step.
 *
 * Usage:
 *   ViewSynchronizer sync(document, anchors, human, shadow, queue);
 *   sync.Rebuild();
 *   sync.OpenOverlay(3);
 *   sync.BeginInsert();
 *   sync.ApplyOverlayEdit(0, 1, {"x = 2"});
 *   sync.EndInsert();
 */
class NBFACADE_API ViewSynchronizer {
public:
    ViewSynchronizer(Document& document, AnchorTracker& anchors,
                     TextView& human, TextView& shadow, TaskQueue& task_queue);

    // Regenerate every view from the document and drop undo history
    void Rebuild();

    // ========== Overlay Lifecycle ==========

    OverlayState GetState() const { return overlay_ ? OverlayState::Open : OverlayState::Closed; }

    // Open overlay (nullptr when closed)
    const EditOverlay* GetOverlay() const { return overlay_ ? &*overlay_ : nullptr; }

    /**
     * Open the overlay on the cell containing a human-view line.
     * The overlay cursor lands on the clamped relative position.
     * @return False if the line is outside every cell
     */
    bool OpenOverlay(int line, int column = 0);

    bool OpenOverlayForCell(const std::string& cell_id, CursorPosition local_cursor = {});

    // Flush the overlay into the cell source and destroy it
    void CloseOverlay();

    // Close and re-open on the next (+1) or previous (-1) cell
    bool OpenAdjacent(int direction);

    // ========== Overlay Editing ==========

    // Continuous insertion session: everything until EndInsert is one undo step
    void BeginInsert();
    void EndInsert();
    bool IsInserting() const { return overlay_ && overlay_->IsInserting(); }

    /**
     * Replace overlay-local lines [local_start, local_end) and propagate to
     * the shadow view, the human view, the document and the anchors.
     */
    bool ApplyOverlayEdit(int local_start, int local_end, std::vector<std::string> lines);

    // Overlay cursor, mirrored into the human-view cursor
    void SetOverlayCursor(CursorPosition cursor);

    const CursorPosition& GetHumanCursor() const { return human_cursor_; }
    void SetHumanCursor(CursorPosition cursor);

    // ========== Undo / Redo ==========

    // Act on the human-view history, then reconcile and refresh every view
    bool Undo();
    bool Redo();

    // ========== Structural Operations ==========

    std::optional<std::string> InsertCell(size_t index, CellKind kind, std::vector<std::string> source = {""});
    bool DeleteCell(const std::string& cell_id);
    std::optional<size_t> MoveCell(const std::string& cell_id, int direction);
    bool SetCellKind(const std::string& cell_id, CellKind kind);

    // ========== Content Replacement ==========

    bool ReplaceCellContent(const std::string& cell_id, std::vector<std::string> lines);

    /**
     * Replace the content of several cells as one undo step.
     * Updates are applied bottom-to-top; unknown cells are skipped.
     */
    bool ReplaceCellContents(std::vector<CellUpdate> updates);

    /**
     * Edit the human view directly: replace lines [start, end).
     * Edits inside one cell's content are applied incrementally; anything
     * else re-derives the cells through Document::Reconcile.
     */
    bool ApplyHumanEdit(int start, int end, std::vector<std::string> lines);

    // ========== Navigation ==========

    // First content line of the next / previous cell
    std::optional<int> NextCellLine(int line) const;
    std::optional<int> PrevCellLine(int line) const;

    // ========== Consistency ==========

    /**
     * Check the human/shadow line-count invariant.
     * On mismatch the shadow view is regenerated from the human view.
     * @return True if the views were consistent
     */
    bool VerifyInvariant();

    void RegenerateShadow();

    // ========== Notifications ==========

    // Batched per task-queue cycle
    void SetViewChangedCallback(ViewChangedCallback callback) { view_changed_callback_ = std::move(callback); }
    void SetOverlayClosedCallback(OverlayClosedCallback callback) { overlay_closed_callback_ = std::move(callback); }

    size_t GetCachedBufferCount() const { return buffer_cache_.size(); }

private:
    std::optional<int> StartLineOfIndex(size_t index) const;
    void ReplaceContentRange(const std::string& cell_id, const LineRange& content, std::vector<std::string> lines);
    void AfterHistoryChange(int old_line_count);
    void RefreshOverlay();
    void PruneBufferCache();
    void QueueChange(ViewKind view, int start, int old_end, int new_end);
    void FlushChanges();

    Document& document_;
    AnchorTracker& anchors_;
    TextView& human_;
    TextView& shadow_;
    TaskQueue& task_queue_;

    std::optional<EditOverlay> overlay_;
    std::unordered_map<std::string, std::shared_ptr<TextView>> buffer_cache_;
    uint64_t generation_counter_ = 0;
    CursorPosition human_cursor_;

    std::vector<ViewChange> pending_changes_;
    ViewChangedCallback view_changed_callback_;
    OverlayClosedCallback overlay_closed_callback_;
};

} // namespace nbfacade
