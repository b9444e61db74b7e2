#include "nbfacade/view_synchronizer.h"
#include "nbfacade/line_format.h"
#include "nbfacade/shadow_projector.h"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <unordered_set>

namespace nbfacade {

namespace {

bool ContainsMarker(const std::vector<std::string>& lines) {
    for (const auto& line : lines) {
        if (ParseStartMarker(line) || IsEndMarker(line)) {
            return true;
        }
    }
    return false;
}

} // namespace

const char* ViewKindName(ViewKind kind) {
    switch (kind) {
        case ViewKind::Human: return "human";
        case ViewKind::Shadow: return "shadow";
        case ViewKind::Overlay: return "overlay";
    }
    return "human";
}

ViewSynchronizer::ViewSynchronizer(Document& document, AnchorTracker& anchors,
                                   TextView& human, TextView& shadow, TaskQueue& task_queue)
    : document_(document), anchors_(anchors), human_(human), shadow_(shadow), task_queue_(task_queue) {
}

void ViewSynchronizer::Rebuild() {
    const int old_count = human_.GetLineCount();

    human_.Reset(document_.ToLines());
    human_.ClearHistory();
    anchors_.PlaceAnchors(document_);
    PruneBufferCache();
    RefreshOverlay();
    RegenerateShadow();

    QueueChange(ViewKind::Human, 0, old_count, human_.GetLineCount());
}

// ========== Overlay Lifecycle ==========

bool ViewSynchronizer::OpenOverlay(int line, int column) {
    auto cell_id = anchors_.CellAt(line);
    if (!cell_id) {
        spdlog::debug("No cell at line {}", line);
        return false;
    }

    auto content = anchors_.ContentRangeOf(*cell_id);
    if (!content) {
        return false;
    }

    int local = std::clamp(line - content->start, 0, content->Count() - 1);
    return OpenOverlayForCell(*cell_id, {local, column});
}

bool ViewSynchronizer::OpenOverlayForCell(const std::string& cell_id, CursorPosition local_cursor) {
    if (overlay_ && overlay_->GetCellId() == cell_id) {
        SetOverlayCursor(local_cursor);
        return true;
    }

    if (!anchors_.ContentRangeOf(cell_id)) {
        spdlog::debug("Cannot open overlay, cell {} is gone", cell_id);
        return false;
    }

    if (overlay_) {
        CloseOverlay();
    }

    // Closing never moves lines, so the range is still current
    auto content = anchors_.ContentRangeOf(cell_id);
    if (!content) {
        return false;
    }

    auto& buffer = buffer_cache_[cell_id];
    if (!buffer) {
        buffer = std::make_shared<TextView>();
    }

    auto lines = human_.GetLines(content->start, content->end + 1);
    if (buffer->GetLines() != lines) {
        buffer->Reset(std::move(lines));
    }

    overlay_.emplace(cell_id, buffer, *content, ++generation_counter_);
    SetOverlayCursor(local_cursor);

    spdlog::debug("Opened overlay {} on cell {} (lines {}-{})",
                  overlay_->GetGeneration(), cell_id, content->start, content->end);

    QueueChange(ViewKind::Overlay, 0, 0, buffer->GetLineCount());
    return true;
}

void ViewSynchronizer::CloseOverlay() {
    if (!overlay_) {
        return;
    }

    EndInsert();

    const std::string cell_id = overlay_->GetCellId();
    const uint64_t generation = overlay_->GetGeneration();
    const int line_count = overlay_->GetBuffer().GetLineCount();

    document_.SetCellSource(cell_id, overlay_->GetBuffer().GetLines());
    overlay_.reset();

    spdlog::debug("Closed overlay {} on cell {}", generation, cell_id);

    QueueChange(ViewKind::Overlay, 0, line_count, 0);
    if (overlay_closed_callback_) {
        overlay_closed_callback_(cell_id, generation);
    }
}

bool ViewSynchronizer::OpenAdjacent(int direction) {
    if (!overlay_ || (direction != -1 && direction != 1)) {
        return false;
    }

    auto index = document_.IndexOf(overlay_->GetCellId());
    if (!index) {
        return false;
    }
    if (direction < 0 && *index == 0) {
        return false;
    }
    size_t target = *index + direction;
    if (!document_.IsValidIndex(target)) {
        return false;
    }

    const Cell& cell = document_.GetCell(target);
    const std::string target_id = cell.id;

    // Moving up lands on the last line of the previous cell
    CursorPosition cursor;
    if (direction < 0) {
        cursor.line = cell.LineCount() - 1;
    }

    CloseOverlay();
    return OpenOverlayForCell(target_id, cursor);
}

// ========== Overlay Editing ==========

void ViewSynchronizer::BeginInsert() {
    if (!overlay_ || overlay_->IsInserting()) {
        return;
    }
    overlay_->SetInserting(true);
    human_.BeginUndoGroup();
}

void ViewSynchronizer::EndInsert() {
    if (!overlay_ || !overlay_->IsInserting()) {
        return;
    }
    overlay_->SetInserting(false);
    human_.CommitUndoGroup();
}

bool ViewSynchronizer::ApplyOverlayEdit(int local_start, int local_end, std::vector<std::string> lines) {
    if (!overlay_) {
        return false;
    }

    TextView& buffer = overlay_->GetBuffer();
    const int count = buffer.GetLineCount();
    if (local_start < 0 || local_end < local_start || local_end > count) {
        spdlog::debug("Overlay edit {}-{} out of range ({} lines)", local_start, local_end, count);
        return false;
    }

    // A cell keeps at least one line
    if (lines.empty() && local_start == 0 && local_end == count) {
        lines.emplace_back();
    }

    const std::string cell_id = overlay_->GetCellId();
    auto shadow_lines = ShadowProjector::ProjectRegion(document_, cell_id, lines);
    if (!shadow_lines) {
        spdlog::debug("Overlay cell {} no longer exists", cell_id);
        return false;
    }

    const int abs_start = overlay_->ToDocumentLine(local_start);
    const int abs_old_end = overlay_->ToDocumentLine(local_end);
    const int abs_new_end = abs_start + static_cast<int>(lines.size());
    const int delta = abs_new_end - abs_old_end;

    buffer.SetLines(local_start, local_end, lines);
    shadow_.SetLines(abs_start, abs_old_end, std::move(*shadow_lines));
    human_.SetLines(abs_start, abs_old_end, std::move(lines));
    document_.SetCellSource(cell_id, buffer.GetLines());

    if (delta != 0) {
        LineRange region = overlay_->GetRegion();
        region.end += delta;
        overlay_->SetRegion(region);
        anchors_.OnLinesReplaced(abs_start, abs_old_end, abs_new_end);
    }

    QueueChange(ViewKind::Overlay, local_start, local_end, local_start + (abs_new_end - abs_start));
    QueueChange(ViewKind::Human, abs_start, abs_old_end, abs_new_end);
    QueueChange(ViewKind::Shadow, abs_start, abs_old_end, abs_new_end);

    VerifyInvariant();
    return true;
}

void ViewSynchronizer::SetOverlayCursor(CursorPosition cursor) {
    if (!overlay_) {
        return;
    }
    const int count = overlay_->GetBuffer().GetLineCount();
    cursor.line = std::clamp(cursor.line, 0, std::max(0, count - 1));
    cursor.column = std::max(0, cursor.column);
    overlay_->SetCursor(cursor);

    human_cursor_ = {overlay_->ToDocumentLine(cursor.line), cursor.column};
}

void ViewSynchronizer::SetHumanCursor(CursorPosition cursor) {
    cursor.line = std::clamp(cursor.line, 0, std::max(0, human_.GetLineCount() - 1));
    cursor.column = std::max(0, cursor.column);
    human_cursor_ = cursor;
}

// ========== Undo / Redo ==========

bool ViewSynchronizer::Undo() {
    EndInsert();

    const int old_count = human_.GetLineCount();
    if (!human_.Undo()) {
        spdlog::debug("Nothing to undo");
        return false;
    }

    AfterHistoryChange(old_count);
    return true;
}

bool ViewSynchronizer::Redo() {
    EndInsert();

    const int old_count = human_.GetLineCount();
    if (!human_.Redo()) {
        spdlog::debug("Nothing to redo");
        return false;
    }

    AfterHistoryChange(old_count);
    return true;
}

void ViewSynchronizer::AfterHistoryChange(int old_line_count) {
    document_.Reconcile(human_.GetLines());
    anchors_.PlaceAnchors(document_);
    PruneBufferCache();
    RefreshOverlay();
    RegenerateShadow();

    QueueChange(ViewKind::Human, 0, old_line_count, human_.GetLineCount());
    VerifyInvariant();
}

// ========== Structural Operations ==========

std::optional<std::string> ViewSynchronizer::InsertCell(size_t index, CellKind kind, std::vector<std::string> source) {
    EndInsert();

    index = std::min(index, document_.GetCellCount());
    auto start = StartLineOfIndex(index);
    if (!start) {
        return std::nullopt;
    }

    std::string id = document_.InsertCell(index, kind, std::move(source));
    const Cell* cell = document_.GetCellById(id);

    auto human_lines = CellsToLines({*cell});
    auto shadow_lines = ShadowProjector::ProjectCell(*cell);
    const int end = *start + static_cast<int>(human_lines.size());

    human_.SetLines(*start, *start, std::move(human_lines));
    shadow_.SetLines(*start, *start, std::move(shadow_lines));
    anchors_.PlaceAnchors(document_);
    RefreshOverlay();

    QueueChange(ViewKind::Human, *start, *start, end);
    QueueChange(ViewKind::Shadow, *start, *start, end);

    VerifyInvariant();
    return id;
}

bool ViewSynchronizer::DeleteCell(const std::string& cell_id) {
    EndInsert();

    auto range = anchors_.RangeOf(cell_id);
    if (!range) {
        return false;
    }
    if (document_.GetCellCount() <= 1) {
        spdlog::warn("Cannot delete the last cell");
        return false;
    }

    if (overlay_ && overlay_->GetCellId() == cell_id) {
        CloseOverlay();
    }
    if (!document_.DeleteCell(cell_id)) {
        return false;
    }

    const int end = range->end + 1;
    human_.SetLines(range->start, end, {});
    shadow_.SetLines(range->start, end, {});
    anchors_.OnLinesReplaced(range->start, end, range->start);
    buffer_cache_.erase(cell_id);
    RefreshOverlay();

    QueueChange(ViewKind::Human, range->start, end, range->start);
    QueueChange(ViewKind::Shadow, range->start, end, range->start);

    VerifyInvariant();
    return true;
}

std::optional<size_t> ViewSynchronizer::MoveCell(const std::string& cell_id, int direction) {
    EndInsert();

    auto index = document_.IndexOf(cell_id);
    if (!index || (direction != -1 && direction != 1)) {
        return std::nullopt;
    }
    if (direction < 0 && *index == 0) {
        return std::nullopt;
    }
    const size_t neighbor_index = *index + direction;
    if (!document_.IsValidIndex(neighbor_index)) {
        return std::nullopt;
    }

    auto own = anchors_.RangeOf(cell_id);
    auto neighbor = anchors_.RangeOf(document_.GetCell(neighbor_index).id);
    if (!own || !neighbor) {
        return std::nullopt;
    }

    auto new_index = document_.MoveCell(cell_id, direction);
    if (!new_index) {
        return std::nullopt;
    }

    // Rewrite the block covering both cells in their new order
    const size_t first = std::min(*index, neighbor_index);
    const int start = std::min(own->start, neighbor->start);
    const int end = std::max(own->end, neighbor->end) + 1;

    std::vector<Cell> pair = {document_.GetCell(first), document_.GetCell(first + 1)};
    auto human_lines = CellsToLines(pair);
    std::vector<std::string> shadow_lines;
    for (const auto& cell : pair) {
        auto projected = ShadowProjector::ProjectCell(cell);
        shadow_lines.insert(shadow_lines.end(), projected.begin(), projected.end());
    }

    human_.SetLines(start, end, std::move(human_lines));
    shadow_.SetLines(start, end, std::move(shadow_lines));
    anchors_.PlaceAnchors(document_);
    RefreshOverlay();

    QueueChange(ViewKind::Human, start, end, end);
    QueueChange(ViewKind::Shadow, start, end, end);

    VerifyInvariant();
    return new_index;
}

bool ViewSynchronizer::SetCellKind(const std::string& cell_id, CellKind kind) {
    EndInsert();

    auto range = anchors_.RangeOf(cell_id);
    const Cell* cell = document_.GetCellById(cell_id);
    if (!range || !cell) {
        return false;
    }
    if (cell->kind == kind) {
        return true;
    }

    document_.SetCellKind(cell_id, kind);

    human_.SetLines(range->start, range->start + 1, {StartMarker(kind)});
    shadow_.SetLines(range->start + 1, range->end, ShadowProjector::ProjectContent(kind, cell->source));

    QueueChange(ViewKind::Human, range->start, range->start + 1, range->start + 1);
    QueueChange(ViewKind::Shadow, range->start + 1, range->end, range->end);

    VerifyInvariant();
    return true;
}

// ========== Content Replacement ==========

bool ViewSynchronizer::ReplaceCellContent(const std::string& cell_id, std::vector<std::string> lines) {
    std::vector<CellUpdate> updates;
    updates.push_back({cell_id, std::move(lines)});
    return ReplaceCellContents(std::move(updates));
}

bool ViewSynchronizer::ReplaceCellContents(std::vector<CellUpdate> updates) {
    EndInsert();

    struct Resolved {
        LineRange content;
        CellUpdate* update;
    };

    std::vector<Resolved> resolved;
    std::unordered_set<std::string> seen;
    for (auto& update : updates) {
        if (!seen.insert(update.cell_id).second) {
            spdlog::debug("Duplicate update for cell {} ignored", update.cell_id);
            continue;
        }
        auto content = anchors_.ContentRangeOf(update.cell_id);
        if (!content) {
            spdlog::debug("Skipping update for stale cell {}", update.cell_id);
            continue;
        }
        resolved.push_back({*content, &update});
    }

    if (resolved.empty()) {
        return false;
    }

    // Bottom-to-top keeps the ranges of the remaining cells valid
    std::sort(resolved.begin(), resolved.end(),
        [](const Resolved& a, const Resolved& b) { return a.content.start > b.content.start; });

    human_.BeginUndoGroup();
    for (auto& entry : resolved) {
        ReplaceContentRange(entry.update->cell_id, entry.content, std::move(entry.update->lines));
    }
    human_.CommitUndoGroup();

    RefreshOverlay();
    VerifyInvariant();
    return true;
}

void ViewSynchronizer::ReplaceContentRange(const std::string& cell_id, const LineRange& content,
                                           std::vector<std::string> lines) {
    lines = Cell::NormalizeSource(std::move(lines));

    auto shadow_lines = ShadowProjector::ProjectRegion(document_, cell_id, lines);
    if (!shadow_lines) {
        return;
    }

    const int start = content.start;
    const int old_end = content.end + 1;
    const int new_end = start + static_cast<int>(lines.size());

    shadow_.SetLines(start, old_end, std::move(*shadow_lines));
    document_.SetCellSource(cell_id, lines);
    human_.SetLines(start, old_end, std::move(lines));

    if (new_end != old_end) {
        anchors_.OnLinesReplaced(start, old_end, new_end);
    }

    QueueChange(ViewKind::Human, start, old_end, new_end);
    QueueChange(ViewKind::Shadow, start, old_end, new_end);
}

bool ViewSynchronizer::ApplyHumanEdit(int start, int end, std::vector<std::string> lines) {
    EndInsert();

    if (start < 0 || end < start || end > human_.GetLineCount()) {
        return false;
    }

    // Fast path: edit confined to one cell's content
    auto cell_id = anchors_.CellAt(start);
    auto content = cell_id ? anchors_.ContentRangeOf(*cell_id) : std::nullopt;
    if (content && start >= content->start && end <= content->end + 1 && !ContainsMarker(lines)) {
        auto source = human_.GetLines(content->start, content->end + 1);
        const int local_start = start - content->start;
        const int local_end = end - content->start;
        source.erase(source.begin() + local_start, source.begin() + local_end);
        source.insert(source.begin() + local_start, lines.begin(), lines.end());

        ReplaceContentRange(*cell_id, *content, std::move(source));
        RefreshOverlay();
        VerifyInvariant();
        return true;
    }

    const int old_count = human_.GetLineCount();

    human_.BeginUndoGroup();
    human_.SetLines(start, end, std::move(lines));
    document_.Reconcile(human_.GetLines());

    // Keep the human view in canonical cell form
    auto canonical = document_.ToLines();
    if (canonical != human_.GetLines()) {
        spdlog::debug("Normalizing human view after structural edit");
        human_.SetLines(0, human_.GetLineCount(), std::move(canonical));
    }
    human_.CommitUndoGroup();

    anchors_.PlaceAnchors(document_);
    PruneBufferCache();
    RefreshOverlay();
    RegenerateShadow();

    QueueChange(ViewKind::Human, 0, old_count, human_.GetLineCount());
    VerifyInvariant();
    return true;
}

// ========== Navigation ==========

std::optional<int> ViewSynchronizer::NextCellLine(int line) const {
    auto cell_id = anchors_.CellAt(line);
    if (!cell_id) {
        return std::nullopt;
    }
    auto index = document_.IndexOf(*cell_id);
    if (!index || !document_.IsValidIndex(*index + 1)) {
        return std::nullopt;
    }
    auto content = anchors_.ContentRangeOf(document_.GetCell(*index + 1).id);
    if (!content) {
        return std::nullopt;
    }
    return content->start;
}

std::optional<int> ViewSynchronizer::PrevCellLine(int line) const {
    auto cell_id = anchors_.CellAt(line);
    if (!cell_id) {
        return std::nullopt;
    }
    auto index = document_.IndexOf(*cell_id);
    if (!index || *index == 0) {
        return std::nullopt;
    }
    auto content = anchors_.ContentRangeOf(document_.GetCell(*index - 1).id);
    if (!content) {
        return std::nullopt;
    }
    return content->start;
}

// ========== Consistency ==========

bool ViewSynchronizer::VerifyInvariant() {
    const int human_count = human_.GetLineCount();
    if (shadow_.GetLineCount() == human_count && anchors_.GetLineCount() == human_count) {
        return true;
    }

    spdlog::warn("View line counts diverged (human {}, shadow {}, anchors {}), regenerating",
                 human_count, shadow_.GetLineCount(), anchors_.GetLineCount());

    if (anchors_.GetLineCount() != human_count) {
        anchors_.PlaceAnchors(document_);
        anchors_.SetLineCount(human_count);
    }
    RegenerateShadow();
    return false;
}

void ViewSynchronizer::RegenerateShadow() {
    const int old_count = shadow_.GetLineCount();

    auto lines = ShadowProjector::Project(document_);
    if (static_cast<int>(lines.size()) != human_.GetLineCount()) {
        // The human view wins over the document
        spdlog::warn("Document does not match the human view, projecting from its lines");
        lines = ShadowProjector::ProjectLines(human_.GetLines());
    }
    shadow_.Reset(std::move(lines));

    QueueChange(ViewKind::Shadow, 0, old_count, shadow_.GetLineCount());
}

// ========== Helpers ==========

std::optional<int> ViewSynchronizer::StartLineOfIndex(size_t index) const {
    if (index >= document_.GetCellCount()) {
        return human_.GetLineCount();
    }
    auto range = anchors_.RangeOf(document_.GetCell(index).id);
    if (!range) {
        return std::nullopt;
    }
    return range->start;
}

void ViewSynchronizer::RefreshOverlay() {
    if (!overlay_) {
        return;
    }

    auto content = anchors_.ContentRangeOf(overlay_->GetCellId());
    if (!content) {
        spdlog::debug("Overlay cell {} is gone, closing overlay", overlay_->GetCellId());
        CloseOverlay();
        return;
    }

    overlay_->SetRegion(*content);

    auto lines = human_.GetLines(content->start, content->end + 1);
    TextView& buffer = overlay_->GetBuffer();
    if (buffer.GetLines() != lines) {
        const int old_count = buffer.GetLineCount();
        buffer.Reset(std::move(lines));
        QueueChange(ViewKind::Overlay, 0, old_count, buffer.GetLineCount());
    }
    SetOverlayCursor(overlay_->GetCursor());
}

void ViewSynchronizer::PruneBufferCache() {
    for (auto it = buffer_cache_.begin(); it != buffer_cache_.end();) {
        if (!document_.GetCellById(it->first)) {
            it = buffer_cache_.erase(it);
        } else {
            ++it;
        }
    }
}

void ViewSynchronizer::QueueChange(ViewKind view, int start, int old_end, int new_end) {
    pending_changes_.push_back({view, start, old_end, new_end});
    task_queue_.PostOnce("view-changed", [this]() { FlushChanges(); });
}

void ViewSynchronizer::FlushChanges() {
    if (pending_changes_.empty()) {
        return;
    }
    std::vector<ViewChange> changes;
    std::swap(changes, pending_changes_);

    if (view_changed_callback_) {
        view_changed_callback_(changes);
    }
}

} // namespace nbfacade
