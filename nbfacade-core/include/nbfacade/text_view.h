#pragma once

#include "api_export.h"
#include <cstdint>
#include <string>
#include <vector>
#include <optional>

namespace nbfacade {

/**
 * One recorded line-block replacement: lines [start, start + removed.size())
 * were replaced by `inserted`.
 */
struct LineEdit {
    int start = 0;
    std::vector<std::string> removed;
    std::vector<std::string> inserted;
};

struct UndoEntry {
    std::vector<LineEdit> edits;
};

/**
 * Line buffer backing one view (human, shadow or overlay).
 *
 * Edits are whole-line replacements. When history is enabled every SetLines
 * call is one undo step, unless it happens inside a Begin/CommitUndoGroup
 * pair, in which case the whole group is one step.
 */
class NBFACADE_API TextView {
public:
    explicit TextView(bool record_history = false);

    const std::vector<std::string>& GetLines() const { return lines_; }
    int GetLineCount() const { return static_cast<int>(lines_.size()); }

    std::optional<std::string> GetLine(int line) const;

    // Lines [start, end), clamped to the buffer
    std::vector<std::string> GetLines(int start, int end) const;

    /**
     * Replace lines [start, end) with `lines`
     * @return False for an invalid range (nothing changes)
     */
    bool SetLines(int start, int end, std::vector<std::string> lines);

    // Replace all content without recording history
    void Reset(std::vector<std::string> lines);

    // Incremented on every content change
    uint64_t GetChangeTick() const { return change_tick_; }

    // ========== Undo History ==========

    bool IsRecordingHistory() const { return record_history_; }

    void BeginUndoGroup();
    void CommitUndoGroup();
    bool IsGrouping() const { return group_depth_ > 0; }

    bool CanUndo() const { return !undo_entries_.empty(); }
    bool CanRedo() const { return !redo_entries_.empty(); }

    bool Undo();
    bool Redo();

    size_t GetUndoDepth() const { return undo_entries_.size(); }
    size_t GetRedoDepth() const { return redo_entries_.size(); }

    void ClearHistory();

private:
    void Replace(int start, int end, std::vector<std::string> lines);

    std::vector<std::string> lines_;
    uint64_t change_tick_ = 0;

    bool record_history_;
    int group_depth_ = 0;
    UndoEntry current_;
    std::vector<UndoEntry> undo_entries_;
    std::vector<UndoEntry> redo_entries_;
};

} // namespace nbfacade
