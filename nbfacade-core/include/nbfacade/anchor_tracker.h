#pragma once

#include "document.h"
#include <string>
#include <vector>
#include <optional>
#include <unordered_map>

namespace nbfacade {

/**
 * Anchor gravity for text inserted exactly at the anchor's line
 */
enum class Gravity {
    Left,   // Stays put; inserted lines end up after the anchor
    Right   // Moves down with the inserted lines
};

struct Anchor {
    int line = 0;
    std::string cell_id;
    Gravity gravity = Gravity::Left;
    bool valid = true;
};

// Inclusive line range in human-view coordinates
struct LineRange {
    int start = 0;
    int end = 0;

    int Count() const { return end - start + 1; }
    bool Contains(int line) const { return line >= start && line <= end; }
    bool operator==(const LineRange& other) const { return start == other.start && end == other.end; }
};

/**
 * Tracks the start line of every cell in the human view.
 *
 * Anchors are kept sorted by line. A cell ends one line before the next valid
 * anchor, or at the last document line. Anchors of removed cells are
 * invalidated rather than erased, so lookups through a stale cell id answer
 * "none" instead of returning another cell's coordinates.
 */
class NBFACADE_API AnchorTracker {
public:
    AnchorTracker() = default;

    // Place one left-gravity anchor per cell from the document layout
    void PlaceAnchors(const Document& document);

    /**
     * Add or move a single anchor
     */
    void SetAnchor(const std::string& cell_id, int line, Gravity gravity = Gravity::Left);

    // Cell owning a human-view line (nearest valid anchor at or before it)
    std::optional<std::string> CellAt(int line) const;

    // Full range, marker lines included
    std::optional<LineRange> RangeOf(const std::string& cell_id) const;

    // Range without the start and end marker lines
    std::optional<LineRange> ContentRangeOf(const std::string& cell_id) const;

    void Invalidate(const std::string& cell_id);
    bool IsValid(const std::string& cell_id) const;

    /**
     * Shift anchors after lines [start, old_end) were replaced by
     * [start, new_end). Anchors inside a deleted region are invalidated.
     */
    void OnLinesReplaced(int start, int old_end, int new_end);

    // Valid cell ids in line order
    std::vector<std::string> GetCellIds() const;

    const std::vector<Anchor>& GetAnchors() const { return anchors_; }

    int GetLineCount() const { return line_count_; }
    void SetLineCount(int count) { line_count_ = count; }

    void Clear();

private:
    void RebuildIndex();
    std::optional<size_t> NextValid(size_t slot) const;

    std::vector<Anchor> anchors_;
    std::unordered_map<std::string, size_t> index_;   // cell id -> slot in anchors_
    int line_count_ = 0;
};

} // namespace nbfacade
