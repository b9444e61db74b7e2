#pragma once

#include "anchor_tracker.h"
#include "text_view.h"
#include <cstdint>
#include <memory>
#include <string>

namespace nbfacade {

struct CursorPosition {
    int line = 0;
    int column = 0;
};

/**
 * Transient editing surface bound to one cell.
 *
 * The region is the cell's content range in human-view coordinates, so
 * overlay-local line N is human-view line GetRegionStart() + N. The buffer is
 * shared with the per-cell cache of the synchronizer and outlives the overlay.
 */
class NBFACADE_API EditOverlay {
public:
    EditOverlay(std::string cell_id, std::shared_ptr<TextView> buffer, LineRange region, uint64_t generation)
        : cell_id_(std::move(cell_id)), buffer_(std::move(buffer)), region_(region), generation_(generation) {}

    const std::string& GetCellId() const { return cell_id_; }

    int GetRegionStart() const { return region_.start; }
    int GetRegionEnd() const { return region_.end; }
    const LineRange& GetRegion() const { return region_; }
    void SetRegion(const LineRange& region) { region_ = region; }

    TextView& GetBuffer() { return *buffer_; }
    const TextView& GetBuffer() const { return *buffer_; }

    // Distinguishes successive overlays; never reused within a session
    uint64_t GetGeneration() const { return generation_; }

    bool IsInserting() const { return inserting_; }
    void SetInserting(bool inserting) { inserting_ = inserting; }

    const CursorPosition& GetCursor() const { return cursor_; }
    void SetCursor(const CursorPosition& cursor) { cursor_ = cursor; }

    int ToDocumentLine(int local_line) const { return region_.start + local_line; }
    int ToLocalLine(int document_line) const { return document_line - region_.start; }

private:
    std::string cell_id_;
    std::shared_ptr<TextView> buffer_;
    LineRange region_;
    uint64_t generation_;
    bool inserting_ = false;
    CursorPosition cursor_;
};

} // namespace nbfacade
