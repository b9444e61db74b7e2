#include "nbfacade/anchor_tracker.h"
#include "nbfacade/line_format.h"
#include <spdlog/spdlog.h>
#include <algorithm>

namespace nbfacade {

void AnchorTracker::PlaceAnchors(const Document& document) {
    anchors_.clear();

    int line = 0;
    for (const auto& cell : document.GetCells()) {
        anchors_.push_back({line, cell.id, Gravity::Left, true});
        line += CellSpan(cell);
    }
    line_count_ = line;

    RebuildIndex();
}

void AnchorTracker::SetAnchor(const std::string& cell_id, int line, Gravity gravity) {
    auto it = index_.find(cell_id);
    if (it != index_.end()) {
        anchors_.erase(anchors_.begin() + it->second);
    }

    Anchor anchor{line, cell_id, gravity, true};
    auto pos = std::upper_bound(anchors_.begin(), anchors_.end(), line,
        [](int l, const Anchor& a) { return l < a.line; });
    anchors_.insert(pos, std::move(anchor));

    RebuildIndex();
}

std::optional<std::string> AnchorTracker::CellAt(int line) const {
    if (line < 0 || line >= line_count_) {
        return std::nullopt;
    }

    // First anchor strictly after the line, then walk back to a valid one
    auto it = std::upper_bound(anchors_.begin(), anchors_.end(), line,
        [](int l, const Anchor& a) { return l < a.line; });

    while (it != anchors_.begin()) {
        --it;
        if (it->valid) {
            return it->cell_id;
        }
    }
    return std::nullopt;
}

std::optional<LineRange> AnchorTracker::RangeOf(const std::string& cell_id) const {
    auto it = index_.find(cell_id);
    if (it == index_.end() || !anchors_[it->second].valid) {
        spdlog::debug("No valid anchor for cell {}", cell_id);
        return std::nullopt;
    }

    LineRange range;
    range.start = anchors_[it->second].line;

    auto next = NextValid(it->second);
    range.end = next ? anchors_[*next].line - 1 : line_count_ - 1;

    if (range.end < range.start) {
        return std::nullopt;
    }
    return range;
}

std::optional<LineRange> AnchorTracker::ContentRangeOf(const std::string& cell_id) const {
    auto range = RangeOf(cell_id);
    if (!range || range->Count() < 3) {
        return std::nullopt;
    }
    return LineRange{range->start + 1, range->end - 1};
}

void AnchorTracker::Invalidate(const std::string& cell_id) {
    auto it = index_.find(cell_id);
    if (it != index_.end()) {
        anchors_[it->second].valid = false;
    }
}

bool AnchorTracker::IsValid(const std::string& cell_id) const {
    auto it = index_.find(cell_id);
    return it != index_.end() && anchors_[it->second].valid;
}

void AnchorTracker::OnLinesReplaced(int start, int old_end, int new_end) {
    const int delta = new_end - old_end;
    const bool pure_insert = (old_end == start);

    for (auto& anchor : anchors_) {
        // Invalid anchors keep moving too so the list stays sorted
        if (anchor.line < start) {
            continue;
        }

        if (pure_insert) {
            if (anchor.line > start || anchor.gravity == Gravity::Right) {
                anchor.line += delta;
            }
        } else if (anchor.line >= old_end) {
            anchor.line += delta;
        } else if (new_end == start) {
            // Region deleted together with the line this anchor sat on
            anchor.line = start;
            if (anchor.valid) {
                anchor.valid = false;
                spdlog::debug("Invalidated anchor for cell {}", anchor.cell_id);
            }
        } else {
            anchor.line = std::min(anchor.line, new_end - 1);
        }
    }

    line_count_ = std::max(0, line_count_ + delta);

    std::stable_sort(anchors_.begin(), anchors_.end(),
        [](const Anchor& a, const Anchor& b) { return a.line < b.line; });
    RebuildIndex();
}

std::vector<std::string> AnchorTracker::GetCellIds() const {
    std::vector<std::string> ids;
    for (const auto& anchor : anchors_) {
        if (anchor.valid) {
            ids.push_back(anchor.cell_id);
        }
    }
    return ids;
}

void AnchorTracker::Clear() {
    anchors_.clear();
    index_.clear();
    line_count_ = 0;
}

void AnchorTracker::RebuildIndex() {
    index_.clear();
    for (size_t i = 0; i < anchors_.size(); ++i) {
        index_[anchors_[i].cell_id] = i;
    }
}

std::optional<size_t> AnchorTracker::NextValid(size_t slot) const {
    for (size_t i = slot + 1; i < anchors_.size(); ++i) {
        if (anchors_[i].valid) {
            return i;
        }
    }
    return std::nullopt;
}

} // namespace nbfacade
