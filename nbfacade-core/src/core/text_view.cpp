#include "nbfacade/text_view.h"
#include <algorithm>

namespace nbfacade {

TextView::TextView(bool record_history) : record_history_(record_history) {
}

std::optional<std::string> TextView::GetLine(int line) const {
    if (line < 0 || line >= GetLineCount()) {
        return std::nullopt;
    }
    return lines_[line];
}

std::vector<std::string> TextView::GetLines(int start, int end) const {
    start = std::clamp(start, 0, GetLineCount());
    end = std::clamp(end, start, GetLineCount());
    return std::vector<std::string>(lines_.begin() + start, lines_.begin() + end);
}

bool TextView::SetLines(int start, int end, std::vector<std::string> lines) {
    if (start < 0 || end < start || end > GetLineCount()) {
        return false;
    }

    if (record_history_) {
        LineEdit edit;
        edit.start = start;
        edit.removed.assign(lines_.begin() + start, lines_.begin() + end);
        edit.inserted = lines;

        if (group_depth_ > 0) {
            current_.edits.push_back(std::move(edit));
        } else {
            UndoEntry entry;
            entry.edits.push_back(std::move(edit));
            undo_entries_.push_back(std::move(entry));
        }
        redo_entries_.clear();
    }

    Replace(start, end, std::move(lines));
    return true;
}

void TextView::Reset(std::vector<std::string> lines) {
    lines_ = std::move(lines);
    ++change_tick_;
}

// ========== Undo History ==========

void TextView::BeginUndoGroup() {
    if (group_depth_++ == 0) {
        current_.edits.clear();
    }
}

void TextView::CommitUndoGroup() {
    if (group_depth_ == 0) {
        return;
    }
    if (--group_depth_ == 0 && !current_.edits.empty()) {
        undo_entries_.push_back(std::move(current_));
        current_.edits.clear();
    }
}

bool TextView::Undo() {
    if (undo_entries_.empty() || group_depth_ > 0) {
        return false;
    }

    UndoEntry entry = std::move(undo_entries_.back());
    undo_entries_.pop_back();

    for (auto it = entry.edits.rbegin(); it != entry.edits.rend(); ++it) {
        int end = it->start + static_cast<int>(it->inserted.size());
        Replace(it->start, end, it->removed);
    }

    redo_entries_.push_back(std::move(entry));
    return true;
}

bool TextView::Redo() {
    if (redo_entries_.empty() || group_depth_ > 0) {
        return false;
    }

    UndoEntry entry = std::move(redo_entries_.back());
    redo_entries_.pop_back();

    for (const auto& edit : entry.edits) {
        int end = edit.start + static_cast<int>(edit.removed.size());
        Replace(edit.start, end, edit.inserted);
    }

    undo_entries_.push_back(std::move(entry));
    return true;
}

void TextView::ClearHistory() {
    undo_entries_.clear();
    redo_entries_.clear();
    current_.edits.clear();
    group_depth_ = 0;
}

void TextView::Replace(int start, int end, std::vector<std::string> lines) {
    lines_.erase(lines_.begin() + start, lines_.begin() + end);
    lines_.insert(lines_.begin() + start,
                  std::make_move_iterator(lines.begin()),
                  std::make_move_iterator(lines.end()));
    ++change_tick_;
}

} // namespace nbfacade
