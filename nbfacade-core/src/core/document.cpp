#include "nbfacade/document.h"
#include "nbfacade/line_format.h"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <deque>
#include <stdexcept>
#include <unordered_map>
#include <unordered_set>

namespace nbfacade {

namespace {

// Carry identity and passthrough payloads from an old cell onto a parsed one
void Inherit(Cell& target, const Cell& old_cell) {
    target.id = old_cell.id;
    target.metadata = old_cell.metadata;
    if (target.kind == CellKind::Code && old_cell.kind == CellKind::Code) {
        target.outputs = old_cell.outputs;
        target.execution_count = old_cell.execution_count;
    }
}

} // namespace

Document::Document() : metadata_(nlohmann::json::object()) {
    cells_.emplace_back(CellKind::Code);
}

Document::Document(std::vector<Cell> cells, nlohmann::json metadata)
    : cells_(std::move(cells)), metadata_(std::move(metadata)) {
    if (!metadata_.is_object()) {
        metadata_ = nlohmann::json::object();
    }

    std::unordered_set<std::string> seen;
    for (auto& cell : cells_) {
        cell.source = Cell::NormalizeSource(std::move(cell.source));
        if (cell.id.empty() || !seen.insert(cell.id).second) {
            cell.id = Cell::GenerateId();
            seen.insert(cell.id);
        }
    }

    if (cells_.empty()) {
        cells_.emplace_back(CellKind::Code);
    }
}

// ========== Cell Access ==========

const Cell& Document::GetCell(size_t index) const {
    if (!IsValidIndex(index)) {
        throw std::out_of_range("Cell index out of range");
    }
    return cells_[index];
}

Cell* Document::GetCellById(const std::string& id) {
    for (auto& cell : cells_) {
        if (cell.id == id) {
            return &cell;
        }
    }
    return nullptr;
}

const Cell* Document::GetCellById(const std::string& id) const {
    for (const auto& cell : cells_) {
        if (cell.id == id) {
            return &cell;
        }
    }
    return nullptr;
}

std::optional<size_t> Document::IndexOf(const std::string& id) const {
    for (size_t i = 0; i < cells_.size(); ++i) {
        if (cells_[i].id == id) {
            return i;
        }
    }
    return std::nullopt;
}

// ========== Cell Operations ==========

std::string Document::InsertCell(size_t index, CellKind kind, std::vector<std::string> source) {
    Cell cell(kind, std::move(source));
    std::string id = cell.id;

    index = std::min(index, cells_.size());
    cells_.insert(cells_.begin() + index, std::move(cell));

    spdlog::debug("Inserted {} cell {} at index {}", CellKindName(kind), id, index);
    return id;
}

bool Document::DeleteCell(const std::string& id) {
    auto index = IndexOf(id);
    if (!index) {
        return false;
    }

    // A notebook always keeps at least one cell
    if (cells_.size() <= 1) {
        spdlog::warn("Cannot delete the last cell");
        return false;
    }

    cells_.erase(cells_.begin() + *index);

    spdlog::debug("Deleted cell {} at index {}", id, *index);
    return true;
}

std::optional<size_t> Document::MoveCell(const std::string& id, int direction) {
    auto index = IndexOf(id);
    if (!index || (direction != -1 && direction != 1)) {
        return std::nullopt;
    }

    if (direction < 0 && *index == 0) {
        return std::nullopt;
    }
    size_t new_index = *index + direction;
    if (new_index >= cells_.size()) {
        return std::nullopt;
    }

    std::swap(cells_[*index], cells_[new_index]);

    spdlog::debug("Moved cell {} from {} to {}", id, *index, new_index);
    return new_index;
}

bool Document::SetCellKind(const std::string& id, CellKind kind) {
    Cell* cell = GetCellById(id);
    if (!cell) {
        return false;
    }
    if (cell->kind == kind) {
        return true;
    }

    cell->kind = kind;
    if (kind == CellKind::Code) {
        cell->outputs = nlohmann::json::array();
    } else {
        cell->outputs = nlohmann::json();
        cell->execution_count = 0;
    }

    spdlog::debug("Changed cell {} kind to {}", id, CellKindName(kind));
    return true;
}

bool Document::SetCellSource(const std::string& id, std::vector<std::string> source) {
    Cell* cell = GetCellById(id);
    if (!cell) {
        return false;
    }
    cell->source = Cell::NormalizeSource(std::move(source));
    return true;
}

// ========== Output Management ==========

bool Document::SetCellOutputs(const std::string& id, nlohmann::json outputs, int execution_count) {
    Cell* cell = GetCellById(id);
    if (!cell || cell->kind != CellKind::Code) {
        return false;
    }
    cell->outputs = std::move(outputs);
    cell->execution_count = execution_count;
    return true;
}

void Document::ClearOutputs(const std::string& id) {
    Cell* cell = GetCellById(id);
    if (cell && cell->kind == CellKind::Code) {
        cell->outputs = nlohmann::json::array();
        cell->execution_count = 0;
    }
}

void Document::ClearAllOutputs() {
    for (auto& cell : cells_) {
        if (cell.kind == CellKind::Code) {
            cell.outputs = nlohmann::json::array();
            cell.execution_count = 0;
        }
    }
}

// ========== Reconciliation ==========

void Document::Reconcile(const std::vector<std::string>& lines) {
    std::vector<Cell> parsed = LinesToCells(lines);

    // Old cells by content key, FIFO for duplicate contents
    std::unordered_map<std::string, std::deque<size_t>> by_content;
    for (size_t i = 0; i < cells_.size(); ++i) {
        by_content[cells_[i].ContentKey()].push_back(i);
    }

    std::vector<bool> claimed(cells_.size(), false);
    std::vector<bool> matched(parsed.size(), false);

    // Pass 1: exact content match
    for (size_t i = 0; i < parsed.size(); ++i) {
        auto it = by_content.find(parsed[i].ContentKey());
        if (it == by_content.end() || it->second.empty()) {
            continue;
        }
        size_t old_index = it->second.front();
        it->second.pop_front();

        Inherit(parsed[i], cells_[old_index]);
        claimed[old_index] = true;
        matched[i] = true;
    }

    // Pass 2: same position, same kind, not claimed by pass 1
    size_t minted = 0;
    for (size_t i = 0; i < parsed.size(); ++i) {
        if (matched[i]) {
            continue;
        }
        if (i < cells_.size() && !claimed[i] && cells_[i].kind == parsed[i].kind) {
            Inherit(parsed[i], cells_[i]);
            claimed[i] = true;
            matched[i] = true;
            continue;
        }
        // Parsed cells already carry a freshly minted id
        ++minted;
    }

    spdlog::debug("Reconciled {} cells ({} new ids)", parsed.size(), minted);

    if (parsed.empty()) {
        // Never leave the document without a cell
        parsed.emplace_back(CellKind::Code);
    }
    cells_ = std::move(parsed);
}

std::vector<std::string> Document::ToLines() const {
    return CellsToLines(cells_);
}

// ========== Metadata ==========

std::string Document::GetLanguage() const {
    auto info = metadata_.find("language_info");
    if (info != metadata_.end() && info->is_object()) {
        auto name = info->find("name");
        if (name != info->end() && name->is_string()) {
            return name->get<std::string>();
        }
    }
    return "python";
}

void Document::SetLanguage(const std::string& language) {
    if (!metadata_["language_info"].is_object()) {
        metadata_["language_info"] = nlohmann::json::object();
    }
    metadata_["language_info"]["name"] = language;
}

} // namespace nbfacade
