#pragma once

#include "cell.h"
#include <vector>
#include <string>
#include <optional>
#include <nlohmann/json.hpp>

namespace nbfacade {

/**
 * Ordered cell sequence of one notebook plus its document-level metadata.
 * Owns all cells. Every mutation keeps cell ids unique and never drops one
 * silently.
 */
class NBFACADE_API Document {
public:
    // Starts with a single empty code cell
    Document();
    Document(std::vector<Cell> cells, nlohmann::json metadata);

    // ========== Cell Access ==========

    const std::vector<Cell>& GetCells() const { return cells_; }
    size_t GetCellCount() const { return cells_.size(); }

    /**
     * Get cell at index
     * @throws std::out_of_range for an invalid index
     */
    const Cell& GetCell(size_t index) const;

    /**
     * Get cell by ID (nullptr when the cell no longer exists)
     */
    Cell* GetCellById(const std::string& id);
    const Cell* GetCellById(const std::string& id) const;

    std::optional<size_t> IndexOf(const std::string& id) const;

    bool IsValidIndex(size_t index) const { return index < cells_.size(); }

    // ========== Cell Operations ==========

    /**
     * Insert a new cell
     * @param index Insert position, clamped to the end
     * @return ID of the new cell
     */
    std::string InsertCell(size_t index, CellKind kind, std::vector<std::string> source = {""});

    /**
     * Delete a cell. The last remaining cell cannot be deleted.
     * @return True if deleted
     */
    bool DeleteCell(const std::string& id);

    /**
     * Move a cell one step up (-1) or down (+1)
     * @return New index, or nullopt at the document edges / unknown id
     */
    std::optional<size_t> MoveCell(const std::string& id, int direction);

    /**
     * Change cell kind. Non-code kinds drop outputs and execution count.
     * @return True if the cell exists
     */
    bool SetCellKind(const std::string& id, CellKind kind);

    bool SetCellSource(const std::string& id, std::vector<std::string> source);

    // ========== Output Management ==========

    bool SetCellOutputs(const std::string& id, nlohmann::json outputs, int execution_count);
    void ClearOutputs(const std::string& id);
    void ClearAllOutputs();

    // ========== Reconciliation ==========

    /**
     * Re-derive the cell list from human-view lines after a bulk change
     * (undo/redo, multi-cell edits). Identities are kept by exact content
     * match first, then by position when the kind is unchanged; new ids are
     * minted only for cells with no match.
     */
    void Reconcile(const std::vector<std::string>& lines);

    // Human-view rendering of the current cells
    std::vector<std::string> ToLines() const;

    // ========== Metadata ==========

    const nlohmann::json& GetMetadata() const { return metadata_; }
    void SetMetadata(nlohmann::json metadata) { metadata_ = std::move(metadata); }

    // Analysis language from metadata.language_info.name (default "python")
    std::string GetLanguage() const;
    void SetLanguage(const std::string& language);

private:
    std::vector<Cell> cells_;
    nlohmann::json metadata_;
};

} // namespace nbfacade
