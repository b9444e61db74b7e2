#pragma once

#include "document.h"
#include <string>
#include <vector>
#include <optional>

namespace nbfacade {

/**
 * Derives the backend-facing view from the document.
 *
 * The shadow view has exactly as many lines as the human view: marker lines
 * become blank lines, code content is copied verbatim, and markdown/raw
 * content is blanked line for line. Every projection is computable from a
 * single cell.
 */
class NBFACADE_API ShadowProjector {
public:
    // Whole-document projection
    static std::vector<std::string> Project(const Document& document);

    // Projection of one cell, marker placeholders included
    static std::vector<std::string> ProjectCell(const Cell& cell);

    // Content projection for a cell kind (same line count as `lines`)
    static std::vector<std::string> ProjectContent(CellKind kind, const std::vector<std::string>& lines);

    /**
     * Replacement lines for a cell's content region after an edit
     * @return nullopt if the cell no longer exists
     */
    static std::optional<std::vector<std::string>> ProjectRegion(const Document& document,
                                                                 const std::string& cell_id,
                                                                 const std::vector<std::string>& new_source);

    // Projection straight from human-view lines, used to recover the line-count invariant
    static std::vector<std::string> ProjectLines(const std::vector<std::string>& human_lines);

    /**
     * File extension for an analysis language (".py" for "python").
     * Configured overrides take precedence over the built-in table.
     */
    static std::string ExtensionFor(const std::string& language);
};

} // namespace nbfacade
