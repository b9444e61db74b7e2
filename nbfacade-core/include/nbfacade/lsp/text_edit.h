#pragma once

#include "nbfacade/api_export.h"
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace nbfacade {
namespace lsp {

struct Position {
    int line = 0;
    int character = 0;
};

struct Range {
    Position start;
    Position end;
};

struct TextEdit {
    Range range;
    std::string new_text;
};

// nullopt for payloads that are not a TextEdit
NBFACADE_API std::optional<TextEdit> ParseTextEdit(const nlohmann::json& json);

// Malformed entries are skipped
NBFACADE_API std::vector<TextEdit> ParseTextEdits(const nlohmann::json& json);

NBFACADE_API nlohmann::json ToJson(const TextEdit& edit);

/**
 * Order edits for application from the bottom of the document to the top.
 * Edits starting at the same position keep their relative insertion order.
 */
NBFACADE_API std::vector<TextEdit> SortBottomUp(std::vector<TextEdit> edits);

/**
 * Apply edits to a copy of `lines`, bottom-up. Columns are byte offsets,
 * clamped to the line length.
 */
NBFACADE_API std::vector<std::string> ApplyTextEdits(std::vector<std::string> lines,
                                                     const std::vector<TextEdit>& edits);

// Drop trailing whitespace-only lines beyond `keep`, leaving at least one line
NBFACADE_API void TrimTrailingBlankLines(std::vector<std::string>& lines, int keep);

} // namespace lsp
} // namespace nbfacade
