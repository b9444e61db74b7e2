#pragma once

#include "api_export.h"
#include <string>
#include <string_view>
#include <vector>
#include <optional>
#include <nlohmann/json.hpp>

namespace nbfacade {

/**
 * Cell kind enumeration
 */
enum class CellKind {
    Code,       // Source analysed by the backend
    Markdown,   // Documentation cell, blank in the shadow view
    Raw         // Raw text cell, blank in the shadow view
};

NBFACADE_API const char* CellKindName(CellKind kind);
NBFACADE_API std::optional<CellKind> ParseCellKind(std::string_view name);

/**
 * Single cell of a notebook document.
 *
 * `source` always holds at least one line; an empty cell is one empty line.
 * `outputs` and `metadata` belong to the serializer and kernel layers and are
 * only passed through.
 */
struct NBFACADE_API Cell {
    std::string id;                         // Stable identity, never reassigned
    CellKind kind = CellKind::Code;
    std::vector<std::string> source{""};
    nlohmann::json outputs = nlohmann::json::array();
    nlohmann::json metadata = nlohmann::json::object();
    int execution_count = 0;                // 0 = not run yet

    Cell();
    Cell(CellKind k, std::vector<std::string> lines = {""});

    // Number of content lines in the human view (never 0)
    int LineCount() const { return static_cast<int>(source.size()); }

    // Source joined with '\n'
    std::string SourceText() const;

    // Identity-free comparison key used by reconciliation
    std::string ContentKey() const;

    // Mint a process-wide unique cell identifier
    static std::string GenerateId();

    // Split text into lines; "" yields one empty line
    static std::vector<std::string> SplitLines(const std::string& text);

    // Make sure a line list is a valid cell source
    static std::vector<std::string> NormalizeSource(std::vector<std::string> lines);
};

/**
 * Marker strings for the human-view line format
 */
namespace CellMarkers {
    constexpr const char* START_PREFIX = "# <<nbfacade:";
    constexpr const char* START_SUFFIX = ">>";
    constexpr const char* END = "# <</nbfacade>>";
}

} // namespace nbfacade
