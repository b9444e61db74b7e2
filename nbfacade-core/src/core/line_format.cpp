#include "nbfacade/line_format.h"
#include <cctype>
#include <cstring>

namespace nbfacade {

std::string StartMarker(CellKind kind) {
    return std::string(CellMarkers::START_PREFIX) + CellKindName(kind) + CellMarkers::START_SUFFIX;
}

std::optional<CellKind> ParseStartMarker(const std::string& line) {
    const size_t prefix_len = std::strlen(CellMarkers::START_PREFIX);
    const size_t suffix_len = std::strlen(CellMarkers::START_SUFFIX);

    if (line.size() <= prefix_len + suffix_len) {
        return std::nullopt;
    }
    if (line.compare(0, prefix_len, CellMarkers::START_PREFIX) != 0) {
        return std::nullopt;
    }
    if (line.compare(line.size() - suffix_len, suffix_len, CellMarkers::START_SUFFIX) != 0) {
        return std::nullopt;
    }

    std::string name = line.substr(prefix_len, line.size() - prefix_len - suffix_len);
    for (char c : name) {
        if (!std::isalnum(static_cast<unsigned char>(c))) {
            return std::nullopt;
        }
    }

    // Unknown kinds still open a cell; they are treated as raw text
    return ParseCellKind(name).value_or(CellKind::Raw);
}

bool IsEndMarker(const std::string& line) {
    return line == CellMarkers::END;
}

std::vector<std::string> CellsToLines(const std::vector<Cell>& cells) {
    std::vector<std::string> lines;
    for (const auto& cell : cells) {
        lines.push_back(StartMarker(cell.kind));
        lines.insert(lines.end(), cell.source.begin(), cell.source.end());
        lines.emplace_back(CellMarkers::END);
    }
    return lines;
}

std::vector<Cell> LinesToCells(const std::vector<std::string>& lines) {
    std::vector<Cell> cells;
    std::optional<CellKind> current;
    std::vector<std::string> content;

    auto save_current = [&]() {
        if (current) {
            cells.emplace_back(*current, std::move(content));
        }
        current.reset();
        content.clear();
    };

    for (const auto& line : lines) {
        if (auto kind = ParseStartMarker(line)) {
            save_current();
            current = kind;
        } else if (IsEndMarker(line)) {
            save_current();
        } else if (current) {
            content.push_back(line);
        }
    }

    // Keep a trailing cell even if its end marker is missing
    save_current();

    return cells;
}

} // namespace nbfacade
