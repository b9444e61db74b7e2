#include "nbfacade/shadow_projector.h"
#include "nbfacade/facade_config.h"
#include "nbfacade/line_format.h"
#include <unordered_map>

namespace nbfacade {

std::vector<std::string> ShadowProjector::Project(const Document& document) {
    std::vector<std::string> lines;
    for (const auto& cell : document.GetCells()) {
        auto projected = ProjectCell(cell);
        lines.insert(lines.end(),
                     std::make_move_iterator(projected.begin()),
                     std::make_move_iterator(projected.end()));
    }
    return lines;
}

std::vector<std::string> ShadowProjector::ProjectCell(const Cell& cell) {
    std::vector<std::string> lines;
    lines.reserve(cell.source.size() + 2);

    lines.emplace_back();
    auto content = ProjectContent(cell.kind, cell.source);
    lines.insert(lines.end(),
                 std::make_move_iterator(content.begin()),
                 std::make_move_iterator(content.end()));
    lines.emplace_back();
    return lines;
}

std::vector<std::string> ShadowProjector::ProjectContent(CellKind kind, const std::vector<std::string>& lines) {
    if (kind == CellKind::Code) {
        return lines;
    }
    return std::vector<std::string>(lines.size());
}

std::optional<std::vector<std::string>> ShadowProjector::ProjectRegion(const Document& document,
                                                                      const std::string& cell_id,
                                                                      const std::vector<std::string>& new_source) {
    const Cell* cell = document.GetCellById(cell_id);
    if (!cell) {
        return std::nullopt;
    }
    return ProjectContent(cell->kind, new_source);
}

std::vector<std::string> ShadowProjector::ProjectLines(const std::vector<std::string>& human_lines) {
    std::vector<std::string> lines;
    lines.reserve(human_lines.size());

    std::optional<CellKind> current;
    for (const auto& line : human_lines) {
        if (auto kind = ParseStartMarker(line)) {
            current = kind;
            lines.emplace_back();
        } else if (IsEndMarker(line)) {
            current.reset();
            lines.emplace_back();
        } else if (current == CellKind::Code) {
            lines.push_back(line);
        } else {
            lines.emplace_back();
        }
    }
    return lines;
}

std::string ShadowProjector::ExtensionFor(const std::string& language) {
    static const std::unordered_map<std::string, std::string> extensions = {
        {"python", ".py"},
        {"julia", ".jl"},
        {"r", ".r"},
        {"ruby", ".rb"},
        {"rust", ".rs"},
        {"go", ".go"},
        {"javascript", ".js"},
        {"typescript", ".ts"},
        {"lua", ".lua"},
        {"scala", ".scala"},
        {"kotlin", ".kt"},
        {"java", ".java"},
        {"cpp", ".cpp"},
        {"c", ".c"},
    };

    auto overrides = FacadeConfig::Instance().GetExtensionOverrides();
    auto custom = overrides.find(language);
    if (custom != overrides.end() && !custom->second.empty()) {
        return custom->second;
    }

    auto it = extensions.find(language);
    if (it != extensions.end()) {
        return it->second;
    }
    return "." + language;
}

} // namespace nbfacade
