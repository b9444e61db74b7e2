#include "nbfacade/lsp/text_edit.h"
#include "nbfacade/cell.h"
#include <algorithm>
#include <numeric>

namespace nbfacade {
namespace lsp {

namespace {

std::optional<Position> ParsePosition(const nlohmann::json& json) {
    if (!json.is_object()) {
        return std::nullopt;
    }
    auto line = json.find("line");
    auto character = json.find("character");
    if (line == json.end() || character == json.end() ||
        !line->is_number_integer() || !character->is_number_integer()) {
        return std::nullopt;
    }
    return Position{line->get<int>(), character->get<int>()};
}

bool IsBlank(const std::string& line) {
    return std::all_of(line.begin(), line.end(), [](char c) {
        return c == ' ' || c == '\t' || c == '\r' || c == '\f' || c == '\v';
    });
}

} // namespace

std::optional<TextEdit> ParseTextEdit(const nlohmann::json& json) {
    if (!json.is_object()) {
        return std::nullopt;
    }
    auto range = json.find("range");
    auto new_text = json.find("newText");
    if (range == json.end() || !range->is_object() || new_text == json.end() || !new_text->is_string()) {
        return std::nullopt;
    }

    auto start = range->find("start");
    auto end = range->find("end");
    if (start == range->end() || end == range->end()) {
        return std::nullopt;
    }
    auto start_pos = ParsePosition(*start);
    auto end_pos = ParsePosition(*end);
    if (!start_pos || !end_pos) {
        return std::nullopt;
    }

    return TextEdit{{*start_pos, *end_pos}, new_text->get<std::string>()};
}

std::vector<TextEdit> ParseTextEdits(const nlohmann::json& json) {
    std::vector<TextEdit> edits;
    if (!json.is_array()) {
        return edits;
    }
    for (const auto& item : json) {
        if (auto edit = ParseTextEdit(item)) {
            edits.push_back(std::move(*edit));
        }
    }
    return edits;
}

nlohmann::json ToJson(const TextEdit& edit) {
    return {
        {"range", {
            {"start", {{"line", edit.range.start.line}, {"character", edit.range.start.character}}},
            {"end", {{"line", edit.range.end.line}, {"character", edit.range.end.character}}}
        }},
        {"newText", edit.new_text}
    };
}

std::vector<TextEdit> SortBottomUp(std::vector<TextEdit> edits) {
    std::vector<size_t> order(edits.size());
    std::iota(order.begin(), order.end(), 0);

    // Later array entries first at equal positions, so inserts end up in array order
    std::sort(order.begin(), order.end(), [&edits](size_t a, size_t b) {
        const Position& pa = edits[a].range.start;
        const Position& pb = edits[b].range.start;
        if (pa.line != pb.line) return pa.line > pb.line;
        if (pa.character != pb.character) return pa.character > pb.character;
        return a > b;
    });

    std::vector<TextEdit> sorted;
    sorted.reserve(edits.size());
    for (size_t index : order) {
        sorted.push_back(std::move(edits[index]));
    }
    return sorted;
}

std::vector<std::string> ApplyTextEdits(std::vector<std::string> lines, const std::vector<TextEdit>& edits) {
    for (const auto& edit : SortBottomUp(edits)) {
        const int count = static_cast<int>(lines.size());
        const int start_line = edit.range.start.line;
        int end_line = edit.range.end.line;

        if (start_line < 0 || start_line > count || end_line < start_line) {
            continue;
        }

        std::string prefix;
        std::string suffix;
        if (start_line < count) {
            const std::string& line = lines[start_line];
            size_t column = static_cast<size_t>(std::max(0, edit.range.start.character));
            prefix = line.substr(0, std::min(column, line.size()));
        }
        if (end_line < count) {
            const std::string& line = lines[end_line];
            size_t column = static_cast<size_t>(std::max(0, edit.range.end.character));
            suffix = line.substr(std::min(column, line.size()));
        }
        const bool past_end = end_line >= count;
        end_line = std::min(end_line, count - 1);

        auto replacement = Cell::SplitLines(edit.new_text);
        replacement.front() = prefix + replacement.front();
        replacement.back() += suffix;

        // A range ending past the last line also consumes its final newline,
        // leaving one empty line when the whole text is deleted
        if (past_end && start_line < count && replacement.back().empty() &&
            (replacement.size() > 1 || start_line > 0)) {
            replacement.pop_back();
        }

        // An edit that starts past the last line appends
        if (start_line < count) {
            lines.erase(lines.begin() + start_line, lines.begin() + end_line + 1);
        }
        lines.insert(lines.begin() + start_line, replacement.begin(), replacement.end());
    }
    return lines;
}

void TrimTrailingBlankLines(std::vector<std::string>& lines, int keep) {
    int trailing = 0;
    for (auto it = lines.rbegin(); it != lines.rend() && IsBlank(*it); ++it) {
        ++trailing;
    }

    int to_remove = std::max(0, trailing - std::max(0, keep));
    while (to_remove-- > 0 && lines.size() > 1) {
        lines.pop_back();
    }
}

} // namespace lsp
} // namespace nbfacade
