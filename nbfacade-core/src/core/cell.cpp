#include "nbfacade/cell.h"
#include <atomic>
#include <random>

namespace nbfacade {

const char* CellKindName(CellKind kind) {
    switch (kind) {
        case CellKind::Code: return "code";
        case CellKind::Markdown: return "markdown";
        case CellKind::Raw: return "raw";
    }
    return "raw";
}

std::optional<CellKind> ParseCellKind(std::string_view name) {
    if (name == "code") return CellKind::Code;
    if (name == "markdown") return CellKind::Markdown;
    if (name == "raw") return CellKind::Raw;
    return std::nullopt;
}

Cell::Cell() : id(GenerateId()) {
}

Cell::Cell(CellKind k, std::vector<std::string> lines)
    : id(GenerateId()), kind(k), source(NormalizeSource(std::move(lines))) {
    if (kind != CellKind::Code) {
        outputs = nlohmann::json();
    }
}

std::string Cell::SourceText() const {
    std::string text;
    for (size_t i = 0; i < source.size(); ++i) {
        if (i > 0) text += '\n';
        text += source[i];
    }
    return text;
}

std::string Cell::ContentKey() const {
    return std::string(CellKindName(kind)) + ":" + SourceText();
}

std::string Cell::GenerateId() {
    // Random per-process salt plus a counter: unique for the process lifetime
    static const std::string salt = [] {
        std::random_device rd;
        std::mt19937 gen(rd());
        std::uniform_int_distribution<> dis(0, 15);
        static const char* hex = "0123456789abcdef";
        std::string s;
        for (int i = 0; i < 8; ++i) {
            s += hex[dis(gen)];
        }
        return s;
    }();
    static std::atomic<uint64_t> counter{0};

    return "cell-" + salt + "-" + std::to_string(++counter);
}

std::vector<std::string> Cell::SplitLines(const std::string& text) {
    std::vector<std::string> lines;
    size_t start = 0;
    while (true) {
        size_t pos = text.find('\n', start);
        if (pos == std::string::npos) {
            lines.emplace_back(text.substr(start));
            break;
        }
        lines.emplace_back(text.substr(start, pos - start));
        start = pos + 1;
    }
    return lines;
}

std::vector<std::string> Cell::NormalizeSource(std::vector<std::string> lines) {
    if (lines.empty()) {
        lines.emplace_back();
    }
    return lines;
}

} // namespace nbfacade
