#pragma once

#include <nbfacade/nbfacade.h>
#include <map>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace nbfacade {
namespace testing {

using json = nlohmann::json;

/**
 * Records everything sent to the analysis backend; replies are injected by
 * the test through ProtocolProxy::OnResponse.
 */
class FakeAnalysisBackend : public lsp::AnalysisBackend {
public:
    struct SentRequest {
        int64_t id = 0;
        std::string method;
        json params;
    };

    struct Change {
        std::string uri;
        int version = 0;
        std::vector<std::string> lines;
    };

    bool IsAvailable() const override { return available; }

    void Attach(const std::string& uri, const std::string& language_id,
                const std::vector<std::string>& lines) override {
        attached.push_back(uri);
        languages.push_back(language_id);
        opened_lines = lines;
    }

    void Detach(const std::string& uri) override {
        detached.push_back(uri);
    }

    void NotifyChanged(const std::string& uri, int version, const std::vector<std::string>& lines) override {
        changes.push_back({uri, version, lines});
    }

    void SendRequest(int64_t id, const std::string& method, const json& params) override {
        requests.push_back({id, method, params});
    }

    const SentRequest& Last() const { return requests.back(); }

    bool available = true;
    std::vector<std::string> attached;
    std::vector<std::string> languages;
    std::vector<std::string> detached;
    std::vector<std::string> opened_lines;
    std::vector<Change> changes;
    std::vector<SentRequest> requests;
};

// Runs synchronously and replies with a preset result
class FakeExecutionBackend : public ExecutionBackend {
public:
    bool IsAvailable() const override { return available; }

    bool Execute(const std::string& cell_id, const std::string& source, CompletionCallback callback) override {
        executed.emplace_back(cell_id, source);
        if (defer) {
            pending = [callback, cell_id, this]() { callback(cell_id, result); };
            return true;
        }
        callback(cell_id, result);
        return true;
    }

    bool available = true;
    bool defer = false;
    ExecutionResult result;
    std::function<void()> pending;
    std::vector<std::pair<std::string, std::string>> executed;
};

class FakeRenderer : public OutputRenderer {
public:
    void Render(const std::string& cell_id, const json& outputs) override {
        rendered[cell_id] = outputs;
    }

    void Clear(const std::string& cell_id) override {
        rendered.erase(cell_id);
        cleared.push_back(cell_id);
    }

    std::map<std::string, json> rendered;
    std::vector<std::string> cleared;
};

// "kind|line1\nline2" blocks separated by "\x1e"
class FakeSerializer : public NotebookSerializer {
public:
    std::optional<NotebookData> Parse(const std::string& bytes) override {
        if (bytes.empty()) {
            return std::nullopt;
        }

        NotebookData data;
        size_t start = 0;
        while (start <= bytes.size()) {
            size_t end = bytes.find('\x1e', start);
            std::string block = bytes.substr(start, end == std::string::npos ? std::string::npos : end - start);
            size_t bar = block.find('|');
            if (bar == std::string::npos) {
                return std::nullopt;
            }
            auto kind = ParseCellKind(block.substr(0, bar));
            data.cells.emplace_back(kind.value_or(CellKind::Raw), Cell::SplitLines(block.substr(bar + 1)));
            if (end == std::string::npos) {
                break;
            }
            start = end + 1;
        }
        data.metadata = {{"language_info", {{"name", language}}}};
        return data;
    }

    std::string Serialize(const NotebookData& data) override {
        std::string bytes;
        for (size_t i = 0; i < data.cells.size(); ++i) {
            if (i > 0) bytes += '\x1e';
            bytes += std::string(CellKindName(data.cells[i].kind)) + "|" + data.cells[i].SourceText();
        }
        return bytes;
    }

    std::string language = "python";
};

/**
 * Three cells:
 *   0  # <<nbfacade:code>>
 *   1  x = 1
 *   2  y = 2
 *   3  # <</nbfacade>>
 *   4  # <<nbfacade:markdown>>
 *   5  # Title
 *   6  # <</nbfacade>>
 *   7  # <<nbfacade:code>>
 *   8  print(x)
 *   9  # <</nbfacade>>
 */
inline std::vector<Cell> SampleCells() {
    std::vector<Cell> cells;
    cells.emplace_back(CellKind::Code, std::vector<std::string>{"x = 1", "y = 2"});
    cells.emplace_back(CellKind::Markdown, std::vector<std::string>{"# Title"});
    cells.emplace_back(CellKind::Code, std::vector<std::string>{"print(x)"});
    return cells;
}

inline std::shared_ptr<NotebookSession> MakeSession(const std::string& name,
                                                    std::vector<Cell> cells = SampleCells()) {
    return NotebookSession::Create(name, Document(std::move(cells), json::object()));
}

inline json PositionJson(int line, int character) {
    return {{"line", line}, {"character", character}};
}

inline json RangeJson(int start_line, int start_char, int end_line, int end_char) {
    return {{"start", PositionJson(start_line, start_char)}, {"end", PositionJson(end_line, end_char)}};
}

inline json EditJson(int start_line, int start_char, int end_line, int end_char, const std::string& text) {
    return {{"range", RangeJson(start_line, start_char, end_line, end_char)}, {"newText", text}};
}

} // namespace testing
} // namespace nbfacade
