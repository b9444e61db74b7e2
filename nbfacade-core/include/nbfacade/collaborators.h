#pragma once

#include "cell.h"
#include <functional>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace nbfacade {

/**
 * Cells plus document-level metadata, as exchanged with a serializer
 */
struct NotebookData {
    std::vector<Cell> cells;
    nlohmann::json metadata = nlohmann::json::object();
};

/**
 * Converts between the on-disk notebook format and cells
 */
class NotebookSerializer {
public:
    virtual ~NotebookSerializer() = default;

    // nullopt if the bytes are not a notebook this serializer understands
    virtual std::optional<NotebookData> Parse(const std::string& bytes) = 0;
    virtual std::string Serialize(const NotebookData& data) = 0;
};

/**
 * Displays stored cell outputs
 */
class OutputRenderer {
public:
    virtual ~OutputRenderer() = default;

    virtual void Render(const std::string& cell_id, const nlohmann::json& outputs) = 0;
    virtual void Clear(const std::string& cell_id) = 0;
};

/**
 * Execution result delivered by an execution backend
 */
struct ExecutionResult {
    bool success = false;
    nlohmann::json outputs = nlohmann::json::array();
    int execution_count = 0;
    std::string error_message;
};

/**
 * Runs cell source in a kernel. Results arrive asynchronously, possibly on
 * another thread.
 */
class ExecutionBackend {
public:
    using CompletionCallback = std::function<void(const std::string& cell_id, const ExecutionResult& result)>;

    virtual ~ExecutionBackend() = default;

    virtual bool IsAvailable() const = 0;

    /**
     * Start executing a cell
     * @return False if the request was not accepted
     */
    virtual bool Execute(const std::string& cell_id, const std::string& source, CompletionCallback callback) = 0;

    virtual void Interrupt() {}
};

} // namespace nbfacade
