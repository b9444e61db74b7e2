#pragma once

#include <cstdint>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace nbfacade {
namespace lsp {

/**
 * Connection to an external line/column analysis backend (a language server).
 *
 * The backend only ever sees shadow documents. Replies are fed back through
 * ProtocolProxy::OnResponse and ProtocolProxy::OnPublishDiagnostics.
 */
class AnalysisBackend {
public:
    virtual ~AnalysisBackend() = default;

    virtual bool IsAvailable() const = 0;

    // textDocument/didOpen
    virtual void Attach(const std::string& uri, const std::string& language_id,
                        const std::vector<std::string>& lines) = 0;

    // textDocument/didClose
    virtual void Detach(const std::string& uri) = 0;

    // textDocument/didChange with full content
    virtual void NotifyChanged(const std::string& uri, int version,
                               const std::vector<std::string>& lines) = 0;

    virtual void SendRequest(int64_t id, const std::string& method, const nlohmann::json& params) = 0;
};

} // namespace lsp
} // namespace nbfacade
