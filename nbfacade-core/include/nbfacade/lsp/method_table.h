#pragma once

#include "nbfacade/api_export.h"
#include <string>
#include <unordered_map>
#include <variant>

namespace nbfacade {
namespace lsp {

/**
 * How shadow identities in a response are rewritten
 */
enum class RewriteStrategy {
    Direct,     // Human view identity; the UI jumps straight to it
    Indirect    // Preview identity; opened later from a picker
};

// ========== Interceptors ==========

// definition / declaration / implementation / typeDefinition
struct NavigationInterceptor {
    RewriteStrategy strategy = RewriteStrategy::Direct;
};

// references, symbols, highlights and unlisted methods
struct ReferenceListInterceptor {
    RewriteStrategy strategy = RewriteStrategy::Indirect;
};

// completion / hover / signatureHelp: a newer request of the same method supersedes older ones
struct InteractiveInterceptor {
    RewriteStrategy strategy = RewriteStrategy::Indirect;
};

// textDocument/formatting: one cell from the overlay, every code cell from the human view
struct DocumentFormatInterceptor {};

// textDocument/rangeFormatting: must stay inside one code cell
struct RangeFormatInterceptor {};

// textDocument/rename: WorkspaceEdit applied per cell as one undo step
struct RenameInterceptor {};

using Interceptor = std::variant<NavigationInterceptor,
                                 ReferenceListInterceptor,
                                 InteractiveInterceptor,
                                 DocumentFormatInterceptor,
                                 RangeFormatInterceptor,
                                 RenameInterceptor>;

NBFACADE_API const char* InterceptorName(const Interceptor& interceptor);

/**
 * Method name -> interceptor
 */
class NBFACADE_API MethodTable {
public:
    MethodTable() = default;

    // Table with the standard LSP methods registered
    static MethodTable Default();

    void Register(const std::string& method, Interceptor interceptor);
    void Unregister(const std::string& method);

    // Unlisted methods are treated as reference lists
    Interceptor Lookup(const std::string& method) const;

    bool Contains(const std::string& method) const { return table_.count(method) > 0; }

private:
    std::unordered_map<std::string, Interceptor> table_;
};

} // namespace lsp
} // namespace nbfacade
