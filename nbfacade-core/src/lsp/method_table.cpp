#include "nbfacade/lsp/method_table.h"

namespace nbfacade {
namespace lsp {

namespace {

struct NameVisitor {
    const char* operator()(const NavigationInterceptor&) const { return "navigation"; }
    const char* operator()(const ReferenceListInterceptor&) const { return "reference-list"; }
    const char* operator()(const InteractiveInterceptor&) const { return "interactive"; }
    const char* operator()(const DocumentFormatInterceptor&) const { return "document-format"; }
    const char* operator()(const RangeFormatInterceptor&) const { return "range-format"; }
    const char* operator()(const RenameInterceptor&) const { return "rename"; }
};

} // namespace

const char* InterceptorName(const Interceptor& interceptor) {
    return std::visit(NameVisitor{}, interceptor);
}

MethodTable MethodTable::Default() {
    MethodTable table;

    table.Register("textDocument/definition", NavigationInterceptor{});
    table.Register("textDocument/declaration", NavigationInterceptor{});
    table.Register("textDocument/implementation", NavigationInterceptor{});
    table.Register("textDocument/typeDefinition", NavigationInterceptor{});

    table.Register("textDocument/references", ReferenceListInterceptor{});
    table.Register("textDocument/documentSymbol", ReferenceListInterceptor{});
    table.Register("textDocument/documentHighlight", ReferenceListInterceptor{});

    table.Register("textDocument/completion", InteractiveInterceptor{});
    table.Register("textDocument/hover", InteractiveInterceptor{});
    table.Register("textDocument/signatureHelp", InteractiveInterceptor{});

    table.Register("textDocument/formatting", DocumentFormatInterceptor{});
    table.Register("textDocument/rangeFormatting", RangeFormatInterceptor{});
    table.Register("textDocument/rename", RenameInterceptor{});

    return table;
}

void MethodTable::Register(const std::string& method, Interceptor interceptor) {
    table_[method] = std::move(interceptor);
}

void MethodTable::Unregister(const std::string& method) {
    table_.erase(method);
}

Interceptor MethodTable::Lookup(const std::string& method) const {
    auto it = table_.find(method);
    if (it == table_.end()) {
        return ReferenceListInterceptor{};
    }
    return it->second;
}

} // namespace lsp
} // namespace nbfacade
