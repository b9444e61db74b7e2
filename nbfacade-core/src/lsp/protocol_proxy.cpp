#include "nbfacade/lsp/protocol_proxy.h"
#include "nbfacade/facade_config.h"
#include "nbfacade/notebook_session.h"
#include "nbfacade/uri.h"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cstdint>
#include <map>
#include <type_traits>

namespace nbfacade {
namespace lsp {

using json = nlohmann::json;

namespace {

// Results of a format-all request, applied once every cell has replied
struct FormatBatch {
    size_t remaining = 0;
    uint64_t human_tick = 0;
    std::vector<CellUpdate> updates;
    ProtocolProxy::ResponseHandler handler;
};

void ShiftLine(json& position, int delta) {
    if (position.is_object() && position.contains("line") && position["line"].is_number_integer()) {
        position["line"] = position["line"].get<int>() + delta;
    }
}

void ShiftRange(json& range, int delta) {
    if (!range.is_object()) {
        return;
    }
    if (range.contains("start")) ShiftLine(range["start"], delta);
    if (range.contains("end")) ShiftLine(range["end"], delta);
}

std::optional<int> StartLineOf(const json& diagnostic) {
    try {
        const json& line = diagnostic.at("range").at("start").at("line");
        if (line.is_number_integer()) {
            return line.get<int>();
        }
    } catch (const json::exception&) {
    }
    return std::nullopt;
}

// Requests sharing a key are superseded: only the latest one is delivered
std::string SupersedeKey(const NotebookSession& session, const std::string& request_class) {
    return session.GetShadowUri() + ":" + request_class;
}

void Reply(const ProtocolProxy::ResponseHandler& handler, const json& error, const json& result) {
    if (handler) {
        handler(error, result);
    }
}

} // namespace

ProtocolProxy::ProtocolProxy(MethodTable methods, SessionRegistry& registry)
    : methods_(std::move(methods)), registry_(registry) {
}

ProtocolProxy::~ProtocolProxy() {
    for (const auto& weak : attached_) {
        auto session = weak.lock();
        if (!session) {
            continue;
        }
        auto& state = session->GetBackendState();
        for (ListenerId id : state.listeners) {
            session->RemoveListener(id);
        }
        state.listeners.clear();
        DetachFromBackend(*session);
    }
}

// ========== Backend ==========

void ProtocolProxy::SetBackend(std::shared_ptr<AnalysisBackend> backend) {
    for (const auto& weak : attached_) {
        if (auto session = weak.lock()) {
            DetachFromBackend(*session);
            tracker_.CancelSession(session.get());
        }
    }

    backend_ = std::move(backend);

    for (const auto& weak : attached_) {
        if (auto session = weak.lock()) {
            AttachToBackend(*session);
        }
    }
}

bool ProtocolProxy::IsBackendAvailable() const {
    return backend_ && backend_->IsAvailable();
}

// ========== Sessions ==========

void ProtocolProxy::AttachSession(const std::shared_ptr<NotebookSession>& session) {
    if (!session || IsAttached(session.get())) {
        return;
    }

    registry_.Register(session);
    attached_.push_back(session);

    std::weak_ptr<NotebookSession> weak = session;
    auto& state = session->GetBackendState();

    state.listeners.push_back(session->AddViewChangedListener(
        [this, weak](const std::vector<ViewChange>&) {
            if (auto self = weak.lock()) {
                SyncDocument(*self);
                RepublishDiagnostics(*self);
            }
        }));

    state.listeners.push_back(session->AddOverlayClosedListener(
        [this, weak](const std::string& cell_id, uint64_t generation) {
            auto self = weak.lock();
            if (!self) {
                return;
            }
            tracker_.CancelOverlay(self.get(), generation);
            Publish(ToOverlayUri(self->GetPath(), cell_id), json::array());
        }));

    state.listeners.push_back(session->AddLanguageChangedListener(
        [this, weak](const std::string& old_uri, const std::string&) {
            if (auto self = weak.lock()) {
                OnLanguageChanged(*self, old_uri);
            }
        }));

    AttachToBackend(*session);
}

void ProtocolProxy::DetachSession(const std::shared_ptr<NotebookSession>& session) {
    if (!session) {
        return;
    }

    auto it = std::find_if(attached_.begin(), attached_.end(),
        [&session](const std::weak_ptr<NotebookSession>& weak) { return weak.lock() == session; });
    if (it == attached_.end()) {
        return;
    }
    attached_.erase(it);

    auto& state = session->GetBackendState();
    for (ListenerId id : state.listeners) {
        session->RemoveListener(id);
    }
    state.listeners.clear();

    DetachFromBackend(*session);
    tracker_.CancelSession(session.get());
    registry_.Unregister(session.get());

    Publish(session->GetHumanUri(), json::array());
}

bool ProtocolProxy::IsAttached(const NotebookSession* session) const {
    return std::any_of(attached_.begin(), attached_.end(),
        [session](const std::weak_ptr<NotebookSession>& weak) {
            auto locked = weak.lock();
            return locked && locked.get() == session;
        });
}

void ProtocolProxy::AttachToBackend(NotebookSession& session) {
    if (!IsBackendAvailable()) {
        return;
    }

    auto& state = session.GetBackendState();
    const TextView& shadow = session.GetShadowView();

    backend_->Attach(session.GetShadowUri(), session.GetLanguage(), shadow.GetLines());
    state.attached = true;
    state.attached_uri = session.GetShadowUri();
    state.version = 0;
    state.synced_tick = shadow.GetChangeTick();

    spdlog::debug("Attached {} as {}", session.GetHumanUri(), state.attached_uri);
}

void ProtocolProxy::DetachFromBackend(NotebookSession& session) {
    auto& state = session.GetBackendState();
    if (!state.attached) {
        return;
    }

    if (backend_) {
        backend_->Detach(state.attached_uri);
    }
    state.attached = false;
    state.attached_uri.clear();
    state.shadow_diagnostics = json::array();
}

void ProtocolProxy::SyncDocument(NotebookSession& session) {
    auto& state = session.GetBackendState();
    if (!state.attached) {
        AttachToBackend(session);
        return;
    }
    if (!IsBackendAvailable()) {
        return;
    }

    const TextView& shadow = session.GetShadowView();
    if (shadow.GetChangeTick() == state.synced_tick) {
        return;
    }

    backend_->NotifyChanged(state.attached_uri, ++state.version, shadow.GetLines());
    state.synced_tick = shadow.GetChangeTick();
}

void ProtocolProxy::OnLanguageChanged(NotebookSession& session, const std::string& old_uri) {
    auto& state = session.GetBackendState();
    spdlog::info("Re-attaching {} ({} -> {})", session.GetHumanUri(), old_uri, session.GetShadowUri());

    // Replies would name the old identity
    tracker_.CancelSession(&session);

    DetachFromBackend(session);
    state.shadow_diagnostics = json::array();
    Publish(session.GetHumanUri(), json::array());

    AttachToBackend(session);
}

// ========== Requests ==========

std::optional<int64_t> ProtocolProxy::Request(const std::string& origin_uri, const std::string& method,
                                              const json& params, ResponseHandler handler) {
    if (!IsBackendAvailable()) {
        spdlog::debug("No analysis backend, ignoring {}", method);
        return std::nullopt;
    }

    auto origin = registry_.Resolve(origin_uri);
    if (!origin || !IsAttached(origin->session.get())) {
        spdlog::debug("Ignoring {} from unknown document {}", method, origin_uri);
        return std::nullopt;
    }
    if (origin->kind == OriginKind::Overlay && !origin->overlay_open) {
        spdlog::debug("Ignoring {} from closed overlay {}", method, origin_uri);
        return std::nullopt;
    }

    SyncDocument(*origin->session);

    Interceptor interceptor = methods_.Lookup(method);
    spdlog::debug("{} from {} view via {}", method, OriginKindName(origin->kind), InterceptorName(interceptor));

    return std::visit([&](const auto& entry) -> std::optional<int64_t> {
        using T = std::decay_t<decltype(entry)>;
        if constexpr (std::is_same_v<T, NavigationInterceptor> || std::is_same_v<T, ReferenceListInterceptor>) {
            return SendLocationRequest(*origin, method, params, entry.strategy, false, std::move(handler));
        } else if constexpr (std::is_same_v<T, InteractiveInterceptor>) {
            return SendLocationRequest(*origin, method, params, entry.strategy, true, std::move(handler));
        } else if constexpr (std::is_same_v<T, DocumentFormatInterceptor>) {
            return SendDocumentFormat(*origin, std::move(handler));
        } else if constexpr (std::is_same_v<T, RangeFormatInterceptor>) {
            return SendRangeFormat(*origin, params, std::move(handler));
        } else {
            return SendRename(*origin, params, std::move(handler));
        }
    }, interceptor);
}

int64_t ProtocolProxy::Send(const std::shared_ptr<NotebookSession>& session, const std::string& method,
                            const json& params, uint64_t generation, std::string supersede_key,
                            ReplyCallback on_reply) {
    PendingRequest request;
    request.id = tracker_.NextId();
    request.method = method;
    request.session = session;
    request.owner = session.get();
    request.overlay_generation = generation;
    request.supersede_key = std::move(supersede_key);
    request.on_reply = std::move(on_reply);

    const int64_t id = request.id;
    tracker_.Track(std::move(request));
    backend_->SendRequest(id, method, params);
    return id;
}

std::optional<int64_t> ProtocolProxy::SendLocationRequest(const ResolvedOrigin& origin, const std::string& method,
                                                          const json& params, RewriteStrategy strategy,
                                                          bool supersede, ResponseHandler handler) {
    uint64_t generation = 0;
    if (origin.kind == OriginKind::Overlay) {
        generation = origin.session->GetSynchronizer().GetOverlay()->GetGeneration();
    }

    // Last request wins per document and method
    std::string supersede_key;
    if (supersede) {
        supersede_key = SupersedeKey(*origin.session, method);
    }

    return Send(origin.session, method, RewriteRequestParams(params, origin), generation, std::move(supersede_key),
        [this, strategy, handler](const json& error, const json& result) {
            if (!error.is_null()) {
                Reply(handler, error, result);
                return;
            }
            Reply(handler, error, RewriteResult(result, strategy));
        });
}

std::optional<int64_t> ProtocolProxy::SendFormatRange(const std::shared_ptr<NotebookSession>& session,
                                                      const std::string& cell_id, uint64_t generation,
                                                      ReplyCallback on_reply) {
    auto content = session->ContentRangeOf(cell_id);
    const Cell* cell = session->GetDocument().GetCellById(cell_id);
    if (!content || !cell || cell->kind != CellKind::Code) {
        spdlog::debug("Cell {} cannot be formatted", cell_id);
        return std::nullopt;
    }

    const auto& config = FacadeConfig::Instance();
    json params = {
        {"textDocument", {{"uri", session->GetShadowUri()}}},
        {"range", {
            {"start", {{"line", content->start}, {"character", 0}}},
            {"end", {{"line", content->end + 1}, {"character", 0}}}
        }},
        {"options", {{"tabSize", config.GetTabSize()}, {"insertSpaces", config.GetInsertSpaces()}}}
    };

    return Send(session, "textDocument/rangeFormatting", params, generation, SupersedeKey(*session, "format:" + cell_id),
                std::move(on_reply));
}

std::optional<int64_t> ProtocolProxy::FormatCell(const std::shared_ptr<NotebookSession>& session,
                                                 const std::string& cell_id, ResponseHandler handler) {
    if (!session || !IsBackendAvailable() || !IsAttached(session.get())) {
        return std::nullopt;
    }
    if (!FacadeConfig::Instance().IsFormatEnabled()) {
        spdlog::debug("Formatting disabled");
        return std::nullopt;
    }

    SyncDocument(*session);

    uint64_t generation = 0;
    const EditOverlay* overlay = session->GetSynchronizer().GetOverlay();
    if (overlay && overlay->GetCellId() == cell_id) {
        generation = overlay->GetGeneration();
    }

    std::weak_ptr<NotebookSession> weak = session;
    const uint64_t tick = session->GetHumanView().GetChangeTick();

    return SendFormatRange(session, cell_id, generation,
        [this, weak, cell_id, tick, handler](const json& error, const json& result) {
            auto self = weak.lock();
            if (!error.is_null() || !self) {
                Reply(handler, error, nullptr);
                return;
            }
            if (self->GetHumanView().GetChangeTick() != tick) {
                spdlog::debug("Dropping formatting of cell {}: document changed", cell_id);
                Reply(handler, nullptr, json::array());
                return;
            }

            auto lines = ApplyEditsToCell(*self, cell_id, ParseTextEdits(result), true);
            if (lines) {
                self->GetSynchronizer().ReplaceCellContent(cell_id, std::move(*lines));
            }
            Reply(handler, nullptr, json::array());
        });
}

std::optional<int64_t> ProtocolProxy::SendDocumentFormat(const ResolvedOrigin& origin, ResponseHandler handler) {
    if (!FacadeConfig::Instance().IsFormatEnabled()) {
        spdlog::debug("Formatting disabled");
        return std::nullopt;
    }

    if (origin.kind == OriginKind::Overlay) {
        return FormatCell(origin.session, origin.cell_id, std::move(handler));
    }

    auto session = origin.session;
    std::vector<std::string> cell_ids;
    for (const auto& cell : session->GetDocument().GetCells()) {
        if (cell.kind == CellKind::Code && session->ContentRangeOf(cell.id)) {
            cell_ids.push_back(cell.id);
        }
    }
    if (cell_ids.empty()) {
        Reply(handler, nullptr, json::array());
        return std::nullopt;
    }

    auto batch = std::make_shared<FormatBatch>();
    batch->remaining = cell_ids.size();
    batch->human_tick = session->GetHumanView().GetChangeTick();
    batch->handler = std::move(handler);

    std::weak_ptr<NotebookSession> weak = session;
    std::optional<int64_t> first_id;

    for (const auto& cell_id : cell_ids) {
        auto id = SendFormatRange(session, cell_id, 0,
            [this, weak, cell_id, batch](const json& error, const json& result) {
                auto self = weak.lock();
                if (self && error.is_null()) {
                    if (auto lines = ApplyEditsToCell(*self, cell_id, ParseTextEdits(result), true)) {
                        batch->updates.push_back({cell_id, std::move(*lines)});
                    }
                }
                if (--batch->remaining > 0 || !self) {
                    return;
                }

                if (self->GetHumanView().GetChangeTick() != batch->human_tick) {
                    spdlog::debug("Dropping document formatting: document changed");
                } else if (!batch->updates.empty()) {
                    // Bottom-to-top, one undo step
                    self->GetSynchronizer().ReplaceCellContents(std::move(batch->updates));
                }
                Reply(batch->handler, nullptr, json::array());
            });
        if (!first_id) {
            first_id = id;
        }
    }
    return first_id;
}

std::optional<int64_t> ProtocolProxy::SendRangeFormat(const ResolvedOrigin& origin, const json& params,
                                                      ResponseHandler handler) {
    if (!FacadeConfig::Instance().IsFormatEnabled()) {
        spdlog::debug("Formatting disabled");
        return std::nullopt;
    }

    json rewritten = RewriteRequestParams(params, origin);
    auto session = origin.session;

    int start_line = 0;
    int end_line = 0;
    try {
        const json& range = rewritten.at("range");
        start_line = range.at("start").at("line").get<int>();
        end_line = range.at("end").at("line").get<int>();
        // An end at column 0 of the next line closes the previous one
        if (range.at("end").value("character", 0) == 0 && end_line > start_line) {
            --end_line;
        }
    } catch (const json::exception& e) {
        spdlog::warn("Malformed rangeFormatting params: {}", e.what());
        return std::nullopt;
    }

    auto cell_id = session->CellAt(start_line);
    if (!cell_id || session->CellAt(end_line) != cell_id) {
        spdlog::debug("Range {}-{} spans cells, not formatting", start_line, end_line);
        return std::nullopt;
    }
    const Cell* cell = session->GetDocument().GetCellById(*cell_id);
    auto content = session->ContentRangeOf(*cell_id);
    if (!cell || cell->kind != CellKind::Code || !content ||
        !content->Contains(start_line) || !content->Contains(end_line)) {
        spdlog::debug("Range {}-{} is not inside a code cell", start_line, end_line);
        return std::nullopt;
    }

    if (!rewritten.contains("options")) {
        const auto& config = FacadeConfig::Instance();
        rewritten["options"] = {{"tabSize", config.GetTabSize()}, {"insertSpaces", config.GetInsertSpaces()}};
    }

    uint64_t generation = 0;
    if (origin.kind == OriginKind::Overlay) {
        generation = session->GetSynchronizer().GetOverlay()->GetGeneration();
    }

    std::weak_ptr<NotebookSession> weak = session;
    const uint64_t tick = session->GetHumanView().GetChangeTick();
    const std::string id = *cell_id;

    return Send(session, "textDocument/rangeFormatting", rewritten, generation, SupersedeKey(*session, "format:" + id),
        [this, weak, id, tick, handler](const json& error, const json& result) {
            auto self = weak.lock();
            if (!error.is_null() || !self) {
                Reply(handler, error, nullptr);
                return;
            }
            if (self->GetHumanView().GetChangeTick() != tick) {
                spdlog::debug("Dropping range formatting of cell {}: document changed", id);
                Reply(handler, nullptr, json::array());
                return;
            }
            if (auto lines = ApplyEditsToCell(*self, id, ParseTextEdits(result), false)) {
                self->GetSynchronizer().ReplaceCellContent(id, std::move(*lines));
            }
            Reply(handler, nullptr, json::array());
        });
}

std::optional<int64_t> ProtocolProxy::SendRename(const ResolvedOrigin& origin, const json& params,
                                                 ResponseHandler handler) {
    auto session = origin.session;

    uint64_t generation = 0;
    if (origin.kind == OriginKind::Overlay) {
        generation = session->GetSynchronizer().GetOverlay()->GetGeneration();
    }

    std::weak_ptr<NotebookSession> weak = session;
    const uint64_t tick = session->GetHumanView().GetChangeTick();

    return Send(session, "textDocument/rename", RewriteRequestParams(params, origin), generation,
                SupersedeKey(*session, "rename"),
        [this, weak, tick, handler](const json& error, const json& result) {
            auto self = weak.lock();
            if (!error.is_null() || !self) {
                Reply(handler, error, nullptr);
                return;
            }
            if (self->GetHumanView().GetChangeTick() != tick) {
                spdlog::debug("Dropping rename: document changed");
                Reply(handler, nullptr, {{"applied", 0}});
                return;
            }

            // Group by owning cell; edits leaving the cell content are dropped
            std::map<std::string, std::vector<TextEdit>> by_cell;
            size_t applied = 0;
            for (auto& edit : CollectWorkspaceEdits(*self, result)) {
                auto cell_id = self->CellAt(edit.range.start.line);
                auto content = cell_id ? self->ContentRangeOf(*cell_id) : std::nullopt;
                const Cell* cell = cell_id ? self->GetDocument().GetCellById(*cell_id) : nullptr;
                if (!content || !cell || cell->kind != CellKind::Code ||
                    !content->Contains(edit.range.start.line) ||
                    !content->Contains(edit.range.end.line)) {
                    spdlog::debug("Dropping rename edit at line {}", edit.range.start.line);
                    continue;
                }
                by_cell[*cell_id].push_back(std::move(edit));
                ++applied;
            }

            std::vector<CellUpdate> updates;
            for (const auto& [cell_id, edits] : by_cell) {
                if (auto lines = ApplyEditsToCell(*self, cell_id, edits, false)) {
                    updates.push_back({cell_id, std::move(*lines)});
                }
            }
            if (!updates.empty()) {
                self->GetSynchronizer().ReplaceCellContents(std::move(updates));
            }

            spdlog::info("Rename applied {} edits", applied);
            Reply(handler, nullptr, {{"applied", applied}});
        });
}

bool ProtocolProxy::OnResponse(int64_t id, const json& result, const json& error) {
    auto request = tracker_.Complete(id);
    if (!request) {
        spdlog::debug("Discarding reply to request {}: not pending", id);
        return false;
    }

    auto session = request->session.lock();
    if (!session) {
        spdlog::debug("Discarding reply to request {}: document closed", id);
        return false;
    }

    if (request->overlay_generation != 0) {
        const EditOverlay* overlay = session->GetSynchronizer().GetOverlay();
        if (!overlay || overlay->GetGeneration() != request->overlay_generation) {
            spdlog::debug("Discarding reply to request {}: overlay closed", id);
            return false;
        }
    }

    if (request->on_reply) {
        request->on_reply(error, result);
    }
    return true;
}

// ========== Rewriting ==========

json ProtocolProxy::RewriteRequestParams(const json& params, const ResolvedOrigin& origin) const {
    json rewritten = params;
    try {
        if (rewritten.is_object() && rewritten.contains("textDocument")) {
            rewritten["textDocument"]["uri"] = origin.session->GetShadowUri();
        }

        if (origin.line_offset != 0 && rewritten.is_object()) {
            if (rewritten.contains("position")) {
                ShiftLine(rewritten["position"], origin.line_offset);
            }
            if (rewritten.contains("range")) {
                ShiftRange(rewritten["range"], origin.line_offset);
            }
        }
    } catch (const json::exception& e) {
        spdlog::warn("Sending request params unmodified: {}", e.what());
        return params;
    }
    return rewritten;
}

json ProtocolProxy::RewriteResult(const json& result, RewriteStrategy strategy) const {
    json rewritten = result;
    try {
        RewriteIdentities(rewritten, strategy);
    } catch (const json::exception& e) {
        spdlog::warn("Passing reply through unmodified: {}", e.what());
        return result;
    }
    return rewritten;
}

void ProtocolProxy::RewriteIdentities(json& node, RewriteStrategy strategy) const {
    if (node.is_array()) {
        for (auto& item : node) {
            RewriteIdentities(item, strategy);
        }
        return;
    }
    if (!node.is_object()) {
        return;
    }

    json rewritten = json::object();
    for (auto it = node.begin(); it != node.end(); ++it) {
        json value = it.value();

        if ((it.key() == "uri" || it.key() == "targetUri") && value.is_string()) {
            if (auto mapped = MapShadowUri(value.get<std::string>(), strategy)) {
                value = *mapped;
            }
        } else {
            RewriteIdentities(value, strategy);
        }

        // WorkspaceEdit.changes is keyed by document identity
        std::string key = it.key();
        if (auto mapped = MapShadowUri(key, strategy)) {
            key = *mapped;
        }
        rewritten[key] = std::move(value);
    }
    node = std::move(rewritten);
}

std::optional<std::string> ProtocolProxy::MapShadowUri(const std::string& uri, RewriteStrategy strategy) const {
    if (uri.rfind(UriScheme::FILE_PREFIX, 0) != 0) {
        return std::nullopt;
    }
    auto origin = registry_.Resolve(uri);
    if (!origin || origin->kind != OriginKind::Shadow) {
        return std::nullopt;
    }
    return strategy == RewriteStrategy::Direct ? origin->session->GetHumanUri()
                                               : origin->session->GetPreviewUri();
}

// ========== Edits ==========

std::optional<std::vector<std::string>> ProtocolProxy::ApplyEditsToCell(const NotebookSession& session,
                                                                        const std::string& cell_id,
                                                                        const std::vector<TextEdit>& edits,
                                                                        bool trim) const {
    auto content = session.ContentRangeOf(cell_id);
    if (!content) {
        return std::nullopt;
    }

    std::vector<TextEdit> local;
    for (TextEdit edit : edits) {
        edit.range.start.line -= content->start;
        edit.range.end.line -= content->start;
        if (edit.range.start.line < 0 || edit.range.end.line > content->Count()) {
            spdlog::debug("Dropping edit outside cell {}", cell_id);
            continue;
        }
        local.push_back(std::move(edit));
    }

    const auto& human = session.GetHumanView();
    auto lines = ApplyTextEdits(human.GetLines(content->start, content->end + 1), local);
    if (trim) {
        TrimTrailingBlankLines(lines, FacadeConfig::Instance().GetTrailingBlankLines());
    }
    if (lines.empty()) {
        lines.emplace_back();
    }
    return lines;
}

std::vector<TextEdit> ProtocolProxy::CollectWorkspaceEdits(const NotebookSession& session,
                                                           const json& edit) const {
    std::vector<TextEdit> edits;
    if (!edit.is_object()) {
        return edits;
    }

    auto is_own = [&session](const std::string& uri) {
        return uri == session.GetShadowUri() || uri == session.GetHumanUri();
    };

    auto changes = edit.find("changes");
    if (changes != edit.end() && changes->is_object()) {
        for (auto it = changes->begin(); it != changes->end(); ++it) {
            if (is_own(it.key())) {
                auto parsed = ParseTextEdits(it.value());
                edits.insert(edits.end(), parsed.begin(), parsed.end());
            }
        }
    }

    auto document_changes = edit.find("documentChanges");
    if (document_changes != edit.end() && document_changes->is_array()) {
        for (const auto& change : *document_changes) {
            if (!change.is_object() || !change.contains("textDocument") || !change.contains("edits")) {
                continue;
            }
            const json& document = change["textDocument"];
            if (document.is_object() && document.contains("uri") && document["uri"].is_string() &&
                is_own(document["uri"].get<std::string>())) {
                auto parsed = ParseTextEdits(change["edits"]);
                edits.insert(edits.end(), parsed.begin(), parsed.end());
            }
        }
    }
    return edits;
}

// ========== Notifications ==========

void ProtocolProxy::OnPublishDiagnostics(const json& params) {
    if (!params.is_object() || !params.contains("uri") || !params["uri"].is_string()) {
        spdlog::warn("Ignoring malformed publishDiagnostics");
        return;
    }

    const std::string uri = params["uri"].get<std::string>();
    const json diagnostics = params.contains("diagnostics") ? params["diagnostics"] : json::array();

    auto origin = registry_.Resolve(uri);
    if (!origin || origin->kind != OriginKind::Shadow) {
        Publish(uri, diagnostics);
        return;
    }

    origin->session->GetBackendState().shadow_diagnostics = diagnostics.is_array() ? diagnostics : json::array();
    RepublishDiagnostics(*origin->session);
}

void ProtocolProxy::RepublishDiagnostics(NotebookSession& session) {
    const json& stored = session.GetBackendState().shadow_diagnostics;
    const EditOverlay* overlay = session.GetSynchronizer().GetOverlay();

    json human = json::array();
    json local = json::array();

    for (const auto& diagnostic : stored) {
        auto line = StartLineOf(diagnostic);
        if (!line) {
            human.push_back(diagnostic);
            continue;
        }

        auto cell_id = session.CellAt(*line);
        const Cell* cell = cell_id ? session.GetDocument().GetCellById(*cell_id) : nullptr;
        if (!cell || cell->kind != CellKind::Code) {
            continue;
        }
        // Marker lines are blank in the shadow view
        auto content = session.ContentRangeOf(*cell_id);
        if (!content || !content->Contains(*line)) {
            continue;
        }
        human.push_back(diagnostic);

        if (overlay && overlay->GetCellId() == *cell_id && overlay->GetRegion().Contains(*line)) {
            json shifted = diagnostic;
            ShiftRange(shifted["range"], -overlay->GetRegionStart());
            local.push_back(std::move(shifted));
        }
    }

    Publish(session.GetHumanUri(), human);
    if (overlay) {
        Publish(session.GetOverlayUri(), local);
    }
}

void ProtocolProxy::Publish(const std::string& uri, const json& diagnostics) {
    if (diagnostics_handler_) {
        diagnostics_handler_(uri, diagnostics);
    }
}

bool ProtocolProxy::ShowDocument(const json& location) {
    std::string uri;
    Position position;
    try {
        json range;
        if (location.contains("targetUri")) {
            uri = location.at("targetUri").get<std::string>();
            range = location.contains("targetSelectionRange") ? location["targetSelectionRange"]
                                                              : location.value("targetRange", json());
        } else {
            uri = location.at("uri").get<std::string>();
            range = location.contains("selection") ? location["selection"] : location.value("range", json());
        }
        if (range.is_object() && range.contains("start")) {
            position.line = range["start"].value("line", 0);
            position.character = range["start"].value("character", 0);
        }
    } catch (const json::exception& e) {
        spdlog::warn("Ignoring malformed location: {}", e.what());
        return false;
    }

    auto origin = registry_.Resolve(uri);
    if (!origin) {
        return false;
    }

    auto& sync = origin->session->GetSynchronizer();
    if (sync.GetState() == OverlayState::Open) {
        sync.CloseOverlay();
    }

    sync.SetHumanCursor({position.line + origin->line_offset, position.character});
    if (focus_handler_) {
        focus_handler_(origin->session->GetHumanUri(), sync.GetHumanCursor());
    }
    return true;
}

std::optional<std::vector<std::string>> ProtocolProxy::PreviewLines(const std::string& uri) const {
    auto origin = registry_.Resolve(uri);
    if (!origin || origin->kind != OriginKind::Preview) {
        return std::nullopt;
    }
    return origin->session->GetHumanView().GetLines();
}

} // namespace lsp
} // namespace nbfacade
