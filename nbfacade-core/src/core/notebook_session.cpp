#include "nbfacade/notebook_session.h"
#include "nbfacade/facade_config.h"
#include "nbfacade/shadow_projector.h"
#include "nbfacade/uri.h"
#include <spdlog/spdlog.h>
#include <atomic>

namespace nbfacade {

namespace {

std::filesystem::path AbsolutePath(const std::filesystem::path& path) {
    std::error_code ec;
    auto absolute = std::filesystem::absolute(path, ec);
    return ec ? path : absolute.lexically_normal();
}

} // namespace

std::shared_ptr<NotebookSession> NotebookSession::Create(const std::filesystem::path& path, Document document) {
    return std::shared_ptr<NotebookSession>(new NotebookSession(path, std::move(document)));
}

NotebookSession::NotebookSession(const std::filesystem::path& path, Document document)
    : path_(AbsolutePath(path)), document_(std::move(document)) {
    synchronizer_ = std::make_unique<ViewSynchronizer>(document_, anchors_, human_, shadow_, task_queue_);
    synchronizer_->SetViewChangedCallback([this](const std::vector<ViewChange>& changes) {
        NotifyViewChanged(changes);
    });
    synchronizer_->SetOverlayClosedCallback([this](const std::string& cell_id, uint64_t generation) {
        NotifyOverlayClosed(cell_id, generation);
    });

    shadow_uri_ = MakeShadowUri();
    synchronizer_->Rebuild();

    spdlog::info("Opened notebook {} ({} cells, shadow {})",
                 path_.string(), document_.GetCellCount(), shadow_uri_);
}

NotebookSession::~NotebookSession() {
    spdlog::debug("Closing notebook {}", path_.string());
}

// ========== Identities ==========

std::string NotebookSession::GetHumanUri() const {
    return ToFileUri(path_);
}

std::string NotebookSession::GetPreviewUri() const {
    return ToPreviewUri(path_);
}

std::string NotebookSession::GetOverlayUri() const {
    const EditOverlay* overlay = synchronizer_->GetOverlay();
    if (!overlay) {
        return std::string();
    }
    return ToOverlayUri(path_, overlay->GetCellId());
}

std::string NotebookSession::MakeShadowUri() const {
    static std::atomic<uint64_t> counter{0};

    std::string name = path_.stem().string() + "_" + std::to_string(++counter) + "_shadow" +
                       ShadowProjector::ExtensionFor(document_.GetLanguage());
    return ToFileUri(FacadeConfig::Instance().GetShadowDirectory() / name);
}

// ========== Language ==========

void NotebookSession::SetLanguage(const std::string& language) {
    if (language.empty() || language == document_.GetLanguage()) {
        return;
    }

    document_.SetLanguage(language);

    std::string old_uri = shadow_uri_;
    shadow_uri_ = MakeShadowUri();
    synchronizer_->RegenerateShadow();

    spdlog::info("Notebook {} language changed to {}, shadow {}", path_.string(), language, shadow_uri_);

    auto listeners = language_listeners_;
    for (const auto& [id, callback] : listeners) {
        callback(old_uri, shadow_uri_);
    }
}

// ========== Persistence ==========

bool NotebookSession::LoadFrom(NotebookSerializer& serializer, const std::string& bytes) {
    auto data = serializer.Parse(bytes);
    if (!data) {
        spdlog::error("Failed to parse notebook {}", path_.string());
        return false;
    }

    const std::string old_language = document_.GetLanguage();

    synchronizer_->CloseOverlay();
    document_ = Document(std::move(data->cells), std::move(data->metadata));
    synchronizer_->Rebuild();

    if (document_.GetLanguage() != old_language) {
        std::string old_uri = shadow_uri_;
        shadow_uri_ = MakeShadowUri();
        auto listeners = language_listeners_;
        for (const auto& [id, callback] : listeners) {
            callback(old_uri, shadow_uri_);
        }
    }

    spdlog::info("Loaded notebook {} ({} cells)", path_.string(), document_.GetCellCount());
    return true;
}

std::string NotebookSession::SaveWith(NotebookSerializer& serializer) const {
    NotebookData data;
    data.cells = document_.GetCells();
    data.metadata = document_.GetMetadata();
    return serializer.Serialize(data);
}

// ========== Execution & Outputs ==========

bool NotebookSession::ExecuteCell(const std::string& cell_id) {
    const Cell* cell = document_.GetCellById(cell_id);
    if (!cell || cell->kind != CellKind::Code) {
        spdlog::debug("Skipping execution of cell {}", cell_id);
        return false;
    }
    if (!execution_ || !execution_->IsAvailable()) {
        spdlog::warn("No execution backend available");
        return false;
    }

    // Results may arrive on another thread; hop back through the task queue
    std::weak_ptr<NotebookSession> weak = weak_from_this();
    return execution_->Execute(cell_id, cell->SourceText(),
        [weak](const std::string& id, const ExecutionResult& result) {
            auto session = weak.lock();
            if (!session) {
                return;
            }
            session->task_queue_.Post([weak, id, result]() {
                if (auto self = weak.lock()) {
                    self->OnExecutionResult(id, result);
                }
            });
        });
}

void NotebookSession::OnExecutionResult(const std::string& cell_id, const ExecutionResult& result) {
    nlohmann::json outputs = result.outputs.is_array() ? result.outputs : nlohmann::json::array();
    if (!result.success && !result.error_message.empty()) {
        outputs.push_back({
            {"output_type", "error"},
            {"ename", "ExecutionError"},
            {"evalue", result.error_message},
            {"traceback", nlohmann::json::array()}
        });
    }

    if (!document_.SetCellOutputs(cell_id, outputs, result.execution_count)) {
        spdlog::debug("Discarding execution result for missing cell {}", cell_id);
        return;
    }

    if (renderer_) {
        renderer_->Render(cell_id, outputs);
    }
}

void NotebookSession::ClearOutputs(const std::string& cell_id) {
    document_.ClearOutputs(cell_id);
    if (renderer_) {
        renderer_->Clear(cell_id);
    }
}

void NotebookSession::ClearAllOutputs() {
    document_.ClearAllOutputs();
    if (renderer_) {
        for (const auto& cell : document_.GetCells()) {
            renderer_->Clear(cell.id);
        }
    }
}

void NotebookSession::RenderAllOutputs() {
    if (!renderer_) {
        return;
    }
    for (const auto& cell : document_.GetCells()) {
        if (cell.kind == CellKind::Code && cell.outputs.is_array() && !cell.outputs.empty()) {
            renderer_->Render(cell.id, cell.outputs);
        }
    }
}

// ========== Listeners ==========

ListenerId NotebookSession::AddViewChangedListener(ViewChangedCallback callback) {
    ListenerId id = next_listener_id_++;
    view_listeners_[id] = std::move(callback);
    return id;
}

ListenerId NotebookSession::AddOverlayClosedListener(OverlayClosedCallback callback) {
    ListenerId id = next_listener_id_++;
    overlay_listeners_[id] = std::move(callback);
    return id;
}

ListenerId NotebookSession::AddLanguageChangedListener(LanguageChangedCallback callback) {
    ListenerId id = next_listener_id_++;
    language_listeners_[id] = std::move(callback);
    return id;
}

void NotebookSession::RemoveListener(ListenerId id) {
    view_listeners_.erase(id);
    overlay_listeners_.erase(id);
    language_listeners_.erase(id);
}

void NotebookSession::NotifyViewChanged(const std::vector<ViewChange>& changes) {
    auto listeners = view_listeners_;
    for (const auto& [id, callback] : listeners) {
        callback(changes);
    }
}

void NotebookSession::NotifyOverlayClosed(const std::string& cell_id, uint64_t generation) {
    auto listeners = overlay_listeners_;
    for (const auto& [id, callback] : listeners) {
        callback(cell_id, generation);
    }
}

} // namespace nbfacade
