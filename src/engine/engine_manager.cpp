#include "engine_manager.hpp"

#include "adapters/local_sidecar_adapter.hpp"

#include <format>
#include <future>
#include <print>

EngineManager::EngineManager(std::unique_ptr<EnginePort> remote, std::unique_ptr<EnginePort> local,
                             AudioConverter converter, TempFileManager temp_files,
                             std::unique_ptr<HistoryDb> history, bool verbose,
                             std::chrono::seconds orphan_age)
    : remote_(std::move(remote)), local_(std::move(local)),
      converter_(std::move(converter)), temp_files_(std::move(temp_files)),
      history_(std::move(history)), verbose_(verbose), orphan_age_(orphan_age) {}

EngineManager::~EngineManager() = default;

EnginePort& EngineManager::port(AdapterKind kind) const {
    return kind == AdapterKind::Local ? *local_ : *remote_;
}

InitResult EngineManager::initialize() {
    auto swept = temp_files_.sweep_orphans(orphan_age_);
    if (swept > 0) log(std::format("Removed {} orphaned temp file(s)", swept));

    bool remote_up = false;
    bool local_up = false;

    auto remote_probe = remote_->is_available();
    if (remote_probe.available) {
        remote_up = true;
        active_ = AdapterKind::Remote;
        log("Remote engine reachable");
    } else {
        log("Remote engine unavailable: " + remote_probe.error);
        auto local_probe = local_->is_available();
        if (local_probe.available) {
            local_up = true;
            active_ = AdapterKind::Local;
            log("Local engine ready");
        } else {
            log("Local engine unavailable: " + local_probe.error);
            active_ = AdapterKind::Remote;
        }
    }

    // Saved selection wins over the probe order.
    std::string selection;
    if (auto remote_sel = remote_->persisted_selection()) {
        selection = *remote_sel;
    } else if (auto local_sel = local_->persisted_selection()) {
        selection = *local_sel;
    } else if (active_ == AdapterKind::Remote) {
        selection = std::string(kDefaultModel);
    } else {
        // Local won the probe with nothing chosen: it serves its first complete model.
        selection = local_->health().active_model;
    }

    if (!selection.empty()) {
        auto ref = ModelRef::parse(selection);
        active_ = ref.kind;
        active_model_ = ref.id;
    }

    bool available = active_ == AdapterKind::Remote ? remote_up : local_up;
    if (active_ == AdapterKind::Local && !local_up) {
        available = local_->is_available().available;
    }

    log(std::format("Active engine: {} ({}){}", to_string(active_), active_model_,
                    available ? "" : ", not available"));
    return InitResult{.adapter = active_, .available = available};
}

TranscriptionResult EngineManager::process_audio(std::span<const uint8_t> audio,
                                                 const TranscribeOptions& options) {
    auto input = temp_files_.write(audio, ".webm");
    auto start = std::chrono::steady_clock::now();
    auto elapsed_ms = [&] {
        return std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - start).count();
    };

    auto& engine = active();

    // A model id from the other namespace cannot be served by this engine.
    TranscribeOptions effective = options;
    if (!effective.model.empty() && ModelRef::parse(effective.model).kind != active_) {
        log("Ignoring model " + effective.model + " for " + std::string(to_string(active_)));
        effective.model.clear();
    }

    std::string audio_path = input.string();
    ScopedTempFile converted;
    if (engine.needs_wav_input()) {
        converted = temp_files_.reserve(".wav");
        auto conv = converter_.convert(input.string(), converted.string());
        if (!conv) {
            auto result = failure(conv.error(), elapsed_ms(), effective);
            record(result);
            return result;
        }
        audio_path = converted.string();
    }

    log(std::format("Transcribing {} bytes with {}", audio.size(), to_string(active_)));

    auto transcribed = engine.transcribe(audio_path, effective);
    auto result = transcribed ? std::move(*transcribed)
                              : failure(transcribed.error(), elapsed_ms(), effective);
    record(result);
    return result;
}

TranscriptionResult EngineManager::failure(EngineError error, double processing_ms,
                                           const TranscribeOptions& options) const {
    return TranscriptionResult{
        .success = false,
        .text = {},
        .processing_ms = processing_ms,
        .engine = std::format("{} (error)", to_string(active_)),
        .model = options.model.empty() ? active_model_ : options.model,
        .language = options.language,
        .error = std::move(error),
    };
}

void EngineManager::record(const TranscriptionResult& result) {
    if (result.success) {
        last_ = LastTranscription{
            .text = result.text,
            .processing_ms = result.processing_ms,
            .engine = result.engine,
            .language = result.language,
            .model = result.model,
        };
        log(std::format("Transcription complete: {:.0f}ms, {} chars", result.processing_ms, result.text.size()));
    } else {
        std::println(stderr, "engine: transcription failed: {}",
                     result.error ? result.error->describe() : "unknown error");
    }

    if (history_ && history_->is_open()) {
        history_->insert(result);
    }
}

std::expected<void, EngineError> EngineManager::switch_model(const std::string& model_id) {
    auto ref = ModelRef::parse(model_id);
    log(std::format("Switching to {} on {}", ref.id, to_string(ref.kind)));

    auto switched = port(ref.kind).switch_model(ref.id);
    if (!switched) {
        log("Switch failed: " + switched.error().describe());
        return std::unexpected(switched.error());
    }

    active_ = ref.kind;
    active_model_ = ref.id;
    return {};
}

std::vector<ModelDescriptor> EngineManager::list_models() {
    auto remote_models = std::async(std::launch::async, [this] { return remote_->list_models(); });
    auto local_models = std::async(std::launch::async, [this] { return local_->list_models(); });

    auto models = remote_models.get();
    auto local = local_models.get();
    models.insert(models.end(), std::make_move_iterator(local.begin()), std::make_move_iterator(local.end()));

    // Only the active engine's model counts as loaded.
    for (auto& m : models) {
        if (m.state == ModelState::Loaded && m.owner != active_) {
            m.state = ModelState::Available;
        }
    }
    return models;
}

EngineStatus EngineManager::status() {
    auto health = active().health();
    bool available = health.state != "unavailable" && health.state != "setup-required" &&
                     health.state != "error";
    return EngineStatus{
        .adapter = active_,
        .active_model = active_model_,
        .available = available,
        .health = std::move(health),
        .config = active().config(),
    };
}

nlohmann::json EngineManager::config(AdapterKind kind) const {
    return port(kind).config();
}

std::expected<void, EngineError> EngineManager::configure(AdapterKind kind, const nlohmann::json& patch) {
    auto configured = port(kind).configure(patch);
    if (!configured) return configured;

    if (kind == active_) {
        if (auto selection = port(kind).persisted_selection();
            selection && ModelRef::parse(*selection).kind == kind) {
            active_model_ = *selection;
        }
    }
    return {};
}

std::expected<AdapterHealth, EngineError> EngineManager::test_connection() {
    auto probe = active().is_available();
    if (!probe.available) {
        auto kind = active_ == AdapterKind::Remote ? ErrorKind::Connectivity : ErrorKind::Configuration;
        return std::unexpected(EngineError{
            .kind = kind,
            .message = probe.error.empty() ? "engine not reachable" : probe.error,
        });
    }
    return active().health();
}

std::expected<void, EngineError> EngineManager::download_model(const std::string& model_id,
                                                               const ProgressCallback& on_progress) {
    auto ref = ModelRef::parse(model_id);
    auto* sidecar = dynamic_cast<LocalSidecarAdapter*>(local_.get());
    if (ref.kind != AdapterKind::Local || !sidecar) {
        return std::unexpected(EngineError{
            .kind = ErrorKind::Configuration,
            .message = model_id + " is not a downloadable local model",
        });
    }

    auto task = sidecar->download_model(ref.id);
    if (!task) return std::unexpected(task.error());

    log("Downloading " + ref.id);
    while (auto progress = task->progress->pop()) {
        if (on_progress) on_progress(*progress);
    }

    auto installed = task->done.get();
    if (!installed) {
        log("Download failed: " + installed.error().describe());
        return std::unexpected(installed.error());
    }

    return switch_model(model_id);
}

std::vector<HistoryEntry> EngineManager::history(int limit) {
    if (!history_ || !history_->is_open()) return {};
    return history_->recent(limit);
}

void EngineManager::log(const std::string& msg) {
    if (verbose_) {
        std::println(stderr, "[echo-engine] {}", msg);
    }
}

nlohmann::json to_json(const InitResult& init) {
    return {{"adapter", std::string(to_string(init.adapter))}, {"available", init.available}};
}

nlohmann::json to_json(const EngineStatus& status) {
    return {
        {"adapter", std::string(to_string(status.adapter))},
        {"activeModel", status.active_model},
        {"available", status.available},
        {"health", to_json(status.health)},
        {"config", status.config},
    };
}

nlohmann::json to_json(const LastTranscription& last) {
    return {
        {"text", last.text},
        {"processingTime", last.processing_ms},
        {"engine", last.engine},
        {"language", last.language},
        {"model", last.model},
    };
}
