#pragma once

#include "adapters/engine_port.hpp"
#include "adapters/model_registry.hpp"
#include "audio/audio_converter.hpp"
#include "engine_types.hpp"
#include "storage/history_db.hpp"
#include "storage/temp_files.hpp"

#include <chrono>
#include <cstdint>
#include <expected>
#include <functional>
#include <memory>
#include <nlohmann/json.hpp>
#include <span>
#include <string>
#include <vector>

struct InitResult {
    AdapterKind adapter = AdapterKind::Remote;
    bool available = false;
};

struct EngineStatus {
    AdapterKind adapter = AdapterKind::Remote;
    std::string active_model;
    bool available = false;
    AdapterHealth health;
    nlohmann::json config;
};

struct LastTranscription {
    std::string text;
    double processing_ms = 0.0;
    std::string engine;
    std::string language;
    std::string model;
};

// Owns both engines and routes every application request to the active one.
// Not reentrant: one call at a time, driven from a single worker thread.
class EngineManager {
public:
    using ProgressCallback = std::function<void(const DownloadProgress&)>;

    EngineManager(std::unique_ptr<EnginePort> remote, std::unique_ptr<EnginePort> local,
                  AudioConverter converter, TempFileManager temp_files,
                  std::unique_ptr<HistoryDb> history = nullptr, bool verbose = false,
                  std::chrono::seconds orphan_age = std::chrono::seconds(300));
    ~EngineManager();

    EngineManager(const EngineManager&) = delete;
    EngineManager& operator=(const EngineManager&) = delete;

    // Sweeps stale temp audio, probes both engines and restores the saved model.
    InitResult initialize();

    // Throws FilesystemError only if the audio cannot be written to disk;
    // every other failure comes back in the result.
    TranscriptionResult process_audio(std::span<const uint8_t> audio,
                                      const TranscribeOptions& options = {});

    std::expected<void, EngineError> switch_model(const std::string& model_id);
    std::vector<ModelDescriptor> list_models();

    EngineStatus status();
    const LastTranscription& last_transcription() const { return last_; }

    nlohmann::json config(AdapterKind kind) const;
    std::expected<void, EngineError> configure(AdapterKind kind, const nlohmann::json& patch);
    std::expected<AdapterHealth, EngineError> test_connection();

    // Installs a local model, reporting progress on the calling thread, then
    // makes it the active model.
    std::expected<void, EngineError> download_model(const std::string& model_id,
                                                    const ProgressCallback& on_progress = {});

    std::vector<HistoryEntry> history(int limit = 10);

    AdapterKind active_kind() const { return active_; }
    const std::string& active_model() const { return active_model_; }

private:
    EnginePort& port(AdapterKind kind) const;
    EnginePort& active() const { return port(active_); }

    TranscriptionResult failure(EngineError error, double processing_ms,
                                const TranscribeOptions& options) const;
    void record(const TranscriptionResult& result);

    void log(const std::string& msg);

    std::unique_ptr<EnginePort> remote_;
    std::unique_ptr<EnginePort> local_;
    AudioConverter converter_;
    TempFileManager temp_files_;
    std::unique_ptr<HistoryDb> history_;
    bool verbose_;
    std::chrono::seconds orphan_age_;

    AdapterKind active_ = AdapterKind::Remote;
    std::string active_model_ = std::string(kDefaultModel);
    LastTranscription last_;
};

nlohmann::json to_json(const InitResult& init);
nlohmann::json to_json(const EngineStatus& status);
nlohmann::json to_json(const LastTranscription& last);
