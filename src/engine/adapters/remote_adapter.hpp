#pragma once

#include "engine_port.hpp"
#include "../storage/adapter_config.hpp"

#include <mutex>
#include <string>

// Client for an OpenAI-compatible transcription server:
//   GET  /health                  liveness + loaded model
//   GET  /v1/models               model list
//   POST /v1/models/switch        load another model (slow, GPU swap)
//   POST /v1/audio/transcriptions multipart transcription
class RemoteAdapter : public EnginePort {
public:
    struct Timeouts {
        long health_ms = 3000;
        long transcribe_s = 120;
        long switch_s = 60;
    };

    explicit RemoteAdapter(std::string config_path, Timeouts timeouts = {});
    ~RemoteAdapter() override;

    RemoteAdapter(const RemoteAdapter&) = delete;
    RemoteAdapter& operator=(const RemoteAdapter&) = delete;

    AdapterKind kind() const override { return AdapterKind::Remote; }
    bool needs_wav_input() const override { return false; }

    std::expected<TranscriptionResult, EngineError>
        transcribe(const std::string& audio_path, const TranscribeOptions& options) override;

    Availability is_available() override;
    AdapterHealth health() override;

    std::expected<void, EngineError> switch_model(const std::string& model_id) override;
    std::vector<ModelDescriptor> list_models() override;

    nlohmann::json config() const override;
    std::expected<void, EngineError> configure(const nlohmann::json& patch) override;
    std::optional<std::string> persisted_selection() const override;

    const RemoteConfig& settings() const { return config_; }

    // Endpoint with any trailing "/v1/audio/transcriptions" and slashes removed.
    std::string base_url() const;

    // "English" -> "en"; codes pass through lowercased.
    static std::string normalize_language(const std::string& language);

private:
    struct HttpResponse {
        long status = 0;
        std::string body;
    };

    enum class Method { Get, PostJson, PostForm };

    struct HttpRequest {
        Method method = Method::Get;
        std::string path;
        long timeout_ms = 0;
        std::string json_body;
        std::string audio_path;
        std::string model;
        std::string language;
    };

    std::expected<HttpResponse, EngineError> perform(const HttpRequest& req) const;

    std::string config_path_;
    RemoteConfig config_;
    Timeouts timeouts_;

    mutable std::mutex switch_mutex_;
    std::string switching_model_;
};
