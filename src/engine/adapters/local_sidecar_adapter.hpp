#pragma once

#include "engine_port.hpp"
#include "model_registry.hpp"
#include "../storage/adapter_config.hpp"

#include <chrono>
#include <string>

// Runs the bundled sherpa-onnx CLI once per request.
class LocalSidecarAdapter : public EnginePort {
public:
    LocalSidecarAdapter(LocalLayout layout, std::string config_path,
                        int num_threads = 4,
                        std::chrono::seconds timeout = std::chrono::seconds(120));

    AdapterKind kind() const override { return AdapterKind::Local; }
    bool needs_wav_input() const override { return true; }

    std::expected<TranscriptionResult, EngineError>
        transcribe(const std::string& audio_path, const TranscribeOptions& options) override;

    Availability is_available() override;
    AdapterHealth health() override;

    std::expected<void, EngineError> switch_model(const std::string& model_id) override;
    std::vector<ModelDescriptor> list_models() override;

    nlohmann::json config() const override;
    std::expected<void, EngineError> configure(const nlohmann::json& patch) override;
    std::optional<std::string> persisted_selection() const override;

    std::expected<DownloadTask, EngineError> download_model(const std::string& model_id);

    const std::string& active_model_id() const { return config_.active_model_id; }

    // The selected model, or the first complete one when nothing is selected.
    std::string resolved_model_id() const;
    ModelRegistry& registry() { return registry_; }

    // Drops the echoed input path line and joins the transcript lines.
    static std::string parse_output(const std::string& out, const std::string& audio_path);

private:
    ModelRegistry registry_;
    std::string config_path_;
    LocalConfig config_;
    int num_threads_;
    std::chrono::seconds timeout_;
};
