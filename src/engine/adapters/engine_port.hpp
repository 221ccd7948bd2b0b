#pragma once

#include "../engine_types.hpp"

#include <expected>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

// Transcription contract shared by the remote and local engines.
class EnginePort {
public:
    virtual ~EnginePort() = default;

    virtual AdapterKind kind() const = 0;

    // Whether transcribe() expects 16 kHz mono WAV rather than the captured container.
    virtual bool needs_wav_input() const = 0;

    virtual std::expected<TranscriptionResult, EngineError>
        transcribe(const std::string& audio_path, const TranscribeOptions& options) = 0;

    // Never throws; reports why the backend is unusable instead.
    virtual Availability is_available() = 0;
    virtual AdapterHealth health() = 0;

    virtual std::expected<void, EngineError> switch_model(const std::string& model_id) = 0;
    virtual std::vector<ModelDescriptor> list_models() = 0;

    virtual nlohmann::json config() const = 0;
    virtual std::expected<void, EngineError> configure(const nlohmann::json& patch) = 0;

    // Model selection persisted by this adapter, if it has one worth restoring.
    virtual std::optional<std::string> persisted_selection() const = 0;
};
