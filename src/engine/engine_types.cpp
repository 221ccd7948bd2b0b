#include "engine_types.hpp"

#include <format>

std::string EngineError::describe() const {
    return std::format("{}: {}", to_string(kind), message);
}

ModelRef ModelRef::parse(std::string_view id) {
    ModelRef ref;
    ref.id = std::string(id);
    ref.kind = id.starts_with(kLocalModelPrefix) ? AdapterKind::Local : AdapterKind::Remote;
    return ref;
}

std::string_view to_string(AdapterKind kind) {
    switch (kind) {
        case AdapterKind::Remote: return "remote";
        case AdapterKind::Local: return "local-sidecar";
    }
    return "unknown";
}

std::string_view to_string(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::Connectivity: return "ConnectivityError";
        case ErrorKind::Configuration: return "ConfigurationError";
        case ErrorKind::Subprocess: return "SubprocessError";
        case ErrorKind::Conversion: return "ConversionError";
        case ErrorKind::Filesystem: return "FilesystemError";
    }
    return "UnknownError";
}

std::string_view to_string(ModelState state) {
    switch (state) {
        case ModelState::Loaded: return "loaded";
        case ModelState::Available: return "available";
        case ModelState::Switching: return "switching";
        case ModelState::Downloading: return "downloading";
        case ModelState::Download: return "download";
    }
    return "unknown";
}

nlohmann::json to_json(const ModelDescriptor& model) {
    nlohmann::json j = {
        {"id", model.id},
        {"label", model.label},
        {"group", model.group},
        {"state", std::string(to_string(model.state))},
    };
    if (!model.detail.empty()) j["detail"] = model.detail;
    return j;
}

nlohmann::json to_json(const AdapterHealth& health) {
    nlohmann::json j = {
        {"state", health.state},
        {"activeModel", health.active_model},
        {"downloadedModels", health.downloaded_models},
        {"binaryFound", health.binary_found},
    };
    if (!health.error.empty()) j["error"] = health.error;
    if (!health.extra.empty()) j["extra"] = health.extra;
    return j;
}

nlohmann::json to_json(const TranscriptionResult& result) {
    nlohmann::json j = {
        {"success", result.success},
        {"text", result.text},
        {"processingTime", result.processing_ms},
        {"engine", result.engine},
        {"model", result.model},
        {"language", result.language},
    };
    if (result.error) {
        j["error"] = result.error->describe();
        j["errorKind"] = std::string(to_string(result.error->kind));
    }
    return j;
}
