#pragma once

#include <nlohmann/json.hpp>

#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

enum class AdapterKind { Remote, Local };

enum class ErrorKind { Connectivity, Configuration, Subprocess, Conversion, Filesystem };

struct EngineError {
    ErrorKind kind = ErrorKind::Connectivity;
    std::string message;

    // "ConversionError: ffmpeg not found"
    std::string describe() const;
};

// Thrown only when the request cannot even be staged on disk.
class FilesystemError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Model id plus the adapter that owns it. Parsed once from the display id.
struct ModelRef {
    AdapterKind kind = AdapterKind::Remote;
    std::string id;

    static ModelRef parse(std::string_view id);
};

inline constexpr std::string_view kLocalModelPrefix = "local-";
inline constexpr std::string_view kDefaultModel = "gpu-english";

enum class ModelState { Loaded, Available, Switching, Downloading, Download };

struct ModelDescriptor {
    std::string id;
    std::string label;
    std::string group; // "gpu" or "local"
    ModelState state = ModelState::Available;
    std::string detail;
    AdapterKind owner = AdapterKind::Remote;
};

struct TranscribeOptions {
    std::string model;
    std::string language;
};

struct TranscriptionResult {
    bool success = false;
    std::string text;
    double processing_ms = 0.0;
    std::string engine;
    std::string model;
    std::string language;
    std::optional<EngineError> error;
};

struct AdapterHealth {
    std::string state; // loaded, degraded, ready, setup-required, unavailable, error
    std::string active_model;
    std::vector<std::string> downloaded_models;
    bool binary_found = false;
    std::string error;
    nlohmann::json extra = nlohmann::json::object();
};

struct Availability {
    bool available = false;
    std::string error;
};

std::string_view to_string(AdapterKind kind);
std::string_view to_string(ErrorKind kind);
std::string_view to_string(ModelState state);

nlohmann::json to_json(const ModelDescriptor& model);
nlohmann::json to_json(const AdapterHealth& health);
nlohmann::json to_json(const TranscriptionResult& result);
