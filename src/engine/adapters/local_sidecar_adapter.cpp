#include "local_sidecar_adapter.hpp"

#include "../process/managed_process.hpp"

#include <format>
#include <print>
#include <sstream>

namespace fs = std::filesystem;

namespace {

constexpr const char* kEngineLabel = "local (sherpa-onnx)";

EngineError config_error(std::string message) {
    return EngineError{.kind = ErrorKind::Configuration, .message = std::move(message)};
}

std::string trim(const std::string& s) {
    auto start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) return {};
    auto end = s.find_last_not_of(" \t\r\n");
    return s.substr(start, end - start + 1);
}

} // namespace

LocalSidecarAdapter::LocalSidecarAdapter(LocalLayout layout, std::string config_path,
                                         int num_threads, std::chrono::seconds timeout)
    : registry_(std::move(layout)),
      config_path_(std::move(config_path)),
      config_(LocalConfig::load(config_path_)),
      num_threads_(num_threads),
      timeout_(timeout) {
    auto binary = registry_.binary_path();
    if (!binary) {
        std::println(stderr, "local: {} not found", registry_.layout().binary_name);
    }
}

std::expected<TranscriptionResult, EngineError>
LocalSidecarAdapter::transcribe(const std::string& audio_path, const TranscribeOptions& options) {
    auto binary = registry_.binary_path();
    if (!binary) {
        return std::unexpected(config_error(registry_.layout().binary_name + " binary not found"));
    }

    auto model_id = resolved_model_id();
    auto model_dir = model_id.empty() ? std::nullopt : registry_.model_dir(model_id);
    if (!model_dir) {
        return std::unexpected(config_error("no local model selected or downloaded"));
    }

    auto bin_dir = binary->parent_path().string();
    ProcessOptions opts{
        .argv = {binary->string(),
                 "--nemo-ctc-model=" + (*model_dir / ModelRegistry::kWeightsFile).string(),
                 "--tokens=" + (*model_dir / ModelRegistry::kTokensFile).string(),
                 "--num-threads=" + std::to_string(num_threads_),
                 audio_path},
        .working_dir = bin_dir,
        .env_prepend = {{"LD_LIBRARY_PATH", bin_dir}, {"PATH", bin_dir}},
        .timeout = timeout_,
    };

    auto start = std::chrono::steady_clock::now();
    auto result = ManagedProcess::run(std::move(opts));
    double processing_ms = std::chrono::duration<double, std::milli>(
        std::chrono::steady_clock::now() - start).count();

    if (!result) {
        const auto& err = result.error();
        auto message = err.message;
        auto stderr_text = trim(err.err);
        if (!stderr_text.empty()) message += ": " + stderr_text;
        return std::unexpected(EngineError{.kind = ErrorKind::Subprocess, .message = std::move(message)});
    }

    if (result->exit_code != 0) {
        return std::unexpected(EngineError{
            .kind = ErrorKind::Subprocess,
            .message = std::format("sherpa-onnx exited with code {}: {}",
                                   result->exit_code, trim(result->err)),
        });
    }

    return TranscriptionResult{
        .success = true,
        .text = parse_output(result->out, audio_path),
        .processing_ms = processing_ms,
        .engine = kEngineLabel,
        .model = model_id,
        .language = options.language.empty() ? "en" : options.language,
    };
}

std::string LocalSidecarAdapter::resolved_model_id() const {
    if (!config_.active_model_id.empty()) return config_.active_model_id;
    auto downloaded = registry_.downloaded_models();
    return downloaded.empty() ? std::string{} : downloaded.front();
}

std::string LocalSidecarAdapter::parse_output(const std::string& out, const std::string& audio_path) {
    std::istringstream in(out);
    std::string line;
    std::string text;
    bool first = true;

    while (std::getline(in, line)) {
        line = trim(line);
        if (line.empty()) continue;
        if (first) {
            first = false;
            // The binary echoes the input file before the transcript.
            if (line == audio_path || line.find(fs::path(audio_path).filename().string()) != std::string::npos) {
                continue;
            }
        }
        if (!text.empty()) text += ' ';
        text += line;
    }
    return text;
}

Availability LocalSidecarAdapter::is_available() {
    if (!registry_.binary_path()) {
        return {.available = false, .error = registry_.layout().binary_name + " binary not found"};
    }

    const auto& active = config_.active_model_id;
    if (!active.empty()) {
        if (!registry_.is_downloaded(active)) {
            return {.available = false, .error = std::format("model {} is incomplete or missing", active)};
        }
        return {.available = true, .error = {}};
    }

    if (registry_.downloaded_models().empty()) {
        return {.available = false, .error = "no local model downloaded"};
    }
    return {.available = true, .error = {}};
}

AdapterHealth LocalSidecarAdapter::health() {
    AdapterHealth h;
    h.binary_found = registry_.binary_path().has_value();
    h.active_model = resolved_model_id();
    h.downloaded_models = registry_.downloaded_models();
    h.state = h.binary_found && !h.downloaded_models.empty() ? "ready" : "setup-required";
    if (!h.binary_found) h.error = registry_.layout().binary_name + " binary not found";
    return h;
}

std::expected<void, EngineError> LocalSidecarAdapter::switch_model(const std::string& model_id) {
    if (!registry_.find(model_id)) {
        return std::unexpected(config_error("unknown local model: " + model_id));
    }
    if (!registry_.is_downloaded(model_id)) {
        return std::unexpected(config_error(std::format("Model {} is not downloaded", model_id)));
    }

    config_.active_model_id = model_id;
    if (auto saved = config_.save(config_path_); !saved) {
        std::println(stderr, "local: failed to save config: {}", saved.error());
    }
    return {};
}

std::vector<ModelDescriptor> LocalSidecarAdapter::list_models() {
    auto active = resolved_model_id();
    std::vector<ModelDescriptor> out;
    for (const auto& spec : registry_.models()) {
        ModelDescriptor m{
            .id = spec.id,
            .label = spec.label,
            .group = "local",
            .state = ModelState::Download,
            .detail = spec.detail,
            .owner = AdapterKind::Local,
        };

        if (registry_.is_downloading(spec.id)) {
            m.state = ModelState::Downloading;
        } else if (registry_.is_downloaded(spec.id)) {
            m.state = spec.id == active ? ModelState::Loaded : ModelState::Available;
        }
        out.push_back(std::move(m));
    }
    return out;
}

nlohmann::json LocalSidecarAdapter::config() const {
    auto binary = registry_.binary_path();
    auto j = config_.to_json();
    j["binaryPath"] = binary ? nlohmann::json(binary->string()) : nlohmann::json(nullptr);
    j["isConfigured"] = binary.has_value() && !config_.active_model_id.empty() &&
                        registry_.is_downloaded(config_.active_model_id);
    return j;
}

std::expected<void, EngineError> LocalSidecarAdapter::configure(const nlohmann::json& patch) {
    auto it = patch.find("activeModelId");
    if (it != patch.end() && it->is_string()) {
        return switch_model(it->get<std::string>());
    }
    return {};
}

std::optional<std::string> LocalSidecarAdapter::persisted_selection() const {
    // Only an explicit choice counts; the first-complete fallback is not a saved selection.
    if (config_.active_model_id.empty()) return std::nullopt;
    return config_.active_model_id;
}

std::expected<DownloadTask, EngineError> LocalSidecarAdapter::download_model(const std::string& model_id) {
    if (registry_.is_downloaded(model_id)) {
        return std::unexpected(config_error(std::format("{} is already downloaded", model_id)));
    }
    return registry_.start_download(model_id);
}
