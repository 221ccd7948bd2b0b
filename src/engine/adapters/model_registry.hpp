#pragma once

#include "../engine_types.hpp"
#include "../progress_channel.hpp"

#include <expected>
#include <filesystem>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

struct LocalModelSpec {
    std::string id;
    std::string label;
    std::string detail;
    std::string dir; // directory name under local-models/
};

// Where the sidecar binary and model directories may live, searched in this order:
// user-writable install, bundled resources, development tree.
struct LocalLayout {
    std::filesystem::path data_dir;
    std::filesystem::path resource_dir;
    std::filesystem::path dev_dir;
    // Downloads copy model directories from here into data_dir, falling back to
    // dev_dir/sherpa_onnx_models/sherpa-onnx-nemo-<dir>.
    std::filesystem::path model_source_dir;
    std::string binary_name = "sherpa-onnx-offline";
};

struct DownloadProgress {
    std::string model_id;
    int percent = 0;
    size_t files_copied = 0;
    size_t files_total = 0;
};

// A running model download. Destroying it cancels and joins the worker.
struct DownloadTask {
    std::string model_id;
    std::shared_ptr<ProgressChannel<DownloadProgress>> progress;
    std::future<std::expected<std::filesystem::path, EngineError>> done;
    std::jthread worker;

    void cancel() { worker.request_stop(); }
};

class ModelRegistry {
public:
    static constexpr std::string_view kWeightsFile = "model.int8.onnx";
    static constexpr std::string_view kTokensFile = "tokens.txt";
    static constexpr std::string_view kBinDirName = "sherpa-onnx-bin";
    static constexpr std::string_view kModelsDirName = "local-models";
    static constexpr std::string_view kDevModelsDirName = "sherpa_onnx_models";

    explicit ModelRegistry(LocalLayout layout);

    ModelRegistry(const ModelRegistry&) = delete;
    ModelRegistry& operator=(const ModelRegistry&) = delete;

    const std::vector<LocalModelSpec>& models() const { return models_; }
    const LocalModelSpec* find(std::string_view model_id) const;
    const LocalLayout& layout() const { return layout_; }

    std::optional<std::filesystem::path> binary_path() const;

    // First candidate directory holding both the weights and the vocabulary.
    std::optional<std::filesystem::path> model_dir(std::string_view model_id) const;
    bool is_downloaded(std::string_view model_id) const;
    std::vector<std::string> downloaded_models() const;

    bool is_downloading(std::string_view model_id) const;
    std::expected<DownloadTask, EngineError> start_download(std::string_view model_id);

    static bool is_complete(const std::filesystem::path& dir);

private:
    std::vector<std::filesystem::path> search_roots() const;
    // User-writable location a download installs into.
    std::filesystem::path install_dir(std::string_view model_id) const;
    std::optional<std::filesystem::path> download_source(const LocalModelSpec& spec) const;
    std::expected<std::filesystem::path, EngineError>
        copy_model(const LocalModelSpec& spec, const std::filesystem::path& source,
                   ProgressChannel<DownloadProgress>& progress, std::stop_token stop);

    LocalLayout layout_;
    std::vector<LocalModelSpec> models_;

    mutable std::mutex mutex_;
    std::set<std::string, std::less<>> downloading_;
};
