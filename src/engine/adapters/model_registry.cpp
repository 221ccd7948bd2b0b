#include "model_registry.hpp"

#include <algorithm>
#include <format>
#include <print>
#include <unistd.h>

namespace fs = std::filesystem;

namespace {

EngineError config_error(std::string message) {
    return EngineError{.kind = ErrorKind::Configuration, .message = std::move(message)};
}

EngineError fs_error(std::string message) {
    return EngineError{.kind = ErrorKind::Filesystem, .message = std::move(message)};
}

} // namespace

ModelRegistry::ModelRegistry(LocalLayout layout)
    : layout_(std::move(layout)),
      models_{
          {.id = "local-fast", .label = "Fast", .detail = "126 MB",
           .dir = "parakeet-tdt_ctc-110m-en-int8"},
          {.id = "local-balanced", .label = "Balanced", .detail = "624 MB",
           .dir = "parakeet-ctc-0.6b-en-int8"},
          {.id = "local-accurate", .label = "Accurate", .detail = "1.1 GB",
           .dir = "parakeet-tdt_ctc-1.1b-en-int8"},
      } {}

const LocalModelSpec* ModelRegistry::find(std::string_view model_id) const {
    auto it = std::find_if(models_.begin(), models_.end(),
                           [&](const LocalModelSpec& m) { return m.id == model_id; });
    return it == models_.end() ? nullptr : &*it;
}

std::vector<fs::path> ModelRegistry::search_roots() const {
    std::vector<fs::path> roots;
    for (const auto& root : {layout_.data_dir, layout_.resource_dir, layout_.dev_dir}) {
        if (!root.empty()) roots.push_back(root);
    }
    return roots;
}

std::optional<fs::path> ModelRegistry::binary_path() const {
    for (const auto& root : search_roots()) {
        auto candidate = root / kBinDirName / layout_.binary_name;
        std::error_code ec;
        if (fs::is_regular_file(candidate, ec) && ::access(candidate.c_str(), X_OK) == 0) {
            return candidate;
        }
    }
    return std::nullopt;
}

bool ModelRegistry::is_complete(const fs::path& dir) {
    std::error_code ec;
    return fs::is_regular_file(dir / kWeightsFile, ec) &&
           fs::is_regular_file(dir / kTokensFile, ec);
}

std::optional<fs::path> ModelRegistry::model_dir(std::string_view model_id) const {
    auto* spec = find(model_id);
    if (!spec) return std::nullopt;

    for (const auto& root : search_roots()) {
        auto candidate = root / kModelsDirName / spec->dir;
        if (is_complete(candidate)) return candidate;
    }
    return std::nullopt;
}

bool ModelRegistry::is_downloaded(std::string_view model_id) const {
    return model_dir(model_id).has_value();
}

std::vector<std::string> ModelRegistry::downloaded_models() const {
    std::vector<std::string> ids;
    for (const auto& m : models_) {
        if (is_downloaded(m.id)) ids.push_back(m.id);
    }
    return ids;
}

fs::path ModelRegistry::install_dir(std::string_view model_id) const {
    auto* spec = find(model_id);
    if (!spec || layout_.data_dir.empty()) return {};
    return layout_.data_dir / kModelsDirName / spec->dir;
}

std::optional<fs::path> ModelRegistry::download_source(const LocalModelSpec& spec) const {
    std::vector<fs::path> candidates;
    if (!layout_.model_source_dir.empty()) candidates.push_back(layout_.model_source_dir / spec.dir);
    // Development checkouts keep the unpacked release archives here.
    if (!layout_.dev_dir.empty()) {
        candidates.push_back(layout_.dev_dir / kDevModelsDirName / ("sherpa-onnx-nemo-" + spec.dir));
    }

    for (const auto& dir : candidates) {
        if (is_complete(dir)) return dir;
    }
    return std::nullopt;
}

bool ModelRegistry::is_downloading(std::string_view model_id) const {
    std::lock_guard lock(mutex_);
    return downloading_.find(model_id) != downloading_.end();
}

std::expected<DownloadTask, EngineError> ModelRegistry::start_download(std::string_view model_id) {
    auto* spec = find(model_id);
    if (!spec) {
        return std::unexpected(config_error(std::format("unknown local model: {}", model_id)));
    }
    if (layout_.data_dir.empty()) {
        return std::unexpected(config_error("no user data directory to install models into"));
    }

    auto source = download_source(*spec);
    if (!source) {
        return std::unexpected(config_error(std::format("no download source for {}", spec->id)));
    }

    {
        std::lock_guard lock(mutex_);
        if (!downloading_.insert(spec->id).second) {
            return std::unexpected(config_error(std::format("{} is already downloading", spec->id)));
        }
    }

    DownloadTask task;
    task.model_id = spec->id;
    task.progress = std::make_shared<ProgressChannel<DownloadProgress>>();

    std::promise<std::expected<fs::path, EngineError>> promise;
    task.done = promise.get_future();

    task.worker = std::jthread([this, spec, source = *source, channel = task.progress,
                                promise = std::move(promise)](std::stop_token stop) mutable {
        auto result = copy_model(*spec, source, *channel, stop);
        {
            std::lock_guard lock(mutex_);
            downloading_.erase(spec->id);
        }
        channel->close();
        promise.set_value(std::move(result));
    });

    return task;
}

std::expected<fs::path, EngineError>
ModelRegistry::copy_model(const LocalModelSpec& spec, const fs::path& source,
                          ProgressChannel<DownloadProgress>& progress, std::stop_token stop) {
    auto target = install_dir(spec.id);
    auto staging = target;
    staging += ".partial";

    std::error_code ec;
    fs::remove_all(staging, ec);
    fs::create_directories(staging, ec);
    if (ec) {
        return std::unexpected(fs_error(std::format("cannot create {}: {}", staging.string(), ec.message())));
    }

    std::vector<fs::path> files;
    for (auto& entry : fs::directory_iterator(source, ec)) {
        if (entry.is_regular_file()) files.push_back(entry.path());
    }
    std::sort(files.begin(), files.end());

    auto fail = [&](EngineError err) {
        std::error_code cleanup_ec;
        fs::remove_all(staging, cleanup_ec);
        return std::unexpected(std::move(err));
    };

    for (size_t i = 0; i < files.size(); i++) {
        if (stop.stop_requested()) {
            return fail(config_error(std::format("download of {} cancelled", spec.id)));
        }

        fs::copy_file(files[i], staging / files[i].filename(),
                      fs::copy_options::overwrite_existing, ec);
        if (ec) {
            return fail(fs_error(std::format("copy of {} failed: {}",
                                              files[i].filename().string(), ec.message())));
        }

        progress.push(DownloadProgress{
            .model_id = spec.id,
            .percent = static_cast<int>((i + 1) * 100 / files.size()),
            .files_copied = i + 1,
            .files_total = files.size(),
        });
    }

    fs::remove_all(target, ec);
    fs::rename(staging, target, ec);
    if (ec) {
        return fail(fs_error(std::format("cannot install {}: {}", target.string(), ec.message())));
    }

    if (!is_complete(target)) {
        fs::remove_all(target, ec);
        return std::unexpected(config_error(std::format("{} is incomplete after download", spec.id)));
    }

    std::println(stderr, "models: installed {} at {}", spec.id, target.string());
    return target;
}
