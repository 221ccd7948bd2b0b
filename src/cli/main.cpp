#include "adapters/local_sidecar_adapter.hpp"
#include "adapters/remote_adapter.hpp"
#include "config.hpp"
#include "engine_manager.hpp"
#include "platform/platform_paths.hpp"

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <nlohmann/json.hpp>
#include <print>
#include <string>
#include <vector>

namespace fs = std::filesystem;
using json = nlohmann::json;

static void usage(const char* prog) {
    std::println(stderr, "Usage: {} [options] <command> [args]", prog);
    std::println(stderr, "Commands:");
    std::println(stderr, "  status                               Show active engine and health");
    std::println(stderr, "  models                               List remote and local models");
    std::println(stderr, "  switch <model-id>                    Select a model (local-* ids are local)");
    std::println(stderr, "  transcribe <file> [--language L] [--model M]");
    std::println(stderr, "                                       Transcribe an audio file");
    std::println(stderr, "  configure remote|local [key=value..] Show or update engine settings");
    std::println(stderr, "  test-connection                      Probe the active engine");
    std::println(stderr, "  download <model-id>                  Install a local model and select it");
    std::println(stderr, "  history [--limit N]                  Show transcription history");
    std::println(stderr, "Options:");
    std::println(stderr, "  -v, --verbose       Enable verbose logging");
    std::println(stderr, "  -c, --config PATH   Config file path");
    std::println(stderr, "  -h, --help          Show this help");
}

static LocalLayout make_layout(const Config& config, const fs::path& data) {
    fs::path exe_dir = platform::executable_dir();

    LocalLayout layout;
    layout.data_dir = data;
    layout.resource_dir = !config.local.resource_dir.empty()
        ? fs::path(config.local.resource_dir)
        : exe_dir.empty() ? fs::path{} : (exe_dir / ".." / "share" / "echo-engine").lexically_normal();
    layout.dev_dir = !config.local.dev_dir.empty() ? fs::path(config.local.dev_dir) : exe_dir;
    layout.model_source_dir = !config.local.model_source_dir.empty()
        ? fs::path(config.local.model_source_dir)
        : layout.resource_dir.empty() ? fs::path{} : layout.resource_dir / "model-archive";
    layout.binary_name = config.local.binary_name;
    return layout;
}

static std::unique_ptr<EngineManager> make_manager(const Config& config, bool verbose) {
    fs::path data = platform::data_dir();
    if (data.empty()) data = "/tmp/echo-engine";

    auto remote = std::make_unique<RemoteAdapter>(
        (data / "remote-engine.json").string(),
        RemoteAdapter::Timeouts{
            .health_ms = config.remote.health_timeout_ms,
            .transcribe_s = config.remote.transcribe_timeout_s,
            .switch_s = config.remote.switch_timeout_s,
        });

    auto local = std::make_unique<LocalSidecarAdapter>(
        make_layout(config, data), (data / "local-engine.json").string(),
        config.local.num_threads, std::chrono::seconds(config.local.timeout_s));

    std::unique_ptr<HistoryDb> history;
    if (config.history.enabled) {
        history = std::make_unique<HistoryDb>();
        if (!history->open((data / "history.db").string())) {
            std::println(stderr, "Warning: history DB failed to open, history disabled");
            history.reset();
        }
    }

    return std::make_unique<EngineManager>(
        std::move(remote), std::move(local),
        AudioConverter(config.conversion.ffmpeg_path, std::chrono::seconds(config.conversion.timeout_s)),
        TempFileManager(config.temp.dir, config.temp.prefix),
        std::move(history), verbose, std::chrono::seconds(config.temp.orphan_age_s));
}

static const char* state_marker(ModelState state) {
    switch (state) {
        case ModelState::Loaded: return "*";
        case ModelState::Switching: return "~";
        case ModelState::Downloading: return "v";
        case ModelState::Download: return "-";
        case ModelState::Available: return " ";
    }
    return " ";
}

static int print_error(const EngineError& err) {
    std::println(stderr, "Error: {}", err.describe());
    return 1;
}

int main(int argc, char* argv[]) {
    bool verbose = false;
    std::string config_path;
    std::string language;
    std::string model;
    int limit = 10;
    std::vector<std::string> positional;

    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        if (arg == "--verbose" || arg == "-v") {
            verbose = true;
        } else if ((arg == "--config" || arg == "-c") && i + 1 < argc) {
            config_path = argv[++i];
        } else if (arg == "--language" && i + 1 < argc) {
            language = argv[++i];
        } else if (arg == "--model" && i + 1 < argc) {
            model = argv[++i];
        } else if (arg == "--limit" && i + 1 < argc) {
            limit = std::atoi(argv[++i]);
        } else if (arg == "--help" || arg == "-h") {
            usage(argv[0]);
            return 0;
        } else {
            positional.push_back(arg);
        }
    }

    if (positional.empty()) {
        usage(argv[0]);
        return 1;
    }

    const std::string& command = positional[0];
    auto arg_at = [&](size_t idx) -> std::string {
        return idx < positional.size() ? positional[idx] : std::string{};
    };

    Config config = config_path.empty() ? Config::load_default() : Config::load(config_path);
    auto manager = make_manager(config, verbose);
    auto init = manager->initialize();
    if (verbose) {
        std::println(stderr, "[echo-engine] Started ({})", to_json(init).dump());
    }

    if (command == "status") {
        auto status = manager->status();
        std::println("Engine: {} ({})", to_string(status.adapter), status.active_model);
        std::println("Available: {}", status.available ? "yes" : "no");
        std::println("Health: {}", status.health.state);
        if (!status.health.error.empty()) {
            std::println("Error: {}", status.health.error);
        }
        if (verbose) std::println("{}", to_json(status).dump(2));
    } else if (command == "models") {
        for (const auto& m : manager->list_models()) {
            std::println("{} {:<20} {:<12} {:<6} {}", state_marker(m.state), m.id, m.label, m.group, m.detail);
        }
    } else if (command == "switch") {
        auto id = arg_at(1);
        if (id.empty()) {
            usage(argv[0]);
            return 1;
        }
        if (auto res = manager->switch_model(id); !res) return print_error(res.error());
        std::println("Active model: {} ({})", manager->active_model(), to_string(manager->active_kind()));
    } else if (command == "transcribe") {
        auto path = arg_at(1);
        std::ifstream f(path, std::ios::binary);
        if (path.empty() || !f.is_open()) {
            std::println(stderr, "Cannot read audio file: {}", path);
            return 1;
        }
        std::vector<uint8_t> audio((std::istreambuf_iterator<char>(f)), std::istreambuf_iterator<char>());

        TranscriptionResult result;
        try {
            result = manager->process_audio(audio, {.model = model, .language = language});
        } catch (const FilesystemError& e) {
            std::println(stderr, "Error: {}", e.what());
            return 1;
        }

        if (!result.success) {
            return print_error(*result.error);
        }
        std::println("{}", result.text);
        if (verbose) {
            std::println(stderr, "[echo-engine] {} / {} / {:.0f}ms", result.engine, result.model, result.processing_ms);
        }
    } else if (command == "configure") {
        auto target = arg_at(1);
        if (target != "remote" && target != "local") {
            usage(argv[0]);
            return 1;
        }
        auto kind = target == "local" ? AdapterKind::Local : AdapterKind::Remote;

        json patch = json::object();
        for (size_t i = 2; i < positional.size(); i++) {
            auto eq = positional[i].find('=');
            if (eq == std::string::npos) {
                std::println(stderr, "Expected key=value, got: {}", positional[i]);
                return 1;
            }
            patch[positional[i].substr(0, eq)] = positional[i].substr(eq + 1);
        }

        if (!patch.empty()) {
            if (auto res = manager->configure(kind, patch); !res) return print_error(res.error());
        }
        std::println("{}", manager->config(kind).dump(2));
    } else if (command == "test-connection") {
        auto health = manager->test_connection();
        if (!health) return print_error(health.error());
        std::println("OK: {} is {}", to_string(manager->active_kind()), health->state);
        if (verbose) std::println("{}", to_json(*health).dump(2));
    } else if (command == "download") {
        auto id = arg_at(1);
        if (id.empty()) {
            usage(argv[0]);
            return 1;
        }
        auto res = manager->download_model(id, [](const DownloadProgress& p) {
            std::println(stderr, "{}: {}% ({}/{} files)", p.model_id, p.percent, p.files_copied, p.files_total);
        });
        if (!res) return print_error(res.error());
        std::println("Installed and selected {}", id);
    } else if (command == "history") {
        for (const auto& e : manager->history(limit)) {
            if (e.success) {
                std::println("[{}] {}", e.timestamp, e.text);
            } else {
                std::println("[{}] (failed) {}", e.timestamp, e.error);
            }
            if (!e.engine.empty()) {
                std::println("  Engine: {} / {}", e.engine, e.model);
            }
        }
    } else {
        std::println(stderr, "Unknown command: {}", command);
        usage(argv[0]);
        return 1;
    }

    return 0;
}
