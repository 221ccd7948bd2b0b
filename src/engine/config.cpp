#include "config.hpp"

#include "platform/platform_paths.hpp"

#include <filesystem>
#include <fstream>
#include <nlohmann/json.hpp>
#include <print>

namespace fs = std::filesystem;
using json = nlohmann::json;

Config Config::load(const std::string& path) {
    Config cfg;
    std::ifstream f(path);
    if (!f.is_open()) {
        std::println(stderr, "config: could not open {}, using defaults", path);
        return cfg;
    }

    try {
        auto j = json::parse(f);

        if (j.contains("remote")) {
            auto& r = j["remote"];
            if (r.contains("health_timeout_ms")) cfg.remote.health_timeout_ms = r["health_timeout_ms"].get<long>();
            if (r.contains("transcribe_timeout_s")) cfg.remote.transcribe_timeout_s = r["transcribe_timeout_s"].get<long>();
            if (r.contains("switch_timeout_s")) cfg.remote.switch_timeout_s = r["switch_timeout_s"].get<long>();
        }

        if (j.contains("local")) {
            auto& l = j["local"];
            if (l.contains("binary_name")) cfg.local.binary_name = l["binary_name"].get<std::string>();
            if (l.contains("num_threads")) cfg.local.num_threads = l["num_threads"].get<int>();
            if (l.contains("timeout_s")) cfg.local.timeout_s = l["timeout_s"].get<int>();
            if (l.contains("resource_dir")) cfg.local.resource_dir = l["resource_dir"].get<std::string>();
            if (l.contains("dev_dir")) cfg.local.dev_dir = l["dev_dir"].get<std::string>();
            if (l.contains("model_source_dir")) cfg.local.model_source_dir = l["model_source_dir"].get<std::string>();
        }

        if (j.contains("conversion")) {
            auto& c = j["conversion"];
            if (c.contains("ffmpeg_path")) cfg.conversion.ffmpeg_path = c["ffmpeg_path"].get<std::string>();
            if (c.contains("timeout_s")) cfg.conversion.timeout_s = c["timeout_s"].get<int>();
        }

        if (j.contains("temp")) {
            auto& t = j["temp"];
            if (t.contains("dir")) cfg.temp.dir = t["dir"].get<std::string>();
            if (t.contains("prefix")) cfg.temp.prefix = t["prefix"].get<std::string>();
            if (t.contains("orphan_age_s")) cfg.temp.orphan_age_s = t["orphan_age_s"].get<int>();
        }

        if (j.contains("history")) {
            auto& h = j["history"];
            if (h.contains("enabled")) cfg.history.enabled = h["enabled"].get<bool>();
        }

    } catch (const json::exception& e) {
        std::println(stderr, "config: parse error: {}", e.what());
    }

    return cfg;
}

Config Config::load_default() {
    auto dir = platform::config_dir();
    if (dir.empty()) return Config{};

    auto config_path = fs::path(dir) / "config.json";
    if (fs::exists(config_path)) {
        return load(config_path.string());
    }
    return Config{};
}
