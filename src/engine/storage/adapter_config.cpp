#include "adapter_config.hpp"

#include <cerrno>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <print>
#include <unistd.h>

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace {

std::string string_or_empty(const json& j, const char* key) {
    auto it = j.find(key);
    if (it == j.end() || !it->is_string()) return {};
    return it->get<std::string>();
}

json nullable(const std::string& value) {
    if (value.empty()) return nullptr;
    return value;
}

} // namespace

namespace config_store {

json read_document(const std::string& path) {
    std::ifstream f(path);
    if (!f.is_open()) return json::object();

    try {
        auto j = json::parse(f);
        if (!j.is_object()) {
            std::println(stderr, "config: {} is not a JSON object, using defaults", path);
            return json::object();
        }
        return j;
    } catch (const json::exception& e) {
        std::println(stderr, "config: parse error in {}: {}", path, e.what());
        return json::object();
    }
}

std::expected<void, std::string> write_document(const std::string& path, const json& doc) {
    fs::path target(path);
    std::error_code ec;
    if (target.has_parent_path()) {
        fs::create_directories(target.parent_path(), ec);
        if (ec) {
            return std::unexpected("cannot create " + target.parent_path().string() + ": " + ec.message());
        }
    }

    auto tmp = target;
    tmp += ".tmp" + std::to_string(::getpid());

    {
        std::ofstream out(tmp, std::ios::trunc);
        if (!out.is_open()) {
            return std::unexpected("cannot open " + tmp.string() + ": " + std::strerror(errno));
        }
        out << doc.dump(2) << '\n';
        out.flush();
        if (!out) {
            out.close();
            fs::remove(tmp, ec);
            return std::unexpected("write failed for " + tmp.string());
        }
    }

    fs::rename(tmp, target, ec);
    if (ec) {
        fs::remove(tmp, ec);
        return std::unexpected("rename to " + path + " failed: " + ec.message());
    }
    return {};
}

} // namespace config_store

json RemoteConfig::to_json() const {
    return {
        {"endpointUrl", nullable(endpoint_url)},
        {"apiKey", nullable(api_key)},
        {"selectedModel", selected_model},
        {"language", nullable(language)},
        {"isConfigured", is_configured()},
    };
}

void RemoteConfig::merge(const json& patch) {
    if (patch.contains("endpointUrl")) endpoint_url = string_or_empty(patch, "endpointUrl");
    if (patch.contains("apiKey")) api_key = string_or_empty(patch, "apiKey");
    if (patch.contains("language")) language = string_or_empty(patch, "language");

    auto model = string_or_empty(patch, "selectedModel");
    if (model.empty()) model = string_or_empty(patch, "model");
    if (!model.empty()) selected_model = std::move(model);
}

RemoteConfig RemoteConfig::load(const std::string& path) {
    RemoteConfig cfg;
    auto j = config_store::read_document(path);
    cfg.endpoint_url = string_or_empty(j, "endpointUrl");
    cfg.api_key = string_or_empty(j, "apiKey");
    cfg.language = string_or_empty(j, "language");
    auto model = string_or_empty(j, "selectedModel");
    if (!model.empty()) cfg.selected_model = std::move(model);
    return cfg;
}

std::expected<void, std::string> RemoteConfig::save(const std::string& path) const {
    auto doc = to_json();
    // Derived, not stored.
    doc.erase("isConfigured");
    return config_store::write_document(path, doc);
}

json LocalConfig::to_json() const {
    return {{"activeModelId", nullable(active_model_id)}};
}

LocalConfig LocalConfig::load(const std::string& path) {
    LocalConfig cfg;
    auto j = config_store::read_document(path);
    cfg.active_model_id = string_or_empty(j, "activeModelId");
    return cfg;
}

std::expected<void, std::string> LocalConfig::save(const std::string& path) const {
    return config_store::write_document(path, to_json());
}
