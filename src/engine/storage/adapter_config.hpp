#pragma once

#include "../engine_types.hpp"

#include <expected>
#include <nlohmann/json.hpp>
#include <string>

// Settings of the remote transcription service, persisted as flat JSON.
struct RemoteConfig {
    std::string endpoint_url;
    std::string api_key;
    std::string selected_model = std::string(kDefaultModel);
    std::string language;

    bool is_configured() const { return !endpoint_url.empty(); }

    nlohmann::json to_json() const;

    // Applies only the keys present in `patch`; "model" is accepted as an alias
    // of "selectedModel".
    void merge(const nlohmann::json& patch);

    static RemoteConfig load(const std::string& path);
    std::expected<void, std::string> save(const std::string& path) const;
};

struct LocalConfig {
    std::string active_model_id;

    nlohmann::json to_json() const;

    static LocalConfig load(const std::string& path);
    std::expected<void, std::string> save(const std::string& path) const;
};

namespace config_store {

// Returns an empty object when the file is missing or unparsable.
nlohmann::json read_document(const std::string& path);

// Writes to a sibling temp file and renames it over `path`.
std::expected<void, std::string> write_document(const std::string& path,
                                                const nlohmann::json& doc);

} // namespace config_store
