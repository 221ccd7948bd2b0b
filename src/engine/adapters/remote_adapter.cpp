#include "remote_adapter.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <chrono>
#include <curl/curl.h>
#include <format>
#include <print>
#include <utility>

using json = nlohmann::json;

namespace {

constexpr const char* kUserAgent = "echo-engine/1.0";

const std::array<std::pair<const char*, const char*>, 22> kLanguageNames = {{
    {"english", "en"}, {"spanish", "es"}, {"french", "fr"}, {"german", "de"},
    {"chinese", "zh"}, {"japanese", "ja"}, {"italian", "it"}, {"portuguese", "pt"},
    {"russian", "ru"}, {"korean", "ko"}, {"dutch", "nl"}, {"polish", "pl"},
    {"arabic", "ar"}, {"hindi", "hi"}, {"turkish", "tr"}, {"vietnamese", "vi"},
    {"thai", "th"}, {"indonesian", "id"}, {"swedish", "sv"}, {"danish", "da"},
    {"norwegian", "no"}, {"finnish", "fi"},
}};

size_t write_callback(char* ptr, size_t size, size_t nmemb, void* userdata) {
    auto* resp = static_cast<std::string*>(userdata);
    resp->append(ptr, size * nmemb);
    return size * nmemb;
}

std::string describe_curl_error(CURLcode code) {
    switch (code) {
        case CURLE_OPERATION_TIMEDOUT:
            return "timeout";
        case CURLE_COULDNT_CONNECT:
            return "connection refused - server may be offline";
        case CURLE_COULDNT_RESOLVE_HOST:
            return "server not found - check the URL";
        default:
            return std::string("curl error: ") + curl_easy_strerror(code);
    }
}

bool is_success(long status) {
    return status >= 200 && status < 300;
}

std::string trim(const std::string& s) {
    auto start = s.find_first_not_of(" \t\n\r");
    if (start == std::string::npos) return {};
    auto end = s.find_last_not_of(" \t\n\r");
    return s.substr(start, end - start + 1);
}

std::string first_string(const json& j, std::initializer_list<const char*> keys) {
    for (const char* key : keys) {
        auto it = j.find(key);
        if (it != j.end() && it->is_string() && !it->get<std::string>().empty()) {
            return it->get<std::string>();
        }
    }
    return {};
}

EngineError connectivity(std::string message) {
    return EngineError{.kind = ErrorKind::Connectivity, .message = std::move(message)};
}

EngineError http_error(long status, const std::string& body) {
    std::string detail;
    try {
        auto j = json::parse(body);
        if (j.is_object()) detail = first_string(j, {"error", "detail", "message"});
    } catch (const json::exception&) {
        detail = trim(body);
    }

    auto kind = (status == 401 || status == 403) ? ErrorKind::Configuration : ErrorKind::Connectivity;
    return EngineError{
        .kind = kind,
        .message = std::format("HTTP {}{}", status, detail.empty() ? "" : " - " + detail),
    };
}

} // namespace

RemoteAdapter::RemoteAdapter(std::string config_path, Timeouts timeouts)
    : config_path_(std::move(config_path)),
      config_(RemoteConfig::load(config_path_)),
      timeouts_(timeouts) {
    curl_global_init(CURL_GLOBAL_DEFAULT);
}

RemoteAdapter::~RemoteAdapter() {
    curl_global_cleanup();
}

std::string RemoteAdapter::base_url() const {
    std::string url = config_.endpoint_url;
    constexpr std::string_view suffix = "/v1/audio/transcriptions";
    while (!url.empty() && url.back() == '/') url.pop_back();
    if (url.ends_with(suffix)) url.erase(url.size() - suffix.size());
    while (!url.empty() && url.back() == '/') url.pop_back();
    return url;
}

std::string RemoteAdapter::normalize_language(const std::string& language) {
    std::string lower = language;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    for (const auto& [name, code] : kLanguageNames) {
        if (lower == name) return code;
    }
    return lower;
}

std::expected<RemoteAdapter::HttpResponse, EngineError>
RemoteAdapter::perform(const HttpRequest& req) const {
    CURL* curl = curl_easy_init();
    if (!curl) {
        return std::unexpected(connectivity("curl_easy_init failed"));
    }

    std::string url = base_url() + req.path;
    std::string response_body;

    curl_slist* headers = nullptr;
    headers = curl_slist_append(headers, "Accept: application/json");
    if (!config_.api_key.empty()) {
        auto auth = "Authorization: Bearer " + config_.api_key;
        headers = curl_slist_append(headers, auth.c_str());
    }

    curl_mime* mime = nullptr;
    if (req.method == Method::PostForm) {
        mime = curl_mime_init(curl);
        curl_mimepart* part;

        part = curl_mime_addpart(mime);
        curl_mime_name(part, "file");
        curl_mime_filedata(part, req.audio_path.c_str());
        curl_mime_filename(part, "recording.webm");
        curl_mime_type(part, "audio/webm");

        part = curl_mime_addpart(mime);
        curl_mime_name(part, "model");
        curl_mime_data(part, req.model.c_str(), CURL_ZERO_TERMINATED);

        part = curl_mime_addpart(mime);
        curl_mime_name(part, "language");
        curl_mime_data(part, req.language.c_str(), CURL_ZERO_TERMINATED);

        part = curl_mime_addpart(mime);
        curl_mime_name(part, "response_format");
        curl_mime_data(part, "verbose_json", CURL_ZERO_TERMINATED);

        curl_easy_setopt(curl, CURLOPT_MIMEPOST, mime);
    } else if (req.method == Method::PostJson) {
        headers = curl_slist_append(headers, "Content-Type: application/json");
        curl_easy_setopt(curl, CURLOPT_POSTFIELDS, req.json_body.c_str());
        curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE, static_cast<long>(req.json_body.size()));
    }

    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers);
    curl_easy_setopt(curl, CURLOPT_USERAGENT, kUserAgent);
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response_body);
    curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, req.timeout_ms);
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT_MS, std::min(req.timeout_ms, 10000L));
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);

    CURLcode res = curl_easy_perform(curl);

    long status = 0;
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &status);

    if (mime) curl_mime_free(mime);
    curl_slist_free_all(headers);
    curl_easy_cleanup(curl);

    if (res != CURLE_OK) {
        return std::unexpected(connectivity(describe_curl_error(res)));
    }

    return HttpResponse{.status = status, .body = std::move(response_body)};
}

std::expected<TranscriptionResult, EngineError>
RemoteAdapter::transcribe(const std::string& audio_path, const TranscribeOptions& options) {
    if (!config_.is_configured()) {
        return std::unexpected(EngineError{
            .kind = ErrorKind::Configuration,
            .message = "remote endpoint not configured",
        });
    }

    std::string model = options.model.empty() ? config_.selected_model : options.model;
    std::string language = !options.language.empty() ? options.language
                         : !config_.language.empty() ? config_.language
                         : "en";

    auto start = std::chrono::steady_clock::now();

    auto resp = perform({
        .method = Method::PostForm,
        .path = "/v1/audio/transcriptions",
        .timeout_ms = timeouts_.transcribe_s * 1000,
        .audio_path = audio_path,
        .model = model,
        .language = language,
    });

    double processing_ms = std::chrono::duration<double, std::milli>(
        std::chrono::steady_clock::now() - start).count();

    if (!resp) {
        auto err = resp.error();
        err.message = "remote transcription failed: " + err.message;
        return std::unexpected(std::move(err));
    }
    if (!is_success(resp->status)) {
        return std::unexpected(http_error(resp->status, resp->body));
    }

    try {
        auto j = json::parse(resp->body);
        if (!j.is_object()) {
            return std::unexpected(connectivity("unexpected response: " + resp->body));
        }

        std::string text = first_string(j, {"text", "transcription"});
        std::string detected = first_string(j, {"language", "detected_language", "lang", "detected_lang"});

        auto slash = model.find_last_of('/');
        std::string model_tail = slash == std::string::npos ? model : model.substr(slash + 1);

        return TranscriptionResult{
            .success = true,
            .text = trim(text),
            .processing_ms = processing_ms,
            .engine = std::format("remote ({})", model_tail),
            .model = model,
            .language = detected.empty() ? language : normalize_language(detected),
        };
    } catch (const json::exception& e) {
        return std::unexpected(connectivity(std::string("JSON parse error: ") + e.what()));
    }
}

Availability RemoteAdapter::is_available() {
    if (!config_.is_configured()) {
        return {.available = false, .error = "no endpoint configured"};
    }

    auto resp = perform({.method = Method::Get, .path = "/health", .timeout_ms = timeouts_.health_ms});
    if (!resp) {
        return {.available = false, .error = resp.error().message};
    }
    if (is_success(resp->status)) {
        return {.available = true, .error = {}};
    }
    if (resp->status == 401 || resp->status == 403) {
        return {.available = false, .error = "invalid API key"};
    }
    return {.available = false, .error = std::format("server returned HTTP {}", resp->status)};
}

AdapterHealth RemoteAdapter::health() {
    AdapterHealth h;
    h.state = "unavailable";

    if (!config_.is_configured()) {
        h.error = "no endpoint configured";
        return h;
    }

    auto resp = perform({.method = Method::Get, .path = "/health", .timeout_ms = timeouts_.health_ms});
    if (!resp) {
        h.error = resp.error().message;
        return h;
    }
    if (!is_success(resp->status)) {
        h.state = "error";
        h.error = std::format("server returned HTTP {}", resp->status);
        return h;
    }

    try {
        auto j = json::parse(resp->body);
        json engine = j.is_object() ? j.value("engine", json::object()) : json::object();
        h.state = engine.value("state", "") == "loaded" ? "loaded" : "degraded";
        if (engine.contains("model_id") && engine["model_id"].is_string()) {
            h.active_model = engine["model_id"].get<std::string>();
        }
        h.extra["server"] = j;
    } catch (const json::exception& e) {
        h.state = "error";
        h.error = std::string("JSON parse error: ") + e.what();
        return h;
    }

    // Supplementary; health stands without it.
    auto models = perform({.method = Method::Get, .path = "/v1/models", .timeout_ms = timeouts_.health_ms});
    if (models && is_success(models->status)) {
        try {
            auto j = json::parse(models->body);
            h.extra["modelCount"] = j.value("data", json::array()).size();
        } catch (const json::exception&) {
        }
    }
    return h;
}

std::expected<void, EngineError> RemoteAdapter::switch_model(const std::string& model_id) {
    if (!config_.is_configured()) {
        return std::unexpected(EngineError{
            .kind = ErrorKind::Configuration,
            .message = "remote endpoint not configured",
        });
    }

    {
        std::lock_guard lock(switch_mutex_);
        switching_model_ = model_id;
    }

    auto resp = perform({
        .method = Method::PostJson,
        .path = "/v1/models/switch",
        .timeout_ms = timeouts_.switch_s * 1000,
        .json_body = json{{"model_id", model_id}}.dump(),
    });

    {
        std::lock_guard lock(switch_mutex_);
        switching_model_.clear();
    }

    if (!resp) {
        auto err = resp.error();
        err.message = "model switch failed: " + err.message;
        return std::unexpected(std::move(err));
    }
    if (!is_success(resp->status)) {
        std::string detail;
        try {
            detail = first_string(json::parse(resp->body), {"error"});
        } catch (const json::exception&) {
        }
        auto kind = resp->status == 404 ? ErrorKind::Configuration : ErrorKind::Connectivity;
        return std::unexpected(EngineError{
            .kind = kind,
            .message = detail.empty() ? std::format("model switch failed: HTTP {}", resp->status) : detail,
        });
    }

    config_.selected_model = model_id;
    if (auto saved = config_.save(config_path_); !saved) {
        std::println(stderr, "remote: failed to save config: {}", saved.error());
    }
    return {};
}

std::vector<ModelDescriptor> RemoteAdapter::list_models() {
    if (!config_.is_configured()) return {};

    auto resp = perform({.method = Method::Get, .path = "/v1/models", .timeout_ms = timeouts_.health_ms});
    if (!resp || !is_success(resp->status)) return {};

    std::string switching;
    {
        std::lock_guard lock(switch_mutex_);
        switching = switching_model_;
    }

    std::vector<ModelDescriptor> out;
    try {
        auto j = json::parse(resp->body);
        for (const auto& m : j.value("data", json::array())) {
            if (!m.is_object() || !m.contains("id")) continue;

            ModelDescriptor d;
            d.id = m["id"].get<std::string>();
            d.label = first_string(m, {"label"});
            if (d.label.empty()) d.label = d.id;
            d.group = first_string(m, {"group"});
            if (d.group.empty()) d.group = "gpu";
            d.detail = first_string(m, {"detail"});
            d.owner = AdapterKind::Remote;

            if (d.id == switching) {
                d.state = ModelState::Switching;
            } else {
                d.state = m.value("active", false) ? ModelState::Loaded : ModelState::Available;
            }
            out.push_back(std::move(d));
        }
    } catch (const json::exception& e) {
        std::println(stderr, "remote: bad model list: {}", e.what());
        return {};
    }
    return out;
}

json RemoteAdapter::config() const {
    return config_.to_json();
}

std::expected<void, EngineError> RemoteAdapter::configure(const json& patch) {
    config_.merge(patch);
    if (auto saved = config_.save(config_path_); !saved) {
        std::println(stderr, "remote: failed to save config: {}", saved.error());
        return std::unexpected(EngineError{.kind = ErrorKind::Filesystem, .message = saved.error()});
    }
    return {};
}

std::optional<std::string> RemoteAdapter::persisted_selection() const {
    if (!config_.is_configured()) return std::nullopt;
    return config_.selected_model;
}
