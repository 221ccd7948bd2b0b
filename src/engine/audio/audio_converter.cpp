#include "audio_converter.hpp"

#include "../process/managed_process.hpp"

#include <cerrno>
#include <filesystem>
#include <format>

namespace fs = std::filesystem;

namespace {

EngineError conversion_error(std::string message) {
    return EngineError{.kind = ErrorKind::Conversion, .message = std::move(message)};
}

std::string last_line(const std::string& text) {
    auto end = text.find_last_not_of(" \t\r\n");
    if (end == std::string::npos) return {};
    auto nl = text.find_last_of('\n', end);
    size_t start = nl == std::string::npos ? 0 : nl + 1;
    return text.substr(start, end - start + 1);
}

} // namespace

AudioConverter::AudioConverter(std::string ffmpeg_path, std::chrono::seconds timeout)
    : ffmpeg_path_(std::move(ffmpeg_path)), timeout_(timeout) {}

std::expected<void, EngineError> AudioConverter::convert(const std::string& input_path,
                                                         const std::string& output_path) const {
    ProcessOptions opts{
        .argv = {ffmpeg_path_, "-hide_banner", "-loglevel", "error",
                 "-y", "-i", input_path,
                 "-ac", std::to_string(kChannels),
                 "-ar", std::to_string(kSampleRate),
                 "-f", "wav", output_path},
        .timeout = timeout_,
    };

    auto result = ManagedProcess::run(std::move(opts));
    if (!result) {
        const auto& err = result.error();
        if (err.kind == ProcessError::Kind::Spawn && err.code == ENOENT) {
            return std::unexpected(conversion_error("conversion tool not found: " + ffmpeg_path_));
        }
        return std::unexpected(conversion_error(err.message));
    }

    if (result->exit_code != 0) {
        auto detail = last_line(result->err);
        return std::unexpected(conversion_error(
            std::format("{} exited with code {}{}", ffmpeg_path_, result->exit_code,
                        detail.empty() ? "" : ": " + detail)));
    }

    std::error_code ec;
    if (!fs::exists(output_path, ec) || fs::file_size(output_path, ec) == 0) {
        return std::unexpected(conversion_error("conversion produced no output at " + output_path));
    }
    return {};
}
