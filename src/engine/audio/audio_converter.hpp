#pragma once

#include "../engine_types.hpp"

#include <chrono>
#include <expected>
#include <string>

// Normalizes captured audio to what the local engine reads:
// mono, 16 kHz, WAV container. Failures are ConversionError.
class AudioConverter {
public:
    static constexpr int kSampleRate = 16000;
    static constexpr int kChannels = 1;

    explicit AudioConverter(std::string ffmpeg_path = "ffmpeg",
                            std::chrono::seconds timeout = std::chrono::seconds(30));

    std::expected<void, EngineError> convert(const std::string& input_path,
                                             const std::string& output_path) const;

private:
    std::string ffmpeg_path_;
    std::chrono::seconds timeout_;
};
