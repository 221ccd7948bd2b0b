#pragma once

#include <string>

struct Config {
    struct Remote {
        long health_timeout_ms = 3000;
        long transcribe_timeout_s = 120;
        long switch_timeout_s = 60;
    } remote;

    struct Local {
        std::string binary_name = "sherpa-onnx-offline";
        int num_threads = 4;
        int timeout_s = 120;
        // Empty means "derive from the platform data dir / executable location".
        std::string resource_dir;
        std::string dev_dir;
        std::string model_source_dir;
    } local;

    struct Conversion {
        std::string ffmpeg_path = "ffmpeg";
        int timeout_s = 30;
    } conversion;

    struct Temp {
        std::string dir; // empty: system temp directory
        std::string prefix = "echo-engine-audio-";
        int orphan_age_s = 300;
    } temp;

    struct History {
        bool enabled = true;
    } history;

    static Config load(const std::string& path);
    static Config load_default();
};
