#include <catch2/catch_test_macros.hpp>

#include "config.hpp"
#include "test_helpers.hpp"

#include <string>

TEST_CASE("Config", "[config]") {
    test::TmpDir dir;

    SECTION("DefaultValues") {
        Config cfg;
        REQUIRE(cfg.remote.health_timeout_ms == 3000);
        REQUIRE(cfg.remote.transcribe_timeout_s == 120);
        REQUIRE(cfg.remote.switch_timeout_s == 60);
        REQUIRE(cfg.local.binary_name == "sherpa-onnx-offline");
        REQUIRE(cfg.local.num_threads == 4);
        REQUIRE(cfg.local.timeout_s == 120);
        REQUIRE(cfg.conversion.ffmpeg_path == "ffmpeg");
        REQUIRE(cfg.conversion.timeout_s == 30);
        REQUIRE(cfg.temp.prefix == "echo-engine-audio-");
        REQUIRE(cfg.temp.orphan_age_s == 300);
        REQUIRE(cfg.history.enabled);
    }

    SECTION("LoadFullConfig") {
        auto path = dir / "config.json";
        test::write_file(path, R"({
            "remote": { "health_timeout_ms": 500, "transcribe_timeout_s": 30, "switch_timeout_s": 10 },
            "local": {
                "binary_name": "sherpa",
                "num_threads": 2,
                "timeout_s": 15,
                "resource_dir": "/opt/echo/resources",
                "dev_dir": "/src/echo",
                "model_source_dir": "/mnt/models"
            },
            "conversion": { "ffmpeg_path": "/usr/local/bin/ffmpeg", "timeout_s": 5 },
            "temp": { "dir": "/var/tmp", "prefix": "x-", "orphan_age_s": 60 },
            "history": { "enabled": false }
        })");

        auto cfg = Config::load(path.string());
        REQUIRE(cfg.remote.health_timeout_ms == 500);
        REQUIRE(cfg.remote.transcribe_timeout_s == 30);
        REQUIRE(cfg.remote.switch_timeout_s == 10);
        REQUIRE(cfg.local.binary_name == "sherpa");
        REQUIRE(cfg.local.num_threads == 2);
        REQUIRE(cfg.local.timeout_s == 15);
        REQUIRE(cfg.local.resource_dir == "/opt/echo/resources");
        REQUIRE(cfg.local.dev_dir == "/src/echo");
        REQUIRE(cfg.local.model_source_dir == "/mnt/models");
        REQUIRE(cfg.conversion.ffmpeg_path == "/usr/local/bin/ffmpeg");
        REQUIRE(cfg.conversion.timeout_s == 5);
        REQUIRE(cfg.temp.dir == "/var/tmp");
        REQUIRE(cfg.temp.prefix == "x-");
        REQUIRE(cfg.temp.orphan_age_s == 60);
        REQUIRE_FALSE(cfg.history.enabled);
    }

    SECTION("LoadPartialConfig") {
        auto path = dir / "config.json";
        test::write_file(path, R"({ "local": { "num_threads": 8 } })");

        auto cfg = Config::load(path.string());
        REQUIRE(cfg.local.num_threads == 8);
        // Other fields retain defaults
        REQUIRE(cfg.local.binary_name == "sherpa-onnx-offline");
        REQUIRE(cfg.remote.health_timeout_ms == 3000);
        REQUIRE(cfg.conversion.ffmpeg_path == "ffmpeg");
    }

    SECTION("LoadInvalidJson") {
        auto path = dir / "config.json";
        test::write_file(path, "not json {{{");

        auto cfg = Config::load(path.string());
        REQUIRE(cfg.local.num_threads == 4);
        REQUIRE(cfg.temp.orphan_age_s == 300);
    }

    SECTION("LoadMissingFile") {
        auto cfg = Config::load((dir / "nope.json").string());
        REQUIRE(cfg.remote.switch_timeout_s == 60);
    }
}
