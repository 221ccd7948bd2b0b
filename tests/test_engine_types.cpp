#include <catch2/catch_test_macros.hpp>

#include "engine_types.hpp"

TEST_CASE("ModelRef", "[types]") {

    SECTION("LocalPrefixRoutesToLocal") {
        auto ref = ModelRef::parse("local-fast");
        REQUIRE(ref.kind == AdapterKind::Local);
        REQUIRE(ref.id == "local-fast");
    }

    SECTION("EverythingElseIsRemote") {
        REQUIRE(ModelRef::parse("gpu-english").kind == AdapterKind::Remote);
        REQUIRE(ModelRef::parse("Systran/faster-whisper-large-v3").kind == AdapterKind::Remote);
        REQUIRE(ModelRef::parse("").kind == AdapterKind::Remote);
        // Prefix must be at the start.
        REQUIRE(ModelRef::parse("my-local-model").kind == AdapterKind::Remote);
        REQUIRE(ModelRef::parse("local").kind == AdapterKind::Remote);
    }
}

TEST_CASE("EngineTypes", "[types]") {

    SECTION("ErrorDescribe") {
        EngineError err{.kind = ErrorKind::Conversion, .message = "ffmpeg not found"};
        REQUIRE(err.describe() == "ConversionError: ffmpeg not found");
        REQUIRE(to_string(ErrorKind::Connectivity) == "ConnectivityError");
        REQUIRE(to_string(ErrorKind::Subprocess) == "SubprocessError");
    }

    SECTION("AdapterNames") {
        REQUIRE(to_string(AdapterKind::Remote) == "remote");
        REQUIRE(to_string(AdapterKind::Local) == "local-sidecar");
    }

    SECTION("ModelDescriptorJson") {
        ModelDescriptor m{
            .id = "local-fast", .label = "Fast", .group = "local",
            .state = ModelState::Download, .detail = "126 MB", .owner = AdapterKind::Local,
        };
        auto j = to_json(m);
        REQUIRE(j["id"] == "local-fast");
        REQUIRE(j["state"] == "download");
        REQUIRE(j["detail"] == "126 MB");

        m.detail.clear();
        REQUIRE_FALSE(to_json(m).contains("detail"));
    }

    SECTION("ResultJsonCarriesErrorKind") {
        TranscriptionResult ok{.success = true, .text = "hi", .engine = "remote (gpu-english)"};
        auto j = to_json(ok);
        REQUIRE(j["success"] == true);
        REQUIRE_FALSE(j.contains("error"));

        TranscriptionResult failed{
            .success = false,
            .error = EngineError{.kind = ErrorKind::Subprocess, .message = "exit 1"},
        };
        j = to_json(failed);
        REQUIRE(j["success"] == false);
        REQUIRE(j["text"] == "");
        REQUIRE(j["errorKind"] == "SubprocessError");
        REQUIRE(j["error"] == "SubprocessError: exit 1");
    }
}
