#include <catch2/catch_test_macros.hpp>

#include "storage/adapter_config.hpp"
#include "test_helpers.hpp"

#include <filesystem>

using json = nlohmann::json;

TEST_CASE("RemoteConfig", "[config-store]") {
    test::TmpDir dir;
    auto path = (dir / "remote-engine.json").string();

    SECTION("Defaults") {
        auto cfg = RemoteConfig::load(path);
        REQUIRE(cfg.endpoint_url.empty());
        REQUIRE(cfg.selected_model == "gpu-english");
        REQUIRE_FALSE(cfg.is_configured());

        auto j = cfg.to_json();
        REQUIRE(j["endpointUrl"].is_null());
        REQUIRE(j["apiKey"].is_null());
        REQUIRE(j["isConfigured"] == false);
    }

    SECTION("SaveAndReload") {
        RemoteConfig cfg;
        cfg.merge({{"endpointUrl", "http://gpu.lan:8000"}, {"apiKey", "sk-test"},
                   {"selectedModel", "gpu-multilingual"}, {"language", "de"}});
        REQUIRE(cfg.is_configured());
        REQUIRE(cfg.save(path));

        auto loaded = RemoteConfig::load(path);
        REQUIRE(loaded.endpoint_url == "http://gpu.lan:8000");
        REQUIRE(loaded.api_key == "sk-test");
        REQUIRE(loaded.selected_model == "gpu-multilingual");
        REQUIRE(loaded.language == "de");
        REQUIRE(loaded.is_configured());

        // Derived flag is not stored.
        auto raw = json::parse(test::read_file(path));
        REQUIRE_FALSE(raw.contains("isConfigured"));
    }

    SECTION("MergeAppliesOnlyPresentKeys") {
        RemoteConfig cfg;
        cfg.endpoint_url = "http://a";
        cfg.api_key = "k";
        cfg.merge({{"model", "gpu-large"}});
        REQUIRE(cfg.endpoint_url == "http://a");
        REQUIRE(cfg.api_key == "k");
        REQUIRE(cfg.selected_model == "gpu-large");

        cfg.merge({{"endpointUrl", ""}});
        REQUIRE_FALSE(cfg.is_configured());
    }

    SECTION("CorruptFileFallsBackToDefaults") {
        test::write_file(path, "{ not json");
        auto cfg = RemoteConfig::load(path);
        REQUIRE_FALSE(cfg.is_configured());
        REQUIRE(cfg.selected_model == "gpu-english");
    }

    SECTION("NonObjectFallsBackToDefaults") {
        test::write_file(path, "[1, 2, 3]");
        auto cfg = RemoteConfig::load(path);
        REQUIRE_FALSE(cfg.is_configured());
    }

    SECTION("AtomicSaveLeavesNoTempFile") {
        RemoteConfig cfg;
        cfg.endpoint_url = "http://x";
        REQUIRE(cfg.save(path));
        cfg.endpoint_url = "http://y";
        REQUIRE(cfg.save(path));

        REQUIRE(test::count_files(dir.path) == 1);
        REQUIRE(RemoteConfig::load(path).endpoint_url == "http://y");
    }

    SECTION("SaveCreatesParentDirectories") {
        auto nested = (dir / "a" / "b" / "remote-engine.json").string();
        RemoteConfig cfg;
        REQUIRE(cfg.save(nested));
        REQUIRE(std::filesystem::exists(nested));
    }

    SECTION("SaveFailsWhenParentIsAFile") {
        test::write_file(dir / "blocker", "x");
        RemoteConfig cfg;
        auto res = cfg.save((dir / "blocker" / "remote-engine.json").string());
        REQUIRE_FALSE(res);
        REQUIRE_FALSE(res.error().empty());
    }
}

TEST_CASE("LocalConfig", "[config-store]") {
    test::TmpDir dir;
    auto path = (dir / "local-engine.json").string();

    SECTION("Defaults") {
        auto cfg = LocalConfig::load(path);
        REQUIRE(cfg.active_model_id.empty());
        REQUIRE(cfg.to_json()["activeModelId"].is_null());
    }

    SECTION("SaveAndReload") {
        LocalConfig cfg{.active_model_id = "local-balanced"};
        REQUIRE(cfg.save(path));
        REQUIRE(LocalConfig::load(path).active_model_id == "local-balanced");
    }
}
