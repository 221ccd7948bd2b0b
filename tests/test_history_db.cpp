#include <catch2/catch_test_macros.hpp>

#include "storage/history_db.hpp"
#include "test_helpers.hpp"

#include <filesystem>
#include <string>

namespace {

TranscriptionResult ok_result(const std::string& text) {
    return TranscriptionResult{
        .success = true,
        .text = text,
        .processing_ms = 320.0,
        .engine = "remote (gpu-english)",
        .model = "gpu-english",
        .language = "en",
    };
}

} // namespace

TEST_CASE("HistoryDb", "[history]") {
    test::TmpDir dir;
    auto path = (dir / "nested" / "history.db").string();

    SECTION("OpenCreatesFile") {
        HistoryDb db;
        REQUIRE(db.open(path));
        REQUIRE(db.is_open());
        REQUIRE(std::filesystem::exists(path));
    }

    SECTION("InsertAndRetrieve") {
        HistoryDb db;
        REQUIRE(db.open(path));
        REQUIRE(db.insert(ok_result("hello world")));

        auto entries = db.recent(1);
        REQUIRE(entries.size() == 1);
        REQUIRE(entries[0].success);
        REQUIRE(entries[0].text == "hello world");
        REQUIRE(entries[0].processing_time == 320.0);
        REQUIRE(entries[0].engine == "remote (gpu-english)");
        REQUIRE(entries[0].model == "gpu-english");
        REQUIRE(entries[0].language == "en");
        REQUIRE(entries[0].error.empty());
        REQUIRE_FALSE(entries[0].timestamp.empty());
    }

    SECTION("RecordsFailures") {
        HistoryDb db;
        REQUIRE(db.open(path));

        TranscriptionResult failed{
            .success = false,
            .engine = "local-sidecar (error)",
            .error = EngineError{.kind = ErrorKind::Conversion, .message = "ffmpeg not found"},
        };
        REQUIRE(db.insert(failed));

        auto entries = db.recent(1);
        REQUIRE(entries.size() == 1);
        REQUIRE_FALSE(entries[0].success);
        REQUIRE(entries[0].text.empty());
        REQUIRE(entries[0].error == "ConversionError: ffmpeg not found");
        REQUIRE(entries[0].model.empty());
    }

    SECTION("LimitWorks") {
        HistoryDb db;
        REQUIRE(db.open(path));
        for (int i = 0; i < 5; ++i) {
            REQUIRE(db.insert(ok_result("entry " + std::to_string(i))));
        }

        auto entries = db.recent(2);
        REQUIRE(entries.size() == 2);
    }

    SECTION("MostRecentFirst") {
        HistoryDb db;
        REQUIRE(db.open(path));
        REQUIRE(db.insert(ok_result("first")));
        REQUIRE(db.insert(ok_result("second")));
        REQUIRE(db.insert(ok_result("third")));

        auto entries = db.recent(10);
        REQUIRE(entries.size() == 3);
        REQUIRE(entries[0].text == "third");
        REQUIRE(entries[2].text == "first");
    }

    SECTION("ReopenPersists") {
        {
            HistoryDb db;
            REQUIRE(db.open(path));
            REQUIRE(db.insert(ok_result("persisted")));
        }
        HistoryDb db;
        REQUIRE(db.open(path));
        auto entries = db.recent(10);
        REQUIRE(entries.size() == 1);
        REQUIRE(entries[0].text == "persisted");
    }

    SECTION("InsertWithoutOpenFails") {
        HistoryDb db;
        REQUIRE_FALSE(db.insert(ok_result("nowhere")));
        REQUIRE(db.recent(5).empty());
    }

    SECTION("ToJson") {
        HistoryEntry e{
            .id = 7, .timestamp = "2024-01-01T00:00:00.000", .success = false, .text = "",
            .processing_time = 1.5, .engine = "x", .model = "m", .language = "en",
            .error = "SubprocessError: boom",
        };
        auto j = to_json(e);
        REQUIRE(j["id"] == 7);
        REQUIRE(j["success"] == false);
        REQUIRE(j["error"] == "SubprocessError: boom");
    }
}
