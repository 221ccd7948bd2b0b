#pragma once

#include "../engine_types.hpp"

#include <cstdint>
#include <sqlite3.h>
#include <string>
#include <vector>

struct HistoryEntry {
    int64_t id;
    std::string timestamp;
    bool success;
    std::string text;
    double processing_time;
    std::string engine;
    std::string model;
    std::string language;
    std::string error;
};

class HistoryDb {
public:
    HistoryDb();
    ~HistoryDb();

    HistoryDb(const HistoryDb&) = delete;
    HistoryDb& operator=(const HistoryDb&) = delete;

    bool open(const std::string& path);
    void close();
    bool is_open() const { return db_ != nullptr; }

    bool insert(const TranscriptionResult& result);

    std::vector<HistoryEntry> recent(int limit = 10);

private:
    bool create_tables();

    sqlite3* db_ = nullptr;
    sqlite3_stmt* insert_stmt_ = nullptr;
    sqlite3_stmt* recent_stmt_ = nullptr;
};

nlohmann::json to_json(const HistoryEntry& entry);
