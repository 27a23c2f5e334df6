#pragma once

#include "../transcript/transcript.hpp"

#include <cstdint>
#include <sqlite3.h>
#include <string>
#include <vector>

struct HistoryEntry {
    int64_t id;
    std::string timestamp;
    std::string file_path;
    std::string model;
    std::string backend;
    std::string language;
    std::string text;
    std::string segments_json;
    double audio_duration;
    double processing_time;
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

    bool insert(const std::string& file_path, const std::string& model,
                const std::string& backend, const Transcript& transcript);

    std::vector<HistoryEntry> recent(int limit = 10);

    // <data_dir>/history.db, or a /tmp fallback without a home directory.
    static std::string default_path();

private:
    bool create_tables();

    sqlite3* db_ = nullptr;
    sqlite3_stmt* insert_stmt_ = nullptr;
    sqlite3_stmt* recent_stmt_ = nullptr;
};
