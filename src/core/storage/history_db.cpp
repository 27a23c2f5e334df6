#include "history_db.hpp"

#include "../platform/platform_paths.hpp"
#include "../transcript/transcript_format.hpp"

#include <filesystem>
#include <print>

namespace fs = std::filesystem;

HistoryDb::HistoryDb() = default;

HistoryDb::~HistoryDb() {
    close();
}

std::string HistoryDb::default_path() {
    auto data = platform::data_dir();
    if (!data.empty()) return data + "/history.db";
    return "/tmp/whisperdesk/history.db";
}

bool HistoryDb::open(const std::string& path) {
    // Ensure parent directory exists
    fs::path p(path);
    std::error_code ec;
    fs::create_directories(p.parent_path(), ec);

    int rc = sqlite3_open(path.c_str(), &db_);
    if (rc != SQLITE_OK) {
        std::println(stderr, "db: failed to open {}: {}", path, sqlite3_errmsg(db_));
        sqlite3_close(db_);
        db_ = nullptr;
        return false;
    }

    // WAL lets the CLI read history while the GUI writes
    sqlite3_exec(db_, "PRAGMA journal_mode=WAL;", nullptr, nullptr, nullptr);

    if (!create_tables()) {
        close();
        return false;
    }

    const char* insert_sql =
        "INSERT INTO transcriptions (file_path, model, backend, language, text, "
        "segments, audio_duration, processing_time) "
        "VALUES (?, ?, ?, ?, ?, ?, ?, ?)";

    const char* recent_sql =
        "SELECT id, timestamp, file_path, model, backend, language, text, "
        "segments, audio_duration, processing_time "
        "FROM transcriptions ORDER BY id DESC LIMIT ?";

    if (sqlite3_prepare_v2(db_, insert_sql, -1, &insert_stmt_, nullptr) != SQLITE_OK) {
        std::println(stderr, "db: prepare insert failed: {}", sqlite3_errmsg(db_));
        close();
        return false;
    }

    if (sqlite3_prepare_v2(db_, recent_sql, -1, &recent_stmt_, nullptr) != SQLITE_OK) {
        std::println(stderr, "db: prepare recent failed: {}", sqlite3_errmsg(db_));
        close();
        return false;
    }

    return true;
}

void HistoryDb::close() {
    if (insert_stmt_) { sqlite3_finalize(insert_stmt_); insert_stmt_ = nullptr; }
    if (recent_stmt_) { sqlite3_finalize(recent_stmt_); recent_stmt_ = nullptr; }
    if (db_) { sqlite3_close(db_); db_ = nullptr; }
}

bool HistoryDb::insert(const std::string& file_path, const std::string& model,
                       const std::string& backend, const Transcript& t) {
    if (!insert_stmt_) return false;

    auto segments = transcript::to_json(t)["chunks"].dump();

    sqlite3_reset(insert_stmt_);

    auto bind_nullable = [this](int idx, const std::string& val) {
        if (val.empty()) sqlite3_bind_null(insert_stmt_, idx);
        else sqlite3_bind_text(insert_stmt_, idx, val.c_str(), -1, SQLITE_TRANSIENT);
    };

    bind_nullable(1, file_path);
    bind_nullable(2, model);
    bind_nullable(3, backend);
    bind_nullable(4, t.language);
    sqlite3_bind_text(insert_stmt_, 5, t.text.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(insert_stmt_, 6, segments.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_double(insert_stmt_, 7, t.audio_duration_s);
    sqlite3_bind_double(insert_stmt_, 8, t.processing_s);

    int rc = sqlite3_step(insert_stmt_);
    if (rc != SQLITE_DONE) {
        std::println(stderr, "db: insert failed: {}", sqlite3_errmsg(db_));
        return false;
    }
    return true;
}

std::vector<HistoryEntry> HistoryDb::recent(int limit) {
    std::vector<HistoryEntry> entries;
    if (!recent_stmt_) return entries;

    sqlite3_reset(recent_stmt_);
    sqlite3_bind_int(recent_stmt_, 1, limit);

    auto get_text = [](sqlite3_stmt* stmt, int col) -> std::string {
        auto* p = sqlite3_column_text(stmt, col);
        return p ? reinterpret_cast<const char*>(p) : "";
    };

    while (sqlite3_step(recent_stmt_) == SQLITE_ROW) {
        HistoryEntry e;
        e.id = sqlite3_column_int64(recent_stmt_, 0);
        e.timestamp = get_text(recent_stmt_, 1);
        e.file_path = get_text(recent_stmt_, 2);
        e.model = get_text(recent_stmt_, 3);
        e.backend = get_text(recent_stmt_, 4);
        e.language = get_text(recent_stmt_, 5);
        e.text = get_text(recent_stmt_, 6);
        e.segments_json = get_text(recent_stmt_, 7);
        e.audio_duration = sqlite3_column_double(recent_stmt_, 8);
        e.processing_time = sqlite3_column_double(recent_stmt_, 9);
        entries.push_back(std::move(e));
    }

    return entries;
}

bool HistoryDb::create_tables() {
    const char* sql = R"(
        CREATE TABLE IF NOT EXISTS transcriptions (
            id INTEGER PRIMARY KEY AUTOINCREMENT,
            timestamp TEXT NOT NULL DEFAULT (strftime('%Y-%m-%dT%H:%M:%f','now')),
            file_path TEXT,
            model TEXT,
            backend TEXT,
            language TEXT,
            text TEXT NOT NULL,
            segments TEXT,
            audio_duration REAL,
            processing_time REAL
        );
    )";

    char* err = nullptr;
    int rc = sqlite3_exec(db_, sql, nullptr, nullptr, &err);
    if (rc != SQLITE_OK) {
        std::println(stderr, "db: create table failed: {}", err ? err : "unknown");
        sqlite3_free(err);
        return false;
    }
    return true;
}
