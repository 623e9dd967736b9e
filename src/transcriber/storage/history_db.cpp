#include "history_db.hpp"

#include <filesystem>
#include <print>

namespace fs = std::filesystem;

HistoryDb::HistoryDb() = default;

HistoryDb::~HistoryDb() {
    close();
}

bool HistoryDb::open(const std::string& path) {
    fs::path p(path);
    std::error_code ec;
    if (p.has_parent_path()) fs::create_directories(p.parent_path(), ec);

    int rc = sqlite3_open(path.c_str(), &db_);
    if (rc != SQLITE_OK) {
        std::println(stderr, "history: failed to open {}: {}", path, sqlite3_errmsg(db_));
        sqlite3_close(db_);
        db_ = nullptr;
        return false;
    }

    sqlite3_exec(db_, "PRAGMA journal_mode=WAL;", nullptr, nullptr, nullptr);

    if (!create_tables()) {
        close();
        return false;
    }

    const char* insert_sql =
        "INSERT INTO jobs (input_path, model, language, device, precision, "
        "audio_duration, processing_time, segment_count, timestamps_path, json_path, text) "
        "VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?)";

    const char* recent_sql =
        "SELECT id, timestamp, input_path, model, language, device, precision, "
        "audio_duration, processing_time, segment_count, timestamps_path, json_path, text "
        "FROM jobs ORDER BY id DESC LIMIT ?";

    if (sqlite3_prepare_v2(db_, insert_sql, -1, &insert_stmt_, nullptr) != SQLITE_OK) {
        std::println(stderr, "history: prepare insert failed: {}", sqlite3_errmsg(db_));
        close();
        return false;
    }

    if (sqlite3_prepare_v2(db_, recent_sql, -1, &recent_stmt_, nullptr) != SQLITE_OK) {
        std::println(stderr, "history: prepare recent failed: {}", sqlite3_errmsg(db_));
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

bool HistoryDb::insert(const JobRecord& job) {
    if (!insert_stmt_) return false;

    sqlite3_reset(insert_stmt_);
    sqlite3_clear_bindings(insert_stmt_);

    auto bind_nullable = [this](int idx, const std::string& val) {
        if (val.empty()) sqlite3_bind_null(insert_stmt_, idx);
        else sqlite3_bind_text(insert_stmt_, idx, val.c_str(), -1, SQLITE_TRANSIENT);
    };

    sqlite3_bind_text(insert_stmt_, 1, job.input_path.c_str(), -1, SQLITE_TRANSIENT);
    bind_nullable(2, job.model);
    bind_nullable(3, job.language);
    bind_nullable(4, job.device);
    bind_nullable(5, job.precision);
    sqlite3_bind_double(insert_stmt_, 6, job.audio_duration);
    sqlite3_bind_double(insert_stmt_, 7, job.processing_time);
    sqlite3_bind_int(insert_stmt_, 8, job.segment_count);
    bind_nullable(9, job.timestamps_path);
    bind_nullable(10, job.json_path);
    sqlite3_bind_text(insert_stmt_, 11, job.text.c_str(), -1, SQLITE_TRANSIENT);

    int rc = sqlite3_step(insert_stmt_);
    if (rc != SQLITE_DONE) {
        std::println(stderr, "history: insert failed: {}", sqlite3_errmsg(db_));
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
        e.job.input_path = get_text(recent_stmt_, 2);
        e.job.model = get_text(recent_stmt_, 3);
        e.job.language = get_text(recent_stmt_, 4);
        e.job.device = get_text(recent_stmt_, 5);
        e.job.precision = get_text(recent_stmt_, 6);
        e.job.audio_duration = sqlite3_column_double(recent_stmt_, 7);
        e.job.processing_time = sqlite3_column_double(recent_stmt_, 8);
        e.job.segment_count = sqlite3_column_int(recent_stmt_, 9);
        e.job.timestamps_path = get_text(recent_stmt_, 10);
        e.job.json_path = get_text(recent_stmt_, 11);
        e.job.text = get_text(recent_stmt_, 12);
        entries.push_back(std::move(e));
    }

    return entries;
}

bool HistoryDb::create_tables() {
    const char* sql = R"(
        CREATE TABLE IF NOT EXISTS jobs (
            id INTEGER PRIMARY KEY AUTOINCREMENT,
            timestamp TEXT NOT NULL DEFAULT (strftime('%Y-%m-%dT%H:%M:%f','now')),
            input_path TEXT NOT NULL,
            model TEXT,
            language TEXT,
            device TEXT,
            precision TEXT,
            audio_duration REAL,
            processing_time REAL,
            segment_count INTEGER,
            timestamps_path TEXT,
            json_path TEXT,
            text TEXT NOT NULL
        );
    )";

    char* err = nullptr;
    int rc = sqlite3_exec(db_, sql, nullptr, nullptr, &err);
    if (rc != SQLITE_OK) {
        std::println(stderr, "history: create table failed: {}", err ? err : "unknown");
        sqlite3_free(err);
        return false;
    }
    return true;
}
