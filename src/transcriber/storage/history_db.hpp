#pragma once

#include <cstdint>
#include <sqlite3.h>
#include <string>
#include <vector>

struct JobRecord {
    std::string input_path;
    std::string model;
    std::string language;
    std::string device;
    std::string precision;
    double audio_duration = 0.0;
    double processing_time = 0.0;
    int segment_count = 0;
    std::string timestamps_path;
    std::string json_path;
    std::string text;
};

struct HistoryEntry {
    int64_t id;
    std::string timestamp;
    JobRecord job;
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

    bool insert(const JobRecord& job);

    std::vector<HistoryEntry> recent(int limit = 10);

private:
    bool create_tables();

    sqlite3* db_ = nullptr;
    sqlite3_stmt* insert_stmt_ = nullptr;
    sqlite3_stmt* recent_stmt_ = nullptr;
};
