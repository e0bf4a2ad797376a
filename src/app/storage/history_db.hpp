#pragma once

#include <cstdint>
#include <sqlite3.h>
#include <string>
#include <vector>

struct RecentFile {
    int64_t id;
    std::string path;
    int64_t last_opened;  // ms since epoch
    uint32_t open_count;
};

// Recently opened files, one row per path, trimmed to max_entries.
class HistoryDb {
public:
    HistoryDb();
    ~HistoryDb();

    HistoryDb(const HistoryDb&) = delete;
    HistoryDb& operator=(const HistoryDb&) = delete;

    bool open(const std::string& path, uint32_t max_entries = 20);
    void close();
    bool is_open() const { return db_ != nullptr; }

    // Insert, or bump last_opened/open_count of an existing path.
    bool record(const std::string& path);

    // Newest first.
    std::vector<RecentFile> recent(int limit = 10);

    bool remove(const std::string& path);
    bool clear();

private:
    bool create_tables();
    bool trim();
    int64_t next_timestamp();

    sqlite3* db_ = nullptr;
    sqlite3_stmt* record_stmt_ = nullptr;
    sqlite3_stmt* recent_stmt_ = nullptr;
    sqlite3_stmt* remove_stmt_ = nullptr;
    sqlite3_stmt* trim_stmt_ = nullptr;
    uint32_t max_entries_ = 20;
    int64_t last_timestamp_ = 0;
};
