#include "storage/history_db.hpp"

#include <algorithm>
#include <chrono>
#include <filesystem>
#include <print>

namespace fs = std::filesystem;

HistoryDb::HistoryDb() = default;

HistoryDb::~HistoryDb() {
    close();
}

bool HistoryDb::open(const std::string& path, uint32_t max_entries) {
    close();
    // LIMIT 0 in trim() would empty the table on every record().
    max_entries_ = std::max<uint32_t>(max_entries, 1);

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

    sqlite3_exec(db_, "PRAGMA journal_mode=WAL;", nullptr, nullptr, nullptr);

    if (!create_tables()) {
        close();
        return false;
    }

    const char* record_sql =
        "INSERT INTO recent_files (path, last_opened) VALUES (?, ?) "
        "ON CONFLICT(path) DO UPDATE SET "
        "last_opened = excluded.last_opened, open_count = open_count + 1";

    const char* recent_sql =
        "SELECT id, path, last_opened, open_count FROM recent_files "
        "ORDER BY last_opened DESC, id DESC LIMIT ?";

    const char* remove_sql = "DELETE FROM recent_files WHERE path = ?";

    const char* trim_sql =
        "DELETE FROM recent_files WHERE id NOT IN ("
        "SELECT id FROM recent_files ORDER BY last_opened DESC, id DESC LIMIT ?)";

    struct {
        const char* sql;
        sqlite3_stmt** stmt;
    } statements[] = {
        {record_sql, &record_stmt_},
        {recent_sql, &recent_stmt_},
        {remove_sql, &remove_stmt_},
        {trim_sql, &trim_stmt_},
    };
    for (auto& s : statements) {
        if (sqlite3_prepare_v2(db_, s.sql, -1, s.stmt, nullptr) != SQLITE_OK) {
            std::println(stderr, "db: prepare failed: {}", sqlite3_errmsg(db_));
            close();
            return false;
        }
    }

    sqlite3_stmt* max_stmt = nullptr;
    if (sqlite3_prepare_v2(db_, "SELECT MAX(last_opened) FROM recent_files", -1,
                           &max_stmt, nullptr) == SQLITE_OK) {
        if (sqlite3_step(max_stmt) == SQLITE_ROW) {
            last_timestamp_ = sqlite3_column_int64(max_stmt, 0);
        }
        sqlite3_finalize(max_stmt);
    }

    return true;
}

void HistoryDb::close() {
    for (auto* stmt : {&record_stmt_, &recent_stmt_, &remove_stmt_, &trim_stmt_}) {
        if (*stmt) { sqlite3_finalize(*stmt); *stmt = nullptr; }
    }
    if (db_) { sqlite3_close(db_); db_ = nullptr; }
}

bool HistoryDb::record(const std::string& path) {
    if (!record_stmt_) return false;

    sqlite3_reset(record_stmt_);
    sqlite3_bind_text(record_stmt_, 1, path.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_int64(record_stmt_, 2, next_timestamp());

    if (sqlite3_step(record_stmt_) != SQLITE_DONE) {
        std::println(stderr, "db: record failed: {}", sqlite3_errmsg(db_));
        return false;
    }
    return trim();
}

std::vector<RecentFile> HistoryDb::recent(int limit) {
    std::vector<RecentFile> entries;
    if (!recent_stmt_) return entries;

    sqlite3_reset(recent_stmt_);
    sqlite3_bind_int(recent_stmt_, 1, limit);

    while (sqlite3_step(recent_stmt_) == SQLITE_ROW) {
        RecentFile e;
        e.id = sqlite3_column_int64(recent_stmt_, 0);
        auto* p = sqlite3_column_text(recent_stmt_, 1);
        e.path = p ? reinterpret_cast<const char*>(p) : "";
        e.last_opened = sqlite3_column_int64(recent_stmt_, 2);
        e.open_count = static_cast<uint32_t>(sqlite3_column_int(recent_stmt_, 3));
        entries.push_back(std::move(e));
    }

    return entries;
}

bool HistoryDb::remove(const std::string& path) {
    if (!remove_stmt_) return false;

    sqlite3_reset(remove_stmt_);
    sqlite3_bind_text(remove_stmt_, 1, path.c_str(), -1, SQLITE_TRANSIENT);
    if (sqlite3_step(remove_stmt_) != SQLITE_DONE) {
        std::println(stderr, "db: remove failed: {}", sqlite3_errmsg(db_));
        return false;
    }
    return true;
}

bool HistoryDb::clear() {
    if (!db_) return false;

    char* err = nullptr;
    if (sqlite3_exec(db_, "DELETE FROM recent_files", nullptr, nullptr, &err) != SQLITE_OK) {
        std::println(stderr, "db: clear failed: {}", err ? err : "unknown");
        sqlite3_free(err);
        return false;
    }
    return true;
}

bool HistoryDb::create_tables() {
    const char* sql = R"(
        CREATE TABLE IF NOT EXISTS recent_files (
            id INTEGER PRIMARY KEY AUTOINCREMENT,
            path TEXT NOT NULL UNIQUE,
            last_opened INTEGER NOT NULL,
            open_count INTEGER NOT NULL DEFAULT 1
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

bool HistoryDb::trim() {
    sqlite3_reset(trim_stmt_);
    sqlite3_bind_int64(trim_stmt_, 1, max_entries_);
    if (sqlite3_step(trim_stmt_) != SQLITE_DONE) {
        std::println(stderr, "db: trim failed: {}", sqlite3_errmsg(db_));
        return false;
    }
    return true;
}

// Strictly increasing, so two opens within one millisecond still order.
int64_t HistoryDb::next_timestamp() {
    auto now = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
    last_timestamp_ = std::max<int64_t>(now, last_timestamp_ + 1);
    return last_timestamp_;
}
