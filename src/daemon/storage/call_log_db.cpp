#include "storage/call_log_db.hpp"

#include "screen/compact_serializer.hpp"

#include <filesystem>
#include <print>

namespace fs = std::filesystem;

CallLogDb::CallLogDb() = default;

CallLogDb::~CallLogDb() {
    close();
}

bool CallLogDb::open(const std::string& path) {
    std::lock_guard lock(mutex_);

    fs::path p(path);
    std::error_code ec;
    if (p.has_parent_path()) fs::create_directories(p.parent_path(), ec);

    int rc = sqlite3_open(path.c_str(), &db_);
    if (rc != SQLITE_OK) {
        std::println(stderr, "db: failed to open {}: {}", path, sqlite3_errmsg(db_));
        sqlite3_close(db_);
        db_ = nullptr;
        return false;
    }

    sqlite3_exec(db_, "PRAGMA journal_mode=WAL;", nullptr, nullptr, nullptr);

    if (!create_tables()) return false;

    const char* insert_sql =
        "INSERT INTO tool_calls (tool_name, params, duration_ms, is_error) "
        "VALUES (?, ?, ?, ?)";

    const char* recent_sql =
        "SELECT id, timestamp, tool_name, params, duration_ms, is_error "
        "FROM tool_calls ORDER BY id DESC LIMIT ?";

    if (sqlite3_prepare_v2(db_, insert_sql, -1, &insert_stmt_, nullptr) != SQLITE_OK) {
        std::println(stderr, "db: prepare insert failed: {}", sqlite3_errmsg(db_));
        return false;
    }

    if (sqlite3_prepare_v2(db_, recent_sql, -1, &recent_stmt_, nullptr) != SQLITE_OK) {
        std::println(stderr, "db: prepare recent failed: {}", sqlite3_errmsg(db_));
        return false;
    }

    return true;
}

void CallLogDb::close() {
    std::lock_guard lock(mutex_);
    if (insert_stmt_) { sqlite3_finalize(insert_stmt_); insert_stmt_ = nullptr; }
    if (recent_stmt_) { sqlite3_finalize(recent_stmt_); recent_stmt_ = nullptr; }
    if (db_) { sqlite3_close(db_); db_ = nullptr; }
}

bool CallLogDb::is_open() const {
    std::lock_guard lock(mutex_);
    return insert_stmt_ != nullptr;
}

bool CallLogDb::insert(const std::string& tool_name, const std::string& params,
                       int64_t duration_ms, bool is_error) {
    std::lock_guard lock(mutex_);
    if (!insert_stmt_) return false;

    auto stored = CompactSerializer::truncate_utf8(params, kMaxParamsLength);

    sqlite3_reset(insert_stmt_);
    sqlite3_bind_text(insert_stmt_, 1, tool_name.c_str(), -1, SQLITE_TRANSIENT);
    if (stored.empty()) sqlite3_bind_null(insert_stmt_, 2);
    else sqlite3_bind_text(insert_stmt_, 2, stored.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_int64(insert_stmt_, 3, duration_ms);
    sqlite3_bind_int(insert_stmt_, 4, is_error ? 1 : 0);

    int rc = sqlite3_step(insert_stmt_);
    if (rc != SQLITE_DONE) {
        std::println(stderr, "db: insert failed: {}", sqlite3_errmsg(db_));
        return false;
    }
    return true;
}

std::vector<CallLogEntry> CallLogDb::recent(int limit) {
    std::lock_guard lock(mutex_);
    std::vector<CallLogEntry> entries;
    if (!recent_stmt_) return entries;

    sqlite3_reset(recent_stmt_);
    sqlite3_bind_int(recent_stmt_, 1, limit);

    auto get_text = [](sqlite3_stmt* stmt, int col) -> std::string {
        auto* p = sqlite3_column_text(stmt, col);
        return p ? reinterpret_cast<const char*>(p) : "";
    };

    while (sqlite3_step(recent_stmt_) == SQLITE_ROW) {
        entries.push_back(CallLogEntry{
            .id = sqlite3_column_int64(recent_stmt_, 0),
            .timestamp = get_text(recent_stmt_, 1),
            .tool_name = get_text(recent_stmt_, 2),
            .params = get_text(recent_stmt_, 3),
            .duration_ms = sqlite3_column_int64(recent_stmt_, 4),
            .is_error = sqlite3_column_int(recent_stmt_, 5) != 0,
        });
    }

    return entries;
}

bool CallLogDb::create_tables() {
    const char* sql = R"(
        CREATE TABLE IF NOT EXISTS tool_calls (
            id INTEGER PRIMARY KEY AUTOINCREMENT,
            timestamp TEXT NOT NULL DEFAULT (strftime('%Y-%m-%dT%H:%M:%f','now')),
            tool_name TEXT NOT NULL,
            params TEXT,
            duration_ms INTEGER NOT NULL DEFAULT 0,
            is_error INTEGER NOT NULL DEFAULT 0
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
