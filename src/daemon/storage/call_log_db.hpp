#pragma once

#include <cstdint>
#include <mutex>
#include <sqlite3.h>
#include <string>
#include <vector>

struct CallLogEntry {
    int64_t id;
    std::string timestamp;
    std::string tool_name;
    std::string params;
    int64_t duration_ms;
    bool is_error;
};

// Per-call audit log of tools/call requests. Safe to use from worker threads.
class CallLogDb {
public:
    static constexpr size_t kMaxParamsLength = 100;

    CallLogDb();
    ~CallLogDb();

    CallLogDb(const CallLogDb&) = delete;
    CallLogDb& operator=(const CallLogDb&) = delete;

    bool open(const std::string& path);
    void close();
    bool is_open() const;

    // params is stored truncated to kMaxParamsLength characters.
    bool insert(const std::string& tool_name, const std::string& params,
                int64_t duration_ms, bool is_error);

    std::vector<CallLogEntry> recent(int limit = 10);

private:
    bool create_tables();

    mutable std::mutex mutex_;
    sqlite3* db_ = nullptr;
    sqlite3_stmt* insert_stmt_ = nullptr;
    sqlite3_stmt* recent_stmt_ = nullptr;
};
