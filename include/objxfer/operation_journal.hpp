#pragma once

#include "objxfer/operation_registry.hpp"

#include <cstdint>
#include <filesystem>
#include <mutex>
#include <string>
#include <vector>

// Forward declarations
struct sqlite3;
struct sqlite3_stmt;

namespace objxfer {

/// Persistent history of settled operations (SQLite, WAL mode).
///
/// Registry records are evicted after their TTL; the journal keeps them.
class OperationJournal {
public:
    struct Entry {
        OperationId id = 0;
        std::string kind;
        std::string state;
        std::string description;
        uint64_t bytes_total = 0;
        uint64_t bytes_transferred = 0;
        int64_t submit_time_ms = 0;
        int64_t start_time_ms = 0;   // 0 if it never started
        int64_t end_time_ms = 0;
        std::string error_code;
        std::string error_message;
    };

    /// Opens (creating if needed) the database. Throws std::runtime_error.
    explicit OperationJournal(const std::filesystem::path& db_path);
    ~OperationJournal();

    OperationJournal(const OperationJournal&) = delete;
    OperationJournal& operator=(const OperationJournal&) = delete;

    /// Record one settled operation. Returns false on a database error.
    bool record(const Operation& op);

    /// Newest first.
    std::vector<Entry> recent(size_t limit) const;

    size_t count() const;

    const std::filesystem::path& path() const { return db_path_; }

private:
    std::filesystem::path db_path_;

    mutable std::mutex mutex_;
    sqlite3* db_ = nullptr;
    sqlite3_stmt* stmt_insert_ = nullptr;
    sqlite3_stmt* stmt_recent_ = nullptr;
    sqlite3_stmt* stmt_count_ = nullptr;
};

}  // namespace objxfer
