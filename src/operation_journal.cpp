#include "objxfer/operation_journal.hpp"

#include <sqlite3.h>

#include <chrono>
#include <stdexcept>
#include <thread>

namespace objxfer {

namespace {

const char* JOURNAL_SCHEMA = R"(
CREATE TABLE IF NOT EXISTS operations (
    seq INTEGER PRIMARY KEY AUTOINCREMENT,
    op_id INTEGER NOT NULL,
    kind TEXT NOT NULL,
    state TEXT NOT NULL,
    description TEXT,
    bytes_total INTEGER NOT NULL DEFAULT 0,
    bytes_transferred INTEGER NOT NULL DEFAULT 0,
    submit_time INTEGER NOT NULL,
    start_time INTEGER NOT NULL DEFAULT 0,
    end_time INTEGER NOT NULL,
    error_code TEXT,
    error_message TEXT
);
CREATE INDEX IF NOT EXISTS idx_operations_end ON operations(end_time);
)";

int64_t to_epoch_ms(std::chrono::system_clock::time_point tp) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        tp.time_since_epoch()).count();
}

// Execute a SQL statement with retry on SQLITE_BUSY
bool sql_exec(sqlite3* db, const char* sql, std::string* error = nullptr) {
    for (int attempt = 0; attempt < 10; ++attempt) {
        char* err = nullptr;
        int rc = sqlite3_exec(db, sql, nullptr, nullptr, &err);
        if (rc == SQLITE_OK) return true;
        if (rc == SQLITE_BUSY || rc == SQLITE_LOCKED) {
            if (err) sqlite3_free(err);
            std::this_thread::sleep_for(std::chrono::milliseconds(10 * (attempt + 1)));
            continue;
        }
        if (err) {
            if (error) *error = err;
            sqlite3_free(err);
        }
        return false;
    }
    if (error) *error = "database busy";
    return false;
}

// Step a prepared statement with SQLITE_BUSY retry
int sql_step_retry(sqlite3_stmt* stmt) {
    for (int attempt = 0; attempt < 10; ++attempt) {
        int rc = sqlite3_step(stmt);
        if (rc != SQLITE_BUSY && rc != SQLITE_LOCKED) return rc;
        sqlite3_reset(stmt);
        std::this_thread::sleep_for(std::chrono::milliseconds(10 * (attempt + 1)));
    }
    return SQLITE_BUSY;
}

std::string column_text(sqlite3_stmt* stmt, int col) {
    auto* text = reinterpret_cast<const char*>(sqlite3_column_text(stmt, col));
    return text ? text : "";
}

}  // namespace

OperationJournal::OperationJournal(const std::filesystem::path& db_path)
    : db_path_(db_path) {
    if (db_path_.has_parent_path()) {
        std::error_code ec;
        std::filesystem::create_directories(db_path_.parent_path(), ec);
    }

    int rc = sqlite3_open(db_path_.c_str(), &db_);
    if (rc != SQLITE_OK) {
        std::string msg = db_ ? sqlite3_errmsg(db_) : "out of memory";
        sqlite3_close(db_);
        db_ = nullptr;
        throw std::runtime_error("Cannot open journal: " + msg);
    }

    // WAL mode so readers don't block the recording worker
    sql_exec(db_, "PRAGMA journal_mode=WAL");
    sql_exec(db_, "PRAGMA synchronous=NORMAL");
    sql_exec(db_, "PRAGMA busy_timeout=5000");

    std::string error;
    if (!sql_exec(db_, JOURNAL_SCHEMA, &error)) {
        sqlite3_close(db_);
        db_ = nullptr;
        throw std::runtime_error("Cannot create journal schema: " + error);
    }

    bool ok =
        sqlite3_prepare_v2(db_,
            "INSERT INTO operations (op_id, kind, state, description, bytes_total, "
            "bytes_transferred, submit_time, start_time, end_time, error_code, error_message) "
            "VALUES (?1, ?2, ?3, ?4, ?5, ?6, ?7, ?8, ?9, ?10, ?11)",
            -1, &stmt_insert_, nullptr) == SQLITE_OK &&
        sqlite3_prepare_v2(db_,
            "SELECT op_id, kind, state, description, bytes_total, bytes_transferred, "
            "submit_time, start_time, end_time, error_code, error_message "
            "FROM operations ORDER BY seq DESC LIMIT ?1",
            -1, &stmt_recent_, nullptr) == SQLITE_OK &&
        sqlite3_prepare_v2(db_, "SELECT COUNT(*) FROM operations",
            -1, &stmt_count_, nullptr) == SQLITE_OK;
    if (!ok) {
        std::string msg = sqlite3_errmsg(db_);
        sqlite3_finalize(stmt_insert_);
        sqlite3_finalize(stmt_recent_);
        sqlite3_finalize(stmt_count_);
        sqlite3_close(db_);
        db_ = nullptr;
        throw std::runtime_error("Cannot prepare journal statements: " + msg);
    }
}

OperationJournal::~OperationJournal() {
    if (stmt_insert_) sqlite3_finalize(stmt_insert_);
    if (stmt_recent_) sqlite3_finalize(stmt_recent_);
    if (stmt_count_) sqlite3_finalize(stmt_count_);

    if (db_) {
        sqlite3_exec(db_, "PRAGMA wal_checkpoint(TRUNCATE)", nullptr, nullptr, nullptr);
        sqlite3_close(db_);
    }
}

bool OperationJournal::record(const Operation& op) {
    std::lock_guard lock(mutex_);

    std::string kind = operation_kind_name(op.kind);
    std::string state = operation_state_name(op.state);

    sqlite3_reset(stmt_insert_);
    sqlite3_clear_bindings(stmt_insert_);
    sqlite3_bind_int64(stmt_insert_, 1, static_cast<int64_t>(op.id));
    sqlite3_bind_text(stmt_insert_, 2, kind.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt_insert_, 3, state.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt_insert_, 4, op.description.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_int64(stmt_insert_, 5, static_cast<int64_t>(op.bytes_total));
    sqlite3_bind_int64(stmt_insert_, 6, static_cast<int64_t>(op.bytes_transferred));
    sqlite3_bind_int64(stmt_insert_, 7, to_epoch_ms(op.submit_time));
    sqlite3_bind_int64(stmt_insert_, 8, op.start_time ? to_epoch_ms(*op.start_time) : 0);
    sqlite3_bind_int64(stmt_insert_, 9,
                       to_epoch_ms(op.end_time.value_or(std::chrono::system_clock::now())));
    if (op.error) {
        sqlite3_bind_text(stmt_insert_, 10, op.error->code.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_text(stmt_insert_, 11, op.error->message.c_str(), -1, SQLITE_TRANSIENT);
    } else {
        sqlite3_bind_null(stmt_insert_, 10);
        sqlite3_bind_null(stmt_insert_, 11);
    }

    int rc = sql_step_retry(stmt_insert_);
    sqlite3_reset(stmt_insert_);
    return rc == SQLITE_DONE;
}

std::vector<OperationJournal::Entry> OperationJournal::recent(size_t limit) const {
    std::lock_guard lock(mutex_);
    std::vector<Entry> entries;

    sqlite3_reset(stmt_recent_);
    sqlite3_bind_int64(stmt_recent_, 1, static_cast<int64_t>(limit));
    while (sql_step_retry(stmt_recent_) == SQLITE_ROW) {
        Entry e;
        e.id = static_cast<OperationId>(sqlite3_column_int64(stmt_recent_, 0));
        e.kind = column_text(stmt_recent_, 1);
        e.state = column_text(stmt_recent_, 2);
        e.description = column_text(stmt_recent_, 3);
        e.bytes_total = static_cast<uint64_t>(sqlite3_column_int64(stmt_recent_, 4));
        e.bytes_transferred = static_cast<uint64_t>(sqlite3_column_int64(stmt_recent_, 5));
        e.submit_time_ms = sqlite3_column_int64(stmt_recent_, 6);
        e.start_time_ms = sqlite3_column_int64(stmt_recent_, 7);
        e.end_time_ms = sqlite3_column_int64(stmt_recent_, 8);
        e.error_code = column_text(stmt_recent_, 9);
        e.error_message = column_text(stmt_recent_, 10);
        entries.push_back(std::move(e));
    }
    sqlite3_reset(stmt_recent_);
    return entries;
}

size_t OperationJournal::count() const {
    std::lock_guard lock(mutex_);
    size_t total = 0;
    sqlite3_reset(stmt_count_);
    if (sql_step_retry(stmt_count_) == SQLITE_ROW) {
        total = static_cast<size_t>(sqlite3_column_int64(stmt_count_, 0));
    }
    sqlite3_reset(stmt_count_);
    return total;
}

}  // namespace objxfer
