#pragma once

#include "Result.h"
#include <sqlite3.h>
#include <string>

namespace LureNet {

/**
 * @brief Finalizes a prepared statement when it leaves scope
 */
class StatementGuard {
public:
    StatementGuard() = default;
    explicit StatementGuard(sqlite3_stmt* stmt) : stmt_(stmt) {}
    ~StatementGuard() {
        if (stmt_) {
            sqlite3_finalize(stmt_);
        }
    }

    StatementGuard(const StatementGuard&) = delete;
    StatementGuard& operator=(const StatementGuard&) = delete;

    sqlite3_stmt* get() const { return stmt_; }
    sqlite3_stmt** out() { return &stmt_; }

private:
    sqlite3_stmt* stmt_ = nullptr;
};

/**
 * @brief Owns the SQLite connection and the event schema
 */
class SQLiteHandler {
public:
    SQLiteHandler() = default;
    ~SQLiteHandler();

    SQLiteHandler(const SQLiteHandler&) = delete;
    SQLiteHandler& operator=(const SQLiteHandler&) = delete;

    /**
     * @brief Open database connection and create tables
     * @param dbPath Database file; its parent directory is created if missing
     */
    lnt::Result<void> initialize(const std::string& dbPath);

    void shutdown();

    sqlite3* getDB() { return db_; }
    bool isOpen() const { return db_ != nullptr; }
    const std::string& path() const { return dbPath_; }

    /// Last error reported by the connection
    std::string lastError() const;

    /// Bind the full byte length; captured payloads may carry NUL bytes
    static int bindText(sqlite3_stmt* stmt, int index, const std::string& value);

    /// Column text including embedded NULs, empty for NULL
    static std::string columnText(sqlite3_stmt* stmt, int column);

private:
    sqlite3* db_ = nullptr;
    std::string dbPath_;

    lnt::Result<void> exec(const char* sql);
    lnt::Result<void> createTables();
};

} // namespace LureNet
