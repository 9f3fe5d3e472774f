#include "AlertManager.h"
#include "Logger.h"

namespace LureNet {

lnt::Result<std::int64_t> AlertManager::insert(const Alert& alert) {
    auto& logger = Logger::instance();
    sqlite3* db = handler_->getDB();

    const char* sql =
        "INSERT INTO alerts (timestamp, source_ip, alert_type, detail, attack_id) "
        "VALUES (?, ?, ?, ?, ?);";

    StatementGuard stmt;
    if (sqlite3_prepare_v2(db, sql, -1, stmt.out(), nullptr) != SQLITE_OK) {
        std::string message = "Failed to prepare statement: " + std::string(sqlite3_errmsg(db));
        logger.log(LogLevel::ERROR, message, "AlertManager");
        return lnt::Err<std::int64_t>(lnt::ErrorCode::QueryFailed, message);
    }

    SQLiteHandler::bindText(stmt.get(), 1, alert.timestamp);
    SQLiteHandler::bindText(stmt.get(), 2, alert.sourceIp);
    SQLiteHandler::bindText(stmt.get(), 3, toString(alert.alertType));
    SQLiteHandler::bindText(stmt.get(), 4, alert.detail);
    if (alert.attackId) {
        sqlite3_bind_int64(stmt.get(), 5, *alert.attackId);
    } else {
        sqlite3_bind_null(stmt.get(), 5);
    }

    if (sqlite3_step(stmt.get()) != SQLITE_DONE) {
        std::string message = "Failed to insert alert: " + std::string(sqlite3_errmsg(db));
        logger.log(LogLevel::ERROR, message, "AlertManager");
        return lnt::Err<std::int64_t>(lnt::ErrorCode::DatabaseError, message);
    }

    return static_cast<std::int64_t>(sqlite3_last_insert_rowid(db));
}

lnt::Result<std::vector<Alert>> AlertManager::query(int limit, int offset) {
    if (limit <= 0 || offset < 0) {
        return lnt::Err<std::vector<Alert>>(lnt::ErrorCode::InvalidPagination,
            "limit must be > 0 and offset must be >= 0");
    }

    const char* sql =
        "SELECT id, timestamp, source_ip, alert_type, detail, attack_id "
        "FROM alerts ORDER BY id DESC LIMIT ? OFFSET ?;";

    sqlite3* db = handler_->getDB();
    StatementGuard stmt;
    if (sqlite3_prepare_v2(db, sql, -1, stmt.out(), nullptr) != SQLITE_OK) {
        std::string message = "Failed to prepare statement: " + std::string(sqlite3_errmsg(db));
        Logger::instance().log(LogLevel::ERROR, message, "AlertManager");
        return lnt::Err<std::vector<Alert>>(lnt::ErrorCode::QueryFailed, message);
    }
    sqlite3_bind_int(stmt.get(), 1, limit);
    sqlite3_bind_int(stmt.get(), 2, offset);

    std::vector<Alert> alerts;
    int rc;
    while ((rc = sqlite3_step(stmt.get())) == SQLITE_ROW) {
        Alert alert;
        alert.id = sqlite3_column_int64(stmt.get(), 0);
        alert.timestamp = SQLiteHandler::columnText(stmt.get(), 1);
        alert.sourceIp = SQLiteHandler::columnText(stmt.get(), 2);
        alert.alertType = alertTypeFromString(SQLiteHandler::columnText(stmt.get(), 3))
                              .value_or(AlertType::HIGH_THREAT);
        alert.detail = SQLiteHandler::columnText(stmt.get(), 4);
        if (sqlite3_column_type(stmt.get(), 5) != SQLITE_NULL) {
            alert.attackId = sqlite3_column_int64(stmt.get(), 5);
        }
        alerts.push_back(std::move(alert));
    }
    if (rc != SQLITE_DONE) {
        std::string message = "Failed to read alerts: " + std::string(sqlite3_errmsg(db));
        Logger::instance().log(LogLevel::ERROR, message, "AlertManager");
        return lnt::Err<std::vector<Alert>>(lnt::ErrorCode::QueryFailed, message);
    }
    return alerts;
}

} // namespace LureNet
