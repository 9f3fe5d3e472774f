#include "AttackEventManager.h"
#include "Constants.h"
#include "Logger.h"
#include <set>

namespace LureNet {

namespace {

const std::set<std::string>& allowedFilterColumns() {
    static const std::set<std::string> columns = {
        "protocol", "attack_type", "source_ip", "threat_level"
    };
    return columns;
}

lnt::Error prepareError(sqlite3* db) {
    std::string message = "Failed to prepare statement: " + std::string(sqlite3_errmsg(db));
    Logger::instance().log(LogLevel::ERROR, message, "AttackEventManager");
    return lnt::Error{lnt::ErrorCode::QueryFailed, message};
}

} // namespace

bool AttackEventManager::isAllowedFilter(const std::string& key) {
    return allowedFilterColumns().count(key) > 0;
}

lnt::Result<std::int64_t> AttackEventManager::insert(const AttackEvent& event) {
    sqlite3* db = handler_->getDB();

    const char* sql =
        "INSERT INTO attack_events "
        "(timestamp, source_ip, source_port, protocol, attack_type, raw_payload, threat_level, attack_pattern) "
        "VALUES (?, ?, ?, ?, ?, ?, ?, ?);";

    StatementGuard stmt;
    if (sqlite3_prepare_v2(db, sql, -1, stmt.out(), nullptr) != SQLITE_OK) {
        return prepareError(db);
    }

    SQLiteHandler::bindText(stmt.get(), 1, event.timestamp);
    SQLiteHandler::bindText(stmt.get(), 2, event.sourceIp);
    sqlite3_bind_int(stmt.get(), 3, event.sourcePort);
    SQLiteHandler::bindText(stmt.get(), 4, toString(event.protocol));
    SQLiteHandler::bindText(stmt.get(), 5, toString(event.attackType));
    SQLiteHandler::bindText(stmt.get(), 6, event.rawPayload);
    SQLiteHandler::bindText(stmt.get(), 7, toString(event.threatLevel));
    SQLiteHandler::bindText(stmt.get(), 8, toString(event.attackPattern));

    if (sqlite3_step(stmt.get()) != SQLITE_DONE) {
        std::string message = "Failed to insert attack event: " + std::string(sqlite3_errmsg(db));
        Logger::instance().log(LogLevel::ERROR, message, "AttackEventManager");
        return lnt::Err<std::int64_t>(lnt::ErrorCode::DatabaseError, message);
    }

    return static_cast<std::int64_t>(sqlite3_last_insert_rowid(db));
}

lnt::Result<std::vector<AttackEvent>> AttackEventManager::query(int limit, int offset, const AttackFilters& filters) {
    if (limit <= 0 || offset < 0) {
        return lnt::Err<std::vector<AttackEvent>>(lnt::ErrorCode::InvalidPagination,
            "limit must be > 0 and offset must be >= 0");
    }

    std::string where;
    std::vector<std::string> values;
    for (const auto& [column, value] : filters) {
        if (!isAllowedFilter(column)) {
            return lnt::Err<std::vector<AttackEvent>>(lnt::ErrorCode::InvalidFilter,
                "Filter column '" + column + "' is not allowed");
        }
        where += where.empty() ? " WHERE " : " AND ";
        // column comes from the allow-list, never from the caller
        where += column + " = ?";
        values.push_back(value);
    }

    std::string sql =
        "SELECT id, timestamp, source_ip, source_port, protocol, attack_type, raw_payload, threat_level, attack_pattern "
        "FROM attack_events" + where + " ORDER BY id DESC LIMIT ? OFFSET ?;";

    sqlite3* db = handler_->getDB();
    StatementGuard stmt;
    if (sqlite3_prepare_v2(db, sql.c_str(), -1, stmt.out(), nullptr) != SQLITE_OK) {
        return prepareError(db);
    }

    int index = 1;
    for (const auto& value : values) {
        SQLiteHandler::bindText(stmt.get(), index++, value);
    }
    sqlite3_bind_int(stmt.get(), index++, limit);
    sqlite3_bind_int(stmt.get(), index, offset);

    std::vector<AttackEvent> events;
    int rc;
    while ((rc = sqlite3_step(stmt.get())) == SQLITE_ROW) {
        events.push_back(readRow(stmt.get()));
    }
    if (rc != SQLITE_DONE) {
        std::string message = "Failed to read attack events: " + std::string(sqlite3_errmsg(db));
        Logger::instance().log(LogLevel::ERROR, message, "AttackEventManager");
        return lnt::Err<std::vector<AttackEvent>>(lnt::ErrorCode::QueryFailed, message);
    }
    return events;
}

lnt::Result<AttackEvent> AttackEventManager::findById(std::int64_t id) {
    const char* sql =
        "SELECT id, timestamp, source_ip, source_port, protocol, attack_type, raw_payload, threat_level, attack_pattern "
        "FROM attack_events WHERE id = ?;";

    sqlite3* db = handler_->getDB();
    StatementGuard stmt;
    if (sqlite3_prepare_v2(db, sql, -1, stmt.out(), nullptr) != SQLITE_OK) {
        return prepareError(db);
    }
    sqlite3_bind_int64(stmt.get(), 1, id);

    int rc = sqlite3_step(stmt.get());
    if (rc == SQLITE_ROW) {
        return readRow(stmt.get());
    }
    if (rc == SQLITE_DONE) {
        return lnt::Err<AttackEvent>(lnt::ErrorCode::NotFound, "Attack " + std::to_string(id) + " not found");
    }

    std::string message = "Failed to read attack event: " + std::string(sqlite3_errmsg(db));
    Logger::instance().log(LogLevel::ERROR, message, "AttackEventManager");
    return lnt::Err<AttackEvent>(lnt::ErrorCode::QueryFailed, message);
}

lnt::Result<AttackStatistics> AttackEventManager::statistics() {
    sqlite3* db = handler_->getDB();
    AttackStatistics stats;

    {
        StatementGuard stmt;
        const char* sql = "SELECT COUNT(*), COUNT(DISTINCT source_ip) FROM attack_events;";
        if (sqlite3_prepare_v2(db, sql, -1, stmt.out(), nullptr) != SQLITE_OK) {
            return prepareError(db);
        }
        if (sqlite3_step(stmt.get()) == SQLITE_ROW) {
            stats.totalAttacks = static_cast<std::uint64_t>(sqlite3_column_int64(stmt.get(), 0));
            stats.uniqueAttackers = static_cast<std::uint64_t>(sqlite3_column_int64(stmt.get(), 1));
        }
    }

    auto byType = groupCount("SELECT attack_type, COUNT(*) FROM attack_events GROUP BY attack_type;");
    if (!byType) return byType.error();
    stats.attacksByType = std::move(*byType);

    auto byLevel = groupCount("SELECT threat_level, COUNT(*) FROM attack_events GROUP BY threat_level;");
    if (!byLevel) return byLevel.error();
    stats.attacksByThreatLevel = std::move(*byLevel);

    {
        // Ties go to the address seen first.
        const char* sql =
            "SELECT source_ip, COUNT(*) AS cnt, MIN(id) AS first_id FROM attack_events "
            "GROUP BY source_ip ORDER BY cnt DESC, first_id ASC LIMIT ?;";
        StatementGuard stmt;
        if (sqlite3_prepare_v2(db, sql, -1, stmt.out(), nullptr) != SQLITE_OK) {
            return prepareError(db);
        }
        sqlite3_bind_int(stmt.get(), 1, static_cast<int>(lnt::config::TOP_SOURCE_LIMIT));
        while (sqlite3_step(stmt.get()) == SQLITE_ROW) {
            SourceCount entry;
            entry.ip = SQLiteHandler::columnText(stmt.get(), 0);
            entry.count = static_cast<std::uint64_t>(sqlite3_column_int64(stmt.get(), 1));
            stats.topAttackingIps.push_back(std::move(entry));
        }
    }

    return stats;
}

lnt::Result<std::map<std::string, std::uint64_t>> AttackEventManager::groupCount(const char* sql) {
    sqlite3* db = handler_->getDB();
    StatementGuard stmt;
    if (sqlite3_prepare_v2(db, sql, -1, stmt.out(), nullptr) != SQLITE_OK) {
        return prepareError(db);
    }

    std::map<std::string, std::uint64_t> counts;
    while (sqlite3_step(stmt.get()) == SQLITE_ROW) {
        counts[SQLiteHandler::columnText(stmt.get(), 0)] = static_cast<std::uint64_t>(sqlite3_column_int64(stmt.get(), 1));
    }
    return counts;
}

AttackEvent AttackEventManager::readRow(sqlite3_stmt* stmt) {
    AttackEvent event;
    event.id = sqlite3_column_int64(stmt, 0);
    event.timestamp = SQLiteHandler::columnText(stmt, 1);
    event.sourceIp = SQLiteHandler::columnText(stmt, 2);
    event.sourcePort = sqlite3_column_int(stmt, 3);

    std::string protocol = SQLiteHandler::columnText(stmt, 4);
    if (auto parsed = protocolFromString(protocol)) {
        event.protocol = *parsed;
    } else {
        Logger::instance().log(LogLevel::WARN, "Unrecognized protocol '" + protocol + "' in row " +
                               std::to_string(*event.id), "AttackEventManager");
    }

    event.attackType = attackTypeFromString(SQLiteHandler::columnText(stmt, 5)).value_or(AttackType::UNKNOWN);
    event.rawPayload = SQLiteHandler::columnText(stmt, 6);
    event.threatLevel = threatLevelFromString(SQLiteHandler::columnText(stmt, 7)).value_or(ThreatLevel::LOW);
    event.attackPattern = attackPatternFromString(SQLiteHandler::columnText(stmt, 8)).value_or(AttackPattern::UNKNOWN);
    return event;
}

} // namespace LureNet
