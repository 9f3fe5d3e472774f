#include "SQLiteHandler.h"
#include "Constants.h"
#include "Logger.h"
#include "PathUtils.h"

namespace LureNet {

SQLiteHandler::~SQLiteHandler() {
    shutdown();
}

lnt::Result<void> SQLiteHandler::initialize(const std::string& dbPath) {
    auto& logger = Logger::instance();

    if (db_) {
        shutdown();
    }

    std::string dirError;
    auto parent = std::filesystem::path(dbPath).parent_path();
    if (!PathUtils::ensureDirectory(parent, dirError)) {
        logger.log(LogLevel::ERROR, dirError, "SQLiteHandler");
        return lnt::Err(lnt::ErrorCode::DatabaseOpenFailed, dirError);
    }

    logger.log(LogLevel::INFO, "Initializing SQLite database: " + dbPath, "SQLiteHandler");

    if (sqlite3_open(dbPath.c_str(), &db_) != SQLITE_OK) {
        std::string message = "Cannot open database: " + lastError();
        logger.log(LogLevel::ERROR, message, "SQLiteHandler");
        sqlite3_close(db_);
        db_ = nullptr;
        return lnt::Err(lnt::ErrorCode::DatabaseOpenFailed, message);
    }
    dbPath_ = dbPath;

    if (auto wal = exec("PRAGMA journal_mode=WAL;"); !wal) {
        logger.log(LogLevel::WARN, "Failed to enable WAL mode: " + wal.error().message, "SQLiteHandler");
    }

    // Committed rows must survive a crash of the process or the host.
    if (auto sync = exec("PRAGMA synchronous=FULL;"); !sync) {
        logger.log(LogLevel::WARN, "Failed to set synchronous mode: " + sync.error().message, "SQLiteHandler");
    }

    sqlite3_busy_timeout(db_, lnt::config::DB_BUSY_TIMEOUT_MS);

    int userVersion = 0;
    {
        StatementGuard stmt;
        if (sqlite3_prepare_v2(db_, "PRAGMA user_version;", -1, stmt.out(), nullptr) == SQLITE_OK &&
            sqlite3_step(stmt.get()) == SQLITE_ROW) {
            userVersion = sqlite3_column_int(stmt.get(), 0);
        }
    }

    if (auto created = createTables(); !created) {
        shutdown();
        return created;
    }

    if (userVersion < lnt::config::DB_SCHEMA_VERSION) {
        std::string pragma = "PRAGMA user_version = " + std::to_string(lnt::config::DB_SCHEMA_VERSION) + ";";
        if (auto versioned = exec(pragma.c_str()); !versioned) {
            logger.log(LogLevel::ERROR, "Failed to set user_version: " + versioned.error().message, "SQLiteHandler");
            shutdown();
            return versioned;
        }
    }

    logger.log(LogLevel::INFO, "Database opened successfully", "SQLiteHandler");
    return lnt::Ok();
}

void SQLiteHandler::shutdown() {
    if (db_) {
        Logger::instance().log(LogLevel::INFO, "Closing SQLite database", "SQLiteHandler");
        sqlite3_close(db_);
        db_ = nullptr;
    }
}

std::string SQLiteHandler::lastError() const {
    if (!db_) {
        return "database not open";
    }
    return sqlite3_errmsg(db_);
}

int SQLiteHandler::bindText(sqlite3_stmt* stmt, int index, const std::string& value) {
    return sqlite3_bind_text(stmt, index, value.data(), static_cast<int>(value.size()), SQLITE_TRANSIENT);
}

std::string SQLiteHandler::columnText(sqlite3_stmt* stmt, int column) {
    const unsigned char* text = sqlite3_column_text(stmt, column);
    if (!text) {
        return "";
    }
    return std::string(reinterpret_cast<const char*>(text),
                       static_cast<std::size_t>(sqlite3_column_bytes(stmt, column)));
}

lnt::Result<void> SQLiteHandler::exec(const char* sql) {
    char* errMsg = nullptr;
    if (sqlite3_exec(db_, sql, nullptr, nullptr, &errMsg) != SQLITE_OK) {
        std::string message = errMsg ? errMsg : lastError();
        sqlite3_free(errMsg);
        return lnt::Err(lnt::ErrorCode::DatabaseError, message);
    }
    return lnt::Ok();
}

lnt::Result<void> SQLiteHandler::createTables() {
    Logger::instance().log(LogLevel::DEBUG, "Creating database tables", "SQLiteHandler");

    const char* sql =
        "CREATE TABLE IF NOT EXISTS attack_events ("
        "id INTEGER PRIMARY KEY AUTOINCREMENT,"
        "timestamp TEXT NOT NULL,"
        "source_ip TEXT NOT NULL,"
        "source_port INTEGER NOT NULL,"
        "protocol TEXT NOT NULL,"
        "attack_type TEXT NOT NULL,"
        "raw_payload TEXT,"
        "threat_level TEXT NOT NULL,"
        "attack_pattern TEXT NOT NULL);"

        "CREATE INDEX IF NOT EXISTS idx_attack_timestamp ON attack_events(timestamp);"
        "CREATE INDEX IF NOT EXISTS idx_attack_source_ip ON attack_events(source_ip);"
        "CREATE INDEX IF NOT EXISTS idx_attack_protocol ON attack_events(protocol);"

        // attack_id is a soft reference: no foreign key is enforced.
        "CREATE TABLE IF NOT EXISTS alerts ("
        "id INTEGER PRIMARY KEY AUTOINCREMENT,"
        "timestamp TEXT NOT NULL,"
        "source_ip TEXT NOT NULL,"
        "alert_type TEXT NOT NULL,"
        "detail TEXT,"
        "attack_id INTEGER);";

    auto result = exec(sql);
    if (!result) {
        Logger::instance().log(LogLevel::ERROR, "Failed to create tables: " + result.error().message, "SQLiteHandler");
    }
    return result;
}

} // namespace LureNet
