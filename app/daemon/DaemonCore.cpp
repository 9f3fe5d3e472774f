#include "DaemonCore.h"
#include "Constants.h"
#include "JsonSerializer.h"
#include "MetricsCollector.h"
#include "PathUtils.h"
#include "TextUtils.h"
#include <chrono>
#include <csignal>

namespace LureNet {

namespace {
    volatile sig_atomic_t signalReceived = 0;
    volatile sig_atomic_t receivedSignalNum = 0;

    void signalHandler(int signal) {
        receivedSignalNum = signal;
        signalReceived = 1;
    }

    const Protocol ALL_PROTOCOLS[] = {Protocol::SSH, Protocol::HTTP, Protocol::FTP};

    std::string keyPrefix(Protocol protocol) {
        return TextUtils::toLower(toString(protocol));
    }

    std::map<Protocol, DecoyOptions> decoyOptions(const DaemonConfig& config) {
        std::map<Protocol, DecoyOptions> options;
        for (const auto& entry : config.listeners) {
            DecoyOptions decoy;
            decoy.readTimeoutSec = entry.second.readTimeoutSec;
            decoy.maxSessions = config.maxSessions;
            options[entry.first] = decoy;
        }
        return options;
    }
}

DaemonConfig DaemonConfig::defaults() {
    DaemonConfig config;
    config.logMaxSizeMb = lnt::config::MAX_LOG_FILE_SIZE_MB;
    for (Protocol protocol : ALL_PROTOCOLS) {
        ListenerSettings settings;
        settings.host = lnt::config::DEFAULT_BIND_HOST;
        settings.port = defaultPortFor(protocol);
        settings.readTimeoutSec = lnt::config::SESSION_READ_TIMEOUT_SEC;
        config.listeners[protocol] = settings;
    }
    return config;
}

std::unordered_map<std::string, Config::Validator> DaemonConfig::schema() {
    std::unordered_map<std::string, Config::Validator> schema;
    for (Protocol protocol : ALL_PROTOCOLS) {
        const std::string prefix = keyPrefix(protocol);
        schema[prefix + ".port"] = Config::portValidator();
        schema[prefix + ".read_timeout_sec"] = Config::nonNegativeValidator();
    }
    schema["listener.max_sessions"] = Config::nonNegativeValidator();
    schema["log_max_size_mb"] = Config::nonNegativeValidator();
    schema["log_level"] = [](const std::string&, const std::string& value) {
        return logLevelFromString(value).has_value();
    };
    return schema;
}

lnt::Result<DaemonConfig> DaemonConfig::fromConfig(const Config& config) {
    auto valid = config.validate(schema());
    if (!valid) {
        return valid.error();
    }

    DaemonConfig result = defaults();
    result.dbPath = config.get("db_path", "");
    result.logFile = config.get("log_file", "");
    if (auto level = logLevelFromString(config.get("log_level", "INFO"))) {
        result.logLevel = *level;
    }
    result.logMaxSizeMb = config.getSize("log_max_size_mb", result.logMaxSizeMb);
    result.maxSessions = config.getSize("listener.max_sessions", 0);

    for (auto& entry : result.listeners) {
        const std::string prefix = keyPrefix(entry.first);
        auto& settings = entry.second;
        settings.enabled = config.getBool(prefix + ".enabled", settings.enabled);
        settings.host = config.get(prefix + ".host", settings.host);
        settings.port = config.getInt(prefix + ".port", settings.port);
        settings.readTimeoutSec = config.getInt(prefix + ".read_timeout_sec", settings.readTimeoutSec);
    }
    return result;
}

Config DaemonConfig::toConfig() const {
    Config config;
    config.set("db_path", dbPath);
    config.set("log_file", logFile);
    config.set("log_level", Logger::levelToString(logLevel));
    config.setSize("log_max_size_mb", logMaxSizeMb);
    config.setSize("listener.max_sessions", maxSessions);
    for (const auto& entry : listeners) {
        const std::string prefix = keyPrefix(entry.first);
        config.setBool(prefix + ".enabled", entry.second.enabled);
        config.set(prefix + ".host", entry.second.host);
        config.setInt(prefix + ".port", entry.second.port);
        config.setInt(prefix + ".read_timeout_sec", entry.second.readTimeoutSec);
    }
    return config;
}

DaemonCore::DaemonCore(DaemonConfig config)
    : config_(std::move(config))
    , dbPath_(PathUtils::resolveDatabasePath(config_.dbPath).string())
    , registry_(std::make_unique<ListenerRegistry>(pipeline_, decoyOptions(config_)))
{
}

DaemonCore::~DaemonCore() {
    shutdown();
}

void DaemonCore::printConfiguration() const {
    auto& logger = Logger::instance();
    logger.info("Database: " + dbPath_, "DaemonCore");
    for (const auto& entry : config_.listeners) {
        const auto& settings = entry.second;
        logger.info(std::string(toString(entry.first)) + " decoy: " +
                    (settings.enabled ? settings.host + ":" + std::to_string(settings.port) : "disabled"),
                    "DaemonCore");
    }
    logger.info("Max concurrent sessions per decoy: " +
                (config_.maxSessions == 0 ? std::string("unbounded") : std::to_string(config_.maxSessions)),
                "DaemonCore");
}

bool DaemonCore::initialize() {
    auto& logger = Logger::instance();
    logger.info("LureNet daemon initializing...", "DaemonCore");

    printConfiguration();

    auto opened = store_.open(dbPath_);
    if (!opened) {
        logger.critical("Cannot open event store: " + opened.error().message, "DaemonCore");
        initStatus_.result = InitializationStatus::Result::StorageFailure;
        initStatus_.message = opened.error().message;
        return false;
    }
    initialized_ = true;

    size_t enabled = 0;
    size_t started = 0;
    for (const auto& entry : config_.listeners) {
        if (!entry.second.enabled) continue;
        ++enabled;

        auto result = registry_->start(entry.first, entry.second.host, entry.second.port);
        if (result) {
            ++started;
        } else {
            logger.error(result.error().message, "DaemonCore");
            initStatus_.message += result.error().message + "; ";
        }
    }

    if (enabled > 0 && started == 0) {
        initStatus_.result = InitializationStatus::Result::NetworkFailure;
        logger.critical("No decoy could be started", "DaemonCore");
        return false;
    }

    logger.info("LureNet daemon initialized, " + std::to_string(started) + "/" +
                std::to_string(enabled) + " decoys running", "DaemonCore");
    return true;
}

void DaemonCore::run() {
    auto& logger = Logger::instance();

    std::signal(SIGINT, signalHandler);
    std::signal(SIGTERM, signalHandler);

    running_ = true;
    logger.info("Daemon running. Press Ctrl+C to stop.", "DaemonCore");

    {
        std::unique_lock<std::mutex> lock(runMutex_);
        while (!stopRequested_ && !signalReceived) {
            runCv_.wait_for(lock, std::chrono::seconds(1));
        }
    }

    if (signalReceived) {
        int sigNum = receivedSignalNum;
        logger.info("Received signal " + std::to_string(sigNum) + ", initiating shutdown", "DaemonCore");
    }

    shutdown();
}

void DaemonCore::requestStop() {
    {
        std::lock_guard<std::mutex> lock(runMutex_);
        stopRequested_ = true;
    }
    runCv_.notify_all();
}

void DaemonCore::shutdown() {
    if (!initialized_.exchange(false)) return;

    auto& logger = Logger::instance();
    logger.info("Shutting down daemon...", "DaemonCore");
    running_ = false;

    registry_->stopAll();

    logger.info("Session summary: " + MetricsCollector::instance().getMetricsSummary(), "DaemonCore");
    logger.debug("Final status: " + JsonSerializer::write(statusJson()), "DaemonCore");

    // Destroying the decoys aborts in-flight sessions and stores their partial captures
    registry_ = std::make_unique<ListenerRegistry>(pipeline_, decoyOptions(config_));

    store_.close();
    logger.info("Daemon stopped", "DaemonCore");
}

Json::Value DaemonCore::statusJson() const {
    Json::Value status(Json::objectValue);
    status["listeners"] = JsonSerializer::toJson(registry_->list());
    status["analyzer"] = JsonSerializer::toJson(analyzer_.getStatistics());
    status["metrics"] = JsonSerializer::toJson(MetricsCollector::instance().getSnapshot());
    status["uptime_seconds"] = static_cast<Json::Int64>(MetricsCollector::instance().getUptime().count());
    return status;
}

lnt::Result<Json::Value> DaemonCore::storeReport(EventStore& store, int recent) {
    auto stats = store.getAttackStatistics();
    if (!stats) {
        return stats.error();
    }
    auto attacks = store.getAttacks(recent, 0);
    if (!attacks) {
        return attacks.error();
    }
    auto alerts = store.getAlerts(recent, 0);
    if (!alerts) {
        return alerts.error();
    }

    Json::Value report(Json::objectValue);
    report["statistics"] = JsonSerializer::toJson(*stats);
    report["recent_attacks"] = JsonSerializer::toJson(*attacks);
    report["recent_alerts"] = JsonSerializer::toJson(*alerts);
    return report;
}

} // namespace LureNet
