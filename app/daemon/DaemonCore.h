#pragma once

#include "AlertPolicy.h"
#include "CapturePipeline.h"
#include "Config.h"
#include "EventStore.h"
#include "ListenerRegistry.h"
#include "Logger.h"
#include "Result.h"
#include "ThreatAnalyzer.h"
#include <atomic>
#include <condition_variable>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <json/json.h>

namespace LureNet {

/**
 * @brief Startup settings for one decoy
 */
struct ListenerSettings {
    bool enabled = true;
    std::string host;
    int port = 0;
    int readTimeoutSec = lnt::config::SESSION_READ_TIMEOUT_SEC;
};

/**
 * @brief Configuration for daemon startup
 */
struct DaemonConfig {
    std::string dbPath;         // Empty = resolve from environment/data dir
    std::string logFile;        // Empty = console only
    LogLevel logLevel = LogLevel::INFO;
    size_t logMaxSizeMb = 100;
    size_t maxSessions = 0;     // 0 = unbounded
    std::map<Protocol, ListenerSettings> listeners;

    static DaemonConfig defaults();

    /**
     * @brief Overlay file settings on the defaults
     * @return InvalidConfig for a malformed port, timeout, size or log level
     */
    static lnt::Result<DaemonConfig> fromConfig(const Config& config);

    /// Flatten back into key=value form, used for the template file
    Config toConfig() const;

    static std::unordered_map<std::string, Config::Validator> schema();
};

/**
 * @brief Core daemon orchestrator
 *
 * Owns the shared services and wires them into the decoys. Members are
 * declared so the registry is destroyed first and the store last.
 */
class DaemonCore {
public:
    explicit DaemonCore(DaemonConfig config);
    ~DaemonCore();

    DaemonCore(const DaemonCore&) = delete;
    DaemonCore& operator=(const DaemonCore&) = delete;

    /**
     * @brief Open the event store and start every enabled decoy
     * @return false if the store cannot be opened or no enabled decoy could bind
     */
    bool initialize();

    /**
     * @brief Block until SIGINT/SIGTERM or requestStop(), then shut down
     */
    void run();

    void requestStop();

    /**
     * @brief Stop decoys, abort their sessions and close the store
     */
    void shutdown();

    bool isRunning() const { return running_; }

    EventStore& store() { return store_; }
    ThreatAnalyzer& analyzer() { return analyzer_; }
    ListenerRegistry& registry() { return *registry_; }
    const DaemonConfig& getConfig() const { return config_; }

    struct InitializationStatus {
        enum class Result {
            Success,
            StorageFailure,
            NetworkFailure,
        } result = Result::Success;
        std::string message;
    };

    const InitializationStatus& getInitializationStatus() const { return initStatus_; }

    /// Listeners, in-memory analyzer statistics and counters
    Json::Value statusJson() const;

    /**
     * @brief Persisted statistics plus the most recent attacks and alerts
     */
    static lnt::Result<Json::Value> storeReport(EventStore& store, int recent = 10);

private:
    DaemonConfig config_;
    std::string dbPath_;

    EventStore store_;
    ThreatAnalyzer analyzer_;
    AlertPolicy alertPolicy_{store_};
    CapturePipeline pipeline_{analyzer_, store_, alertPolicy_};
    std::unique_ptr<ListenerRegistry> registry_;

    std::atomic<bool> initialized_{false};
    std::atomic<bool> running_{false};
    std::atomic<bool> stopRequested_{false};
    std::mutex runMutex_;
    std::condition_variable runCv_;
    InitializationStatus initStatus_;

    void printConfiguration() const;
};

} // namespace LureNet
