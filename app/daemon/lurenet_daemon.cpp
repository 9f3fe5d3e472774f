#include <filesystem>
#include <iostream>
#include <map>
#include <string>
#include "Config.h"
#include "DaemonCore.h"
#include "JsonSerializer.h"
#include "Logger.h"
#include "PathUtils.h"

using namespace LureNet;

namespace {

void printUsage(const char* argv0) {
    std::cout << "LureNet Daemon - multi-protocol honeypot" << std::endl;
    std::cout << "\nUsage: " << argv0 << " [OPTIONS]" << std::endl;
    std::cout << "\nOptions:" << std::endl;
    std::cout << "  --config <FILE>        Configuration file (default: " << PathUtils::getConfigPath().string() << ")" << std::endl;
    std::cout << "  --db <PATH>            Event database (overrides db_path and LURENET_DB_PATH)" << std::endl;
    std::cout << "  --ssh-port <PORT>      SSH decoy port (default: 2222)" << std::endl;
    std::cout << "  --http-port <PORT>     HTTP decoy port (default: 8080)" << std::endl;
    std::cout << "  --ftp-port <PORT>      FTP decoy port (default: 2121)" << std::endl;
    std::cout << "  --stats                Print stored statistics as JSON and exit" << std::endl;
    std::cout << "  --help                 Show this help message" << std::endl;
}

bool parsePort(const std::string& text, int& port) {
    try {
        size_t consumed = 0;
        int value = std::stoi(text, &consumed);
        if (consumed != text.size() || value < 0 || value > 65535) {
            return false;
        }
        port = value;
        return true;
    } catch (const std::exception&) {
        return false;
    }
}

bool loadOrCreateConfig(const std::filesystem::path& configPath, Config& fileConfig) {
    if (fileConfig.loadFromFile(configPath.string())) {
        return true;
    }

    std::string error;
    if (!PathUtils::ensureDirectory(configPath.parent_path(), error)) {
        std::cerr << "Warning: " << error << std::endl;
        return false;
    }
    auto written = DaemonConfig::defaults().toConfig().saveToFile(configPath.string());
    if (!written) {
        std::cerr << "Warning: " << written.error().message << std::endl;
        return false;
    }
    std::cout << "Created configuration template at " << configPath.string() << std::endl;
    return fileConfig.loadFromFile(configPath.string());
}

} // namespace

int main(int argc, char* argv[]) {
    std::filesystem::path configPath = PathUtils::getConfigPath();
    std::string dbOverride;
    std::map<Protocol, int> portOverrides;
    bool statsOnly = false;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "--config" && i + 1 < argc) {
            configPath = argv[++i];
        }
        else if (arg == "--db" && i + 1 < argc) {
            dbOverride = argv[++i];
        }
        else if ((arg == "--ssh-port" || arg == "--http-port" || arg == "--ftp-port") && i + 1 < argc) {
            int port = 0;
            if (!parsePort(argv[++i], port)) {
                std::cerr << "Error: invalid port for " << arg << ": " << argv[i] << std::endl;
                return 1;
            }
            Protocol protocol = arg == "--ssh-port" ? Protocol::SSH
                              : arg == "--http-port" ? Protocol::HTTP : Protocol::FTP;
            portOverrides[protocol] = port;
        }
        else if (arg == "--stats") {
            statsOnly = true;
        }
        else if (arg == "--help") {
            printUsage(argv[0]);
            return 0;
        }
        else {
            std::cerr << "Error: unknown option " << arg << std::endl;
            printUsage(argv[0]);
            return 1;
        }
    }

    Config fileConfig;
    if (!loadOrCreateConfig(configPath, fileConfig)) {
        std::cerr << "Warning: no configuration loaded, using defaults" << std::endl;
    }

    auto loaded = DaemonConfig::fromConfig(fileConfig);
    if (!loaded) {
        std::cerr << "Error: " << loaded.error().message << std::endl;
        return 1;
    }
    DaemonConfig config = std::move(loaded.value());
    if (!dbOverride.empty()) {
        config.dbPath = dbOverride;
    }
    for (const auto& entry : portOverrides) {
        config.listeners[entry.first].port = entry.second;
    }

    auto& logger = Logger::instance();
    logger.setLevel(config.logLevel);
    logger.setMaxFileSize(config.logMaxSizeMb);
    logger.setComponent("Daemon");
    if (!config.logFile.empty()) {
        logger.setLogFile(config.logFile);
    }

    if (statsOnly) {
        logger.setConsoleOutput(false);
        EventStore store;
        auto opened = store.open(PathUtils::resolveDatabasePath(config.dbPath).string());
        if (!opened) {
            std::cerr << "Error: " << opened.error().message << std::endl;
            return 1;
        }
        auto report = DaemonCore::storeReport(store);
        if (!report) {
            std::cerr << "Error: " << report.error().message << std::endl;
            return 1;
        }
        std::cout << JsonSerializer::write(*report) << std::endl;
        return 0;
    }

    logger.info("=== LureNet Daemon Starting ===", "Daemon");

    DaemonCore daemon(config);
    if (!daemon.initialize()) {
        std::cerr << "Failed to initialize daemon: " << daemon.getInitializationStatus().message << std::endl;
        return 1;
    }

    daemon.run();
    return 0;
}
