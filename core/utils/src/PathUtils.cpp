#include "PathUtils.h"
#include <cstdlib>

namespace LureNet {

std::filesystem::path PathUtils::getHome() {
    if (const char* home = std::getenv("HOME")) {
        return std::filesystem::path(home);
    }
    return {};
}

std::filesystem::path PathUtils::getConfigDir() {
    if (const char* config = std::getenv("XDG_CONFIG_HOME")) {
        return std::filesystem::path(config) / "lurenet";
    }
    auto home = getHome();
    if (home.empty()) {
        return std::filesystem::temp_directory_path() / "lurenet";
    }
    return home / ".config" / "lurenet";
}

std::filesystem::path PathUtils::getDataDir() {
    if (const char* data = std::getenv("XDG_DATA_HOME")) {
        return std::filesystem::path(data) / "lurenet";
    }
    auto home = getHome();
    if (home.empty()) {
        return std::filesystem::temp_directory_path() / "lurenet";
    }
    return home / ".local" / "share" / "lurenet";
}

std::filesystem::path PathUtils::getConfigPath() {
    return getConfigDir() / "lurenet.conf";
}

std::filesystem::path PathUtils::resolveDatabasePath(const std::string& explicitPath) {
    if (!explicitPath.empty()) {
        return explicitPath;
    }
    if (const char* envPath = std::getenv("LURENET_DB_PATH")) {
        if (*envPath != '\0') {
            return std::filesystem::path(envPath);
        }
    }
    return getDataDir() / "honeypot.db";
}

bool PathUtils::ensureDirectory(const std::filesystem::path& dir, std::string& error) {
    if (dir.empty()) {
        return true;
    }
    std::error_code ec;
    if (!std::filesystem::exists(dir, ec)) {
        std::filesystem::create_directories(dir, ec);
    }
    if (ec) {
        error = "Failed to create directory: " + dir.string() + " (" + ec.message() + ")";
        return false;
    }
    return true;
}

} // namespace LureNet
