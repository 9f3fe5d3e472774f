#pragma once

#include <filesystem>
#include <string>

namespace LureNet {

class PathUtils {
public:
    /// $HOME, or an empty path when unset
    static std::filesystem::path getHome();
    static std::filesystem::path getConfigDir();
    static std::filesystem::path getDataDir();
    static std::filesystem::path getConfigPath();

    /**
     * @brief Resolve where the event database lives
     *
     * An explicit path wins, then LURENET_DB_PATH, then the data dir.
     */
    static std::filesystem::path resolveDatabasePath(const std::string& explicitPath = "");

    /// Create dir and parents; returns false and leaves a message in error on failure
    static bool ensureDirectory(const std::filesystem::path& dir, std::string& error);
};

} // namespace LureNet
