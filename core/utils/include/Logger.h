#pragma once

#include <atomic>
#include <cstddef>
#include <fstream>
#include <mutex>
#include <optional>
#include <string>

namespace LureNet {

    enum class LogLevel {
        DEBUG,
        INFO,
        WARN,
        ERROR,
        CRITICAL
    };

    /// Accepts debug/info/warn/warning/error/critical in any case
    std::optional<LogLevel> logLevelFromString(const std::string& value);

    class Logger {
    public:
        static Logger& instance();

        void setLogFile(const std::string& path);
        void setLevel(LogLevel level);
        void setMaxFileSize(size_t maxSizeMB); // rotate once the file grows past this
        void setComponent(const std::string& component);
        void setConsoleOutput(bool enabled);

        bool isDebugEnabled() const { return currentLevel_ <= LogLevel::DEBUG; }
        bool isInfoEnabled() const { return currentLevel_ <= LogLevel::INFO; }
        LogLevel getLevel() const { return currentLevel_; }

        static std::string levelToString(LogLevel level);

        void log(LogLevel level, const std::string& message, const std::string& component = "");

        void debug(const std::string& message, const std::string& component = "");
        void info(const std::string& message, const std::string& component = "");
        void warn(const std::string& message, const std::string& component = "");
        void error(const std::string& message, const std::string& component = "");
        void critical(const std::string& message, const std::string& component = "");

    private:
        Logger() = default;
        ~Logger();

        std::mutex mutex_;
        std::ofstream logFile_;
        std::string logFilePath_;
        std::atomic<LogLevel> currentLevel_{LogLevel::INFO};
        std::atomic<bool> consoleOutput_{true};
        std::string defaultComponent_ = "LureNet";
        size_t maxFileSizeMB_ = 100;
        size_t currentFileSize_ = 0;

        static std::string getCurrentTime();
        void write(LogLevel level, const std::string& logEntry);
        void rotateLogFile();
        void checkAndRotate();
        size_t getFileSize();
    };

}
