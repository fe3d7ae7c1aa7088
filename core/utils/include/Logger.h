#pragma once

#include <string>
#include <mutex>
#include <fstream>
#include <iostream>
#include <optional>

namespace WatchBridge {

    enum class LogLevel {
        DEBUG,
        INFO,
        WARN,
        ERROR,
        CRITICAL
    };

    /**
     * @brief Process-wide diagnostics sink
     *
     * Console output always goes to stderr: stdout belongs to the fsmonitor
     * protocol and must never carry anything but responses.
     */
    class Logger {
    public:
        static Logger& instance();

        void setLogFile(const std::string& path);
        void setLevel(LogLevel level);
        void setMaxFileSize(size_t maxSizeMB); // Set max log file size before rotation
        void setComponent(const std::string& component); // Set default component name
        void setConsoleEnabled(bool enabled);

        bool isDebugEnabled() const { return currentLevel_ <= LogLevel::DEBUG; }
        bool isInfoEnabled() const { return currentLevel_ <= LogLevel::INFO; }
        LogLevel getLevel() const { return currentLevel_; }

        void log(LogLevel level, const std::string& message, const std::string& component = "");

        void debug(const std::string& message, const std::string& component = "");
        void info(const std::string& message, const std::string& component = "");
        void warn(const std::string& message, const std::string& component = "");
        void error(const std::string& message, const std::string& component = "");
        void critical(const std::string& message, const std::string& component = "");

        static std::optional<LogLevel> parseLevel(const std::string& name);

    private:
        Logger() = default;
        ~Logger();

        std::mutex mutex_;
        std::ofstream logFile_;
        std::string logFilePath_;
        LogLevel currentLevel_ = LogLevel::WARN;
        std::string defaultComponent_ = "Bridge";
        bool consoleEnabled_ = true;
        size_t maxFileSizeMB_ = 100;
        size_t currentFileSize_ = 0;

        std::string levelToString(LogLevel level);
        std::string getCurrentTime();
        void rotateLogFile();
        void checkAndRotate();
        size_t getFileSize();
    };

}
