#pragma once

#include <string>
#include <mutex>
#include <fstream>
#include <iostream>
#include <atomic>

namespace SkipKP {

    enum class LogLevel {
        DEBUG,
        INFO,
        WARN,
        ERROR,
        CRITICAL
    };

    /**
     * @brief Parse a level name (DEBUG, INFO, WARN, ERROR, CRITICAL).
     * @return false when @p name is not a level; @p out is left untouched.
     */
    bool parseLogLevel(const std::string& name, LogLevel& out);

    class Logger {
    public:
        static Logger& instance();

        bool setLogFile(const std::string& path);
        void setLevel(LogLevel level);
        void setMaxFileSize(size_t maxSizeMB); // rotate once the file exceeds this
        void setConsoleOutput(bool enabled);

        bool isDebugEnabled() const { return currentLevel_ <= LogLevel::DEBUG; }
        LogLevel getLevel() const { return currentLevel_; }

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
        size_t maxFileSizeMB_ = 100;
        size_t currentFileSize_ = 0;

        static const char* levelToString(LogLevel level);
        static std::string getCurrentTime();
        void writeEntry(LogLevel level, const std::string& entry);
        void rotateLogFile();
        size_t getFileSize() const;
    };

    /// Shorten a key ID for log output
    std::string shortId(const std::string& keyId);

}
