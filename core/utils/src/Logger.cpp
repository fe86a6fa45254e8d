#include "Logger.h"
#include "Constants.h"
#include <chrono>
#include <iomanip>
#include <sstream>
#include <filesystem>
#include <ctime>

namespace SkipKP {

    bool parseLogLevel(const std::string& name, LogLevel& out) {
        if (name == "DEBUG" || name == "debug") { out = LogLevel::DEBUG; return true; }
        if (name == "INFO" || name == "info") { out = LogLevel::INFO; return true; }
        if (name == "WARN" || name == "warn" || name == "WARNING") { out = LogLevel::WARN; return true; }
        if (name == "ERROR" || name == "error") { out = LogLevel::ERROR; return true; }
        if (name == "CRITICAL" || name == "critical") { out = LogLevel::CRITICAL; return true; }
        return false;
    }

    std::string shortId(const std::string& keyId) {
        if (keyId.size() <= skp::config::LOGGED_KEY_ID_CHARS) {
            return keyId;
        }
        return keyId.substr(0, skp::config::LOGGED_KEY_ID_CHARS) + "...";
    }

    Logger& Logger::instance() {
        static Logger instance;
        return instance;
    }

    Logger::~Logger() {
        if (logFile_.is_open()) {
            logFile_.close();
        }
    }

    bool Logger::setLogFile(const std::string& path) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (logFile_.is_open()) {
            logFile_.close();
        }
        logFilePath_ = path;
        if (path.empty()) {
            return true;
        }
        logFile_.open(path, std::ios::app);
        currentFileSize_ = getFileSize();
        return logFile_.is_open();
    }

    void Logger::setMaxFileSize(size_t maxSizeMB) {
        std::lock_guard<std::mutex> lock(mutex_);
        maxFileSizeMB_ = maxSizeMB;
    }

    void Logger::setLevel(LogLevel level) {
        currentLevel_ = level;
    }

    void Logger::setConsoleOutput(bool enabled) {
        consoleOutput_ = enabled;
    }

    void Logger::log(LogLevel level, const std::string& message, const std::string& component) {
        if (level < currentLevel_) {
            return;
        }

        std::string comp = component.empty() ? "Core" : component;
        std::string logEntry = "[" + getCurrentTime() + "] [" + levelToString(level) + "] [" + comp + "] " + message;

        std::lock_guard<std::mutex> lock(mutex_);
        writeEntry(level, logEntry);

        if (logFile_.is_open() && currentFileSize_ > maxFileSizeMB_ * 1024 * 1024) {
            rotateLogFile();
        }
    }

    void Logger::writeEntry(LogLevel level, const std::string& entry) {
        if (consoleOutput_) {
            if (level == LogLevel::ERROR || level == LogLevel::CRITICAL) {
                std::cerr << "\033[1;31m" << entry << "\033[0m" << std::endl;
            } else if (level == LogLevel::WARN) {
                std::cout << "\033[1;33m" << entry << "\033[0m" << std::endl;
            } else {
                std::cout << entry << std::endl;
            }
        }

        if (logFile_.is_open()) {
            logFile_ << entry << std::endl;
            currentFileSize_ += entry.length() + 1;
        }
    }

    void Logger::debug(const std::string& message, const std::string& component) {
        log(LogLevel::DEBUG, message, component);
    }

    void Logger::info(const std::string& message, const std::string& component) {
        log(LogLevel::INFO, message, component);
    }

    void Logger::warn(const std::string& message, const std::string& component) {
        log(LogLevel::WARN, message, component);
    }

    void Logger::error(const std::string& message, const std::string& component) {
        log(LogLevel::ERROR, message, component);
    }

    void Logger::critical(const std::string& message, const std::string& component) {
        log(LogLevel::CRITICAL, message, component);
    }

    const char* Logger::levelToString(LogLevel level) {
        switch (level) {
            case LogLevel::DEBUG: return "DEBUG";
            case LogLevel::INFO: return "INFO";
            case LogLevel::WARN: return "WARN";
            case LogLevel::ERROR: return "ERROR";
            case LogLevel::CRITICAL: return "CRITICAL";
            default: return "UNKNOWN";
        }
    }

    std::string Logger::getCurrentTime() {
        auto now = std::chrono::system_clock::now();
        auto in_time_t = std::chrono::system_clock::to_time_t(now);

        std::stringstream ss;
        struct tm tm_buf;
        localtime_r(&in_time_t, &tm_buf);
        ss << std::put_time(&tm_buf, "%Y-%m-%d %H:%M:%S");
        return ss.str();
    }

    // Caller holds mutex_.
    void Logger::rotateLogFile() {
        if (logFilePath_.empty()) {
            return;
        }

        logFile_.close();

        auto in_time_t = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
        std::stringstream ss;
        struct tm tm_buf;
        localtime_r(&in_time_t, &tm_buf);
        ss << std::put_time(&tm_buf, "%Y%m%d_%H%M%S");
        std::string rotatedPath = logFilePath_ + "." + ss.str();

        std::error_code ec;
        std::filesystem::rename(logFilePath_, rotatedPath, ec);
        if (ec) {
            std::cerr << "Failed to rotate log file: " << ec.message() << std::endl;
        }

        logFile_.open(logFilePath_, std::ios::app);
        currentFileSize_ = 0;

        writeEntry(LogLevel::INFO, "[" + getCurrentTime() + "] [INFO] [Logger] Log file rotated to: " + rotatedPath);
    }

    size_t Logger::getFileSize() const {
        std::error_code ec;
        auto size = std::filesystem::file_size(logFilePath_, ec);
        return ec ? 0 : static_cast<size_t>(size);
    }

}
