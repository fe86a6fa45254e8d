#include <iostream>
#include <string>
#include <cstdlib>
#include <filesystem>
#include "Config.h"
#include "KeyProviderConfig.h"
#include "KeyProviderDaemon.h"
#include "Logger.h"
#include "Version.h"

using namespace SkipKP;

namespace {

void printUsage(const char* program) {
    std::cout << "SKIP Key Provider " << Version::STRING << std::endl;
    std::cout << "\nUsage: " << program << " [OPTIONS]" << std::endl;
    std::cout << "\nOptions:" << std::endl;
    std::cout << "  --config <PATH>       Configuration file (default: $SKIP_KP_CONFIG)" << std::endl;
    std::cout << "  --port <PORT>         Listen port, overrides listen_port" << std::endl;
    std::cout << "  --log-level <LEVEL>   DEBUG, INFO, WARN or ERROR, overrides log_level" << std::endl;
    std::cout << "  --help                Show this help message" << std::endl;
}

} // namespace

int main(int argc, char* argv[]) {
    auto& logger = Logger::instance();

    std::string configPath;
    if (const char* env = std::getenv("SKIP_KP_CONFIG")) {
        configPath = env;
    }
    std::string portOverride;
    std::string levelOverride;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "--config" && i + 1 < argc) {
            configPath = argv[++i];
        }
        else if (arg == "--port" && i + 1 < argc) {
            portOverride = argv[++i];
        }
        else if (arg == "--log-level" && i + 1 < argc) {
            levelOverride = argv[++i];
        }
        else if (arg == "--help") {
            printUsage(argv[0]);
            return 0;
        }
        else {
            std::cerr << "Unknown option: " << arg << std::endl;
            printUsage(argv[0]);
            return 2;
        }
    }

    Config fileConfig;
    if (!configPath.empty()) {
        if (!fileConfig.loadFromFile(configPath)) {
            std::cerr << "Cannot read configuration file: " << configPath << std::endl;
            return 1;
        }
    }
    if (!portOverride.empty()) {
        fileConfig.set("listen_port", portOverride);
    }
    if (!levelOverride.empty()) {
        fileConfig.set("log_level", levelOverride);
    }

    auto config = KeyProviderConfig::fromConfig(fileConfig);
    if (!config) {
        std::cerr << "Invalid configuration: " << config.error().message << std::endl;
        return 1;
    }

    LogLevel level = LogLevel::INFO;
    if (!parseLogLevel(config->logLevel, level)) {
        std::cerr << "Unknown log level " << config->logLevel << ", using INFO" << std::endl;
    }
    logger.setLevel(level);
    logger.setMaxFileSize(config->logMaxSizeMB);
    if (!config->logFile.empty()) {
        std::filesystem::path logPath(config->logFile);
        std::error_code ec;
        if (logPath.has_parent_path()) {
            std::filesystem::create_directories(logPath.parent_path(), ec);
        }
        if (!logger.setLogFile(config->logFile)) {
            std::cerr << "Cannot open log file " << config->logFile << ", logging to console only" << std::endl;
        }
    }

    logger.log(LogLevel::INFO, "=== SKIP Key Provider " + std::string(Version::STRING) + " starting ===", "Daemon");
    if (configPath.empty()) {
        logger.log(LogLevel::WARN, "No configuration file given, running with defaults", "Daemon");
    }

    KeyProviderDaemon daemon(std::move(*config));
    auto initialized = daemon.initialize();
    if (!initialized) {
        std::cerr << "Failed to start: " << initialized.error().message << std::endl;
        return 1;
    }

    daemon.run();
    return 0;
}
