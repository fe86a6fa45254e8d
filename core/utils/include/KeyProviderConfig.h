#pragma once

/**
 * @file KeyProviderConfig.h
 * @brief Immutable, validated configuration value for the Key Provider
 *
 * Built once at startup from the raw Config and handed by value to every
 * component constructor. Nothing reads configuration after startup.
 */

#include "Result.h"

#include <chrono>
#include <string>
#include <vector>

namespace SkipKP {

    class Config;

    /**
     * @brief A configured sync peer.
     */
    struct PeerConfig {
        std::string systemId;
        std::string endpoint;
        int port = 0;
        std::string sharedSecret;
    };

    enum class StorageBackend {
        SQLite,
        Memory
    };

    struct KeyProviderConfig {
        // Listener
        std::string listenAddress;
        int listenPort;
        std::size_t workerThreads;

        // Identity and capabilities
        std::string localSystemId;
        std::vector<std::string> remoteSystemIds;
        std::string algorithm;

        // Key and entropy sizes (bits)
        int defaultKeySize;
        int minKeySize;
        int maxKeySize;
        int defaultEntropySize;

        // Key lifecycle
        std::chrono::seconds keyExpiry;
        std::size_t maxStoredKeys;
        std::chrono::seconds sweepInterval;

        // Storage
        StorageBackend storageBackend;
        std::string dbPath;

        // Peer synchronization
        bool syncEnabled;
        std::chrono::milliseconds syncInterval;
        std::chrono::milliseconds heartbeatInterval;
        int missedThreshold;
        int maxRetryAttempts;
        std::chrono::milliseconds retryBackoff;
        std::chrono::milliseconds syncTimeout;
        std::chrono::seconds replayWindow;
        std::vector<PeerConfig> peers;

        // Logging
        std::string logLevel;
        std::string logFile;
        std::size_t logMaxSizeMB;

        /// Configuration with every default applied and no peers.
        KeyProviderConfig();

        /**
         * @brief Read and validate settings.
         *
         * Keys that are present but do not parse are reported as
         * InvalidConfig, as are all validate() failures.
         */
        static skp::Result<KeyProviderConfig> fromConfig(const Config& config);

        /// Human readable problems; empty when the configuration is usable.
        std::vector<std::string> validate() const;

        const PeerConfig* findPeer(const std::string& systemId) const;
    };

}
