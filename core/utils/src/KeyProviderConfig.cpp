#include "KeyProviderConfig.h"
#include "Config.h"
#include "Constants.h"
#include "Logger.h"

#include <set>
#include <sstream>
#include <stdexcept>

namespace SkipKP {

    namespace {

        bool isInteger(const std::string&, const std::string& value) {
            try {
                size_t consumed = 0;
                std::stoll(value, &consumed);
                return consumed == value.size();
            } catch (const std::logic_error&) {
                return false;
            }
        }

        bool isBoolean(const std::string&, const std::string& value) {
            static const std::set<std::string> accepted = {
                "1", "0", "true", "false", "yes", "no", "on", "off",
                "TRUE", "FALSE", "True", "False"
            };
            return accepted.count(value) > 0;
        }

        const std::vector<std::string> kIntegerKeys = {
            "listen_port", "worker_threads",
            "default_key_size", "min_key_size", "max_key_size", "default_entropy_size",
            "key_expiry_seconds", "max_stored_keys", "sweep_interval",
            "sync_interval", "heartbeat_interval", "missed_threshold",
            "max_retry_attempts", "retry_backoff_ms", "sync_timeout",
            "replay_window_seconds", "log_max_size_mb"
        };

    } // namespace

    KeyProviderConfig::KeyProviderConfig()
        : listenAddress(skp::config::DEFAULT_LISTEN_ADDRESS),
          listenPort(skp::config::DEFAULT_LISTEN_PORT),
          workerThreads(skp::config::DEFAULT_WORKER_THREADS),
          localSystemId("KP_QuIIN_Server"),
          remoteSystemIds{"KP_QuIIN_Client", "KP_*_Test", "KP_Development_*"},
          algorithm("TLS_DHE_PSK_WITH_AES_256_CBC_SHA384"),
          defaultKeySize(skp::config::DEFAULT_KEY_SIZE_BITS),
          minKeySize(skp::config::MIN_KEY_SIZE_BITS),
          maxKeySize(skp::config::MAX_KEY_SIZE_BITS),
          defaultEntropySize(skp::config::DEFAULT_ENTROPY_BITS),
          keyExpiry(skp::config::DEFAULT_KEY_EXPIRY_SEC),
          maxStoredKeys(skp::config::DEFAULT_MAX_STORED_KEYS),
          sweepInterval(skp::config::DEFAULT_SWEEP_INTERVAL_SEC),
          storageBackend(StorageBackend::SQLite),
          dbPath("skip_kp.db"),
          syncEnabled(true),
          syncInterval(std::chrono::seconds(skp::config::DEFAULT_SYNC_INTERVAL_SEC)),
          heartbeatInterval(std::chrono::seconds(skp::config::DEFAULT_HEARTBEAT_INTERVAL_SEC)),
          missedThreshold(skp::config::DEFAULT_MISSED_THRESHOLD),
          maxRetryAttempts(skp::config::DEFAULT_MAX_RETRY_ATTEMPTS),
          retryBackoff(skp::config::DEFAULT_RETRY_BACKOFF_MS),
          syncTimeout(std::chrono::seconds(skp::config::DEFAULT_SYNC_TIMEOUT_SEC)),
          replayWindow(skp::config::DEFAULT_REPLAY_WINDOW_SEC),
          logLevel("INFO"),
          logMaxSizeMB(skp::config::MAX_LOG_FILE_SIZE_MB) {}

    skp::Result<KeyProviderConfig> KeyProviderConfig::fromConfig(const Config& config) {
        std::unordered_map<std::string, Config::Validator> schema;
        for (const auto& key : kIntegerKeys) {
            schema[key] = isInteger;
        }
        schema["sync_enabled"] = isBoolean;

        auto malformed = config.validate(schema);
        if (!malformed.empty()) {
            std::string joined;
            for (const auto& key : malformed) {
                joined += (joined.empty() ? "" : ", ") + key;
            }
            return skp::Err<KeyProviderConfig>(skp::ErrorCode::InvalidConfig, "Malformed value for: " + joined);
        }

        KeyProviderConfig cfg;

        cfg.listenAddress = config.get("listen_address", cfg.listenAddress);
        cfg.listenPort = config.getInt("listen_port", cfg.listenPort);
        cfg.workerThreads = config.getSize("worker_threads", cfg.workerThreads);

        cfg.localSystemId = config.get("local_system_id", cfg.localSystemId);
        if (config.hasKey("remote_system_ids")) {
            cfg.remoteSystemIds = config.getList("remote_system_ids");
        }
        cfg.algorithm = config.get("algorithm", cfg.algorithm);

        cfg.defaultKeySize = config.getInt("default_key_size", cfg.defaultKeySize);
        cfg.minKeySize = config.getInt("min_key_size", cfg.minKeySize);
        cfg.maxKeySize = config.getInt("max_key_size", cfg.maxKeySize);
        cfg.defaultEntropySize = config.getInt("default_entropy_size", cfg.defaultEntropySize);

        cfg.keyExpiry = std::chrono::seconds(config.getInt("key_expiry_seconds", static_cast<int>(cfg.keyExpiry.count())));
        cfg.maxStoredKeys = config.getSize("max_stored_keys", cfg.maxStoredKeys);
        cfg.sweepInterval = std::chrono::seconds(config.getInt("sweep_interval", static_cast<int>(cfg.sweepInterval.count())));

        std::string backend = config.get("storage_backend", "sqlite");
        if (backend == "sqlite") {
            cfg.storageBackend = StorageBackend::SQLite;
        } else if (backend == "memory") {
            cfg.storageBackend = StorageBackend::Memory;
        } else {
            return skp::Err<KeyProviderConfig>(skp::ErrorCode::InvalidConfig,
                "storage_backend must be 'sqlite' or 'memory', got '" + backend + "'");
        }
        cfg.dbPath = config.get("db_path", cfg.dbPath);

        cfg.syncEnabled = config.getBool("sync_enabled", cfg.syncEnabled);
        cfg.syncInterval = std::chrono::seconds(config.getInt("sync_interval", skp::config::DEFAULT_SYNC_INTERVAL_SEC));
        cfg.heartbeatInterval = std::chrono::seconds(config.getInt("heartbeat_interval", skp::config::DEFAULT_HEARTBEAT_INTERVAL_SEC));
        cfg.missedThreshold = config.getInt("missed_threshold", cfg.missedThreshold);
        cfg.maxRetryAttempts = config.getInt("max_retry_attempts", cfg.maxRetryAttempts);
        cfg.retryBackoff = std::chrono::milliseconds(config.getInt("retry_backoff_ms", skp::config::DEFAULT_RETRY_BACKOFF_MS));
        cfg.syncTimeout = std::chrono::seconds(config.getInt("sync_timeout", skp::config::DEFAULT_SYNC_TIMEOUT_SEC));
        cfg.replayWindow = std::chrono::seconds(config.getInt("replay_window_seconds", skp::config::DEFAULT_REPLAY_WINDOW_SEC));

        for (const auto& id : config.getList("sync_peers")) {
            PeerConfig peer;
            peer.systemId = id;
            peer.endpoint = config.get("peer." + id + ".endpoint");
            peer.port = config.getInt("peer." + id + ".port", 0);
            peer.sharedSecret = config.get("peer." + id + ".shared_secret");
            cfg.peers.push_back(std::move(peer));
        }

        cfg.logLevel = config.get("log_level", cfg.logLevel);
        cfg.logFile = config.get("log_file", cfg.logFile);
        cfg.logMaxSizeMB = config.getSize("log_max_size_mb", cfg.logMaxSizeMB);

        auto problems = cfg.validate();
        if (!problems.empty()) {
            std::ostringstream oss;
            for (size_t i = 0; i < problems.size(); ++i) {
                if (i) oss << "; ";
                oss << problems[i];
            }
            return skp::Err<KeyProviderConfig>(skp::ErrorCode::InvalidConfig, oss.str());
        }
        return cfg;
    }

    std::vector<std::string> KeyProviderConfig::validate() const {
        std::vector<std::string> errors;

        if (listenPort < 0 || listenPort > 65535) {
            errors.push_back("listen_port must be between 0 and 65535");
        }
        if (workerThreads == 0) {
            errors.push_back("worker_threads must be positive");
        }

        if (localSystemId.empty()) {
            errors.push_back("local_system_id cannot be empty");
        }
        if (remoteSystemIds.empty()) {
            errors.push_back("remote_system_ids must contain at least one pattern");
        }

        if (minKeySize < skp::config::MIN_KEY_SIZE_BITS || maxKeySize > skp::config::MAX_KEY_SIZE_BITS ||
            minKeySize > maxKeySize) {
            errors.push_back("key size bounds must satisfy 128 <= min_key_size <= max_key_size <= 512");
        }
        if (minKeySize % 8 != 0 || maxKeySize % 8 != 0) {
            errors.push_back("key size bounds must be multiples of 8");
        }
        if (defaultKeySize < minKeySize || defaultKeySize > maxKeySize || defaultKeySize % 8 != 0) {
            errors.push_back("default_key_size must be a multiple of 8 between min_key_size and max_key_size");
        }
        if (defaultEntropySize < skp::config::MIN_ENTROPY_BITS || defaultEntropySize > skp::config::MAX_ENTROPY_BITS ||
            defaultEntropySize % 8 != 0) {
            errors.push_back("default_entropy_size must be a multiple of 8 between 8 and 2048");
        }

        if (keyExpiry.count() <= 0) {
            errors.push_back("key_expiry_seconds must be positive");
        }
        if (maxStoredKeys == 0) {
            errors.push_back("max_stored_keys must be positive");
        }
        if (sweepInterval.count() <= 0) {
            errors.push_back("sweep_interval must be positive");
        }
        if (storageBackend == StorageBackend::SQLite && dbPath.empty()) {
            errors.push_back("db_path cannot be empty with the sqlite backend");
        }

        if (syncInterval.count() <= 0 || heartbeatInterval.count() <= 0) {
            errors.push_back("sync_interval and heartbeat_interval must be positive");
        }
        if (missedThreshold < 1) {
            errors.push_back("missed_threshold must be at least 1");
        }
        if (maxRetryAttempts < 0) {
            errors.push_back("max_retry_attempts cannot be negative");
        }
        if (retryBackoff.count() < 0 || syncTimeout.count() <= 0) {
            errors.push_back("retry_backoff_ms cannot be negative and sync_timeout must be positive");
        }
        if (replayWindow.count() <= 0) {
            errors.push_back("replay_window_seconds must be positive");
        }

        LogLevel level;
        if (!parseLogLevel(logLevel, level)) {
            errors.push_back("log_level must be DEBUG, INFO, WARN or ERROR");
        }

        std::set<std::string> ids;
        std::set<std::string> secrets;
        for (const auto& peer : peers) {
            if (peer.systemId == localSystemId) {
                errors.push_back("peer " + peer.systemId + " has the local system id");
            }
            if (!ids.insert(peer.systemId).second) {
                errors.push_back("peer " + peer.systemId + " is configured twice");
            }
            if (peer.endpoint.empty()) {
                errors.push_back("peer." + peer.systemId + ".endpoint is missing");
            }
            if (peer.port <= 0 || peer.port > 65535) {
                errors.push_back("peer." + peer.systemId + ".port must be between 1 and 65535");
            }
            if (peer.sharedSecret.size() < skp::config::MIN_SHARED_SECRET_BYTES) {
                errors.push_back("peer." + peer.systemId + ".shared_secret must be at least 32 bytes");
            } else if (!secrets.insert(peer.sharedSecret).second) {
                errors.push_back("peer." + peer.systemId + ".shared_secret is reused by another peer");
            }
        }

        return errors;
    }

    const PeerConfig* KeyProviderConfig::findPeer(const std::string& systemId) const {
        for (const auto& peer : peers) {
            if (peer.systemId == systemId) {
                return &peer;
            }
        }
        return nullptr;
    }

}
