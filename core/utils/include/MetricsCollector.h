#pragma once

#include <string>
#include <atomic>
#include <chrono>
#include <cstdint>

namespace SkipKP {

    // Snapshot structs for returning metrics (non-atomic)
    struct KeyMetricsSnapshot {
        uint64_t keysGenerated{0};
        uint64_t keysRetrieved{0};
        uint64_t keysReceived{0};
        uint64_t keysReplicated{0};
        uint64_t keysRetired{0};
        uint64_t keysExpired{0};
        uint64_t entropyRequests{0};
    };

    struct SyncMetricsSnapshot {
        uint64_t messagesSent{0};
        uint64_t messagesReceived{0};
        uint64_t sendRetries{0};
        uint64_t sendFailures{0};
        uint64_t peersWentOffline{0};
    };

    struct SecurityMetricsSnapshot {
        uint64_t authFailures{0};
        uint64_t signatureFailures{0};
        uint64_t replayRejections{0};
        uint64_t rngFailures{0};
        uint64_t storageErrors{0};
    };

    struct KeyMetrics {
        std::atomic<uint64_t> keysGenerated{0};
        std::atomic<uint64_t> keysRetrieved{0};
        std::atomic<uint64_t> keysReceived{0};
        std::atomic<uint64_t> keysReplicated{0};
        std::atomic<uint64_t> keysRetired{0};
        std::atomic<uint64_t> keysExpired{0};
        std::atomic<uint64_t> entropyRequests{0};
    };

    struct SyncMetrics {
        std::atomic<uint64_t> messagesSent{0};
        std::atomic<uint64_t> messagesReceived{0};
        std::atomic<uint64_t> sendRetries{0};
        std::atomic<uint64_t> sendFailures{0};
        std::atomic<uint64_t> peersWentOffline{0};
    };

    struct SecurityMetrics {
        std::atomic<uint64_t> authFailures{0};
        std::atomic<uint64_t> signatureFailures{0};
        std::atomic<uint64_t> replayRejections{0};
        std::atomic<uint64_t> rngFailures{0};
        std::atomic<uint64_t> storageErrors{0};
    };

    /**
     * @brief Process-wide counters, reported only through /status/health.
     */
    class MetricsCollector {
    public:
        static MetricsCollector& instance();

        // Key lifecycle
        void incrementKeysGenerated() { keyMetrics_.keysGenerated++; }
        void incrementKeysRetrieved() { keyMetrics_.keysRetrieved++; }
        void incrementKeysReceived() { keyMetrics_.keysReceived++; }
        void incrementKeysReplicated() { keyMetrics_.keysReplicated++; }
        void incrementKeysRetired() { keyMetrics_.keysRetired++; }
        void addKeysExpired(uint64_t count) { keyMetrics_.keysExpired += count; }
        void incrementEntropyRequests() { keyMetrics_.entropyRequests++; }

        // Sync
        void incrementMessagesSent() { syncMetrics_.messagesSent++; }
        void incrementMessagesReceived() { syncMetrics_.messagesReceived++; }
        void incrementSendRetries() { syncMetrics_.sendRetries++; }
        void incrementSendFailures() { syncMetrics_.sendFailures++; }
        void incrementPeersWentOffline() { syncMetrics_.peersWentOffline++; }

        // Security
        void incrementAuthFailures() { securityMetrics_.authFailures++; }
        void incrementSignatureFailures() { securityMetrics_.signatureFailures++; }
        void incrementReplayRejections() { securityMetrics_.replayRejections++; }
        void incrementRngFailures() { securityMetrics_.rngFailures++; }
        void incrementStorageErrors() { securityMetrics_.storageErrors++; }

        KeyMetricsSnapshot getKeyMetrics() const;
        SyncMetricsSnapshot getSyncMetrics() const;
        SecurityMetricsSnapshot getSecurityMetrics() const;

        std::string getMetricsSummary() const;

        void reset();

        std::chrono::seconds getUptime() const;

    private:
        MetricsCollector();
        ~MetricsCollector() = default;

        KeyMetrics keyMetrics_;
        SyncMetrics syncMetrics_;
        SecurityMetrics securityMetrics_;

        std::chrono::steady_clock::time_point startTime_;
    };

} // namespace SkipKP
