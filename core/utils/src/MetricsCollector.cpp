#include "MetricsCollector.h"
#include <sstream>

namespace SkipKP {

    MetricsCollector::MetricsCollector()
        : startTime_(std::chrono::steady_clock::now()) {
    }

    MetricsCollector& MetricsCollector::instance() {
        static MetricsCollector instance;
        return instance;
    }

    KeyMetricsSnapshot MetricsCollector::getKeyMetrics() const {
        KeyMetricsSnapshot snap;
        snap.keysGenerated = keyMetrics_.keysGenerated.load();
        snap.keysRetrieved = keyMetrics_.keysRetrieved.load();
        snap.keysReceived = keyMetrics_.keysReceived.load();
        snap.keysReplicated = keyMetrics_.keysReplicated.load();
        snap.keysRetired = keyMetrics_.keysRetired.load();
        snap.keysExpired = keyMetrics_.keysExpired.load();
        snap.entropyRequests = keyMetrics_.entropyRequests.load();
        return snap;
    }

    SyncMetricsSnapshot MetricsCollector::getSyncMetrics() const {
        SyncMetricsSnapshot snap;
        snap.messagesSent = syncMetrics_.messagesSent.load();
        snap.messagesReceived = syncMetrics_.messagesReceived.load();
        snap.sendRetries = syncMetrics_.sendRetries.load();
        snap.sendFailures = syncMetrics_.sendFailures.load();
        snap.peersWentOffline = syncMetrics_.peersWentOffline.load();
        return snap;
    }

    SecurityMetricsSnapshot MetricsCollector::getSecurityMetrics() const {
        SecurityMetricsSnapshot snap;
        snap.authFailures = securityMetrics_.authFailures.load();
        snap.signatureFailures = securityMetrics_.signatureFailures.load();
        snap.replayRejections = securityMetrics_.replayRejections.load();
        snap.rngFailures = securityMetrics_.rngFailures.load();
        snap.storageErrors = securityMetrics_.storageErrors.load();
        return snap;
    }

    std::string MetricsCollector::getMetricsSummary() const {
        std::stringstream ss;

        auto uptime = getUptime();
        auto hours = std::chrono::duration_cast<std::chrono::hours>(uptime).count();
        auto minutes = std::chrono::duration_cast<std::chrono::minutes>(uptime % std::chrono::hours(1)).count();

        auto keys = getKeyMetrics();
        auto sync = getSyncMetrics();
        auto sec = getSecurityMetrics();

        ss << "=== SKIP Key Provider Metrics ===" << std::endl;
        ss << "Uptime: " << hours << "h " << minutes << "m" << std::endl << std::endl;

        ss << "--- Keys ---" << std::endl;
        ss << "  Generated: " << keys.keysGenerated << std::endl;
        ss << "  Retrieved: " << keys.keysRetrieved << std::endl;
        ss << "  Received from peers: " << keys.keysReceived << std::endl;
        ss << "  Replicated to peers: " << keys.keysReplicated << std::endl;
        ss << "  Retired after sync: " << keys.keysRetired << std::endl;
        ss << "  Expired: " << keys.keysExpired << std::endl;
        ss << "  Entropy requests: " << keys.entropyRequests << std::endl << std::endl;

        ss << "--- Sync ---" << std::endl;
        ss << "  Messages sent: " << sync.messagesSent << std::endl;
        ss << "  Messages received: " << sync.messagesReceived << std::endl;
        ss << "  Retries: " << sync.sendRetries << std::endl;
        ss << "  Failed sends: " << sync.sendFailures << std::endl;
        ss << "  Peers gone offline: " << sync.peersWentOffline << std::endl << std::endl;

        ss << "--- Security ---" << std::endl;
        ss << "  Authorization failures: " << sec.authFailures << std::endl;
        ss << "  Signature failures: " << sec.signatureFailures << std::endl;
        ss << "  Replay rejections: " << sec.replayRejections << std::endl;
        ss << "  RNG failures: " << sec.rngFailures << std::endl;
        ss << "  Storage errors: " << sec.storageErrors << std::endl;

        return ss.str();
    }

    void MetricsCollector::reset() {
        keyMetrics_.keysGenerated = 0;
        keyMetrics_.keysRetrieved = 0;
        keyMetrics_.keysReceived = 0;
        keyMetrics_.keysReplicated = 0;
        keyMetrics_.keysRetired = 0;
        keyMetrics_.keysExpired = 0;
        keyMetrics_.entropyRequests = 0;

        syncMetrics_.messagesSent = 0;
        syncMetrics_.messagesReceived = 0;
        syncMetrics_.sendRetries = 0;
        syncMetrics_.sendFailures = 0;
        syncMetrics_.peersWentOffline = 0;

        securityMetrics_.authFailures = 0;
        securityMetrics_.signatureFailures = 0;
        securityMetrics_.replayRejections = 0;
        securityMetrics_.rngFailures = 0;
        securityMetrics_.storageErrors = 0;

        startTime_ = std::chrono::steady_clock::now();
    }

    std::chrono::seconds MetricsCollector::getUptime() const {
        return std::chrono::duration_cast<std::chrono::seconds>(std::chrono::steady_clock::now() - startTime_);
    }

} // namespace SkipKP
