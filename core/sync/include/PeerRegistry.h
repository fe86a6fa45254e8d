#pragma once

#include "CapabilityRegistry.h"
#include "KeyProviderConfig.h"
#include "SecureBuffer.h"

#include <chrono>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace SkipKP {

enum class PeerStatus {
    Unknown,
    Online,
    Offline
};

inline const char* peerStatusToString(PeerStatus status) {
    switch (status) {
        case PeerStatus::Unknown: return "unknown";
        case PeerStatus::Online: return "online";
        case PeerStatus::Offline: return "offline";
        default: return "unknown";
    }
}

/**
 * @brief Snapshot of a peer's state. Never carries the shared secret.
 */
struct PeerInfo {
    std::string systemId;
    std::string endpoint;
    int port = 0;
    PeerStatus status = PeerStatus::Unknown;
    std::optional<std::chrono::system_clock::time_point> lastHeartbeatAt;
    std::optional<std::chrono::system_clock::time_point> lastContactAt;
    int consecutiveFailures = 0;
    std::string lastError;
    std::optional<CapabilityDescriptor> capabilities;   // diagnostics only
    bool capabilitiesSent = false;
};

/**
 * @brief Configured sync peers and their liveness state machine
 *
 * Unknown -> Online on the first successful exchange; Online -> Offline
 * after missedThreshold consecutive failed sends; Offline -> Online on the
 * next success. State moves only through the record*() calls; the
 * registry does no I/O and runs no timers.
 */
class PeerRegistry {
public:
    explicit PeerRegistry(const KeyProviderConfig& config);

    bool hasPeer(const std::string& systemId) const;
    std::optional<PeerInfo> getPeer(const std::string& systemId) const;
    std::vector<PeerInfo> getAllPeers() const;
    std::vector<std::string> peerIds() const;

    /// Shared secret for @p systemId, or nullptr for an unknown peer
    std::shared_ptr<const skp::SecureBuffer> sharedSecret(const std::string& systemId) const;

    /**
     * @brief A message to the peer was acknowledged
     * @param heartbeat the acknowledged message was a heartbeat
     * @return true if the peer just became Online
     */
    bool recordSuccess(const std::string& systemId, bool heartbeat = false);

    /**
     * @brief A send to the peer failed after all retries
     * @return true if the peer just became Offline
     */
    bool recordFailure(const std::string& systemId, const std::string& error);

    /// An authenticated heartbeat arrived from the peer
    bool recordHeartbeatReceived(const std::string& systemId);

    void setCapabilities(const std::string& systemId, CapabilityDescriptor descriptor);

    /// Online peer that has not yet been sent our capability descriptor
    bool needsCapabilityExchange(const std::string& systemId) const;
    void markCapabilitiesSent(const std::string& systemId);

    /// Last heartbeat older than twice the heartbeat interval, or none yet
    bool isStale(const PeerInfo& peer, std::chrono::system_clock::time_point now) const;

    std::size_t peerCount() const;
    std::size_t onlineCount() const;

    int missedThreshold() const { return missedThreshold_; }

private:
    struct Entry {
        PeerInfo info;
        std::shared_ptr<const skp::SecureBuffer> secret;
    };

    bool markOnline(Entry& entry);

    mutable std::mutex mutex_;
    std::map<std::string, Entry> peers_;
    int missedThreshold_;
    std::chrono::milliseconds heartbeatInterval_;
};

} // namespace SkipKP
