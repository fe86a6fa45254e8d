#include "PeerRegistry.h"
#include "Logger.h"
#include "MetricsCollector.h"

namespace SkipKP {

PeerRegistry::PeerRegistry(const KeyProviderConfig& config)
    : missedThreshold_(config.missedThreshold),
      heartbeatInterval_(config.heartbeatInterval) {
    for (const auto& peer : config.peers) {
        Entry entry;
        entry.info.systemId = peer.systemId;
        entry.info.endpoint = peer.endpoint;
        entry.info.port = peer.port;
        entry.secret = std::make_shared<const skp::SecureBuffer>(skp::SecureBuffer::fromString(peer.sharedSecret));
        peers_.emplace(peer.systemId, std::move(entry));
    }
}

bool PeerRegistry::hasPeer(const std::string& systemId) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return peers_.count(systemId) > 0;
}

std::optional<PeerInfo> PeerRegistry::getPeer(const std::string& systemId) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = peers_.find(systemId);
    if (it == peers_.end()) {
        return std::nullopt;
    }
    return it->second.info;
}

std::vector<PeerInfo> PeerRegistry::getAllPeers() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<PeerInfo> result;
    result.reserve(peers_.size());
    for (const auto& [id, entry] : peers_) {
        result.push_back(entry.info);
    }
    return result;
}

std::vector<std::string> PeerRegistry::peerIds() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> ids;
    for (const auto& [id, entry] : peers_) {
        ids.push_back(id);
    }
    return ids;
}

std::shared_ptr<const skp::SecureBuffer> PeerRegistry::sharedSecret(const std::string& systemId) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = peers_.find(systemId);
    return it == peers_.end() ? nullptr : it->second.secret;
}

bool PeerRegistry::markOnline(Entry& entry) {
    bool transitioned = entry.info.status != PeerStatus::Online;
    entry.info.status = PeerStatus::Online;
    entry.info.consecutiveFailures = 0;
    entry.info.lastError.clear();
    entry.info.lastContactAt = std::chrono::system_clock::now();
    if (transitioned) {
        Logger::instance().log(LogLevel::INFO, "Peer " + entry.info.systemId + " is online", "PeerRegistry");
    }
    return transitioned;
}

bool PeerRegistry::recordSuccess(const std::string& systemId, bool heartbeat) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = peers_.find(systemId);
    if (it == peers_.end()) {
        return false;
    }
    if (heartbeat) {
        it->second.info.lastHeartbeatAt = std::chrono::system_clock::now();
    }
    return markOnline(it->second);
}

bool PeerRegistry::recordHeartbeatReceived(const std::string& systemId) {
    return recordSuccess(systemId, true);
}

bool PeerRegistry::recordFailure(const std::string& systemId, const std::string& error) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = peers_.find(systemId);
    if (it == peers_.end()) {
        return false;
    }

    auto& info = it->second.info;
    info.consecutiveFailures++;
    info.lastError = error;

    if (info.status != PeerStatus::Offline && info.consecutiveFailures >= missedThreshold_) {
        info.status = PeerStatus::Offline;
        info.capabilitiesSent = false;
        Logger::instance().log(LogLevel::WARN, "Peer " + systemId + " marked offline after " +
                               std::to_string(info.consecutiveFailures) + " failed attempts: " + error, "PeerRegistry");
        MetricsCollector::instance().incrementPeersWentOffline();
        return true;
    }
    return false;
}

void PeerRegistry::setCapabilities(const std::string& systemId, CapabilityDescriptor descriptor) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = peers_.find(systemId);
    if (it != peers_.end()) {
        it->second.info.capabilities = std::move(descriptor);
    }
}

bool PeerRegistry::needsCapabilityExchange(const std::string& systemId) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = peers_.find(systemId);
    return it != peers_.end() && it->second.info.status == PeerStatus::Online && !it->second.info.capabilitiesSent;
}

void PeerRegistry::markCapabilitiesSent(const std::string& systemId) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = peers_.find(systemId);
    if (it != peers_.end()) {
        it->second.info.capabilitiesSent = true;
    }
}

bool PeerRegistry::isStale(const PeerInfo& peer, std::chrono::system_clock::time_point now) const {
    if (!peer.lastHeartbeatAt) {
        return true;
    }
    return now - *peer.lastHeartbeatAt > 2 * heartbeatInterval_;
}

std::size_t PeerRegistry::peerCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return peers_.size();
}

std::size_t PeerRegistry::onlineCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::size_t count = 0;
    for (const auto& [id, entry] : peers_) {
        if (entry.info.status == PeerStatus::Online) {
            ++count;
        }
    }
    return count;
}

} // namespace SkipKP
