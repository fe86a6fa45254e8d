#include "SyncScheduler.h"
#include "KeyStore.h"
#include "Logger.h"
#include "PeerRegistry.h"
#include "SyncMessenger.h"

#include <algorithm>

namespace SkipKP {

namespace {

// Clears an in-flight flag when the peer task ends, whatever the path.
class InFlightGuard {
public:
    explicit InFlightGuard(std::atomic<bool>& flag) : flag_(flag) {}
    ~InFlightGuard() { flag_ = false; }

    InFlightGuard(const InFlightGuard&) = delete;
    InFlightGuard& operator=(const InFlightGuard&) = delete;

private:
    std::atomic<bool>& flag_;
};

} // namespace

SyncScheduler::SyncScheduler(const KeyProviderConfig& config,
                             std::shared_ptr<PeerRegistry> peers,
                             std::shared_ptr<KeyStore> keyStore,
                             std::shared_ptr<SyncMessenger> messenger)
    : heartbeatInterval_(config.heartbeatInterval),
      syncInterval_(config.syncInterval),
      peers_(std::move(peers)),
      keyStore_(std::move(keyStore)),
      messenger_(std::move(messenger)) {
    for (const auto& id : peers_->peerIds()) {
        slots_.emplace(id, std::make_unique<PeerSlot>());
    }
    // Two task kinds per peer may be queued at once
    pool_ = std::make_unique<ThreadPool>(std::max<std::size_t>(2, slots_.size() * 2));
}

SyncScheduler::~SyncScheduler() {
    stop();
}

void SyncScheduler::start() {
    if (running_.exchange(true)) {
        return;
    }
    stopping_ = false;

    Logger::instance().log(LogLevel::INFO, "Sync scheduler started for " + std::to_string(slots_.size()) +
                           " peer(s), heartbeat every " + std::to_string(heartbeatInterval_.count()) +
                           "ms, replication every " + std::to_string(syncInterval_.count()) + "ms", "SyncScheduler");

    heartbeatThread_ = std::thread(&SyncScheduler::timerLoop, this, Cycle::Heartbeat, heartbeatInterval_);
    replicationThread_ = std::thread(&SyncScheduler::timerLoop, this, Cycle::Replication, syncInterval_);
}

void SyncScheduler::stop() {
    {
        std::lock_guard<std::mutex> lock(timerMutex_);
        stopping_ = true;
    }
    timerCv_.notify_all();
    messenger_->cancelRetries();

    if (heartbeatThread_.joinable()) {
        heartbeatThread_.join();
    }
    if (replicationThread_.joinable()) {
        replicationThread_.join();
    }
    if (pool_) {
        pool_->shutdown();
    }

    if (running_.exchange(false)) {
        Logger::instance().log(LogLevel::INFO, "Sync scheduler stopped", "SyncScheduler");
    }
}

void SyncScheduler::timerLoop(Cycle cycle, std::chrono::milliseconds interval) {
    std::unique_lock<std::mutex> lock(timerMutex_);
    while (!stopping_) {
        lock.unlock();
        dispatch(cycle);
        lock.lock();
        timerCv_.wait_for(lock, interval, [this] { return stopping_.load(); });
    }
}

std::vector<std::future<void>> SyncScheduler::dispatch(Cycle cycle) {
    std::vector<std::future<void>> tasks;
    if (stopping_) {
        return tasks;
    }

    for (auto& [peerId, slot] : slots_) {
        PeerSlot* peerSlot = slot.get();
        std::atomic<bool>& inFlight = cycle == Cycle::Heartbeat ? peerSlot->heartbeatInFlight
                                                                 : peerSlot->replicationInFlight;
        if (inFlight.exchange(true)) {
            Logger::instance().log(LogLevel::DEBUG, "Peer " + peerId + " still busy, skipping tick", "SyncScheduler");
            continue;
        }

        const std::string id = peerId;
        tasks.push_back(pool_->enqueue([this, peerSlot, &inFlight, id, cycle]() {
            InFlightGuard guard(inFlight);
            std::lock_guard<std::mutex> lock(peerSlot->mutex);
            if (stopping_) {
                return;
            }
            if (cycle == Cycle::Heartbeat) {
                heartbeatPeer(id);
            } else {
                replicatePeer(id, *peerSlot);
            }
        }));
    }
    return tasks;
}

void SyncScheduler::heartbeatPeer(const std::string& peerId) {
    auto sent = messenger_->sendHeartbeat(peerId);
    if (!sent) {
        return;
    }

    if (peers_->needsCapabilityExchange(peerId)) {
        auto exchanged = messenger_->sendCapabilities(peerId);
        if (exchanged) {
            peers_->markCapabilitiesSent(peerId);
        }
    }
}

void SyncScheduler::replicatePeer(const std::string& peerId, PeerSlot& slot) {
    auto& logger = Logger::instance();

    auto peer = peers_->getPeer(peerId);
    if (!peer || peer->status == PeerStatus::Offline) {
        return;
    }

    auto pending = keyStore_->pendingFor(peerId);
    if (!pending) {
        logger.log(LogLevel::ERROR, "Could not list keys pending for " + peerId + ": " + pending.error().message,
                   "SyncScheduler");
        return;
    }
    // Forget refusals for keys that are no longer pending
    std::set<std::string> stillRefused;
    for (const auto& record : *pending) {
        if (slot.refusedKeys.count(record.keyId) > 0) {
            stillRefused.insert(record.keyId);
        }
    }
    slot.refusedKeys.swap(stillRefused);

    std::size_t replicated = 0;
    for (const auto& record : *pending) {
        if (stopping_) {
            break;
        }
        if (slot.refusedKeys.count(record.keyId) > 0) {
            continue;
        }

        // Retrieved since the batch was listed
        auto live = keyStore_->isLive(record.keyId);
        if (!live || !*live) {
            continue;
        }

        auto sent = messenger_->sendKey(peerId, record);
        if (!sent && sent.code() == skp::ErrorCode::PeerRejected) {
            logger.log(LogLevel::WARN, "Peer " + peerId + " refused key " + shortId(record.keyId) +
                       ", not offering it again", "SyncScheduler");
            slot.refusedKeys.insert(record.keyId);
            continue;
        }
        if (!sent) {
            logger.log(LogLevel::DEBUG, "Replication batch to " + peerId + " stopped after " +
                       std::to_string(replicated) + " key(s)", "SyncScheduler");
            break;
        }

        auto marked = keyStore_->markSynced(record.keyId, peerId);
        if (!marked) {
            logger.log(LogLevel::WARN, "Could not record sync of key " + shortId(record.keyId) + " to " + peerId +
                       ": " + marked.error().message, "SyncScheduler");
            continue;
        }
        ++replicated;
    }

    if (replicated > 0) {
        logger.log(LogLevel::INFO, "Replicated " + std::to_string(replicated) + " key(s) to " + peerId, "SyncScheduler");
    }
}

void SyncScheduler::heartbeatOnce() {
    for (auto& task : dispatch(Cycle::Heartbeat)) {
        task.wait();
    }
}

void SyncScheduler::replicateOnce() {
    for (auto& task : dispatch(Cycle::Replication)) {
        task.wait();
    }
}

} // namespace SkipKP
