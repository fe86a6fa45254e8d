#pragma once

#include "KeyProviderConfig.h"
#include "ThreadPool.h"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <thread>
#include <vector>

namespace SkipKP {

class KeyStore;
class PeerRegistry;
class SyncMessenger;

/**
 * @brief Drives the heartbeat and replication cycles
 *
 * Two timer threads post one task per peer and cycle onto a worker pool.
 * A peer whose previous task of the same kind is still running is skipped
 * for that tick. Tasks for one peer never interleave.
 */
class SyncScheduler {
public:
    SyncScheduler(const KeyProviderConfig& config,
                  std::shared_ptr<PeerRegistry> peers,
                  std::shared_ptr<KeyStore> keyStore,
                  std::shared_ptr<SyncMessenger> messenger);
    ~SyncScheduler();

    SyncScheduler(const SyncScheduler&) = delete;
    SyncScheduler& operator=(const SyncScheduler&) = delete;

    void start();

    /// No new attempt starts after this; in-flight sends finish or time out.
    void stop();

    bool isRunning() const { return running_; }

    /// Run one heartbeat cycle and wait for every peer task
    void heartbeatOnce();

    /// Run one replication cycle and wait for every peer task
    void replicateOnce();

private:
    enum class Cycle { Heartbeat, Replication };

    struct PeerSlot {
        std::mutex mutex;
        std::atomic<bool> heartbeatInFlight{false};
        std::atomic<bool> replicationInFlight{false};
        std::set<std::string> refusedKeys;      // keys the peer rejected; guarded by mutex
    };

    std::vector<std::future<void>> dispatch(Cycle cycle);
    void heartbeatPeer(const std::string& peerId);
    void replicatePeer(const std::string& peerId, PeerSlot& slot);
    void timerLoop(Cycle cycle, std::chrono::milliseconds interval);

    std::chrono::milliseconds heartbeatInterval_;
    std::chrono::milliseconds syncInterval_;

    std::shared_ptr<PeerRegistry> peers_;
    std::shared_ptr<KeyStore> keyStore_;
    std::shared_ptr<SyncMessenger> messenger_;

    std::map<std::string, std::unique_ptr<PeerSlot>> slots_;
    std::unique_ptr<ThreadPool> pool_;

    std::atomic<bool> running_{false};
    std::atomic<bool> stopping_{false};
    std::mutex timerMutex_;
    std::condition_variable timerCv_;
    std::thread heartbeatThread_;
    std::thread replicationThread_;
};

} // namespace SkipKP
