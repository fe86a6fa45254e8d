#pragma once

#include "KeyProviderConfig.h"
#include "Result.h"

#include <atomic>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <thread>

namespace SkipKP {

class CapabilityRegistry;
class EntropyProvider;
class HttpServer;
class IKeyPersistence;
class IPeerTransport;
class KeyStore;
class PeerRegistry;
class ProtocolHandler;
class SyncMessenger;
class SyncScheduler;

/**
 * @brief Wires the Key Provider together and owns its lifecycle
 *
 * initialize() opens storage, starts the HTTP listener, the sync scheduler
 * and the expiry sweep. run() blocks until SIGINT/SIGTERM or shutdown().
 */
class KeyProviderDaemon {
public:
    /// @param transport peer transport override; HTTP when null
    explicit KeyProviderDaemon(KeyProviderConfig config, std::shared_ptr<IPeerTransport> transport = nullptr);
    ~KeyProviderDaemon();

    KeyProviderDaemon(const KeyProviderDaemon&) = delete;
    KeyProviderDaemon& operator=(const KeyProviderDaemon&) = delete;

    skp::Result<void> initialize();
    void run();
    void shutdown();

    bool isRunning() const { return running_; }
    int boundPort() const;

    std::shared_ptr<KeyStore> keyStore() const { return keyStore_; }
    std::shared_ptr<PeerRegistry> peers() const { return peers_; }

private:
    skp::Result<std::shared_ptr<IKeyPersistence>> openStorage();
    void maintenanceLoop();

    KeyProviderConfig config_;
    std::shared_ptr<IPeerTransport> transport_;

    std::shared_ptr<IKeyPersistence> persistence_;
    std::shared_ptr<EntropyProvider> entropy_;
    std::shared_ptr<const CapabilityRegistry> capabilities_;
    std::shared_ptr<KeyStore> keyStore_;
    std::shared_ptr<PeerRegistry> peers_;
    std::shared_ptr<SyncMessenger> messenger_;
    std::unique_ptr<SyncScheduler> scheduler_;
    std::shared_ptr<ProtocolHandler> handler_;
    std::unique_ptr<HttpServer> server_;

    std::atomic<bool> running_{false};
    std::mutex runMutex_;
    std::condition_variable runCv_;
    std::thread maintenanceThread_;
};

} // namespace SkipKP
