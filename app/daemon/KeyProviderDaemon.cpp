#include "KeyProviderDaemon.h"
#include "CapabilityRegistry.h"
#include "EntropyProvider.h"
#include "HttpPeerTransport.h"
#include "HttpServer.h"
#include "InMemoryKeyPersistence.h"
#include "KeyStore.h"
#include "Logger.h"
#include "MetricsCollector.h"
#include "PeerRegistry.h"
#include "ProtocolHandler.h"
#include "SQLiteKeyPersistence.h"
#include "SyncMessenger.h"
#include "SyncScheduler.h"
#include "Version.h"

#include <csignal>

namespace SkipKP {

namespace {
    // Signal-safe: use volatile sig_atomic_t for guaranteed async-signal-safety
    volatile sig_atomic_t signalReceived = 0;
    volatile sig_atomic_t receivedSignalNum = 0;

    void signalHandler(int signal) {
        receivedSignalNum = signal;
        signalReceived = 1;
    }
}

KeyProviderDaemon::KeyProviderDaemon(KeyProviderConfig config, std::shared_ptr<IPeerTransport> transport)
    : config_(std::move(config)),
      transport_(std::move(transport)) {
    if (!transport_) {
        transport_ = std::make_shared<HttpPeerTransport>();
    }
}

KeyProviderDaemon::~KeyProviderDaemon() {
    shutdown();
}

skp::Result<std::shared_ptr<IKeyPersistence>> KeyProviderDaemon::openStorage() {
    if (config_.storageBackend == StorageBackend::Memory) {
        Logger::instance().log(LogLevel::WARN, "Using in-memory key storage; keys do not survive a restart", "Daemon");
        return std::shared_ptr<IKeyPersistence>(std::make_shared<InMemoryKeyPersistence>());
    }

    auto sqlite = std::make_shared<SQLiteKeyPersistence>(config_.dbPath);
    auto opened = sqlite->open();
    if (!opened) {
        return opened.error();
    }
    return std::shared_ptr<IKeyPersistence>(sqlite);
}

skp::Result<void> KeyProviderDaemon::initialize() {
    auto& logger = Logger::instance();
    logger.log(LogLevel::INFO, Version::toString() + " initializing as " + config_.localSystemId, "Daemon");

    auto persistence = openStorage();
    if (!persistence) {
        logger.log(LogLevel::CRITICAL, "Key storage unavailable: " + persistence.error().message, "Daemon");
        return persistence.error();
    }
    persistence_ = *persistence;

    entropy_ = std::make_shared<EntropyProvider>();
    capabilities_ = std::make_shared<CapabilityRegistry>(config_);
    keyStore_ = std::make_shared<KeyStore>(config_, persistence_, capabilities_, entropy_);
    peers_ = std::make_shared<PeerRegistry>(config_);

    if (config_.syncEnabled) {
        messenger_ = std::make_shared<SyncMessenger>(config_, peers_, keyStore_, capabilities_, entropy_, transport_);
        scheduler_ = std::make_unique<SyncScheduler>(config_, peers_, keyStore_, messenger_);
    }

    handler_ = std::make_shared<ProtocolHandler>(config_, keyStore_, entropy_, capabilities_, peers_, messenger_);
    auto handler = handler_;
    server_ = std::make_unique<HttpServer>(config_.listenAddress, config_.listenPort, config_.workerThreads,
                                           [handler](const HttpRequest& request) { return handler->handle(request); });

    auto started = server_->start();
    if (!started) {
        logger.log(LogLevel::CRITICAL, "Failed to start HTTP listener: " + started.error().message, "Daemon");
        return started;
    }

    running_ = true;

    if (scheduler_ && peers_->peerCount() > 0) {
        scheduler_->start();
    } else {
        logger.log(LogLevel::INFO, config_.syncEnabled ? "No sync peers configured" : "Peer sync disabled", "Daemon");
    }

    maintenanceThread_ = std::thread(&KeyProviderDaemon::maintenanceLoop, this);

    logger.log(LogLevel::INFO, "Daemon initialization complete", "Daemon");
    return skp::Ok();
}

int KeyProviderDaemon::boundPort() const {
    return server_ ? server_->boundPort() : 0;
}

void KeyProviderDaemon::maintenanceLoop() {
    std::unique_lock<std::mutex> lock(runMutex_);
    while (running_) {
        runCv_.wait_for(lock, config_.sweepInterval, [this] { return !running_; });
        if (!running_) {
            break;
        }
        lock.unlock();
        auto swept = keyStore_->sweep();
        if (!swept) {
            Logger::instance().log(LogLevel::ERROR, "Expiry sweep failed: " + swept.error().message, "Daemon");
        }
        lock.lock();
    }
}

void KeyProviderDaemon::run() {
    auto& logger = Logger::instance();

    std::signal(SIGINT, signalHandler);
    std::signal(SIGTERM, signalHandler);

    logger.log(LogLevel::INFO, "Key Provider serving on " + config_.listenAddress + ":" +
               std::to_string(boundPort()), "Daemon");

    {
        std::unique_lock<std::mutex> lock(runMutex_);
        while (running_ && !signalReceived) {
            runCv_.wait_for(lock, std::chrono::seconds(1));
        }
    }

    if (signalReceived) {
        int sigNum = receivedSignalNum;
        logger.log(LogLevel::INFO, "Received signal " + std::to_string(sigNum) + ", initiating shutdown", "Daemon");
    }

    shutdown();
}

void KeyProviderDaemon::shutdown() {
    {
        std::lock_guard<std::mutex> lock(runMutex_);
        if (!running_) {
            return;
        }
        running_ = false;
    }
    runCv_.notify_all();

    auto& logger = Logger::instance();
    logger.log(LogLevel::INFO, "Shutting down Key Provider...", "Daemon");

    // Stop taking requests first, then background work
    if (server_) {
        server_->stop();
    }
    if (scheduler_) {
        scheduler_->stop();
    }
    if (maintenanceThread_.joinable()) {
        maintenanceThread_.join();
    }

    logger.log(LogLevel::INFO, MetricsCollector::instance().getMetricsSummary(), "Daemon");
    logger.log(LogLevel::INFO, "Daemon stopped gracefully", "Daemon");
}

} // namespace SkipKP
