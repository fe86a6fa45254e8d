#pragma once

/**
 * @file SyncMessenger.h
 * @brief Signed, encrypted messaging between Key Providers
 */

#include "IPeerTransport.h"
#include "KeyProviderConfig.h"
#include "KeyRecord.h"
#include "Result.h"
#include "SecureBuffer.h"
#include "SyncMessage.h"

#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <string>

namespace SkipKP {

class CapabilityRegistry;
class EntropyProvider;
class KeyStore;
class PeerRegistry;

class SyncMessenger {
public:
    SyncMessenger(const KeyProviderConfig& config,
                  std::shared_ptr<PeerRegistry> peers,
                  std::shared_ptr<KeyStore> keyStore,
                  std::shared_ptr<const CapabilityRegistry> capabilities,
                  std::shared_ptr<EntropyProvider> entropy,
                  std::shared_ptr<IPeerTransport> transport);

    skp::Result<void> sendHeartbeat(const std::string& peerId);
    skp::Result<void> sendCapabilities(const std::string& peerId);

    /// Seal @p record for @p peerId and send it as key_sync
    skp::Result<void> sendKey(const std::string& peerId, const KeyRecord& record);

    /**
     * @brief Authenticate and apply one inbound message
     *
     * Checks run in order: parse, receiver, sender and signature, timestamp
     * window. Nothing is applied unless every check passes.
     *
     * @return acknowledgement text for the HTTP reply
     */
    skp::Result<std::string> receive(const std::string& body);

    /// Abort pending backoff waits and refuse further attempts
    void cancelRetries();

    /// Fill in message.signature with HMAC-SHA256 over signingInput()
    static void sign(SyncMessage& message, const skp::SecureBuffer& secret);

    static int64_t nowMillis();

private:
    skp::Result<SyncMessage> buildMessage(const std::string& peerId, SyncMessageType type, std::string payload);
    skp::Result<void> send(const std::string& peerId, const SyncMessage& message);

    skp::Result<std::string> sealKey(const KeyRecord& record, const std::string& peerId,
                                     const skp::SecureBuffer& secret) const;
    skp::Result<std::string> handleKeySync(const SyncMessage& message, const skp::SecureBuffer& secret);
    skp::Result<std::string> handleCapabilities(const SyncMessage& message);

    /// @return false when cancelled during the wait
    bool waitForRetry(std::chrono::milliseconds delay);
    bool cancelled() const;

    std::string localSystemId_;
    int maxRetryAttempts_;
    std::chrono::milliseconds retryBackoff_;
    std::chrono::milliseconds syncTimeout_;
    std::chrono::seconds replayWindow_;

    std::shared_ptr<PeerRegistry> peers_;
    std::shared_ptr<KeyStore> keyStore_;
    std::shared_ptr<const CapabilityRegistry> capabilities_;
    std::shared_ptr<EntropyProvider> entropy_;
    std::shared_ptr<IPeerTransport> transport_;

    mutable std::mutex cancelMutex_;
    std::condition_variable cancelCv_;
    bool cancelled_ = false;
};

} // namespace SkipKP
