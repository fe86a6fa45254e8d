#pragma once

/**
 * @file KeyStore.h
 * @brief Key lifecycle: generation, single-use retrieval, replication, expiry
 */

#include "IKeyPersistence.h"
#include "KeyProviderConfig.h"
#include "Result.h"
#include "SecureBuffer.h"

#include <chrono>
#include <memory>
#include <string>
#include <vector>

namespace SkipKP {

class CapabilityRegistry;
class EntropyProvider;

struct GeneratedKey {
    std::string keyId;
    skp::SecureBuffer keyMaterial;
};

class KeyStore {
public:
    KeyStore(const KeyProviderConfig& config,
             std::shared_ptr<IKeyPersistence> persistence,
             std::shared_ptr<const CapabilityRegistry> capabilities,
             std::shared_ptr<EntropyProvider> entropy);

    /**
     * @brief Create and persist a new key for @p remoteSystemId
     *
     * Fails with Unauthorized, InvalidSize, CapacityExceeded, RngUnavailable
     * or StorageUnavailable. The new record is immediately eligible for
     * replication.
     */
    skp::Result<GeneratedKey> generate(const std::string& remoteSystemId, int sizeBits);

    /**
     * @brief Hand out a key exactly once
     *
     * The caller must be authorized and be either the system the key was
     * requested for or the Key Provider that generated it. A malformed,
     * unknown or consumed key ID gives NotFound or AlreadyConsumed; an
     * unauthorized caller never consumes the key.
     */
    skp::Result<skp::SecureBuffer> retrieve(const std::string& keyId, const std::string& remoteSystemId);

    /**
     * @brief Store a key received from a peer
     * @return true if stored, false if the ID was already known (live or
     *         consumed); a consumed key is never brought back
     */
    skp::Result<bool> insertReplicated(KeyRecord&& record);

    /// Live keys @p peerId does not hold yet, oldest first
    skp::Result<std::vector<KeyRecord>> pendingFor(const std::string& peerId, std::size_t limit = 256);

    /// Known and not yet consumed
    skp::Result<bool> isLive(const std::string& keyId);

    /**
     * @brief Record a completed replication
     *
     * When every configured peer holds the key the local copy is retired:
     * consumed and wiped.
     */
    skp::Result<void> markSynced(const std::string& keyId, const std::string& peerId);

    /// Delete every record older than the key expiry, consumed or not
    skp::Result<std::size_t> sweep(std::chrono::system_clock::time_point now = std::chrono::system_clock::now());

    skp::Result<KeyCounts> counts();
    skp::Result<void> healthCheck();

    /// 32 hex characters
    static bool isWellFormedKeyId(const std::string& keyId);

private:
    bool mayRetrieve(const KeyMetadata& meta, const std::string& remoteSystemId) const;

    std::string localSystemId_;
    int minKeySize_;
    int maxKeySize_;
    std::size_t maxStoredKeys_;
    std::chrono::seconds keyExpiry_;
    std::vector<std::string> peerIds_;

    std::shared_ptr<IKeyPersistence> persistence_;
    std::shared_ptr<const CapabilityRegistry> capabilities_;
    std::shared_ptr<EntropyProvider> entropy_;
};

} // namespace SkipKP
