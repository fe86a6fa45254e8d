#include "KeyStore.h"
#include "CapabilityRegistry.h"
#include "Constants.h"
#include "Crypto.h"
#include "EntropyProvider.h"
#include "Logger.h"
#include "MetricsCollector.h"

#include <algorithm>
#include <cctype>

namespace SkipKP {

namespace {

int64_t toEpochSeconds(std::chrono::system_clock::time_point tp) {
    return std::chrono::duration_cast<std::chrono::seconds>(tp.time_since_epoch()).count();
}

std::string toLower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

constexpr int kMaxIdAttempts = 3;

} // namespace

KeyStore::KeyStore(const KeyProviderConfig& config,
                   std::shared_ptr<IKeyPersistence> persistence,
                   std::shared_ptr<const CapabilityRegistry> capabilities,
                   std::shared_ptr<EntropyProvider> entropy)
    : localSystemId_(config.localSystemId),
      minKeySize_(config.minKeySize),
      maxKeySize_(config.maxKeySize),
      maxStoredKeys_(config.maxStoredKeys),
      keyExpiry_(config.keyExpiry),
      persistence_(std::move(persistence)),
      capabilities_(std::move(capabilities)),
      entropy_(std::move(entropy)) {
    for (const auto& peer : config.peers) {
        peerIds_.push_back(peer.systemId);
    }
}

bool KeyStore::isWellFormedKeyId(const std::string& keyId) {
    return keyId.size() == skp::config::KEY_ID_BYTES * 2 && Crypto::isHex(keyId);
}

skp::Result<GeneratedKey> KeyStore::generate(const std::string& remoteSystemId, int sizeBits) {
    auto& logger = Logger::instance();
    auto& metrics = MetricsCollector::instance();

    if (!capabilities_->authorize(remoteSystemId)) {
        logger.log(LogLevel::WARN, "Key generation refused for unauthorized system: " + remoteSystemId, "KeyStore");
        metrics.incrementAuthFailures();
        return skp::Err<GeneratedKey>(skp::ErrorCode::Unauthorized, "Invalid remoteSystemID");
    }

    if (sizeBits < minKeySize_ || sizeBits > maxKeySize_) {
        return skp::Err<GeneratedKey>(skp::ErrorCode::InvalidSize,
            "Invalid key size. Must be between " + std::to_string(minKeySize_) + " and " +
            std::to_string(maxKeySize_) + " bits");
    }
    if (sizeBits % 8 != 0) {
        return skp::Err<GeneratedKey>(skp::ErrorCode::InvalidSize, "Key size must be a multiple of 8");
    }

    auto counts = persistence_->counts();
    if (!counts) {
        return counts.error();
    }
    if (counts->live >= maxStoredKeys_) {
        logger.log(LogLevel::WARN, "Key store full (" + std::to_string(counts->live) + " live keys)", "KeyStore");
        return skp::Err<GeneratedKey>(skp::ErrorCode::CapacityExceeded);
    }

    auto material = entropy_->randomBytes(static_cast<std::size_t>(sizeBits / 8));
    if (!material) {
        return material.error();
    }

    for (int attempt = 0; attempt < kMaxIdAttempts; ++attempt) {
        auto keyId = entropy_->randomId(skp::config::KEY_ID_BYTES);
        if (!keyId) {
            return keyId.error();
        }

        KeyRecord record;
        record.keyId = *keyId;
        record.keyMaterial = material->clone();
        record.remoteSystemId = remoteSystemId;
        record.originSystemId = localSystemId_;
        record.sizeBits = sizeBits;
        record.createdAt = toEpochSeconds(std::chrono::system_clock::now());

        auto stored = persistence_->insert(std::move(record));
        if (stored.code() == skp::ErrorCode::DuplicateKey) {
            continue;
        }
        if (!stored) {
            return stored.error();
        }

        logger.log(LogLevel::INFO, "Generated key " + shortId(*keyId) + " (" + std::to_string(sizeBits) +
                   " bits) for " + remoteSystemId, "KeyStore");
        metrics.incrementKeysGenerated();

        GeneratedKey generated;
        generated.keyId = *keyId;
        generated.keyMaterial = std::move(*material);
        return std::move(generated);
    }

    return skp::Err<GeneratedKey>(skp::ErrorCode::InternalError, "Could not allocate a unique key ID");
}

bool KeyStore::mayRetrieve(const KeyMetadata& meta, const std::string& remoteSystemId) const {
    if (!capabilities_->authorize(remoteSystemId)) {
        return false;
    }
    return remoteSystemId == meta.remoteSystemId || remoteSystemId == meta.originSystemId;
}

skp::Result<skp::SecureBuffer> KeyStore::retrieve(const std::string& keyId, const std::string& remoteSystemId) {
    auto& logger = Logger::instance();
    auto& metrics = MetricsCollector::instance();

    if (!isWellFormedKeyId(keyId)) {
        return skp::Err<skp::SecureBuffer>(skp::ErrorCode::NotFound, "Malformed keyId");
    }
    const std::string id = toLower(keyId);

    auto meta = persistence_->findMetadata(id);
    if (!meta) {
        return meta.error();
    }
    if (meta->consumed) {
        logger.log(LogLevel::WARN, "Retrieval of consumed key " + shortId(id) + " by " + remoteSystemId, "KeyStore");
        return skp::Err<skp::SecureBuffer>(skp::ErrorCode::AlreadyConsumed);
    }

    if (!mayRetrieve(*meta, remoteSystemId)) {
        logger.log(LogLevel::WARN, "Unauthorized retrieval of key " + shortId(id) + " by " + remoteSystemId, "KeyStore");
        metrics.incrementAuthFailures();
        return skp::Err<skp::SecureBuffer>(skp::ErrorCode::Unauthorized, "Invalid remoteSystemID");
    }

    auto material = persistence_->consume(id);
    if (!material) {
        if (material.code() == skp::ErrorCode::AlreadyConsumed) {
            logger.log(LogLevel::WARN, "Lost consume race for key " + shortId(id), "KeyStore");
        }
        return material.error();
    }

    logger.log(LogLevel::INFO, "Key " + shortId(id) + " retrieved and consumed by " + remoteSystemId, "KeyStore");
    metrics.incrementKeysRetrieved();
    return material;
}

skp::Result<bool> KeyStore::insertReplicated(KeyRecord&& record) {
    record.keyId = toLower(record.keyId);
    if (!isWellFormedKeyId(record.keyId)) {
        return skp::Err<bool>(skp::ErrorCode::ValidationError, "Malformed keyId");
    }
    if (record.sizeBits < minKeySize_ || record.sizeBits > maxKeySize_ || record.sizeBits % 8 != 0 ||
        record.keyMaterial.size() != static_cast<std::size_t>(record.sizeBits / 8)) {
        return skp::Err<bool>(skp::ErrorCode::InvalidSize, "Replicated key has an invalid size");
    }
    if (!capabilities_->authorize(record.remoteSystemId)) {
        MetricsCollector::instance().incrementAuthFailures();
        return skp::Err<bool>(skp::ErrorCode::Unauthorized, "Replicated key for unauthorized system");
    }

    record.consumed = false;
    std::string id = record.keyId;
    std::string origin = record.originSystemId;

    auto stored = persistence_->insert(std::move(record));
    if (stored.code() == skp::ErrorCode::DuplicateKey) {
        Logger::instance().log(LogLevel::DEBUG, "Replicated key " + shortId(id) + " already known", "KeyStore");
        return false;
    }
    if (!stored) {
        return stored.error();
    }

    Logger::instance().log(LogLevel::INFO, "Stored key " + shortId(id) + " replicated from " + origin, "KeyStore");
    MetricsCollector::instance().incrementKeysReceived();
    return true;
}

skp::Result<std::vector<KeyRecord>> KeyStore::pendingFor(const std::string& peerId, std::size_t limit) {
    return persistence_->pendingFor(peerId, limit);
}

skp::Result<bool> KeyStore::isLive(const std::string& keyId) {
    auto meta = persistence_->findMetadata(keyId);
    if (meta.code() == skp::ErrorCode::NotFound) {
        return false;
    }
    if (!meta) {
        return meta.error();
    }
    return !meta->consumed;
}

skp::Result<void> KeyStore::markSynced(const std::string& keyId, const std::string& peerId) {
    auto synced = persistence_->markSynced(keyId, peerId);
    if (!synced) {
        return synced.error();
    }
    MetricsCollector::instance().incrementKeysReplicated();

    bool allPeersHold = std::all_of(peerIds_.begin(), peerIds_.end(),
                                    [&](const std::string& id) { return synced->count(id) > 0; });
    if (!allPeersHold) {
        return skp::Ok();
    }

    // Only the generating side retires; a receiver keeps its copy for retrieval.
    auto meta = persistence_->findMetadata(keyId);
    if (!meta) {
        return meta.error();
    }
    if (meta->originSystemId != localSystemId_) {
        return skp::Ok();
    }

    auto retired = persistence_->retire(keyId);
    if (!retired) {
        return retired.error();
    }
    if (*retired) {
        Logger::instance().log(LogLevel::DEBUG, "Key " + shortId(keyId) + " replicated to all peers, local copy wiped", "KeyStore");
        MetricsCollector::instance().incrementKeysRetired();
    }
    return skp::Ok();
}

skp::Result<std::size_t> KeyStore::sweep(std::chrono::system_clock::time_point now) {
    int64_t cutoff = toEpochSeconds(now) - keyExpiry_.count();
    auto removed = persistence_->sweep(cutoff);
    if (!removed) {
        return removed.error();
    }
    if (*removed > 0) {
        Logger::instance().log(LogLevel::INFO, "Expired " + std::to_string(*removed) + " key records", "KeyStore");
        MetricsCollector::instance().addKeysExpired(*removed);
    }
    return removed;
}

skp::Result<KeyCounts> KeyStore::counts() {
    return persistence_->counts();
}

skp::Result<void> KeyStore::healthCheck() {
    return persistence_->ping();
}

} // namespace SkipKP
