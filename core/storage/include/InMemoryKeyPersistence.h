#pragma once

#include "IKeyPersistence.h"

#include <atomic>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <unordered_map>

namespace SkipKP {

/**
 * @brief Process-local key records
 *
 * The map lock only guards membership. Consumption is decided by a
 * compare-and-set on the record's own atomic flag, so retrievals of
 * unrelated keys never contend.
 */
class InMemoryKeyPersistence : public IKeyPersistence {
public:
    InMemoryKeyPersistence() = default;

    skp::Result<void> insert(KeyRecord&& record) override;
    skp::Result<KeyMetadata> findMetadata(const std::string& keyId) override;
    skp::Result<skp::SecureBuffer> consume(const std::string& keyId) override;
    skp::Result<bool> retire(const std::string& keyId) override;
    skp::Result<std::vector<KeyRecord>> pendingFor(const std::string& peerId, std::size_t limit) override;
    skp::Result<std::set<std::string>> markSynced(const std::string& keyId, const std::string& peerId) override;
    skp::Result<std::size_t> sweep(int64_t cutoff) override;
    skp::Result<KeyCounts> counts() override;
    skp::Result<void> ping() override;

private:
    struct Entry {
        KeyMetadata meta;               // consumed/syncedPeers fields unused here
        std::atomic<bool> consumed{false};
        uint64_t sequence = 0;          // insertion order, breaks createdAt ties
        std::mutex mutex;               // guards material and syncedPeers
        skp::SecureBuffer material;
        std::set<std::string> syncedPeers;
    };

    std::shared_ptr<Entry> find(const std::string& keyId) const;

    mutable std::shared_mutex mapMutex_;
    std::unordered_map<std::string, std::shared_ptr<Entry>> entries_;
    uint64_t nextSequence_ = 0;
};

} // namespace SkipKP
