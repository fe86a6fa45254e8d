#include "InMemoryKeyPersistence.h"
#include "Logger.h"

#include <algorithm>

namespace SkipKP {

std::shared_ptr<InMemoryKeyPersistence::Entry> InMemoryKeyPersistence::find(const std::string& keyId) const {
    std::shared_lock<std::shared_mutex> lock(mapMutex_);
    auto it = entries_.find(keyId);
    return it == entries_.end() ? nullptr : it->second;
}

skp::Result<void> InMemoryKeyPersistence::insert(KeyRecord&& record) {
    auto entry = std::make_shared<Entry>();
    entry->meta = static_cast<const KeyMetadata&>(record);
    entry->consumed = record.consumed;
    entry->material = std::move(record.keyMaterial);
    entry->syncedPeers = record.syncedPeers;

    std::unique_lock<std::shared_mutex> lock(mapMutex_);
    if (entries_.count(record.keyId)) {
        return skp::Err(skp::ErrorCode::DuplicateKey, "Key " + shortId(record.keyId) + " already stored");
    }
    entry->sequence = nextSequence_++;
    entries_.emplace(record.keyId, std::move(entry));
    return skp::Ok();
}

skp::Result<KeyMetadata> InMemoryKeyPersistence::findMetadata(const std::string& keyId) {
    auto entry = find(keyId);
    if (!entry) {
        return skp::Err<KeyMetadata>(skp::ErrorCode::NotFound);
    }

    KeyMetadata meta = entry->meta;
    meta.consumed = entry->consumed.load();
    std::lock_guard<std::mutex> lock(entry->mutex);
    meta.syncedPeers = entry->syncedPeers;
    return meta;
}

skp::Result<skp::SecureBuffer> InMemoryKeyPersistence::consume(const std::string& keyId) {
    auto entry = find(keyId);
    if (!entry) {
        return skp::Err<skp::SecureBuffer>(skp::ErrorCode::NotFound);
    }

    bool expected = false;
    if (!entry->consumed.compare_exchange_strong(expected, true)) {
        return skp::Err<skp::SecureBuffer>(skp::ErrorCode::AlreadyConsumed);
    }

    std::lock_guard<std::mutex> lock(entry->mutex);
    skp::SecureBuffer material = std::move(entry->material);
    return std::move(material);
}

skp::Result<bool> InMemoryKeyPersistence::retire(const std::string& keyId) {
    auto entry = find(keyId);
    if (!entry) {
        return false;
    }

    bool expected = false;
    if (!entry->consumed.compare_exchange_strong(expected, true)) {
        return false;
    }

    std::lock_guard<std::mutex> lock(entry->mutex);
    entry->material.wipe();
    return true;
}

skp::Result<std::vector<KeyRecord>> InMemoryKeyPersistence::pendingFor(const std::string& peerId, std::size_t limit) {
    std::vector<std::shared_ptr<Entry>> candidates;
    {
        std::shared_lock<std::shared_mutex> lock(mapMutex_);
        for (const auto& [id, entry] : entries_) {
            if (!entry->consumed.load()) {
                candidates.push_back(entry);
            }
        }
    }

    std::sort(candidates.begin(), candidates.end(), [](const auto& a, const auto& b) {
        if (a->meta.createdAt != b->meta.createdAt) {
            return a->meta.createdAt < b->meta.createdAt;
        }
        return a->sequence < b->sequence;
    });

    std::vector<KeyRecord> records;
    for (const auto& entry : candidates) {
        if (records.size() >= limit) {
            break;
        }
        std::lock_guard<std::mutex> lock(entry->mutex);
        // Re-check under the entry lock: a retrieval may have won since.
        if (entry->consumed.load() || entry->syncedPeers.count(peerId)) {
            continue;
        }
        KeyRecord record;
        static_cast<KeyMetadata&>(record) = entry->meta;
        record.syncedPeers = entry->syncedPeers;
        record.keyMaterial = entry->material.clone();
        records.push_back(std::move(record));
    }
    return std::move(records);
}

skp::Result<std::set<std::string>> InMemoryKeyPersistence::markSynced(const std::string& keyId, const std::string& peerId) {
    auto entry = find(keyId);
    if (!entry) {
        return skp::Err<std::set<std::string>>(skp::ErrorCode::NotFound);
    }
    std::lock_guard<std::mutex> lock(entry->mutex);
    entry->syncedPeers.insert(peerId);
    return entry->syncedPeers;
}

skp::Result<std::size_t> InMemoryKeyPersistence::sweep(int64_t cutoff) {
    std::unique_lock<std::shared_mutex> lock(mapMutex_);
    std::size_t removed = 0;
    for (auto it = entries_.begin(); it != entries_.end();) {
        if (it->second->meta.createdAt < cutoff) {
            it = entries_.erase(it);
            ++removed;
        } else {
            ++it;
        }
    }
    return removed;
}

skp::Result<KeyCounts> InMemoryKeyPersistence::counts() {
    std::shared_lock<std::shared_mutex> lock(mapMutex_);
    KeyCounts result;
    for (const auto& [id, entry] : entries_) {
        if (entry->consumed.load()) {
            ++result.consumed;
        } else {
            ++result.live;
        }
    }
    return result;
}

skp::Result<void> InMemoryKeyPersistence::ping() {
    return skp::Ok();
}

} // namespace SkipKP
