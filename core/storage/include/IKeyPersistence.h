#pragma once

#include "KeyRecord.h"
#include "Result.h"

#include <cstddef>
#include <cstdint>
#include <set>
#include <string>
#include <vector>

namespace SkipKP {

/**
 * @brief Storage backend for key records
 *
 * Implementations must make consume() a per-record compare-and-set: of
 * any number of concurrent calls for one key exactly one returns the
 * material. Storage failures are reported as StorageUnavailable.
 */
class IKeyPersistence {
public:
    virtual ~IKeyPersistence() = default;

    /// DuplicateKey if a record (live or tombstone) with this ID exists
    virtual skp::Result<void> insert(KeyRecord&& record) = 0;

    /// NotFound if no record exists
    virtual skp::Result<KeyMetadata> findMetadata(const std::string& keyId) = 0;

    /**
     * @brief Mark the record consumed and hand out its material
     *
     * The stored copy of the material is erased in the same step.
     * @return NotFound if absent, AlreadyConsumed if another caller won
     */
    virtual skp::Result<skp::SecureBuffer> consume(const std::string& keyId) = 0;

    /**
     * @brief Consume without returning the material
     * @return false if the record was already consumed or is absent
     */
    virtual skp::Result<bool> retire(const std::string& keyId) = 0;

    /// Live records not yet synced to @p peerId, oldest first
    virtual skp::Result<std::vector<KeyRecord>> pendingFor(const std::string& peerId, std::size_t limit) = 0;

    /// Record that @p peerId holds the key; returns the full synced set
    virtual skp::Result<std::set<std::string>> markSynced(const std::string& keyId, const std::string& peerId) = 0;

    /// Delete records created before @p cutoff (epoch seconds)
    virtual skp::Result<std::size_t> sweep(int64_t cutoff) = 0;

    virtual skp::Result<KeyCounts> counts() = 0;

    /// Cheap liveness probe used by /status/health
    virtual skp::Result<void> ping() = 0;
};

} // namespace SkipKP
