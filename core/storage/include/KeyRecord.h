#pragma once

#include "SecureBuffer.h"

#include <cstdint>
#include <set>
#include <string>

namespace SkipKP {

/**
 * @brief Everything known about a key except its material
 */
struct KeyMetadata {
    std::string keyId;            // 32 lowercase hex chars
    std::string remoteSystemId;   // system the key was requested for
    std::string originSystemId;   // Key Provider that generated it
    int sizeBits = 0;
    int64_t createdAt = 0;        // epoch seconds
    bool consumed = false;
    std::set<std::string> syncedPeers;
};

/**
 * @brief A stored key. Move-only because it owns secret material.
 *
 * Once consumed the material is gone and the record remains only as a
 * tombstone until the expiry sweep deletes it.
 */
struct KeyRecord : KeyMetadata {
    skp::SecureBuffer keyMaterial;

    KeyRecord() = default;
    KeyRecord(KeyRecord&&) = default;
    KeyRecord& operator=(KeyRecord&&) = default;
};

struct KeyCounts {
    std::size_t live = 0;
    std::size_t consumed = 0;
};

} // namespace SkipKP
