#pragma once

/**
 * @file CapabilityRegistry.h
 * @brief Local capability descriptor and remote system authorization
 */

#include "Result.h"

#include <json/json.h>

#include <string>
#include <vector>

namespace SkipKP {

struct KeyProviderConfig;

/**
 * @brief What a Key Provider offers and whom it serves
 *
 * JSON form: {entropy, key, algorithm, localSystemID, remoteSystemID[]}
 */
struct CapabilityDescriptor {
    bool entropy = true;
    bool key = true;
    std::string algorithm;
    std::string localSystemId;
    std::vector<std::string> remoteSystemIds;

    Json::Value toJson() const;

    /// ValidationError when a field is missing or has the wrong type
    static skp::Result<CapabilityDescriptor> fromJson(const Json::Value& value);
};

/**
 * @brief Immutable after construction; safe to share across threads
 */
class CapabilityRegistry {
public:
    explicit CapabilityRegistry(const KeyProviderConfig& config);

    const CapabilityDescriptor& describe() const { return descriptor_; }

    /**
     * @brief Check @p remoteSystemId against the configured patterns
     *
     * Patterns use shell glob syntax (`*`, `?`, `[...]`), matched
     * case-sensitively over the whole identifier. An empty identifier is
     * never authorized.
     */
    bool authorize(const std::string& remoteSystemId) const;

    const std::string& localSystemId() const { return descriptor_.localSystemId; }

private:
    CapabilityDescriptor descriptor_;
};

} // namespace SkipKP
