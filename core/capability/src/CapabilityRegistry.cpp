#include "CapabilityRegistry.h"
#include "KeyProviderConfig.h"

#include <fnmatch.h>

namespace SkipKP {

Json::Value CapabilityDescriptor::toJson() const {
    Json::Value root;
    root["entropy"] = entropy;
    root["key"] = key;
    root["algorithm"] = algorithm;
    root["localSystemID"] = localSystemId;

    Json::Value remote(Json::arrayValue);
    for (const auto& pattern : remoteSystemIds) {
        remote.append(pattern);
    }
    root["remoteSystemID"] = remote;
    return root;
}

skp::Result<CapabilityDescriptor> CapabilityDescriptor::fromJson(const Json::Value& value) {
    if (!value.isObject() ||
        !value["entropy"].isBool() || !value["key"].isBool() ||
        !value["algorithm"].isString() || !value["localSystemID"].isString() ||
        !value["remoteSystemID"].isArray()) {
        return skp::Err<CapabilityDescriptor>(skp::ErrorCode::ValidationError, "Malformed capability descriptor");
    }

    CapabilityDescriptor descriptor;
    descriptor.entropy = value["entropy"].asBool();
    descriptor.key = value["key"].asBool();
    descriptor.algorithm = value["algorithm"].asString();
    descriptor.localSystemId = value["localSystemID"].asString();
    for (const auto& item : value["remoteSystemID"]) {
        if (!item.isString()) {
            return skp::Err<CapabilityDescriptor>(skp::ErrorCode::ValidationError, "remoteSystemID entries must be strings");
        }
        descriptor.remoteSystemIds.push_back(item.asString());
    }
    return descriptor;
}

CapabilityRegistry::CapabilityRegistry(const KeyProviderConfig& config) {
    descriptor_.entropy = true;
    descriptor_.key = true;
    descriptor_.algorithm = config.algorithm;
    descriptor_.localSystemId = config.localSystemId;
    descriptor_.remoteSystemIds = config.remoteSystemIds;
}

bool CapabilityRegistry::authorize(const std::string& remoteSystemId) const {
    if (remoteSystemId.empty()) {
        return false;
    }
    for (const auto& pattern : descriptor_.remoteSystemIds) {
        if (fnmatch(pattern.c_str(), remoteSystemId.c_str(), 0) == 0) {
            return true;
        }
    }
    return false;
}

} // namespace SkipKP
