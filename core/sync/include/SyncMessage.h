#pragma once

/**
 * @file SyncMessage.h
 * @brief Wire model for Key Provider to Key Provider messages
 */

#include "Result.h"

#include <json/json.h>

#include <cstdint>
#include <string>

namespace SkipKP {

enum class SyncMessageType {
    Heartbeat,
    KeySync,
    CapabilityExchange
};

const char* syncMessageTypeToString(SyncMessageType type);
bool parseSyncMessageType(const std::string& name, SyncMessageType& out);

/**
 * @brief One signed message between two Key Providers
 *
 * JSON form: {messageId, senderId, receiverId, type, timestamp, payload,
 * signature}. The timestamp is epoch milliseconds. For key_sync the
 * payload is sealed ciphertext; otherwise it is JSON text.
 */
struct SyncMessage {
    std::string messageId;
    std::string senderId;
    std::string receiverId;
    SyncMessageType type = SyncMessageType::Heartbeat;
    int64_t timestamp = 0;
    std::string payload;
    std::string signature;

    /// Canonical bytes covered by the signature, one field per line
    std::string signingInput() const;

    Json::Value toJson() const;
    std::string serialize() const;

    /// ValidationError on malformed JSON, a missing field or an unknown type
    static skp::Result<SyncMessage> parse(const std::string& body);
};

} // namespace SkipKP
