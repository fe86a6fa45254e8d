#include "SyncMessage.h"

#include <memory>

namespace SkipKP {

const char* syncMessageTypeToString(SyncMessageType type) {
    switch (type) {
        case SyncMessageType::Heartbeat: return "heartbeat";
        case SyncMessageType::KeySync: return "key_sync";
        case SyncMessageType::CapabilityExchange: return "capability_exchange";
        default: return "unknown";
    }
}

bool parseSyncMessageType(const std::string& name, SyncMessageType& out) {
    if (name == "heartbeat") {
        out = SyncMessageType::Heartbeat;
    } else if (name == "key_sync") {
        out = SyncMessageType::KeySync;
    } else if (name == "capability_exchange") {
        out = SyncMessageType::CapabilityExchange;
    } else {
        return false;
    }
    return true;
}

std::string SyncMessage::signingInput() const {
    std::string input;
    input.reserve(messageId.size() + senderId.size() + receiverId.size() + payload.size() + 64);
    input += messageId;
    input += '\n';
    input += senderId;
    input += '\n';
    input += receiverId;
    input += '\n';
    input += syncMessageTypeToString(type);
    input += '\n';
    input += std::to_string(timestamp);
    input += '\n';
    input += payload;
    return input;
}

Json::Value SyncMessage::toJson() const {
    Json::Value root;
    root["messageId"] = messageId;
    root["senderId"] = senderId;
    root["receiverId"] = receiverId;
    root["type"] = syncMessageTypeToString(type);
    root["timestamp"] = static_cast<Json::Int64>(timestamp);
    root["payload"] = payload;
    root["signature"] = signature;
    return root;
}

std::string SyncMessage::serialize() const {
    Json::StreamWriterBuilder builder;
    builder["indentation"] = "";
    return Json::writeString(builder, toJson());
}

skp::Result<SyncMessage> SyncMessage::parse(const std::string& body) {
    Json::CharReaderBuilder builder;
    std::unique_ptr<Json::CharReader> reader(builder.newCharReader());
    Json::Value root;
    std::string errors;

    if (!reader->parse(body.data(), body.data() + body.size(), &root, &errors) || !root.isObject()) {
        return skp::Err<SyncMessage>(skp::ErrorCode::ValidationError, "Sync message is not a JSON object");
    }

    for (const char* field : {"messageId", "senderId", "receiverId", "type", "payload", "signature"}) {
        if (!root[field].isString()) {
            return skp::Err<SyncMessage>(skp::ErrorCode::ValidationError,
                                         std::string("Sync message field missing: ") + field);
        }
    }
    if (!root["timestamp"].isIntegral()) {
        return skp::Err<SyncMessage>(skp::ErrorCode::ValidationError, "Sync message timestamp must be an integer");
    }

    SyncMessage message;
    if (!parseSyncMessageType(root["type"].asString(), message.type)) {
        return skp::Err<SyncMessage>(skp::ErrorCode::ValidationError, "Unknown sync message type");
    }
    message.messageId = root["messageId"].asString();
    message.senderId = root["senderId"].asString();
    message.receiverId = root["receiverId"].asString();
    message.timestamp = root["timestamp"].asInt64();
    message.payload = root["payload"].asString();
    message.signature = root["signature"].asString();
    return message;
}

} // namespace SkipKP
