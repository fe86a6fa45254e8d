#include "SyncMessenger.h"
#include "CapabilityRegistry.h"
#include "Constants.h"
#include "Crypto.h"
#include "EntropyProvider.h"
#include "KeyStore.h"
#include "Logger.h"
#include "MetricsCollector.h"
#include "PeerRegistry.h"

#include <json/json.h>

#include <algorithm>
#include <cstdlib>
#include <cstring>
#include <memory>

namespace SkipKP {

namespace {

std::string compactJson(const Json::Value& value) {
    Json::StreamWriterBuilder builder;
    builder["indentation"] = "";
    return Json::writeString(builder, value);
}

bool parseJson(const std::string& text, Json::Value& out) {
    Json::CharReaderBuilder builder;
    std::unique_ptr<Json::CharReader> reader(builder.newCharReader());
    std::string errors;
    return reader->parse(text.data(), text.data() + text.size(), &out, &errors);
}

std::string payloadAad(const std::string& senderId, const std::string& receiverId) {
    return senderId + "\n" + receiverId;
}

skp::SecureBuffer payloadKey(const skp::SecureBuffer& secret) {
    return Crypto::hkdfSHA256(secret, skp::config::SYNC_KDF_SALT, skp::config::SYNC_KDF_INFO, Crypto::KEY_SIZE);
}

} // namespace

SyncMessenger::SyncMessenger(const KeyProviderConfig& config,
                             std::shared_ptr<PeerRegistry> peers,
                             std::shared_ptr<KeyStore> keyStore,
                             std::shared_ptr<const CapabilityRegistry> capabilities,
                             std::shared_ptr<EntropyProvider> entropy,
                             std::shared_ptr<IPeerTransport> transport)
    : localSystemId_(config.localSystemId),
      maxRetryAttempts_(config.maxRetryAttempts),
      retryBackoff_(config.retryBackoff),
      syncTimeout_(config.syncTimeout),
      replayWindow_(config.replayWindow),
      peers_(std::move(peers)),
      keyStore_(std::move(keyStore)),
      capabilities_(std::move(capabilities)),
      entropy_(std::move(entropy)),
      transport_(std::move(transport)) {
}

int64_t SyncMessenger::nowMillis() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

void SyncMessenger::sign(SyncMessage& message, const skp::SecureBuffer& secret) {
    message.signature = Crypto::hmacSHA256Hex(secret, message.signingInput());
}

// ============================================================================
// Outbound
// ============================================================================

skp::Result<SyncMessage> SyncMessenger::buildMessage(const std::string& peerId, SyncMessageType type,
                                                     std::string payload) {
    auto secret = peers_->sharedSecret(peerId);
    if (!secret) {
        return skp::Err<SyncMessage>(skp::ErrorCode::ValidationError, "Unknown peer: " + peerId);
    }

    auto messageId = entropy_->randomId(skp::config::KEY_ID_BYTES);
    if (!messageId) {
        return messageId.error();
    }

    SyncMessage message;
    message.messageId = *messageId;
    message.senderId = localSystemId_;
    message.receiverId = peerId;
    message.type = type;
    message.timestamp = nowMillis();
    message.payload = std::move(payload);

    try {
        sign(message, *secret);
    } catch (const std::exception& e) {
        return skp::Err<SyncMessage>(skp::ErrorCode::InternalError, std::string("Signing failed: ") + e.what());
    }
    return message;
}

skp::Result<void> SyncMessenger::sendHeartbeat(const std::string& peerId) {
    Json::Value payload;
    payload["status"] = "online";

    auto message = buildMessage(peerId, SyncMessageType::Heartbeat, compactJson(payload));
    if (!message) {
        return message.error();
    }
    return send(peerId, *message);
}

skp::Result<void> SyncMessenger::sendCapabilities(const std::string& peerId) {
    auto message = buildMessage(peerId, SyncMessageType::CapabilityExchange,
                                compactJson(capabilities_->describe().toJson()));
    if (!message) {
        return message.error();
    }
    return send(peerId, *message);
}

skp::Result<std::string> SyncMessenger::sealKey(const KeyRecord& record, const std::string& peerId,
                                                const skp::SecureBuffer& secret) const {
    Json::Value header;
    header["keyId"] = record.keyId;
    header["remoteSystemId"] = record.remoteSystemId;
    header["sizeBits"] = record.sizeBits;
    header["createdAt"] = static_cast<Json::Int64>(record.createdAt);
    std::string line = compactJson(header);

    // header line, '\n', raw key bytes
    skp::SecureBuffer plaintext(line.size() + 1 + record.keyMaterial.size());
    std::memcpy(plaintext.data(), line.data(), line.size());
    plaintext.data()[line.size()] = '\n';
    if (!record.keyMaterial.empty()) {
        std::memcpy(plaintext.data() + line.size() + 1, record.keyMaterial.data(), record.keyMaterial.size());
    }

    try {
        skp::SecureBuffer key = payloadKey(secret);
        auto sealed = Crypto::sealAesGcm(key, plaintext, payloadAad(localSystemId_, peerId));
        return Crypto::base64Encode(sealed);
    } catch (const std::exception& e) {
        return skp::Err<std::string>(skp::ErrorCode::InternalError, std::string("Sealing key failed: ") + e.what());
    }
}

skp::Result<void> SyncMessenger::sendKey(const std::string& peerId, const KeyRecord& record) {
    auto secret = peers_->sharedSecret(peerId);
    if (!secret) {
        return skp::Err(skp::ErrorCode::ValidationError, "Unknown peer: " + peerId);
    }

    auto payload = sealKey(record, peerId, *secret);
    if (!payload) {
        return payload.error();
    }

    auto message = buildMessage(peerId, SyncMessageType::KeySync, std::move(*payload));
    if (!message) {
        return message.error();
    }
    return send(peerId, *message);
}

skp::Result<void> SyncMessenger::send(const std::string& peerId, const SyncMessage& message) {
    auto& logger = Logger::instance();
    auto& metrics = MetricsCollector::instance();

    auto peer = peers_->getPeer(peerId);
    if (!peer) {
        return skp::Err(skp::ErrorCode::ValidationError, "Unknown peer: " + peerId);
    }

    const std::string body = message.serialize();
    const char* typeName = syncMessageTypeToString(message.type);
    const int attempts = 1 + std::max(0, maxRetryAttempts_);
    skp::Error lastError(skp::ErrorCode::PeerUnreachable);

    for (int attempt = 0; attempt < attempts; ++attempt) {
        if (attempt > 0) {
            auto delay = retryBackoff_ * (1LL << (attempt - 1));
            metrics.incrementSendRetries();
            logger.log(LogLevel::DEBUG, "Retrying " + std::string(typeName) + " to " + peerId + " in " +
                       std::to_string(delay.count()) + "ms", "SyncMessenger");
            if (!waitForRetry(delay)) {
                return skp::Err(skp::ErrorCode::PeerUnreachable, "Send to " + peerId + " cancelled");
            }
        } else if (cancelled()) {
            return skp::Err(skp::ErrorCode::PeerUnreachable, "Send to " + peerId + " cancelled");
        }

        auto response = transport_->post(*peer, localSystemId_, body, syncTimeout_);
        if (response) {
            if (response->isSuccess()) {
                metrics.incrementMessagesSent();
                peers_->recordSuccess(peerId, message.type == SyncMessageType::Heartbeat);
                logger.log(LogLevel::DEBUG, "Sent " + std::string(typeName) + " to " + peerId, "SyncMessenger");
                return skp::Ok();
            }
            // The peer answered and refused; retrying the same message will not help.
            lastError = skp::Error(skp::ErrorCode::PeerRejected,
                                   peerId + " rejected " + typeName + " with HTTP " + std::to_string(response->status));
            break;
        }

        lastError = response.error();
        logger.log(LogLevel::DEBUG, "Attempt " + std::to_string(attempt + 1) + "/" + std::to_string(attempts) +
                   " to " + peerId + " failed: " + lastError.message, "SyncMessenger");
        if (!skp::isTransientTransportError(lastError.code)) {
            break;
        }
    }

    metrics.incrementSendFailures();
    logger.log(LogLevel::WARN, "Failed to send " + std::string(typeName) + " to " + peerId + ": " +
               lastError.message, "SyncMessenger");

    if (lastError.code == skp::ErrorCode::PeerRejected) {
        // A refusal still proves the peer is reachable
        peers_->recordSuccess(peerId);
        return lastError;
    }
    peers_->recordFailure(peerId, lastError.message);
    return skp::Err(skp::ErrorCode::PeerUnreachable, lastError.message);
}

bool SyncMessenger::waitForRetry(std::chrono::milliseconds delay) {
    std::unique_lock<std::mutex> lock(cancelMutex_);
    return !cancelCv_.wait_for(lock, delay, [this] { return cancelled_; });
}

bool SyncMessenger::cancelled() const {
    std::lock_guard<std::mutex> lock(cancelMutex_);
    return cancelled_;
}

void SyncMessenger::cancelRetries() {
    {
        std::lock_guard<std::mutex> lock(cancelMutex_);
        cancelled_ = true;
    }
    cancelCv_.notify_all();
}

// ============================================================================
// Inbound
// ============================================================================

skp::Result<std::string> SyncMessenger::receive(const std::string& body) {
    auto& logger = Logger::instance();
    auto& metrics = MetricsCollector::instance();
    metrics.incrementMessagesReceived();

    auto parsed = SyncMessage::parse(body);
    if (!parsed) {
        logger.log(LogLevel::WARN, "Rejected sync message: " + parsed.error().message, "SyncMessenger");
        return parsed.error();
    }
    const SyncMessage& message = *parsed;

    if (message.receiverId != localSystemId_) {
        logger.log(LogLevel::WARN, "Rejected sync message for " + message.receiverId + " from " +
                   message.senderId, "SyncMessenger");
        return skp::Err<std::string>(skp::ErrorCode::ValidationError, "Message not addressed to this Key Provider");
    }

    auto secret = peers_->sharedSecret(message.senderId);
    if (!secret) {
        metrics.incrementSignatureFailures();
        logger.log(LogLevel::WARN, "Rejected sync message from unknown sender " + message.senderId, "SyncMessenger");
        return skp::Err<std::string>(skp::ErrorCode::InvalidSignature, "Unknown sender");
    }

    std::string expected;
    try {
        expected = Crypto::hmacSHA256Hex(*secret, message.signingInput());
    } catch (const std::exception& e) {
        return skp::Err<std::string>(skp::ErrorCode::InternalError, std::string("Signature check failed: ") + e.what());
    }
    if (!Crypto::constantTimeEquals(expected, message.signature)) {
        metrics.incrementSignatureFailures();
        logger.log(LogLevel::WARN, "Invalid signature on " + std::string(syncMessageTypeToString(message.type)) +
                   " from " + message.senderId, "SyncMessenger");
        return skp::Err<std::string>(skp::ErrorCode::InvalidSignature);
    }

    int64_t skew = std::llabs(nowMillis() - message.timestamp);
    int64_t window = std::chrono::duration_cast<std::chrono::milliseconds>(replayWindow_).count();
    if (skew > window) {
        metrics.incrementReplayRejections();
        logger.log(LogLevel::WARN, "Rejected stale " + std::string(syncMessageTypeToString(message.type)) +
                   " from " + message.senderId + " (skew " + std::to_string(skew) + "ms)", "SyncMessenger");
        return skp::Err<std::string>(skp::ErrorCode::ReplayRejected);
    }

    switch (message.type) {
        case SyncMessageType::Heartbeat:
            peers_->recordHeartbeatReceived(message.senderId);
            return std::string("Heartbeat acknowledged");
        case SyncMessageType::CapabilityExchange:
            return handleCapabilities(message);
        case SyncMessageType::KeySync:
            return handleKeySync(message, *secret);
        default:
            return skp::Err<std::string>(skp::ErrorCode::ValidationError, "Unsupported message type");
    }
}

skp::Result<std::string> SyncMessenger::handleCapabilities(const SyncMessage& message) {
    Json::Value root;
    if (!parseJson(message.payload, root)) {
        return skp::Err<std::string>(skp::ErrorCode::ValidationError, "Capability payload is not JSON");
    }
    auto descriptor = CapabilityDescriptor::fromJson(root);
    if (!descriptor) {
        return descriptor.error();
    }

    // Stored for diagnostics; never merged into local authorization.
    peers_->setCapabilities(message.senderId, std::move(*descriptor));
    Logger::instance().log(LogLevel::INFO, "Received capabilities from " + message.senderId, "SyncMessenger");
    return std::string("Capabilities recorded");
}

skp::Result<std::string> SyncMessenger::handleKeySync(const SyncMessage& message, const skp::SecureBuffer& secret) {
    auto& logger = Logger::instance();

    std::vector<uint8_t> sealed;
    if (!Crypto::base64Decode(message.payload, sealed)) {
        return skp::Err<std::string>(skp::ErrorCode::ValidationError, "key_sync payload is not base64");
    }

    skp::SecureBuffer plaintext;
    try {
        skp::SecureBuffer key = payloadKey(secret);
        plaintext = Crypto::openAesGcm(key, sealed, payloadAad(message.senderId, localSystemId_));
    } catch (const std::exception& e) {
        MetricsCollector::instance().incrementSignatureFailures();
        logger.log(LogLevel::WARN, "Could not decrypt key_sync from " + message.senderId + ": " + e.what(), "SyncMessenger");
        return skp::Err<std::string>(skp::ErrorCode::DecryptionFailed);
    }

    const uint8_t* begin = plaintext.data();
    const uint8_t* end = begin + plaintext.size();
    const uint8_t* newline = std::find(begin, end, static_cast<uint8_t>('\n'));
    if (newline == end) {
        return skp::Err<std::string>(skp::ErrorCode::ValidationError, "key_sync payload has no header");
    }

    Json::Value header;
    std::string headerText(reinterpret_cast<const char*>(begin), static_cast<size_t>(newline - begin));
    if (!parseJson(headerText, header) || !header.isObject() ||
        !header["keyId"].isString() || !header["remoteSystemId"].isString() ||
        !header["sizeBits"].isInt() || !header["createdAt"].isIntegral()) {
        return skp::Err<std::string>(skp::ErrorCode::ValidationError, "key_sync header is malformed");
    }

    KeyRecord record;
    record.keyId = header["keyId"].asString();
    record.remoteSystemId = header["remoteSystemId"].asString();
    record.originSystemId = message.senderId;
    record.sizeBits = header["sizeBits"].asInt();
    record.createdAt = header["createdAt"].asInt64();
    record.syncedPeers = {message.senderId};
    record.keyMaterial = skp::SecureBuffer(newline + 1, static_cast<size_t>(end - newline - 1));
    plaintext.wipe();

    auto stored = keyStore_->insertReplicated(std::move(record));
    if (!stored) {
        logger.log(LogLevel::WARN, "Rejected key_sync from " + message.senderId + ": " + stored.error().message,
                   "SyncMessenger");
        return stored.error();
    }
    return std::string(*stored ? "Key stored" : "Key already known");
}

} // namespace SkipKP
