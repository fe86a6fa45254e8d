#include "ProtocolHandler.h"
#include "CapabilityRegistry.h"
#include "Constants.h"
#include "Crypto.h"
#include "EntropyProvider.h"
#include "KeyStore.h"
#include "Logger.h"
#include "MetricsCollector.h"
#include "PeerRegistry.h"
#include "SyncMessenger.h"
#include "Version.h"

#include <algorithm>
#include <cctype>
#include <chrono>

namespace SkipKP {

namespace {

// Whole-string decimal integer
bool parseInt(const std::string& text, int& out) {
    if (text.empty()) {
        return false;
    }
    size_t consumed = 0;
    try {
        out = std::stoi(text, &consumed);
    } catch (const std::logic_error&) {
        return false;
    }
    return consumed == text.size() && !std::isspace(static_cast<unsigned char>(text[0]));
}

int64_t epochSeconds(std::chrono::system_clock::time_point tp) {
    return std::chrono::duration_cast<std::chrono::seconds>(tp.time_since_epoch()).count();
}

// {"keyId":"...","key":"..."} built in one buffer so it can be wiped after sending
HttpResponse keyResponse(const std::string& keyId, const skp::SecureBuffer& material) {
    HttpResponse response;
    response.sensitive = true;
    response.body.reserve(keyId.size() + material.size() * 2 + 32);
    response.body += "{\"keyId\":\"";
    response.body += keyId;
    response.body += "\",\"key\":\"";
    Crypto::appendHex(response.body, material.data(), material.size());
    response.body += "\"}";
    return response;
}

} // namespace

// ============================================================================
// Typed requests
// ============================================================================

skp::Result<KeyRequest> KeyRequest::fromHttp(const HttpRequest& request, int defaultSize) {
    KeyRequest parsed;
    parsed.remoteSystemId = request.queryParam("remoteSystemID");
    if (parsed.remoteSystemId.empty()) {
        return skp::Err<KeyRequest>(skp::ErrorCode::ValidationError, "remoteSystemID is required");
    }

    parsed.sizeBits = defaultSize;
    if (request.hasQuery("size") && !parseInt(request.queryParam("size"), parsed.sizeBits)) {
        return skp::Err<KeyRequest>(skp::ErrorCode::ValidationError, "Invalid size parameter");
    }
    return parsed;
}

skp::Result<KeyRetrievalRequest> KeyRetrievalRequest::fromHttp(const HttpRequest& request, const std::string& keyId) {
    KeyRetrievalRequest parsed;
    parsed.remoteSystemId = request.queryParam("remoteSystemID");
    if (parsed.remoteSystemId.empty()) {
        return skp::Err<KeyRetrievalRequest>(skp::ErrorCode::ValidationError, "remoteSystemID is required");
    }
    if (!KeyStore::isWellFormedKeyId(keyId)) {
        return skp::Err<KeyRetrievalRequest>(skp::ErrorCode::ValidationError, "Malformed keyId");
    }
    parsed.keyId = keyId;
    return parsed;
}

skp::Result<EntropyRequest> EntropyRequest::fromHttp(const HttpRequest& request, int defaultBits) {
    EntropyRequest parsed;
    parsed.minEntropyBits = defaultBits;
    if (request.hasQuery("minentropy") && !parseInt(request.queryParam("minentropy"), parsed.minEntropyBits)) {
        return skp::Err<EntropyRequest>(skp::ErrorCode::ValidationError, "Invalid minentropy parameter");
    }
    if (parsed.minEntropyBits < skp::config::MIN_ENTROPY_BITS || parsed.minEntropyBits > skp::config::MAX_ENTROPY_BITS) {
        return skp::Err<EntropyRequest>(skp::ErrorCode::InvalidSize,
            "Invalid minentropy. Must be between " + std::to_string(skp::config::MIN_ENTROPY_BITS) + " and " +
            std::to_string(skp::config::MAX_ENTROPY_BITS) + " bits");
    }
    return parsed;
}

// ============================================================================
// Routing
// ============================================================================

ProtocolHandler::ProtocolHandler(const KeyProviderConfig& config,
                                 std::shared_ptr<KeyStore> keyStore,
                                 std::shared_ptr<EntropyProvider> entropy,
                                 std::shared_ptr<const CapabilityRegistry> capabilities,
                                 std::shared_ptr<PeerRegistry> peers,
                                 std::shared_ptr<SyncMessenger> messenger)
    : syncEnabled_(config.syncEnabled),
      localSystemId_(config.localSystemId),
      defaultKeySize_(config.defaultKeySize),
      defaultEntropySize_(config.defaultEntropySize),
      keyStore_(std::move(keyStore)),
      entropy_(std::move(entropy)),
      capabilities_(std::move(capabilities)),
      peers_(std::move(peers)),
      messenger_(std::move(messenger)) {}

int ProtocolHandler::statusFor(skp::ErrorCode code) {
    if (skp::isClientError(code)) {
        return 400;
    }
    switch (code) {
        case skp::ErrorCode::InvalidSignature:
        case skp::ErrorCode::ReplayRejected:
        case skp::ErrorCode::DecryptionFailed:
            return 400;
        case skp::ErrorCode::RngUnavailable:
        case skp::ErrorCode::StorageUnavailable:
        case skp::ErrorCode::DatabaseError:
        case skp::ErrorCode::CapacityExceeded:
            return 503;
        default:
            return 500;
    }
}

HttpResponse ProtocolHandler::handle(const HttpRequest& request) {
    const std::string& path = request.path;
    const bool isGet = request.method == "GET";

    Logger::instance().log(LogLevel::DEBUG, request.method + " " + path, "ProtocolHandler");

    if (path == "/capabilities") {
        return isGet ? handleCapabilities() : HttpResponse::error(405, "Method not allowed");
    }
    if (path == "/key") {
        return isGet ? handleNewKey(request) : HttpResponse::error(405, "Method not allowed");
    }
    static const std::string keyPrefix = "/key/";
    if (path.compare(0, keyPrefix.size(), keyPrefix) == 0 && path.size() > keyPrefix.size() &&
        path.find('/', keyPrefix.size()) == std::string::npos) {
        return isGet ? handleKeyById(request, path.substr(keyPrefix.size()))
                     : HttpResponse::error(405, "Method not allowed");
    }
    if (path == "/entropy") {
        return isGet ? handleEntropy(request) : HttpResponse::error(405, "Method not allowed");
    }
    if (path == "/sync") {
        return request.method == "POST" ? handleSync(request) : HttpResponse::error(405, "Method not allowed");
    }
    if (path == "/status/sync") {
        return isGet ? handleSyncStatus() : HttpResponse::error(405, "Method not allowed");
    }
    if (path == "/status/health") {
        return isGet ? handleHealth() : HttpResponse::error(405, "Method not allowed");
    }
    return HttpResponse::error(404, "Endpoint not found");
}

HttpResponse ProtocolHandler::handleCapabilities() {
    return HttpResponse::json(200, capabilities_->describe().toJson());
}

HttpResponse ProtocolHandler::handleNewKey(const HttpRequest& request) {
    auto parsed = KeyRequest::fromHttp(request, defaultKeySize_);
    if (!parsed) {
        return HttpResponse::error(400, parsed.error().message);
    }

    auto key = keyStore_->generate(parsed->remoteSystemId, parsed->sizeBits);
    if (!key) {
        int status = statusFor(key.code());
        if (status == 400) {
            return HttpResponse::error(400, key.error().message);
        }
        Logger::instance().log(LogLevel::ERROR, "Key generation failed: " + key.error().message, "ProtocolHandler");
        if (key.code() == skp::ErrorCode::RngUnavailable) {
            return HttpResponse::error(status, "Hardware random number generator not available");
        }
        return HttpResponse::error(status, status == 503 ? "Key storage unavailable" : "Internal server error");
    }

    return keyResponse(key->keyId, key->keyMaterial);
}

HttpResponse ProtocolHandler::handleKeyById(const HttpRequest& request, const std::string& keyId) {
    auto parsed = KeyRetrievalRequest::fromHttp(request, keyId);
    if (!parsed) {
        return HttpResponse::error(400, parsed.error().message);
    }

    auto material = keyStore_->retrieve(parsed->keyId, parsed->remoteSystemId);
    if (!material) {
        switch (material.code()) {
            case skp::ErrorCode::Unauthorized:
                return HttpResponse::error(400, "Invalid remoteSystemID");
            case skp::ErrorCode::NotFound:
            case skp::ErrorCode::AlreadyConsumed:
                return HttpResponse::error(400, "Key not found");
            default:
                Logger::instance().log(LogLevel::ERROR, "Key retrieval failed: " + material.error().message,
                                       "ProtocolHandler");
                return HttpResponse::error(statusFor(material.code()), "Internal error while trying to read key");
        }
    }

    std::string id = parsed->keyId;
    std::transform(id.begin(), id.end(), id.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return keyResponse(id, *material);
}

HttpResponse ProtocolHandler::handleEntropy(const HttpRequest& request) {
    auto parsed = EntropyRequest::fromHttp(request, defaultEntropySize_);
    if (!parsed) {
        return HttpResponse::error(400, parsed.error().message);
    }

    auto random = entropy_->generate(parsed->minEntropyBits);
    if (!random) {
        int status = statusFor(random.code());
        Logger::instance().log(LogLevel::ERROR, "Entropy request failed: " + random.error().message, "ProtocolHandler");
        return HttpResponse::error(status, status == 503 ? "Hardware random number generator not available"
                                                         : random.error().message);
    }

    Json::Value body;
    body["randomStr"] = *random;
    body["minentropy"] = parsed->minEntropyBits;
    return HttpResponse::json(200, body);
}

HttpResponse ProtocolHandler::handleSync(const HttpRequest& request) {
    Json::Value body;
    if (!syncEnabled_ || !messenger_) {
        body["status"] = "error";
        body["message"] = "rejected";
        return HttpResponse::json(400, body);
    }

    auto ack = messenger_->receive(request.body);
    if (!ack) {
        // Details stay in the log
        int status = statusFor(ack.code());
        body["status"] = "error";
        body["message"] = "rejected";
        return HttpResponse::json(status == 503 ? 503 : 400, body);
    }

    body["status"] = "ok";
    body["message"] = *ack;
    return HttpResponse::json(200, body);
}

HttpResponse ProtocolHandler::handleSyncStatus() {
    Json::Value body;
    body["sync_enabled"] = syncEnabled_;
    body["local_system_id"] = localSystemId_;

    auto now = std::chrono::system_clock::now();
    auto peers = peers_ ? peers_->getAllPeers() : std::vector<PeerInfo>();
    body["peer_count"] = static_cast<Json::UInt64>(peers.size());

    Json::Value peerMap(Json::objectValue);
    Json::UInt64 online = 0;
    for (const auto& peer : peers) {
        Json::Value entry;
        entry["endpoint"] = peer.endpoint + ":" + std::to_string(peer.port);
        entry["status"] = peerStatusToString(peer.status);
        entry["last_heartbeat"] = peer.lastHeartbeatAt ? Json::Value(static_cast<Json::Int64>(epochSeconds(*peer.lastHeartbeatAt)))
                                                       : Json::Value(Json::nullValue);
        entry["stale"] = peers_->isStale(peer, now);
        entry["consecutive_failures"] = peer.consecutiveFailures;
        if (!peer.lastError.empty()) {
            entry["last_error"] = peer.lastError;
        }
        entry["capabilities"] = peer.capabilities ? peer.capabilities->toJson() : Json::Value(Json::nullValue);
        peerMap[peer.systemId] = entry;

        if (peer.status == PeerStatus::Online) {
            ++online;
        }
    }
    body["online_count"] = online;
    body["peers"] = peerMap;
    return HttpResponse::json(200, body);
}

HttpResponse ProtocolHandler::handleHealth() {
    auto& metrics = MetricsCollector::instance();

    Json::Value body;
    body["timestamp"] = static_cast<Json::Int64>(epochSeconds(std::chrono::system_clock::now()));
    body["version"] = Version::STRING;
    body["localSystemID"] = localSystemId_;

    auto db = keyStore_->healthCheck();
    body["database"] = db ? "connected" : "unavailable";
    body["status"] = db ? "ok" : "degraded";

    auto counts = keyStore_->counts();
    if (counts) {
        Json::Value keys;
        keys["live"] = static_cast<Json::UInt64>(counts->live);
        keys["consumed"] = static_cast<Json::UInt64>(counts->consumed);
        body["keys"] = keys;
    }

    auto keyMetrics = metrics.getKeyMetrics();
    auto syncMetrics = metrics.getSyncMetrics();
    auto securityMetrics = metrics.getSecurityMetrics();

    Json::Value m;
    m["uptime_seconds"] = static_cast<Json::Int64>(metrics.getUptime().count());
    m["keys_generated"] = static_cast<Json::UInt64>(keyMetrics.keysGenerated);
    m["keys_retrieved"] = static_cast<Json::UInt64>(keyMetrics.keysRetrieved);
    m["keys_received"] = static_cast<Json::UInt64>(keyMetrics.keysReceived);
    m["keys_replicated"] = static_cast<Json::UInt64>(keyMetrics.keysReplicated);
    m["keys_retired"] = static_cast<Json::UInt64>(keyMetrics.keysRetired);
    m["keys_expired"] = static_cast<Json::UInt64>(keyMetrics.keysExpired);
    m["entropy_requests"] = static_cast<Json::UInt64>(keyMetrics.entropyRequests);
    m["sync_messages_sent"] = static_cast<Json::UInt64>(syncMetrics.messagesSent);
    m["sync_messages_received"] = static_cast<Json::UInt64>(syncMetrics.messagesReceived);
    m["sync_failures"] = static_cast<Json::UInt64>(syncMetrics.sendFailures);
    m["auth_failures"] = static_cast<Json::UInt64>(securityMetrics.authFailures);
    m["signature_failures"] = static_cast<Json::UInt64>(securityMetrics.signatureFailures);
    m["replay_rejections"] = static_cast<Json::UInt64>(securityMetrics.replayRejections);
    m["rng_failures"] = static_cast<Json::UInt64>(securityMetrics.rngFailures);
    m["storage_errors"] = static_cast<Json::UInt64>(securityMetrics.storageErrors);
    body["metrics"] = m;

    return HttpResponse::json(db ? 200 : 503, body);
}

} // namespace SkipKP
