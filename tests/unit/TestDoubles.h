#pragma once

#include "EntropyProvider.h"
#include "HttpMessage.h"
#include "IPeerTransport.h"
#include "KeyProviderConfig.h"
#include "PeerRegistry.h"
#include "ProtocolHandler.h"

#include <atomic>
#include <deque>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace SkipKP {

/// Random source that can be switched off to simulate a dead RNG
class FailingRandomSource : public IRandomSource {
public:
    bool fill(uint8_t* out, std::size_t len) override {
        if (failing) {
            return false;
        }
        return fallback_.fill(out, len);
    }

    std::atomic<bool> failing{true};

private:
    OpenSSLRandomSource fallback_;
};

struct RecordedPost {
    std::string peerId;
    std::string senderId;
    std::string body;
};

/// Replays queued outcomes; answers 200 once the script runs out
class ScriptedTransport : public IPeerTransport {
public:
    skp::Result<TransportResponse> post(const PeerInfo& peer,
                                        const std::string& senderId,
                                        const std::string& body,
                                        std::chrono::milliseconds) override {
        std::lock_guard<std::mutex> lock(mutex_);
        posts_.push_back({peer.systemId, senderId, body});
        if (script_.empty()) {
            TransportResponse ok;
            ok.status = 200;
            ok.body = "{\"status\":\"ok\"}";
            return ok;
        }
        auto next = std::move(script_.front());
        script_.pop_front();
        return next;
    }

    void pushStatus(int status) {
        TransportResponse response;
        response.status = status;
        std::lock_guard<std::mutex> lock(mutex_);
        script_.emplace_back(response);
    }

    void pushError(skp::ErrorCode code) {
        std::lock_guard<std::mutex> lock(mutex_);
        script_.emplace_back(skp::Error(code, "scripted failure"));
    }

    /// Fail every post until cleared
    void pushErrors(skp::ErrorCode code, int count) {
        for (int i = 0; i < count; ++i) {
            pushError(code);
        }
    }

    std::vector<RecordedPost> posts() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return posts_;
    }

    std::size_t postCount() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return posts_.size();
    }

private:
    mutable std::mutex mutex_;
    std::deque<skp::Result<TransportResponse>> script_;
    std::vector<RecordedPost> posts_;
};

/// Delivers posts straight into another Key Provider's request handler
class LoopbackTransport : public IPeerTransport {
public:
    void connect(const std::string& peerId, std::shared_ptr<ProtocolHandler> handler) {
        std::lock_guard<std::mutex> lock(mutex_);
        targets_.push_back({peerId, std::move(handler)});
    }

    skp::Result<TransportResponse> post(const PeerInfo& peer,
                                        const std::string& senderId,
                                        const std::string& body,
                                        std::chrono::milliseconds) override {
        std::shared_ptr<ProtocolHandler> target;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            for (const auto& entry : targets_) {
                if (entry.peerId == peer.systemId) {
                    target = entry.handler;
                }
            }
        }
        if (!target) {
            return skp::Err<TransportResponse>(skp::ErrorCode::ConnectionFailed, "no route to " + peer.systemId);
        }

        HttpRequest request;
        request.method = "POST";
        request.path = "/sync";
        request.headers["x-skip-sender"] = senderId;
        request.body = body;

        HttpResponse reply = target->handle(request);
        TransportResponse response;
        response.status = reply.status;
        response.body = reply.body;
        return response;
    }

private:
    struct Target {
        std::string peerId;
        std::shared_ptr<ProtocolHandler> handler;
    };

    std::mutex mutex_;
    std::vector<Target> targets_;
};

/// In-memory configuration that authorizes every KP_* system
inline KeyProviderConfig makeTestConfig(const std::string& localSystemId) {
    KeyProviderConfig config;
    config.localSystemId = localSystemId;
    config.remoteSystemIds = {"KP_*"};
    config.storageBackend = StorageBackend::Memory;
    config.listenPort = 0;
    config.workerThreads = 2;
    config.retryBackoff = std::chrono::milliseconds(1);
    config.syncTimeout = std::chrono::milliseconds(2000);
    config.heartbeatInterval = std::chrono::milliseconds(200);
    config.syncInterval = std::chrono::milliseconds(200);
    config.logLevel = "WARN";
    return config;
}

inline void addPeer(KeyProviderConfig& config, const std::string& systemId, const std::string& secret,
                    int port = 9) {
    PeerConfig peer;
    peer.systemId = systemId;
    peer.endpoint = "127.0.0.1";
    peer.port = port;
    peer.sharedSecret = secret;
    config.peers.push_back(peer);
}

/// Secret shared by a pair of test Key Providers (40 bytes)
inline std::string pairSecret(const std::string& a, const std::string& b) {
    std::string first = a < b ? a : b;
    std::string second = a < b ? b : a;
    std::string secret = "test-secret:" + first + ":" + second + ":";
    while (secret.size() < 40) {
        secret += 'x';
    }
    return secret;
}

} // namespace SkipKP
