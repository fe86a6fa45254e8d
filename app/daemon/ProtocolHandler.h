#pragma once

#include "HttpMessage.h"
#include "KeyProviderConfig.h"
#include "Result.h"

#include <memory>
#include <string>

namespace SkipKP {

class CapabilityRegistry;
class EntropyProvider;
class KeyStore;
class PeerRegistry;
class SyncMessenger;

/**
 * @brief GET /key
 */
struct KeyRequest {
    std::string remoteSystemId;
    int sizeBits = 0;

    static skp::Result<KeyRequest> fromHttp(const HttpRequest& request, int defaultSize);
};

/**
 * @brief GET /key/{keyId}
 */
struct KeyRetrievalRequest {
    std::string keyId;
    std::string remoteSystemId;

    static skp::Result<KeyRetrievalRequest> fromHttp(const HttpRequest& request, const std::string& keyId);
};

/**
 * @brief GET /entropy
 */
struct EntropyRequest {
    int minEntropyBits = 0;

    static skp::Result<EntropyRequest> fromHttp(const HttpRequest& request, int defaultBits);
};

/**
 * @brief Routes API requests to the core and renders the JSON replies
 *
 * Holds no state of its own. @p messenger may be null when sync is
 * disabled; POST /sync is then rejected.
 */
class ProtocolHandler {
public:
    ProtocolHandler(const KeyProviderConfig& config,
                    std::shared_ptr<KeyStore> keyStore,
                    std::shared_ptr<EntropyProvider> entropy,
                    std::shared_ptr<const CapabilityRegistry> capabilities,
                    std::shared_ptr<PeerRegistry> peers,
                    std::shared_ptr<SyncMessenger> messenger);

    HttpResponse handle(const HttpRequest& request);

    /// HTTP status for a core error code
    static int statusFor(skp::ErrorCode code);

private:
    HttpResponse handleCapabilities();
    HttpResponse handleNewKey(const HttpRequest& request);
    HttpResponse handleKeyById(const HttpRequest& request, const std::string& keyId);
    HttpResponse handleEntropy(const HttpRequest& request);
    HttpResponse handleSync(const HttpRequest& request);
    HttpResponse handleSyncStatus();
    HttpResponse handleHealth();

    bool syncEnabled_;
    std::string localSystemId_;
    int defaultKeySize_;
    int defaultEntropySize_;

    std::shared_ptr<KeyStore> keyStore_;
    std::shared_ptr<EntropyProvider> entropy_;
    std::shared_ptr<const CapabilityRegistry> capabilities_;
    std::shared_ptr<PeerRegistry> peers_;
    std::shared_ptr<SyncMessenger> messenger_;
};

} // namespace SkipKP
