#pragma once

#include "Result.h"

#include <chrono>
#include <string>

namespace SkipKP {

struct PeerInfo;

struct TransportResponse {
    int status = 0;
    std::string body;

    bool isSuccess() const { return status >= 200 && status < 300; }
};

/**
 * @brief Delivers a serialized SyncMessage to a peer's /sync endpoint
 *
 * One call is one attempt. Retries, backoff and peer state belong to
 * SyncMessenger. Transport failures use the ConnectionFailed /
 * ConnectionTimeout / SendFailed / ReceiveFailed codes; an HTTP reply of
 * any status is a successful delivery.
 */
class IPeerTransport {
public:
    virtual ~IPeerTransport() = default;

    virtual skp::Result<TransportResponse> post(const PeerInfo& peer,
                                                const std::string& senderId,
                                                const std::string& body,
                                                std::chrono::milliseconds timeout) = 0;
};

} // namespace SkipKP
