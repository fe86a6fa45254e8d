#pragma once

#include "IPeerTransport.h"
#include "SocketGuard.h"

namespace SkipKP {

/**
 * @brief Plain HTTP/1.1 POST to http://endpoint:port/sync
 *
 * TLS is terminated in front of the Key Provider, so the transport speaks
 * plaintext HTTP. Blocking; each call opens and closes its own connection.
 */
class HttpPeerTransport : public IPeerTransport {
public:
    skp::Result<TransportResponse> post(const PeerInfo& peer,
                                        const std::string& senderId,
                                        const std::string& body,
                                        std::chrono::milliseconds timeout) override;

private:
    skp::Result<skp::SocketGuard> connectTo(const std::string& host, int port, std::chrono::milliseconds timeout);
    static skp::Result<TransportResponse> parseResponse(const std::string& raw);
};

} // namespace SkipKP
