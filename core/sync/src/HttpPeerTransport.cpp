#include "HttpPeerTransport.h"
#include "Constants.h"
#include "Logger.h"
#include "PeerRegistry.h"

#include <sys/socket.h>
#include <sys/time.h>
#include <netdb.h>
#include <fcntl.h>
#include <poll.h>
#include <unistd.h>

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstring>

namespace SkipKP {

namespace {

timeval toTimeval(std::chrono::milliseconds timeout) {
    timeval tv{};
    tv.tv_sec = static_cast<time_t>(timeout.count() / 1000);
    tv.tv_usec = static_cast<suseconds_t>((timeout.count() % 1000) * 1000);
    return tv;
}

std::string lower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

// Content-Length from a raw header block, -1 when absent or unparsable
long contentLength(const std::string& headers) {
    std::string lowered = lower(headers);
    auto pos = lowered.find("\r\ncontent-length:");
    if (pos == std::string::npos) {
        return -1;
    }
    pos += std::strlen("\r\ncontent-length:");
    auto end = lowered.find("\r\n", pos);
    std::string value = lowered.substr(pos, end == std::string::npos ? std::string::npos : end - pos);
    try {
        return std::stol(value);
    } catch (const std::logic_error&) {
        return -1;
    }
}

} // namespace

skp::Result<skp::SocketGuard> HttpPeerTransport::connectTo(const std::string& host, int port,
                                                           std::chrono::milliseconds timeout) {
    struct addrinfo hints{}, *result = nullptr;
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;

    std::string portStr = std::to_string(port);
    int status = getaddrinfo(host.c_str(), portStr.c_str(), &hints, &result);
    if (status != 0) {
        return skp::Err<skp::SocketGuard>(skp::ErrorCode::ConnectionFailed,
                                          "Failed to resolve " + host + ": " + gai_strerror(status));
    }

    skp::SocketGuard sock(socket(result->ai_family, result->ai_socktype, result->ai_protocol));
    if (!sock) {
        freeaddrinfo(result);
        return skp::Err<skp::SocketGuard>(skp::ErrorCode::ConnectionFailed,
                                          "Failed to create socket: " + std::string(strerror(errno)));
    }

    // Non-blocking for connect with timeout
    int flags = fcntl(sock.get(), F_GETFL, 0);
    fcntl(sock.get(), F_SETFL, flags | O_NONBLOCK);

    int connectResult = ::connect(sock.get(), result->ai_addr, result->ai_addrlen);
    freeaddrinfo(result);

    if (connectResult < 0 && errno != EINPROGRESS) {
        return skp::Err<skp::SocketGuard>(skp::ErrorCode::ConnectionFailed,
                                          "Failed to connect to " + host + ":" + portStr + ": " + strerror(errno));
    }

    if (connectResult < 0) {
        struct pollfd pfd;
        pfd.fd = sock.get();
        pfd.events = POLLOUT;

        int pollResult = poll(&pfd, 1, static_cast<int>(timeout.count()));
        if (pollResult == 0) {
            return skp::Err<skp::SocketGuard>(skp::ErrorCode::ConnectionTimeout,
                                              "Connection to " + host + ":" + portStr + " timed out");
        }
        if (pollResult < 0) {
            return skp::Err<skp::SocketGuard>(skp::ErrorCode::ConnectionFailed,
                                              "poll failed: " + std::string(strerror(errno)));
        }

        int error = 0;
        socklen_t len = sizeof(error);
        getsockopt(sock.get(), SOL_SOCKET, SO_ERROR, &error, &len);
        if (error != 0) {
            return skp::Err<skp::SocketGuard>(skp::ErrorCode::ConnectionFailed,
                                              "Connection to " + host + ":" + portStr + " failed: " + strerror(error));
        }
    }

    // Back to blocking, bounded by socket timeouts
    fcntl(sock.get(), F_SETFL, flags);
    timeval tv = toTimeval(timeout);
    setsockopt(sock.get(), SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));
    setsockopt(sock.get(), SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv));

    return std::move(sock);
}

skp::Result<TransportResponse> HttpPeerTransport::post(const PeerInfo& peer,
                                                       const std::string& senderId,
                                                       const std::string& body,
                                                       std::chrono::milliseconds timeout) {
    auto sock = connectTo(peer.endpoint, peer.port, timeout);
    if (!sock) {
        return sock.error();
    }

    std::string request;
    request.reserve(body.size() + 256);
    request += "POST /sync HTTP/1.1\r\n";
    request += "Host: " + peer.endpoint + ":" + std::to_string(peer.port) + "\r\n";
    request += "Content-Type: application/json\r\n";
    request += "Content-Length: " + std::to_string(body.size()) + "\r\n";
    request += std::string(skp::config::SYNC_SENDER_HEADER) + ": " + senderId + "\r\n";
    request += "User-Agent: " + std::string(skp::config::SYNC_USER_AGENT_PREFIX) + senderId + "\r\n";
    request += "Connection: close\r\n\r\n";
    request += body;

    size_t sent = 0;
    while (sent < request.size()) {
        ssize_t n = send(sock->get(), request.data() + sent, request.size() - sent, MSG_NOSIGNAL);
        if (n < 0) {
            if (errno == EINTR) {
                continue;
            }
            if (errno == EAGAIN || errno == EWOULDBLOCK) {
                return skp::Err<TransportResponse>(skp::ErrorCode::ConnectionTimeout, "Send to " + peer.systemId + " timed out");
            }
            return skp::Err<TransportResponse>(skp::ErrorCode::SendFailed,
                                               "Send to " + peer.systemId + " failed: " + strerror(errno));
        }
        sent += static_cast<size_t>(n);
    }

    std::string raw;
    char buffer[4096];
    while (true) {
        ssize_t n = recv(sock->get(), buffer, sizeof(buffer), 0);
        if (n == 0) {
            break;
        }
        if (n < 0) {
            if (errno == EINTR) {
                continue;
            }
            if (errno == EAGAIN || errno == EWOULDBLOCK) {
                return skp::Err<TransportResponse>(skp::ErrorCode::ConnectionTimeout,
                                                   "No response from " + peer.systemId);
            }
            return skp::Err<TransportResponse>(skp::ErrorCode::ReceiveFailed,
                                               "Receive from " + peer.systemId + " failed: " + strerror(errno));
        }
        raw.append(buffer, static_cast<size_t>(n));
        if (raw.size() > skp::config::MAX_REQUEST_BYTES) {
            return skp::Err<TransportResponse>(skp::ErrorCode::ReceiveFailed, "Response from " + peer.systemId + " too large");
        }

        auto headerEnd = raw.find("\r\n\r\n");
        if (headerEnd != std::string::npos) {
            long length = contentLength(raw.substr(0, headerEnd + 2));
            if (length >= 0 && raw.size() >= headerEnd + 4 + static_cast<size_t>(length)) {
                break;
            }
        }
    }

    return parseResponse(raw);
}

skp::Result<TransportResponse> HttpPeerTransport::parseResponse(const std::string& raw) {
    // "HTTP/1.1 200 OK"
    auto lineEnd = raw.find("\r\n");
    if (raw.compare(0, 5, "HTTP/") != 0 || lineEnd == std::string::npos) {
        return skp::Err<TransportResponse>(skp::ErrorCode::ReceiveFailed, "Malformed HTTP response");
    }
    auto firstSpace = raw.find(' ');
    if (firstSpace == std::string::npos || firstSpace > lineEnd) {
        return skp::Err<TransportResponse>(skp::ErrorCode::ReceiveFailed, "Malformed HTTP status line");
    }

    TransportResponse response;
    try {
        response.status = std::stoi(raw.substr(firstSpace + 1, 3));
    } catch (const std::logic_error&) {
        return skp::Err<TransportResponse>(skp::ErrorCode::ReceiveFailed, "Malformed HTTP status code");
    }

    auto headerEnd = raw.find("\r\n\r\n");
    if (headerEnd != std::string::npos) {
        response.body = raw.substr(headerEnd + 4);
    }
    return response;
}

} // namespace SkipKP
