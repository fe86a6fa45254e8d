#include "HttpServer.h"
#include "Constants.h"
#include "Logger.h"
#include "SecureBuffer.h"

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/select.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>

namespace SkipKP {

HttpServer::HttpServer(std::string address, int port, std::size_t workerThreads, RequestHandler handler)
    : address_(std::move(address)),
      port_(port),
      workerThreads_(workerThreads == 0 ? 1 : workerThreads),
      handler_(std::move(handler)) {}

HttpServer::~HttpServer() {
    stop();
}

skp::Result<void> HttpServer::start() {
    auto& logger = Logger::instance();

    skp::SocketGuard sock(socket(AF_INET, SOCK_STREAM, 0));
    if (!sock) {
        return skp::Err(skp::ErrorCode::ConnectionFailed, "Failed to create listen socket: " + std::string(strerror(errno)));
    }

    int opt = 1;
    setsockopt(sock.get(), SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt));

    struct sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port = htons(static_cast<uint16_t>(port_));
    if (inet_pton(AF_INET, address_.c_str(), &addr.sin_addr) != 1) {
        return skp::Err(skp::ErrorCode::InvalidConfig, "Invalid listen address: " + address_);
    }

    if (bind(sock.get(), reinterpret_cast<struct sockaddr*>(&addr), sizeof(addr)) < 0) {
        return skp::Err(skp::ErrorCode::ConnectionFailed, "Failed to bind " + address_ + ":" +
                        std::to_string(port_) + ": " + strerror(errno));
    }

    if (listen(sock.get(), skp::config::HTTP_BACKLOG) < 0) {
        return skp::Err(skp::ErrorCode::ConnectionFailed, "Failed to listen: " + std::string(strerror(errno)));
    }

    struct sockaddr_in bound{};
    socklen_t boundLen = sizeof(bound);
    if (getsockname(sock.get(), reinterpret_cast<struct sockaddr*>(&bound), &boundLen) == 0) {
        boundPort_ = ntohs(bound.sin_port);
    } else {
        boundPort_ = port_;
    }

    serverSocket_ = std::move(sock);
    pool_ = std::make_unique<ThreadPool>(workerThreads_);
    running_ = true;
    serverThread_ = std::thread(&HttpServer::serverLoop, this);

    logger.log(LogLevel::INFO, "Listening on " + address_ + ":" + std::to_string(boundPort_.load()), "HttpServer");
    return skp::Ok();
}

void HttpServer::stop() {
    if (!running_.exchange(false)) {
        return;
    }

    if (serverThread_.joinable()) {
        serverThread_.join();
    }
    serverSocket_.reset();

    // Lets in-flight requests finish
    if (pool_) {
        pool_->shutdown();
    }

    Logger::instance().log(LogLevel::INFO, "HTTP server stopped", "HttpServer");
}

void HttpServer::serverLoop() {
    while (running_) {
        fd_set readfds;
        FD_ZERO(&readfds);
        FD_SET(serverSocket_.get(), &readfds);

        struct timeval tv;
        tv.tv_sec = 1;
        tv.tv_usec = 0;

        int activity = select(serverSocket_.get() + 1, &readfds, nullptr, nullptr, &tv);
        if (activity <= 0) continue;

        struct sockaddr_in clientAddr;
        socklen_t len = sizeof(clientAddr);
        int clientSocket = accept(serverSocket_.get(), reinterpret_cast<struct sockaddr*>(&clientAddr), &len);
        if (clientSocket < 0) {
            continue;
        }

        bool queued = pool_->tryPost([this, clientSocket]() {
            handleClient(skp::SocketGuard(clientSocket));
        });
        if (!queued) {
            ::close(clientSocket);
        }
    }
}

bool HttpServer::sendAll(int fd, const std::string& data) {
    size_t sent = 0;
    while (sent < data.size()) {
        ssize_t n = send(fd, data.data() + sent, data.size() - sent, MSG_NOSIGNAL);
        if (n < 0) {
            if (errno == EINTR) {
                continue;
            }
            return false;
        }
        sent += static_cast<size_t>(n);
    }
    return true;
}

void HttpServer::handleClient(skp::SocketGuard client) {
    struct timeval tv;
    tv.tv_sec = skp::config::CLIENT_RECV_TIMEOUT_SEC;
    tv.tv_usec = 0;
    setsockopt(client.get(), SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));
    setsockopt(client.get(), SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv));

    std::string raw;
    HttpResponse response;
    bool haveResponse = false;
    char buffer[4096];

    while (true) {
        ssize_t bytesRead = recv(client.get(), buffer, sizeof(buffer), 0);
        if (bytesRead < 0 && errno == EINTR) {
            continue;
        }
        if (bytesRead <= 0) {
            // Peer went away or timed out before a full request
            return;
        }
        raw.append(buffer, static_cast<size_t>(bytesRead));

        auto expected = HttpRequest::expectedSize(raw);
        if (!expected) {
            response = HttpResponse::error(400, "Malformed request");
            haveResponse = true;
            break;
        }
        if (*expected > skp::config::MAX_REQUEST_BYTES ||
            (*expected == 0 && raw.size() > skp::config::MAX_REQUEST_BYTES)) {
            response = HttpResponse::error(413, "Request too large");
            haveResponse = true;
            break;
        }
        if (*expected != 0 && raw.size() >= *expected) {
            break;
        }
    }

    if (!haveResponse) {
        auto request = HttpRequest::parse(raw);
        if (!request) {
            response = HttpResponse::error(400, "Malformed request");
        } else {
            try {
                response = handler_(*request);
            } catch (const std::exception& e) {
                Logger::instance().log(LogLevel::ERROR, "Request handler failed: " + std::string(e.what()), "HttpServer");
                response = HttpResponse::error(500, "Internal error");
            }
        }
    }

    std::string wire = response.serialize();
    if (!sendAll(client.get(), wire)) {
        Logger::instance().log(LogLevel::DEBUG, "Client disconnected before the response was sent", "HttpServer");
    }

    // Zeroize only after the payload has been handed to the socket
    if (response.sensitive) {
        skp::cleanseString(wire);
        skp::cleanseString(response.body);
    }
}

} // namespace SkipKP
