#pragma once

/**
 * @file HttpServer.h
 * @brief Blocking HTTP/1.1 listener serving the Key Provider API
 *
 * One accept thread with a 1 s select timeout so stop() is picked up
 * promptly; each connection is handled on a worker pool and closed after
 * a single response.
 */

#include "HttpMessage.h"
#include "Result.h"
#include "SocketGuard.h"
#include "ThreadPool.h"

#include <atomic>
#include <functional>
#include <memory>
#include <string>
#include <thread>

namespace SkipKP {

using RequestHandler = std::function<HttpResponse(const HttpRequest&)>;

class HttpServer {
public:
    /**
     * @param port 0 binds an ephemeral port, see boundPort()
     */
    HttpServer(std::string address, int port, std::size_t workerThreads, RequestHandler handler);
    ~HttpServer();

    HttpServer(const HttpServer&) = delete;
    HttpServer& operator=(const HttpServer&) = delete;

    /// ConnectionFailed if the address cannot be bound
    skp::Result<void> start();
    void stop();

    bool isRunning() const { return running_; }
    int boundPort() const { return boundPort_; }

private:
    void serverLoop();
    void handleClient(skp::SocketGuard client);
    static bool sendAll(int fd, const std::string& data);

    std::string address_;
    int port_;
    std::atomic<int> boundPort_{0};
    std::size_t workerThreads_;
    RequestHandler handler_;

    skp::SocketGuard serverSocket_;
    std::unique_ptr<ThreadPool> pool_;
    std::atomic<bool> running_{false};
    std::thread serverThread_;
};

} // namespace SkipKP
