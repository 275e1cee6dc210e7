#pragma once

#include "daemon/metrics/status_report.h"

#include <atomic>
#include <cstdint>
#include <string>
#include <thread>

namespace spoofwatch {
namespace network {

struct HttpResponse {
    int status = 200;
    std::string body;  // JSON
};

// Minimal HTTP/1.1 status endpoint: GET /health and GET /stats, one request per
// connection, served sequentially on a single thread.
class StatusHttpServer {
   public:
    StatusHttpServer(std::string bindAddress, int port, metrics::Dependencies deps);
    ~StatusHttpServer();

    StatusHttpServer(const StatusHttpServer&) = delete;
    StatusHttpServer& operator=(const StatusHttpServer&) = delete;

    bool start();
    void stop();

    bool running() const {
        return running_.load(std::memory_order_acquire);
    }
    uint16_t boundPort() const {
        return boundPort_;
    }

    // Routing without the socket layer.
    HttpResponse handleRequest(const std::string& method, const std::string& target) const;

   private:
    void serveLoop();
    void serveClient(int fd) const;

    std::string bindAddress_;
    int port_;
    metrics::Dependencies deps_;
    int fd_ = -1;
    uint16_t boundPort_ = 0;
    std::atomic<bool> running_{false};
    std::thread worker_;
};

const char* httpReasonPhrase(int status);

}  // namespace network
}  // namespace spoofwatch
