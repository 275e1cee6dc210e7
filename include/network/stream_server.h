#pragma once

#include "core/config_loader.h"
#include "detection/detection_invoker.h"
#include "session/connection_registry.h"
#include "session/connection_session.h"

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <list>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

namespace spoofwatch {
namespace network {

struct StreamServerOptions {
    std::string bindAddress = "0.0.0.0";
    int port = 8765;  // 0 = let the OS choose (tests)
    int backlog = 16;
    std::size_t maxMessageBytes = static_cast<std::size_t>(8 * 1024 * 1024);
    int pollIntervalMs = 200;
    StreamDefaults stream;
};

StreamServerOptions streamServerOptionsFromConfig(const AppConfig& config);

// TCP front end: one worker thread per accepted connection, newline-delimited JSON in both
// directions. Each worker owns exactly one ConnectionSession.
class StreamServer {
   public:
    StreamServer(StreamServerOptions options, session::ConnectionRegistry& registry,
                 const detection::DetectionInvoker& invoker);
    ~StreamServer();

    StreamServer(const StreamServer&) = delete;
    StreamServer& operator=(const StreamServer&) = delete;

    // Called on the connection thread after every detection_result sent.
    void setDetectionListener(session::DetectionListener listener);

    bool start();
    // Stop accepting, shut every connection down and join all workers.
    void stop();

    bool running() const {
        return running_.load(std::memory_order_acquire);
    }
    uint16_t boundPort() const {
        return boundPort_;
    }
    // Open transports, including ones that have not sent connect yet.
    std::size_t connectionCount() const;

   private:
    struct Connection {
        int fd = -1;
        std::string peer;
        std::mutex mutex;  // guards fd against shutdown() racing the final close
        std::thread worker;
        std::atomic<bool> finished{false};

        void shutdown();
        void closeSocket();
    };

    void acceptLoop();
    void serveConnection(const std::shared_ptr<Connection>& connection);
    void reapFinished();

    StreamServerOptions options_;
    session::ConnectionRegistry& registry_;
    const detection::DetectionInvoker& invoker_;
    session::DetectionListener detectionListener_;

    int listenFd_ = -1;
    uint16_t boundPort_ = 0;
    std::atomic<bool> running_{false};
    std::thread acceptThread_;

    mutable std::mutex connectionsMutex_;
    std::list<std::shared_ptr<Connection>> connections_;
};

}  // namespace network
}  // namespace spoofwatch
