#pragma once

#include "core/daemon_constants.h"
#include "core/error_codes.h"

#include <atomic>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <nlohmann/json.hpp>
#include <string>
#include <thread>

namespace zmq {
class context_t;
class socket_t;
}  // namespace zmq

namespace spoofwatch {
namespace control {

// One operator request. Two framings are accepted on the REP socket:
//   raw:  "CMD" or "CMD:argument"
//   JSON: {"cmd": "CMD", "params": {...}}
struct ControlRequest {
    std::string raw;
    std::string command;
    std::string argument;  // raw framing only
    nlohmann::json params = nlohmann::json::object();
    bool isJson = false;
    std::string parseError;

    // params[key] when it is a string (JSON framing), the argument otherwise.
    std::string stringParam(const std::string& key) const;
};

struct ControlServerOptions {
    std::string endpoint = DaemonConstants::ZEROMQ_IPC_PATH;
    int pollTimeoutMs = DaemonConstants::ZEROMQ_POLL_TIMEOUT_MS;
};

/**
 * @brief ZeroMQ REP command socket plus a PUB event socket.
 *
 * Commands are dispatched on one background thread; the PUB socket is written from any
 * thread. The PUB endpoint is derived from the REP endpoint (see derivePubEndpoint).
 */
class ControlServer {
   public:
    using Handler = std::function<std::string(const ControlRequest&)>;

    explicit ControlServer(ControlServerOptions options = ControlServerOptions());
    ~ControlServer();

    ControlServer(const ControlServer&) = delete;
    ControlServer& operator=(const ControlServer&) = delete;

    // Register before start(). Handlers run on the server thread; a throwing handler
    // produces an IPC_PROTOCOL_ERROR reply.
    void on(const std::string& command, Handler handler);

    bool start();
    void stop();
    bool isRunning() const {
        return running_.load(std::memory_order_acquire);
    }

    // Non-blocking; false when the socket is gone or the message was dropped.
    bool publish(const std::string& message);

    const std::string& endpoint() const {
        return options_.endpoint;
    }
    const std::string& pubEndpoint() const {
        return pubEndpoint_;
    }

    // ipc://x -> ipc://x.pub, tcp://host:N -> tcp://host:N+1, anything else -> suffix form.
    static std::string derivePubEndpoint(const std::string& endpoint);

    static ControlRequest parseRequest(const std::string& raw);

    // Replies in the framing the request used: JSON {"status":"ok",...} or "OK[:text]".
    static std::string okReply(const ControlRequest& request, const std::string& message = "",
                               const nlohmann::json& data = nullptr);
    static std::string errorReply(const ControlRequest& request, ErrorCode code,
                                  const std::string& message);

    // Dispatch without a socket (used by the server thread).
    std::string handle(const ControlRequest& request) const;

   private:
    void run();
    void closeSockets();

    ControlServerOptions options_;
    std::string pubEndpoint_;
    std::map<std::string, Handler> handlers_;

    std::unique_ptr<zmq::context_t> context_;
    std::unique_ptr<zmq::socket_t> rep_;
    std::unique_ptr<zmq::socket_t> pub_;
    std::mutex pubMutex_;

    std::thread thread_;
    std::atomic<bool> running_{false};
};

}  // namespace control
}  // namespace spoofwatch
