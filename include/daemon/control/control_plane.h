#pragma once

#include "daemon/control/zmq_server.h"
#include "daemon/metrics/status_report.h"
#include "detection/detection_invoker.h"
#include "session/connection_registry.h"

#include <memory>
#include <string>

namespace spoofwatch {
namespace control {

struct ControlPlaneDependencies {
    session::ConnectionRegistry* registry = nullptr;
    metrics::Dependencies status;
    std::string endpoint = DaemonConstants::ZEROMQ_IPC_PATH;
};

// Operator control plane over ZeroMQ: PING, HEALTH, STATS, LIST_SESSIONS, EVICT on the REP
// socket, detection events on the PUB socket.
class ControlPlane {
   public:
    explicit ControlPlane(ControlPlaneDependencies deps);
    ~ControlPlane();

    ControlPlane(const ControlPlane&) = delete;
    ControlPlane& operator=(const ControlPlane&) = delete;

    bool start();
    void stop();

    bool isRunning() const {
        return server_ && server_->isRunning();
    }
    const std::string& endpoint() const {
        return server_->endpoint();
    }
    const std::string& pubEndpoint() const {
        return server_->pubEndpoint();
    }

    // {"event":"detection","client_id","label","score","is_spoof","timestamp"}
    void publishDetection(const std::string& clientId, const detection::DetectionResult& result,
                          double timestamp);

   private:
    void registerHandlers();

    std::string handlePing(const ControlRequest& request);
    std::string handleHealth(const ControlRequest& request);
    std::string handleStats(const ControlRequest& request);
    std::string handleListSessions(const ControlRequest& request);
    std::string handleEvict(const ControlRequest& request);

    ControlPlaneDependencies deps_;
    std::unique_ptr<ControlServer> server_;
};

}  // namespace control
}  // namespace spoofwatch
