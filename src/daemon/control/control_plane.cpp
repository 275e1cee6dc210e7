#include "daemon/control/control_plane.h"

#include "logging/logger.h"
#include "session/protocol.h"

#include <utility>

namespace spoofwatch {
namespace control {

ControlPlane::ControlPlane(ControlPlaneDependencies deps) : deps_(std::move(deps)) {
    ControlServerOptions options;
    options.endpoint = deps_.endpoint;
    server_ = std::make_unique<ControlServer>(std::move(options));
    registerHandlers();
}

ControlPlane::~ControlPlane() {
    stop();
}

bool ControlPlane::start() {
    return server_->start();
}

void ControlPlane::stop() {
    server_->stop();
}

void ControlPlane::registerHandlers() {
    server_->on("PING", [this](const ControlRequest& r) { return handlePing(r); });
    server_->on("HEALTH", [this](const ControlRequest& r) { return handleHealth(r); });
    server_->on("STATS", [this](const ControlRequest& r) { return handleStats(r); });
    server_->on("LIST_SESSIONS", [this](const ControlRequest& r) { return handleListSessions(r); });
    server_->on("EVICT", [this](const ControlRequest& r) { return handleEvict(r); });
}

void ControlPlane::publishDetection(const std::string& clientId,
                                    const detection::DetectionResult& result, double timestamp) {
    if (!server_->isRunning()) {
        return;
    }
    nlohmann::json event = {{"event", "detection"},      {"client_id", clientId},
                            {"label", result.label},     {"score", result.score},
                            {"is_spoof", result.isSpoof}, {"timestamp", timestamp}};
    if (!server_->publish(session::serialize(event))) {
        LOG_EVERY_N(DEBUG, 100, "ZeroMQ: detection event for {} not published", clientId);
    }
}

std::string ControlPlane::handlePing(const ControlRequest& request) {
    return ControlServer::okReply(request, "pong");
}

std::string ControlPlane::handleHealth(const ControlRequest& request) {
    return ControlServer::okReply(request, "", metrics::buildHealthJson(deps_.status));
}

std::string ControlPlane::handleStats(const ControlRequest& request) {
    return ControlServer::okReply(request, "", metrics::buildStatsJson(deps_.status));
}

std::string ControlPlane::handleListSessions(const ControlRequest& request) {
    return ControlServer::okReply(request, "", metrics::buildSessionListJson(deps_.status));
}

std::string ControlPlane::handleEvict(const ControlRequest& request) {
    const std::string clientId = request.stringParam("client_id");
    if (clientId.empty()) {
        return ControlServer::errorReply(request, ErrorCode::IPC_INVALID_PARAMS,
                                         "EVICT requires client_id");
    }
    if (!deps_.registry || !deps_.registry->evict(clientId, "evicted by operator")) {
        return ControlServer::errorReply(request, ErrorCode::SESSION_NOT_FOUND,
                                         "No session for client_id '" + clientId + "'");
    }
    LOG_INFO("ZeroMQ: evicted session '{}'", clientId);
    return ControlServer::okReply(request, "evicted " + clientId);
}

}  // namespace control
}  // namespace spoofwatch
