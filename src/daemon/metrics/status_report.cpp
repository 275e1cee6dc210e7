#include "daemon/metrics/status_report.h"

#include "session/protocol.h"
#include "session/session_stats.h"

namespace spoofwatch {
namespace metrics {

bool isHealthy(const Dependencies& deps) {
    return deps.registry != nullptr && deps.invoker != nullptr && deps.invoker->isReady();
}

nlohmann::json buildHealthJson(const Dependencies& deps) {
    const bool modelReady = deps.invoker != nullptr && deps.invoker->isReady();
    nlohmann::json json;
    json["status"] = isHealthy(deps) ? "healthy" : "initializing";
    json["model_ready"] = modelReady;
    json["backend"] = deps.invoker ? deps.invoker->backendName() : "none";
    json["active_connections"] = deps.registry ? deps.registry->size() : 0;
    json["timestamp"] = session::nowSeconds();
    return json;
}

nlohmann::json buildStatsJson(const Dependencies& deps) {
    nlohmann::json json;
    nlohmann::json connections = nlohmann::json::object();
    std::size_t active = 0;
    if (deps.registry) {
        for (const auto& stats : deps.registry->snapshot()) {
            connections[stats.clientId] = session::sessionStatsToJson(stats);
            ++active;
        }
    }
    const auto uptime = std::chrono::steady_clock::now() - deps.startedAt;

    json["active_connections"] = active;
    json["total_connections"] = deps.registry ? deps.registry->totalConnections() : 0;
    json["total_detections"] = deps.registry ? deps.registry->totalDetections() : 0;
    json["uptime_seconds"] = std::chrono::duration<double>(uptime).count();
    json["connections"] = std::move(connections);
    return json;
}

nlohmann::json buildSessionListJson(const Dependencies& deps) {
    nlohmann::json list = nlohmann::json::array();
    if (deps.registry) {
        for (const auto& stats : deps.registry->snapshot()) {
            list.push_back(session::sessionStatsToJson(stats));
        }
    }
    return list;
}

}  // namespace metrics
}  // namespace spoofwatch
