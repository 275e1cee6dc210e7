#pragma once

#include "detection/detection_invoker.h"
#include "session/connection_registry.h"

#include <chrono>
#include <nlohmann/json.hpp>

namespace spoofwatch {
namespace metrics {

// Read-only view shared by the HTTP status server and the ZeroMQ control plane.
struct Dependencies {
    const session::ConnectionRegistry* registry = nullptr;
    const detection::DetectionInvoker* invoker = nullptr;
    std::chrono::steady_clock::time_point startedAt = std::chrono::steady_clock::now();
};

// {"status": "healthy"|"initializing", "model_ready", "backend", "active_connections",
//  "timestamp"}
nlohmann::json buildHealthJson(const Dependencies& deps);

bool isHealthy(const Dependencies& deps);

// {"active_connections", "total_connections", "total_detections", "uptime_seconds",
//  "connections": {client_id: session stats}}
nlohmann::json buildStatsJson(const Dependencies& deps);

// Array of session stats objects, one per live session.
nlohmann::json buildSessionListJson(const Dependencies& deps);

}  // namespace metrics
}  // namespace spoofwatch
