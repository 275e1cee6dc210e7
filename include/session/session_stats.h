#pragma once

#include <cstddef>
#include <cstdint>
#include <nlohmann/json.hpp>
#include <string>

namespace spoofwatch {
namespace session {

// Point-in-time copy of one session's counters.
struct SessionStats {
    std::string clientId;
    double connectedAt = 0.0;
    uint64_t totalMessages = 0;
    uint64_t totalDetections = 0;
    uint64_t totalWindows = 0;
    uint64_t totalErrors = 0;
    uint64_t protocolViolations = 0;
    std::size_t bufferSize = 0;  // pending samples
    double bufferDuration = 0.0;
    uint32_t sampleRate = 0;
};

inline nlohmann::json sessionStatsToJson(const SessionStats& stats) {
    return {{"client_id", stats.clientId},
            {"connected_at", stats.connectedAt},
            {"total_messages", stats.totalMessages},
            {"total_detections", stats.totalDetections},
            {"total_windows", stats.totalWindows},
            {"total_errors", stats.totalErrors},
            {"protocol_violations", stats.protocolViolations},
            {"buffer_size", stats.bufferSize},
            {"buffer_duration", stats.bufferDuration},
            {"sample_rate", stats.sampleRate}};
}

}  // namespace session
}  // namespace spoofwatch
