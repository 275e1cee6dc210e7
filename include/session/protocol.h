#pragma once

#include "core/error_codes.h"
#include "detection/detection_invoker.h"

#include <cstdint>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <string_view>

namespace spoofwatch {
namespace session {

// Client -> server message kinds. Anything else parses to Unknown.
enum class MessageType {
    Connect,
    AudioChunk,
    Config,
    Ping,
    Stats,
    Disconnect,
    Unknown,
};

const char* messageTypeToString(MessageType type);
MessageType messageTypeFromString(std::string_view name);

constexpr const char* kDefaultEncoding = "base64";

struct InboundMessage {
    MessageType type = MessageType::Unknown;
    std::string typeName;  // raw "type" value, kept for error replies
    std::optional<double> timestamp;

    // connect / audio_chunk
    std::string clientId;

    // audio_chunk
    nlohmann::json audioData;  // null when absent
    std::optional<int64_t> sampleRate;
    std::string encoding = kDefaultEncoding;

    // config (sampleRate above is shared)
    std::optional<double> chunkDuration;
    std::optional<double> overlapDuration;
    std::optional<double> minDuration;

    bool hasConfigFields() const {
        return sampleRate || chunkDuration || overlapDuration || minDuration;
    }
};

/**
 * @brief Parse one line of the wire protocol.
 *
 * @return OK on success. SESSION_PROTOCOL_VIOLATION for unparsable JSON, a non-object or a
 *         missing "type"; VALIDATION_INVALID_CONFIG / VALIDATION_INVALID_SAMPLE_RATE for
 *         fields of the wrong type. An unrecognized "type" is not an error here: the
 *         message comes back as MessageType::Unknown.
 */
ErrorCode parseInbound(std::string_view line, InboundMessage& out, std::string& error);

// Seconds since the Unix epoch.
double nowSeconds();

// Random RFC 4122 version 4 UUID string, used when a client connects without an identity.
std::string generateClientId();

nlohmann::json buildConnected(const std::string& clientId, double timestamp);
nlohmann::json buildDetectionResult(const std::string& clientId, uint64_t windowIndex,
                                    std::size_t windowSamples,
                                    const detection::DetectionResult& result, double timestamp);
nlohmann::json buildError(ErrorCode code, const std::string& message, double timestamp);
nlohmann::json buildPong(double timestamp);
nlohmann::json buildStats(const nlohmann::json& stats, double timestamp);

// The "result" object of a detection_result message; also used by the event publisher.
nlohmann::json detectionResultToJson(const detection::DetectionResult& result);

// Single-line JSON; invalid UTF-8 in strings is replaced instead of throwing.
std::string serialize(const nlohmann::json& message);

}  // namespace session
}  // namespace spoofwatch
