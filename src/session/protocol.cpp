#include "session/protocol.h"

#include <array>
#include <chrono>
#include <cmath>
#include <cstdio>
#include <random>

namespace spoofwatch {
namespace session {

namespace {

struct TypeEntry {
    MessageType type;
    const char* name;
};

constexpr std::array<TypeEntry, 6> kTypeNames = {{
    {MessageType::Connect, "connect"},
    {MessageType::AudioChunk, "audio_chunk"},
    {MessageType::Config, "config"},
    {MessageType::Ping, "ping"},
    {MessageType::Stats, "stats"},
    {MessageType::Disconnect, "disconnect"},
}};

bool readDuration(const nlohmann::json& object, const char* key, std::optional<double>& out,
                  std::string& error) {
    auto it = object.find(key);
    if (it == object.end() || it->is_null()) {
        return true;
    }
    if (!it->is_number()) {
        error = std::string(key) + " must be a number";
        return false;
    }
    double value = it->get<double>();
    if (!std::isfinite(value)) {
        error = std::string(key) + " must be finite";
        return false;
    }
    out = value;
    return true;
}

bool readSampleRate(const nlohmann::json& object, std::optional<int64_t>& out,
                    std::string& error) {
    auto it = object.find("sample_rate");
    if (it == object.end() || it->is_null()) {
        return true;
    }
    if (it->is_number_integer()) {
        out = it->get<int64_t>();
        return true;
    }
    if (it->is_number_float()) {
        double value = it->get<double>();
        if (std::isfinite(value) && std::floor(value) == value && std::fabs(value) < 1e12) {
            out = static_cast<int64_t>(value);
            return true;
        }
    }
    error = "sample_rate must be an integer number of Hz";
    return false;
}

}  // namespace

const char* messageTypeToString(MessageType type) {
    for (const auto& entry : kTypeNames) {
        if (entry.type == type) {
            return entry.name;
        }
    }
    return "unknown";
}

MessageType messageTypeFromString(std::string_view name) {
    for (const auto& entry : kTypeNames) {
        if (name == entry.name) {
            return entry.type;
        }
    }
    return MessageType::Unknown;
}

ErrorCode parseInbound(std::string_view line, InboundMessage& out, std::string& error) {
    out = InboundMessage{};

    nlohmann::json json;
    try {
        json = nlohmann::json::parse(line.begin(), line.end());
    } catch (const nlohmann::json::parse_error& e) {
        error = std::string("Invalid JSON: ") + e.what();
        return ErrorCode::SESSION_PROTOCOL_VIOLATION;
    }
    if (!json.is_object()) {
        error = "Message must be a JSON object";
        return ErrorCode::SESSION_PROTOCOL_VIOLATION;
    }
    auto typeIt = json.find("type");
    if (typeIt == json.end() || !typeIt->is_string()) {
        error = "Message has no string 'type' field";
        return ErrorCode::SESSION_PROTOCOL_VIOLATION;
    }

    out.typeName = typeIt->get<std::string>();
    out.type = messageTypeFromString(out.typeName);

    auto tsIt = json.find("timestamp");
    if (tsIt != json.end() && tsIt->is_number()) {
        out.timestamp = tsIt->get<double>();
    }
    auto idIt = json.find("client_id");
    if (idIt != json.end() && idIt->is_string()) {
        out.clientId = idIt->get<std::string>();
    }

    switch (out.type) {
    case MessageType::AudioChunk: {
        auto dataIt = json.find("audio_data");
        if (dataIt != json.end()) {
            out.audioData = *dataIt;
        }
        auto encIt = json.find("encoding");
        if (encIt != json.end() && !encIt->is_null()) {
            if (!encIt->is_string()) {
                error = "encoding must be a string";
                return ErrorCode::AUDIO_UNSUPPORTED_ENCODING;
            }
            out.encoding = encIt->get<std::string>();
        }
        if (!readSampleRate(json, out.sampleRate, error)) {
            return ErrorCode::VALIDATION_INVALID_SAMPLE_RATE;
        }
        break;
    }
    case MessageType::Config:
        if (!readSampleRate(json, out.sampleRate, error)) {
            return ErrorCode::VALIDATION_INVALID_SAMPLE_RATE;
        }
        if (!readDuration(json, "chunk_duration", out.chunkDuration, error) ||
            !readDuration(json, "overlap_duration", out.overlapDuration, error) ||
            !readDuration(json, "min_duration", out.minDuration, error)) {
            return ErrorCode::VALIDATION_INVALID_CONFIG;
        }
        break;
    default:
        break;
    }
    return ErrorCode::OK;
}

double nowSeconds() {
    using namespace std::chrono;
    return duration<double>(system_clock::now().time_since_epoch()).count();
}

std::string generateClientId() {
    thread_local std::mt19937_64 rng{std::random_device{}()};
    std::uniform_int_distribution<uint64_t> dist;
    uint64_t hi = dist(rng);
    uint64_t lo = dist(rng);

    hi = (hi & 0xFFFFFFFFFFFF0FFFULL) | 0x0000000000004000ULL;  // version 4
    lo = (lo & 0x3FFFFFFFFFFFFFFFULL) | 0x8000000000000000ULL;  // RFC 4122 variant

    char buf[37];
    std::snprintf(buf, sizeof(buf), "%08x-%04x-%04x-%04x-%012llx",
                  static_cast<unsigned>(hi >> 32), static_cast<unsigned>((hi >> 16) & 0xFFFF),
                  static_cast<unsigned>(hi & 0xFFFF), static_cast<unsigned>(lo >> 48),
                  static_cast<unsigned long long>(lo & 0xFFFFFFFFFFFFULL));
    return buf;
}

nlohmann::json buildConnected(const std::string& clientId, double timestamp) {
    return {{"type", "connected"}, {"client_id", clientId}, {"timestamp", timestamp}};
}

nlohmann::json detectionResultToJson(const detection::DetectionResult& result) {
    nlohmann::json json = {
        {"label", result.label},
        {"score", result.score},
        {"is_spoof", result.isSpoof},
        {"all_scores",
         {{detection::kLabelBonafide, result.bonafideScore},
          {detection::kLabelSpoof, result.spoofScore}}},
    };
    if (!result.logits.empty()) {
        json["logits"] = result.logits;
    }
    return json;
}

nlohmann::json buildDetectionResult(const std::string& clientId, uint64_t windowIndex,
                                    std::size_t windowSamples,
                                    const detection::DetectionResult& result, double timestamp) {
    return {{"type", "detection_result"},
            {"client_id", clientId},
            {"result", detectionResultToJson(result)},
            {"window_index", windowIndex},
            {"window_samples", windowSamples},
            {"timestamp", timestamp},
            {"processing_time_ms", result.processingTimeMs}};
}

nlohmann::json buildError(ErrorCode code, const std::string& message, double timestamp) {
    return {{"type", "error"},
            {"message", message},
            {"error_code", errorCodeToString(code)},
            {"timestamp", timestamp}};
}

nlohmann::json buildPong(double timestamp) {
    return {{"type", "pong"}, {"timestamp", timestamp}};
}

nlohmann::json buildStats(const nlohmann::json& stats, double timestamp) {
    return {{"type", "stats"}, {"stats", stats}, {"timestamp", timestamp}};
}

std::string serialize(const nlohmann::json& message) {
    return message.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

}  // namespace session
}  // namespace spoofwatch
