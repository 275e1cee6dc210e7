#include "core/config_loader.h"

#include "audio/sample_decoder.h"
#include "audio/window_buffer.h"
#include "logging/logger.h"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <fstream>
#include <nlohmann/json.hpp>

namespace spoofwatch {

namespace {

std::string toLower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

std::string validateOrtProvider(const std::string& str) {
    std::string lower = toLower(str);
    if (lower == "cpu" || lower == "cuda" || lower == "tensorrt" || lower == "trt") {
        return (lower == "trt") ? "tensorrt" : lower;
    }
    return "cpu";
}

bool validPort(int port) {
    return port >= 0 && port <= 65535;
}

void loadServerSection(const nlohmann::json& section, AppConfig::ServerConfig& server,
                       bool verbose) {
    if (!section.is_object()) {
        return;
    }
    const AppConfig::ServerConfig defaults;
    server.bindAddress = section.value("bindAddress", defaults.bindAddress);
    server.port = section.value("port", defaults.port);
    if (!validPort(server.port)) {
        if (verbose) {
            LOG_WARN("Config: server.port out of range ({}), using {}", server.port,
                     defaults.port);
        }
        server.port = defaults.port;
    }
    server.backlog = std::max(1, section.value("backlog", defaults.backlog));
    server.maxMessageBytes = section.value("maxMessageBytes", defaults.maxMessageBytes);
    if (server.maxMessageBytes < 1024) {
        if (verbose) {
            LOG_WARN("Config: server.maxMessageBytes too small ({}), using {}",
                     server.maxMessageBytes, defaults.maxMessageBytes);
        }
        server.maxMessageBytes = defaults.maxMessageBytes;
    }
    server.pollIntervalMs = section.value("pollIntervalMs", defaults.pollIntervalMs);
    if (server.pollIntervalMs <= 0) {
        server.pollIntervalMs = defaults.pollIntervalMs;
    }
}

void loadStreamSection(const nlohmann::json& section, StreamDefaults& stream, bool verbose) {
    if (!section.is_object()) {
        return;
    }
    const StreamDefaults defaults;
    StreamDefaults candidate;
    candidate.sampleRate = section.value("sampleRate", defaults.sampleRate);
    candidate.chunkDuration = section.value("chunkDuration", defaults.chunkDuration);
    candidate.overlapDuration = section.value("overlapDuration", defaults.overlapDuration);
    candidate.minDuration = section.value("minDuration", defaults.minDuration);
    candidate.maxWindowDuration =
        section.value("maxWindowDuration", defaults.maxWindowDuration);

    std::string error;
    if (!validateStreamDefaults(candidate, error)) {
        if (verbose) {
            LOG_WARN("Config: invalid stream section ({}), using defaults", error);
        }
        stream = defaults;
        return;
    }
    stream = candidate;
}

void loadDetectionSection(const nlohmann::json& section, AppConfig::DetectionConfig& detection,
                          bool verbose) {
    if (!section.is_object()) {
        return;
    }
    const AppConfig::DetectionConfig defaults;
    detection.backend = normalizeBackendName(section.value("backend", defaults.backend));
    detection.threshold = section.value("threshold", defaults.threshold);
    if (!std::isfinite(detection.threshold) || detection.threshold < 0.0f ||
        detection.threshold > 1.0f) {
        if (verbose) {
            LOG_WARN("Config: detection.threshold must be within [0, 1] (got {}), using {}",
                     detection.threshold, defaults.threshold);
        }
        detection.threshold = defaults.threshold;
    }
    detection.warmup = section.value("warmup", defaults.warmup);

    if (section.contains("ort") && section["ort"].is_object()) {
        const auto& ort = section["ort"];
        detection.ort.modelPath = ort.value("modelPath", defaults.ort.modelPath);
        detection.ort.provider = validateOrtProvider(ort.value("provider", defaults.ort.provider));
        detection.ort.intraOpThreads = ort.value("intraOpThreads", defaults.ort.intraOpThreads);
        detection.ort.spoofIndex = ort.value("spoofIndex", defaults.ort.spoofIndex);
        if (detection.ort.spoofIndex != 0 && detection.ort.spoofIndex != 1) {
            if (verbose) {
                LOG_WARN("Config: detection.ort.spoofIndex must be 0 or 1 (got {}), using 1",
                         detection.ort.spoofIndex);
            }
            detection.ort.spoofIndex = defaults.ort.spoofIndex;
        }
    }
}

void loadStatusSection(const nlohmann::json& section, AppConfig::StatusConfig& status,
                       bool verbose) {
    if (!section.is_object()) {
        return;
    }
    const AppConfig::StatusConfig defaults;
    status.httpPort = section.value("httpPort", defaults.httpPort);
    if (!validPort(status.httpPort)) {
        if (verbose) {
            LOG_WARN("Config: status.httpPort out of range ({}), disabling HTTP status",
                     status.httpPort);
        }
        status.httpPort = 0;
    }
    status.httpBindAddress = section.value("httpBindAddress", defaults.httpBindAddress);
    status.zmqEnabled = section.value("zmqEnabled", defaults.zmqEnabled);
    status.zmqEndpoint = section.value("zmqEndpoint", defaults.zmqEndpoint);
}

}  // namespace

DuplicatePolicy parseDuplicatePolicy(const std::string& str) {
    std::string lower = toLower(str);
    if (lower == "evict_existing" || lower == "evict-existing" || lower == "evict" ||
        lower == "last_wins") {
        return DuplicatePolicy::EvictExisting;
    }
    return DuplicatePolicy::RejectNew;
}

const char* duplicatePolicyToString(DuplicatePolicy policy) {
    switch (policy) {
    case DuplicatePolicy::EvictExisting:
        return "evict_existing";
    case DuplicatePolicy::RejectNew:
    default:
        return "reject_new";
    }
}

std::string normalizeBackendName(const std::string& str) {
    std::string lower = toLower(str);
    if (lower == "ort" || lower == "onnx" || lower == "onnxruntime") {
        return "ort";
    }
    return "bypass";
}

bool validateStreamDefaults(const StreamDefaults& stream, std::string& error) {
    if (!audio::isSupportedSampleRate(stream.sampleRate)) {
        error = "sampleRate must be within [" + std::to_string(audio::kMinSampleRate) + ", " +
                std::to_string(audio::kMaxSampleRate) + "]";
        return false;
    }
    if (!std::isfinite(stream.chunkDuration) || stream.chunkDuration <= 0.0) {
        error = "chunkDuration must be positive";
        return false;
    }
    if (!std::isfinite(stream.overlapDuration) || stream.overlapDuration < 0.0) {
        error = "overlapDuration must not be negative";
        return false;
    }
    if (stream.overlapDuration >= stream.chunkDuration) {
        error = "overlapDuration must be shorter than chunkDuration";
        return false;
    }
    if (!std::isfinite(stream.minDuration) || stream.minDuration < 0.0) {
        error = "minDuration must not be negative";
        return false;
    }
    if (!std::isfinite(stream.maxWindowDuration) || stream.maxWindowDuration <= 0.0) {
        error = "maxWindowDuration must be positive";
        return false;
    }
    if (stream.chunkDuration > stream.maxWindowDuration ||
        stream.minDuration > stream.maxWindowDuration) {
        error = "chunkDuration and minDuration must not exceed maxWindowDuration (" +
                std::to_string(stream.maxWindowDuration) + " s)";
        return false;
    }

    // A client may switch to any supported rate, so the cap must convert at the highest.
    audio::WindowDurations largest;
    largest.chunk = stream.maxWindowDuration;
    largest.overlap = 0.0;
    largest.min = stream.maxWindowDuration;
    largest.max = stream.maxWindowDuration;
    audio::WindowLengths lengths;
    std::string lengthError;
    if (!audio::computeWindowLengths(largest, audio::kMaxSampleRate, lengths, lengthError)) {
        error = "maxWindowDuration is too large: " + lengthError;
        return false;
    }
    return true;
}

bool loadAppConfig(const std::filesystem::path& configPath, AppConfig& outConfig, bool verbose) {
    outConfig = AppConfig{};

    std::ifstream file(configPath);
    if (!file.is_open()) {
        if (verbose) {
            LOG_INFO("Config: {} not found, using defaults", configPath.string());
        }
        return false;
    }

    try {
        nlohmann::json json;
        file >> json;
        if (!json.is_object()) {
            if (verbose) {
                LOG_WARN("Config: {} is not a JSON object, using defaults", configPath.string());
            }
            return false;
        }

        if (json.contains("server")) {
            loadServerSection(json["server"], outConfig.server, verbose);
        }
        if (json.contains("stream")) {
            loadStreamSection(json["stream"], outConfig.stream, verbose);
        }
        if (json.contains("registry") && json["registry"].is_object()) {
            outConfig.duplicatePolicy =
                parseDuplicatePolicy(json["registry"].value("duplicatePolicy", "reject_new"));
        }
        if (json.contains("detection")) {
            loadDetectionSection(json["detection"], outConfig.detection, verbose);
        }
        if (json.contains("status")) {
            loadStatusSection(json["status"], outConfig.status, verbose);
        }
        if (json.contains("logging")) {
            outConfig.logging = logging::logConfigFromJson(json["logging"]);
        }
    } catch (const nlohmann::json::exception& e) {
        if (verbose) {
            LOG_ERROR("Config: failed to parse {}: {}", configPath.string(), e.what());
        }
        outConfig = AppConfig{};
        return false;
    }

    if (verbose) {
        LOG_INFO("Config: loaded {}", configPath.string());
    }
    return true;
}

}  // namespace spoofwatch
