#ifndef SPOOFWATCH_CONFIG_LOADER_H
#define SPOOFWATCH_CONFIG_LOADER_H

#include "audio/window_buffer.h"
#include "core/daemon_constants.h"
#include "logging/logger.h"

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <string>

namespace spoofwatch {

constexpr const char* DEFAULT_CONFIG_FILE = "config.json";

// What to do when a connect claims an identity that is already live.
enum class DuplicatePolicy {
    RejectNew,     // First registrant wins; the new attempt is refused
    EvictExisting  // The live session is evicted and the new one takes the identity
};

struct StreamDefaults {
    uint32_t sampleRate = 16000;
    double chunkDuration = 1.0;    // seconds
    double overlapDuration = 0.5;  // seconds
    double minDuration = 0.5;      // seconds of audio before the first window
    double maxWindowDuration = audio::kDefaultMaxWindowDuration;  // cap for chunk and min
};

struct AppConfig {
    struct ServerConfig {
        std::string bindAddress = "0.0.0.0";
        int port = DaemonConstants::DEFAULT_STREAM_PORT;
        int backlog = 16;
        std::size_t maxMessageBytes = static_cast<std::size_t>(8 * 1024 * 1024);
        int pollIntervalMs = 200;
    } server;

    StreamDefaults stream;

    DuplicatePolicy duplicatePolicy = DuplicatePolicy::RejectNew;

    struct DetectionConfig {
        std::string backend = "bypass";  // "bypass" or "ort"
        float threshold = 0.5f;          // P(spoof) at or above which a window is "spoof"
        bool warmup = true;
        struct OrtConfig {
            std::string modelPath;
            std::string provider = "cpu";  // cpu, cuda, tensorrt
            int intraOpThreads = 1;
            int spoofIndex = 1;  // Index of the spoof logit in the model output
        } ort;
    } detection;

    struct StatusConfig {
        int httpPort = DaemonConstants::DEFAULT_HTTP_PORT;  // 0 = disabled
        std::string httpBindAddress = "127.0.0.1";
        bool zmqEnabled = true;
        std::string zmqEndpoint = DaemonConstants::ZEROMQ_IPC_PATH;
    } status;

    logging::LogConfig logging;
};

DuplicatePolicy parseDuplicatePolicy(const std::string& str);
const char* duplicatePolicyToString(DuplicatePolicy policy);

// Normalize backend aliases ("onnx", "onnxruntime" -> "ort"); unknown -> "bypass".
std::string normalizeBackendName(const std::string& str);

// Check a window configuration (durations in seconds).
// Returns false and fills error when overlap >= chunk, chunk or min exceed
// maxWindowDuration, or any value is out of range.
bool validateStreamDefaults(const StreamDefaults& stream, std::string& error);

// Load configuration from JSON. outConfig is reset to defaults first; invalid values are
// replaced by their defaults with a warning. Returns false when the file is missing or
// cannot be parsed.
bool loadAppConfig(const std::filesystem::path& configPath, AppConfig& outConfig,
                   bool verbose = true);

}  // namespace spoofwatch

#endif  // SPOOFWATCH_CONFIG_LOADER_H
