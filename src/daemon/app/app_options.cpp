#include "daemon/app/app_options.h"

#include <cstdlib>
#include <iostream>
#include <string>

namespace spoofwatch {

namespace {

bool parseBool(const std::string& value, bool& out) {
    if (value == "1" || value == "true" || value == "TRUE" || value == "on" || value == "yes") {
        out = true;
        return true;
    }
    if (value == "0" || value == "false" || value == "FALSE" || value == "off" || value == "no") {
        out = false;
        return true;
    }
    return false;
}

bool parsePort(const std::string& text, int& out) {
    if (text.empty()) {
        return false;
    }
    char* end = nullptr;
    long value = std::strtol(text.c_str(), &end, 10);
    if (!end || *end != '\0' || value < 0 || value > 65535) {
        return false;
    }
    out = static_cast<int>(value);
    return true;
}

bool parseEnvPort(const char* name, int& target, std::string& error) {
    if (const char* env = std::getenv(name)) {
        if (!parsePort(env, target)) {
            error = std::string("Environment variable ") + name +
                    " is not a valid port number: " + env;
            return false;
        }
    }
    return true;
}

}  // namespace

bool applyEnvOverrides(AppConfig& config, std::string& error) {
    if (!parseEnvPort("SPOOFWATCH_PORT", config.server.port, error)) {
        return false;
    }
    if (!parseEnvPort("SPOOFWATCH_HTTP_PORT", config.status.httpPort, error)) {
        return false;
    }
    if (const char* lvl = std::getenv("SPOOFWATCH_LOG_LEVEL")) {
        config.logging.level = logging::stringToLevel(lvl);
    }
    if (const char* backend = std::getenv("SPOOFWATCH_BACKEND")) {
        config.detection.backend = normalizeBackendName(backend);
    }
    if (const char* model = std::getenv("SPOOFWATCH_MODEL_PATH")) {
        config.detection.ort.modelPath = model;
    }
    if (const char* endpoint = std::getenv("SPOOFWATCH_ZMQ_ENDPOINT")) {
        config.status.zmqEndpoint = endpoint;
    }
    if (const char* zmqDisable = std::getenv("SPOOFWATCH_DISABLE_ZMQ")) {
        bool disable = false;
        if (!parseBool(zmqDisable, disable)) {
            error = "SPOOFWATCH_DISABLE_ZMQ must be true/false";
            return false;
        }
        config.status.zmqEnabled = !disable;
    }
    if (const char* policy = std::getenv("SPOOFWATCH_DUPLICATE_POLICY")) {
        config.duplicatePolicy = parseDuplicatePolicy(policy);
    }
    return true;
}

void applyCliOverrides(const AppOptions& options, AppConfig& config) {
    if (options.port) {
        config.server.port = *options.port;
    }
    if (options.httpPort) {
        config.status.httpPort = *options.httpPort;
    }
    if (options.logLevel) {
        config.logging.level = logging::stringToLevel(*options.logLevel);
    }
    if (options.backend) {
        config.detection.backend = normalizeBackendName(*options.backend);
    }
    if (options.modelPath) {
        config.detection.ort.modelPath = *options.modelPath;
    }
    if (options.zmqEndpoint) {
        config.status.zmqEndpoint = *options.zmqEndpoint;
    }
    if (options.duplicatePolicy) {
        config.duplicatePolicy = parseDuplicatePolicy(*options.duplicatePolicy);
    }
    if (options.disableZmq) {
        config.status.zmqEnabled = false;
    }
}

void printHelp(const char* exeName) {
    std::cout << "spoofwatchd - streaming synthetic speech detection server\n";
    std::cout << "Usage: " << exeName << " [options]\n\n";
    std::cout << "Options:\n";
    std::cout << "  -c, --config <path>       JSON config file (default: " << DEFAULT_CONFIG_FILE
              << ")\n";
    std::cout << "  -p, --port <number>       stream TCP port (default: "
              << DaemonConstants::DEFAULT_STREAM_PORT << ")\n";
    std::cout << "  --http-port <number>      HTTP status port, 0 disables (default: "
              << DaemonConstants::DEFAULT_HTTP_PORT << ")\n";
    std::cout << "  -l, --log-level <lvl>     trace/debug/info/warn/error (default: info)\n";
    std::cout << "  --backend <name>          bypass | ort (default: bypass)\n";
    std::cout << "  --model <path>            ONNX model for the ort backend\n";
    std::cout << "  --zmq-endpoint <uri>      ZeroMQ REP endpoint (default: "
              << DaemonConstants::ZEROMQ_IPC_PATH << ")\n";
    std::cout << "  --disable-zmq             disable the ZeroMQ control plane\n";
    std::cout << "  --duplicate-policy <p>    reject_new | evict_existing (default: reject_new)\n";
    std::cout << "  -h, --help                Show this help\n";
    std::cout << "\nEnvironment: SPOOFWATCH_PORT, SPOOFWATCH_HTTP_PORT, SPOOFWATCH_LOG_LEVEL,\n"
                 "  SPOOFWATCH_BACKEND, SPOOFWATCH_MODEL_PATH, SPOOFWATCH_ZMQ_ENDPOINT,\n"
                 "  SPOOFWATCH_DISABLE_ZMQ, SPOOFWATCH_DUPLICATE_POLICY\n";
    std::cout << std::endl;
}

bool parseArgs(int argc, char** argv, AppOptions& options, bool& showHelp, std::string& error) {
    showHelp = false;
    for (int i = 1; i < argc; ++i) {
        std::string arg(argv[i]);
        const bool hasValue = i + 1 < argc;
        if (arg == "-h" || arg == "--help") {
            printHelp(argv[0]);
            showHelp = true;
            return false;
        }
        if ((arg == "-c" || arg == "--config") && hasValue) {
            options.configPath = argv[++i];
            continue;
        }
        if ((arg == "-p" || arg == "--port" || arg == "--http-port") && hasValue) {
            int port = 0;
            std::string value = argv[++i];
            if (!parsePort(value, port)) {
                error = "Invalid port for " + arg + ": " + value;
                return false;
            }
            if (arg == "--http-port") {
                options.httpPort = port;
            } else {
                options.port = port;
            }
            continue;
        }
        if ((arg == "-l" || arg == "--log-level") && hasValue) {
            options.logLevel = argv[++i];
            continue;
        }
        if (arg == "--backend" && hasValue) {
            options.backend = argv[++i];
            continue;
        }
        if (arg == "--model" && hasValue) {
            options.modelPath = argv[++i];
            continue;
        }
        if (arg == "--zmq-endpoint" && hasValue) {
            options.zmqEndpoint = argv[++i];
            continue;
        }
        if (arg == "--duplicate-policy" && hasValue) {
            options.duplicatePolicy = argv[++i];
            continue;
        }
        if (arg == "--disable-zmq") {
            options.disableZmq = true;
            continue;
        }

        error = "Unknown argument: " + arg;
        return false;
    }
    return true;
}

}  // namespace spoofwatch
