#pragma once

#include "core/config_loader.h"

#include <optional>
#include <string>

namespace spoofwatch {

// Command-line overrides. Unset fields leave the configuration untouched.
struct AppOptions {
    std::string configPath = DEFAULT_CONFIG_FILE;
    std::optional<int> port;
    std::optional<int> httpPort;
    std::optional<std::string> logLevel;
    std::optional<std::string> backend;
    std::optional<std::string> modelPath;
    std::optional<std::string> zmqEndpoint;
    std::optional<std::string> duplicatePolicy;
    bool disableZmq = false;
};

// Parse CLI arguments. showHelp=true means help was printed and the caller should exit 0.
bool parseArgs(int argc, char** argv, AppOptions& options, bool& showHelp, std::string& error);

// Apply SPOOFWATCH_* environment variables. Fails on values that do not parse.
bool applyEnvOverrides(AppConfig& config, std::string& error);

// Apply parsed CLI options (highest precedence).
void applyCliOverrides(const AppOptions& options, AppConfig& config);

void printHelp(const char* exeName);

}  // namespace spoofwatch
