/**
 * @file logger.cpp
 * @brief spdlog-backed logging for the spoofwatch daemon
 */

#include "logging/logger.h"

#include <algorithm>
#include <cctype>
#include <iostream>
#include <mutex>
#include <nlohmann/json.hpp>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <vector>

namespace spoofwatch {
namespace logging {

namespace {

constexpr const char* kLoggerName = "spoofwatch";

std::shared_ptr<spdlog::logger> g_logger;
std::mutex g_mutex;

// LogLevel mirrors spdlog's level order (trace .. off).
static_assert(static_cast<int>(LogLevel::Trace) == spdlog::level::trace &&
                  static_cast<int>(LogLevel::Off) == spdlog::level::off,
              "LogLevel must follow spdlog::level::level_enum");

spdlog::level::level_enum toSpdlogLevel(LogLevel level) {
    return static_cast<spdlog::level::level_enum>(level);
}

struct LevelName {
    std::string_view name;
    LogLevel level;
};

// First entry per level is the canonical name.
constexpr LevelName kLevelNames[] = {
    {"trace", LogLevel::Trace},       {"debug", LogLevel::Debug},
    {"info", LogLevel::Info},         {"warn", LogLevel::Warn},
    {"warning", LogLevel::Warn},      {"error", LogLevel::Error},
    {"err", LogLevel::Error},         {"critical", LogLevel::Critical},
    {"fatal", LogLevel::Critical},    {"off", LogLevel::Off},
    {"none", LogLevel::Off},
};

void installLogger(std::shared_ptr<spdlog::logger> logger) {
    if (g_logger) {
        g_logger->flush();
    }
    spdlog::drop(kLoggerName);
    g_logger = std::move(logger);
    spdlog::set_default_logger(g_logger);
}

}  // namespace

bool initialize(const LogConfig& config) {
    try {
        std::lock_guard<std::mutex> lock(g_mutex);
        std::vector<spdlog::sink_ptr> sinks;

        if (config.consoleOutput) {
            auto console = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
            if (!config.coloredOutput) {
                console->set_color_mode(spdlog::color_mode::never);
            }
            sinks.push_back(console);
        }

        if (!config.filePath.empty()) {
            sinks.push_back(std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                config.filePath, config.maxFileSize, config.maxBackups));
        }

        auto logger = std::make_shared<spdlog::logger>(kLoggerName, sinks.begin(), sinks.end());
        logger->set_level(toSpdlogLevel(config.level));
        logger->set_pattern(config.pattern);
        logger->flush_on(spdlog::level::err);
        installLogger(std::move(logger));
    } catch (const spdlog::spdlog_ex& ex) {
        std::cerr << "Logger initialization failed: " << ex.what() << std::endl;
        return false;
    }

    LOG_INFO("Logging initialized (level={})", levelToString(config.level));
    if (!config.filePath.empty()) {
        LOG_INFO("Log file: {} (max {}MB x {} backups)", config.filePath,
                 config.maxFileSize / (1024 * 1024), config.maxBackups);
    }
    return true;
}

bool initializeEarly() {
    std::lock_guard<std::mutex> lock(g_mutex);
    if (g_logger) {
        return true;
    }
    try {
        auto sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
        auto logger = std::make_shared<spdlog::logger>(kLoggerName, sink);
        logger->set_level(spdlog::level::info);
        logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");
        installLogger(std::move(logger));
        return true;
    } catch (const spdlog::spdlog_ex& ex) {
        std::cerr << "Early logger initialization failed: " << ex.what() << std::endl;
        return false;
    }
}

LogConfig logConfigFromJson(const nlohmann::json& section) {
    LogConfig config;
    if (!section.is_object()) {
        return config;
    }
    auto read = [&section](const char* key, auto& target, auto isValid) {
        auto it = section.find(key);
        if (it != section.end() && isValid(*it)) {
            it->get_to(target);
        }
    };
    auto isString = [](const nlohmann::json& v) { return v.is_string(); };
    auto isCount = [](const nlohmann::json& v) { return v.is_number_unsigned(); };
    auto isBool = [](const nlohmann::json& v) { return v.is_boolean(); };

    std::string level;
    read("level", level, isString);
    if (!level.empty()) {
        config.level = stringToLevel(level);
    }
    read("filePath", config.filePath, isString);
    read("maxFileSize", config.maxFileSize, isCount);
    read("maxBackups", config.maxBackups, isCount);
    read("consoleOutput", config.consoleOutput, isBool);
    read("coloredOutput", config.coloredOutput, isBool);
    read("pattern", config.pattern, isString);
    return config;
}

void shutdown() {
    std::lock_guard<std::mutex> lock(g_mutex);
    if (g_logger) {
        g_logger->info("Logging shutdown");
        g_logger->flush();
    }
    spdlog::shutdown();
    g_logger.reset();
}

void setLevel(LogLevel level) {
    std::lock_guard<std::mutex> lock(g_mutex);
    if (g_logger) {
        g_logger->set_level(toSpdlogLevel(level));
    }
}

LogLevel getLevel() {
    std::lock_guard<std::mutex> lock(g_mutex);
    return g_logger ? static_cast<LogLevel>(g_logger->level()) : LogLevel::Info;
}

void flush() {
    std::lock_guard<std::mutex> lock(g_mutex);
    if (g_logger) {
        g_logger->flush();
    }
}

std::shared_ptr<spdlog::logger> getLogger() {
    std::lock_guard<std::mutex> lock(g_mutex);
    return g_logger;
}

std::string_view levelToString(LogLevel level) {
    for (const auto& entry : kLevelNames) {
        if (entry.level == level) {
            return entry.name;
        }
    }
    return "info";
}

LogLevel stringToLevel(std::string_view str) {
    std::string lower(str);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    for (const auto& entry : kLevelNames) {
        if (entry.name == lower) {
            return entry.level;
        }
    }
    return LogLevel::Info;
}

}  // namespace logging
}  // namespace spoofwatch
