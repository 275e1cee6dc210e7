/**
 * @file logger.h
 * @brief Structured logging for the spoofwatch daemon
 *
 * Thin layer over spdlog: one process-wide logger with a colored console sink and an
 * optional rotating file sink. Call sites use the LOG_* macros below.
 */

#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <string_view>

#include <nlohmann/json_fwd.hpp>

namespace spdlog {
class logger;
}  // namespace spdlog

namespace spoofwatch {
namespace logging {

enum class LogLevel : std::uint8_t {
    Trace,
    Debug,
    Info,
    Warn,
    Error,
    Critical,
    Off
};

struct LogConfig {
    LogLevel level = LogLevel::Info;
    std::string filePath;  // Empty = no file output
    std::size_t maxFileSize = static_cast<std::size_t>(10 * 1024 * 1024);
    std::size_t maxBackups = 5;
    bool consoleOutput = true;
    bool coloredOutput = true;
    std::string pattern = "[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [%t] %v";
};

/**
 * @brief Initialize (or re-apply) the logging configuration
 *
 * A second call after a successful initialization rebuilds the sinks, so the early
 * stderr logger can be replaced by the configured one.
 *
 * @return true if initialization succeeded
 */
bool initialize(const LogConfig& config = LogConfig{});

/**
 * @brief Early initialization with a stderr sink only
 *
 * Used before the configuration file has been read.
 */
bool initializeEarly();

/**
 * @brief Read a "logging" JSON section into a LogConfig
 *
 * Unknown keys are ignored; keys with the wrong type keep their defaults.
 */
LogConfig logConfigFromJson(const nlohmann::json& section);

/**
 * @brief Flush and release all sinks
 */
void shutdown();

void setLevel(LogLevel level);
LogLevel getLevel();
void flush();

/**
 * @brief Underlying spdlog logger (may be null before initialization)
 */
std::shared_ptr<spdlog::logger> getLogger();

std::string_view levelToString(LogLevel level);

/**
 * @brief Parse a level name (case-insensitive, "warning" accepted)
 * @return Matching level, Info if unknown
 */
LogLevel stringToLevel(std::string_view str);

}  // namespace logging
}  // namespace spoofwatch

#include <spdlog/spdlog.h>

#define SPOOFWATCH_LOG_AT(macro, ...)                     \
    do {                                                  \
        auto logger = spoofwatch::logging::getLogger();   \
        if (logger)                                       \
            macro(logger, __VA_ARGS__);                   \
    } while (0)

#define LOG_TRACE(...) SPOOFWATCH_LOG_AT(SPDLOG_LOGGER_TRACE, __VA_ARGS__)
#define LOG_DEBUG(...) SPOOFWATCH_LOG_AT(SPDLOG_LOGGER_DEBUG, __VA_ARGS__)
#define LOG_INFO(...) SPOOFWATCH_LOG_AT(SPDLOG_LOGGER_INFO, __VA_ARGS__)
#define LOG_WARN(...) SPOOFWATCH_LOG_AT(SPDLOG_LOGGER_WARN, __VA_ARGS__)
#define LOG_ERROR(...) SPOOFWATCH_LOG_AT(SPDLOG_LOGGER_ERROR, __VA_ARGS__)
#define LOG_CRITICAL(...) SPOOFWATCH_LOG_AT(SPDLOG_LOGGER_CRITICAL, __VA_ARGS__)

/**
 * @brief Log every N occurrences (rate limit for per-message paths)
 */
#define LOG_EVERY_N(level, n, ...)                            \
    do {                                                      \
        static std::atomic<uint64_t> log_count_##__LINE__{0}; \
        if (log_count_##__LINE__.fetch_add(1) % (n) == 0) {   \
            LOG_##level(__VA_ARGS__);                         \
        }                                                     \
    } while (0)
