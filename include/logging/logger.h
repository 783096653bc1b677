/**
 * @file logger.h
 * @brief spdlog-backed logging for the needledrop daemon
 *
 * One process-wide logger with a colored console sink and an optional
 * rotating file sink. Components log through the LOG_* macros only.
 */

#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <nlohmann/json_fwd.hpp>
#include <string>
#include <string_view>

namespace spdlog {
class logger;
}  // namespace spdlog

namespace needledrop {
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
    std::string filePath;  // Empty = console only
    size_t maxFileSize = static_cast<size_t>(5 * 1024 * 1024);
    size_t maxBackups = 3;
    bool consoleOutput = true;
    bool coloredOutput = true;
    std::string pattern = "[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [%t] %v";
};

/**
 * @brief Initialize (or reconfigure) the process logger.
 *
 * Calling again after a successful initialization only updates the level
 * and pattern; sinks are fixed for the lifetime of the process.
 */
bool initialize(const LogConfig& config = LogConfig{});

// stderr-only logger for the window before the config file is read
bool initializeEarly();

/**
 * @brief Apply the keys of a "logging" JSON object onto @p config.
 *
 * Unknown keys are ignored; keys of the wrong type are skipped.
 */
void parseLogConfig(const nlohmann::json& section, LogConfig& config);

// Flushes and drops the logger; LOG_* after this re-initializes with defaults
void shutdown();

std::shared_ptr<spdlog::logger> getLogger();

std::string_view levelToString(LogLevel level);

// Case-insensitive; unknown names map to Info
LogLevel stringToLevel(std::string_view str);

}  // namespace logging
}  // namespace needledrop

#include <spdlog/spdlog.h>

#define LOG_TRACE(...)                                  \
    do {                                                \
        auto logger = needledrop::logging::getLogger(); \
        if (logger)                                     \
            SPDLOG_LOGGER_TRACE(logger, __VA_ARGS__);   \
    } while (0)

#define LOG_DEBUG(...)                                  \
    do {                                                \
        auto logger = needledrop::logging::getLogger(); \
        if (logger)                                     \
            SPDLOG_LOGGER_DEBUG(logger, __VA_ARGS__);   \
    } while (0)

#define LOG_INFO(...)                                   \
    do {                                                \
        auto logger = needledrop::logging::getLogger(); \
        if (logger)                                     \
            SPDLOG_LOGGER_INFO(logger, __VA_ARGS__);    \
    } while (0)

#define LOG_WARN(...)                                   \
    do {                                                \
        auto logger = needledrop::logging::getLogger(); \
        if (logger)                                     \
            SPDLOG_LOGGER_WARN(logger, __VA_ARGS__);    \
    } while (0)

#define LOG_ERROR(...)                                  \
    do {                                                \
        auto logger = needledrop::logging::getLogger(); \
        if (logger)                                     \
            SPDLOG_LOGGER_ERROR(logger, __VA_ARGS__);   \
    } while (0)

#define LOG_CRITICAL(...)                                \
    do {                                                 \
        auto logger = needledrop::logging::getLogger();  \
        if (logger)                                      \
            SPDLOG_LOGGER_CRITICAL(logger, __VA_ARGS__); \
    } while (0)

/**
 * @brief Log every N occurrences at the call site.
 *
 * Used on per-chunk audio paths where a persistent fault would otherwise
 * flood the log.
 */
#define LOG_EVERY_N(level, n, ...)                            \
    do {                                                      \
        static std::atomic<uint64_t> log_count_##__LINE__{0}; \
        if (log_count_##__LINE__.fetch_add(1) % (n) == 0) {   \
            LOG_##level(__VA_ARGS__);                         \
        }                                                     \
    } while (0)

// First occurrence at the call site only
#define LOG_ONCE(level, ...)                                        \
    do {                                                            \
        static std::atomic<bool> log_once_##__LINE__{false};        \
        if (!log_once_##__LINE__.exchange(true)) {                  \
            LOG_##level(__VA_ARGS__);                               \
        }                                                           \
    } while (0)
