/**
 * @file logger.cpp
 * @brief spdlog-backed logging for the needledrop daemon
 */

#include "logging/logger.h"

#include <cctype>
#include <iostream>
#include <mutex>
#include <nlohmann/json.hpp>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <vector>

namespace needledrop {
namespace logging {

namespace {

constexpr const char* kLoggerName = "needledrop";

std::shared_ptr<spdlog::logger> g_logger;
std::mutex g_init_mutex;
std::atomic<bool> g_initialized{false};

spdlog::level::level_enum toSpdlogLevel(LogLevel level) {
    switch (level) {
    case LogLevel::Trace:
        return spdlog::level::trace;
    case LogLevel::Debug:
        return spdlog::level::debug;
    case LogLevel::Info:
        return spdlog::level::info;
    case LogLevel::Warn:
        return spdlog::level::warn;
    case LogLevel::Error:
        return spdlog::level::err;
    case LogLevel::Critical:
        return spdlog::level::critical;
    case LogLevel::Off:
        return spdlog::level::off;
    }
    return spdlog::level::info;
}

// Caller holds g_init_mutex
void installLogger(std::vector<spdlog::sink_ptr> sinks, const LogConfig& config) {
    g_logger = std::make_shared<spdlog::logger>(kLoggerName, sinks.begin(), sinks.end());
    g_logger->set_level(toSpdlogLevel(config.level));
    g_logger->set_pattern(config.pattern);
    g_logger->flush_on(spdlog::level::warn);
    spdlog::set_default_logger(g_logger);
    g_initialized.store(true, std::memory_order_release);
}

}  // namespace

bool initialize(const LogConfig& config) {
    std::lock_guard<std::mutex> lock(g_init_mutex);

    if (g_initialized.load(std::memory_order_acquire) && g_logger) {
        g_logger->set_level(toSpdlogLevel(config.level));
        g_logger->set_pattern(config.pattern);
        for (auto& sink : g_logger->sinks()) {
            sink->set_level(toSpdlogLevel(config.level));
        }
        return true;
    }

    try {
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
        for (auto& sink : sinks) {
            sink->set_level(toSpdlogLevel(config.level));
        }
        installLogger(std::move(sinks), config);
    } catch (const spdlog::spdlog_ex& ex) {
        std::cerr << "Logger initialization failed: " << ex.what() << std::endl;
        return false;
    }

    LOG_DEBUG("Logging initialized (level={})", levelToString(config.level));
    if (!config.filePath.empty()) {
        LOG_INFO("Log file: {} ({} bytes x {} backups)", config.filePath, config.maxFileSize,
                 config.maxBackups);
    }
    return true;
}

bool initializeEarly() {
    std::lock_guard<std::mutex> lock(g_init_mutex);
    if (g_initialized.load(std::memory_order_acquire)) {
        return true;
    }
    try {
        LogConfig config;
        std::vector<spdlog::sink_ptr> sinks{std::make_shared<spdlog::sinks::stderr_color_sink_mt>()};
        installLogger(std::move(sinks), config);
        return true;
    } catch (const spdlog::spdlog_ex& ex) {
        std::cerr << "Early logger initialization failed: " << ex.what() << std::endl;
        return false;
    }
}

void parseLogConfig(const nlohmann::json& section, LogConfig& config) {
    if (!section.is_object()) {
        return;
    }
    if (section.contains("level") && section["level"].is_string()) {
        config.level = stringToLevel(section["level"].get<std::string>());
    }
    if (section.contains("filePath") && section["filePath"].is_string()) {
        config.filePath = section["filePath"].get<std::string>();
    }
    if (section.contains("maxFileSize") && section["maxFileSize"].is_number_unsigned()) {
        config.maxFileSize = section["maxFileSize"].get<size_t>();
    }
    if (section.contains("maxBackups") && section["maxBackups"].is_number_unsigned()) {
        config.maxBackups = section["maxBackups"].get<size_t>();
    }
    if (section.contains("consoleOutput") && section["consoleOutput"].is_boolean()) {
        config.consoleOutput = section["consoleOutput"].get<bool>();
    }
    if (section.contains("coloredOutput") && section["coloredOutput"].is_boolean()) {
        config.coloredOutput = section["coloredOutput"].get<bool>();
    }
    if (section.contains("pattern") && section["pattern"].is_string()) {
        config.pattern = section["pattern"].get<std::string>();
    }
}

void shutdown() {
    std::lock_guard<std::mutex> lock(g_init_mutex);
    if (g_logger) {
        g_logger->flush();
    }
    g_initialized.store(false, std::memory_order_release);
    spdlog::shutdown();
    g_logger.reset();
}

std::shared_ptr<spdlog::logger> getLogger() {
    if (g_initialized.load(std::memory_order_acquire)) {
        return g_logger;
    }
    initialize();
    return g_logger;
}

std::string_view levelToString(LogLevel level) {
    switch (level) {
    case LogLevel::Trace:
        return "trace";
    case LogLevel::Debug:
        return "debug";
    case LogLevel::Info:
        return "info";
    case LogLevel::Warn:
        return "warn";
    case LogLevel::Error:
        return "error";
    case LogLevel::Critical:
        return "critical";
    case LogLevel::Off:
        return "off";
    }
    return "info";
}

LogLevel stringToLevel(std::string_view str) {
    std::string lower;
    lower.reserve(str.size());
    for (char c : str) {
        lower.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    }

    if (lower == "trace")
        return LogLevel::Trace;
    if (lower == "debug" || lower == "d")
        return LogLevel::Debug;
    if (lower == "warn" || lower == "warning" || lower == "w")
        return LogLevel::Warn;
    if (lower == "error" || lower == "err" || lower == "e")
        return LogLevel::Error;
    if (lower == "critical" || lower == "fatal")
        return LogLevel::Critical;
    if (lower == "off" || lower == "none")
        return LogLevel::Off;
    return LogLevel::Info;
}

}  // namespace logging
}  // namespace needledrop
