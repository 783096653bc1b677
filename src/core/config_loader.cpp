#include "core/config_loader.h"

#include <algorithm>
#include <type_traits>
#include <fstream>
#include <iostream>
#include <nlohmann/json.hpp>

namespace needledrop {

namespace {

// Assign j[key] to out when present with a compatible type
template <typename T>
void readIfPresent(const nlohmann::json& j, const char* key, T& out) {
    if (!j.contains(key)) {
        return;
    }
    const auto& value = j[key];
    if constexpr (std::is_same_v<T, bool>) {
        if (value.is_boolean()) {
            out = value.get<bool>();
        }
    } else if constexpr (std::is_same_v<T, std::string>) {
        if (value.is_string()) {
            out = value.get<std::string>();
        }
    } else if constexpr (std::is_integral_v<T>) {
        if (value.is_number_integer()) {
            out = value.get<T>();
        }
    } else {
        if (value.is_number()) {
            out = value.get<T>();
        }
    }
}

void parseAudio(const nlohmann::json& a, AppConfig::AudioConfig& out) {
    readIfPresent(a, "sampleRate", out.sampleRate);
    readIfPresent(a, "channels", out.channels);
    readIfPresent(a, "chunkSize", out.chunkSize);
    readIfPresent(a, "recordSeconds", out.recordSeconds);
    readIfPresent(a, "levelCheckMs", out.levelCheckMs);
    readIfPresent(a, "sampleFormat", out.sampleFormat);
}

void parseDetection(const nlohmann::json& d, AppConfig::DetectionConfig& out) {
    readIfPresent(d, "consistencyChecks", out.consistencyChecks);
    readIfPresent(d, "consistencyThreshold", out.consistencyThreshold);
    readIfPresent(d, "confidenceThreshold", out.confidenceThreshold);
    readIfPresent(d, "checkDelayMs", out.checkDelayMs);
    readIfPresent(d, "checkIntervalMs", out.checkIntervalMs);
    readIfPresent(d, "noMatchStreakForFallback", out.noMatchStreakForFallback);
}

void parseLevel(const nlohmann::json& l, AppConfig::LevelConfig& out, bool verbose) {
    if (l.contains("metric") && l["metric"].is_string()) {
        std::string metric = l["metric"].get<std::string>();
        out.metric = detection::parseLevelMetric(metric);
        if (verbose && metric != detection::levelMetricToString(out.metric)) {
            LOG_WARN("Config: Unknown level.metric '{}', using '{}'", metric,
                     detection::levelMetricToString(out.metric));
        }
    }
    readIfPresent(l, "silenceThreshold", out.silenceThreshold);
    readIfPresent(l, "activityThreshold", out.activityThreshold);
    readIfPresent(l, "activityWindow", out.activityWindow);
    readIfPresent(l, "standbyWindow", out.standbyWindow);
    readIfPresent(l, "standbyPollMs", out.standbyPollMs);
    readIfPresent(l, "startInStandby", out.startInStandby);
}

}  // namespace

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
        nlohmann::json j;
        file >> j;
        if (!j.is_object()) {
            if (verbose) {
                LOG_ERROR("Config: {} is not a JSON object", configPath.string());
            }
            return false;
        }

        if (j.contains("audio") && j["audio"].is_object()) {
            parseAudio(j["audio"], outConfig.audio);
        }
        if (j.contains("detection") && j["detection"].is_object()) {
            parseDetection(j["detection"], outConfig.detection);
        }
        if (j.contains("level") && j["level"].is_object()) {
            parseLevel(j["level"], outConfig.level, verbose);
        }
        if (j.contains("aggressive") && j["aggressive"].is_object()) {
            const auto& a = j["aggressive"];
            readIfPresent(a, "checkCount", outConfig.aggressive.checkCount);
            readIfPresent(a, "intervalMs", outConfig.aggressive.intervalMs);
        }
        if (j.contains("session") && j["session"].is_object()) {
            const auto& s = j["session"];
            readIfPresent(s, "errorBackoffMs", outConfig.session.errorBackoffMs);
            readIfPresent(s, "maxReopenAttempts", outConfig.session.maxReopenAttempts);
            readIfPresent(s, "listenerQueueCapacity", outConfig.session.listenerQueueCapacity);
        }
        if (j.contains("recognition") && j["recognition"].is_object()) {
            const auto& r = j["recognition"];
            readIfPresent(r, "endpoint", outConfig.recognition.endpoint);
            readIfPresent(r, "timeoutMs", outConfig.recognition.timeoutMs);
        }
        if (j.contains("scrobble") && j["scrobble"].is_object()) {
            const auto& s = j["scrobble"];
            readIfPresent(s, "enabled", outConfig.scrobble.enabled);
            readIfPresent(s, "endpoint", outConfig.scrobble.endpoint);
            readIfPresent(s, "timeoutMs", outConfig.scrobble.timeoutMs);
            readIfPresent(s, "trackInfo", outConfig.scrobble.trackInfo);
        }
        if (j.contains("control") && j["control"].is_object()) {
            const auto& c = j["control"];
            readIfPresent(c, "enabled", outConfig.control.enabled);
            readIfPresent(c, "endpoint", outConfig.control.endpoint);
        }
        if (j.contains("logging") && j["logging"].is_object()) {
            logging::parseLogConfig(j["logging"], outConfig.logging);
        }

        if (verbose) {
            LOG_INFO("Config: Loaded from {}", std::filesystem::absolute(configPath).string());
        }
        return true;
    } catch (const std::exception& e) {
        if (verbose) {
            LOG_ERROR("Config: Failed to parse {}: {}", configPath.string(), e.what());
        }
        outConfig = AppConfig{};
        return false;
    }
}

bool validateAppConfig(AppConfig& config, std::string& error) {
    const auto& audio = config.audio;
    if (audio.sampleRate == 0) {
        error = "audio.sampleRate must be positive";
        return false;
    }
    if (audio.channels == 0) {
        error = "audio.channels must be at least 1";
        return false;
    }
    if (audio.chunkSize <= 0) {
        error = "audio.chunkSize must be positive";
        return false;
    }
    if (audio.recordSeconds <= 0.0) {
        error = "audio.recordSeconds must be positive";
        return false;
    }
    if (audio.levelCheckMs <= 0) {
        error = "audio.levelCheckMs must be positive";
        return false;
    }
    if (audio.sampleFormat != "float32" && audio.sampleFormat != "s32" &&
        audio.sampleFormat != "s16") {
        error = "audio.sampleFormat must be one of float32, s32, s16 (got '" +
                audio.sampleFormat + "')";
        return false;
    }

    const auto& det = config.detection;
    if (det.consistencyChecks < 1) {
        error = "detection.consistencyChecks must be at least 1";
        return false;
    }
    if (det.consistencyThreshold < 1 || det.consistencyThreshold > det.consistencyChecks) {
        error = "detection.consistencyThreshold must be between 1 and consistencyChecks (" +
                std::to_string(det.consistencyChecks) + ")";
        return false;
    }
    if (det.noMatchStreakForFallback < 1) {
        error = "detection.noMatchStreakForFallback must be at least 1";
        return false;
    }

    const auto& level = config.level;
    if (level.silenceThreshold < 0.0f) {
        error = "level.silenceThreshold must not be negative";
        return false;
    }
    if (level.activityThreshold < level.silenceThreshold) {
        error = "level.activityThreshold must be >= level.silenceThreshold";
        return false;
    }
    if (level.activityWindow < 1 || level.standbyWindow < 1) {
        error = "level.activityWindow and level.standbyWindow must be at least 1";
        return false;
    }

    if (config.aggressive.checkCount < 0) {
        error = "aggressive.checkCount must not be negative";
        return false;
    }
    if (config.session.maxReopenAttempts < 0) {
        error = "session.maxReopenAttempts must not be negative";
        return false;
    }
    if (config.session.listenerQueueCapacity < 1) {
        error = "session.listenerQueueCapacity must be at least 1";
        return false;
    }
    if (config.recognition.timeoutMs <= 0) {
        error = "recognition.timeoutMs must be positive";
        return false;
    }
    if (config.recognition.endpoint.empty()) {
        error = "recognition.endpoint must not be empty";
        return false;
    }
    if (config.scrobble.enabled && config.scrobble.endpoint.empty()) {
        error = "scrobble.endpoint must be set when scrobbling is enabled";
        return false;
    }

    config.detection.checkDelayMs = std::max(0, config.detection.checkDelayMs);
    config.detection.checkIntervalMs = std::max(0, config.detection.checkIntervalMs);
    config.level.standbyPollMs = std::max(0, config.level.standbyPollMs);
    config.aggressive.intervalMs = std::max(0, config.aggressive.intervalMs);
    config.session.errorBackoffMs = std::max(0, config.session.errorBackoffMs);
    return true;
}

}  // namespace needledrop
