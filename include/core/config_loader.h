#ifndef NEEDLEDROP_CONFIG_LOADER_H
#define NEEDLEDROP_CONFIG_LOADER_H

#include "core/daemon_constants.h"
#include "detection/level_monitor.h"
#include "logging/logger.h"

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <string>

namespace needledrop {

struct AppConfig {
    struct AudioConfig {
        uint32_t sampleRate = 48000;
        uint16_t channels = 1;
        int chunkSize = 4096;       // Frames per ALSA read
        double recordSeconds = 5.0;  // Per recognition clip
        int levelCheckMs = 5000;     // Per loudness sample
        std::string sampleFormat = "float32";  // float32, s32, s16
    } audio;

    struct DetectionConfig {
        int consistencyChecks = 3;
        int consistencyThreshold = 2;
        double confidenceThreshold = 0.0;
        int checkDelayMs = 1000;     // Between consistency samples
        int checkIntervalMs = 3000;  // Between cycles
        int noMatchStreakForFallback = DaemonConstants::NO_MATCH_STREAK_FOR_FALLBACK;
    } detection;

    struct LevelConfig {
        detection::LevelMetric metric = detection::LevelMetric::Peak;
        float silenceThreshold = 0.05f;
        float activityThreshold = 0.1f;
        int activityWindow = 2;
        int standbyWindow = 5;
        int standbyPollMs = 3000;
        bool startInStandby = false;
    } level;

    struct AggressiveConfig {
        int checkCount = 3;
        int intervalMs = 2000;
    } aggressive;

    struct SessionConfig {
        int errorBackoffMs = 1000;
        int maxReopenAttempts = 5;
        int listenerQueueCapacity = 64;
    } session;

    struct RecognitionConfig {
        std::string endpoint = DaemonConstants::RECOGNIZER_IPC_PATH;
        int timeoutMs = 15000;  // Per IDENTIFY call
    } recognition;

    struct ScrobbleConfig {
        bool enabled = false;  // false = log-only sink
        std::string endpoint = DaemonConstants::SCROBBLER_IPC_PATH;
        int timeoutMs = 10000;
        bool trackInfo = true;  // TRACK_INFO lookup for each new track
    } scrobble;

    struct ControlConfig {
        bool enabled = true;
        std::string endpoint = DaemonConstants::CONTROL_IPC_PATH;
    } control;

    logging::LogConfig logging;
};

/**
 * @brief Load @p configPath into @p outConfig.
 *
 * outConfig is reset to defaults first. Returns false when the file is
 * missing or is not valid JSON; individual keys of the wrong type keep
 * their defaults. Does not validate cross-field constraints.
 */
bool loadAppConfig(const std::filesystem::path& configPath, AppConfig& outConfig,
                   bool verbose = true);

/**
 * @brief Check cross-field constraints.
 *
 * Negative delays are raised to zero in place; anything else that cannot
 * run (threshold above the number of checks, inverted level thresholds,
 * empty windows) fails with a message in @p error.
 */
bool validateAppConfig(AppConfig& config, std::string& error);

}  // namespace needledrop

#endif  // NEEDLEDROP_CONFIG_LOADER_H
