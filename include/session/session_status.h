#pragma once

#include "detection/level_monitor.h"
#include "detection/track.h"

#include <chrono>
#include <cstdint>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>

namespace needledrop {
namespace session {

// Diagnostics only; never read back for control decisions.
struct DebugInfo {
    float audioLevel = 0.0f;
    std::optional<std::chrono::system_clock::time_point> lastDetectionAt;
    int detectionCount = 0;
    std::optional<std::string> lastError;

    detection::Activity activity = detection::Activity::Active;
    int wakeCount = 0;  // Standby -> Active transitions this session
    int noMatchStreak = 0;
    uint64_t listenerDrops = 0;
    uint64_t listenerFailures = 0;  // Exceptions thrown by listener callbacks
};

struct SessionStatus {
    bool running = false;
    std::optional<int> currentDevice;
    std::optional<detection::Track> currentTrack;
    DebugInfo debug;
};

// ISO-8601 UTC with millisecond precision, e.g. 2024-05-01T12:00:00.123Z
std::string formatTimestamp(std::chrono::system_clock::time_point tp);

nlohmann::json trackToJson(const detection::Track& track);
nlohmann::json debugInfoToJson(const DebugInfo& debug);
nlohmann::json statusToJson(const SessionStatus& status);

}  // namespace session
}  // namespace needledrop
