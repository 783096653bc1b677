#include "session/session_status.h"

#include <ctime>
#include <fmt/format.h>

namespace needledrop {
namespace session {

std::string formatTimestamp(std::chrono::system_clock::time_point tp) {
    auto millis =
        std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count() %
        1000;
    if (millis < 0) {
        millis += 1000;
    }
    std::time_t seconds = std::chrono::system_clock::to_time_t(tp);
    std::tm utc{};
    gmtime_r(&seconds, &utc);
    return fmt::format("{:04d}-{:02d}-{:02d}T{:02d}:{:02d}:{:02d}.{:03d}Z", utc.tm_year + 1900,
                       utc.tm_mon + 1, utc.tm_mday, utc.tm_hour, utc.tm_min, utc.tm_sec,
                       static_cast<int>(millis));
}

namespace {

template <typename T>
nlohmann::json orNull(const std::optional<T>& value) {
    return value ? nlohmann::json(*value) : nlohmann::json(nullptr);
}

}  // namespace

nlohmann::json trackToJson(const detection::Track& track) {
    nlohmann::json j = {{"artist", track.artist()},
                        {"title", track.title()},
                        {"confidence", track.confidence()},
                        {"detected_at", formatTimestamp(track.detectedAt())}};
    if (const auto& info = track.info()) {
        j["album"] = info->album
                         ? nlohmann::json{{"name", *info->album}, {"year", orNull(info->year)}}
                         : nlohmann::json(nullptr);
        j["duration"] = orNull(info->durationSeconds);
        j["tags"] = info->tags;
        j["listeners"] = orNull(info->listeners);
        j["playcount"] = orNull(info->playcount);
    }
    return j;
}

nlohmann::json debugInfoToJson(const DebugInfo& debug) {
    nlohmann::json j;
    j["audio_level"] = debug.audioLevel;
    j["last_detection"] =
        debug.lastDetectionAt ? nlohmann::json(formatTimestamp(*debug.lastDetectionAt))
                              : nlohmann::json(nullptr);
    j["detection_count"] = debug.detectionCount;
    j["last_error"] = debug.lastError ? nlohmann::json(*debug.lastError) : nlohmann::json(nullptr);
    j["activity"] = std::string(detection::activityToString(debug.activity));
    j["wake_count"] = debug.wakeCount;
    j["no_match_streak"] = debug.noMatchStreak;
    j["listener_drops"] = debug.listenerDrops;
    j["listener_failures"] = debug.listenerFailures;
    return j;
}

nlohmann::json statusToJson(const SessionStatus& status) {
    nlohmann::json j;
    j["running"] = status.running;
    j["device_index"] =
        status.currentDevice ? nlohmann::json(*status.currentDevice) : nlohmann::json(nullptr);
    j["current_track"] =
        status.currentTrack ? trackToJson(*status.currentTrack) : nlohmann::json(nullptr);
    j["debug"] = debugInfoToJson(status.debug);
    return j;
}

}  // namespace session
}  // namespace needledrop
