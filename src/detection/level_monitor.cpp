#include "detection/level_monitor.h"

#include "logging/logger.h"

#include <algorithm>
#include <cctype>

namespace needledrop {
namespace detection {

const char* activityToString(Activity activity) {
    return activity == Activity::Standby ? "standby" : "active";
}

LevelMetric parseLevelMetric(const std::string& str) {
    std::string lower = str;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lower == "rms") {
        return LevelMetric::Rms;
    }
    return LevelMetric::Peak;
}

const char* levelMetricToString(LevelMetric metric) {
    return metric == LevelMetric::Rms ? "rms" : "peak";
}

float LevelMonitor::measure(const audio::PcmBuffer& buffer) const {
    if (config_.metric == LevelMetric::Rms) {
        return audio::rmsLevel(buffer);
    }
    return audio::peakAmplitude(buffer);
}

LevelReading LevelMonitor::update(const ActivityState& state, float metric) const {
    LevelReading reading;
    reading.state = state;
    reading.metric = metric;
    ActivityState& next = reading.state;

    if (metric < config_.silenceThreshold) {
        next.consecutiveBelowThreshold++;
        next.consecutiveAboveThreshold = 0;
        if (next.activity == Activity::Active &&
            next.consecutiveBelowThreshold >= static_cast<uint32_t>(config_.standbyWindow)) {
            next.activity = Activity::Standby;
            reading.transitioned = true;
            LOG_INFO("Entering standby - level {:.3f} below {} for {} samples", metric,
                     config_.silenceThreshold, next.consecutiveBelowThreshold);
        }
    } else if (metric > config_.activityThreshold) {
        next.consecutiveAboveThreshold++;
        next.consecutiveBelowThreshold = 0;
        if (next.activity == Activity::Standby &&
            next.consecutiveAboveThreshold >= static_cast<uint32_t>(config_.activityWindow)) {
            next.activity = Activity::Active;
            reading.transitioned = true;
            LOG_INFO("Exiting standby - level {:.3f} above {} for {} samples", metric,
                     config_.activityThreshold, next.consecutiveAboveThreshold);
        }
    }

    return reading;
}

}  // namespace detection
}  // namespace needledrop
