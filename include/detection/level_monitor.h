/**
 * @file level_monitor.h
 * @brief Loudness gate with windowed hysteresis (Active / Standby)
 *
 * Recognition calls are the expensive, rate-limited operation, so the
 * session only issues them while the input is Active. Two thresholds and
 * two consecutive-sample windows keep the state from flapping on noisy
 * signals:
 * - metric < silenceThreshold for standbyWindow samples: Active -> Standby
 * - metric > activityThreshold for activityWindow samples: Standby -> Active
 * - values in between leave counters and state unchanged
 */

#pragma once

#include "audio/pcm_buffer.h"

#include <cstdint>
#include <string>

namespace needledrop {
namespace detection {

enum class Activity {
    Active,
    Standby
};

const char* activityToString(Activity activity);

enum class LevelMetric {
    Peak,  // Peak absolute amplitude of normalized samples
    Rms    // RMS energy in 16-bit integer units
};

// Invalid input maps to Peak
LevelMetric parseLevelMetric(const std::string& str);
const char* levelMetricToString(LevelMetric metric);

struct LevelConfig {
    LevelMetric metric = LevelMetric::Peak;
    float silenceThreshold = 0.05f;
    float activityThreshold = 0.1f;  // Must be >= silenceThreshold
    int activityWindow = 2;
    int standbyWindow = 5;
};

struct ActivityState {
    Activity activity = Activity::Active;
    uint32_t consecutiveBelowThreshold = 0;
    uint32_t consecutiveAboveThreshold = 0;

    bool isStandby() const {
        return activity == Activity::Standby;
    }
};

struct LevelReading {
    ActivityState state;
    float metric = 0.0f;
    bool transitioned = false;
};

class LevelMonitor {
   public:
    explicit LevelMonitor(const LevelConfig& config) : config_(config) {}

    // Loudness metric of @p buffer according to the configured LevelMetric
    float measure(const audio::PcmBuffer& buffer) const;

    // Apply one metric value to @p state
    LevelReading update(const ActivityState& state, float metric) const;

    LevelReading update(const ActivityState& state, const audio::PcmBuffer& buffer) const {
        return update(state, measure(buffer));
    }

    const LevelConfig& config() const {
        return config_;
    }

   private:
    LevelConfig config_;
};

}  // namespace detection
}  // namespace needledrop
