#pragma once

#include "detection/consistency_checker.h"
#include "detection/track.h"

#include <chrono>
#include <functional>
#include <optional>

namespace needledrop {
namespace detection {

struct AggressiveConfig {
    int triggerStreak = 3;  // Consecutive misses before the fallback runs
    int checkCount = 3;     // Rounds per fallback, each a full consistency run
    std::chrono::milliseconds interval{2000};
};

// One full consistency run over fresh samples
using RoundFn = std::function<std::optional<Track>()>;

/**
 * @brief Rapid retries after repeated non-detections.
 *
 * Each round costs `checks` recognition calls, so the fallback only runs
 * once the miss streak reaches triggerStreak and is bounded by checkCount.
 */
class AggressiveFallback {
   public:
    explicit AggressiveFallback(const AggressiveConfig& config) : config_(config) {}

    bool shouldRun(int noMatchStreak) const {
        return noMatchStreak >= config_.triggerStreak;
    }

    // First round that yields a track wins; nullopt when all rounds miss
    // or @p wait reports cancellation.
    std::optional<Track> run(const RoundFn& round, const WaitFn& wait) const;

    const AggressiveConfig& config() const {
        return config_;
    }

   private:
    AggressiveConfig config_;
};

}  // namespace detection
}  // namespace needledrop
