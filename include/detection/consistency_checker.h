/**
 * @file consistency_checker.h
 * @brief Majority-vote identification across temporally distinct samples
 *
 * The recognizer is noisy (false positives on silence, transient misreads).
 * A track is only accepted when at least `threshold` of `checks`
 * independent samples agree on the same (artist, title) pair.
 */

#pragma once

#include "detection/track.h"

#include <chrono>
#include <functional>
#include <optional>
#include <vector>

namespace needledrop {
namespace detection {

struct ConsistencyConfig {
    int checks = 3;                     // K samples per run
    int threshold = 2;                  // Matches needed, <= checks
    double confidenceThreshold = 0.0;   // Samples below this do not vote
    std::chrono::milliseconds checkDelay{1000};
};

// Capture a fresh clip and identify it; @p attempt is 0-based
using SampleFn = std::function<std::optional<RecognitionResult>(int attempt)>;

// Interruptible wait; false means it was cut short by cancellation
using WaitFn = std::function<bool(std::chrono::milliseconds)>;

struct TallyEntry {
    TrackKey key;
    int count = 0;
    double confidenceSum = 0.0;
};

struct ConsistencyVerdict {
    std::optional<TrackKey> winner;
    double averageConfidence = 0.0;
    int matches = 0;
    int validSamples = 0;
    std::vector<TallyEntry> tally;  // First-encountered order
};

class ConsistencyChecker {
   public:
    explicit ConsistencyChecker(const ConsistencyConfig& config) : config_(config) {}

    /**
     * @brief Vote over a set of samples.
     *
     * Invalid identifications (empty, "None") and samples below the
     * confidence threshold are ignored. Ties on the highest count go to
     * the pair encountered first. The winner is only reported when its
     * count reaches the threshold.
     */
    ConsistencyVerdict tally(const std::vector<std::optional<RecognitionResult>>& samples) const;

    /**
     * @brief Take exactly `checks` samples, waiting checkDelay between
     * them, then vote.
     *
     * RecognitionError from @p sample counts as "no result". Any other
     * exception (e.g. DeviceError) propagates. Returns nullopt early if
     * @p wait reports cancellation.
     */
    std::optional<Track> run(const SampleFn& sample, const WaitFn& wait) const;

    const ConsistencyConfig& config() const {
        return config_;
    }

   private:
    ConsistencyConfig config_;
};

}  // namespace detection
}  // namespace needledrop
