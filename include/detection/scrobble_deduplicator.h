#pragma once

#include "detection/scrobble_sink.h"
#include "detection/track.h"

#include <chrono>
#include <optional>
#include <string>

namespace needledrop {
namespace detection {

struct DedupOutcome {
    std::optional<TrackKey> lastReported;  // Anchor for the next call
    bool nowPlayingCleared = false;
    bool nowPlayingSent = false;
    bool scrobbled = false;
    std::string error;  // Last sink failure, empty on success
};

/**
 * @brief Scrobble-on-change reporting policy.
 *
 * - no/invalid track: clear now-playing, keep the anchor
 * - same pair as the anchor: nothing is sent
 * - new pair: now-playing + scrobble stamped @p now; the anchor moves only
 *   when both calls succeed, so a failed report is retried on the next
 *   genuinely new detection
 */
class ScrobbleDeduplicator {
   public:
    explicit ScrobbleDeduplicator(ScrobbleSink& sink) : sink_(sink) {}

    DedupOutcome process(const std::optional<Track>& track,
                         const std::optional<TrackKey>& lastReported,
                         std::chrono::system_clock::time_point now);

   private:
    ScrobbleSink& sink_;
};

}  // namespace detection
}  // namespace needledrop
