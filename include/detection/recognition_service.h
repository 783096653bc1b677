#pragma once

#include "audio/pcm_buffer.h"
#include "detection/track.h"

#include <chrono>
#include <functional>
#include <optional>

namespace needledrop {
namespace detection {

/**
 * @brief Per-call limits for external I/O.
 *
 * Implementations must give up once @p timeout has elapsed and should
 * poll @p cancelRequested often enough to abandon an in-flight call
 * promptly when the session stops.
 */
struct CallOptions {
    std::chrono::milliseconds timeout{15000};
    std::function<bool()> cancelRequested;

    bool cancelled() const {
        return cancelRequested && cancelRequested();
    }
};

/**
 * @brief Fingerprint recognizer (black box).
 *
 * Returns the best guess for @p clip, or nullopt when nothing matched.
 * Transport failures, timeouts and cancellation are reported by throwing
 * RecognitionError; the consistency checker treats them as "no match".
 */
class RecognitionService {
   public:
    virtual ~RecognitionService() = default;

    virtual std::optional<RecognitionResult> identify(const audio::PcmBuffer& clip,
                                                      const CallOptions& options) = 0;
};

}  // namespace detection
}  // namespace needledrop
