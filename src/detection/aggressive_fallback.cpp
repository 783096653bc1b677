#include "detection/aggressive_fallback.h"

#include "logging/logger.h"

namespace needledrop {
namespace detection {

std::optional<Track> AggressiveFallback::run(const RoundFn& round, const WaitFn& wait) const {
    for (int i = 0; i < config_.checkCount; ++i) {
        LOG_DEBUG("Aggressive check {}/{}", i + 1, config_.checkCount);

        std::optional<Track> track = round();
        if (track && isValidIdentification(track->artist(), track->title())) {
            LOG_INFO("Aggressive check {} identified {} by {}", i + 1, track->title(),
                     track->artist());
            return track;
        }

        if (i < config_.checkCount - 1 && !wait(config_.interval)) {
            return std::nullopt;
        }
    }

    LOG_DEBUG("Aggressive detection exhausted {} rounds", config_.checkCount);
    return std::nullopt;
}

}  // namespace detection
}  // namespace needledrop
