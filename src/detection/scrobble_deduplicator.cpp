#include "detection/scrobble_deduplicator.h"

#include "core/errors.h"
#include "logging/logger.h"

namespace needledrop {
namespace detection {

namespace {

// Runs one sink call, folding SinkError into the bool/error convention.
template <typename Fn>
bool invokeSink(const char* what, std::string& error, Fn&& fn) {
    try {
        if (fn(error)) {
            return true;
        }
    } catch (const SinkError& e) {
        error = e.what();
    }
    if (error.empty()) {
        error = std::string(what) + " failed";
    }
    LOG_WARN("Scrobble sink {} failed: {}", what, error);
    return false;
}

}  // namespace

DedupOutcome ScrobbleDeduplicator::process(const std::optional<Track>& track,
                                           const std::optional<TrackKey>& lastReported,
                                           std::chrono::system_clock::time_point now) {
    DedupOutcome outcome;
    outcome.lastReported = lastReported;

    if (!track || !isValidIdentification(track->artist(), track->title())) {
        outcome.nowPlayingCleared = invokeSink(
            "clear now playing", outcome.error,
            [this](std::string& err) { return sink_.clearNowPlaying(err); });
        return outcome;
    }

    if (lastReported && *lastReported == track->key()) {
        LOG_DEBUG("Still playing: {} by {}", track->title(), track->artist());
        return outcome;
    }

    outcome.nowPlayingSent =
        invokeSink("now playing", outcome.error, [this, &track](std::string& err) {
            return sink_.updateNowPlaying(track->artist(), track->title(), err);
        });
    if (!outcome.nowPlayingSent) {
        return outcome;
    }

    outcome.scrobbled = invokeSink("scrobble", outcome.error, [this, &track, now](std::string& err) {
        return sink_.scrobble(track->artist(), track->title(), now, err);
    });
    if (outcome.scrobbled) {
        LOG_INFO("Scrobbled: {} by {}", track->title(), track->artist());
        outcome.lastReported = track->key();
    }
    return outcome;
}

}  // namespace detection
}  // namespace needledrop
