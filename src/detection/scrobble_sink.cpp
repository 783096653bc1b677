#include "detection/scrobble_sink.h"

#include "logging/logger.h"

namespace needledrop {
namespace detection {

bool LoggingScrobbleSink::updateNowPlaying(const std::string& artist, const std::string& title,
                                           std::string& /*error*/) {
    LOG_ONCE(INFO, "Scrobbler not configured, now playing and scrobbles are only logged");
    LOG_DEBUG("Scrobbler not configured, skipping now playing: {} by {}", title, artist);
    return true;
}

bool LoggingScrobbleSink::scrobble(const std::string& artist, const std::string& title,
                                   std::chrono::system_clock::time_point timestamp,
                                   std::string& /*error*/) {
    auto epoch =
        std::chrono::duration_cast<std::chrono::seconds>(timestamp.time_since_epoch()).count();
    LOG_DEBUG("Scrobbler not configured, skipping scrobble: {} by {} at {}", title, artist, epoch);
    return true;
}

bool LoggingScrobbleSink::clearNowPlaying(std::string& /*error*/) {
    LOG_DEBUG("Scrobbler not configured, skipping now playing clear");
    return true;
}

}  // namespace detection
}  // namespace needledrop
