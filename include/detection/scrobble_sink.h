#pragma once

#include "detection/track.h"

#include <chrono>
#include <optional>
#include <string>

namespace needledrop {
namespace detection {

/**
 * @brief Outbound now-playing/scrobble reporting.
 *
 * Each call returns false and fills @p error on failure. Implementations
 * may also throw SinkError; callers handle both the same way.
 */
class ScrobbleSink {
   public:
    virtual ~ScrobbleSink() = default;

    virtual bool updateNowPlaying(const std::string& artist, const std::string& title,
                                  std::string& error) = 0;

    virtual bool scrobble(const std::string& artist, const std::string& title,
                          std::chrono::system_clock::time_point timestamp,
                          std::string& error) = 0;

    // Services without a "clear" call treat this as success.
    virtual bool clearNowPlaying(std::string& /*error*/) {
        return true;
    }

    /**
     * @brief Catalogue metadata for a newly identified track.
     *
     * nullopt with an empty @p error means the service has none to offer.
     */
    virtual std::optional<TrackInfo> lookupTrackInfo(const std::string& /*artist*/,
                                                     const std::string& /*title*/,
                                                     std::string& /*error*/) {
        return std::nullopt;
    }
};

// Stand-in when no scrobbler is configured
class LoggingScrobbleSink : public ScrobbleSink {
   public:
    bool updateNowPlaying(const std::string& artist, const std::string& title,
                          std::string& error) override;
    bool scrobble(const std::string& artist, const std::string& title,
                  std::chrono::system_clock::time_point timestamp, std::string& error) override;
    bool clearNowPlaying(std::string& error) override;
};

}  // namespace detection
}  // namespace needledrop
