#pragma once

#include "daemon/ipc/zmq_request_client.h"
#include "detection/scrobble_sink.h"

#include <chrono>
#include <optional>
#include <string>

namespace needledrop {
namespace ipc {

/**
 * @brief ScrobbleSink backed by a scrobbler sidecar.
 *
 * Commands: NOW_PLAYING {artist,title}, SCROBBLE {artist,title,timestamp}
 * (unix seconds), CLEAR_NOW_PLAYING and TRACK_INFO {artist,title}.
 * Failures are returned, never thrown.
 */
class ZmqScrobbleSink : public detection::ScrobbleSink {
   public:
    ZmqScrobbleSink(std::string endpoint, std::chrono::milliseconds timeout);

    bool updateNowPlaying(const std::string& artist, const std::string& title,
                          std::string& error) override;
    bool scrobble(const std::string& artist, const std::string& title,
                  std::chrono::system_clock::time_point timestamp, std::string& error) override;
    bool clearNowPlaying(std::string& error) override;
    std::optional<detection::TrackInfo> lookupTrackInfo(const std::string& artist,
                                                        const std::string& title,
                                                        std::string& error) override;

    /**
     * @brief Read TRACK_INFO reply data.
     *
     * Accepts the sidecar's normalized fields (album, year, duration_ms,
     * tags, listeners, playcount, wiki). Counts may arrive as numeric
     * strings; fields of any other type are ignored.
     */
    static std::optional<detection::TrackInfo> parseTrackInfo(const nlohmann::json& data);

   private:
    bool send(const nlohmann::json& command, std::string& error);

    ZmqRequestClient client_;
    std::chrono::milliseconds timeout_;
};

}  // namespace ipc
}  // namespace needledrop
