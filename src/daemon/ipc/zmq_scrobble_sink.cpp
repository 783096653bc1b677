#include "daemon/ipc/zmq_scrobble_sink.h"

#include "logging/logger.h"

#include <stdexcept>

namespace needledrop {
namespace ipc {

namespace {

std::optional<std::string> textField(const nlohmann::json& data, const char* key) {
    auto it = data.find(key);
    if (it == data.end()) {
        return std::nullopt;
    }
    if (it->is_string() && !it->get_ref<const std::string&>().empty()) {
        return it->get<std::string>();
    }
    if (it->is_number_integer()) {
        return std::to_string(it->get<int64_t>());
    }
    return std::nullopt;
}

// Integer, or a string holding one (the catalogue reports counts as text)
std::optional<int64_t> countField(const nlohmann::json& data, const char* key) {
    auto it = data.find(key);
    if (it == data.end()) {
        return std::nullopt;
    }
    if (it->is_number_integer()) {
        return it->get<int64_t>();
    }
    if (it->is_string()) {
        const std::string& text = it->get_ref<const std::string&>();
        try {
            size_t used = 0;
            long long value = std::stoll(text, &used);
            if (used == text.size()) {
                return static_cast<int64_t>(value);
            }
        } catch (const std::logic_error&) {
            // not a number
        }
    }
    return std::nullopt;
}

}  // namespace

ZmqScrobbleSink::ZmqScrobbleSink(std::string endpoint, std::chrono::milliseconds timeout)
    : client_(std::move(endpoint)), timeout_(timeout) {}

bool ZmqScrobbleSink::updateNowPlaying(const std::string& artist, const std::string& title,
                                       std::string& error) {
    nlohmann::json command;
    command["cmd"] = "NOW_PLAYING";
    command["params"] = {{"artist", artist}, {"title", title}};
    return send(command, error);
}

bool ZmqScrobbleSink::scrobble(const std::string& artist, const std::string& title,
                               std::chrono::system_clock::time_point timestamp,
                               std::string& error) {
    nlohmann::json command;
    command["cmd"] = "SCROBBLE";
    command["params"] = {
        {"artist", artist},
        {"title", title},
        {"timestamp",
         std::chrono::duration_cast<std::chrono::seconds>(timestamp.time_since_epoch()).count()}};
    return send(command, error);
}

bool ZmqScrobbleSink::clearNowPlaying(std::string& error) {
    nlohmann::json command;
    command["cmd"] = "CLEAR_NOW_PLAYING";
    return send(command, error);
}

std::optional<detection::TrackInfo> ZmqScrobbleSink::lookupTrackInfo(const std::string& artist,
                                                                     const std::string& title,
                                                                     std::string& error) {
    nlohmann::json command;
    command["cmd"] = "TRACK_INFO";
    command["params"] = {{"artist", artist}, {"title", title}};

    RequestResult reply = client_.request(command, timeout_);
    if (!reply.ok()) {
        error = std::string(requestOutcomeToString(reply.outcome)) + ": " + reply.message;
        LOG_DEBUG("Scrobbler TRACK_INFO failed: {}", error);
        return std::nullopt;
    }
    if (!reply.data.is_null() && !reply.data.is_object()) {
        error = "TRACK_INFO data is not an object";
        return std::nullopt;
    }
    return parseTrackInfo(reply.data);
}

std::optional<detection::TrackInfo> ZmqScrobbleSink::parseTrackInfo(const nlohmann::json& data) {
    if (!data.is_object()) {
        return std::nullopt;
    }

    detection::TrackInfo info;
    auto album = data.find("album");
    if (album != data.end() && album->is_object()) {
        info.album = textField(*album, "title");
        if (!info.album) {
            info.album = textField(*album, "name");
        }
    } else {
        info.album = textField(data, "album");
    }

    info.year = textField(data, "year");
    if (!info.year) {
        auto wiki = data.find("wiki");
        if (wiki != data.end() && wiki->is_string()) {
            info.year = detection::findReleaseYear(wiki->get_ref<const std::string&>());
        }
    }

    if (auto durationMs = countField(data, "duration_ms"); durationMs && *durationMs > 0) {
        info.durationSeconds = static_cast<int>(*durationMs / 1000);
    }

    auto tags = data.find("tags");
    if (tags != data.end() && tags->is_array()) {
        for (const auto& tag : *tags) {
            if (info.tags.size() >= detection::kMaxTrackTags) {
                break;
            }
            if (tag.is_string()) {
                info.tags.push_back(tag.get<std::string>());
            } else if (tag.is_object()) {
                if (auto name = textField(tag, "name")) {
                    info.tags.push_back(*name);
                }
            }
        }
    }

    info.listeners = countField(data, "listeners");
    info.playcount = countField(data, "playcount");
    return info;
}

bool ZmqScrobbleSink::send(const nlohmann::json& command, std::string& error) {
    RequestResult reply = client_.request(command, timeout_);
    if (reply.ok()) {
        return true;
    }
    error = std::string(requestOutcomeToString(reply.outcome)) + ": " + reply.message;
    LOG_DEBUG("Scrobbler {} failed: {}", command.value("cmd", std::string()), error);
    return false;
}

}  // namespace ipc
}  // namespace needledrop
