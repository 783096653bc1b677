#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace needledrop {
namespace detection {

// Placeholder the recognizer returns in place of a real artist/title
constexpr std::string_view kUnknownSentinel = "None";

/**
 * @brief Identity of a track for deduplication: the (artist, title) pair.
 */
struct TrackKey {
    std::string artist;
    std::string title;

    bool operator==(const TrackKey& other) const = default;
};

// One raw guess from the recognition service for one clip.
struct RecognitionResult {
    std::string artist;
    std::string title;
    double confidence = 0.0;
};

// Catalogue metadata from the scrobbling service; any field may be missing.
struct TrackInfo {
    std::optional<std::string> album;
    std::optional<std::string> year;
    std::optional<int> durationSeconds;
    std::vector<std::string> tags;  // Top tags, at most kMaxTrackTags
    std::optional<int64_t> listeners;
    std::optional<int64_t> playcount;
};

constexpr size_t kMaxTrackTags = 3;

/**
 * @brief An identified track. Immutable once constructed.
 *
 * Only key() takes part in equality for reporting purposes; confidence,
 * detectedAt and info are informational.
 */
class Track {
   public:
    Track(std::string artist, std::string title, double confidence,
          std::chrono::system_clock::time_point detectedAt)
        : key_{std::move(artist), std::move(title)},
          confidence_(confidence),
          detectedAt_(detectedAt) {}

    const std::string& artist() const {
        return key_.artist;
    }
    const std::string& title() const {
        return key_.title;
    }
    double confidence() const {
        return confidence_;
    }
    std::chrono::system_clock::time_point detectedAt() const {
        return detectedAt_;
    }
    const TrackKey& key() const {
        return key_;
    }
    const std::optional<TrackInfo>& info() const {
        return info_;
    }

    // Copy of this track carrying @p info
    Track withInfo(TrackInfo info) const {
        Track copy(*this);
        copy.info_ = std::move(info);
        return copy;
    }

   private:
    TrackKey key_;
    double confidence_;
    std::chrono::system_clock::time_point detectedAt_;
    std::optional<TrackInfo> info_;
};

/**
 * @brief Whether an artist/title pair names a real track.
 *
 * Empty strings and the "None" sentinel (any case) are rejected.
 */
bool isValidIdentification(std::string_view artist, std::string_view title);

/**
 * @brief First release year (19xx or 20xx standing alone) mentioned in @p text.
 *
 * Used on free-form wiki text when the catalogue has no year field.
 */
std::optional<std::string> findReleaseYear(std::string_view text);

inline bool isValidIdentification(const RecognitionResult& result) {
    return isValidIdentification(result.artist, result.title);
}

// Same track for reporting purposes (absent == absent)
inline bool sameTrack(const std::optional<Track>& a, const std::optional<Track>& b) {
    if (!a || !b) {
        return !a && !b;
    }
    return a->key() == b->key();
}

}  // namespace detection
}  // namespace needledrop
