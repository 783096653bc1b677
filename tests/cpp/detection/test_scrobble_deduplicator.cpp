#include "detection/scrobble_deduplicator.h"

#include "../support/fakes.h"

#include <gtest/gtest.h>

using namespace needledrop;
using namespace needledrop::detection;
using testing_support::RecordingSink;

namespace {

Track track(const std::string& artist, const std::string& title, double confidence = 0.8) {
    return Track(artist, title, confidence, std::chrono::system_clock::now());
}

const auto kNow = std::chrono::system_clock::now();

}  // namespace

TEST(ScrobbleDeduplicator, NewTrackSendsNowPlayingAndScrobble) {
    RecordingSink sink;
    ScrobbleDeduplicator dedup(sink);

    DedupOutcome outcome = dedup.process(track("A", "T"), std::nullopt, kNow);
    EXPECT_TRUE(outcome.nowPlayingSent);
    EXPECT_TRUE(outcome.scrobbled);
    ASSERT_TRUE(outcome.lastReported.has_value());
    EXPECT_EQ(outcome.lastReported->artist, "A");

    auto calls = sink.calls();
    ASSERT_EQ(calls.size(), 2u);
    EXPECT_EQ(calls[0].kind, "now_playing");
    EXPECT_EQ(calls[1].kind, "scrobble");
}

TEST(ScrobbleDeduplicator, SamePairTwiceNeverScrobblesAgain) {
    RecordingSink sink;
    ScrobbleDeduplicator dedup(sink);

    auto first = dedup.process(track("A", "T", 0.6), std::nullopt, kNow);
    auto second = dedup.process(track("A", "T", 0.9), first.lastReported, kNow);

    EXPECT_FALSE(second.nowPlayingSent);
    EXPECT_FALSE(second.scrobbled);
    EXPECT_EQ(sink.count("scrobble"), 1);
    EXPECT_EQ(second.lastReported, first.lastReported);
}

TEST(ScrobbleDeduplicator, NoneClearsNowPlayingAndKeepsAnchor) {
    RecordingSink sink;
    ScrobbleDeduplicator dedup(sink);
    std::optional<TrackKey> anchor = TrackKey{"A", "T"};

    DedupOutcome outcome = dedup.process(std::nullopt, anchor, kNow);
    EXPECT_TRUE(outcome.nowPlayingCleared);
    EXPECT_FALSE(outcome.scrobbled);
    EXPECT_EQ(outcome.lastReported, anchor);
    EXPECT_EQ(sink.count("clear"), 1);
    EXPECT_EQ(sink.count("scrobble"), 0);
}

TEST(ScrobbleDeduplicator, PlaceholderTrackIsTreatedAsNone) {
    RecordingSink sink;
    ScrobbleDeduplicator dedup(sink);
    DedupOutcome outcome = dedup.process(track("None", "None"), std::nullopt, kNow);
    EXPECT_TRUE(outcome.nowPlayingCleared);
    EXPECT_FALSE(outcome.lastReported.has_value());
}

TEST(ScrobbleDeduplicator, SameTrackAfterNoneIsStillDeduplicated) {
    RecordingSink sink;
    ScrobbleDeduplicator dedup(sink);
    auto first = dedup.process(track("A", "T"), std::nullopt, kNow);
    auto cleared = dedup.process(std::nullopt, first.lastReported, kNow);
    auto again = dedup.process(track("A", "T"), cleared.lastReported, kNow);
    EXPECT_FALSE(again.scrobbled);
    EXPECT_EQ(sink.count("scrobble"), 1);
}

TEST(ScrobbleDeduplicator, FailedScrobbleKeepsPreviousAnchorForRetry) {
    RecordingSink sink;
    sink.failScrobble = true;
    ScrobbleDeduplicator dedup(sink);
    std::optional<TrackKey> anchor = TrackKey{"Old", "Song"};

    DedupOutcome outcome = dedup.process(track("A", "T"), anchor, kNow);
    EXPECT_TRUE(outcome.nowPlayingSent);
    EXPECT_FALSE(outcome.scrobbled);
    EXPECT_EQ(outcome.lastReported, anchor);
    EXPECT_FALSE(outcome.error.empty());

    sink.failScrobble = false;
    DedupOutcome retry = dedup.process(track("A", "T"), outcome.lastReported, kNow);
    EXPECT_TRUE(retry.scrobbled);
    EXPECT_EQ(retry.lastReported, (TrackKey{"A", "T"}));
}

TEST(ScrobbleDeduplicator, ThrownSinkErrorIsContained) {
    RecordingSink sink;
    sink.throwOnScrobble = true;
    ScrobbleDeduplicator dedup(sink);

    DedupOutcome outcome;
    EXPECT_NO_THROW(outcome = dedup.process(track("A", "T"), std::nullopt, kNow));
    EXPECT_FALSE(outcome.scrobbled);
    EXPECT_FALSE(outcome.lastReported.has_value());
    EXPECT_EQ(outcome.error, "scrobble endpoint down");
}

TEST(ScrobbleDeduplicator, FailedNowPlayingSkipsScrobble) {
    RecordingSink sink;
    sink.failNowPlaying = true;
    ScrobbleDeduplicator dedup(sink);
    DedupOutcome outcome = dedup.process(track("A", "T"), std::nullopt, kNow);
    EXPECT_FALSE(outcome.nowPlayingSent);
    EXPECT_EQ(sink.count("scrobble"), 0);
    EXPECT_FALSE(outcome.lastReported.has_value());
}

TEST(LoggingScrobbleSink, AlwaysSucceeds) {
    LoggingScrobbleSink sink;
    std::string error;
    EXPECT_TRUE(sink.updateNowPlaying("A", "T", error));
    EXPECT_TRUE(sink.scrobble("A", "T", kNow, error));
    EXPECT_TRUE(sink.clearNowPlaying(error));
    EXPECT_TRUE(error.empty());
}

namespace {

class NowPlayingOnlySink : public ScrobbleSink {
   public:
    bool updateNowPlaying(const std::string&, const std::string&, std::string&) override {
        return true;
    }
    bool scrobble(const std::string&, const std::string&, std::chrono::system_clock::time_point,
                  std::string&) override {
        return true;
    }
};

}  // namespace

TEST(ScrobbleSink, OptionalCallsDefaultToHarmlessResults) {
    NowPlayingOnlySink sink;
    std::string error;
    EXPECT_TRUE(sink.clearNowPlaying(error));
    EXPECT_FALSE(sink.lookupTrackInfo("A", "T", error).has_value());
    EXPECT_TRUE(error.empty());

    ScrobbleDeduplicator dedup(sink);
    std::optional<TrackKey> anchor = TrackKey{"A", "T"};
    DedupOutcome outcome = dedup.process(std::nullopt, anchor, kNow);
    EXPECT_TRUE(outcome.nowPlayingCleared);
    EXPECT_EQ(outcome.lastReported, anchor);
}
