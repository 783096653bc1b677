#include "detection/consistency_checker.h"

#include "core/errors.h"

#include <chrono>
#include <gtest/gtest.h>
#include <stdexcept>
#include <vector>

using namespace needledrop;
using namespace needledrop::detection;

namespace {

using Sample = std::optional<RecognitionResult>;

Sample hit(const std::string& artist, const std::string& title, double confidence = 0.5) {
    return RecognitionResult{artist, title, confidence};
}

ConsistencyConfig threeOfTwo() {
    ConsistencyConfig config;
    config.checks = 3;
    config.threshold = 2;
    config.checkDelay = std::chrono::milliseconds(0);
    return config;
}

// Replays a fixed list of samples and records the waits requested
struct Script {
    std::vector<Sample> samples;
    std::vector<std::chrono::milliseconds> waits;
    int calls = 0;

    SampleFn sampler() {
        return [this](int attempt) {
            ++calls;
            return samples.at(static_cast<size_t>(attempt));
        };
    }
    WaitFn waiter(bool keepGoing = true) {
        return [this, keepGoing](std::chrono::milliseconds d) {
            waits.push_back(d);
            return keepGoing;
        };
    }
};

}  // namespace

TEST(ConsistencyChecker, MajorityWinsWithMeanOfMatchingConfidences) {
    Script script{{hit("A", "T", 0.8), hit("A", "T", 0.6), hit("B", "U", 0.99)}};
    ConsistencyChecker checker(threeOfTwo());

    auto track = checker.run(script.sampler(), script.waiter());
    ASSERT_TRUE(track.has_value());
    EXPECT_EQ(track->artist(), "A");
    EXPECT_EQ(track->title(), "T");
    EXPECT_DOUBLE_EQ(track->confidence(), 0.7);
}

TEST(ConsistencyChecker, AllDistinctReturnsNone) {
    Script script{{hit("A", "T"), hit("B", "U"), hit("C", "V")}};
    ConsistencyChecker checker(threeOfTwo());
    EXPECT_FALSE(checker.run(script.sampler(), script.waiter()).has_value());
    EXPECT_EQ(script.calls, 3);
}

TEST(ConsistencyChecker, TakesExactlyKSamplesAndWaitsBetweenThem) {
    ConsistencyConfig config = threeOfTwo();
    config.checks = 4;
    config.checkDelay = std::chrono::milliseconds(250);
    Script script{{hit("A", "T"), hit("A", "T"), hit("A", "T"), hit("A", "T")}};

    ConsistencyChecker checker(config);
    ASSERT_TRUE(checker.run(script.sampler(), script.waiter()).has_value());
    EXPECT_EQ(script.calls, 4);
    ASSERT_EQ(script.waits.size(), 3u);
    for (auto wait : script.waits) {
        EXPECT_EQ(wait, std::chrono::milliseconds(250));
    }
}

TEST(ConsistencyChecker, SentinelAndEmptyResultsDoNotVote) {
    std::vector<Sample> samples = {hit("None", "None"), hit("", "T"), std::nullopt,
                                   hit("A", "none"), hit("A", "T")};
    ConsistencyChecker checker(threeOfTwo());
    ConsistencyVerdict verdict = checker.tally(samples);
    EXPECT_EQ(verdict.validSamples, 1);
    ASSERT_EQ(verdict.tally.size(), 1u);
    EXPECT_FALSE(verdict.winner.has_value());
}

TEST(ConsistencyChecker, TieGoesToFirstEncounteredPair) {
    ConsistencyConfig config = threeOfTwo();
    config.checks = 4;
    ConsistencyChecker checker(config);

    std::vector<Sample> samples = {hit("B", "U"), hit("A", "T"), hit("A", "T"), hit("B", "U")};
    ConsistencyVerdict verdict = checker.tally(samples);
    ASSERT_TRUE(verdict.winner.has_value());
    EXPECT_EQ(verdict.winner->artist, "B");
    EXPECT_EQ(verdict.matches, 2);

    std::vector<Sample> reversed = {hit("A", "T"), hit("B", "U"), hit("B", "U"), hit("A", "T")};
    verdict = checker.tally(reversed);
    ASSERT_TRUE(verdict.winner.has_value());
    EXPECT_EQ(verdict.winner->artist, "A");
}

TEST(ConsistencyChecker, LowConfidenceSamplesAreIgnored) {
    ConsistencyConfig config = threeOfTwo();
    config.confidenceThreshold = 0.5;
    ConsistencyChecker checker(config);

    std::vector<Sample> samples = {hit("A", "T", 0.9), hit("A", "T", 0.2), hit("B", "U", 0.9)};
    ConsistencyVerdict verdict = checker.tally(samples);
    EXPECT_FALSE(verdict.winner.has_value());
    EXPECT_EQ(verdict.validSamples, 2);
}

TEST(ConsistencyChecker, ThresholdEqualToChecksRequiresUnanimity) {
    ConsistencyConfig config = threeOfTwo();
    config.threshold = 3;
    ConsistencyChecker checker(config);
    EXPECT_FALSE(checker.tally({hit("A", "T"), hit("A", "T"), std::nullopt}).winner);
    EXPECT_TRUE(checker.tally({hit("A", "T"), hit("A", "T"), hit("A", "T")}).winner);
}

TEST(ConsistencyChecker, RecognitionErrorCountsAsNoMatch) {
    int calls = 0;
    SampleFn sampler = [&calls](int attempt) -> Sample {
        ++calls;
        if (attempt == 1) {
            throw RecognitionError("timed out", ErrorCode::RECOGNITION_TIMEOUT);
        }
        return hit("A", "T");
    };
    ConsistencyChecker checker(threeOfTwo());
    auto track = checker.run(sampler, [](std::chrono::milliseconds) { return true; });
    ASSERT_TRUE(track.has_value());
    EXPECT_EQ(calls, 3);
}

TEST(ConsistencyChecker, DeviceErrorPropagates) {
    SampleFn sampler = [](int) -> Sample {
        throw DeviceError(DeviceError::Kind::StreamClosed, "unplugged");
    };
    ConsistencyChecker checker(threeOfTwo());
    EXPECT_THROW(checker.run(sampler, [](std::chrono::milliseconds) { return true; }),
                 DeviceError);
}

TEST(ConsistencyChecker, CancelledWaitStopsEarly) {
    Script script{{hit("A", "T"), hit("A", "T"), hit("A", "T")}};
    ConsistencyChecker checker(threeOfTwo());
    EXPECT_FALSE(checker.run(script.sampler(), script.waiter(false)).has_value());
    EXPECT_EQ(script.calls, 1);
}

TEST(ConsistencyChecker, CancelledRecognitionStopsEarly) {
    int calls = 0;
    SampleFn sampler = [&calls](int) -> Sample {
        ++calls;
        throw RecognitionError("stopping", ErrorCode::RECOGNITION_CANCELLED);
    };
    ConsistencyChecker checker(threeOfTwo());
    EXPECT_FALSE(checker.run(sampler, [](std::chrono::milliseconds) { return true; }));
    EXPECT_EQ(calls, 1);
}
