#include "detection/consistency_checker.h"

#include "core/errors.h"
#include "logging/logger.h"

#include <algorithm>

namespace needledrop {
namespace detection {

ConsistencyVerdict ConsistencyChecker::tally(
    const std::vector<std::optional<RecognitionResult>>& samples) const {
    ConsistencyVerdict verdict;

    for (const auto& sample : samples) {
        if (!sample || !isValidIdentification(*sample)) {
            continue;
        }
        if (sample->confidence < config_.confidenceThreshold) {
            LOG_DEBUG("Ignoring {} by {}: confidence {:.2f} below {:.2f}", sample->title,
                      sample->artist, sample->confidence, config_.confidenceThreshold);
            continue;
        }
        verdict.validSamples++;

        TrackKey key{sample->artist, sample->title};
        auto it = std::find_if(verdict.tally.begin(), verdict.tally.end(),
                               [&key](const TallyEntry& entry) { return entry.key == key; });
        if (it == verdict.tally.end()) {
            verdict.tally.push_back(TallyEntry{std::move(key), 1, sample->confidence});
        } else {
            it->count++;
            it->confidenceSum += sample->confidence;
        }
    }

    // Strict '>' keeps the earliest pair on equal counts.
    const TallyEntry* best = nullptr;
    for (const auto& entry : verdict.tally) {
        if (!best || entry.count > best->count) {
            best = &entry;
        }
    }

    if (best && best->count >= config_.threshold) {
        verdict.winner = best->key;
        verdict.matches = best->count;
        verdict.averageConfidence = best->confidenceSum / static_cast<double>(best->count);
    }
    return verdict;
}

std::optional<Track> ConsistencyChecker::run(const SampleFn& sample, const WaitFn& wait) const {
    std::vector<std::optional<RecognitionResult>> samples;
    samples.reserve(static_cast<size_t>(std::max(config_.checks, 0)));

    for (int i = 0; i < config_.checks; ++i) {
        LOG_DEBUG("Consistency check {}/{}", i + 1, config_.checks);

        std::optional<RecognitionResult> result;
        try {
            result = sample(i);
        } catch (const RecognitionError& e) {
            LOG_DEBUG("Check {} recognition error [{}]: {}", i + 1, errorCodeToString(e.code()),
                      e.what());
            if (e.code() == ErrorCode::RECOGNITION_CANCELLED) {
                return std::nullopt;
            }
        }

        if (result) {
            LOG_DEBUG("Check {} result: {} by {} (confidence: {:.2f})", i + 1, result->title,
                      result->artist, result->confidence);
        } else {
            LOG_DEBUG("Check {} result: no match", i + 1);
        }
        samples.push_back(std::move(result));

        if (i < config_.checks - 1 && !wait(config_.checkDelay)) {
            return std::nullopt;
        }
    }

    ConsistencyVerdict verdict = tally(samples);
    if (!verdict.winner) {
        if (verdict.tally.empty()) {
            LOG_DEBUG("No songs detected in {} samples", config_.checks);
        } else {
            LOG_DEBUG("Inconsistent results across {} samples:", config_.checks);
            for (const auto& entry : verdict.tally) {
                LOG_DEBUG("  {} by {}: {} matches", entry.key.title, entry.key.artist,
                          entry.count);
            }
        }
        return std::nullopt;
    }

    LOG_DEBUG("Consistent song detected: {} by {} ({}/{} matches, avg confidence: {:.2f})",
              verdict.winner->title, verdict.winner->artist, verdict.matches, config_.checks,
              verdict.averageConfidence);
    return Track(verdict.winner->artist, verdict.winner->title, verdict.averageConfidence,
                 std::chrono::system_clock::now());
}

}  // namespace detection
}  // namespace needledrop
