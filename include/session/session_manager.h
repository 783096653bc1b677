/**
 * @file session_manager.h
 * @brief Start/stop lifecycle and run loop of a detection session
 *
 * One session owns one audio device. Each cycle samples loudness, skips
 * recognition while in Standby, otherwise identifies the track by majority
 * vote (with the aggressive fallback after repeated misses) and reports it
 * through the scrobble deduplicator. Listeners are fed through bounded
 * per-listener queues, never directly from the run loop.
 *
 * Lock discipline: lifecycleMutex_ serializes start()/stop(); stateMutex_
 * guards status_ and is never held across I/O or listener delivery. Only
 * the run-loop thread writes status_ while a session is running.
 */

#pragma once

#include "audio/audio_source.h"
#include "detection/aggressive_fallback.h"
#include "detection/consistency_checker.h"
#include "detection/level_monitor.h"
#include "detection/recognition_service.h"
#include "detection/scrobble_deduplicator.h"
#include "detection/scrobble_sink.h"
#include "session/listener_registry.h"
#include "session/session_status.h"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

namespace needledrop {
namespace session {

struct SessionConfig {
    uint32_t sampleRate = 48000;
    size_t chunkFrames = 4096;
    std::chrono::milliseconds recordDuration{5000};      // Per recognition clip
    std::chrono::milliseconds levelCheckDuration{5000};  // Per loudness sample

    detection::LevelConfig level;
    bool startInStandby = false;
    std::chrono::milliseconds standbyPoll{3000};

    detection::ConsistencyConfig consistency;
    detection::AggressiveConfig aggressive;

    // Ask the scrobble sink for album, tags etc. once per newly identified track
    bool fetchTrackInfo = true;

    std::chrono::milliseconds cycleInterval{3000};
    std::chrono::milliseconds recognitionTimeout{15000};
    std::chrono::milliseconds errorBackoff{1000};
    int maxReopenAttempts = 5;
    size_t listenerQueueCapacity = 64;
};

// Collaborators are borrowed and must outlive the SessionManager.
struct SessionDependencies {
    audio::AudioSource* source = nullptr;
    detection::RecognitionService* recognizer = nullptr;
    detection::ScrobbleSink* sink = nullptr;
};

class SessionManager {
   public:
    SessionManager(SessionDependencies deps, SessionConfig config);
    ~SessionManager();

    SessionManager(const SessionManager&) = delete;
    SessionManager& operator=(const SessionManager&) = delete;

    /**
     * @brief Begin a session on @p deviceId.
     * @return false if a session is already running (nothing is spawned)
     */
    bool start(int deviceId);

    /**
     * @brief End the running session and wait for the run loop to exit.
     *
     * Cancels in-flight waits and recognition calls. On return running is
     * false, currentTrack is cleared and the audio source is closed.
     * @return false if no session was running
     */
    bool stop();

    bool isRunning() const {
        return running_.load();
    }

    SessionStatus status() const;

    void addTrackListener(std::string name, ListenerRegistry::TrackListener listener) {
        listeners_.addTrackListener(std::move(name), std::move(listener));
    }
    void addStatusListener(std::string name, ListenerRegistry::StatusListener listener) {
        listeners_.addStatusListener(std::move(name), std::move(listener));
    }

    size_t listenerCount() const {
        return listeners_.trackListenerCount() + listeners_.statusListenerCount();
    }

    // Block until queued listener events have been delivered (tests, shutdown)
    bool waitForListeners(std::chrono::milliseconds timeout) {
        return listeners_.waitIdle(timeout);
    }

    const SessionConfig& config() const {
        return config_;
    }

   private:
    // State private to one run-loop invocation
    struct LoopState {
        int deviceId = -1;
        detection::ActivityState activity;
        std::optional<detection::TrackKey> lastReported;
        int noMatchStreak = 0;
    };

    void runLoop(int deviceId);
    void runCycle(LoopState& loop);
    std::optional<detection::Track> identify();
    void noteDetectionAttempt();
    detection::Track withTrackInfo(const detection::Track& track);
    void applyIdentification(LoopState& loop, const std::optional<detection::Track>& track,
                             bool clearOnMiss);
    void recoverStream(int deviceId);
    void endWithFatal(const std::string& message);

    bool waitFor(std::chrono::milliseconds duration);
    bool cancelRequested() const {
        return stopRequested_.load();
    }
    size_t framesFor(std::chrono::milliseconds duration) const;

    void recordError(const std::string& message);
    void publishStatus();
    void joinStaleThread();

    SessionDependencies deps_;
    SessionConfig config_;
    detection::LevelMonitor levelMonitor_;
    detection::ConsistencyChecker consistency_;
    detection::AggressiveFallback fallback_;
    detection::ScrobbleDeduplicator dedup_;
    ListenerRegistry listeners_;

    std::mutex lifecycleMutex_;
    mutable std::mutex stateMutex_;
    SessionStatus status_;

    std::atomic<bool> running_{false};
    std::atomic<bool> stopRequested_{false};
    std::mutex waitMutex_;
    std::condition_variable waitCv_;
    std::thread loopThread_;
};

}  // namespace session
}  // namespace needledrop
