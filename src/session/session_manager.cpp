#include "session/session_manager.h"

#include "core/errors.h"
#include "logging/logger.h"

#include <fmt/format.h>
#include <stdexcept>
#include <utility>

namespace needledrop {
namespace session {

namespace {

// Closes the audio source on every exit path of the run loop
class SourceCloser {
   public:
    explicit SourceCloser(audio::AudioSource& source) : source_(source) {}
    ~SourceCloser() {
        source_.close();
    }

    SourceCloser(const SourceCloser&) = delete;
    SourceCloser& operator=(const SourceCloser&) = delete;

   private:
    audio::AudioSource& source_;
};

void requireDependencies(const SessionDependencies& deps) {
    if (!deps.source || !deps.recognizer || !deps.sink) {
        throw std::invalid_argument(
            "SessionManager requires an audio source, a recognizer and a scrobble sink");
    }
}

}  // namespace

SessionManager::SessionManager(SessionDependencies deps, SessionConfig config)
    : deps_((requireDependencies(deps), deps)),
      config_(std::move(config)),
      levelMonitor_(config_.level),
      consistency_(config_.consistency),
      fallback_(config_.aggressive),
      dedup_(*deps_.sink),
      listeners_(config_.listenerQueueCapacity) {}

SessionManager::~SessionManager() {
    stop();
    joinStaleThread();
    listeners_.shutdown();
}

bool SessionManager::start(int deviceId) {
    std::lock_guard<std::mutex> lifecycle(lifecycleMutex_);
    if (running_.load()) {
        LOG_WARN("Session already running on device {}, start({}) rejected",
                 status().currentDevice.value_or(-1), deviceId);
        return false;
    }
    joinStaleThread();

    {
        std::lock_guard<std::mutex> lock(stateMutex_);
        status_ = SessionStatus{};
        status_.running = true;
        status_.currentDevice = deviceId;
        status_.debug.activity = config_.startInStandby ? detection::Activity::Standby
                                                         : detection::Activity::Active;
    }
    {
        std::lock_guard<std::mutex> lock(waitMutex_);
        stopRequested_.store(false);
    }
    running_.store(true);

    LOG_INFO("Starting detection session on device {}", deviceId);
    publishStatus();
    loopThread_ = std::thread(&SessionManager::runLoop, this, deviceId);
    return true;
}

bool SessionManager::stop() {
    std::lock_guard<std::mutex> lifecycle(lifecycleMutex_);
    if (!running_.load()) {
        joinStaleThread();
        return false;
    }

    LOG_INFO("Stopping detection session");
    {
        std::lock_guard<std::mutex> lock(waitMutex_);
        stopRequested_.store(true);
    }
    waitCv_.notify_all();
    if (loopThread_.joinable()) {
        loopThread_.join();
    }

    running_.store(false);
    {
        std::lock_guard<std::mutex> lock(stateMutex_);
        status_.running = false;
        status_.currentTrack.reset();
    }
    listeners_.notifyTrackChanged(std::nullopt);
    publishStatus();
    LOG_INFO("Detection session stopped");
    return true;
}

SessionStatus SessionManager::status() const {
    std::lock_guard<std::mutex> lock(stateMutex_);
    return status_;
}

void SessionManager::joinStaleThread() {
    // A loop that ended on a fatal error has exited but is still joinable
    if (loopThread_.joinable()) {
        loopThread_.join();
    }
}

void SessionManager::runLoop(int deviceId) {
    audio::AudioSource& source = *deps_.source;
    SourceCloser closer(source);

    try {
        source.open(deviceId);
    } catch (const DeviceError& e) {
        endWithFatal(fmt::format("Failed to open audio device {}: {}", deviceId, e.what()));
        return;
    }

    LoopState loop;
    loop.deviceId = deviceId;
    loop.activity.activity =
        config_.startInStandby ? detection::Activity::Standby : detection::Activity::Active;

    while (!cancelRequested()) {
        try {
            runCycle(loop);
        } catch (const DeviceError& e) {
            if (cancelRequested()) {
                break;
            }
            recordError(e.what());
            if (e.kind() == DeviceError::Kind::StreamClosed) {
                LOG_WARN("Audio stream closed: {}. Reopening device {}", e.what(), deviceId);
                try {
                    recoverStream(deviceId);
                } catch (const FatalSessionError& fatal) {
                    endWithFatal(fatal.what());
                    return;
                }
            } else {
                LOG_ERROR("Audio device error [{}]: {}", errorCodeToString(e.code()), e.what());
            }
            waitFor(config_.errorBackoff);
        } catch (const FatalSessionError& e) {
            endWithFatal(e.what());
            return;
        } catch (const std::exception& e) {
            LOG_ERROR("Detection cycle failed: {}", e.what());
            recordError(e.what());
            waitFor(config_.errorBackoff);
        }
    }
    LOG_DEBUG("Run loop exiting on device {}", deviceId);
}

void SessionManager::runCycle(LoopState& loop) {
    audio::AudioSource& source = *deps_.source;

    audio::PcmBuffer levelSample =
        audio::captureFrames(source, framesFor(config_.levelCheckDuration), config_.chunkFrames);
    detection::LevelReading reading = levelMonitor_.update(loop.activity, levelSample);
    loop.activity = reading.state;

    {
        std::lock_guard<std::mutex> lock(stateMutex_);
        status_.debug.audioLevel = reading.metric;
        status_.debug.activity = reading.state.activity;
        if (reading.transitioned && !reading.state.isStandby()) {
            status_.debug.wakeCount++;
        }
    }

    if (loop.activity.isStandby()) {
        LOG_EVERY_N(DEBUG, 10, "Standby: level {:.4f}, polling every {} ms", reading.metric,
                    config_.standbyPoll.count());
        publishStatus();
        waitFor(config_.standbyPoll);
        return;
    }

    noteDetectionAttempt();
    std::optional<detection::Track> track = identify();
    if (cancelRequested()) {
        return;
    }

    bool clearOnMiss = false;
    if (track) {
        loop.noMatchStreak = 0;
    } else {
        loop.noMatchStreak++;
        LOG_DEBUG("No consistent match (streak {})", loop.noMatchStreak);
        if (fallback_.shouldRun(loop.noMatchStreak)) {
            LOG_DEBUG("Running aggressive detection after {} misses", loop.noMatchStreak);
            track = fallback_.run(
                [this] {
                    noteDetectionAttempt();
                    return identify();
                },
                [this](std::chrono::milliseconds d) { return waitFor(d); });
            if (cancelRequested()) {
                return;
            }
            if (track) {
                loop.noMatchStreak = 0;
            } else {
                clearOnMiss = true;
            }
        }
    }

    {
        std::lock_guard<std::mutex> lock(stateMutex_);
        status_.debug.noMatchStreak = loop.noMatchStreak;
    }
    applyIdentification(loop, track, clearOnMiss);

    publishStatus();
    waitFor(config_.cycleInterval);
}

std::optional<detection::Track> SessionManager::identify() {
    const size_t clipFrames = framesFor(config_.recordDuration);
    auto sample = [this, clipFrames](int /*attempt*/) -> std::optional<detection::RecognitionResult> {
        if (cancelRequested()) {
            throw RecognitionError("Session stopping", ErrorCode::RECOGNITION_CANCELLED);
        }
        audio::PcmBuffer clip =
            audio::captureFrames(*deps_.source, clipFrames, config_.chunkFrames);

        detection::CallOptions options;
        options.timeout = config_.recognitionTimeout;
        options.cancelRequested = [this] { return cancelRequested(); };
        return deps_.recognizer->identify(clip, options);
    };
    return consistency_.run(sample, [this](std::chrono::milliseconds d) { return waitFor(d); });
}

void SessionManager::applyIdentification(LoopState& loop,
                                         const std::optional<detection::Track>& track,
                                         bool clearOnMiss) {
    if (!track && !clearOnMiss) {
        return;  // Keep the current track until the fallback gives up too
    }

    auto now = std::chrono::system_clock::now();
    detection::DedupOutcome outcome = dedup_.process(track, loop.lastReported, now);
    loop.lastReported = outcome.lastReported;
    if (!outcome.error.empty()) {
        recordError(outcome.error);
    }

    // Only the run loop writes currentTrack, so the lookup may run unlocked
    std::optional<detection::Track> reported = track;
    if (track && config_.fetchTrackInfo && !detection::sameTrack(status().currentTrack, track)) {
        reported = withTrackInfo(*track);
    }

    bool changed = false;
    std::optional<detection::Track> current;
    {
        std::lock_guard<std::mutex> lock(stateMutex_);
        if (!detection::sameTrack(status_.currentTrack, reported)) {
            status_.currentTrack = reported;
            changed = true;
        }
        current = status_.currentTrack;
    }

    if (changed) {
        if (current) {
            LOG_DEBUG("Current track changed: {} by {}", current->title(), current->artist());
        } else {
            LOG_DEBUG("Current track cleared");
        }
        listeners_.notifyTrackChanged(current);
    }
}

detection::Track SessionManager::withTrackInfo(const detection::Track& track) {
    std::string error;
    std::optional<detection::TrackInfo> info;
    try {
        info = deps_.sink->lookupTrackInfo(track.artist(), track.title(), error);
    } catch (const SinkError& e) {
        error = e.what();
    }
    if (!info) {
        if (!error.empty()) {
            LOG_WARN("Track info for {} by {} unavailable: {}", track.title(), track.artist(),
                     error);
        }
        return track;
    }
    return track.withInfo(std::move(*info));
}

// Counts recognition attempts, matched or not
void SessionManager::noteDetectionAttempt() {
    std::lock_guard<std::mutex> lock(stateMutex_);
    status_.debug.detectionCount++;
    status_.debug.lastDetectionAt = std::chrono::system_clock::now();
}

void SessionManager::recoverStream(int deviceId) {
    audio::AudioSource& source = *deps_.source;
    source.close();

    for (int attempt = 1; attempt <= config_.maxReopenAttempts; ++attempt) {
        if (cancelRequested()) {
            return;
        }
        try {
            source.open(deviceId);
            LOG_INFO("Reopened audio device {} (attempt {})", deviceId, attempt);
            return;
        } catch (const DeviceError& e) {
            LOG_WARN("Reopen attempt {}/{} for device {} failed: {}", attempt,
                     config_.maxReopenAttempts, deviceId, e.what());
        }
        if (!waitFor(config_.errorBackoff)) {
            return;
        }
    }

    throw FatalSessionError(fmt::format("Audio device {} could not be reopened after {} attempts",
                                        deviceId, config_.maxReopenAttempts),
                            ErrorCode::SESSION_REOPEN_EXHAUSTED);
}

void SessionManager::endWithFatal(const std::string& message) {
    LOG_ERROR("Session ended: {}", message);
    deps_.source->close();

    bool hadTrack = false;
    {
        std::lock_guard<std::mutex> lock(stateMutex_);
        status_.running = false;
        hadTrack = status_.currentTrack.has_value();
        status_.currentTrack.reset();
        status_.debug.lastError = message;
    }
    running_.store(false);

    if (hadTrack) {
        listeners_.notifyTrackChanged(std::nullopt);
    }
    publishStatus();
}

bool SessionManager::waitFor(std::chrono::milliseconds duration) {
    std::unique_lock<std::mutex> lock(waitMutex_);
    if (duration.count() > 0) {
        waitCv_.wait_for(lock, duration, [this] { return stopRequested_.load(); });
    }
    return !stopRequested_.load();
}

size_t SessionManager::framesFor(std::chrono::milliseconds duration) const {
    // The granted device rate wins over the configured one
    uint32_t rate = deps_.source->sampleRate();
    if (rate == 0) {
        rate = config_.sampleRate;
    }
    auto frames = static_cast<size_t>(static_cast<uint64_t>(rate) *
                                      static_cast<uint64_t>(duration.count()) / 1000);
    return frames == 0 ? 1 : frames;
}

void SessionManager::recordError(const std::string& message) {
    std::lock_guard<std::mutex> lock(stateMutex_);
    status_.debug.lastError = message;
}

void SessionManager::publishStatus() {
    SessionStatus snapshot;
    {
        std::lock_guard<std::mutex> lock(stateMutex_);
        status_.debug.listenerDrops = listeners_.droppedEvents();
        status_.debug.listenerFailures = listeners_.listenerFailures();
        snapshot = status_;
    }
    listeners_.notifyStatusChanged(snapshot);
}

}  // namespace session
}  // namespace needledrop
