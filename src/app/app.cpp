#include "app/app.h"

#include "core/daemon_constants.h"
#include "daemon/control/control_plane.h"
#include "daemon/ipc/zmq_recognition_client.h"
#include "daemon/ipc/zmq_scrobble_sink.h"
#include "detection/scrobble_sink.h"
#include "logging/logger.h"

#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <memory>
#include <thread>

namespace needledrop {
namespace app {

namespace {

std::atomic<bool> gStopRequested{false};

void handleSignal(int /*signum*/) {
    gStopRequested.store(true);
}

std::chrono::milliseconds ms(int value) {
    return std::chrono::milliseconds(value);
}

}  // namespace

session::SessionConfig toSessionConfig(const AppConfig& config) {
    session::SessionConfig out;
    out.sampleRate = config.audio.sampleRate;
    out.chunkFrames = static_cast<size_t>(config.audio.chunkSize);
    out.recordDuration = ms(static_cast<int>(config.audio.recordSeconds * 1000.0));
    out.levelCheckDuration = ms(config.audio.levelCheckMs);

    out.level.metric = config.level.metric;
    out.level.silenceThreshold = config.level.silenceThreshold;
    out.level.activityThreshold = config.level.activityThreshold;
    out.level.activityWindow = config.level.activityWindow;
    out.level.standbyWindow = config.level.standbyWindow;
    out.startInStandby = config.level.startInStandby;
    out.standbyPoll = ms(config.level.standbyPollMs);

    out.consistency.checks = config.detection.consistencyChecks;
    out.consistency.threshold = config.detection.consistencyThreshold;
    out.consistency.confidenceThreshold = config.detection.confidenceThreshold;
    out.consistency.checkDelay = ms(config.detection.checkDelayMs);

    out.aggressive.triggerStreak = config.detection.noMatchStreakForFallback;
    out.aggressive.checkCount = config.aggressive.checkCount;
    out.aggressive.interval = ms(config.aggressive.intervalMs);

    out.cycleInterval = ms(config.detection.checkIntervalMs);
    out.recognitionTimeout = ms(config.recognition.timeoutMs);
    out.errorBackoff = ms(config.session.errorBackoffMs);
    out.maxReopenAttempts = config.session.maxReopenAttempts;
    out.listenerQueueCapacity = static_cast<size_t>(config.session.listenerQueueCapacity);
    out.fetchTrackInfo = config.scrobble.enabled && config.scrobble.trackInfo;
    return out;
}

std::optional<audio::AlsaAudioSource::SampleFormat> parseSampleFormat(std::string_view value) {
    if (value == "float32") {
        return audio::AlsaAudioSource::SampleFormat::FLOAT_LE;
    }
    if (value == "s32") {
        return audio::AlsaAudioSource::SampleFormat::S32_LE;
    }
    if (value == "s16") {
        return audio::AlsaAudioSource::SampleFormat::S16_LE;
    }
    return std::nullopt;
}

audio::AlsaAudioSource::Config toCaptureConfig(const AppConfig& config) {
    audio::AlsaAudioSource::Config out;
    out.sampleRate = config.audio.sampleRate;
    out.channels = config.audio.channels;
    out.format = parseSampleFormat(config.audio.sampleFormat)
                     .value_or(audio::AlsaAudioSource::SampleFormat::FLOAT_LE);
    out.periodFrames = static_cast<snd_pcm_uframes_t>(config.audio.chunkSize);
    return out;
}

std::unique_ptr<control::ControlPlane> startControlPlane(control::ControlPlaneDependencies deps) {
    auto plane = std::make_unique<control::ControlPlane>(std::move(deps));
    if (!plane->start()) {
        return nullptr;
    }
    plane->attachEventPublisher();
    return plane;
}

App::App(Options options) : options_(std::move(options)) {}

int App::listDevices() const {
    auto devices = audio::AlsaAudioSource::listCaptureDevices();
    if (devices.empty()) {
        std::cout << "No capture devices found" << std::endl;
        return 1;
    }
    std::cout << "Available capture devices:" << std::endl;
    for (const auto& device : devices) {
        std::cout << "  [" << device.index << "] " << device.name;
        if (!device.description.empty()) {
            std::cout << " - " << device.description;
        }
        std::cout << std::endl;
    }
    return 0;
}

int App::run() {
    logging::initializeEarly();

    if (options_.listDevices) {
        return listDevices();
    }

    AppConfig config;
    loadAppConfig(options_.configPath, config, true);
    std::string error;
    if (!validateAppConfig(config, error)) {
        LOG_ERROR("Config: {}", error);
        return 1;
    }

    logging::LogConfig logConfig = config.logging;
    if (options_.logLevel) {
        logConfig.level = *options_.logLevel;
    }
    if (options_.verbose && logConfig.level > logging::LogLevel::Debug) {
        logConfig.level = logging::LogLevel::Debug;
    }
    logging::initialize(logConfig);
    if (options_.controlEndpoint) {
        config.control.endpoint = *options_.controlEndpoint;
    }

    std::optional<int> device = options_.device;
    if (!device) {
        auto devices = audio::AlsaAudioSource::listCaptureDevices();
        device = audio::AlsaAudioSource::chooseDefaultDevice(devices);
        if (device) {
            LOG_INFO("Auto-selected capture device [{}]", *device);
        }
    }
    if (!device && !config.control.enabled) {
        LOG_ERROR("No capture device available (see --list-devices)");
        return 1;
    }

    audio::AlsaAudioSource source(toCaptureConfig(config));
    ipc::ZmqRecognitionClient recognizer(config.recognition.endpoint);
    std::unique_ptr<detection::ScrobbleSink> sink;
    if (config.scrobble.enabled) {
        sink = std::make_unique<ipc::ZmqScrobbleSink>(config.scrobble.endpoint,
                                                      ms(config.scrobble.timeoutMs));
    } else {
        sink = std::make_unique<detection::LoggingScrobbleSink>();
    }

    auto session = std::make_unique<session::SessionManager>(
        session::SessionDependencies{&source, &recognizer, sink.get()}, toSessionConfig(config));
    session->addTrackListener("console", [](const std::optional<detection::Track>& track) {
        if (track) {
            LOG_INFO("Now playing: {} by {}", track->title(), track->artist());
        }
    });

    std::unique_ptr<control::ControlPlane> controlPlane;
    if (config.control.enabled) {
        control::ControlPlaneDependencies deps;
        deps.session = session.get();
        deps.endpoint = config.control.endpoint;
        deps.listDevices = [] { return audio::AlsaAudioSource::listCaptureDevices(); };
        deps.defaultDevice = [] {
            return audio::AlsaAudioSource::chooseDefaultDevice(
                audio::AlsaAudioSource::listCaptureDevices());
        };
        controlPlane = startControlPlane(std::move(deps));
        if (!controlPlane) {
            LOG_WARN("Control plane unavailable on {}, continuing without it",
                     config.control.endpoint);
        }
    }

    std::signal(SIGINT, handleSignal);
    std::signal(SIGTERM, handleSignal);

    if (device) {
        if (!session->start(*device)) {
            LOG_WARN("Session on device {} was already running", *device);
        }
    } else {
        LOG_WARN("No capture device found; waiting for START on the control plane");
    }

    int exitCode = 0;
    while (!gStopRequested.load()) {
        if (!controlPlane && !session->isRunning()) {
            auto lastError = session->status().debug.lastError;
            LOG_ERROR("Session ended: {}", lastError.value_or("unknown error"));
            exitCode = 1;
            break;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }

    LOG_INFO("Shutting down");
    session->stop();
    session->waitForListeners(ms(DaemonConstants::LISTENER_DRAIN_TIMEOUT_MS));
    // Listener threads reference the control plane, so they go first
    session.reset();
    controlPlane.reset();
    logging::shutdown();
    return exitCode;
}

}  // namespace app
}  // namespace needledrop
