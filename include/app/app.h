#pragma once

#include "app/options.h"
#include "audio/alsa_audio_source.h"
#include "core/config_loader.h"
#include "daemon/control/control_plane.h"
#include "session/session_manager.h"

#include <memory>
#include <optional>
#include <string_view>

namespace needledrop {
namespace app {

session::SessionConfig toSessionConfig(const AppConfig& config);

// "float32" | "s32" | "s16"
std::optional<audio::AlsaAudioSource::SampleFormat> parseSampleFormat(std::string_view value);

audio::AlsaAudioSource::Config toCaptureConfig(const AppConfig& config);

/**
 * @brief Bind the control plane and only then hook it into the session.
 *
 * Returns nullptr when the endpoint cannot be bound; the session is left
 * without any listener pointing at the discarded plane.
 */
std::unique_ptr<control::ControlPlane> startControlPlane(control::ControlPlaneDependencies deps);

/**
 * @brief The needledrop daemon: config, adapters, session and control plane.
 *
 * Runs until SIGINT/SIGTERM. Without a control plane the process also ends
 * when the session stops on a fatal error.
 */
class App {
   public:
    explicit App(Options options);

    int run();

   private:
    int listDevices() const;

    Options options_;
};

}  // namespace app
}  // namespace needledrop
