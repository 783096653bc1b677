#pragma once

#include "audio/audio_source.h"
#include "daemon/control/zmq_server.h"
#include "session/session_manager.h"

#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace needledrop {
namespace control {

struct ControlPlaneDependencies {
    session::SessionManager* session = nullptr;
    std::string endpoint = DaemonConstants::CONTROL_IPC_PATH;

    std::function<std::vector<audio::CaptureDeviceInfo>()> listDevices;
    // Device used by START when the request names none
    std::function<std::optional<int>()> defaultDevice;
};

/**
 * @brief Remote control and live event stream for a SessionManager.
 *
 * Commands on the REP socket: PING, STATUS, START, STOP, DEVICES.
 * Events on the PUB socket: {"type":"status_update","data":status} for
 * every status change and {"type":"track_update","data":track} whenever a
 * new track is identified.
 */
class ControlPlane {
   public:
    explicit ControlPlane(ControlPlaneDependencies deps);
    ~ControlPlane();

    ControlPlane(const ControlPlane&) = delete;
    ControlPlane& operator=(const ControlPlane&) = delete;

    bool start();
    void stop();

    /**
     * @brief Register the PUB publisher as session listeners.
     *
     * Session listeners cannot be removed, so this refuses (returns false)
     * until start() has succeeded. Later calls are no-ops.
     */
    bool attachEventPublisher();

    const ipc::ZmqCommandServer& server() const {
        return *server_;
    }

    // Route one raw request without the socket (tests, local callers)
    std::string handleRaw(const std::string& raw);

    static nlohmann::json trackUpdateEvent(const detection::Track& track);
    static nlohmann::json statusUpdateEvent(const session::SessionStatus& status);

   private:
    void registerHandlers();
    void publish(const nlohmann::json& event);

    std::string handlePing(const ipc::ZmqRequest& request);
    std::string handleStatus(const ipc::ZmqRequest& request);
    std::string handleStart(const ipc::ZmqRequest& request);
    std::string handleStop(const ipc::ZmqRequest& request);
    std::string handleDevices(const ipc::ZmqRequest& request);

    ControlPlaneDependencies deps_;
    std::unique_ptr<ipc::ZmqCommandServer> server_;
    bool publisherAttached_ = false;
};

}  // namespace control
}  // namespace needledrop
