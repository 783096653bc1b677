#include "daemon/control/control_plane.h"

#include "core/error_codes.h"
#include "logging/logger.h"

#include <stdexcept>

namespace needledrop {
namespace control {

namespace {

std::string errorReply(const ipc::ZmqRequest& request, ErrorCode code,
                       const std::string& message) {
    return ipc::buildErrorResponse(request, code, message);
}

// device_index from JSON params, or the payload of "START:<n>"
std::optional<int> requestedDevice(const ipc::ZmqRequest& request, std::string& error) {
    if (request.isJson) {
        nlohmann::json params = request.params();
        if (!params.contains("device_index") || params["device_index"].is_null()) {
            return std::nullopt;
        }
        if (!params["device_index"].is_number_integer()) {
            error = "device_index must be an integer";
            return std::nullopt;
        }
        return params["device_index"].get<int>();
    }
    if (request.payload.empty()) {
        return std::nullopt;
    }
    try {
        size_t used = 0;
        int index = std::stoi(request.payload, &used);
        if (used == request.payload.size()) {
            return index;
        }
    } catch (const std::logic_error&) {
        // falls through to the error below
    }
    error = "device index must be an integer, got '" + request.payload + "'";
    return std::nullopt;
}

}  // namespace

ControlPlane::ControlPlane(ControlPlaneDependencies deps)
    : deps_(std::move(deps)), server_(std::make_unique<ipc::ZmqCommandServer>(deps_.endpoint)) {
    if (!deps_.session) {
        throw std::invalid_argument("ControlPlane requires a session manager");
    }
    registerHandlers();
}

ControlPlane::~ControlPlane() {
    stop();
}

bool ControlPlane::start() {
    return server_->start();
}

void ControlPlane::stop() {
    server_->stop();
}

void ControlPlane::registerHandlers() {
    server_->registerCommand("PING", [this](const ipc::ZmqRequest& r) { return handlePing(r); });
    server_->registerCommand("STATUS",
                             [this](const ipc::ZmqRequest& r) { return handleStatus(r); });
    server_->registerCommand("START", [this](const ipc::ZmqRequest& r) { return handleStart(r); });
    server_->registerCommand("STOP", [this](const ipc::ZmqRequest& r) { return handleStop(r); });
    server_->registerCommand("DEVICES",
                             [this](const ipc::ZmqRequest& r) { return handleDevices(r); });
}

std::string ControlPlane::handleRaw(const std::string& raw) {
    return server_->dispatch(ipc::ZmqCommandServer::parseRequest(raw));
}

bool ControlPlane::attachEventPublisher() {
    if (publisherAttached_) {
        return true;
    }
    if (!server_->isRunning()) {
        LOG_WARN("Control: not listening on {}, event publisher not attached", deps_.endpoint);
        return false;
    }
    publisherAttached_ = true;

    deps_.session->addTrackListener("control-track",
                                    [this](const std::optional<detection::Track>& track) {
                                        // Clearing is visible through status_update
                                        if (track) {
                                            publish(trackUpdateEvent(*track));
                                        }
                                    });
    deps_.session->addStatusListener("control-status",
                                     [this](const session::SessionStatus& status) {
                                         publish(statusUpdateEvent(status));
                                     });
    return true;
}

nlohmann::json ControlPlane::trackUpdateEvent(const detection::Track& track) {
    return {{"type", "track_update"}, {"data", session::trackToJson(track)}};
}

nlohmann::json ControlPlane::statusUpdateEvent(const session::SessionStatus& status) {
    return {{"type", "status_update"}, {"data", session::statusToJson(status)}};
}

void ControlPlane::publish(const nlohmann::json& event) {
    if (!server_->isRunning()) {
        return;
    }
    if (!server_->publish(event.dump())) {
        LOG_EVERY_N(WARN, 50, "Control: failed to publish {}", event.value("type", std::string()));
    }
}

std::string ControlPlane::handlePing(const ipc::ZmqRequest& request) {
    return ipc::buildOkResponse(request, "pong");
}

std::string ControlPlane::handleStatus(const ipc::ZmqRequest& request) {
    return ipc::buildOkResponse(request, "", session::statusToJson(deps_.session->status()));
}

std::string ControlPlane::handleStart(const ipc::ZmqRequest& request) {
    std::string error;
    std::optional<int> device = requestedDevice(request, error);
    if (!error.empty()) {
        return errorReply(request, ErrorCode::IPC_INVALID_PARAMS, error);
    }
    if (!device && deps_.defaultDevice) {
        device = deps_.defaultDevice();
    }
    if (!device) {
        return errorReply(request, ErrorCode::DEVICE_NOT_FOUND,
                          "No device_index given and no capture device available");
    }

    if (!deps_.session->start(*device)) {
        return errorReply(request, ErrorCode::SESSION_ALREADY_RUNNING,
                          "Detection is already running");
    }
    return ipc::buildOkResponse(request, "started", {{"device_index", *device}});
}

std::string ControlPlane::handleStop(const ipc::ZmqRequest& request) {
    if (!deps_.session->stop()) {
        return errorReply(request, ErrorCode::SESSION_NOT_RUNNING, "Detection is not running");
    }
    return ipc::buildOkResponse(request, "stopped");
}

std::string ControlPlane::handleDevices(const ipc::ZmqRequest& request) {
    nlohmann::json devices = nlohmann::json::array();
    if (deps_.listDevices) {
        for (const auto& device : deps_.listDevices()) {
            devices.push_back({{"index", device.index},
                               {"name", device.name},
                               {"description", device.description}});
        }
    }
    return ipc::buildOkResponse(request, "", {{"devices", devices}});
}

}  // namespace control
}  // namespace needledrop
