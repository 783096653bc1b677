#include "daemon/control/zmq_server.h"

#include "core/error_codes.h"
#include "logging/logger.h"

#include <cstdio>
#include <zmq.hpp>

namespace needledrop {
namespace ipc {
namespace {

constexpr const char* kShutdownToken = "__NEEDLEDROP_SHUTDOWN__";

bool startsWith(const std::string& value, const std::string& prefix) {
    return value.rfind(prefix, 0) == 0;
}

}  // namespace

nlohmann::json ZmqRequest::params() const {
    if (json && json->contains("params") && (*json)["params"].is_object()) {
        return (*json)["params"];
    }
    return nlohmann::json::object();
}

std::string buildOkResponse(const ZmqRequest& request, const std::string& message,
                            const nlohmann::json& data) {
    if (request.isJson) {
        nlohmann::json resp;
        resp["status"] = "ok";
        if (!message.empty()) {
            resp["message"] = message;
        }
        if (!data.is_null()) {
            resp["data"] = data;
        }
        return resp.dump();
    }
    if (!data.is_null()) {
        return "OK:" + data.dump();
    }
    return message.empty() ? "OK" : "OK:" + message;
}

std::string buildErrorResponse(const ZmqRequest& request, const std::string& code,
                               const std::string& message) {
    if (request.isJson) {
        nlohmann::json resp;
        resp["status"] = "error";
        resp["error_code"] = code;
        resp["message"] = message;
        return resp.dump();
    }
    return "ERR:" + message;
}

std::string buildErrorResponse(const ZmqRequest& request, ErrorCode code,
                               const std::string& message) {
    if (!request.isJson) {
        return buildErrorResponse(request, errorCodeToString(code), message);
    }
    nlohmann::json resp = nlohmann::json::parse(
        buildErrorResponse(request, errorCodeToString(code), message));
    resp["inner_error"] = {{"cpp_code", errorCodeToHex(code)},
                           {"category", getErrorCategory(code)}};
    return resp.dump();
}

ZmqCommandServer::ZmqCommandServer(std::string endpoint, int recvTimeoutMs)
    : endpoint_(std::move(endpoint)),
      pubEndpoint_(derivePubEndpoint(endpoint_)),
      recvTimeoutMs_(recvTimeoutMs) {}

ZmqCommandServer::~ZmqCommandServer() {
    stop();
}

void ZmqCommandServer::registerCommand(const std::string& command, Handler handler) {
    handlers_[command] = std::move(handler);
}

bool ZmqCommandServer::start() {
    if (running_.load()) {
        return true;
    }

    try {
        context_ = std::make_unique<zmq::context_t>(1);
        repSocket_ = std::make_unique<zmq::socket_t>(*context_, zmq::socket_type::rep);
        repSocket_->set(zmq::sockopt::rcvtimeo, recvTimeoutMs_);
        repSocket_->set(zmq::sockopt::linger, 0);
        cleanupIpcPath(endpoint_);
        repSocket_->bind(endpoint_);

        pubSocket_ = std::make_unique<zmq::socket_t>(*context_, zmq::socket_type::pub);
        pubSocket_->set(zmq::sockopt::linger, 0);
        cleanupIpcPath(pubEndpoint_);
        pubSocket_->bind(pubEndpoint_);

        bindFailed_.store(false);
        running_.store(true);
        serverThread_ = std::thread(&ZmqCommandServer::serverLoop, this);

        LOG_INFO("Control: listening on {} (events on {})", endpoint_, pubEndpoint_);
        return true;
    } catch (const zmq::error_t& e) {
        LOG_ERROR("Control: failed to bind {}: {}", endpoint_, e.what());
        bindFailed_.store(true);
        running_.store(false);
        cleanupSockets();
        return false;
    }
}

void ZmqCommandServer::stop() {
    if (!running_.exchange(false)) {
        return;
    }

    // Wake the blocking recv so the loop sees running_ == false promptly
    try {
        zmq::context_t wakeCtx{1};
        zmq::socket_t wake{wakeCtx, zmq::socket_type::req};
        wake.set(zmq::sockopt::linger, 0);
        wake.connect(endpoint_);
        (void)wake.send(zmq::buffer(std::string(kShutdownToken)), zmq::send_flags::dontwait);
    } catch (const zmq::error_t& e) {
        LOG_DEBUG("Control: wake-up send failed ({}), waiting for recv timeout", e.what());
    }

    if (serverThread_.joinable()) {
        serverThread_.join();
    }

    cleanupSockets();
    cleanupIpcPath(endpoint_);
    cleanupIpcPath(pubEndpoint_);
}

bool ZmqCommandServer::publish(const std::string& message) {
    std::lock_guard<std::mutex> lock(pubMutex_);
    if (!pubSocket_) {
        return false;
    }
    try {
        auto sent = pubSocket_->send(zmq::buffer(message), zmq::send_flags::dontwait);
        return sent.has_value();
    } catch (const zmq::error_t& e) {
        LOG_WARN("Control: PUB send failed: {}", e.what());
        return false;
    }
}

ZmqRequest ZmqCommandServer::parseRequest(const std::string& raw) {
    ZmqRequest request;
    request.raw = raw;
    if (raw.empty()) {
        return request;
    }

    if (raw.front() == '{') {
        request.isJson = true;
        try {
            request.json = nlohmann::json::parse(raw);
            if (request.json->contains("cmd") && (*request.json)["cmd"].is_string()) {
                request.command = (*request.json)["cmd"].get<std::string>();
            }
        } catch (const nlohmann::json::exception& e) {
            request.parseError = e.what();
        }
        return request;
    }

    std::string text = raw.substr(0, raw.find('\0'));
    auto colon = text.find(':');
    if (colon == std::string::npos) {
        request.command = text;
    } else {
        request.command = text.substr(0, colon);
        request.payload = text.substr(colon + 1);
    }
    return request;
}

std::string ZmqCommandServer::dispatch(const ZmqRequest& request) {
    if (!request.parseError.empty()) {
        return buildErrorResponse(request, ErrorCode::IPC_PROTOCOL_ERROR,
                                  "JSON parse error: " + request.parseError);
    }

    auto it = handlers_.find(request.command);
    if (it == handlers_.end()) {
        std::string name = request.command.empty() ? "<empty>" : request.command;
        return buildErrorResponse(request, ErrorCode::IPC_INVALID_COMMAND,
                                  "Unknown command: " + name);
    }

    try {
        return it->second(request);
    } catch (const std::exception& e) {
        LOG_ERROR("Control: handler for {} threw: {}", request.command, e.what());
        return buildErrorResponse(request, ErrorCode::INTERNAL_UNKNOWN,
                                  std::string("Handler exception: ") + e.what());
    }
}

void ZmqCommandServer::serverLoop() {
    while (running_.load()) {
        try {
            zmq::message_t message;
            auto received = repSocket_->recv(message, zmq::recv_flags::none);
            if (!received) {
                continue;  // rcvtimeo elapsed
            }

            std::string raw(static_cast<const char*>(message.data()), message.size());
            std::string reply =
                raw == kShutdownToken ? std::string("OK") : dispatch(parseRequest(raw));
            (void)repSocket_->send(zmq::buffer(reply), zmq::send_flags::none);
        } catch (const zmq::error_t& e) {
            if (running_.load()) {
                LOG_WARN("Control: socket error: {}", e.what());
            }
        }
    }
}

void ZmqCommandServer::cleanupSockets() {
    std::lock_guard<std::mutex> lock(pubMutex_);
    try {
        if (repSocket_) {
            repSocket_->close();
        }
        if (pubSocket_) {
            pubSocket_->close();
        }
    } catch (const zmq::error_t& e) {
        LOG_WARN("Control: socket close failed: {}", e.what());
    }
    repSocket_.reset();
    pubSocket_.reset();
    context_.reset();
}

void ZmqCommandServer::cleanupIpcPath(const std::string& endpoint) const {
    if (!startsWith(endpoint, "ipc://")) {
        return;
    }
    std::string path = endpoint.substr(6);
    if (!path.empty()) {
        std::remove(path.c_str());
    }
}

std::string ZmqCommandServer::derivePubEndpoint(const std::string& endpoint) {
    if (startsWith(endpoint, "tcp://")) {
        auto colon = endpoint.rfind(':');
        std::string port = colon == std::string::npos ? "" : endpoint.substr(colon + 1);
        if (!port.empty() && port.find_first_not_of("0123456789") == std::string::npos &&
            port.size() <= 5) {
            return endpoint.substr(0, colon + 1) + std::to_string(std::stoi(port) + 1);
        }
    }
    return endpoint + DaemonConstants::ZEROMQ_PUB_SUFFIX;
}

}  // namespace ipc
}  // namespace needledrop
