#pragma once

#include "core/error_codes.h"

#include "core/daemon_constants.h"

#include <atomic>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <thread>

namespace zmq {
class context_t;
class socket_t;
}  // namespace zmq

namespace needledrop {
namespace ipc {

/**
 * @brief One decoded control request.
 *
 * Two wire forms are accepted: JSON `{"cmd": "...", "params": {...}}`
 * and plain text `CMD` or `CMD:payload`. Replies mirror the request form.
 */
struct ZmqRequest {
    std::string raw;
    std::optional<nlohmann::json> json;
    std::string command;
    std::string payload;
    bool isJson = false;
    std::string parseError;

    // params object of a JSON request, or an empty object
    nlohmann::json params() const;
};

std::string buildOkResponse(const ZmqRequest& request, const std::string& message = "",
                            const nlohmann::json& data = nullptr);
std::string buildErrorResponse(const ZmqRequest& request, const std::string& code,
                               const std::string& message);

// JSON replies also carry inner_error {cpp_code: "0x4002", category: "session"}
std::string buildErrorResponse(const ZmqRequest& request, ErrorCode code,
                               const std::string& message);

/**
 * @brief REP command server with a companion PUB socket for events.
 *
 * Handlers run on the server thread, one request at a time. The PUB
 * endpoint is derived from the REP endpoint: ipc paths get a ".pub"
 * suffix, tcp endpoints use the next port.
 */
class ZmqCommandServer {
   public:
    using Handler = std::function<std::string(const ZmqRequest&)>;

    explicit ZmqCommandServer(std::string endpoint = DaemonConstants::CONTROL_IPC_PATH,
                              int recvTimeoutMs = 1000);
    ~ZmqCommandServer();

    ZmqCommandServer(const ZmqCommandServer&) = delete;
    ZmqCommandServer& operator=(const ZmqCommandServer&) = delete;

    // Register before start(); the handler table is not locked
    void registerCommand(const std::string& command, Handler handler);

    bool start();
    void stop();
    bool isRunning() const {
        return running_.load();
    }
    bool hasBindError() const {
        return bindFailed_.load();
    }

    bool publish(const std::string& message);
    const std::string& endpoint() const {
        return endpoint_;
    }
    const std::string& pubEndpoint() const {
        return pubEndpoint_;
    }

    static ZmqRequest parseRequest(const std::string& raw);
    static std::string derivePubEndpoint(const std::string& endpoint);

    // Exposed for tests: route a request through the handler table
    std::string dispatch(const ZmqRequest& request);

   private:
    void serverLoop();
    void cleanupSockets();
    void cleanupIpcPath(const std::string& endpoint) const;

    std::string endpoint_;
    std::string pubEndpoint_;
    int recvTimeoutMs_;
    std::unique_ptr<zmq::context_t> context_;
    std::unique_ptr<zmq::socket_t> repSocket_;
    std::unique_ptr<zmq::socket_t> pubSocket_;
    std::thread serverThread_;
    std::atomic<bool> running_{false};
    std::atomic<bool> bindFailed_{false};
    std::map<std::string, Handler> handlers_;
    mutable std::mutex pubMutex_;
};

}  // namespace ipc
}  // namespace needledrop
