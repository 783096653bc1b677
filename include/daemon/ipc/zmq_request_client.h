#pragma once

#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <nlohmann/json.hpp>
#include <string>

namespace needledrop {
namespace ipc {

enum class RequestOutcome {
    Ok,           // status "ok"; data holds the reply's "data" field (may be null)
    ErrorReply,   // status "error"; errorCode/message from the reply
    Timeout,
    Cancelled,
    Transport,    // could not send or receive
    BadReply      // not JSON or no status field
};

const char* requestOutcomeToString(RequestOutcome outcome);

struct RequestResult {
    RequestOutcome outcome = RequestOutcome::Transport;
    std::string errorCode;
    std::string message;
    nlohmann::json data;

    bool ok() const {
        return outcome == RequestOutcome::Ok;
    }
};

/**
 * @brief Synchronous JSON request/reply over a ZeroMQ REQ socket.
 *
 * The reply is polled in short slices so that @p cancelled is observed
 * while a sidecar is still working. A REQ socket that gave up on a reply
 * cannot send again, so after a timeout, cancellation or transport error
 * the socket is dropped and a fresh one connects on the next request.
 * Requests are serialized; the client is safe to share between threads.
 */
class ZmqRequestClient {
   public:
    explicit ZmqRequestClient(std::string endpoint);
    ~ZmqRequestClient();

    ZmqRequestClient(const ZmqRequestClient&) = delete;
    ZmqRequestClient& operator=(const ZmqRequestClient&) = delete;

    RequestResult request(const nlohmann::json& command, std::chrono::milliseconds timeout,
                          const std::function<bool()>& cancelled = nullptr);

    const std::string& endpoint() const {
        return endpoint_;
    }

   private:
    struct Impl;

    void ensureSocket();
    void resetSocket();

    std::string endpoint_;
    std::unique_ptr<Impl> impl_;
    std::mutex mutex_;
};

}  // namespace ipc
}  // namespace needledrop
