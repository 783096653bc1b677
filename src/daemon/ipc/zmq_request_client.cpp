#include "daemon/ipc/zmq_request_client.h"

#include "core/daemon_constants.h"
#include "logging/logger.h"

#include <algorithm>
#include <zmq.hpp>

namespace needledrop {
namespace ipc {

const char* requestOutcomeToString(RequestOutcome outcome) {
    switch (outcome) {
    case RequestOutcome::Ok:
        return "ok";
    case RequestOutcome::ErrorReply:
        return "error_reply";
    case RequestOutcome::Timeout:
        return "timeout";
    case RequestOutcome::Cancelled:
        return "cancelled";
    case RequestOutcome::Transport:
        return "transport";
    case RequestOutcome::BadReply:
        return "bad_reply";
    }
    return "transport";
}

namespace {

// Error fields of a reply, tolerating peers that send them untyped
std::string replyText(const nlohmann::json& reply, const char* key, const std::string& fallback) {
    auto it = reply.find(key);
    if (it == reply.end() || it->is_null()) {
        return fallback;
    }
    return it->is_string() ? it->get<std::string>() : it->dump();
}

}  // namespace

struct ZmqRequestClient::Impl {
    zmq::context_t context{1};
    std::unique_ptr<zmq::socket_t> socket;
};

ZmqRequestClient::ZmqRequestClient(std::string endpoint)
    : endpoint_(std::move(endpoint)), impl_(std::make_unique<Impl>()) {}

ZmqRequestClient::~ZmqRequestClient() {
    std::lock_guard<std::mutex> lock(mutex_);
    resetSocket();
}

void ZmqRequestClient::ensureSocket() {
    if (impl_->socket) {
        return;
    }
    impl_->socket = std::make_unique<zmq::socket_t>(impl_->context, zmq::socket_type::req);
    impl_->socket->set(zmq::sockopt::linger, 0);
    impl_->socket->connect(endpoint_);
}

void ZmqRequestClient::resetSocket() {
    if (!impl_->socket) {
        return;
    }
    try {
        impl_->socket->close();
    } catch (const zmq::error_t& e) {
        LOG_DEBUG("IPC: closing socket to {} failed: {}", endpoint_, e.what());
    }
    impl_->socket.reset();
}

RequestResult ZmqRequestClient::request(const nlohmann::json& command,
                                        std::chrono::milliseconds timeout,
                                        const std::function<bool()>& cancelled) {
    std::lock_guard<std::mutex> lock(mutex_);
    RequestResult result;

    auto isCancelled = [&cancelled] { return cancelled && cancelled(); };
    if (isCancelled()) {
        result.outcome = RequestOutcome::Cancelled;
        result.message = "Cancelled before send";
        return result;
    }

    try {
        ensureSocket();
        auto sent = impl_->socket->send(zmq::buffer(command.dump()), zmq::send_flags::dontwait);
        if (!sent) {
            resetSocket();
            result.outcome = RequestOutcome::Transport;
            result.message = "Peer not accepting requests at " + endpoint_;
            return result;
        }

        const auto deadline = std::chrono::steady_clock::now() + timeout;
        const auto slice = std::chrono::milliseconds(DaemonConstants::IPC_POLL_SLICE_MS);
        while (true) {
            if (isCancelled()) {
                resetSocket();
                result.outcome = RequestOutcome::Cancelled;
                result.message = "Cancelled while waiting for reply";
                return result;
            }
            auto now = std::chrono::steady_clock::now();
            if (now >= deadline) {
                resetSocket();
                result.outcome = RequestOutcome::Timeout;
                result.message = "No reply from " + endpoint_ + " within " +
                                 std::to_string(timeout.count()) + " ms";
                return result;
            }

            auto wait = std::min(slice, std::chrono::duration_cast<std::chrono::milliseconds>(
                                            deadline - now));
            zmq::pollitem_t items[] = {{impl_->socket->handle(), 0, ZMQ_POLLIN, 0}};
            zmq::poll(items, 1, wait);
            if (items[0].revents & ZMQ_POLLIN) {
                break;
            }
        }

        zmq::message_t reply;
        if (!impl_->socket->recv(reply, zmq::recv_flags::dontwait)) {
            resetSocket();
            result.outcome = RequestOutcome::Transport;
            result.message = "Reply vanished after poll";
            return result;
        }

        std::string body(static_cast<const char*>(reply.data()), reply.size());
        nlohmann::json parsed = nlohmann::json::parse(body, nullptr, false);
        if (parsed.is_discarded() || !parsed.is_object() || !parsed.contains("status") ||
            !parsed["status"].is_string()) {
            result.outcome = RequestOutcome::BadReply;
            result.message = "Malformed reply: " + body.substr(0, 200);
            return result;
        }

        if (parsed["status"] == "ok") {
            result.outcome = RequestOutcome::Ok;
            result.data = parsed.contains("data") ? parsed["data"] : nlohmann::json(nullptr);
        } else {
            result.outcome = RequestOutcome::ErrorReply;
            result.errorCode = replyText(parsed, "error_code", "");
            result.message = replyText(parsed, "message", "error");
        }
        return result;
    } catch (const zmq::error_t& e) {
        resetSocket();
        result.outcome = RequestOutcome::Transport;
        result.message = std::string("ZeroMQ error: ") + e.what();
        return result;
    }
}

}  // namespace ipc
}  // namespace needledrop
