#pragma once

#include <atomic>
#include <chrono>
#include <cstdio>
#include <functional>
#include <mutex>
#include <nlohmann/json.hpp>
#include <optional>
#include <sstream>
#include <string>
#include <thread>
#include <unistd.h>
#include <vector>
#include <zmq.hpp>

namespace needledrop {
namespace testing_support {

inline std::string makeIpcEndpoint(const std::string& tag) {
    static std::atomic<int> counter{0};
    std::ostringstream oss;
    oss << "ipc:///tmp/needledrop_" << tag << "_" << ::getpid() << "_" << counter++ << ".sock";
    return oss.str();
}

/**
 * REP peer standing in for a recognizer or scrobbler process. The handler
 * returns the raw reply, or nullopt to leave the request unanswered.
 */
class FakeSidecar {
   public:
    using Handler = std::function<std::optional<std::string>(const nlohmann::json&)>;

    FakeSidecar(std::string endpoint, Handler handler)
        : endpoint_(std::move(endpoint)),
          handler_(std::move(handler)),
          socket_(context_, zmq::socket_type::rep) {
        socket_.set(zmq::sockopt::rcvtimeo, 20);
        socket_.set(zmq::sockopt::linger, 0);
        socket_.bind(endpoint_);
        thread_ = std::thread([this] { loop(); });
    }

    ~FakeSidecar() {
        running_ = false;
        thread_.join();
        socket_.close();
        std::remove(endpoint_.substr(6).c_str());
    }

    FakeSidecar(const FakeSidecar&) = delete;
    FakeSidecar& operator=(const FakeSidecar&) = delete;

    const std::string& endpoint() const {
        return endpoint_;
    }

    std::vector<nlohmann::json> requests() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return requests_;
    }

   private:
    void loop() {
        while (running_) {
            zmq::message_t message;
            auto received = socket_.recv(message, zmq::recv_flags::none);
            if (!received) {
                continue;
            }
            std::string body(static_cast<const char*>(message.data()), message.size());
            nlohmann::json request = nlohmann::json::parse(body, nullptr, false);
            {
                std::lock_guard<std::mutex> lock(mutex_);
                requests_.push_back(request);
            }
            std::optional<std::string> reply = handler_(request);
            if (!reply) {
                // Unanswered: a REP socket cannot receive again, so park here
                while (running_) {
                    std::this_thread::sleep_for(std::chrono::milliseconds(5));
                }
                return;
            }
            (void)socket_.send(zmq::buffer(*reply), zmq::send_flags::none);
        }
    }

    std::string endpoint_;
    Handler handler_;
    zmq::context_t context_{1};
    zmq::socket_t socket_;
    std::atomic<bool> running_{true};
    std::thread thread_;
    mutable std::mutex mutex_;
    std::vector<nlohmann::json> requests_;
};

}  // namespace testing_support
}  // namespace needledrop
