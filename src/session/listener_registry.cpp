#include "session/listener_registry.h"

namespace needledrop {
namespace session {

ListenerRegistry::~ListenerRegistry() {
    shutdown();
}

void ListenerRegistry::addTrackListener(std::string name, TrackListener listener) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (shutdown_) {
        LOG_WARN("Ignoring track listener '{}' registered after shutdown", name);
        return;
    }
    trackChannels_.push_back(
        std::make_unique<TrackChannel>(std::move(name), std::move(listener), queueCapacity_));
}

void ListenerRegistry::addStatusListener(std::string name, StatusListener listener) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (shutdown_) {
        LOG_WARN("Ignoring status listener '{}' registered after shutdown", name);
        return;
    }
    statusChannels_.push_back(
        std::make_unique<StatusChannel>(std::move(name), std::move(listener), queueCapacity_));
}

void ListenerRegistry::notifyTrackChanged(const std::optional<detection::Track>& track) {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto& channel : trackChannels_) {
        channel->post(track);
    }
}

void ListenerRegistry::notifyStatusChanged(const SessionStatus& status) {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto& channel : statusChannels_) {
        channel->post(status);
    }
}

uint64_t ListenerRegistry::droppedEvents() const {
    std::lock_guard<std::mutex> lock(mutex_);
    uint64_t total = 0;
    for (const auto& channel : trackChannels_) {
        total += channel->dropped();
    }
    for (const auto& channel : statusChannels_) {
        total += channel->dropped();
    }
    return total;
}

uint64_t ListenerRegistry::listenerFailures() const {
    std::lock_guard<std::mutex> lock(mutex_);
    uint64_t total = 0;
    for (const auto& channel : trackChannels_) {
        total += channel->failures();
    }
    for (const auto& channel : statusChannels_) {
        total += channel->failures();
    }
    return total;
}

size_t ListenerRegistry::trackListenerCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return trackChannels_.size();
}

size_t ListenerRegistry::statusListenerCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return statusChannels_.size();
}

bool ListenerRegistry::waitIdle(std::chrono::milliseconds timeout) {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    std::lock_guard<std::mutex> lock(mutex_);
    auto remaining = [&deadline] {
        auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now());
        return left.count() > 0 ? left : std::chrono::milliseconds(0);
    };
    for (auto& channel : trackChannels_) {
        if (!channel->waitIdle(remaining())) {
            return false;
        }
    }
    for (auto& channel : statusChannels_) {
        if (!channel->waitIdle(remaining())) {
            return false;
        }
    }
    return true;
}

void ListenerRegistry::shutdown() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (shutdown_) {
        return;
    }
    shutdown_ = true;
    for (auto& channel : trackChannels_) {
        channel->stop();
    }
    for (auto& channel : statusChannels_) {
        channel->stop();
    }
}

}  // namespace session
}  // namespace needledrop
