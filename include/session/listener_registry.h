#pragma once

#include "detection/track.h"
#include "logging/logger.h"
#include "session/session_status.h"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <exception>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <utility>
#include <vector>

namespace needledrop {
namespace session {

/**
 * @brief One listener behind a bounded queue drained by its own thread.
 *
 * post() never blocks the caller. When the queue is full the oldest
 * pending event is discarded and counted, so a slow listener only ever
 * loses stale updates. Exceptions thrown by the callback are logged and
 * counted; they never reach the poster.
 */
template <typename Event>
class ListenerChannel {
   public:
    using Callback = std::function<void(const Event&)>;

    ListenerChannel(std::string name, Callback callback, size_t capacity)
        : name_(std::move(name)),
          callback_(std::move(callback)),
          capacity_(capacity == 0 ? 1 : capacity),
          worker_(&ListenerChannel::workerLoop, this) {}

    ~ListenerChannel() {
        stop();
    }

    ListenerChannel(const ListenerChannel&) = delete;
    ListenerChannel& operator=(const ListenerChannel&) = delete;

    // Returns false when an older event had to be dropped to make room
    bool post(Event event) {
        bool dropped = false;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (stopping_) {
                return true;
            }
            if (queue_.size() >= capacity_) {
                queue_.pop_front();
                dropped = true;
            }
            queue_.push_back(std::move(event));
        }
        cv_.notify_one();

        if (dropped) {
            uint64_t total = ++dropped_;
            LOG_WARN("Listener '{}' queue full (capacity {}), dropped oldest event (total {})",
                     name_, capacity_, total);
        }
        return !dropped;
    }

    // Wait until every posted event has been delivered
    bool waitIdle(std::chrono::milliseconds timeout) {
        std::unique_lock<std::mutex> lock(mutex_);
        return idleCv_.wait_for(lock, timeout, [this] { return queue_.empty() && !busy_; });
    }

    // Delivers what is already queued, then joins the worker
    void stop() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (stopping_) {
                return;
            }
            stopping_ = true;
        }
        cv_.notify_all();
        if (worker_.joinable()) {
            worker_.join();
        }
    }

    const std::string& name() const {
        return name_;
    }
    uint64_t dropped() const {
        return dropped_.load();
    }
    uint64_t failures() const {
        return failures_.load();
    }

   private:
    void workerLoop() {
        std::unique_lock<std::mutex> lock(mutex_);
        while (true) {
            cv_.wait(lock, [this] { return stopping_ || !queue_.empty(); });
            if (queue_.empty()) {
                break;  // stopping and drained
            }
            Event event = std::move(queue_.front());
            queue_.pop_front();
            busy_ = true;
            lock.unlock();

            deliver(event);

            lock.lock();
            busy_ = false;
            if (queue_.empty()) {
                idleCv_.notify_all();
            }
        }
        idleCv_.notify_all();
    }

    void deliver(const Event& event) {
        try {
            callback_(event);
        } catch (const std::exception& e) {
            ++failures_;
            LOG_WARN("Listener '{}' threw: {}", name_, e.what());
        } catch (...) {
            ++failures_;
            LOG_WARN("Listener '{}' threw a non-standard exception", name_);
        }
    }

    std::string name_;
    Callback callback_;
    size_t capacity_;

    std::mutex mutex_;
    std::condition_variable cv_;
    std::condition_variable idleCv_;
    std::deque<Event> queue_;
    bool stopping_ = false;
    bool busy_ = false;

    std::atomic<uint64_t> dropped_{0};
    std::atomic<uint64_t> failures_{0};

    // Last member: the thread starts once everything above is constructed
    std::thread worker_;
};

/**
 * @brief Track and status listeners of a SessionManager.
 *
 * Registration is append-only. Track listeners receive the new current
 * track (nullopt when it was cleared); status listeners receive a copy of
 * the status snapshot.
 */
class ListenerRegistry {
   public:
    using TrackListener = std::function<void(const std::optional<detection::Track>&)>;
    using StatusListener = std::function<void(const SessionStatus&)>;

    explicit ListenerRegistry(size_t queueCapacity = 64) : queueCapacity_(queueCapacity) {}
    ~ListenerRegistry();

    ListenerRegistry(const ListenerRegistry&) = delete;
    ListenerRegistry& operator=(const ListenerRegistry&) = delete;

    void addTrackListener(std::string name, TrackListener listener);
    void addStatusListener(std::string name, StatusListener listener);

    void notifyTrackChanged(const std::optional<detection::Track>& track);
    void notifyStatusChanged(const SessionStatus& status);

    // Total events discarded because a listener queue was full
    uint64_t droppedEvents() const;
    uint64_t listenerFailures() const;

    size_t trackListenerCount() const;
    size_t statusListenerCount() const;

    // Wait until all listeners have drained their queues
    bool waitIdle(std::chrono::milliseconds timeout);

    // Drain and join every listener thread; later notifications are ignored
    void shutdown();

   private:
    using TrackChannel = ListenerChannel<std::optional<detection::Track>>;
    using StatusChannel = ListenerChannel<SessionStatus>;

    size_t queueCapacity_;
    mutable std::mutex mutex_;
    std::vector<std::unique_ptr<TrackChannel>> trackChannels_;
    std::vector<std::unique_ptr<StatusChannel>> statusChannels_;
    bool shutdown_ = false;
};

}  // namespace session
}  // namespace needledrop
