#pragma once
#include "broadcaster.hpp"
#include "stream_event.hpp"
#include "stream_registry.hpp"
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

namespace chatrelay {

enum class CancelOutcome { Cancelled, NothingToCancel };

// Drives Streaming -> Cancelling -> Cancelled for user cancels and idle
// timeouts. Whoever wins the Streaming transition finalizes the stream;
// every other actor's attempt is a no-op.
class CancellationController {
public:
    CancellationController(StreamRegistry& registry, Broadcaster& broadcaster);

    // Cancel the active stream for key, if any.
    CancelOutcome cancel(const std::string& key,
                         CancelReason reason = CancelReason::UserCancelled);

    // Cancel this particular stream. False if it was no longer Streaming.
    bool cancel_stream(const std::shared_ptr<StreamSession>& session,
                       CancelReason reason);

    // Cancel (reason Timeout) every stream with no attached connection whose
    // last activity is older than threshold. Returns how many were cancelled.
    size_t sweep_idle(std::chrono::seconds threshold,
                      StreamSession::Clock::time_point now = StreamSession::Clock::now());

private:
    StreamRegistry& registry_;
    Broadcaster& broadcaster_;
};

// Background thread calling sweep_idle every interval.
class IdleSupervisor {
public:
    IdleSupervisor(CancellationController& controller,
                   std::chrono::seconds threshold,
                   std::chrono::milliseconds interval);
    ~IdleSupervisor();

    IdleSupervisor(const IdleSupervisor&) = delete;
    IdleSupervisor& operator=(const IdleSupervisor&) = delete;

    void start();

    // Wake the thread and join it. Safe to call more than once.
    void stop();

    bool running() const { return running_.load(); }

    // Time between sweeps; a zero interval is raised to one second.
    std::chrono::milliseconds interval() const { return interval_; }

    // Total streams cancelled by this supervisor
    size_t cancelled_count() const { return cancelled_.load(); }

private:
    void run();

    CancellationController& controller_;
    std::chrono::seconds threshold_;
    std::chrono::milliseconds interval_;

    std::mutex mutex_;
    std::condition_variable cv_;
    bool stop_requested_ = false;
    std::atomic<bool> running_{false};
    std::atomic<size_t> cancelled_{0};
    std::thread thread_;
};

} // namespace chatrelay
