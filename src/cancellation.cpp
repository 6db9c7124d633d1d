#include "cancellation.hpp"
#include <iostream>

namespace chatrelay {

CancellationController::CancellationController(StreamRegistry& registry,
                                               Broadcaster& broadcaster)
    : registry_(registry), broadcaster_(broadcaster) {}

CancelOutcome CancellationController::cancel(const std::string& key, CancelReason reason) {
    auto session = registry_.get(key);
    if (!session) return CancelOutcome::NothingToCancel;
    return cancel_stream(session, reason) ? CancelOutcome::Cancelled
                                          : CancelOutcome::NothingToCancel;
}

bool CancellationController::cancel_stream(const std::shared_ptr<StreamSession>& session,
                                           CancelReason reason) {
    if (!session->transition(StreamState::Streaming, StreamState::Cancelling)) {
        return false;
    }

    // Cooperative upstream abort; do not wait for the provider to notice.
    session->cancel_upstream();
    session->transition(StreamState::Cancelling, StreamState::Cancelled);

    size_t reached = broadcaster_.finish(*session, StreamEvent::cancelled(reason));
    registry_.end(session->session_key(), session->stream_id());

    std::cerr << "[cancel] Stream " << session->stream_id().substr(0, 8)
              << " for session " << session->session_key() << " cancelled ("
              << cancel_reason_to_string(reason) << ", " << session->chunk_count()
              << " chunks discarded, " << reached << " viewers notified)\n";
    return true;
}

size_t CancellationController::sweep_idle(std::chrono::seconds threshold,
                                          StreamSession::Clock::time_point now) {
    size_t cancelled = 0;
    for (const auto& session : registry_.active()) {
        if (session->state() != StreamState::Streaming) continue;
        if (session->connection_count() > 0) continue;
        if (now - session->last_activity() <= threshold) continue;
        if (cancel_stream(session, CancelReason::Timeout)) cancelled++;
    }
    return cancelled;
}

IdleSupervisor::IdleSupervisor(CancellationController& controller,
                               std::chrono::seconds threshold,
                               std::chrono::milliseconds interval)
    : controller_(controller), threshold_(threshold),
      interval_(interval.count() <= 0 ? std::chrono::milliseconds(1000) : interval) {}

IdleSupervisor::~IdleSupervisor() {
    stop();
}

void IdleSupervisor::start() {
    if (running_.exchange(true)) return;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stop_requested_ = false;
    }
    thread_ = std::thread([this]() { run(); });
}

void IdleSupervisor::stop() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stop_requested_ = true;
    }
    cv_.notify_all();
    if (thread_.joinable()) thread_.join();
    running_.store(false);
}

void IdleSupervisor::run() {
    std::unique_lock<std::mutex> lock(mutex_);
    while (!stop_requested_) {
        if (cv_.wait_for(lock, interval_, [this] { return stop_requested_; })) break;

        lock.unlock();
        size_t n = controller_.sweep_idle(threshold_);
        if (n > 0) {
            cancelled_ += n;
            std::cerr << "[supervisor] Cancelled " << n << " idle stream(s)\n";
        }
        lock.lock();
    }
}

} // namespace chatrelay
