#include "connection.hpp"
#include "util.hpp"

namespace chatrelay {

Connection::Connection(size_t capacity)
    : id_(generate_id()), capacity_(capacity == 0 ? 1 : capacity) {}

std::string Connection::stream_id() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return stream_id_;
}

void Connection::set_stream_id(const std::string& stream_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    stream_id_ = stream_id;
}

bool Connection::try_push(StreamEvent event) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (closed_ || live_pending_ >= capacity_) return false;
    queue_.push_back(Entry{std::move(event), true});
    live_pending_++;
    cv_.notify_one();
    return true;
}

void Connection::push_backlog(StreamEvent event) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (closed_) return;
    queue_.push_back(Entry{std::move(event), false});
    cv_.notify_one();
}

void Connection::push_terminal(StreamEvent event) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (closed_) return;
    queue_.push_back(Entry{std::move(event), false});
    closed_ = true;
    cv_.notify_all();
}

std::optional<StreamEvent> Connection::next(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait_for(lock, timeout, [&] { return !queue_.empty() || closed_; });
    if (queue_.empty()) return std::nullopt;

    Entry entry = std::move(queue_.front());
    queue_.pop_front();
    if (entry.live) live_pending_--;
    return std::move(entry.event);
}

void Connection::close() {
    std::lock_guard<std::mutex> lock(mutex_);
    closed_ = true;
    cv_.notify_all();
}

bool Connection::closed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return closed_;
}

bool Connection::finished() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return closed_ && queue_.empty();
}

size_t Connection::pending() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return live_pending_;
}

} // namespace chatrelay
