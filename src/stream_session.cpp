#include "stream_session.hpp"
#include "errors.hpp"
#include "util.hpp"
#include <algorithm>

namespace chatrelay {

const char* stream_state_to_string(StreamState state) {
    switch (state) {
        case StreamState::Streaming: return "streaming";
        case StreamState::Cancelling: return "cancelling";
        case StreamState::Completed: return "completed";
        case StreamState::Cancelled: return "cancelled";
        case StreamState::Failed: return "failed";
    }
    return "unknown";
}

static bool valid_edge(StreamState from, StreamState to) {
    switch (from) {
        case StreamState::Streaming:
            return to == StreamState::Cancelling || to == StreamState::Completed ||
                   to == StreamState::Failed;
        case StreamState::Cancelling:
            return to == StreamState::Cancelled;
        case StreamState::Completed:
            return to == StreamState::Failed;
        case StreamState::Cancelled:
        case StreamState::Failed:
            return false;
    }
    return false;
}

StreamSession::StreamSession(std::string session_key, std::string model)
    : session_key_(std::move(session_key)),
      stream_id_(generate_id()),
      model_(std::move(model)),
      started_at_(Clock::now()),
      last_activity_(started_at_) {}

StreamState StreamSession::state() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_;
}

bool StreamSession::transition(StreamState from, StreamState to) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (state_ != from || !valid_edge(from, to)) return false;
    state_ = to;
    return true;
}

bool StreamSession::append(const std::string& chunk,
                           std::vector<std::shared_ptr<Connection>>& dropped) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (state_ != StreamState::Streaming) return false;

    chunks_.push_back(chunk);
    buffer_ += chunk;
    last_activity_ = Clock::now();

    auto it = connections_.begin();
    while (it != connections_.end()) {
        if ((*it)->try_push(StreamEvent::content(chunk))) {
            ++it;
            continue;
        }
        (*it)->push_terminal(StreamEvent::failure(kViewerDroppedMessage));
        dropped.push_back(*it);
        it = connections_.erase(it);
    }
    return true;
}

void StreamSession::attach(const std::shared_ptr<Connection>& conn,
                           size_t max_connections) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!terminal_ && max_connections > 0 && connections_.size() >= max_connections) {
        throw ConnectionLimitError("Too many connections to stream " + stream_id_);
    }

    conn->set_stream_id(stream_id_);
    for (const auto& chunk : chunks_) {
        conn->push_backlog(StreamEvent::content(chunk));
    }
    last_activity_ = Clock::now();

    if (terminal_) {
        conn->push_terminal(*terminal_);
        return;
    }
    connections_.push_back(conn);
}

bool StreamSession::detach(const Connection& conn) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = std::find_if(connections_.begin(), connections_.end(),
                           [&](const std::shared_ptr<Connection>& c) {
                               return c.get() == &conn;
                           });
    if (it == connections_.end()) return false;
    connections_.erase(it);
    return true;
}

size_t StreamSession::finish(const StreamEvent& terminal) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (terminal_) return 0;
    terminal_ = terminal;

    size_t reached = connections_.size();
    for (auto& conn : connections_) {
        conn->push_terminal(terminal);
    }
    connections_.clear();
    return reached;
}

std::optional<StreamEvent> StreamSession::terminal_event() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return terminal_;
}

void StreamSession::install_cancel(const CancelHandle& handle) {
    bool cancel_now = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        cancel_ = handle;
        cancel_now = state_ != StreamState::Streaming;
    }
    if (cancel_now) handle.cancel();
}

void StreamSession::cancel_upstream() {
    std::optional<CancelHandle> handle;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        handle = cancel_;
    }
    if (handle) handle->cancel();
}

void StreamSession::touch(Clock::time_point now) {
    std::lock_guard<std::mutex> lock(mutex_);
    last_activity_ = now;
}

StreamSession::Clock::time_point StreamSession::last_activity() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return last_activity_;
}

std::string StreamSession::buffer() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return buffer_;
}

std::vector<std::string> StreamSession::chunks() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return chunks_;
}

size_t StreamSession::chunk_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return chunks_.size();
}

size_t StreamSession::buffer_size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return buffer_.size();
}

size_t StreamSession::connection_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return connections_.size();
}

} // namespace chatrelay
