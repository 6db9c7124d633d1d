#pragma once
#include "connection.hpp"
#include "provider.hpp"
#include "stream_event.hpp"
#include <chrono>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace chatrelay {

// Terminal error sent to a viewer dropped for not keeping up
constexpr const char* kViewerDroppedMessage = "Connection dropped: viewer fell behind";

enum class StreamState { Streaming, Cancelling, Completed, Cancelled, Failed };

const char* stream_state_to_string(StreamState state);

inline bool is_terminal(StreamState state) {
    return state == StreamState::Completed || state == StreamState::Cancelled ||
           state == StreamState::Failed;
}

// One in-flight generation for a chat session. All fields are guarded by a
// single mutex, which also serializes publishing, so every attached
// connection sees chunks in the same order.
class StreamSession {
public:
    using Clock = std::chrono::steady_clock;

    StreamSession(std::string session_key, std::string model);

    StreamSession(const StreamSession&) = delete;
    StreamSession& operator=(const StreamSession&) = delete;

    const std::string& session_key() const { return session_key_; }
    const std::string& stream_id() const { return stream_id_; }
    const std::string& model() const { return model_; }
    Clock::time_point started_at() const { return started_at_; }

    StreamState state() const;

    // Compare-and-set. Allowed edges:
    //   Streaming  -> Cancelling | Completed | Failed
    //   Cancelling -> Cancelled
    //   Completed  -> Failed      (persisting the turn failed)
    // Returns false if the current state is not `from` or the edge is invalid.
    bool transition(StreamState from, StreamState to);

    // Append a chunk and push it to every connection. Connections that cannot
    // take it get a terminal error, are removed and returned in `dropped`. Returns false
    // (and changes nothing) unless the stream is Streaming.
    bool append(const std::string& chunk,
                std::vector<std::shared_ptr<Connection>>& dropped);

    // Replay the buffer into conn, then register it for live events. If the
    // terminal event was already sent, conn gets backlog + terminal and is
    // not registered. Throws ConnectionLimitError past max_connections.
    void attach(const std::shared_ptr<Connection>& conn, size_t max_connections);

    // Remove without closing. False if conn was not attached.
    bool detach(const Connection& conn);

    // Send terminal to every connection and detach them all. Only the first
    // call has an effect; returns the number of connections reached.
    size_t finish(const StreamEvent& terminal);

    std::optional<StreamEvent> terminal_event() const;

    // Upstream abort handle. Installing it after the stream has left
    // Streaming cancels it immediately.
    void install_cancel(const CancelHandle& handle);
    void cancel_upstream();

    void touch(Clock::time_point now = Clock::now());
    Clock::time_point last_activity() const;

    std::string buffer() const;
    std::vector<std::string> chunks() const;
    size_t chunk_count() const;
    size_t buffer_size() const;
    size_t connection_count() const;

private:
    std::string session_key_;
    std::string stream_id_;
    std::string model_;
    Clock::time_point started_at_;

    mutable std::mutex mutex_;
    StreamState state_ = StreamState::Streaming;
    std::vector<std::string> chunks_;
    std::string buffer_;
    std::vector<std::shared_ptr<Connection>> connections_;
    Clock::time_point last_activity_;
    std::optional<CancelHandle> cancel_;
    std::optional<StreamEvent> terminal_;
};

} // namespace chatrelay
