#pragma once
#include "stream_event.hpp"
#include <chrono>
#include <condition_variable>
#include <deque>
#include <mutex>
#include <optional>
#include <string>

namespace chatrelay {

// One viewer's output channel: a bounded queue of stream events filled by
// the publisher and drained by the viewer's writer thread.
//
// Only live events count against the capacity. Backlog replay and the
// terminal event are always accepted, so a late joiner gets the full buffer
// and every viewer sees how the stream ended.
class Connection {
public:
    explicit Connection(size_t capacity);

    const std::string& id() const { return id_; }
    size_t capacity() const { return capacity_; }

    // Stream this connection was attached to (empty until attached)
    std::string stream_id() const;
    void set_stream_id(const std::string& stream_id);

    // Never blocks. False when the queue is full or the connection is closed.
    bool try_push(StreamEvent event);

    // Replayed history; not bounded.
    void push_backlog(StreamEvent event);

    // Queue the terminal event and close. Ignored if already closed.
    void push_terminal(StreamEvent event);

    // Wait up to timeout for the next event. nullopt on timeout, or once
    // closed and drained (see finished()).
    std::optional<StreamEvent> next(std::chrono::milliseconds timeout);

    // Stop accepting events and wake the consumer.
    void close();

    bool closed() const;

    // Closed and nothing left to read
    bool finished() const;

    // Pending live events
    size_t pending() const;

private:
    struct Entry {
        StreamEvent event;
        bool live;
    };

    std::string id_;
    size_t capacity_;
    std::string stream_id_;

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<Entry> queue_;
    size_t live_pending_ = 0;
    bool closed_ = false;
};

} // namespace chatrelay
