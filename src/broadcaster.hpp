#pragma once
#include "connection.hpp"
#include "stream_registry.hpp"
#include "stream_session.hpp"
#include <memory>
#include <string>

namespace chatrelay {

// Fans stream output out to attached connections. A viewer that cannot keep
// up is dropped instead of being waited on.
class Broadcaster {
public:
    Broadcaster(StreamRegistry& registry, size_t max_connections,
                size_t queue_capacity);

    // Attach a new connection: buffered chunks first, then live events.
    // Throws NotFoundError for an unknown stream id, ConnectionLimitError
    // when the stream already has max_connections viewers.
    std::shared_ptr<Connection> attach(const std::string& stream_id);
    std::shared_ptr<Connection> attach(const std::shared_ptr<StreamSession>& session);

    // Remove the connection from its stream and close it.
    void detach(const std::shared_ptr<Connection>& conn);

    // Append to the buffer and push to every viewer. False once the stream
    // has left Streaming.
    bool publish(const std::string& stream_id, const std::string& chunk);
    bool publish(StreamSession& session, const std::string& chunk);

    // Deliver the terminal event to every viewer and detach them all.
    size_t finish(StreamSession& session, const StreamEvent& terminal);

    // Viewer is still there; resets the stream's idle clock.
    void heartbeat(const std::shared_ptr<Connection>& conn);

    size_t max_connections() const { return max_connections_; }

private:
    StreamRegistry& registry_;
    size_t max_connections_;
    size_t queue_capacity_;
};

} // namespace chatrelay
