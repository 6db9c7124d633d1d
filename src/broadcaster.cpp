#include "broadcaster.hpp"
#include "errors.hpp"
#include <iostream>
#include <vector>

namespace chatrelay {

Broadcaster::Broadcaster(StreamRegistry& registry, size_t max_connections,
                         size_t queue_capacity)
    : registry_(registry),
      max_connections_(max_connections),
      queue_capacity_(queue_capacity) {}

std::shared_ptr<Connection> Broadcaster::attach(const std::string& stream_id) {
    auto session = registry_.find_stream(stream_id);
    if (!session) {
        throw NotFoundError("Stream " + stream_id + " not found");
    }
    return attach(session);
}

std::shared_ptr<Connection> Broadcaster::attach(const std::shared_ptr<StreamSession>& session) {
    auto conn = std::make_shared<Connection>(queue_capacity_);
    session->attach(conn, max_connections_);
    return conn;
}

void Broadcaster::detach(const std::shared_ptr<Connection>& conn) {
    if (!conn) return;
    conn->close();
    auto session = registry_.find_stream(conn->stream_id());
    if (session) session->detach(*conn);
}

bool Broadcaster::publish(const std::string& stream_id, const std::string& chunk) {
    auto session = registry_.find_stream(stream_id);
    if (!session) return false;
    return publish(*session, chunk);
}

bool Broadcaster::publish(StreamSession& session, const std::string& chunk) {
    std::vector<std::shared_ptr<Connection>> dropped;
    bool accepted = session.append(chunk, dropped);
    for (const auto& conn : dropped) {
        std::cerr << "[broadcast] Dropped connection " << conn->id().substr(0, 8)
                  << " from stream " << session.stream_id().substr(0, 8)
                  << " (queue full or closed)\n";
    }
    return accepted;
}

size_t Broadcaster::finish(StreamSession& session, const StreamEvent& terminal) {
    return session.finish(terminal);
}

void Broadcaster::heartbeat(const std::shared_ptr<Connection>& conn) {
    if (!conn) return;
    auto session = registry_.find_stream(conn->stream_id());
    if (session) session->touch();
}

} // namespace chatrelay
