#pragma once
#include "http_server.hpp"
#include "stream_service.hpp"
#include <chrono>
#include <memory>
#include <string>

namespace chatrelay {

constexpr const char* kChatSessionsPrefix = "/api/v1/messages/chat-sessions/";

// JSON error body: {"success":false,"error":{"code":...,"message":...}}
ServerResponse error_response(int status, const std::string& code,
                              const std::string& message);

// Routes the streaming endpoints onto a StreamService.
//   POST {prefix}{id}/send-message    SSE stream of the new generation
//   POST {prefix}{id}/cancel-message  cancel the active generation
//   GET  {prefix}{id}/stream          reattach to the active generation
//   GET  {prefix}{id}/stream-status   active stream summary
class Api {
public:
    Api(StreamService& service, std::chrono::seconds keepalive_interval);

    ServerResponse handle(const ServerRequest& req);

private:
    ServerResponse send_message(const std::string& session_id, const ServerRequest& req);
    ServerResponse cancel_message(const std::string& session_id);
    ServerResponse reattach(const std::string& session_id);
    ServerResponse stream_status(const std::string& session_id);

    // SSE response draining conn until its terminal event or the client leaves.
    ServerResponse event_stream(std::shared_ptr<Connection> conn);

    StreamService& service_;
    std::chrono::seconds keepalive_interval_;
};

} // namespace chatrelay
