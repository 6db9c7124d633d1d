#include "api.hpp"
#include "errors.hpp"
#include "provider.hpp"
#include <nlohmann/json.hpp>
#include <iostream>

using json = nlohmann::json;

namespace chatrelay {

ServerResponse error_response(int status, const std::string& code,
                              const std::string& message) {
    ServerResponse resp;
    resp.status = status;
    resp.body = json{{"success", false},
                     {"error", {{"code", code}, {"message", message}}}}.dump();
    return resp;
}

static ServerResponse ok_response(const json& data) {
    ServerResponse resp;
    resp.body = json{{"success", true}, {"data", data}}.dump();
    return resp;
}

Api::Api(StreamService& service, std::chrono::seconds keepalive_interval)
    : service_(service), keepalive_interval_(keepalive_interval) {}

ServerResponse Api::handle(const ServerRequest& req) {
    const std::string prefix = kChatSessionsPrefix;
    if (req.path.compare(0, prefix.size(), prefix) != 0) {
        return error_response(404, "RESOURCE_NOT_FOUND", "No route for " + req.path);
    }

    std::string rest = req.path.substr(prefix.size());
    auto slash = rest.find('/');
    if (slash == std::string::npos || slash == 0) {
        return error_response(404, "RESOURCE_NOT_FOUND", "No route for " + req.path);
    }
    std::string session_id = rest.substr(0, slash);
    std::string action = rest.substr(slash + 1);

    try {
        if (action == "send-message") {
            if (req.method != "POST")
                return error_response(405, "METHOD_NOT_ALLOWED", "Use POST");
            return send_message(session_id, req);
        }
        if (action == "cancel-message") {
            if (req.method != "POST")
                return error_response(405, "METHOD_NOT_ALLOWED", "Use POST");
            return cancel_message(session_id);
        }
        if (action == "stream") {
            if (req.method != "GET")
                return error_response(405, "METHOD_NOT_ALLOWED", "Use GET");
            return reattach(session_id);
        }
        if (action == "stream-status") {
            if (req.method != "GET")
                return error_response(405, "METHOD_NOT_ALLOWED", "Use GET");
            return stream_status(session_id);
        }
        return error_response(404, "RESOURCE_NOT_FOUND", "No route for " + req.path);
    } catch (const ValidationError& e) {
        return error_response(400, "VALIDATION_ERROR", e.what());
    } catch (const NotFoundError& e) {
        return error_response(404, "RESOURCE_NOT_FOUND", e.what());
    } catch (const AlreadyStreamingError& e) {
        return error_response(409, "STREAM_IN_PROGRESS", e.what());
    } catch (const ConnectionLimitError& e) {
        return error_response(429, "TOO_MANY_CONNECTIONS", e.what());
    } catch (const ServiceUnavailableError& e) {
        return error_response(503, "SERVICE_UNAVAILABLE", e.what());
    } catch (const StorageError& e) {
        std::cerr << "[api] " << e.what() << "\n";
        return error_response(500, "DATABASE_ERROR", "A database error occurred");
    } catch (const std::exception& e) {
        std::cerr << "[api] Unexpected error on " << req.path << ": " << e.what() << "\n";
        return error_response(500, "INTERNAL_ERROR", "An unexpected error occurred");
    }
}

ServerResponse Api::send_message(const std::string& session_id, const ServerRequest& req) {
    json body;
    try {
        body = json::parse(req.body);
    } catch (const json::exception&) {
        throw ValidationError("Request body must be valid JSON");
    }
    if (!body.is_object()) {
        throw ValidationError("Request body must be a JSON object");
    }
    if (!body.contains("content") || !body["content"].is_string()) {
        throw ValidationError("Message content is required");
    }
    if (body.contains("stream") && body["stream"].is_boolean() &&
        !body["stream"].get<bool>()) {
        throw ValidationError("Only streaming responses are supported");
    }

    auto started = service_.send_message(session_id, body["content"].get<std::string>());
    return event_stream(started.connection);
}

ServerResponse Api::cancel_message(const std::string& session_id) {
    CancelOutcome outcome = service_.cancel(session_id);
    bool cancelled = outcome == CancelOutcome::Cancelled;
    return ok_response({
        {"cancelled", cancelled},
        {"message", cancelled ? "Generation cancelled" : "Nothing to cancel"},
    });
}

ServerResponse Api::reattach(const std::string& session_id) {
    return event_stream(service_.attach(session_id));
}

ServerResponse Api::stream_status(const std::string& session_id) {
    StreamStatus st = service_.status(session_id);
    json data = {{"active", st.active}};
    if (st.active) {
        data["stream_id"] = st.stream_id;
        data["state"] = stream_state_to_string(st.state);
        data["connections"] = st.connections;
        data["chunks"] = st.chunks;
    }
    return ok_response(data);
}

ServerResponse Api::event_stream(std::shared_ptr<Connection> conn) {
    ServerResponse resp;
    resp.content_type = "text/event-stream";
    resp.headers = {
        {"Cache-Control", "no-cache"},
        {"X-Accel-Buffering", "no"},
    };

    StreamService& service = service_;
    auto keepalive = keepalive_interval_;
    resp.on_abort = [&service, conn] { service.detach(conn); };
    resp.stream = [&service, conn, keepalive](ChunkWriter& writer) {
        auto last_write = std::chrono::steady_clock::now();
        while (true) {
            auto event = conn->next(std::chrono::milliseconds(500));
            if (event) {
                if (!writer.write(event->to_sse())) break;
                last_write = std::chrono::steady_clock::now();
                if (event->terminal()) return;
                continue;
            }
            if (conn->finished()) return;  // dropped by the broadcaster
            if (writer.stopping()) break;

            if (std::chrono::steady_clock::now() - last_write >= keepalive) {
                if (!writer.write(": keepalive\n\n")) break;
                service.heartbeat(conn);
                last_write = std::chrono::steady_clock::now();
            }
        }
        // client went away or server stopping
        service.detach(conn);
    };
    return resp;
}

} // namespace chatrelay
