#include "stream_event.hpp"

namespace chatrelay {

StreamEvent StreamEvent::content(std::string fragment) {
    StreamEvent ev;
    ev.type = Type::Content;
    ev.data = std::move(fragment);
    return ev;
}

StreamEvent StreamEvent::done() {
    StreamEvent ev;
    ev.type = Type::Done;
    return ev;
}

StreamEvent StreamEvent::failure(std::string message) {
    StreamEvent ev;
    ev.type = Type::Error;
    ev.error = std::move(message);
    return ev;
}

StreamEvent StreamEvent::cancelled(CancelReason reason) {
    StreamEvent ev;
    ev.type = Type::Cancelled;
    ev.reason = reason;
    return ev;
}

nlohmann::json StreamEvent::to_json() const {
    switch (type) {
        case Type::Content:
            return {{"type", "content"}, {"data", data}};
        case Type::Done:
            return {{"type", "done"}};
        case Type::Error:
            return {{"type", "error"}, {"error", error}};
        case Type::Cancelled:
            return {{"type", "cancelled"}, {"reason", cancel_reason_to_string(reason)}};
    }
    return nlohmann::json::object();
}

std::string StreamEvent::to_sse() const {
    // dump with replacement so a split UTF-8 sequence from upstream never throws
    return "data: " +
           to_json().dump(-1, ' ', false, nlohmann::json::error_handler_t::replace) +
           "\n\n";
}

} // namespace chatrelay
