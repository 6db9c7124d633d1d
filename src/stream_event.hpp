#pragma once
#include <nlohmann/json.hpp>
#include <string>

namespace chatrelay {

enum class CancelReason { UserCancelled, Timeout };

inline const char* cancel_reason_to_string(CancelReason reason) {
    switch (reason) {
        case CancelReason::UserCancelled: return "user_cancelled";
        case CancelReason::Timeout: return "timeout";
    }
    return "user_cancelled";
}

// One event on a stream's wire. Done, Error and Cancelled are terminal.
struct StreamEvent {
    enum class Type { Content, Done, Error, Cancelled };

    Type type = Type::Content;
    std::string data;                                   // Content fragment
    std::string error;                                  // Error message
    CancelReason reason = CancelReason::UserCancelled;  // Cancelled reason

    static StreamEvent content(std::string fragment);
    static StreamEvent done();
    static StreamEvent failure(std::string message);
    static StreamEvent cancelled(CancelReason reason);

    bool terminal() const { return type != Type::Content; }

    nlohmann::json to_json() const;

    // "data: <json>\n\n"
    std::string to_sse() const;
};

} // namespace chatrelay
