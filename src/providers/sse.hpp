#pragma once
#include <string>
#include <functional>

namespace chatrelay {

struct SSEEvent {
    std::string event; // event type; empty for plain "data:" events
    std::string data;  // raw payload, multi-line data joined with '\n'
};

// Callback receives each parsed SSE event. Return false to stop parsing.
using SSECallback = std::function<bool(const SSEEvent& event)>;

// Incremental parser for a text/event-stream body. Lines may be split
// across feed() calls; comment lines (leading ':') are skipped.
class SSEParser {
public:
    // Feed raw data chunk, triggers callback for complete events.
    // Returns false if the callback asked to stop.
    bool feed(const std::string& chunk, const SSECallback& callback);

    // Reset parser state
    void reset();

    // Number of comment lines seen so far (keep-alive pings)
    size_t comments_seen() const { return comments_; }

private:
    std::string buffer_;
    std::string event_;
    std::string data_;
    bool has_data_ = false;
    size_t comments_ = 0;
};

} // namespace chatrelay
