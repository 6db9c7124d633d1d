#include <catch2/catch_test_macros.hpp>
#include "providers/sse.hpp"
#include <vector>

using namespace chatrelay;

// Helper: collect all events from a single feed
static std::vector<SSEEvent> collect_events(SSEParser& parser, const std::string& chunk) {
    std::vector<SSEEvent> events;
    parser.feed(chunk, [&](const SSEEvent& ev) {
        events.push_back(ev);
        return true;
    });
    return events;
}

// ── Basic event parsing ──────────────────────────────────────────

TEST_CASE("SSEParser: single data-only event", "[sse]") {
    SSEParser parser;
    auto events = collect_events(parser, "data: hello\n\n");
    REQUIRE(events.size() == 1);
    REQUIRE(events[0].data == "hello");
    REQUIRE(events[0].event.empty());
}

TEST_CASE("SSEParser: event with named type", "[sse]") {
    SSEParser parser;
    auto events = collect_events(parser, "event: message\ndata: {}\n\n");
    REQUIRE(events.size() == 1);
    REQUIRE(events[0].event == "message");
    REQUIRE(events[0].data == "{}");
}

TEST_CASE("SSEParser: multiple events in one chunk", "[sse]") {
    SSEParser parser;
    auto events = collect_events(parser, "data: first\n\ndata: second\n\n");
    REQUIRE(events.size() == 2);
    REQUIRE(events[0].data == "first");
    REQUIRE(events[1].data == "second");
}

TEST_CASE("SSEParser: multi-line data concatenated", "[sse]") {
    SSEParser parser;
    auto events = collect_events(parser, "data: line1\ndata: line2\n\n");
    REQUIRE(events.size() == 1);
    REQUIRE(events[0].data == "line1\nline2");
}

TEST_CASE("SSEParser: data field without space after colon", "[sse]") {
    SSEParser parser;
    auto events = collect_events(parser, "data:no_space\n\n");
    REQUIRE(events.size() == 1);
    REQUIRE(events[0].data == "no_space");
}

TEST_CASE("SSEParser: CRLF line endings", "[sse]") {
    SSEParser parser;
    auto events = collect_events(parser, "data: crlf\r\n\r\n");
    REQUIRE(events.size() == 1);
    REQUIRE(events[0].data == "crlf");
}

// ── Comments ─────────────────────────────────────────────────────

TEST_CASE("SSEParser: processing comments are skipped and counted", "[sse]") {
    SSEParser parser;
    auto events = collect_events(parser,
        ": OPENROUTER PROCESSING\n\n: OPENROUTER PROCESSING\n\ndata: x\n\n");
    REQUIRE(events.size() == 1);
    REQUIRE(events[0].data == "x");
    REQUIRE(parser.comments_seen() == 2);
}

// ── Streaming / chunked delivery ─────────────────────────────────

TEST_CASE("SSEParser: event split across two chunks", "[sse]") {
    SSEParser parser;

    auto events1 = collect_events(parser, "data: hel");
    REQUIRE(events1.empty());

    auto events2 = collect_events(parser, "lo\n\n");
    REQUIRE(events2.size() == 1);
    REQUIRE(events2[0].data == "hello");
}

TEST_CASE("SSEParser: split between data line and blank line", "[sse]") {
    SSEParser parser;

    auto first = collect_events(parser, "data: complete line\n");
    REQUIRE(first.empty());

    auto second = collect_events(parser, "\n");
    REQUIRE(second.size() == 1);
    REQUIRE(second[0].data == "complete line");
}

TEST_CASE("SSEParser: event type split across chunks", "[sse]") {
    SSEParser parser;

    auto ev1 = collect_events(parser, "event: mess");
    REQUIRE(ev1.empty());

    auto ev2 = collect_events(parser, "age\ndata: {\"x\":1}\n\n");
    REQUIRE(ev2.size() == 1);
    REQUIRE(ev2[0].event == "message");
    REQUIRE(ev2[0].data == "{\"x\":1}");
}

TEST_CASE("SSEParser: byte-at-a-time delivery", "[sse]") {
    SSEParser parser;
    std::string stream = "data: a\n\ndata: b\n\n";
    std::vector<SSEEvent> events;
    for (char c : stream) {
        parser.feed(std::string(1, c), [&](const SSEEvent& ev) {
            events.push_back(ev);
            return true;
        });
    }
    REQUIRE(events.size() == 2);
    REQUIRE(events[0].data == "a");
    REQUIRE(events[1].data == "b");
}

// ── Stop and reset ───────────────────────────────────────────────

TEST_CASE("SSEParser: callback returning false stops parsing", "[sse]") {
    SSEParser parser;
    std::vector<std::string> seen;
    bool cont = parser.feed("data: [DONE]\n\ndata: after\n\n", [&](const SSEEvent& ev) {
        seen.push_back(ev.data);
        return false;
    });
    REQUIRE_FALSE(cont);
    REQUIRE(seen.size() == 1);
    REQUIRE(seen[0] == "[DONE]");
}

TEST_CASE("SSEParser: reset discards partial input", "[sse]") {
    SSEParser parser;
    collect_events(parser, "data: partial");
    parser.reset();
    auto events = collect_events(parser, "data: fresh\n\n");
    REQUIRE(events.size() == 1);
    REQUIRE(events[0].data == "fresh");
}

TEST_CASE("SSEParser: blank lines without data dispatch nothing", "[sse]") {
    SSEParser parser;
    auto events = collect_events(parser, "\n\n\n");
    REQUIRE(events.empty());
}
