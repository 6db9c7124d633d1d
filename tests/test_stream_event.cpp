#include <catch2/catch_test_macros.hpp>
#include "stream_event.hpp"

using namespace chatrelay;

TEST_CASE("StreamEvent: wire shapes", "[stream_event]") {
    REQUIRE(StreamEvent::content("Hi").to_sse() ==
            "data: {\"data\":\"Hi\",\"type\":\"content\"}\n\n");
    REQUIRE(StreamEvent::done().to_sse() == "data: {\"type\":\"done\"}\n\n");
    REQUIRE(StreamEvent::failure("boom").to_json()["error"] == "boom");

    auto cancelled = StreamEvent::cancelled(CancelReason::Timeout).to_json();
    REQUIRE(cancelled["type"] == "cancelled");
    REQUIRE(cancelled["reason"] == "timeout");
    REQUIRE(StreamEvent::cancelled(CancelReason::UserCancelled).to_json()["reason"] ==
            "user_cancelled");
}

TEST_CASE("StreamEvent: only content is non-terminal", "[stream_event]") {
    REQUIRE_FALSE(StreamEvent::content("x").terminal());
    REQUIRE(StreamEvent::done().terminal());
    REQUIRE(StreamEvent::failure("e").terminal());
    REQUIRE(StreamEvent::cancelled(CancelReason::Timeout).terminal());
}

TEST_CASE("StreamEvent: invalid UTF-8 in a fragment does not throw", "[stream_event]") {
    std::string split = "caf\xC3";   // first byte of a two-byte sequence
    std::string sse;
    REQUIRE_NOTHROW(sse = StreamEvent::content(split).to_sse());
    REQUIRE(sse.rfind("data: ", 0) == 0);
}

TEST_CASE("StreamEvent: newlines in content stay on one data line", "[stream_event]") {
    auto sse = StreamEvent::content("line1\nline2").to_sse();
    REQUIRE(sse == "data: {\"data\":\"line1\\nline2\",\"type\":\"content\"}\n\n");
}
