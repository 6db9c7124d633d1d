#include <catch2/catch_test_macros.hpp>
#include "connection.hpp"
#include <thread>

using namespace chatrelay;
using namespace std::chrono_literals;

TEST_CASE("Connection: events come out in push order", "[connection]") {
    Connection conn(8);
    REQUIRE(conn.try_push(StreamEvent::content("a")));
    REQUIRE(conn.try_push(StreamEvent::content("b")));

    auto first = conn.next(10ms);
    auto second = conn.next(10ms);
    REQUIRE(first);
    REQUIRE(second);
    REQUIRE(first->data == "a");
    REQUIRE(second->data == "b");
    REQUIRE_FALSE(conn.next(10ms).has_value());
}

TEST_CASE("Connection: live events are bounded", "[connection]") {
    Connection conn(2);
    REQUIRE(conn.try_push(StreamEvent::content("1")));
    REQUIRE(conn.try_push(StreamEvent::content("2")));
    REQUIRE_FALSE(conn.try_push(StreamEvent::content("3")));
    REQUIRE(conn.pending() == 2);

    conn.next(10ms);
    REQUIRE(conn.try_push(StreamEvent::content("3")));
}

TEST_CASE("Connection: backlog does not count against capacity", "[connection]") {
    Connection conn(1);
    for (int i = 0; i < 10; i++) conn.push_backlog(StreamEvent::content(std::to_string(i)));
    REQUIRE(conn.pending() == 0);
    REQUIRE(conn.try_push(StreamEvent::content("live")));
}

TEST_CASE("Connection: terminal is accepted on a full queue and closes", "[connection]") {
    Connection conn(1);
    REQUIRE(conn.try_push(StreamEvent::content("x")));
    conn.push_terminal(StreamEvent::done());

    REQUIRE(conn.closed());
    REQUIRE_FALSE(conn.finished());
    REQUIRE_FALSE(conn.try_push(StreamEvent::content("late")));

    REQUIRE(conn.next(10ms)->data == "x");
    REQUIRE(conn.next(10ms)->type == StreamEvent::Type::Done);
    REQUIRE(conn.finished());
}

TEST_CASE("Connection: second terminal is ignored", "[connection]") {
    Connection conn(4);
    conn.push_terminal(StreamEvent::cancelled(CancelReason::Timeout));
    conn.push_terminal(StreamEvent::done());

    auto ev = conn.next(10ms);
    REQUIRE(ev->type == StreamEvent::Type::Cancelled);
    REQUIRE_FALSE(conn.next(10ms).has_value());
}

TEST_CASE("Connection: close wakes a waiting reader", "[connection]") {
    Connection conn(4);
    std::thread closer([&] {
        std::this_thread::sleep_for(20ms);
        conn.close();
    });
    auto start = std::chrono::steady_clock::now();
    auto ev = conn.next(5s);
    closer.join();

    REQUIRE_FALSE(ev.has_value());
    REQUIRE(std::chrono::steady_clock::now() - start < 4s);
    REQUIRE(conn.finished());
}

TEST_CASE("Connection: ids are unique", "[connection]") {
    Connection a(1), b(1);
    REQUIRE_FALSE(a.id().empty());
    REQUIRE(a.id() != b.id());
    REQUIRE(a.stream_id().empty());
}
