#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>
#include "api.hpp"
#include "fake_provider.hpp"
#include "http_test_client.hpp"
#include "memory_chat_store.hpp"
#include "test_helpers.hpp"
#include <nlohmann/json.hpp>
#include <atomic>
#include <thread>
#include <sys/socket.h>
#include <unistd.h>

using namespace chatrelay;
using Catch::Matchers::ContainsSubstring;
using json = nlohmann::json;

namespace {

struct Fixture {
    MemoryChatStore store;
    FakeProvider provider;
    StreamConfig config;
    std::unique_ptr<StreamService> service;
    std::unique_ptr<Api> api;

    explicit Fixture(std::chrono::seconds keepalive = std::chrono::seconds(15)) {
        ChatSessionConfig cfg;
        cfg.session_id = "1";
        cfg.model = "openai/gpt-4o-mini";
        cfg.system_prompt = "You are helpful.";
        store.add_session(cfg);
        service = std::make_unique<StreamService>(store, store, store, provider, config);
        api = std::make_unique<Api>(*service, keepalive);
    }
};

ServerRequest request(const std::string& method, const std::string& path,
                      const std::string& body = "") {
    ServerRequest req;
    req.method = method;
    req.path = path;
    req.body = body;
    return req;
}

std::string route(const std::string& id, const std::string& action) {
    return std::string(kChatSessionsPrefix) + id + "/" + action;
}

json body_of(const ServerResponse& resp) {
    return json::parse(resp.body);
}

// Run a streaming response into a socketpair and return the decoded body.
std::string run_stream(const ServerResponse& resp, const std::atomic<bool>& running) {
    int fds[2];
    if (::socketpair(AF_UNIX, SOCK_STREAM, 0, fds) != 0) return "";

    std::string out;
    std::thread reader([&] {
        char buf[4096];
        ssize_t n;
        while ((n = ::read(fds[1], buf, sizeof(buf))) > 0) {
            out.append(buf, static_cast<size_t>(n));
        }
    });

    ChunkWriter writer(fds[0], running);
    resp.stream(writer);
    writer.finish();
    ::close(fds[0]);
    reader.join();
    ::close(fds[1]);
    return dechunk(out);
}

std::string run_stream(const ServerResponse& resp) {
    std::atomic<bool> running{true};
    return run_stream(resp, running);
}

} // namespace

// ── Routing ──────────────────────────────────────────────────────

TEST_CASE("Api: unknown routes are 404", "[api]") {
    Fixture f;
    REQUIRE(f.api->handle(request("GET", "/api/v1/other")).status == 404);
    REQUIRE(f.api->handle(request("GET", route("1", "nope"))).status == 404);
    REQUIRE(f.api->handle(request("GET", kChatSessionsPrefix)).status == 404);
}

TEST_CASE("Api: wrong method is 405", "[api]") {
    Fixture f;
    REQUIRE(f.api->handle(request("GET", route("1", "send-message"))).status == 405);
    REQUIRE(f.api->handle(request("GET", route("1", "cancel-message"))).status == 405);
    REQUIRE(f.api->handle(request("POST", route("1", "stream"))).status == 405);
    REQUIRE(f.api->handle(request("POST", route("1", "stream-status"))).status == 405);
}

// ── send-message ─────────────────────────────────────────────────

TEST_CASE("Api: send-message body validation", "[api]") {
    Fixture f;
    auto path = route("1", "send-message");

    auto bad_json = f.api->handle(request("POST", path, "{nope"));
    REQUIRE(bad_json.status == 400);
    REQUIRE(body_of(bad_json)["success"] == false);
    REQUIRE(body_of(bad_json)["error"]["code"] == "VALIDATION_ERROR");

    REQUIRE(f.api->handle(request("POST", path, "[1,2]")).status == 400);
    REQUIRE(f.api->handle(request("POST", path, "{}")).status == 400);
    REQUIRE(f.api->handle(request("POST", path, R"({"content":42})")).status == 400);
    REQUIRE(f.api->handle(request("POST", path, R"({"content":"   "})")).status == 400);

    auto non_stream = f.api->handle(request("POST", path, R"({"content":"hi","stream":false})"));
    REQUIRE(non_stream.status == 400);
    REQUIRE(body_of(non_stream)["error"]["message"] == "Only streaming responses are supported");

    REQUIRE(f.provider.open_count() == 0);
}

TEST_CASE("Api: send-message to an unknown session is 404", "[api]") {
    Fixture f;
    auto resp = f.api->handle(request("POST", route("42", "send-message"), R"({"content":"hi"})"));
    REQUIRE(resp.status == 404);
    REQUIRE(body_of(resp)["error"]["code"] == "RESOURCE_NOT_FOUND");
}

TEST_CASE("Api: send-message without credentials is 503", "[api]") {
    Fixture f;
    f.provider.is_ready = false;
    auto resp = f.api->handle(request("POST", route("1", "send-message"), R"({"content":"hi"})"));
    REQUIRE(resp.status == 503);
    REQUIRE(body_of(resp)["error"]["code"] == "SERVICE_UNAVAILABLE");
}

TEST_CASE("Api: storage failure is a 500 database error", "[api]") {
    Fixture f;
    f.store.fail_user_append = true;
    auto resp = f.api->handle(request("POST", route("1", "send-message"), R"({"content":"hi"})"));
    REQUIRE(resp.status == 500);
    REQUIRE(body_of(resp)["error"]["code"] == "DATABASE_ERROR");
}

TEST_CASE("Api: send-message streams SSE events to the end", "[api]") {
    Fixture f;
    f.provider.script = std::vector<std::string>{"Hel", "lo"};

    auto resp = f.api->handle(request("POST", route("1", "send-message"),
                                      R"({"content":"hi","stream":true})"));
    REQUIRE(resp.status == 200);
    REQUIRE(resp.content_type == "text/event-stream");
    REQUIRE(resp.stream);

    bool no_cache = false;
    for (const auto& h : resp.headers) {
        if (h.first == "Cache-Control" && h.second == "no-cache") no_cache = true;
    }
    REQUIRE(no_cache);

    auto body = run_stream(resp);
    REQUIRE(body ==
            "data: {\"data\":\"Hel\",\"type\":\"content\"}\n\n"
            "data: {\"data\":\"lo\",\"type\":\"content\"}\n\n"
            "data: {\"type\":\"done\"}\n\n");
    REQUIRE(wait_until([&] { return f.store.count(Role::Assistant) == 1; }));
}

TEST_CASE("Api: second send while streaming is 409", "[api]") {
    Fixture f;
    auto first = f.api->handle(request("POST", route("1", "send-message"), R"({"content":"a"})"));
    REQUIRE(first.status == 200);
    REQUIRE(f.provider.wait_for_open(1));

    auto second = f.api->handle(request("POST", route("1", "send-message"), R"({"content":"b"})"));
    REQUIRE(second.status == 409);
    REQUIRE(body_of(second)["error"]["code"] == "STREAM_IN_PROGRESS");

    f.provider.end();
}

// ── cancel-message ───────────────────────────────────────────────

TEST_CASE("Api: cancel with nothing running", "[api]") {
    Fixture f;
    auto resp = f.api->handle(request("POST", route("1", "cancel-message")));
    REQUIRE(resp.status == 200);
    auto j = body_of(resp);
    REQUIRE(j["success"] == true);
    REQUIRE(j["data"]["cancelled"] == false);
    REQUIRE(j["data"]["message"] == "Nothing to cancel");
}

TEST_CASE("Api: cancel ends the open event stream", "[api]") {
    Fixture f;
    auto resp = f.api->handle(request("POST", route("1", "send-message"), R"({"content":"go"})"));
    REQUIRE(f.provider.wait_for_open(1));
    f.provider.push("partial");

    std::string body;
    std::thread viewer([&] { body = run_stream(resp); });
    REQUIRE(wait_until([&] { return f.service->status("1").chunks == 1; }));

    auto cancel = f.api->handle(request("POST", route("1", "cancel-message")));
    viewer.join();

    auto j = body_of(cancel);
    REQUIRE(j["data"]["cancelled"] == true);
    REQUIRE(j["data"]["message"] == "Generation cancelled");
    REQUIRE_THAT(body, ContainsSubstring("\"partial\""));
    REQUIRE_THAT(body, ContainsSubstring(
        "data: {\"reason\":\"user_cancelled\",\"type\":\"cancelled\"}\n\n"));
    REQUIRE(f.store.count(Role::Assistant) == 0);
}

// ── stream / stream-status ───────────────────────────────────────

TEST_CASE("Api: reattach when idle is 404", "[api]") {
    Fixture f;
    auto resp = f.api->handle(request("GET", route("1", "stream")));
    REQUIRE(resp.status == 404);
}

TEST_CASE("Api: reattach replays the buffered chunks", "[api]") {
    Fixture f;
    auto first = f.api->handle(request("POST", route("1", "send-message"), R"({"content":"go"})"));
    REQUIRE(f.provider.wait_for_open(1));
    f.provider.push("one ");
    REQUIRE(wait_until([&] { return f.service->status("1").chunks == 1; }));

    auto second = f.api->handle(request("GET", route("1", "stream")));
    REQUIRE(second.status == 200);
    REQUIRE(second.content_type == "text/event-stream");

    f.provider.push("two");
    f.provider.end();

    auto body = run_stream(second);
    REQUIRE(body ==
            "data: {\"data\":\"one \",\"type\":\"content\"}\n\n"
            "data: {\"data\":\"two\",\"type\":\"content\"}\n\n"
            "data: {\"type\":\"done\"}\n\n");
    // The first viewer was never read but still got everything queued
    REQUIRE_THAT(run_stream(first), ContainsSubstring("\"done\""));
}

TEST_CASE("Api: stream-status reports the active stream", "[api]") {
    Fixture f;
    auto idle = body_of(f.api->handle(request("GET", route("1", "stream-status"))));
    REQUIRE(idle["success"] == true);
    REQUIRE(idle["data"]["active"] == false);
    REQUIRE_FALSE(idle["data"].contains("stream_id"));

    auto resp = f.api->handle(request("POST", route("1", "send-message"), R"({"content":"go"})"));
    REQUIRE(f.provider.wait_for_open(1));
    f.provider.push("x");
    REQUIRE(wait_until([&] { return f.service->status("1").chunks == 1; }));

    auto active = body_of(f.api->handle(request("GET", route("1", "stream-status"))));
    REQUIRE(active["data"]["active"] == true);
    REQUIRE(active["data"]["state"] == "streaming");
    REQUIRE(active["data"]["connections"] == 1);
    REQUIRE(active["data"]["chunks"] == 1);
    REQUIRE(active["data"]["stream_id"].is_string());

    f.provider.end();
    run_stream(resp);
}

// ── Keepalive and shutdown ───────────────────────────────────────

TEST_CASE("Api: idle streams get keepalive comments", "[api]") {
    Fixture f(std::chrono::seconds(0));
    auto resp = f.api->handle(request("POST", route("1", "send-message"), R"({"content":"go"})"));
    REQUIRE(f.provider.wait_for_open(1));

    std::string body;
    std::thread viewer([&] { body = run_stream(resp); });
    std::this_thread::sleep_for(std::chrono::milliseconds(1200));
    f.provider.push("late");
    f.provider.end();
    viewer.join();

    REQUIRE_THAT(body, ContainsSubstring(": keepalive\n\n"));
    REQUIRE_THAT(body, ContainsSubstring("\"late\""));
    REQUIRE_THAT(body, ContainsSubstring("\"done\""));
}

TEST_CASE("Api: server stopping detaches the viewer but keeps the stream", "[api]") {
    Fixture f;
    auto resp = f.api->handle(request("POST", route("1", "send-message"), R"({"content":"go"})"));
    REQUIRE(f.provider.wait_for_open(1));

    std::atomic<bool> running{false};
    run_stream(resp, running);

    auto st = f.service->status("1");
    REQUIRE(st.active);
    REQUIRE(st.connections == 0);

    f.provider.end();
}

TEST_CASE("Api: aborting an event stream detaches its viewer", "[api]") {
    Fixture f;
    auto resp = f.api->handle(request("POST", route("1", "send-message"), R"({"content":"go"})"));
    REQUIRE(f.provider.wait_for_open(1));
    REQUIRE(f.service->status("1").connections == 1);
    REQUIRE(resp.on_abort);

    resp.on_abort();
    REQUIRE(f.service->status("1").connections == 0);
    REQUIRE(f.service->status("1").active);

    f.provider.end();
}

TEST_CASE("Api: reattached event stream also detaches on abort", "[api]") {
    Fixture f;
    auto first = f.api->handle(request("POST", route("1", "send-message"), R"({"content":"go"})"));
    REQUIRE(f.provider.wait_for_open(1));
    auto second = f.api->handle(request("GET", route("1", "stream")));
    REQUIRE(f.service->status("1").connections == 2);

    second.on_abort();
    first.on_abort();
    REQUIRE(f.service->status("1").connections == 0);

    f.provider.end();
}

// ── Through the HTTP server ──────────────────────────────────────

TEST_CASE("Api: end to end over HTTP", "[api][http_server]") {
    Fixture f;
    f.provider.script = std::vector<std::string>{"Hi", " there"};

    Api& api = *f.api;
    HttpServer server("127.0.0.1:0", 65536, 8,
                      [&api](const ServerRequest& req) { return api.handle(req); });
    std::string err;
    REQUIRE(server.start(err));

    auto resp = http_post(server.port(), route("1", "send-message"), R"({"content":"hello"})");
    REQUIRE(wait_until([&] { return !f.service->status("1").active; }));
    auto status = http_get(server.port(), route("1", "stream-status"));
    server.stop();

    REQUIRE_THAT(resp, ContainsSubstring("Content-Type: text/event-stream"));
    REQUIRE_THAT(resp, ContainsSubstring("X-Accel-Buffering: no"));
    REQUIRE(dechunk(response_body(resp)) ==
            "data: {\"data\":\"Hi\",\"type\":\"content\"}\n\n"
            "data: {\"data\":\" there\",\"type\":\"content\"}\n\n"
            "data: {\"type\":\"done\"}\n\n");
    REQUIRE_THAT(status, ContainsSubstring("\"active\":false"));
}
