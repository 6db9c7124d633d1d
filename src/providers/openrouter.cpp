#include "openrouter.hpp"
#include "sse.hpp"
#include <algorithm>
#include <condition_variable>
#include <deque>
#include <iostream>
#include <mutex>
#include <thread>

using json = nlohmann::json;

namespace chatrelay {

namespace {

constexpr size_t kMaxErrorBody = 2048;

// Shared between the reader thread and the consumer. Outlives whichever
// side finishes first.
struct StreamState {
    std::mutex mutex;
    std::condition_variable cv;
    std::deque<std::string> chunks;
    bool finished = false;
    bool failed = false;
    std::string error;
    long status = 0;
};

// Pull the human-readable message out of an OpenRouter/OpenAI error body.
std::string error_message_from(const std::string& body) {
    try {
        auto j = json::parse(body);
        if (j.contains("error") && j["error"].is_object())
            return j["error"].value("message", body);
    } catch (const json::exception&) {
        // not JSON; fall through to the raw body
    }
    return body;
}

class HttpChunkStream : public ChunkStream {
public:
    HttpChunkStream(HttpClient& http, std::string url, std::string body,
                    std::vector<Header> headers, long timeout_seconds,
                    CancelHandle cancel)
        : state_(std::make_shared<StreamState>()), cancel_(std::move(cancel)) {
        std::weak_ptr<StreamState> weak = state_;
        cancel_.on_cancel([weak] {
            if (auto state = weak.lock()) {
                std::lock_guard<std::mutex> lock(state->mutex);
                state->cv.notify_all();
            }
        });

        reader_ = std::thread([&http, state = state_, cancel = cancel_,
                               url = std::move(url), body = std::move(body),
                               headers = std::move(headers), timeout_seconds] {
            read_stream(http, url, body, headers, timeout_seconds, cancel, *state);
        });
    }

    ~HttpChunkStream() override {
        cancel_.cancel();
        if (reader_.joinable()) reader_.join();
    }

    bool next(std::string& chunk) override {
        std::unique_lock<std::mutex> lock(state_->mutex);
        state_->cv.wait(lock, [&] {
            return !state_->chunks.empty() || state_->finished || cancel_.cancelled();
        });
        if (cancel_.cancelled()) return false;
        if (!state_->chunks.empty()) {
            chunk = std::move(state_->chunks.front());
            state_->chunks.pop_front();
            return true;
        }
        if (state_->failed) throw ProviderError(state_->error, state_->status);
        return false;
    }

private:
    static void read_stream(HttpClient& http, const std::string& url,
                            const std::string& body,
                            const std::vector<Header>& headers,
                            long timeout_seconds, const CancelHandle& cancel,
                            StreamState& state) {
        SSEParser parser;
        std::string head;      // first bytes of the body, for error reports
        std::string failure;
        bool done_seen = false;

        auto push = [&](std::string text) {
            std::lock_guard<std::mutex> lock(state.mutex);
            state.chunks.push_back(std::move(text));
            state.cv.notify_all();
        };

        HttpResponse response;
        try {
            response = http.stream_post_raw(
                url, body, headers,
                [&](const char* data, size_t len) -> bool {
                    if (head.size() < kMaxErrorBody)
                        head.append(data, std::min(len, kMaxErrorBody - head.size()));

                    parser.feed(std::string(data, len), [&](const SSEEvent& sse) -> bool {
                        if (sse.data == "[DONE]") {
                            done_seen = true;
                            return false;
                        }

                        json payload;
                        try {
                            payload = json::parse(sse.data);
                        } catch (const json::exception&) {
                            failure = "Malformed stream payload from provider";
                            return false;
                        }

                        if (payload.contains("error")) {
                            const auto& err = payload["error"];
                            failure = err.is_object()
                                ? err.value("message", std::string("Provider error"))
                                : err.dump();
                            return false;
                        }

                        if (!payload.contains("choices") || !payload["choices"].is_array() ||
                            payload["choices"].empty())
                            return true;
                        const auto& choice = payload["choices"][0];
                        if (choice.contains("delta") && choice["delta"].contains("content") &&
                            choice["delta"]["content"].is_string()) {
                            std::string text = choice["delta"]["content"].get<std::string>();
                            if (!text.empty()) push(std::move(text));
                        }
                        if (choice.contains("finish_reason") &&
                            choice["finish_reason"].is_string() &&
                            choice["finish_reason"].get<std::string>() == "error") {
                            failure = "Provider reported an error while generating";
                            return false;
                        }
                        return true;
                    });
                    return !done_seen && failure.empty() && !cancel.cancelled();
                },
                timeout_seconds, cancel.flag());
        } catch (const std::exception& e) {
            failure = std::string("Provider request failed: ") + e.what();
        }

        std::lock_guard<std::mutex> lock(state.mutex);
        state.finished = true;
        state.status = response.status_code;
        if (cancel.cancelled()) {
            // consumer already stopped; nothing to report
        } else if (response.status_code != 0 &&
                   (response.status_code < 200 || response.status_code >= 300)) {
            state.failed = true;
            state.error = "Provider returned HTTP " +
                          std::to_string(response.status_code) + ": " +
                          error_message_from(head);
        } else if (!failure.empty()) {
            state.failed = true;
            state.error = failure;
        } else if (response.status_code == 0 && !done_seen) {
            state.failed = true;
            state.error = "Could not connect to provider at " + url;
        } else if (!done_seen) {
            state.failed = true;
            state.error = "Provider stream ended unexpectedly";
        }
        if (state.failed)
            std::cerr << "[openrouter] " << state.error << "\n";
        state.cv.notify_all();
    }

    std::shared_ptr<StreamState> state_;
    CancelHandle cancel_;
    std::thread reader_;
};

} // namespace

OpenRouterProvider::OpenRouterProvider(const std::string& api_key, HttpClient& http,
                                       const std::string& base_url,
                                       long timeout_seconds)
    : api_key_(api_key), http_(http),
      base_url_(base_url.empty() ? "https://openrouter.ai/api/v1" : base_url),
      timeout_seconds_(timeout_seconds) {
    while (!base_url_.empty() && base_url_.back() == '/') base_url_.pop_back();
}

json OpenRouterProvider::build_request(const CompletionRequest& request) const {
    json j;
    j["model"] = request.model;
    j["stream"] = true;
    if (request.temperature) j["temperature"] = *request.temperature;

    json msgs = json::array();
    for (const auto& msg : request.messages) {
        msgs.push_back({{"role", role_to_string(msg.role)}, {"content", msg.content}});
    }
    j["messages"] = msgs;
    return j;
}

std::vector<Header> OpenRouterProvider::build_headers() const {
    return {
        {"Authorization", "Bearer " + api_key_},
        {"Content-Type", "application/json"},
        {"Accept", "text/event-stream"},
        {"HTTP-Referer", "https://chatrelay.local"},
        {"X-Title", "ChatRelay"},
    };
}

OpenedStream OpenRouterProvider::open(const CompletionRequest& request) {
    if (request.model.empty()) throw ProviderError("No model specified");

    CompletionRequest normalized = request;
    normalized.messages = normalize_messages(request.messages);

    CancelHandle cancel;
    auto chunks = std::make_unique<HttpChunkStream>(
        http_, completions_url(), build_request(normalized).dump(),
        build_headers(), timeout_seconds_, cancel);
    return OpenedStream{std::move(chunks), cancel};
}

} // namespace chatrelay
