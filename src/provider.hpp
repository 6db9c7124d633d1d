#pragma once
#include <atomic>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace chatrelay {

enum class Role { System, User, Assistant };

inline const char* role_to_string(Role role) {
    switch (role) {
        case Role::System: return "system";
        case Role::User: return "user";
        case Role::Assistant: return "assistant";
    }
    return "user";
}

// Parse "system" / "user" / "assistant"; nullopt for anything else.
std::optional<Role> role_from_string(const std::string& s);

struct ChatMessage {
    Role role;
    std::string content;
};

struct CompletionRequest {
    std::string model;
    std::vector<ChatMessage> messages;
    std::optional<double> temperature;
};

// Any upstream failure: connect/timeout, non-2xx, malformed framing,
// mid-stream disconnect.
class ProviderError : public std::runtime_error {
public:
    explicit ProviderError(const std::string& message, long status = 0)
        : std::runtime_error(message), status_(status) {}

    // HTTP status of the upstream response, 0 when none was received
    long status() const { return status_; }

private:
    long status_;
};

// Shared abort signal for one upstream call. Copies refer to the same state.
class CancelHandle {
public:
    CancelHandle();

    // Idempotent; safe before, during, and after the stream ends.
    void cancel() const;
    bool cancelled() const;

    // Polled by the HTTP layer to stop the transfer.
    const std::atomic<bool>* flag() const;

    // Run fn when cancel() is first called (immediately if already cancelled).
    void on_cancel(std::function<void()> fn) const;

private:
    struct State {
        std::atomic<bool> flag{false};
        std::mutex mutex;
        std::vector<std::function<void()>> callbacks;
    };
    std::shared_ptr<State> state_;
};

// Single-pass, blocking sequence of text fragments.
class ChunkStream {
public:
    virtual ~ChunkStream() = default;

    // Block until the next fragment. Returns false at end of stream or once
    // cancelled. Throws ProviderError on upstream failure.
    virtual bool next(std::string& chunk) = 0;
};

struct OpenedStream {
    std::unique_ptr<ChunkStream> chunks;
    CancelHandle cancel;
};

// Abstract base class for the completion provider
class Provider {
public:
    virtual ~Provider() = default;

    // Start one streaming completion. Throws ProviderError when the request
    // is rejected before any network I/O.
    virtual OpenedStream open(const CompletionRequest& request) = 0;

    // False when the provider cannot serve requests (e.g. no credentials).
    virtual bool ready() const { return true; }

    virtual std::string provider_name() const = 0;
};

// Validate roles and trim content; throws ProviderError on an empty message.
std::vector<ChatMessage> normalize_messages(const std::vector<ChatMessage>& messages);

class HttpClient;
struct ProviderConfig;

// Factory: the configured completion provider
std::unique_ptr<Provider> create_provider(const ProviderConfig& config,
                                          HttpClient& http);

} // namespace chatrelay
