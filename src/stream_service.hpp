#pragma once
#include "broadcaster.hpp"
#include "cancellation.hpp"
#include "chat_store.hpp"
#include "config.hpp"
#include "provider.hpp"
#include "stream_registry.hpp"
#include <atomic>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace chatrelay {

constexpr size_t kMaxMessageLength = 65535;

struct StreamStatus {
    bool active = false;
    std::string stream_id;
    StreamState state = StreamState::Streaming;
    size_t connections = 0;
    size_t chunks = 0;
};

// Runs "send message" end to end: claims the session, assembles the prompt,
// streams the provider's output to viewers on a worker thread and applies
// exactly one terminal transition per stream.
class StreamService {
public:
    StreamService(SessionConfigSource& configs, HistoryReader& history,
                  MessagePersister& persister, Provider& provider,
                  const StreamConfig& config,
                  std::optional<double> temperature = std::nullopt);
    ~StreamService();

    StreamService(const StreamService&) = delete;
    StreamService& operator=(const StreamService&) = delete;

    struct Started {
        std::shared_ptr<StreamSession> session;
        std::shared_ptr<Connection> connection;   // the caller's viewer
    };

    // Throws ValidationError, NotFoundError, ServiceUnavailableError,
    // AlreadyStreamingError, StorageError. Nothing is claimed on failure.
    Started send_message(const std::string& session_key, const std::string& content);

    // Attach another viewer to the active stream. NotFoundError when idle.
    std::shared_ptr<Connection> attach(const std::string& session_key);

    void detach(const std::shared_ptr<Connection>& conn);
    void heartbeat(const std::shared_ptr<Connection>& conn);

    CancelOutcome cancel(const std::string& session_key);

    StreamStatus status(const std::string& session_key) const;

    // Fail every active stream, join all workers, refuse new sends.
    void shutdown();

    StreamRegistry& registry() { return registry_; }
    Broadcaster& broadcaster() { return broadcaster_; }
    CancellationController& cancellation() { return cancellation_; }

private:
    struct Worker {
        std::thread thread;
        std::shared_ptr<std::atomic<bool>> done;
    };

    void run_stream(const std::shared_ptr<StreamSession>& session,
                    const CompletionRequest& request);
    void complete(const std::shared_ptr<StreamSession>& session);
    void fail(const std::shared_ptr<StreamSession>& session, const std::string& message);
    void reap_workers();

    SessionConfigSource& configs_;
    HistoryReader& history_;
    MessagePersister& persister_;
    Provider& provider_;
    StreamConfig config_;
    std::optional<double> temperature_;

    StreamRegistry registry_;
    Broadcaster broadcaster_;
    CancellationController cancellation_;

    std::mutex workers_mutex_;
    std::vector<Worker> workers_;
    std::atomic<bool> shutting_down_{false};
};

} // namespace chatrelay
