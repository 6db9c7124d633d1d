#include "stream_service.hpp"
#include "errors.hpp"
#include "prompt.hpp"
#include "util.hpp"
#include <iostream>

namespace chatrelay {

StreamService::StreamService(SessionConfigSource& configs, HistoryReader& history,
                             MessagePersister& persister, Provider& provider,
                             const StreamConfig& config,
                             std::optional<double> temperature)
    : configs_(configs), history_(history), persister_(persister),
      provider_(provider), config_(config), temperature_(temperature),
      broadcaster_(registry_, config.max_connections, config.connection_queue),
      cancellation_(registry_, broadcaster_) {}

StreamService::~StreamService() {
    shutdown();
}

StreamService::Started StreamService::send_message(const std::string& session_key,
                                                    const std::string& content) {
    if (shutting_down_.load()) {
        throw ServiceUnavailableError("Server is shutting down");
    }

    std::string text = trim(content);
    if (text.empty()) {
        throw ValidationError("Message content cannot be empty");
    }
    if (text.size() > kMaxMessageLength) {
        throw ValidationError("Message content exceeds " +
                              std::to_string(kMaxMessageLength) + " characters");
    }
    if (!provider_.ready()) {
        throw ServiceUnavailableError("No API key configured for " + provider_.provider_name());
    }

    ChatSessionConfig config = configs_.load_config(session_key);
    if (config.model.empty()) {
        throw ServiceUnavailableError("No AI model selected for chat session " + session_key);
    }
    std::vector<ConversationTurn> turns = history_.load_history(session_key);

    reap_workers();
    auto session = registry_.try_begin(session_key, config.model);

    Started started;
    started.session = session;
    try {
        CompletionRequest request =
            build_completion_request(config, turns, text, temperature_);
        persister_.append(session_key, Role::User, text);
        started.connection = broadcaster_.attach(session);

        auto done = std::make_shared<std::atomic<bool>>(false);
        std::thread thread([this, session, request, done]() {
            run_stream(session, request);
            done->store(true);
        });

        std::lock_guard<std::mutex> lock(workers_mutex_);
        workers_.push_back(Worker{std::move(thread), done});
    } catch (const std::exception& e) {
        session->transition(StreamState::Streaming, StreamState::Failed);
        registry_.end(session_key, session->stream_id());
        std::cerr << "[stream] Could not start stream for session " << session_key
                  << ": " << e.what() << "\n";
        throw;
    }

    std::cerr << "[stream] Started " << session->stream_id().substr(0, 8)
              << " for session " << session_key << " (model " << config.model
              << ", " << turns.size() << " prior turns)\n";
    return started;
}

std::shared_ptr<Connection> StreamService::attach(const std::string& session_key) {
    auto session = registry_.get(session_key);
    if (!session) {
        throw NotFoundError("No active stream for chat session " + session_key);
    }
    return broadcaster_.attach(session);
}

void StreamService::detach(const std::shared_ptr<Connection>& conn) {
    broadcaster_.detach(conn);
}

void StreamService::heartbeat(const std::shared_ptr<Connection>& conn) {
    broadcaster_.heartbeat(conn);
}

CancelOutcome StreamService::cancel(const std::string& session_key) {
    return cancellation_.cancel(session_key, CancelReason::UserCancelled);
}

StreamStatus StreamService::status(const std::string& session_key) const {
    StreamStatus st;
    auto session = registry_.get(session_key);
    if (!session) return st;
    st.active = true;
    st.stream_id = session->stream_id();
    st.state = session->state();
    st.connections = session->connection_count();
    st.chunks = session->chunk_count();
    return st;
}

void StreamService::shutdown() {
    shutting_down_.store(true);

    for (const auto& session : registry_.active()) {
        fail(session, "Server is shutting down");
    }

    std::vector<Worker> workers;
    {
        std::lock_guard<std::mutex> lock(workers_mutex_);
        workers.swap(workers_);
    }
    for (auto& w : workers) {
        if (w.thread.joinable()) w.thread.join();
    }
}

void StreamService::run_stream(const std::shared_ptr<StreamSession>& session,
                               const CompletionRequest& request) {
    try {
        OpenedStream opened = provider_.open(request);
        session->install_cancel(opened.cancel);

        std::string chunk;
        while (opened.chunks->next(chunk)) {
            if (!broadcaster_.publish(*session, chunk)) break;
        }
        complete(session);
    } catch (const ProviderError& e) {
        fail(session, e.what());
    } catch (const std::exception& e) {
        fail(session, std::string("Internal error: ") + e.what());
    }
}

void StreamService::complete(const std::shared_ptr<StreamSession>& session) {
    if (session->state() != StreamState::Streaming) return; // cancelled or failed elsewhere

    if (session->buffer_size() == 0) {
        fail(session, "The model returned an empty response");
        return;
    }
    if (!session->transition(StreamState::Streaming, StreamState::Completed)) return;

    std::string text = session->buffer();
    try {
        persister_.append(session->session_key(), Role::Assistant, text);
    } catch (const std::exception& e) {
        session->transition(StreamState::Completed, StreamState::Failed);
        broadcaster_.finish(*session, StreamEvent::failure(
            std::string("Failed to save response: ") + e.what()));
        registry_.end(session->session_key(), session->stream_id());
        std::cerr << "[stream] Persisting " << session->stream_id().substr(0, 8)
                  << " failed: " << e.what() << "\n";
        return;
    }

    broadcaster_.finish(*session, StreamEvent::done());
    registry_.end(session->session_key(), session->stream_id());

    std::cerr << "[stream] Completed " << session->stream_id().substr(0, 8)
              << " for session " << session->session_key() << " ("
              << session->chunk_count() << " chunks, " << text.size() << " bytes)\n";
}

void StreamService::fail(const std::shared_ptr<StreamSession>& session,
                         const std::string& message) {
    if (!session->transition(StreamState::Streaming, StreamState::Failed)) return;

    session->cancel_upstream();
    broadcaster_.finish(*session, StreamEvent::failure(message));
    registry_.end(session->session_key(), session->stream_id());

    std::cerr << "[stream] Failed " << session->stream_id().substr(0, 8)
              << " for session " << session->session_key() << ": " << message << "\n";
}

void StreamService::reap_workers() {
    std::lock_guard<std::mutex> lock(workers_mutex_);
    auto it = workers_.begin();
    while (it != workers_.end()) {
        if (it->done->load()) {
            if (it->thread.joinable()) it->thread.join();
            it = workers_.erase(it);
        } else {
            ++it;
        }
    }
}

} // namespace chatrelay
