#pragma once
#include <stdexcept>
#include <string>

namespace chatrelay {

// Request input rejected before any work starts (HTTP 400).
class ValidationError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Unknown chat session, or no active stream to attach to (HTTP 404).
class NotFoundError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// The chat session already has a generation in flight (HTTP 409).
class AlreadyStreamingError : public std::runtime_error {
public:
    explicit AlreadyStreamingError(const std::string& session_key)
        : std::runtime_error("A response is already being generated for session " +
                             session_key),
          session_key_(session_key) {}

    const std::string& session_key() const { return session_key_; }

private:
    std::string session_key_;
};

// Missing model or provider credentials (HTTP 503).
class ServiceUnavailableError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Viewer limit reached for a stream (HTTP 429).
class ConnectionLimitError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// SQLite failure in the chat store (HTTP 500).
class StorageError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

} // namespace chatrelay
