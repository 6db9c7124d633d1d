#pragma once
#include "provider.hpp"
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace chatrelay {

// Resolved configuration of one chat session, copied at stream start.
struct ChatSessionConfig {
    std::string session_id;
    std::string model;                               // provider model id; empty = none selected
    std::string system_prompt;
    std::optional<std::string> pre_prompt;
    bool pre_prompt_enabled = false;
    std::optional<std::string> post_prompt;
    bool post_prompt_enabled = false;
    std::optional<std::string> character_description;
    std::optional<std::string> user_description;
};

// One stored message, in creation order.
struct ConversationTurn {
    Role role;
    std::string content;
    int64_t sequence = 0;
};

class SessionConfigSource {
public:
    virtual ~SessionConfigSource() = default;
    // Throws NotFoundError for an unknown session id.
    virtual ChatSessionConfig load_config(const std::string& session_id) = 0;
};

class HistoryReader {
public:
    virtual ~HistoryReader() = default;
    // Turns ordered oldest first.
    virtual std::vector<ConversationTurn> load_history(const std::string& session_id) = 0;
};

class MessagePersister {
public:
    virtual ~MessagePersister() = default;
    // Append one turn. Throws StorageError (or NotFoundError) on failure.
    virtual void append(const std::string& session_id, Role role,
                        const std::string& content) = 0;
};

} // namespace chatrelay
