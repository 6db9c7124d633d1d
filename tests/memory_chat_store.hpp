#pragma once
#include "chat_store.hpp"
#include "errors.hpp"
#include <map>
#include <mutex>
#include <string>
#include <vector>

namespace chatrelay {

// In-memory stand-in for the application's chat database.
class MemoryChatStore : public SessionConfigSource,
                        public HistoryReader,
                        public MessagePersister {
public:
    struct Appended {
        std::string session_id;
        Role role;
        std::string content;
    };

    bool fail_assistant_append = false;
    bool fail_user_append = false;

    void add_session(const ChatSessionConfig& config) {
        std::lock_guard<std::mutex> lock(mutex_);
        configs_[config.session_id] = config;
    }

    void add_turn(const std::string& session_id, Role role, const std::string& content) {
        std::lock_guard<std::mutex> lock(mutex_);
        auto& turns = history_[session_id];
        turns.push_back(ConversationTurn{role, content, static_cast<int64_t>(turns.size() + 1)});
    }

    ChatSessionConfig load_config(const std::string& session_id) override {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = configs_.find(session_id);
        if (it == configs_.end()) throw NotFoundError("Chat session " + session_id + " not found");
        return it->second;
    }

    std::vector<ConversationTurn> load_history(const std::string& session_id) override {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = history_.find(session_id);
        return it == history_.end() ? std::vector<ConversationTurn>{} : it->second;
    }

    void append(const std::string& session_id, Role role,
                const std::string& content) override {
        std::lock_guard<std::mutex> lock(mutex_);
        if (role == Role::Assistant && fail_assistant_append)
            throw StorageError("disk full");
        if (role == Role::User && fail_user_append)
            throw StorageError("disk full");
        appended_.push_back(Appended{session_id, role, content});
        auto& turns = history_[session_id];
        turns.push_back(ConversationTurn{role, content, static_cast<int64_t>(turns.size() + 1)});
    }

    std::vector<Appended> appended() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return appended_;
    }

    size_t count(Role role) const {
        std::lock_guard<std::mutex> lock(mutex_);
        size_t n = 0;
        for (const auto& a : appended_) if (a.role == role) n++;
        return n;
    }

private:
    mutable std::mutex mutex_;
    std::map<std::string, ChatSessionConfig> configs_;
    std::map<std::string, std::vector<ConversationTurn>> history_;
    std::vector<Appended> appended_;
};

} // namespace chatrelay
