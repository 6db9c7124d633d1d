#pragma once
#include "../chat_store.hpp"
#include <mutex>
#include <string>

struct sqlite3; // forward declare

namespace chatrelay {

// Chat sessions, prompts and messages read from the application's SQLite
// database. The schema is owned by the application; this class never
// creates or migrates tables.
class SqliteChatStore : public SessionConfigSource,
                        public HistoryReader,
                        public MessagePersister {
public:
    explicit SqliteChatStore(const std::string& path);
    ~SqliteChatStore() override;

    // Non-copyable
    SqliteChatStore(const SqliteChatStore&) = delete;
    SqliteChatStore& operator=(const SqliteChatStore&) = delete;

    ChatSessionConfig load_config(const std::string& session_id) override;
    std::vector<ConversationTurn> load_history(const std::string& session_id) override;
    void append(const std::string& session_id, Role role,
                const std::string& content) override;

    const std::string& path() const { return path_; }

private:
    std::string path_;
    sqlite3* db_ = nullptr;
    std::mutex mutex_;
};

} // namespace chatrelay
