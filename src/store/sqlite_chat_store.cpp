#include "sqlite_chat_store.hpp"
#include "../errors.hpp"
#include <sqlite3.h>
#include <iostream>

namespace chatrelay {

// RAII wrapper for sqlite3_stmt
struct StmtGuard {
    sqlite3_stmt* stmt = nullptr;
    ~StmtGuard() { if (stmt) sqlite3_finalize(stmt); }
};

static std::optional<std::string> column_text(sqlite3_stmt* stmt, int col) {
    if (sqlite3_column_type(stmt, col) == SQLITE_NULL) return std::nullopt;
    const auto* text = sqlite3_column_text(stmt, col);
    return std::string(text ? reinterpret_cast<const char*>(text) : "");
}

// Session ids are integer primary keys; anything else cannot match a row.
static int64_t parse_session_id(const std::string& session_id) {
    if (session_id.empty() || session_id.size() > 18)
        throw NotFoundError("Chat session " + session_id + " not found");
    for (char c : session_id) {
        if (c < '0' || c > '9')
            throw NotFoundError("Chat session " + session_id + " not found");
    }
    return std::stoll(session_id);
}

SqliteChatStore::SqliteChatStore(const std::string& path) : path_(path) {
    if (sqlite3_open(path_.c_str(), &db_) != SQLITE_OK) {
        std::string err = db_ ? sqlite3_errmsg(db_) : "unknown error";
        if (db_) {
            sqlite3_close(db_);
            db_ = nullptr;
        }
        throw StorageError("SqliteChatStore: failed to open database: " + err);
    }

    sqlite3_busy_timeout(db_, 5000);
    sqlite3_exec(db_, "PRAGMA foreign_keys=ON;", nullptr, nullptr, nullptr);
    sqlite3_exec(db_, "PRAGMA journal_mode=WAL;", nullptr, nullptr, nullptr);
}

SqliteChatStore::~SqliteChatStore() {
    if (db_) {
        sqlite3_close(db_);
        db_ = nullptr;
    }
}

ChatSessionConfig SqliteChatStore::load_config(const std::string& session_id) {
    int64_t id = parse_session_id(session_id);
    std::lock_guard<std::mutex> lock(mutex_);

    const char* sql =
        "SELECT cs.prePrompt, cs.prePromptEnabled, cs.postPrompt, cs.postPromptEnabled,"
        "       c.description, up.description, am.label, sp.content"
        "  FROM chatSession cs"
        "  LEFT JOIN character c     ON c.id  = cs.character_id"
        "  LEFT JOIN userProfile up  ON up.id = cs.userProfile_id"
        "  LEFT JOIN aiModel am      ON am.id = cs.aiModel_id"
        "  LEFT JOIN systemPrompt sp ON sp.id = cs.systemPrompt_id"
        " WHERE cs.id = ?;";
    StmtGuard g;
    if (sqlite3_prepare_v2(db_, sql, -1, &g.stmt, nullptr) != SQLITE_OK) {
        throw StorageError(std::string("SqliteChatStore: ") + sqlite3_errmsg(db_));
    }
    sqlite3_bind_int64(g.stmt, 1, id);

    int rc = sqlite3_step(g.stmt);
    if (rc == SQLITE_DONE) {
        throw NotFoundError("Chat session " + session_id + " not found");
    }
    if (rc != SQLITE_ROW) {
        throw StorageError(std::string("SqliteChatStore: ") + sqlite3_errmsg(db_));
    }

    ChatSessionConfig config;
    config.session_id = session_id;
    config.pre_prompt = column_text(g.stmt, 0);
    config.pre_prompt_enabled = sqlite3_column_int(g.stmt, 1) != 0;
    config.post_prompt = column_text(g.stmt, 2);
    config.post_prompt_enabled = sqlite3_column_int(g.stmt, 3) != 0;
    config.character_description = column_text(g.stmt, 4);
    config.user_description = column_text(g.stmt, 5);
    config.model = column_text(g.stmt, 6).value_or("");
    config.system_prompt = column_text(g.stmt, 7).value_or("");
    return config;
}

std::vector<ConversationTurn> SqliteChatStore::load_history(const std::string& session_id) {
    int64_t id = parse_session_id(session_id);
    std::lock_guard<std::mutex> lock(mutex_);

    const char* sql =
        "SELECT id, role, content FROM message"
        " WHERE chatSession_id = ? ORDER BY id ASC;";
    StmtGuard g;
    if (sqlite3_prepare_v2(db_, sql, -1, &g.stmt, nullptr) != SQLITE_OK) {
        throw StorageError(std::string("SqliteChatStore: ") + sqlite3_errmsg(db_));
    }
    sqlite3_bind_int64(g.stmt, 1, id);

    std::vector<ConversationTurn> turns;
    int rc;
    while ((rc = sqlite3_step(g.stmt)) == SQLITE_ROW) {
        auto role = role_from_string(column_text(g.stmt, 1).value_or(""));
        if (!role) continue;
        turns.push_back(ConversationTurn{*role, column_text(g.stmt, 2).value_or(""),
                                         sqlite3_column_int64(g.stmt, 0)});
    }
    if (rc != SQLITE_DONE) {
        throw StorageError(std::string("SqliteChatStore: ") + sqlite3_errmsg(db_));
    }
    return turns;
}

void SqliteChatStore::append(const std::string& session_id, Role role,
                             const std::string& content) {
    if (role == Role::System) {
        throw StorageError("SqliteChatStore: system messages are not stored");
    }
    int64_t id = parse_session_id(session_id);
    std::lock_guard<std::mutex> lock(mutex_);

    auto fail = [&](const std::string& what) {
        std::string err = what + ": " + sqlite3_errmsg(db_);
        sqlite3_exec(db_, "ROLLBACK;", nullptr, nullptr, nullptr);
        std::cerr << "[store] " << err << "\n";
        throw StorageError("SqliteChatStore: " + err);
    };

    if (sqlite3_exec(db_, "BEGIN IMMEDIATE;", nullptr, nullptr, nullptr) != SQLITE_OK) {
        throw StorageError(std::string("SqliteChatStore: begin failed: ") + sqlite3_errmsg(db_));
    }

    {
        StmtGuard g;
        const char* sql =
            "UPDATE chatSession SET updatedAt = CURRENT_TIMESTAMP WHERE id = ?;";
        if (sqlite3_prepare_v2(db_, sql, -1, &g.stmt, nullptr) != SQLITE_OK)
            fail("update failed");
        sqlite3_bind_int64(g.stmt, 1, id);
        if (sqlite3_step(g.stmt) != SQLITE_DONE) fail("update failed");
        if (sqlite3_changes(db_) == 0) {
            sqlite3_exec(db_, "ROLLBACK;", nullptr, nullptr, nullptr);
            throw NotFoundError("Chat session " + session_id + " not found");
        }
    }

    {
        StmtGuard g;
        const char* sql =
            "INSERT INTO message (chatSession_id, role, content) VALUES (?, ?, ?);";
        if (sqlite3_prepare_v2(db_, sql, -1, &g.stmt, nullptr) != SQLITE_OK)
            fail("insert failed");
        sqlite3_bind_int64(g.stmt, 1, id);
        sqlite3_bind_text(g.stmt, 2, role_to_string(role), -1, SQLITE_STATIC);
        sqlite3_bind_text(g.stmt, 3, content.c_str(), -1, SQLITE_STATIC);
        if (sqlite3_step(g.stmt) != SQLITE_DONE) fail("insert failed");
    }

    if (sqlite3_exec(db_, "COMMIT;", nullptr, nullptr, nullptr) != SQLITE_OK)
        fail("commit failed");
}

} // namespace chatrelay
