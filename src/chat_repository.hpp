#pragma once
#include "message.hpp"
#include <string>
#include <vector>
#include <mutex>
#include <cstdint>
#include <sqlite3.h>
#include <nlohmann/json.hpp>

namespace switchboard {

struct StoredMessage {
    int64_t id = 0;
    std::string created_at;
};

struct MessageRecord {
    int64_t id = 0;
    Message message;    // metadata restored; assistant tool_calls rebuilt from it
};

// Chat history persistence. Implementations throw StorageError.
class ChatRepository {
public:
    virtual ~ChatRepository() = default;

    virtual void ensure_session(const std::string& session_id) = 0;
    virtual bool session_exists(const std::string& session_id) = 0;
    // content is a string or an array of fragments.
    virtual StoredMessage append_message(const std::string& session_id, const std::string& role,
                                         const nlohmann::json& content,
                                         const nlohmann::json& metadata,
                                         const std::string& tool_call_id) = 0;
    // Insertion order.
    virtual std::vector<MessageRecord> get_messages(const std::string& session_id) = 0;
    virtual void clear_session(const std::string& session_id) = 0;
};

// Tables chat_sessions and messages. ":memory:" gives a private in-memory DB.
class SqliteChatRepository : public ChatRepository {
public:
    explicit SqliteChatRepository(const std::string& db_path);
    ~SqliteChatRepository() override;

    SqliteChatRepository(const SqliteChatRepository&) = delete;
    SqliteChatRepository& operator=(const SqliteChatRepository&) = delete;

    void ensure_session(const std::string& session_id) override;
    bool session_exists(const std::string& session_id) override;
    StoredMessage append_message(const std::string& session_id, const std::string& role,
                                 const nlohmann::json& content, const nlohmann::json& metadata,
                                 const std::string& tool_call_id) override;
    std::vector<MessageRecord> get_messages(const std::string& session_id) override;
    void clear_session(const std::string& session_id) override;

private:
    sqlite3* db_ = nullptr;
    std::mutex mutex_;

    void init_db();
    sqlite3_stmt* prepare(const char* sql);
};

} // namespace switchboard
