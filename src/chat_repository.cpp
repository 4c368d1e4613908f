#include "chat_repository.hpp"
#include "errors.hpp"
#include "utils.hpp"

namespace switchboard {

// Marks rows whose content column holds a JSON fragment array.
static const char* kStructuredContentKey = "__content_json__";

SqliteChatRepository::SqliteChatRepository(const std::string& db_path) {
    std::string path = db_path;
    if (path != ":memory:") {
        path = expand_path(db_path);
        auto parent = fs::path(path).parent_path();
        if (!parent.empty()) fs::create_directories(parent);
    }
    int rc = sqlite3_open(path.c_str(), &db_);
    if (rc != SQLITE_OK) {
        std::string msg = db_ ? sqlite3_errmsg(db_) : "out of memory";
        if (db_) sqlite3_close(db_);
        db_ = nullptr;
        throw StorageError("Failed to open chat DB " + path + ": " + msg);
    }
    init_db();
}

SqliteChatRepository::~SqliteChatRepository() {
    if (db_) sqlite3_close(db_);
}

void SqliteChatRepository::init_db() {
    const char* sql = R"(
        PRAGMA foreign_keys = ON;
        CREATE TABLE IF NOT EXISTS chat_sessions (
            session_id TEXT PRIMARY KEY,
            created_at TEXT NOT NULL
        );
        CREATE TABLE IF NOT EXISTS messages (
            id INTEGER PRIMARY KEY AUTOINCREMENT,
            session_id TEXT NOT NULL REFERENCES chat_sessions(session_id) ON DELETE CASCADE,
            role TEXT NOT NULL,
            content TEXT,
            tool_call_id TEXT,
            metadata TEXT,
            created_at TEXT NOT NULL
        );
        CREATE INDEX IF NOT EXISTS idx_messages_session_id ON messages(session_id);
    )";
    char* err = nullptr;
    int rc = sqlite3_exec(db_, sql, nullptr, nullptr, &err);
    if (rc != SQLITE_OK) {
        std::string msg = err ? err : "unknown error";
        sqlite3_free(err);
        throw StorageError("Failed to init chat DB: " + msg);
    }
}

sqlite3_stmt* SqliteChatRepository::prepare(const char* sql) {
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        throw StorageError(std::string("Failed to prepare statement: ") + sqlite3_errmsg(db_));
    }
    return stmt;
}

static std::string column_text(sqlite3_stmt* stmt, int col) {
    auto p = sqlite3_column_text(stmt, col);
    return p ? reinterpret_cast<const char*>(p) : "";
}

void SqliteChatRepository::ensure_session(const std::string& session_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    sqlite3_stmt* stmt = prepare("INSERT OR IGNORE INTO chat_sessions (session_id, created_at) VALUES (?, ?)");
    std::string now = iso_now();
    sqlite3_bind_text(stmt, 1, session_id.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 2, now.c_str(), -1, SQLITE_TRANSIENT);
    int rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);
    if (rc != SQLITE_DONE) {
        throw StorageError("Failed to create session " + session_id + ": " + sqlite3_errmsg(db_));
    }
}

bool SqliteChatRepository::session_exists(const std::string& session_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    sqlite3_stmt* stmt = prepare("SELECT 1 FROM chat_sessions WHERE session_id = ? LIMIT 1");
    sqlite3_bind_text(stmt, 1, session_id.c_str(), -1, SQLITE_TRANSIENT);
    bool found = sqlite3_step(stmt) == SQLITE_ROW;
    sqlite3_finalize(stmt);
    return found;
}

StoredMessage SqliteChatRepository::append_message(const std::string& session_id, const std::string& role,
                                                   const nlohmann::json& content,
                                                   const nlohmann::json& metadata,
                                                   const std::string& tool_call_id) {
    nlohmann::json stored_meta = metadata.is_object() ? metadata : nlohmann::json::object();
    std::string serialized;
    bool has_content = !content.is_null();
    if (content.is_string()) {
        serialized = content.get<std::string>();
    } else if (has_content) {
        serialized = content.dump();
        stored_meta[kStructuredContentKey] = true;
    }
    std::string meta_text = stored_meta.empty() ? "" : stored_meta.dump();

    StoredMessage out;
    out.created_at = iso_now();

    std::lock_guard<std::mutex> lock(mutex_);
    sqlite3_stmt* stmt = prepare(
        "INSERT INTO messages (session_id, role, content, tool_call_id, metadata, created_at) "
        "VALUES (?, ?, ?, ?, ?, ?)");
    sqlite3_bind_text(stmt, 1, session_id.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 2, role.c_str(), -1, SQLITE_TRANSIENT);
    if (has_content) sqlite3_bind_text(stmt, 3, serialized.c_str(), -1, SQLITE_TRANSIENT);
    else sqlite3_bind_null(stmt, 3);
    if (!tool_call_id.empty()) sqlite3_bind_text(stmt, 4, tool_call_id.c_str(), -1, SQLITE_TRANSIENT);
    else sqlite3_bind_null(stmt, 4);
    if (!meta_text.empty()) sqlite3_bind_text(stmt, 5, meta_text.c_str(), -1, SQLITE_TRANSIENT);
    else sqlite3_bind_null(stmt, 5);
    sqlite3_bind_text(stmt, 6, out.created_at.c_str(), -1, SQLITE_TRANSIENT);

    int rc = sqlite3_step(stmt);
    out.id = sqlite3_last_insert_rowid(db_);
    sqlite3_finalize(stmt);

    if (rc != SQLITE_DONE) {
        throw StorageError("Failed to add message to session " + session_id + ": " + sqlite3_errmsg(db_));
    }
    return out;
}

std::vector<MessageRecord> SqliteChatRepository::get_messages(const std::string& session_id) {
    std::vector<MessageRecord> records;
    std::lock_guard<std::mutex> lock(mutex_);
    sqlite3_stmt* stmt = prepare(
        "SELECT id, role, content, tool_call_id, metadata, created_at "
        "FROM messages WHERE session_id = ? ORDER BY id ASC");
    sqlite3_bind_text(stmt, 1, session_id.c_str(), -1, SQLITE_TRANSIENT);

    int rc;
    while ((rc = sqlite3_step(stmt)) == SQLITE_ROW) {
        MessageRecord r;
        r.id = sqlite3_column_int64(stmt, 0);
        Message& m = r.message;
        m.role = column_text(stmt, 1);
        m.tool_call_id = column_text(stmt, 3);
        m.created_at = column_text(stmt, 5);

        nlohmann::json meta = nlohmann::json::object();
        std::string meta_text = column_text(stmt, 4);
        if (!meta_text.empty()) {
            meta = nlohmann::json::parse(meta_text, nullptr, false);
            if (!meta.is_object()) meta = nlohmann::json::object();
        }
        bool structured = meta.value(kStructuredContentKey, false);
        meta.erase(kStructuredContentKey);

        std::string content = column_text(stmt, 2);
        if (structured) {
            auto parsed = nlohmann::json::parse(content, nullptr, false);
            m.content = parsed.is_discarded() ? nlohmann::json(content) : parsed;
        } else {
            m.content = content;
        }

        if (m.role == "assistant" && meta.contains("tool_calls")) {
            m.tool_calls = Message::from_json({{"tool_calls", meta["tool_calls"]}}).tool_calls;
        }
        m.metadata = std::move(meta);
        records.push_back(std::move(r));
    }
    sqlite3_finalize(stmt);
    if (rc != SQLITE_DONE) {
        throw StorageError("Failed to read messages for session " + session_id + ": " + sqlite3_errmsg(db_));
    }
    return records;
}

void SqliteChatRepository::clear_session(const std::string& session_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    sqlite3_stmt* stmt = prepare("DELETE FROM chat_sessions WHERE session_id = ?");
    sqlite3_bind_text(stmt, 1, session_id.c_str(), -1, SQLITE_TRANSIENT);
    int rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);
    if (rc != SQLITE_DONE) {
        throw StorageError("Failed to clear session " + session_id + ": " + sqlite3_errmsg(db_));
    }
}

} // namespace switchboard
