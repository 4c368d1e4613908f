#pragma once
#include "message.hpp"
#include "utils.hpp"
#include <string>
#include <vector>
#include <fstream>
#include <mutex>
#include <iostream>

namespace switchboard {

// Appends one JSON line per finished turn to
// <dir>/<YYYY-MM-DD>/session_<id>.jsonl for replay and debugging.
class ConversationLog {
public:
    explicit ConversationLog(const std::string& dir) : dir_(expand_path(dir)) {}

    void write(const std::string& session_id, const nlohmann::json& request,
               const std::vector<Message>& conversation) {
        nlohmann::json messages = nlohmann::json::array();
        for (auto& m : conversation) {
            auto j = m.to_json();
            if (!m.created_at.empty()) j["created_at"] = m.created_at;
            messages.push_back(std::move(j));
        }
        nlohmann::json entry = {
            {"type", "conversation_snapshot"},
            {"logged_at", iso_now()},
            {"session_id", session_id},
            {"message_count", conversation.size()},
            {"request", request},
            {"conversation", messages},
        };

        std::lock_guard<std::mutex> lock(mutex_);
        std::string file = file_for(session_id);
        std::error_code ec;
        fs::create_directories(fs::path(file).parent_path(), ec);
        std::ofstream f(file, std::ios::app);
        if (!f) {
            std::cerr << "[turn] Cannot write conversation log " << file << "\n";
            return;
        }
        f << entry.dump() << "\n";
    }

    std::string file_for(const std::string& session_id) const {
        std::string safe = session_id;
        std::replace(safe.begin(), safe.end(), '/', '_');
        return dir_ + "/" + iso_now().substr(0, 10) + "/session_" + safe + ".jsonl";
    }

private:
    std::string dir_;
    std::mutex mutex_;
};

} // namespace switchboard
