#pragma once
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace switchboard {

struct ToolCall {
    std::string id;
    std::string name;
    std::string arguments; // JSON string, possibly partial while streaming
};

inline nlohmann::json tool_calls_to_json(const std::vector<ToolCall>& calls) {
    nlohmann::json arr = nlohmann::json::array();
    for (auto& tc : calls) {
        arr.push_back({
            {"id", tc.id},
            {"type", "function"},
            {"function", {{"name", tc.name}, {"arguments", tc.arguments}}}
        });
    }
    return arr;
}

// One element of the conversation state. `content` is either a string or an
// ordered array of typed fragments ({"type":"text"|"image_url",...}).
struct Message {
    std::string role;       // "system", "user", "assistant", "tool"
    nlohmann::json content = "";
    std::string tool_call_id;       // for role="tool"
    std::vector<ToolCall> tool_calls; // for role="assistant" with tool calls
    nlohmann::json metadata;        // persisted alongside, never sent to the model
    std::string created_at;

    static Message text(const std::string& role, const std::string& text) {
        Message m;
        m.role = role;
        m.content = text;
        return m;
    }

    nlohmann::json to_json() const {
        nlohmann::json j;
        j["role"] = role;
        if (content.is_null()) {
            j["content"] = "";
        } else {
            j["content"] = content;
        }
        if (!tool_call_id.empty()) j["tool_call_id"] = tool_call_id;
        if (!tool_calls.empty()) j["tool_calls"] = tool_calls_to_json(tool_calls);
        return j;
    }

    static Message from_json(const nlohmann::json& j) {
        Message m;
        m.role = j.value("role", "");
        if (j.contains("content") && !j["content"].is_null()) m.content = j["content"];
        m.tool_call_id = j.value("tool_call_id", "");
        if (j.contains("tool_calls") && j["tool_calls"].is_array()) {
            for (auto& tc : j["tool_calls"]) {
                ToolCall t;
                t.id = tc.value("id", "");
                if (tc.contains("function")) {
                    t.name = tc["function"].value("name", "");
                    t.arguments = tc["function"].value("arguments", "");
                }
                m.tool_calls.push_back(std::move(t));
            }
        }
        return m;
    }
};

} // namespace switchboard
