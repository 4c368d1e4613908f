#include "reasoning.hpp"
#include "utils.hpp"

namespace switchboard {

static const char* kTextKeys[] = {
    "text", "output", "content", "reasoning", "message", "details", "explanation",
};

static void push_segment(std::vector<ReasoningSegment>& out, const std::string& text,
                         const std::string& type) {
    ReasoningSegment seg = {{"text", text}};
    if (!type.empty()) seg["type"] = type;
    out.push_back(std::move(seg));
}

static void walk(const nlohmann::json& node, const std::string& type,
                 std::vector<ReasoningSegment>& out) {
    if (node.is_null()) return;

    if (node.is_string()) {
        std::string text = trim(node.get<std::string>());
        if (!text.empty()) push_segment(out, text, type);
        return;
    }
    if (node.is_number() || node.is_boolean()) {
        push_segment(out, node.dump(), type);
        return;
    }
    if (node.is_array()) {
        for (auto& item : node) walk(item, type, out);
        return;
    }
    if (!node.is_object()) return;

    std::string label = type;
    if (node.contains("type") && node["type"].is_string()) {
        std::string t = trim(node["type"].get<std::string>());
        if (!t.empty()) label = t;
    }

    bool extracted = false;
    for (const char* key : kTextKeys) {
        auto it = node.find(key);
        if (it == node.end() || it->is_null()) continue;
        walk(*it, label, out);
        extracted = true;
    }
    if (extracted) return;

    nlohmann::json remaining = nlohmann::json::object();
    for (auto& [key, value] : node.items()) {
        if (key == "type" || key == "id" || key == "index") continue;
        remaining[key] = value;
    }
    if (!remaining.empty()) push_segment(out, remaining.dump(), label);
}

std::vector<ReasoningSegment> extract_reasoning_segments(const nlohmann::json& payload) {
    std::vector<ReasoningSegment> out;
    walk(payload, "", out);
    return out;
}

void extend_reasoning_segments(std::vector<ReasoningSegment>& accumulator,
                               const std::vector<ReasoningSegment>& segments,
                               ReasoningKeySet& seen) {
    for (auto& seg : segments) {
        if (!seg.is_object() || !seg.contains("text") || !seg["text"].is_string()) continue;
        std::string text = trim(seg["text"].get<std::string>());
        if (text.empty()) continue;
        std::string type;
        if (seg.contains("type") && seg["type"].is_string()) type = trim(seg["type"].get<std::string>());
        if (!seen.insert({type, text}).second) continue;

        ReasoningSegment normalized = {{"text", text}};
        if (!type.empty()) normalized["type"] = type;
        accumulator.push_back(std::move(normalized));
    }
}

} // namespace switchboard
