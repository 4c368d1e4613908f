#pragma once
#include "message.hpp"
#include "reasoning.hpp"
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace switchboard {

class AttachmentStore;

// One tool call while its deltas are still arriving.
struct StreamedToolCall {
    std::string id;
    std::string type = "function";
    std::string name;
    std::string arguments;
    std::string rationale;
};

// Applies a provider `tool_calls` delta array. Entries are keyed by `index`;
// without one they are matched by `id`, else appended. Names replace,
// argument fragments concatenate.
void merge_tool_calls(std::vector<StreamedToolCall>& accumulator, const nlohmann::json& deltas);

// Calls with a non-blank name and non-blank arguments; missing ids become
// call_<index>.
std::vector<ToolCall> finalize_tool_calls(const std::vector<StreamedToolCall>& calls);

// Named calls whose arguments never arrived, so the caller can report them
// instead of silently dropping them. `finalized` is the count already admitted.
std::vector<ToolCall> fallback_tool_calls(const std::vector<StreamedToolCall>& calls,
                                          size_t finalized);

struct AssistantTurn {
    nlohmann::json content;     // null, string, or array of fragments
    std::vector<ToolCall> tool_calls;
    std::string finish_reason;
    std::string model;
    nlohmann::json usage;       // null when the provider sent none
    nlohmann::json meta;
    std::string generation_id;
    std::vector<ReasoningSegment> reasoning;
    std::vector<std::string> attachment_ids;
    std::string created_at;

    Message to_message() const;
    // finish_reason, tool_calls, model, usage, meta, generation_id, reasoning;
    // absent values are left out.
    nlohmann::json metadata() const;
};

struct TextSplit {
    bool image = false;
    std::string value;
};

// Splits inline data:image/...;base64, URIs out of text. A markdown image
// wrapper "![alt](" before the URI is dropped and its alt text kept.
std::vector<TextSplit> split_text_and_inline_images(const std::string& text);

// Accumulates assistant content. Text stays a plain string until a
// structured fragment shows up.
class ContentBuilder {
public:
    void add_text(const std::string& text);
    void add_structured(const nlohmann::json& fragments);
    void register_attachment(const std::string& attachment_id);

    // Image fragments carrying inline bytes are persisted when a store is
    // given and rewritten to point at the stored copy.
    nlohmann::json finalize(const std::string& session_id, AttachmentStore* store);

    const std::vector<std::string>& attachment_ids() const { return attachment_ids_; }
    bool empty() const { return pieces_.empty(); }

private:
    struct Piece {
        bool text = true;
        std::string value;
        nlohmann::json fragment;
    };
    std::vector<Piece> pieces_;
    std::vector<std::string> attachment_ids_;

    nlohmann::json process_fragment(const nlohmann::json& fragment, const std::string& session_id,
                                    AttachmentStore* store);
};

// Turns a stream of provider chunks into one AssistantTurn.
class TurnDecoder {
public:
    explicit TurnDecoder(std::string session_id = "", AttachmentStore* store = nullptr)
        : session_id_(std::move(session_id)), store_(store) {}

    // One parsed `message` event payload.
    void feed(const nlohmann::json& chunk);
    AssistantTurn finish();

    ContentBuilder& content() { return content_; }

private:
    std::string session_id_;
    AttachmentStore* store_;

    ContentBuilder content_;
    std::vector<StreamedToolCall> tool_calls_;
    std::string finish_reason_;
    std::string model_;
    nlohmann::json usage_;
    nlohmann::json meta_;
    std::string generation_id_;
    std::vector<ReasoningSegment> reasoning_;
    ReasoningKeySet seen_reasoning_;

    void add_reasoning(const nlohmann::json& payload);
    void add_content(const nlohmann::json& value);
};

} // namespace switchboard
