#include "turn_decoder.hpp"
#include "attachment_store.hpp"
#include "utils.hpp"
#include <iostream>
#include <cctype>

namespace switchboard {

// ── Tool call accumulation ───────────────────────────────────────────

static const size_t kMaxToolCallIndexGap = 16;

void merge_tool_calls(std::vector<StreamedToolCall>& accumulator, const nlohmann::json& deltas) {
    if (!deltas.is_array()) return;
    for (auto& delta : deltas) {
        if (!delta.is_object()) continue;

        std::string delta_id;
        if (delta.contains("id") && delta["id"].is_string()) delta_id = delta["id"].get<std::string>();

        // Indexes far past the calls seen so far are treated as appends.
        size_t index = accumulator.size();
        bool indexed = false;
        if (delta.contains("index") && delta["index"].is_number_integer()) {
            int64_t raw = delta["index"].get<int64_t>();
            if (raw >= 0 && static_cast<uint64_t>(raw) <= accumulator.size() + kMaxToolCallIndexGap) {
                index = static_cast<size_t>(raw);
                indexed = true;
            }
        }
        if (!indexed && !delta_id.empty()) {
            for (size_t i = 0; i < accumulator.size(); i++) {
                if (accumulator[i].id == delta_id) { index = i; break; }
            }
        }
        if (accumulator.size() <= index) accumulator.resize(index + 1);
        auto& entry = accumulator[index];

        if (!delta_id.empty()) entry.id = delta_id;
        if (delta.contains("type") && delta["type"].is_string() &&
            !delta["type"].get<std::string>().empty()) {
            entry.type = delta["type"].get<std::string>();
        }
        if (delta.contains("rationale") && delta["rationale"].is_string()) {
            entry.rationale += delta["rationale"].get<std::string>();
        }

        if (!delta.contains("function") || !delta["function"].is_object()) continue;
        auto& fn = delta["function"];
        if (fn.contains("name") && fn["name"].is_string() && !fn["name"].get<std::string>().empty()) {
            entry.name = fn["name"].get<std::string>();
        }
        if (fn.contains("arguments")) {
            auto& args = fn["arguments"];
            if (args.is_string()) entry.arguments += args.get<std::string>();
            else if (args.is_object()) entry.arguments += args.dump();
        }
        if (fn.contains("rationale") && fn["rationale"].is_string()) {
            entry.rationale += fn["rationale"].get<std::string>();
        }
    }
}

std::vector<ToolCall> finalize_tool_calls(const std::vector<StreamedToolCall>& calls) {
    std::vector<ToolCall> out;
    for (size_t i = 0; i < calls.size(); i++) {
        auto& c = calls[i];
        if (trim(c.name).empty() || trim(c.arguments).empty()) continue;
        out.push_back({c.id.empty() ? "call_" + std::to_string(i) : c.id, c.name, c.arguments});
    }
    return out;
}

std::vector<ToolCall> fallback_tool_calls(const std::vector<StreamedToolCall>& calls,
                                          size_t finalized) {
    std::vector<ToolCall> out;
    for (size_t i = 0; i < calls.size(); i++) {
        auto& c = calls[i];
        std::string name = trim(c.name);
        if (name.empty() || !trim(c.arguments).empty()) continue;
        std::string id = c.id.empty() ? "call_" + std::to_string(finalized + i) : c.id;
        out.push_back({id, name, c.arguments});
    }
    return out;
}

// ── AssistantTurn ────────────────────────────────────────────────────

Message AssistantTurn::to_message() const {
    Message m;
    m.role = "assistant";
    m.content = content.is_null() ? nlohmann::json("") : content;
    m.tool_calls = tool_calls;
    m.metadata = metadata();
    m.created_at = created_at;
    return m;
}

nlohmann::json AssistantTurn::metadata() const {
    nlohmann::json j = nlohmann::json::object();
    if (!finish_reason.empty()) j["finish_reason"] = finish_reason;
    if (!tool_calls.empty()) j["tool_calls"] = tool_calls_to_json(tool_calls);
    if (!model.empty()) j["model"] = model;
    if (!usage.is_null()) j["usage"] = usage;
    if (!meta.is_null()) j["meta"] = meta;
    if (!generation_id.empty()) j["generation_id"] = generation_id;
    if (!reasoning.empty()) j["reasoning"] = reasoning;
    return j;
}

// ── Inline images ────────────────────────────────────────────────────

static bool is_base64_char(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '+' || c == '/' || c == '=';
}

static bool is_mime_char(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '.' || c == '+' || c == '-';
}

// Length of a data:image/<subtype>;base64,<payload> URI at pos, or 0.
static size_t match_data_uri(const std::string& text, const std::string& lowered, size_t pos) {
    static const std::string head = "data:image/";
    static const std::string marker = ";base64,";
    if (lowered.compare(pos, head.size(), head) != 0) return 0;
    size_t i = pos + head.size();
    size_t mime_start = i;
    while (i < text.size() && is_mime_char(text[i])) i++;
    if (i == mime_start) return 0;
    if (lowered.compare(i, marker.size(), marker) != 0) return 0;
    i += marker.size();
    size_t payload_start = i;
    bool padding = false;
    while (i < text.size() && is_base64_char(text[i])) {
        if (text[i] == '=') padding = true;
        else if (padding) break;
        i++;
    }
    if (i == payload_start) return 0;
    return i - pos;
}

// "![alt](" at the end of s; returns its start and the alt text.
static bool markdown_image_prefix(const std::string& s, size_t& start, std::string& alt) {
    if (s.size() < 4 || s.compare(s.size() - 2, 2, "](") != 0) return false;
    size_t close = s.size() - 2;
    size_t open = s.rfind("![", close);
    if (open == std::string::npos) return false;
    std::string inner = s.substr(open + 2, close - open - 2);
    if (inner.find(']') != std::string::npos) return false;
    start = open;
    alt = trim(inner);
    return true;
}

std::vector<TextSplit> split_text_and_inline_images(const std::string& text) {
    std::vector<TextSplit> out;
    if (text.empty()) return out;

    std::string lowered = to_lower(text);
    size_t cursor = 0;
    size_t pos = lowered.find("data:image/");
    while (pos != std::string::npos) {
        size_t len = match_data_uri(text, lowered, pos);
        if (len == 0) {
            pos = lowered.find("data:image/", pos + 1);
            continue;
        }
        std::string before = text.substr(cursor, pos - cursor);
        size_t md_start = 0;
        std::string alt;
        bool wrapped = markdown_image_prefix(before, md_start, alt);
        if (wrapped) {
            if (md_start > 0) out.push_back({false, before.substr(0, md_start)});
            if (!alt.empty()) out.push_back({false, alt + ": "});
        } else if (!before.empty()) {
            out.push_back({false, before});
        }
        out.push_back({true, text.substr(pos, len)});
        cursor = pos + len;
        if (wrapped && cursor < text.size() && text[cursor] == ')') cursor++;
        pos = lowered.find("data:image/", cursor);
    }
    if (cursor < text.size()) out.push_back({false, text.substr(cursor)});
    return out;
}

// ── ContentBuilder ───────────────────────────────────────────────────

void ContentBuilder::add_text(const std::string& text) {
    if (text.empty()) return;
    if (!pieces_.empty() && pieces_.back().text) {
        pieces_.back().value += text;
        return;
    }
    pieces_.push_back({true, text, nullptr});
}

void ContentBuilder::add_structured(const nlohmann::json& fragments) {
    if (!fragments.is_array()) return;
    for (auto& f : fragments) {
        if (f.is_object()) pieces_.push_back({false, "", f});
        else if (f.is_string()) add_text(f.get<std::string>());
    }
}

void ContentBuilder::register_attachment(const std::string& attachment_id) {
    if (attachment_id.empty()) return;
    for (auto& id : attachment_ids_) {
        if (id == attachment_id) return;
    }
    attachment_ids_.push_back(attachment_id);
}

static std::string sniff_mime(const std::string& bytes) {
    if (bytes.compare(0, 8, "\x89PNG\r\n\x1a\n") == 0) return "image/png";
    if (bytes.compare(0, 3, "\xff\xd8\xff") == 0) return "image/jpeg";
    if (bytes.compare(0, 4, "GIF8") == 0) return "image/gif";
    if (bytes.size() >= 12 && bytes.compare(0, 4, "RIFF") == 0 && bytes.compare(8, 4, "WEBP") == 0) {
        return "image/webp";
    }
    return "";
}

// Inline bytes of an image fragment: a data: URL in image_url/image/url, or a
// bare base64 field.
static bool inline_image_bytes(const nlohmann::json& fragment, std::string& bytes, std::string& mime) {
    auto url_of = [](const nlohmann::json& v) -> std::string {
        if (v.is_string()) return v.get<std::string>();
        if (v.is_object() && v.contains("url") && v["url"].is_string()) return v["url"].get<std::string>();
        return "";
    };
    for (const char* key : {"image_url", "image", "url"}) {
        if (!fragment.contains(key)) continue;
        std::string url = trim(url_of(fragment[key]));
        if (!starts_with(url, "data:")) continue;
        size_t comma = url.find(',');
        if (comma == std::string::npos) continue;
        std::string header = to_lower(url.substr(5, comma - 5));
        if (header.find(";base64") == std::string::npos) continue;
        bytes = base64_decode(url.substr(comma + 1));
        mime = header.substr(0, header.find(';'));
        return !bytes.empty();
    }
    for (const char* key : {"b64_json", "image_base64", "image_b64"}) {
        if (!fragment.contains(key) || !fragment[key].is_string()) continue;
        bytes = base64_decode(fragment[key].get<std::string>());
        mime = fragment.value("mime_type", "");
        return !bytes.empty();
    }
    return false;
}

nlohmann::json ContentBuilder::process_fragment(const nlohmann::json& fragment,
                                                const std::string& session_id,
                                                AttachmentStore* store) {
    if (fragment.contains("metadata") && fragment["metadata"].is_object() &&
        fragment["metadata"].contains("attachment_id")) {
        return fragment;
    }

    std::string type = fragment.contains("type") && fragment["type"].is_string()
                           ? to_lower(trim(fragment["type"].get<std::string>()))
                           : "";
    if (type == "text" || type == "output_text") {
        if (fragment.contains("text") && fragment["text"].is_string()) {
            return {{"type", "text"}, {"text", fragment["text"]}};
        }
        return nullptr;
    }
    if (type.empty() && fragment.contains("text") && fragment["text"].is_string()) {
        return {{"type", "text"}, {"text", fragment["text"]}};
    }

    bool image_like = starts_with(type, "image");
    for (const char* key : {"image_url", "image", "b64_json", "image_base64", "image_b64"}) {
        if (fragment.contains(key)) image_like = true;
    }
    if (!image_like || !store) return fragment;

    std::string bytes, mime;
    if (!inline_image_bytes(fragment, bytes, mime)) return fragment;
    if (mime.empty()) mime = sniff_mime(bytes);
    if (mime.empty()) mime = "image/png";

    AttachmentRef ref;
    try {
        ref = store->store(session_id, bytes, mime, "image" + extension_for_mime(mime));
    } catch (const std::exception& e) {
        std::cerr << "[turn] Failed to persist generated image for session " << session_id
                  << ": " << e.what() << "\n";
        return fragment;
    }
    register_attachment(ref.id);

    nlohmann::json metadata = {
        {"attachment_id", ref.id},
        {"display_url", ref.url},
        {"delivery_url", ref.url},
        {"mime_type", ref.mime_type},
        {"size_bytes", ref.size},
        {"session_id", ref.session_id},
        {"uploaded_at", ref.created_at},
        {"filename", ref.filename},
    };
    if (!type.empty()) metadata["source_fragment_type"] = fragment["type"];
    return {
        {"type", "image_url"},
        {"image_url", {{"url", ref.url}}},
        {"metadata", metadata},
    };
}

nlohmann::json ContentBuilder::finalize(const std::string& session_id, AttachmentStore* store) {
    if (pieces_.empty()) return nullptr;

    bool structured = false;
    std::string buffer;
    nlohmann::json parts = nlohmann::json::array();

    auto add_fragment = [&](const nlohmann::json& fragment) {
        if (!buffer.empty()) {
            parts.push_back({{"type", "text"}, {"text", buffer}});
            buffer.clear();
        }
        structured = true;
        auto processed = process_fragment(fragment, session_id, store);
        if (!processed.is_null()) parts.push_back(std::move(processed));
    };

    for (auto& piece : pieces_) {
        if (!piece.text) {
            add_fragment(piece.fragment);
            continue;
        }
        for (auto& seg : split_text_and_inline_images(piece.value)) {
            if (seg.image) {
                add_fragment({{"type", "image_url"}, {"image_url", {{"url", trim(seg.value)}}}});
            } else {
                buffer += seg.value;
            }
        }
    }

    if (!structured) return buffer;
    if (!buffer.empty()) parts.push_back({{"type", "text"}, {"text", buffer}});
    if (parts.empty()) return nullptr;
    return parts;
}

// ── TurnDecoder ──────────────────────────────────────────────────────

void TurnDecoder::add_reasoning(const nlohmann::json& payload) {
    if (payload.is_null()) return;
    extend_reasoning_segments(reasoning_, extract_reasoning_segments(payload), seen_reasoning_);
}

void TurnDecoder::add_content(const nlohmann::json& value) {
    if (value.is_string()) content_.add_text(value.get<std::string>());
    else if (value.is_array()) content_.add_structured(value);
}

void TurnDecoder::feed(const nlohmann::json& chunk) {
    if (!chunk.is_object()) return;

    if (chunk.contains("choices") && chunk["choices"].is_array()) {
        for (auto& choice : chunk["choices"]) {
            if (!choice.is_object()) continue;
            if (choice.contains("delta") && choice["delta"].is_object()) {
                auto& delta = choice["delta"];
                if (delta.contains("content")) add_content(delta["content"]);
                if (delta.contains("images") && delta["images"].is_array()) {
                    content_.add_structured(delta["images"]);
                }
                if (delta.contains("tool_calls")) merge_tool_calls(tool_calls_, delta["tool_calls"]);
                if (delta.contains("reasoning")) add_reasoning(delta["reasoning"]);
            }
            if (choice.contains("finish_reason") && choice["finish_reason"].is_string() &&
                !choice["finish_reason"].get<std::string>().empty()) {
                finish_reason_ = choice["finish_reason"].get<std::string>();
            }
        }
    }

    if (chunk.contains("model") && chunk["model"].is_string()) model_ = chunk["model"].get<std::string>();
    if (chunk.contains("usage") && chunk["usage"].is_object()) usage_ = chunk["usage"];
    if (chunk.contains("meta") && chunk["meta"].is_object()) meta_ = chunk["meta"];
    if (chunk.contains("id") && chunk["id"].is_string() && !chunk["id"].get<std::string>().empty()) {
        generation_id_ = chunk["id"].get<std::string>();
    }

    if (chunk.contains("reasoning")) add_reasoning(chunk["reasoning"]);
    if (chunk.contains("message")) {
        auto& message = chunk["message"];
        if (!message.is_object()) {
            add_reasoning(message);
            return;
        }
        if (message.contains("reasoning")) add_reasoning(message["reasoning"]);
        if (message.contains("content")) add_content(message["content"]);
        if (message.contains("images") && message["images"].is_array()) {
            content_.add_structured(message["images"]);
        }
    }
}

AssistantTurn TurnDecoder::finish() {
    AssistantTurn turn;
    turn.tool_calls = finalize_tool_calls(tool_calls_);
    auto fallback = fallback_tool_calls(tool_calls_, turn.tool_calls.size());
    turn.tool_calls.insert(turn.tool_calls.end(), fallback.begin(), fallback.end());

    auto content = content_.finalize(session_id_, store_);
    if (!(content.is_string() && content.get<std::string>().empty())) turn.content = content;

    turn.finish_reason = finish_reason_;
    turn.model = model_;
    turn.usage = usage_;
    turn.meta = meta_;
    turn.generation_id = generation_id_;
    turn.reasoning = reasoning_;
    turn.attachment_ids = content_.attachment_ids();
    return turn;
}

} // namespace switchboard
