#include "turn_orchestrator.hpp"
#include "capability_digest.hpp"
#include "errors.hpp"
#include "utils.hpp"
#include <iostream>
#include <sstream>

namespace switchboard {

static std::string dump_lenient(const nlohmann::json& j) {
    return j.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

static SseEvent make_event(const std::string& name, const nlohmann::json& data) {
    return {name, dump_lenient(data), ""};
}

static nlohmann::json or_null(const std::string& s) {
    return s.empty() ? nlohmann::json(nullptr) : nlohmann::json(s);
}

// ── ChatRequest ──────────────────────────────────────────────────────

ChatRequest ChatRequest::from_json(const nlohmann::json& j) {
    if (!j.is_object()) throw ConfigError("chat request must be a JSON object");

    static const char* known[] = {
        "session_id", "messages", "message", "model", "tool_choice",
        "contexts", "client", "metadata", "stream",
    };

    ChatRequest r;
    r.session_id = j.value("session_id", "");
    if (j.contains("messages") && j["messages"].is_array()) {
        for (auto& m : j["messages"]) {
            if (!m.is_object() || !m.contains("role")) {
                throw ConfigError("chat request messages need a role");
            }
            r.messages.push_back(Message::from_json(m));
        }
    } else if (j.contains("message") && j["message"].is_string()) {
        r.messages.push_back(Message::text("user", j["message"].get<std::string>()));
    }
    if (r.messages.empty()) throw ConfigError("chat request has no messages");

    r.model = j.value("model", "");
    if (j.contains("tool_choice")) r.tool_choice = j["tool_choice"];
    if (j.contains("contexts")) {
        auto& c = j["contexts"];
        if (c.is_string()) r.contexts.push_back(c.get<std::string>());
        else if (c.is_array()) {
            for (auto& item : c) {
                if (item.is_string()) r.contexts.push_back(item.get<std::string>());
            }
        }
    }
    r.client = j.value("client", "");
    if (j.contains("metadata")) r.metadata = j["metadata"];

    for (auto& [key, value] : j.items()) {
        bool is_known = false;
        for (const char* k : known) {
            if (key == k) { is_known = true; break; }
        }
        if (!is_known) r.settings[key] = value;
    }
    return r;
}

nlohmann::json ChatRequest::to_json() const {
    nlohmann::json j = settings.is_object() ? settings : nlohmann::json::object();
    nlohmann::json msgs = nlohmann::json::array();
    for (auto& m : messages) msgs.push_back(m.to_json());
    j["messages"] = msgs;
    if (!session_id.empty()) j["session_id"] = session_id;
    if (!model.empty()) j["model"] = model;
    if (!tool_choice.is_null()) j["tool_choice"] = tool_choice;
    if (!contexts.empty()) j["contexts"] = contexts;
    if (!client.empty()) j["client"] = client;
    if (!metadata.is_null()) j["metadata"] = metadata;
    return j;
}

// ── RegistryToolExecutor ─────────────────────────────────────────────

nlohmann::json RegistryToolExecutor::tools_for(const std::string& client,
                                               const std::vector<std::string>& contexts) {
    return registry_.tools_spec_for_contexts(contexts, context_limit_, client);
}

std::string RegistryToolExecutor::digest_message(const std::vector<std::string>& contexts) {
    return build_tool_digest_message(registry_.capability_digest(contexts, context_limit_), contexts);
}

ToolCallResult RegistryToolExecutor::call_tool(const std::string& name, const nlohmann::json& args) {
    return registry_.call_tool(name, args);
}

// ── Message preparation ──────────────────────────────────────────────

nlohmann::json prepare_messages_for_model(const std::vector<Message>& messages) {
    nlohmann::json out = nlohmann::json::array();
    for (auto& m : messages) {
        if (m.role != "tool" || !m.content.is_array()) {
            out.push_back(m.to_json());
            continue;
        }

        std::vector<std::string> texts, image_urls, others;
        for (auto& fragment : m.content) {
            if (!fragment.is_object()) continue;
            std::string type = fragment.value("type", "");
            if (type == "text") {
                if (fragment.contains("text") && fragment["text"].is_string()) {
                    texts.push_back(fragment["text"].get<std::string>());
                }
            } else if (type == "image_url") {
                auto& img = fragment.contains("image_url") ? fragment["image_url"] : fragment;
                std::string url = img.is_object() ? trim(img.value("url", "")) : "";
                if (!url.empty()) image_urls.push_back(url);
            } else {
                others.push_back(dump_lenient(fragment));
            }
        }

        std::vector<std::string> parts;
        std::string joined = trim(join(texts, "\n"));
        if (!joined.empty()) parts.push_back(joined);
        parts.insert(parts.end(), others.begin(), others.end());
        if (parts.empty() && !image_urls.empty()) parts.push_back("Tool returned image attachment(s).");
        for (auto& url : image_urls) parts.push_back("Image URL: " + url);

        auto j = m.to_json();
        j["content"] = join(parts, "\n");
        out.push_back(std::move(j));
    }
    return out;
}

static void collect_attachment_ids(const nlohmann::json& value, std::vector<std::string>& found) {
    if (value.is_object()) {
        if (value.contains("attachment_id") && value["attachment_id"].is_string()) {
            std::string id = trim(value["attachment_id"].get<std::string>());
            if (!id.empty()) found.push_back(id);
        }
        for (auto& [_, child] : value.items()) collect_attachment_ids(child, found);
    } else if (value.is_array()) {
        for (auto& item : value) collect_attachment_ids(item, found);
    }
}

std::pair<std::string, std::vector<std::string>> parse_attachment_references(const std::string& text) {
    std::string cleaned = text;
    std::vector<std::string> ids;

    if (text.find("attachment_id:") != std::string::npos) {
        std::vector<std::string> kept;
        std::istringstream in(text);
        std::string line;
        while (std::getline(in, line)) {
            std::string t = trim(line);
            if (starts_with(t, "attachment_id:")) {
                std::string id = trim(t.substr(14));
                if (!id.empty()) ids.push_back(id);
            } else {
                kept.push_back(line);
            }
        }
        cleaned = trim(join(kept, "\n"));
    }

    if (ids.empty()) {
        auto j = nlohmann::json::parse(text, nullptr, false);
        if (!j.is_discarded()) collect_attachment_ids(j, ids);
    }
    return {cleaned, ids};
}

// ── TurnOrchestrator ─────────────────────────────────────────────────

TurnOrchestrator::Options TurnOrchestrator::Options::from_config(const Config& cfg) {
    Options o;
    o.default_model = cfg.model;
    o.system_prompt = cfg.system_prompt;
    o.hop_limit = cfg.tool_hop_limit;
    o.session_aware_tools = cfg.session_aware_tools;
    o.provider_overrides = cfg.provider_overrides;
    o.model_capabilities = cfg.model_capabilities;
    return o;
}

TurnOrchestrator::TurnOrchestrator(Options options, ModelGateway& gateway, ChatRepository& repository,
                                   ToolExecutor& tools, AttachmentStore* attachments,
                                   ConversationLog* conversation_log, NoResultClassifier classifier)
    : options_(std::move(options))
    , gateway_(gateway)
    , repository_(repository)
    , tools_(tools)
    , attachments_(attachments)
    , conversation_log_(conversation_log)
    , classifier_(std::move(classifier))
{}

bool TurnOrchestrator::model_supports_tools(const std::string& model) const {
    auto it = options_.model_capabilities.find(model);
    return it == options_.model_capabilities.end() || it->second.supports_tools;
}

nlohmann::json TurnOrchestrator::build_payload(const std::string& model, const ChatRequest& request,
                                               const std::vector<Message>& preamble,
                                               const std::vector<Message>& state) const {
    nlohmann::json payload = request.settings.is_object() ? request.settings : nlohmann::json::object();

    // Persisted overrides act as defaults; request values win.
    if (options_.provider_overrides.is_object()) {
        for (auto& [key, value] : options_.provider_overrides.items()) {
            if (key == "model") continue;
            if (key == "provider" && value.is_object()) {
                nlohmann::json merged = value;
                if (payload.contains("provider") && payload["provider"].is_object()) {
                    merged.update(payload["provider"]);
                }
                payload["provider"] = merged;
            } else if (!payload.contains(key)) {
                payload[key] = value;
            }
        }
    }

    std::vector<Message> all = preamble;
    all.insert(all.end(), state.begin(), state.end());
    payload["model"] = model;
    payload["stream"] = true;
    payload["messages"] = prepare_messages_for_model(all);
    return payload;
}

void TurnOrchestrator::process_turn(const std::string& requested_session, const ChatRequest& request,
                                    const TurnEventHandler& on_event) {
    std::string session_id = !requested_session.empty() ? requested_session
                           : !request.session_id.empty() ? request.session_id
                           : generate_id("sess_");
    repository_.ensure_session(session_id);
    on_event(make_event("session", {{"session_id", session_id}}));

    std::vector<Message> state;
    for (auto& record : repository_.get_messages(session_id)) state.push_back(std::move(record.message));
    for (auto& m : request.messages) {
        auto stored = repository_.append_message(session_id, m.role, m.content, m.metadata, m.tool_call_id);
        Message copy = m;
        copy.created_at = stored.created_at;
        state.push_back(std::move(copy));
    }

    // Sent to the model every hop, never persisted.
    std::vector<Message> preamble;
    bool has_system = !state.empty() && state.front().role == "system";
    if (!options_.system_prompt.empty() && !has_system) {
        preamble.push_back(Message::text("system", options_.system_prompt));
    }
    auto contexts = normalize_contexts(request.contexts);
    if (!contexts.empty()) {
        std::string digest = tools_.digest_message(contexts);
        if (!digest.empty()) preamble.push_back(Message::text("system", digest));
    }

    std::string model = request.model;
    if (model.empty() && options_.provider_overrides.is_object()) {
        model = options_.provider_overrides.value("model", "");
    }
    if (model.empty()) model = options_.default_model;

    nlohmann::json tools_payload = tools_.tools_for(request.client, contexts);
    std::string choice = request.tool_choice.is_string() ? request.tool_choice.get<std::string>() : "";
    bool tools_disabled = choice == "none";
    bool can_retry_without_tools =
        (request.tool_choice.is_null() || choice == "auto") && !request.tool_choice.is_object();
    bool supports_tools = model_supports_tools(model);
    if (!supports_tools && !tools_payload.empty() && !tools_disabled) {
        std::cerr << "[turn] Model " << model << " does not support tools; sending none\n";
    }

    int hop = 0;
    std::vector<nlohmann::json> pending_attachments;

    while (true) {
        bool allow_tools = !tools_payload.empty() && !tools_disabled && supports_tools;
        nlohmann::json payload = build_payload(model, request, preamble, state);
        if (allow_tools) {
            payload["tools"] = tools_payload;
            if (!payload.contains("tool_choice")) {
                payload["tool_choice"] = request.tool_choice.is_null() ? nlohmann::json("auto")
                                                                       : request.tool_choice;
            }
        } else {
            payload.erase("tools");
            payload.erase("tool_choice");
        }

        TurnDecoder decoder(session_id, attachments_);
        for (auto& fragment : pending_attachments) {
            std::string source = fragment.value("_tool_source", "");
            nlohmann::json clean = fragment;
            clean.erase("_tool_source");
            if (!source.empty()) decoder.content().add_text("Image from " + source + ":");
            decoder.content().add_structured(nlohmann::json::array({clean}));
            nlohmann::json delta = {{"content", nlohmann::json::array({clean})}, {"role", "assistant"}};
            on_event(make_event("message", {{"choices", nlohmann::json::array({{{"delta", delta}, {"index", 0}}})}}));
        }

        nlohmann::json routing;
        bool done = false;
        try {
            gateway_.stream_chat(payload, [&](const SseEvent& ev) {
                if (done || ev.data.empty()) return;
                if (ev.event == "openrouter_headers") {
                    auto parsed = nlohmann::json::parse(ev.data, nullptr, false);
                    if (parsed.is_object()) routing = std::move(parsed);
                    return;
                }
                if (ev.event != "message") {
                    on_event(ev);
                    return;
                }
                if (ev.data == "[DONE]") {
                    done = true;
                    return;
                }
                auto chunk = nlohmann::json::parse(ev.data, nullptr, false);
                if (chunk.is_discarded()) {
                    std::cerr << "[turn] Skipping non-JSON stream payload: "
                              << truncate_preview(ev.data, 120) << "\n";
                    return;
                }
                decoder.feed(chunk);
                on_event(ev);
            });
        } catch (const ProviderError& e) {
            if (allow_tools && can_retry_without_tools && is_tool_support_error(e.status_code, e.detail)) {
                std::cerr << "[turn] Retrying without tools for session " << session_id
                          << ": " << e.what() << "\n";
                tools_disabled = true;
                on_event(make_event("tool", {
                    {"status", "notice"},
                    {"name", "system"},
                    {"message", "Tools unavailable for this model; continuing without them."},
                }));
                continue;
            }
            throw;
        }
        pending_attachments.clear();

        AssistantTurn turn = decoder.finish();
        nlohmann::json metadata = turn.metadata();
        if (routing.is_object() && !routing.empty()) metadata["routing"] = routing;

        auto stored = repository_.append_message(session_id, "assistant", turn.content, metadata, "");
        turn.created_at = stored.created_at;
        Message assistant = turn.to_message();
        assistant.metadata = metadata;
        state.push_back(std::move(assistant));

        on_event(make_event("metadata", {
            {"role", "assistant"},
            {"finish_reason", or_null(turn.finish_reason)},
            {"model", or_null(turn.model)},
            {"usage", turn.usage},
            {"routing", routing},
            {"meta", turn.meta},
            {"generation_id", or_null(turn.generation_id)},
            {"reasoning", turn.reasoning.empty() ? nlohmann::json(nullptr) : nlohmann::json(turn.reasoning)},
            {"tool_calls", turn.tool_calls.empty() ? nlohmann::json(nullptr) : tool_calls_to_json(turn.tool_calls)},
            {"message_id", stored.id},
            {"created_at", stored.created_at},
        }));

        if (turn.tool_calls.empty()) break;

        if (hop >= options_.hop_limit) {
            const std::string warning = "Tool execution stopped after hop limit";
            std::cerr << "[turn] " << warning << " for session " << session_id << "\n";
            on_event(make_event("tool", {{"status", "error"}, {"name", "system"}, {"message", warning}}));
            break;
        }

        HopContext ctx{session_id, hop, state, pending_attachments, on_event};
        for (size_t i = 0; i < turn.tool_calls.size(); i++) {
            execute_tool_call(turn.tool_calls[i], i, ctx);
        }
        hop++;
    }

    if (conversation_log_) {
        conversation_log_->write(session_id, request.to_json(), state);
    }
    on_event({"message", "[DONE]", ""});
}

void TurnOrchestrator::execute_tool_call(const ToolCall& call, size_t index, HopContext& ctx) {
    std::string call_id = call.id.empty() ? "call_" + std::to_string(index) : call.id;
    std::string name = trim(call.name);

    if (name.empty()) {
        const std::string warning = "Tool call missing function name; skipping execution.";
        std::cerr << "[turn] " << warning << "\n";
        record_tool_result("unknown", call_id, "error", warning, ctx);
        return;
    }

    ctx.emit(make_event("tool", {{"status", "started"}, {"name", name}, {"call_id", call_id}}));

    std::string status = "finished";
    std::string result_text;
    bool missing_arguments = false;
    bool tool_error = false;

    if (trim(call.arguments).empty()) {
        result_text = "Tool " + name + " requires arguments but none were provided.";
        status = "error";
        missing_arguments = true;
        std::cerr << "[turn] Missing tool arguments for " << name << "\n";
    } else {
        nlohmann::json args;
        try {
            args = nlohmann::json::parse(call.arguments);
        } catch (const nlohmann::json::parse_error& e) {
            result_text = "Invalid JSON arguments for tool " + name + ": " + e.what();
            status = "error";
            std::cerr << "[turn] Tool argument parse failure for " << name << ": " << e.what() << "\n";
        }

        if (status != "error" && !args.is_object()) {
            result_text = "Tool " + name + " expected a JSON object for arguments but received " +
                          args.type_name() + ".";
            status = "error";
            std::cerr << "[turn] Unexpected tool argument type for " << name << ": " << args.type_name() << "\n";
        }

        if (status != "error") {
            if (tool_requires_session_id(name, options_.session_aware_tools)) {
                std::string existing = args.contains("session_id") && args["session_id"].is_string()
                                           ? trim(args["session_id"].get<std::string>()) : "";
                if (!existing.empty() && existing != ctx.session_id) {
                    std::cerr << "[turn] Overriding session_id '" << existing << "' with '"
                              << ctx.session_id << "' for tool " << name << "\n";
                }
                args["session_id"] = ctx.session_id;
            }
            try {
                ToolCallResult result = tools_.call_tool(name, args);
                result_text = result.text;
                tool_error = result.is_error;
                status = tool_error ? "error" : "finished";
            } catch (const std::exception& e) {
                std::cerr << "[turn] Tool '" << name << "' failed: " << e.what() << "\n";
                result_text = std::string("Tool error: ") + e.what();
                status = "error";
                tool_error = true;
            }
        }
    }

    record_tool_result(name, call_id, status, result_text, ctx);

    FollowupKind reason = classify_tool_followup(status, result_text, tool_error, missing_arguments, classifier_);
    if (reason != FollowupKind::none) {
        ctx.emit(make_event("notice", {
            {"type", "tool_followup_required"},
            {"tool", name},
            {"reason", to_string(reason)},
            {"message", result_text},
            {"attempt", ctx.hop},
            {"confirmation_required", true},
        }));
    }
}

void TurnOrchestrator::record_tool_result(const std::string& tool_name, const std::string& call_id,
                                          const std::string& status, const std::string& result_text,
                                          HopContext& ctx) {
    nlohmann::json metadata = {{"tool_name", tool_name}};
    auto stored = repository_.append_message(ctx.session_id, "tool", result_text, metadata, call_id);

    Message tool_msg;
    tool_msg.role = "tool";
    tool_msg.tool_call_id = call_id;
    tool_msg.metadata = metadata;
    tool_msg.created_at = stored.created_at;
    tool_msg.content = result_text;

    nlohmann::json event = {
        {"status", status},
        {"name", tool_name},
        {"call_id", call_id},
        {"result", result_text},
        {"message_id", stored.id},
        {"created_at", stored.created_at},
    };

    auto [cleaned, attachment_ids] = parse_attachment_references(result_text);
    if (!attachment_ids.empty()) {
        nlohmann::json parts = nlohmann::json::array();
        if (!cleaned.empty()) parts.push_back({{"type", "text"}, {"text", cleaned}});
        for (auto& id : attachment_ids) {
            nlohmann::json meta = {{"attachment_id", id}};
            std::string url;
            if (attachments_) {
                if (auto ref = attachments_->resolve(id)) {
                    url = ref->url;
                    meta["mime_type"] = ref->mime_type;
                    meta["size_bytes"] = ref->size;
                    meta["display_url"] = url;
                    meta["delivery_url"] = url;
                    if (!ref->filename.empty()) meta["filename"] = ref->filename;
                }
            }
            nlohmann::json fragment = {
                {"type", "image_url"},
                {"image_url", {{"url", url}}},
                {"metadata", meta},
            };
            parts.push_back(fragment);
            if (!url.empty()) {
                fragment["_tool_source"] = tool_name;
                ctx.pending_attachments.push_back(std::move(fragment));
            }
        }
        tool_msg.content = parts;
        event["content"] = parts;
    }

    ctx.state.push_back(std::move(tool_msg));
    ctx.emit(make_event("tool", event));
}

} // namespace switchboard
