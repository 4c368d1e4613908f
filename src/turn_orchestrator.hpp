#pragma once
#include "config.hpp"
#include "message.hpp"
#include "provider.hpp"
#include "chat_repository.hpp"
#include "attachment_store.hpp"
#include "conversation_log.hpp"
#include "tool_followup.hpp"
#include "tool_registry.hpp"
#include "turn_decoder.hpp"
#include <string>
#include <vector>
#include <map>
#include <functional>
#include <nlohmann/json.hpp>

namespace switchboard {

struct ChatRequest {
    std::string session_id;
    std::vector<Message> messages;      // new messages for this turn
    std::string model;                  // empty = configured default
    nlohmann::json tool_choice;         // null, "auto", "none", "required" or an object
    std::vector<std::string> contexts;  // narrows tools and adds a digest
    std::string client;                 // client id for per-client server toggles
    nlohmann::json settings = nlohmann::json::object();  // passed through to the provider
    nlohmann::json metadata;

    // Unknown top-level keys (temperature, max_tokens, ...) land in settings.
    // "message" is accepted as a single user message. Throws ConfigError.
    static ChatRequest from_json(const nlohmann::json& j);
    nlohmann::json to_json() const;
};

using TurnEventHandler = std::function<void(const SseEvent&)>;

// What the orchestrator needs from the tool side.
class ToolExecutor {
public:
    virtual ~ToolExecutor() = default;
    virtual nlohmann::json tools_for(const std::string& client,
                                     const std::vector<std::string>& contexts) = 0;
    // Empty when nothing matches.
    virtual std::string digest_message(const std::vector<std::string>& contexts) = 0;
    virtual ToolCallResult call_tool(const std::string& name, const nlohmann::json& args) = 0;
};

class RegistryToolExecutor : public ToolExecutor {
public:
    RegistryToolExecutor(ToolRegistry& registry, size_t context_limit)
        : registry_(registry), context_limit_(context_limit) {}
    RegistryToolExecutor(ToolRegistry& registry, const Config& cfg)
        : RegistryToolExecutor(registry, static_cast<size_t>(cfg.context_tool_limit)) {}

    nlohmann::json tools_for(const std::string& client,
                             const std::vector<std::string>& contexts) override;
    std::string digest_message(const std::vector<std::string>& contexts) override;
    ToolCallResult call_tool(const std::string& name, const nlohmann::json& args) override;

private:
    ToolRegistry& registry_;
    size_t context_limit_;
};

// Tool messages with fragment content become text: text parts joined, other
// fragments as JSON, image URLs listed. Everything else is passed as is.
nlohmann::json prepare_messages_for_model(const std::vector<Message>& messages);

// Pulls attachment ids out of tool output: "attachment_id: X" lines (removed
// from the returned text) or, failing that, attachment_id fields anywhere in
// a JSON body.
std::pair<std::string, std::vector<std::string>> parse_attachment_references(const std::string& text);

class TurnOrchestrator {
public:
    struct Options {
        std::string default_model;
        std::string system_prompt;
        int hop_limit = 8;
        std::vector<std::string> session_aware_tools;
        nlohmann::json provider_overrides = nlohmann::json::object();
        std::map<std::string, ModelCapabilities> model_capabilities;

        static Options from_config(const Config& cfg);
    };

    TurnOrchestrator(Options options, ModelGateway& gateway, ChatRepository& repository,
                     ToolExecutor& tools, AttachmentStore* attachments = nullptr,
                     ConversationLog* conversation_log = nullptr,
                     NoResultClassifier classifier = NoResultClassifier());

    // Runs one user turn to completion: provider round trips, tool hops and
    // persistence. Events go to on_event in order; the last one is
    // message/[DONE]. ProviderError and StorageError propagate.
    void process_turn(const std::string& session_id, const ChatRequest& request,
                      const TurnEventHandler& on_event);

private:
    Options options_;
    ModelGateway& gateway_;
    ChatRepository& repository_;
    ToolExecutor& tools_;
    AttachmentStore* attachments_;
    ConversationLog* conversation_log_;
    NoResultClassifier classifier_;

    bool model_supports_tools(const std::string& model) const;
    nlohmann::json build_payload(const std::string& model, const ChatRequest& request,
                                 const std::vector<Message>& preamble,
                                 const std::vector<Message>& state) const;

    struct HopContext {
        const std::string& session_id;
        int hop;
        std::vector<Message>& state;
        std::vector<nlohmann::json>& pending_attachments;
        const TurnEventHandler& emit;
    };
    void execute_tool_call(const ToolCall& call, size_t index, HopContext& ctx);
    void record_tool_result(const std::string& tool_name, const std::string& call_id,
                            const std::string& status, const std::string& result_text,
                            HopContext& ctx);
};

} // namespace switchboard
