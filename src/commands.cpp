#include "commands.hpp"
#include "config.hpp"
#include "errors.hpp"
#include "chat_repository.hpp"
#include "conversation_log.hpp"
#include "server_descriptor.hpp"
#include "tool_registry.hpp"
#include "turn_orchestrator.hpp"
#include <iostream>
#include <memory>

namespace switchboard {

static Config load_config() {
    Config cfg = Config::load(default_config_path());
    cfg.apply_env_overrides();
    return cfg;
}

static std::unique_ptr<ToolRegistry> open_registry(const Config& cfg) {
    auto registry = std::make_unique<ToolRegistry>(
        ToolRegistry::Options::from_config(cfg.mcp),
        make_connection_factory(ConnectionOptions::from_config(cfg.mcp)));
    registry->apply_configs(load_server_descriptors(cfg.mcp.servers_path));
    return registry;
}

int cmd_init() {
    std::string cfg_path = default_config_path();
    if (fs::exists(cfg_path)) {
        std::cout << "Config already exists: " << cfg_path << "\n";
    } else {
        Config::make_default().save(cfg_path);
        std::cout << "Wrote " << cfg_path << "\n";
    }

    Config cfg = Config::load(cfg_path);
    std::string servers = expand_path(cfg.mcp.servers_path);
    if (fs::exists(servers)) {
        std::cout << "Server list already exists: " << servers << "\n";
    } else {
        save_server_descriptors(servers, {});
        std::cout << "Wrote " << servers << "\n";
    }
    return 0;
}

int cmd_status() {
    Config cfg = load_config();
    std::cout << "=== switchboard status ===\n";
    std::cout << "Config path  : " << default_config_path() << "\n";
    std::cout << "Model        : " << cfg.model << "\n";
    std::cout << "API base     : " << cfg.provider.api_base << "\n";
    std::cout << "API key      : " << (cfg.provider.api_key.empty() ? "(not set)" : "(set)") << "\n";
    std::cout << "Hop limit    : " << cfg.tool_hop_limit << "\n";
    std::cout << "Servers file : " << expand_path(cfg.mcp.servers_path) << "\n";
    std::cout << "Discovery    : ports " << cfg.mcp.discovery_port_start << "-"
              << cfg.mcp.discovery_port_end << (cfg.mcp.lazy_mode ? " (lazy)" : "") << "\n";
    std::cout << "Database     : " << expand_path(cfg.database_path) << "\n";
    std::cout << "Gateway      : " << cfg.gateway_host << ":" << cfg.gateway_port << "\n";

    try {
        auto descriptors = load_server_descriptors(cfg.mcp.servers_path);
        std::cout << "Servers      : " << descriptors.size() << " configured\n";
        for (auto& d : descriptors) {
            std::cout << "  - " << d.id << " (" << (d.is_spawned() ? "spawn" : "attach") << ", "
                      << d.endpoint() << ")" << (d.enabled ? "" : " [disabled]") << "\n";
        }
    } catch (const ConfigError& e) {
        std::cout << "Servers      : invalid (" << e.what() << ")\n";
    }
    return 0;
}

int cmd_servers() {
    Config cfg = load_config();
    std::unique_ptr<ToolRegistry> registry;
    try {
        registry = open_registry(cfg);
    } catch (const ConfigError& e) {
        std::cerr << "[config] " << e.what() << "\n";
        return 1;
    }
    std::cout << registry->describe_servers().dump(2) << "\n";
    registry->close();
    return 0;
}

int cmd_discover() {
    Config cfg = load_config();
    std::unique_ptr<ToolRegistry> registry;
    try {
        registry = open_registry(cfg);
    } catch (const ConfigError& e) {
        std::cerr << "[config] " << e.what() << "\n";
        return 1;
    }
    for (auto& [port, open] : registry->discover_servers()) {
        std::cout << port << ": " << (open ? "open" : "closed") << "\n";
    }
    std::cout << registry->describe_servers().dump(2) << "\n";
    registry->close();
    return 0;
}

int cmd_digest(const std::vector<std::string>& contexts, size_t limit) {
    Config cfg = load_config();
    std::unique_ptr<ToolRegistry> registry;
    try {
        registry = open_registry(cfg);
    } catch (const ConfigError& e) {
        std::cerr << "[config] " << e.what() << "\n";
        return 1;
    }
    auto digest = registry->capability_digest(contexts, limit);
    std::string message = build_tool_digest_message(digest, contexts);
    if (!message.empty()) std::cout << message << "\n\n";
    std::cout << digest_to_json(digest).dump(2) << "\n";
    registry->close();
    return 0;
}

int cmd_call(const std::string& tool, const std::string& arguments) {
    auto args = nlohmann::json::parse(arguments.empty() ? "{}" : arguments, nullptr, false);
    if (args.is_discarded() || !args.is_object()) {
        std::cerr << "Arguments must be a JSON object\n";
        return 1;
    }
    Config cfg = load_config();
    std::unique_ptr<ToolRegistry> registry;
    try {
        registry = open_registry(cfg);
    } catch (const ConfigError& e) {
        std::cerr << "[config] " << e.what() << "\n";
        return 1;
    }
    int rc = 0;
    try {
        auto result = registry->call_tool(tool, args);
        std::cout << result.text << "\n";
        rc = result.is_error ? 2 : 0;
    } catch (const std::runtime_error& e) {
        std::cerr << "[error] " << e.what() << "\n";
        rc = 1;
    }
    registry->close();
    return rc;
}

int cmd_chat(const std::string& message, const std::string& session_id,
             const std::string& model, const std::vector<std::string>& contexts) {
    if (message.empty()) {
        std::cerr << "chat requires -m MESSAGE\n";
        return 1;
    }
    Config cfg = load_config();
    std::unique_ptr<ToolRegistry> registry;
    try {
        registry = open_registry(cfg);
    } catch (const ConfigError& e) {
        std::cerr << "[config] " << e.what() << "\n";
        return 1;
    }

    SqliteChatRepository repository(cfg.database_path);
    FileAttachmentStore attachments(cfg.attachments_dir, cfg.attachments_base_url);
    std::unique_ptr<ConversationLog> conversation_log;
    if (!cfg.conversation_log_dir.empty()) {
        conversation_log = std::make_unique<ConversationLog>(cfg.conversation_log_dir);
    }
    HttpModelGateway provider(cfg.provider);
    RegistryToolExecutor executor(*registry, cfg);
    TurnOrchestrator orchestrator(TurnOrchestrator::Options::from_config(cfg), provider, repository,
                                  executor, &attachments, conversation_log.get());

    ChatRequest request;
    request.session_id = session_id;
    request.model = model;
    request.contexts = contexts;
    request.client = "cli";
    request.messages.push_back(Message::text("user", message));

    int rc = 0;
    try {
        orchestrator.process_turn(session_id, request, [](const SseEvent& ev) {
            if (ev.event == "session") {
                auto j = nlohmann::json::parse(ev.data, nullptr, false);
                if (j.is_object()) std::cerr << "[chat] session " << j.value("session_id", "") << "\n";
            } else if (ev.event == "message" && ev.data != "[DONE]") {
                auto j = nlohmann::json::parse(ev.data, nullptr, false);
                if (!j.is_object() || !j.contains("choices")) return;
                for (auto& choice : j["choices"]) {
                    if (choice.contains("delta") && choice["delta"].contains("content") &&
                        choice["delta"]["content"].is_string()) {
                        std::cout << choice["delta"]["content"].get<std::string>() << std::flush;
                    }
                }
            } else if (ev.event == "tool" || ev.event == "notice") {
                std::cerr << "\n[" << ev.event << "] " << ev.data << "\n";
            }
        });
        std::cout << "\n";
    } catch (const ProviderError& e) {
        std::cerr << "[provider] " << e.what() << "\n";
        rc = 1;
    }
    registry->close();
    return rc;
}

} // namespace switchboard
