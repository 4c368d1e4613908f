#pragma once
#include <string>
#include <vector>
#include <map>
#include <nlohmann/json.hpp>
#include "utils.hpp"

namespace switchboard {

struct ProviderConfig {
    std::string api_key;
    std::string api_base = "https://openrouter.ai/api/v1";
    std::string app_url;        // sent as HTTP-Referer
    std::string app_name;       // sent as X-Title
    int connect_timeout = 30;   // seconds
    int read_timeout = 120;     // seconds
    bool log_payloads = false;
};

struct McpConfig {
    std::string servers_path = "~/.switchboard/mcp_servers.json";
    int discovery_port_start = 9001;
    int discovery_port_end = 9015;
    int probe_timeout_ms = 500;
    bool lazy_mode = false;
    int connect_timeout_ms = 30000;
    int port_poll_ms = 200;
    int close_timeout_ms = 2500;
    int process_grace_ms = 5000;
    int reconnect_backoff_ms = 1000;
    int max_reconnect_attempts = 3;
    int call_timeout = 60;      // seconds, per tool RPC
    std::vector<std::string> module_runner = {"python3", "-m"};
};

struct ModelCapabilities {
    bool supports_tools = true;
};

struct Config {
    std::string model = "openai/gpt-4o-mini";
    std::string system_prompt;
    int tool_hop_limit = 8;
    int context_tool_limit = 12;    // tools offered per requested context, 0 = no limit
    std::vector<std::string> session_aware_tools;

    ProviderConfig provider;
    McpConfig mcp;

    std::string database_path = "~/.switchboard/chat.db";
    std::string attachments_dir = "~/.switchboard/attachments";
    std::string attachments_base_url = "/api/attachments";
    std::string conversation_log_dir;   // empty = disabled

    std::string gateway_host = "127.0.0.1";
    int gateway_port = 8000;

    std::map<std::string, ModelCapabilities> model_capabilities;
    nlohmann::json provider_overrides = nlohmann::json::object();

    bool model_supports_tools(const std::string& model_id) const;

    static Config make_default();
    // Missing file yields defaults; unreadable JSON is reported and ignored.
    static Config load(const std::string& path);
    void save(const std::string& path) const;
    nlohmann::json to_json() const;
    static Config from_json(const nlohmann::json& j);
    // SWITCHBOARD_API_KEY, SWITCHBOARD_API_BASE, SWITCHBOARD_MODEL,
    // MCP_PORT_START and MCP_PORT_END.
    void apply_env_overrides();
};

} // namespace switchboard
