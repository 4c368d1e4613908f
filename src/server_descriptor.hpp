#pragma once
#include "errors.hpp"
#include <string>
#include <vector>
#include <map>
#include <set>
#include <nlohmann/json.hpp>

namespace switchboard {

// Declarative description of one MCP tool server.
//
// A server is either spawned (module or command, plus the http_port the child
// listens on) or attached to (http_url and/or http_port, nothing to spawn).
struct ServerDescriptor {
    std::string id;
    std::string module;                 // spawned as <module_runner...> <module>
    std::vector<std::string> command;   // spawned as argv
    std::string http_url;
    int http_port = 0;
    std::map<std::string, std::string> env;
    std::string cwd;
    std::string tool_prefix;
    std::set<std::string> disabled_tools;
    std::vector<std::string> contexts;
    std::map<std::string, std::vector<std::string>> tool_overrides;
    std::map<std::string, bool> client_enabled;
    bool enabled = true;

    bool is_spawned() const { return !module.empty() || !command.empty(); }

    // Full MCP endpoint: http_url when set, else http://127.0.0.1:<port>/mcp.
    std::string endpoint() const;

    // http_port, or the port parsed out of http_url (0 when unknown).
    int port() const;

    // Per-client visibility; an explicit client entry wins over `enabled`.
    bool enabled_for_client(const std::string& client) const;
    bool enabled_for_any_client() const;

    // Context tags for one of this server's tools (override or server default).
    std::vector<std::string> tags_for_tool(const std::string& tool_name) const;

    // Throws ConfigError describing the first violated rule.
    void validate() const;

    nlohmann::json to_json() const;
    static ServerDescriptor from_json(const nlohmann::json& j);
};

// True when the change between a and b requires relaunching the server.
bool restart_fields_differ(const ServerDescriptor& a, const ServerDescriptor& b);

// Accepts a bare list or {"servers": [...]}; later duplicate ids replace
// earlier ones (keeping the later position). Throws ConfigError.
std::vector<ServerDescriptor> parse_server_descriptors(const nlohmann::json& payload);
std::vector<ServerDescriptor> load_server_descriptors(const std::string& path);
void save_server_descriptors(const std::string& path,
                             const std::vector<ServerDescriptor>& servers);

} // namespace switchboard
