#include "server_descriptor.hpp"
#include "net_probe.hpp"
#include "utils.hpp"
#include <fstream>
#include <iostream>

namespace switchboard {

std::string ServerDescriptor::endpoint() const {
    if (!http_url.empty()) return http_url;
    return "http://127.0.0.1:" + std::to_string(http_port) + "/mcp";
}

int ServerDescriptor::port() const {
    if (http_port > 0) return http_port;
    if (!http_url.empty()) return parse_http_url(http_url).port;
    return 0;
}

bool ServerDescriptor::enabled_for_client(const std::string& client) const {
    auto it = client_enabled.find(client);
    if (it != client_enabled.end()) return it->second;
    return enabled;
}

bool ServerDescriptor::enabled_for_any_client() const {
    if (!enabled) return false;
    if (client_enabled.empty()) return true;
    for (auto& [_, on] : client_enabled) {
        if (on) return true;
    }
    return false;
}

std::vector<std::string> ServerDescriptor::tags_for_tool(const std::string& tool_name) const {
    std::vector<std::string> tags;
    auto it = tool_overrides.find(tool_name);
    const auto& source = (it != tool_overrides.end()) ? it->second : contexts;
    for (auto& t : source) {
        std::string tag = to_lower(trim(t));
        if (!tag.empty() && std::find(tags.begin(), tags.end(), tag) == tags.end()) {
            tags.push_back(tag);
        }
    }
    return tags;
}

void ServerDescriptor::validate() const {
    if (trim(id).empty()) {
        throw ConfigError("MCP server id must be a non-empty string");
    }
    const std::string where = "MCP server '" + id + "': ";
    if (!module.empty() && !command.empty()) {
        throw ConfigError(where + "'module' and 'command' are mutually exclusive");
    }
    if (is_spawned()) {
        if (!http_url.empty()) {
            throw ConfigError(where + "'http_url' cannot be combined with a spawned server; use 'http_port'");
        }
        if (http_port <= 0) {
            throw ConfigError(where + "spawned servers require 'http_port'");
        }
    } else if (http_url.empty() && http_port <= 0) {
        throw ConfigError(where + "one of 'module', 'command', 'http_url' or 'http_port' is required");
    }
    if (http_port < 0 || http_port > 65535) {
        throw ConfigError(where + "'http_port' out of range");
    }
    if (!http_url.empty() && !starts_with(http_url, "http://") && !starts_with(http_url, "https://")) {
        throw ConfigError(where + "'http_url' must start with http:// or https://");
    }
}

nlohmann::json ServerDescriptor::to_json() const {
    nlohmann::json j;
    j["id"] = id;
    if (!module.empty()) j["module"] = module;
    if (!command.empty()) j["command"] = command;
    if (!http_url.empty()) j["http_url"] = http_url;
    if (http_port > 0) j["http_port"] = http_port;
    if (!env.empty()) j["env"] = env;
    if (!cwd.empty()) j["cwd"] = cwd;
    if (!tool_prefix.empty()) j["tool_prefix"] = tool_prefix;
    j["disabled_tools"] = disabled_tools;
    if (!contexts.empty()) j["contexts"] = contexts;
    if (!tool_overrides.empty()) {
        auto& o = j["tool_overrides"];
        for (auto& [name, tags] : tool_overrides) o[name] = {{"contexts", tags}};
    }
    if (!client_enabled.empty()) j["client_enabled"] = client_enabled;
    j["enabled"] = enabled;
    return j;
}

static std::vector<std::string> string_list(const nlohmann::json& v, const std::string& field,
                                            const std::string& id) {
    std::vector<std::string> out;
    if (v.is_null()) return out;
    if (v.is_string()) {
        out.push_back(v.get<std::string>());
        return out;
    }
    if (!v.is_array()) {
        throw ConfigError("MCP server '" + id + "': '" + field + "' must be a list of strings");
    }
    for (auto& item : v) {
        if (item.is_string()) out.push_back(item.get<std::string>());
    }
    return out;
}

ServerDescriptor ServerDescriptor::from_json(const nlohmann::json& j) {
    if (!j.is_object()) {
        throw ConfigError("MCP server entry must be an object");
    }
    ServerDescriptor d;
    try {
        d.id = trim(j.value("id", ""));
        d.module = j.value("module", "");
        if (j.contains("command")) {
            if (j["command"].is_string()) {
                d.command.push_back(j["command"].get<std::string>());
            } else {
                d.command = string_list(j["command"], "command", d.id);
            }
        }
        d.http_url = j.value("http_url", j.value("url", ""));
        d.http_port = j.value("http_port", 0);
        if (j.contains("env") && j["env"].is_object()) {
            for (auto& [k, v] : j["env"].items()) {
                d.env[k] = v.is_string() ? v.get<std::string>() : v.dump();
            }
        }
        d.cwd = j.value("cwd", "");
        d.tool_prefix = j.value("tool_prefix", "");
        if (j.contains("disabled_tools")) {
            for (auto& t : string_list(j["disabled_tools"], "disabled_tools", d.id)) {
                d.disabled_tools.insert(t);
            }
        }
        if (j.contains("contexts")) d.contexts = string_list(j["contexts"], "contexts", d.id);
        if (j.contains("tool_overrides") && j["tool_overrides"].is_object()) {
            for (auto& [name, ov] : j["tool_overrides"].items()) {
                if (ov.is_object() && ov.contains("contexts")) {
                    d.tool_overrides[name] = string_list(ov["contexts"], "tool_overrides", d.id);
                } else if (ov.is_array()) {
                    d.tool_overrides[name] = string_list(ov, "tool_overrides", d.id);
                }
            }
        }
        if (j.contains("client_enabled") && j["client_enabled"].is_object()) {
            for (auto& [client, on] : j["client_enabled"].items()) {
                if (on.is_boolean()) d.client_enabled[client] = on.get<bool>();
            }
        }
        d.enabled = j.value("enabled", true);
    } catch (const nlohmann::json::exception& e) {
        throw ConfigError("MCP server '" + d.id + "': " + e.what());
    }
    d.validate();
    return d;
}

bool restart_fields_differ(const ServerDescriptor& a, const ServerDescriptor& b) {
    return a.module != b.module || a.command != b.command || a.http_url != b.http_url ||
           a.http_port != b.http_port || a.cwd != b.cwd || a.env != b.env;
}

std::vector<ServerDescriptor> parse_server_descriptors(const nlohmann::json& payload) {
    const nlohmann::json* items = &payload;
    if (payload.is_object()) {
        if (!payload.contains("servers")) {
            throw ConfigError("Expected 'servers' key in MCP server config");
        }
        items = &payload["servers"];
    }
    if (!items->is_array()) {
        throw ConfigError("MCP server config must be a list or {\"servers\": [...]}");
    }

    std::vector<std::string> errors;
    std::vector<ServerDescriptor> ordered;
    for (auto& raw : *items) {
        try {
            auto d = ServerDescriptor::from_json(raw);
            auto it = std::find_if(ordered.begin(), ordered.end(),
                                   [&](const ServerDescriptor& x) { return x.id == d.id; });
            if (it != ordered.end()) {
                std::cerr << "[config] Overriding MCP server '" << d.id << "' with later entry\n";
                ordered.erase(it);
            }
            ordered.push_back(std::move(d));
        } catch (const ConfigError& e) {
            errors.push_back(e.what());
        }
    }
    if (!errors.empty()) {
        throw ConfigError("Failed to load MCP server configuration:\n" + join(errors, "\n"));
    }
    return ordered;
}

std::vector<ServerDescriptor> load_server_descriptors(const std::string& path) {
    std::string p = expand_path(path);
    if (!fs::exists(p)) return {};
    nlohmann::json payload;
    try {
        payload = nlohmann::json::parse(read_file(p));
    } catch (const nlohmann::json::parse_error& e) {
        throw ConfigError("Invalid JSON in MCP server config " + p + ": " + e.what());
    }
    return parse_server_descriptors(payload);
}

void save_server_descriptors(const std::string& path,
                             const std::vector<ServerDescriptor>& servers) {
    std::string p = expand_path(path);
    if (fs::path(p).has_parent_path()) fs::create_directories(fs::path(p).parent_path());
    nlohmann::json arr = nlohmann::json::array();
    for (auto& s : servers) arr.push_back(s.to_json());
    std::ofstream f(p);
    if (!f) throw ConfigError("Cannot write MCP server config: " + p);
    f << nlohmann::json{{"servers", arr}}.dump(2) << "\n";
    f.flush();
    if (!f) throw ConfigError("Failed writing MCP server config: " + p);
}

} // namespace switchboard
