#include "config.hpp"
#include "errors.hpp"
#include <fstream>
#include <iostream>

namespace switchboard {

bool Config::model_supports_tools(const std::string& model_id) const {
    auto it = model_capabilities.find(model_id);
    if (it == model_capabilities.end()) return true;
    return it->second.supports_tools;
}

Config Config::make_default() {
    Config c;
    c.session_aware_tools = {
        "chat_history",
        "download_gmail_attachment",
        "read_gmail_attachment_text",
        "extract_gmail_attachment_by_id",
        "gdrive_display_image",
    };
    return c;
}

nlohmann::json Config::to_json() const {
    nlohmann::json j;
    j["model"] = model;
    if (!system_prompt.empty()) j["system_prompt"] = system_prompt;
    j["tool_hop_limit"] = tool_hop_limit;
    j["context_tool_limit"] = context_tool_limit;
    j["session_aware_tools"] = session_aware_tools;

    auto& p = j["provider"];
    p["api_base"] = provider.api_base;
    if (!provider.api_key.empty()) p["api_key"] = provider.api_key;
    if (!provider.app_url.empty()) p["app_url"] = provider.app_url;
    if (!provider.app_name.empty()) p["app_name"] = provider.app_name;
    p["connect_timeout"] = provider.connect_timeout;
    p["read_timeout"] = provider.read_timeout;
    if (provider.log_payloads) p["log_payloads"] = true;

    auto& m = j["mcp"];
    m["servers_path"] = mcp.servers_path;
    m["discovery_ports"] = {mcp.discovery_port_start, mcp.discovery_port_end};
    m["probe_timeout_ms"] = mcp.probe_timeout_ms;
    m["lazy_mode"] = mcp.lazy_mode;
    m["connect_timeout_ms"] = mcp.connect_timeout_ms;
    m["port_poll_ms"] = mcp.port_poll_ms;
    m["close_timeout_ms"] = mcp.close_timeout_ms;
    m["process_grace_ms"] = mcp.process_grace_ms;
    m["reconnect_backoff_ms"] = mcp.reconnect_backoff_ms;
    m["max_reconnect_attempts"] = mcp.max_reconnect_attempts;
    m["call_timeout"] = mcp.call_timeout;
    m["module_runner"] = mcp.module_runner;

    j["database_path"] = database_path;
    j["attachments_dir"] = attachments_dir;
    j["attachments_base_url"] = attachments_base_url;
    if (!conversation_log_dir.empty()) j["conversation_log_dir"] = conversation_log_dir;

    j["gateway"] = {{"host", gateway_host}, {"port", gateway_port}};

    for (auto& [id, caps] : model_capabilities) {
        j["model_capabilities"][id] = {{"supports_tools", caps.supports_tools}};
    }
    if (!provider_overrides.empty()) j["provider_overrides"] = provider_overrides;
    return j;
}

static std::vector<std::string> parse_string_array(const nlohmann::json& arr) {
    std::vector<std::string> result;
    if (arr.is_array()) {
        for (auto& item : arr) {
            if (item.is_string()) result.push_back(item.get<std::string>());
        }
    }
    return result;
}

Config Config::from_json(const nlohmann::json& j) {
    Config c = make_default();
    c.model = j.value("model", c.model);
    c.system_prompt = j.value("system_prompt", "");
    c.tool_hop_limit = j.value("tool_hop_limit", c.tool_hop_limit);
    if (c.tool_hop_limit < 1) {
        throw ConfigError("tool_hop_limit must be at least 1");
    }
    c.context_tool_limit = j.value("context_tool_limit", c.context_tool_limit);
    if (c.context_tool_limit < 0) {
        throw ConfigError("context_tool_limit must not be negative");
    }
    if (j.contains("session_aware_tools")) {
        c.session_aware_tools = parse_string_array(j["session_aware_tools"]);
    }

    if (j.contains("provider") && j["provider"].is_object()) {
        auto& p = j["provider"];
        c.provider.api_base = p.value("api_base", c.provider.api_base);
        c.provider.api_key = p.value("api_key", "");
        c.provider.app_url = p.value("app_url", "");
        c.provider.app_name = p.value("app_name", "");
        c.provider.connect_timeout = p.value("connect_timeout", c.provider.connect_timeout);
        c.provider.read_timeout = p.value("read_timeout", c.provider.read_timeout);
        c.provider.log_payloads = p.value("log_payloads", false);
    }

    if (j.contains("mcp") && j["mcp"].is_object()) {
        auto& m = j["mcp"];
        c.mcp.servers_path = m.value("servers_path", c.mcp.servers_path);
        if (m.contains("discovery_ports") && m["discovery_ports"].is_array() &&
            m["discovery_ports"].size() == 2) {
            c.mcp.discovery_port_start = m["discovery_ports"][0].get<int>();
            c.mcp.discovery_port_end = m["discovery_ports"][1].get<int>();
        }
        c.mcp.probe_timeout_ms = m.value("probe_timeout_ms", c.mcp.probe_timeout_ms);
        c.mcp.lazy_mode = m.value("lazy_mode", c.mcp.lazy_mode);
        c.mcp.connect_timeout_ms = m.value("connect_timeout_ms", c.mcp.connect_timeout_ms);
        c.mcp.port_poll_ms = m.value("port_poll_ms", c.mcp.port_poll_ms);
        c.mcp.close_timeout_ms = m.value("close_timeout_ms", c.mcp.close_timeout_ms);
        c.mcp.process_grace_ms = m.value("process_grace_ms", c.mcp.process_grace_ms);
        c.mcp.reconnect_backoff_ms = m.value("reconnect_backoff_ms", c.mcp.reconnect_backoff_ms);
        c.mcp.max_reconnect_attempts = m.value("max_reconnect_attempts", c.mcp.max_reconnect_attempts);
        c.mcp.call_timeout = m.value("call_timeout", c.mcp.call_timeout);
        if (m.contains("module_runner")) {
            auto runner = parse_string_array(m["module_runner"]);
            if (runner.empty()) throw ConfigError("mcp.module_runner must not be empty");
            c.mcp.module_runner = std::move(runner);
        }
    }
    if (c.mcp.discovery_port_start > c.mcp.discovery_port_end) {
        throw ConfigError("mcp.discovery_ports start must not exceed end");
    }

    c.database_path = j.value("database_path", c.database_path);
    c.attachments_dir = j.value("attachments_dir", c.attachments_dir);
    c.attachments_base_url = j.value("attachments_base_url", c.attachments_base_url);
    c.conversation_log_dir = j.value("conversation_log_dir", "");

    if (j.contains("gateway") && j["gateway"].is_object()) {
        c.gateway_host = j["gateway"].value("host", c.gateway_host);
        c.gateway_port = j["gateway"].value("port", c.gateway_port);
    }

    if (j.contains("model_capabilities") && j["model_capabilities"].is_object()) {
        for (auto& [id, caps] : j["model_capabilities"].items()) {
            ModelCapabilities mc;
            if (caps.is_object()) mc.supports_tools = caps.value("supports_tools", true);
            c.model_capabilities[id] = mc;
        }
    }
    if (j.contains("provider_overrides") && j["provider_overrides"].is_object()) {
        c.provider_overrides = j["provider_overrides"];
    }
    return c;
}

void Config::apply_env_overrides() {
    provider.api_key = env_or("SWITCHBOARD_API_KEY", provider.api_key);
    provider.api_base = env_or("SWITCHBOARD_API_BASE", provider.api_base);
    model = env_or("SWITCHBOARD_MODEL", model);
    try {
        mcp.discovery_port_start = std::stoi(env_or("MCP_PORT_START", std::to_string(mcp.discovery_port_start)));
        mcp.discovery_port_end = std::stoi(env_or("MCP_PORT_END", std::to_string(mcp.discovery_port_end)));
    } catch (const std::exception&) {
        std::cerr << "[config] Warning: ignoring non-numeric MCP_PORT_START/MCP_PORT_END\n";
    }
}

Config Config::load(const std::string& path) {
    std::string p = expand_path(path);
    Config c = make_default();
    std::ifstream f(p);
    if (f) {
        try {
            nlohmann::json j;
            f >> j;
            c = from_json(j);
        } catch (const nlohmann::json::exception& e) {
            std::cerr << "[config] Warning: failed to parse " << p << ": " << e.what()
                      << "\n[config] Using defaults.\n";
            c = make_default();
        }
    }
    c.apply_env_overrides();
    return c;
}

void Config::save(const std::string& path) const {
    std::string p = expand_path(path);
    if (fs::path(p).has_parent_path()) fs::create_directories(fs::path(p).parent_path());
    std::ofstream f(p);
    if (!f) throw ConfigError("Cannot write config: " + p);
    f << to_json().dump(2) << "\n";
}

} // namespace switchboard
