#include "tool_registry.hpp"
#include "net_probe.hpp"
#include "errors.hpp"
#include <iostream>
#include <algorithm>

namespace switchboard {

ToolRegistry::Options ToolRegistry::Options::from_config(const McpConfig& mcp) {
    Options o;
    o.port_start = mcp.discovery_port_start;
    o.port_end = mcp.discovery_port_end;
    o.probe_timeout_ms = mcp.probe_timeout_ms;
    o.lazy_mode = mcp.lazy_mode;
    return o;
}

ToolRegistry::ConnectionFactory make_connection_factory(ConnectionOptions options,
                                                        TransportFactory transport) {
    return [options, transport](const ServerDescriptor& desc) {
        return std::make_shared<ToolConnection>(desc, options, transport);
    };
}

ToolRegistry::ToolRegistry(Options options, ConnectionFactory factory)
    : options_(std::move(options)),
      factory_(std::move(factory)),
      catalog_(std::make_shared<const Catalog>()) {}

ToolRegistry::~ToolRegistry() {
    close();
}

// ── Mutating operations (serialized by mutex_) ──

void ToolRegistry::apply_configs(std::vector<ServerDescriptor> descriptors) {
    std::set<std::string> ids;
    for (auto& d : descriptors) {
        d.validate();
        if (!ids.insert(d.id).second) {
            throw ConfigError("Duplicate MCP server id '" + d.id + "'");
        }
    }

    std::lock_guard<std::mutex> lock(mutex_);
    std::map<std::string, const ServerDescriptor*> incoming;
    for (auto& d : descriptors) incoming[d.id] = &d;

    for (auto it = connections_.begin(); it != connections_.end();) {
        const std::string id = it->first;
        auto found = incoming.find(id);
        const ServerDescriptor* old_desc = find_locked(id);
        if (found == incoming.end() || !found->second->enabled_for_any_client()) {
            std::cerr << "[registry] Stopping MCP server '" << id << "' (removed or disabled)\n";
            it->second->close();
            it = connections_.erase(it);
            continue;
        }
        if (old_desc && restart_fields_differ(*old_desc, *found->second)) {
            std::cerr << "[registry] Launch settings changed for '" << id << "', relaunching\n";
            it->second->close();
            it = connections_.erase(it);
            continue;
        }
        it->second->update_descriptor(*found->second);
        ++it;
    }

    descriptors_ = std::move(descriptors);
    for (auto it = known_tools_.begin(); it != known_tools_.end();) {
        if (!find_locked(it->first)) it = known_tools_.erase(it);
        else ++it;
    }

    if (!options_.lazy_mode) {
        for (auto& d : descriptors_) {
            if (d.enabled_for_any_client() && !connections_.count(d.id)) launch_locked(d);
        }
    }
    rebuild_locked();

    std::cerr << "[registry] MCP config applied: " << connections_.size() << " server(s) connected, "
              << snapshot()->order.size() << " tool(s)\n";
}

void ToolRegistry::connect_all() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (options_.lazy_mode) {
        std::cerr << "[registry] Lazy mode, skipping startup connections\n";
        return;
    }
    for (auto& d : descriptors_) {
        if (d.enabled_for_any_client() && !connections_.count(d.id)) launch_locked(d);
    }
    if (connections_.empty()) {
        std::cerr << "[registry] No MCP servers connected; tool execution is disabled\n";
    }
    rebuild_locked();
}

void ToolRegistry::refresh() {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto it = connections_.begin(); it != connections_.end();) {
        try {
            it->second->refresh_tools();
            ++it;
        } catch (const std::exception& e) {
            std::cerr << "[registry] Failed to refresh tools for '" << it->first << "': " << e.what()
                      << "; removing\n";
            it->second->close();
            known_tools_[it->first].clear();
            it = connections_.erase(it);
        }
    }
    rebuild_locked();
}

std::map<int, bool> ToolRegistry::discover_servers() {
    std::lock_guard<std::mutex> lock(mutex_);
    std::map<int, bool> discovered;

    for (int port = options_.port_start; port <= options_.port_end; port++) {
        bool open = port_open(options_.probe_host, port, options_.probe_timeout_ms);
        discovered[port] = open;
        if (!open) continue;

        auto match = std::find_if(descriptors_.begin(), descriptors_.end(),
                                  [&](const ServerDescriptor& d) { return d.port() == port; });
        if (match == descriptors_.end()) {
            std::cerr << "[registry] MCP server on port " << port << " has no config, skipping\n";
            continue;
        }
        if (!match->enabled_for_any_client()) continue;

        auto existing = connections_.find(match->id);
        if (existing != connections_.end()) {
            if (existing->second->ready()) continue;
            stop_locked(match->id);
        }

        // Something already listens there; attach instead of spawning a second copy.
        ServerDescriptor target = *match;
        if (target.is_spawned()) {
            target.module.clear();
            target.command.clear();
        }
        std::cerr << "[registry] Discovered MCP server '" << target.id << "' on port " << port
                  << ", connecting\n";
        launch_locked(target);
    }
    rebuild_locked();

    std::cerr << "[registry] MCP discovery complete: " << connections_.size() << " server(s) connected, "
              << snapshot()->order.size() << " tool(s)\n";
    return discovered;
}

std::string ToolRegistry::connect_to_url(const std::string& url, const std::string& server_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    ServerDescriptor desc;
    desc.http_url = url;
    desc.id = server_id;

    std::shared_ptr<ToolConnection> probe;
    if (desc.id.empty()) {
        HttpUrl u = parse_http_url(url);
        desc.id = u.host + "-" + std::to_string(u.port);
        desc.validate();
        probe = factory_(desc);
        probe->connect();

        auto info = probe->server_info();
        if (info.is_object() && info.contains("serverInfo") && info["serverInfo"].is_object()) {
            std::string name = trim(info["serverInfo"].value("name", ""));
            if (!name.empty()) {
                name = to_lower(name);
                std::replace(name.begin(), name.end(), ' ', '-');
                desc.id = name;
            }
        }
        if (desc.id != probe->server_id()) {
            probe->close();
            probe.reset();
        }
    }
    desc.validate();

    if (!find_locked(desc.id)) {
        descriptors_.push_back(desc);
    }
    const ServerDescriptor& config = *find_locked(desc.id);

    auto existing = connections_.find(config.id);
    if (existing != connections_.end() && existing->second->ready()) {
        std::cerr << "[registry] Server '" << config.id << "' already connected\n";
        if (probe) probe->close();
    } else if (probe) {
        if (existing != connections_.end()) stop_locked(config.id);
        connections_[config.id] = probe;
    } else {
        if (existing != connections_.end()) stop_locked(config.id);
        auto conn = factory_(config);
        conn->connect();
        connections_[config.id] = conn;
    }
    rebuild_locked();
    return config.id;
}

void ToolRegistry::reconnect_server(const std::string& server_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    const ServerDescriptor* desc = find_locked(server_id);
    if (!desc) {
        throw std::runtime_error("Unknown MCP server: " + server_id);
    }
    auto it = connections_.find(server_id);
    if (it == connections_.end()) {
        auto conn = factory_(*desc);
        conn->connect();
        connections_[server_id] = conn;
    } else if (desc->is_spawned()) {
        it->second->close();
        it->second->connect();
    } else {
        it->second->reconnect();
    }
    launch_errors_.erase(server_id);
    rebuild_locked();
}

void ToolRegistry::close() {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto& [id, conn] : connections_) {
        conn->close();
    }
    connections_.clear();
    publish(std::make_shared<const Catalog>());
}

// Lazy mode: starts configured servers that are not running yet, one at a
// time, until one of them provides `name`. A `{server}__` prefix that names a
// configured server or prefix narrows the search to it.
bool ToolRegistry::launch_on_first_use(const std::string& name) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (snapshot()->bindings.count(name)) return true;

    std::string owner;
    auto sep = name.find("__");
    if (sep != std::string::npos) {
        owner = name.substr(0, sep);
        bool known = std::any_of(descriptors_.begin(), descriptors_.end(), [&](const ServerDescriptor& d) {
            return d.id == owner || d.tool_prefix == owner;
        });
        if (!known) owner.clear();
    }

    std::vector<ServerDescriptor> candidates;
    for (auto& d : descriptors_) {
        if (!d.enabled_for_any_client() || connections_.count(d.id)) continue;
        if (!owner.empty() && d.id != owner && d.tool_prefix != owner) continue;
        candidates.push_back(d);
    }
    for (auto& d : candidates) {
        std::cerr << "[registry] Starting MCP server '" << d.id << "' on first use of '" << name << "'\n";
        if (!launch_locked(d)) continue;
        rebuild_locked();
        if (snapshot()->bindings.count(name)) return true;
    }
    return false;
}

bool ToolRegistry::launch_locked(const ServerDescriptor& desc) {
    auto conn = factory_(desc);
    try {
        conn->connect();
    } catch (const ConnectionError& e) {
        std::cerr << "[registry] " << e.what() << "\n";
        launch_errors_[desc.id] = e.what();
        return false;
    }
    launch_errors_.erase(desc.id);
    connections_[desc.id] = conn;
    return true;
}

void ToolRegistry::stop_locked(const std::string& server_id) {
    auto it = connections_.find(server_id);
    if (it == connections_.end()) return;
    it->second->close();
    connections_.erase(it);
}

const ServerDescriptor* ToolRegistry::find_locked(const std::string& server_id) const {
    for (auto& d : descriptors_) {
        if (d.id == server_id) return &d;
    }
    return nullptr;
}

// Rebuilds bindings, specs and digest entries from the cached tool lists.
void ToolRegistry::rebuild_locked() {
    struct Source {
        const ServerDescriptor* desc;
        std::shared_ptr<ToolConnection> conn;
        std::vector<McpToolInfo> tools;
    };
    std::vector<Source> sources;
    std::map<std::string, int> name_counts;

    for (auto& d : descriptors_) {
        auto it = connections_.find(d.id);
        if (it == connections_.end()) continue;
        Source src{&d, it->second, it->second->tools()};

        std::vector<std::string> names;
        for (auto& t : src.tools) names.push_back(t.name);
        known_tools_[d.id] = names;

        for (auto& t : src.tools) {
            if (!d.disabled_tools.count(t.name)) name_counts[t.name]++;
        }
        sources.push_back(std::move(src));
    }

    auto catalog = std::make_shared<Catalog>();
    for (auto& d : descriptors_) catalog->servers[d.id] = d;

    for (auto& src : sources) {
        const ServerDescriptor& d = *src.desc;
        for (auto& t : src.tools) {
            if (d.disabled_tools.count(t.name)) continue;

            std::string qualified = t.name;
            if (!d.tool_prefix.empty() || name_counts[t.name] > 1) {
                qualified = (d.tool_prefix.empty() ? d.id : d.tool_prefix) + "__" + t.name;
            }
            if (catalog->bindings.count(qualified)) {
                std::cerr << "[registry] Duplicate tool '" << qualified << "' from server '" << d.id
                          << "', skipping\n";
                continue;
            }

            std::string annotated = "[" + d.id + "]";
            if (!t.description.empty()) annotated += " " + t.description;

            ToolBinding b;
            b.qualified_name = qualified;
            b.original_name = t.name;
            b.server_id = d.id;
            b.connection = src.conn;
            b.tags = d.tags_for_tool(t.name);
            b.description = t.description;
            b.schema = t.input_schema;
            b.spec = {
                {"type", "function"},
                {"function", {
                    {"name", qualified},
                    {"description", annotated},
                    {"parameters", t.input_schema}
                }}
            };
            catalog->digest_entries.push_back(
                DigestEntry::make(qualified, t.description, t.input_schema, d.id, b.tags));
            catalog->order.push_back(qualified);
            catalog->bindings.emplace(qualified, std::move(b));
        }
    }
    publish(std::move(catalog));
}

void ToolRegistry::publish(std::shared_ptr<const Catalog> catalog) {
    std::lock_guard<std::mutex> lock(catalog_mutex_);
    catalog_ = std::move(catalog);
}

// ── Readers (snapshot only) ──

std::shared_ptr<const Catalog> ToolRegistry::snapshot() const {
    std::lock_guard<std::mutex> lock(catalog_mutex_);
    return catalog_;
}

ToolCallResult ToolRegistry::call_tool(const std::string& qualified_name, const nlohmann::json& args) {
    auto catalog = snapshot();
    auto it = catalog->bindings.find(qualified_name);
    if (it == catalog->bindings.end() && options_.lazy_mode && launch_on_first_use(qualified_name)) {
        catalog = snapshot();
        it = catalog->bindings.find(qualified_name);
    }
    if (it == catalog->bindings.end()) {
        throw ToolNotFound(qualified_name);
    }
    const ToolBinding& binding = it->second;
    ConnectionState state = binding.connection->state();
    if (state == ConnectionState::connecting) {
        binding.connection->connect();
    } else if (state != ConnectionState::ready) {
        std::cerr << "[registry] Server '" << binding.server_id << "' not ready, recovering on demand\n";
        binding.connection->recover();
    }
    std::cerr << "[registry] Dispatching '" << qualified_name << "' to server '" << binding.server_id << "'\n";
    return binding.connection->call_tool(binding.original_name, args);
}

nlohmann::json ToolRegistry::tools_spec() const {
    auto catalog = snapshot();
    nlohmann::json arr = nlohmann::json::array();
    for (auto& name : catalog->order) arr.push_back(catalog->bindings.at(name).spec);
    return arr;
}

nlohmann::json ToolRegistry::tools_spec_for_client(const std::string& client) const {
    if (client.empty()) return tools_spec();
    auto catalog = snapshot();
    nlohmann::json arr = nlohmann::json::array();
    for (auto& name : catalog->order) {
        auto& b = catalog->bindings.at(name);
        auto srv = catalog->servers.find(b.server_id);
        if (srv != catalog->servers.end() && srv->second.enabled_for_client(client)) {
            arr.push_back(b.spec);
        }
    }
    return arr;
}

nlohmann::json ToolRegistry::tools_spec_for_contexts(const std::vector<std::string>& contexts, size_t limit,
                                                     const std::string& client) const {
    auto ctxs = normalize_contexts(contexts);
    ctxs.erase(std::remove(ctxs.begin(), ctxs.end(), "all"), ctxs.end());
    if (ctxs.empty()) return tools_spec_for_client(client);

    auto catalog = snapshot();
    std::set<std::string> wanted;
    for (auto& ctx : ctxs) {
        for (auto& scored : rank_for_context(catalog->digest_entries, ctx, limit)) {
            wanted.insert(scored.entry.name);
        }
    }
    if (wanted.empty()) return tools_spec_for_client(client);

    nlohmann::json arr = nlohmann::json::array();
    for (auto& name : catalog->order) {
        if (!wanted.count(name)) continue;
        auto& b = catalog->bindings.at(name);
        auto srv = catalog->servers.find(b.server_id);
        if (!client.empty() && srv != catalog->servers.end() && !srv->second.enabled_for_client(client)) continue;
        arr.push_back(b.spec);
    }
    return arr;
}

CapabilityDigest ToolRegistry::capability_digest(const std::vector<std::string>& contexts,
                                                 size_t limit) const {
    return build_capability_digest(snapshot()->digest_entries, contexts, limit);
}

nlohmann::json ToolRegistry::describe_servers() const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto catalog = snapshot();

    std::map<std::string, std::set<std::string>> active;
    for (auto& [name, b] : catalog->bindings) active[b.server_id].insert(b.original_name);

    nlohmann::json details = nlohmann::json::array();
    for (auto& d : descriptors_) {
        auto conn_it = connections_.find(d.id);
        bool connected = conn_it != connections_.end() && conn_it->second->ready();

        std::vector<std::string> known;
        auto kt = known_tools_.find(d.id);
        if (kt != known_tools_.end()) known = kt->second;
        std::sort(known.begin(), known.end());

        nlohmann::json tools = nlohmann::json::array();
        for (auto& name : known) {
            tools.push_back({{"name", name}, {"enabled", active[d.id].count(name) > 0}});
        }

        nlohmann::json entry = {
            {"id", d.id},
            {"url", d.endpoint()},
            {"mode", d.is_spawned() ? "spawn" : "attach"},
            {"enabled", d.enabled},
            {"client_enabled", d.client_enabled},
            {"connected", connected},
            {"state", conn_it != connections_.end() ? to_string(conn_it->second->state()) : "disconnected"},
            {"tool_count", active[d.id].size()},
            {"tools", tools},
            {"disabled_tools", d.disabled_tools},
            {"contexts", d.contexts},
        };
        auto err = launch_errors_.find(d.id);
        if (conn_it != connections_.end()) {
            auto last = conn_it->second->last_error();
            if (last) entry["last_error"] = last->what();
            entry["reconnect_attempts"] = conn_it->second->reconnect_attempts();
        } else if (err != launch_errors_.end()) {
            entry["last_error"] = err->second;
        }
        details.push_back(std::move(entry));
    }
    return details;
}

std::vector<ServerDescriptor> ToolRegistry::configs() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return descriptors_;
}

std::vector<std::string> ToolRegistry::active_servers() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> ids;
    for (auto& [id, conn] : connections_) {
        if (conn->ready()) ids.push_back(id);
    }
    return ids;
}

} // namespace switchboard
