#pragma once
#include "config.hpp"
#include "server_descriptor.hpp"
#include "tool_connection.hpp"
#include "capability_digest.hpp"
#include <string>
#include <vector>
#include <map>
#include <set>
#include <memory>
#include <mutex>
#include <functional>
#include <nlohmann/json.hpp>

namespace switchboard {

struct ToolBinding {
    std::string qualified_name;
    std::string original_name;
    std::string server_id;
    std::shared_ptr<ToolConnection> connection;
    std::vector<std::string> tags;
    std::string description;
    nlohmann::json schema;
    nlohmann::json spec;    // provider-facing function spec
};

// Immutable view published on every rebuild. Readers hold a shared_ptr and
// never observe a half-built catalog.
struct Catalog {
    std::map<std::string, ToolBinding> bindings;
    std::vector<std::string> order;
    std::vector<DigestEntry> digest_entries;
    std::map<std::string, ServerDescriptor> servers;
};

// Aggregates N tool servers behind one collision-free tool namespace.
class ToolRegistry {
public:
    using ConnectionFactory =
        std::function<std::shared_ptr<ToolConnection>(const ServerDescriptor&)>;

    struct Options {
        int port_start = 9001;
        int port_end = 9015;
        int probe_timeout_ms = 500;
        std::string probe_host = "127.0.0.1";
        bool lazy_mode = false;

        static Options from_config(const McpConfig& mcp);
    };

    ToolRegistry(Options options, ConnectionFactory factory);
    ~ToolRegistry();

    ToolRegistry(const ToolRegistry&) = delete;
    ToolRegistry& operator=(const ToolRegistry&) = delete;

    // Diffs against the current set: removed/disabled servers stop, restart
    // fields relaunch, everything else applies in place. Throws ConfigError.
    void apply_configs(std::vector<ServerDescriptor> descriptors);
    void connect_all();
    // Re-fetches every live server's tools; a failing server is dropped alone.
    void refresh();
    // Probes the discovery port range; returns {port: open}.
    std::map<int, bool> discover_servers();
    // Attaches to an MCP endpoint, deriving an id from the server when empty.
    std::string connect_to_url(const std::string& url, const std::string& server_id = "");
    void reconnect_server(const std::string& server_id);
    void close();

    // Throws ToolNotFound for unknown names; transport failures propagate. A
    // binding whose server dropped is recovered within its reconnect budget.
    // In lazy mode an unknown name first starts the configured servers.
    ToolCallResult call_tool(const std::string& qualified_name, const nlohmann::json& args);

    nlohmann::json tools_spec() const;
    nlohmann::json tools_spec_for_client(const std::string& client) const;
    // Tools relevant to any of the contexts, limited per context. With no
    // contexts, or when nothing matches, the client's full set is returned.
    nlohmann::json tools_spec_for_contexts(const std::vector<std::string>& contexts, size_t limit,
                                           const std::string& client = "") const;
    CapabilityDigest capability_digest(const std::vector<std::string>& contexts, size_t limit) const;
    nlohmann::json describe_servers() const;

    std::vector<ServerDescriptor> configs() const;
    std::vector<std::string> active_servers() const;
    std::shared_ptr<const Catalog> snapshot() const;

private:
    Options options_;
    ConnectionFactory factory_;

    mutable std::mutex mutex_;
    std::vector<ServerDescriptor> descriptors_;
    std::map<std::string, std::shared_ptr<ToolConnection>> connections_;
    std::map<std::string, std::vector<std::string>> known_tools_;
    std::map<std::string, std::string> launch_errors_;

    mutable std::mutex catalog_mutex_;
    std::shared_ptr<const Catalog> catalog_;

    bool launch_locked(const ServerDescriptor& desc);
    bool launch_on_first_use(const std::string& name);
    void stop_locked(const std::string& server_id);
    void rebuild_locked();
    void publish(std::shared_ptr<const Catalog> catalog);
    const ServerDescriptor* find_locked(const std::string& server_id) const;
};

ToolRegistry::ConnectionFactory make_connection_factory(
    ConnectionOptions options, TransportFactory transport = default_transport_factory());

} // namespace switchboard
