#pragma once
#include "config.hpp"
#include "server_descriptor.hpp"
#include "mcp_transport.hpp"
#include "child_process.hpp"
#include <string>
#include <vector>
#include <memory>
#include <mutex>
#include <condition_variable>
#include <future>
#include <optional>
#include <thread>
#include <stdexcept>
#include <nlohmann/json.hpp>

namespace switchboard {

enum class ConnectionState { disconnected, connecting, ready, closing, error };

const char* to_string(ConnectionState state);

enum class ConnectionFailure {
    timeout,
    dns,
    refused,
    network,
    http_status,
    malformed_stream,
    process_exited,
    spawn_failed,
    not_connected,
    closed,
    reconnect_refused,
    unexpected,
};

const char* to_string(ConnectionFailure kind);

struct ConnectionError : std::runtime_error {
    ConnectionError(ConnectionFailure k, const std::string& msg, int status = 0)
        : std::runtime_error(msg), kind(k), http_status(status) {}
    ConnectionFailure kind;
    int http_status;
};

struct ConnectionOptions {
    int connect_timeout_ms = 30000;
    int port_poll_ms = 200;
    int close_timeout_ms = 2500;
    int process_grace_ms = 5000;
    int reconnect_backoff_ms = 1000;
    int max_reconnect_attempts = 3;
    int call_timeout_s = 60;
    size_t output_lines = 200;
    std::vector<std::string> module_runner = {"python3", "-m"};

    static ConnectionOptions from_config(const McpConfig& mcp);
};

// Supervises one MCP server: spawn or attach, handshake, tool listing,
// calls, bounded reconnection and teardown.
//
// One supervisor thread per live session. It performs the start-up
// sequence, opens a one-shot ready gate shared by every concurrent
// connect() caller, then holds the session until close() or until the
// child exits. All state is guarded by mutex_; lifecycle_mutex_ serializes
// connect start-up against close().
class ToolConnection {
public:
    ToolConnection(ServerDescriptor descriptor, ConnectionOptions options,
                   TransportFactory factory = default_transport_factory());
    ~ToolConnection();

    ToolConnection(const ToolConnection&) = delete;
    ToolConnection& operator=(const ToolConnection&) = delete;

    // Idempotent; throws ConnectionError describing the failure.
    void connect();
    // Idempotent; a never-connected connection returns immediately.
    void close();
    // Attach-only; bounded by max_reconnect_attempts over the lifetime.
    void reconnect();
    // On-demand recovery for dispatch: attached servers reconnect, spawned
    // ones relaunch. Shares the reconnect budget; throws reconnect_refused
    // once it is spent.
    void recover();

    // Fetch the full (paginated) tool list from the server. Requires ready.
    std::vector<McpToolInfo> list_tools();
    std::vector<McpToolInfo> refresh_tools() { return list_tools(); }
    ToolCallResult call_tool(const std::string& name, const nlohmann::json& args);

    ConnectionState state() const;
    bool ready() const { return state() == ConnectionState::ready; }
    std::vector<McpToolInfo> tools() const;
    std::optional<ConnectionError> last_error() const;
    std::vector<std::string> recent_output() const;
    nlohmann::json server_info() const;
    int reconnect_attempts() const;

    const std::string& server_id() const { return id_; }
    ServerDescriptor descriptor() const;
    // Updates fields that do not require a relaunch.
    void update_descriptor(const ServerDescriptor& descriptor);

private:
    std::string id_;
    ServerDescriptor descriptor_;
    ConnectionOptions options_;
    TransportFactory factory_;
    std::string tag_;

    mutable std::mutex mutex_;
    std::mutex lifecycle_mutex_;
    std::condition_variable close_cv_;
    std::condition_variable done_cv_;

    ConnectionState state_ = ConnectionState::disconnected;
    bool close_requested_ = false;
    bool supervisor_done_ = true;
    std::shared_future<void> ready_gate_;
    std::thread supervisor_;
    std::shared_ptr<McpTransport> transport_;
    std::shared_ptr<ChildProcess> process_;
    std::vector<McpToolInfo> tools_;
    nlohmann::json server_info_;
    std::optional<ConnectionError> last_error_;
    std::vector<std::string> last_output_;
    int reconnect_attempts_ = 0;

    void supervise(std::promise<void> ready);
    void fail_startup(const ConnectionError& err, std::promise<void>& ready);
    void hold_session();
    void stop_supervisor();
    void restart_session(const char* verb);
    std::vector<std::string> launch_argv(const ServerDescriptor& desc) const;
    std::vector<McpToolInfo> fetch_all_tools(McpTransport& transport);
    ConnectionError describe(const TransportError& e, const std::string& endpoint) const;
    std::shared_ptr<McpTransport> require_ready() const;
    void log_output(const std::vector<std::string>& lines) const;
    void mark_disconnected(const ConnectionError& err);
    bool close_requested() const;
};

} // namespace switchboard
