#include "tool_connection.hpp"
#include "net_probe.hpp"
#include <iostream>
#include <chrono>
#include <algorithm>

namespace switchboard {

using Clock = std::chrono::steady_clock;

const char* to_string(ConnectionState state) {
    switch (state) {
        case ConnectionState::disconnected: return "disconnected";
        case ConnectionState::connecting: return "connecting";
        case ConnectionState::ready: return "ready";
        case ConnectionState::closing: return "closing";
        case ConnectionState::error: return "error";
    }
    return "error";
}

const char* to_string(ConnectionFailure kind) {
    switch (kind) {
        case ConnectionFailure::timeout: return "timeout";
        case ConnectionFailure::dns: return "dns";
        case ConnectionFailure::refused: return "refused";
        case ConnectionFailure::network: return "network";
        case ConnectionFailure::http_status: return "http_status";
        case ConnectionFailure::malformed_stream: return "malformed_stream";
        case ConnectionFailure::process_exited: return "process_exited";
        case ConnectionFailure::spawn_failed: return "spawn_failed";
        case ConnectionFailure::not_connected: return "not_connected";
        case ConnectionFailure::closed: return "closed";
        case ConnectionFailure::reconnect_refused: return "reconnect_refused";
        case ConnectionFailure::unexpected: return "unexpected";
    }
    return "unexpected";
}

ConnectionOptions ConnectionOptions::from_config(const McpConfig& mcp) {
    ConnectionOptions o;
    o.connect_timeout_ms = mcp.connect_timeout_ms;
    o.port_poll_ms = mcp.port_poll_ms;
    o.close_timeout_ms = mcp.close_timeout_ms;
    o.process_grace_ms = mcp.process_grace_ms;
    o.reconnect_backoff_ms = mcp.reconnect_backoff_ms;
    o.max_reconnect_attempts = mcp.max_reconnect_attempts;
    o.call_timeout_s = mcp.call_timeout;
    o.module_runner = mcp.module_runner;
    return o;
}

ToolConnection::ToolConnection(ServerDescriptor descriptor, ConnectionOptions options,
                               TransportFactory factory)
    : id_(descriptor.id),
      descriptor_(std::move(descriptor)),
      options_(std::move(options)),
      factory_(std::move(factory)),
      tag_("mcp:" + id_) {}

ToolConnection::~ToolConnection() {
    close();
}

// ── Lifecycle ──

void ToolConnection::connect() {
    std::shared_future<void> gate;
    {
        std::lock_guard<std::mutex> life(lifecycle_mutex_);
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (state_ == ConnectionState::ready) return;
            if (state_ == ConnectionState::connecting) gate = ready_gate_;
        }
        if (!gate.valid()) {
            // Drop a stale session (failed start-up or broken transport).
            stop_supervisor();

            std::promise<void> ready;
            {
                std::lock_guard<std::mutex> lock(mutex_);
                ready_gate_ = ready.get_future().share();
                gate = ready_gate_;
                state_ = ConnectionState::connecting;
                close_requested_ = false;
                supervisor_done_ = false;
            }
            std::cerr << "[" << tag_ << "] Connecting to " << descriptor().endpoint() << "\n";
            supervisor_ = std::thread(&ToolConnection::supervise, this, std::move(ready));
        }
    }

    // Port wait and handshake are each bounded by the connect timeout.
    auto budget = std::chrono::milliseconds(options_.connect_timeout_ms * 2 + 1000);
    if (gate.wait_for(budget) == std::future_status::timeout) {
        ConnectionError err(ConnectionFailure::timeout,
                            "Failed to connect to MCP server '" + id_ + "': timed out after " +
                            std::to_string(options_.connect_timeout_ms / 1000) + "s");
        std::cerr << "[" << tag_ << "] " << err.what() << "\n";
        close();
        {
            std::lock_guard<std::mutex> lock(mutex_);
            last_error_ = err;
        }
        throw err;
    }
    gate.get();
}

void ToolConnection::close() {
    std::lock_guard<std::mutex> life(lifecycle_mutex_);
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!supervisor_.joinable() && !process_ && !transport_) {
            tools_.clear();
            state_ = ConnectionState::disconnected;
            return;
        }
    }
    std::cerr << "[" << tag_ << "] Closing session\n";
    stop_supervisor();
}

// Requires lifecycle_mutex_. Always leaves the connection disconnected.
void ToolConnection::stop_supervisor() {
    std::shared_ptr<ChildProcess> proc;
    {
        std::unique_lock<std::mutex> lock(mutex_);
        if (supervisor_.joinable()) {
            close_requested_ = true;
            if (state_ == ConnectionState::ready || state_ == ConnectionState::connecting) {
                state_ = ConnectionState::closing;
            }
            close_cv_.notify_all();
            bool done = done_cv_.wait_for(lock, std::chrono::milliseconds(options_.close_timeout_ms),
                                          [this]() { return supervisor_done_; });
            if (!done) {
                std::cerr << "[" << tag_ << "] Session close timed out after "
                          << options_.close_timeout_ms << "ms, terminating\n";
            }
        }
        proc = process_;
    }

    if (proc) {
        proc->terminate(options_.process_grace_ms);
    }
    if (supervisor_.joinable()) supervisor_.join();

    std::lock_guard<std::mutex> lock(mutex_);
    if (proc) last_output_ = proc->recent_output();
    transport_.reset();
    process_.reset();
    tools_.clear();
    server_info_ = nullptr;
    close_requested_ = false;
    supervisor_done_ = true;
    state_ = ConnectionState::disconnected;
}

void ToolConnection::reconnect() {
    ServerDescriptor desc = descriptor();
    if (desc.is_spawned()) {
        throw ConnectionError(ConnectionFailure::reconnect_refused,
                              "Reconnect is only supported for attached MCP servers ('" + id_ +
                              "' is spawned)");
    }
    restart_session("Reconnecting");
}

void ToolConnection::recover() {
    restart_session(descriptor().is_spawned() ? "Relaunching" : "Reconnecting");
}

void ToolConnection::restart_session(const char* verb) {
    int attempt;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (reconnect_attempts_ >= options_.max_reconnect_attempts) {
            ConnectionError err(ConnectionFailure::reconnect_refused,
                                "MCP server '" + id_ + "' exhausted its " +
                                std::to_string(options_.max_reconnect_attempts) +
                                " reconnect attempts");
            last_error_ = err;
            throw err;
        }
        attempt = ++reconnect_attempts_;
    }
    std::cerr << "[" << tag_ << "] " << verb << " (attempt " << attempt << "/"
              << options_.max_reconnect_attempts << ")\n";
    close();
    std::this_thread::sleep_for(std::chrono::milliseconds(options_.reconnect_backoff_ms));
    connect();
}

// ── Supervisor thread ──

void ToolConnection::supervise(std::promise<void> ready) {
    ServerDescriptor desc = descriptor();
    std::string endpoint = desc.endpoint();
    auto deadline = Clock::now() + std::chrono::milliseconds(options_.connect_timeout_ms);
    auto remaining_ms = [&]() {
        auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - Clock::now()).count();
        return static_cast<int>(std::max<long long>(left, 1));
    };

    try {
        if (desc.is_spawned()) {
            auto proc = std::make_shared<ChildProcess>(tag_, options_.output_lines);
            {
                std::lock_guard<std::mutex> lock(mutex_);
                process_ = proc;
            }
            auto argv = launch_argv(desc);
            try {
                proc->spawn(argv, desc.env, desc.cwd);
            } catch (const std::runtime_error& e) {
                throw ConnectionError(ConnectionFailure::spawn_failed,
                                      "Failed to spawn '" + join(argv, " ") + "': " + e.what());
            }
            std::cerr << "[" << tag_ << "] Spawned '" << join(argv, " ") << "', waiting for port "
                      << desc.port() << "\n";

            bool up = wait_for_port("127.0.0.1", desc.port(), options_.connect_timeout_ms,
                                    options_.port_poll_ms, [&]() {
                                        return !close_requested() && proc->running();
                                    });
            if (!up) {
                if (close_requested()) {
                    throw ConnectionError(ConnectionFailure::closed, "closed while connecting");
                }
                if (!proc->running()) {
                    throw ConnectionError(ConnectionFailure::process_exited,
                                          "process exited with code " + std::to_string(proc->exit_code()) +
                                          " before opening port " + std::to_string(desc.port()));
                }
                throw ConnectionError(ConnectionFailure::timeout,
                                      "Timeout waiting for port " + std::to_string(desc.port()) + " after " +
                                      std::to_string(options_.connect_timeout_ms / 1000) + "s");
            }
            // The port wait consumed part of the budget; the handshake gets a fresh one.
            deadline = Clock::now() + std::chrono::milliseconds(options_.connect_timeout_ms);
        }

        if (close_requested()) {
            throw ConnectionError(ConnectionFailure::closed, "closed while connecting");
        }

        // The handshake is bounded by what is left of the connect budget; the
        // transport then lives on for tool calls with the call timeout.
        TransportOptions topts;
        topts.connect_timeout_ms = std::min(options_.connect_timeout_ms, remaining_ms());
        topts.handshake_timeout_s = remaining_ms() / 1000 + 1;
        topts.read_timeout_s = std::max(1, options_.call_timeout_s);
        std::shared_ptr<McpTransport> transport(factory_(endpoint, topts));
        nlohmann::json info = transport->initialize();
        auto tools = fetch_all_tools(*transport);

        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (close_requested_) {
                throw ConnectionError(ConnectionFailure::closed, "closed while connecting");
            }
            transport_ = transport;
            tools_ = tools;
            server_info_ = info;
            state_ = ConnectionState::ready;
            last_error_.reset();
        }
        std::cerr << "[" << tag_ << "] Connected, " << tools.size() << " tool(s)\n";
        ready.set_value();
    } catch (const TransportError& e) {
        auto err = describe(e, endpoint);
        fail_startup(ConnectionError(err.kind, "Failed to connect to MCP server '" + id_ + "': " + err.what(),
                                     err.http_status), ready);
        return;
    } catch (const ConnectionError& e) {
        fail_startup(ConnectionError(e.kind, "Failed to connect to MCP server '" + id_ + "': " + e.what(),
                                     e.http_status), ready);
        return;
    } catch (const std::exception& e) {
        fail_startup(ConnectionError(ConnectionFailure::unexpected,
                                     "Failed to connect to MCP server '" + id_ +
                                     "': Unexpected error connecting to MCP server '" + endpoint + "': " + e.what()),
                     ready);
        return;
    }

    hold_session();
}

void ToolConnection::fail_startup(const ConnectionError& err, std::promise<void>& ready) {
    std::shared_ptr<ChildProcess> proc;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        proc = process_;
    }
    if (proc) proc->terminate(options_.process_grace_ms);

    std::vector<std::string> output = proc ? proc->recent_output() : std::vector<std::string>{};
    std::cerr << "[" << tag_ << "] " << err.what() << "\n";
    log_output(output);

    {
        std::lock_guard<std::mutex> lock(mutex_);
        last_error_ = err;
        last_output_ = output;
        state_ = ConnectionState::error;
        supervisor_done_ = true;
    }
    done_cv_.notify_all();
    ready.set_exception(std::make_exception_ptr(err));
}

void ToolConnection::hold_session() {
    std::unique_lock<std::mutex> lock(mutex_);
    while (!close_requested_ && state_ == ConnectionState::ready) {
        close_cv_.wait_for(lock, std::chrono::milliseconds(250));
        if (close_requested_ || !process_ || process_->running()) continue;

        ConnectionError err(ConnectionFailure::process_exited,
                            "MCP server '" + id_ + "' exited unexpectedly with code " +
                            std::to_string(process_->exit_code()));
        last_error_ = err;
        last_output_ = process_->recent_output();
        state_ = ConnectionState::disconnected;
        std::cerr << "[" << tag_ << "] " << err.what() << "\n";
        log_output(last_output_);
    }

    auto transport = transport_;
    bool closing = close_requested_;
    lock.unlock();

    if (transport && closing) {
        try {
            transport->close();
        } catch (const std::exception& e) {
            std::cerr << "[" << tag_ << "] Error closing MCP session: " << e.what() << "\n";
        }
    }

    lock.lock();
    supervisor_done_ = true;
    lock.unlock();
    done_cv_.notify_all();
}

// ── Operations ──

std::shared_ptr<McpTransport> ToolConnection::require_ready() const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (state_ != ConnectionState::ready || !transport_) {
        throw ConnectionError(ConnectionFailure::not_connected,
                              "MCP server '" + id_ + "' is not connected (state: " + to_string(state_) + ")");
    }
    return transport_;
}

std::vector<McpToolInfo> ToolConnection::fetch_all_tools(McpTransport& transport) {
    std::vector<McpToolInfo> out;
    std::string cursor;
    for (int page = 0; page < 64; page++) {
        McpToolPage p = transport.list_tools(cursor);
        for (auto& t : p.tools) out.push_back(std::move(t));
        if (p.next_cursor.empty() || p.next_cursor == cursor) break;
        cursor = p.next_cursor;
    }
    return out;
}

std::vector<McpToolInfo> ToolConnection::list_tools() {
    auto transport = require_ready();
    std::vector<McpToolInfo> tools;
    try {
        tools = fetch_all_tools(*transport);
    } catch (const TransportError& e) {
        if (e.kind == TransportFailure::rpc_error) throw;
        auto err = describe(e, descriptor().endpoint());
        mark_disconnected(err);
        throw err;
    }
    std::lock_guard<std::mutex> lock(mutex_);
    tools_ = tools;
    return tools;
}

ToolCallResult ToolConnection::call_tool(const std::string& name, const nlohmann::json& args) {
    auto transport = require_ready();
    std::cerr << "[" << tag_ << "] Calling tool '" << name << "'\n";
    try {
        return parse_tool_result(transport->call_tool(name, args));
    } catch (const TransportError& e) {
        std::cerr << "[" << tag_ << "] Tool '" << name << "' FAILED: " << e.what() << "\n";
        if (e.kind == TransportFailure::rpc_error) throw;
        auto err = describe(e, descriptor().endpoint());
        mark_disconnected(err);
        throw err;
    }
}

void ToolConnection::mark_disconnected(const ConnectionError& err) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (state_ == ConnectionState::ready) state_ = ConnectionState::disconnected;
        last_error_ = err;
    }
    close_cv_.notify_all();
    std::cerr << "[" << tag_ << "] Marked disconnected: " << err.what() << "\n";
}

ConnectionError ToolConnection::describe(const TransportError& e, const std::string& endpoint) const {
    const std::string where = "MCP server '" + endpoint + "'";
    switch (e.kind) {
        case TransportFailure::timeout:
            return ConnectionError(ConnectionFailure::timeout,
                                   "Timeout connecting to " + where + " after " +
                                   std::to_string(options_.connect_timeout_ms / 1000) + "s (" + e.what() + ")");
        case TransportFailure::dns:
            return ConnectionError(ConnectionFailure::dns, "DNS resolution failed for " + where + ": " + e.what());
        case TransportFailure::refused:
            return ConnectionError(ConnectionFailure::refused, "Connection refused to " + where);
        case TransportFailure::network:
            return ConnectionError(ConnectionFailure::network, "Network error connecting to " + where + ": " + e.what());
        case TransportFailure::http_status: {
            int code = e.http_status;
            std::string msg;
            if (code == 401) msg = "Authentication required for " + where;
            else if (code == 403) msg = "Access forbidden to " + where;
            else if (code == 404) msg = "MCP endpoint not found '" + endpoint + "'";
            else if (code >= 500) msg = "Server error from " + where + ": " + std::to_string(code);
            else msg = "HTTP error from " + where + ": " + std::to_string(code);
            return ConnectionError(ConnectionFailure::http_status, msg, code);
        }
        case TransportFailure::malformed_stream:
            return ConnectionError(ConnectionFailure::malformed_stream,
                                   "Invalid stream format from " + where + ": " + e.what());
        case TransportFailure::rpc_error:
        case TransportFailure::unexpected:
            break;
    }
    return ConnectionError(ConnectionFailure::unexpected,
                           "Unexpected error connecting to " + where + ": " + e.what());
}

void ToolConnection::log_output(const std::vector<std::string>& lines) const {
    if (lines.empty()) return;
    size_t start = lines.size() > 20 ? lines.size() - 20 : 0;
    std::cerr << "[" << tag_ << "] Recent output:\n";
    for (size_t i = start; i < lines.size(); i++) {
        std::cerr << "    | " << lines[i] << "\n";
    }
}

std::vector<std::string> ToolConnection::launch_argv(const ServerDescriptor& desc) const {
    if (!desc.command.empty()) return desc.command;
    std::vector<std::string> argv = options_.module_runner;
    argv.push_back(desc.module);
    return argv;
}

// ── Accessors ──

bool ToolConnection::close_requested() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return close_requested_;
}

ConnectionState ToolConnection::state() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_;
}

std::vector<McpToolInfo> ToolConnection::tools() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return tools_;
}

std::optional<ConnectionError> ToolConnection::last_error() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return last_error_;
}

std::vector<std::string> ToolConnection::recent_output() const {
    std::shared_ptr<ChildProcess> proc;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!process_) return last_output_;
        proc = process_;
    }
    return proc->recent_output();
}

nlohmann::json ToolConnection::server_info() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return server_info_;
}

int ToolConnection::reconnect_attempts() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return reconnect_attempts_;
}

ServerDescriptor ToolConnection::descriptor() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return descriptor_;
}

void ToolConnection::update_descriptor(const ServerDescriptor& descriptor) {
    std::lock_guard<std::mutex> lock(mutex_);
    descriptor_ = descriptor;
}

} // namespace switchboard
