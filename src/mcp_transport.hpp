#pragma once
#include <string>
#include <vector>
#include <memory>
#include <mutex>
#include <functional>
#include <stdexcept>
#include <nlohmann/json.hpp>

namespace switchboard {

struct McpToolInfo {
    std::string name;
    std::string description;
    nlohmann::json input_schema;
};

struct McpToolPage {
    std::vector<McpToolInfo> tools;
    std::string next_cursor;    // empty on the last page
};

struct ToolCallResult {
    std::string text;
    bool is_error = false;
    nlohmann::json raw;
};

// Joins text items with newlines; other items are serialized as JSON. Falls
// back to structuredContent when there is no content at all.
ToolCallResult parse_tool_result(const nlohmann::json& result);

enum class TransportFailure {
    timeout,
    dns,
    refused,
    network,
    http_status,
    malformed_stream,
    rpc_error,      // well-formed JSON-RPC error; the session stays usable
    unexpected,
};

const char* to_string(TransportFailure kind);

struct TransportError : std::runtime_error {
    TransportError(TransportFailure k, const std::string& msg, int status = 0)
        : std::runtime_error(msg), kind(k), http_status(status) {}
    TransportFailure kind;
    int http_status;
};

struct TransportOptions {
    int connect_timeout_ms = 30000;
    int handshake_timeout_s = 30;   // initialize only
    int read_timeout_s = 60;        // every later request, tool calls included
    std::string client_name = "switchboard";
    std::string client_version = "1.0";
};

// One MCP session over some wire. Implementations throw TransportError.
class McpTransport {
public:
    virtual ~McpTransport() = default;

    // Runs the initialize handshake and returns the server's InitializeResult.
    virtual nlohmann::json initialize() = 0;
    virtual McpToolPage list_tools(const std::string& cursor) = 0;
    // Returns the raw CallToolResult object.
    virtual nlohmann::json call_tool(const std::string& name, const nlohmann::json& args) = 0;
    virtual void close() = 0;
};

using TransportFactory = std::function<std::unique_ptr<McpTransport>(
    const std::string& endpoint, const TransportOptions& options)>;

// Streamable-HTTP MCP: JSON-RPC over POST, responses as JSON or SSE.
class HttpMcpTransport : public McpTransport {
public:
    HttpMcpTransport(const std::string& endpoint, TransportOptions options);

    nlohmann::json initialize() override;
    McpToolPage list_tools(const std::string& cursor) override;
    nlohmann::json call_tool(const std::string& name, const nlohmann::json& args) override;
    void close() override;

    const std::string& session_id() const { return session_id_; }

private:
    std::string endpoint_;
    TransportOptions options_;
    std::string base_url_;
    std::string host_;
    std::string path_;
    std::string session_id_;
    std::string protocol_version_ = "2025-06-18";
    int next_id_ = 1;
    std::mutex rpc_mutex_;

    nlohmann::json send_request(const std::string& method, const nlohmann::json& params,
                                int read_timeout_s);
    void send_notification(const std::string& method, int read_timeout_s);
};

TransportFactory default_transport_factory();

} // namespace switchboard
