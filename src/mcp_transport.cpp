#include "mcp_transport.hpp"
#include "net_probe.hpp"
#include "sse.hpp"
#include "utils.hpp"
#include <httplib.h>
#include <iostream>
#include <netdb.h>

namespace switchboard {

const char* to_string(TransportFailure kind) {
    switch (kind) {
        case TransportFailure::timeout: return "timeout";
        case TransportFailure::dns: return "dns";
        case TransportFailure::refused: return "refused";
        case TransportFailure::network: return "network";
        case TransportFailure::http_status: return "http_status";
        case TransportFailure::malformed_stream: return "malformed_stream";
        case TransportFailure::rpc_error: return "rpc_error";
        case TransportFailure::unexpected: return "unexpected";
    }
    return "unexpected";
}

ToolCallResult parse_tool_result(const nlohmann::json& result) {
    ToolCallResult out;
    out.raw = result;
    if (!result.is_object()) {
        out.text = result.is_null() ? "" : result.dump();
        return out;
    }
    out.is_error = result.value("isError", false);

    std::vector<std::string> texts;
    if (result.contains("content") && result["content"].is_array()) {
        for (auto& item : result["content"]) {
            if (item.is_object() && item.value("type", "") == "text") {
                if (item.contains("text") && item["text"].is_string()) {
                    texts.push_back(item["text"].get<std::string>());
                }
            } else {
                texts.push_back(item.dump());
            }
        }
    }
    if (texts.empty() && result.contains("structuredContent") &&
        !result["structuredContent"].is_null() && !result["structuredContent"].empty()) {
        texts.push_back(result["structuredContent"].dump());
    }
    out.text = join(texts, "\n");
    return out;
}

static bool host_resolves(const std::string& host) {
    addrinfo hints{};
    hints.ai_socktype = SOCK_STREAM;
    addrinfo* res = nullptr;
    int rc = getaddrinfo(host.c_str(), nullptr, &hints, &res);
    if (res) freeaddrinfo(res);
    return rc == 0;
}

static TransportError map_http_error(httplib::Error err, const std::string& host,
                                     const std::string& endpoint) {
    std::string what = httplib::to_string(err);
    switch (err) {
        case httplib::Error::ConnectionTimeout:
            return TransportError(TransportFailure::timeout, "timed out connecting to " + endpoint);
        case httplib::Error::Read:
            return TransportError(TransportFailure::timeout, "read from " + endpoint + " failed or timed out: " + what);
        case httplib::Error::Connection:
            if (!host_resolves(host)) {
                return TransportError(TransportFailure::dns, "cannot resolve host '" + host + "'");
            }
            return TransportError(TransportFailure::refused, "connection refused by " + endpoint);
        case httplib::Error::Write:
        case httplib::Error::SSLConnection:
        case httplib::Error::SSLServerVerification:
            return TransportError(TransportFailure::network, what + " (" + endpoint + ")");
        default:
            return TransportError(TransportFailure::unexpected, what + " (" + endpoint + ")");
    }
}

HttpMcpTransport::HttpMcpTransport(const std::string& endpoint, TransportOptions options)
    : endpoint_(endpoint), options_(std::move(options)) {
    HttpUrl u = parse_http_url(endpoint_);
    base_url_ = u.base();
    host_ = u.host;
    path_ = u.path.empty() ? "/" : u.path;
}

// Picks the JSON-RPC response with the given id out of an SSE body.
static nlohmann::json response_from_sse(const std::string& body, int id) {
    nlohmann::json found;
    SseParser parser([&](const SseEvent& ev) {
        if (!found.is_null() || ev.data.empty()) return;
        auto j = nlohmann::json::parse(ev.data, nullptr, false);
        if (j.is_discarded()) {
            throw TransportError(TransportFailure::malformed_stream,
                                 "invalid JSON in SSE event: " + truncate_preview(ev.data, 120));
        }
        if (j.is_object() && j.contains("id") && j["id"] == id) found = std::move(j);
    });
    parser.feed(body);
    parser.finish();
    if (found.is_null()) {
        throw TransportError(TransportFailure::malformed_stream, "no JSON-RPC response in event stream");
    }
    return found;
}

nlohmann::json HttpMcpTransport::send_request(const std::string& method, const nlohmann::json& params,
                                              int read_timeout_s) {
    std::lock_guard<std::mutex> lock(rpc_mutex_);
    int id = next_id_++;
    nlohmann::json req = {
        {"jsonrpc", "2.0"},
        {"id", id},
        {"method", method},
        {"params", params.is_null() ? nlohmann::json::object() : params}
    };

    httplib::Client cli(base_url_);
    cli.set_connection_timeout(std::chrono::milliseconds(options_.connect_timeout_ms));
    cli.set_read_timeout(read_timeout_s, 0);

    httplib::Headers headers = {
        {"Accept", "application/json, text/event-stream"},
    };
    if (!session_id_.empty()) {
        headers.emplace("Mcp-Session-Id", session_id_);
        headers.emplace("MCP-Protocol-Version", protocol_version_);
    }

    auto res = cli.Post(path_, headers, req.dump(), "application/json");
    if (!res) {
        throw map_http_error(res.error(), host_, endpoint_);
    }
    if (res->status < 200 || res->status >= 300) {
        throw TransportError(TransportFailure::http_status,
                             "HTTP " + std::to_string(res->status) + " from " + endpoint_,
                             res->status);
    }
    if (res->has_header("Mcp-Session-Id")) {
        session_id_ = res->get_header_value("Mcp-Session-Id");
    }

    nlohmann::json resp;
    std::string ctype = res->get_header_value("Content-Type");
    if (ctype.find("text/event-stream") != std::string::npos) {
        resp = response_from_sse(res->body, id);
    } else {
        resp = nlohmann::json::parse(res->body, nullptr, false);
        if (resp.is_discarded() || !resp.is_object()) {
            throw TransportError(TransportFailure::malformed_stream,
                                 "invalid JSON-RPC response: " + truncate_preview(res->body, 120));
        }
    }

    if (resp.contains("error") && resp["error"].is_object()) {
        std::string msg = resp["error"].value("message", "json-rpc error");
        throw TransportError(TransportFailure::rpc_error, method + ": " + msg);
    }
    if (!resp.contains("result")) {
        throw TransportError(TransportFailure::malformed_stream, method + ": missing result");
    }
    return resp["result"];
}

void HttpMcpTransport::send_notification(const std::string& method, int read_timeout_s) {
    nlohmann::json notif = {{"jsonrpc", "2.0"}, {"method", method}};
    httplib::Client cli(base_url_);
    cli.set_connection_timeout(std::chrono::milliseconds(options_.connect_timeout_ms));
    cli.set_read_timeout(read_timeout_s, 0);
    httplib::Headers headers = {{"Accept", "application/json, text/event-stream"}};
    if (!session_id_.empty()) headers.emplace("Mcp-Session-Id", session_id_);

    auto res = cli.Post(path_, headers, notif.dump(), "application/json");
    if (!res) {
        throw map_http_error(res.error(), host_, endpoint_);
    }
    if (res->status >= 400) {
        throw TransportError(TransportFailure::http_status,
                             "HTTP " + std::to_string(res->status) + " from " + endpoint_ + " on " + method,
                             res->status);
    }
}

nlohmann::json HttpMcpTransport::initialize() {
    auto result = send_request("initialize", {
        {"protocolVersion", protocol_version_},
        {"capabilities", nlohmann::json::object()},
        {"clientInfo", {{"name", options_.client_name}, {"version", options_.client_version}}}
    }, options_.handshake_timeout_s);
    if (result.is_object() && result.contains("protocolVersion") && result["protocolVersion"].is_string()) {
        protocol_version_ = result["protocolVersion"].get<std::string>();
    }
    send_notification("notifications/initialized", options_.handshake_timeout_s);
    return result;
}

McpToolPage HttpMcpTransport::list_tools(const std::string& cursor) {
    nlohmann::json params = nlohmann::json::object();
    if (!cursor.empty()) params["cursor"] = cursor;
    auto r = send_request("tools/list", params, options_.read_timeout_s);

    McpToolPage page;
    if (!r.is_object() || !r.contains("tools") || !r["tools"].is_array()) {
        throw TransportError(TransportFailure::malformed_stream, "tools/list: missing 'tools' array");
    }
    for (auto& t : r["tools"]) {
        if (!t.is_object()) continue;
        McpToolInfo info;
        info.name = t.value("name", "");
        info.description = t.value("description", "");
        if (info.description.empty()) info.description = t.value("title", "");
        if (t.contains("inputSchema") && t["inputSchema"].is_object()) {
            info.input_schema = t["inputSchema"];
        } else {
            info.input_schema = {{"type", "object"}, {"properties", nlohmann::json::object()}};
        }
        if (!info.name.empty()) page.tools.push_back(std::move(info));
    }
    if (r.contains("nextCursor") && r["nextCursor"].is_string()) {
        page.next_cursor = r["nextCursor"].get<std::string>();
    }
    return page;
}

nlohmann::json HttpMcpTransport::call_tool(const std::string& name, const nlohmann::json& args) {
    return send_request("tools/call", {{"name", name}, {"arguments", args}}, options_.read_timeout_s);
}

void HttpMcpTransport::close() {
    std::lock_guard<std::mutex> lock(rpc_mutex_);
    if (session_id_.empty()) return;
    httplib::Client cli(base_url_);
    cli.set_connection_timeout(std::chrono::milliseconds(options_.connect_timeout_ms));
    cli.set_read_timeout(2, 0);
    auto res = cli.Delete(path_, {{"Mcp-Session-Id", session_id_}});
    if (!res) {
        std::cerr << "[mcp] Session close for " << endpoint_ << " failed: "
                  << httplib::to_string(res.error()) << "\n";
    }
    session_id_.clear();
}

TransportFactory default_transport_factory() {
    return [](const std::string& endpoint, const TransportOptions& options) -> std::unique_ptr<McpTransport> {
        return std::make_unique<HttpMcpTransport>(endpoint, options);
    };
}

} // namespace switchboard
