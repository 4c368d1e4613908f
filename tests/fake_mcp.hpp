#pragma once
#include "mcp_transport.hpp"
#include <atomic>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace switchboard {
namespace test_support {

// In-process MCP server state shared by every transport it hands out.
struct FakeMcpServer {
    std::string name = "fake";
    std::vector<McpToolInfo> tools;
    size_t page_size = 0;   // 0 = single page
    std::map<std::string, std::string> replies;
    bool fail_initialize = false;
    TransportFailure initialize_failure = TransportFailure::refused;
    bool fail_list = false;
    bool fail_calls = false;
    TransportFailure call_failure = TransportFailure::network;

    std::atomic<int> sessions{0};
    std::atomic<int> closes{0};
    std::mutex mutex;
    std::vector<std::pair<std::string, nlohmann::json>> calls;

    void add_tool(const std::string& tool, const std::string& description = "",
                  nlohmann::json schema = {{"type", "object"}, {"properties", nlohmann::json::object()}}) {
        tools.push_back({tool, description, std::move(schema)});
    }
};

class FakeTransport : public McpTransport {
public:
    explicit FakeTransport(std::shared_ptr<FakeMcpServer> server) : server_(std::move(server)) {}

    nlohmann::json initialize() override {
        if (server_->fail_initialize) {
            throw TransportError(server_->initialize_failure, "initialize failed");
        }
        server_->sessions++;
        return {{"protocolVersion", "2025-06-18"}, {"serverInfo", {{"name", server_->name}}}};
    }

    McpToolPage list_tools(const std::string& cursor) override {
        if (server_->fail_list) throw TransportError(TransportFailure::network, "list failed");
        McpToolPage page;
        size_t start = cursor.empty() ? 0 : std::stoul(cursor);
        size_t count = server_->page_size ? server_->page_size : server_->tools.size();
        for (size_t i = start; i < server_->tools.size() && i < start + count; i++) {
            page.tools.push_back(server_->tools[i]);
        }
        if (start + count < server_->tools.size()) page.next_cursor = std::to_string(start + count);
        return page;
    }

    nlohmann::json call_tool(const std::string& name, const nlohmann::json& args) override {
        {
            std::lock_guard<std::mutex> lock(server_->mutex);
            server_->calls.push_back({name, args});
        }
        if (server_->fail_calls) throw TransportError(server_->call_failure, "call failed");
        auto it = server_->replies.find(name);
        std::string text = it != server_->replies.end() ? it->second : name + " ok";
        return {{"content", {{{"type", "text"}, {"text", text}}}}, {"isError", false}};
    }

    void close() override { server_->closes++; }

private:
    std::shared_ptr<FakeMcpServer> server_;
};

// Routes each endpoint to its fake server; unknown endpoints refuse.
inline TransportFactory fake_transport_factory(
    std::map<std::string, std::shared_ptr<FakeMcpServer>> servers,
    std::shared_ptr<std::atomic<int>> created = nullptr) {
    return [servers, created](const std::string& endpoint,
                              const TransportOptions&) -> std::unique_ptr<McpTransport> {
        auto it = servers.find(endpoint);
        if (it == servers.end()) {
            throw TransportError(TransportFailure::refused, "connection refused: " + endpoint);
        }
        if (created) (*created)++;
        return std::make_unique<FakeTransport>(it->second);
    };
}

inline ConnectionOptions fast_options() {
    ConnectionOptions o;
    o.connect_timeout_ms = 2000;
    o.port_poll_ms = 20;
    o.close_timeout_ms = 500;
    o.process_grace_ms = 200;
    o.reconnect_backoff_ms = 0;
    o.max_reconnect_attempts = 2;
    return o;
}

} // namespace test_support
} // namespace switchboard
