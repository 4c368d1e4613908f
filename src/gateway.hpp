#pragma once
#include "config.hpp"
#include "tool_registry.hpp"
#include "turn_orchestrator.hpp"
#include "attachment_store.hpp"
#include <httplib.h>
#include <string>
#include <thread>

namespace switchboard {

// HTTP surface over the orchestrator and the tool registry.
class Gateway {
public:
    Gateway(Config config, ToolRegistry& registry, TurnOrchestrator& orchestrator,
            FileAttachmentStore* attachments = nullptr);
    ~Gateway();

    Gateway(const Gateway&) = delete;
    Gateway& operator=(const Gateway&) = delete;

    // Binds and serves on a background thread; port 0 picks a free port.
    // Returns the bound port. Throws std::runtime_error when binding fails.
    int start(const std::string& host, int port);
    void stop();

private:
    Config config_;
    ToolRegistry& registry_;
    TurnOrchestrator& orchestrator_;
    FileAttachmentStore* attachments_;
    httplib::Server server_;
    std::thread thread_;

    void register_routes();
    nlohmann::json servers_body() const;
};

int cmd_gateway(const std::string& host, int port);

} // namespace switchboard
