#include "gateway.hpp"
#include "chat_repository.hpp"
#include "conversation_log.hpp"
#include "errors.hpp"
#include "provider.hpp"
#include "server_descriptor.hpp"
#include "utils.hpp"
#include <iostream>
#include <csignal>
#include <atomic>
#include <chrono>

namespace switchboard {

static std::atomic<bool> g_running{true};

static void signal_handler(int) {
    g_running = false;
}

static void send_json(httplib::Response& res, const nlohmann::json& body, int status = 200) {
    res.status = status;
    res.set_content(body.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace),
                    "application/json");
}

static void send_error(httplib::Response& res, int status, const std::string& msg) {
    send_json(res, {{"error", msg}}, status);
}

// Parses a JSON body or answers 400.
static bool parse_body(const httplib::Request& req, httplib::Response& res, nlohmann::json& out) {
    out = nlohmann::json::parse(req.body, nullptr, false);
    if (out.is_discarded()) {
        send_error(res, 400, "invalid JSON in request body");
        return false;
    }
    return true;
}

Gateway::Gateway(Config config, ToolRegistry& registry, TurnOrchestrator& orchestrator,
                 FileAttachmentStore* attachments)
    : config_(std::move(config))
    , registry_(registry)
    , orchestrator_(orchestrator)
    , attachments_(attachments)
{
    register_routes();
}

Gateway::~Gateway() {
    stop();
}

nlohmann::json Gateway::servers_body() const {
    return {{"servers", registry_.describe_servers()}};
}

void Gateway::register_routes() {
    server_.set_exception_handler([](const httplib::Request& req, httplib::Response& res, std::exception_ptr ep) {
        std::string msg = "unknown error";
        try { if (ep) std::rethrow_exception(ep); }
        catch (const std::exception& e) { msg = e.what(); }
        catch (...) { msg = "non-std exception"; }
        std::cerr << "[gateway] Unhandled exception on " << req.path << ": " << msg << "\n";
        send_error(res, 500, msg);
    });

    server_.Get("/health", [](const httplib::Request&, httplib::Response& res) {
        send_json(res, {{"status", "ok"}});
    });

    server_.Post("/api/chat/stream", [this](const httplib::Request& req, httplib::Response& res) {
        nlohmann::json body;
        if (!parse_body(req, res, body)) return;
        ChatRequest chat;
        try {
            chat = ChatRequest::from_json(body);
        } catch (const ConfigError& e) {
            send_error(res, 400, e.what());
            return;
        }

        res.set_header("Cache-Control", "no-cache");
        res.set_chunked_content_provider("text/event-stream",
            [this, chat](size_t, httplib::DataSink& sink) {
                bool client_gone = false;
                auto emit = [&](const SseEvent& ev) {
                    if (client_gone) return;
                    std::string frame = format_sse(ev.event, ev.data);
                    if (!sink.write(frame.data(), frame.size())) {
                        std::cerr << "[gateway] Client went away; finishing turn without streaming\n";
                        client_gone = true;
                    }
                };
                try {
                    orchestrator_.process_turn(chat.session_id, chat, emit);
                } catch (const ProviderError& e) {
                    std::cerr << "[gateway] Provider failure: " << e.what() << "\n";
                    emit({"error", nlohmann::json{{"status", e.status_code}, {"detail", e.detail}}.dump(), ""});
                } catch (const std::exception& e) {
                    std::cerr << "[gateway] Turn failed: " << e.what() << "\n";
                    emit({"error", nlohmann::json{{"message", e.what()}}.dump(), ""});
                }
                sink.done();
                return true;
            });
    });

    server_.Get("/api/mcp/servers", [this](const httplib::Request&, httplib::Response& res) {
        send_json(res, servers_body());
    });

    server_.Post("/api/mcp/servers/discover", [this](const httplib::Request&, httplib::Response& res) {
        nlohmann::json ports = nlohmann::json::object();
        for (auto& [port, open] : registry_.discover_servers()) ports[std::to_string(port)] = open;
        auto body = servers_body();
        body["ports"] = ports;
        send_json(res, body);
    });

    server_.Put("/api/mcp/servers", [this](const httplib::Request& req, httplib::Response& res) {
        nlohmann::json body;
        if (!parse_body(req, res, body)) return;
        std::vector<ServerDescriptor> descriptors;
        try {
            descriptors = parse_server_descriptors(body);
        } catch (const ConfigError& e) {
            send_error(res, 400, e.what());
            return;
        }
        // Persist first so the running registry never diverges from the file.
        try {
            save_server_descriptors(config_.mcp.servers_path, descriptors);
        } catch (const std::exception& e) {
            std::cerr << "[gateway] Failed to save MCP server config: " << e.what() << "\n";
            send_error(res, 500, std::string("failed to save MCP server config: ") + e.what());
            return;
        }
        try {
            registry_.apply_configs(descriptors);
        } catch (const ConfigError& e) {
            send_error(res, 400, e.what());
            return;
        }
        send_json(res, servers_body());
    });

    server_.Post("/api/mcp/servers/reload", [this](const httplib::Request&, httplib::Response& res) {
        try {
            registry_.apply_configs(load_server_descriptors(config_.mcp.servers_path));
        } catch (const ConfigError& e) {
            send_error(res, 400, e.what());
            return;
        }
        registry_.refresh();
        send_json(res, servers_body());
    });

    server_.Get("/api/mcp/digest", [this](const httplib::Request& req, httplib::Response& res) {
        std::vector<std::string> contexts;
        if (req.has_param("contexts")) {
            std::string raw = req.get_param_value("contexts");
            size_t start = 0;
            while (start <= raw.size()) {
                size_t comma = raw.find(',', start);
                if (comma == std::string::npos) comma = raw.size();
                contexts.push_back(raw.substr(start, comma - start));
                start = comma + 1;
            }
        }
        size_t limit = 0;
        if (req.has_param("limit")) {
            try {
                limit = static_cast<size_t>(std::stoul(req.get_param_value("limit")));
            } catch (const std::exception&) {
                send_error(res, 400, "limit must be a non-negative integer");
                return;
            }
        }
        auto digest = registry_.capability_digest(contexts, limit);
        send_json(res, {
            {"digest", digest_to_json(digest)},
            {"message", build_tool_digest_message(digest, contexts)},
        });
    });

    server_.Post("/api/mcp/tools/call", [this](const httplib::Request& req, httplib::Response& res) {
        nlohmann::json body;
        if (!parse_body(req, res, body)) return;
        std::string name = body.value("name", "");
        nlohmann::json args = body.contains("arguments") ? body["arguments"] : nlohmann::json::object();
        if (name.empty() || !args.is_object()) {
            send_error(res, 400, "expected {\"name\": string, \"arguments\": object}");
            return;
        }
        try {
            auto result = registry_.call_tool(name, args);
            send_json(res, {{"result", result.text}, {"is_error", result.is_error}, {"raw", result.raw}});
        } catch (const ToolNotFound& e) {
            send_error(res, 404, e.what());
        } catch (const ConnectionError& e) {
            send_error(res, 502, e.what());
        } catch (const TransportError& e) {
            send_error(res, 502, e.what());
        }
    });

    server_.Get(R"(/api/attachments/([A-Za-z0-9_\-]+))", [this](const httplib::Request& req, httplib::Response& res) {
        std::string id = req.matches[1];
        auto ref = attachments_ ? attachments_->resolve(id) : std::nullopt;
        std::string path = attachments_ ? attachments_->blob_path(id) : "";
        if (!ref || path.empty() || !fs::exists(path)) {
            send_error(res, 404, "attachment not found");
            return;
        }
        std::ifstream f(path, std::ios::binary);
        std::string bytes((std::istreambuf_iterator<char>(f)), std::istreambuf_iterator<char>());
        res.set_content(bytes, ref->mime_type);
    });
}

int Gateway::start(const std::string& host, int port) {
    int bound = port;
    if (port == 0) {
        bound = server_.bind_to_any_port(host);
        if (bound < 0) throw std::runtime_error("Failed to bind gateway on " + host);
    } else if (!server_.bind_to_port(host, port)) {
        throw std::runtime_error("Failed to bind gateway on " + host + ":" + std::to_string(port));
    }
    thread_ = std::thread([this, host, bound]() {
        std::cerr << "[gateway] Listening on " << host << ":" << bound << "\n";
        server_.listen_after_bind();
    });
    return bound;
}

void Gateway::stop() {
    server_.stop();
    if (thread_.joinable()) thread_.join();
}

int cmd_gateway(const std::string& host, int port) {
    Config cfg = Config::load(default_config_path());
    cfg.apply_env_overrides();
    std::string bind_host = host.empty() ? cfg.gateway_host : host;
    int bind_port = port > 0 ? port : cfg.gateway_port;

    ToolRegistry registry(ToolRegistry::Options::from_config(cfg.mcp),
                          make_connection_factory(ConnectionOptions::from_config(cfg.mcp)));
    try {
        registry.apply_configs(load_server_descriptors(cfg.mcp.servers_path));
    } catch (const ConfigError& e) {
        std::cerr << "[gateway] Invalid MCP server config: " << e.what() << "\n";
        return 1;
    }

    SqliteChatRepository repository(cfg.database_path);
    FileAttachmentStore attachments(cfg.attachments_dir, cfg.attachments_base_url);
    std::unique_ptr<ConversationLog> conversation_log;
    if (!cfg.conversation_log_dir.empty()) {
        conversation_log = std::make_unique<ConversationLog>(cfg.conversation_log_dir);
    }
    HttpModelGateway provider(cfg.provider);
    RegistryToolExecutor executor(registry, cfg);
    TurnOrchestrator orchestrator(TurnOrchestrator::Options::from_config(cfg), provider, repository,
                                  executor, &attachments, conversation_log.get());

    Gateway gateway(cfg, registry, orchestrator, &attachments);
    gateway.start(bind_host, bind_port);

    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);
    std::cerr << "[gateway] Ready. Ctrl+C to quit.\n";

    while (g_running) {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }

    std::cerr << "[gateway] Shutting down...\n";
    gateway.stop();
    registry.close();
    std::cerr << "[gateway] Done.\n";
    return 0;
}

} // namespace switchboard
