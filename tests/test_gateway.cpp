#include <gtest/gtest.h>
#include "gateway.hpp"
#include "chat_repository.hpp"
#include "utils.hpp"
#include "fake_mcp.hpp"
#include <fstream>

using namespace switchboard;
using namespace switchboard::test_support;
using nlohmann::json;

namespace {

class EchoGateway : public ModelGateway {
public:
    void stream_chat(const json& payload, const ProviderEventHandler& on_event) override {
        std::string last = payload["messages"].back()["content"];
        if (last == "explode") throw ProviderError(503, "model overloaded");
        json chunk = {{"choices", {{{"index", 0}, {"delta", {{"content", "echo: " + last}}},
                                    {"finish_reason", "stop"}}}}};
        on_event({"message", chunk.dump(), ""});
        on_event({"message", "[DONE]", ""});
    }
};

class GatewayTest : public ::testing::Test {
protected:
    void SetUp() override {
        dir = fs::temp_directory_path() /
              ("sb_gateway_" + std::to_string(epoch_now()) + "_" +
               ::testing::UnitTest::GetInstance()->current_test_info()->name());
        fs::create_directories(dir);
        config.mcp.servers_path = (dir / "servers.json").string();

        notes = std::make_shared<FakeMcpServer>();
        notes->add_tool("search_notes", "Search notes");
        notes->replies["search_notes"] = "2 notes";

        registry = std::make_unique<ToolRegistry>(
            ToolRegistry::Options(),
            make_connection_factory(fast_options(),
                                    fake_transport_factory({{"http://127.0.0.1:9301/mcp", notes}})));
        attachments = std::make_unique<FileAttachmentStore>((dir / "attachments").string(), "/api/attachments");
        executor = std::make_unique<RegistryToolExecutor>(*registry, config);
        TurnOrchestrator::Options options;
        options.default_model = "test/model";
        orchestrator = std::make_unique<TurnOrchestrator>(options, model, repository, *executor,
                                                          attachments.get());
        gateway = std::make_unique<Gateway>(config, *registry, *orchestrator, attachments.get());
        port = gateway->start("127.0.0.1", 0);
        client = std::make_unique<httplib::Client>("127.0.0.1", port);
    }

    void TearDown() override {
        gateway->stop();
        registry->close();
        fs::remove_all(dir);
    }

    json put_servers(const json& body, int expected_status = 200) {
        auto res = client->Put("/api/mcp/servers", body.dump(), "application/json");
        EXPECT_TRUE(res);
        if (!res) return nullptr;
        EXPECT_EQ(res->status, expected_status);
        return json::parse(res->body);
    }

    fs::path dir;
    Config config;
    std::shared_ptr<FakeMcpServer> notes;
    EchoGateway model;
    SqliteChatRepository repository{":memory:"};
    std::unique_ptr<ToolRegistry> registry;
    std::unique_ptr<FileAttachmentStore> attachments;
    std::unique_ptr<RegistryToolExecutor> executor;
    std::unique_ptr<TurnOrchestrator> orchestrator;
    std::unique_ptr<Gateway> gateway;
    int port = 0;
    std::unique_ptr<httplib::Client> client;
};

std::vector<SseEvent> parse_stream(const std::string& body) {
    std::vector<SseEvent> events;
    SseParser parser([&](const SseEvent& e) { events.push_back(e); });
    parser.feed(body);
    parser.finish();
    return events;
}

} // namespace

TEST_F(GatewayTest, HealthAnswers) {
    auto res = client->Get("/health");
    ASSERT_TRUE(res);
    EXPECT_EQ(res->status, 200);
    EXPECT_EQ(json::parse(res->body)["status"], "ok");
}

TEST_F(GatewayTest, ChatStreamsEventsInOrder) {
    auto res = client->Post("/api/chat/stream", R"({"message":"ping","session_id":"web-1"})",
                            "application/json");
    ASSERT_TRUE(res);
    EXPECT_EQ(res->status, 200);

    auto events = parse_stream(res->body);
    ASSERT_GE(events.size(), 4u);
    EXPECT_EQ(events.front().event, "session");
    EXPECT_EQ(events.back().data, "[DONE]");
    EXPECT_EQ(repository.get_messages("web-1").back().message.content, "echo: ping");
}

TEST_F(GatewayTest, ProviderFailureBecomesErrorEvent) {
    auto res = client->Post("/api/chat/stream", R"({"message":"explode"})", "application/json");
    ASSERT_TRUE(res);
    auto events = parse_stream(res->body);
    ASSERT_FALSE(events.empty());
    EXPECT_EQ(events.back().event, "error");
    EXPECT_EQ(json::parse(events.back().data)["status"], 503);
}

TEST_F(GatewayTest, BadChatRequestIs400) {
    auto res = client->Post("/api/chat/stream", R"({"nothing":true})", "application/json");
    ASSERT_TRUE(res);
    EXPECT_EQ(res->status, 400);
    res = client->Post("/api/chat/stream", "not json", "application/json");
    ASSERT_TRUE(res);
    EXPECT_EQ(res->status, 400);
}

TEST_F(GatewayTest, ServerConfigCanBeReplaced) {
    auto body = put_servers({{"servers", {{{"id", "notes"}, {"http_url", "http://127.0.0.1:9301/mcp"}}}}});
    ASSERT_EQ(body["servers"].size(), 1u);
    EXPECT_TRUE(body["servers"][0]["connected"].get<bool>());
    EXPECT_EQ(load_server_descriptors(config.mcp.servers_path).size(), 1u);

    auto listed = client->Get("/api/mcp/servers");
    ASSERT_TRUE(listed);
    EXPECT_EQ(json::parse(listed->body)["servers"][0]["tool_count"], 1);
}

TEST_F(GatewayTest, InvalidServerConfigIs400) {
    auto body = put_servers({{"servers", {{{"id", "broken"}}}}}, 400);
    EXPECT_NE(body["error"].get<std::string>().find("broken"), std::string::npos);
    EXPECT_FALSE(fs::exists(config.mcp.servers_path));
}

TEST_F(GatewayTest, UnsavableServerConfigLeavesRegistryUntouched) {
    put_servers({{"servers", {{{"id", "notes"}, {"http_url", "http://127.0.0.1:9301/mcp"}}}}});

    // A regular file where the config directory should be makes the save fail.
    std::ofstream(dir / "blocker") << "not a directory";
    Config broken = config;
    broken.mcp.servers_path = (dir / "blocker" / "servers.json").string();
    Gateway other(broken, *registry, *orchestrator, attachments.get());
    int other_port = other.start("127.0.0.1", 0);
    httplib::Client other_client("127.0.0.1", other_port);

    auto res = other_client.Put("/api/mcp/servers", json{{"servers", json::array()}}.dump(), "application/json");
    ASSERT_TRUE(res);
    EXPECT_EQ(res->status, 500);
    EXPECT_NE(json::parse(res->body)["error"].get<std::string>().find("save"), std::string::npos);
    other.stop();

    EXPECT_EQ(registry->active_servers(), std::vector<std::string>{"notes"});
    EXPECT_EQ(registry->configs().size(), 1u);
}

TEST_F(GatewayTest, ToolCallsRouteThroughRegistry) {
    put_servers({{"servers", {{{"id", "notes"}, {"http_url", "http://127.0.0.1:9301/mcp"}}}}});

    auto res = client->Post("/api/mcp/tools/call", R"({"name":"search_notes","arguments":{"q":"x"}})",
                            "application/json");
    ASSERT_TRUE(res);
    EXPECT_EQ(res->status, 200);
    EXPECT_EQ(json::parse(res->body)["result"], "2 notes");

    res = client->Post("/api/mcp/tools/call", R"({"name":"missing"})", "application/json");
    ASSERT_TRUE(res);
    EXPECT_EQ(res->status, 404);
}

TEST_F(GatewayTest, DigestHonorsContexts) {
    put_servers({{"servers", {{{"id", "notes"}, {"http_url", "http://127.0.0.1:9301/mcp"},
                               {"contexts", {"notes"}}}}}});
    auto res = client->Get("/api/mcp/digest?contexts=notes,mail&limit=5");
    ASSERT_TRUE(res);
    auto body = json::parse(res->body);
    EXPECT_EQ(body["digest"]["notes"][0]["name"], "search_notes");
    EXPECT_TRUE(body["digest"]["mail"].empty());
    EXPECT_EQ(body["message"].get<std::string>().rfind("Tool digest for contexts: notes", 0), 0u);
}

TEST_F(GatewayTest, AttachmentsAreServed) {
    auto ref = attachments->store("s1", "GIF89a", "image/gif", "tiny.gif");
    auto res = client->Get("/api/attachments/" + ref.id);
    ASSERT_TRUE(res);
    EXPECT_EQ(res->status, 200);
    EXPECT_EQ(res->body, "GIF89a");
    EXPECT_EQ(res->get_header_value("Content-Type"), "image/gif");

    res = client->Get("/api/attachments/att_unknown");
    ASSERT_TRUE(res);
    EXPECT_EQ(res->status, 404);
}
