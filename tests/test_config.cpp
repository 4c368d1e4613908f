#include <gtest/gtest.h>
#include "config.hpp"
#include "errors.hpp"
#include "turn_orchestrator.hpp"
#include "fake_mcp.hpp"

using namespace switchboard;
using namespace switchboard::test_support;
using nlohmann::json;

TEST(ConfigTest, DefaultsMatchDocumentedValues) {
    Config c = Config::make_default();
    EXPECT_EQ(c.tool_hop_limit, 8);
    EXPECT_EQ(c.context_tool_limit, 12);
    EXPECT_FALSE(c.provider.log_payloads);
    EXPECT_EQ(c.mcp.discovery_port_start, 9001);
    EXPECT_EQ(c.mcp.discovery_port_end, 9015);
    EXPECT_EQ(c.mcp.call_timeout, 60);
}

TEST(ConfigTest, ReadsLimitsAndPayloadLogging) {
    Config c = Config::from_json({{"context_tool_limit", 4},
                                  {"provider", {{"log_payloads", true}}}});
    EXPECT_EQ(c.context_tool_limit, 4);
    EXPECT_TRUE(c.provider.log_payloads);

    Config again = Config::from_json(c.to_json());
    EXPECT_EQ(again.context_tool_limit, 4);
    EXPECT_TRUE(again.provider.log_payloads);
}

TEST(ConfigTest, RejectsInvalidLimits) {
    EXPECT_THROW(Config::from_json({{"tool_hop_limit", 0}}), ConfigError);
    EXPECT_THROW(Config::from_json({{"context_tool_limit", -1}}), ConfigError);
}

TEST(ConfigTest, ExecutorOffersContextToolLimit) {
    auto files = std::make_shared<FakeMcpServer>();
    files->add_tool("read_file", "Read a file");
    files->add_tool("write_file", "Write a file");
    files->add_tool("list_files", "List files in a folder");
    ToolRegistry registry(ToolRegistry::Options(),
                          make_connection_factory(fast_options(),
                                                  fake_transport_factory({{"http://127.0.0.1:9401/mcp", files}})));
    ServerDescriptor d;
    d.id = "files";
    d.http_url = "http://127.0.0.1:9401/mcp";
    d.contexts = {"files"};
    registry.apply_configs({d});

    Config cfg = Config::from_json({{"context_tool_limit", 2}});
    RegistryToolExecutor executor(registry, cfg);
    EXPECT_EQ(executor.tools_for("", {"files"}).size(), 2u);
    EXPECT_EQ(executor.tools_for("", {}).size(), 3u);
}
