#include <gtest/gtest.h>
#include "turn_orchestrator.hpp"
#include "errors.hpp"
#include "utils.hpp"
#include "memory_attachment_store.hpp"
#include <algorithm>
#include <optional>
#include <set>
#include <map>

using namespace switchboard;
using namespace switchboard::test_support;
using nlohmann::json;

namespace {

// Replays one scripted stream per call; the last step repeats.
class ScriptedGateway : public ModelGateway {
public:
    struct Step {
        std::vector<json> chunks;
        std::optional<ProviderError> error;
        std::map<std::string, std::string> routing;
    };

    void stream_chat(const json& payload, const ProviderEventHandler& on_event) override {
        payloads.push_back(payload);
        const Step& step = steps.at(std::min(payloads.size() - 1, steps.size() - 1));
        if (step.error) throw *step.error;
        if (!step.routing.empty()) on_event({"openrouter_headers", json(step.routing).dump(), ""});
        for (auto& chunk : step.chunks) on_event({"message", chunk.dump(), ""});
        on_event({"message", "[DONE]", ""});
    }

    std::vector<Step> steps;
    std::vector<json> payloads;
};

class FakeToolExecutor : public ToolExecutor {
public:
    json tools_for(const std::string&, const std::vector<std::string>& contexts) override {
        last_contexts = contexts;
        return specs;
    }

    std::string digest_message(const std::vector<std::string>& contexts) override {
        if (contexts.empty()) return "";
        return "Tool digest for contexts: " + join(contexts, ", ");
    }

    ToolCallResult call_tool(const std::string& name, const json& args) override {
        calls.push_back({name, args});
        if (!specs_contain(name)) throw ToolNotFound(name);
        ToolCallResult r;
        auto it = replies.find(name);
        r.text = it != replies.end() ? it->second : "ok";
        r.is_error = error_tools.count(name) > 0;
        return r;
    }

    bool specs_contain(const std::string& name) const {
        for (auto& s : specs) {
            if (s["function"]["name"] == name) return true;
        }
        return false;
    }

    json specs = json::array({
        {{"type", "function"}, {"function", {{"name", "get_weather"}, {"parameters", json::object()}}}},
        {{"type", "function"}, {"function", {{"name", "chat_history"}, {"parameters", json::object()}}}},
        {{"type", "function"}, {"function", {{"name", "render_chart"}, {"parameters", json::object()}}}},
    });
    std::map<std::string, std::string> replies;
    std::set<std::string> error_tools;
    std::vector<std::pair<std::string, json>> calls;
    std::vector<std::string> last_contexts;
};

json text_chunk(const std::string& text) {
    return {{"id", "gen-1"}, {"model", "test/model"},
            {"choices", {{{"index", 0}, {"delta", {{"content", text}}}}}}};
}

json finish_chunk(const std::string& reason) {
    return {{"choices", {{{"index", 0}, {"delta", json::object()}, {"finish_reason", reason}}}}};
}

json tool_call_chunk(const std::string& id, const std::string& name, const std::string& args) {
    json call = {{"index", 0}, {"id", id}, {"type", "function"},
                 {"function", {{"name", name}, {"arguments", args}}}};
    return {{"choices", {{{"index", 0}, {"delta", {{"tool_calls", json::array({call})}}}}}}};
}

ScriptedGateway::Step reply(const std::string& text) {
    return {{text_chunk(text), finish_chunk("stop")}, std::nullopt, {}};
}

ScriptedGateway::Step call(const std::string& name, const std::string& args, const std::string& id = "call_1") {
    return {{tool_call_chunk(id, name, args), finish_chunk("tool_calls")}, std::nullopt, {}};
}

ScriptedGateway::Step failure(int status, json detail) {
    return {{}, ProviderError(status, std::move(detail)), {}};
}

ChatRequest user_request(const std::string& text) {
    ChatRequest r;
    r.messages.push_back(Message::text("user", text));
    return r;
}

class TurnOrchestratorTest : public ::testing::Test {
protected:
    TurnOrchestrator::Options options() {
        TurnOrchestrator::Options o;
        o.default_model = "default/model";
        o.hop_limit = 3;
        return o;
    }

    std::vector<SseEvent> run(const ChatRequest& request, TurnOrchestrator::Options opts,
                              const std::string& session_id = "s1") {
        TurnOrchestrator orchestrator(std::move(opts), gateway, repository, tools, &attachments);
        std::vector<SseEvent> events;
        orchestrator.process_turn(session_id, request, [&](const SseEvent& e) { events.push_back(e); });
        return events;
    }

    std::vector<SseEvent> run(const ChatRequest& request) { return run(request, options()); }

    static std::vector<json> named(const std::vector<SseEvent>& events, const std::string& name) {
        std::vector<json> out;
        for (auto& e : events) {
            if (e.event == name) out.push_back(json::parse(e.data));
        }
        return out;
    }

    static std::vector<json> tool_events(const std::vector<SseEvent>& events, const std::string& status) {
        std::vector<json> out;
        for (auto& j : named(events, "tool")) {
            if (j["status"] == status) out.push_back(j);
        }
        return out;
    }

    ScriptedGateway gateway;
    SqliteChatRepository repository{":memory:"};
    FakeToolExecutor tools;
    MemoryAttachmentStore attachments;
};

} // namespace

TEST_F(TurnOrchestratorTest, PlainReplyIsStreamedAndPersisted) {
    gateway.steps = {reply("Hello there")};
    auto events = run(user_request("hi"));

    ASSERT_GE(events.size(), 4u);
    EXPECT_EQ(events.front().event, "session");
    EXPECT_EQ(json::parse(events.front().data)["session_id"], "s1");
    EXPECT_EQ(events.back().event, "message");
    EXPECT_EQ(events.back().data, "[DONE]");

    auto metadata = named(events, "metadata");
    ASSERT_EQ(metadata.size(), 1u);
    EXPECT_EQ(metadata[0]["finish_reason"], "stop");
    EXPECT_EQ(metadata[0]["model"], "test/model");
    EXPECT_TRUE(metadata[0]["tool_calls"].is_null());

    auto records = repository.get_messages("s1");
    ASSERT_EQ(records.size(), 2u);
    EXPECT_EQ(records[0].message.role, "user");
    EXPECT_EQ(records[1].message.content, "Hello there");
    EXPECT_EQ(records[1].id, metadata[0]["message_id"].get<int64_t>());

    ASSERT_EQ(gateway.payloads.size(), 1u);
    EXPECT_EQ(gateway.payloads[0]["model"], "default/model");
    EXPECT_TRUE(gateway.payloads[0]["stream"].get<bool>());
    EXPECT_EQ(gateway.payloads[0]["tools"].size(), 3u);
    EXPECT_EQ(gateway.payloads[0]["tool_choice"], "auto");
}

TEST_F(TurnOrchestratorTest, GeneratesSessionIdWhenMissing) {
    gateway.steps = {reply("ok")};
    auto events = run(user_request("hi"), options(), "");
    std::string session = json::parse(events.front().data)["session_id"];
    EXPECT_EQ(session.rfind("sess_", 0), 0u);
    EXPECT_TRUE(repository.session_exists(session));
}

TEST_F(TurnOrchestratorTest, HistoryIsSentOnNextTurn) {
    gateway.steps = {reply("first answer")};
    run(user_request("first"));
    gateway.payloads.clear();
    run(user_request("second"));

    auto& messages = gateway.payloads[0]["messages"];
    ASSERT_EQ(messages.size(), 3u);
    EXPECT_EQ(messages[0]["content"], "first");
    EXPECT_EQ(messages[1]["content"], "first answer");
    EXPECT_EQ(messages[2]["content"], "second");
}

TEST_F(TurnOrchestratorTest, ToolCallRoundTrip) {
    tools.replies["get_weather"] = "Sunny, 21C";
    gateway.steps = {call("get_weather", "{\"city\":\"Oslo\"}"), reply("It is sunny.")};
    auto events = run(user_request("weather in Oslo?"));

    ASSERT_EQ(tools.calls.size(), 1u);
    EXPECT_EQ(tools.calls[0].first, "get_weather");
    EXPECT_EQ(tools.calls[0].second["city"], "Oslo");

    ASSERT_EQ(tool_events(events, "started").size(), 1u);
    auto finished = tool_events(events, "finished");
    ASSERT_EQ(finished.size(), 1u);
    EXPECT_EQ(finished[0]["call_id"], "call_1");
    EXPECT_EQ(finished[0]["result"], "Sunny, 21C");
    EXPECT_TRUE(named(events, "notice").empty());

    ASSERT_EQ(gateway.payloads.size(), 2u);
    auto& second = gateway.payloads[1]["messages"];
    ASSERT_EQ(second.size(), 3u);
    EXPECT_EQ(second[1]["role"], "assistant");
    EXPECT_EQ(second[1]["tool_calls"][0]["function"]["name"], "get_weather");
    EXPECT_EQ(second[2]["role"], "tool");
    EXPECT_EQ(second[2]["tool_call_id"], "call_1");
    EXPECT_EQ(second[2]["content"], "Sunny, 21C");

    auto records = repository.get_messages("s1");
    ASSERT_EQ(records.size(), 4u);
    EXPECT_EQ(records[1].message.tool_calls.size(), 1u);
    EXPECT_EQ(records[2].message.role, "tool");
    EXPECT_EQ(records[2].message.metadata["tool_name"], "get_weather");
    EXPECT_EQ(records[3].message.content, "It is sunny.");
}

TEST_F(TurnOrchestratorTest, HopLimitStopsToolLoop) {
    gateway.steps = {call("get_weather", "{\"city\":\"Oslo\"}")};
    auto opts = options();
    opts.hop_limit = 2;
    auto events = run(user_request("loop forever"), opts);

    EXPECT_EQ(tools.calls.size(), 2u);
    EXPECT_EQ(gateway.payloads.size(), 3u);
    auto errors = tool_events(events, "error");
    ASSERT_EQ(errors.size(), 1u);
    EXPECT_EQ(errors[0]["name"], "system");
    EXPECT_EQ(errors[0]["message"], "Tool execution stopped after hop limit");
    EXPECT_EQ(events.back().data, "[DONE]");
}

TEST_F(TurnOrchestratorTest, RetriesOnceWithoutToolsWhenUnsupported) {
    gateway.steps = {failure(404, {{"message", "No endpoints found that support tool use"}}), reply("plain")};
    auto events = run(user_request("hi"));

    ASSERT_EQ(gateway.payloads.size(), 2u);
    EXPECT_TRUE(gateway.payloads[0].contains("tools"));
    EXPECT_FALSE(gateway.payloads[1].contains("tools"));
    EXPECT_FALSE(gateway.payloads[1].contains("tool_choice"));
    auto notices = tool_events(events, "notice");
    ASSERT_EQ(notices.size(), 1u);
    EXPECT_EQ(repository.get_messages("s1").back().message.content, "plain");
}

TEST_F(TurnOrchestratorTest, SecondToolSupportErrorPropagates) {
    gateway.steps = {failure(404, {{"message", "No endpoints found that support tool use"}})};
    EXPECT_THROW(run(user_request("hi")), ProviderError);
    EXPECT_EQ(gateway.payloads.size(), 2u);
}

TEST_F(TurnOrchestratorTest, ExplicitToolChoiceIsNotRetried) {
    gateway.steps = {failure(404, {{"message", "No endpoints found that support tool use"}}), reply("x")};
    auto request = user_request("hi");
    request.tool_choice = "required";
    EXPECT_THROW(run(request), ProviderError);
    EXPECT_EQ(gateway.payloads.size(), 1u);
}

TEST_F(TurnOrchestratorTest, OtherProviderErrorsPropagate) {
    gateway.steps = {failure(500, "upstream exploded")};
    try {
        run(user_request("hi"));
        FAIL() << "expected ProviderError";
    } catch (const ProviderError& e) {
        EXPECT_EQ(e.status_code, 500);
    }
    EXPECT_EQ(gateway.payloads.size(), 1u);
}

TEST_F(TurnOrchestratorTest, MissingArgumentsSkipTheTool) {
    gateway.steps = {call("get_weather", ""), reply("Which city?")};
    auto events = run(user_request("weather?"));

    EXPECT_TRUE(tools.calls.empty());
    auto errors = tool_events(events, "error");
    ASSERT_EQ(errors.size(), 1u);
    EXPECT_EQ(errors[0]["result"], "Tool get_weather requires arguments but none were provided.");
    auto notices = named(events, "notice");
    ASSERT_EQ(notices.size(), 1u);
    EXPECT_EQ(notices[0]["type"], "tool_followup_required");
    EXPECT_EQ(notices[0]["reason"], "missing_arguments");
    EXPECT_EQ(notices[0]["tool"], "get_weather");
}

TEST_F(TurnOrchestratorTest, NonObjectArgumentsAreRejected) {
    gateway.steps = {call("get_weather", "[1, 2]"), reply("sorry")};
    auto events = run(user_request("weather?"));

    EXPECT_TRUE(tools.calls.empty());
    auto errors = tool_events(events, "error");
    ASSERT_EQ(errors.size(), 1u);
    EXPECT_EQ(errors[0]["result"], "Tool get_weather expected a JSON object for arguments but received array.");
    EXPECT_EQ(named(events, "notice")[0]["reason"], "tool_error");
}

TEST_F(TurnOrchestratorTest, InvalidJsonArgumentsAreRejected) {
    gateway.steps = {call("get_weather", "{\"city\":"), reply("sorry")};
    auto events = run(user_request("weather?"));

    EXPECT_TRUE(tools.calls.empty());
    auto errors = tool_events(events, "error");
    ASSERT_EQ(errors.size(), 1u);
    EXPECT_EQ(errors[0]["result"].get<std::string>().rfind("Invalid JSON arguments for tool get_weather", 0), 0u);
}

TEST_F(TurnOrchestratorTest, SessionIdIsInjectedForHistoryTools) {
    gateway.steps = {call("chat_history", "{\"session_id\":\"other\",\"limit\":5}"), reply("done")};
    run(user_request("what did we discuss?"));

    ASSERT_EQ(tools.calls.size(), 1u);
    EXPECT_EQ(tools.calls[0].second["session_id"], "s1");
    EXPECT_EQ(tools.calls[0].second["limit"], 5);
}

TEST_F(TurnOrchestratorTest, UnknownToolBecomesErrorResult) {
    gateway.steps = {call("launch_rocket", "{}"), reply("cannot")};
    auto events = run(user_request("launch"));

    auto errors = tool_events(events, "error");
    ASSERT_EQ(errors.size(), 1u);
    EXPECT_EQ(errors[0]["result"], "Tool error: Unknown tool: launch_rocket");
    EXPECT_EQ(repository.get_messages("s1")[2].message.content, "Tool error: Unknown tool: launch_rocket");
}

TEST_F(TurnOrchestratorTest, NoResultReplyRequestsFollowup) {
    tools.replies["get_weather"] = "No results for Atlantis";
    gateway.steps = {call("get_weather", "{\"city\":\"Atlantis\"}"), reply("Not found.")};
    auto events = run(user_request("weather in Atlantis"));

    auto notices = named(events, "notice");
    ASSERT_EQ(notices.size(), 1u);
    EXPECT_EQ(notices[0]["reason"], "no_results");
    EXPECT_EQ(notices[0]["attempt"], 0);
    EXPECT_TRUE(notices[0]["confirmation_required"].get<bool>());
}

TEST_F(TurnOrchestratorTest, PreambleIsSentButNotPersisted) {
    gateway.steps = {reply("ok")};
    auto opts = options();
    opts.system_prompt = "Be brief.";
    auto request = user_request("hi");
    request.contexts = {" Weather "};
    run(request, opts);

    auto& messages = gateway.payloads[0]["messages"];
    ASSERT_EQ(messages.size(), 2u + 1u);
    EXPECT_EQ(messages[0]["role"], "system");
    EXPECT_EQ(messages[0]["content"], "Be brief.");
    EXPECT_EQ(messages[1]["content"], "Tool digest for contexts: weather");
    EXPECT_EQ(tools.last_contexts, std::vector<std::string>{"weather"});

    auto records = repository.get_messages("s1");
    ASSERT_EQ(records.size(), 2u);
    EXPECT_EQ(records[0].message.role, "user");
}

TEST_F(TurnOrchestratorTest, LeadingSystemMessageSuppressesPrompt) {
    gateway.steps = {reply("ok")};
    auto opts = options();
    opts.system_prompt = "Be brief.";
    ChatRequest request;
    request.messages = {Message::text("system", "Custom"), Message::text("user", "hi")};
    run(request, opts);

    auto& messages = gateway.payloads[0]["messages"];
    ASSERT_EQ(messages.size(), 2u);
    EXPECT_EQ(messages[0]["content"], "Custom");
}

TEST_F(TurnOrchestratorTest, ModelAndSettingsPrecedence) {
    gateway.steps = {reply("ok")};
    auto opts = options();
    opts.provider_overrides = {{"model", "override/model"}, {"temperature", 0.2}, {"top_p", 0.5},
                               {"provider", {{"order", {"a"}}, {"allow_fallbacks", true}}}};
    auto request = user_request("hi");
    request.settings = {{"temperature", 0.9}, {"provider", {{"allow_fallbacks", false}}}};
    run(request, opts);

    auto& payload = gateway.payloads[0];
    EXPECT_EQ(payload["model"], "override/model");
    EXPECT_DOUBLE_EQ(payload["temperature"].get<double>(), 0.9);
    EXPECT_DOUBLE_EQ(payload["top_p"].get<double>(), 0.5);
    EXPECT_FALSE(payload["provider"]["allow_fallbacks"].get<bool>());
    EXPECT_EQ(payload["provider"]["order"][0], "a");

    gateway.payloads.clear();
    request.model = "request/model";
    run(request, opts);
    EXPECT_EQ(gateway.payloads[0]["model"], "request/model");
}

TEST_F(TurnOrchestratorTest, ToolsWithheldFromIncapableModels) {
    gateway.steps = {reply("ok")};
    auto opts = options();
    opts.model_capabilities["default/model"].supports_tools = false;
    run(user_request("hi"), opts);
    EXPECT_FALSE(gateway.payloads[0].contains("tools"));
}

TEST_F(TurnOrchestratorTest, ToolChoiceNoneSendsNoTools) {
    gateway.steps = {reply("ok")};
    auto request = user_request("hi");
    request.tool_choice = "none";
    run(request);
    EXPECT_FALSE(gateway.payloads[0].contains("tools"));
}

TEST_F(TurnOrchestratorTest, RoutingHeadersLandInMetadata) {
    auto step = reply("ok");
    step.routing = {{"x-request-id", "req-9"}};
    gateway.steps = {step};
    auto events = run(user_request("hi"));

    auto metadata = named(events, "metadata");
    ASSERT_EQ(metadata.size(), 1u);
    EXPECT_EQ(metadata[0]["routing"]["x-request-id"], "req-9");
    EXPECT_EQ(repository.get_messages("s1")[1].message.metadata["routing"]["x-request-id"], "req-9");
    for (auto& e : events) EXPECT_NE(e.event, "openrouter_headers");
}

TEST_F(TurnOrchestratorTest, ToolImagesAreShownToTheUser) {
    auto ref = attachments.store("s1", "png-bytes", "image/png", "chart.png");
    tools.replies["render_chart"] = "attachment_id: " + ref.id + "\nChart ready";
    gateway.steps = {call("render_chart", "{\"series\":[1,2]}"), reply("Here it is.")};
    auto events = run(user_request("chart please"));

    auto finished = tool_events(events, "finished");
    ASSERT_EQ(finished.size(), 1u);
    ASSERT_TRUE(finished[0].contains("content"));
    EXPECT_EQ(finished[0]["content"][0]["text"], "Chart ready");
    EXPECT_EQ(finished[0]["content"][1]["image_url"]["url"], ref.url);

    auto& tool_msg = gateway.payloads[1]["messages"][2];
    EXPECT_EQ(tool_msg["content"], "Chart ready\nImage URL: " + ref.url);

    auto final_content = repository.get_messages("s1").back().message.content;
    ASSERT_TRUE(final_content.is_array());
    ASSERT_EQ(final_content.size(), 3u);
    EXPECT_EQ(final_content[0]["text"], "Image from render_chart:");
    EXPECT_EQ(final_content[1]["metadata"]["attachment_id"], ref.id);
    EXPECT_FALSE(final_content[1].contains("_tool_source"));
    EXPECT_EQ(final_content[2]["text"], "Here it is.");
}

TEST_F(TurnOrchestratorTest, ConversationLogGetsSnapshot) {
    auto dir = fs::temp_directory_path() / ("sb_convlog_" + std::to_string(epoch_now()));
    ConversationLog log(dir.string());
    gateway.steps = {reply("logged")};

    TurnOrchestrator orchestrator(options(), gateway, repository, tools, &attachments, &log);
    orchestrator.process_turn("s1", user_request("hi"), [](const SseEvent&) {});

    std::string text = read_file(log.file_for("s1"));
    ASSERT_FALSE(text.empty());
    auto entry = json::parse(text.substr(0, text.find('\n')));
    EXPECT_EQ(entry["type"], "conversation_snapshot");
    EXPECT_EQ(entry["message_count"], 2);
    EXPECT_EQ(entry["conversation"][1]["content"], "logged");
    fs::remove_all(dir);
}

TEST(ChatRequestParsing, AcceptsSingleMessageAndKeepsSettings) {
    auto r = ChatRequest::from_json({{"message", "hello"}, {"session_id", "s9"},
                                     {"contexts", "calendar"}, {"temperature", 0.3}});
    ASSERT_EQ(r.messages.size(), 1u);
    EXPECT_EQ(r.messages[0].role, "user");
    EXPECT_EQ(r.session_id, "s9");
    EXPECT_EQ(r.contexts, std::vector<std::string>{"calendar"});
    EXPECT_DOUBLE_EQ(r.settings["temperature"].get<double>(), 0.3);
    EXPECT_FALSE(r.settings.contains("message"));
}

TEST(ChatRequestParsing, RejectsEmptyRequests) {
    EXPECT_THROW(ChatRequest::from_json(json::object()), ConfigError);
    EXPECT_THROW(ChatRequest::from_json({{"messages", {{{"content", "no role"}}}}}), ConfigError);
    EXPECT_THROW(ChatRequest::from_json("text"), ConfigError);
}

TEST(PrepareMessages, FlattensToolFragments) {
    Message tool;
    tool.role = "tool";
    tool.tool_call_id = "c1";
    tool.content = json::array({
        {{"type", "text"}, {"text", "Result"}},
        {{"type", "image_url"}, {"image_url", {{"url", "/a/1"}}}},
        {{"type", "table"}, {"rows", 2}},
    });
    Message user = Message::text("user", "hi");
    user.content = json::array({{{"type", "text"}, {"text", "look"}}});

    auto out = prepare_messages_for_model({user, tool});
    EXPECT_TRUE(out[0]["content"].is_array());
    EXPECT_EQ(out[1]["content"], "Result\n{\"rows\":2,\"type\":\"table\"}\nImage URL: /a/1");
    EXPECT_EQ(out[1]["tool_call_id"], "c1");
}

TEST(PrepareMessages, ImageOnlyToolResult) {
    Message tool;
    tool.role = "tool";
    tool.content = json::array({{{"type", "image_url"}, {"image_url", {{"url", "/a/2"}}}}});
    auto out = prepare_messages_for_model({tool});
    EXPECT_EQ(out[0]["content"], "Tool returned image attachment(s).\nImage URL: /a/2");
}

TEST(AttachmentReferences, LinesAreStripped) {
    auto [text, ids] = parse_attachment_references("Saved.\nattachment_id: att_7\n  attachment_id: att_8");
    EXPECT_EQ(text, "Saved.");
    EXPECT_EQ(ids, (std::vector<std::string>{"att_7", "att_8"}));
}

TEST(AttachmentReferences, JsonBodiesAreSearched) {
    auto [text, ids] = parse_attachment_references("{\"files\":[{\"attachment_id\":\"att_3\"}]}");
    EXPECT_EQ(ids, std::vector<std::string>{"att_3"});
    EXPECT_EQ(text, "{\"files\":[{\"attachment_id\":\"att_3\"}]}");

    auto [plain, none] = parse_attachment_references("nothing here");
    EXPECT_TRUE(none.empty());
    EXPECT_EQ(plain, "nothing here");
}
