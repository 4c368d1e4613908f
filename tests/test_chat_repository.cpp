#include <gtest/gtest.h>
#include "chat_repository.hpp"
#include "errors.hpp"
#include "utils.hpp"

using namespace switchboard;
using nlohmann::json;

TEST(ChatRepository, SessionsAreCreatedOnce) {
    SqliteChatRepository repo(":memory:");
    EXPECT_FALSE(repo.session_exists("s1"));
    repo.ensure_session("s1");
    repo.ensure_session("s1");
    EXPECT_TRUE(repo.session_exists("s1"));
}

TEST(ChatRepository, MessagesComeBackInOrder) {
    SqliteChatRepository repo(":memory:");
    repo.ensure_session("s1");
    auto first = repo.append_message("s1", "user", "hi", nullptr, "");
    auto second = repo.append_message("s1", "assistant", "hello", json{{"model", "m"}}, "");
    EXPECT_LT(first.id, second.id);
    EXPECT_FALSE(second.created_at.empty());

    auto records = repo.get_messages("s1");
    ASSERT_EQ(records.size(), 2u);
    EXPECT_EQ(records[0].message.role, "user");
    EXPECT_EQ(records[0].message.content, "hi");
    EXPECT_EQ(records[1].message.metadata["model"], "m");
    EXPECT_EQ(records[1].id, second.id);
}

TEST(ChatRepository, StructuredContentRoundTrips) {
    SqliteChatRepository repo(":memory:");
    repo.ensure_session("s1");
    json parts = json::array({
        {{"type", "text"}, {"text", "chart"}},
        {{"type", "image_url"}, {"image_url", {{"url", "/api/attachments/att_1"}}}},
    });
    repo.append_message("s1", "assistant", parts, json::object(), "");

    auto records = repo.get_messages("s1");
    ASSERT_EQ(records.size(), 1u);
    EXPECT_EQ(records[0].message.content, parts);
    EXPECT_FALSE(records[0].message.metadata.contains("__content_json__"));
}

TEST(ChatRepository, JsonLookingTextStaysText) {
    SqliteChatRepository repo(":memory:");
    repo.ensure_session("s1");
    repo.append_message("s1", "tool", "[1, 2, 3]", json{{"tool_name", "numbers"}}, "call_0");
    auto records = repo.get_messages("s1");
    ASSERT_EQ(records.size(), 1u);
    EXPECT_TRUE(records[0].message.content.is_string());
    EXPECT_EQ(records[0].message.tool_call_id, "call_0");
}

TEST(ChatRepository, AssistantToolCallsAreRebuilt) {
    SqliteChatRepository repo(":memory:");
    repo.ensure_session("s1");
    json calls = tool_calls_to_json({{"call_1", "get_weather", "{\"city\":\"Oslo\"}"}});
    repo.append_message("s1", "assistant", nullptr, json{{"tool_calls", calls}}, "");

    auto records = repo.get_messages("s1");
    ASSERT_EQ(records.size(), 1u);
    auto& m = records[0].message;
    ASSERT_EQ(m.tool_calls.size(), 1u);
    EXPECT_EQ(m.tool_calls[0].name, "get_weather");
    EXPECT_EQ(m.to_json()["tool_calls"][0]["function"]["arguments"], "{\"city\":\"Oslo\"}");
}

TEST(ChatRepository, UnknownSessionIsRejected) {
    SqliteChatRepository repo(":memory:");
    EXPECT_THROW(repo.append_message("missing", "user", "hi", nullptr, ""), StorageError);
}

TEST(ChatRepository, ClearRemovesMessages) {
    SqliteChatRepository repo(":memory:");
    repo.ensure_session("s1");
    repo.ensure_session("s2");
    repo.append_message("s1", "user", "a", nullptr, "");
    repo.append_message("s2", "user", "b", nullptr, "");
    repo.clear_session("s1");
    EXPECT_FALSE(repo.session_exists("s1"));
    EXPECT_TRUE(repo.get_messages("s1").empty());
    EXPECT_EQ(repo.get_messages("s2").size(), 1u);
}

TEST(ChatRepository, PersistsAcrossReopen) {
    auto dir = fs::temp_directory_path() / ("sb_repo_" + std::to_string(epoch_now()));
    std::string path = (dir / "chat.db").string();
    {
        SqliteChatRepository repo(path);
        repo.ensure_session("s1");
        repo.append_message("s1", "user", "remember me", nullptr, "");
    }
    SqliteChatRepository reopened(path);
    auto records = reopened.get_messages("s1");
    ASSERT_EQ(records.size(), 1u);
    EXPECT_EQ(records[0].message.content, "remember me");
    fs::remove_all(dir);
}
