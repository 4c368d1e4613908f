#include <gtest/gtest.h>
#include "tool_followup.hpp"

using namespace switchboard;

TEST(ToolFollowup, MissingArgumentsWins) {
    EXPECT_EQ(classify_tool_followup("error", "No results", false, true), FollowupKind::missing_arguments);
}

TEST(ToolFollowup, NoResultPhrasesOnSuccess) {
    EXPECT_EQ(classify_tool_followup("success", "No events found for that day.", false, false),
              FollowupKind::no_results);
    EXPECT_EQ(classify_tool_followup("success", "File NOT FOUND", false, false), FollowupKind::no_results);
}

TEST(ToolFollowup, ErrorsWithoutPhraseAreToolErrors) {
    EXPECT_EQ(classify_tool_followup("error", "Tool error: connection reset", true, false),
              FollowupKind::tool_error);
    EXPECT_EQ(classify_tool_followup("error", "Nothing found here", true, false), FollowupKind::no_results);
}

TEST(ToolFollowup, BlankSuccessIsEmptyResult) {
    EXPECT_EQ(classify_tool_followup("success", "  \n", false, false), FollowupKind::empty_result);
}

TEST(ToolFollowup, NormalResultNeedsNothing) {
    EXPECT_EQ(classify_tool_followup("success", "3 events today", false, false), FollowupKind::none);
    EXPECT_STREQ(to_string(FollowupKind::none), "none");
    EXPECT_STREQ(to_string(FollowupKind::no_results), "no_results");
}

TEST(ToolFollowup, CustomPhrases) {
    NoResultClassifier classifier({"  Zero Hits ", ""});
    ASSERT_EQ(classifier.phrases().size(), 1u);
    EXPECT_EQ(classify_tool_followup("success", "zero hits for query", false, false, classifier),
              FollowupKind::no_results);
    EXPECT_EQ(classify_tool_followup("success", "no results", false, false, classifier),
              FollowupKind::none);
}

TEST(ToolSupportError, RequiresAllMarkers) {
    nlohmann::json detail = {{"message", "No endpoints found that support tool use."}, {"code", 404}};
    EXPECT_TRUE(is_tool_support_error(404, detail));
    EXPECT_TRUE(is_tool_support_error(404, "This model does not support tool use"));
    EXPECT_FALSE(is_tool_support_error(400, detail));
    EXPECT_FALSE(is_tool_support_error(404, "Model not found"));
    EXPECT_FALSE(is_tool_support_error(404, nullptr));
}

TEST(SessionAwareTools, MatchesHistoryTools) {
    EXPECT_TRUE(tool_requires_session_id("chat_history"));
    EXPECT_TRUE(tool_requires_session_id("memory__chat_history"));
    EXPECT_FALSE(tool_requires_session_id("chat_history_export"));
    EXPECT_TRUE(tool_requires_session_id("notes_for_session", {"notes_for_session"}));
}
