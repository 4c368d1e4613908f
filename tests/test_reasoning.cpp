#include <gtest/gtest.h>
#include "reasoning.hpp"

using namespace switchboard;
using nlohmann::json;

TEST(Reasoning, PlainStringIsOneSegment) {
    auto segs = extract_reasoning_segments("  thinking about it ");
    ASSERT_EQ(segs.size(), 1u);
    EXPECT_EQ(segs[0]["text"], "thinking about it");
    EXPECT_FALSE(segs[0].contains("type"));
}

TEST(Reasoning, TypedObjectsLabelTheirText) {
    json payload = json::array({
        {{"type", "reasoning.summary"}, {"summary", "x"}, {"text", "Step one"}},
        {{"type", "reasoning.text"}, {"content", {{{"text", "Step two"}}}}},
    });
    auto segs = extract_reasoning_segments(payload);
    ASSERT_EQ(segs.size(), 2u);
    EXPECT_EQ(segs[0]["type"], "reasoning.summary");
    EXPECT_EQ(segs[0]["text"], "Step one");
    EXPECT_EQ(segs[1]["type"], "reasoning.text");
    EXPECT_EQ(segs[1]["text"], "Step two");
}

TEST(Reasoning, ObjectWithoutTextKeysIsSerialized) {
    auto segs = extract_reasoning_segments({{"type", "reasoning.encrypted"}, {"id", "r1"}, {"data", "abc"}});
    ASSERT_EQ(segs.size(), 1u);
    EXPECT_EQ(segs[0]["type"], "reasoning.encrypted");
    EXPECT_EQ(segs[0]["text"], "{\"data\":\"abc\"}");
}

TEST(Reasoning, ScalarsAreDumped) {
    auto segs = extract_reasoning_segments(json::array({42, true, nullptr}));
    ASSERT_EQ(segs.size(), 2u);
    EXPECT_EQ(segs[0]["text"], "42");
    EXPECT_EQ(segs[1]["text"], "true");
}

TEST(Reasoning, ExtendDeduplicatesByTypeAndText) {
    std::vector<ReasoningSegment> acc;
    ReasoningKeySet seen;
    extend_reasoning_segments(acc, {{{"text", "a"}}, {{"text", " a "}}, {{"text", "a"}, {"type", "t"}}}, seen);
    extend_reasoning_segments(acc, {{{"text", "a"}}, {{"text", ""}}, json("not an object")}, seen);
    ASSERT_EQ(acc.size(), 2u);
    EXPECT_EQ(acc[1]["type"], "t");
}
