#include <gtest/gtest.h>
#include "sse.hpp"

using namespace switchboard;

TEST(SseParser, SplitsEventsOnBlankLines) {
    std::vector<SseEvent> events;
    SseParser parser([&](const SseEvent& e) { events.push_back(e); });
    parser.feed("data: {\"a\":1}\n\nevent: tool\ndata: x\n\n");
    ASSERT_EQ(events.size(), 2u);
    EXPECT_EQ(events[0].event, "message");
    EXPECT_EQ(events[0].data, "{\"a\":1}");
    EXPECT_EQ(events[1].event, "tool");
    EXPECT_EQ(events[1].data, "x");
}

TEST(SseParser, HandlesArbitraryByteSplits) {
    std::string wire = "event: message\r\ndata: hello\r\ndata: world\r\n\r\ndata: [DONE]\n\n";
    for (size_t cut = 1; cut < wire.size(); cut++) {
        std::vector<SseEvent> events;
        SseParser parser([&](const SseEvent& e) { events.push_back(e); });
        parser.feed(wire.substr(0, cut));
        parser.feed(wire.substr(cut));
        ASSERT_EQ(events.size(), 2u) << "cut at " << cut;
        EXPECT_EQ(events[0].data, "hello\nworld");
        EXPECT_EQ(events[1].data, "[DONE]");
    }
}

TEST(SseParser, IgnoresComments) {
    std::vector<SseEvent> events;
    SseParser parser([&](const SseEvent& e) { events.push_back(e); });
    parser.feed(": keep-alive\n\ndata: x\n\n");
    ASSERT_EQ(events.size(), 1u);
    EXPECT_EQ(events[0].data, "x");
}

TEST(SseParser, FinishFlushesTrailingEvent) {
    std::vector<SseEvent> events;
    SseParser parser([&](const SseEvent& e) { events.push_back(e); });
    parser.feed("data: tail");
    EXPECT_TRUE(events.empty());
    parser.finish();
    ASSERT_EQ(events.size(), 1u);
    EXPECT_EQ(events[0].data, "tail");
}

TEST(SseFormat, WritesEventAndData) {
    EXPECT_EQ(format_sse("tool", "{}"), "event: tool\ndata: {}\n\n");
}
