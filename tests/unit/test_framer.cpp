#include <gtest/gtest.h>
#include "mcphost/framer.hpp"
#include "mcphost/codec.hpp"

using namespace mcphost;

TEST(LineFramer, SingleFrame) {
    LineFramer framer;
    auto frames = framer.feed("{\"a\":1}\n");
    ASSERT_EQ(frames.size(), 1u);
    EXPECT_EQ(frames[0], "{\"a\":1}");
    EXPECT_EQ(framer.buffered(), 0u);
}

TEST(LineFramer, PartialFrameIsBuffered) {
    LineFramer framer;
    EXPECT_TRUE(framer.feed("{\"a\":").empty());
    EXPECT_EQ(framer.buffered(), 5u);
    auto frames = framer.feed("1}\n");
    ASSERT_EQ(frames.size(), 1u);
    EXPECT_EQ(frames[0], "{\"a\":1}");
}

TEST(LineFramer, SeveralFramesInOneChunk) {
    LineFramer framer;
    auto frames = framer.feed("one\ntwo\nthree\nfour");
    ASSERT_EQ(frames.size(), 3u);
    EXPECT_EQ(frames[2], "three");
    EXPECT_EQ(framer.buffered(), 4u);
}

TEST(LineFramer, CrlfAndBlankLines) {
    LineFramer framer;
    auto frames = framer.feed("one\r\n\n\r\ntwo\n");
    ASSERT_EQ(frames.size(), 2u);
    EXPECT_EQ(frames[0], "one");
    EXPECT_EQ(frames[1], "two");
}

TEST(LineFramer, ByteAtATime) {
    LineFramer framer;
    const std::string input = "{\"jsonrpc\":\"2.0\",\"method\":\"x\"}\n";
    std::vector<std::string> frames;
    for (char c : input) {
        for (auto& f : framer.feed(std::string_view(&c, 1))) frames.push_back(std::move(f));
    }
    ASSERT_EQ(frames.size(), 1u);
    EXPECT_EQ(frames[0] + "\n", input);
}

TEST(LineFramer, OversizedFrameIsDropped) {
    LineFramer framer(8);
    auto frames = framer.feed("0123456789abcdef\nok\n");
    ASSERT_EQ(frames.size(), 1u);
    EXPECT_EQ(frames[0], "ok");
    EXPECT_EQ(framer.dropped_frames(), 1u);
}

TEST(LineFramer, OversizedFrameAcrossChunks) {
    LineFramer framer(8);
    EXPECT_TRUE(framer.feed("0123456789").empty());
    EXPECT_TRUE(framer.feed("more garbage").empty());
    auto frames = framer.feed(" end\nnext\n");
    ASSERT_EQ(frames.size(), 1u);
    EXPECT_EQ(frames[0], "next");
    EXPECT_EQ(framer.dropped_frames(), 1u);
}

TEST(LineFramer, ResetDiscardsPartialFrame) {
    LineFramer framer;
    (void)framer.feed("partial");
    framer.reset();
    EXPECT_EQ(framer.buffered(), 0u);
    auto frames = framer.feed("whole\n");
    ASSERT_EQ(frames.size(), 1u);
    EXPECT_EQ(frames[0], "whole");
}

TEST(LineFramer, EncodeTerminatesWithNewline) {
    JsonRpcNotification n;
    n.method = "notifications/initialized";
    std::string wire = LineFramer::encode(n);
    ASSERT_FALSE(wire.empty());
    EXPECT_EQ(wire.back(), '\n');
    EXPECT_EQ(wire.find('\n'), wire.size() - 1);

    LineFramer framer;
    auto frames = framer.feed(wire);
    ASSERT_EQ(frames.size(), 1u);
    EXPECT_TRUE(std::holds_alternative<JsonRpcNotification>(Codec::parse(frames[0])));
}
