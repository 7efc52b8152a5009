#include <string>

#include <gtest/gtest.h>

#include <gelfmover/ingest/frame_splitter.hpp>

#include "helpers.hpp"

using namespace gelfmover;


namespace {
    auto with_nul(std::string text) -> std::vector<std::uint8_t> {
        auto bytes = test::to_bytes(text);
        bytes.push_back(0);
        return bytes;
    }

    auto as_string(gelf::RawPayload const &frame) -> std::string {
        return {frame.begin(), frame.end()};
    }
}


TEST(FrameSplitterTest, SplitsTwoFramesFromOneRead) {
    auto splitter = ingest::FrameSplitter();
    auto data = with_nul("first");
    const auto second = with_nul("second");
    data.insert(data.end(), second.begin(), second.end());

    const auto result = splitter.feed(data);
    ASSERT_EQ(result.frames.size(), 2);
    EXPECT_EQ(as_string(result.frames[0]), "first");
    EXPECT_EQ(as_string(result.frames[1]), "second");
    EXPECT_EQ(splitter.pending(), 0);
}


TEST(FrameSplitterTest, BuffersFrameAcrossReads) {
    auto splitter = ingest::FrameSplitter();

    EXPECT_TRUE(splitter.feed(test::to_bytes("hello, ")).frames.empty());
    EXPECT_EQ(splitter.pending(), 7);

    const auto result = splitter.feed(with_nul("world"));
    ASSERT_EQ(result.frames.size(), 1);
    EXPECT_EQ(as_string(result.frames[0]), "hello, world");
}


TEST(FrameSplitterTest, SkipsEmptyFrames) {
    auto splitter = ingest::FrameSplitter();
    const auto data = std::vector<std::uint8_t>{0, 0, 'a', 0, 0};

    const auto result = splitter.feed(data);
    ASSERT_EQ(result.frames.size(), 1);
    EXPECT_EQ(as_string(result.frames[0]), "a");
}


TEST(FrameSplitterTest, DiscardsOversizedFrameUpToTerminator) {
    auto splitter = ingest::FrameSplitter(8);

    auto result = splitter.feed(test::to_bytes("0123456789"));
    EXPECT_TRUE(result.frames.empty());
    EXPECT_EQ(result.oversized, 1);
    EXPECT_EQ(splitter.pending(), 0);

    // The tail of the long frame is dropped too; the frame after it survives.
    auto tail = with_nul("abcdef");
    const auto next = with_nul("ok");
    tail.insert(tail.end(), next.begin(), next.end());
    result = splitter.feed(tail);
    ASSERT_EQ(result.frames.size(), 1);
    EXPECT_EQ(as_string(result.frames[0]), "ok");
    EXPECT_EQ(result.oversized, 0);
}
