#include <gtest/gtest.h>

#include <gelfmover/errors.hpp>
#include <gelfmover/gelf/chunk.hpp>

#include "helpers.hpp"

using namespace gelfmover;


TEST(ChunkTest, ParsesHeaderFields) {
    const auto id = test::make_message_id(7);
    const auto datagram = test::make_chunk_datagram(id, 1, 3, test::to_bytes("payload"));

    ASSERT_TRUE(gelf::is_chunked(datagram));
    const auto chunk = gelf::parse_chunk(datagram);
    EXPECT_EQ(chunk.message_id, id);
    EXPECT_EQ(chunk.sequence_index, 1);
    EXPECT_EQ(chunk.sequence_count, 3);
    EXPECT_EQ(chunk.payload, test::to_bytes("payload"));
}


TEST(ChunkTest, AllowsEmptyPayload) {
    const auto datagram = test::make_chunk_datagram(test::make_message_id(1), 0, 1, {});
    EXPECT_TRUE(gelf::parse_chunk(datagram).payload.empty());
}


TEST(ChunkTest, PlainJsonIsNotChunked) {
    EXPECT_FALSE(gelf::is_chunked(test::to_bytes(R"({"version":"1.1"})")));
    EXPECT_FALSE(gelf::is_chunked(test::to_bytes("")));
    EXPECT_FALSE(gelf::is_chunked(std::vector<std::uint8_t>{0x1e}));
}


TEST(ChunkTest, RejectsTruncatedHeader) {
    const auto datagram = std::vector<std::uint8_t>{0x1e, 0x0f, 1, 2, 3, 4, 5};
    ASSERT_TRUE(gelf::is_chunked(datagram));
    EXPECT_THROW(static_cast<void>(gelf::parse_chunk(datagram)), MalformedChunkError);
}


TEST(ChunkTest, RejectsZeroCount) {
    const auto datagram = test::make_chunk_datagram(test::make_message_id(2), 0, 0, test::to_bytes("x"));
    EXPECT_THROW(static_cast<void>(gelf::parse_chunk(datagram)), MalformedChunkError);
}


TEST(ChunkTest, RejectsIndexOutOfRange) {
    const auto datagram = test::make_chunk_datagram(test::make_message_id(3), 2, 2, test::to_bytes("x"));
    EXPECT_THROW(static_cast<void>(gelf::parse_chunk(datagram)), MalformedChunkError);
}
