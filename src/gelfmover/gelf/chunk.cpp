#include <gelfmover/gelf/chunk.hpp>

#include <algorithm>
#include <string>

#include <gelfmover/errors.hpp>


auto gelfmover::gelf::is_chunked(
    const std::span<const std::uint8_t> datagram)
    -> bool {
    return datagram.size() >= CHUNK_MAGIC.size()
        and datagram[0] == CHUNK_MAGIC[0]
        and datagram[1] == CHUNK_MAGIC[1];
}


auto gelfmover::gelf::parse_chunk(
    const std::span<const std::uint8_t> datagram)
    -> RawChunk {
    if (datagram.size() < CHUNK_HEADER_SIZE) {
        throw MalformedChunkError("header needs " + std::to_string(CHUNK_HEADER_SIZE) + " bytes, got " + std::to_string(datagram.size()));
    }

    // Split the datagram into the header fields and the payload.
    auto chunk = RawChunk{};
    std::copy_n(datagram.begin() + 2, chunk.message_id.size(), chunk.message_id.begin());
    chunk.sequence_index = datagram[10];
    chunk.sequence_count = datagram[11];
    chunk.payload.assign(datagram.begin() + CHUNK_HEADER_SIZE, datagram.end());

    // Check the sequence position is consistent.
    if (chunk.sequence_count == 0) {
        throw MalformedChunkError("sequence count is zero");
    }
    if (chunk.sequence_index >= chunk.sequence_count) {
        throw MalformedChunkError(
            "sequence index " + std::to_string(chunk.sequence_index) + " out of range for count " + std::to_string(chunk.sequence_count));
    }
    return chunk;
}
