#pragma once

#include <array>
#include <cstdint>
#include <span>
#include <vector>


namespace gelfmover::gelf {
    /**
     * GELF chunked datagrams start with this two byte marker, followed by the rest of the @c ChunkHeader layout.
     */
    constexpr auto CHUNK_MAGIC = std::array<std::uint8_t, 2>{0x1e, 0x0f};

    /**
     * Magic (2) + message id (8) + sequence index (1) + sequence count (1).
     */
    constexpr auto CHUNK_HEADER_SIZE = 12uz;

    using MessageId = std::array<std::uint8_t, 8>;

    /**
     * The @c RawChunk is one fragment of a chunked GELF message, as cut out of a datagram by the UDP listener. The
     * sequence count is repeated in every chunk of a message, and the first one seen fixes it for the reassembler.
     */
    struct RawChunk {
        MessageId message_id{};
        std::uint8_t sequence_index = 0;
        std::uint8_t sequence_count = 0;
        std::vector<std::uint8_t> payload;
    };

    using RawPayload = std::vector<std::uint8_t>;

    /**
     * Whether a datagram claims to be a chunk, i.e. starts with @c CHUNK_MAGIC. Anything else is a whole message.
     */
    [[nodiscard]]
    auto is_chunked(std::span<const std::uint8_t> datagram) -> bool;

    /**
     * Cut a chunked datagram into its header fields and payload.
     * @throw MalformedChunkError If the datagram is shorter than the header, the count is zero, or the index is not
     * below the count.
     */
    auto parse_chunk(std::span<const std::uint8_t> datagram) -> RawChunk;
}
