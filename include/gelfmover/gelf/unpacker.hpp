#pragma once

#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>

#include <gelfmover/gelf/log_record.hpp>


namespace gelfmover::gelf {
    enum class Compression {
        NONE = 0,
        GZIP = 1,
        ZLIB = 2,
    };

    /**
     * Identify the compression of a payload from its leading bytes: @c 1f @c 8b for gzip, and for zlib a deflate method
     * byte (@c 0x78 family) whose two-byte header is a multiple of 31.
     */
    [[nodiscard]]
    auto detect_compression(std::span<const std::uint8_t> payload) -> Compression;

    /**
     * Inflate a gzip or zlib payload.
     * @throw UnpackError If the stream is corrupt, truncated, or inflates beyond @c max_size bytes.
     */
    auto decompress(std::span<const std::uint8_t> payload, std::size_t max_size) -> std::vector<std::uint8_t>;

    /**
     * Decompress (when needed) and decode a GELF payload into a @c LogRecord.
     */
    class Unpacker {
        std::size_t m_max_decompressed_size;

    public:
        static constexpr auto DEFAULT_MAX_DECOMPRESSED_SIZE = 16uz * 1024 * 1024;

        explicit Unpacker(std::size_t max_decompressed_size = DEFAULT_MAX_DECOMPRESSED_SIZE);

        /**
         * @throw UnpackError If the payload cannot be decompressed, is not valid UTF-8 JSON, is not an object, or lacks
         * @c version, @c host or @c short_message.
         */
        [[nodiscard]]
        auto unpack(std::span<const std::uint8_t> payload) const -> LogRecord;
    };
}
