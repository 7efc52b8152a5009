#pragma once

#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>

#include <gelfmover/gelf/chunk.hpp>


namespace gelfmover::ingest {
    /**
     * Cuts a GELF TCP byte stream into frames. Each frame ends with a NUL byte; bytes are buffered across reads until
     * the terminator arrives. Empty frames are skipped. A frame longer than @c max_frame_size is discarded up to its
     * terminator rather than buffered without bound.
     */
    class FrameSplitter {
        std::size_t m_max_frame_size;
        std::vector<std::uint8_t> m_buffer;
        bool m_discarding = false;

    public:
        static constexpr std::uint8_t DELIMITER = 0x00;
        static constexpr auto DEFAULT_MAX_FRAME_SIZE = 8uz * 1024 * 1024;

        struct Result {
            std::vector<gelf::RawPayload> frames;
            std::size_t oversized = 0;
        };

        explicit FrameSplitter(std::size_t max_frame_size = DEFAULT_MAX_FRAME_SIZE);

        [[nodiscard]]
        auto feed(std::span<const std::uint8_t> data) -> Result;

        /**
         * Bytes of an unterminated frame still buffered.
         */
        [[nodiscard]]
        auto pending() const -> std::size_t {
            return m_buffer.size();
        }
    };
}
