#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <cstring>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include <zlib.h>

#include <gelfmover/errors.hpp>
#include <gelfmover/gelf/chunk.hpp>
#include <gelfmover/sink/transport.hpp>


namespace gelfmover::test {
    inline auto to_bytes(std::string const &text) -> std::vector<std::uint8_t> {
        return {text.begin(), text.end()};
    }

    inline auto make_message_id(const std::uint8_t seed) -> gelf::MessageId {
        return {seed, 0x11, 0x22, 0x33, 0x44, 0x55, 0x66, seed};
    }

    inline auto make_chunk(
        gelf::MessageId const &message_id,
        const std::uint8_t index,
        const std::uint8_t count,
        std::string const &payload)
        -> gelf::RawChunk {
        return gelf::RawChunk{.message_id = message_id, .sequence_index = index, .sequence_count = count, .payload = to_bytes(payload)};
    }

    inline auto make_chunk_datagram(
        gelf::MessageId const &message_id,
        const std::uint8_t index,
        const std::uint8_t count,
        std::vector<std::uint8_t> const &payload)
        -> std::vector<std::uint8_t> {
        auto datagram = std::vector<std::uint8_t>{gelf::CHUNK_MAGIC[0], gelf::CHUNK_MAGIC[1]};
        datagram.insert(datagram.end(), message_id.begin(), message_id.end());
        datagram.push_back(index);
        datagram.push_back(count);
        datagram.insert(datagram.end(), payload.begin(), payload.end());
        return datagram;
    }

    /**
     * Deflate @c text with a gzip (window bits 31) or zlib (window bits 15) wrapper.
     */
    inline auto compress(std::string const &text, const int window_bits) -> std::vector<std::uint8_t> {
        z_stream zstream;
        std::memset(&zstream, 0, sizeof(zstream));
        if (deflateInit2(&zstream, Z_DEFAULT_COMPRESSION, Z_DEFLATED, window_bits, 8, Z_DEFAULT_STRATEGY) != Z_OK) {
            throw std::runtime_error("deflateInit2 failed");
        }

        auto output = std::vector<std::uint8_t>(deflateBound(&zstream, static_cast<uLong>(text.size())) + 32);
        zstream.next_in = reinterpret_cast<Bytef*>(const_cast<char*>(text.data()));
        zstream.avail_in = static_cast<uInt>(text.size());
        zstream.next_out = output.data();
        zstream.avail_out = static_cast<uInt>(output.size());

        const auto rc = deflate(&zstream, Z_FINISH);
        deflateEnd(&zstream);
        if (rc != Z_STREAM_END) {
            throw std::runtime_error("deflate failed");
        }
        output.resize(zstream.total_out);
        return output;
    }

    inline auto gzip(std::string const &text) -> std::vector<std::uint8_t> {
        return compress(text, 15 + 16);
    }

    inline auto zlib(std::string const &text) -> std::vector<std::uint8_t> {
        return compress(text, 15);
    }

    /**
     * Keeps every event it is given, and lets a test wait until a number of events has arrived.
     */
    class RecordingTransport final : public sink::Transport {
        mutable std::mutex m_mutex;
        std::condition_variable m_cv;
        std::vector<sink::ForwardEvent> m_events;

    public:
        auto send(sink::ForwardEvent const &event) -> void override {
            {
                std::scoped_lock lock(m_mutex);
                m_events.push_back(event);
            }
            m_cv.notify_all();
        }

        [[nodiscard]]
        auto describe() const -> std::string override {
            return "recording";
        }

        auto wait_for(const std::size_t count, const std::chrono::milliseconds timeout = std::chrono::seconds(5)) -> bool {
            std::unique_lock lock(m_mutex);
            return m_cv.wait_for(lock, timeout, [&] { return m_events.size() >= count; });
        }

        [[nodiscard]]
        auto events() const -> std::vector<sink::ForwardEvent> {
            std::scoped_lock lock(m_mutex);
            return m_events;
        }
    };

    /**
     * Fails every call, transiently or permanently, and counts the attempts.
     */
    class FailingTransport final : public sink::Transport {
        bool m_permanent;

    public:
        std::atomic<std::size_t> attempts = 0;

        explicit FailingTransport(const bool permanent = false) :
            m_permanent(permanent) {
        }

        auto send(sink::ForwardEvent const &) -> void override {
            ++attempts;
            if (m_permanent) {
                throw PermanentForwardError("HTTP 401: invalid api key");
            }
            throw TransientForwardError("connection refused");
        }

        [[nodiscard]]
        auto describe() const -> std::string override {
            return "failing";
        }
    };

    /**
     * Fails transiently a fixed number of times, then succeeds.
     */
    class FlakyTransport final : public sink::Transport {
        std::size_t m_failures;

    public:
        std::atomic<std::size_t> attempts = 0;

        explicit FlakyTransport(const std::size_t failures) :
            m_failures(failures) {
        }

        auto send(sink::ForwardEvent const &) -> void override {
            if (++attempts <= m_failures) {
                throw TransientForwardError("timed out");
            }
        }

        [[nodiscard]]
        auto describe() const -> std::string override {
            return "flaky";
        }
    };

    template <typename Predicate>
    auto eventually(Predicate predicate, const std::chrono::milliseconds timeout = std::chrono::seconds(5)) -> bool {
        const auto deadline = std::chrono::steady_clock::now() + timeout;
        while (std::chrono::steady_clock::now() < deadline) {
            if (predicate()) {
                return true;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(10));
        }
        return predicate();
    }
}
