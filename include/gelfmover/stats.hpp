#pragma once

#include <atomic>
#include <cstdint>
#include <memory>

#include <spdlog/logger.h>


namespace gelfmover {
    /**
     * Counters shared by every stage of the pipeline. Each one only ever increases; they exist so that drops, which are
     * never fatal, are still visible in the periodic summary.
     */
    struct Counters {
        std::atomic<std::uint64_t> datagrams_received = 0;
        std::atomic<std::uint64_t> chunks_received = 0;
        std::atomic<std::uint64_t> tcp_frames_received = 0;
        std::atomic<std::uint64_t> messages_reassembled = 0;
        std::atomic<std::uint64_t> records_unpacked = 0;
        std::atomic<std::uint64_t> events_forwarded = 0;

        std::atomic<std::uint64_t> malformed_input = 0;
        std::atomic<std::uint64_t> capacity_exceeded = 0;
        std::atomic<std::uint64_t> reassembly_timeouts = 0;
        std::atomic<std::uint64_t> unpack_failures = 0;
        std::atomic<std::uint64_t> backpressure_drops = 0;
        std::atomic<std::uint64_t> forward_transient_failures = 0;
        std::atomic<std::uint64_t> forward_permanent_failures = 0;

        auto log_summary(spdlog::logger &logger) const -> void;
    };
}
