#include <gelfmover/stats.hpp>


auto gelfmover::Counters::log_summary(
    spdlog::logger &logger) const
    -> void {
    logger.info(
        "in: {} datagrams, {} chunks, {} tcp frames | reassembled {} | unpacked {} | forwarded {}",
        datagrams_received.load(), chunks_received.load(), tcp_frames_received.load(),
        messages_reassembled.load(), records_unpacked.load(), events_forwarded.load());

    logger.info(
        "dropped: malformed {}, capacity {}, timeout {}, unpack {}, backpressure {}, sink transient {}, sink permanent {}",
        malformed_input.load(), capacity_exceeded.load(), reassembly_timeouts.load(), unpack_failures.load(),
        backpressure_drops.load(), forward_transient_failures.load(), forward_permanent_failures.load());
}
