#include <gelfmover/gateway.hpp>

#include <gelfmover/errors.hpp>
#include <gelfmover/utils/logging.hpp>


gelfmover::Gateway::Gateway(
    Config config,
    std::shared_ptr<sink::Transport> transport) :
    m_logger(utils::create_logger("Gateway")),
    m_config(std::move(config)),
    m_unpacker(m_config.max_decompressed_size) {

    // Build the pipeline from the sink backwards, so every stage exists before anything feeds it.
    m_forwarder = std::make_unique<sink::Forwarder>(
        std::move(transport), m_config.forwarder_threads, m_config.queue_size, m_counters);

    m_unpack_queue = std::make_shared<utils::BoundedQueue<gelf::RawPayload>>(m_config.queue_size);
    m_unpack_pool = std::make_unique<utils::WorkerPool<gelf::RawPayload>>(
        "UnpackerPool", m_config.unpacker_threads, m_unpack_queue,
        [this](gelf::RawPayload &&payload) { handle_payload(std::move(payload)); });

    m_reassembler = std::make_unique<gelf::Reassembler>(
        m_config.max_parallel_chunks, m_counters, m_config.chunk_ttl, m_config.sweep_interval);

    // Bind both listeners; failures here are fatal startup errors.
    m_udp_listener = std::make_unique<ingest::UDPListener>(
        m_config.udp_addr, m_config.reader_threads, m_config.queue_size, *m_reassembler, m_unpack_queue, m_counters);
    m_tcp_listener = std::make_unique<ingest::TCPListener>(
        m_config.tcp_addr, m_unpack_queue, m_counters, m_config.max_frame_size);
}


gelfmover::Gateway::~Gateway() {
    stop();
}


auto gelfmover::Gateway::start()
    -> void {
    m_reassembler->start();
    m_udp_listener->start();
    m_tcp_listener->start();
    m_stats_thread = std::jthread([this](std::stop_token stop_token) { report_loop(stop_token); });
    m_logger->info("{} started", m_config.system_name);
}


auto gelfmover::Gateway::stop()
    -> void {
    {
        std::scoped_lock lock(m_stats_mutex);
        if (m_stopped) {
            return;
        }
        m_stopped = true;
    }
    m_logger->info("{} stopping", m_config.system_name);

    // Stop taking traffic.
    m_udp_listener->stop();
    m_tcp_listener->stop();
    m_reassembler->stop();

    // Drain the stages in order: unpacker, then forwarder.
    m_unpack_pool->join();
    m_forwarder->stop();

    if (m_stats_thread.joinable()) {
        m_stats_thread.request_stop();
        m_stats_thread.join();
    }
    m_counters.log_summary(*m_logger);
}


auto gelfmover::Gateway::handle_payload(
    gelf::RawPayload &&payload)
    -> void {
    // Decode; a bad payload is dropped and counted, never fatal.
    auto record = gelf::LogRecord{};
    try {
        record = m_unpacker.unpack(payload);
    }
    catch (UnpackError const &e) {
        m_counters.unpack_failures++;
        m_logger->debug("Dropping payload of {} bytes: {}", payload.size(), e.what());
        return;
    }
    m_counters.records_unpacked++;

    // Hand the record on to the forwarder pool.
    if (not m_forwarder->submit(std::move(record))) {
        m_logger->debug("Forwarder stopped, dropping record");
    }
}


auto gelfmover::Gateway::report_loop(
    std::stop_token const &stop_token)
    -> void {
    while (not stop_token.stop_requested()) {
        {
            std::unique_lock lock(m_stats_mutex);
            m_stats_cv.wait_for(lock, stop_token, m_config.stats_interval, [] { return false; });
        }
        if (stop_token.stop_requested()) {
            break;
        }
        m_counters.log_summary(*m_logger);
    }
}
