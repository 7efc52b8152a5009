#include <gelfmover/ingest/udp_listener.hpp>

#include <system_error>

#include <gelfmover/errors.hpp>
#include <gelfmover/utils/logging.hpp>


gelfmover::ingest::UDPListener::UDPListener(
    net::Endpoint const &endpoint,
    const std::size_t reader_threads,
    const std::size_t queue_size,
    gelf::Reassembler &reassembler,
    std::shared_ptr<utils::BoundedQueue<gelf::RawPayload>> unpack_queue,
    Counters &counters) :
    m_logger(utils::create_logger("UDPListener")),
    m_reassembler(reassembler),
    m_unpack_queue(std::move(unpack_queue)),
    m_counters(counters),
    m_datagram_queue(std::make_shared<utils::BoundedQueue<std::vector<std::uint8_t>>>(queue_size)) {

    // Setup the socket.
    m_socket.bind(endpoint);
    m_logger->info("Listening for GELF over UDP on {}:{}", endpoint.host, m_socket.local_port());

    // Setup the reader pool that classifies datagrams.
    m_readers = std::make_unique<utils::WorkerPool<std::vector<std::uint8_t>>>(
        "UDPReaderPool", reader_threads, m_datagram_queue,
        [this](std::vector<std::uint8_t> &&datagram) { handle_datagram(std::move(datagram)); });
}


gelfmover::ingest::UDPListener::~UDPListener() {
    stop();
}


auto gelfmover::ingest::UDPListener::start()
    -> void {
    if (m_receiver_thread.joinable()) {
        return;
    }
    m_receiver_thread = std::jthread([this](std::stop_token stop_token) { receive_loop(stop_token); });
}


auto gelfmover::ingest::UDPListener::stop()
    -> void {
    // Stop receiving first, then let the readers finish what was already queued.
    if (m_receiver_thread.joinable()) {
        m_receiver_thread.request_stop();
        m_receiver_thread.join();
    }
    if (m_readers != nullptr) {
        m_readers->join();
    }
}


auto gelfmover::ingest::UDPListener::handle_datagram(
    std::vector<std::uint8_t> &&datagram)
    -> void {
    // No chunk magic => the datagram is a whole message.
    if (not gelf::is_chunked(datagram)) {
        enqueue_payload(std::move(datagram));
        return;
    }

    // Chunk magic => parse the header; a bad header only costs this datagram.
    auto chunk = gelf::RawChunk{};
    try {
        chunk = gelf::parse_chunk(datagram);
    }
    catch (MalformedChunkError const &e) {
        m_counters.malformed_input++;
        m_logger->debug("Dropping datagram: {}", e.what());
        return;
    }

    // Feed the reassembler; a completed message continues to the unpacker.
    m_counters.chunks_received++;
    if (auto payload = m_reassembler.handle_chunk(std::move(chunk)); payload.has_value()) {
        enqueue_payload(std::move(*payload));
    }
}


auto gelfmover::ingest::UDPListener::receive_loop(
    std::stop_token const &stop_token)
    -> void {
    m_logger->debug("UDP receiver thread started");
    while (not stop_token.stop_requested()) {
        try {
            // Wait briefly for a datagram, so that a stop request is noticed.
            auto datagram = m_socket.recv_from(POLL_INTERVAL);
            if (not datagram.has_value()) {
                continue;
            }
            m_counters.datagrams_received++;

            // Hand over to the readers without waiting.
            if (not m_datagram_queue->try_push(std::move(datagram->data))) {
                m_counters.backpressure_drops++;
                m_logger->debug("Reader queue full, dropping datagram from {}", datagram->peer);
            }
        }
        catch (std::system_error const &e) {
            m_logger->error("UDP receive failed: {}", e.what());
            std::this_thread::sleep_for(POLL_INTERVAL);
        }
    }
}


auto gelfmover::ingest::UDPListener::enqueue_payload(
    gelf::RawPayload &&payload)
    -> void {
    if (not m_unpack_queue->try_push(std::move(payload))) {
        m_counters.backpressure_drops++;
        m_logger->debug("Unpacker queue full, dropping UDP payload");
    }
}
