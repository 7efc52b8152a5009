#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <thread>
#include <vector>

#include <spdlog/logger.h>

#include <gelfmover/gelf/chunk.hpp>
#include <gelfmover/gelf/reassembler.hpp>
#include <gelfmover/net/udp_socket.hpp>
#include <gelfmover/stats.hpp>
#include <gelfmover/utils/bounded_queue.hpp>
#include <gelfmover/utils/worker_pool.hpp>


namespace gelfmover::ingest {
    /**
     * The @c UDPListener owns the UDP socket. One receiver thread reads datagrams and hands them to a pool of reader
     * workers, which either pass whole messages straight to the unpacker queue or cut chunks out and feed them to the
     * reassembler. Nothing on this path ever waits for a downstream stage: when a queue is full the datagram or payload
     * is dropped and counted, as UDP delivery is best-effort anyway.
     */
    class UDPListener {
        std::shared_ptr<spdlog::logger> m_logger;
        net::UDPSocket m_socket;
        gelf::Reassembler &m_reassembler;
        std::shared_ptr<utils::BoundedQueue<gelf::RawPayload>> m_unpack_queue;
        Counters &m_counters;

        std::shared_ptr<utils::BoundedQueue<std::vector<std::uint8_t>>> m_datagram_queue;
        std::unique_ptr<utils::WorkerPool<std::vector<std::uint8_t>>> m_readers;
        std::jthread m_receiver_thread;

    public:
        static constexpr auto POLL_INTERVAL = std::chrono::milliseconds(200);

        /**
         * Bind the socket. Failing to bind is a startup failure and propagates as @c std::system_error.
         */
        UDPListener(
            net::Endpoint const &endpoint,
            std::size_t reader_threads,
            std::size_t queue_size,
            gelf::Reassembler &reassembler,
            std::shared_ptr<utils::BoundedQueue<gelf::RawPayload>> unpack_queue,
            Counters &counters);

        ~UDPListener();

        auto start() -> void;
        auto stop() -> void;

        /**
         * Classify one datagram and route it. Malformed chunk headers are dropped and counted here.
         */
        auto handle_datagram(std::vector<std::uint8_t> &&datagram) -> void;

        [[nodiscard]]
        auto local_port() const -> std::uint16_t {
            return m_socket.local_port();
        }

    private:
        auto receive_loop(std::stop_token const &stop_token) -> void;
        auto enqueue_payload(gelf::RawPayload &&payload) -> void;
    };
}
