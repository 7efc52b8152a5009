#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <list>
#include <memory>
#include <mutex>
#include <thread>

#include <spdlog/logger.h>

#include <gelfmover/gelf/chunk.hpp>
#include <gelfmover/net/tcp_socket.hpp>
#include <gelfmover/stats.hpp>
#include <gelfmover/utils/bounded_queue.hpp>


namespace gelfmover::ingest {
    /**
     * The @c TCPListener accepts connections and gives each one a reader thread. TCP already delivers bytes complete
     * and in order, so frames go straight to the unpacker queue with no reassembly. Pushes wait while the queue is
     * full, which stops reading from the connection and lets TCP flow control slow the sender down. A reset or
     * end-of-stream closes the connection; reconnecting is the client's business.
     */
    class TCPListener {
        struct Connection {
            std::shared_ptr<net::TCPSocket> socket;
            std::shared_ptr<std::atomic<bool>> finished;
            std::jthread thread;
        };

        std::shared_ptr<spdlog::logger> m_logger;
        net::TCPSocket m_socket;
        std::shared_ptr<utils::BoundedQueue<gelf::RawPayload>> m_unpack_queue;
        Counters &m_counters;
        std::size_t m_max_frame_size;

        std::jthread m_acceptor_thread;
        std::mutex m_connections_mutex;
        std::list<Connection> m_connections;

    public:
        static constexpr auto POLL_INTERVAL = std::chrono::milliseconds(200);
        static constexpr auto READ_SIZE = 64uz * 1024;

        /**
         * Bind and listen. Failing to bind is a startup failure and propagates as @c std::system_error.
         */
        TCPListener(
            net::Endpoint const &endpoint,
            std::shared_ptr<utils::BoundedQueue<gelf::RawPayload>> unpack_queue,
            Counters &counters,
            std::size_t max_frame_size);

        ~TCPListener();

        auto start() -> void;
        auto stop() -> void;

        [[nodiscard]]
        auto local_port() const -> std::uint16_t {
            return m_socket.local_port();
        }

    private:
        auto accept_loop(std::stop_token const &stop_token) -> void;
        auto read_connection(net::TCPSocket const &socket, std::stop_token const &stop_token) -> void;
        auto reap_finished_connections() -> void;
    };
}
