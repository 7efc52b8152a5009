#pragma once

#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <thread>

#include <spdlog/logger.h>

#include <gelfmover/config.hpp>
#include <gelfmover/gelf/reassembler.hpp>
#include <gelfmover/gelf/unpacker.hpp>
#include <gelfmover/ingest/tcp_listener.hpp>
#include <gelfmover/ingest/udp_listener.hpp>
#include <gelfmover/sink/forwarder.hpp>
#include <gelfmover/sink/transport.hpp>
#include <gelfmover/stats.hpp>
#include <gelfmover/utils/bounded_queue.hpp>
#include <gelfmover/utils/worker_pool.hpp>


namespace gelfmover {
    /**
     * The @c Gateway assembles the pipeline: UDP and TCP listeners feed a bounded unpacker queue, the unpacker pool
     * decodes payloads and submits records to the forwarder, and the forwarder pool sends them through the transport.
     * Constructing it binds both listeners, so a bad address fails before any traffic is accepted.
     */
    class Gateway {
        std::shared_ptr<spdlog::logger> m_logger;
        Config m_config;
        Counters m_counters;

        gelf::Unpacker m_unpacker;
        std::unique_ptr<sink::Forwarder> m_forwarder;
        std::shared_ptr<utils::BoundedQueue<gelf::RawPayload>> m_unpack_queue;
        std::unique_ptr<utils::WorkerPool<gelf::RawPayload>> m_unpack_pool;
        std::unique_ptr<gelf::Reassembler> m_reassembler;
        std::unique_ptr<ingest::UDPListener> m_udp_listener;
        std::unique_ptr<ingest::TCPListener> m_tcp_listener;

        std::mutex m_stats_mutex;
        std::condition_variable_any m_stats_cv;
        std::jthread m_stats_thread;
        bool m_stopped = false;

    public:
        Gateway(Config config, std::shared_ptr<sink::Transport> transport);
        ~Gateway();

        Gateway(const Gateway &) = delete;
        auto operator=(const Gateway &) -> Gateway& = delete;

        auto start() -> void;

        /**
         * Stop the listeners, then drain each stage in pipeline order. Records still queued are sent on a best-effort
         * basis; nothing is persisted.
         */
        auto stop() -> void;

        [[nodiscard]] auto counters() const -> Counters const& { return m_counters; }
        [[nodiscard]] auto udp_port() const -> std::uint16_t { return m_udp_listener->local_port(); }
        [[nodiscard]] auto tcp_port() const -> std::uint16_t { return m_tcp_listener->local_port(); }
        [[nodiscard]] auto reassembler() const -> gelf::Reassembler const& { return *m_reassembler; }

    private:
        auto handle_payload(gelf::RawPayload &&payload) -> void;
        auto report_loop(std::stop_token const &stop_token) -> void;
    };
}
