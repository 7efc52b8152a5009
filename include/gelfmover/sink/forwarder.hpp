#pragma once

#include <atomic>
#include <chrono>
#include <cstddef>
#include <memory>

#include <spdlog/logger.h>

#include <gelfmover/gelf/log_record.hpp>
#include <gelfmover/sink/transport.hpp>
#include <gelfmover/stats.hpp>
#include <gelfmover/utils/bounded_queue.hpp>
#include <gelfmover/utils/worker_pool.hpp>


namespace gelfmover::sink {
    struct RetryPolicy {
        std::size_t max_attempts = 3;
        std::chrono::milliseconds backoff = std::chrono::milliseconds(100);
    };

    /**
     * The @c Forwarder is the last pipeline stage. Records submitted to it are queued and sent by its own worker pool.
     * Transient failures are retried with exponential backoff until the attempt budget is spent, then the record is
     * dropped. A permanent failure is reported at error level the first time only, so a bad DSN does not flood the log
     * while ingestion carries on.
     */
    class Forwarder {
        std::shared_ptr<spdlog::logger> m_logger;
        std::shared_ptr<Transport> m_transport;
        RetryPolicy m_retry;
        Counters &m_counters;
        std::atomic<bool> m_permanent_failure_reported = false;

        std::shared_ptr<utils::BoundedQueue<gelf::LogRecord>> m_queue;
        std::unique_ptr<utils::WorkerPool<gelf::LogRecord>> m_pool;

    public:
        Forwarder(
            std::shared_ptr<Transport> transport,
            std::size_t worker_count,
            std::size_t queue_size,
            Counters &counters,
            RetryPolicy retry = {});

        ~Forwarder();

        /**
         * Send one record, retrying transient failures.
         * @throw TransientForwardError Once the retry budget is exhausted.
         * @throw PermanentForwardError On the first permanent failure (never retried).
         */
        auto forward(gelf::LogRecord const &record) -> void;

        /**
         * Queue a record for the worker pool, waiting while the queue is full.
         * @return False if the forwarder is shutting down and the record was not queued.
         */
        [[nodiscard]]
        auto submit(gelf::LogRecord &&record) -> bool;

        /**
         * Stop accepting records, send everything already queued and join the workers.
         */
        auto stop() -> void;

    private:
        auto deliver(gelf::LogRecord &&record) -> void;
    };
}
