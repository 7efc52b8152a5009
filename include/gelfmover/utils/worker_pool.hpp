#pragma once

#include <cstddef>
#include <exception>
#include <functional>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include <spdlog/logger.h>

#include <gelfmover/utils/bounded_queue.hpp>
#include <gelfmover/utils/logging.hpp>


namespace gelfmover::utils {
    /**
     * A fixed number of threads draining one @c BoundedQueue. The worker count is set at construction and never
     * changes. An exception escaping the handler is logged and the worker carries on with the next item, so a single
     * bad item cannot take a stage down. The pool stops once its queue is closed and drained.
     */
    template <typename T>
    class WorkerPool {
    public:
        using Handler = std::function<void(T &&)>;

    private:
        std::shared_ptr<spdlog::logger> m_logger;
        std::shared_ptr<BoundedQueue<T>> m_queue;
        Handler m_handler;
        std::vector<std::jthread> m_workers;

    public:
        WorkerPool(
            std::string const &name,
            const std::size_t worker_count,
            std::shared_ptr<BoundedQueue<T>> queue,
            Handler handler) :
            m_logger(create_logger(name)),
            m_queue(std::move(queue)),
            m_handler(std::move(handler)) {

            // At least one worker, otherwise the queue would never drain.
            const auto count = worker_count == 0 ? 1uz : worker_count;
            m_workers.reserve(count);
            for (auto i = 0uz; i < count; ++i) {
                m_workers.emplace_back([this] { run(); });
            }
            m_logger->debug("Started {} workers", count);
        }

        WorkerPool(const WorkerPool &) = delete;
        auto operator=(const WorkerPool &) -> WorkerPool& = delete;

        ~WorkerPool() {
            join();
        }

        /**
         * Close the queue and wait for every worker to finish the items still queued.
         */
        auto join() -> void {
            m_queue->close();
            for (auto &worker : m_workers) {
                if (worker.joinable()) {
                    worker.join();
                }
            }
        }

        [[nodiscard]]
        auto size() const -> std::size_t {
            return m_workers.size();
        }

    private:
        auto run() -> void {
            while (auto item = m_queue->pop()) {
                try {
                    m_handler(std::move(*item));
                }
                catch (std::exception const &e) {
                    m_logger->error("Worker failed to handle item: {}", e.what());
                }
            }
        }
    };
}
