#include <gelfmover/sink/forwarder.hpp>

#include <thread>

#include <gelfmover/errors.hpp>
#include <gelfmover/utils/logging.hpp>


gelfmover::sink::Forwarder::Forwarder(
    std::shared_ptr<Transport> transport,
    const std::size_t worker_count,
    const std::size_t queue_size,
    Counters &counters,
    const RetryPolicy retry) :
    m_logger(utils::create_logger("Forwarder")),
    m_transport(std::move(transport)),
    m_retry(retry),
    m_counters(counters),
    m_queue(std::make_shared<utils::BoundedQueue<gelf::LogRecord>>(queue_size)) {

    // Start the workers last, once everything they use is initialised.
    m_pool = std::make_unique<utils::WorkerPool<gelf::LogRecord>>(
        "ForwarderPool", worker_count, m_queue, [this](gelf::LogRecord &&record) { deliver(std::move(record)); });
    m_logger->info("Forwarding to {} with {} workers", m_transport->describe(), m_pool->size());
}


gelfmover::sink::Forwarder::~Forwarder() {
    stop();
}


auto gelfmover::sink::Forwarder::forward(
    gelf::LogRecord const &record)
    -> void {
    // The event (and its id) is built once, so every retry of the same record carries the same event id.
    const auto event = make_event(record);
    auto backoff = m_retry.backoff;

    for (auto attempt = 1uz; ; ++attempt) {
        try {
            m_transport->send(event);
            m_counters.events_forwarded++;
            return;
        }
        catch (TransientForwardError const &e) {
            if (attempt >= m_retry.max_attempts) {
                m_counters.forward_transient_failures++;
                throw;
            }
            m_logger->debug("Attempt {}/{} for event {} failed: {}", attempt, m_retry.max_attempts, event.event_id, e.what());
        }
        catch (PermanentForwardError const &) {
            m_counters.forward_permanent_failures++;
            throw;
        }

        // Back off before the next attempt, doubling each time.
        std::this_thread::sleep_for(backoff);
        backoff *= 2;
    }
}


auto gelfmover::sink::Forwarder::submit(
    gelf::LogRecord &&record)
    -> bool {
    return m_queue->push(std::move(record));
}


auto gelfmover::sink::Forwarder::stop()
    -> void {
    if (m_pool != nullptr) {
        m_pool->join();
    }
}


auto gelfmover::sink::Forwarder::deliver(
    gelf::LogRecord &&record)
    -> void {
    try {
        forward(record);
    }
    catch (TransientForwardError const &e) {
        m_logger->warn("Dropping record from {} after {} attempts: {}", record.host, m_retry.max_attempts, e.what());
    }
    catch (PermanentForwardError const &e) {
        // Report the first permanent failure loudly; later ones are only counted.
        if (not m_permanent_failure_reported.exchange(true)) {
            m_logger->error("{} (further permanent failures are only counted)", e.what());
        }
    }
}
