#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <stop_token>
#include <thread>
#include <vector>

#include <spdlog/logger.h>

#include <gelfmover/gelf/chunk.hpp>
#include <gelfmover/stats.hpp>


namespace gelfmover::gelf {
    using Clock = std::chrono::steady_clock;

    /**
     * The @c PartialMessage holds the chunks received so far for one message id. Chunks are keyed by sequence index,
     * so a re-delivered index never overwrites the first copy and iterating the map yields payloads in order.
     */
    struct PartialMessage {
        MessageId message_id{};
        std::uint8_t total_chunks = 0;
        std::map<std::uint8_t, std::vector<std::uint8_t>> received;
        Clock::time_point first_seen;
        Clock::time_point last_seen;
    };

    enum class ChunkOutcome {
        STARTED = 0,     // first chunk of a new message id
        ACCEPTED = 1,    // new index for a tracked message, still incomplete
        DUPLICATE = 2,   // index already present, nothing changed
        COMPLETED = 3,   // all indices present, message removed and returned
        REJECTED = 4,    // store full and the id was not tracked
        MISMATCHED = 5,  // sequence count differs from the first chunk of this id
    };

    struct ChunkResult {
        ChunkOutcome outcome;
        std::optional<RawPayload> payload;
    };

    /**
     * The @c ReassemblyStore is the only shared mutable state of the pipeline: every reader thread feeds chunks into
     * the same table. All mutation happens inside one lock, so the lookup, the insertion, the completion check and the
     * removal of a message are a single atomic step; two threads delivering the last two chunks of a message can never
     * both complete it. The number of tracked messages never exceeds @c capacity: a chunk for an unknown id is rejected
     * while the table is full, which keeps in-flight messages from being starved by new arrivals. A single-chunk
     * message for an untracked id completes without entering the table, so it is never rejected.
     */
    class ReassemblyStore {
        std::size_t m_capacity;
        std::map<MessageId, PartialMessage> m_messages;
        mutable std::mutex m_mutex;

    public:
        explicit ReassemblyStore(std::size_t capacity);

        [[nodiscard]]
        auto insert(RawChunk &&chunk, Clock::time_point now) -> ChunkResult;

        /**
         * Remove every message whose first chunk arrived more than @c ttl before @c now.
         * @return The ids that were evicted.
         */
        auto evict_expired(Clock::time_point now, Clock::duration ttl) -> std::vector<MessageId>;

        [[nodiscard]] auto size() const -> std::size_t;
        [[nodiscard]] auto capacity() const -> std::size_t { return m_capacity; }
        [[nodiscard]] auto contains(MessageId const &message_id) const -> bool;
        [[nodiscard]] auto received_count(MessageId const &message_id) const -> std::size_t;
    };

    /**
     * The @c Reassembler turns chunks into complete payloads. It owns the @c ReassemblyStore, counts every dropped
     * chunk (a full store is reported at warning level once until a new message is admitted again), and runs a sweeper thread which evicts incomplete messages once they outlive the time-to-live.
     * A chunk arriving after its message was evicted simply starts a new partial message.
     */
    class Reassembler {
        std::shared_ptr<spdlog::logger> m_logger;
        ReassemblyStore m_store;
        Clock::duration m_ttl;
        Clock::duration m_sweep_interval;
        Counters &m_counters;
        std::atomic<bool> m_capacity_warned = false;

        std::mutex m_sweep_mutex;
        std::condition_variable_any m_sweep_cv;
        std::jthread m_sweeper_thread;

    public:
        static constexpr auto DEFAULT_TTL = std::chrono::milliseconds(5000);
        static constexpr auto DEFAULT_SWEEP_INTERVAL = std::chrono::milliseconds(1000);

        Reassembler(
            std::size_t capacity,
            Counters &counters,
            Clock::duration ttl = DEFAULT_TTL,
            Clock::duration sweep_interval = DEFAULT_SWEEP_INTERVAL);

        ~Reassembler();

        /**
         * Add a chunk to its message. Returns the assembled payload when this chunk completes the message; every
         * other outcome returns an empty optional.
         */
        auto handle_chunk(RawChunk &&chunk) -> std::optional<RawPayload>;
        auto handle_chunk(RawChunk &&chunk, Clock::time_point now) -> std::optional<RawPayload>;

        auto sweep_expired(Clock::time_point now) -> std::size_t;

        auto start() -> void;
        auto stop() -> void;

        [[nodiscard]]
        auto store() const -> ReassemblyStore const& {
            return m_store;
        }

    private:
        auto sweep_loop(std::stop_token const &stop_token) -> void;
    };
}
