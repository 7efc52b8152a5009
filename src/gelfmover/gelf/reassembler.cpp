#include <gelfmover/gelf/reassembler.hpp>

#include <gelfmover/macros.hpp>
#include <gelfmover/utils/logging.hpp>


gelfmover::gelf::ReassemblyStore::ReassemblyStore(
    const std::size_t capacity) :
    m_capacity(capacity) {
}


auto gelfmover::gelf::ReassemblyStore::insert(
    RawChunk &&chunk,
    const Clock::time_point now)
    -> ChunkResult {
    std::scoped_lock lock(m_mutex);

    // Look up the message; a new id is only admitted while there is room for it.
    auto it = m_messages.find(chunk.message_id);
    auto outcome = ChunkOutcome::ACCEPTED;

    // A single chunk for an untracked id is a whole message and never takes a slot.
    if (it == m_messages.end() and chunk.sequence_count == 1) {
        return {ChunkOutcome::COMPLETED, std::move(chunk.payload)};
    }

    if (it == m_messages.end()) {
        if (m_messages.size() >= m_capacity) {
            return {ChunkOutcome::REJECTED, std::nullopt};
        }
        it = m_messages.emplace(chunk.message_id, PartialMessage{
            .message_id = chunk.message_id,
            .total_chunks = chunk.sequence_count,
            .received = {},
            .first_seen = now,
            .last_seen = now
        }).first;
        outcome = ChunkOutcome::STARTED;
    }

    // The first chunk of an id fixes the number of chunks; a disagreeing chunk is malformed.
    auto &message = it->second;
    if (chunk.sequence_count != message.total_chunks) {
        return {ChunkOutcome::MISMATCHED, std::nullopt};
    }

    // Store the payload unless this index was already delivered.
    message.last_seen = now;
    if (not message.received.try_emplace(chunk.sequence_index, std::move(chunk.payload)).second) {
        return {ChunkOutcome::DUPLICATE, std::nullopt};
    }

    // Not complete yet => wait for the remaining chunks.
    if (message.received.size() < message.total_chunks) {
        return {outcome, std::nullopt};
    }

    // Complete => concatenate in index order (map order) and remove the entry.
    auto total_length = 0uz;
    for (auto const &[index, payload] : message.received) {
        total_length += payload.size();
    }
    auto assembled = RawPayload();
    assembled.reserve(total_length);
    for (auto const &[index, payload] : message.received) {
        assembled.insert(assembled.end(), payload.begin(), payload.end());
    }
    m_messages.erase(it);
    return {ChunkOutcome::COMPLETED, std::move(assembled)};
}


auto gelfmover::gelf::ReassemblyStore::evict_expired(
    const Clock::time_point now,
    const Clock::duration ttl)
    -> std::vector<MessageId> {
    auto evicted = std::vector<MessageId>();
    std::scoped_lock lock(m_mutex);

    for (auto it = m_messages.begin(); it != m_messages.end();) {
        // Timed out => erase the message.
        if (now - it->second.first_seen > ttl) {
            evicted.push_back(it->first);
            it = m_messages.erase(it);
        }

        // Not timed out => continue to next message.
        else {
            ++it;
        }
    }
    return evicted;
}


auto gelfmover::gelf::ReassemblyStore::size() const
    -> std::size_t {
    std::scoped_lock lock(m_mutex);
    return m_messages.size();
}


auto gelfmover::gelf::ReassemblyStore::contains(
    MessageId const &message_id) const
    -> bool {
    std::scoped_lock lock(m_mutex);
    return m_messages.contains(message_id);
}


auto gelfmover::gelf::ReassemblyStore::received_count(
    MessageId const &message_id) const
    -> std::size_t {
    std::scoped_lock lock(m_mutex);
    const auto it = m_messages.find(message_id);
    return it == m_messages.end() ? 0 : it->second.received.size();
}


gelfmover::gelf::Reassembler::Reassembler(
    const std::size_t capacity,
    Counters &counters,
    const Clock::duration ttl,
    const Clock::duration sweep_interval) :
    m_logger(utils::create_logger("Reassembler")),
    m_store(capacity),
    m_ttl(ttl),
    m_sweep_interval(sweep_interval),
    m_counters(counters) {
}


gelfmover::gelf::Reassembler::~Reassembler() {
    stop();
}


auto gelfmover::gelf::Reassembler::handle_chunk(
    RawChunk &&chunk)
    -> std::optional<RawPayload> {
    return handle_chunk(std::move(chunk), Clock::now());
}


auto gelfmover::gelf::Reassembler::handle_chunk(
    RawChunk &&chunk,
    const Clock::time_point now)
    -> std::optional<RawPayload> {
    const auto chunk_info = FORMAT_CHUNK_INFO(chunk);
    auto [outcome, payload] = m_store.insert(std::move(chunk), now);

    switch (outcome) {
    case ChunkOutcome::STARTED:
        m_capacity_warned = false;
        m_logger->trace("Stored chunk{}", chunk_info);
        break;
    case ChunkOutcome::ACCEPTED:
        m_logger->trace("Stored chunk{}", chunk_info);
        break;
    case ChunkOutcome::DUPLICATE:
        m_logger->debug("Ignoring duplicate chunk{}", chunk_info);
        break;
    case ChunkOutcome::COMPLETED:
        m_counters.messages_reassembled++;
        m_logger->debug("Reassembled message{} ({} bytes)", chunk_info, payload->size());
        break;
    case ChunkOutcome::REJECTED:
        // Warn once per full spell; the rest are only counted.
        m_counters.capacity_exceeded++;
        if (not m_capacity_warned.exchange(true)) {
            m_logger->warn("Reassembly store full ({} messages), rejecting chunks for new messages", m_store.capacity());
        }
        m_logger->debug("Rejecting chunk{}", chunk_info);
        break;
    case ChunkOutcome::MISMATCHED:
        m_counters.malformed_input++;
        m_logger->warn("Sequence count differs from earlier chunks, discarding chunk{}", chunk_info);
        break;
    }
    return std::move(payload);
}


auto gelfmover::gelf::Reassembler::sweep_expired(
    const Clock::time_point now)
    -> std::size_t {
    const auto evicted = m_store.evict_expired(now, m_ttl);
    for (auto const &message_id : evicted) {
        m_counters.reassembly_timeouts++;
        m_logger->info("Evicted incomplete message {} after time-to-live", FORMAT_MESSAGE_ID(message_id));
    }
    return evicted.size();
}


auto gelfmover::gelf::Reassembler::start()
    -> void {
    if (m_sweeper_thread.joinable()) {
        return;
    }
    m_sweeper_thread = std::jthread([this](std::stop_token stop_token) { sweep_loop(stop_token); });
}


auto gelfmover::gelf::Reassembler::stop()
    -> void {
    if (m_sweeper_thread.joinable()) {
        m_sweeper_thread.request_stop();
        m_sweeper_thread.join();
    }
}


auto gelfmover::gelf::Reassembler::sweep_loop(
    std::stop_token const &stop_token)
    -> void {
    m_logger->debug("Sweeper started (ttl {} ms)", std::chrono::duration_cast<std::chrono::milliseconds>(m_ttl).count());
    while (not stop_token.stop_requested()) {
        // Sleep for one interval, waking early on a stop request.
        {
            std::unique_lock lock(m_sweep_mutex);
            m_sweep_cv.wait_for(lock, stop_token, m_sweep_interval, [] { return false; });
        }
        if (stop_token.stop_requested()) {
            break;
        }
        sweep_expired(Clock::now());
    }
}
