#include <gelfmover/ingest/frame_splitter.hpp>

#include <algorithm>


gelfmover::ingest::FrameSplitter::FrameSplitter(
    const std::size_t max_frame_size) :
    m_max_frame_size(max_frame_size) {
}


auto gelfmover::ingest::FrameSplitter::feed(
    const std::span<const std::uint8_t> data)
    -> Result {
    auto result = Result{};
    auto begin = data.begin();

    while (begin != data.end()) {
        const auto delimiter = std::find(begin, data.end(), DELIMITER);

        // Accumulate the bytes of the current frame, unless it is already known to be too long.
        if (not m_discarding) {
            m_buffer.insert(m_buffer.end(), begin, delimiter);
            if (m_buffer.size() > m_max_frame_size) {
                m_buffer.clear();
                m_discarding = true;
                ++result.oversized;
            }
        }

        // No terminator in the rest of the data => wait for the next read.
        if (delimiter == data.end()) {
            break;
        }

        // Terminator => the frame is complete.
        if (not m_discarding and not m_buffer.empty()) {
            result.frames.push_back(std::move(m_buffer));
        }
        m_buffer.clear();
        m_discarding = false;
        begin = delimiter + 1;
    }
    return result;
}
