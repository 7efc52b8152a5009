#include <gelfmover/ingest/tcp_listener.hpp>

#include <algorithm>
#include <system_error>

#include <gelfmover/ingest/frame_splitter.hpp>
#include <gelfmover/utils/logging.hpp>


gelfmover::ingest::TCPListener::TCPListener(
    net::Endpoint const &endpoint,
    std::shared_ptr<utils::BoundedQueue<gelf::RawPayload>> unpack_queue,
    Counters &counters,
    const std::size_t max_frame_size) :
    m_logger(utils::create_logger("TCPListener")),
    m_unpack_queue(std::move(unpack_queue)),
    m_counters(counters),
    m_max_frame_size(max_frame_size) {

    // Setup the listening socket.
    m_socket.bind(endpoint);
    m_socket.listen();
    m_logger->info("Listening for GELF over TCP on {}:{}", endpoint.host, m_socket.local_port());
}


gelfmover::ingest::TCPListener::~TCPListener() {
    stop();
}


auto gelfmover::ingest::TCPListener::start()
    -> void {
    if (m_acceptor_thread.joinable()) {
        return;
    }
    m_acceptor_thread = std::jthread([this](std::stop_token stop_token) { accept_loop(stop_token); });
}


auto gelfmover::ingest::TCPListener::stop()
    -> void {
    // Stop accepting new connections.
    if (m_acceptor_thread.joinable()) {
        m_acceptor_thread.request_stop();
        m_acceptor_thread.join();
    }

    // Wake every reader blocked in recv by shutting its socket down, then join them.
    auto connections = std::list<Connection>();
    {
        std::scoped_lock lock(m_connections_mutex);
        connections.swap(m_connections);
    }
    for (auto &connection : connections) {
        connection.thread.request_stop();
        connection.socket->shutdown();
    }
    connections.clear();
}


auto gelfmover::ingest::TCPListener::accept_loop(
    std::stop_token const &stop_token)
    -> void {
    m_logger->debug("TCP acceptor thread started");
    while (not stop_token.stop_requested()) {
        auto client = std::optional<net::TCPSocket>();
        try {
            client = m_socket.accept(POLL_INTERVAL);
        }
        catch (std::system_error const &e) {
            m_logger->error("TCP accept failed: {}", e.what());
            std::this_thread::sleep_for(POLL_INTERVAL);
            continue;
        }

        reap_finished_connections();
        if (not client.has_value()) {
            continue;
        }

        // Give the connection its own reader thread.
        auto socket = std::make_shared<net::TCPSocket>(std::move(*client));
        auto finished = std::make_shared<std::atomic<bool>>(false);
        auto thread = std::jthread([this, socket, finished](std::stop_token conn_stop_token) {
            read_connection(*socket, conn_stop_token);
            finished->store(true);
        });

        std::scoped_lock lock(m_connections_mutex);
        m_connections.push_back(Connection{.socket = std::move(socket), .finished = std::move(finished), .thread = std::move(thread)});
        m_logger->debug("Accepted connection ({} open)", m_connections.size());
    }
}


auto gelfmover::ingest::TCPListener::read_connection(
    net::TCPSocket const &socket,
    std::stop_token const &stop_token)
    -> void {
    auto splitter = FrameSplitter(m_max_frame_size);

    while (not stop_token.stop_requested()) {
        // Read the next block; reset or end-of-stream closes the connection.
        auto data = std::vector<std::uint8_t>();
        try {
            data = socket.recv_some(READ_SIZE);
        }
        catch (std::system_error const &e) {
            m_logger->debug("Connection closed: {}", e.what());
            break;
        }
        if (data.empty()) {
            break;
        }

        // Split into frames and push them downstream, waiting for room if needed.
        auto [frames, oversized] = splitter.feed(data);
        if (oversized > 0) {
            m_counters.malformed_input += oversized;
            m_logger->warn("Discarded {} frame(s) longer than {} bytes", oversized, m_max_frame_size);
        }
        for (auto &frame : frames) {
            m_counters.tcp_frames_received++;
            if (not m_unpack_queue->push(std::move(frame))) {
                return;
            }
        }
    }

    if (splitter.pending() > 0) {
        m_logger->debug("Discarding {} bytes of unterminated frame at end of stream", splitter.pending());
    }
}


auto gelfmover::ingest::TCPListener::reap_finished_connections()
    -> void {
    auto finished = std::list<Connection>();
    {
        std::scoped_lock lock(m_connections_mutex);
        for (auto it = m_connections.begin(); it != m_connections.end();) {
            if (it->finished->load()) {
                auto next = std::next(it);
                finished.splice(finished.end(), m_connections, it);
                it = next;
            }
            else {
                ++it;
            }
        }
    }

    // Joining happens outside the lock; these threads have already returned.
    finished.clear();
}
