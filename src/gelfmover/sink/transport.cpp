#include <gelfmover/sink/transport.hpp>

#include <optional>
#include <system_error>

#include <gelfmover/errors.hpp>
#include <gelfmover/net/tcp_socket.hpp>
#include <gelfmover/net/tls_stream.hpp>
#include <gelfmover/sink/http.hpp>
#include <gelfmover/utils/logging.hpp>
#include <gelfmover/version.hpp>


namespace {
    template <typename Stream>
    auto exchange(
        Stream const &stream,
        std::vector<std::uint8_t> const &request,
        const std::size_t max_response_size)
        -> std::vector<std::uint8_t> {
        // Write the request, then read until the server closes the connection.
        stream.send(request);
        auto response = std::vector<std::uint8_t>();
        while (response.size() < max_response_size) {
            const auto part = stream.recv_some();
            if (part.empty()) {
                break;
            }
            response.insert(response.end(), part.begin(), part.end());
        }
        return response;
    }
}


gelfmover::sink::HttpTransport::HttpTransport(
    Dsn dsn,
    const std::chrono::milliseconds timeout) :
    m_logger(utils::create_logger("HttpTransport")),
    m_dsn(std::move(dsn)),
    m_timeout(timeout) {
}


auto gelfmover::sink::HttpTransport::auth_header() const
    -> std::string {
    auto header = std::string("Sentry sentry_version=7, sentry_client=gelfmover/") + GELFMOVER_VERSION;
    header += ", sentry_key=" + m_dsn.public_key;
    if (m_dsn.secret_key.has_value()) {
        header += ", sentry_secret=" + *m_dsn.secret_key;
    }
    return header;
}


auto gelfmover::sink::HttpTransport::describe() const
    -> std::string {
    return m_dsn.scheme + "://" + m_dsn.host + ":" + std::to_string(m_dsn.port) + m_dsn.store_path();
}


auto gelfmover::sink::HttpTransport::send(
    ForwardEvent const &event)
    -> void {
    const auto request = http::build_post_request(
        m_dsn.host, m_dsn.store_path(),
        {{"X-Sentry-Auth", auth_header()}, {"User-Agent", std::string("gelfmover/") + GELFMOVER_VERSION}},
        event.body.dump());

    // Connect and exchange the request; any socket or TLS failure is worth another attempt.
    auto raw_response = std::vector<std::uint8_t>();
    try {
        auto socket = net::TCPSocket();
        socket.set_timeout(m_timeout);
        if (not socket.connect(m_dsn.host, m_dsn.port)) {
            throw TransientForwardError("cannot connect to " + m_dsn.host + ":" + std::to_string(m_dsn.port));
        }

        if (m_dsn.is_tls()) {
            const auto stream = net::TLSStream(std::move(socket), m_dsn.host);
            raw_response = exchange(stream, request, MAX_RESPONSE_SIZE);
        }
        else {
            raw_response = exchange(socket, request, MAX_RESPONSE_SIZE);
        }
    }
    catch (std::system_error const &e) {
        throw TransientForwardError(e.what());
    }
    catch (TransientForwardError const &) {
        throw;
    }
    catch (std::runtime_error const &e) {
        throw TransientForwardError(e.what());
    }

    // Classify the response status.
    auto response = http::HttpResponse{};
    try {
        response = http::parse_response(raw_response);
    }
    catch (std::runtime_error const &e) {
        throw TransientForwardError(e.what());
    }

    if (response.status_code >= 200 and response.status_code < 300) {
        m_logger->debug("Event {} accepted ({})", event.event_id, response.status_code);
        return;
    }
    const auto reason = "HTTP " + std::to_string(response.status_code) + " from " + describe() + ": " + response.body.substr(0, 256);
    if (response.status_code == 429 or response.status_code >= 500) {
        throw TransientForwardError(reason);
    }
    throw PermanentForwardError(reason);
}


gelfmover::sink::ConsoleTransport::ConsoleTransport(
    std::ostream &out) :
    m_out(out) {
}


auto gelfmover::sink::ConsoleTransport::send(
    ForwardEvent const &event)
    -> void {
    std::scoped_lock lock(m_mutex);
    m_out << event.body.dump() << '\n';
    m_out.flush();
}
