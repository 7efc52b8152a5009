#include <gelfmover/net/tls_stream.hpp>

#include <cerrno>
#include <csignal>
#include <ctime>
#include <stdexcept>
#include <system_error>

#include <pthread.h>

#include <openssl/err.h>
#include <openssl/x509v3.h>


namespace {
    auto last_ssl_error(std::string const &what) -> std::runtime_error {
        // An I/O failure leaves OpenSSL's queue empty and the reason in errno.
        const auto saved_errno = errno;
        const auto code = ERR_get_error();
        if (code == 0) {
            return std::runtime_error(what + ": " + std::system_category().message(saved_errno));
        }
        char buffer[256];
        ERR_error_string_n(code, buffer, sizeof(buffer));
        return std::runtime_error(what + ": " + buffer);
    }

    /**
     * Blocks @c SIGPIPE on this thread for its lifetime. A @c SIGPIPE raised meanwhile by a write to a closed peer is
     * consumed before the old mask is restored, unless one was already pending.
     */
    class SigpipeGuard {
        sigset_t m_sigpipe{};
        sigset_t m_previous{};
        bool m_was_pending = false;

    public:
        SigpipeGuard() {
            sigemptyset(&m_sigpipe);
            sigaddset(&m_sigpipe, SIGPIPE);
            auto pending = sigset_t{};
            sigpending(&pending);
            m_was_pending = sigismember(&pending, SIGPIPE) == 1;
            pthread_sigmask(SIG_BLOCK, &m_sigpipe, &m_previous);
        }

        SigpipeGuard(const SigpipeGuard &) = delete;
        auto operator=(const SigpipeGuard &) -> SigpipeGuard& = delete;

        ~SigpipeGuard() {
            if (not m_was_pending) {
                auto pending = sigset_t{};
                sigpending(&pending);
                if (sigismember(&pending, SIGPIPE) == 1) {
                    const auto no_wait = timespec{0, 0};
                    while (sigtimedwait(&m_sigpipe, nullptr, &no_wait) < 0 and errno == EINTR) {
                    }
                }
            }
            pthread_sigmask(SIG_SETMASK, &m_previous, nullptr);
        }
    };

    auto is_fatal(const int ssl_error) -> bool {
        return ssl_error == SSL_ERROR_SYSCALL or ssl_error == SSL_ERROR_SSL;
    }
}


gelfmover::net::TLSStream::TLSStream(
    TCPSocket &&socket,
    std::string const &host) :
    m_socket(std::move(socket)),
    m_ctx(SSL_CTX_new(TLS_client_method())) {

    // Configure the context to verify the server against the system trust store.
    if (m_ctx == nullptr) {
        throw last_ssl_error("Failed to create TLS context");
    }
    SSL_CTX_set_verify(m_ctx.get(), SSL_VERIFY_PEER, nullptr);
    SSL_CTX_set_min_proto_version(m_ctx.get(), TLS1_2_VERSION);
    if (SSL_CTX_set_default_verify_paths(m_ctx.get()) != 1) {
        throw last_ssl_error("Failed to load system trust store");
    }

    // Create the session, set SNI and the expected host name, and bind it to the socket.
    m_ssl.reset(SSL_new(m_ctx.get()));
    if (m_ssl == nullptr) {
        throw last_ssl_error("Failed to create TLS session");
    }
    SSL_set_tlsext_host_name(m_ssl.get(), host.c_str());
    SSL_set1_host(m_ssl.get(), host.c_str());
    SSL_set_fd(m_ssl.get(), m_socket.fileno());

    // Perform the handshake.
    const auto guard = SigpipeGuard();
    if (SSL_connect(m_ssl.get()) != 1) {
        throw last_ssl_error("TLS handshake with " + host + " failed");
    }
}


gelfmover::net::TLSStream::~TLSStream() {
    // No close_notify after a fatal error; OpenSSL forbids it.
    if (m_ssl != nullptr and not m_failed) {
        const auto guard = SigpipeGuard();
        SSL_shutdown(m_ssl.get());
    }
}


auto gelfmover::net::TLSStream::send(
    const std::span<const std::uint8_t> data) const
    -> void {
    // Send all data, handling partial writes.
    const auto guard = SigpipeGuard();
    auto total_sent = 0uz;
    while (total_sent < data.size()) {
        const auto sent = SSL_write(m_ssl.get(), data.data() + total_sent, static_cast<int>(data.size() - total_sent));
        if (sent <= 0) {
            m_failed = m_failed or is_fatal(SSL_get_error(m_ssl.get(), sent));
            throw last_ssl_error("Failed to send TLS data");
        }
        total_sent += static_cast<std::size_t>(sent);
    }
}


auto gelfmover::net::TLSStream::recv_some(
    const std::size_t max_len) const
    -> std::vector<std::uint8_t> {
    auto buffer = std::vector<std::uint8_t>(max_len);
    const auto guard = SigpipeGuard();
    const auto recv_len = SSL_read(m_ssl.get(), buffer.data(), static_cast<int>(buffer.size()));
    if (recv_len <= 0) {
        // A clean close_notify or a plain EOF both end the stream.
        const auto err = SSL_get_error(m_ssl.get(), recv_len);
        m_failed = m_failed or is_fatal(err);
        if (err == SSL_ERROR_ZERO_RETURN or (err == SSL_ERROR_SYSCALL and ERR_peek_error() == 0)) {
            return {};
        }
        throw last_ssl_error("Failed to receive TLS data");
    }
    buffer.resize(static_cast<std::size_t>(recv_len));
    return buffer;
}
