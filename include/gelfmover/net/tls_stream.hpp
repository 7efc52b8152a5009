#pragma once

#include <cstdint>
#include <memory>
#include <span>
#include <string>
#include <vector>

#include <openssl/ssl.h>

#include <gelfmover/net/tcp_socket.hpp>


namespace gelfmover::net {
    /**
     * A TLS client session layered over a connected @c TCPSocket. The peer certificate is verified against the system
     * trust store and must match @c host. Errors are raised as @c std::runtime_error carrying OpenSSL's error string.
     * OpenSSL writes through the plain descriptor, so every call that may write blocks @c SIGPIPE on the calling thread
     * and a peer that went away surfaces as an error instead of killing the process. After a fatal error the session
     * is not shut down cleanly.
     */
    class TLSStream {
        struct CtxDeleter { auto operator()(SSL_CTX *ctx) const -> void { SSL_CTX_free(ctx); } };
        struct SslDeleter { auto operator()(SSL *ssl) const -> void { SSL_free(ssl); } };

        TCPSocket m_socket;
        std::unique_ptr<SSL_CTX, CtxDeleter> m_ctx;
        std::unique_ptr<SSL, SslDeleter> m_ssl;
        mutable bool m_failed = false;

    public:
        TLSStream(TCPSocket &&socket, std::string const &host);

        TLSStream(const TLSStream &) = delete;
        auto operator=(const TLSStream &) -> TLSStream& = delete;
        ~TLSStream();

        auto send(std::span<const std::uint8_t> data) const -> void;

        /**
         * Read whatever decrypted data is available. An empty result means the peer closed the session.
         */
        [[nodiscard]] auto recv_some(std::size_t max_len = 4096) const -> std::vector<std::uint8_t>;
    };
}
