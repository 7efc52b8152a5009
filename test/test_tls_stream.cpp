#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <future>
#include <memory>
#include <stdexcept>
#include <thread>
#include <vector>

#include <gtest/gtest.h>
#include <openssl/evp.h>
#include <openssl/pem.h>
#include <openssl/ssl.h>
#include <openssl/x509v3.h>

#include <gelfmover/net/tcp_socket.hpp>
#include <gelfmover/net/tls_stream.hpp>

using namespace gelfmover;
using namespace std::chrono_literals;


namespace {
    struct PkeyDeleter { auto operator()(EVP_PKEY *pkey) const -> void { EVP_PKEY_free(pkey); } };
    struct X509Deleter { auto operator()(X509 *x509) const -> void { X509_free(x509); } };
    struct CtxDeleter { auto operator()(SSL_CTX *ctx) const -> void { SSL_CTX_free(ctx); } };
    struct SslDeleter { auto operator()(SSL *ssl) const -> void { SSL_free(ssl); } };

    /**
     * A self-signed certificate for @c localhost, written to a PEM file which the client trusts through
     * @c SSL_CERT_FILE.
     */
    class SelfSignedCertificate {
    public:
        std::unique_ptr<EVP_PKEY, PkeyDeleter> key{EVP_RSA_gen(2048)};
        std::unique_ptr<X509, X509Deleter> cert{X509_new()};
        std::filesystem::path pem_path = std::filesystem::temp_directory_path() / "gelfmover_test_localhost.pem";

        SelfSignedCertificate() {
            ASN1_INTEGER_set(X509_get_serialNumber(cert.get()), 1);
            X509_gmtime_adj(X509_getm_notBefore(cert.get()), -60);
            X509_gmtime_adj(X509_getm_notAfter(cert.get()), 3600);
            X509_set_pubkey(cert.get(), key.get());

            auto *name = X509_get_subject_name(cert.get());
            X509_NAME_add_entry_by_txt(name, "CN", MBSTRING_ASC, reinterpret_cast<const unsigned char*>("localhost"), -1, -1, 0);
            X509_set_issuer_name(cert.get(), name);

            auto ctx = X509V3_CTX{};
            X509V3_set_ctx_nodb(&ctx);
            X509V3_set_ctx(&ctx, cert.get(), cert.get(), nullptr, nullptr, 0);
            auto *san = X509V3_EXT_conf_nid(nullptr, &ctx, NID_subject_alt_name, "DNS:localhost");
            X509_add_ext(cert.get(), san, -1);
            X509_EXTENSION_free(san);
            X509_sign(cert.get(), key.get(), EVP_sha256());

            auto *file = std::fopen(pem_path.c_str(), "w");
            PEM_write_X509(file, cert.get());
            std::fclose(file);
            setenv("SSL_CERT_FILE", pem_path.c_str(), 1);
        }

        ~SelfSignedCertificate() {
            unsetenv("SSL_CERT_FILE");
            std::filesystem::remove(pem_path);
        }
    };
}


TEST(TLSStreamTest, PeerClosingMidSendIsAnError) {
    const auto certificate = SelfSignedCertificate();
    ASSERT_NE(certificate.key, nullptr);

    auto listener = net::TCPSocket();
    listener.bind({"127.0.0.1", 0});
    listener.listen();

    // The server completes the handshake, then closes the session before anything is sent.
    auto server_closed = std::promise<void>();
    auto closed = server_closed.get_future();
    auto server = std::jthread([&] {
        const auto client = listener.accept(5000ms);
        if (not client.has_value()) {
            ADD_FAILURE() << "No client connected";
            server_closed.set_value();
            return;
        }
        auto ctx = std::unique_ptr<SSL_CTX, CtxDeleter>(SSL_CTX_new(TLS_server_method()));
        SSL_CTX_use_certificate(ctx.get(), certificate.cert.get());
        SSL_CTX_use_PrivateKey(ctx.get(), certificate.key.get());
        auto ssl = std::unique_ptr<SSL, SslDeleter>(SSL_new(ctx.get()));
        SSL_set_fd(ssl.get(), client->fileno());
        if (SSL_accept(ssl.get()) == 1) {
            SSL_shutdown(ssl.get());
        }
        else {
            ADD_FAILURE() << "TLS handshake failed on the server side";
        }
        server_closed.set_value();
    });

    auto socket = net::TCPSocket();
    ASSERT_TRUE(socket.connect("localhost", listener.local_port()));
    auto stream = std::make_unique<net::TLSStream>(std::move(socket), "localhost");

    closed.wait();
    server.join();
    std::this_thread::sleep_for(100ms);

    // Writing to the closed peer ends in an exception; the process survives.
    const auto body = std::vector<std::uint8_t>(256 * 1024, 'x');
    auto threw = false;
    for (auto attempt = 0; attempt < 8 and not threw; ++attempt) {
        try {
            stream->send(body);
        }
        catch (std::runtime_error const &) {
            threw = true;
        }
    }
    EXPECT_TRUE(threw);

    // The broken session is released without a close_notify.
    EXPECT_NO_THROW(stream.reset());
}
