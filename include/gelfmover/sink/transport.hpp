#pragma once

#include <chrono>
#include <memory>
#include <mutex>
#include <ostream>
#include <string>

#include <spdlog/logger.h>

#include <gelfmover/sink/dsn.hpp>
#include <gelfmover/sink/event.hpp>


namespace gelfmover::sink {
    /**
     * The channel an event leaves the process through. Implementations report failures by throwing
     * @c TransientForwardError (worth retrying) or @c PermanentForwardError (not). They are called concurrently from
     * every forwarder worker.
     */
    class Transport {
    public:
        virtual ~Transport() = default;

        virtual auto send(ForwardEvent const &event) -> void = 0;

        [[nodiscard]]
        virtual auto describe() const -> std::string = 0;
    };

    /**
     * Sends events to a Sentry store endpoint, one HTTP/1.1 request per event over a fresh connection (TLS for
     * @c https DSNs). A 2xx status is success; 429, 5xx and any network or TLS error are transient; every other status
     * is permanent.
     */
    class HttpTransport final : public Transport {
        std::shared_ptr<spdlog::logger> m_logger;
        Dsn m_dsn;
        std::chrono::milliseconds m_timeout;

    public:
        static constexpr auto DEFAULT_TIMEOUT = std::chrono::milliseconds(10000);
        static constexpr auto MAX_RESPONSE_SIZE = 64uz * 1024;

        explicit HttpTransport(Dsn dsn, std::chrono::milliseconds timeout = DEFAULT_TIMEOUT);

        auto send(ForwardEvent const &event) -> void override;

        [[nodiscard]]
        auto describe() const -> std::string override;

        [[nodiscard]]
        auto auth_header() const -> std::string;
    };

    /**
     * Prints each event as one JSON line. Used for debugging without a Sentry project.
     */
    class ConsoleTransport final : public Transport {
        std::ostream &m_out;
        std::mutex m_mutex;

    public:
        explicit ConsoleTransport(std::ostream &out);

        auto send(ForwardEvent const &event) -> void override;

        [[nodiscard]]
        auto describe() const -> std::string override {
            return "console";
        }
    };
}
