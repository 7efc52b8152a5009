#pragma once

#include <cstdint>
#include <mutex>

#include <gelfmover/net/address.hpp>


namespace gelfmover::net {
    using socket_t = int;

    class Socket {
    protected:
        socket_t socket_fd;
        std::mutex mtx;

        explicit Socket(
            std::int32_t family,
            std::int32_t type,
            std::int32_t protocol,
            socket_t fd = -1);

    public:
        Socket(const Socket &other) = delete;
        Socket(Socket &&other) noexcept;
        auto operator=(const Socket &other) -> Socket& = delete;
        auto operator=(Socket &&other) noexcept -> Socket&;
        ~Socket();

        auto bind(Endpoint const &endpoint) const -> void;
        auto close() -> void;

        /**
         * Shut both directions down without releasing the descriptor. Any thread blocked in a read on this socket
         * returns, which is how listener threads are stopped.
         */
        auto shutdown() const noexcept -> void;

        [[nodiscard]] auto local_port() const -> std::uint16_t;
        [[nodiscard]] auto fileno() const -> socket_t { return socket_fd; }
    };
}
