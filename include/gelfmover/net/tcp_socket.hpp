#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <vector>

#include <gelfmover/net/socket.hpp>


namespace gelfmover::net {
    class TCPSocket : public Socket {
    public:
        explicit TCPSocket(socket_t fd = -1);

        [[nodiscard]] auto connect(std::string const &host, std::uint16_t port) const -> bool;
        auto listen(std::int32_t backlog = 128) const -> void;

        /**
         * Accept a pending connection, waiting at most @c timeout. Returns an empty optional on timeout.
         */
        [[nodiscard]] auto accept(std::chrono::milliseconds timeout) const -> std::optional<TCPSocket>;

        auto send(std::span<const std::uint8_t> data) const -> void;

        /**
         * Read whatever is available, up to @c max_len bytes. An empty result means the peer closed the stream.
         */
        [[nodiscard]] auto recv_some(std::size_t max_len = 4096) const -> std::vector<std::uint8_t>;

        auto set_timeout(std::chrono::milliseconds timeout) const -> void;
    };
}
