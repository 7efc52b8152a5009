#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <vector>

#include <gelfmover/net/socket.hpp>


namespace gelfmover::net {
    /**
     * One received datagram with its sender, formatted as @c ip:port for logging.
     */
    struct Datagram {
        std::vector<std::uint8_t> data;
        std::string peer;
    };

    class UDPSocket : public Socket {
    public:
        static constexpr auto MAX_UDP_SIZE = 65535uz;

        explicit UDPSocket(socket_t fd = -1);

        auto send_to(std::span<const std::uint8_t> data, Endpoint const &endpoint) const -> void;

        /**
         * Receive a single datagram, waiting at most @c timeout. Returns an empty optional on timeout so that receive
         * loops can check for a stop request.
         */
        [[nodiscard]]
        auto recv_from(std::chrono::milliseconds timeout) const -> std::optional<Datagram>;
    };
}
