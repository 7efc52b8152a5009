#pragma once

#include <cstdint>
#include <string>

#include <netinet/in.h>


namespace gelfmover::net {
    /**
     * A bind or connect target given as @c host:port. The host may be an IPv4 literal or a name resolved at use.
     */
    struct Endpoint {
        std::string host;
        std::uint16_t port = 0;

        [[nodiscard]]
        auto to_string() const -> std::string {
            return host + ":" + std::to_string(port);
        }
    };

    /**
     * Parse a @c host:port string. The port must be a decimal number in 0..65535 and the host must be non-empty.
     * @throw std::invalid_argument If the string is not of that form.
     */
    auto parse_endpoint(std::string const &text) -> Endpoint;

    /**
     * Resolve a host name (or IPv4 literal) into an IPv4 socket address.
     * @throw std::runtime_error If resolution fails.
     */
    auto resolve_ipv4(std::string const &host, std::uint16_t port) -> sockaddr_in;

    auto format_ipv4(sockaddr_in const &addr) -> std::string;
}
