#include <gelfmover/net/address.hpp>

#include <charconv>
#include <cstring>
#include <stdexcept>

#include <arpa/inet.h>
#include <netdb.h>
#include <sys/socket.h>


auto gelfmover::net::parse_endpoint(
    std::string const &text)
    -> Endpoint {
    // Split on the last colon, so that the host part is everything before it.
    const auto colon = text.rfind(':');
    if (colon == std::string::npos or colon == 0 or colon + 1 == text.size()) {
        throw std::invalid_argument("Expected host:port, got '" + text + "'");
    }

    // Parse the port as a full-width decimal number.
    auto port = 0u;
    const auto port_str = text.substr(colon + 1);
    const auto [end, ec] = std::from_chars(port_str.data(), port_str.data() + port_str.size(), port);
    if (ec != std::errc{} or end != port_str.data() + port_str.size() or port > 65535) {
        throw std::invalid_argument("Invalid port in '" + text + "'");
    }

    return Endpoint{.host = text.substr(0, colon), .port = static_cast<std::uint16_t>(port)};
}


auto gelfmover::net::resolve_ipv4(
    std::string const &host,
    const std::uint16_t port)
    -> sockaddr_in {
    auto addr = sockaddr_in{};
    std::memset(&addr, 0, sizeof(addr));
    addr.sin_family = AF_INET;
    addr.sin_port = htons(port);

    // Fast path for numeric addresses.
    if (inet_pton(AF_INET, host.c_str(), &addr.sin_addr) == 1) {
        return addr;
    }

    // Resolve the hostname.
    auto hints = addrinfo{};
    auto res = static_cast<addrinfo*>(nullptr);
    std::memset(&hints, 0, sizeof(hints));
    hints.ai_family = AF_INET;

    if (const auto rc = getaddrinfo(host.c_str(), nullptr, &hints, &res); rc != 0) {
        throw std::runtime_error("Failed to resolve hostname " + host + ": " + gai_strerror(rc));
    }
    addr.sin_addr = reinterpret_cast<sockaddr_in*>(res->ai_addr)->sin_addr;
    freeaddrinfo(res);
    return addr;
}


auto gelfmover::net::format_ipv4(
    sockaddr_in const &addr)
    -> std::string {
    char ip_str[INET_ADDRSTRLEN];
    inet_ntop(AF_INET, &addr.sin_addr, ip_str, INET_ADDRSTRLEN);
    return std::string(ip_str) + ":" + std::to_string(ntohs(addr.sin_port));
}
