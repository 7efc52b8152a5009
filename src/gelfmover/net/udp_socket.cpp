#include <gelfmover/net/udp_socket.hpp>

#include <cerrno>
#include <system_error>

#include <sys/socket.h>

#include <gelfmover/net/select.hpp>


gelfmover::net::UDPSocket::UDPSocket(
    const socket_t fd) :
    Socket(AF_INET, SOCK_DGRAM, IPPROTO_UDP, fd) {
}


auto gelfmover::net::UDPSocket::send_to(
    const std::span<const std::uint8_t> data,
    Endpoint const &endpoint) const
    -> void {
    // Create the address structure for IPv4.
    const auto addr = resolve_ipv4(endpoint.host, endpoint.port);

    // Send the datagram in one call (UDP never sends partially).
    const auto sent = ::sendto(
        socket_fd, data.data(), data.size(), 0,
        reinterpret_cast<const sockaddr*>(&addr), sizeof(addr));

    if (sent < 0 or static_cast<std::size_t>(sent) != data.size()) {
        throw std::system_error(errno, std::system_category(), "Failed to send datagram to " + endpoint.to_string());
    }
}


auto gelfmover::net::UDPSocket::recv_from(
    const std::chrono::milliseconds timeout) const
    -> std::optional<Datagram> {
    // Wait for the socket to become readable.
    if (select({socket_fd}, timeout).empty()) {
        return std::nullopt;
    }

    // Prepare sockaddr for sender info, and a buffer large enough for any datagram.
    auto src_addr = sockaddr_in{};
    auto addr_len = static_cast<socklen_t>(sizeof(src_addr));
    auto buffer = std::vector<std::uint8_t>(MAX_UDP_SIZE);

    const auto recv_len = ::recvfrom(
        socket_fd, buffer.data(), buffer.size(), 0,
        reinterpret_cast<sockaddr*>(&src_addr), &addr_len);

    // Handle errors. A signal or a spurious wakeup is not an error.
    if (recv_len < 0) {
        if (errno == EINTR or errno == EAGAIN or errno == EWOULDBLOCK) {
            return std::nullopt;
        }
        throw std::system_error(errno, std::system_category(), "Failed to receive datagram");
    }

    buffer.resize(static_cast<std::size_t>(recv_len));
    return Datagram{.data = std::move(buffer), .peer = format_ipv4(src_addr)};
}
