#include <gelfmover/net/socket.hpp>

#include <cerrno>
#include <system_error>

#include <sys/socket.h>
#include <unistd.h>


gelfmover::net::Socket::Socket(
    const std::int32_t family,
    const std::int32_t type,
    const std::int32_t protocol,
    const socket_t fd) :
    socket_fd(fd) {

    // Create a socket with a new descriptor if one is not provided.
    if (socket_fd < 0) {
        socket_fd = ::socket(family, type, protocol);
    }

    // If socket creation failed, throw an error.
    if (socket_fd < 0) {
        throw std::system_error(errno, std::system_category(), "Failed to create socket");
    }

    // Set socket options standard for all sockets.
    constexpr auto opt = 1;
    if (::setsockopt(socket_fd, SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt)) < 0) {
        const auto err = errno;
        ::close(socket_fd);
        throw std::system_error(err, std::system_category(), "Failed to set socket options");
    }
}


gelfmover::net::Socket::Socket(
    Socket &&other) noexcept {
    std::lock_guard lock(other.mtx);
    socket_fd = other.socket_fd;
    other.socket_fd = -1;
}


auto gelfmover::net::Socket::operator=(
    Socket &&other) noexcept
    -> Socket& {
    if (this != &other) {
        std::scoped_lock lock(mtx, other.mtx);
        if (socket_fd >= 0) {
            ::close(socket_fd);
        }
        socket_fd = other.socket_fd;
        other.socket_fd = -1;
    }
    return *this;
}


gelfmover::net::Socket::~Socket() {
    if (socket_fd >= 0) {
        ::close(socket_fd);
    }
}


auto gelfmover::net::Socket::bind(
    Endpoint const &endpoint) const
    -> void {
    // Create the address structure for IPv4.
    const auto addr = resolve_ipv4(endpoint.host, endpoint.port);

    if (::bind(socket_fd, reinterpret_cast<const sockaddr*>(&addr), sizeof(addr)) < 0) {
        throw std::system_error(errno, std::system_category(), "Failed to bind socket to " + endpoint.to_string());
    }
}


auto gelfmover::net::Socket::close() -> void {
    if (socket_fd >= 0) {
        if (::close(socket_fd) < 0) {
            throw std::system_error(errno, std::system_category(), "Failed to close socket");
        }
        socket_fd = -1;
    }
}


auto gelfmover::net::Socket::shutdown() const noexcept
    -> void {
    if (socket_fd >= 0) {
        ::shutdown(socket_fd, SHUT_RDWR);
    }
}


auto gelfmover::net::Socket::local_port() const
    -> std::uint16_t {
    auto addr = sockaddr_in{};
    auto addr_len = static_cast<socklen_t>(sizeof(addr));
    if (::getsockname(socket_fd, reinterpret_cast<sockaddr*>(&addr), &addr_len) < 0) {
        throw std::system_error(errno, std::system_category(), "Failed to query socket address");
    }
    return ntohs(addr.sin_port);
}
