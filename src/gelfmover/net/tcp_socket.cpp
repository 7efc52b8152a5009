#include <gelfmover/net/tcp_socket.hpp>

#include <cerrno>
#include <system_error>

#include <sys/socket.h>
#include <sys/time.h>

#include <gelfmover/net/select.hpp>


gelfmover::net::TCPSocket::TCPSocket(
    const socket_t fd) :
    Socket(AF_INET, SOCK_STREAM, IPPROTO_TCP, fd) {
}


auto gelfmover::net::TCPSocket::connect(
    std::string const &host,
    const std::uint16_t port) const
    -> bool {
    // Resolve the hostname; an unresolvable host is reported like an unreachable one.
    auto addr = sockaddr_in{};
    try {
        addr = resolve_ipv4(host, port);
    }
    catch (std::runtime_error const &) {
        return false;
    }

    // Connect to the server.
    while (::connect(socket_fd, reinterpret_cast<const sockaddr*>(&addr), sizeof(addr)) < 0) {
        if (errno != EINTR) {
            return false;
        }
    }
    return true;
}


auto gelfmover::net::TCPSocket::listen(
    const std::int32_t backlog) const
    -> void {
    if (::listen(socket_fd, backlog) < 0) {
        throw std::system_error(errno, std::system_category(), "Failed to listen on socket");
    }
}


auto gelfmover::net::TCPSocket::accept(
    const std::chrono::milliseconds timeout) const
    -> std::optional<TCPSocket> {
    // Wait for a pending connection.
    if (select({socket_fd}, timeout).empty()) {
        return std::nullopt;
    }

    // Accept the new connection.
    const auto client_fd = ::accept(socket_fd, nullptr, nullptr);
    if (client_fd < 0) {
        if (errno == EINTR or errno == EAGAIN or errno == ECONNABORTED) {
            return std::nullopt;
        }
        throw std::system_error(errno, std::system_category(), "Failed to accept connection");
    }
    return TCPSocket(client_fd);
}


auto gelfmover::net::TCPSocket::send(
    const std::span<const std::uint8_t> data) const
    -> void {
    // Send all data, handling partial sends.
    auto total_sent = 0uz;
    while (total_sent < data.size()) {
        const auto sent = ::send(socket_fd, data.data() + total_sent, data.size() - total_sent, MSG_NOSIGNAL);
        if (sent < 0 and errno == EINTR) {
            continue;
        }
        if (sent <= 0) {
            throw std::system_error(errno, std::system_category(), "Failed to send data");
        }
        total_sent += static_cast<std::size_t>(sent);
    }
}


auto gelfmover::net::TCPSocket::recv_some(
    const std::size_t max_len) const
    -> std::vector<std::uint8_t> {
    auto buffer = std::vector<std::uint8_t>(max_len);
    while (true) {
        const auto recv_len = ::recv(socket_fd, buffer.data(), buffer.size(), 0);
        if (recv_len < 0 and errno == EINTR) {
            continue;
        }
        if (recv_len < 0) {
            throw std::system_error(errno, std::system_category(), "Failed to receive data");
        }
        buffer.resize(static_cast<std::size_t>(recv_len));
        return buffer;
    }
}


auto gelfmover::net::TCPSocket::set_timeout(
    const std::chrono::milliseconds timeout) const
    -> void {
    auto tv = timeval{};
    tv.tv_sec = static_cast<long>(timeout.count() / 1000);
    tv.tv_usec = static_cast<long>((timeout.count() % 1000) * 1000);

    if (::setsockopt(socket_fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv)) < 0 or
        ::setsockopt(socket_fd, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv)) < 0) {
        throw std::system_error(errno, std::system_category(), "Failed to set socket timeouts");
    }
}
