#include <gelfmover/net/select.hpp>

#include <cerrno>
#include <system_error>

#include <sys/select.h>
#include <sys/time.h>


auto gelfmover::net::select(
    std::vector<socket_t> const &read_fds,
    const std::optional<std::chrono::milliseconds> timeout)
    -> std::vector<socket_t> {
    // Initialize fd_set and find max fd
    fd_set read_set;
    FD_ZERO(&read_set);
    auto max_fd = static_cast<socket_t>(0);

    for (const auto fd : read_fds) {
        if (fd < 0) continue;
        FD_SET(fd, &read_set);
        if (fd > max_fd) max_fd = fd;
    }

    // Prepare timeout
    timeval tv{};
    timeval *tv_ptr = nullptr;
    if (timeout.has_value()) {
        tv.tv_sec = static_cast<long>(timeout->count() / 1000);
        tv.tv_usec = static_cast<long>((timeout->count() % 1000) * 1000);
        tv_ptr = &tv;
    }

    // Call select
    if (::select(max_fd + 1, &read_set, nullptr, nullptr, tv_ptr) < 0) {
        if (errno == EINTR) {
            return {};
        }
        throw std::system_error(errno, std::system_category(), "Select call failed");
    }

    // Collect ready fds
    auto ready_read_fds = std::vector<socket_t>{};
    for (const auto fd : read_fds) {
        if (fd >= 0 and FD_ISSET(fd, &read_set)) { ready_read_fds.push_back(fd); }
    }
    return ready_read_fds;
}
