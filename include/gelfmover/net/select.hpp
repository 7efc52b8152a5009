#pragma once

#include <chrono>
#include <optional>
#include <vector>

#include <gelfmover/net/socket.hpp>


namespace gelfmover::net {
    /**
     * Wait until any of @c read_fds is readable or the timeout expires. A timeout of @c std::nullopt waits forever.
     * An interrupted call (EINTR) returns no ready descriptors rather than throwing.
     * @return The subset of @c read_fds that is readable.
     */
    auto select(
        std::vector<socket_t> const &read_fds,
        std::optional<std::chrono::milliseconds> timeout = std::nullopt)
        -> std::vector<socket_t>;
}
