#include <gelfmover/utils/random.hpp>

#include <stdexcept>

#include <openssl/rand.h>


auto gelfmover::utils::random_bytes(
    const std::size_t len)
    -> std::vector<std::uint8_t> {
    // Generate random bytes of the specified length.
    auto buffer = std::vector<std::uint8_t>(len);
    if (RAND_bytes(buffer.data(), static_cast<int>(len)) != 1) {
        throw std::runtime_error("Failed to generate random bytes");
    }
    return buffer;
}
