#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>


namespace gelfmover::utils {
    /**
     * Random bytes from OpenSSL's generator.
     * @throw std::runtime_error If the generator is not seeded.
     */
    auto random_bytes(std::size_t len) -> std::vector<std::uint8_t>;
}
