#pragma once

#include <cstdint>
#include <span>
#include <string>


namespace gelfmover::utils {
    /**
     * Convert a byte sequence to a lowercase hexadecimal string, two characters per byte. Used to print GELF message
     * ids and to build Sentry event ids.
     */
    auto to_hex(std::span<const std::uint8_t> data) -> std::string;

    /**
     * Reinterpret bytes as a string, without validation.
     */
    auto decode_bytes(std::span<const std::uint8_t> data) -> std::string;

    /**
     * Check that a byte sequence is well-formed UTF-8 (no overlong forms, no surrogates, nothing above U+10FFFF).
     */
    [[nodiscard]]
    auto is_valid_utf8(std::span<const std::uint8_t> data) -> bool;
}
