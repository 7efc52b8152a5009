#include <gelfmover/utils/encoding.hpp>


auto gelfmover::utils::to_hex(
    const std::span<const std::uint8_t> data)
    -> std::string {
    // Convert each byte to its hexadecimal representation.
    static constexpr char hex_chars[] = "0123456789abcdef";
    auto hex_str = std::string(data.size() * 2, '0');
    for (auto i = 0uz; i < data.size(); ++i) {
        hex_str[i * 2] = hex_chars[data[i] >> 4 & 0x0F];
        hex_str[i * 2 + 1] = hex_chars[data[i] & 0x0F];
    }
    return hex_str;
}


auto gelfmover::utils::decode_bytes(
    const std::span<const std::uint8_t> data)
    -> std::string {
    return {data.begin(), data.end()};
}


auto gelfmover::utils::is_valid_utf8(
    const std::span<const std::uint8_t> data)
    -> bool {
    auto i = 0uz;
    while (i < data.size()) {
        const auto lead = data[i];

        // Single byte (ASCII).
        if (lead < 0x80) {
            ++i;
            continue;
        }

        // Determine the sequence length and the minimum code point to reject overlong encodings.
        auto length = 0uz;
        auto code_point = std::uint32_t{0};
        auto min_code_point = std::uint32_t{0};
        if ((lead & 0xE0) == 0xC0) {
            length = 2;
            code_point = lead & 0x1F;
            min_code_point = 0x80;
        }
        else if ((lead & 0xF0) == 0xE0) {
            length = 3;
            code_point = lead & 0x0F;
            min_code_point = 0x800;
        }
        else if ((lead & 0xF8) == 0xF0) {
            length = 4;
            code_point = lead & 0x07;
            min_code_point = 0x10000;
        }
        else {
            return false;
        }

        if (i + length > data.size()) {
            return false;
        }

        // Every continuation byte must be of the form 10xxxxxx.
        for (auto j = 1uz; j < length; ++j) {
            const auto cont = data[i + j];
            if ((cont & 0xC0) != 0x80) {
                return false;
            }
            code_point = (code_point << 6) | (cont & 0x3F);
        }

        if (code_point < min_code_point or code_point > 0x10FFFF or (code_point >= 0xD800 and code_point <= 0xDFFF)) {
            return false;
        }
        i += length;
    }
    return true;
}
