#pragma once

#include <fmt/format.h>

#include <gelfmover/utils/encoding.hpp>


#define FORMAT_MESSAGE_ID(id) \
    gelfmover::utils::to_hex(std::span<const std::uint8_t>((id).data(), (id).size()))

#define FORMAT_CHUNK_INFO(chunk) \
    fmt::format(" {}[{}/{}]", FORMAT_MESSAGE_ID((chunk).message_id), (chunk).sequence_index, (chunk).sequence_count)
