#include <gelfmover/gelf/unpacker.hpp>

#include <algorithm>
#include <chrono>
#include <cmath>
#include <cstring>
#include <string>

#include <zlib.h>

#include <gelfmover/errors.hpp>
#include <gelfmover/utils/encoding.hpp>


namespace {
    constexpr auto INFLATE_STEP = 64uz * 1024;

    // Keys decoded into typed fields; everything else goes to the extras.
    constexpr const char *KNOWN_KEYS[] = {"version", "host", "short_message", "full_message", "timestamp", "level"};

    auto is_known_key(std::string const &key) -> bool {
        return std::any_of(std::begin(KNOWN_KEYS), std::end(KNOWN_KEYS), [&key](const char *known) { return key == known; });
    }

    auto required_string(nlohmann::json const &json, const char *key) -> std::string {
        const auto it = json.find(key);
        if (it == json.end()) {
            throw gelfmover::UnpackError(std::string("missing required field '") + key + "'");
        }
        if (not it->is_string()) {
            throw gelfmover::UnpackError(std::string("field '") + key + "' must be a string");
        }
        return it->get<std::string>();
    }

    auto now_as_gelf_timestamp() -> double {
        const auto since_epoch = std::chrono::system_clock::now().time_since_epoch();
        return std::chrono::duration<double>(since_epoch).count();
    }
}


auto gelfmover::gelf::detect_compression(
    const std::span<const std::uint8_t> payload)
    -> Compression {
    if (payload.size() < 2) {
        return Compression::NONE;
    }

    // Gzip member header (RFC 1952).
    if (payload[0] == 0x1f and payload[1] == 0x8b) {
        return Compression::GZIP;
    }

    // Zlib header (RFC 1950): deflate method, window up to 32K, and CMF*256+FLG divisible by 31.
    if ((payload[0] & 0x0F) == 8 and (payload[0] >> 4) <= 7 and ((payload[0] << 8) | payload[1]) % 31 == 0) {
        return Compression::ZLIB;
    }
    return Compression::NONE;
}


auto gelfmover::gelf::decompress(
    const std::span<const std::uint8_t> payload,
    const std::size_t max_size)
    -> std::vector<std::uint8_t> {
    z_stream zstream;
    std::memset(&zstream, 0, sizeof(zstream));
    zstream.next_in = const_cast<Bytef*>(payload.data());
    zstream.avail_in = static_cast<uInt>(payload.size());

    // Window bits 15 + 32 lets zlib detect the gzip or zlib wrapper itself.
    if (inflateInit2(&zstream, 15 + 32) != Z_OK) {
        throw UnpackError("failed to initialise zlib");
    }

    // Inflate in steps, growing the output until the stream ends or the limit is reached.
    auto output = std::vector<std::uint8_t>();
    auto zerror = Z_OK;
    while (zerror == Z_OK) {
        if (output.size() >= max_size) {
            inflateEnd(&zstream);
            throw UnpackError("decompressed payload exceeds " + std::to_string(max_size) + " bytes");
        }

        const auto offset = output.size();
        const auto step = std::min(INFLATE_STEP, max_size - offset);
        output.resize(offset + step);
        zstream.next_out = output.data() + offset;
        zstream.avail_out = static_cast<uInt>(step);

        zerror = inflate(&zstream, Z_NO_FLUSH);
        output.resize(offset + step - zstream.avail_out);

        // No progress and no more input means the stream is truncated.
        if (zerror == Z_BUF_ERROR or (zerror == Z_OK and zstream.avail_in == 0 and zstream.avail_out != 0)) {
            inflateEnd(&zstream);
            throw UnpackError("compressed payload is truncated");
        }
    }

    const auto message = zstream.msg != nullptr ? std::string(zstream.msg) : std::string("error ") + std::to_string(zerror);
    inflateEnd(&zstream);
    if (zerror != Z_STREAM_END) {
        throw UnpackError("decompression failed: " + message);
    }
    return output;
}


gelfmover::gelf::Unpacker::Unpacker(
    const std::size_t max_decompressed_size) :
    m_max_decompressed_size(max_decompressed_size) {
}


auto gelfmover::gelf::Unpacker::unpack(
    const std::span<const std::uint8_t> payload) const
    -> LogRecord {
    // Decompress if the leading bytes say so.
    auto inflated = std::vector<std::uint8_t>();
    auto text = payload;
    if (detect_compression(payload) != Compression::NONE) {
        inflated = decompress(payload, m_max_decompressed_size);
        text = inflated;
    }

    // Validate the text encoding and parse the JSON document.
    if (not utils::is_valid_utf8(text)) {
        throw UnpackError("payload is not valid UTF-8");
    }
    auto json = nlohmann::json::parse(text.begin(), text.end(), nullptr, false);
    if (json.is_discarded()) {
        throw UnpackError("payload is not valid JSON");
    }
    if (not json.is_object()) {
        throw UnpackError("payload is not a JSON object");
    }

    // Required fields. Some clients send "message" instead of "short_message".
    auto record = LogRecord{};
    record.version = required_string(json, "version");
    record.host = required_string(json, "host");
    const auto use_message_alias = not json.contains("short_message") and json.contains("message");
    record.short_message = required_string(json, use_message_alias ? "message" : "short_message");

    // Optional fields with defaults.
    if (const auto it = json.find("full_message"); it != json.end() and not it->is_null()) {
        if (not it->is_string()) {
            throw UnpackError("field 'full_message' must be a string");
        }
        record.full_message = it->get<std::string>();
    }

    record.timestamp = now_as_gelf_timestamp();
    if (const auto it = json.find("timestamp"); it != json.end() and not it->is_null()) {
        if (not it->is_number()) {
            throw UnpackError("field 'timestamp' must be a number");
        }
        record.timestamp = it->get<double>();
    }

    if (const auto it = json.find("level"); it != json.end() and not it->is_null()) {
        if (not it->is_number()) {
            throw UnpackError("field 'level' must be a number");
        }
        const auto level = std::clamp(std::lround(it->get<double>()), 0l, 7l);
        record.level = static_cast<Level>(level);
    }

    // Every other key is kept as is.
    for (auto it = json.begin(); it != json.end(); ++it) {
        if (is_known_key(it.key()) or (use_message_alias and it.key() == "message")) {
            continue;
        }
        record.extra.emplace(it.key(), std::move(it.value()));
    }
    return record;
}
