#pragma once

#include <cstdint>
#include <map>
#include <span>
#include <string>
#include <vector>


namespace gelfmover::sink::http {
    struct HttpResponse {
        std::uint32_t status_code = 0;
        std::map<std::string, std::string> headers;
        std::string body;
    };

    /**
     * Serialize a @c POST request with a JSON body. The connection is closed after the response, so the response can
     * be read until end-of-stream.
     */
    auto build_post_request(
        std::string const &host,
        std::string const &path,
        std::map<std::string, std::string> const &headers,
        std::string const &body)
        -> std::vector<std::uint8_t>;

    /**
     * Parse a raw HTTP/1.x response. Header names are lowercased.
     * @throw std::runtime_error If the status line is missing or malformed.
     */
    auto parse_response(std::span<const std::uint8_t> raw) -> HttpResponse;
}
