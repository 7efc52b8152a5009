#include <gelfmover/sink/http.hpp>

#include <algorithm>
#include <cctype>
#include <charconv>
#include <stdexcept>

#include <gelfmover/utils/encoding.hpp>


auto gelfmover::sink::http::build_post_request(
    std::string const &host,
    std::string const &path,
    std::map<std::string, std::string> const &headers,
    std::string const &body)
    -> std::vector<std::uint8_t> {
    auto request = std::string();
    request += "POST " + path + " HTTP/1.1\r\n";
    request += "Host: " + host + "\r\n";
    request += "Content-Type: application/json\r\n";
    request += "Content-Length: " + std::to_string(body.size()) + "\r\n";
    request += "Connection: close\r\n";
    for (auto const &[name, value] : headers) {
        request += name + ": " + value + "\r\n";
    }
    request += "\r\n";
    request += body;
    return {request.begin(), request.end()};
}


auto gelfmover::sink::http::parse_response(
    const std::span<const std::uint8_t> raw)
    -> HttpResponse {
    const auto text = utils::decode_bytes(raw);
    auto response = HttpResponse{};

    // Split off the header block; the body is whatever follows the blank line.
    const auto header_end = text.find("\r\n\r\n");
    const auto head = text.substr(0, header_end);
    if (header_end != std::string::npos) {
        response.body = text.substr(header_end + 4);
    }

    // Status line: "HTTP/1.1 200 OK".
    const auto line_end = head.find("\r\n");
    const auto status_line = head.substr(0, line_end);
    if (not status_line.starts_with("HTTP/")) {
        throw std::runtime_error("Malformed HTTP status line");
    }
    const auto code_start = status_line.find(' ');
    if (code_start == std::string::npos or code_start + 4 > status_line.size()) {
        throw std::runtime_error("Malformed HTTP status line");
    }
    const auto code_str = status_line.substr(code_start + 1, 3);
    const auto [ptr, ec] = std::from_chars(code_str.data(), code_str.data() + code_str.size(), response.status_code);
    if (ec != std::errc{} or ptr != code_str.data() + code_str.size()) {
        throw std::runtime_error("Malformed HTTP status code '" + code_str + "'");
    }

    // Headers: "Name: value" per line.
    auto pos = line_end == std::string::npos ? head.size() : line_end + 2;
    while (pos < head.size()) {
        auto next = head.find("\r\n", pos);
        if (next == std::string::npos) {
            next = head.size();
        }
        const auto line = head.substr(pos, next - pos);
        if (const auto colon = line.find(':'); colon != std::string::npos) {
            auto name = line.substr(0, colon);
            std::transform(name.begin(), name.end(), name.begin(), [](const unsigned char c) { return static_cast<char>(std::tolower(c)); });
            auto value = line.substr(colon + 1);
            value.erase(0, value.find_first_not_of(' '));
            response.headers[name] = value;
        }
        pos = next + 2;
    }
    return response;
}
