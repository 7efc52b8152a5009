#include <gelfmover/sink/dsn.hpp>

#include <algorithm>
#include <cctype>
#include <charconv>

#include <gelfmover/errors.hpp>


auto gelfmover::sink::Dsn::store_path() const
    -> std::string {
    return path_prefix + "/api/" + project_id + "/store/";
}


auto gelfmover::sink::parse_dsn(
    std::string const &text)
    -> Dsn {
    auto dsn = Dsn{};

    // Trim surrounding whitespace (DSN files usually end with a newline).
    const auto first = text.find_first_not_of(" \t\r\n");
    const auto last = text.find_last_not_of(" \t\r\n");
    if (first == std::string::npos) {
        throw ConfigError("empty DSN");
    }
    const auto trimmed = text.substr(first, last - first + 1);

    // Scheme.
    const auto scheme_end = trimmed.find("://");
    if (scheme_end == std::string::npos) {
        throw ConfigError("DSN has no scheme");
    }
    dsn.scheme = trimmed.substr(0, scheme_end);
    if (dsn.scheme != "http" and dsn.scheme != "https") {
        throw ConfigError("unsupported DSN scheme '" + dsn.scheme + "'");
    }

    // Credentials, up to the '@'.
    auto rest = trimmed.substr(scheme_end + 3);
    const auto at = rest.find('@');
    if (at == std::string::npos or at == 0) {
        throw ConfigError("DSN has no public key");
    }
    const auto credentials = rest.substr(0, at);
    if (const auto colon = credentials.find(':'); colon != std::string::npos) {
        dsn.public_key = credentials.substr(0, colon);
        dsn.secret_key = credentials.substr(colon + 1);
    }
    else {
        dsn.public_key = credentials;
    }
    if (dsn.public_key.empty()) {
        throw ConfigError("DSN has no public key");
    }
    rest = rest.substr(at + 1);

    // Host and optional port, up to the first '/'.
    const auto slash = rest.find('/');
    if (slash == std::string::npos) {
        throw ConfigError("DSN has no project id");
    }
    auto host_port = rest.substr(0, slash);
    dsn.port = dsn.is_tls() ? 443 : 80;
    if (const auto colon = host_port.rfind(':'); colon != std::string::npos) {
        auto port = 0u;
        const auto port_str = host_port.substr(colon + 1);
        const auto [end, ec] = std::from_chars(port_str.data(), port_str.data() + port_str.size(), port);
        if (ec != std::errc{} or end != port_str.data() + port_str.size() or port == 0 or port > 65535) {
            throw ConfigError("invalid DSN port '" + port_str + "'");
        }
        dsn.port = static_cast<std::uint16_t>(port);
        host_port = host_port.substr(0, colon);
    }
    if (host_port.empty()) {
        throw ConfigError("DSN has no host");
    }
    dsn.host = host_port;

    // Path: everything up to the last segment is a prefix, the last segment is the project id.
    auto path = rest.substr(slash);
    while (path.size() > 1 and path.back() == '/') {
        path.pop_back();
    }
    const auto last_slash = path.rfind('/');
    dsn.path_prefix = path.substr(0, last_slash);
    dsn.project_id = path.substr(last_slash + 1);
    if (dsn.project_id.empty() or not std::all_of(dsn.project_id.begin(), dsn.project_id.end(), [](const unsigned char c) { return std::isalnum(c) or c == '-' or c == '_'; })) {
        throw ConfigError("invalid DSN project id '" + dsn.project_id + "'");
    }
    return dsn;
}
