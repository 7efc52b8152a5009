#include <gelfmover/config.hpp>

#include <filesystem>
#include <fstream>
#include <sstream>
#include <stdexcept>

#include <spdlog/common.h>

#include <gelfmover/errors.hpp>


namespace {
    auto read_dsn_file(std::string const &path) -> std::string {
        if (not std::filesystem::is_regular_file(path)) {
            throw gelfmover::ConfigError("DSN file '" + path + "' not found");
        }
        auto file = std::ifstream(path, std::ios::binary);
        if (not file) {
            throw gelfmover::ConfigError("DSN file '" + path + "' cannot be read");
        }
        auto contents = std::ostringstream();
        contents << file.rdbuf();
        return contents.str();
    }

    auto parse_address(std::string const &name, std::string const &text) -> gelfmover::net::Endpoint {
        try {
            return gelfmover::net::parse_endpoint(text);
        }
        catch (std::invalid_argument const &e) {
            throw gelfmover::ConfigError(name + ": " + e.what());
        }
    }

    auto require_positive(std::string const &name, const std::size_t value) -> std::size_t {
        if (value == 0) {
            throw gelfmover::ConfigError(name + " must be at least 1");
        }
        return value;
    }
}


auto gelfmover::register_options(
    CLI::App &app,
    RawOptions &raw)
    -> void {
    // Sink.
    app.add_option("--dsn", raw.dsn, "Sentry DSN events are sent to")->envname("SENTRY_DSN");
    app.add_option("--dsn-file", raw.dsn_file, "File containing the Sentry DSN")->envname("SENTRY_DSN_FILE");
    app.add_flag("--console", raw.console, "Print events to stdout instead of sending them to Sentry");

    // Listeners.
    app.add_option("--udp-addr", raw.udp_addr, "UDP address to listen on")->envname("UDP_ADDR")->capture_default_str();
    app.add_option("--tcp-addr", raw.tcp_addr, "TCP address to listen on")->envname("TCP_ADDR")->capture_default_str();
    app.add_option("--system", raw.system_name, "Name of this gateway in the logs")->envname("SYSTEM")->capture_default_str();

    // Worker pools and bounds.
    app.add_option("--reader-threads", raw.reader_threads, "UDP reader workers")->envname("READER_THREADS")->capture_default_str();
    app.add_option("--unpacker-threads", raw.unpacker_threads, "Unpacker workers")->envname("UNPACKER_THREADS")->capture_default_str();
    app.add_option("--forwarder-threads", raw.forwarder_threads, "Forwarder workers")->envname("FORWARDER_THREADS")->capture_default_str();
    app.add_option("--max-parallel-chunks", raw.max_parallel_chunks, "Maximum incomplete chunked messages held at once")->envname("MAX_PARALLEL_CHUNKS")->capture_default_str();
    app.add_option("--queue-size", raw.queue_size, "Capacity of each stage queue")->envname("QUEUE_SIZE")->capture_default_str();
    app.add_option("--chunk-ttl-ms", raw.chunk_ttl_ms, "Time-to-live of an incomplete chunked message")->envname("CHUNK_TTL_MS")->capture_default_str();

    // Logging.
    app.add_option("--log-level", raw.log_level, "trace, debug, info, warn, error, critical or off")->envname("LOG_LEVEL")->capture_default_str();
}


auto gelfmover::resolve_config(
    RawOptions const &raw)
    -> Config {
    auto config = Config{};

    // Exactly one DSN source, unless events only go to the console.
    if (not raw.dsn.empty() and not raw.dsn_file.empty()) {
        throw ConfigError("only one of SENTRY_DSN and SENTRY_DSN_FILE may be given");
    }
    if (not raw.dsn.empty()) {
        config.dsn = raw.dsn;
    }
    else if (not raw.dsn_file.empty()) {
        config.dsn = read_dsn_file(raw.dsn_file);
    }
    config.console = raw.console;
    if (not config.dsn.has_value() and not config.console) {
        throw ConfigError("SENTRY_DSN or SENTRY_DSN_FILE must be given");
    }

    config.udp_addr = parse_address("UDP address", raw.udp_addr);
    config.tcp_addr = parse_address("TCP address", raw.tcp_addr);
    config.system_name = raw.system_name;

    config.reader_threads = require_positive("reader threads", raw.reader_threads);
    config.unpacker_threads = require_positive("unpacker threads", raw.unpacker_threads);
    config.forwarder_threads = require_positive("forwarder threads", raw.forwarder_threads);
    config.max_parallel_chunks = require_positive("max parallel chunks", raw.max_parallel_chunks);
    config.queue_size = require_positive("queue size", raw.queue_size);
    config.chunk_ttl = std::chrono::milliseconds(require_positive("chunk ttl", raw.chunk_ttl_ms));

    // spdlog maps unknown names to "off", so check the round trip.
    const auto level = spdlog::level::from_str(raw.log_level);
    if (level == spdlog::level::off and raw.log_level != "off") {
        throw ConfigError("unknown log level '" + raw.log_level + "'");
    }
    config.log_level = raw.log_level;
    return config;
}
