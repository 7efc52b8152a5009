#pragma once

#include <chrono>
#include <cstddef>
#include <optional>
#include <string>

#include <CLI/CLI.hpp>

#include <gelfmover/net/address.hpp>


namespace gelfmover {
    /**
     * Option values exactly as given on the command line or in the environment, before validation.
     */
    struct RawOptions {
        std::string dsn;
        std::string dsn_file;
        std::string udp_addr = "0.0.0.0:8080";
        std::string tcp_addr = "0.0.0.0:8081";
        std::string system_name = "Gelf Mover";
        std::size_t reader_threads = 1;
        std::size_t unpacker_threads = 1;
        std::size_t forwarder_threads = 1;
        std::size_t max_parallel_chunks = 500;
        std::size_t queue_size = 1024;
        std::size_t chunk_ttl_ms = 5000;
        std::string log_level = "info";
        bool console = false;
    };

    /**
     * The validated configuration, built once at startup and passed to each component's constructor.
     */
    struct Config {
        std::optional<std::string> dsn;
        bool console = false;
        net::Endpoint udp_addr;
        net::Endpoint tcp_addr;
        std::string system_name;
        std::size_t reader_threads = 1;
        std::size_t unpacker_threads = 1;
        std::size_t forwarder_threads = 1;
        std::size_t max_parallel_chunks = 500;
        std::size_t queue_size = 1024;
        std::chrono::milliseconds chunk_ttl = std::chrono::milliseconds(5000);
        std::chrono::milliseconds sweep_interval = std::chrono::milliseconds(1000);
        std::chrono::milliseconds stats_interval = std::chrono::milliseconds(60000);
        std::size_t max_frame_size = 8uz * 1024 * 1024;
        std::size_t max_decompressed_size = 16uz * 1024 * 1024;
        std::string log_level = "info";
    };

    /**
     * Declare every option on @c app, each with its environment variable fallback, writing into @c raw.
     */
    auto register_options(CLI::App &app, RawOptions &raw) -> void;

    /**
     * Validate the parsed options and read the DSN file if one was given.
     * @throw ConfigError If both or neither DSN source is set (and the console sink is not selected), the DSN file
     * cannot be read, an address or the log level is malformed, or a count is zero.
     */
    auto resolve_config(RawOptions const &raw) -> Config;
}
