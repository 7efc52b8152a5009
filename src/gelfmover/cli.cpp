#include <gelfmover/cli.hpp>

#include <csignal>
#include <stdexcept>
#include <iostream>
#include <memory>
#include <system_error>

#include <pthread.h>

#include <CLI/CLI.hpp>
#include <spdlog/spdlog.h>

#include <gelfmover/config.hpp>
#include <gelfmover/errors.hpp>
#include <gelfmover/gateway.hpp>
#include <gelfmover/sink/dsn.hpp>
#include <gelfmover/sink/transport.hpp>
#include <gelfmover/version.hpp>


namespace {
    auto make_transport(gelfmover::Config const &config) -> std::shared_ptr<gelfmover::sink::Transport> {
        if (config.console) {
            return std::make_shared<gelfmover::sink::ConsoleTransport>(std::cout);
        }
        return std::make_shared<gelfmover::sink::HttpTransport>(gelfmover::sink::parse_dsn(*config.dsn));
    }

    auto wait_for_shutdown_signal(sigset_t const &signals) -> int {
        auto signal = 0;
        while (sigwait(&signals, &signal) != 0) {
        }
        return signal;
    }
}


auto gelfmover::cli::create_cli(
    const int argc,
    char **argv)
    -> int {
    CLI::App app{"Forward GELF log events received over UDP and TCP to Sentry"};
    app.set_version_flag("--version", GELFMOVER_VERSION);

    auto raw = RawOptions{};
    register_options(app, raw);
    CLI11_PARSE(app, argc, argv);

    // Block the shutdown signals before any thread starts, so that every thread inherits the mask and only the
    // main thread receives them through sigwait.
    auto signals = sigset_t{};
    sigemptyset(&signals);
    sigaddset(&signals, SIGINT);
    sigaddset(&signals, SIGTERM);
    pthread_sigmask(SIG_BLOCK, &signals, nullptr);

    // A sink that closes mid-request must fail the send, not end the process.
    std::signal(SIGPIPE, SIG_IGN);

    // Everything up to a started gateway is startup: any failure here ends the process.
    auto gateway = std::unique_ptr<Gateway>();
    try {
        const auto config = resolve_config(raw);
        spdlog::set_level(spdlog::level::from_str(config.log_level));
        spdlog::info("{} {} starting", config.system_name, GELFMOVER_VERSION);

        gateway = std::make_unique<Gateway>(config, make_transport(config));
        gateway->start();
    }
    catch (ConfigError const &e) {
        spdlog::critical("{}", e.what());
        return 1;
    }
    catch (std::system_error const &e) {
        spdlog::critical("Startup failed: {}", e.what());
        return 1;
    }
    catch (std::runtime_error const &e) {
        spdlog::critical("Startup failed: {}", e.what());
        return 1;
    }

    const auto signal = wait_for_shutdown_signal(signals);
    spdlog::info("Received signal {}, shutting down", signal);
    gateway->stop();
    return 0;
}
