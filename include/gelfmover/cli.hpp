#pragma once


namespace gelfmover::cli {
    /**
     * Parse the command line, start the gateway and run it until SIGINT or SIGTERM.
     * @return The process exit code: 0 after a clean shutdown, 1 on a startup failure.
     */
    auto create_cli(int argc, char **argv) -> int;
}
