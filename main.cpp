#include <gelfmover/cli.hpp>


auto main(const int argc, char **argv) -> int {
    return gelfmover::cli::create_cli(argc, argv);
}
