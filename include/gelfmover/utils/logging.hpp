#pragma once

#include <memory>
#include <string>

#include <spdlog/logger.h>


namespace gelfmover::utils {
    /**
     * Create a named logger writing to a coloured stdout sink, and register it with spdlog so that the global level
     * set at startup applies to it. Each component owns one of these.
     * @param name The component name shown in each log line.
     * @return The shared logger.
     */
    auto create_logger(std::string const &name) -> std::shared_ptr<spdlog::logger>;
}
