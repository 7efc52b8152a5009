#include <gelfmover/utils/logging.hpp>

#include <mutex>

#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>


auto gelfmover::utils::create_logger(
    std::string const &name)
    -> std::shared_ptr<spdlog::logger> {
    static auto registry_mutex = std::mutex{};
    std::scoped_lock lock(registry_mutex);

    // Reuse an existing logger of the same name (several instances of one component can exist, e.g. in tests).
    if (auto existing = spdlog::get(name); existing != nullptr) {
        return existing;
    }

    auto sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    auto logger = std::make_shared<spdlog::logger>(name, sink);
    logger->set_level(spdlog::get_level());
    spdlog::register_logger(logger);
    return logger;
}
