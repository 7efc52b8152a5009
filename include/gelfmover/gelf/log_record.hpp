#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>


namespace gelfmover::gelf {
    /**
     * GELF severity levels, identical to syslog's.
     */
    enum class Level : std::uint8_t {
        EMERGENCY = 0,
        ALERT = 1,
        CRITICAL = 2,
        ERROR = 3,
        WARNING = 4,
        NOTICE = 5,
        INFORMATIONAL = 6,
        DEBUG = 7,
    };

    /**
     * A decoded GELF event. The well-known fields are typed; every other top-level key (custom fields are conventionally
     * prefixed with an underscore) is kept verbatim in @c extra.
     */
    struct LogRecord {
        std::string version;
        std::string host;
        std::string short_message;
        std::optional<std::string> full_message;
        double timestamp = 0.0;
        Level level = Level::INFORMATIONAL;
        std::map<std::string, nlohmann::json> extra;
    };

    /**
     * Re-encode a record as a GELF JSON object.
     */
    auto to_json(LogRecord const &record) -> nlohmann::json;
}
