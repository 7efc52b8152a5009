#include <gelfmover/gelf/log_record.hpp>


auto gelfmover::gelf::to_json(
    LogRecord const &record)
    -> nlohmann::json {
    auto json = nlohmann::json::object();
    json["version"] = record.version;
    json["host"] = record.host;
    json["short_message"] = record.short_message;
    if (record.full_message.has_value()) {
        json["full_message"] = *record.full_message;
    }
    json["timestamp"] = record.timestamp;
    json["level"] = static_cast<std::uint8_t>(record.level);

    for (auto const &[key, value] : record.extra) {
        json[key] = value;
    }
    return json;
}
