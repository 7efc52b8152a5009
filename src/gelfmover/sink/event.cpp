#include <gelfmover/sink/event.hpp>

#include <gelfmover/utils/encoding.hpp>
#include <gelfmover/utils/random.hpp>


auto gelfmover::sink::sentry_level(
    const gelf::Level level)
    -> std::string_view {
    switch (level) {
    case gelf::Level::EMERGENCY:
    case gelf::Level::ALERT:
    case gelf::Level::CRITICAL:
        return "fatal";
    case gelf::Level::ERROR:
        return "error";
    case gelf::Level::WARNING:
        return "warning";
    case gelf::Level::NOTICE:
    case gelf::Level::INFORMATIONAL:
        return "info";
    case gelf::Level::DEBUG:
        return "debug";
    }
    return "info";
}


auto gelfmover::sink::make_event(
    gelf::LogRecord const &record)
    -> ForwardEvent {
    // Sentry event ids are 32 lowercase hex digits without dashes.
    auto event = ForwardEvent{.event_id = utils::to_hex(utils::random_bytes(16)), .body = nlohmann::json::object()};

    // Structured context: the GELF version, the long message, and every custom field.
    auto extra = nlohmann::json::object();
    extra["gelf_version"] = record.version;
    if (record.full_message.has_value()) {
        extra["full_message"] = *record.full_message;
    }
    for (auto const &[key, value] : record.extra) {
        extra[key] = value;
    }

    auto &body = event.body;
    body["event_id"] = event.event_id;
    body["message"] = record.short_message;
    body["level"] = std::string(sentry_level(record.level));
    body["timestamp"] = record.timestamp;
    body["server_name"] = record.host;
    body["logger"] = "gelf";
    body["platform"] = "other";
    body["extra"] = std::move(extra);
    return event;
}
