#pragma once

#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

#include <gelfmover/gelf/log_record.hpp>


namespace gelfmover::sink {
    /**
     * The @c ForwardEvent is a record projected onto Sentry's event schema. It is built right before sending and
     * thrown away afterwards.
     */
    struct ForwardEvent {
        std::string event_id;
        nlohmann::json body;
    };

    /**
     * Map a GELF (syslog) severity onto Sentry's level names: emergency, alert and critical become @c fatal, notice
     * and informational become @c info.
     */
    auto sentry_level(gelf::Level level) -> std::string_view;

    /**
     * Build the Sentry event for a record: @c short_message is the event message, @c host the server name, and
     * @c full_message, @c version and every extra field go into @c extra.
     */
    auto make_event(gelf::LogRecord const &record) -> ForwardEvent;
}
