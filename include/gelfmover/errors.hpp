#pragma once

#include <stdexcept>
#include <string>


namespace gelfmover {
    /**
     * A datagram carries the chunk magic but its header is truncated or inconsistent (zero count, index out of range).
     */
    struct MalformedChunkError final : std::runtime_error {
        explicit MalformedChunkError(std::string const &message) :
            std::runtime_error("Malformed chunk: " + message) {
        }
    };

    /**
     * A payload could not be decompressed or decoded into a GELF record.
     */
    struct UnpackError final : std::runtime_error {
        explicit UnpackError(std::string const &message) :
            std::runtime_error("Unpack failed: " + message) {
        }
    };

    struct ForwardError : std::runtime_error {
        using std::runtime_error::runtime_error;
    };

    /**
     * The sink could not be reached or asked us to come back later. Worth retrying.
     */
    struct TransientForwardError final : ForwardError {
        explicit TransientForwardError(std::string const &message) :
            ForwardError("Transient sink failure: " + message) {
        }
    };

    /**
     * The sink refused the event in a way that retrying cannot fix (bad credentials, unknown project).
     */
    struct PermanentForwardError final : ForwardError {
        explicit PermanentForwardError(std::string const &message) :
            ForwardError("Permanent sink failure: " + message) {
        }
    };

    /**
     * Invalid startup configuration. Only raised before any traffic is accepted.
     */
    struct ConfigError final : std::runtime_error {
        explicit ConfigError(std::string const &message) :
            std::runtime_error("Configuration error: " + message) {
        }
    };
}
