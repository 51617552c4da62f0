#pragma once

#include <system_error>

namespace wellscan {

/**
 * @brief Failure conditions raised by the wellscan core.
 *
 * Values are wrapped in std::error_code (category "wellscan") so they travel
 * through `wellscan::expected` next to OS and Asio errors.
 *
 * - Geometry and channel-shape errors are configuration/programming errors:
 *   report them, never retry.
 * - Connection and protocol errors are hardware conditions; the session logs
 *   the literal cause (controller line, OS message) before returning them.
 * - Missing calibration references are NOT errors; reductions return zeros.
 */
enum class Errc {
    InvalidWell = 1,        ///< Identifier malformed or outside the grid.
    InvalidGrid,            ///< rows/cols outside [1, 26] / [1, ...].
    IncompleteCorners,      ///< Well positions requested before all 4 corners were set.
    ChannelLengthMismatch,  ///< Vectors of different widths combined.
    ConnectionFailed,       ///< Port was found but could not be opened.
    NoPortFound,            ///< No candidate port accepted an open.
    ProtocolTimeout,        ///< No ok/error acknowledgment inside the deadline.
    ProtocolError,          ///< Controller answered with an "error" line.
    NotConnected,           ///< Command issued without an open link.
    SensorFailure,          ///< Sensor collaborator could not deliver a frame.
    InvalidPayload          ///< Persisted JSON could not be parsed or is malformed.
};

const std::error_category& errorCategory() noexcept;

std::error_code make_error_code(Errc e) noexcept;

} // namespace wellscan

namespace std {
template <>
struct is_error_code_enum<wellscan::Errc> : true_type {};
} // namespace std
