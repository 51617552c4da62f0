#pragma once

#include "wellscan/geometry/Geometry.hpp"

#include <cstdint>
#include <optional>
#include <string_view>

namespace wellscan::motion {

enum class AckKind : std::uint8_t {
    None = 0,   ///< Informational line (echo, busy, position report).
    Ok,
    Error
};

/**
 * @brief Classify a decoded controller line.
 *
 * Case-insensitive substring match, "ok" checked before "error": Marlin
 * terminates every accepted command with a line containing "ok", and
 * reports rejected ones with "Error:...".
 */
AckKind classifyAck(std::string_view line);

/**
 * @brief Parse an M114 report such as
 *        "X:10.00 Y:20.00 Z:5.00 E:0.00 Count X:800 Y:1600 Z:2000".
 *
 * Reads AXIS:value tokens up to the "Count" section (stepper counts, not
 * millimetres). All of X, Y and Z must be present.
 */
std::optional<geometry::Point3> parsePosition(std::string_view line);

} // namespace wellscan::motion
