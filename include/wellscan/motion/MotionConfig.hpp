#pragma once

#include <chrono>

namespace wellscan::motion::config {

/**
 * @brief Constants for the Marlin-style motion controller link.
 *
 * The runtime-tunable subset is copied into MotionTimeouts.
 */

// Serial link -----------------------------------------------------------------
constexpr unsigned int MOTION_BAUD_RATE = 115200;
constexpr int MOTION_OPEN_ATTEMPTS = 10;
constexpr std::chrono::milliseconds MOTION_OPEN_BACKOFF{2000};

// Protocol timing -------------------------------------------------------------
constexpr std::chrono::milliseconds MOTION_ACK_TIMEOUT{5000};
constexpr std::chrono::milliseconds MOTION_SETTLE_TIMEOUT{120000};   // G28 / M400
constexpr std::chrono::milliseconds MOTION_POSITION_TIMEOUT{2000};   // M114 window
constexpr std::chrono::milliseconds MOTION_POLL_SLICE{50};

// Moves -----------------------------------------------------------------------
constexpr int MOTION_DEFAULT_FEEDRATE = 3000;   // mm/min

} // namespace wellscan::motion::config
