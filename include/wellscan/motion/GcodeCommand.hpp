#pragma once

#include "wellscan/geometry/Geometry.hpp"

#include <string>

namespace wellscan::motion {

enum class Axis : char {
    X = 'X',
    Y = 'Y',
    Z = 'Z'
};

/**
 * @brief One G-code line in the Marlin dialect the stage understands.
 *
 * Coordinates are printed with two decimals, the resolution positions are
 * rounded to; the feedrate is an integer in mm/min.
 */
class GcodeCommand {
public:
    static GcodeCommand linearMove(const geometry::Point3& target, int feedrate);
    static GcodeCommand waitForMoves();    // M400
    static GcodeCommand homeAll();         // G28
    static GcodeCommand reportPosition();  // M114

    explicit GcodeCommand(std::string text);

    const std::string& text() const { return body; }

    /// Text plus the terminating newline, as written to the wire.
    std::string line() const { return body + '\n'; }

private:
    std::string body;
};

} // namespace wellscan::motion
