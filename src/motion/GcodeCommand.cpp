#include "wellscan/motion/GcodeCommand.hpp"

#include <cstdio>
#include <utility>

namespace wellscan::motion {

GcodeCommand::GcodeCommand(std::string text)
: body(std::move(text)) {}

GcodeCommand GcodeCommand::linearMove(const geometry::Point3& target, int feedrate) {
    char buffer[128];
    std::snprintf(buffer, sizeof(buffer), "G1 X%.2f Y%.2f Z%.2f F%d",
                  target.x, target.y, target.z, feedrate);
    return GcodeCommand(buffer);
}

GcodeCommand GcodeCommand::waitForMoves() {
    return GcodeCommand("M400");
}

GcodeCommand GcodeCommand::homeAll() {
    return GcodeCommand("G28");
}

GcodeCommand GcodeCommand::reportPosition() {
    return GcodeCommand("M114");
}

} // namespace wellscan::motion
