#pragma once

#include <string>
#include <vector>

namespace wellscan::motion {

/**
 * @brief USB serial devices that may be the motion controller.
 *
 * Lists `ttyUSB*` and `ttyACM*` entries under @p deviceDir, sorted, leaving
 * out the on-board UART and console (`ttyAMA0`, `ttyS0`). Nothing is opened
 * here; MotionSession::connect() test-opens the candidates.
 */
std::vector<std::string> listCandidatePorts(const std::string& deviceDir = "/dev");

/// True for names the discovery would accept ("ttyUSB0", "ttyACM3").
bool isCandidatePortName(const std::string& name);

} // namespace wellscan::motion
