#pragma once

#include <chrono>
#include <string>

namespace wellscan {

/// Local wall-clock time as "YYYY-MM-DDTHH:MM:SS" (seconds precision).
std::string isoTimestamp();

std::string isoTimestamp(std::chrono::system_clock::time_point when);

} // namespace wellscan
