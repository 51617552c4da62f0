#pragma once

#include <array>
#include <cstddef>
#include <string>
#include <vector>

namespace wellscan::spectral {

/// Spectral channels of the 13-channel sensor, in the order frames are read.
constexpr std::size_t kChannelCount = 13;

constexpr std::array<const char*, kChannelCount> kChannelLabels{
    "F1 (405)", "F2 (425)", "FZ (450)", "F3 (475)", "F4 (515)",
    "FY (550)", "F5 (555)", "FXL (600)", "F6 (640)", "F7 (690)",
    "F8 (745)", "VIS (broad)", "NIR (855)"};

/// Labels as owned strings (the shape persisted with every payload).
std::vector<std::string> channelLabels();

/// Index of the first label starting with @p prefix ("F5", "FXL"), or kChannelCount.
std::size_t findChannel(const char* prefix);

} // namespace wellscan::spectral
