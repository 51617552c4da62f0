#include "wellscan/spectral/Channels.hpp"

#include <cstring>

namespace wellscan::spectral {

std::vector<std::string> channelLabels() {
    return std::vector<std::string>(kChannelLabels.begin(), kChannelLabels.end());
}

std::size_t findChannel(const char* prefix) {
    const std::size_t length = std::strlen(prefix);
    for (std::size_t i = 0; i < kChannelCount; ++i) {
        if (std::strncmp(kChannelLabels[i], prefix, length) == 0) {
            return i;
        }
    }
    return kChannelCount;
}

} // namespace wellscan::spectral
