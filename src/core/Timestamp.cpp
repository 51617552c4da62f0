#include "wellscan/core/Timestamp.hpp"

#include <ctime>
#include <iomanip>
#include <sstream>

namespace wellscan {

std::string isoTimestamp() {
    return isoTimestamp(std::chrono::system_clock::now());
}

std::string isoTimestamp(std::chrono::system_clock::time_point when) {
    const std::time_t seconds = std::chrono::system_clock::to_time_t(when);
    std::tm local{};
    localtime_r(&seconds, &local);

    std::ostringstream os;
    os << std::put_time(&local, "%Y-%m-%dT%H:%M:%S");
    return os.str();
}

} // namespace wellscan
