#include "wellscan/motion/PortDiscovery.hpp"
#include "wellscan/log/Log.hpp"

#include <algorithm>
#include <filesystem>
#include <system_error>

namespace wellscan::motion {

namespace fs = std::filesystem;

bool isCandidatePortName(const std::string& name) {
    if (name == "ttyAMA0" || name == "ttyS0") {
        return false;
    }
    return name.rfind("ttyUSB", 0) == 0 || name.rfind("ttyACM", 0) == 0;
}

std::vector<std::string> listCandidatePorts(const std::string& deviceDir) {
    std::vector<std::string> ports;

    std::error_code ec;
    fs::directory_iterator it(deviceDir, ec);
    if (ec) {
        logError("[PortDiscovery] cannot list ", deviceDir, ": ", ec.message(), "\n");
        return ports;
    }

    for (; it != fs::directory_iterator(); it.increment(ec)) {
        const auto name = it->path().filename().string();
        if (isCandidatePortName(name)) {
            ports.push_back(it->path().string());
        }
    }
    if (ec) {
        logError("[PortDiscovery] error while listing ", deviceDir, ": ", ec.message(), "\n");
    }

    std::sort(ports.begin(), ports.end());
    if (ports.empty()) {
        logInfo("[PortDiscovery] no USB serial ports under ", deviceDir, "\n");
    }
    return ports;
}

} // namespace wellscan::motion
