#include "wellscan/sensor/SpectralReader.hpp"

#include "wellscan/core/Error.hpp"
#include "wellscan/log/Log.hpp"

#include <thread>
#include <vector>

namespace wellscan::sensor {

expected<ChannelVector> readFrame(SensorDevice& device) {
    if (auto triggered = device.triggerMeasurement(); !triggered) {
        logError("[SpectralReader] trigger failed: ", triggered.error().message(), "\n");
        return unexpected(make_error_code(Errc::SensorFailure));
    }

    const std::size_t width = device.channelCount();
    ChannelVector frame;
    frame.reserve(width);
    for (std::size_t i = 0; i < width; ++i) {
        auto value = device.readChannel(i);
        if (!value) {
            logError("[SpectralReader] channel ", i, " read failed: ",
                     value.error().message(), "\n");
            return unexpected(make_error_code(Errc::SensorFailure));
        }
        frame.push_back(*value);
    }
    return frame;
}

expected<ChannelVector> readAveraged(SensorDevice& device,
                                     int averages,
                                     std::chrono::milliseconds gap) {
    if (averages < 1) {
        averages = 1;
    }

    std::vector<ChannelVector> frames;
    frames.reserve(static_cast<std::size_t>(averages));
    for (int i = 0; i < averages; ++i) {
        auto frame = readFrame(device);
        if (!frame) {
            return unexpected(frame.error());
        }
        frames.push_back(std::move(*frame));
        if (gap.count() > 0 && i + 1 < averages) {
            std::this_thread::sleep_for(gap);
        }
    }
    return spectral::accumulateAndAverage(frames);
}

} // namespace wellscan::sensor
