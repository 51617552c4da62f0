#include "wellscan/sensor/Dummy/DummySensor.hpp"
#include "wellscan/log/Log.hpp"

namespace wellscan::sensor::dummy {

DummySensor::DummySensor(std::size_t channels, bool withIllumination)
: channels(channels)
, illuminationFitted(withIllumination)
, dark(channels, 50.0)
, lit(channels, 0.0)
, latched(channels, 0.0) {
    // Rising response across the band so channels are distinguishable.
    for (std::size_t i = 0; i < channels; ++i) {
        lit[i] = 1000.0 + 100.0 * static_cast<double>(i);
    }
}

expected<void> DummySensor::triggerMeasurement() {
    std::lock_guard<std::mutex> lock(mutex);
    ++triggers;
    if (pendingFailures > 0) {
        --pendingFailures;
        return unexpected(std::make_error_code(std::errc::io_error));
    }
    for (std::size_t i = 0; i < channels; ++i) {
        latched[i] = dark[i] + (illuminated ? lit[i] * sampleFactor : 0.0);
    }
    return {};
}

expected<double> DummySensor::readChannel(std::size_t index) {
    std::lock_guard<std::mutex> lock(mutex);
    if (index >= channels) {
        return unexpected(std::make_error_code(std::errc::invalid_argument));
    }
    return latched[index];
}

expected<void> DummySensor::setIllumination(bool on) {
    if (!illuminationFitted) {
        return unexpected(std::make_error_code(std::errc::not_supported));
    }
    std::lock_guard<std::mutex> lock(mutex);
    if (illuminated != on) {
        ++switches;
        logInfo("[DummySensor] LED ", on ? "on" : "off", "\n");
    }
    illuminated = on;
    return {};
}

bool DummySensor::isIlluminated() const {
    std::lock_guard<std::mutex> lock(mutex);
    return illuminated;
}

void DummySensor::setDarkLevel(const spectral::ChannelVector& levels) {
    std::lock_guard<std::mutex> lock(mutex);
    if (levels.size() == channels) {
        dark = levels;
    }
}

void DummySensor::setLitLevel(const spectral::ChannelVector& levels) {
    std::lock_guard<std::mutex> lock(mutex);
    if (levels.size() == channels) {
        lit = levels;
    }
}

void DummySensor::setSampleFactor(double factor) {
    std::lock_guard<std::mutex> lock(mutex);
    sampleFactor = factor;
}

void DummySensor::failNextTriggers(int count) {
    std::lock_guard<std::mutex> lock(mutex);
    pendingFailures = count;
}

std::size_t DummySensor::triggerCount() const {
    std::lock_guard<std::mutex> lock(mutex);
    return triggers;
}

std::size_t DummySensor::illuminationSwitches() const {
    std::lock_guard<std::mutex> lock(mutex);
    return switches;
}

} // namespace wellscan::sensor::dummy
