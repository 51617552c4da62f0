#pragma once

#include "wellscan/core/Expected.hpp"

#include <cstddef>

namespace wellscan::sensor {

/**
 * @brief Fixed capability contract of the spectral sensor collaborator.
 *
 * Register-level configuration (gain, integration time) belongs to the
 * concrete driver and is not part of this interface. A measurement is one
 * triggerMeasurement() followed by readChannel(0..channelCount()-1).
 *
 * Implementations report hardware trouble through the returned error code;
 * callers translate it to Errc::SensorFailure.
 */
class SensorDevice {
public:
    virtual ~SensorDevice() = default;

    virtual std::size_t channelCount() const = 0;

    virtual expected<void> triggerMeasurement() = 0;
    virtual expected<double> readChannel(std::size_t index) = 0;

    /// True when the sensor carries a controllable light source.
    virtual bool hasIllumination() const = 0;
    virtual expected<void> setIllumination(bool on) = 0;
    virtual bool isIlluminated() const = 0;
};

} // namespace wellscan::sensor
