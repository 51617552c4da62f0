#pragma once

#include "wellscan/sensor/SensorDevice.hpp"
#include "wellscan/spectral/ChannelBuffer.hpp"

#include <cstddef>
#include <mutex>

namespace wellscan::sensor::dummy {

/**
 * @brief Deterministic stand-in for the spectral sensor.
 *
 * Each channel reads `dark[i] + (illuminated ? lit[i] * sampleFactor : 0)`.
 * Tests and the demo shape the signal with the setters and can make the next
 * N triggers fail to exercise per-well failure handling.
 */
class DummySensor : public SensorDevice {
public:
    explicit DummySensor(std::size_t channels = 13, bool withIllumination = true);

    std::size_t channelCount() const override { return channels; }

    expected<void> triggerMeasurement() override;
    expected<double> readChannel(std::size_t index) override;

    bool hasIllumination() const override { return illuminationFitted; }
    expected<void> setIllumination(bool on) override;
    bool isIlluminated() const override;

    void setDarkLevel(const spectral::ChannelVector& levels);
    void setLitLevel(const spectral::ChannelVector& levels);

    /// Scales the lit signal; 0.5 reads like a sample absorbing half the light.
    void setSampleFactor(double factor);

    /// The next @p count triggers report an I/O error.
    void failNextTriggers(int count);

    std::size_t triggerCount() const;
    std::size_t illuminationSwitches() const;

private:
    const std::size_t channels;
    const bool illuminationFitted;

    mutable std::mutex mutex;
    spectral::ChannelVector dark;
    spectral::ChannelVector lit;
    spectral::ChannelVector latched;
    double sampleFactor = 1.0;
    bool illuminated = false;
    int pendingFailures = 0;
    std::size_t triggers = 0;
    std::size_t switches = 0;
};

} // namespace wellscan::sensor::dummy
