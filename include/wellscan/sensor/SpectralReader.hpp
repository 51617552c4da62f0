#pragma once

#include "wellscan/sensor/SensorDevice.hpp"
#include "wellscan/spectral/ChannelBuffer.hpp"

#include <chrono>

namespace wellscan::sensor {

using spectral::ChannelVector;

/// One triggered measurement across every channel.
expected<ChannelVector> readFrame(SensorDevice& device);

/**
 * @brief Mean of @p averages frames, sleeping @p gap between them.
 *
 * The first failing frame aborts the read with Errc::SensorFailure; the
 * driver's own error is logged. @p averages below 1 reads a single frame.
 */
expected<ChannelVector> readAveraged(SensorDevice& device,
                                     int averages,
                                     std::chrono::milliseconds gap = std::chrono::milliseconds{0});

} // namespace wellscan::sensor
