#pragma once

#include "wellscan/calibration/CalibrationEngine.hpp"
#include "wellscan/spectral/ChannelBuffer.hpp"

#include <optional>

namespace wellscan::calibration {

/**
 * @brief Display pipeline for the live view: EMA over raw counts, then
 *        reduction with the engine's active mode.
 *
 * The smoothed state is always in counts, so switching modes never blends
 * one mode's units into another's.
 */
class LiveReadout {
public:
    explicit LiveReadout(const CalibrationEngine& engine, double alpha = 0.30);

    expected<DerivedVector> update(const ChannelVector& raw,
                                   const std::optional<WellId>& well = std::nullopt);

    void reset() { smoother.reset(); }

private:
    const CalibrationEngine& engine;
    spectral::EmaSmoother smoother;
};

} // namespace wellscan::calibration
