#pragma once

#include "wellscan/calibration/CalibrationState.hpp"
#include "wellscan/geometry/WellId.hpp"
#include "wellscan/sensor/SensorDevice.hpp"

#include <chrono>
#include <mutex>
#include <optional>

namespace wellscan::calibration {

struct CalibrationSettings {
    /// Count floor applied after dark subtraction (numerator and denominator).
    double eps = 1.0;
    /// Floor on reflectance ratios before division results and log10.
    double ratioFloor = 1e-9;
    /// Lower clip for %T.
    double percentFloor = 1e-6;
    /// Upper clip for %R / %T; keeps runaway ratios printable.
    double percentCeiling = 1e6;
    /// Frames averaged per stored reference.
    int averages = 3;

    std::chrono::milliseconds darkSettle{800};
    int darkFlushFrames = 2;
    std::chrono::milliseconds flushGap{10};
    std::chrono::milliseconds lightSettle{150};
};

/**
 * @brief Owns the dark / white / per-well blank references and reduces raw
 *        frames into reflectance, absorbance and transmittance.
 *
 * References change only through explicit capture, set and clear calls.
 * Each is replaced as a whole new vector under the mutex, so readers holding
 * a snapshot() never see a half-written reference. reduce() works on a
 * snapshot and is safe to call from any thread.
 *
 * A reference that has not been captured is not an error: reductions that
 * need it return zero vectors. Width mismatches between a raw frame and a
 * reference are Errc::ChannelLengthMismatch.
 */
class CalibrationEngine {
public:
    explicit CalibrationEngine(CalibrationSettings settings = {});

    /// LED off, settle, flush stale frames, then store the averaged dark frame.
    expected<void> captureDark(sensor::SensorDevice& device);

    /// LED on (settling only if it was off), store the averaged white frame.
    expected<void> captureWhite(sensor::SensorDevice& device);

    /// LED on as for white, store {I0, now} for @p well and return it.
    expected<BlankRecord> captureBlank(const WellId& well, sensor::SensorDevice& device);

    void setDark(std::optional<ChannelVector> dark);
    void setWhite(std::optional<ChannelVector> white);
    void setBlank(const WellId& well, BlankRecord blank);
    void clearBlank(const WellId& well);
    void clearAll();

    /// Reduce with an explicit mode; @p well selects the blank (if any).
    expected<DerivedVector> reduce(const ChannelVector& raw,
                                   Mode mode,
                                   const std::optional<WellId>& well = std::nullopt) const;

    /// Reduce with the active mode.
    expected<DerivedVector> reduce(const ChannelVector& raw,
                                   const std::optional<WellId>& well = std::nullopt) const;

    /// Pure reduction over an explicit snapshot.
    static expected<DerivedVector> reduce(const CalibrationSnapshot& references,
                                          const CalibrationSettings& settings,
                                          const ChannelVector& raw,
                                          Mode mode,
                                          const std::optional<WellId>& well);

    Mode mode() const;
    Mode cycleMode();
    void setMode(Mode mode);

    CalibrationStatus status(const geometry::WellGrid& grid) const;
    CalibrationSnapshot snapshot() const;

    const CalibrationSettings& settings() const { return config; }

private:
    expected<ChannelVector> captureLit(sensor::SensorDevice& device, const char* what);

    const CalibrationSettings config;

    mutable std::mutex mutex;
    ReferencePtr dark;
    ReferencePtr white;
    BlankMap blanks;
    Mode activeMode = Mode::Raw;
};

} // namespace wellscan::calibration
