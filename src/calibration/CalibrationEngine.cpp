#include "wellscan/calibration/CalibrationEngine.hpp"

#include "wellscan/core/Error.hpp"
#include "wellscan/core/Timestamp.hpp"
#include "wellscan/geometry/Geometry.hpp"
#include "wellscan/log/Log.hpp"
#include "wellscan/sensor/SpectralReader.hpp"

#include <algorithm>
#include <cmath>
#include <thread>
#include <utility>

namespace wellscan::calibration {

namespace {

expected<void> switchIllumination(sensor::SensorDevice& device, bool on) {
    if (auto switched = device.setIllumination(on); !switched) {
        logError("[CalibrationEngine] could not switch illumination ", on ? "on" : "off",
                 ": ", switched.error().message(), "\n");
        return unexpected(make_error_code(Errc::SensorFailure));
    }
    return {};
}

double clip(double value, double low, double high) {
    return std::min(std::max(value, low), high);
}

DerivedVector zerosFor(Mode mode, std::size_t width) {
    return DerivedVector{mode, spectral::zeros(width), spectral::zeros(width)};
}

// max(raw - dark, eps) for both sample and reference, dark defaulting to zero.
expected<std::pair<ChannelVector, ChannelVector>>
flooredPair(const ChannelVector& sample,
            const ChannelVector& reference,
            const ChannelVector& dark,
            double eps) {
    auto s = spectral::subtractFloor(sample, dark, eps);
    if (!s) {
        return unexpected(s.error());
    }
    auto r = spectral::subtractFloor(reference, dark, eps);
    if (!r) {
        return unexpected(r.error());
    }
    return std::make_pair(std::move(*s), std::move(*r));
}

} // namespace

CalibrationEngine::CalibrationEngine(CalibrationSettings settings)
: config(settings) {}

expected<void> CalibrationEngine::captureDark(sensor::SensorDevice& device) {
    if (device.hasIllumination()) {
        if (auto off = switchIllumination(device, false); !off) {
            return off;
        }
    }
    std::this_thread::sleep_for(config.darkSettle);

    // Frames integrated while the LED was still decaying are thrown away.
    for (int i = 0; i < config.darkFlushFrames; ++i) {
        if (auto flushed = sensor::readFrame(device); !flushed) {
            return unexpected(flushed.error());
        }
        std::this_thread::sleep_for(config.flushGap);
    }

    auto frame = sensor::readAveraged(device, config.averages);
    if (!frame) {
        logError("[CalibrationEngine] dark capture failed: ", frame.error().message(), "\n");
        return unexpected(frame.error());
    }
    setDark(std::move(*frame));
    logInfo("[CalibrationEngine] dark stored (", config.averages, " frames)\n");
    return {};
}

expected<ChannelVector> CalibrationEngine::captureLit(sensor::SensorDevice& device, const char* what) {
    if (device.hasIllumination() && !device.isIlluminated()) {
        if (auto on = switchIllumination(device, true); !on) {
            return unexpected(on.error());
        }
        std::this_thread::sleep_for(config.lightSettle);
    }
    auto frame = sensor::readAveraged(device, config.averages);
    if (!frame) {
        logError("[CalibrationEngine] ", what, " capture failed: ", frame.error().message(), "\n");
    }
    return frame;
}

expected<void> CalibrationEngine::captureWhite(sensor::SensorDevice& device) {
    auto frame = captureLit(device, "white");
    if (!frame) {
        return unexpected(frame.error());
    }
    setWhite(std::move(*frame));
    logInfo("[CalibrationEngine] white stored\n");
    return {};
}

expected<BlankRecord> CalibrationEngine::captureBlank(const WellId& well, sensor::SensorDevice& device) {
    auto frame = captureLit(device, "blank");
    if (!frame) {
        return unexpected(frame.error());
    }
    BlankRecord record{std::move(*frame), isoTimestamp()};
    setBlank(well, record);
    logInfo("[CalibrationEngine] blank stored for ", well.toString(), " @ ", record.timestamp, "\n");
    return record;
}

void CalibrationEngine::setDark(std::optional<ChannelVector> value) {
    ReferencePtr next = value ? std::make_shared<const ChannelVector>(std::move(*value)) : nullptr;
    std::lock_guard<std::mutex> lock(mutex);
    dark = std::move(next);
}

void CalibrationEngine::setWhite(std::optional<ChannelVector> value) {
    ReferencePtr next = value ? std::make_shared<const ChannelVector>(std::move(*value)) : nullptr;
    std::lock_guard<std::mutex> lock(mutex);
    white = std::move(next);
}

void CalibrationEngine::setBlank(const WellId& well, BlankRecord blank) {
    auto next = std::make_shared<const BlankRecord>(std::move(blank));
    std::lock_guard<std::mutex> lock(mutex);
    blanks[well] = std::move(next);
}

void CalibrationEngine::clearBlank(const WellId& well) {
    std::lock_guard<std::mutex> lock(mutex);
    blanks.erase(well);
}

void CalibrationEngine::clearAll() {
    std::lock_guard<std::mutex> lock(mutex);
    dark.reset();
    white.reset();
    blanks.clear();
}

expected<DerivedVector> CalibrationEngine::reduce(const ChannelVector& raw,
                                                  Mode mode,
                                                  const std::optional<WellId>& well) const {
    return reduce(snapshot(), config, raw, mode, well);
}

expected<DerivedVector> CalibrationEngine::reduce(const ChannelVector& raw,
                                                  const std::optional<WellId>& well) const {
    auto references = snapshot();
    return reduce(references, config, raw, references.mode, well);
}

expected<DerivedVector> CalibrationEngine::reduce(const CalibrationSnapshot& references,
                                                  const CalibrationSettings& settings,
                                                  const ChannelVector& raw,
                                                  Mode mode,
                                                  const std::optional<WellId>& well) {
    const std::size_t width = raw.size();
    if (mode == Mode::Raw) {
        return DerivedVector{mode, raw, {}};
    }

    const ChannelVector darkValues = references.dark ? *references.dark : spectral::zeros(width);
    if (darkValues.size() != width) {
        return unexpected(make_error_code(Errc::ChannelLengthMismatch));
    }

    if (mode == Mode::Reflectance || mode == Mode::Absorbance) {
        if (!references.white) {
            return zerosFor(mode, width);
        }
        auto pair = flooredPair(raw, *references.white, darkValues, settings.eps);
        if (!pair) {
            return unexpected(pair.error());
        }
        const auto& [sample, whiteLevel] = *pair;

        DerivedVector out{mode, ChannelVector(width), ChannelVector(width)};
        for (std::size_t i = 0; i < width; ++i) {
            const double r = std::max(sample[i] / whiteLevel[i], settings.ratioFloor);
            out.values[i] = mode == Mode::Reflectance ? r : -std::log10(r);
            out.percent[i] = std::min(100.0 * r, settings.percentCeiling);
        }
        return out;
    }

    // Transmittance and AbsTx need the selected well's blank.
    BlankPtr blank = well ? references.blankFor(*well) : nullptr;
    if (!blank) {
        return zerosFor(mode, width);
    }
    auto pair = flooredPair(raw, blank->values, darkValues, settings.eps);
    if (!pair) {
        return unexpected(pair.error());
    }
    const auto& [intensity, incident] = *pair;

    DerivedVector out{mode, ChannelVector(width), ChannelVector(width)};
    for (std::size_t i = 0; i < width; ++i) {
        if (mode == Mode::Transmittance) {
            const double t = intensity[i] / incident[i];
            out.values[i] = t;
            out.percent[i] = clip(100.0 * t, settings.percentFloor, settings.percentCeiling);
        } else {
            const double a = std::log10(incident[i] / intensity[i]);
            out.values[i] = a;
            out.percent[i] = clip(100.0 * std::pow(10.0, -a),
                                  settings.percentFloor, settings.percentCeiling);
        }
    }
    return out;
}

Mode CalibrationEngine::mode() const {
    std::lock_guard<std::mutex> lock(mutex);
    return activeMode;
}

Mode CalibrationEngine::cycleMode() {
    std::lock_guard<std::mutex> lock(mutex);
    activeMode = nextMode(activeMode);
    return activeMode;
}

void CalibrationEngine::setMode(Mode mode) {
    std::lock_guard<std::mutex> lock(mutex);
    activeMode = mode;
}

CalibrationStatus CalibrationEngine::status(const geometry::WellGrid& grid) const {
    auto references = snapshot();
    CalibrationStatus out;
    out.darkSet = references.dark != nullptr;
    out.whiteSet = references.white != nullptr;
    out.mode = references.mode;
    for (const auto& well : geometry::allWells(grid)) {
        if (references.blankFor(well)) {
            out.wellsWithBlank.push_back(well);
        } else {
            out.wellsMissingBlank.push_back(well);
        }
    }
    return out;
}

CalibrationSnapshot CalibrationEngine::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex);
    return CalibrationSnapshot{dark, white, blanks, activeMode};
}

} // namespace wellscan::calibration
