#pragma once

#include "wellscan/calibration/CalibrationMode.hpp"
#include "wellscan/geometry/WellId.hpp"
#include "wellscan/spectral/ChannelBuffer.hpp"

#include <map>
#include <memory>
#include <string>
#include <vector>

namespace wellscan::calibration {

using spectral::ChannelVector;
using geometry::WellId;

/// Per-well blank (I0) and when it was captured.
struct BlankRecord {
    ChannelVector values;
    std::string timestamp;
};

using ReferencePtr = std::shared_ptr<const ChannelVector>;
using BlankPtr = std::shared_ptr<const BlankRecord>;
using BlankMap = std::map<WellId, BlankPtr>;

/**
 * @brief Immutable view of every reference at one instant.
 *
 * Copying a snapshot copies pointers only. The vectors behind them are never
 * modified after publication, so a display thread can keep using a snapshot
 * while the engine swaps in new references.
 */
struct CalibrationSnapshot {
    ReferencePtr dark;
    ReferencePtr white;
    BlankMap blanks;
    Mode mode = Mode::Raw;

    BlankPtr blankFor(const WellId& well) const {
        auto it = blanks.find(well);
        return it == blanks.end() ? nullptr : it->second;
    }
};

/// Which references exist, relative to a plate grid.
struct CalibrationStatus {
    std::vector<WellId> wellsWithBlank;
    std::vector<WellId> wellsMissingBlank;
    bool darkSet = false;
    bool whiteSet = false;
    Mode mode = Mode::Raw;
};

/**
 * @brief Output of a reduction.
 *
 * `percent` carries %R or %T alongside the primary values, and is empty in
 * Raw mode.
 */
struct DerivedVector {
    Mode mode = Mode::Raw;
    ChannelVector values;
    ChannelVector percent;
};

} // namespace wellscan::calibration
