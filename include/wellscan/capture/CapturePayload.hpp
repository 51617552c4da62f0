#pragma once

#include "wellscan/calibration/CalibrationState.hpp"
#include "wellscan/geometry/Geometry.hpp"

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace wellscan::capture {

enum class RunStatus : std::uint8_t {
    Idle = 0,
    Running,
    Completed,
    Cancelled,
    Failed
};

const char* toString(RunStatus status);
std::optional<RunStatus> parseRunStatus(const std::string& text);

/// Blank per grid well; std::nullopt for wells never captured (or failed).
using BlankTable = std::map<geometry::WellId, std::optional<calibration::BlankRecord>>;

/**
 * @brief Everything a capture run produced, in the shape that is persisted.
 */
struct CapturePayload {
    std::string timestamp;
    std::string notes;
    std::vector<std::string> labels;
    double eps = 1.0;

    geometry::WellGrid grid{};
    geometry::CornerSet corners{};
    geometry::WellPositions positions;

    BlankTable blanks;
    std::optional<spectral::ChannelVector> dark;

    RunStatus status = RunStatus::Idle;
    std::vector<geometry::WellId> failedWells;
    /// Wells attempted, in visit order (captured or failed).
    std::vector<geometry::WellId> visitedWells;

    std::size_t capturedCount() const;
};

} // namespace wellscan::capture
