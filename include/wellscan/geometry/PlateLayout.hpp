#pragma once

#include "wellscan/geometry/Geometry.hpp"

#include <optional>
#include <vector>

namespace wellscan::geometry {

/**
 * @brief Operator-editable plate definition: grid plus the four anchors.
 *
 * Front ends (console, forms) submit explicit commands here instead of
 * sharing corner variables. Derived positions are cached and dropped whenever
 * the grid or a corner changes, so a WellPosition always belongs to the
 * current inputs.
 */
class PlateLayout {
public:
    PlateLayout() = default;
    PlateLayout(const WellGrid& grid, const CornerSet& corners);

    expected<void> setGrid(const WellGrid& grid);
    const WellGrid& grid() const { return grid_; }

    void setCorner(Corner corner, const Point3& point);
    void clearCorner(Corner corner);
    const CornerSet& corners() const { return corners_; }

    bool cornersComplete() const { return corners_.complete(); }

    /// Human names of the corners still missing ("Top Left", ...).
    std::vector<std::string> missingCorners() const;

    /// All positions; Errc::IncompleteCorners until every corner is set.
    expected<WellPositions> positions() const;

    expected<Point3> position(const WellId& well) const;

    std::vector<WellId> visitOrder() const { return generateVisitOrder(grid_); }

private:
    WellGrid grid_{};
    CornerSet corners_{};
    mutable std::optional<WellPositions> cache_{};
};

} // namespace wellscan::geometry
