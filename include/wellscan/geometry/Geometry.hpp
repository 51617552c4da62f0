// Geometry.hpp
// -----------------------------------------------------------------------------
// Well coordinates from four corner anchors, and the serpentine visit order.
// Everything here is a pure function of its arguments.

#pragma once

#include "wellscan/core/Expected.hpp"
#include "wellscan/geometry/WellId.hpp"

#include <array>
#include <cstdint>
#include <map>
#include <string>
#include <string_view>
#include <vector>

namespace wellscan::geometry {

/// Stage coordinate in millimetres.
struct Point3 {
    double x = 0.0;
    double y = 0.0;
    double z = 0.0;
};

inline bool operator==(const Point3& a, const Point3& b) {
    return a.x == b.x && a.y == b.y && a.z == b.z;
}
inline bool operator!=(const Point3& a, const Point3& b) { return !(a == b); }

enum class Corner : std::uint8_t {
    TopLeft = 0,
    BottomLeft = 1,
    TopRight = 2,
    BottomRight = 3
};

constexpr std::array<Corner, 4> kAllCorners{
    Corner::TopLeft, Corner::BottomLeft, Corner::TopRight, Corner::BottomRight};

/// "Top Left" etc., for operator-facing messages.
const char* cornerName(Corner corner);
/// "top_left" etc., the key used in configuration files.
const char* cornerKey(Corner corner);

/**
 * @brief The four plate anchors, each with an explicit "set" flag.
 *
 * A corner at (0,0,0) is a legitimate stage position, so "unset" is tracked
 * separately instead of being inferred from default coordinates.
 */
class CornerSet {
public:
    void set(Corner corner, const Point3& point);
    void clear(Corner corner);

    bool isSet(Corner corner) const { return flags[index(corner)]; }
    bool complete() const;
    std::vector<Corner> missing() const;

    /// Coordinates of @p corner; (0,0,0) if it was never set.
    const Point3& at(Corner corner) const { return points[index(corner)]; }

private:
    static std::size_t index(Corner corner) { return static_cast<std::size_t>(corner); }

    std::array<Point3, 4> points{};
    std::array<bool, 4> flags{};
};

using WellPositions = std::map<WellId, Point3>;

/// Decimal places kept on every derived axis (stage controllers truncate beyond this).
constexpr int kPositionDecimals = 2;

double roundTo(double value, int decimals);

/**
 * @brief Position of one well by two-stage bilinear interpolation.
 *
 * u = col/(cols-1) and v = row/(rows-1) (0 for a single column/row). The top
 * edge (top_left -> top_right) and the bottom edge (bottom_left ->
 * bottom_right) are each interpolated at u, then the result is interpolated
 * between the two edge points at v. Each edge uses its own pair of corners, so
 * a tilted or slightly skewed plate is followed rather than squared off.
 * Every axis is rounded to kPositionDecimals.
 *
 * @return Errc::IncompleteCorners, Errc::InvalidGrid or Errc::InvalidWell on
 *         bad input.
 */
expected<Point3> calculateWellPosition(const CornerSet& corners,
                                       const WellGrid& grid,
                                       const WellId& well);

expected<Point3> calculateWellPosition(const CornerSet& corners,
                                       const WellGrid& grid,
                                       std::string_view well);

/// Every well of the grid.
expected<WellPositions> calculateWellPositions(const CornerSet& corners,
                                               const WellGrid& grid);

/// Row-major order A1..A<cols>, B1.. (the order wells are listed in files).
std::vector<WellId> allWells(const WellGrid& grid);

/**
 * @brief Boustrophedon traversal: even rows left-to-right, odd rows
 *        right-to-left. Empty for an invalid grid.
 */
std::vector<WellId> generateVisitOrder(const WellGrid& grid);

/// True when moving from @p previous to @p next crosses to another row.
inline bool isRowChange(const WellId& previous, const WellId& next) {
    return previous.row != next.row;
}

/// "X=1.00, Y=2.00, Z=3.00"
std::string formatPoint(const Point3& point);

} // namespace wellscan::geometry
