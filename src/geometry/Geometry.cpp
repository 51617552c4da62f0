#include "wellscan/geometry/Geometry.hpp"
#include "wellscan/core/Error.hpp"

#include <cmath>
#include <iomanip>
#include <sstream>

namespace wellscan::geometry {

namespace {

// (1-t)*a + t*b lands exactly on a at t=0 and on b at t=1, so edge wells
// reproduce the corner coordinates bit-for-bit.
double lerp(double a, double b, double t) {
    return (1.0 - t) * a + t * b;
}

Point3 lerp(const Point3& a, const Point3& b, double t) {
    return {lerp(a.x, b.x, t), lerp(a.y, b.y, t), lerp(a.z, b.z, t)};
}

double normalized(int index, int count) {
    return count > 1 ? static_cast<double>(index) / static_cast<double>(count - 1) : 0.0;
}

} // namespace

const char* cornerName(Corner corner) {
    switch (corner) {
        case Corner::TopLeft:     return "Top Left";
        case Corner::BottomLeft:  return "Bottom Left";
        case Corner::TopRight:    return "Top Right";
        case Corner::BottomRight: return "Bottom Right";
    }
    return "unknown";
}

const char* cornerKey(Corner corner) {
    switch (corner) {
        case Corner::TopLeft:     return "top_left";
        case Corner::BottomLeft:  return "bottom_left";
        case Corner::TopRight:    return "top_right";
        case Corner::BottomRight: return "bottom_right";
    }
    return "unknown";
}

void CornerSet::set(Corner corner, const Point3& point) {
    points[index(corner)] = point;
    flags[index(corner)] = true;
}

void CornerSet::clear(Corner corner) {
    points[index(corner)] = Point3{};
    flags[index(corner)] = false;
}

bool CornerSet::complete() const {
    for (bool flag : flags) {
        if (!flag) return false;
    }
    return true;
}

std::vector<Corner> CornerSet::missing() const {
    std::vector<Corner> result;
    for (Corner corner : kAllCorners) {
        if (!isSet(corner)) {
            result.push_back(corner);
        }
    }
    return result;
}

double roundTo(double value, int decimals) {
    const double scale = std::pow(10.0, decimals);
    return std::round(value * scale) / scale;
}

expected<Point3> calculateWellPosition(const CornerSet& corners,
                                       const WellGrid& grid,
                                       const WellId& well) {
    if (!corners.complete()) {
        return unexpected(make_error_code(Errc::IncompleteCorners));
    }
    if (!grid.valid()) {
        return unexpected(make_error_code(Errc::InvalidGrid));
    }
    if (!well.within(grid)) {
        return unexpected(make_error_code(Errc::InvalidWell));
    }

    const double u = normalized(well.col, grid.cols);
    const double v = normalized(well.row, grid.rows);

    const Point3 top = lerp(corners.at(Corner::TopLeft), corners.at(Corner::TopRight), u);
    const Point3 bottom = lerp(corners.at(Corner::BottomLeft), corners.at(Corner::BottomRight), u);
    const Point3 p = lerp(top, bottom, v);

    return Point3{roundTo(p.x, kPositionDecimals),
                  roundTo(p.y, kPositionDecimals),
                  roundTo(p.z, kPositionDecimals)};
}

expected<Point3> calculateWellPosition(const CornerSet& corners,
                                       const WellGrid& grid,
                                       std::string_view well) {
    auto id = WellId::parse(well);
    if (!id) {
        return unexpected(id.error());
    }
    return calculateWellPosition(corners, grid, *id);
}

expected<WellPositions> calculateWellPositions(const CornerSet& corners,
                                               const WellGrid& grid) {
    if (!grid.valid()) {
        return unexpected(make_error_code(Errc::InvalidGrid));
    }

    WellPositions positions;
    for (const auto& well : allWells(grid)) {
        auto position = calculateWellPosition(corners, grid, well);
        if (!position) {
            return unexpected(position.error());
        }
        positions.emplace(well, *position);
    }
    return positions;
}

std::vector<WellId> allWells(const WellGrid& grid) {
    std::vector<WellId> wells;
    wells.reserve(grid.wellCount());
    if (!grid.valid()) {
        return wells;
    }
    for (int r = 0; r < grid.rows; ++r) {
        for (int c = 0; c < grid.cols; ++c) {
            wells.push_back(WellId{r, c});
        }
    }
    return wells;
}

std::vector<WellId> generateVisitOrder(const WellGrid& grid) {
    std::vector<WellId> order;
    order.reserve(grid.wellCount());
    if (!grid.valid()) {
        return order;
    }
    for (int r = 0; r < grid.rows; ++r) {
        if (r % 2 == 0) {
            for (int c = 0; c < grid.cols; ++c) {
                order.push_back(WellId{r, c});
            }
        } else {
            for (int c = grid.cols - 1; c >= 0; --c) {
                order.push_back(WellId{r, c});
            }
        }
    }
    return order;
}

std::string formatPoint(const Point3& point) {
    std::ostringstream os;
    os << std::fixed << std::setprecision(kPositionDecimals)
       << "X=" << point.x << ", Y=" << point.y << ", Z=" << point.z;
    return os.str();
}

} // namespace wellscan::geometry
