#include "wellscan/geometry/PlateLayout.hpp"
#include "wellscan/core/Error.hpp"

namespace wellscan::geometry {

PlateLayout::PlateLayout(const WellGrid& grid, const CornerSet& corners)
: grid_(grid)
, corners_(corners) {}

expected<void> PlateLayout::setGrid(const WellGrid& grid) {
    if (!grid.valid()) {
        return unexpected(make_error_code(Errc::InvalidGrid));
    }
    if (grid != grid_) {
        grid_ = grid;
        cache_.reset();
    }
    return {};
}

void PlateLayout::setCorner(Corner corner, const Point3& point) {
    corners_.set(corner, point);
    cache_.reset();
}

void PlateLayout::clearCorner(Corner corner) {
    corners_.clear(corner);
    cache_.reset();
}

std::vector<std::string> PlateLayout::missingCorners() const {
    std::vector<std::string> names;
    for (Corner corner : corners_.missing()) {
        names.emplace_back(cornerName(corner));
    }
    return names;
}

expected<WellPositions> PlateLayout::positions() const {
    if (cache_) {
        return *cache_;
    }
    auto computed = calculateWellPositions(corners_, grid_);
    if (!computed) {
        return computed;
    }
    cache_ = *computed;
    return computed;
}

expected<Point3> PlateLayout::position(const WellId& well) const {
    if (!well.within(grid_)) {
        return unexpected(make_error_code(Errc::InvalidWell));
    }
    auto all = positions();
    if (!all) {
        return unexpected(all.error());
    }
    return all->at(well);
}

} // namespace wellscan::geometry
