#pragma once

#include "wellscan/core/Expected.hpp"
#include "wellscan/geometry/PlateLayout.hpp"

#include <string>

namespace wellscan::persist {

/**
 * @brief Plate configuration file:
 *        {num_rows, num_cols, top_left, bottom_left, top_right, bottom_right}
 *        with each corner as {X, Y, Z}.
 *
 * Saving also records `timestamp`, and, once all corners are set, the derived
 * `well_positions` and the `snake_path` visit order for reference. Loading
 * reads only the grid and corners; corners absent from the file stay unset.
 */
expected<geometry::PlateLayout> loadPlateConfig(const std::string& path);

expected<void> savePlateConfig(const std::string& path, const geometry::PlateLayout& layout);

} // namespace wellscan::persist
