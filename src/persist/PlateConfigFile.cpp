#include "wellscan/persist/PlateConfigFile.hpp"

#include "wellscan/core/Error.hpp"
#include "wellscan/core/Timestamp.hpp"
#include "wellscan/log/Log.hpp"
#include "wellscan/persist/JsonFile.hpp"

namespace wellscan::persist {

using nlohmann::json;
using nlohmann::ordered_json;
using geometry::Corner;

expected<geometry::PlateLayout> loadPlateConfig(const std::string& path) {
    auto document = readJsonFile(path);
    if (!document) {
        return unexpected(document.error());
    }

    geometry::PlateLayout layout;
    try {
        const geometry::WellGrid grid{document->at("num_rows").get<int>(),
                                      document->at("num_cols").get<int>()};
        if (auto applied = layout.setGrid(grid); !applied) {
            logError("[PlateConfigFile] ", path, ": invalid grid ", grid.rows, "x", grid.cols, "\n");
            return unexpected(applied.error());
        }
        for (Corner corner : geometry::kAllCorners) {
            if (auto it = document->find(geometry::cornerKey(corner));
                it != document->end() && !it->is_null()) {
                layout.setCorner(corner, pointFromJson(*it));
            }
        }
    } catch (const json::exception& e) {
        logError("[PlateConfigFile] ", path, ": ", e.what(), "\n");
        return unexpected(make_error_code(Errc::InvalidPayload));
    }

    if (!layout.cornersComplete()) {
        std::string names;
        for (const auto& name : layout.missingCorners()) {
            names += names.empty() ? name : ", " + name;
        }
        logInfo("[PlateConfigFile] ", path, " leaves corners unset: ", names, "\n");
    }
    logInfo("[PlateConfigFile] loaded ", layout.grid().rows, "x", layout.grid().cols,
            " plate from ", path, "\n");
    return layout;
}

expected<void> savePlateConfig(const std::string& path, const geometry::PlateLayout& layout) {
    ordered_json document;
    document["num_rows"] = layout.grid().rows;
    document["num_cols"] = layout.grid().cols;
    for (Corner corner : geometry::kAllCorners) {
        if (layout.corners().isSet(corner)) {
            document[geometry::cornerKey(corner)] = pointToJson(layout.corners().at(corner));
        } else {
            document[geometry::cornerKey(corner)] = nullptr;
        }
    }
    document["timestamp"] = isoTimestamp();

    if (auto positions = layout.positions()) {
        ordered_json wells = ordered_json::object();
        for (const auto& [well, point] : *positions) {
            wells[well.toString()] = pointToJson(point);
        }
        document["well_positions"] = std::move(wells);

        ordered_json snake = ordered_json::array();
        for (const auto& well : layout.visitOrder()) {
            snake.push_back(well.toString());
        }
        document["snake_path"] = std::move(snake);
    }

    auto written = writeJsonFile(path, document);
    if (written) {
        logInfo("[PlateConfigFile] saved plate configuration to ", path, "\n");
    }
    return written;
}

} // namespace wellscan::persist
