#include "wellscan/persist/PayloadFile.hpp"

#include "wellscan/core/Error.hpp"
#include "wellscan/log/Log.hpp"
#include "wellscan/persist/JsonFile.hpp"

namespace wellscan::persist {

using nlohmann::json;
using nlohmann::ordered_json;
using geometry::WellId;

namespace {

ordered_json vectorToJson(const spectral::ChannelVector& values) {
    return ordered_json(values);
}

// Numeric array of the expected width (0 = any width).
expected<spectral::ChannelVector> vectorFromJson(const json& node, std::size_t width, const char* what) {
    if (!node.is_array()) {
        logError("[PayloadFile] '", what, "' is not an array\n");
        return unexpected(make_error_code(Errc::InvalidPayload));
    }
    spectral::ChannelVector out;
    out.reserve(node.size());
    for (const auto& value : node) {
        if (!value.is_number()) {
            logError("[PayloadFile] '", what, "' holds a non-numeric value\n");
            return unexpected(make_error_code(Errc::InvalidPayload));
        }
        out.push_back(value.get<double>());
    }
    if (width != 0 && out.size() != width) {
        logError("[PayloadFile] '", what, "' has ", out.size(), " channels, expected ", width, "\n");
        return unexpected(make_error_code(Errc::InvalidPayload));
    }
    return out;
}

} // namespace

ordered_json payloadToJson(const capture::CapturePayload& payload) {
    ordered_json document;
    document["timestamp"] = payload.timestamp;
    document["notes"] = payload.notes;
    document["labels"] = payload.labels;
    document["eps"] = payload.eps;

    ordered_json blanks = ordered_json::object();
    for (const auto& [well, record] : payload.blanks) {
        if (record) {
            blanks[well.toString()] = ordered_json{
                {"I0", vectorToJson(record->values)},
                {"timestamp", record->timestamp}};
        } else {
            blanks[well.toString()] = nullptr;
        }
    }
    document["blanks"] = std::move(blanks);
    document["dark"] = payload.dark ? vectorToJson(*payload.dark) : ordered_json(nullptr);

    if (!payload.positions.empty()) {
        ordered_json positions = ordered_json::object();
        for (const auto& [well, point] : payload.positions) {
            positions[well.toString()] = pointToJson(point);
        }
        document["well_config"] = ordered_json{
            {"num_rows", payload.grid.rows},
            {"num_cols", payload.grid.cols},
            {"well_positions", std::move(positions)}};
    }

    document["status"] = capture::toString(payload.status);
    ordered_json failed = ordered_json::array();
    for (const auto& well : payload.failedWells) {
        failed.push_back(well.toString());
    }
    document["failed_wells"] = std::move(failed);
    return document;
}

expected<capture::CapturePayload> payloadFromJson(const json& document,
                                                  const geometry::WellGrid& grid) {
    if (!document.is_object()) {
        logError("[PayloadFile] payload is not a JSON object\n");
        return unexpected(make_error_code(Errc::InvalidPayload));
    }

    capture::CapturePayload payload;
    payload.grid = grid;
    for (const auto& well : geometry::allWells(grid)) {
        payload.blanks[well] = std::nullopt;
    }

    try {
        payload.timestamp = document.value("timestamp", std::string{});
        payload.notes = document.value("notes", std::string{});
        payload.eps = document.value("eps", 1.0);
        if (auto it = document.find("labels"); it != document.end()) {
            payload.labels = it->get<std::vector<std::string>>();
        }
        const std::size_t width = payload.labels.size();

        if (auto it = document.find("blanks"); it != document.end() && !it->is_null()) {
            if (!it->is_object()) {
                logError("[PayloadFile] 'blanks' is not an object\n");
                return unexpected(make_error_code(Errc::InvalidPayload));
            }
            for (const auto& [key, entry] : it->items()) {
                auto well = WellId::parse(key, grid);
                if (!well) {
                    logInfo("[PayloadFile] dropping blank for ", key, " (not on this plate)\n");
                    continue;
                }
                if (entry.is_null()) {
                    continue;
                }
                auto values = vectorFromJson(entry.at("I0"), width, "I0");
                if (!values) {
                    return unexpected(values.error());
                }
                payload.blanks[*well] = calibration::BlankRecord{
                    std::move(*values), entry.value("timestamp", std::string{})};
            }
        }

        if (auto it = document.find("dark"); it != document.end() && !it->is_null()) {
            auto dark = vectorFromJson(*it, width, "dark");
            if (!dark) {
                return unexpected(dark.error());
            }
            payload.dark = std::move(*dark);
        }

        if (auto it = document.find("well_config"); it != document.end() && it->is_object()) {
            if (auto positions = it->find("well_positions"); positions != it->end()) {
                for (const auto& [key, point] : positions->items()) {
                    if (auto well = WellId::parse(key, grid)) {
                        payload.positions[*well] = pointFromJson(point);
                    }
                }
            }
        }

        if (auto status = capture::parseRunStatus(document.value("status", std::string{}))) {
            payload.status = *status;
        }
        if (auto it = document.find("failed_wells"); it != document.end() && it->is_array()) {
            for (const auto& key : *it) {
                if (auto well = WellId::parse(key.get<std::string>(), grid)) {
                    payload.failedWells.push_back(*well);
                }
            }
        }
    } catch (const json::exception& e) {
        logError("[PayloadFile] malformed payload: ", e.what(), "\n");
        return unexpected(make_error_code(Errc::InvalidPayload));
    }

    return payload;
}

expected<void> savePayload(const std::string& path, const capture::CapturePayload& payload) {
    auto written = writeJsonFile(path, payloadToJson(payload));
    if (written) {
        logInfo("[PayloadFile] saved ", payload.capturedCount(), " blank(s) to ", path, "\n");
    }
    return written;
}

expected<capture::CapturePayload> loadPayload(const std::string& path,
                                              const geometry::WellGrid& grid) {
    auto document = readJsonFile(path);
    if (!document) {
        return unexpected(document.error());
    }
    auto payload = payloadFromJson(*document, grid);
    if (payload) {
        logInfo("[PayloadFile] loaded ", payload->capturedCount(), " blank(s) from ", path, "\n");
    }
    return payload;
}

void applyToEngine(const capture::CapturePayload& payload, calibration::CalibrationEngine& engine) {
    engine.setDark(payload.dark);
    for (const auto& [well, record] : payload.blanks) {
        if (record) {
            engine.setBlank(well, *record);
        } else {
            engine.clearBlank(well);
        }
    }
}

} // namespace wellscan::persist
