#pragma once

#include "wellscan/core/Expected.hpp"
#include "wellscan/geometry/Geometry.hpp"

#include <nlohmann/json.hpp>

#include <string>

namespace wellscan::persist {

/// Parse @p path. I/O failures keep their OS error; syntax errors are Errc::InvalidPayload.
expected<nlohmann::json> readJsonFile(const std::string& path);

/// Write @p document indented by two spaces, with a trailing newline.
expected<void> writeJsonFile(const std::string& path, const nlohmann::ordered_json& document);

/// {"X": .., "Y": .., "Z": ..}
nlohmann::ordered_json pointToJson(const geometry::Point3& point);

/// Inverse of pointToJson(); throws nlohmann::json::exception on missing axes.
geometry::Point3 pointFromJson(const nlohmann::json& node);

} // namespace wellscan::persist
