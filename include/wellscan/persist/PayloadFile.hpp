#pragma once

#include "wellscan/calibration/CalibrationEngine.hpp"
#include "wellscan/capture/CapturePayload.hpp"
#include "wellscan/core/Expected.hpp"

#include <nlohmann/json.hpp>

#include <string>

namespace wellscan::persist {

/**
 * @brief JSON form of a capture payload.
 *
 * {timestamp, notes, labels[N], eps,
 *  blanks: {well: {I0[N], timestamp} | null}, dark: [N] | null,
 *  well_config: {num_rows, num_cols, well_positions: {well: {X, Y, Z}}},
 *  status, failed_wells}
 *
 * Keys are written in that order. well_config is omitted when the payload
 * carries no positions.
 */
nlohmann::ordered_json payloadToJson(const capture::CapturePayload& payload);

/**
 * @brief Parse a payload and reconcile it with the plate currently in use.
 *
 * Wells outside @p grid are dropped, grid wells absent from the file stay
 * unset. Vectors whose width differs from the label list make the payload
 * invalid (Errc::InvalidPayload), as do structural type errors.
 */
expected<capture::CapturePayload> payloadFromJson(const nlohmann::json& document,
                                                  const geometry::WellGrid& grid);

expected<void> savePayload(const std::string& path, const capture::CapturePayload& payload);

expected<capture::CapturePayload> loadPayload(const std::string& path,
                                              const geometry::WellGrid& grid);

/// Replace the engine's dark and blanks with the payload's (the resume path).
void applyToEngine(const capture::CapturePayload& payload, calibration::CalibrationEngine& engine);

} // namespace wellscan::persist
