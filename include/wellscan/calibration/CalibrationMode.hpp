#pragma once

#include <cstdint>
#include <optional>
#include <string_view>

namespace wellscan::calibration {

/**
 * @brief What reduce() derives from a raw frame.
 *
 * Cycle order: Raw -> Reflectance -> Absorbance -> Transmittance -> AbsTx -> Raw.
 */
enum class Mode : std::uint8_t {
    Raw = 0,
    Reflectance,
    Absorbance,     ///< A* = -log10(R), from the white reference.
    Transmittance,  ///< T = I/I0, from the well's blank.
    AbsTx           ///< Beer-Lambert A = log10(I0/I) with %T.
};

Mode nextMode(Mode mode);

/// "RAW", "REFLECTANCE", "ABSORBANCE", "TRANSMITTANCE", "ABS_TX".
const char* toString(Mode mode);

/// Inverse of toString(), case-insensitive.
std::optional<Mode> parseMode(std::string_view text);

} // namespace wellscan::calibration
