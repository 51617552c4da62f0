#include "wellscan/calibration/CalibrationMode.hpp"

#include <array>
#include <cctype>

namespace wellscan::calibration {

namespace {

constexpr std::array<Mode, 5> kModes{
    Mode::Raw, Mode::Reflectance, Mode::Absorbance, Mode::Transmittance, Mode::AbsTx};

bool equalsIgnoreCase(std::string_view a, std::string_view b) {
    if (a.size() != b.size()) {
        return false;
    }
    for (std::size_t i = 0; i < a.size(); ++i) {
        if (std::toupper(static_cast<unsigned char>(a[i])) !=
            std::toupper(static_cast<unsigned char>(b[i]))) {
            return false;
        }
    }
    return true;
}

} // namespace

Mode nextMode(Mode mode) {
    switch (mode) {
        case Mode::Raw:           return Mode::Reflectance;
        case Mode::Reflectance:   return Mode::Absorbance;
        case Mode::Absorbance:    return Mode::Transmittance;
        case Mode::Transmittance: return Mode::AbsTx;
        case Mode::AbsTx:         return Mode::Raw;
    }
    return Mode::Raw;
}

const char* toString(Mode mode) {
    switch (mode) {
        case Mode::Raw:           return "RAW";
        case Mode::Reflectance:   return "REFLECTANCE";
        case Mode::Absorbance:    return "ABSORBANCE";
        case Mode::Transmittance: return "TRANSMITTANCE";
        case Mode::AbsTx:         return "ABS_TX";
    }
    return "UNKNOWN";
}

std::optional<Mode> parseMode(std::string_view text) {
    for (Mode mode : kModes) {
        if (equalsIgnoreCase(text, toString(mode))) {
            return mode;
        }
    }
    return std::nullopt;
}

} // namespace wellscan::calibration
