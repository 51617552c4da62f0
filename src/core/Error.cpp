#include "wellscan/core/Error.hpp"

#include <string>

namespace wellscan {
namespace {

class WellscanCategory : public std::error_category {
public:
    const char* name() const noexcept override { return "wellscan"; }

    std::string message(int value) const override {
        switch (static_cast<Errc>(value)) {
            case Errc::InvalidWell:           return "invalid well identifier";
            case Errc::InvalidGrid:           return "invalid well grid dimensions";
            case Errc::IncompleteCorners:     return "not all plate corners are set";
            case Errc::ChannelLengthMismatch: return "channel vector length mismatch";
            case Errc::ConnectionFailed:      return "could not open motion controller port";
            case Errc::NoPortFound:           return "no usable serial port found";
            case Errc::ProtocolTimeout:       return "timed out waiting for controller acknowledgment";
            case Errc::ProtocolError:         return "controller reported an error";
            case Errc::NotConnected:          return "motion controller not connected";
            case Errc::SensorFailure:         return "sensor read failed";
            case Errc::InvalidPayload:        return "invalid or unreadable payload";
        }
        return "unknown wellscan error";
    }
};

} // namespace

const std::error_category& errorCategory() noexcept {
    static const WellscanCategory category;
    return category;
}

std::error_code make_error_code(Errc e) noexcept {
    return {static_cast<int>(e), errorCategory()};
}

} // namespace wellscan
