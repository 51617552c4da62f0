#include "wellscan/calibration/LiveReadout.hpp"

namespace wellscan::calibration {

LiveReadout::LiveReadout(const CalibrationEngine& engine, double alpha)
: engine(engine)
, smoother(alpha) {}

expected<DerivedVector> LiveReadout::update(const ChannelVector& raw,
                                            const std::optional<WellId>& well) {
    auto smoothed = smoother.update(raw);
    if (!smoothed) {
        return unexpected(smoothed.error());
    }
    return engine.reduce(*smoothed, well);
}

} // namespace wellscan::calibration
