#include "wellscan/spectral/ChannelBuffer.hpp"
#include "wellscan/core/Error.hpp"

#include <algorithm>

namespace wellscan::spectral {

expected<ChannelVector> accumulateAndAverage(const std::vector<ChannelVector>& reads) {
    if (reads.empty()) {
        return unexpected(make_error_code(Errc::ChannelLengthMismatch));
    }

    const std::size_t width = reads.front().size();
    ChannelVector sum(width, 0.0);
    for (const auto& read : reads) {
        if (read.size() != width) {
            return unexpected(make_error_code(Errc::ChannelLengthMismatch));
        }
        for (std::size_t i = 0; i < width; ++i) {
            sum[i] += read[i];
        }
    }

    const double count = static_cast<double>(reads.size());
    for (auto& value : sum) {
        value /= count;
    }
    return sum;
}

expected<ChannelVector> subtractFloor(const ChannelVector& a,
                                      const ChannelVector& b,
                                      double floor) {
    if (a.size() != b.size()) {
        return unexpected(make_error_code(Errc::ChannelLengthMismatch));
    }
    ChannelVector out(a.size());
    for (std::size_t i = 0; i < a.size(); ++i) {
        out[i] = std::max(a[i] - b[i], floor);
    }
    return out;
}

expected<ChannelVector> emaUpdate(const ChannelVector& previous,
                                  const ChannelVector& sample,
                                  double alpha) {
    if (!(alpha > 0.0 && alpha <= 1.0)) {
        return unexpected(std::make_error_code(std::errc::invalid_argument));
    }
    if (previous.size() != sample.size()) {
        return unexpected(make_error_code(Errc::ChannelLengthMismatch));
    }
    ChannelVector out(sample.size());
    for (std::size_t i = 0; i < sample.size(); ++i) {
        // Written as a blend around previous so emaUpdate(v, v, a) == v exactly.
        out[i] = previous[i] + alpha * (sample[i] - previous[i]);
    }
    return out;
}

EmaSmoother::EmaSmoother(double alpha)
: smoothing(alpha) {}

expected<ChannelVector> EmaSmoother::update(const ChannelVector& sample) {
    if (!state || state->size() != sample.size()) {
        state = sample;
        return *state;
    }
    auto next = emaUpdate(*state, sample, smoothing);
    if (!next) {
        return next;
    }
    state = *next;
    return next;
}

} // namespace wellscan::spectral
