// ChannelBuffer.hpp
// -----------------------------------------------------------------------------
// Element-wise arithmetic on per-channel sensor vectors. All vectors handed
// to one call must have the same width; mixing widths is a programming error
// reported as Errc::ChannelLengthMismatch.

#pragma once

#include "wellscan/core/Expected.hpp"

#include <optional>
#include <vector>

namespace wellscan::spectral {

using ChannelVector = std::vector<double>;

/**
 * @brief Element-wise mean of one or more reads.
 *
 * Fails with Errc::ChannelLengthMismatch when @p reads is empty or the reads
 * differ in width.
 */
expected<ChannelVector> accumulateAndAverage(const std::vector<ChannelVector>& reads);

/**
 * @brief `max(a[i] - b[i], floor)` for every channel.
 *
 * The floor keeps later denominators and logarithms finite. It biases
 * near-zero signals upward on purpose; it is not an estimator.
 */
expected<ChannelVector> subtractFloor(const ChannelVector& a,
                                      const ChannelVector& b,
                                      double floor);

/**
 * @brief Exponential moving average `alpha*sample + (1-alpha)*previous`.
 *
 * @p alpha must lie in (0, 1]; anything else is std::errc::invalid_argument.
 * Display smoothing only: stored references are plain averages.
 */
expected<ChannelVector> emaUpdate(const ChannelVector& previous,
                                  const ChannelVector& sample,
                                  double alpha);

/// Zero vector of @p width channels.
inline ChannelVector zeros(std::size_t width) { return ChannelVector(width, 0.0); }

/**
 * @brief Running EMA state for a live display.
 *
 * The first sample seeds the state verbatim; later samples are blended with
 * emaUpdate(). A width change (different sensor) reseeds instead of failing.
 */
class EmaSmoother {
public:
    explicit EmaSmoother(double alpha = 0.30);

    expected<ChannelVector> update(const ChannelVector& sample);
    void reset() { state.reset(); }

    const std::optional<ChannelVector>& current() const { return state; }
    double alpha() const { return smoothing; }

private:
    double smoothing;
    std::optional<ChannelVector> state{};
};

} // namespace wellscan::spectral
