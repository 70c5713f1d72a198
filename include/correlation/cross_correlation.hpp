#ifndef TRACKALIGN_CORRELATION_CROSS_CORRELATION_HPP_
#define TRACKALIGN_CORRELATION_CROSS_CORRELATION_HPP_

#include <vector>

#include <alignment/status.hpp>

namespace trackalign {

// Signals with a per-sample variance below this are treated as constant.
constexpr double kMinSignalVariance = 1e-12;

// Normalized cross-correlation scores for a contiguous range of integer lags,
// lags.front() == -max_lag, lags.back() == max_lag.
struct CrossCorrelation {
  std::vector<int> lags;
  std::vector<double> scores;
};

// Search window half-width in samples for a window in seconds. The result
// must fit in an int.
int MaxLagSamples(double max_lag_seconds, double rate_hz);

// Normalized cross-correlation of two equally spaced, equal length signals:
//
//   score[tau] = sum_t x[t] * y[t + tau] / sqrt(sum_t x[t]^2 * sum_t y[t]^2)
//
// for tau in [-max_lag_samples, max_lag_samples], after removing the mean of
// each signal. The numerator runs over the samples where both x[t] and
// y[t + tau] exist, the energies over the whole signals, so scores are in
// [-1, 1] and shrink linearly with the lost overlap. Of two equally similar
// alignments the one closer to zero lag scores higher. The window is
// narrowed to at most half the signal length.
//
// A positive peak lag means that y reproduces x that many samples later.
//
// Returns DEGENERATE_SIGNAL (leaving result untouched) if either signal is
// constant.
AlignmentStatus CrossCorrelate(const std::vector<double> &x,
                               const std::vector<double> &y,
                               int max_lag_samples, CrossCorrelation *result);

} // namespace trackalign

#endif // TRACKALIGN_CORRELATION_CROSS_CORRELATION_HPP_
