#include <correlation/cross_correlation.hpp>

#include <algorithm>
#include <cmath>
#include <limits>
#include <utility>

#include <glog/logging.h>

#include <math/math.hpp>

namespace trackalign {

namespace {
double Variance(const std::vector<double> &demeaned) {
  if (demeaned.empty()) {
    return 0.0;
  }
  KahanSum<double> sum_squares(0.0);
  for (const double v : demeaned) {
    sum_squares.add(v * v);
  }
  return sum_squares.sum() / static_cast<double>(demeaned.size());
}

// Score for a single lag, see CrossCorrelate().
double LagScore(const std::vector<double> &x, const std::vector<double> &y,
                int lag, double norm) {
  const int num_samples = static_cast<int>(x.size());
  const int start = std::max(0, -lag);
  const int end = std::min(num_samples, num_samples - lag);
  CHECK_LT(start, end);

  KahanSum<double> product(0.0);
  for (int t = start; t < end; ++t) {
    product.add(x[t] * y[t + lag]);
  }
  const double score = product.sum() / norm;
  return std::max(-1.0, std::min(1.0, score));
}
} // namespace

int MaxLagSamples(double max_lag_seconds, double rate_hz) {
  CHECK_GE(max_lag_seconds, 0.0);
  CHECK_GT(rate_hz, 0.0);
  const double max_lag = std::round(max_lag_seconds * rate_hz);
  CHECK_LE(max_lag, static_cast<double>(std::numeric_limits<int>::max()));
  return static_cast<int>(max_lag);
}

AlignmentStatus CrossCorrelate(const std::vector<double> &x,
                               const std::vector<double> &y,
                               int max_lag_samples, CrossCorrelation *result) {
  CHECK_NOTNULL(result);
  CHECK_EQ(x.size(), y.size());
  CHECK_GE(max_lag_samples, 0);

  const std::vector<double> x_demeaned = Demeaned(x);
  const std::vector<double> y_demeaned = Demeaned(y);
  const double x_variance = Variance(x_demeaned);
  const double y_variance = Variance(y_demeaned);
  if (x_variance < kMinSignalVariance || y_variance < kMinSignalVariance) {
    VLOG(1) << "Constant signal, variances " << x_variance << " and "
            << y_variance;
    return AlignmentStatus::DEGENERATE_SIGNAL;
  }

  const int max_lag =
      std::min(max_lag_samples, static_cast<int>(x.size()) / 2);
  if (max_lag < max_lag_samples) {
    VLOG(1) << "Narrowing lag window from " << max_lag_samples << " to "
            << max_lag << " samples for a signal of length " << x.size();
  }

  // Energies of the whole signals, so that lags with less overlap score
  // proportionally lower.
  const double norm = static_cast<double>(x.size()) *
                      sqrt(x_variance * y_variance);

  CrossCorrelation correlation;
  correlation.lags.reserve(2 * max_lag + 1);
  correlation.scores.reserve(2 * max_lag + 1);
  for (int lag = -max_lag; lag <= max_lag; ++lag) {
    correlation.lags.push_back(lag);
    correlation.scores.push_back(LagScore(x_demeaned, y_demeaned, lag, norm));
  }
  *result = std::move(correlation);
  return AlignmentStatus::OK;
}

} // namespace trackalign
