#include <correlation/peak.hpp>

#include <cmath>

#include <glog/logging.h>

namespace trackalign {

AxisCorrelation LocatePeak(const CrossCorrelation &correlation,
                           double rate_hz) {
  CHECK_GT(rate_hz, 0.0);
  CHECK_EQ(correlation.lags.size(), correlation.scores.size());
  CHECK(!correlation.scores.empty());

  const std::vector<double> &scores = correlation.scores;
  size_t peak_idx = 0;
  for (size_t i = 1; i < scores.size(); ++i) {
    if (std::abs(scores.at(i)) > std::abs(scores.at(peak_idx))) {
      peak_idx = i;
    }
  }

  AxisCorrelation result;
  result.lag_samples = correlation.lags.at(peak_idx);
  result.normalized_score = scores.at(peak_idx);
  result.offset_sec = static_cast<double>(result.lag_samples) / rate_hz;

  if (peak_idx == 0 || peak_idx + 1 == scores.size()) {
    VLOG(1) << "Correlation peak at the window boundary, lag "
            << result.lag_samples << " score " << result.normalized_score;
    result.status = AlignmentStatus::DEGENERATE_SIGNAL;
    return result;
  }

  if (result.normalized_score < 0) {
    LOG(WARNING) << "Strongest correlation is negative ("
                 << result.normalized_score << " at lag " << result.lag_samples
                 << "). Using it, but the signals may be mirrored.";
  }

  const double y1 = std::abs(scores.at(peak_idx - 1));
  const double y2 = std::abs(scores.at(peak_idx));
  const double y3 = std::abs(scores.at(peak_idx + 1));
  const double curvature = y1 - 2.0 * y2 + y3;
  if (curvature != 0.0) {
    result.sub_sample_offset = (y1 - y3) / (2.0 * curvature);
  }
  result.offset_sec =
      (static_cast<double>(result.lag_samples) + result.sub_sample_offset) /
      rate_hz;
  result.status = AlignmentStatus::OK;
  return result;
}

} // namespace trackalign
