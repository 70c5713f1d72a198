#ifndef TRACKALIGN_CORRELATION_PEAK_HPP_
#define TRACKALIGN_CORRELATION_PEAK_HPP_

#include <alignment/status.hpp>
#include <correlation/cross_correlation.hpp>

namespace trackalign {

// Correlation peak of one axis.
struct AxisCorrelation {
  AlignmentStatus status = AlignmentStatus::DEGENERATE_SIGNAL;
  // Integer lag of the strongest |score|.
  int lag_samples = 0;
  // Parabolic refinement of the peak, in samples, within (-0.5, 0.5).
  double sub_sample_offset = 0.0;
  // Signed score at the integer peak. Negative for anti-correlated signals.
  double normalized_score = 0.0;
  // (lag_samples + sub_sample_offset) / rate.
  double offset_sec = 0.0;
};

// Finds the lag with the largest |score| (the first one on ties) and refines
// it with a parabola through |score| at the peak and its two neighbours:
//
//   delta = (y1 - y3) / (2 (y1 - 2 y2 + y3))
//
// A flat top (zero denominator) keeps the integer lag. A peak on either end of
// the lag window is DEGENERATE_SIGNAL: the true peak may lie outside of the
// window. Negative peaks are accepted with a warning.
AxisCorrelation LocatePeak(const CrossCorrelation &correlation, double rate_hz);

} // namespace trackalign

#endif // TRACKALIGN_CORRELATION_PEAK_HPP_
