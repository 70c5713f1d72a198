#ifndef TRACKALIGN_INTERPOLATION_RESAMPLE_HPP_
#define TRACKALIGN_INTERPOLATION_RESAMPLE_HPP_

#include <cstddef>
#include <vector>

#include <alignment/status.hpp>
#include <interpolation/time_series.hpp>

namespace trackalign {

// Closed time interval [start_sec, end_sec]. Empty if end < start.
struct TimeRange {
  double start_sec, end_sec;

  bool IsEmpty() const { return end_sec < start_sec; }
  double DurationSec() const;
};

// Interval where all the components are defined: latest start to earliest
// end. Empty (IsEmpty() is true) if one component ends before another one
// starts. Requires at least one component.
TimeRange IntersectTimeRanges(const std::vector<TimeRange> &ranges);

// Timestamps start, start + 1/rate, ... up to and including range end.
// Empty for an empty range.
std::vector<double> UniformGrid(const TimeRange &range, double rate_hz);

// Two multi-channel series brought onto one uniform time grid.
struct ResampledPair {
  std::vector<double> times_sec;
  // [channel][grid index]
  std::vector<std::vector<double>> reference;
  std::vector<std::vector<double>> target;
};

// Resamples both series onto a grid with step 1/rate_hz spanning the
// intersection of their time spans. Samples with a NaN in any channel are
// ignored.
//
// Returns INSUFFICIENT_OVERLAP (leaving result untouched) if the grid would
// have fewer than min_overlap_samples points.
//
// Throws InvalidInputError for malformed series (see CheckChannelSeries()),
// a series with no valid samples, differing channel counts or a non-positive
// rate.
AlignmentStatus Resample(const ChannelSeries &reference,
                         const ChannelSeries &target, double rate_hz,
                         size_t min_overlap_samples, ResampledPair *result);

} // namespace trackalign

#endif // TRACKALIGN_INTERPOLATION_RESAMPLE_HPP_
