#ifndef TRACKALIGN_INTERPOLATION_TIME_SERIES_HPP_
#define TRACKALIGN_INTERPOLATION_TIME_SERIES_HPP_

#include <string>
#include <vector>

namespace trackalign {

// Several scalar channels sampled at a shared set of timestamps, e.g. the
// East, North and Up components of one projected track.
struct ChannelSeries {
  std::vector<double> times_sec;
  // channels[c][i] is the value of channel c at times_sec[i].
  std::vector<std::vector<double>> channels;

  size_t size() const { return times_sec.size(); }
  size_t num_channels() const { return channels.size(); }
};

// Throws InvalidInputError if a channel length differs from the number of
// timestamps, or if the timestamps are not strictly increasing.
void CheckChannelSeries(const ChannelSeries &series,
                        const std::string &series_name);

// Copy of the input without the samples that have a NaN value in any
// channel.
ChannelSeries DropInvalidSamples(const ChannelSeries &series);

// Linear interpolation of (times, values) at every target time. Targets must
// be sorted. Targets outside [times.front(), times.back()] are NaN (no
// extrapolation); a target exactly at a sample timestamp gets that sample's
// value.
// Uses a linear (not binary) search that advances along with the targets, so
// the whole call is O(times + targets).
std::vector<double> InterpolateLinear(const std::vector<double> &times,
                                      const std::vector<double> &values,
                                      const std::vector<double> &target_times);

} // namespace trackalign

#endif // TRACKALIGN_INTERPOLATION_TIME_SERIES_HPP_
