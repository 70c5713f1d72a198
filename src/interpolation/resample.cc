#include <interpolation/resample.hpp>

#include <algorithm>
#include <cmath>
#include <sstream>
#include <string>
#include <utility>

#include <glog/logging.h>

namespace trackalign {

namespace {
// Slack for floating point error when counting how many grid steps fit into
// a range whose duration is a whole number of steps.
constexpr double kGridStepTolerance = 1e-9;

ChannelSeries ValidSamplesOrThrow(const ChannelSeries &series,
                                  const std::string &series_name) {
  CheckChannelSeries(series, series_name);
  ChannelSeries valid = DropInvalidSamples(series);
  if (valid.size() == 0) {
    throw InvalidInputError("Series '" + series_name +
                            "' has no samples without NaN values");
  }
  if (valid.size() < series.size()) {
    LOG(WARNING) << "Series '" << series_name << "': ignoring "
                 << series.size() - valid.size() << " of " << series.size()
                 << " samples with NaN values.";
  }
  return valid;
}
} // namespace

double TimeRange::DurationSec() const {
  CHECK(!IsEmpty());
  return end_sec - start_sec;
}

TimeRange IntersectTimeRanges(const std::vector<TimeRange> &ranges) {
  CHECK(!ranges.empty());
  TimeRange result = ranges.front();
  for (const TimeRange &range : ranges) {
    result.start_sec = std::max(result.start_sec, range.start_sec);
    result.end_sec = std::min(result.end_sec, range.end_sec);
  }
  return result;
}

std::vector<double> UniformGrid(const TimeRange &range, double rate_hz) {
  CHECK_GT(rate_hz, 0.0);
  if (range.IsEmpty()) {
    return {};
  }
  const size_t num_points = static_cast<size_t>(std::floor(
                                range.DurationSec() * rate_hz +
                                kGridStepTolerance)) +
                            1;
  std::vector<double> result;
  result.reserve(num_points);
  for (size_t i = 0; i < num_points; ++i) {
    result.push_back(std::min(
        range.start_sec + static_cast<double>(i) / rate_hz, range.end_sec));
  }
  return result;
}

AlignmentStatus Resample(const ChannelSeries &reference,
                         const ChannelSeries &target, double rate_hz,
                         size_t min_overlap_samples, ResampledPair *result) {
  CHECK_NOTNULL(result);
  if (!(rate_hz > 0.0)) {
    std::ostringstream message;
    message << "Resampling rate must be positive, got " << rate_hz;
    throw InvalidInputError(message.str());
  }
  if (reference.num_channels() != target.num_channels()) {
    std::ostringstream message;
    message << "Cannot resample series with different channel counts: "
            << reference.num_channels() << " vs " << target.num_channels();
    throw InvalidInputError(message.str());
  }

  const ChannelSeries valid_reference =
      ValidSamplesOrThrow(reference, "reference");
  const ChannelSeries valid_target = ValidSamplesOrThrow(target, "target");

  const TimeRange common_range = IntersectTimeRanges(
      {{valid_reference.times_sec.front(), valid_reference.times_sec.back()},
       {valid_target.times_sec.front(), valid_target.times_sec.back()}});
  std::vector<double> grid = UniformGrid(common_range, rate_hz);
  if (grid.size() < min_overlap_samples) {
    VLOG(1) << "Common time range [" << common_range.start_sec << ", "
            << common_range.end_sec << "] yields " << grid.size()
            << " samples at " << rate_hz << " Hz, need "
            << min_overlap_samples;
    return AlignmentStatus::INSUFFICIENT_OVERLAP;
  }

  ResampledPair resampled;
  for (size_t channel = 0; channel < valid_reference.num_channels();
       ++channel) {
    resampled.reference.push_back(
        InterpolateLinear(valid_reference.times_sec,
                          valid_reference.channels.at(channel), grid));
    resampled.target.push_back(InterpolateLinear(
        valid_target.times_sec, valid_target.channels.at(channel), grid));
  }
  resampled.times_sec.swap(grid);
  *result = std::move(resampled);
  return AlignmentStatus::OK;
}

} // namespace trackalign
