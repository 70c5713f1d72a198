#include <interpolation/time_series.hpp>

#include <cmath>
#include <limits>
#include <sstream>

#include <glog/logging.h>

#include <alignment/status.hpp>
#include <tracks/data.hpp>

namespace trackalign {

void CheckChannelSeries(const ChannelSeries &series,
                        const std::string &series_name) {
  for (size_t channel = 0; channel < series.num_channels(); ++channel) {
    if (series.channels.at(channel).size() != series.size()) {
      std::ostringstream message;
      message << "Series '" << series_name << "' channel " << channel << " has "
              << series.channels.at(channel).size() << " values for "
              << series.size() << " timestamps";
      throw InvalidInputError(message.str());
    }
  }
  CheckTimestampsIncreasing(series.times_sec, series_name);
}

ChannelSeries DropInvalidSamples(const ChannelSeries &series) {
  ChannelSeries result;
  result.channels.resize(series.num_channels());
  for (size_t i = 0; i < series.size(); ++i) {
    bool is_valid = true;
    for (const std::vector<double> &channel : series.channels) {
      CHECK_LT(i, channel.size());
      if (std::isnan(channel.at(i))) {
        is_valid = false;
        break;
      }
    }
    if (!is_valid) {
      continue;
    }
    result.times_sec.push_back(series.times_sec.at(i));
    for (size_t channel = 0; channel < series.num_channels(); ++channel) {
      result.channels.at(channel).push_back(series.channels.at(channel).at(i));
    }
  }
  return result;
}

std::vector<double> InterpolateLinear(const std::vector<double> &times,
                                      const std::vector<double> &values,
                                      const std::vector<double> &target_times) {
  CHECK_EQ(times.size(), values.size());
  std::vector<double> result(target_times.size(),
                             std::numeric_limits<double>::quiet_NaN());
  if (times.empty()) {
    return result;
  }

  // Index of the first sample no earlier than the current target.
  size_t right_idx = 0;
  for (size_t target_idx = 0; target_idx < target_times.size();
       ++target_idx) {
    const double target_time = target_times.at(target_idx);
    if (target_idx > 0) {
      CHECK_LE(target_times.at(target_idx - 1), target_time);
    }
    if (target_time < times.front() || target_time > times.back()) {
      continue;
    }
    while (times.at(right_idx) < target_time) {
      ++right_idx;
    }
    if (times.at(right_idx) == target_time) {
      result.at(target_idx) = values.at(right_idx);
      continue;
    }
    CHECK_GT(right_idx, 0);
    const size_t left_idx = right_idx - 1;
    const double left_time = times.at(left_idx);
    const double right_time = times.at(right_idx);
    const double right_weight =
        (target_time - left_time) / (right_time - left_time);
    result.at(target_idx) = (1.0 - right_weight) * values.at(left_idx) +
                            right_weight * values.at(right_idx);
  }
  return result;
}

} // namespace trackalign
