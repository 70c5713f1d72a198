#include <tracks/data.hpp>

#include <cmath>
#include <sstream>

#include <glog/logging.h>

#include <alignment/status.hpp>

namespace trackalign {

void CheckTimestampsIncreasing(const std::vector<double> &times_sec,
                               const std::string &stream_name) {
  for (size_t i = 0; i < times_sec.size(); ++i) {
    if (std::isnan(times_sec.at(i))) {
      std::ostringstream message;
      message << "Stream '" << stream_name << "' has a NaN timestamp at index "
              << i;
      throw InvalidInputError(message.str());
    }
    if (i > 0 && !(times_sec.at(i - 1) < times_sec.at(i))) {
      std::ostringstream message;
      message << "Stream '" << stream_name
              << "' timestamps are not strictly increasing at index " << i
              << " (" << times_sec.at(i - 1) << " then " << times_sec.at(i)
              << ")";
      throw InvalidInputError(message.str());
    }
  }
}

StreamInfo MakeStreamInfo(const std::vector<double> &times_sec) {
  CHECK_GE(times_sec.size(), 2);
  StreamInfo info;
  info.samples = times_sec.size();
  info.start_sec = times_sec.front();
  info.end_sec = times_sec.back();
  info.duration_sec = info.end_sec - info.start_sec;
  info.sample_rate_hz =
      info.duration_sec > 0
          ? static_cast<double>(info.samples) / info.duration_sec
          : 0.0;
  return info;
}

} // namespace trackalign
