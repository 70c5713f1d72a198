#ifndef TRACKALIGN_TRACKS_DATA_HPP_
#define TRACKALIGN_TRACKS_DATA_HPP_

#include <string>
#include <vector>

// Datastructures and helpers for storing decoded, timestamped sensor data.
// Timestamps are in seconds on the clock of the device that produced the
// stream. Different devices have unrelated clocks.

namespace trackalign {

// GNSS fix.
struct TimestampedPosition {
  double latitude_deg, longitude_deg, altitude_m;
  double time_sec;
};

// Single attitude angle (e.g. gimbal or inclinometer pitch), in degrees.
struct TimestampedAngle {
  double angle_deg;
  double time_sec;
};

// All the streams one device can contribute. A device that does not provide a
// given stream leaves the corresponding vector empty.
struct SensorTrack {
  std::vector<TimestampedPosition> positions;
  std::vector<TimestampedAngle> pitch;

  bool HasPositions() const { return !positions.empty(); }
  bool HasPitch() const { return !pitch.empty(); }
  bool IsEmpty() const { return !HasPositions() && !HasPitch(); }
};

// Time coverage of one stream.
struct StreamInfo {
  size_t samples;
  double duration_sec;
  // samples / duration, 0 for a zero-length stream.
  double sample_rate_hz;
  double start_sec, end_sec;
};

// From a vector of structs, extracts a vector of timestamps.
template <typename T>
std::vector<double> ExtractTimestamps(const std::vector<T> &events) {
  std::vector<double> result;
  result.reserve(events.size());
  for (const T &event : events) {
    result.push_back(event.time_sec);
  }
  return result;
}

// Throws InvalidInputError naming the stream if the timestamps are not
// strictly increasing or contain NaNs.
void CheckTimestampsIncreasing(const std::vector<double> &times_sec,
                               const std::string &stream_name);

// Requires at least 2 samples.
StreamInfo MakeStreamInfo(const std::vector<double> &times_sec);

} // namespace trackalign

#endif // TRACKALIGN_TRACKS_DATA_HPP_
