#include <alignment/session.hpp>

#include <algorithm>
#include <iomanip>
#include <sstream>

#include <glog/logging.h>

#include <logging/strings.hpp>

namespace trackalign {

namespace {
// One stream of a source along with the names of its value columns.
struct NamedStream {
  std::string name;
  std::vector<std::string> column_names;
  ChannelSeries series;
};

std::vector<NamedStream> TrackStreams(const SensorTrack &track) {
  std::vector<NamedStream> result;
  if (track.HasPositions()) {
    NamedStream positions;
    positions.name = kPositionsStream;
    positions.column_names = {kLatitudeColumn, kLongitudeColumn,
                              kAltitudeColumn};
    positions.series.times_sec = ExtractTimestamps(track.positions);
    positions.series.channels.resize(3);
    for (const TimestampedPosition &position : track.positions) {
      positions.series.channels.at(0).push_back(position.latitude_deg);
      positions.series.channels.at(1).push_back(position.longitude_deg);
      positions.series.channels.at(2).push_back(position.altitude_m);
    }
    result.push_back(positions);
  }
  if (track.HasPitch()) {
    NamedStream pitch;
    pitch.name = kPitchStream;
    pitch.column_names = {kPitchColumn};
    pitch.series.times_sec = ExtractTimestamps(track.pitch);
    pitch.series.channels.resize(1);
    for (const TimestampedAngle &angle : track.pitch) {
      pitch.series.channels.front().push_back(angle.angle_deg);
    }
    result.push_back(pitch);
  }
  return result;
}

void CheckRegistered(const std::map<std::string, SensorTrack> &sources,
                     const std::string &name) {
  if (sources.count(name) == 0) {
    throw InvalidInputError("Unknown source '" + name + "'");
  }
}
} // namespace

AlignmentSession::AlignmentSession(const AlignmentConfig &config)
    : aligner_(config) {}

void AlignmentSession::AddSource(const std::string &name,
                                 const SensorTrack &track) {
  if (name.empty()) {
    throw InvalidInputError("Source name must not be empty");
  }
  if (track.IsEmpty()) {
    throw InvalidInputError("Source '" + name + "' has no data streams");
  }
  if (name == reference_) {
    throw InvalidInputError("Source '" + name +
                            "' is the reference and cannot be replaced");
  }
  for (const NamedStream &stream : TrackStreams(track)) {
    CheckTimestampsIncreasing(stream.series.times_sec,
                              name + " " + stream.name);
    if (DropInvalidSamples(stream.series).size() == 0) {
      throw InvalidInputError("Source '" + name + "' " + stream.name +
                              " has no samples without NaN values");
    }
  }

  if (HasSource(name)) {
    LOG(WARNING) << "Overwriting existing source '" << name << "'";
  }
  sources_[name] = track;
  ClearResults();
  LOG(INFO) << "Added source '" << name << "' with "
            << track.positions.size() << " positions and "
            << track.pitch.size() << " pitch samples";
}

bool AlignmentSession::RemoveSource(const std::string &name) {
  if (sources_.erase(name) == 0) {
    return false;
  }
  if (reference_ == name) {
    LOG(WARNING) << "Removed the reference source '" << name << "'";
    reference_.clear();
  }
  for (auto it = chained_targets_.begin(); it != chained_targets_.end();) {
    if (it->first == name || it->second == name) {
      LOG(WARNING) << "Dropping chained alignment of '" << it->first
                   << "' through '" << it->second << "'";
      it = chained_targets_.erase(it);
    } else {
      ++it;
    }
  }
  ClearResults();
  LOG(INFO) << "Removed source '" << name << "'";
  return true;
}

bool AlignmentSession::HasSource(const std::string &name) const {
  return sources_.count(name) > 0;
}

std::vector<std::string> AlignmentSession::SourceNames() const {
  std::vector<std::string> result;
  for (const auto &name_and_track : sources_) {
    result.push_back(name_and_track.first);
  }
  return result;
}

void AlignmentSession::SetReference(const std::string &name) {
  CheckRegistered(sources_, name);
  if (chained_targets_.erase(name) > 0) {
    LOG(WARNING) << "Reference source '" << name
                 << "' is no longer a chained target";
  }
  reference_ = name;
  ClearResults();
}

void AlignmentSession::AddChainedTarget(const std::string &target,
                                        const std::string &intermediate) {
  CheckRegistered(sources_, target);
  CheckRegistered(sources_, intermediate);
  if (target == intermediate) {
    throw InvalidInputError("Source '" + target +
                            "' cannot be its own intermediate");
  }
  chained_targets_[target] = intermediate;
  ClearResults();
}

SessionStreamInfo AlignmentSession::SourceInfo() const {
  SessionStreamInfo result;
  for (const auto &name_and_track : sources_) {
    for (const NamedStream &stream : TrackStreams(name_and_track.second)) {
      if (stream.series.size() < 2) {
        LOG(WARNING) << "Source '" << name_and_track.first << "' "
                     << stream.name << " has too few samples for time analysis";
        continue;
      }
      result[name_and_track.first][stream.name] =
          MakeStreamInfo(stream.series.times_sec);
    }
  }
  return result;
}

double AlignmentSession::MaxSampleRate() const {
  double result = 0.0;
  for (const auto &source : SourceInfo()) {
    for (const auto &stream : source.second) {
      result = std::max(result, stream.second.sample_rate_hz);
    }
  }
  return result;
}

TimeRange AlignmentSession::CommonTimeRange() const {
  std::vector<TimeRange> ranges;
  for (const auto &name_and_track : sources_) {
    double offset_sec = 0.0;
    if (!ClockOffset(name_and_track.first, &offset_sec)) {
      continue;
    }
    for (const NamedStream &stream : TrackStreams(name_and_track.second)) {
      ranges.push_back({stream.series.times_sec.front() + offset_sec,
                        stream.series.times_sec.back() + offset_sec});
    }
  }
  if (ranges.empty()) {
    // Empty range.
    return {0.0, -1.0};
  }
  return IntersectTimeRanges(ranges);
}

size_t AlignmentSession::AlignAll() {
  if (reference_.empty()) {
    throw InvalidInputError("Set the reference source before aligning");
  }
  ClearResults();

  const SensorTrack &reference = sources_.at(reference_);
  size_t num_aligned = 0;
  for (const auto &name_and_track : sources_) {
    const std::string &name = name_and_track.first;
    if (name == reference_) {
      continue;
    }

    AlignmentStatus status;
    double offset_sec;
    const auto chained = chained_targets_.find(name);
    try {
      if (chained != chained_targets_.end()) {
        LOG(INFO) << "Aligning '" << name << "' to '" << reference_
                  << "' through '" << chained->second << "'";
        const ChainedAlignmentResult result = aligner_.AlignChained(
            reference, sources_.at(chained->second), name_and_track.second);
        chained_results_[name] = result;
        status = result.status;
        offset_sec = result.time_offset_seconds;
      } else {
        LOG(INFO) << "Aligning '" << name << "' to '" << reference_ << "'";
        const AlignmentResult result =
            aligner_.Align(reference, name_and_track.second);
        direct_results_[name] = result;
        status = result.status;
        offset_sec = result.time_offset_seconds;
      }
    } catch (const InvalidInputError &e) {
      LOG(ERROR) << "Cannot align source '" << name << "': " << e.what();
      alignment_errors_[name] = e.what();
      continue;
    }

    if (status == AlignmentStatus::OK) {
      LOG(INFO) << "Source '" << name << "' clock offset: " << offset_sec
                << " s";
      ++num_aligned;
    } else {
      LOG(WARNING) << "Could not align source '" << name << "': " << status;
    }
  }
  return num_aligned;
}

bool AlignmentSession::ClockOffset(const std::string &name,
                                   double *offset_sec) const {
  CHECK_NOTNULL(offset_sec);
  if (!HasSource(name)) {
    return false;
  }
  if (reference_.empty() || name == reference_) {
    *offset_sec = 0.0;
    return true;
  }
  const auto direct = direct_results_.find(name);
  if (direct != direct_results_.end() &&
      direct->second.status == AlignmentStatus::OK) {
    *offset_sec = direct->second.time_offset_seconds;
    return true;
  }
  const auto chained = chained_results_.find(name);
  if (chained != chained_results_.end() &&
      chained->second.status == AlignmentStatus::OK) {
    *offset_sec = chained->second.time_offset_seconds;
    return true;
  }
  return false;
}

SynchronizedTable AlignmentSession::Synchronize(double rate_hz) const {
  const double max_rate_hz = MaxSampleRate();
  if (rate_hz == 0.0) {
    rate_hz = max_rate_hz;
  }
  if (!(rate_hz > 0.0) || rate_hz > max_rate_hz) {
    std::ostringstream message;
    message << "Synchronization rate " << rate_hz
            << " Hz is not within (0, " << max_rate_hz << "] Hz";
    throw InvalidInputError(message.str());
  }

  const TimeRange range = CommonTimeRange();
  if (range.IsEmpty() || !(range.DurationSec() > 0.0)) {
    throw InvalidInputError("No overlapping time range between the sources");
  }

  SynchronizedTable result;
  result.times_sec = UniformGrid(range, rate_hz);
  size_t num_sources = 0;
  for (const auto &name_and_track : sources_) {
    const std::string &name = name_and_track.first;
    double offset_sec = 0.0;
    if (!ClockOffset(name, &offset_sec)) {
      LOG(WARNING) << "Skipping source '" << name
                   << "' with unknown clock offset";
      continue;
    }
    for (const NamedStream &stream : TrackStreams(name_and_track.second)) {
      ChannelSeries valid = DropInvalidSamples(stream.series);
      for (double &time : valid.times_sec) {
        time += offset_sec;
      }
      for (size_t channel = 0; channel < valid.num_channels(); ++channel) {
        result.columns[name + "_" + stream.column_names.at(channel)] =
            InterpolateLinear(valid.times_sec, valid.channels.at(channel),
                              result.times_sec);
      }
    }
    ++num_sources;
  }

  LOG(INFO) << "Synchronized " << num_sources << " source(s) at " << rate_hz
            << " Hz: " << result.times_sec.size() << " samples over "
            << range.DurationSec() << " s";
  return result;
}

std::string AlignmentSession::Summary() const {
  if (sources_.empty()) {
    return "No sources added.";
  }
  const SessionStreamInfo info = SourceInfo();

  std::ostringstream out;
  out << std::fixed;
  out << "Alignment session: " << sources_.size() << " source(s)";
  if (!reference_.empty()) {
    out << ", reference '" << reference_ << "'";
  }
  out << "\n";

  for (const auto &name_and_track : sources_) {
    const std::string &name = name_and_track.first;
    out << "\n" << name;
    const auto chained = chained_targets_.find(name);
    if (name == reference_) {
      out << " (reference)";
    } else if (chained != chained_targets_.end()) {
      out << " (through " << chained->second << ")";
    }
    out << "\n";

    const auto streams = info.find(name);
    if (streams != info.end()) {
      for (const auto &stream : streams->second) {
        const StreamInfo &stream_info = stream.second;
        out << "  " << stream.first << ": " << stream_info.samples
            << " samples, " << std::setprecision(2)
            << stream_info.duration_sec << " s, "
            << stream_info.sample_rate_hz << " Hz, " << std::setprecision(3)
            << stream_info.start_sec << " - " << stream_info.end_sec
            << " s\n";
      }
    }

    const auto direct = direct_results_.find(name);
    const auto chained_result = chained_results_.find(name);
    if (direct != direct_results_.end()) {
      out << "  alignment: " << direct->second.status;
      if (direct->second.status == AlignmentStatus::OK) {
        out << ", offset " << std::setprecision(4)
            << direct->second.time_offset_seconds << " s, quality "
            << std::setprecision(3) << direct->second.quality;
      }
      out << "\n";
    } else if (chained_result != chained_results_.end()) {
      out << "  alignment: " << chained_result->second.status;
      if (chained_result->second.status == AlignmentStatus::OK) {
        out << ", offset " << std::setprecision(4)
            << chained_result->second.time_offset_seconds << " s";
      }
      out << "\n";
    } else if (alignment_errors_.count(name) > 0) {
      out << "  alignment: failed, " << alignment_errors_.at(name) << "\n";
    }
  }

  const TimeRange range = CommonTimeRange();
  out << "\nCommon time range: ";
  if (range.IsEmpty()) {
    out << "none";
  } else {
    out << std::setprecision(3) << range.start_sec << " - " << range.end_sec
        << " s (" << std::setprecision(2) << range.DurationSec() << " s)";
  }
  out << "\nMaximum sample rate: " << std::setprecision(2) << MaxSampleRate()
      << " Hz\n";
  return out.str();
}

void AlignmentSession::ClearResults() {
  direct_results_.clear();
  chained_results_.clear();
  alignment_errors_.clear();
}

} // namespace trackalign
