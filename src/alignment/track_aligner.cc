#include <alignment/track_aligner.hpp>

#include <cmath>
#include <limits>
#include <sstream>

#include <glog/logging.h>

#include <alignment/fusion.hpp>
#include <alignment/residual.hpp>
#include <correlation/cross_correlation.hpp>
#include <geometry/geodetic.hpp>
#include <interpolation/resample.hpp>
#include <logging/strings.hpp>

namespace trackalign {

namespace {
void CheckNotEmpty(size_t num_samples, const std::string &track_name) {
  if (num_samples == 0) {
    throw InvalidInputError("Track '" + track_name + "' has no samples");
  }
}

ChannelSeries EnuSeries(const std::vector<TimestampedPosition> &positions,
                        const std::vector<EnuPoint> &enu) {
  CHECK_EQ(positions.size(), enu.size());
  ChannelSeries result;
  result.times_sec = ExtractTimestamps(positions);
  result.channels.resize(3);
  for (const EnuPoint &point : enu) {
    for (int axis = 0; axis < 3; ++axis) {
      result.channels.at(axis).push_back(point(axis));
    }
  }
  return result;
}

ChannelSeries AngleSeries(const std::vector<TimestampedAngle> &angles) {
  ChannelSeries result;
  result.times_sec = ExtractTimestamps(angles);
  result.channels.resize(1);
  for (const TimestampedAngle &angle : angles) {
    result.channels.front().push_back(angle.angle_deg);
  }
  return result;
}
} // namespace

void ValidateAlignmentConfig(const AlignmentConfig &config) {
  std::ostringstream message;
  if (!(config.rate_hz > 0.0) || std::isinf(config.rate_hz)) {
    message << "rate_hz must be positive and finite, got " << config.rate_hz;
  } else if (!(config.max_lag_seconds >= 0.0) ||
             std::isinf(config.max_lag_seconds)) {
    message << "max_lag_seconds must be non-negative and finite, got "
            << config.max_lag_seconds;
  } else if (config.max_lag_seconds * config.rate_hz >
             static_cast<double>(std::numeric_limits<int>::max())) {
    message << "max_lag_seconds of " << config.max_lag_seconds << " at "
            << config.rate_hz << " Hz is too many samples";
  } else if (config.min_overlap_samples < 3) {
    message << "min_overlap_samples must be at least 3, got "
            << config.min_overlap_samples;
  } else {
    return;
  }
  throw InvalidInputError(message.str());
}

TrackAligner::TrackAligner(const AlignmentConfig &config) : config_(config) {
  ValidateAlignmentConfig(config_);
}

AlignmentStatus TrackAligner::CorrelateChannels(
    const ChannelSeries &reference, const ChannelSeries &target,
    const std::vector<std::string> &axis_names,
    std::map<std::string, AxisCorrelation> *per_axis) const {
  CHECK_NOTNULL(per_axis);
  CHECK_EQ(reference.num_channels(), axis_names.size());

  ResampledPair resampled;
  const AlignmentStatus resample_status =
      Resample(reference, target, config_.rate_hz,
               config_.min_overlap_samples, &resampled);
  if (resample_status != AlignmentStatus::OK) {
    LOG(WARNING) << "Not enough time overlap between the tracks: "
                 << resample_status;
    return resample_status;
  }
  VLOG(1) << "Resampled to " << resampled.times_sec.size() << " samples at "
          << config_.rate_hz << " Hz over ["
          << resampled.times_sec.front() << ", "
          << resampled.times_sec.back() << "]";

  const int max_lag_samples =
      MaxLagSamples(config_.max_lag_seconds, config_.rate_hz);
  for (size_t axis = 0; axis < axis_names.size(); ++axis) {
    AxisCorrelation axis_result;
    CrossCorrelation correlation;
    // Correlating target against reference makes a positive lag mean that
    // the reference shows the same motion later, i.e. the target clock is
    // behind.
    if (CrossCorrelate(resampled.target.at(axis),
                       resampled.reference.at(axis), max_lag_samples,
                       &correlation) == AlignmentStatus::OK) {
      axis_result = LocatePeak(correlation, config_.rate_hz);
    }
    LOG(INFO) << "Axis " << axis_names.at(axis) << ": " << axis_result;
    (*per_axis)[axis_names.at(axis)] = axis_result;
  }
  return AlignmentStatus::OK;
}

AlignmentResult TrackAligner::AlignPositions(
    const std::vector<TimestampedPosition> &reference,
    const std::vector<TimestampedPosition> &target) const {
  CheckNotEmpty(reference.size(), "reference positions");
  CheckNotEmpty(target.size(), "target positions");
  GeoPoint origin;
  if (!FirstValidPosition(reference, &origin)) {
    throw InvalidInputError("Reference positions have no valid sample");
  }
  VLOG(1) << "ENU origin: " << origin.latitude_deg << ", "
          << origin.longitude_deg << ", " << origin.altitude_m;

  const std::vector<EnuPoint> reference_enu = ProjectToEnu(origin, reference);
  const std::vector<EnuPoint> target_enu = ProjectToEnu(origin, target);
  const ChannelSeries reference_series = EnuSeries(reference, reference_enu);
  const ChannelSeries target_series = EnuSeries(target, target_enu);

  AlignmentResult result;
  result.status =
      CorrelateChannels(reference_series, target_series,
                        {kEastAxis, kNorthAxis, kUpAxis}, &result.per_axis);
  if (result.status != AlignmentStatus::OK) {
    return result;
  }

  const FusedOffset fused = FuseAxisOffsets(result.per_axis);
  result.status = fused.status;
  if (fused.status != AlignmentStatus::OK) {
    LOG(WARNING) << "No usable axis for position alignment.";
    return result;
  }
  result.time_offset_seconds = fused.offset_sec;
  result.quality = fused.quality;
  result.has_residual = ResidualSpatialOffset(
      reference_series.times_sec, reference_enu, target_series.times_sec,
      target_enu, result.time_offset_seconds,
      &result.residual_spatial_offset_m);

  LOG(INFO) << "Position alignment: offset " << result.time_offset_seconds
            << " s, quality " << result.quality << " from " << fused.axes_used
            << " axes";
  if (result.has_residual) {
    LOG(INFO) << "Residual spatial offset after alignment: "
              << result.residual_spatial_offset_m << " m";
  }
  return result;
}

AlignmentResult
TrackAligner::AlignAttitudes(const std::vector<TimestampedAngle> &reference,
                             const std::vector<TimestampedAngle> &target) const {
  CheckNotEmpty(reference.size(), "reference pitch");
  CheckNotEmpty(target.size(), "target pitch");

  AlignmentResult result;
  result.status = CorrelateChannels(AngleSeries(reference), AngleSeries(target),
                                    {kPitchAxis}, &result.per_axis);
  if (result.status != AlignmentStatus::OK) {
    return result;
  }

  const AxisCorrelation &pitch = result.per_axis.at(kPitchAxis);
  result.status = pitch.status;
  if (pitch.status != AlignmentStatus::OK) {
    return result;
  }
  result.time_offset_seconds = pitch.offset_sec;
  result.quality = std::abs(pitch.normalized_score);
  LOG(INFO) << "Attitude alignment: offset " << result.time_offset_seconds
            << " s, quality " << result.quality;
  return result;
}

AlignmentResult TrackAligner::Align(const SensorTrack &reference,
                                    const SensorTrack &target) const {
  if (reference.HasPositions() && target.HasPositions()) {
    return AlignPositions(reference.positions, target.positions);
  }
  if (reference.HasPitch() && target.HasPitch()) {
    return AlignAttitudes(reference.pitch, target.pitch);
  }
  throw InvalidInputError(
      "Tracks have neither positions nor pitch in common, cannot align");
}

ChainedAlignmentResult
TrackAligner::AlignChained(const SensorTrack &reference,
                           const SensorTrack &intermediate,
                           const SensorTrack &target) const {
  ChainedAlignmentResult result;
  result.stage_1 = Align(reference, intermediate);
  result.status = result.stage_1.status;
  if (result.status != AlignmentStatus::OK) {
    LOG(WARNING) << "Chained alignment: reference to intermediate failed: "
                 << result.status;
    return result;
  }

  result.stage_2 = Align(intermediate, target);
  result.has_stage_2 = true;
  result.status = result.stage_2.status;
  if (result.status != AlignmentStatus::OK) {
    LOG(WARNING) << "Chained alignment: intermediate to target failed: "
                 << result.status;
    return result;
  }

  result.time_offset_seconds =
      result.stage_1.time_offset_seconds + result.stage_2.time_offset_seconds;
  LOG(INFO) << "Chained alignment: offset " << result.time_offset_seconds
            << " s (" << result.stage_1.time_offset_seconds << " + "
            << result.stage_2.time_offset_seconds << ")";
  return result;
}

} // namespace trackalign
