#ifndef TRACKALIGN_ALIGNMENT_TRACK_ALIGNER_HPP_
#define TRACKALIGN_ALIGNMENT_TRACK_ALIGNER_HPP_

#include <cstddef>
#include <map>
#include <string>
#include <vector>

#include <alignment/status.hpp>
#include <correlation/peak.hpp>
#include <interpolation/time_series.hpp>
#include <tracks/data.hpp>

namespace trackalign {

constexpr char kEastAxis[] = "east";
constexpr char kNorthAxis[] = "north";
constexpr char kUpAxis[] = "up";
constexpr char kPitchAxis[] = "pitch";

struct AlignmentConfig {
  // Rate of the common time grid both tracks are resampled to.
  double rate_hz = 100.0;
  // The correlation looks for offsets within [-max_lag_seconds,
  // max_lag_seconds].
  double max_lag_seconds = 10.0;
  // Fewer grid points in the time overlap of two tracks yield
  // INSUFFICIENT_OVERLAP. At least 3 (a peak needs two neighbours).
  size_t min_overlap_samples = 8;
};

// Throws InvalidInputError for a non-positive rate, a negative or NaN lag
// window, a lag window of more than INT_MAX samples or
// min_overlap_samples < 3.
void ValidateAlignmentConfig(const AlignmentConfig &config);

struct AlignmentResult {
  AlignmentStatus status = AlignmentStatus::DEGENERATE_SIGNAL;
  // Add to the target timestamps to bring them onto the reference clock.
  // Zero unless status is OK.
  double time_offset_seconds = 0.0;
  // In [0, 1]. Zero unless status is OK.
  double quality = 0.0;
  // Empty if the tracks did not overlap enough to be correlated.
  std::map<std::string, AxisCorrelation> per_axis;
  // Position alignment only.
  bool has_residual = false;
  double residual_spatial_offset_m = 0.0;
};

struct ChainedAlignmentResult {
  // Status of the first stage that failed, OK if both succeeded.
  AlignmentStatus status = AlignmentStatus::DEGENERATE_SIGNAL;
  // stage_1 + stage_2 offsets, zero unless status is OK.
  double time_offset_seconds = 0.0;
  // Reference <-> intermediate.
  AlignmentResult stage_1;
  // Intermediate <-> target. Only filled in if stage 1 succeeded.
  bool has_stage_2 = false;
  AlignmentResult stage_2;
};

// Estimates constant clock offsets between tracks recorded by different
// devices by cross-correlating their motion.
//
// Every call is independent and const, so one aligner can be shared between
// threads.
class TrackAligner {
public:
  // Throws InvalidInputError if the config is invalid.
  explicit TrackAligner(const AlignmentConfig &config = AlignmentConfig());

  // Projects both tracks onto a local East-North-Up frame around the first
  // valid reference position, correlates each of the three axes and fuses
  // the per-axis offsets. Also computes the residual spatial offset between
  // the tracks after alignment.
  //
  // Throws InvalidInputError for empty tracks, tracks without a single valid
  // position and non-increasing timestamps.
  AlignmentResult
  AlignPositions(const std::vector<TimestampedPosition> &reference,
                 const std::vector<TimestampedPosition> &target) const;

  // Single axis alignment of two angle series. The result quality is the
  // |score| of the correlation peak.
  AlignmentResult
  AlignAttitudes(const std::vector<TimestampedAngle> &reference,
                 const std::vector<TimestampedAngle> &target) const;

  // Position alignment if both tracks carry positions, otherwise attitude
  // alignment if both carry pitch. Throws InvalidInputError if the tracks
  // have no stream type in common.
  AlignmentResult Align(const SensorTrack &reference,
                        const SensorTrack &target) const;

  // Aligns target to reference through an intermediate track that overlaps
  // both of them:
  //
  //   offset(target -> reference) =
  //       offset(target -> intermediate) + offset(intermediate -> reference)
  //
  // Stops after the first stage that fails.
  ChainedAlignmentResult AlignChained(const SensorTrack &reference,
                                      const SensorTrack &intermediate,
                                      const SensorTrack &target) const;

  const AlignmentConfig &config() const { return config_; }

private:
  // Resamples the two series onto a common grid and locates the correlation
  // peak of every channel. Returns the resampling status; per-axis outcomes
  // go to per_axis.
  AlignmentStatus
  CorrelateChannels(const ChannelSeries &reference, const ChannelSeries &target,
                    const std::vector<std::string> &axis_names,
                    std::map<std::string, AxisCorrelation> *per_axis) const;

  const AlignmentConfig config_;
};

} // namespace trackalign

#endif // TRACKALIGN_ALIGNMENT_TRACK_ALIGNER_HPP_
