#ifndef TRACKALIGN_ALIGNMENT_SESSION_HPP_
#define TRACKALIGN_ALIGNMENT_SESSION_HPP_

#include <map>
#include <string>
#include <vector>

#include <alignment/track_aligner.hpp>
#include <interpolation/resample.hpp>
#include <tracks/data.hpp>

namespace trackalign {

constexpr char kPositionsStream[] = "positions";
constexpr char kPitchStream[] = "pitch";

constexpr char kLatitudeColumn[] = "latitude_deg";
constexpr char kLongitudeColumn[] = "longitude_deg";
constexpr char kAltitudeColumn[] = "altitude_m";
constexpr char kPitchColumn[] = "pitch_deg";

// [source name][stream name]
typedef std::map<std::string, std::map<std::string, StreamInfo>>
    SessionStreamInfo;

// Several sources resampled onto one uniform grid on the reference clock.
struct SynchronizedTable {
  std::vector<double> times_sec;
  // Keyed by <source>_<channel>, e.g. "gimbal_pitch_deg". Every column has
  // the same length as times_sec. NaN where the source has no data.
  std::map<std::string, std::vector<double>> columns;
};

// A set of named sensor sources recorded by devices with unrelated clocks.
// One of them is the reference; every other source is aligned to it either
// directly or through an intermediate source, after which all the sources can
// be resampled onto a shared time grid.
//
// Typical use:
//
//   AlignmentSession session(config);
//   session.AddSource("drone", drone_track);
//   session.AddSource("gimbal", gimbal_track);
//   session.AddSource("inclinometer", inclinometer_track);
//   session.SetReference("drone");
//   session.AddChainedTarget("inclinometer", "gimbal");
//   session.AlignAll();
//   const SynchronizedTable table = session.Synchronize(0);
//
// Any change to the set of sources discards the alignment results.
class AlignmentSession {
public:
  explicit AlignmentSession(const AlignmentConfig &config = AlignmentConfig());

  // Registers a source, replacing (with a warning) a source of the same
  // name. Throws InvalidInputError for an empty name, the name of the
  // current reference, a track with no streams, non-increasing timestamps or
  // a stream where every sample has a NaN value.
  void AddSource(const std::string &name, const SensorTrack &track);

  // Returns false if there is no such source. Also drops the chained
  // alignments that go through the source and the reference if it was the
  // reference.
  bool RemoveSource(const std::string &name);

  bool HasSource(const std::string &name) const;
  std::vector<std::string> SourceNames() const;

  // Throws InvalidInputError if the source is not registered.
  void SetReference(const std::string &name);
  const std::string &reference() const { return reference_; }

  // Aligns target to the reference through intermediate instead of
  // directly. Both must be registered and different. Throws
  // InvalidInputError otherwise.
  void AddChainedTarget(const std::string &target,
                        const std::string &intermediate);

  // Coverage of every stream with at least two samples, on the clock of the
  // device that recorded it.
  SessionStreamInfo SourceInfo() const;

  // Highest mean sample rate over all the streams, 0 without any streams.
  double MaxSampleRate() const;

  // Time range, on the reference clock, where every stream of every source
  // with a known clock offset has data. Known offsets are: zero for the
  // reference, the alignment result for successfully aligned sources, and
  // zero for every source if no reference has been set (the sources are
  // then assumed to share one clock). Empty if there is no such time.
  TimeRange CommonTimeRange() const;

  // Aligns every source other than the reference. A failed alignment is
  // logged and stored, and does not prevent aligning the other sources. So
  // does a pair of tracks that cannot be aligned at all (e.g. no stream type
  // in common), see alignment_errors().
  // Returns the number of successfully aligned sources.
  //
  // Throws InvalidInputError if no reference is set.
  size_t AlignAll();

  // Outcome of the last AlignAll() for every direct target.
  const std::map<std::string, AlignmentResult> &direct_results() const {
    return direct_results_;
  }
  // Same for the chained targets.
  const std::map<std::string, ChainedAlignmentResult> &
  chained_results() const {
    return chained_results_;
  }

  // Sources the last AlignAll() could not align at all, with the reason.
  const std::map<std::string, std::string> &alignment_errors() const {
    return alignment_errors_;
  }

  // Offset to add to the source timestamps to bring them onto the reference
  // clock. Returns false if the offset is not known (see CommonTimeRange()).
  bool ClockOffset(const std::string &name, double *offset_sec) const;

  // Resamples every source with a known clock offset onto a uniform grid
  // over CommonTimeRange(). Sources whose offset is unknown (e.g. because
  // their alignment failed) are skipped with a warning.
  //
  // rate_hz of 0 means MaxSampleRate(). Throws InvalidInputError for a
  // negative rate, a rate above MaxSampleRate() or an empty common time
  // range.
  SynchronizedTable Synchronize(double rate_hz) const;

  // Multi-line human readable description of the sources, their coverage and
  // the alignment outcomes.
  std::string Summary() const;

private:
  void ClearResults();

  const TrackAligner aligner_;
  std::map<std::string, SensorTrack> sources_;
  std::string reference_;
  // Target name -> intermediate name.
  std::map<std::string, std::string> chained_targets_;

  std::map<std::string, AlignmentResult> direct_results_;
  std::map<std::string, ChainedAlignmentResult> chained_results_;
  std::map<std::string, std::string> alignment_errors_;
};

} // namespace trackalign

#endif // TRACKALIGN_ALIGNMENT_SESSION_HPP_
