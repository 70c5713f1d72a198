#ifndef TRACKALIGN_IO_JSON_CONVERTERS_HPP_
#define TRACKALIGN_IO_JSON_CONVERTERS_HPP_

#include <memory>
#include <string>

#include <nlohmann/json.hpp>

#include <alignment/session.hpp>
#include <alignment/track_aligner.hpp>
#include <correlation/peak.hpp>
#include <tracks/data.hpp>

namespace trackalign {
constexpr char kPositions[] = "positions";
constexpr char kPitch[] = "pitch";
constexpr char kTimeSec[] = "time_sec";
constexpr char kLatitudeDeg[] = "latitude_deg";
constexpr char kLongitudeDeg[] = "longitude_deg";
constexpr char kAltitudeM[] = "altitude_m";
constexpr char kAngleDeg[] = "angle_deg";

constexpr char kTimeOffsetSeconds[] = "time_offset_seconds";
constexpr char kQuality[] = "quality";
constexpr char kStatus[] = "status";
constexpr char kPerAxis[] = "per_axis";
constexpr char kLagSamples[] = "lag_samples";
constexpr char kSubSampleOffset[] = "sub_sample_offset";
constexpr char kNormalizedScore[] = "normalized_score";
constexpr char kOffsetSeconds[] = "offset_seconds";
constexpr char kResidualSpatialOffsetM[] = "residual_spatial_offset_m";
constexpr char kStage1[] = "stage_1";
constexpr char kStage2[] = "stage_2";
constexpr char kResults[] = "results";

// Reads a track of the form
//
//   {"positions": [{"time_sec": ..., "latitude_deg": ..., "longitude_deg": ...,
//                   "altitude_m": ...}, ...],
//    "pitch": [{"time_sec": ..., "angle_deg": ...}, ...]}
//
// where both streams are optional. A null value (but not a null timestamp)
// stands for a missing measurement and becomes NaN. Throws nlohmann::json
// exceptions for missing fields or values of the wrong type.
SensorTrack ParseSensorTrack(const nlohmann::json &track_json);
nlohmann::json SensorTrackToJson(const SensorTrack &track);

nlohmann::json AxisCorrelationToJson(const AxisCorrelation &axis);
// residual_spatial_offset_m is only present if the result has one.
nlohmann::json AlignmentResultToJson(const AlignmentResult &result);
// stage_2 is only present if it was run.
nlohmann::json ChainedAlignmentResultToJson(const ChainedAlignmentResult &result);
// {"time_sec": [...], "<column>": [...], ...}. NaN values become null.
nlohmann::json SynchronizedTableToJson(const SynchronizedTable &table);

std::unique_ptr<nlohmann::json> ReadJsonFile(const std::string &filename);
void WriteJsonFile(const std::string &filename, const nlohmann::json &json);
} // namespace trackalign

#endif // TRACKALIGN_IO_JSON_CONVERTERS_HPP_
