#include <io/json_converters.hpp>

#include <cmath>
#include <fstream>
#include <limits>

#include <glog/logging.h>

namespace trackalign {
namespace {
double ValueOrNan(const nlohmann::json &event_json, const char *key) {
  const nlohmann::json &value = event_json.at(key);
  if (value.is_null()) {
    return std::numeric_limits<double>::quiet_NaN();
  }
  return value.get<double>();
}

nlohmann::json NanToNull(double value) {
  if (std::isnan(value)) {
    return nullptr;
  }
  return value;
}
} // namespace

SensorTrack ParseSensorTrack(const nlohmann::json &track_json) {
  SensorTrack track;
  if (track_json.count(kPositions) > 0) {
    for (const auto &position_json : track_json.at(kPositions)) {
      track.positions.emplace_back();
      TimestampedPosition &position = track.positions.back();
      position.time_sec = position_json.at(kTimeSec).get<double>();
      position.latitude_deg = ValueOrNan(position_json, kLatitudeDeg);
      position.longitude_deg = ValueOrNan(position_json, kLongitudeDeg);
      position.altitude_m = ValueOrNan(position_json, kAltitudeM);
    }
  }
  if (track_json.count(kPitch) > 0) {
    for (const auto &angle_json : track_json.at(kPitch)) {
      track.pitch.push_back({ValueOrNan(angle_json, kAngleDeg),
                             angle_json.at(kTimeSec).get<double>()});
    }
  }
  return track;
}

nlohmann::json SensorTrackToJson(const SensorTrack &track) {
  nlohmann::json result = nlohmann::json::object();
  if (track.HasPositions()) {
    result[kPositions] = nlohmann::json::array();
    for (const TimestampedPosition &position : track.positions) {
      nlohmann::json position_json;
      position_json[kTimeSec] = position.time_sec;
      position_json[kLatitudeDeg] = NanToNull(position.latitude_deg);
      position_json[kLongitudeDeg] = NanToNull(position.longitude_deg);
      position_json[kAltitudeM] = NanToNull(position.altitude_m);
      result[kPositions].push_back(position_json);
    }
  }
  if (track.HasPitch()) {
    result[kPitch] = nlohmann::json::array();
    for (const TimestampedAngle &angle : track.pitch) {
      nlohmann::json angle_json;
      angle_json[kTimeSec] = angle.time_sec;
      angle_json[kAngleDeg] = NanToNull(angle.angle_deg);
      result[kPitch].push_back(angle_json);
    }
  }
  return result;
}

nlohmann::json AxisCorrelationToJson(const AxisCorrelation &axis) {
  nlohmann::json result;
  result[kStatus] = AlignmentStatusName(axis.status);
  result[kLagSamples] = axis.lag_samples;
  result[kSubSampleOffset] = axis.sub_sample_offset;
  result[kNormalizedScore] = axis.normalized_score;
  result[kOffsetSeconds] = axis.offset_sec;
  return result;
}

nlohmann::json AlignmentResultToJson(const AlignmentResult &result) {
  nlohmann::json result_json;
  result_json[kStatus] = AlignmentStatusName(result.status);
  result_json[kTimeOffsetSeconds] = result.time_offset_seconds;
  result_json[kQuality] = result.quality;
  result_json[kPerAxis] = nlohmann::json::object();
  for (const auto &name_and_axis : result.per_axis) {
    result_json[kPerAxis][name_and_axis.first] =
        AxisCorrelationToJson(name_and_axis.second);
  }
  if (result.has_residual) {
    result_json[kResidualSpatialOffsetM] = result.residual_spatial_offset_m;
  }
  return result_json;
}

nlohmann::json
ChainedAlignmentResultToJson(const ChainedAlignmentResult &result) {
  nlohmann::json result_json;
  result_json[kStatus] = AlignmentStatusName(result.status);
  result_json[kTimeOffsetSeconds] = result.time_offset_seconds;
  result_json[kStage1] = AlignmentResultToJson(result.stage_1);
  if (result.has_stage_2) {
    result_json[kStage2] = AlignmentResultToJson(result.stage_2);
  }
  return result_json;
}

nlohmann::json SynchronizedTableToJson(const SynchronizedTable &table) {
  nlohmann::json result;
  result[kTimeSec] = table.times_sec;
  for (const auto &name_and_column : table.columns) {
    CHECK_EQ(name_and_column.second.size(), table.times_sec.size());
    nlohmann::json column = nlohmann::json::array();
    for (const double value : name_and_column.second) {
      column.push_back(NanToNull(value));
    }
    result[name_and_column.first] = column;
  }
  return result;
}

std::unique_ptr<nlohmann::json> ReadJsonFile(const std::string &filename) {
  std::ifstream file_stream(filename);
  CHECK(file_stream.good()) << "Could not open " << filename;
  std::unique_ptr<nlohmann::json> result(new nlohmann::json());
  file_stream >> *result;
  return result;
}

void WriteJsonFile(const std::string &filename, const nlohmann::json &json) {
  std::ofstream file_stream(filename);
  CHECK(file_stream.good()) << "Could not open " << filename << " for writing";
  file_stream << json.dump(2) << std::endl;
}
} // namespace trackalign
