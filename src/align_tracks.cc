// Estimates the clock offsets of several sensor tracks relative to a reference
// track (typically the drone flight log) by cross-correlating their motion,
// and optionally resamples all the tracks onto one common time grid.
//
// Every track is a JSON file with "positions" and/or "pitch" arrays, see
// io/json_converters.hpp. Example:
//
//   align_tracks --reference_json=drone.json
//     --target_jsons=gnss=gnss.json,gimbal=gimbal.json,incl=incl.json
//     --chained=incl=gimbal --out_json=offsets.json
//     --synchronized_json=synchronized.json

#include <cstdlib>
#include <memory>
#include <sstream>
#include <string>
#include <utility>
#include <vector>

#include <gflags/gflags.h>
#include <glog/logging.h>

#include <nlohmann/json.hpp>

#include <alignment/session.hpp>
#include <alignment/track_aligner.hpp>
#include <io/json_converters.hpp>

DEFINE_string(reference_json, "", "Track that defines the common clock.");
DEFINE_string(reference_name, "reference",
              "Name of the reference track in the outputs.");
DEFINE_string(target_jsons, "",
              "Comma separated list of name=path pairs of the tracks to align "
              "to the reference.");
DEFINE_string(chained, "",
              "Comma separated list of target=intermediate pairs. The target "
              "is aligned through the intermediate track instead of directly, "
              "for targets that share no stream with the reference.");
DEFINE_double(rate_hz, 100.0,
              "Rate of the common time grid used for correlation.");
DEFINE_double(max_lag_seconds, 10.0, "Largest clock offset to look for.");
DEFINE_int32(min_overlap_samples, 8,
             "Minimum number of grid points in the time overlap of two tracks.");
DEFINE_string(out_json, "", "Alignment results.");
DEFINE_string(synchronized_json, "",
              "If set, all the aligned tracks are resampled onto one time grid "
              "on the reference clock and written here.");
DEFINE_double(sync_rate_hz, 0.0,
              "Rate of the synchronized table. 0 means the highest sample "
              "rate of the input tracks.");

namespace {
// Parses "a=b,c=d" into {{a, b}, {c, d}}.
std::vector<std::pair<std::string, std::string>>
ParseKeyValueList(const std::string &list, const std::string &flag_name) {
  std::vector<std::pair<std::string, std::string>> result;
  std::istringstream list_stream(list);
  std::string item;
  while (std::getline(list_stream, item, ',')) {
    if (item.empty()) {
      continue;
    }
    const size_t separator = item.find('=');
    CHECK(separator != std::string::npos && separator > 0 &&
          separator + 1 < item.size())
        << "--" << flag_name << ": expected name=value, got '" << item << "'";
    result.emplace_back(item.substr(0, separator), item.substr(separator + 1));
  }
  return result;
}

trackalign::SensorTrack ReadTrack(const std::string &filename) {
  std::unique_ptr<nlohmann::json> track_json =
      trackalign::ReadJsonFile(filename);
  return trackalign::ParseSensorTrack(*track_json);
}

void Run() {
  trackalign::AlignmentConfig config;
  config.rate_hz = FLAGS_rate_hz;
  config.max_lag_seconds = FLAGS_max_lag_seconds;
  CHECK_GE(FLAGS_min_overlap_samples, 0);
  config.min_overlap_samples = static_cast<size_t>(FLAGS_min_overlap_samples);

  trackalign::AlignmentSession session(config);
  session.AddSource(FLAGS_reference_name, ReadTrack(FLAGS_reference_json));
  session.SetReference(FLAGS_reference_name);
  for (const auto &name_and_path :
       ParseKeyValueList(FLAGS_target_jsons, "target_jsons")) {
    CHECK_NE(name_and_path.first, FLAGS_reference_name)
        << "--target_jsons: '" << name_and_path.first
        << "' is the name of the reference track";
    LOG(INFO) << "Reading " << name_and_path.first << " from "
              << name_and_path.second;
    session.AddSource(name_and_path.first, ReadTrack(name_and_path.second));
  }
  for (const auto &target_and_intermediate :
       ParseKeyValueList(FLAGS_chained, "chained")) {
    session.AddChainedTarget(target_and_intermediate.first,
                             target_and_intermediate.second);
  }

  const size_t num_aligned = session.AlignAll();
  LOG(INFO) << "Aligned " << num_aligned << " of "
            << session.SourceNames().size() - 1 << " tracks.";
  LOG(INFO) << "\n" << session.Summary();

  nlohmann::json results = nlohmann::json::object();
  for (const auto &name_and_result : session.direct_results()) {
    results[name_and_result.first] =
        trackalign::AlignmentResultToJson(name_and_result.second);
  }
  for (const auto &name_and_result : session.chained_results()) {
    results[name_and_result.first] =
        trackalign::ChainedAlignmentResultToJson(name_and_result.second);
  }
  nlohmann::json out_json;
  out_json[trackalign::kResults] = results;
  trackalign::WriteJsonFile(FLAGS_out_json, out_json);

  if (!FLAGS_synchronized_json.empty()) {
    trackalign::WriteJsonFile(FLAGS_synchronized_json,
                              trackalign::SynchronizedTableToJson(
                                  session.Synchronize(FLAGS_sync_rate_hz)));
  }
}
} // namespace

int main(int argc, char **argv) {
  google::InitGoogleLogging(argv[0]);
  google::ParseCommandLineFlags(&argc, &argv, true);
  google::InstallFailureSignalHandler();

  CHECK(!FLAGS_reference_json.empty());
  CHECK(!FLAGS_target_jsons.empty());
  CHECK(!FLAGS_out_json.empty());

  try {
    Run();
  } catch (const std::exception &e) {
    LOG(FATAL) << e.what();
  }

  return EXIT_SUCCESS;
}
