#include "gtest/gtest.h"

#include <cmath>
#include <random>
#include <utility>

#include <alignment/track_aligner.hpp>
#include <geometry/geodetic.hpp>

namespace trackalign {
namespace {

constexpr double kOriginLatDeg = 47.37;
constexpr double kOriginLonDeg = 8.54;
constexpr double kOriginAltM = 450.0;

TimestampedPosition FromEnu(const EnuPoint &enu, double time_sec) {
  const double origin_lat_rad = kOriginLatDeg * M_PI / 180.0;
  TimestampedPosition result;
  result.latitude_deg = kOriginLatDeg + enu.y() / kEarthRadiusM * 180.0 / M_PI;
  result.longitude_deg =
      kOriginLonDeg +
      enu.x() / (kEarthRadiusM * cos(origin_lat_rad)) * 180.0 / M_PI;
  result.altitude_m = kOriginAltM + enu.z();
  result.time_sec = time_sec;
  return result;
}

// True position of the drone at time t. Each axis mixes two incommensurate
// periods that are short compared to the track length.
EnuPoint FlightPath(double t, bool level_flight) {
  return EnuPoint(
      40.0 * sin(2.0 * M_PI * t / 2.3) + 25.0 * sin(2.0 * M_PI * t / 3.7 + 0.5),
      30.0 * sin(2.0 * M_PI * t / 2.9 + 0.3) +
          20.0 * sin(2.0 * M_PI * t / 1.7 + 1.3),
      level_flight ? 0.0
                   : 8.0 * sin(2.0 * M_PI * t / 3.1 + 1.1) +
                         5.0 * sin(2.0 * M_PI * t / 1.3 + 0.2));
}

// True pitch at time t.
double PitchProfile(double t) {
  return 10.0 * sin(2.0 * M_PI * t / 2.1) +
         6.0 * sin(2.0 * M_PI * t / 3.3 + 0.5) +
         2.0 * sin(2.0 * M_PI * t / 0.9 + 2.0);
}

// Half hertz pure tone.
double SlowSine(double t) { return sin(2.0 * M_PI * 0.5 * t); }

class TrackAlignerTest : public ::testing::Test {
protected:
  // Samples the flight path with a device whose clock reads clock_lag_sec
  // less than the true time, so that adding clock_lag_sec to the device
  // timestamps recovers the true time.
  std::vector<TimestampedPosition>
  RecordPositions(double start_sec, double duration_sec, double rate_hz,
                  double clock_lag_sec, double noise_sigma_m = 0.0,
                  bool level_flight = false) {
    std::normal_distribution<double> noise(0.0, 1.0);
    const int num_samples =
        static_cast<int>(std::round(duration_sec * rate_hz)) + 1;
    std::vector<TimestampedPosition> result;
    for (int i = 0; i < num_samples; ++i) {
      const double t = start_sec + static_cast<double>(i) / rate_hz;
      EnuPoint enu = FlightPath(t + clock_lag_sec, level_flight);
      if (noise_sigma_m > 0.0) {
        enu += noise_sigma_m *
               EnuPoint(noise(generator_), noise(generator_),
                        noise(generator_));
      }
      result.push_back(FromEnu(enu, t));
    }
    return result;
  }

  std::vector<TimestampedAngle> RecordPitch(double start_sec,
                                            double duration_sec,
                                            double rate_hz,
                                            double clock_lag_sec,
                                            double noise_sigma_deg = 0.0,
                                            double (*profile)(double) =
                                                PitchProfile) {
    std::normal_distribution<double> noise(0.0, 1.0);
    const int num_samples =
        static_cast<int>(std::round(duration_sec * rate_hz)) + 1;
    std::vector<TimestampedAngle> result;
    for (int i = 0; i < num_samples; ++i) {
      const double t = start_sec + static_cast<double>(i) / rate_hz;
      double pitch = profile(t + clock_lag_sec);
      if (noise_sigma_deg > 0.0) {
        pitch += noise_sigma_deg * noise(generator_);
      }
      result.push_back({pitch, t});
    }
    return result;
  }

  std::mt19937 generator_{42};
};

TEST_F(TrackAlignerTest, ConfigValidation) {
  AlignmentConfig config;
  EXPECT_NO_THROW(ValidateAlignmentConfig(config));
  EXPECT_EQ(config.rate_hz, 100.0);
  EXPECT_EQ(config.max_lag_seconds, 10.0);
  EXPECT_EQ(config.min_overlap_samples, 8);

  config.rate_hz = 0.0;
  EXPECT_THROW(TrackAligner aligner(config), InvalidInputError);
  config = AlignmentConfig();
  config.max_lag_seconds = -1.0;
  EXPECT_THROW(TrackAligner aligner(config), InvalidInputError);
  config = AlignmentConfig();
  config.min_overlap_samples = 2;
  EXPECT_THROW(TrackAligner aligner(config), InvalidInputError);
  // Search window too wide to count in samples.
  config = AlignmentConfig();
  config.max_lag_seconds = 1e8;
  EXPECT_THROW(TrackAligner aligner(config), InvalidInputError);
}

// Sinusoidal horizontal trajectory at 10 Hz over 60 s, target clock 0.215 s
// behind, searched over the default 10 s window.
TEST_F(TrackAlignerTest, PositionOffsetAt10Hz) {
  const TrackAligner aligner;
  const std::vector<TimestampedPosition> reference =
      RecordPositions(0.0, 60.0, 10.0, 0.0);
  const std::vector<TimestampedPosition> target =
      RecordPositions(0.0, 60.0, 10.0, 0.215);

  const AlignmentResult result = aligner.AlignPositions(reference, target);
  ASSERT_EQ(result.status, AlignmentStatus::OK);
  EXPECT_GE(result.time_offset_seconds, 0.20);
  EXPECT_LE(result.time_offset_seconds, 0.23);
  EXPECT_GT(result.quality, 0.9);
  ASSERT_TRUE(result.has_residual);
  EXPECT_LT(result.residual_spatial_offset_m, 1.0);

  ASSERT_EQ(result.per_axis.size(), 3);
  for (const auto &axis : result.per_axis) {
    EXPECT_EQ(axis.second.status, AlignmentStatus::OK) << axis.first;
    EXPECT_GT(axis.second.normalized_score, 0.9) << axis.first;
    EXPECT_NEAR(axis.second.offset_sec, 0.215, 0.015) << axis.first;
  }
}

TEST_F(TrackAlignerTest, NoisyPositionOffset) {
  const TrackAligner aligner;
  const std::vector<TimestampedPosition> reference =
      RecordPositions(0.0, 60.0, 10.0, 0.0, 0.1);
  const std::vector<TimestampedPosition> target =
      RecordPositions(3.05, 50.0, 5.0, 0.37, 0.1);

  const AlignmentResult result = aligner.AlignPositions(reference, target);
  ASSERT_EQ(result.status, AlignmentStatus::OK);
  EXPECT_NEAR(result.time_offset_seconds, 0.37,
              1.0 / aligner.config().rate_hz);
  EXPECT_GT(result.quality, 0.9);
  ASSERT_TRUE(result.has_residual);
  EXPECT_LT(result.residual_spatial_offset_m, 1.0);
}

TEST_F(TrackAlignerTest, SwappingTracksNegatesOffset) {
  const TrackAligner aligner;
  const std::vector<TimestampedPosition> a =
      RecordPositions(0.0, 60.0, 10.0, 0.0);
  const std::vector<TimestampedPosition> b =
      RecordPositions(0.0, 60.0, 10.0, -0.34);

  const AlignmentResult forward = aligner.AlignPositions(a, b);
  const AlignmentResult backward = aligner.AlignPositions(b, a);
  ASSERT_EQ(forward.status, AlignmentStatus::OK);
  ASSERT_EQ(backward.status, AlignmentStatus::OK);
  EXPECT_NEAR(forward.time_offset_seconds, -0.34, 0.01);
  EXPECT_NEAR(forward.time_offset_seconds, -backward.time_offset_seconds,
              1e-3);
}

TEST_F(TrackAlignerTest, SelfAlignment) {
  const TrackAligner aligner;
  const std::vector<TimestampedPosition> track =
      RecordPositions(0.0, 30.0, 10.0, 0.0);
  const AlignmentResult result = aligner.AlignPositions(track, track);
  ASSERT_EQ(result.status, AlignmentStatus::OK);
  EXPECT_NEAR(result.time_offset_seconds, 0.0, 1e-6);
  EXPECT_NEAR(result.quality, 1.0, 1e-6);
  ASSERT_TRUE(result.has_residual);
  EXPECT_NEAR(result.residual_spatial_offset_m, 0.0, 1e-6);
}

TEST_F(TrackAlignerTest, PureSineOffset) {
  const TrackAligner aligner;
  const std::vector<TimestampedAngle> reference =
      RecordPitch(0.0, 60.0, 10.0, 0.0, 0.01, SlowSine);
  const std::vector<TimestampedAngle> target =
      RecordPitch(0.0, 60.0, 10.0, 0.37, 0.01, SlowSine);

  // Several 2 s periods fit into the search window.
  ASSERT_GT(aligner.config().max_lag_seconds, 2.0 * 2.0);
  const AlignmentResult result = aligner.AlignAttitudes(reference, target);
  ASSERT_EQ(result.status, AlignmentStatus::OK);
  EXPECT_NEAR(result.time_offset_seconds, 0.37,
              1.0 / aligner.config().rate_hz);
  EXPECT_GT(result.per_axis.at(kPitchAxis).normalized_score, 0.9);
}

TEST_F(TrackAlignerTest, LevelFlightDropsUpAxis) {
  const TrackAligner aligner;
  const AlignmentResult result = aligner.AlignPositions(
      RecordPositions(0.0, 60.0, 10.0, 0.0, 0.0, true),
      RecordPositions(0.0, 60.0, 10.0, 0.3, 0.0, true));
  ASSERT_EQ(result.status, AlignmentStatus::OK);
  EXPECT_EQ(result.per_axis.at(kUpAxis).status,
            AlignmentStatus::DEGENERATE_SIGNAL);
  EXPECT_EQ(result.per_axis.at(kEastAxis).status, AlignmentStatus::OK);
  EXPECT_EQ(result.per_axis.at(kNorthAxis).status, AlignmentStatus::OK);
  EXPECT_NEAR(result.time_offset_seconds, 0.3, 0.01);
  EXPECT_GT(result.quality, 0.9);
}

TEST_F(TrackAlignerTest, DisjointTracks) {
  const TrackAligner aligner;
  const AlignmentResult result =
      aligner.AlignPositions(RecordPositions(0.0, 30.0, 10.0, 0.0),
                             RecordPositions(100.0, 30.0, 10.0, 0.0));
  EXPECT_EQ(result.status, AlignmentStatus::INSUFFICIENT_OVERLAP);
  EXPECT_EQ(result.time_offset_seconds, 0.0);
  EXPECT_EQ(result.quality, 0.0);
  EXPECT_TRUE(result.per_axis.empty());
  EXPECT_FALSE(result.has_residual);
}

TEST_F(TrackAlignerTest, ShortOverlap) {
  const TrackAligner aligner;
  // 0.05 s of overlap gives 6 grid points at 100 Hz.
  const AlignmentResult result =
      aligner.AlignAttitudes(RecordPitch(0.0, 10.0, 100.0, 0.0),
                             RecordPitch(9.95, 10.0, 100.0, 0.0));
  EXPECT_EQ(result.status, AlignmentStatus::INSUFFICIENT_OVERLAP);
}

TEST_F(TrackAlignerTest, AttitudeOffset) {
  const TrackAligner aligner;
  const std::vector<TimestampedAngle> reference =
      RecordPitch(0.0, 60.0, 50.0, 0.0, 0.05);
  const std::vector<TimestampedAngle> target =
      RecordPitch(0.013, 60.0, 50.0, 0.37, 0.05);

  const AlignmentResult result = aligner.AlignAttitudes(reference, target);
  ASSERT_EQ(result.status, AlignmentStatus::OK);
  EXPECT_NEAR(result.time_offset_seconds, 0.37,
              1.0 / aligner.config().rate_hz);
  EXPECT_GT(result.quality, 0.95);
  EXPECT_FALSE(result.has_residual);
  ASSERT_EQ(result.per_axis.size(), 1);
  EXPECT_DOUBLE_EQ(result.quality,
                   std::abs(result.per_axis.at(kPitchAxis).normalized_score));

  const AlignmentResult backward = aligner.AlignAttitudes(target, reference);
  ASSERT_EQ(backward.status, AlignmentStatus::OK);
  EXPECT_NEAR(result.time_offset_seconds, -backward.time_offset_seconds,
              0.01);
}

TEST_F(TrackAlignerTest, ConstantAttitude) {
  const TrackAligner aligner;
  std::vector<TimestampedAngle> constant = RecordPitch(0.0, 30.0, 50.0, 0.0);
  for (TimestampedAngle &angle : constant) {
    angle.angle_deg = 5.0;
  }
  const AlignmentResult result =
      aligner.AlignAttitudes(RecordPitch(0.0, 30.0, 50.0, 0.0), constant);
  EXPECT_EQ(result.status, AlignmentStatus::DEGENERATE_SIGNAL);
  EXPECT_EQ(result.per_axis.at(kPitchAxis).status,
            AlignmentStatus::DEGENERATE_SIGNAL);
  EXPECT_EQ(result.time_offset_seconds, 0.0);
}

TEST_F(TrackAlignerTest, AlignPicksSharedStream) {
  const TrackAligner aligner;

  SensorTrack drone, gimbal, gnss;
  drone.positions = RecordPositions(0.0, 60.0, 10.0, 0.0);
  drone.pitch = RecordPitch(0.0, 60.0, 50.0, 0.0);
  gimbal.pitch = RecordPitch(0.0, 60.0, 50.0, 0.2);
  gnss.positions = RecordPositions(0.0, 60.0, 10.0, -0.4);

  const AlignmentResult by_pitch = aligner.Align(drone, gimbal);
  ASSERT_EQ(by_pitch.status, AlignmentStatus::OK);
  EXPECT_EQ(by_pitch.per_axis.count(kPitchAxis), 1);
  EXPECT_NEAR(by_pitch.time_offset_seconds, 0.2, 0.01);

  const AlignmentResult by_position = aligner.Align(drone, gnss);
  ASSERT_EQ(by_position.status, AlignmentStatus::OK);
  EXPECT_EQ(by_position.per_axis.size(), 3);
  EXPECT_NEAR(by_position.time_offset_seconds, -0.4, 0.01);

  EXPECT_THROW(aligner.Align(gnss, gimbal), InvalidInputError);
}

TEST_F(TrackAlignerTest, ChainedAlignment) {
  const TrackAligner aligner;

  SensorTrack reference, intermediate, target;
  reference.positions = RecordPositions(0.0, 60.0, 10.0, 0.0);
  // The intermediate clock is 0.42 s behind, the target clock another 0.27 s
  // ahead of it.
  intermediate.positions = RecordPositions(0.0, 60.0, 10.0, 0.42);
  intermediate.pitch = RecordPitch(0.0, 60.0, 50.0, 0.42);
  target.pitch = RecordPitch(0.0, 60.0, 50.0, 0.42 - 0.27);

  const ChainedAlignmentResult result =
      aligner.AlignChained(reference, intermediate, target);
  ASSERT_EQ(result.status, AlignmentStatus::OK);
  ASSERT_TRUE(result.has_stage_2);
  EXPECT_EQ(result.stage_1.per_axis.size(), 3);
  EXPECT_EQ(result.stage_2.per_axis.size(), 1);
  EXPECT_NEAR(result.stage_1.time_offset_seconds, 0.42, 0.01);
  EXPECT_NEAR(result.stage_2.time_offset_seconds, -0.27, 0.01);
  EXPECT_NEAR(result.time_offset_seconds, 0.15, 0.02);
  EXPECT_DOUBLE_EQ(result.time_offset_seconds,
                   result.stage_1.time_offset_seconds +
                       result.stage_2.time_offset_seconds);
}

TEST_F(TrackAlignerTest, ChainedAlignmentStopsAtFirstFailure) {
  const TrackAligner aligner;
  SensorTrack reference, intermediate, target;
  reference.positions = RecordPositions(0.0, 30.0, 10.0, 0.0);
  intermediate.positions = RecordPositions(500.0, 30.0, 10.0, 0.0);
  intermediate.pitch = RecordPitch(500.0, 30.0, 50.0, 0.0);
  target.pitch = RecordPitch(500.0, 30.0, 50.0, 0.0);

  ChainedAlignmentResult result =
      aligner.AlignChained(reference, intermediate, target);
  EXPECT_EQ(result.status, AlignmentStatus::INSUFFICIENT_OVERLAP);
  EXPECT_FALSE(result.has_stage_2);
  EXPECT_EQ(result.time_offset_seconds, 0.0);

  intermediate.positions = RecordPositions(0.0, 30.0, 10.0, 0.0);
  intermediate.pitch = RecordPitch(0.0, 30.0, 50.0, 0.0);
  result = aligner.AlignChained(reference, intermediate, target);
  EXPECT_EQ(result.stage_1.status, AlignmentStatus::OK);
  EXPECT_TRUE(result.has_stage_2);
  EXPECT_EQ(result.status, AlignmentStatus::INSUFFICIENT_OVERLAP);
  EXPECT_EQ(result.time_offset_seconds, 0.0);
}

TEST_F(TrackAlignerTest, InvalidInput) {
  const TrackAligner aligner;
  std::vector<TimestampedPosition> track =
      RecordPositions(0.0, 10.0, 10.0, 0.0);
  EXPECT_THROW(aligner.AlignPositions(track, {}), InvalidInputError);
  EXPECT_THROW(aligner.AlignPositions({}, track), InvalidInputError);

  std::vector<TimestampedPosition> unordered = track;
  std::swap(unordered.at(3).time_sec, unordered.at(4).time_sec);
  EXPECT_THROW(aligner.AlignPositions(track, unordered), InvalidInputError);

  std::vector<TimestampedPosition> all_nan = track;
  for (TimestampedPosition &position : all_nan) {
    position.latitude_deg = NAN;
  }
  EXPECT_THROW(aligner.AlignPositions(all_nan, track), InvalidInputError);
  EXPECT_THROW(aligner.AlignPositions(track, all_nan), InvalidInputError);
}

} // namespace
} // namespace trackalign
