#include "gtest/gtest.h"

#include <limits>

#include <alignment/status.hpp>
#include <tracks/data.hpp>

namespace trackalign {
namespace {

class TracksDataTest : public ::testing::Test {};

TEST_F(TracksDataTest, ExtractTimestamps) {
  const std::vector<TimestampedAngle> angles = {{1.0, 0.5}, {2.0, 0.75}};
  EXPECT_EQ(ExtractTimestamps(angles), std::vector<double>({0.5, 0.75}));
  EXPECT_TRUE(ExtractTimestamps(std::vector<TimestampedAngle>()).empty());
}

TEST_F(TracksDataTest, SensorTrackStreams) {
  SensorTrack track;
  EXPECT_TRUE(track.IsEmpty());
  track.pitch.push_back({1.0, 0.0});
  EXPECT_FALSE(track.IsEmpty());
  EXPECT_TRUE(track.HasPitch());
  EXPECT_FALSE(track.HasPositions());
}

TEST_F(TracksDataTest, CheckTimestampsIncreasing) {
  EXPECT_NO_THROW(CheckTimestampsIncreasing({}, "empty"));
  EXPECT_NO_THROW(CheckTimestampsIncreasing({1.0}, "single"));
  EXPECT_NO_THROW(CheckTimestampsIncreasing({-1.0, 0.0, 2.5}, "increasing"));
  EXPECT_THROW(CheckTimestampsIncreasing({0.0, 1.0, 1.0}, "repeated"),
               InvalidInputError);
  EXPECT_THROW(CheckTimestampsIncreasing({0.0, 2.0, 1.0}, "decreasing"),
               InvalidInputError);
  EXPECT_THROW(CheckTimestampsIncreasing(
                   {0.0, std::numeric_limits<double>::quiet_NaN()}, "nan"),
               InvalidInputError);

  try {
    CheckTimestampsIncreasing({0.0, 2.0, 1.0}, "gimbal pitch");
    FAIL();
  } catch (const InvalidInputError &e) {
    EXPECT_NE(std::string(e.what()).find("gimbal pitch"), std::string::npos);
  }
}

TEST_F(TracksDataTest, MakeStreamInfo) {
  const StreamInfo info = MakeStreamInfo({10.0, 10.5, 11.0, 12.0});
  EXPECT_EQ(info.samples, 4);
  EXPECT_DOUBLE_EQ(info.start_sec, 10.0);
  EXPECT_DOUBLE_EQ(info.end_sec, 12.0);
  EXPECT_DOUBLE_EQ(info.duration_sec, 2.0);
  EXPECT_DOUBLE_EQ(info.sample_rate_hz, 2.0);

  EXPECT_DEATH(MakeStreamInfo({1.0}), "");
}

} // namespace
} // namespace trackalign
