#include <alignment/residual.hpp>

#include <cmath>

#include <glog/logging.h>

#include <interpolation/time_series.hpp>
#include <math/math.hpp>

namespace trackalign {

namespace {
ChannelSeries ToChannelSeries(const std::vector<double> &times_sec,
                              const std::vector<EnuPoint> &points,
                              double time_offset_sec) {
  CHECK_EQ(times_sec.size(), points.size());
  ChannelSeries result;
  result.channels.resize(3);
  for (size_t i = 0; i < times_sec.size(); ++i) {
    result.times_sec.push_back(times_sec.at(i) + time_offset_sec);
    for (int axis = 0; axis < 3; ++axis) {
      result.channels.at(axis).push_back(points.at(i)(axis));
    }
  }
  return result;
}
} // namespace

bool ResidualSpatialOffset(const std::vector<double> &times_a_sec,
                           const std::vector<EnuPoint> &enu_a,
                           const std::vector<double> &times_b_sec,
                           const std::vector<EnuPoint> &enu_b,
                           double time_offset_sec, double *residual_m) {
  CHECK_NOTNULL(residual_m);
  CHECK_EQ(times_a_sec.size(), enu_a.size());

  const ChannelSeries shifted_b = DropInvalidSamples(
      ToChannelSeries(times_b_sec, enu_b, time_offset_sec));
  std::vector<std::vector<double>> b_at_a;
  for (const std::vector<double> &channel : shifted_b.channels) {
    b_at_a.push_back(
        InterpolateLinear(shifted_b.times_sec, channel, times_a_sec));
  }

  KahanSum<Eigen::Vector3d> total_difference(Eigen::Vector3d::Zero());
  size_t num_covered = 0;
  for (size_t i = 0; i < times_a_sec.size(); ++i) {
    const EnuPoint b_point(b_at_a.at(0).at(i), b_at_a.at(1).at(i),
                           b_at_a.at(2).at(i));
    const Eigen::Vector3d difference = b_point - enu_a.at(i);
    if (std::isnan(difference.sum())) {
      continue;
    }
    total_difference.add(difference);
    ++num_covered;
  }
  if (num_covered == 0) {
    VLOG(1) << "No overlap left for the residual after shifting by "
            << time_offset_sec << " s.";
    return false;
  }

  const Eigen::Vector3d mean_difference =
      total_difference.sum() / static_cast<double>(num_covered);
  VLOG(1) << "Mean ENU residual over " << num_covered
          << " samples: " << mean_difference.transpose();
  *residual_m = mean_difference.norm();
  return true;
}

} // namespace trackalign
