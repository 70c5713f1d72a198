#include <alignment/fusion.hpp>

#include <cmath>

#include <glog/logging.h>

#include <logging/strings.hpp>

namespace trackalign {

FusedOffset
FuseAxisOffsets(const std::map<std::string, AxisCorrelation> &axes) {
  double weighted_offset = 0.0, total_weight = 0.0;
  size_t axes_used = 0;
  for (const auto &name_and_axis : axes) {
    const AxisCorrelation &axis = name_and_axis.second;
    if (axis.status != AlignmentStatus::OK) {
      LOG(WARNING) << "Dropping axis " << name_and_axis.first
                   << " from offset fusion: " << axis.status;
      continue;
    }
    const double weight = std::abs(axis.normalized_score);
    weighted_offset += weight * axis.offset_sec;
    total_weight += weight;
    ++axes_used;
  }

  if (axes_used == 0 || !(total_weight > 0.0)) {
    return {AlignmentStatus::DEGENERATE_SIGNAL, 0.0, 0.0, 0};
  }
  return {AlignmentStatus::OK, weighted_offset / total_weight,
          total_weight / static_cast<double>(axes_used), axes_used};
}

} // namespace trackalign
