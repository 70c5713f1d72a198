#ifndef TRACKALIGN_ALIGNMENT_RESIDUAL_HPP_
#define TRACKALIGN_ALIGNMENT_RESIDUAL_HPP_

#include <vector>

#include <geometry/geodetic.hpp>

namespace trackalign {

// Remaining spatial discrepancy between two ENU tracks once track b has been
// shifted in time by time_offset_sec (t_b' = t_b + time_offset_sec).
//
// Track b is linearly interpolated at every sample of a that falls within the
// shifted span of b, and the result is the norm of the mean per-axis
// difference (b - a). Samples with NaN coordinates on either side are
// skipped. Returns false (leaving residual_m untouched) if no sample of a is
// covered.
bool ResidualSpatialOffset(const std::vector<double> &times_a_sec,
                           const std::vector<EnuPoint> &enu_a,
                           const std::vector<double> &times_b_sec,
                           const std::vector<EnuPoint> &enu_b,
                           double time_offset_sec, double *residual_m);

} // namespace trackalign

#endif // TRACKALIGN_ALIGNMENT_RESIDUAL_HPP_
