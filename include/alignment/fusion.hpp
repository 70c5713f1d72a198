#ifndef TRACKALIGN_ALIGNMENT_FUSION_HPP_
#define TRACKALIGN_ALIGNMENT_FUSION_HPP_

#include <map>
#include <string>

#include <alignment/status.hpp>
#include <correlation/peak.hpp>

namespace trackalign {

struct FusedOffset {
  AlignmentStatus status;
  double offset_sec;
  // Mean |score| of the axes that contributed, in [0, 1].
  double quality;
  size_t axes_used;
};

// Combines per-axis offsets of the axes with OK status:
//
//   offset  = sum(|score_i| * offset_i) / sum(|score_i|)
//   quality = mean(|score_i|)
//
// Returns DEGENERATE_SIGNAL with zero offset and quality if no axis is OK (or
// all OK axes have a zero score).
FusedOffset FuseAxisOffsets(const std::map<std::string, AxisCorrelation> &axes);

} // namespace trackalign

#endif // TRACKALIGN_ALIGNMENT_FUSION_HPP_
