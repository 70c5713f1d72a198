#ifndef TRACKALIGN_LOGGING_STRINGS_HPP_
#define TRACKALIGN_LOGGING_STRINGS_HPP_

#include <cmath>
#include <sstream>
#include <string>
#include <vector>

#include <alignment/status.hpp>
#include <correlation/peak.hpp>

template <typename T>
std::ostream &operator<<(std::ostream &out, const std::vector<T> &v) {
  out << "{";
  for (auto it = v.begin(); it != v.end(); ++it) {
    out << *it;
    if (it + 1 != v.end()) {
      out << ", ";
    }
  }
  out << "}";

  return out;
}

namespace trackalign {

inline std::ostream &operator<<(std::ostream &out, AlignmentStatus status) {
  out << AlignmentStatusName(status);
  return out;
}

inline std::ostream &operator<<(std::ostream &out,
                                const AxisCorrelation &axis) {
  out << axis.status << ": lag " << axis.lag_samples << " "
      << (axis.sub_sample_offset < 0 ? "- " : "+ ")
      << std::abs(axis.sub_sample_offset) << " samples, score "
      << axis.normalized_score << ", offset " << axis.offset_sec << " s";
  return out;
}

} // namespace trackalign

#endif // TRACKALIGN_LOGGING_STRINGS_HPP_
