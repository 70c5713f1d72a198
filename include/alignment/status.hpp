#ifndef TRACKALIGN_ALIGNMENT_STATUS_HPP_
#define TRACKALIGN_ALIGNMENT_STATUS_HPP_

#include <stdexcept>
#include <string>

namespace trackalign {

// Outcome of an alignment step. Anything other than OK means that no usable
// offset was produced, which is an expected result for real sensor data (e.g.
// an optional sensor that was switched off for most of the flight), so it is
// reported as a value rather than thrown.
enum class AlignmentStatus {
  OK,
  // The two tracks overlap in time for fewer than the required number of
  // samples at the resampling rate.
  INSUFFICIENT_OVERLAP,
  // Constant signal, or the correlation peak sits on the search window
  // boundary.
  DEGENERATE_SIGNAL,
};

const char *AlignmentStatusName(AlignmentStatus status);

// Parses the names produced by AlignmentStatusName(). Throws
// InvalidInputError for unknown names.
AlignmentStatus AlignmentStatusFromName(const std::string &name);

// Thrown for caller-side precondition violations: non-increasing timestamps,
// tracks with no valid samples, mismatched column lengths, nonsensical
// configuration. These point at an upstream bug, so they are not folded into
// AlignmentStatus.
class InvalidInputError : public std::invalid_argument {
public:
  explicit InvalidInputError(const std::string &what)
      : std::invalid_argument(what) {}
};

} // namespace trackalign

#endif // TRACKALIGN_ALIGNMENT_STATUS_HPP_
