#include <alignment/status.hpp>

#include <glog/logging.h>

namespace trackalign {

namespace {
constexpr char kOk[] = "OK";
constexpr char kInsufficientOverlap[] = "INSUFFICIENT_OVERLAP";
constexpr char kDegenerateSignal[] = "DEGENERATE_SIGNAL";
} // namespace

const char *AlignmentStatusName(AlignmentStatus status) {
  switch (status) {
  case AlignmentStatus::OK:
    return kOk;
  case AlignmentStatus::INSUFFICIENT_OVERLAP:
    return kInsufficientOverlap;
  case AlignmentStatus::DEGENERATE_SIGNAL:
    return kDegenerateSignal;
  }
  LOG(FATAL) << "Unknown alignment status " << static_cast<int>(status);
  return "";
}

AlignmentStatus AlignmentStatusFromName(const std::string &name) {
  if (name == kOk) {
    return AlignmentStatus::OK;
  } else if (name == kInsufficientOverlap) {
    return AlignmentStatus::INSUFFICIENT_OVERLAP;
  } else if (name == kDegenerateSignal) {
    return AlignmentStatus::DEGENERATE_SIGNAL;
  }
  throw InvalidInputError("Unknown alignment status name: " + name);
}

} // namespace trackalign
