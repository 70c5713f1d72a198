#ifndef TRACKALIGN_MATH_MATH_HPP_
#define TRACKALIGN_MATH_MATH_HPP_

#include <cstddef>
#include <vector>

namespace trackalign {

// Summing accumulator using Kahan's algorithm:
// https://en.wikipedia.org/wiki/Kahan_summation_algorithm
template <typename T> class KahanSum {
public:
  explicit KahanSum(const T &zero) : sum_(zero), remainder_(zero) {}

  void add(const T &v) {
    const T proposed_update = v + remainder_;
    const T updated_sum = sum_ + proposed_update;
    const T actual_update = updated_sum - sum_;
    remainder_ = proposed_update - actual_update;
    sum_ = updated_sum;
  }

  const T &sum() const { return sum_; }

private:
  T sum_, remainder_;
};

// Arithmetic mean, 0 for an empty input.
inline double Mean(const std::vector<double> &values) {
  if (values.empty()) {
    return 0.0;
  }
  KahanSum<double> total(0.0);
  for (const double v : values) {
    total.add(v);
  }
  return total.sum() / static_cast<double>(values.size());
}

// Copy of the input with its mean subtracted.
inline std::vector<double> Demeaned(const std::vector<double> &values) {
  const double mean = Mean(values);
  std::vector<double> result;
  result.reserve(values.size());
  for (const double v : values) {
    result.push_back(v - mean);
  }
  return result;
}

} // namespace trackalign

#endif // TRACKALIGN_MATH_MATH_HPP_
