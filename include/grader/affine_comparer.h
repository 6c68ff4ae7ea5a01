#ifndef MATHGRADE_GRADER_AFFINE_COMPARER_H_
#define MATHGRADE_GRADER_AFFINE_COMPARER_H_

#include <optional>
#include <string>
#include <vector>

#include "grader/comparer.h"

namespace mathgrade::grader {

/// Credit for each relation expected = a * student + b; an unset mode is not checked.
struct AffineComparerConfig {
  std::optional<double> equals = 1.0;
  std::optional<double> proportional = 0.5;
  std::optional<double> offset;
  std::optional<double> affine;
  std::string equals_msg;
  std::string proportional_msg =
      "The submitted answer differs from an expected answer by a constant factor.";
  std::string offset_msg;
  std::string affine_msg;
};

/// The earlier form of LinearComparer. A student whose values are all nearly zero never
/// matches, any number of samples is accepted, equality is judged on the summed absolute
/// differences, and the affine fit is an unconstrained least-squares fit.
class AffineComparer : public CorrelatedComparer {
 public:
  explicit AffineComparer(AffineComparerConfig config = AffineComparerConfig());

  std::string Name() const override { return "AffineComparer"; }
  void CheckParamCount(size_t count) const override;
  ComparisonResult CompareAll(const std::vector<std::vector<runtime::Value>>& params,
                              const std::vector<runtime::Value>& students,
                              const ComparerUtils& utils) const override;

  const AffineComparerConfig& config() const { return config_; }

 private:
  AffineComparerConfig config_;
};

/// Sum of |y - x|.
double AbsoluteDifference(const std::vector<runtime::Complex>& x,
                          const std::vector<runtime::Complex>& y);
/// Residual norm of the least-squares fit y = a x + b. When x is constant the columns are
/// dependent and the best fit is the mean of y.
double AffineFitError(const std::vector<runtime::Complex>& x,
                      const std::vector<runtime::Complex>& y);

}  // namespace mathgrade::grader

#endif  // MATHGRADE_GRADER_AFFINE_COMPARER_H_
