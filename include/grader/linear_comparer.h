#ifndef MATHGRADE_GRADER_LINEAR_COMPARER_H_
#define MATHGRADE_GRADER_LINEAR_COMPARER_H_

#include <optional>
#include <string>
#include <vector>

#include "grader/comparer.h"

namespace mathgrade::grader {

/// Credit for each linear relation expected = a * student + b. An unset mode is not
/// checked.
struct LinearComparerConfig {
  /// a = 1, b = 0.
  std::optional<double> equals = 1.0;
  /// b = 0.
  std::optional<double> proportional = 0.5;
  /// a = 1.
  std::optional<double> offset;
  std::optional<double> linear;
  std::string equals_msg;
  std::string proportional_msg =
      "The submitted answer differs from an expected answer by a constant factor.";
  std::string offset_msg;
  std::string linear_msg;
};

/// Fits the student values against the expected values across all trials and awards the
/// best credit among the relations that fit within tolerance. Array values are compared
/// entrywise with one shared relation.
class LinearComparer : public CorrelatedComparer {
 public:
  explicit LinearComparer(LinearComparerConfig config = LinearComparerConfig());

  std::string Name() const override { return "LinearComparer"; }
  void CheckParamCount(size_t count) const override;
  ComparisonResult CompareAll(const std::vector<std::vector<runtime::Value>>& params,
                              const std::vector<runtime::Value>& students,
                              const ComparerUtils& utils) const override;

  const LinearComparerConfig& config() const { return config_; }

 private:
  LinearComparerConfig config_;
};

// Residual norms of the best fit of y by x under each relation.
double EqualsFitError(const std::vector<runtime::Complex>& x,
                      const std::vector<runtime::Complex>& y);
double ProportionalFitError(const std::vector<runtime::Complex>& x,
                            const std::vector<runtime::Complex>& y);
double OffsetFitError(const std::vector<runtime::Complex>& x,
                      const std::vector<runtime::Complex>& y);
/// Falls back to the offset fit when x is constant.
double LinearFitError(const std::vector<runtime::Complex>& x,
                      const std::vector<runtime::Complex>& y);

}  // namespace mathgrade::grader

#endif  // MATHGRADE_GRADER_LINEAR_COMPARER_H_
