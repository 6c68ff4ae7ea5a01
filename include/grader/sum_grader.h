#ifndef MATHGRADE_GRADER_SUM_GRADER_H_
#define MATHGRADE_GRADER_SUM_GRADER_H_

#include <functional>
#include <memory>
#include <set>
#include <string>

#include "grader/config.h"
#include "grader/grader.h"
#include "runtime/environment.h"
#include "runtime/value.h"

namespace mathgrade::grader {

/// A summation `sum_{variable=lower}^{upper} summand`.
struct SumAnswer {
  std::string lower;
  std::string upper;
  std::string summand;
  std::string summation_variable;
};

struct SumConfig {
  /// Formula preset with tolerance 1e-12 and 2 samples.
  GraderConfig base = DefaultBase();
  /// Stands in for an infinite limit.
  double infty_val = 1e3;
  /// Stands in for an infinite limit when fact or factorial is used.
  double infty_val_fact = 80;
  /// 0 sums every integer, 1 odd integers only, 2 even integers only.
  int even_odd = 0;
  /// Largest finite limit magnitude; bounds the number of terms in any sum.
  double max_limit = 1e6;

  static GraderConfig DefaultBase();
};

/// Grades a student's summation by evaluating both sums numerically in sampled
/// bindings. `infty` is available in limits; infinite limits are truncated.
class SumGrader {
 public:
  /// Throws a kConfig util::Error for invalid configuration.
  explicit SumGrader(SumConfig config, parser::ParseCache* cache = nullptr);

  GradeResult Grade(const SumAnswer& answer, const SumAnswer& student,
                    const GradeOptions& options = GradeOptions()) const;

  /// Evaluates `sum` in `scope`. Functions used in the limits and the summand are added
  /// to `functions_used` when it is not null.
  runtime::Value EvaluateSum(const SumAnswer& sum,
                             std::shared_ptr<const runtime::Environment> scope,
                             const runtime::EvalOptions& options,
                             std::set<std::string>* functions_used = nullptr) const;

  /// Adds `summand(n)` for integer n between the limits, in either order. Infinite limits
  /// become +/-infty_val; finite limits beyond +/-max_limit are rejected.
  static runtime::Value PerformSummation(const std::function<runtime::Value(double)>& summand,
                                         double lower, double upper, int even_odd,
                                         double infty_val, double max_limit = 1e6);

  const SumConfig& config() const { return config_; }
  const Grader& core() const { return core_; }

 private:
  void ValidateSummationVariable(const std::string& name) const;

  SumConfig config_;
  Grader core_;
  std::shared_ptr<runtime::Environment> scope_;
};

}  // namespace mathgrade::grader

#endif  // MATHGRADE_GRADER_SUM_GRADER_H_
