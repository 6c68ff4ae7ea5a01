#ifndef MATHGRADE_GRADER_INTEGRAL_GRADER_H_
#define MATHGRADE_GRADER_INTEGRAL_GRADER_H_

#include <functional>
#include <memory>
#include <optional>
#include <set>
#include <string>

#include "grader/config.h"
#include "grader/grader.h"
#include "runtime/environment.h"
#include "runtime/value.h"

namespace mathgrade::grader {

/// An integral `integral_{lower}^{upper} integrand d(variable)`.
struct IntegralAnswer {
  std::string lower;
  std::string upper;
  std::string integrand;
  std::string integration_variable;
};

/// Adaptive Gauss-Kronrod settings. Integration stops once the error estimate is within
/// max(abs_tol, rel_tol * |value|) and fails after `limit` subintervals.
struct IntegratorOptions {
  double abs_tol = 1.49e-8;
  double rel_tol = 1.49e-8;
  int limit = 50;
};

struct QuadratureResult {
  double value = 0.0;
  double abs_error = 0.0;
  int evaluations = 0;
};

/// Real part, and the imaginary part when the integrand may be complex.
struct IntegralEvaluation {
  QuadratureResult real;
  std::optional<QuadratureResult> imag;

  runtime::Complex value() const {
    return runtime::Complex(real.value, imag ? imag->value : 0.0);
  }
};

struct IntegralConfig {
  /// Formula preset with 1 sample.
  GraderConfig base = DefaultBase();
  /// Integrate real and imaginary parts separately instead of rejecting complex values.
  bool complex_integrand = false;
  IntegratorOptions integrator;

  static GraderConfig DefaultBase();
};

/// Grades a student's definite integral by integrating both integrals numerically in
/// sampled bindings. `infty` is available in the limits; infinite ranges are mapped onto
/// (0, 1] before integrating.
class IntegralGrader {
 public:
  /// Throws a kConfig util::Error for invalid configuration.
  explicit IntegralGrader(IntegralConfig config, parser::ParseCache* cache = nullptr);

  GradeResult Grade(const IntegralAnswer& answer, const IntegralAnswer& student,
                    const GradeOptions& options = GradeOptions()) const;

  /// Integrates `integral` in `scope`. The integration variable may also appear in the
  /// limits, where it keeps its value from `scope`.
  IntegralEvaluation EvaluateIntegral(const IntegralAnswer& integral,
                                      std::shared_ptr<const runtime::Environment> scope,
                                      const runtime::EvalOptions& options,
                                      std::set<std::string>* functions_used = nullptr) const;

  /// Integrates `f` from `lower` to `upper`; reversed limits negate the result. Throws a
  /// kDomain util::Error when the subdivision limit is reached before convergence.
  static QuadratureResult PerformIntegration(const std::function<double(double)>& f,
                                             double lower, double upper,
                                             const IntegratorOptions& options);

  const IntegralConfig& config() const { return config_; }
  const Grader& core() const { return core_; }

 private:
  void ValidateIntegrationVariable(const std::string& name) const;

  IntegralConfig config_;
  Grader core_;
  std::shared_ptr<runtime::Environment> scope_;
};

}  // namespace mathgrade::grader

#endif  // MATHGRADE_GRADER_INTEGRAL_GRADER_H_
