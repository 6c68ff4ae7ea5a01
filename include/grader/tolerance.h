#ifndef MATHGRADE_GRADER_TOLERANCE_H_
#define MATHGRADE_GRADER_TOLERANCE_H_

#include <string>

#include "runtime/value.h"

namespace mathgrade::grader {

/// An absolute tolerance, or a percentage of a reference norm.
struct Tolerance {
  bool percentage = false;
  /// Absolute bound, or the percentage itself (5 for "5%").
  double value = 0.0;

  static Tolerance Absolute(double value);
  static Tolerance Percent(double percent);
  /// Parses "5%", "0.01%" or a plain non-negative number; anything else is a kConfig
  /// util::Error.
  static Tolerance Parse(const std::string& text);

  /// The absolute bound for a reference of the given norm.
  double BoundFor(double reference_norm) const;
  std::string ToString() const;
};

/// |x - y| <= tol using the Frobenius norm of the difference. A percentage tolerance is
/// relative to |x|, so a zero x demands exact equality. Scalar infinities compare exactly.
/// Incompatible shapes throw a kShape util::Error.
bool WithinTolerance(const runtime::Value& x, const runtime::Value& y, const Tolerance& tol);

/// |x| <= tol. A percentage tolerance needs a reference; without one this throws a
/// kConfig util::Error.
bool IsNearlyZero(double x_norm, const Tolerance& tol, const double* reference_norm = nullptr);
bool IsNearlyZero(const runtime::Value& x, const Tolerance& tol,
                  const runtime::Value* reference = nullptr);

}  // namespace mathgrade::grader

#endif  // MATHGRADE_GRADER_TOLERANCE_H_
