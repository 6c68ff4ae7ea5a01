#ifndef MATHGRADE_GRADER_COMPARER_H_
#define MATHGRADE_GRADER_COMPARER_H_

#include <cstdint>
#include <string>
#include <vector>

#include "grader/tolerance.h"
#include "runtime/value.h"

namespace mathgrade::grader {

enum class Outcome { kMismatch, kPartial, kMatch };

/// "match", "partial" or "mismatch".
const char* OutcomeName(Outcome outcome);

struct ComparisonResult {
  Outcome ok = Outcome::kMismatch;
  double grade_decimal = 0.0;
  std::string message;

  static ComparisonResult Match(std::string message = "");
  static ComparisonResult Mismatch(std::string message = "");
  /// kMatch at 1, kMismatch at 0 and kPartial in between.
  static ComparisonResult FromGrade(double grade, std::string message = "");
  static ComparisonResult FromBool(bool ok) { return ok ? Match() : Mismatch(); }
};

/// How much a shape mismatch message reveals.
enum class ShapeDetail { kNone, kType, kShape };

/// Grader settings handed to comparers.
struct ComparerUtils {
  Tolerance tolerance = Tolerance::Percent(0.01);
  /// Array-mode graders make the equality comparer check shapes first.
  bool validate_shape = false;
  ShapeDetail shape_detail = ShapeDetail::kType;

  bool WithinTolerance(const runtime::Value& x, const runtime::Value& y) const {
    return grader::WithinTolerance(x, y, tolerance);
  }

  /// Throws a kShape util::Error when the student value does not have `expected` shape,
  /// e.g. "Expected answer to be a vector, but input is a scalar".
  void ValidateShape(const runtime::Value& student, const std::vector<int64_t>& expected) const;
};

class Comparer {
 public:
  virtual ~Comparer() = default;

  /// Name shown in debug output.
  virtual std::string Name() const = 0;

  /// Throws a kConfig util::Error when the comparer cannot use `count` parameters.
  virtual void CheckParamCount(size_t count) const = 0;
};

/// Compares one trial at a time.
class TrialComparer : public Comparer {
 public:
  virtual ComparisonResult Compare(const std::vector<runtime::Value>& params,
                                   const runtime::Value& student,
                                   const ComparerUtils& utils) const = 0;
};

/// Sees every trial at once; `params[t]` and `students[t]` belong to trial t.
class CorrelatedComparer : public Comparer {
 public:
  virtual ComparisonResult CompareAll(const std::vector<std::vector<runtime::Value>>& params,
                                      const std::vector<runtime::Value>& students,
                                      const ComparerUtils& utils) const = 0;
};

/// The default comparer: student equals the single parameter within tolerance.
class EqualityComparer : public TrialComparer {
 public:
  std::string Name() const override { return "EqualityComparer"; }
  void CheckParamCount(size_t count) const override;
  ComparisonResult Compare(const std::vector<runtime::Value>& params,
                           const runtime::Value& student,
                           const ComparerUtils& utils) const override;
};

/// Student must be real and in [start, stop].
class BetweenComparer : public TrialComparer {
 public:
  std::string Name() const override { return "BetweenComparer"; }
  void CheckParamCount(size_t count) const override;
  ComparisonResult Compare(const std::vector<runtime::Value>& params,
                           const runtime::Value& student,
                           const ComparerUtils& utils) const override;
};

/// Student equals target modulo modulus (e.g. angles modulo 2*pi).
class CongruenceComparer : public TrialComparer {
 public:
  std::string Name() const override { return "CongruenceComparer"; }
  void CheckParamCount(size_t count) const override;
  ComparisonResult Compare(const std::vector<runtime::Value>& params,
                           const runtime::Value& student,
                           const ComparerUtils& utils) const override;
};

/// Student is a nonzero eigenvector of params[0] with eigenvalue params[1].
class EigenvectorComparer : public TrialComparer {
 public:
  std::string Name() const override { return "EigenvectorComparer"; }
  void CheckParamCount(size_t count) const override;
  ComparisonResult Compare(const std::vector<runtime::Value>& params,
                           const runtime::Value& student,
                           const ComparerUtils& utils) const override;
};

/// Student is a nonzero vector in the span of the parameter vectors.
class VectorSpanComparer : public TrialComparer {
 public:
  std::string Name() const override { return "VectorSpanComparer"; }
  void CheckParamCount(size_t count) const override;
  ComparisonResult Compare(const std::vector<runtime::Value>& params,
                           const runtime::Value& student,
                           const ComparerUtils& utils) const override;
};

/// Student equals the parameter vector up to an overall phase.
class VectorPhaseComparer : public TrialComparer {
 public:
  std::string Name() const override { return "VectorPhaseComparer"; }
  void CheckParamCount(size_t count) const override;
  ComparisonResult Compare(const std::vector<runtime::Value>& params,
                           const runtime::Value& student,
                           const ComparerUtils& utils) const override;
};

/// Full credit for equality, partial credit when every trial differs from the expected
/// value by the same nonzero factor.
class ConstantMultipleComparer : public CorrelatedComparer {
 public:
  explicit ConstantMultipleComparer(
      double grade_decimal = 0.5,
      std::string message =
          "The submitted answer differs from the expected answer by a constant multiple");

  std::string Name() const override { return "ConstantMultipleComparer"; }
  void CheckParamCount(size_t count) const override;
  ComparisonResult CompareAll(const std::vector<std::vector<runtime::Value>>& params,
                              const std::vector<runtime::Value>& students,
                              const ComparerUtils& utils) const override;

 private:
  double grade_decimal_;
  std::string message_;
};

/// Throws a kConfig util::Error unless `count` equals `expected`.
void RequireParamCount(const std::string& comparer, size_t count, size_t expected);

/// Every trial value, flattened into one sequence of scalars.
std::vector<runtime::Complex> Flatten(const std::vector<runtime::Value>& values);

}  // namespace mathgrade::grader

#endif  // MATHGRADE_GRADER_COMPARER_H_
