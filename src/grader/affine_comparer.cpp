#include "grader/affine_comparer.h"

#include <cmath>
#include <utility>

#include "grader/linear_comparer.h"
#include "runtime/linalg.h"
#include "util/error.h"

namespace mathgrade::grader {

namespace {

using runtime::Complex;
using runtime::Value;

void CheckCredit(const char* mode, const std::optional<double>& credit) {
  if (credit && (*credit < 0.0 || *credit > 1.0)) {
    throw util::Error(util::ErrorKind::kConfig,
                      std::string("AffineComparer credit for '") + mode + "' must lie in [0, 1]");
  }
}

}  // namespace

double AbsoluteDifference(const std::vector<Complex>& x, const std::vector<Complex>& y) {
  double sum = 0.0;
  for (size_t i = 0; i < x.size(); ++i) {
    sum += std::abs(y[i] - x[i]);
  }
  return sum;
}

double AffineFitError(const std::vector<Complex>& x, const std::vector<Complex>& y) {
  const Value target = Value::Array({static_cast<int64_t>(y.size())}, y);
  const std::vector<Value> columns = {
      Value::Array({static_cast<int64_t>(x.size())}, x),
      Value::Array({static_cast<int64_t>(x.size())},
                   std::vector<Complex>(x.size(), Complex(1.0, 0.0)))};
  Complex a(0.0, 0.0);
  Complex b(0.0, 0.0);
  if (auto coefficients = runtime::LeastSquares(columns, target)) {
    a = (*coefficients)[0];
    b = (*coefficients)[1];
  } else {
    for (const auto& v : y) b += v;
    if (!y.empty()) b /= static_cast<double>(y.size());
  }
  double sum = 0.0;
  for (size_t i = 0; i < x.size(); ++i) {
    sum += std::norm(y[i] - (a * x[i] + b));
  }
  return std::sqrt(sum);
}

AffineComparer::AffineComparer(AffineComparerConfig config) : config_(std::move(config)) {
  CheckCredit("equals", config_.equals);
  CheckCredit("proportional", config_.proportional);
  CheckCredit("offset", config_.offset);
  CheckCredit("affine", config_.affine);
}

void AffineComparer::CheckParamCount(size_t count) const {
  RequireParamCount(Name(), count, 1);
}

ComparisonResult AffineComparer::CompareAll(const std::vector<std::vector<Value>>& params,
                                            const std::vector<Value>& students,
                                            const ComparerUtils& utils) const {
  if (utils.validate_shape && !students.empty()) {
    utils.ValidateShape(students[0], params[0][0].shape);
  }
  std::vector<Value> expected_values;
  for (size_t t = 0; t < students.size(); ++t) {
    expected_values.push_back(params[t][0]);
  }
  const std::vector<Complex> x = Flatten(students);
  const std::vector<Complex> y = Flatten(expected_values);
  if (x.size() != y.size()) {
    return ComparisonResult::Mismatch();
  }
  const double student_norm = runtime::Norm(Value::Vector(x));
  const double expected_norm = runtime::Norm(Value::Vector(y));
  if (IsNearlyZero(student_norm, utils.tolerance, &expected_norm)) {
    return ComparisonResult::Mismatch();
  }

  struct Mode {
    const std::optional<double>* credit;
    const std::string* message;
    double (*fit)(const std::vector<Complex>&, const std::vector<Complex>&);
  };
  const Mode modes[] = {
      {&config_.equals, &config_.equals_msg, &AbsoluteDifference},
      {&config_.proportional, &config_.proportional_msg, &ProportionalFitError},
      {&config_.offset, &config_.offset_msg, &OffsetFitError},
      {&config_.affine, &config_.affine_msg, &AffineFitError},
  };

  bool any_mode = false;
  double best_grade = 0.0;
  std::string best_message;
  for (const auto& mode : modes) {
    if (!mode.credit->has_value()) {
      continue;
    }
    double grade = 0.0;
    std::string message;
    if (IsNearlyZero(mode.fit(x, y), utils.tolerance, &student_norm)) {
      grade = **mode.credit;
      message = *mode.message;
    }
    if (!any_mode || grade > best_grade || (grade == best_grade && message > best_message)) {
      best_grade = grade;
      best_message = message;
    }
    any_mode = true;
  }
  if (!any_mode) {
    return ComparisonResult::Mismatch();
  }
  return ComparisonResult::FromGrade(best_grade, best_message);
}

}  // namespace mathgrade::grader
