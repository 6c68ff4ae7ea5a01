#include "grader/linear_comparer.h"

#include <cmath>
#include <utility>

#include "runtime/linalg.h"
#include "util/error.h"

namespace mathgrade::grader {

namespace {

using runtime::Complex;
using runtime::Value;

constexpr double kConstantTolerance = 1e-24;

double ResidualNorm(const std::vector<Complex>& x, const std::vector<Complex>& y, Complex a,
                    Complex b) {
  double sum = 0.0;
  for (size_t i = 0; i < x.size(); ++i) {
    sum += std::norm(y[i] - (a * x[i] + b));
  }
  return std::sqrt(sum);
}

Complex Mean(const std::vector<Complex>& v) {
  Complex sum(0.0, 0.0);
  for (const auto& x : v) sum += x;
  return v.empty() ? sum : sum / static_cast<double>(v.size());
}

void CheckCredit(const char* mode, const std::optional<double>& credit) {
  if (credit && (*credit < 0.0 || *credit > 1.0)) {
    throw util::Error(util::ErrorKind::kConfig,
                      std::string("LinearComparer credit for '") + mode + "' must lie in [0, 1]");
  }
}

}  // namespace

double EqualsFitError(const std::vector<Complex>& x, const std::vector<Complex>& y) {
  return ResidualNorm(x, y, Complex(1.0, 0.0), Complex(0.0, 0.0));
}

double ProportionalFitError(const std::vector<Complex>& x, const std::vector<Complex>& y) {
  Complex cross(0.0, 0.0);
  double gram = 0.0;
  for (size_t i = 0; i < x.size(); ++i) {
    cross += std::conj(x[i]) * y[i];
    gram += std::norm(x[i]);
  }
  const Complex a = gram > 0.0 ? cross / gram : Complex(0.0, 0.0);
  return ResidualNorm(x, y, a, Complex(0.0, 0.0));
}

double OffsetFitError(const std::vector<Complex>& x, const std::vector<Complex>& y) {
  std::vector<Complex> difference(x.size());
  for (size_t i = 0; i < x.size(); ++i) {
    difference[i] = y[i] - x[i];
  }
  return ResidualNorm(x, y, Complex(1.0, 0.0), Mean(difference));
}

double LinearFitError(const std::vector<Complex>& x, const std::vector<Complex>& y) {
  const Complex x_mean = Mean(x);
  const Complex y_mean = Mean(y);
  Complex cross(0.0, 0.0);
  double spread = 0.0;
  double scale = 0.0;
  for (size_t i = 0; i < x.size(); ++i) {
    cross += std::conj(x[i] - x_mean) * (y[i] - y_mean);
    spread += std::norm(x[i] - x_mean);
    scale += std::norm(x[i]);
  }
  if (spread <= kConstantTolerance * scale || spread == 0.0) {
    return OffsetFitError(x, y);
  }
  const Complex a = cross / spread;
  return ResidualNorm(x, y, a, y_mean - a * x_mean);
}

LinearComparer::LinearComparer(LinearComparerConfig config) : config_(std::move(config)) {
  CheckCredit("equals", config_.equals);
  CheckCredit("proportional", config_.proportional);
  CheckCredit("offset", config_.offset);
  CheckCredit("linear", config_.linear);
}

void LinearComparer::CheckParamCount(size_t count) const {
  RequireParamCount(Name(), count, 1);
}

ComparisonResult LinearComparer::CompareAll(const std::vector<std::vector<Value>>& params,
                                            const std::vector<Value>& students,
                                            const ComparerUtils& utils) const {
  if (utils.validate_shape && !students.empty()) {
    utils.ValidateShape(students[0], params[0][0].shape);
  }
  if (students.size() < 3) {
    throw util::Error(util::ErrorKind::kConfig,
                      "Cannot perform linear comparison with less than 3 samples");
  }

  std::vector<Value> expected_values;
  bool student_zero = true;
  bool expected_zero = true;
  for (size_t t = 0; t < students.size(); ++t) {
    const Value& expected = params[t][0];
    expected_values.push_back(expected);
    student_zero = student_zero && IsNearlyZero(students[t], utils.tolerance, &expected);
    expected_zero = expected_zero && expected.IsZero();
  }
  const bool comparing_zero = student_zero || expected_zero;

  const std::vector<Complex> x = Flatten(students);
  const std::vector<Complex> y = Flatten(expected_values);
  if (x.size() != y.size()) {
    return ComparisonResult::Mismatch();
  }
  const double student_norm = runtime::Norm(Value::Vector(x));

  struct Mode {
    const std::optional<double>* credit;
    const std::string* message;
    double (*fit)(const std::vector<Complex>&, const std::vector<Complex>&);
    bool zero_compatible;
  };
  const Mode modes[] = {
      {&config_.equals, &config_.equals_msg, &EqualsFitError, true},
      {&config_.proportional, &config_.proportional_msg, &ProportionalFitError, false},
      {&config_.offset, &config_.offset_msg, &OffsetFitError, true},
      {&config_.linear, &config_.linear_msg, &LinearFitError, false},
  };

  bool any_mode = false;
  double best_grade = 0.0;
  std::string best_message;
  for (const auto& mode : modes) {
    if (!mode.credit->has_value() || (comparing_zero && !mode.zero_compatible)) {
      continue;
    }
    double grade = 0.0;
    std::string message;
    if (IsNearlyZero(mode.fit(x, y), utils.tolerance, &student_norm)) {
      grade = **mode.credit;
      message = *mode.message;
    }
    // Highest credit wins; the message breaks ties.
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
