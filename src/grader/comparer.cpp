#include "grader/comparer.h"

#include <cmath>
#include <utility>

#include "runtime/array_ops.h"
#include "runtime/linalg.h"
#include "util/error.h"

namespace mathgrade::grader {

namespace {

using runtime::Complex;
using runtime::Value;

[[noreturn]] void ConfigFail(const std::string& message) {
  throw util::Error(util::ErrorKind::kConfig, message);
}

// Least-squares residual of `target` against the span of `columns`, skipping any column
// that depends linearly on the ones before it.
double SpanResidual(const std::vector<Value>& columns, const Value& target) {
  std::vector<Value> basis;
  std::vector<Complex> coefficients;
  for (const auto& column : columns) {
    std::vector<Value> trial = basis;
    trial.push_back(column);
    auto solved = runtime::LeastSquares(trial, target);
    if (!solved) continue;
    basis = std::move(trial);
    coefficients = std::move(*solved);
  }
  Value residual = target;
  for (size_t k = 0; k < basis.size(); ++k) {
    for (size_t i = 0; i < residual.data.size(); ++i) {
      residual.data[i] -= coefficients[k] * basis[k].data[i];
    }
  }
  return runtime::Norm(residual);
}

bool IsRealScalar(const Value& v) {
  return v.IsScalar() && v.IsReal();
}

}  // namespace

const char* OutcomeName(Outcome outcome) {
  switch (outcome) {
    case Outcome::kMismatch:
      return "mismatch";
    case Outcome::kPartial:
      return "partial";
    case Outcome::kMatch:
      return "match";
  }
  return "mismatch";
}

ComparisonResult ComparisonResult::Match(std::string message) {
  return ComparisonResult{Outcome::kMatch, 1.0, std::move(message)};
}

ComparisonResult ComparisonResult::Mismatch(std::string message) {
  return ComparisonResult{Outcome::kMismatch, 0.0, std::move(message)};
}

ComparisonResult ComparisonResult::FromGrade(double grade, std::string message) {
  if (grade >= 1.0) return ComparisonResult{Outcome::kMatch, 1.0, std::move(message)};
  if (grade <= 0.0) return ComparisonResult{Outcome::kMismatch, 0.0, std::move(message)};
  return ComparisonResult{Outcome::kPartial, grade, std::move(message)};
}

void ComparerUtils::ValidateShape(const Value& student,
                                  const std::vector<int64_t>& expected) const {
  if (student.shape == expected) {
    return;
  }
  if (shape_detail == ShapeDetail::kNone) {
    throw util::Error(util::ErrorKind::kShape, "");
  }
  std::string wanted;
  std::string received;
  if (shape_detail == ShapeDetail::kShape) {
    wanted = runtime::DescribeShape(expected);
    received = student.Description();
  } else {
    wanted = runtime::ShapeNameForRank(expected.size());
    received = student.ShapeName();
  }
  std::string message = "Expected answer to be a " + wanted + ", but input is a " + received;
  if (shape_detail == ShapeDetail::kType && wanted == received) {
    message += " of incorrect shape";
  }
  throw util::Error(util::ErrorKind::kShape, message);
}

void RequireParamCount(const std::string& comparer, size_t count, size_t expected) {
  if (count != expected) {
    ConfigFail(comparer + " expects " + std::to_string(expected) +
               " comparer parameters, but received " + std::to_string(count));
  }
}

std::vector<Complex> Flatten(const std::vector<Value>& values) {
  std::vector<Complex> flat;
  for (const auto& v : values) {
    flat.insert(flat.end(), v.data.begin(), v.data.end());
  }
  return flat;
}

void EqualityComparer::CheckParamCount(size_t count) const {
  RequireParamCount(Name(), count, 1);
}

ComparisonResult EqualityComparer::Compare(const std::vector<Value>& params,
                                           const Value& student,
                                           const ComparerUtils& utils) const {
  const Value& expected = params[0];
  if (utils.validate_shape) {
    utils.ValidateShape(student, expected.shape);
  }
  return ComparisonResult::FromBool(utils.WithinTolerance(expected, student));
}

void BetweenComparer::CheckParamCount(size_t count) const {
  RequireParamCount(Name(), count, 2);
}

ComparisonResult BetweenComparer::Compare(const std::vector<Value>& params,
                                          const Value& student, const ComparerUtils&) const {
  if (!IsRealScalar(params[0]) || !IsRealScalar(params[1])) {
    ConfigFail("BetweenComparer limits must be real numbers");
  }
  if (!IsRealScalar(student)) {
    throw util::Error(util::ErrorKind::kDomain, "Input must be real.");
  }
  const double x = student.scalar().real();
  return ComparisonResult::FromBool(params[0].scalar().real() <= x &&
                                    x <= params[1].scalar().real());
}

void CongruenceComparer::CheckParamCount(size_t count) const {
  RequireParamCount(Name(), count, 2);
}

ComparisonResult CongruenceComparer::Compare(const std::vector<Value>& params,
                                             const Value& student,
                                             const ComparerUtils& utils) const {
  const Value& target = params[0];
  const Value& modulus = params[1];
  if (!IsRealScalar(target) || !IsRealScalar(modulus) || modulus.IsZero()) {
    ConfigFail("CongruenceComparer needs a real target and a nonzero real modulus");
  }
  if (!IsRealScalar(student)) {
    return ComparisonResult::Mismatch();
  }
  // Reduce the difference to the representative nearest zero.
  const double m = modulus.scalar().real();
  const double difference = student.scalar().real() - target.scalar().real();
  const double reduced = difference - m * std::round(difference / m);
  const Value shifted = Value::Real(target.scalar().real() + reduced);
  return ComparisonResult::FromBool(utils.WithinTolerance(target, shifted));
}

void EigenvectorComparer::CheckParamCount(size_t count) const {
  RequireParamCount(Name(), count, 2);
}

ComparisonResult EigenvectorComparer::Compare(const std::vector<Value>& params,
                                              const Value& student,
                                              const ComparerUtils& utils) const {
  const Value& matrix = params[0];
  const Value& eigenvalue = params[1];
  if (!matrix.IsSquare() || !eigenvalue.IsScalar()) {
    ConfigFail("EigenvectorComparer needs a square matrix and a scalar eigenvalue");
  }
  utils.ValidateShape(student, {matrix.shape[0]});
  if (utils.WithinTolerance(Value::Real(0.0), Value::Real(runtime::Norm(student)))) {
    return ComparisonResult::Mismatch("Eigenvectors must be nonzero.");
  }
  const Value expected = runtime::Multiply(eigenvalue, student);
  const Value actual = runtime::MatMul(matrix, student);
  return ComparisonResult::FromBool(utils.WithinTolerance(actual, expected));
}

void VectorSpanComparer::CheckParamCount(size_t count) const {
  if (count == 0) {
    ConfigFail("VectorSpanComparer expects at least 1 comparer parameter, but received 0");
  }
}

ComparisonResult VectorSpanComparer::Compare(const std::vector<Value>& params,
                                             const Value& student,
                                             const ComparerUtils& utils) const {
  for (const auto& v : params) {
    if (!v.IsVector() || v.shape != params[0].shape) {
      ConfigFail(
          "Problem Configuration Error: comparer_params should be a list of strings that "
          "evaluate to equal-length vectors");
    }
  }
  utils.ValidateShape(student, params[0].shape);
  if (utils.WithinTolerance(Value::Real(0.0), Value::Real(runtime::Norm(student)))) {
    return ComparisonResult::Mismatch("Input should be a nonzero vector.");
  }
  const double residual = SpanResidual(params, student);
  return ComparisonResult::FromBool(IsNearlyZero(Value::Real(residual), utils.tolerance, &student));
}

void VectorPhaseComparer::CheckParamCount(size_t count) const {
  RequireParamCount(Name(), count, 1);
}

ComparisonResult VectorPhaseComparer::Compare(const std::vector<Value>& params,
                                              const Value& student,
                                              const ComparerUtils& utils) const {
  if (!params[0].IsVector()) {
    ConfigFail(
        "Problem Configuration Error: comparer_params should be a list of strings that "
        "evaluate to a single vector.");
  }
  ComparisonResult in_span = VectorSpanComparer().Compare(params, student, utils);
  if (in_span.ok != Outcome::kMatch) {
    return in_span;
  }
  const bool same_magnitude = utils.WithinTolerance(Value::Real(runtime::Norm(params[0])),
                                                    Value::Real(runtime::Norm(student)));
  return ComparisonResult::FromBool(same_magnitude);
}

ConstantMultipleComparer::ConstantMultipleComparer(double grade_decimal, std::string message)
    : grade_decimal_(grade_decimal), message_(std::move(message)) {
  if (grade_decimal_ < 0.0 || grade_decimal_ > 1.0) {
    ConfigFail("ConstantMultipleComparer grade_decimal must lie in [0, 1]");
  }
}

void ConstantMultipleComparer::CheckParamCount(size_t count) const {
  RequireParamCount(Name(), count, 1);
}

ComparisonResult ConstantMultipleComparer::CompareAll(
    const std::vector<std::vector<Value>>& params, const std::vector<Value>& students,
    const ComparerUtils& utils) const {
  if (students.empty()) {
    return ComparisonResult::Mismatch();
  }
  if (utils.validate_shape) {
    utils.ValidateShape(students[0], params[0][0].shape);
  }
  std::vector<Value> expected_values;
  for (const auto& trial : params) {
    expected_values.push_back(trial[0]);
  }
  const Value x = Value::Vector(Flatten(students));
  const Value y = Value::Vector(Flatten(expected_values));
  if (x.data.size() != y.data.size()) {
    return ComparisonResult::Mismatch();
  }
  const double x_norm = runtime::Norm(x);
  const double mean_norm = x_norm / static_cast<double>(students.size());
  if (IsNearlyZero(mean_norm, utils.tolerance, &x_norm)) {
    return ComparisonResult::Mismatch();
  }
  // Best single factor c with y ~ c x.
  auto solved = runtime::LeastSquares({x}, y);
  if (!solved) {
    return ComparisonResult::Mismatch();
  }
  const Complex factor = solved->front();
  Value residual = y;
  for (size_t i = 0; i < residual.data.size(); ++i) {
    residual.data[i] -= factor * x.data[i];
  }
  if (!IsNearlyZero(runtime::Norm(residual), utils.tolerance, &mean_norm)) {
    return ComparisonResult::Mismatch();
  }
  if (IsNearlyZero(std::abs(factor - 1.0), utils.tolerance, &mean_norm)) {
    return ComparisonResult::Match();
  }
  return ComparisonResult::FromGrade(grade_decimal_, message_);
}

}  // namespace mathgrade::grader
