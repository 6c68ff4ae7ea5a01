#include "runtime/array_ops.h"

#include <cmath>
#include <cstdlib>
#include <string>

#include "runtime/linalg.h"
#include "util/error.h"

namespace mathgrade::runtime {

namespace {

const char kDivisionByZero[] = "Division by zero occurred. Check your input's denominators.";

// Largest exponent magnitude at which every integer is exactly representable.
constexpr double kMaxMatrixExponent = 9007199254740992.0;

[[noreturn]] void ShapeError(const std::string& message) {
  throw util::Error(util::ErrorKind::kShape, message);
}

Value Scale(const Value& array, Complex factor) {
  Value out = array;
  for (auto& v : out.data) {
    v *= factor;
  }
  return out;
}

// Scalars and one-element arrays such as [5] or [[5]].
bool IsNumberLike(const Value& v) {
  return v.data.size() == 1;
}

bool IsIntegerValued(Complex v) {
  return v.imag() == 0.0 && std::isfinite(v.real()) && std::floor(v.real()) == v.real();
}

Complex IntegerPower(Complex base, int64_t n) {
  const bool invert = n < 0;
  uint64_t remaining = invert ? static_cast<uint64_t>(-n) : static_cast<uint64_t>(n);
  Complex result(1.0, 0.0);
  Complex square = base;
  while (remaining > 0) {
    if (remaining & 1u) result *= square;
    remaining >>= 1;
    if (remaining > 0) square *= square;
  }
  return invert ? Complex(1.0, 0.0) / result : result;
}

}  // namespace

Complex ScalarDivide(Complex lhs, Complex rhs) {
  if (rhs == Complex(0.0, 0.0)) {
    throw util::Error(util::ErrorKind::kZeroDivision, kDivisionByZero);
  }
  if (lhs.imag() == 0.0 && rhs.imag() == 0.0) {
    return Complex(lhs.real() / rhs.real(), 0.0);
  }
  return lhs / rhs;
}

Complex ScalarPower(Complex base, Complex exponent) {
  if (base == Complex(0.0, 0.0)) {
    if (exponent == Complex(0.0, 0.0)) return Complex(1.0, 0.0);
    if (exponent.imag() == 0.0 && exponent.real() > 0.0) return Complex(0.0, 0.0);
    throw util::Error(util::ErrorKind::kZeroDivision, kDivisionByZero);
  }
  if (base.imag() == 0.0 && exponent.imag() == 0.0) {
    const double b = base.real();
    const double e = exponent.real();
    if (b >= 0.0 || std::floor(e) == e) {
      return Complex(std::pow(b, e), 0.0);
    }
    return std::pow(base, exponent);
  }
  if (IsIntegerValued(exponent) && std::fabs(exponent.real()) <= 100.0) {
    return IntegerPower(base, static_cast<int64_t>(exponent.real()));
  }
  return std::pow(base, exponent);
}

Value Add(const Value& lhs, const Value& rhs) {
  if (lhs.IsScalar() && rhs.IsScalar()) {
    return Value::Scalar(lhs.scalar() + rhs.scalar());
  }
  if (rhs.IsScalar()) {
    if (rhs.IsZero()) return lhs;
    if (IsNumberLike(lhs)) return Value::Scalar(lhs.scalar() + rhs.scalar());
    ShapeError("Cannot add/subtract scalars to a " + lhs.ShapeName() + ".");
  }
  if (lhs.IsScalar()) {
    if (lhs.IsZero()) return rhs;
    if (IsNumberLike(rhs)) return Value::Scalar(lhs.scalar() + rhs.scalar());
    ShapeError("Cannot add/subtract scalars to a " + rhs.ShapeName() + ".");
  }
  if (lhs.shape != rhs.shape) {
    if (IsNumberLike(lhs) && lhs.IsZero()) return rhs;
    if (IsNumberLike(rhs) && rhs.IsZero()) return lhs;
    ShapeError("Cannot add/subtract a " + lhs.Description() + " with a " + rhs.Description() +
               ".");
  }
  Value out = lhs;
  for (size_t i = 0; i < out.data.size(); ++i) {
    out.data[i] += rhs.data[i];
  }
  return out;
}

Value Subtract(const Value& lhs, const Value& rhs) {
  return Add(lhs, Negate(rhs));
}

Value Negate(const Value& v) {
  Value out = v;
  for (auto& x : out.data) {
    x = -x;
  }
  return out;
}

Value Multiply(const Value& lhs, const Value& rhs) {
  if (lhs.IsScalar() && rhs.IsScalar()) {
    return Value::Scalar(lhs.scalar() * rhs.scalar());
  }
  if (lhs.IsScalar()) return Scale(rhs, lhs.scalar());
  if (rhs.IsScalar()) return Scale(lhs, rhs.scalar());
  if (IsNumberLike(lhs)) return Scale(rhs, lhs.scalar());
  if (IsNumberLike(rhs)) return Scale(lhs, rhs.scalar());
  if (lhs.IsTensor() || rhs.IsTensor()) {
    ShapeError("Multiplication of tensor arrays is not currently supported.");
  }
  if (lhs.IsVector() && rhs.IsVector()) {
    if (lhs.shape[0] != rhs.shape[0]) {
      ShapeError("Cannot calculate the dot product of a " + lhs.Description() + " with a " +
                 rhs.Description());
    }
    return MatMul(lhs, rhs);
  }
  const int64_t lhs_inner = lhs.shape.back();
  const int64_t rhs_inner = rhs.shape.front();
  if (lhs_inner != rhs_inner) {
    ShapeError("Cannot multiply a " + lhs.Description() + " with a " + rhs.Description() + ".");
  }
  return MatMul(lhs, rhs);
}

Value Divide(const Value& lhs, const Value& rhs) {
  const bool scalar_divisor = rhs.IsScalar() || (IsNumberLike(rhs) && !lhs.IsScalar());
  if (!scalar_divisor) {
    if (lhs.IsScalar()) {
      ShapeError("Cannot divide by a " + rhs.ShapeName());
    }
    ShapeError("Cannot divide a " + lhs.ShapeName() + " by a " + rhs.ShapeName());
  }
  Value out = lhs;
  const Complex divisor = rhs.scalar();
  for (auto& v : out.data) {
    v = ScalarDivide(v, divisor);
  }
  return out;
}

Value Power(const Value& base, const Value& exponent, bool negative_powers) {
  if (IsNumberLike(base)) {
    if (!IsNumberLike(exponent)) {
      ShapeError("Cannot raise a scalar to power of a " + exponent.ShapeName() + ".");
    }
    return Value::Scalar(ScalarPower(base.scalar(), exponent.scalar()));
  }
  if (!base.IsMatrix()) {
    ShapeError("Cannot raise a " + base.ShapeName() + " to powers.");
  }
  if (!base.IsSquare()) {
    ShapeError("Cannot raise a non-square matrix to powers.");
  }
  if (!IsNumberLike(exponent)) {
    ShapeError("Cannot raise a matrix to " + exponent.ShapeName() + " powers.");
  }
  const Complex e = exponent.scalar();
  if (!IsIntegerValued(e)) {
    ShapeError("Cannot raise a matrix to non-integer powers.");
  }
  if (e.real() < 0 && !negative_powers) {
    ShapeError("Negative matrix powers have been disabled.");
  }
  if (std::fabs(e.real()) > kMaxMatrixExponent) {
    throw util::Error(util::ErrorKind::kOverflow,
                      "Numerical overflow occurred. Matrix powers are limited to exponents of "
                      "magnitude at most 2^53.");
  }
  return MatrixPower(base, static_cast<int64_t>(e.real()));
}

}  // namespace mathgrade::runtime
