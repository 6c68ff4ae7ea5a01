#ifndef MATHGRADE_RUNTIME_ARRAY_OPS_H_
#define MATHGRADE_RUNTIME_ARRAY_OPS_H_

#include "runtime/value.h"

namespace mathgrade::runtime {

// Arithmetic over scalars and arrays. Shape violations throw a kShape util::Error naming
// both operands; division by an exact zero throws kZeroDivision.

Value Add(const Value& lhs, const Value& rhs);
Value Subtract(const Value& lhs, const Value& rhs);
Value Multiply(const Value& lhs, const Value& rhs);
Value Divide(const Value& lhs, const Value& rhs);
Value Negate(const Value& v);

/// Scalar powers, and integer powers of square matrices. Negative matrix powers invert
/// the matrix unless `negative_powers` is false.
Value Power(const Value& base, const Value& exponent, bool negative_powers = true);

/// Principal-branch complex power that stays real for a real base and a real exponent
/// whenever the result is real. Zero to a negative or complex power is a division by zero.
Complex ScalarPower(Complex base, Complex exponent);

Complex ScalarDivide(Complex lhs, Complex rhs);

}  // namespace mathgrade::runtime

#endif  // MATHGRADE_RUNTIME_ARRAY_OPS_H_
