#ifndef MATHGRADE_RUNTIME_LINALG_H_
#define MATHGRADE_RUNTIME_LINALG_H_

#include <cstdint>
#include <optional>
#include <vector>

#include "runtime/value.h"

namespace mathgrade::runtime {

/// n x n identity matrix.
Value Identity(int64_t n);

/// Dot product of two vectors, matrix-vector, vector-matrix or matrix-matrix product.
/// Callers check the inner dimensions; a 1x1 result is returned as a scalar.
Value MatMul(const Value& lhs, const Value& rhs);

Value Transpose(const Value& m);
Value ConjugateTranspose(const Value& m);

/// Determinant via LU decomposition with partial pivoting.
Complex Determinant(const Value& m);
Complex Trace(const Value& m);

/// Matrix inverse; throws a kZeroDivision util::Error for singular input.
Value Inverse(const Value& m);

/// Integer power of a square matrix; zero gives the identity, negative powers invert.
Value MatrixPower(const Value& m, int64_t exponent);

/// Frobenius norm (Euclidean norm for vectors, modulus for scalars).
double Norm(const Value& v);

/// Cross product of two length-3 vectors.
Value Cross(const Value& a, const Value& b);

/// Solves min ||sum_k c_k columns[k] - target|| for the coefficients c_k. Returns
/// std::nullopt when the columns are linearly dependent.
std::optional<std::vector<Complex>> LeastSquares(const std::vector<Value>& columns,
                                                 const Value& target);

/// Orthonormal factor Q of a QR decomposition (modified Gram-Schmidt). R's diagonal is
/// positive, so Q is Haar-distributed for a Gaussian input.
Value OrthonormalFactor(const Value& m);

}  // namespace mathgrade::runtime

#endif  // MATHGRADE_RUNTIME_LINALG_H_
