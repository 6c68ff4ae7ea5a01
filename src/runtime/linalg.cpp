#include "runtime/linalg.h"

#include <algorithm>
#include <cmath>
#include <utility>

#include "util/error.h"

namespace mathgrade::runtime {

namespace {

// A pivot at or below this fraction of its column's largest original entry counts as zero.
constexpr double kRelativePivotTolerance = 1e-12;

template <typename Rows>
std::vector<double> ColumnScales(const Rows& a, size_t cols) {
  std::vector<double> scales(cols, 0.0);
  for (const auto& row : a) {
    for (size_t c = 0; c < cols; ++c) {
      scales[c] = std::max(scales[c], std::abs(row[c]));
    }
  }
  return scales;
}

bool NegligiblePivot(Complex pivot, double column_scale) {
  return std::abs(pivot) <= kRelativePivotTolerance * column_scale;
}

std::vector<Complex> Column(const Value& m, int64_t col) {
  std::vector<Complex> out(static_cast<size_t>(m.shape[0]));
  for (int64_t r = 0; r < m.shape[0]; ++r) {
    out[static_cast<size_t>(r)] = m.At(r, col);
  }
  return out;
}

Complex InnerProduct(const std::vector<Complex>& a, const std::vector<Complex>& b) {
  // Conjugate-linear in the first argument.
  Complex sum(0.0, 0.0);
  for (size_t i = 0; i < a.size(); ++i) {
    sum += std::conj(a[i]) * b[i];
  }
  return sum;
}

double VectorNorm(const std::vector<Complex>& a) {
  double sum = 0.0;
  for (const auto& v : a) {
    sum += std::norm(v);
  }
  return std::sqrt(sum);
}

// Solves A x = b in place with Gaussian elimination; returns false when A is singular.
bool Solve(std::vector<std::vector<Complex>> a, std::vector<Complex> b, std::vector<Complex>* x) {
  const size_t n = b.size();
  const std::vector<double> scales = ColumnScales(a, n);
  for (size_t col = 0; col < n; ++col) {
    size_t pivot = col;
    for (size_t r = col + 1; r < n; ++r) {
      if (std::abs(a[r][col]) > std::abs(a[pivot][col])) pivot = r;
    }
    if (NegligiblePivot(a[pivot][col], scales[col])) return false;
    std::swap(a[col], a[pivot]);
    std::swap(b[col], b[pivot]);
    for (size_t r = col + 1; r < n; ++r) {
      Complex factor = a[r][col] / a[col][col];
      for (size_t c = col; c < n; ++c) {
        a[r][c] -= factor * a[col][c];
      }
      b[r] -= factor * b[col];
    }
  }
  x->assign(n, Complex(0.0, 0.0));
  for (size_t i = n; i-- > 0;) {
    Complex sum = b[i];
    for (size_t c = i + 1; c < n; ++c) {
      sum -= a[i][c] * (*x)[c];
    }
    (*x)[i] = sum / a[i][i];
  }
  return true;
}

Value SquareProduct(const Value& lhs, const Value& rhs) {
  const int64_t n = lhs.shape[0];
  Value out = Value::Zeros({n, n});
  for (int64_t r = 0; r < n; ++r) {
    for (int64_t k = 0; k < n; ++k) {
      const Complex a = lhs.At(r, k);
      for (int64_t c = 0; c < n; ++c) {
        out.At(r, c) += a * rhs.At(k, c);
      }
    }
  }
  return out;
}

}  // namespace

Value Identity(int64_t n) {
  Value out = Value::Zeros({n, n});
  for (int64_t i = 0; i < n; ++i) {
    out.At(i, i) = Complex(1.0, 0.0);
  }
  return out;
}

Value MatMul(const Value& lhs, const Value& rhs) {
  if (lhs.IsVector() && rhs.IsVector()) {
    Complex sum(0.0, 0.0);
    for (int64_t i = 0; i < lhs.shape[0]; ++i) {
      sum += lhs.data[i] * rhs.data[i];
    }
    return Value::Scalar(sum);
  }
  if (lhs.IsMatrix() && rhs.IsVector()) {
    const int64_t rows = lhs.shape[0];
    const int64_t inner = lhs.shape[1];
    std::vector<Complex> out(static_cast<size_t>(rows));
    for (int64_t r = 0; r < rows; ++r) {
      for (int64_t k = 0; k < inner; ++k) {
        out[r] += lhs.At(r, k) * rhs.data[k];
      }
    }
    if (rows == 1) return Value::Scalar(out[0]);
    return Value::Vector(std::move(out));
  }
  if (lhs.IsVector() && rhs.IsMatrix()) {
    const int64_t inner = rhs.shape[0];
    const int64_t cols = rhs.shape[1];
    std::vector<Complex> out(static_cast<size_t>(cols));
    for (int64_t c = 0; c < cols; ++c) {
      for (int64_t k = 0; k < inner; ++k) {
        out[c] += lhs.data[k] * rhs.At(k, c);
      }
    }
    if (cols == 1) return Value::Scalar(out[0]);
    return Value::Vector(std::move(out));
  }
  const int64_t rows = lhs.shape[0];
  const int64_t inner = lhs.shape[1];
  const int64_t cols = rhs.shape[1];
  Value out = Value::Zeros({rows, cols});
  for (int64_t r = 0; r < rows; ++r) {
    for (int64_t k = 0; k < inner; ++k) {
      const Complex a = lhs.At(r, k);
      for (int64_t c = 0; c < cols; ++c) {
        out.At(r, c) += a * rhs.At(k, c);
      }
    }
  }
  if (rows == 1 && cols == 1) return Value::Scalar(out.data[0]);
  return out;
}

Value Transpose(const Value& m) {
  if (!m.IsMatrix()) return m;
  Value out = Value::Zeros({m.shape[1], m.shape[0]});
  for (int64_t r = 0; r < m.shape[0]; ++r) {
    for (int64_t c = 0; c < m.shape[1]; ++c) {
      out.At(c, r) = m.At(r, c);
    }
  }
  return out;
}

Value ConjugateTranspose(const Value& m) {
  Value out = Transpose(m);
  for (auto& v : out.data) {
    v = std::conj(v);
  }
  return out;
}

Complex Determinant(const Value& m) {
  const int64_t n = m.shape[0];
  std::vector<std::vector<Complex>> a(static_cast<size_t>(n));
  for (int64_t r = 0; r < n; ++r) {
    a[r] = std::vector<Complex>(m.data.begin() + r * n, m.data.begin() + (r + 1) * n);
  }
  Complex det(1.0, 0.0);
  for (int64_t col = 0; col < n; ++col) {
    int64_t pivot = col;
    for (int64_t r = col + 1; r < n; ++r) {
      if (std::abs(a[r][col]) > std::abs(a[pivot][col])) pivot = r;
    }
    if (a[pivot][col] == Complex(0.0, 0.0)) return Complex(0.0, 0.0);
    if (pivot != col) {
      std::swap(a[pivot], a[col]);
      det = -det;
    }
    det *= a[col][col];
    for (int64_t r = col + 1; r < n; ++r) {
      Complex factor = a[r][col] / a[col][col];
      for (int64_t c = col; c < n; ++c) {
        a[r][c] -= factor * a[col][c];
      }
    }
  }
  return det;
}

Complex Trace(const Value& m) {
  Complex sum(0.0, 0.0);
  for (int64_t i = 0; i < m.shape[0]; ++i) {
    sum += m.At(i, i);
  }
  return sum;
}

Value Inverse(const Value& m) {
  const int64_t n = m.shape[0];
  std::vector<std::vector<Complex>> a(static_cast<size_t>(n),
                                      std::vector<Complex>(static_cast<size_t>(2 * n)));
  for (int64_t r = 0; r < n; ++r) {
    for (int64_t c = 0; c < n; ++c) {
      a[r][c] = m.At(r, c);
    }
    a[r][n + r] = Complex(1.0, 0.0);
  }
  const std::vector<double> scales = ColumnScales(a, static_cast<size_t>(n));
  for (int64_t col = 0; col < n; ++col) {
    int64_t pivot = col;
    for (int64_t r = col + 1; r < n; ++r) {
      if (std::abs(a[r][col]) > std::abs(a[pivot][col])) pivot = r;
    }
    if (NegligiblePivot(a[pivot][col], scales[col])) {
      throw util::Error(util::ErrorKind::kZeroDivision,
                        "Division by zero occurred. Check your input's denominators.");
    }
    std::swap(a[col], a[pivot]);
    const Complex diag = a[col][col];
    for (auto& v : a[col]) {
      v /= diag;
    }
    for (int64_t r = 0; r < n; ++r) {
      if (r == col) continue;
      const Complex factor = a[r][col];
      if (factor == Complex(0.0, 0.0)) continue;
      for (int64_t c = 0; c < 2 * n; ++c) {
        a[r][c] -= factor * a[col][c];
      }
    }
  }
  Value out = Value::Zeros({n, n});
  for (int64_t r = 0; r < n; ++r) {
    for (int64_t c = 0; c < n; ++c) {
      out.At(r, c) = a[r][n + c];
    }
  }
  return out;
}

Value MatrixPower(const Value& m, int64_t exponent) {
  const int64_t n = m.shape[0];
  Value base = exponent < 0 ? Inverse(m) : m;
  uint64_t remaining = exponent < 0 ? static_cast<uint64_t>(-(exponent + 1)) + 1
                                    : static_cast<uint64_t>(exponent);
  Value result = Identity(n);
  while (remaining > 0) {
    if (remaining & 1u) {
      result = SquareProduct(result, base);
    }
    remaining >>= 1;
    if (remaining > 0) {
      base = SquareProduct(base, base);
    }
  }
  return result;
}

double Norm(const Value& v) {
  return VectorNorm(v.data);
}

Value Cross(const Value& a, const Value& b) {
  const auto& x = a.data;
  const auto& y = b.data;
  return Value::Vector({x[1] * y[2] - x[2] * y[1], x[2] * y[0] - x[0] * y[2],
                        x[0] * y[1] - x[1] * y[0]});
}

std::optional<std::vector<Complex>> LeastSquares(const std::vector<Value>& columns,
                                                 const Value& target) {
  // Normal equations G c = A^H t with Gram matrix G = A^H A.
  const size_t k = columns.size();
  std::vector<std::vector<Complex>> gram(k, std::vector<Complex>(k));
  std::vector<Complex> rhs(k);
  for (size_t i = 0; i < k; ++i) {
    for (size_t j = 0; j < k; ++j) {
      gram[i][j] = InnerProduct(columns[i].data, columns[j].data);
    }
    rhs[i] = InnerProduct(columns[i].data, target.data);
  }
  std::vector<Complex> coefficients;
  if (!Solve(std::move(gram), std::move(rhs), &coefficients)) {
    return std::nullopt;
  }
  return coefficients;
}

Value OrthonormalFactor(const Value& m) {
  const int64_t n = m.shape[0];
  const int64_t cols = m.shape[1];
  std::vector<std::vector<Complex>> q;
  for (int64_t c = 0; c < cols; ++c) {
    std::vector<Complex> v = Column(m, c);
    const double original_norm = VectorNorm(v);
    for (const auto& basis : q) {
      const Complex proj = InnerProduct(basis, v);
      for (size_t i = 0; i < v.size(); ++i) {
        v[i] -= proj * basis[i];
      }
    }
    const double norm = VectorNorm(v);
    if (norm <= kRelativePivotTolerance * original_norm) {
      throw util::Error(util::ErrorKind::kZeroDivision,
                        "Division by zero occurred. Check your input's denominators.");
    }
    for (auto& x : v) {
      x /= norm;
    }
    q.push_back(std::move(v));
  }
  Value out = Value::Zeros({n, cols});
  for (int64_t c = 0; c < cols; ++c) {
    for (int64_t r = 0; r < n; ++r) {
      out.At(r, c) = q[c][r];
    }
  }
  return out;
}

}  // namespace mathgrade::runtime
