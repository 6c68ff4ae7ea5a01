#ifndef MATHGRADE_RUNTIME_VALUE_H_
#define MATHGRADE_RUNTIME_VALUE_H_

#include <complex>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace mathgrade::runtime {

using Complex = std::complex<double>;

/// A complex scalar or a dense row-major array of complex scalars. A scalar has an empty
/// shape and exactly one element; an array holds the product of its shape.
struct Value {
  std::vector<int64_t> shape;
  std::vector<Complex> data{Complex(0.0, 0.0)};

  /// Constructors.
  static Value Scalar(Complex v);
  static Value Real(double v) { return Scalar(Complex(v, 0.0)); }
  static Value NaN();
  /// Builds an array; throws a kInternal util::Error if data does not match the shape.
  static Value Array(std::vector<int64_t> shape, std::vector<Complex> data);
  static Value Vector(std::vector<Complex> entries);
  static Value Zeros(std::vector<int64_t> shape);

  bool IsScalar() const { return shape.empty(); }
  int Rank() const { return static_cast<int>(shape.size()); }
  bool IsVector() const { return shape.size() == 1; }
  bool IsMatrix() const { return shape.size() == 2; }
  bool IsTensor() const { return shape.size() > 2; }
  bool IsSquare() const { return IsMatrix() && shape[0] == shape[1]; }

  /// The scalar payload (first element for arrays).
  Complex scalar() const { return data.front(); }
  Complex At(int64_t row, int64_t col) const { return data[row * shape[1] + col]; }
  Complex& At(int64_t row, int64_t col) { return data[row * shape[1] + col]; }

  bool IsReal() const;
  bool IsZero() const;
  bool HasNaN() const;
  bool HasInf() const;

  /// "scalar", "vector", "matrix" or "tensor".
  std::string ShapeName() const;
  /// "vector of length 3", "matrix of shape (rows: 2, cols: 2)", ...
  std::string Description() const;

  /// Formats the value for display in the console.
  std::string ToString() const;
};

bool operator==(const Value& lhs, const Value& rhs);
inline bool operator!=(const Value& lhs, const Value& rhs) { return !(lhs == rhs); }

std::string ShapeNameForRank(size_t rank);
std::string DescribeShape(const std::vector<int64_t>& shape);
std::string FormatComplex(Complex v);

using NativeFunction = std::function<Value(const std::vector<Value>&)>;

/// A callable visible to formulas.
struct Function {
  std::string name;
  /// Exact input count, or the minimum when `variadic` is set.
  int arity = 1;
  bool variadic = false;
  /// True when the implementation checks its own argument count and shapes.
  bool validated = false;
  NativeFunction impl;
};

std::shared_ptr<Function> MakeFunction(std::string name, int arity, NativeFunction impl);

}  // namespace mathgrade::runtime

#endif  // MATHGRADE_RUNTIME_VALUE_H_
