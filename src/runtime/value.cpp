#include "runtime/value.h"

#include <cmath>
#include <iomanip>
#include <limits>
#include <sstream>
#include <utility>

#include "util/error.h"

namespace mathgrade::runtime {

namespace {

std::string FormatReal(double v) {
  if (std::isnan(v)) return "nan";
  if (std::isinf(v)) return v > 0 ? "inf" : "-inf";
  std::ostringstream out;
  out << std::setprecision(12) << v;
  return out.str();
}

void AppendArray(const Value& value, size_t dim, size_t* offset, std::ostringstream* out) {
  *out << "[";
  const int64_t extent = value.shape[dim];
  for (int64_t i = 0; i < extent; ++i) {
    if (i > 0) *out << ", ";
    if (dim + 1 == value.shape.size()) {
      *out << FormatComplex(value.data[*offset]);
      ++*offset;
    } else {
      AppendArray(value, dim + 1, offset, out);
    }
  }
  *out << "]";
}

}  // namespace

Value Value::Scalar(Complex v) {
  Value val;
  val.data[0] = v;
  return val;
}

Value Value::NaN() {
  return Real(std::numeric_limits<double>::quiet_NaN());
}

Value Value::Array(std::vector<int64_t> shape, std::vector<Complex> data) {
  int64_t expected = 1;
  for (int64_t dim : shape) {
    expected *= dim;
  }
  if (expected != static_cast<int64_t>(data.size()) || expected == 0) {
    throw util::Error(util::ErrorKind::kInternal,
                      "Array data does not match shape " + DescribeShape(shape));
  }
  Value val;
  val.shape = std::move(shape);
  val.data = std::move(data);
  return val;
}

Value Value::Vector(std::vector<Complex> entries) {
  std::vector<int64_t> shape{static_cast<int64_t>(entries.size())};
  return Array(std::move(shape), std::move(entries));
}

Value Value::Zeros(std::vector<int64_t> shape) {
  int64_t size = 1;
  for (int64_t dim : shape) {
    size *= dim;
  }
  return Array(std::move(shape), std::vector<Complex>(static_cast<size_t>(size)));
}

bool Value::IsReal() const {
  for (const auto& v : data) {
    if (v.imag() != 0.0) return false;
  }
  return true;
}

bool Value::IsZero() const {
  for (const auto& v : data) {
    if (v != Complex(0.0, 0.0)) return false;
  }
  return true;
}

bool Value::HasNaN() const {
  for (const auto& v : data) {
    if (std::isnan(v.real()) || std::isnan(v.imag())) return true;
  }
  return false;
}

bool Value::HasInf() const {
  for (const auto& v : data) {
    if (std::isinf(v.real()) || std::isinf(v.imag())) return true;
  }
  return false;
}

std::string Value::ShapeName() const {
  return ShapeNameForRank(shape.size());
}

std::string Value::Description() const {
  return DescribeShape(shape);
}

std::string Value::ToString() const {
  if (IsScalar()) {
    return FormatComplex(data[0]);
  }
  std::ostringstream out;
  size_t offset = 0;
  AppendArray(*this, 0, &offset, &out);
  return out.str();
}

bool operator==(const Value& lhs, const Value& rhs) {
  return lhs.shape == rhs.shape && lhs.data == rhs.data;
}

std::string ShapeNameForRank(size_t rank) {
  switch (rank) {
    case 0:
      return "scalar";
    case 1:
      return "vector";
    case 2:
      return "matrix";
    default:
      return "tensor";
  }
}

std::string DescribeShape(const std::vector<int64_t>& shape) {
  const std::string name = ShapeNameForRank(shape.size());
  if (shape.empty()) {
    return name;
  }
  if (shape.size() == 1) {
    return name + " of length " + std::to_string(shape[0]);
  }
  if (shape.size() == 2) {
    return name + " of shape (rows: " + std::to_string(shape[0]) +
           ", cols: " + std::to_string(shape[1]) + ")";
  }
  std::string dims;
  for (size_t i = 0; i < shape.size(); ++i) {
    if (i > 0) dims += ", ";
    dims += std::to_string(shape[i]);
  }
  return name + " of shape (" + dims + ")";
}

std::string FormatComplex(Complex v) {
  if (v.imag() == 0.0) {
    return FormatReal(v.real());
  }
  if (v.real() == 0.0) {
    return FormatReal(v.imag()) + "*i";
  }
  std::string imag = FormatReal(std::fabs(v.imag()));
  return FormatReal(v.real()) + (v.imag() < 0 ? " - " : " + ") + imag + "*i";
}

std::shared_ptr<Function> MakeFunction(std::string name, int arity, NativeFunction impl) {
  auto fn = std::make_shared<Function>();
  fn->name = std::move(name);
  fn->arity = arity;
  fn->impl = std::move(impl);
  return fn;
}

}  // namespace mathgrade::runtime
