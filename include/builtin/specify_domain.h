#ifndef MATHGRADE_BUILTIN_SPECIFY_DOMAIN_H_
#define MATHGRADE_BUILTIN_SPECIFY_DOMAIN_H_

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include "runtime/value.h"

namespace mathgrade::builtin {

enum class ShapeKind { kScalar, kArray, kSquare };

/// Expected shape of one function input.
struct ShapeSpec {
  ShapeKind kind = ShapeKind::kScalar;
  std::vector<int64_t> shape;

  static ShapeSpec Scalar() { return ShapeSpec(); }
  static ShapeSpec Vector(int64_t length) { return Array({length}); }
  static ShapeSpec Matrix(int64_t rows, int64_t cols) { return Array({rows, cols}); }
  static ShapeSpec Array(std::vector<int64_t> dims);
  /// A square matrix of any size.
  static ShapeSpec Square();

  bool Accepts(const runtime::Value& value) const;
  /// "scalar", "square matrix", "vector of length 3", ...
  std::string Description() const;
};

/// "1st", "2nd", "3rd", then "4th", "11th", "21th".
std::string LowOrdinal(int n);

/// Wraps `impl` so that it only runs on inputs matching `shapes`. Mismatches throw a
/// kDomain util::Error listing every input as ok or in error.
std::shared_ptr<runtime::Function> SpecifyDomain(const std::string& name,
                                                 std::vector<ShapeSpec> shapes,
                                                 runtime::NativeFunction impl);

/// Variadic form: at least `min_length` inputs, each matching `shape`.
std::shared_ptr<runtime::Function> SpecifyDomainVariadic(const std::string& name, ShapeSpec shape,
                                                         int min_length,
                                                         runtime::NativeFunction impl);

}  // namespace mathgrade::builtin

#endif  // MATHGRADE_BUILTIN_SPECIFY_DOMAIN_H_
