#include "grader/tolerance.h"

#include <cmath>
#include <cstdlib>
#include <sstream>

#include "runtime/array_ops.h"
#include "runtime/linalg.h"
#include "util/error.h"
#include "util/string.h"

namespace mathgrade::grader {

namespace {

[[noreturn]] void InvalidTolerance(const std::string& text) {
  throw util::Error(util::ErrorKind::kConfig,
                    "Invalid tolerance '" + text +
                        "': expected a non-negative number or a percentage like '5%'");
}

bool IsInfinite(const runtime::Value& v) {
  return v.IsScalar() && (std::isinf(v.scalar().real()) || std::isinf(v.scalar().imag()));
}

}  // namespace

Tolerance Tolerance::Absolute(double value) {
  if (!(value >= 0.0)) {
    throw util::Error(util::ErrorKind::kConfig, "Tolerance must be non-negative");
  }
  Tolerance tol;
  tol.value = value;
  return tol;
}

Tolerance Tolerance::Percent(double percent) {
  Tolerance tol = Absolute(percent);
  tol.percentage = true;
  return tol;
}

Tolerance Tolerance::Parse(const std::string& text) {
  std::string body = util::Trim(text);
  bool percent = false;
  if (!body.empty() && body.back() == '%') {
    percent = true;
    body.pop_back();
    body = util::Trim(body);
  }
  if (body.empty()) {
    InvalidTolerance(text);
  }
  char* end = nullptr;
  const double value = std::strtod(body.c_str(), &end);
  if (end == nullptr || *end != '\0' || !(value >= 0.0) || std::isinf(value)) {
    InvalidTolerance(text);
  }
  return percent ? Percent(value) : Absolute(value);
}

double Tolerance::BoundFor(double reference_norm) const {
  return percentage ? reference_norm * value / 100.0 : value;
}

std::string Tolerance::ToString() const {
  std::ostringstream out;
  out << value;
  if (percentage) out << '%';
  return out.str();
}

bool WithinTolerance(const runtime::Value& x, const runtime::Value& y, const Tolerance& tol) {
  if (IsInfinite(x) || IsInfinite(y)) {
    return y.IsScalar() && x.IsScalar() && x.scalar() == y.scalar();
  }
  const double bound = tol.BoundFor(runtime::Norm(x));
  return runtime::Norm(runtime::Subtract(x, y)) <= bound;
}

bool IsNearlyZero(double x_norm, const Tolerance& tol, const double* reference_norm) {
  if (tol.percentage && reference_norm == nullptr) {
    throw util::Error(util::ErrorKind::kConfig,
                      "When tolerance is a percentage, a reference value is required.");
  }
  const double bound = tol.percentage ? tol.BoundFor(*reference_norm) : tol.value;
  return x_norm <= bound;
}

bool IsNearlyZero(const runtime::Value& x, const Tolerance& tol,
                  const runtime::Value* reference) {
  if (reference == nullptr) {
    return IsNearlyZero(runtime::Norm(x), tol);
  }
  const double reference_norm = runtime::Norm(*reference);
  return IsNearlyZero(runtime::Norm(x), tol, &reference_norm);
}

}  // namespace mathgrade::grader
