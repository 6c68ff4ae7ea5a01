#include "builtin/builtins.h"

#include <algorithm>
#include <cmath>
#include <functional>
#include <stdexcept>
#include <utility>
#include <vector>

#include "builtin/specify_domain.h"
#include "runtime/linalg.h"
#include "util/error.h"

namespace mathgrade::builtin {

namespace {

using runtime::Complex;
using runtime::Value;
using ScalarFn = std::function<Complex(Complex)>;

constexpr double kPi = 3.14159265358979323846;

// Lanczos approximation, g = 7, n = 9.
constexpr double kLanczosG = 7.0;
constexpr double kLanczosCoefficients[] = {
    0.99999999999980993,     676.5203681218851,     -1259.1392167224028,
    771.32342877765313,      -176.61502916214059,   12.507343278686905,
    -0.13857109526572012,    9.9843695780195716e-6, 1.5056327351493116e-7};

bool IsRealScalar(Complex z) {
  return z.imag() == 0.0;
}

// Applies `fn` to the real part when `z` is real, otherwise to `z` itself. `fn` must
// accept both double and Complex.
template <typename Fn>
Complex Elementwise(Complex z, Fn fn) {
  if (IsRealScalar(z)) {
    return Complex(fn(z.real()), 0.0);
  }
  return fn(z);
}

template <typename Fn>
ScalarFn Lift(Fn fn) {
  return [fn](Complex z) { return Elementwise(z, fn); };
}

double RealOnly(Complex z) {
  if (!IsRealScalar(z)) {
    throw std::domain_error("complex input to a real-valued function");
  }
  return z.real();
}

// Real results where the real function is defined; the principal complex value otherwise.
Complex ScimathSqrt(Complex z) {
  if (IsRealScalar(z)) {
    const double x = z.real();
    return x >= 0.0 ? Complex(std::sqrt(x), 0.0) : Complex(0.0, std::sqrt(-x));
  }
  return std::sqrt(z);
}

Complex ScimathLog(Complex z) {
  if (IsRealScalar(z)) {
    const double x = z.real();
    if (x >= 0.0) return Complex(std::log(x), 0.0);
    return Complex(std::log(-x), kPi);
  }
  return std::log(z);
}

Complex ScimathArcsin(Complex z) {
  if (IsRealScalar(z) && std::fabs(z.real()) <= 1.0) {
    return Complex(std::asin(z.real()), 0.0);
  }
  return std::asin(z);
}

Complex ScimathArccos(Complex z) {
  if (IsRealScalar(z) && std::fabs(z.real()) <= 1.0) {
    return Complex(std::acos(z.real()), 0.0);
  }
  return std::acos(z);
}

Complex ScimathArctanh(Complex z) {
  if (IsRealScalar(z) && std::fabs(z.real()) <= 1.0) {
    return Complex(std::atanh(z.real()), 0.0);
  }
  return std::atanh(z);
}

Complex Arctan(Complex z) {
  return Elementwise(z, [](auto x) { return std::atan(x); });
}

Complex Arccot(Complex z) {
  const double offset = z.real() < 0.0 ? -kPi / 2.0 : kPi / 2.0;
  return Complex(offset, 0.0) - Arctan(z);
}

Complex LanczosGamma(Complex z) {
  if (z.real() < 0.5) {
    // Reflection formula.
    return kPi / (std::sin(kPi * z) * LanczosGamma(1.0 - z));
  }
  z -= 1.0;
  Complex x(kLanczosCoefficients[0], 0.0);
  for (int i = 1; i < 9; ++i) {
    x += kLanczosCoefficients[i] / (z + static_cast<double>(i));
  }
  const Complex t = z + kLanczosG + 0.5;
  return std::sqrt(2.0 * kPi) * std::pow(t, z + 0.5) * std::exp(-t) * x;
}

const std::vector<std::pair<std::string, ScalarFn>>& ScalarFunctions() {
  static const std::vector<std::pair<std::string, ScalarFn>> table{
      {"sin", Lift([](auto x) { return std::sin(x); })},
      {"cos", Lift([](auto x) { return std::cos(x); })},
      {"tan", Lift([](auto x) { return std::tan(x); })},
      {"sec", Lift([](auto x) { return 1.0 / std::cos(x); })},
      {"csc", Lift([](auto x) { return 1.0 / std::sin(x); })},
      {"cot", Lift([](auto x) { return 1.0 / std::tan(x); })},
      {"sqrt", ScimathSqrt},
      {"log10", [](Complex z) { return ScimathLog(z) / std::log(10.0); }},
      {"log2", [](Complex z) { return ScimathLog(z) / std::log(2.0); }},
      {"ln", ScimathLog},
      {"exp", Lift([](auto x) { return std::exp(x); })},
      {"arccos", ScimathArccos},
      {"arcsin", ScimathArcsin},
      {"arctan", Arctan},
      {"arcsec", Lift([](auto x) { return std::acos(1.0 / x); })},
      {"arccsc", Lift([](auto x) { return std::asin(1.0 / x); })},
      {"arccot", Arccot},
      {"abs", [](Complex z) { return Complex(std::abs(z), 0.0); }},
      {"fact", Factorial},
      {"factorial", Factorial},
      {"sinh", Lift([](auto x) { return std::sinh(x); })},
      {"cosh", Lift([](auto x) { return std::cosh(x); })},
      {"tanh", Lift([](auto x) { return std::tanh(x); })},
      {"sech", Lift([](auto x) { return 1.0 / std::cosh(x); })},
      {"csch", Lift([](auto x) { return 1.0 / std::sinh(x); })},
      {"coth", Lift([](auto x) { return 1.0 / std::tanh(x); })},
      {"arcsinh", Lift([](auto x) { return std::asinh(x); })},
      {"arccosh", Lift([](auto x) { return std::acosh(x); })},
      {"arctanh", ScimathArctanh},
      {"arcsech", Lift([](auto x) { return std::acosh(1.0 / x); })},
      {"arccsch", Lift([](auto x) { return std::asinh(1.0 / x); })},
      {"arccoth", Lift([](auto x) { return std::atanh(1.0 / x); })},
      {"floor", [](Complex z) { return Complex(std::floor(RealOnly(z)), 0.0); }},
      {"ceil", [](Complex z) { return Complex(std::ceil(RealOnly(z)), 0.0); }},
  };
  return table;
}

Value MapEntries(const Value& v, const ScalarFn& fn) {
  Value out = v;
  for (auto& x : out.data) {
    x = fn(x);
  }
  return out;
}

std::shared_ptr<runtime::Function> Extremum(const std::string& name, bool want_max) {
  return SpecifyDomainVariadic(
      name, ShapeSpec::Scalar(), 2, [want_max](const std::vector<Value>& args) {
        double best = RealOnly(args[0].scalar());
        for (size_t i = 1; i < args.size(); ++i) {
          const double v = RealOnly(args[i].scalar());
          best = want_max ? std::max(best, v) : std::min(best, v);
        }
        return Value::Real(best);
      });
}

}  // namespace

Complex Factorial(Complex z) {
  if (IsRealScalar(z)) {
    const double x = z.real();
    if (x < 0.0 && std::floor(x) == x) {
      throw util::Error(util::ErrorKind::kDomain,
                        "Error evaluating factorial() or fact() in input. These functions cannot "
                        "be used at negative integer values.");
    }
    return Complex(std::tgamma(x + 1.0), 0.0);
  }
  return LanczosGamma(z + 1.0);
}

void InstallConstants(runtime::Environment* env) {
  env->Define("i", Value::Scalar(Complex(0.0, 1.0)));
  env->Define("j", Value::Scalar(Complex(0.0, 1.0)));
  env->Define("e", Value::Real(std::exp(1.0)));
  env->Define("pi", Value::Real(kPi));
}

void InstallDefaultFunctions(runtime::Environment* env) {
  for (const auto& entry : ScalarFunctions()) {
    const ScalarFn fn = entry.second;
    env->DefineFunction(entry.first,
                        SpecifyDomain(entry.first, {ShapeSpec::Scalar()},
                                      [fn](const std::vector<Value>& args) {
                                        return Value::Scalar(fn(args[0].scalar()));
                                      }));
  }

  env->DefineFunction(
      "arctan2", SpecifyDomain("arctan2", {ShapeSpec::Scalar(), ShapeSpec::Scalar()},
                               [](const std::vector<Value>& args) {
                                 const double x = RealOnly(args[0].scalar());
                                 const double y = RealOnly(args[1].scalar());
                                 if (x == 0.0 && y == 0.0) {
                                   throw util::Error(util::ErrorKind::kDomain,
                                                     "arctan2(0, 0) is undefined");
                                 }
                                 return Value::Real(std::atan2(y, x));
                               }));
  env->DefineFunction(
      "kronecker", SpecifyDomain("kronecker", {ShapeSpec::Scalar(), ShapeSpec::Scalar()},
                                 [](const std::vector<Value>& args) {
                                   const double x = RealOnly(args[0].scalar());
                                   const double y = RealOnly(args[1].scalar());
                                   return Value::Real(x == y ? 1.0 : 0.0);
                                 }));
  env->DefineFunction("min", Extremum("min", false));
  env->DefineFunction("max", Extremum("max", true));

  env->DefineFunction("re", runtime::MakeFunction("re", 1, [](const std::vector<Value>& args) {
                        return MapEntries(args[0],
                                          [](Complex z) { return Complex(z.real(), 0.0); });
                      }));
  env->DefineFunction("im", runtime::MakeFunction("im", 1, [](const std::vector<Value>& args) {
                        return MapEntries(args[0],
                                          [](Complex z) { return Complex(z.imag(), 0.0); });
                      }));
  env->DefineFunction("conj",
                      runtime::MakeFunction("conj", 1, [](const std::vector<Value>& args) {
                        return MapEntries(args[0], [](Complex z) { return std::conj(z); });
                      }));
}

void InstallArrayFunctions(runtime::Environment* env) {
  env->DefineFunction("norm", runtime::MakeFunction("norm", 1, [](const std::vector<Value>& args) {
                        return Value::Real(runtime::Norm(args[0]));
                      }));
  env->DefineFunction("abs", runtime::MakeFunction("abs", 1, [](const std::vector<Value>& args) {
                        if (args[0].Rank() > 1) {
                          throw util::Error(util::ErrorKind::kDomain,
                                            "The abs(...) function expects a scalar or vector. "
                                            "To take the norm of a " +
                                                args[0].ShapeName() + ", try norm(...) instead.");
                        }
                        return Value::Real(runtime::Norm(args[0]));
                      }));
  env->DefineFunction("trans",
                      runtime::MakeFunction("trans", 1, [](const std::vector<Value>& args) {
                        return runtime::Transpose(args[0]);
                      }));
  for (const char* name : {"ctrans", "adj"}) {
    env->DefineFunction(name,
                        runtime::MakeFunction(name, 1, [](const std::vector<Value>& args) {
                          return runtime::ConjugateTranspose(args[0]);
                        }));
  }
  env->DefineFunction("det", SpecifyDomain("det", {ShapeSpec::Square()},
                                           [](const std::vector<Value>& args) {
                                             return Value::Scalar(runtime::Determinant(args[0]));
                                           }));
  env->DefineFunction("trace", SpecifyDomain("trace", {ShapeSpec::Square()},
                                             [](const std::vector<Value>& args) {
                                               return Value::Scalar(runtime::Trace(args[0]));
                                             }));
  env->DefineFunction("cross",
                      SpecifyDomain("cross", {ShapeSpec::Vector(3), ShapeSpec::Vector(3)},
                                    [](const std::vector<Value>& args) {
                                      return runtime::Cross(args[0], args[1]);
                                    }));
}

void InstallDefaultSuffixes(runtime::Environment* env) {
  env->DefineSuffix("%", 0.01);
}

void InstallMetricSuffixes(runtime::Environment* env) {
  env->DefineSuffix("k", 1e3);
  env->DefineSuffix("M", 1e6);
  env->DefineSuffix("G", 1e9);
  env->DefineSuffix("T", 1e12);
  env->DefineSuffix("m", 1e-3);
  env->DefineSuffix("u", 1e-6);
  env->DefineSuffix("n", 1e-9);
  env->DefineSuffix("p", 1e-12);
}

void InstallPauliMatrices(runtime::Environment* env) {
  const Complex zero(0.0, 0.0);
  const Complex one(1.0, 0.0);
  const Complex i(0.0, 1.0);
  env->Define("sigma_x", Value::Array({2, 2}, {zero, one, one, zero}));
  env->Define("sigma_y", Value::Array({2, 2}, {zero, -i, i, zero}));
  env->Define("sigma_z", Value::Array({2, 2}, {one, zero, zero, -one}));
}

void InstallCartesianXyz(runtime::Environment* env) {
  env->Define("hatx", Value::Vector({1.0, 0.0, 0.0}));
  env->Define("haty", Value::Vector({0.0, 1.0, 0.0}));
  env->Define("hatz", Value::Vector({0.0, 0.0, 1.0}));
}

void InstallCartesianIjk(runtime::Environment* env) {
  env->Define("hati", Value::Vector({1.0, 0.0, 0.0}));
  env->Define("hatj", Value::Vector({0.0, 1.0, 0.0}));
  env->Define("hatk", Value::Vector({0.0, 0.0, 1.0}));
}

std::shared_ptr<const runtime::Environment> DefaultScope() {
  static const std::shared_ptr<const runtime::Environment> scope = [] {
    auto env = std::make_shared<runtime::Environment>();
    InstallConstants(env.get());
    InstallDefaultFunctions(env.get());
    InstallDefaultSuffixes(env.get());
    return std::shared_ptr<const runtime::Environment>(std::move(env));
  }();
  return scope;
}

const std::set<std::string>& DefaultFunctionNames() {
  static const std::set<std::string> names = [] {
    runtime::Environment env;
    InstallDefaultFunctions(&env);
    return env.FunctionNames();
  }();
  return names;
}

const std::set<std::string>& DefaultVariableNames() {
  static const std::set<std::string> names = [] {
    runtime::Environment env;
    InstallConstants(&env);
    return env.VariableNames();
  }();
  return names;
}

}  // namespace mathgrade::builtin
