#include "sampling/sampling_set.h"

#include <cmath>
#include <stdexcept>
#include <utility>

#include "builtin/builtins.h"
#include "parser/parser.h"
#include "runtime/environment.h"
#include "runtime/ops.h"
#include "util/error.h"
#include "util/log.h"

namespace mathgrade::sampling {

namespace {

constexpr double kPi = 3.14159265358979323846;

}  // namespace

RealInterval::RealInterval(double start, double stop)
    : start_(start <= stop ? start : stop), stop_(start <= stop ? stop : start) {}

double RealInterval::Draw(Rng* rng) const {
  return start_ + (stop_ - start_) * rng->Uniform();
}

runtime::Value RealInterval::Sample(Rng* rng) const {
  return runtime::Value::Real(Draw(rng));
}

IntegerRange::IntegerRange(int64_t start, int64_t stop)
    : start_(start <= stop ? start : stop), stop_(start <= stop ? stop : start) {}

runtime::Value IntegerRange::Sample(Rng* rng) const {
  return runtime::Value::Real(static_cast<double>(rng->UniformInt(start_, stop_)));
}

ComplexRectangle::ComplexRectangle(RealInterval re, RealInterval im)
    : re_(std::move(re)), im_(std::move(im)) {}

runtime::Value ComplexRectangle::Sample(Rng* rng) const {
  double re = re_.Draw(rng);
  double im = im_.Draw(rng);
  return runtime::Value::Scalar(runtime::Complex(re, im));
}

ComplexSector::ComplexSector() : modulus_(1.0, 3.0), argument_(0.0, kPi / 2.0) {}

ComplexSector::ComplexSector(RealInterval modulus, RealInterval argument)
    : modulus_(std::move(modulus)), argument_(std::move(argument)) {}

runtime::Value ComplexSector::Sample(Rng* rng) const {
  double modulus = modulus_.Draw(rng);
  double argument = argument_.Draw(rng);
  return runtime::Value::Scalar(std::polar(modulus, argument));
}

DiscreteSet::DiscreteSet(std::vector<runtime::Value> values) : values_(std::move(values)) {
  if (values_.empty()) {
    throw util::Error(util::ErrorKind::kConfig, "DiscreteSet requires at least one value");
  }
}

runtime::Value DiscreteSet::Sample(Rng* rng) const {
  return values_[rng->Index(values_.size())];
}

DependentSampler::DependentSampler(std::vector<std::string> depends, std::string formula)
    : depends_(std::move(depends)), formula_(std::move(formula)) {
  try {
    parsed_ = parser::ParseFormula(formula_);
  } catch (const util::Error&) {
    throw util::Error(util::ErrorKind::kConfig,
                      "Formula error in dependent sampling formula: " + formula_);
  }
}

runtime::Value DependentSampler::Sample(Rng*) const {
  throw util::Error(util::ErrorKind::kInternal,
                    "DependentSampler values must be computed from their dependencies");
}

runtime::Value DependentSampler::Compute(
    const std::map<std::string, runtime::Value>& samples) const {
  runtime::Environment scope(builtin::DefaultScope());
  for (const auto& entry : samples) {
    scope.Define(entry.first, entry.second);
  }
  try {
    return runtime::EvaluateFormula(*parsed_, scope);
  } catch (const util::Error& err) {
    util::LogRecord rec;
    rec.level = util::LogLevel::kDebug;
    rec.component = "sampling";
    rec.operation = "dependent";
    rec.message = formula_ + ": " + err.what();
    rec.error_kind = err.kind();
    util::Log(rec);
    throw util::Error(util::ErrorKind::kConfig,
                      "Formula error in dependent sampling formula: " + formula_);
  }
}

RandomFunction::RandomFunction(RandomFunctionConfig config) : config_(config) {
  if (config_.input_dim < 1 || config_.output_dim < 1 || config_.num_terms < 1) {
    throw util::Error(util::ErrorKind::kConfig,
                      "RandomFunction dimensions and num_terms must be positive");
  }
}

std::shared_ptr<const runtime::Function> RandomFunction::Sample(const std::string& name,
                                                                Rng* rng) const {
  // One (amplitude, frequency, phase) triple per term, input and output component.
  const size_t count = static_cast<size_t>(config_.num_terms) * config_.input_dim *
                       config_.output_dim;
  std::vector<double> a(count);
  std::vector<double> b(count);
  std::vector<double> c(count);
  for (size_t k = 0; k < count; ++k) {
    a[k] = rng->Uniform() / 2.0 + 0.5;
  }
  for (size_t k = 0; k < count; ++k) {
    b[k] = 2.0 * kPi * (rng->Uniform() - 0.5);
  }
  for (size_t k = 0; k < count; ++k) {
    c[k] = 2.0 * kPi * rng->Uniform();
  }

  auto fn = std::make_shared<runtime::Function>();
  fn->name = name;
  fn->arity = config_.input_dim;
  fn->validated = true;
  const RandomFunctionConfig config = config_;
  fn->impl = [config, a, b, c](const std::vector<runtime::Value>& args) {
    if (static_cast<int>(args.size()) != config.input_dim) {
      throw util::Error(util::ErrorKind::kDomain,
                        "Expected " + std::to_string(config.input_dim) +
                            " arguments, but received " + std::to_string(args.size()));
    }
    for (const auto& arg : args) {
      if (!arg.IsScalar()) {
        throw std::domain_error("random functions take scalar inputs");
      }
    }
    std::vector<runtime::Complex> out(config.output_dim, runtime::Complex(0.0, 0.0));
    size_t k = 0;
    for (int term = 0; term < config.num_terms; ++term) {
      for (int input = 0; input < config.input_dim; ++input) {
        const runtime::Complex x = args[input].scalar();
        for (int output = 0; output < config.output_dim; ++output, ++k) {
          out[output] += a[k] * std::sin(b[k] * x + c[k]);
        }
      }
    }
    const double scale = config.amplitude / config.num_terms;
    for (auto& v : out) {
      v = scale * v + config.center;
    }
    if (config.output_dim == 1) {
      return runtime::Value::Scalar(out.front());
    }
    return runtime::Value::Vector(std::move(out));
  };
  return fn;
}

SpecificFunctions::SpecificFunctions(
    std::vector<std::shared_ptr<const runtime::Function>> functions)
    : functions_(std::move(functions)) {
  if (functions_.empty()) {
    throw util::Error(util::ErrorKind::kConfig, "SpecificFunctions requires at least one function");
  }
}

std::shared_ptr<const runtime::Function> SpecificFunctions::Sample(const std::string&,
                                                                   Rng* rng) const {
  return functions_[rng->Index(functions_.size())];
}

}  // namespace mathgrade::sampling
