#include "grader/integral_grader.h"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <limits>
#include <queue>
#include <sstream>
#include <utility>
#include <vector>

#include "runtime/ops.h"
#include "sampling/rng.h"
#include "util/error.h"
#include "util/log.h"
#include "util/string.h"

namespace mathgrade::grader {

namespace {

using runtime::Value;

// Problems with the limits, the integrand or the convergence of an integral.
class IntegrationError : public util::Error {
 public:
  explicit IntegrationError(const std::string& message)
      : util::Error(util::ErrorKind::kDomain, message) {}
};

// 15-point Kronrod abscissae on [-1, 1]; the odd entries are the 7-point Gauss nodes.
constexpr double kKronrodNodes[8] = {
    0.991455371120812639206854697526329, 0.949107912342758524526189684047851,
    0.864864423359769072789712788640926, 0.741531185599394439863864773280788,
    0.586087235467691130294144845693013, 0.405845151377397166906606412076961,
    0.207784955007898467600689403773245, 0.000000000000000000000000000000000};
constexpr double kKronrodWeights[8] = {
    0.022935322010529224963732008058970, 0.063092092629978553290700663189204,
    0.104790010322250183839876322541518, 0.140653259715525918745189590510238,
    0.169004726639267902826583426598550, 0.190350578064785409913256402421014,
    0.204432940075298892414161999234649, 0.209482141084727828012999174891714};
constexpr double kGaussWeights[4] = {
    0.129484966168869693270611432679082, 0.279705391489276667901467771423780,
    0.381830050505118944950369775488975, 0.417959183673469387755102040816327};

struct Segment {
  double a;
  double b;
  double value;
  double error;

  bool operator<(const Segment& other) const { return error < other.error; }
};

Segment KronrodSegment(const std::function<double(double)>& f, double a, double b,
                       int* evaluations) {
  const double center = 0.5 * (a + b);
  const double half = 0.5 * (b - a);
  const double fc = f(center);
  double gauss = fc * kGaussWeights[3];
  double kronrod = fc * kKronrodWeights[7];
  for (int j = 0; j < 7; ++j) {
    const double dx = half * kKronrodNodes[j];
    const double pair = f(center - dx) + f(center + dx);
    kronrod += kKronrodWeights[j] * pair;
    if (j % 2 == 1) {
      gauss += kGaussWeights[j / 2] * pair;
    }
  }
  *evaluations += 15;
  return Segment{a, b, kronrod * half, std::fabs((kronrod - gauss) * half)};
}

QuadratureResult Adaptive(const std::function<double(double)>& f, double a, double b,
                          const IntegratorOptions& options) {
  QuadratureResult result;
  std::priority_queue<Segment> segments;
  segments.push(KronrodSegment(f, a, b, &result.evaluations));
  double value = segments.top().value;
  double error = segments.top().error;
  int count = 1;
  while (error > std::max(options.abs_tol, options.rel_tol * std::fabs(value))) {
    if (count >= options.limit) {
      std::ostringstream message;
      message << "The maximum number of subdivisions (" << options.limit
              << ") has been achieved.";
      throw IntegrationError(message.str());
    }
    const Segment worst = segments.top();
    segments.pop();
    const double mid = 0.5 * (worst.a + worst.b);
    const Segment left = KronrodSegment(f, worst.a, mid, &result.evaluations);
    const Segment right = KronrodSegment(f, mid, worst.b, &result.evaluations);
    value += left.value + right.value - worst.value;
    error += left.error + right.error - worst.error;
    segments.push(left);
    segments.push(right);
    ++count;
  }
  // Re-add the segments so running-sum cancellation does not leak into the result.
  result.value = 0.0;
  result.abs_error = 0.0;
  while (!segments.empty()) {
    result.value += segments.top().value;
    result.abs_error += segments.top().error;
    segments.pop();
  }
  return result;
}

bool IsValidVariableName(const std::string& name) {
  if (name.empty() || !std::isalpha(static_cast<unsigned char>(name.front()))) {
    return false;
  }
  size_t i = 1;
  while (i < name.size() &&
         (std::isalnum(static_cast<unsigned char>(name[i])) || name[i] == '_')) {
    ++i;
  }
  while (i < name.size() && name[i] == '\'') {
    ++i;
  }
  return i == name.size();
}

double RealLimit(const Value& limit) {
  if (!limit.IsScalar() || std::isnan(limit.scalar().real())) {
    throw IntegrationError("Integration limits must be numbers but have evaluated to " +
                           limit.Description() + ".");
  }
  if (limit.scalar().imag() != 0.0) {
    throw IntegrationError(
        "Integration limits must be real but have evaluated to complex numbers.");
  }
  return limit.scalar().real();
}

std::string FormatQuadrature(const QuadratureResult& r) {
  std::ostringstream out;
  out << runtime::FormatComplex(r.value) << " (error estimate " << r.abs_error << ", "
      << r.evaluations << " evaluations)";
  return out.str();
}

}  // namespace

GraderConfig IntegralConfig::DefaultBase() {
  GraderConfig config = GraderConfig::Formula();
  config.samples = 1;
  return config;
}

IntegralGrader::IntegralGrader(IntegralConfig config, parser::ParseCache* cache)
    : config_(std::move(config)), core_(config_.base, cache) {
  if (config_.integrator.limit < 1) {
    throw util::Error(util::ErrorKind::kConfig, "integrator limit must be at least 1");
  }
  if (!(config_.integrator.abs_tol >= 0) || !(config_.integrator.rel_tol >= 0)) {
    throw util::Error(util::ErrorKind::kConfig,
                      "integrator abs_tol and rel_tol must be non-negative");
  }
  scope_ = std::make_shared<runtime::Environment>(core_.resolved().scope);
  if (!config_.base.user_constants.count("infty")) {
    scope_->Define("infty", Value::Real(std::numeric_limits<double>::infinity()));
  }
}

void IntegralGrader::ValidateIntegrationVariable(const std::string& name) const {
  if (scope_->HasVariable(name) || scope_->HasFunction(name) ||
      config_.base.random_functions.count(name) > 0) {
    throw util::Error(util::ErrorKind::kDomain,
                      "Cannot use " + name +
                          " as integration variable; it is already has another meaning in "
                          "this problem.");
  }
  if (!IsValidVariableName(name)) {
    throw util::Error(util::ErrorKind::kDomain,
                      "Integration variable " + name +
                          " is an invalid variable name. Variable name should begin with a "
                          "letter and contain alphanumeric characters or underscores "
                          "thereafter, but may end in single quotes.");
  }
}

QuadratureResult IntegralGrader::PerformIntegration(const std::function<double(double)>& f,
                                                    double lower, double upper,
                                                    const IntegratorOptions& options) {
  if (lower == upper) {
    return QuadratureResult();
  }
  if (lower > upper) {
    QuadratureResult reversed = PerformIntegration(f, upper, lower, options);
    reversed.value = -reversed.value;
    return reversed;
  }
  const bool lower_inf = std::isinf(lower);
  const bool upper_inf = std::isinf(upper);
  if (!lower_inf && !upper_inf) {
    return Adaptive(f, lower, upper, options);
  }
  // x = anchor +/- (1 - t) / t maps t in (0, 1] onto a half line; the nodes never reach
  // t = 0.
  std::function<double(double)> mapped;
  if (lower_inf && upper_inf) {
    mapped = [&f](double t) {
      const double x = (1.0 - t) / t;
      return (f(x) + f(-x)) / (t * t);
    };
  } else if (upper_inf) {
    mapped = [&f, lower](double t) { return f(lower + (1.0 - t) / t) / (t * t); };
  } else {
    mapped = [&f, upper](double t) { return f(upper - (1.0 - t) / t) / (t * t); };
  }
  return Adaptive(mapped, 0.0, 1.0, options);
}

IntegralEvaluation IntegralGrader::EvaluateIntegral(
    const IntegralAnswer& integral, std::shared_ptr<const runtime::Environment> scope,
    const runtime::EvalOptions& options, std::set<std::string>* functions_used) const {
  runtime::EvalOptions limit_options = options;
  limit_options.allow_inf = true;
  const auto lower_expr = core_.Parse(integral.lower);
  const auto upper_expr = core_.Parse(integral.upper);
  const auto integrand_expr = core_.Parse(integral.integrand);
  const double lower = RealLimit(runtime::EvaluateFormula(*lower_expr, *scope, limit_options));
  const double upper = RealLimit(runtime::EvaluateFormula(*upper_expr, *scope, limit_options));

  if (functions_used) {
    for (const auto* expr : {lower_expr.get(), upper_expr.get(), integrand_expr.get()}) {
      functions_used->insert(expr->functions_used.begin(), expr->functions_used.end());
    }
  }

  auto point_scope = std::make_shared<runtime::Environment>(scope);
  auto integrand = [&](double x) {
    point_scope->Define(integral.integration_variable, Value::Real(x));
    const Value value = runtime::EvaluateFormula(*integrand_expr, *point_scope, options);
    if (!value.IsScalar()) {
      throw IntegrationError("Integrand must evaluate to a number but has evaluated to " +
                             value.Description() + ".");
    }
    return value.scalar();
  };

  IntegralEvaluation out;
  if (config_.complex_integrand) {
    out.real = PerformIntegration([&](double x) { return integrand(x).real(); }, lower, upper,
                                  config_.integrator);
    out.imag = PerformIntegration([&](double x) { return integrand(x).imag(); }, lower, upper,
                                  config_.integrator);
    return out;
  }
  out.real = PerformIntegration(
      [&](double x) {
        const runtime::Complex value = integrand(x);
        if (value.imag() != 0.0) {
          throw IntegrationError(
              "Integrand has evaluated to complex number but must evaluate to a real.");
        }
        return value.real();
      },
      lower, upper, config_.integrator);
  return out;
}

GradeResult IntegralGrader::Grade(const IntegralAnswer& answer, const IntegralAnswer& student,
                                  const GradeOptions& options) const {
  const std::vector<std::pair<std::string, std::string>> fields = {
      {"lower", student.lower},
      {"upper", student.upper},
      {"integrand", student.integrand},
      {"integration_variable", student.integration_variable}};
  std::set<std::string> names;
  try {
    for (const auto& field : fields) {
      if (util::Trim(field.second).empty()) {
        throw util::Error(util::ErrorKind::kParse,
                          "Please enter a value for " + field.first + ", it cannot be empty.");
      }
    }
    ValidateIntegrationVariable(util::Trim(student.integration_variable));
    for (const auto* source : {&student.lower, &student.upper, &student.integrand}) {
      const auto parsed = core_.Parse(*source);
      names.insert(parsed->variables_used.begin(), parsed->variables_used.end());
    }
  } catch (const util::Error& err) {
    if (!util::IsStudentFacing(err.kind())) throw;
    return core_.StudentError(err);
  }
  try {
    for (const auto* source : {&answer.lower, &answer.upper, &answer.integrand}) {
      const auto parsed = core_.Parse(*source);
      names.insert(parsed->variables_used.begin(), parsed->variables_used.end());
    }
  } catch (const util::Error& err) {
    throw util::Error(util::ErrorKind::kConfig,
                      std::string("Integration Error with author's stored answer: ") +
                          err.what());
  }

  IntegralAnswer student_integral = student;
  student_integral.integration_variable = util::Trim(student.integration_variable);
  IntegralAnswer answer_integral = answer;
  answer_integral.integration_variable = util::Trim(answer.integration_variable);
  const auto& sampler = core_.sampler();
  const std::vector<std::string> plan = sampler.Plan(names);
  const runtime::EvalOptions student_options = core_.StudentEvalOptions();
  const ComparerUtils utils = core_.Utils();
  const EqualityComparer equality;
  const int samples = options.samples.value_or(config_.base.samples);

  sampling::Rng rng(options.seed);
  GradeResult result;
  int failures = 0;
  bool matched = true;
  std::set<std::string> functions_used;
  for (int trial = 0; trial < samples; ++trial) {
    sampling::TrialSample drawn;
    auto env = sampler.SampleBindings(plan, scope_, &rng, &drawn);

    IntegralEvaluation expected;
    try {
      expected = EvaluateIntegral(answer_integral, env, runtime::EvalOptions());
    } catch (const util::Error& err) {
      if (!util::IsStudentFacing(err.kind())) throw;
      throw util::Error(util::ErrorKind::kConfig,
                        std::string("Integration Error with author's stored answer: ") +
                            err.what());
    }

    IntegralEvaluation submitted;
    try {
      submitted = EvaluateIntegral(student_integral, core_.StudentScope(env), student_options,
                                   &functions_used);
    } catch (const IntegrationError& err) {
      GradeResult out = core_.StudentError(util::Error(
          err.kind(), std::string("There appears to be an error with the integral you "
                                  "entered: ") +
                          err.what()));
      out.debug_log = std::move(result.debug_log);
      return out;
    } catch (const util::Error& err) {
      if (!util::IsStudentFacing(err.kind())) throw;
      GradeResult out = core_.StudentError(err);
      out.debug_log = std::move(result.debug_log);
      return out;
    }

    const ComparisonResult compared = equality.Compare(
        {Value::Scalar(expected.value())}, Value::Scalar(submitted.value()), utils);

    if (config_.base.debug) {
      std::vector<std::string> bindings;
      for (const auto& entry : drawn.values) {
        bindings.push_back(entry.first + " = " + entry.second.ToString());
      }
      std::ostringstream line;
      line << "Integration sample " << (trial + 1) << " of " << samples << ": variables {"
           << util::Join(bindings, ", ") << "}; student real part "
           << FormatQuadrature(submitted.real);
      if (submitted.imag) {
        line << ", imaginary part " << FormatQuadrature(*submitted.imag);
      }
      line << "; instructor real part " << FormatQuadrature(expected.real);
      if (expected.imag) {
        line << ", imaginary part " << FormatQuadrature(*expected.imag);
      }
      line << "; result " << OutcomeName(compared.ok);
      util::LogRecord rec;
      rec.level = util::LogLevel::kDebug;
      rec.component = "integral_grader";
      rec.operation = "trial";
      rec.message = line.str();
      rec.trial = trial;
      util::Log(rec);
      result.debug_log.push_back(line.str());
    }

    if (compared.ok != Outcome::kMatch && ++failures > config_.base.failable_evals) {
      matched = false;
      break;
    }
  }

  if (!matched) {
    return result;
  }
  const std::string combined = student.lower + ";" + student.upper + ";" + student.integrand;
  if (auto failure = core_.PostMatchCheck(combined, functions_used)) {
    result.message = *failure;
    return result;
  }
  result.ok = Outcome::kMatch;
  result.grade_decimal = 1.0;
  return result;
}

}  // namespace mathgrade::grader
