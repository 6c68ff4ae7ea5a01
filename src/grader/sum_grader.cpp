#include "grader/sum_grader.h"

#include <cctype>
#include <cmath>
#include <iomanip>
#include <limits>
#include <optional>
#include <sstream>
#include <utility>
#include <vector>

#include "runtime/array_ops.h"
#include "runtime/ops.h"
#include "sampling/rng.h"
#include "util/error.h"
#include "util/log.h"
#include "util/string.h"

namespace mathgrade::grader {

namespace {

using runtime::Value;

// Problems with the limits or the summation variable of a sum.
class SummationError : public util::Error {
 public:
  explicit SummationError(const std::string& message)
      : util::Error(util::ErrorKind::kDomain, message) {}
};

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
  if (!limit.IsScalar()) {
    throw SummationError("Summation limits must be numbers but have evaluated to " +
                         limit.Description() + ".");
  }
  if (limit.scalar().imag() != 0.0) {
    throw SummationError(
        "Summation limits must be real but have evaluated to complex numbers.");
  }
  return limit.scalar().real();
}

bool IsIntegerOrInfinite(double x) {
  return std::isinf(x) || std::floor(x) == x;
}

}  // namespace

GraderConfig SumConfig::DefaultBase() {
  GraderConfig config = GraderConfig::Formula();
  config.tolerance = Tolerance::Absolute(1e-12);
  config.samples = 2;
  return config;
}

SumGrader::SumGrader(SumConfig config, parser::ParseCache* cache)
    : config_(std::move(config)), core_(config_.base, cache) {
  if (!(config_.infty_val > 0) || !(config_.infty_val_fact > 0)) {
    throw util::Error(util::ErrorKind::kConfig, "infty_val and infty_val_fact must be positive");
  }
  if (!(config_.max_limit >= config_.infty_val) ||
      !(config_.max_limit >= config_.infty_val_fact)) {
    throw util::Error(util::ErrorKind::kConfig,
                      "max_limit must be at least infty_val and infty_val_fact");
  }
  if (config_.even_odd < 0 || config_.even_odd > 2) {
    throw util::Error(util::ErrorKind::kConfig, "even_odd must be 0, 1 or 2");
  }
  scope_ = std::make_shared<runtime::Environment>(core_.resolved().scope);
  if (!config_.base.user_constants.count("infty")) {
    scope_->Define("infty", Value::Real(std::numeric_limits<double>::infinity()));
  }
}

void SumGrader::ValidateSummationVariable(const std::string& name) const {
  if (scope_->HasVariable(name) || scope_->HasFunction(name) ||
      config_.base.random_functions.count(name) > 0) {
    throw util::Error(util::ErrorKind::kDomain,
                      "Cannot use " + name +
                          " as summation variable; it is already has another meaning in this "
                          "problem.");
  }
  if (!IsValidVariableName(name)) {
    throw util::Error(util::ErrorKind::kDomain,
                      "Summation variable " + name +
                          " is an invalid variable name. Variable name should begin with a "
                          "letter and contain alphanumeric characters or underscores "
                          "thereafter, but may end in single quotes.");
  }
}

Value SumGrader::PerformSummation(const std::function<Value(double)>& summand, double lower,
                                  double upper, int even_odd, double infty_val,
                                  double max_limit) {
  if (lower > upper) {
    std::swap(lower, upper);
  }
  const double inf = std::numeric_limits<double>::infinity();
  if (lower == -inf) {
    lower = -infty_val;
  }
  if (upper == inf) {
    upper = infty_val;
  }
  if (upper == -inf) {
    throw SummationError("Cannot sum from -infty to -infty.");
  }
  if (lower == inf) {
    throw SummationError("Cannot sum from infty to infty.");
  }
  if (std::fabs(lower) > max_limit || std::fabs(upper) > max_limit) {
    std::ostringstream message;
    message << "Summation limits must be at most " << std::setprecision(15) << max_limit
            << " in magnitude; use infty for an unbounded sum.";
    throw SummationError(message.str());
  }

  int64_t delta = 1;
  if (even_odd == 1) {
    delta = 2;
    if (std::fabs(std::fmod(lower, 2.0)) != 1.0) lower += 1;
  } else if (even_odd == 2) {
    delta = 2;
    if (std::fabs(std::fmod(lower, 2.0)) != 0.0) lower += 1;
  }

  std::optional<Value> total;
  const auto last = static_cast<int64_t>(std::floor(upper));
  for (auto n = static_cast<int64_t>(std::ceil(lower)); n <= last; n += delta) {
    Value term = summand(static_cast<double>(n));
    total = total ? runtime::Add(*total, term) : std::move(term);
  }
  return total ? *total : Value::Real(0.0);
}

Value SumGrader::EvaluateSum(const SumAnswer& sum,
                             std::shared_ptr<const runtime::Environment> scope,
                             const runtime::EvalOptions& options,
                             std::set<std::string>* functions_used) const {
  if (scope->HasVariable(sum.summation_variable)) {
    throw SummationError("Summation variable " + sum.summation_variable +
                         " conflicts with another previously-defined variable.");
  }

  runtime::EvalOptions limit_options = options;
  limit_options.allow_inf = true;
  const auto lower_expr = core_.Parse(sum.lower);
  const auto upper_expr = core_.Parse(sum.upper);
  const auto summand_expr = core_.Parse(sum.summand);
  const double lower = RealLimit(runtime::EvaluateFormula(*lower_expr, *scope, limit_options));
  const double upper = RealLimit(runtime::EvaluateFormula(*upper_expr, *scope, limit_options));
  if (!IsIntegerOrInfinite(lower)) {
    throw SummationError("Lower summation limit does not evaluate to an integer.");
  }
  if (!IsIntegerOrInfinite(upper)) {
    throw SummationError("Upper summation limit does not evaluate to an integer.");
  }

  std::set<std::string> used;
  for (const auto* expr : {lower_expr.get(), upper_expr.get(), summand_expr.get()}) {
    used.insert(expr->functions_used.begin(), expr->functions_used.end());
  }
  const bool factorial = used.count("fact") > 0 || used.count("factorial") > 0;
  if (functions_used) {
    functions_used->insert(used.begin(), used.end());
  }

  auto term_scope = std::make_shared<runtime::Environment>(scope);
  auto summand = [&](double n) {
    term_scope->Define(sum.summation_variable, Value::Real(n));
    return runtime::EvaluateFormula(*summand_expr, *term_scope, options);
  };
  return PerformSummation(summand, lower, upper, config_.even_odd,
                          factorial ? config_.infty_val_fact : config_.infty_val,
                          config_.max_limit);
}

GradeResult SumGrader::Grade(const SumAnswer& answer, const SumAnswer& student,
                             const GradeOptions& options) const {
  const std::vector<std::pair<std::string, std::string>> fields = {
      {"lower", student.lower},
      {"upper", student.upper},
      {"summand", student.summand},
      {"summation_variable", student.summation_variable}};
  std::set<std::string> names;
  try {
    for (const auto& field : fields) {
      if (util::Trim(field.second).empty()) {
        throw util::Error(util::ErrorKind::kParse,
                          "Please enter a value for " + field.first + ", it cannot be empty.");
      }
    }
    ValidateSummationVariable(util::Trim(student.summation_variable));
    for (const auto* source : {&student.lower, &student.upper, &student.summand}) {
      const auto parsed = core_.Parse(*source);
      names.insert(parsed->variables_used.begin(), parsed->variables_used.end());
    }
  } catch (const util::Error& err) {
    if (!util::IsStudentFacing(err.kind())) throw;
    return core_.StudentError(err);
  }
  try {
    for (const auto* source : {&answer.lower, &answer.upper, &answer.summand}) {
      const auto parsed = core_.Parse(*source);
      names.insert(parsed->variables_used.begin(), parsed->variables_used.end());
    }
  } catch (const util::Error& err) {
    throw util::Error(util::ErrorKind::kConfig,
                      std::string("Summation Error with author's stored answer: ") + err.what());
  }

  SumAnswer student_sum = student;
  student_sum.summation_variable = util::Trim(student.summation_variable);
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

    Value expected;
    try {
      expected = EvaluateSum(answer, env, runtime::EvalOptions());
    } catch (const util::Error& err) {
      if (!util::IsStudentFacing(err.kind())) throw;
      throw util::Error(util::ErrorKind::kConfig,
                        std::string("Summation Error with author's stored answer: ") +
                            err.what());
    }

    Value submitted;
    try {
      submitted =
          EvaluateSum(student_sum, core_.StudentScope(env), student_options, &functions_used);
    } catch (const SummationError& err) {
      GradeResult out = core_.StudentError(util::Error(
          err.kind(),
          std::string("There appears to be an error with the sum you entered: ") + err.what()));
      out.debug_log = std::move(result.debug_log);
      return out;
    } catch (const util::Error& err) {
      if (!util::IsStudentFacing(err.kind())) throw;
      GradeResult out = core_.StudentError(err);
      out.debug_log = std::move(result.debug_log);
      return out;
    }

    ComparisonResult compared;
    try {
      compared = equality.Compare({expected}, submitted, utils);
    } catch (const util::Error& err) {
      if (!util::IsStudentFacing(err.kind())) throw;
      GradeResult out = core_.StudentError(err);
      out.debug_log = std::move(result.debug_log);
      return out;
    }

    if (config_.base.debug) {
      std::vector<std::string> bindings;
      for (const auto& entry : drawn.values) {
        bindings.push_back(entry.first + " = " + entry.second.ToString());
      }
      std::ostringstream line;
      line << "Summation sample " << (trial + 1) << " of " << samples << ": variables {"
           << util::Join(bindings, ", ") << "}; student " << submitted.ToString()
           << "; instructor " << expected.ToString() << "; result " << OutcomeName(compared.ok);
      util::LogRecord rec;
      rec.level = util::LogLevel::kDebug;
      rec.component = "sum_grader";
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
  const std::string combined = student.lower + ";" + student.upper + ";" + student.summand;
  if (auto failure = core_.PostMatchCheck(combined, functions_used)) {
    result.message = *failure;
    return result;
  }
  result.ok = Outcome::kMatch;
  result.grade_decimal = 1.0;
  return result;
}

}  // namespace mathgrade::grader
