#include "grader/grader.h"

#include <algorithm>
#include <sstream>
#include <utility>

#include "parser/parser.h"
#include "sampling/rng.h"
#include "util/log.h"
#include "util/string.h"

namespace mathgrade::grader {

namespace {

using runtime::Value;

// Student errors that consume the failable-eval budget instead of ending the grade.
bool IsBudgeted(util::ErrorKind kind) {
  return kind == util::ErrorKind::kDomain || kind == util::ErrorKind::kOverflow ||
         kind == util::ErrorKind::kShape || kind == util::ErrorKind::kZeroDivision;
}

void LogGrade(util::LogLevel level, const std::string& operation, const std::string& message,
              int trial = -1) {
  util::LogRecord rec;
  rec.level = level;
  rec.component = "grader";
  rec.operation = operation;
  rec.message = message;
  rec.trial = trial;
  util::Log(rec);
}

std::string FormatValues(const std::vector<Value>& values) {
  std::vector<std::string> parts;
  for (const auto& v : values) {
    parts.push_back(v.ToString());
  }
  return "[" + util::Join(parts, ", ") + "]";
}

std::string FormatTrial(int trial, int samples, const sampling::TrialSample& drawn,
                        const std::string& student, const std::vector<Value>& params,
                        const Comparer& comparer, const std::string& result) {
  std::vector<std::string> bindings;
  for (const auto& entry : drawn.values) {
    bindings.push_back(entry.first + " = " + entry.second.ToString());
  }
  for (const auto& entry : drawn.functions) {
    bindings.push_back(entry.first + " = <random function>");
  }
  std::ostringstream out;
  out << "Sample " << (trial + 1) << " of " << samples << ": variables {"
      << util::Join(bindings, ", ") << "}; student " << student << "; compare to "
      << FormatValues(params) << "; comparer " << comparer.Name() << "; result " << result;
  return out.str();
}

std::string DescribeResult(const ComparisonResult& result) {
  std::ostringstream out;
  out << OutcomeName(result.ok) << " (" << result.grade_decimal << ")";
  if (!result.message.empty()) {
    out << " " << result.message;
  }
  return out.str();
}

GradeResult FromComparison(const ComparisonResult& result) {
  GradeResult out;
  out.ok = result.ok;
  out.grade_decimal = result.grade_decimal;
  out.message = result.message;
  return out;
}

}  // namespace

Answer::Answer(const std::string& expected)
    : comparer(std::make_shared<EqualityComparer>()), params{expected} {}

Answer::Answer(const char* expected) : Answer(std::string(expected)) {}

Answer::Answer(std::shared_ptr<const Comparer> comparer, std::vector<std::string> params)
    : comparer(std::move(comparer)), params(std::move(params)) {}

Diagnostic MakeDiagnostic(const util::Error& err) {
  Diagnostic diagnostic;
  diagnostic.kind = err.kind();
  diagnostic.message = err.what();
  diagnostic.start = err.start();
  diagnostic.end = err.end();
  return diagnostic;
}

Grader::Grader(GraderConfig config, parser::ParseCache* cache)
    : config_(std::move(config)), cache_(cache) {
  try {
    resolved_ = ResolveConfig(config_);
    sampler_ = std::make_unique<sampling::Sampler>(config_.variables, config_.numbered_vars,
                                                   config_.sample_from,
                                                   config_.random_functions);
  } catch (const util::Error& err) {
    util::LogRecord rec;
    rec.level = util::LogLevel::kWarn;
    rec.component = "grader";
    rec.operation = "configure";
    rec.message = std::string(GraderKindName(config_.kind)) + ": " + err.what();
    rec.error_kind = err.kind();
    util::Log(rec);
    throw;
  }
}

runtime::EvalOptions Grader::StudentEvalOptions() const {
  runtime::EvalOptions options;
  options.max_array_dim = config_.max_array_dim;
  options.negative_powers = config_.negative_powers;
  return options;
}

ComparerUtils Grader::Utils() const {
  ComparerUtils utils;
  utils.tolerance = config_.tolerance;
  utils.validate_shape = config_.kind == GraderKind::kMatrix;
  utils.shape_detail = config_.answer_shape_mismatch;
  return utils;
}

std::shared_ptr<const parser::ParsedExpression> Grader::Parse(const std::string& source) const {
  if (cache_ && cache_->Enabled()) {
    return cache_->Parse(source);
  }
  return parser::ParseFormula(source);
}

std::shared_ptr<const runtime::Environment> Grader::StudentScope(
    std::shared_ptr<const runtime::Environment> trial) const {
  if (config_.instructor_vars.empty()) {
    return trial;
  }
  auto scope = std::make_shared<runtime::Environment>(std::move(trial));
  for (const auto& name : config_.instructor_vars) {
    scope->Erase(name);
  }
  return scope;
}

std::optional<std::string> Grader::PostMatchCheck(
    const std::string& student, const std::set<std::string>& functions_used) const {
  const std::string stripped = util::StripWhitespace(student);
  for (const auto& forbidden : config_.forbidden_strings) {
    const std::string needle = util::StripWhitespace(forbidden);
    if (!needle.empty() && stripped.find(needle) != std::string::npos) {
      return config_.forbidden_message;
    }
  }
  for (const auto& required : config_.required_functions) {
    if (functions_used.count(required) == 0) {
      return "Invalid Input: Answer must contain the function " + required;
    }
  }
  std::vector<std::string> not_permitted;
  for (const auto& name : functions_used) {
    if (resolved_.permitted_functions.count(name) == 0) {
      not_permitted.push_back("'" + name + "'");
    }
  }
  if (!not_permitted.empty()) {
    return "Invalid Input: function(s) " + util::Join(not_permitted, ", ") +
           " not permitted in answer";
  }
  return std::nullopt;
}

GradeResult Grader::StudentError(const util::Error& err) const {
  GradeResult result;
  result.message = err.what();
  if (err.kind() == util::ErrorKind::kShape && !config_.shape_errors) {
    return result;
  }
  result.diagnostic = MakeDiagnostic(err);
  return result;
}

GradeResult Grader::Grade(const Answer& answer, const std::string& student,
                          const GradeOptions& options) const {
  if (!answer.comparer) {
    throw util::Error(util::ErrorKind::kConfig, "Answer has no comparer");
  }
  answer.comparer->CheckParamCount(answer.params.size());
  const int samples = options.samples.value_or(config_.samples);
  if (samples < 1) {
    throw util::Error(util::ErrorKind::kConfig, "samples must be a positive integer");
  }

  std::vector<std::shared_ptr<const parser::ParsedExpression>> params;
  std::set<std::string> names;
  for (const auto& source : answer.params) {
    try {
      params.push_back(Parse(source));
    } catch (const util::Error& err) {
      throw util::Error(util::ErrorKind::kConfig,
                        "Error parsing comparer parameter '" + source + "': " + err.what());
    }
    names.insert(params.back()->variables_used.begin(), params.back()->variables_used.end());
  }

  std::shared_ptr<const parser::ParsedExpression> parsed;
  try {
    parsed = Parse(student);
  } catch (const util::Error& err) {
    if (!util::IsStudentFacing(err.kind())) throw;
    return StudentError(err);
  }
  names.insert(parsed->variables_used.begin(), parsed->variables_used.end());

  const std::vector<std::string> plan = sampler_->Plan(names);
  const ComparerUtils utils = Utils();
  const runtime::EvalOptions student_options = StudentEvalOptions();
  runtime::EvalOptions param_options;
  param_options.negative_powers = config_.negative_powers;

  const auto* trial_comparer = dynamic_cast<const TrialComparer*>(answer.comparer.get());
  const auto* correlated = dynamic_cast<const CorrelatedComparer*>(answer.comparer.get());
  if (!trial_comparer && !correlated) {
    throw util::Error(util::ErrorKind::kInternal,
                      "Unsupported comparer " + answer.comparer->Name());
  }

  sampling::Rng rng(options.seed);
  std::vector<std::string> debug_log;
  std::vector<std::vector<Value>> buffered_params;
  std::vector<Value> buffered_students;
  std::optional<ComparisonResult> weakest;
  // The most recent budgeted student error, reported when no trial evaluates.
  std::optional<util::Error> last_error;
  int evaluated = 0;
  int failures = 0;

  auto finish = [&](GradeResult result) {
    result.debug_log = std::move(debug_log);
    return result;
  };
  auto record = [&](int trial, const std::string& line) {
    LogGrade(util::LogLevel::kDebug, "trial", line, trial);
    debug_log.push_back(line);
  };
  auto over_budget = [&](int trial, const std::string& reason) {
    ++failures;
    if (failures <= config_.failable_evals) {
      return false;
    }
    LogGrade(util::LogLevel::kInfo, "budget",
             "failable_evals=" + std::to_string(config_.failable_evals) +
                 " exhausted: " + reason,
             trial);
    return true;
  };

  for (int trial = 0; trial < samples; ++trial) {
    sampling::TrialSample drawn;
    auto env = sampler_->SampleBindings(plan, resolved_.scope, &rng, &drawn);

    std::vector<Value> param_values;
    for (const auto& param : params) {
      try {
        param_values.push_back(runtime::EvaluateFormula(*param, *env, param_options));
      } catch (const util::Error& err) {
        if (err.kind() == util::ErrorKind::kConfig) throw;
        throw util::Error(util::ErrorKind::kConfig, "Error evaluating comparer parameter '" +
                                                        param->source + "': " + err.what());
      }
    }

    Value student_value;
    const auto student_scope = StudentScope(env);
    try {
      student_value = runtime::EvaluateFormula(*parsed, *student_scope, student_options);
    } catch (const util::Error& err) {
      if (!util::IsStudentFacing(err.kind())) throw;
      if (config_.debug) {
        record(trial, FormatTrial(trial, samples, drawn, std::string("error: ") + err.what(),
                                  param_values, *answer.comparer, "not compared"));
      }
      if (!IsBudgeted(err.kind()) || over_budget(trial, err.what())) {
        return finish(StudentError(err));
      }
      last_error = err;
      continue;
    } catch (const std::exception& err) {
      GradeResult result;
      Diagnostic diagnostic;
      diagnostic.kind = util::ErrorKind::kDomain;
      diagnostic.message =
          config_.debug ? err.what() : "Invalid Input: Could not evaluate the expression.";
      result.message = diagnostic.message;
      result.diagnostic = diagnostic;
      return finish(std::move(result));
    }

    ++evaluated;
    if (correlated) {
      if (config_.debug) {
        record(trial, FormatTrial(trial, samples, drawn, student_value.ToString(),
                                  param_values, *answer.comparer, "buffered"));
      }
      buffered_params.push_back(std::move(param_values));
      buffered_students.push_back(std::move(student_value));
      continue;
    }

    ComparisonResult compared;
    try {
      compared = trial_comparer->Compare(param_values, student_value, utils);
    } catch (const util::Error& err) {
      if (!util::IsStudentFacing(err.kind())) throw;
      return finish(StudentError(err));
    }
    if (config_.debug) {
      record(trial, FormatTrial(trial, samples, drawn, student_value.ToString(), param_values,
                                *answer.comparer, DescribeResult(compared)));
    }
    if (compared.ok == Outcome::kMismatch) {
      if (over_budget(trial, "comparison failed")) {
        return finish(FromComparison(compared));
      }
    } else if (compared.ok == Outcome::kPartial &&
               (!weakest || compared.grade_decimal < weakest->grade_decimal)) {
      weakest = compared;
    }
  }

  if (evaluated == 0 && last_error) {
    return finish(StudentError(*last_error));
  }

  ComparisonResult verdict = ComparisonResult::FromGrade(answer.grade_decimal, answer.message);
  if (correlated) {
    ComparisonResult compared;
    try {
      compared = correlated->CompareAll(buffered_params, buffered_students, utils);
    } catch (const util::Error& err) {
      if (!util::IsStudentFacing(err.kind())) throw;
      return finish(StudentError(err));
    }
    if (config_.debug) {
      record(-1, answer.comparer->Name() + " over " + std::to_string(buffered_students.size()) +
                     " samples: " + DescribeResult(compared));
    }
    if (compared.ok != Outcome::kMatch) {
      verdict = compared;
    }
  } else if (weakest) {
    verdict = *weakest;
  }

  if (verdict.ok != Outcome::kMismatch) {
    auto failure = PostMatchCheck(student, parsed->functions_used);
    if (failure) {
      verdict = ComparisonResult::Mismatch(*failure);
    }
  }
  return finish(FromComparison(verdict));
}

}  // namespace mathgrade::grader
