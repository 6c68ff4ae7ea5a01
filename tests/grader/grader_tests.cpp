#include "grader/grader.h"
#include "grader/linear_comparer.h"
#include "parser/parse_cache.h"
#include "sampling/sampling_set.h"
#include "test_util.h"

namespace test {

namespace gr = mathgrade::grader;
namespace sp = mathgrade::sampling;

namespace {

gr::GraderConfig WithVariables(std::vector<std::string> variables,
                               gr::GraderConfig config = gr::GraderConfig::Formula()) {
  config.variables = std::move(variables);
  return config;
}

void ExpectMatch(const gr::GradeResult& result, const std::string& name, TestContext* ctx) {
  ExpectTrue(result.ok == gr::Outcome::kMatch && result.grade_decimal == 1.0 &&
                 !result.diagnostic,
             name, ctx);
}

void ExpectMismatch(const gr::GradeResult& result, const std::string& name, TestContext* ctx) {
  ExpectTrue(result.ok == gr::Outcome::kMismatch && result.grade_decimal == 0.0, name, ctx);
}

void ExpectDiagnostic(const gr::GradeResult& result, util::ErrorKind kind,
                      const std::string& name, TestContext* ctx) {
  ExpectTrue(result.ok == gr::Outcome::kMismatch && result.diagnostic.has_value() &&
                 result.diagnostic->kind == kind,
             name, ctx);
}

void TestScenarios(TestContext* ctx) {
  const gr::Grader grader(WithVariables({"x"}));
  ExpectMatch(grader.Grade("x^2", "x*x"), "square_as_product", ctx);
  ExpectMatch(grader.Grade("sin(x)/cos(x)", "tan(x)"), "trig_identity", ctx);
  ExpectMismatch(grader.Grade("x^2", "2*x"), "different_formula", ctx);

  gr::GraderConfig numbered;
  numbered.numbered_vars = {"a"};
  const gr::Grader numbered_grader(numbered);
  ExpectMatch(numbered_grader.Grade("a_{0}+a_{1}+a_{-1}", "a_{0}+a_{1}+a_{-1}+a_{42}-a_{42}"),
              "numbered_variables_cancel", ctx);
  ExpectMismatch(numbered_grader.Grade("a_{0}+a_{1}", "a_{0}+a_{2}"),
                 "numbered_variables_distinct", ctx);

  const gr::Grader matrix(gr::GraderConfig::Matrix());
  gr::GradeResult shape = matrix.Grade("[1, 2]", "[1,2]+[1,2,3]");
  ExpectDiagnostic(shape, util::ErrorKind::kShape, "vector_length_mismatch", ctx);
  ExpectTrue(Contains(shape.message, "vector of length 2") &&
                 Contains(shape.message, "vector of length 3"),
             "vector_length_mismatch_message", ctx);

  const gr::Grader angles(WithVariables({"a", "b"}));
  const gr::Answer congruent(std::make_shared<gr::CongruenceComparer>(),
                             {"b^2/a", "2*pi"});
  ExpectMatch(angles.Grade(congruent, "b^2/a + 6*pi"), "congruent_modulo_two_pi", ctx);
  ExpectMismatch(angles.Grade(congruent, "b^2/a + 5.5*pi"), "not_congruent", ctx);

  gr::GradeResult unbalanced = grader.Grade("x", "(1+2");
  ExpectDiagnostic(unbalanced, util::ErrorKind::kParse, "unbalanced_parenthesis", ctx);
  ExpectTrue(unbalanced.diagnostic && unbalanced.diagnostic->start == 0,
             "unbalanced_parenthesis_position", ctx);
}

void TestSelfEqualityAndDeterminism(TestContext* ctx) {
  gr::GraderConfig config = WithVariables({"x", "y"});
  config.sample_from["y"] = std::make_shared<sp::ComplexSector>();
  config.samples = 10;
  const gr::Grader grader(config);
  for (const char* expr :
       {"x", "x^y", "sqrt(x - 3)", "ln(y) + arcsin(x)", "fact(x)*exp(-y)", "x || y"}) {
    ExpectMatch(grader.Grade(expr, expr), std::string("self_equality_") + expr, ctx);
  }

  config.debug = true;
  const gr::Grader debug(config);
  gr::GradeOptions options;
  options.seed = 1234;
  const gr::GradeResult first = debug.Grade("x + y", "y + x", options);
  const gr::GradeResult second = debug.Grade("x + y", "y + x", options);
  ExpectTrue(first.debug_log.size() == 10 && first.debug_log == second.debug_log,
             "fixed_seed_is_deterministic", ctx);
  ExpectTrue(Contains(first.debug_log[0], "Sample 1 of 10: variables {x = ") &&
                 Contains(first.debug_log[0], "comparer EqualityComparer; result match"),
             "debug_line_format", ctx);
  options.seed = 4321;
  ExpectTrue(debug.Grade("x + y", "y + x", options).debug_log != first.debug_log,
             "seed_changes_bindings", ctx);
  ExpectTrue(grader.Grade("x", "x", options).debug_log.empty(), "no_debug_log_by_default", ctx);
}

void TestFailableEvals(TestContext* ctx) {
  // fact(-x) fails at x = 1 and succeeds at x = 0.5.
  gr::GraderConfig config = WithVariables({"x"});
  config.sample_from["x"] = std::make_shared<sp::DiscreteSet>(
      std::vector<rt::Value>{rt::Value::Real(1.0), rt::Value::Real(0.5)});
  config.samples = 20;
  const std::string student = "x + 0*fact(-x)";

  const gr::Grader strict(config);
  gr::GradeResult failed = strict.Grade("x", student);
  ExpectDiagnostic(failed, util::ErrorKind::kDomain, "sporadic_error_without_budget", ctx);
  ExpectTrue(Contains(failed.message, "negative integer values"),
             "sporadic_error_message", ctx);

  config.failable_evals = 19;
  const gr::Grader lenient(config);
  ExpectMatch(lenient.Grade("x", student), "sporadic_error_absorbed", ctx);

  config.sample_from["x"] =
      std::make_shared<sp::DiscreteSet>(std::vector<rt::Value>{rt::Value::Real(1.0)});
  config.samples = 5;
  config.failable_evals = 5;
  const gr::Grader consistent(config);
  ExpectDiagnostic(consistent.Grade("x", student), util::ErrorKind::kDomain,
                   "consistent_error_reported", ctx);

  gr::GraderConfig mismatches = WithVariables({"x"});
  mismatches.sample_from["x"] = std::make_shared<sp::DiscreteSet>(
      std::vector<rt::Value>{rt::Value::Real(1.0), rt::Value::Real(2.0)});
  mismatches.samples = 20;
  mismatches.failable_evals = 20;
  ExpectMatch(gr::Grader(mismatches).Grade("x", "1"), "mismatches_absorbed_by_budget", ctx);
  mismatches.failable_evals = 0;
  ExpectMismatch(gr::Grader(mismatches).Grade("x", "1"), "mismatch_without_budget", ctx);

  const gr::Grader grader(WithVariables({"x"}));
  gr::GradeResult unknown = grader.Grade("x", "y + 1");
  ExpectDiagnostic(unknown, util::ErrorKind::kUnknownIdentifier, "unknown_variable", ctx);
  ExpectTrue(unknown.message == "Invalid Input: 'y' not permitted in answer as a variable",
             "unknown_variable_message", ctx);
  gr::GradeResult arrays = grader.Grade("x", "[x, x]");
  ExpectDiagnostic(arrays, util::ErrorKind::kShape, "arrays_forbidden", ctx);
  ExpectTrue(arrays.message == "Vector and matrix expressions have been forbidden in this entry.",
             "arrays_forbidden_message", ctx);
}

void TestPostMatchChecks(TestContext* ctx) {
  gr::GraderConfig config = WithVariables({"x"});
  config.forbidden_strings = {"+"};
  const gr::Grader forbidden(config);
  gr::GradeResult result = forbidden.Grade("2*x", "x + x");
  ExpectMismatch(result, "forbidden_string", ctx);
  ExpectTrue(result.message == "Invalid Input: This particular answer is forbidden",
             "forbidden_string_message", ctx);
  ExpectMatch(forbidden.Grade("2*x", "x*2"), "forbidden_string_absent", ctx);
  ExpectTrue(forbidden.Grade("2*x", "x + 1").message.empty(),
             "forbidden_checked_only_after_match", ctx);

  config = WithVariables({"x"});
  config.required_functions = {"sin"};
  const gr::Grader required(config);
  result = required.Grade("sin(x)", "cos(pi/2 - x)");
  ExpectMismatch(result, "required_function_missing", ctx);
  ExpectTrue(result.message == "Invalid Input: Answer must contain the function sin",
             "required_function_message", ctx);
  ExpectMatch(required.Grade("sin(x)", "sin(x)"), "required_function_present", ctx);

  config = WithVariables({"x"});
  config.whitelist = {"sin"};
  const gr::Grader whitelisted(config);
  result = whitelisted.Grade("sin(x)", "cos(pi/2 - x)");
  ExpectMismatch(result, "function_not_permitted", ctx);
  ExpectTrue(result.message == "Invalid Input: function(s) 'cos' not permitted in answer",
             "function_not_permitted_message", ctx);

  config = WithVariables({"x", "s"});
  config.instructor_vars = {"s"};
  const gr::Grader hidden(config);
  ExpectMatch(hidden.Grade("x + s - s", "x"), "instructor_vars_visible_to_answer", ctx);
  ExpectDiagnostic(hidden.Grade("x", "s"), util::ErrorKind::kUnknownIdentifier,
                   "instructor_vars_hidden_from_student", ctx);
}

void TestMatrixGrading(TestContext* ctx) {
  gr::GraderConfig config = gr::GraderConfig::Matrix();
  config.variables = {"A"};
  config.sample_from["A"] = std::make_shared<sp::RealInterval>();
  config.identity_dim = 2;
  const gr::Grader grader(config);
  ExpectMatch(grader.Grade("[[A, 0], [0, A]]", "A*I"), "identity_scaled", ctx);
  ExpectMatch(grader.Grade("[1, 2]", "[1, 2]"), "vector_equal", ctx);
  gr::GradeResult result = grader.Grade("[1, 2]", "3");
  ExpectDiagnostic(result, util::ErrorKind::kShape, "expected_vector_got_scalar", ctx);
  ExpectTrue(result.message == "Expected answer to be a vector, but input is a scalar",
             "expected_vector_message", ctx);
  result = grader.Grade("[[1, 2], [3, 4]]", "[[1, 2], [3, 4]]");
  ExpectDiagnostic(result, util::ErrorKind::kShape, "matrix_entry_forbidden", ctx);
  ExpectTrue(result.message == "Matrix expressions have been forbidden in this entry.",
             "matrix_entry_forbidden_message", ctx);

  config.shape_errors = false;
  config.answer_shape_mismatch = gr::ShapeDetail::kShape;
  const gr::Grader quiet(config);
  result = quiet.Grade("[1, 2]", "[1, 2, 3]");
  ExpectTrue(result.ok == gr::Outcome::kMismatch && !result.diagnostic &&
                 result.message ==
                     "Expected answer to be a vector of length 2, but input is a vector of "
                     "length 3",
             "shape_errors_disabled", ctx);

  config = gr::GraderConfig::Matrix();
  config.max_array_dim = 2;
  config.negative_powers = false;
  const gr::Grader no_inverse(config);
  ExpectDiagnostic(no_inverse.Grade("[[1, 0], [0, 1]]", "[[1, 0], [0, 1]]^-1"),
                   util::ErrorKind::kShape, "negative_powers_disabled", ctx);
  ExpectMatch(no_inverse.Grade("[[2, 0], [0, 2]]", "[[1, 0], [0, 1]]*2"), "matrix_entry_allowed",
              ctx);
}

void TestComparersAndCredit(TestContext* ctx) {
  const gr::Grader grader(WithVariables({"x"}));

  const gr::Answer multiple(std::make_shared<gr::ConstantMultipleComparer>(), {"2*x"});
  gr::GradeResult result = grader.Grade(multiple, "x");
  ExpectTrue(result.ok == gr::Outcome::kPartial && result.grade_decimal == 0.5 &&
                 Contains(result.message, "constant multiple"),
             "constant_multiple_partial_credit", ctx);
  ExpectMatch(grader.Grade(multiple, "x*2"), "constant_multiple_match", ctx);
  ExpectMismatch(grader.Grade(multiple, "x^2"), "constant_multiple_mismatch", ctx);

  const gr::Answer linear(std::make_shared<gr::LinearComparer>(), {"3*x"});
  result = grader.Grade(linear, "x");
  ExpectTrue(result.ok == gr::Outcome::kPartial && result.grade_decimal == 0.5,
             "linear_comparer_proportional", ctx);

  gr::Answer half("x");
  half.grade_decimal = 0.5;
  half.message = "Half credit.";
  result = grader.Grade(half, "x");
  ExpectTrue(result.ok == gr::Outcome::kPartial && result.grade_decimal == 0.5 &&
                 result.message == "Half credit.",
             "answer_partial_credit", ctx);

  const gr::Answer between(std::make_shared<gr::BetweenComparer>(), {"x - 1", "x + 1"});
  ExpectMatch(grader.Grade(between, "x + 0.5"), "between_comparer", ctx);
  ExpectMismatch(grader.Grade(between, "x + 2"), "between_comparer_outside", ctx);

  gr::GraderConfig numerical = gr::GraderConfig::Numerical();
  const gr::Grader numeric(numerical);
  ExpectMatch(numeric.Grade("2", "2.05"), "numerical_within_five_percent", ctx);
  ExpectMismatch(numeric.Grade("2", "2.2"), "numerical_outside_tolerance", ctx);

  gr::GraderConfig random = WithVariables({"x"});
  random.random_functions["f"] = std::make_shared<sp::RandomFunction>();
  const gr::Grader random_grader(random);
  ExpectMatch(random_grader.Grade("f(x)^2", "f(x)*f(x)"), "random_function_match", ctx);
  ExpectMismatch(random_grader.Grade("f(x)^2", "f(x)"), "random_function_mismatch", ctx);
}

void TestConfigurationErrors(TestContext* ctx) {
  const gr::Grader grader(WithVariables({"x"}));
  std::string message = ExpectThrowsKind([&] { grader.Grade("x +", "x"); },
                                         util::ErrorKind::kConfig, "answer_parse_error", ctx);
  ExpectTrue(Contains(message, "Error parsing comparer parameter 'x +'"),
             "answer_parse_error_message", ctx);
  message = ExpectThrowsKind([&] { grader.Grade("1/(x - x)", "x"); }, util::ErrorKind::kConfig,
                             "answer_evaluation_error", ctx);
  ExpectTrue(Contains(message, "Error evaluating comparer parameter '1/(x - x)'"),
             "answer_evaluation_error_message", ctx);
  ExpectThrowsKind(
      [&] { grader.Grade(gr::Answer(std::make_shared<gr::BetweenComparer>(), {"1"}), "x"); },
      util::ErrorKind::kConfig, "comparer_parameter_count", ctx);
  ExpectThrowsKind([&] { grader.Grade(gr::Answer(nullptr, {"x"}), "x"); },
                   util::ErrorKind::kConfig, "answer_without_comparer", ctx);
  gr::GradeOptions options;
  options.samples = 0;
  ExpectThrowsKind([&] { grader.Grade("x", "x", options); }, util::ErrorKind::kConfig,
                   "zero_samples_override", ctx);

  gr::GraderConfig cyclic = WithVariables({"x", "y"});
  cyclic.sample_from["x"] =
      std::make_shared<sp::DependentSampler>(std::vector<std::string>{"y"}, "y");
  cyclic.sample_from["y"] =
      std::make_shared<sp::DependentSampler>(std::vector<std::string>{"x"}, "x");
  ExpectThrowsKind([&] { gr::Grader invalid(cyclic); }, util::ErrorKind::kConfig,
                   "cyclic_sampling_rejected_at_construction", ctx);
}

void TestParseCache(TestContext* ctx) {
  ps::ParseCache cache{ps::CachePolicy()};
  const gr::Grader grader(WithVariables({"x"}), &cache);
  ExpectMatch(grader.Grade("x^2", "x*x"), "cached_grade", ctx);
  ExpectMatch(grader.Grade("x^2", "x*x"), "cached_grade_repeat", ctx);
  ExpectTrue(cache.hits() >= 2 && cache.size() == 2, "grader_uses_cache", ctx);
}

}  // namespace

void RunGraderTests(TestContext* ctx) {
  TestScenarios(ctx);
  TestSelfEqualityAndDeterminism(ctx);
  TestFailableEvals(ctx);
  TestPostMatchChecks(ctx);
  TestMatrixGrading(ctx);
  TestComparersAndCredit(ctx);
  TestConfigurationErrors(ctx);
  TestParseCache(ctx);
}

}  // namespace test
