#include <limits>

#include "grader/sum_grader.h"
#include "test_util.h"

namespace test {

namespace gr = mathgrade::grader;
namespace sp = mathgrade::sampling;

namespace {

rt::Value Count(double) {
  return rt::Value::Real(1.0);
}

rt::Value Identity(double n) {
  return rt::Value::Real(n);
}

double Sum(double lower, double upper, int even_odd = 0, double infty_val = 1e3) {
  return gr::SumGrader::PerformSummation(Identity, lower, upper, even_odd, infty_val)
      .scalar()
      .real();
}

gr::SumConfig WithUpperLimit() {
  gr::SumConfig config;
  config.base.variables = {"N"};
  config.base.sample_from["N"] = std::make_shared<sp::IntegerRange>(2, 9);
  return config;
}

void ExpectStudentError(const gr::GradeResult& result, util::ErrorKind kind,
                        const std::string& message, const std::string& name,
                        TestContext* ctx) {
  ExpectTrue(result.ok == gr::Outcome::kMismatch && result.diagnostic.has_value() &&
                 result.diagnostic->kind == kind,
             name, ctx);
  ExpectTrue(result.message == message, name + "_message", ctx);
}

void TestPerformSummation(TestContext* ctx) {
  const double inf = std::numeric_limits<double>::infinity();
  ExpectNear(Sum(1, 4), 10.0, "sum_one_to_four", ctx);
  ExpectNear(Sum(4, 1), 10.0, "sum_swapped_limits", ctx);
  ExpectNear(Sum(3, 3), 3.0, "sum_single_term", ctx);
  ExpectNear(Sum(2.5, 2.7), 0.0, "sum_without_integers", ctx);
  ExpectNear(Sum(1, 6, 1), 9.0, "sum_odd_terms", ctx);
  ExpectNear(Sum(1, 6, 2), 12.0, "sum_even_terms", ctx);
  ExpectNear(Sum(-3, 3, 1), 0.0, "sum_odd_terms_negative_start", ctx);
  ExpectNear(Sum(-4, 0, 2), -6.0, "sum_even_terms_negative_start", ctx);
  ExpectNear(gr::SumGrader::PerformSummation(Count, -inf, inf, 0, 10).scalar().real(), 21.0,
             "sum_infinite_limits_truncated", ctx);
  ExpectNear(gr::SumGrader::PerformSummation(Count, 1, inf, 0, 10).scalar().real(), 10.0,
             "sum_to_infinity", ctx);
  std::string message = ExpectThrowsKind(
      [&] { gr::SumGrader::PerformSummation(Count, inf, inf, 0, 10); }, util::ErrorKind::kDomain,
      "sum_infty_to_infty", ctx);
  ExpectTrue(message == "Cannot sum from infty to infty.", "sum_infty_to_infty_message", ctx);
  message = ExpectThrowsKind(
      [&] { gr::SumGrader::PerformSummation(Count, -inf, -inf, 0, 10); },
      util::ErrorKind::kDomain, "sum_negative_infty", ctx);
  ExpectTrue(message == "Cannot sum from -infty to -infty.", "sum_negative_infty_message", ctx);
  message = ExpectThrowsKind(
      [&] { gr::SumGrader::PerformSummation(Count, 1, 1e15, 0, 10); }, util::ErrorKind::kDomain,
      "sum_huge_finite_limit", ctx);
  ExpectTrue(message == "Summation limits must be at most 1000000 in magnitude; use infty for "
                        "an unbounded sum.",
             "sum_huge_finite_limit_message", ctx);
  ExpectThrowsKind([&] { gr::SumGrader::PerformSummation(Count, -1e300, 0, 0, 10, 50); },
                   util::ErrorKind::kDomain, "sum_limit_beyond_custom_bound", ctx);
  ExpectNear(gr::SumGrader::PerformSummation(Count, -50, 50, 0, 10, 50).scalar().real(), 101.0,
             "sum_limits_at_bound", ctx);

  auto vector_term = [](double n) {
    return rt::Value::Array({2}, {rt::Complex(n, 0.0), rt::Complex(1.0, 0.0)});
  };
  const rt::Value total = gr::SumGrader::PerformSummation(vector_term, 1, 3, 0, 10);
  ExpectTrue(total.shape == std::vector<int64_t>{2} && total.data[0] == rt::Complex(6.0, 0.0) &&
                 total.data[1] == rt::Complex(3.0, 0.0),
             "sum_of_vectors", ctx);
}

void TestGrading(TestContext* ctx) {
  const gr::SumGrader grader(WithUpperLimit());
  const gr::SumAnswer answer{"1", "N", "n", "n"};
  ExpectTrue(grader.Grade(answer, {"1", "N", "n", "n"}).correct(), "sum_identical", ctx);
  ExpectTrue(grader.Grade(answer, {"0", "N", "k", "k"}).correct(), "sum_renamed_variable", ctx);
  ExpectTrue(grader.Grade(answer, {"1", "N", "N - m + 1", " m "}).correct(),
             "sum_variable_trimmed", ctx);
  ExpectTrue(grader.Grade(answer, {"N", "1", "n", "n"}).correct(), "sum_reversed_limits", ctx);
  const gr::GradeResult short_sum = grader.Grade(answer, {"1", "N - 1", "n", "n"});
  ExpectTrue(short_sum.ok == gr::Outcome::kMismatch && !short_sum.diagnostic,
             "sum_missing_term", ctx);

  gr::SumConfig geometric;
  const gr::SumGrader infinite(geometric);
  const gr::SumAnswer series{"0", "infty", "2^(-n)", "n"};
  ExpectTrue(infinite.Grade(series, {"0", "infty", "1/2^n", "n"}).correct(),
             "sum_infinite_geometric", ctx);
  ExpectTrue(infinite.Grade(series, {"1", "infty", "1/2^n", "n"}).ok == gr::Outcome::kMismatch,
             "sum_infinite_geometric_offset", ctx);
  ExpectTrue(infinite.Grade({"0", "infty", "1/fact(n)", "n"}, {"0", "80", "1/fact(n)", "n"})
                 .correct(),
             "sum_factorial_truncated_earlier", ctx);

  gr::SumConfig odd;
  odd.even_odd = 1;
  const gr::SumGrader odd_grader(odd);
  ExpectTrue(odd_grader.Grade({"1", "9", "n", "n"}, {"0", "9", "n", "n"}).correct(),
             "sum_odd_only", ctx);

  gr::SumConfig required = WithUpperLimit();
  required.base.required_functions = {"fact"};
  const gr::SumGrader required_grader(required);
  const gr::SumAnswer factorials{"1", "N", "fact(n)", "n"};
  ExpectTrue(required_grader.Grade(factorials, factorials).correct(),
             "sum_required_function_in_summand", ctx);
  const gr::GradeResult missing =
      required_grader.Grade(factorials, {"1", "N", "factorial(n)", "n"});
  ExpectTrue(missing.ok == gr::Outcome::kMismatch &&
                 missing.message == "Invalid Input: Answer must contain the function fact",
             "sum_required_function_missing", ctx);

  gr::SumConfig debug = WithUpperLimit();
  debug.base.debug = true;
  const gr::GradeResult logged = gr::SumGrader(debug).Grade(answer, answer);
  ExpectTrue(logged.debug_log.size() == 2 &&
                 Contains(logged.debug_log[0], "Summation sample 1 of 2: variables {N = "),
             "sum_debug_log", ctx);
}

void TestStudentErrors(TestContext* ctx) {
  const gr::SumGrader grader(WithUpperLimit());
  const gr::SumAnswer answer{"1", "N", "n", "n"};
  ExpectStudentError(grader.Grade(answer, {"1", "N", "", "n"}), util::ErrorKind::kParse,
                     "Please enter a value for summand, it cannot be empty.", "sum_empty_summand",
                     ctx);
  ExpectStudentError(grader.Grade(answer, {"1", "N", "n", "  "}), util::ErrorKind::kParse,
                     "Please enter a value for summation_variable, it cannot be empty.",
                     "sum_empty_variable", ctx);
  ExpectStudentError(
      grader.Grade(answer, {"1", "N", "pi", "pi"}), util::ErrorKind::kDomain,
      "Cannot use pi as summation variable; it is already has another meaning in this problem.",
      "sum_variable_is_constant", ctx);
  ExpectStudentError(grader.Grade(answer, {"1", "N", "n", "2n"}), util::ErrorKind::kDomain,
                     "Summation variable 2n is an invalid variable name. Variable name should "
                     "begin with a letter and contain alphanumeric characters or underscores "
                     "thereafter, but may end in single quotes.",
                     "sum_variable_invalid", ctx);
  ExpectStudentError(grader.Grade(answer, {"1", "N", "N", "N"}), util::ErrorKind::kDomain,
                     "There appears to be an error with the sum you entered: Summation variable "
                     "N conflicts with another previously-defined variable.",
                     "sum_variable_conflicts", ctx);
  ExpectStudentError(grader.Grade(answer, {"1/2", "N", "n", "n"}), util::ErrorKind::kDomain,
                     "There appears to be an error with the sum you entered: Lower summation "
                     "limit does not evaluate to an integer.",
                     "sum_lower_limit_not_integer", ctx);
  ExpectStudentError(grader.Grade(answer, {"1", "N + 1/2", "n", "n"}), util::ErrorKind::kDomain,
                     "There appears to be an error with the sum you entered: Upper summation "
                     "limit does not evaluate to an integer.",
                     "sum_upper_limit_not_integer", ctx);
  ExpectStudentError(grader.Grade(answer, {"i", "N", "n", "n"}), util::ErrorKind::kDomain,
                     "There appears to be an error with the sum you entered: Summation limits "
                     "must be real but have evaluated to complex numbers.",
                     "sum_complex_limit", ctx);
  ExpectStudentError(grader.Grade(answer, {"1", "10^30", "n", "n"}), util::ErrorKind::kDomain,
                     "There appears to be an error with the sum you entered: Summation limits "
                     "must be at most 1000000 in magnitude; use infty for an unbounded sum.",
                     "sum_huge_upper_limit", ctx);
  ExpectStudentError(grader.Grade(answer, {"1", "N", "m", "n"}),
                     util::ErrorKind::kUnknownIdentifier,
                     "Invalid Input: 'm' not permitted in answer as a variable",
                     "sum_unknown_variable", ctx);
  const gr::GradeResult division = grader.Grade(answer, {"1", "N", "1/(n - 2)", "n"});
  ExpectTrue(division.diagnostic && division.diagnostic->kind == util::ErrorKind::kZeroDivision,
             "sum_zero_division", ctx);
  const gr::GradeResult parse = grader.Grade(answer, {"1", "N", "(n", "n"});
  ExpectTrue(parse.diagnostic && parse.diagnostic->kind == util::ErrorKind::kParse,
             "sum_parse_error", ctx);
}

void TestConfigurationErrors(TestContext* ctx) {
  const gr::SumGrader grader(WithUpperLimit());
  std::string message = ExpectThrowsKind(
      [&] { grader.Grade({"1", "N", "n +", "n"}, {"1", "N", "n", "n"}); },
      util::ErrorKind::kConfig, "sum_answer_parse_error", ctx);
  ExpectTrue(Contains(message, "Summation Error with author's stored answer: "),
             "sum_answer_parse_error_message", ctx);
  ExpectThrowsKind([&] { grader.Grade({"1/2", "N", "n", "n"}, {"1", "N", "n", "n"}); },
                   util::ErrorKind::kConfig, "sum_answer_limit_error", ctx);

  gr::SumConfig config;
  config.infty_val = 0;
  ExpectThrowsKind([&] { gr::SumGrader invalid(config); }, util::ErrorKind::kConfig,
                   "sum_infty_val_positive", ctx);
  config = gr::SumConfig();
  config.even_odd = 3;
  ExpectThrowsKind([&] { gr::SumGrader invalid(config); }, util::ErrorKind::kConfig,
                   "sum_even_odd_range", ctx);
  config = gr::SumConfig();
  config.infty_val = 1e7;
  ExpectThrowsKind([&] { gr::SumGrader invalid(config); }, util::ErrorKind::kConfig,
                   "sum_infty_val_within_max_limit", ctx);
  config = gr::SumConfig();
  config.base.samples = 0;
  ExpectThrowsKind([&] { gr::SumGrader invalid(config); }, util::ErrorKind::kConfig,
                   "sum_samples_positive", ctx);
}

}  // namespace

void RunSumGraderTests(TestContext* ctx) {
  TestPerformSummation(ctx);
  TestGrading(ctx);
  TestStudentErrors(ctx);
  TestConfigurationErrors(ctx);
}

}  // namespace test
