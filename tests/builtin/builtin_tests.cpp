#include "builtin/specify_domain.h"
#include "test_util.h"

namespace test {

namespace {

std::string EvalError(const std::string& expr, util::ErrorKind kind, const std::string& name,
                      TestContext* ctx) {
  auto env = MakeScope();
  return ExpectThrowsKind([&] { EvalExpr(expr, *env); }, kind, name, ctx);
}

}  // namespace

void RunBuiltinTests(TestContext* ctx) {
  auto env = MakeScope();

  {
    rt::Environment first;
    rt::Environment second;
    bt::InstallDefaultFunctions(&first);
    bt::InstallDefaultFunctions(&second);
    ExpectTrue(first.FunctionNames() == second.FunctionNames() &&
                   first.FunctionNames() == bt::DefaultFunctionNames() && first.HasFunction("sin"),
               "function_table_installs_repeatably", ctx);
  }

  ExpectComplexNear(EvalExpr("i^2", *env).scalar(), -1.0, "imaginary_unit", ctx);
  ExpectComplexNear(EvalExpr("j", *env).scalar(), rt::Complex(0.0, 1.0), "engineering_j", ctx);
  ExpectNear(EvalReal("ln(e)", *env), 1.0, "natural_log_of_e", ctx);
  ExpectNear(EvalReal("cos(pi)", *env), -1.0, "cos_pi", ctx);
  ExpectComplexNear(EvalExpr("sqrt(-4)", *env).scalar(), rt::Complex(0.0, 2.0),
                    "sqrt_of_negative", ctx);
  ExpectComplexNear(EvalExpr("ln(-1)", *env).scalar(), rt::Complex(0.0, std::acos(-1.0)),
                    "log_of_negative", ctx);
  ExpectNear(EvalReal("log10(1000)", *env), 3.0, "log10", ctx);
  ExpectNear(EvalReal("log2(8)", *env), 3.0, "log2", ctx);
  ExpectTrue(EvalExpr("arcsin(2)", *env).scalar().imag() != 0.0, "arcsin_outside_domain", ctx);
  ExpectNear(EvalReal("arccot(-1)", *env), -std::acos(-1.0) / 4.0, "arccot_negative", ctx);
  ExpectNear(EvalReal("fact(5)", *env), 120.0, "factorial", ctx);
  ExpectNear(EvalReal("factorial(0.5)", *env), std::tgamma(1.5), "factorial_of_fraction", ctx);
  {
    const double pi = std::acos(-1.0);
    ExpectNear(std::abs(EvalExpr("fact(i)", *env).scalar()), std::sqrt(pi / std::sinh(pi)),
               "factorial_of_complex", ctx);
  }
  ExpectNear(EvalReal("arctan2(1, 0)", *env), 0.0, "arctan2_on_axis", ctx);
  ExpectNear(EvalReal("arctan2(0, 1)", *env), std::acos(-1.0) / 2.0, "arctan2_quadrant", ctx);
  ExpectNear(EvalReal("kronecker(2, 2) + kronecker(1, 2)", *env), 1.0, "kronecker", ctx);
  ExpectNear(EvalReal("min(3, 1, 2) + max(3, 1, 2)", *env), 4.0, "min_max", ctx);
  ExpectNear(EvalReal("floor(2.5) + ceil(2.5)", *env), 5.0, "floor_ceil", ctx);
  ExpectTrue(EvalExpr("conj([1 + i, 2])", *env) ==
                 rt::Value::Vector({rt::Complex(1.0, -1.0), rt::Complex(2.0, 0.0)}),
             "conj_elementwise", ctx);
  ExpectNear(EvalReal("re(3 + 4*i) + im(3 + 4*i)", *env), 7.0, "real_and_imaginary_parts", ctx);
  ExpectNear(EvalReal("50%", *env), 0.5, "percent", ctx);

  std::string message = EvalError("fact(-2)", util::ErrorKind::kDomain,
                                  "factorial_negative_integer", ctx);
  ExpectTrue(Contains(message, "cannot be used at negative integer values"),
             "factorial_negative_integer_message", ctx);
  message = EvalError("arctan2(0, 0)", util::ErrorKind::kDomain, "arctan2_origin", ctx);
  ExpectTrue(message == "arctan2(0, 0) is undefined", "arctan2_origin_message", ctx);
  message = EvalError("floor(i)", util::ErrorKind::kDomain, "floor_of_complex", ctx);
  ExpectTrue(Contains(message, "Its input does not seem to be in its domain"),
             "floor_of_complex_message", ctx);
  message = EvalError("max(1)", util::ErrorKind::kDomain, "max_needs_two_inputs", ctx);
  ExpectTrue(Contains(message, "expected at least 2 inputs, but received 1."),
             "max_arity_message", ctx);
  message = EvalError("sin(1, 2)", util::ErrorKind::kDomain, "sin_two_inputs", ctx);
  ExpectTrue(message ==
                 "There was an error evaluating function sin(...): expected 1 inputs, but "
                 "received 2.",
             "sin_arity_message", ctx);
  message = EvalError("sin([1, 2])", util::ErrorKind::kDomain, "sin_of_vector", ctx);
  ExpectTrue(Contains(message, "1st input has an error: received a vector of length 2, "
                               "expected a scalar"),
             "sin_of_vector_message", ctx);
  message = EvalError("cross([1, 0, 0], [1, 2])", util::ErrorKind::kDomain,
                      "cross_of_short_vector", ctx);
  ExpectTrue(Contains(message, "1st input is ok: received a vector of length 3 as expected") &&
                 Contains(message, "2nd input has an error: received a vector of length 2"),
             "cross_report_lists_each_input", ctx);
  message = EvalError("abs([[1, 2], [3, 4]])", util::ErrorKind::kDomain, "abs_of_matrix", ctx);
  ExpectTrue(Contains(message, "try norm(...) instead"), "abs_of_matrix_message", ctx);
  EvalError("det([[1, 2, 3], [4, 5, 6]])", util::ErrorKind::kDomain, "det_of_non_square", ctx);

  ExpectNear(EvalReal("abs([3, 4])", *env), 5.0, "abs_of_vector", ctx);
  ExpectNear(EvalReal("abs(-3)", *env), 3.0, "abs_of_scalar", ctx);
  ExpectNear(EvalReal("norm([[1, 1], [1, 1]])", *env), 2.0, "norm_of_matrix", ctx);
  ExpectNear(EvalReal("det([[1, 2], [3, 4]])", *env), -2.0, "det", ctx);
  ExpectNear(EvalReal("trace([[1, 2], [3, 4]])", *env), 5.0, "trace", ctx);
  ExpectTrue(EvalExpr("cross([1, 0, 0], [0, 1, 0])", *env) == rt::Value::Vector({0.0, 0.0, 1.0}),
             "cross", ctx);
  ExpectTrue(EvalExpr("trans([[1, 2], [3, 4]])", *env) ==
                 rt::Value::Array({2, 2}, {1.0, 3.0, 2.0, 4.0}),
             "trans", ctx);
  ExpectTrue(EvalExpr("adj([[i, 0], [0, 1]])", *env) ==
                 rt::Value::Array({2, 2}, {rt::Complex(0.0, -1.0), 0.0, 0.0, 1.0}),
             "adj_conjugates", ctx);

  ExpectTrue(bt::LowOrdinal(1) == "1st" && bt::LowOrdinal(2) == "2nd" &&
                 bt::LowOrdinal(3) == "3rd" && bt::LowOrdinal(4) == "4th" &&
                 bt::LowOrdinal(21) == "21th",
             "low_ordinal", ctx);
  ExpectTrue(bt::ShapeSpec::Square().Description() == "square matrix" &&
                 bt::ShapeSpec::Matrix(2, 3).Description() == "matrix of shape (rows: 2, cols: 3)",
             "shape_spec_description", ctx);

  {
    auto custom = std::make_shared<rt::Environment>(bt::DefaultScope());
    custom->DefineFunction("f", bt::SpecifyDomain("f", {bt::ShapeSpec::Scalar()},
                                                  [](const std::vector<rt::Value>& args) {
                                                    return args[0];
                                                  }));
    std::string report = ExpectThrowsKind([&] { EvalExpr("f()", *custom); },
                                          util::ErrorKind::kParse, "empty_call_is_parse_error",
                                          ctx);
    ExpectTrue(Contains(report, "must be called with an input"), "empty_call_message", ctx);
  }

  {
    auto physics = std::make_shared<rt::Environment>(bt::DefaultScope());
    bt::InstallArrayFunctions(physics.get());
    bt::InstallPauliMatrices(physics.get());
    bt::InstallCartesianXyz(physics.get());
    bt::InstallCartesianIjk(physics.get());
    bt::InstallMetricSuffixes(physics.get());
    ExpectTrue(EvalExpr("sigma_x*sigma_y - i*sigma_z", *physics) == rt::Value::Zeros({2, 2}),
               "pauli_commutation", ctx);
    ExpectTrue(EvalExpr("sigma_y^2", *physics) == rt::Value::Array({2, 2}, {1.0, 0.0, 0.0, 1.0}),
               "pauli_square", ctx);
    ExpectTrue(EvalExpr("cross(hatx, haty) - hatk", *physics) == rt::Value::Zeros({3}),
               "cartesian_unit_vectors", ctx);
    ExpectNear(EvalReal("2k + 3m", *physics), 2000.003, "metric_suffixes", ctx);
  }

  ExpectTrue(bt::DefaultFunctionNames().count("sin") > 0 &&
                 bt::DefaultFunctionNames().count("det") == 0,
             "default_function_names", ctx);
  ExpectTrue(bt::DefaultVariableNames() == std::set<std::string>({"e", "i", "j", "pi"}),
             "default_variable_names", ctx);
}

}  // namespace test
