#include "runtime/ops.h"

#include <algorithm>
#include <cctype>
#include <exception>
#include <set>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "runtime/array_ops.h"
#include "util/error.h"
#include "util/string.h"

namespace mathgrade::runtime {

namespace {

const char kShapeMessage[] =
    "Unable to parse vector/matrix. If you're trying to enter a matrix, this is most likely "
    "caused by an unequal number of elements in each row.";

std::string JoinQuoted(const std::set<std::string>& names) {
  return util::Join(std::vector<std::string>(names.begin(), names.end()), "', '");
}

// Known names that differ from one of `bad` only by case.
std::set<std::string> CaseVariants(const std::set<std::string>& bad,
                                   const std::set<std::string>& known) {
  std::set<std::string> variants;
  for (const auto& wrong : bad) {
    const std::string lowered = util::ToLower(wrong);
    for (const auto& candidate : known) {
      if (util::ToLower(candidate) == lowered) {
        variants.insert(candidate);
      }
    }
  }
  return variants;
}

std::string CaseHint(const std::set<std::string>& bad, const std::set<std::string>& known) {
  const auto variants = CaseVariants(bad, known);
  if (variants.empty()) {
    return "";
  }
  return " (did you mean '" + JoinQuoted(variants) + "'?)";
}

bool AnyIn(const std::set<std::string>& names, const Environment& env) {
  for (const auto& name : names) {
    if (env.HasVariable(name)) return true;
  }
  return false;
}

std::string ForbiddenArrayMessage(int max_array_dim) {
  if (max_array_dim == 0) {
    return "Vector and matrix expressions have been forbidden in this entry.";
  }
  if (max_array_dim == 1) {
    return "Matrix expressions have been forbidden in this entry.";
  }
  return "Tensor expressions have been forbidden in this entry.";
}

}  // namespace

Evaluator::Evaluator(const Environment* env, EvalOptions options)
    : env_(env), options_(options) {}

Value Evaluator::Evaluate(const parser::Expression& expr) {
  try {
    return Finish(Dispatch(expr));
  } catch (const util::Error& err) {
    if (err.has_location() || expr.start < 0) {
      throw;
    }
    throw util::Error(err.kind(), err.what(), expr.start, expr.end);
  }
}

Value Evaluator::Dispatch(const parser::Expression& expr) {
  if (const auto* num = dynamic_cast<const parser::NumberLiteral*>(&expr)) {
    return EvaluateNumber(*num);
  }
  if (const auto* identifier = dynamic_cast<const parser::Identifier*>(&expr)) {
    return EvaluateIdentifier(*identifier);
  }
  if (const auto* call = dynamic_cast<const parser::CallExpression*>(&expr)) {
    return EvaluateCall(*call);
  }
  if (const auto* unary = dynamic_cast<const parser::UnaryExpression*>(&expr)) {
    return EvaluateUnary(*unary);
  }
  if (const auto* binary = dynamic_cast<const parser::BinaryExpression*>(&expr)) {
    return EvaluateBinary(*binary);
  }
  if (const auto* product = dynamic_cast<const parser::ProductExpression*>(&expr)) {
    return EvaluateProduct(*product);
  }
  if (const auto* parallel = dynamic_cast<const parser::ParallelExpression*>(&expr)) {
    return EvaluateParallel(*parallel);
  }
  if (const auto* array = dynamic_cast<const parser::ArrayLiteral*>(&expr)) {
    return EvaluateArray(*array);
  }
  throw util::Error(util::ErrorKind::kInternal, "Unknown expression type");
}

Value Evaluator::Finish(Value result) const {
  if (!options_.allow_inf && result.HasInf()) {
    throw util::Error(util::ErrorKind::kOverflow,
                      "Numerical overflow occurred. Does your expression generate very large "
                      "numbers?");
  }
  if (result.HasNaN()) {
    return Value::NaN();
  }
  return result;
}

Value Evaluator::EvaluateNumber(const parser::NumberLiteral& literal) {
  if (literal.suffix.empty()) {
    return Value::Real(literal.value);
  }
  auto scale = env_->GetSuffix(literal.suffix);
  if (!scale.has_value()) {
    throw util::Error(util::ErrorKind::kUnknownIdentifier,
                      "Invalid Input: '" + literal.suffix +
                          "' not permitted directly after a number");
  }
  return Value::Real(literal.value * scale.value());
}

Value Evaluator::EvaluateIdentifier(const parser::Identifier& identifier) {
  auto value = env_->Get(identifier.name);
  if (!value.has_value()) {
    throw util::Error(util::ErrorKind::kUnknownIdentifier,
                      "Invalid Input: '" + identifier.name +
                          "' not permitted in answer as a variable");
  }
  return value.value();
}

Value Evaluator::EvaluateCall(const parser::CallExpression& call) {
  auto fn = env_->GetFunction(call.callee);
  if (fn == nullptr) {
    throw util::Error(util::ErrorKind::kUnknownIdentifier,
                      "Invalid Input: '" + call.callee + "' not permitted in answer as a function");
  }
  std::vector<Value> args;
  args.reserve(call.args.size());
  for (const auto& arg : call.args) {
    args.push_back(Evaluate(*arg));
    if (args.back().HasNaN()) {
      return Value::NaN();
    }
  }
  const int received = static_cast<int>(args.size());
  if (!fn->validated && (fn->variadic ? received < fn->arity : received != fn->arity)) {
    throw util::Error(util::ErrorKind::kDomain,
                      "Wrong number of arguments passed to " + call.callee + "(...): Expected " +
                          std::to_string(fn->arity) + " inputs, but received " +
                          std::to_string(received) + ".");
  }
  try {
    return fn->impl(args);
  } catch (const util::Error&) {
    throw;
  } catch (const std::exception&) {
    throw util::Error(util::ErrorKind::kDomain,
                      "There was an error evaluating " + call.callee +
                          "(...). Its input does not seem to be in its domain.");
  }
}

Value Evaluator::EvaluateUnary(const parser::UnaryExpression& expr) {
  Value operand = Evaluate(*expr.operand);
  if (operand.HasNaN()) {
    return Value::NaN();
  }
  switch (expr.op) {
    case parser::UnaryOp::kNegate:
      return Negate(operand);
  }
  throw util::Error(util::ErrorKind::kInternal, "Unhandled unary operator");
}

Value Evaluator::EvaluateBinary(const parser::BinaryExpression& expr) {
  Value lhs = Evaluate(*expr.lhs);
  Value rhs = Evaluate(*expr.rhs);
  if (lhs.HasNaN() || rhs.HasNaN()) {
    return Value::NaN();
  }
  switch (expr.op) {
    case parser::BinaryOp::kAdd:
      return Add(lhs, rhs);
    case parser::BinaryOp::kSub:
      return Subtract(lhs, rhs);
    case parser::BinaryOp::kMul:
      return Multiply(lhs, rhs);
    case parser::BinaryOp::kDiv:
      return Divide(lhs, rhs);
    case parser::BinaryOp::kPow:
      return Power(lhs, rhs, options_.negative_powers);
  }
  throw util::Error(util::ErrorKind::kInternal, "Unhandled binary operator");
}

Value Evaluator::EvaluateProduct(const parser::ProductExpression& expr) {
  std::vector<Value> operands;
  operands.reserve(expr.operands.size());
  for (const auto& operand : expr.operands) {
    operands.push_back(Evaluate(*operand));
    if (operands.back().HasNaN()) {
      return Value::NaN();
    }
  }
  // A vector.vector product inside an unbroken chain may not meet a third vector.
  bool double_vector_product = false;
  Value result = operands[0];
  for (size_t i = 0; i < expr.ops.size(); ++i) {
    const Value& rhs = operands[i + 1];
    if (expr.ops[i] == parser::BinaryOp::kDiv) {
      result = Divide(result, rhs);
      continue;
    }
    if (rhs.IsVector()) {
      if (double_vector_product) {
        throw util::Error(util::ErrorKind::kShape,
                          "Multiplying three or more vectors is ambiguous. Please place "
                          "parentheses around vector multiplications.",
                          expr.start, expr.end);
      }
      if (result.IsVector()) {
        double_vector_product = true;
      }
    }
    result = Multiply(result, rhs);
  }
  return result;
}

Value Evaluator::EvaluateParallel(const parser::ParallelExpression& expr) {
  std::vector<Value> operands;
  operands.reserve(expr.operands.size());
  for (const auto& operand : expr.operands) {
    operands.push_back(Evaluate(*operand));
    if (operands.back().HasNaN()) {
      return Value::NaN();
    }
  }
  for (const auto& operand : operands) {
    if (operand.IsScalar() && operand.IsZero()) {
      return Value::NaN();
    }
  }
  const Value one = Value::Real(1.0);
  Value reciprocal_sum = Value::Real(0.0);
  for (const auto& operand : operands) {
    reciprocal_sum = Add(reciprocal_sum, Divide(one, operand));
  }
  return Divide(one, reciprocal_sum);
}

Value Evaluator::EvaluateArray(const parser::ArrayLiteral& literal) {
  std::vector<Value> elements;
  elements.reserve(literal.elements.size());
  for (const auto& element : literal.elements) {
    elements.push_back(Evaluate(*element));
    if (elements.back().HasNaN()) {
      return Value::NaN();
    }
  }
  const std::vector<int64_t>& inner_shape = elements.front().shape;
  std::vector<Complex> data;
  for (const auto& element : elements) {
    if (element.shape != inner_shape) {
      throw util::Error(util::ErrorKind::kShape, kShapeMessage, literal.start, literal.end);
    }
    data.insert(data.end(), element.data.begin(), element.data.end());
  }
  std::vector<int64_t> shape;
  shape.push_back(static_cast<int64_t>(elements.size()));
  shape.insert(shape.end(), inner_shape.begin(), inner_shape.end());
  Value array = Value::Array(std::move(shape), std::move(data));
  metadata_.max_array_dim_used = std::max(metadata_.max_array_dim_used, array.Rank());
  return array;
}

void CheckScope(const parser::ParsedExpression& parsed, const Environment& env) {
  std::set<std::string> bad_vars;
  for (const auto& name : parsed.variables_used) {
    if (!env.HasVariable(name)) bad_vars.insert(name);
  }
  if (!bad_vars.empty()) {
    throw util::Error(util::ErrorKind::kUnknownIdentifier,
                      "Invalid Input: '" + JoinQuoted(bad_vars) +
                          "' not permitted in answer as a variable" +
                          CaseHint(bad_vars, env.VariableNames()));
  }

  std::set<std::string> bad_funcs;
  for (const auto& name : parsed.functions_used) {
    if (!env.HasFunction(name)) bad_funcs.insert(name);
  }
  if (!bad_funcs.empty()) {
    std::string message = "Invalid Input: '" + JoinQuoted(bad_funcs) +
                          "' not permitted in answer as a function";
    if (AnyIn(bad_funcs, env)) {
      message += " (did you forget to use * for multiplication?)";
    }
    message += CaseHint(bad_funcs, env.FunctionNames());
    throw util::Error(util::ErrorKind::kUnknownIdentifier, message);
  }

  std::set<std::string> bad_suffixes;
  for (const auto& suffix : parsed.suffixes_used) {
    if (!env.GetSuffix(suffix).has_value()) bad_suffixes.insert(suffix);
  }
  if (!bad_suffixes.empty()) {
    std::string message = "Invalid Input: '" + JoinQuoted(bad_suffixes) +
                          "' not permitted directly after a number";
    if (AnyIn(bad_suffixes, env)) {
      message += " (did you forget to use * for multiplication?)";
    }
    message += CaseHint(bad_suffixes, env.SuffixNames());
    throw util::Error(util::ErrorKind::kUnknownIdentifier, message);
  }
}

Value EvaluateFormula(const parser::ParsedExpression& parsed, const Environment& env,
                      const EvalOptions& options, EvalMetadata* metadata) {
  CheckScope(parsed, env);
  Evaluator evaluator(&env, options);
  Value result = evaluator.Evaluate(*parsed.root);
  if (metadata != nullptr) {
    *metadata = evaluator.metadata();
  }
  if (options.max_array_dim >= 0 &&
      evaluator.metadata().max_array_dim_used > options.max_array_dim) {
    throw util::Error(util::ErrorKind::kShape, ForbiddenArrayMessage(options.max_array_dim));
  }
  return result;
}

}  // namespace mathgrade::runtime
