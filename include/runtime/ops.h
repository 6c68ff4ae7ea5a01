#ifndef MATHGRADE_RUNTIME_OPS_H_
#define MATHGRADE_RUNTIME_OPS_H_

#include "parser/ast.h"
#include "runtime/environment.h"
#include "runtime/value.h"

namespace mathgrade::runtime {

struct EvalOptions {
  /// When false, any intermediate infinity raises a kOverflow error.
  bool allow_inf = false;
  /// Highest array rank a literal may produce; negative means unlimited.
  int max_array_dim = -1;
  bool negative_powers = true;
};

struct EvalMetadata {
  int max_array_dim_used = 0;
};

class Evaluator {
 public:
  /// Evaluates AST nodes against the provided environment (not owned).
  explicit Evaluator(const Environment* env, EvalOptions options = EvalOptions());

  /// Dispatches to the appropriate visitor for the expression kind. Results containing a
  /// NaN collapse to a scalar NaN; errors without a location pick up the node's range.
  Value Evaluate(const parser::Expression& expr);

  const EvalMetadata& metadata() const { return metadata_; }

 private:
  Value Dispatch(const parser::Expression& expr);
  Value EvaluateNumber(const parser::NumberLiteral& literal);
  Value EvaluateIdentifier(const parser::Identifier& identifier);
  Value EvaluateCall(const parser::CallExpression& call);
  Value EvaluateUnary(const parser::UnaryExpression& expr);
  Value EvaluateBinary(const parser::BinaryExpression& expr);
  Value EvaluateProduct(const parser::ProductExpression& expr);
  Value EvaluateParallel(const parser::ParallelExpression& expr);
  Value EvaluateArray(const parser::ArrayLiteral& literal);
  Value Finish(Value result) const;

  const Environment* env_;
  EvalOptions options_;
  EvalMetadata metadata_;
};

/// Throws a kUnknownIdentifier util::Error naming every variable, function or number
/// suffix used by `parsed` that `env` does not provide, with case and
/// missing-multiplication hints.
void CheckScope(const parser::ParsedExpression& parsed, const Environment& env);

/// CheckScope, then evaluation, then the max_array_dim limit.
Value EvaluateFormula(const parser::ParsedExpression& parsed, const Environment& env,
                      const EvalOptions& options = EvalOptions(),
                      EvalMetadata* metadata = nullptr);

}  // namespace mathgrade::runtime

#endif  // MATHGRADE_RUNTIME_OPS_H_
