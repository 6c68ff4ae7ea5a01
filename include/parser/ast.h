#ifndef MATHGRADE_PARSER_AST_H_
#define MATHGRADE_PARSER_AST_H_

#include <memory>
#include <set>
#include <string>
#include <utility>
#include <vector>

// AST nodes for formula expressions.

namespace mathgrade::parser {

enum class UnaryOp { kNegate };
enum class BinaryOp { kAdd, kSub, kMul, kDiv, kPow };

const char* BinaryOpSymbol(BinaryOp op);

struct Expression {
  virtual ~Expression() = default;
  // Source range in the original input (0-based, end exclusive).
  int start = -1;
  int end = -1;
};

/// Numeric literal value with an optional suffix ("%", "k", ...).
struct NumberLiteral : public Expression {
  NumberLiteral(double v, std::string lex, std::string sfx)
      : value(v), lexeme(std::move(lex)), suffix(std::move(sfx)) {}
  double value;
  std::string lexeme;
  std::string suffix;
};

/// Named variable reference.
struct Identifier : public Expression {
  explicit Identifier(std::string n) : name(std::move(n)) {}
  std::string name;
};

/// Function call with positional arguments (at least one).
struct CallExpression : public Expression {
  CallExpression(std::string callee_name, std::vector<std::unique_ptr<Expression>> arguments)
      : callee(std::move(callee_name)), args(std::move(arguments)) {}
  std::string callee;
  std::vector<std::unique_ptr<Expression>> args;
};

/// Unary negation.
struct UnaryExpression : public Expression {
  UnaryExpression(UnaryOp o, std::unique_ptr<Expression> expr) : op(o), operand(std::move(expr)) {}
  UnaryOp op;
  std::unique_ptr<Expression> operand;
};

/// Binary expression for sums, differences and powers.
struct BinaryExpression : public Expression {
  BinaryExpression(BinaryOp o, std::unique_ptr<Expression> lhs_expr,
                   std::unique_ptr<Expression> rhs_expr)
      : op(o), lhs(std::move(lhs_expr)), rhs(std::move(rhs_expr)) {}
  BinaryOp op;
  std::unique_ptr<Expression> lhs;
  std::unique_ptr<Expression> rhs;
};

/// Chain of multiplications and divisions, kept flat so that a parenthesized group
/// remains distinguishable from an unbroken chain. ops[i] joins operands[i] and
/// operands[i + 1].
struct ProductExpression : public Expression {
  ProductExpression(std::vector<std::unique_ptr<Expression>> factors, std::vector<BinaryOp> o)
      : operands(std::move(factors)), ops(std::move(o)) {}
  std::vector<std::unique_ptr<Expression>> operands;
  std::vector<BinaryOp> ops;
};

/// Parallel combination a||b||c = 1/(1/a + 1/b + 1/c).
struct ParallelExpression : public Expression {
  explicit ParallelExpression(std::vector<std::unique_ptr<Expression>> items)
      : operands(std::move(items)) {}
  std::vector<std::unique_ptr<Expression>> operands;
};

/// Bracketed array literal; nested literals build matrices and tensors.
struct ArrayLiteral : public Expression {
  explicit ArrayLiteral(std::vector<std::unique_ptr<Expression>> items)
      : elements(std::move(items)) {}
  std::vector<std::unique_ptr<Expression>> elements;
};

/// A parsed formula with the names it references. Immutable once built and shared
/// between callers through the parse cache.
struct ParsedExpression {
  std::string source;
  std::string stripped;
  std::unique_ptr<Expression> root;
  std::set<std::string> variables_used;
  std::set<std::string> functions_used;
  std::set<std::string> suffixes_used;
};

}  // namespace mathgrade::parser

#endif  // MATHGRADE_PARSER_AST_H_
