#ifndef MATHGRADE_PARSER_PARSER_H_
#define MATHGRADE_PARSER_PARSER_H_

#include <memory>
#include <set>
#include <string>

#include "lexer/lexer.h"
#include "parser/ast.h"
#include "util/error.h"

namespace mathgrade::parser {

class Parser {
 public:
  /// Builds a parser with ownership of the provided lexer.
  explicit Parser(lexer::Lexer lexer);

  /// Parses a complete formula and throws a kParse util::Error on syntax issues.
  std::unique_ptr<Expression> ParseExpression();

  const std::set<std::string>& variables_used() const { return variables_used_; }
  const std::set<std::string>& functions_used() const { return functions_used_; }
  const std::set<std::string>& suffixes_used() const { return suffixes_used_; }

 private:
  const lexer::Token& Peek() const;
  const lexer::Token& Next() const;
  const lexer::Token& Previous() const;
  lexer::Token Advance();
  bool Match(lexer::TokenType type);
  void Consume(lexer::TokenType type);

  [[noreturn]] void Fail(const lexer::Token& at) const;
  [[noreturn]] void FailMissingOperand(const lexer::Token& at) const;

  std::unique_ptr<Expression> ExpressionRule();
  std::unique_ptr<Expression> Product();
  std::unique_ptr<Expression> Parallel();
  std::unique_ptr<Expression> Negation();
  std::unique_ptr<Expression> Power();
  std::unique_ptr<Expression> Atom();
  std::unique_ptr<Expression> FinishCall(const lexer::Token& name);
  std::unique_ptr<Expression> FinishArray(const lexer::Token& open);

  lexer::Lexer lexer_;
  lexer::Token current_;
  lexer::Token lookahead_;
  lexer::Token previous_;
  std::set<std::string> variables_used_;
  std::set<std::string> functions_used_;
  std::set<std::string> suffixes_used_;
};

/// Validates brackets, then parses `source` into an immutable ParsedExpression.
std::shared_ptr<const ParsedExpression> ParseFormula(const std::string& source);

}  // namespace mathgrade::parser

#endif  // MATHGRADE_PARSER_PARSER_H_
