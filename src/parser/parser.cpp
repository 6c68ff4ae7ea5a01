#include "parser/parser.h"

#include <cstdlib>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "parser/bracket_validator.h"

namespace mathgrade::parser {

namespace {

bool IsOperator(lexer::TokenType type) {
  switch (type) {
    case lexer::TokenType::kPlus:
    case lexer::TokenType::kMinus:
    case lexer::TokenType::kStar:
    case lexer::TokenType::kSlash:
    case lexer::TokenType::kCaret:
    case lexer::TokenType::kParallel:
      return true;
    default:
      return false;
  }
}

template <typename T>
std::unique_ptr<T> WithRange(std::unique_ptr<T> node, int start, int end) {
  node->start = start;
  node->end = end;
  return node;
}

}  // namespace

const char* BinaryOpSymbol(BinaryOp op) {
  switch (op) {
    case BinaryOp::kAdd:
      return "+";
    case BinaryOp::kSub:
      return "-";
    case BinaryOp::kMul:
      return "*";
    case BinaryOp::kDiv:
      return "/";
    case BinaryOp::kPow:
      return "^";
  }
  return "?";
}

Parser::Parser(lexer::Lexer lexer)
    : lexer_(std::move(lexer)),
      current_(lexer_.NextToken()),
      lookahead_(lexer_.NextToken()),
      previous_{lexer::TokenType::kInvalid, "", -1, -1, ""} {}

const lexer::Token& Parser::Peek() const {
  return current_;
}

const lexer::Token& Parser::Next() const {
  return lookahead_;
}

const lexer::Token& Parser::Previous() const {
  return previous_;
}

lexer::Token Parser::Advance() {
  previous_ = current_;
  current_ = lookahead_;
  if (lookahead_.type != lexer::TokenType::kEof) {
    lookahead_ = lexer_.NextToken();
  }
  return previous_;
}

bool Parser::Match(lexer::TokenType type) {
  if (Peek().type == type) {
    Advance();
    return true;
  }
  return false;
}

void Parser::Consume(lexer::TokenType type) {
  if (Peek().type == type) {
    Advance();
    return;
  }
  Fail(Peek());
}

void Parser::Fail(const lexer::Token& at) const {
  if (at.type == lexer::TokenType::kInvalid) {
    throw util::Error(util::ErrorKind::kParse,
                      "Invalid Input: unrecognized character '" + at.lexeme + "'", at.start,
                      at.end);
  }
  throw util::Error(util::ErrorKind::kParse,
                    "Invalid Input: Could not parse '" + lexer_.original() + "' as a formula",
                    at.start, at.end);
}

void Parser::FailMissingOperand(const lexer::Token& at) const {
  const lexer::Token& prev = Previous();
  const bool after_operator = IsOperator(prev.type);
  if (at.type == lexer::TokenType::kEof && after_operator) {
    throw util::Error(util::ErrorKind::kParse,
                      "Invalid Input: Missing operand after '" + prev.lexeme + "'", prev.start,
                      prev.end);
  }
  if (IsOperator(at.type)) {
    if (after_operator) {
      throw util::Error(util::ErrorKind::kParse,
                        "Invalid Input: Missing operand between '" + prev.lexeme + "' and '" +
                            at.lexeme + "'",
                        prev.start, at.end);
    }
    throw util::Error(util::ErrorKind::kParse,
                      "Invalid Input: Missing operand before '" + at.lexeme + "'", at.start,
                      at.end);
  }
  Fail(at);
}

std::unique_ptr<Expression> Parser::ParseExpression() {
  if (Peek().type == lexer::TokenType::kEof) {
    throw util::Error(util::ErrorKind::kParse, "Invalid Input: Empty expression", 0, 0);
  }
  auto expr = ExpressionRule();
  if (Peek().type != lexer::TokenType::kEof) {
    // Two operands with no operator between them, e.g. "2(3)" or "[1][2]".
    Fail(Peek());
  }
  return expr;
}

std::unique_ptr<Expression> Parser::ExpressionRule() {
  Match(lexer::TokenType::kPlus);  // optional leading plus
  auto expr = Product();
  while (true) {
    BinaryOp op;
    if (Match(lexer::TokenType::kPlus)) {
      op = BinaryOp::kAdd;
    } else if (Match(lexer::TokenType::kMinus)) {
      op = BinaryOp::kSub;
    } else {
      break;
    }
    auto rhs = Product();
    const int start = expr->start;
    const int end = rhs->end;
    expr = WithRange(std::make_unique<BinaryExpression>(op, std::move(expr), std::move(rhs)),
                     start, end);
  }
  return expr;
}

std::unique_ptr<Expression> Parser::Product() {
  auto first = Parallel();
  if (Peek().type != lexer::TokenType::kStar && Peek().type != lexer::TokenType::kSlash) {
    return first;
  }
  const int start = first->start;
  std::vector<std::unique_ptr<Expression>> operands;
  std::vector<BinaryOp> ops;
  operands.push_back(std::move(first));
  while (true) {
    if (Match(lexer::TokenType::kStar)) {
      ops.push_back(BinaryOp::kMul);
    } else if (Match(lexer::TokenType::kSlash)) {
      ops.push_back(BinaryOp::kDiv);
    } else {
      break;
    }
    operands.push_back(Parallel());
  }
  const int end = operands.back()->end;
  return WithRange(std::make_unique<ProductExpression>(std::move(operands), std::move(ops)),
                   start, end);
}

std::unique_ptr<Expression> Parser::Parallel() {
  auto first = Negation();
  if (Peek().type != lexer::TokenType::kParallel) {
    return first;
  }
  const int start = first->start;
  std::vector<std::unique_ptr<Expression>> operands;
  operands.push_back(std::move(first));
  while (Match(lexer::TokenType::kParallel)) {
    operands.push_back(Negation());
  }
  const int end = operands.back()->end;
  return WithRange(std::make_unique<ParallelExpression>(std::move(operands)), start, end);
}

std::unique_ptr<Expression> Parser::Negation() {
  if (Match(lexer::TokenType::kMinus)) {
    const int start = Previous().start;
    auto operand = Power();
    const int end = operand->end;
    return WithRange(std::make_unique<UnaryExpression>(UnaryOp::kNegate, std::move(operand)),
                     start, end);
  }
  return Power();
}

std::unique_ptr<Expression> Parser::Power() {
  auto base = Atom();
  if (!Match(lexer::TokenType::kCaret)) {
    return base;
  }
  // Right-associative; each exponent may carry a single minus sign.
  std::unique_ptr<Expression> exponent;
  if (Match(lexer::TokenType::kMinus)) {
    const int neg_start = Previous().start;
    auto inner = Power();
    const int neg_end = inner->end;
    exponent = WithRange(std::make_unique<UnaryExpression>(UnaryOp::kNegate, std::move(inner)),
                         neg_start, neg_end);
  } else {
    exponent = Power();
  }
  const int start = base->start;
  const int end = exponent->end;
  return WithRange(
      std::make_unique<BinaryExpression>(BinaryOp::kPow, std::move(base), std::move(exponent)),
      start, end);
}

std::unique_ptr<Expression> Parser::Atom() {
  const lexer::Token token = Peek();
  switch (token.type) {
    case lexer::TokenType::kNumber: {
      Advance();
      double value = std::strtod(token.lexeme.c_str(), nullptr);
      if (!token.suffix.empty()) {
        suffixes_used_.insert(token.suffix);
      }
      return WithRange(std::make_unique<NumberLiteral>(value, token.lexeme, token.suffix),
                       token.start, token.end);
    }
    case lexer::TokenType::kIdentifier: {
      if (Next().type == lexer::TokenType::kLParen) {
        Advance();  // name
        Advance();  // '('
        return FinishCall(token);
      }
      Advance();
      variables_used_.insert(token.lexeme);
      return WithRange(std::make_unique<Identifier>(token.lexeme), token.start, token.end);
    }
    case lexer::TokenType::kLParen: {
      Advance();
      auto inner = ExpressionRule();
      Consume(lexer::TokenType::kRParen);
      // Parentheses only regroup; the inner node keeps its own identity.
      return inner;
    }
    case lexer::TokenType::kLBracket: {
      Advance();
      return FinishArray(token);
    }
    default:
      break;
  }
  FailMissingOperand(token);
}

std::unique_ptr<Expression> Parser::FinishCall(const lexer::Token& name) {
  if (Peek().type == lexer::TokenType::kRParen) {
    throw util::Error(util::ErrorKind::kParse,
                      "Invalid Input: " + name.lexeme + "(...) must be called with an input",
                      name.start, Peek().end);
  }
  std::vector<std::unique_ptr<Expression>> args;
  do {
    args.push_back(ExpressionRule());
  } while (Match(lexer::TokenType::kComma));
  Consume(lexer::TokenType::kRParen);
  functions_used_.insert(name.lexeme);
  return WithRange(std::make_unique<CallExpression>(name.lexeme, std::move(args)), name.start,
                   Previous().end);
}

std::unique_ptr<Expression> Parser::FinishArray(const lexer::Token& open) {
  std::vector<std::unique_ptr<Expression>> elements;
  do {
    elements.push_back(ExpressionRule());
  } while (Match(lexer::TokenType::kComma));
  Consume(lexer::TokenType::kRBracket);
  return WithRange(std::make_unique<ArrayLiteral>(std::move(elements)), open.start,
                   Previous().end);
}

std::shared_ptr<const ParsedExpression> ParseFormula(const std::string& source) {
  ValidateBrackets(source);
  lexer::Lexer lexer(source);
  auto parsed = std::make_shared<ParsedExpression>();
  parsed->source = source;
  parsed->stripped = lexer.stripped();
  Parser parser(std::move(lexer));
  parsed->root = parser.ParseExpression();
  parsed->variables_used = parser.variables_used();
  parsed->functions_used = parser.functions_used();
  parsed->suffixes_used = parser.suffixes_used();
  return parsed;
}

}  // namespace mathgrade::parser
