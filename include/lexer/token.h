#ifndef MATHGRADE_LEXER_TOKEN_H_
#define MATHGRADE_LEXER_TOKEN_H_

#include <string>

namespace mathgrade::lexer {

enum class TokenType {
  kEof,
  kNumber,
  kIdentifier,
  kPlus,
  kMinus,
  kStar,
  kSlash,
  kCaret,
  kParallel,
  kComma,
  kLParen,
  kRParen,
  kLBracket,
  kRBracket,
  kInvalid,
};

const char* TokenTypeName(TokenType type);

/// A lexical token with type, original lexeme, and source range. Positions are 0-based
/// offsets into the caller's original string, whitespace included.
struct Token {
  TokenType type;
  std::string lexeme;
  int start;
  int end;
  /// Trailing suffix of a number token ("%", "k", ...), empty otherwise.
  std::string suffix;
};

}  // namespace mathgrade::lexer

#endif  // MATHGRADE_LEXER_TOKEN_H_
