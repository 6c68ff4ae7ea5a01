#ifndef MATHGRADE_LEXER_LEXER_H_
#define MATHGRADE_LEXER_LEXER_H_

#include <string>
#include <vector>

#include "lexer/token.h"
#include "util/error.h"

namespace mathgrade::lexer {

class Lexer {
 public:
  /// Initializes a lexer over the provided source string. Whitespace is discarded up
  /// front; token positions still refer to `source`.
  explicit Lexer(const std::string& source);

  /// Returns the next token, throwing util::Error on malformed names or numbers.
  Token NextToken();

  /// Tokenizes the whole input, including the trailing kEof token.
  std::vector<Token> Tokenize();

  /// The source with all whitespace removed.
  const std::string& stripped() const { return source_; }
  const std::string& original() const { return original_; }

  /// Maps an offset in the stripped source back to the original string.
  int OriginalOffset(size_t stripped_index) const;

 private:
  char Peek() const;
  char PeekNext() const;
  char Advance();
  bool IsAtEnd() const;
  Token MakeToken(TokenType type, std::string lexeme, size_t begin) const;
  Token NumberToken();
  Token IdentifierToken();
  void ReadIndex(std::string* lexeme);

  std::string original_;
  std::string source_;
  std::vector<int> offsets_;
  size_t index_;
};

}  // namespace mathgrade::lexer

#endif  // MATHGRADE_LEXER_LEXER_H_
