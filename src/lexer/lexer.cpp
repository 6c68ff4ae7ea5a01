#include "lexer/lexer.h"

#include <cctype>
#include <utility>

#include "util/string.h"

namespace mathgrade::lexer {

namespace {

bool IsDigit(char ch) {
  return std::isdigit(static_cast<unsigned char>(ch)) != 0;
}

bool IsAlpha(char ch) {
  return std::isalpha(static_cast<unsigned char>(ch)) != 0;
}

bool IsAlnum(char ch) {
  return std::isalnum(static_cast<unsigned char>(ch)) != 0;
}

}  // namespace

const char* TokenTypeName(TokenType type) {
  switch (type) {
    case TokenType::kEof:
      return "end of input";
    case TokenType::kNumber:
      return "number";
    case TokenType::kIdentifier:
      return "identifier";
    case TokenType::kPlus:
      return "'+'";
    case TokenType::kMinus:
      return "'-'";
    case TokenType::kStar:
      return "'*'";
    case TokenType::kSlash:
      return "'/'";
    case TokenType::kCaret:
      return "'^'";
    case TokenType::kParallel:
      return "'||'";
    case TokenType::kComma:
      return "','";
    case TokenType::kLParen:
      return "'('";
    case TokenType::kRParen:
      return "')'";
    case TokenType::kLBracket:
      return "'['";
    case TokenType::kRBracket:
      return "']'";
    case TokenType::kInvalid:
      return "invalid character";
  }
  return "token";
}

Lexer::Lexer(const std::string& source) : original_(source), index_(0) {
  source_.reserve(source.size());
  offsets_.reserve(source.size() + 1);
  for (size_t i = 0; i < source.size(); ++i) {
    if (util::IsSpace(source[i])) {
      continue;
    }
    source_.push_back(source[i]);
    offsets_.push_back(static_cast<int>(i));
  }
  offsets_.push_back(static_cast<int>(source.size()));
}

int Lexer::OriginalOffset(size_t stripped_index) const {
  if (stripped_index >= offsets_.size()) {
    return offsets_.back();
  }
  return offsets_[stripped_index];
}

char Lexer::Peek() const {
  if (index_ >= source_.size()) {
    return '\0';
  }
  return source_[index_];
}

char Lexer::PeekNext() const {
  if (index_ + 1 >= source_.size()) {
    return '\0';
  }
  return source_[index_ + 1];
}

char Lexer::Advance() {
  char ch = Peek();
  ++index_;
  return ch;
}

bool Lexer::IsAtEnd() const {
  return index_ >= source_.size();
}

Token Lexer::MakeToken(TokenType type, std::string lexeme, size_t begin) const {
  int start = OriginalOffset(begin);
  // One past the last character of the token, in original coordinates.
  int end = index_ > begin ? OriginalOffset(index_ - 1) + 1 : start;
  return Token{type, std::move(lexeme), start, end, ""};
}

Token Lexer::NumberToken() {
  size_t begin = index_;
  std::string lexeme;
  if (Peek() == '.') {
    lexeme.push_back(Advance());
    while (IsDigit(Peek())) {
      lexeme.push_back(Advance());
    }
  } else {
    while (IsDigit(Peek())) {
      lexeme.push_back(Advance());
    }
    if (Peek() == '.') {
      lexeme.push_back(Advance());
      while (IsDigit(Peek())) {
        lexeme.push_back(Advance());
      }
    }
  }
  if (Peek() == 'e' || Peek() == 'E') {
    char next = PeekNext();
    char after = index_ + 2 < source_.size() ? source_[index_ + 2] : '\0';
    if (IsDigit(next) || ((next == '+' || next == '-') && IsDigit(after))) {
      lexeme.push_back(Advance());
      if (Peek() == '+' || Peek() == '-') {
        lexeme.push_back(Advance());
      }
      while (IsDigit(Peek())) {
        lexeme.push_back(Advance());
      }
    }
  }
  std::string suffix;
  while (IsAlpha(Peek()) || Peek() == '%') {
    suffix.push_back(Advance());
  }
  Token token = MakeToken(TokenType::kNumber, std::move(lexeme), begin);
  token.suffix = std::move(suffix);
  return token;
}

void Lexer::ReadIndex(std::string* lexeme) {
  // Reads "_{-?alnum+}" or "^{-?alnum+}".
  size_t begin = index_;
  lexeme->push_back(Advance());
  lexeme->push_back(Advance());
  if (Peek() == '-') {
    lexeme->push_back(Advance());
  }
  size_t digits = 0;
  while (IsAlnum(Peek())) {
    lexeme->push_back(Advance());
    ++digits;
  }
  if (digits == 0 || Peek() != '}') {
    throw util::Error(util::ErrorKind::kParse,
                      "Invalid Input: Could not parse '" + original_ + "' as a formula",
                      OriginalOffset(begin), OriginalOffset(index_));
  }
  lexeme->push_back(Advance());
}

Token Lexer::IdentifierToken() {
  size_t begin = index_;
  std::string lexeme;
  lexeme.push_back(Advance());
  while (IsAlnum(Peek())) {
    lexeme.push_back(Advance());
  }
  if (Peek() == '_' && PeekNext() != '{') {
    // Plain subscript run such as x_1 or sigma_x.
    while (IsAlnum(Peek()) || (Peek() == '_' && PeekNext() != '{')) {
      lexeme.push_back(Advance());
    }
  } else {
    if (Peek() == '_' && PeekNext() == '{') {
      ReadIndex(&lexeme);
    }
    if (Peek() == '^' && PeekNext() == '{') {
      ReadIndex(&lexeme);
    }
  }
  while (Peek() == '\'') {
    lexeme.push_back(Advance());
  }
  return MakeToken(TokenType::kIdentifier, std::move(lexeme), begin);
}

Token Lexer::NextToken() {
  if (IsAtEnd()) {
    int pos = OriginalOffset(source_.size());
    return Token{TokenType::kEof, "", pos, pos, ""};
  }

  size_t begin = index_;
  char ch = Peek();
  if (IsDigit(ch) || (ch == '.' && IsDigit(PeekNext()))) {
    return NumberToken();
  }
  if (IsAlpha(ch)) {
    return IdentifierToken();
  }

  Advance();
  switch (ch) {
    case '+':
      return MakeToken(TokenType::kPlus, "+", begin);
    case '-':
      return MakeToken(TokenType::kMinus, "-", begin);
    case '*':
      return MakeToken(TokenType::kStar, "*", begin);
    case '/':
      return MakeToken(TokenType::kSlash, "/", begin);
    case '^':
      return MakeToken(TokenType::kCaret, "^", begin);
    case ',':
      return MakeToken(TokenType::kComma, ",", begin);
    case '(':
      return MakeToken(TokenType::kLParen, "(", begin);
    case ')':
      return MakeToken(TokenType::kRParen, ")", begin);
    case '[':
      return MakeToken(TokenType::kLBracket, "[", begin);
    case ']':
      return MakeToken(TokenType::kRBracket, "]", begin);
    case '|':
      if (Peek() == '|') {
        Advance();
        return MakeToken(TokenType::kParallel, "||", begin);
      }
      break;
    default:
      break;
  }

  return MakeToken(TokenType::kInvalid, std::string(1, ch), begin);
}

std::vector<Token> Lexer::Tokenize() {
  std::vector<Token> tokens;
  while (true) {
    Token token = NextToken();
    bool done = token.type == TokenType::kEof;
    tokens.push_back(std::move(token));
    if (done) {
      break;
    }
  }
  return tokens;
}

}  // namespace mathgrade::lexer
