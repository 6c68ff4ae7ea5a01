#include <vector>

#include "test_util.h"

namespace test {

namespace {

std::vector<lx::TokenType> Types(const std::string& source) {
  std::vector<lx::TokenType> types;
  for (const auto& tok : lx::Lexer(source).Tokenize()) {
    types.push_back(tok.type);
  }
  return types;
}

}  // namespace

void RunLexerTests(TestContext* ctx) {
  std::vector<lx::TokenType> expected = {
      lx::TokenType::kPlus,     lx::TokenType::kMinus,    lx::TokenType::kStar,
      lx::TokenType::kSlash,    lx::TokenType::kCaret,    lx::TokenType::kParallel,
      lx::TokenType::kLParen,   lx::TokenType::kRParen,   lx::TokenType::kLBracket,
      lx::TokenType::kRBracket, lx::TokenType::kIdentifier, lx::TokenType::kComma,
      lx::TokenType::kNumber,   lx::TokenType::kEof};
  ExpectTrue(Types("+ - * / ^ || ( ) [ ] foo , 123") == expected, "basic_tokenization", ctx);

  auto joined = lx::Lexer("foo 123").Tokenize();
  ExpectTrue(joined.size() == 2 && joined[0].type == lx::TokenType::kIdentifier &&
                 joined[0].lexeme == "foo123",
             "interior_whitespace_joins_identifier", ctx);
  ExpectTrue(joined[0].start == 0 && joined[0].end == 7, "joined_identifier_spans_original",
             ctx);

  auto tokens = lx::Lexer("1.5e-3k").Tokenize();
  ExpectTrue(tokens[0].type == lx::TokenType::kNumber && tokens[0].lexeme == "1.5e-3" &&
                 tokens[0].suffix == "k",
             "number_with_exponent_and_suffix", ctx);

  tokens = lx::Lexer("2e").Tokenize();
  ExpectTrue(tokens[0].lexeme == "2" && tokens[0].suffix == "e", "dangling_e_is_suffix", ctx);

  tokens = lx::Lexer(".5%").Tokenize();
  ExpectTrue(tokens[0].lexeme == ".5" && tokens[0].suffix == "%", "leading_dot_and_percent",
             ctx);

  tokens = lx::Lexer("a_{-3} + x_1' + T^{ab}").Tokenize();
  ExpectTrue(tokens[0].lexeme == "a_{-3}", "numbered_variable_lexeme", ctx);
  ExpectTrue(tokens[2].lexeme == "x_1'", "subscript_with_prime", ctx);
  ExpectTrue(tokens[4].lexeme == "T^{ab}", "superscript_index", ctx);

  tokens = lx::Lexer("  x  +   yy").Tokenize();
  ExpectTrue(tokens[0].start == 2 && tokens[0].end == 3, "position_skips_whitespace", ctx);
  ExpectTrue(tokens[2].start == 9 && tokens[2].end == 11, "position_in_original", ctx);

  lx::Lexer spaced("a b");
  ExpectTrue(spaced.stripped() == "ab", "whitespace_is_stripped", ctx);
  ExpectTrue(spaced.OriginalOffset(1) == 2, "original_offset_map", ctx);

  tokens = lx::Lexer("1 $ 2").Tokenize();
  ExpectTrue(tokens[1].type == lx::TokenType::kInvalid && tokens[1].start == 2,
             "invalid_character_token", ctx);

  ExpectThrowsKind([] { lx::Lexer("a_{}").Tokenize(); }, util::ErrorKind::kParse,
                   "empty_index_rejected", ctx);
}

}  // namespace test
