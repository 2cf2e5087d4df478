#pragma once

#include <cstddef>
#include <string>
#include <string_view>

namespace interview::logic {

enum class TokenType { Integer, Float, String, Name, Operator, End };

struct Token {
  TokenType type = TokenType::End;
  std::string text;
  std::size_t begin = 0;
  std::size_t end = 0;
};

// Produces tokens on demand so a template can stop lexing at `}}` without
// touching the literal text that follows.
class Lexer {
public:
  Lexer(std::string_view source, std::size_t pos = 0) : source_(source), pos_(pos) {}

  Token next();

  std::size_t position() const { return pos_; }
  std::string_view source() const { return source_; }

private:
  void skip_whitespace();
  Token lex_number();
  Token lex_string();
  Token lex_name();
  Token lex_operator();

  std::string_view source_;
  std::size_t pos_;
};

} // namespace interview::logic
