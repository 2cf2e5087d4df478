#include "lexer.hpp"

#include "interview/errors.hpp"

#include <array>
#include <cctype>

namespace interview::logic {
namespace {

constexpr std::array<std::string_view, 6> kTwoCharOperators = {"==", "!=", "<=",
                                                            ">=", "//", "**"};

} // namespace

void Lexer::skip_whitespace() {
  while (pos_ < source_.size() && std::isspace(static_cast<unsigned char>(source_[pos_]))) {
    ++pos_;
  }
}

Token Lexer::next() {
  skip_whitespace();
  if (pos_ >= source_.size()) {
    return Token{TokenType::End, "", pos_, pos_};
  }
  const char ch = source_[pos_];
  if (std::isdigit(static_cast<unsigned char>(ch))) {
    return lex_number();
  }
  if (ch == '"' || ch == '\'') {
    return lex_string();
  }
  if (std::isalpha(static_cast<unsigned char>(ch)) || ch == '_') {
    return lex_name();
  }
  return lex_operator();
}

Token Lexer::lex_number() {
  Token token;
  token.begin = pos_;
  token.type = TokenType::Integer;
  while (pos_ < source_.size() && std::isdigit(static_cast<unsigned char>(source_[pos_]))) {
    ++pos_;
  }
  if (pos_ + 1 < source_.size() && source_[pos_] == '.' &&
      std::isdigit(static_cast<unsigned char>(source_[pos_ + 1]))) {
    token.type = TokenType::Float;
    ++pos_;
    while (pos_ < source_.size() && std::isdigit(static_cast<unsigned char>(source_[pos_]))) {
      ++pos_;
    }
  }
  if (pos_ < source_.size() && (source_[pos_] == 'e' || source_[pos_] == 'E')) {
    std::size_t look = pos_ + 1;
    if (look < source_.size() && (source_[look] == '+' || source_[look] == '-')) {
      ++look;
    }
    if (look < source_.size() && std::isdigit(static_cast<unsigned char>(source_[look]))) {
      token.type = TokenType::Float;
      pos_ = look;
      while (pos_ < source_.size() && std::isdigit(static_cast<unsigned char>(source_[pos_]))) {
        ++pos_;
      }
    }
  }
  token.end = pos_;
  token.text = std::string(source_.substr(token.begin, token.end - token.begin));
  return token;
}

Token Lexer::lex_string() {
  Token token;
  token.type = TokenType::String;
  token.begin = pos_;
  const char quote = source_[pos_++];
  while (pos_ < source_.size() && source_[pos_] != quote) {
    char ch = source_[pos_++];
    if (ch == '\\' && pos_ < source_.size()) {
      const char esc = source_[pos_++];
      switch (esc) {
        case 'n': ch = '\n'; break;
        case 't': ch = '\t'; break;
        case 'r': ch = '\r'; break;
        default: ch = esc; break;
      }
    }
    token.text.push_back(ch);
  }
  if (pos_ >= source_.size()) {
    throw EvaluationError("Expression: unterminated string at position " +
                          std::to_string(token.begin));
  }
  ++pos_;
  token.end = pos_;
  return token;
}

Token Lexer::lex_name() {
  Token token;
  token.type = TokenType::Name;
  token.begin = pos_;
  while (pos_ < source_.size() &&
         (std::isalnum(static_cast<unsigned char>(source_[pos_])) || source_[pos_] == '_')) {
    ++pos_;
  }
  token.end = pos_;
  token.text = std::string(source_.substr(token.begin, token.end - token.begin));
  return token;
}

Token Lexer::lex_operator() {
  Token token;
  token.type = TokenType::Operator;
  token.begin = pos_;
  if (pos_ + 1 < source_.size()) {
    const auto pair = source_.substr(pos_, 2);
    for (auto op : kTwoCharOperators) {
      if (pair == op) {
        pos_ += 2;
        token.end = pos_;
        token.text = std::string(op);
        return token;
      }
    }
  }
  static constexpr std::string_view kSingle = "+-*/%~<>()[]{}.,:|";
  const char ch = source_[pos_];
  if (kSingle.find(ch) == std::string_view::npos) {
    throw EvaluationError("Expression: unexpected character '" + std::string(1, ch) +
                          "' at position " + std::to_string(pos_));
  }
  ++pos_;
  token.end = pos_;
  token.text = std::string(1, ch);
  return token;
}

} // namespace interview::logic
