#include "ast.hpp"
#include "lexer.hpp"

#include "interview/errors.hpp"

#include <deque>
#include <set>
#include <utility>

namespace interview::logic {
namespace {

const std::set<std::string>& known_tests() {
  static const std::set<std::string> tests = {
      "defined", "undefined", "none", "number", "string", "boolean", "mapping", "sequence"};
  return tests;
}

const std::set<std::string>& known_filters() {
  static const std::set<std::string> filters = {
      "default", "d", "length", "count", "lower", "upper", "trim", "string",
      "int", "float", "bool", "join", "first", "last", "list"};
  return filters;
}

NodePtr make_node(NodeKind kind, std::string text = {}, std::vector<NodePtr> children = {}) {
  auto node = std::make_shared<Node>();
  node->kind = kind;
  node->text = std::move(text);
  node->children = std::move(children);
  return node;
}

NodePtr make_literal(nlohmann::json value) {
  auto node = std::make_shared<Node>();
  node->kind = NodeKind::Literal;
  node->literal = std::move(value);
  return node;
}

class Parser {
public:
  Parser(std::string_view source, std::size_t pos) : lexer_(source, pos) {}

  NodePtr parse_conditional() {
    auto value = parse_or();
    if (!is_name("if")) {
      return value;
    }
    take();
    auto condition = parse_or();
    std::vector<NodePtr> children = {value, condition};
    if (is_name("else")) {
      take();
      children.push_back(parse_conditional());
    }
    return make_node(NodeKind::Conditional, {}, std::move(children));
  }

  const Token& peek(std::size_t ahead = 0) {
    while (lookahead_.size() <= ahead) {
      lookahead_.push_back(lexer_.next());
    }
    return lookahead_[ahead];
  }

  Token take() {
    peek();
    Token token = std::move(lookahead_.front());
    lookahead_.pop_front();
    return token;
  }

  [[noreturn]] void fail(const std::string& detail, const Token& token) const {
    throw EvaluationError("Expression: " + detail + " at position " +
                          std::to_string(token.begin) + " in '" +
                          std::string(lexer_.source()) + "'");
  }

  void expect_operator(const char* op) {
    const Token& token = peek();
    if (token.type != TokenType::Operator || token.text != op) {
      fail(std::string("expected '") + op + "'", token);
    }
    take();
  }

private:
  bool is_name(const char* name, std::size_t ahead = 0) {
    const Token& token = peek(ahead);
    return token.type == TokenType::Name && token.text == name;
  }

  bool is_operator(const char* op, std::size_t ahead = 0) {
    const Token& token = peek(ahead);
    return token.type == TokenType::Operator && token.text == op;
  }

  NodePtr parse_or() {
    auto left = parse_and();
    while (is_name("or")) {
      take();
      left = make_node(NodeKind::Or, {}, {left, parse_and()});
    }
    return left;
  }

  NodePtr parse_and() {
    auto left = parse_not();
    while (is_name("and")) {
      take();
      left = make_node(NodeKind::And, {}, {left, parse_not()});
    }
    return left;
  }

  NodePtr parse_not() {
    if (is_name("not")) {
      take();
      return make_node(NodeKind::Not, {}, {parse_not()});
    }
    return parse_compare();
  }

  NodePtr parse_compare() {
    auto left = parse_concat();
    while (true) {
      const Token& token = peek();
      if (token.type == TokenType::Operator &&
          (token.text == "==" || token.text == "!=" || token.text == "<" ||
           token.text == "<=" || token.text == ">" || token.text == ">=")) {
        auto op = take().text;
        left = make_node(NodeKind::Compare, op, {left, parse_concat()});
      } else if (is_name("in")) {
        take();
        left = make_node(NodeKind::Compare, "in", {left, parse_concat()});
      } else if (is_name("not") && is_name("in", 1)) {
        take();
        take();
        left = make_node(NodeKind::Compare, "not in", {left, parse_concat()});
      } else if (is_name("is")) {
        take();
        bool negated = false;
        if (is_name("not")) {
          take();
          negated = true;
        }
        const Token name = take();
        if (name.type != TokenType::Name || known_tests().count(name.text) == 0) {
          fail("unknown test '" + name.text + "'", name);
        }
        auto node = std::make_shared<Node>();
        node->kind = NodeKind::Test;
        node->text = name.text;
        node->negated = negated;
        node->children.push_back(left);
        left = node;
      } else {
        return left;
      }
    }
  }

  NodePtr parse_concat() {
    auto left = parse_additive();
    while (is_operator("~")) {
      take();
      left = make_node(NodeKind::Binary, "~", {left, parse_additive()});
    }
    return left;
  }

  NodePtr parse_additive() {
    auto left = parse_term();
    while (is_operator("+") || is_operator("-")) {
      auto op = take().text;
      left = make_node(NodeKind::Binary, op, {left, parse_term()});
    }
    return left;
  }

  NodePtr parse_term() {
    auto left = parse_unary();
    while (is_operator("*") || is_operator("/") || is_operator("//") || is_operator("%")) {
      auto op = take().text;
      left = make_node(NodeKind::Binary, op, {left, parse_unary()});
    }
    return left;
  }

  NodePtr parse_unary() {
    if (is_operator("-")) {
      take();
      return make_node(NodeKind::Negate, {}, {parse_unary()});
    }
    if (is_operator("+")) {
      take();
      return make_node(NodeKind::Positive, {}, {parse_unary()});
    }
    return parse_power();
  }

  NodePtr parse_power() {
    auto base = parse_filtered();
    if (is_operator("**")) {
      take();
      return make_node(NodeKind::Binary, "**", {base, parse_unary()});
    }
    return base;
  }

  NodePtr parse_filtered() {
    auto subject = parse_postfix();
    while (is_operator("|")) {
      take();
      const Token name = take();
      if (name.type != TokenType::Name || known_filters().count(name.text) == 0) {
        fail("unknown filter '" + name.text + "'", name);
      }
      std::vector<NodePtr> children = {subject};
      if (is_operator("(")) {
        take();
        if (!is_operator(")")) {
          children.push_back(parse_conditional());
          while (is_operator(",")) {
            take();
            children.push_back(parse_conditional());
          }
        }
        expect_operator(")");
      }
      subject = make_node(NodeKind::Filter, name.text, std::move(children));
    }
    return subject;
  }

  NodePtr parse_postfix() {
    auto node = parse_primary();
    while (true) {
      if (is_operator(".")) {
        take();
        const Token key = take();
        if (key.type == TokenType::Name) {
          node = make_node(NodeKind::Lookup, {}, {node, make_literal(key.text)});
        } else if (key.type == TokenType::Integer) {
          node = make_node(NodeKind::Lookup, {}, {node, make_literal(std::stoll(key.text))});
        } else {
          fail("expected attribute name", key);
        }
      } else if (is_operator("[")) {
        take();
        auto key = parse_conditional();
        expect_operator("]");
        node = make_node(NodeKind::Lookup, {}, {node, key});
      } else {
        return node;
      }
    }
  }

  NodePtr parse_primary() {
    const Token token = take();
    switch (token.type) {
      case TokenType::Integer:
        try {
          return make_literal(std::stoll(token.text));
        } catch (const std::out_of_range&) {
          return make_literal(std::stod(token.text));
        }
      case TokenType::Float:
        return make_literal(std::stod(token.text));
      case TokenType::String: {
        std::string text = token.text;
        while (peek().type == TokenType::String) {
          text += take().text;
        }
        return make_literal(text);
      }
      case TokenType::Name:
        return parse_name(token);
      case TokenType::Operator:
        if (token.text == "(") {
          auto inner = parse_conditional();
          expect_operator(")");
          return inner;
        }
        if (token.text == "[") {
          return parse_list();
        }
        if (token.text == "{") {
          return parse_object();
        }
        break;
      case TokenType::End:
        fail("unexpected end of expression", token);
    }
    fail("unexpected '" + token.text + "'", token);
  }

  NodePtr parse_name(const Token& token) {
    const auto& name = token.text;
    if (name == "true" || name == "True") {
      return make_literal(true);
    }
    if (name == "false" || name == "False") {
      return make_literal(false);
    }
    if (name == "none" || name == "None" || name == "null") {
      return make_literal(nullptr);
    }
    if (name == "and" || name == "or" || name == "not" || name == "in" || name == "is" ||
        name == "if" || name == "else") {
      fail("unexpected keyword '" + name + "'", token);
    }
    return make_node(NodeKind::Name, name);
  }

  NodePtr parse_list() {
    std::vector<NodePtr> items;
    if (!is_operator("]")) {
      items.push_back(parse_conditional());
      while (is_operator(",")) {
        take();
        if (is_operator("]")) {
          break;
        }
        items.push_back(parse_conditional());
      }
    }
    expect_operator("]");
    return make_node(NodeKind::List, {}, std::move(items));
  }

  NodePtr parse_object() {
    std::vector<NodePtr> items;
    if (!is_operator("}")) {
      while (true) {
        items.push_back(parse_conditional());
        expect_operator(":");
        items.push_back(parse_conditional());
        if (!is_operator(",")) {
          break;
        }
        take();
        if (is_operator("}")) {
          break;
        }
      }
    }
    expect_operator("}");
    return make_node(NodeKind::Object, {}, std::move(items));
  }

  Lexer lexer_;
  std::deque<Token> lookahead_;
};

} // namespace

NodePtr parse_expression(const std::string& source) {
  Parser parser(source, 0);
  auto root = parser.parse_conditional();
  const Token& rest = parser.peek();
  if (rest.type != TokenType::End) {
    parser.fail("unexpected '" + rest.text + "'", rest);
  }
  return root;
}

std::shared_ptr<const TemplateBody> parse_template(const std::string& source) {
  auto body = std::make_shared<TemplateBody>();
  std::size_t pos = 0;
  while (pos < source.size()) {
    const auto open = source.find("{{", pos);
    if (open == std::string::npos) {
      body->parts.push_back({source.substr(pos), nullptr});
      break;
    }
    if (open > pos) {
      body->parts.push_back({source.substr(pos, open - pos), nullptr});
    }
    Parser parser(source, open + 2);
    auto expression = parser.parse_conditional();
    const Token close = parser.peek();
    if (close.type != TokenType::Operator || close.text != "}" ||
        close.end >= source.size() || source[close.end] != '}') {
      parser.fail("expected '}}'", close);
    }
    body->parts.push_back({{}, std::move(expression)});
    pos = close.end + 1;
  }
  return body;
}

} // namespace interview::logic
