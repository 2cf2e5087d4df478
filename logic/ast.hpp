#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace interview::logic {

enum class NodeKind {
  Literal,     // literal
  Name,        // text
  Lookup,      // children[0][children[1]], also `a.b`
  List,        // children
  Object,      // children = key0, value0, key1, value1...
  Negate,      // -children[0]
  Positive,    // +children[0]
  Not,         // not children[0]
  And,
  Or,
  Binary,      // text = operator
  Compare,     // text = operator, including "in" and "not in"
  Conditional, // children = value, condition[, otherwise]
  Test,        // text = test name, negated
  Filter       // text = filter name, children = subject, args...
};

struct Node;
using NodePtr = std::shared_ptr<const Node>;

struct Node {
  NodeKind kind = NodeKind::Literal;
  std::string text;
  nlohmann::json literal;
  std::vector<NodePtr> children;
  bool negated = false;
};

struct TemplateBody {
  struct Part {
    std::string text;
    NodePtr expression; // null for literal text
  };
  std::vector<Part> parts;
};

// Evaluation value; std::nullopt is "undefined".
using Value = std::optional<nlohmann::json>;

NodePtr parse_expression(const std::string& source);
std::shared_ptr<const TemplateBody> parse_template(const std::string& source);

Value evaluate(const Node& node, const nlohmann::json& context);
bool truthy(const Value& value);
std::string to_display_string(const Value& value);

} // namespace interview::logic
