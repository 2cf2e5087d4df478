#include "ast.hpp"

#include "interview/errors.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdint>
#include <cstdlib>
#include <limits>
#include <sstream>

namespace interview::logic {
namespace {

[[noreturn]] void undefined_operation(const std::string& detail) {
  throw EvaluationError("Expression: " + detail);
}

std::string type_name(const Value& value) {
  if (!value.has_value()) {
    return "undefined";
  }
  return value->type_name();
}

const nlohmann::json& require_value(const Value& value, const std::string& operation) {
  if (!value.has_value() || value->is_null()) {
    undefined_operation(operation + " on " + type_name(value));
  }
  return *value;
}

bool is_numeric(const nlohmann::json& value) {
  return value.is_number();
}

// Unsigned values above LLONG_MAX take the floating point path.
bool fits_int(const nlohmann::json& value) {
  if (value.is_number_unsigned()) {
    return value.get<std::uint64_t>() <=
           static_cast<std::uint64_t>(std::numeric_limits<long long>::max());
  }
  return value.is_number_integer();
}

bool both_integers(const nlohmann::json& lhs, const nlohmann::json& rhs) {
  return fits_int(lhs) && fits_int(rhs);
}

long long as_int(const nlohmann::json& value) {
  if (!fits_int(value)) {
    throw EvaluationError("Expression: integer out of range");
  }
  if (value.is_number_unsigned()) {
    return static_cast<long long>(value.get<std::uint64_t>());
  }
  return value.get<long long>();
}

long long checked_add(long long a, long long b) {
  long long out = 0;
  if (__builtin_add_overflow(a, b, &out)) {
    throw EvaluationError("Expression: integer overflow");
  }
  return out;
}

long long checked_sub(long long a, long long b) {
  long long out = 0;
  if (__builtin_sub_overflow(a, b, &out)) {
    throw EvaluationError("Expression: integer overflow");
  }
  return out;
}

long long checked_mul(long long a, long long b) {
  long long out = 0;
  if (__builtin_mul_overflow(a, b, &out)) {
    throw EvaluationError("Expression: integer overflow");
  }
  return out;
}

long long checked_pow(long long base, long long exponent) {
  long long result = 1;
  while (exponent > 0) {
    if (exponent & 1) {
      result = checked_mul(result, base);
    }
    exponent >>= 1;
    if (exponent > 0) {
      base = checked_mul(base, base);
    }
  }
  return result;
}

nlohmann::json number_result(double value) {
  return nlohmann::json(value);
}

nlohmann::json repeat(const nlohmann::json& seq, long long times) {
  if (seq.is_string()) {
    std::string out;
    for (long long i = 0; i < times; ++i) {
      out += seq.get_ref<const std::string&>();
    }
    return out;
  }
  nlohmann::json out = nlohmann::json::array();
  for (long long i = 0; i < times; ++i) {
    for (const auto& item : seq) {
      out.push_back(item);
    }
  }
  return out;
}

nlohmann::json arithmetic(const std::string& op, const Value& lhs_value, const Value& rhs_value) {
  const auto& lhs = require_value(lhs_value, "'" + op + "'");
  const auto& rhs = require_value(rhs_value, "'" + op + "'");
  if (op == "+") {
    if (lhs.is_string() && rhs.is_string()) {
      return lhs.get<std::string>() + rhs.get<std::string>();
    }
    if (lhs.is_array() && rhs.is_array()) {
      nlohmann::json out = lhs;
      for (const auto& item : rhs) {
        out.push_back(item);
      }
      return out;
    }
  }
  if (op == "*") {
    if ((lhs.is_string() || lhs.is_array()) && rhs.is_number_integer()) {
      return repeat(lhs, as_int(rhs));
    }
    if (lhs.is_number_integer() && (rhs.is_string() || rhs.is_array())) {
      return repeat(rhs, as_int(lhs));
    }
  }
  if (!is_numeric(lhs) || lhs.is_boolean() || !is_numeric(rhs) || rhs.is_boolean()) {
    undefined_operation("unsupported operand types for '" + op + "': " + lhs.type_name() +
                        " and " + rhs.type_name());
  }
  const bool integral = both_integers(lhs, rhs);
  if (op == "+") {
    return integral ? nlohmann::json(checked_add(as_int(lhs), as_int(rhs)))
                    : number_result(lhs.get<double>() + rhs.get<double>());
  }
  if (op == "-") {
    return integral ? nlohmann::json(checked_sub(as_int(lhs), as_int(rhs)))
                    : number_result(lhs.get<double>() - rhs.get<double>());
  }
  if (op == "*") {
    return integral ? nlohmann::json(checked_mul(as_int(lhs), as_int(rhs)))
                    : number_result(lhs.get<double>() * rhs.get<double>());
  }
  if (op == "**") {
    if (integral && as_int(rhs) >= 0) {
      return checked_pow(as_int(lhs), as_int(rhs));
    }
    return number_result(std::pow(lhs.get<double>(), rhs.get<double>()));
  }
  if (rhs.get<double>() == 0.0) {
    undefined_operation("division by zero");
  }
  if (op == "/") {
    return number_result(lhs.get<double>() / rhs.get<double>());
  }
  if (op == "//") {
    if (integral) {
      const long long a = as_int(lhs);
      const long long b = as_int(rhs);
      if (a == std::numeric_limits<long long>::min() && b == -1) {
        undefined_operation("integer overflow");
      }
      long long q = a / b;
      if ((a % b != 0) && ((a < 0) != (b < 0))) {
        --q;
      }
      return q;
    }
    return number_result(std::floor(lhs.get<double>() / rhs.get<double>()));
  }
  if (op == "%") {
    if (integral) {
      const long long a = as_int(lhs);
      const long long b = as_int(rhs);
      if (b == -1) {
        return 0;
      }
      long long r = a % b;
      if (r != 0 && ((r < 0) != (b < 0))) {
        r += b;
      }
      return r;
    }
    const double a = lhs.get<double>();
    const double b = rhs.get<double>();
    return number_result(a - b * std::floor(a / b));
  }
  undefined_operation("unknown operator '" + op + "'");
}

bool contains(const Value& needle_value, const Value& haystack_value) {
  const auto& haystack = require_value(haystack_value, "'in'");
  const nlohmann::json needle = needle_value.value_or(nlohmann::json(nullptr));
  if (haystack.is_string()) {
    if (!needle.is_string()) {
      undefined_operation("'in <string>' requires a string operand");
    }
    return haystack.get_ref<const std::string&>().find(needle.get_ref<const std::string&>()) !=
           std::string::npos;
  }
  if (haystack.is_array()) {
    return std::find(haystack.begin(), haystack.end(), needle) != haystack.end();
  }
  if (haystack.is_object()) {
    return needle.is_string() && haystack.contains(needle.get<std::string>());
  }
  undefined_operation(std::string("'in' on ") + haystack.type_name());
}

bool compare(const std::string& op, const Value& lhs_value, const Value& rhs_value) {
  if (op == "==" || op == "!=") {
    const auto lhs = lhs_value.value_or(nlohmann::json(nullptr));
    const auto rhs = rhs_value.value_or(nlohmann::json(nullptr));
    return (lhs == rhs) == (op == "==");
  }
  if (op == "in") {
    return contains(lhs_value, rhs_value);
  }
  if (op == "not in") {
    return !contains(lhs_value, rhs_value);
  }
  const auto& lhs = require_value(lhs_value, "'" + op + "'");
  const auto& rhs = require_value(rhs_value, "'" + op + "'");
  const bool numbers = lhs.is_number() && rhs.is_number();
  const bool strings = lhs.is_string() && rhs.is_string();
  const bool arrays = lhs.is_array() && rhs.is_array();
  if (!numbers && !strings && !arrays) {
    undefined_operation(std::string("cannot compare ") + lhs.type_name() + " and " +
                        rhs.type_name() +
                        " with '" + op + "'");
  }
  if (numbers && !both_integers(lhs, rhs)) {
    const double a = lhs.get<double>();
    const double b = rhs.get<double>();
    if (op == "<") {
      return a < b;
    }
    if (op == "<=") {
      return a <= b;
    }
    if (op == ">") {
      return a > b;
    }
    return a >= b;
  }
  if (op == "<") {
    return lhs < rhs;
  }
  if (op == "<=") {
    return lhs <= rhs;
  }
  if (op == ">") {
    return lhs > rhs;
  }
  return lhs >= rhs;
}

bool run_test(const std::string& name, const Value& value) {
  if (name == "defined") {
    return value.has_value();
  }
  if (name == "undefined") {
    return !value.has_value();
  }
  if (!value.has_value()) {
    return false;
  }
  if (name == "none") {
    return value->is_null();
  }
  if (name == "number") {
    return value->is_number();
  }
  if (name == "string") {
    return value->is_string();
  }
  if (name == "boolean") {
    return value->is_boolean();
  }
  if (name == "mapping") {
    return value->is_object();
  }
  return value->is_array() || value->is_string();
}

Value lookup(const Value& base, const Value& key) {
  if (!base.has_value() || !key.has_value()) {
    return std::nullopt;
  }
  if (base->is_object() && key->is_string()) {
    auto it = base->find(key->get<std::string>());
    if (it == base->end()) {
      return std::nullopt;
    }
    return *it;
  }
  if ((base->is_array() || base->is_string()) && fits_int(*key)) {
    const auto size = static_cast<long long>(base->is_array()
                                                 ? base->size()
                                                 : base->get_ref<const std::string&>().size());
    long long index = as_int(*key);
    if (index < 0) {
      index += size;
    }
    if (index < 0 || index >= size) {
      return std::nullopt;
    }
    if (base->is_array()) {
      return (*base)[static_cast<std::size_t>(index)];
    }
    return std::string(1, base->get_ref<const std::string&>()[static_cast<std::size_t>(index)]);
  }
  return std::nullopt;
}

std::string trim(const std::string& text) {
  const auto begin = std::find_if_not(text.begin(), text.end(), [](unsigned char ch) {
    return std::isspace(ch);
  });
  const auto end = std::find_if_not(text.rbegin(), text.rend(), [](unsigned char ch) {
                     return std::isspace(ch);
                   }).base();
  return begin < end ? std::string(begin, end) : std::string();
}

nlohmann::json to_int(const Value& value) {
  if (!value.has_value() || value->is_null()) {
    return 0;
  }
  if (value->is_boolean()) {
    return value->get<bool>() ? 1 : 0;
  }
  if (value->is_number_integer()) {
    return *value;
  }
  if (value->is_number_float()) {
    return static_cast<long long>(value->get<double>());
  }
  if (value->is_string()) {
    const auto text = trim(value->get<std::string>());
    char* end = nullptr;
    const long long parsed = std::strtoll(text.c_str(), &end, 10);
    if (!text.empty() && end == text.c_str() + text.size()) {
      return parsed;
    }
  }
  return 0;
}

nlohmann::json to_float(const Value& value) {
  if (!value.has_value() || value->is_null()) {
    return 0.0;
  }
  if (value->is_boolean()) {
    return value->get<bool>() ? 1.0 : 0.0;
  }
  if (value->is_number()) {
    return value->get<double>();
  }
  if (value->is_string()) {
    const auto text = trim(value->get<std::string>());
    char* end = nullptr;
    const double parsed = std::strtod(text.c_str(), &end);
    if (!text.empty() && end == text.c_str() + text.size()) {
      return parsed;
    }
  }
  return 0.0;
}

Value apply_filter(const Node& node, const nlohmann::json& context) {
  const auto& name = node.text;
  const Value subject = evaluate(*node.children[0], context);
  std::vector<Value> args;
  for (std::size_t i = 1; i < node.children.size(); ++i) {
    args.push_back(evaluate(*node.children[i], context));
  }
  auto arg = [&args](std::size_t i) -> Value {
    return i < args.size() ? args[i] : Value{};
  };

  if (name == "default" || name == "d") {
    const bool use_falsy = truthy(arg(1));
    if (!subject.has_value() || (use_falsy && !truthy(subject))) {
      return args.empty() ? Value{nlohmann::json("")} : args[0];
    }
    return subject;
  }
  if (name == "length" || name == "count") {
    const auto& value = require_value(subject, "'" + name + "'");
    if (value.is_string()) {
      return static_cast<long long>(value.get_ref<const std::string&>().size());
    }
    if (value.is_array() || value.is_object()) {
      return static_cast<long long>(value.size());
    }
    undefined_operation("'" + name + "' on " + value.type_name());
  }
  if (name == "lower" || name == "upper") {
    std::string text = to_display_string(subject);
    for (auto& ch : text) {
      const auto c = static_cast<unsigned char>(ch);
      ch = static_cast<char>(name == "lower" ? std::tolower(c) : std::toupper(c));
    }
    return text;
  }
  if (name == "trim") {
    return trim(to_display_string(subject));
  }
  if (name == "string") {
    return to_display_string(subject);
  }
  if (name == "int") {
    return to_int(subject);
  }
  if (name == "float") {
    return to_float(subject);
  }
  if (name == "bool") {
    return truthy(subject);
  }
  if (name == "join") {
    const auto& value = require_value(subject, "'join'");
    if (!value.is_array()) {
      undefined_operation(std::string("'join' on ") + value.type_name());
    }
    const std::string sep = args.empty() ? std::string() : to_display_string(args[0]);
    std::string out;
    bool first = true;
    for (const auto& item : value) {
      if (!first) {
        out += sep;
      }
      out += to_display_string(item);
      first = false;
    }
    return out;
  }
  if (name == "first" || name == "last") {
    const auto& value = require_value(subject, "'" + name + "'");
    if (!value.is_array() && !value.is_string()) {
      undefined_operation("'" + name + "' on " + value.type_name());
    }
    return lookup(subject, nlohmann::json(name == "first" ? 0 : -1));
  }
  // list
  const auto& value = require_value(subject, "'list'");
  nlohmann::json out = nlohmann::json::array();
  if (value.is_string()) {
    for (char ch : value.get_ref<const std::string&>()) {
      out.push_back(std::string(1, ch));
    }
  } else if (value.is_array()) {
    out = value;
  } else if (value.is_object()) {
    for (const auto& item : value.items()) {
      out.push_back(item.key());
    }
  } else {
    undefined_operation(std::string("'list' on ") + value.type_name());
  }
  return out;
}

} // namespace

bool truthy(const Value& value) {
  if (!value.has_value()) {
    return false;
  }
  const auto& v = *value;
  switch (v.type()) {
    case nlohmann::json::value_t::null:
      return false;
    case nlohmann::json::value_t::boolean:
      return v.get<bool>();
    case nlohmann::json::value_t::number_integer:
    case nlohmann::json::value_t::number_unsigned:
      return v.is_number_unsigned() ? v.get<std::uint64_t>() != 0 : v.get<long long>() != 0;
    case nlohmann::json::value_t::number_float:
      return v.get<double>() != 0.0;
    case nlohmann::json::value_t::string:
      return !v.get_ref<const std::string&>().empty();
    case nlohmann::json::value_t::array:
    case nlohmann::json::value_t::object:
      return !v.empty();
    default:
      return true;
  }
}

std::string to_display_string(const Value& value) {
  if (!value.has_value() || value->is_null()) {
    return "";
  }
  const auto& v = *value;
  if (v.is_string()) {
    return v.get<std::string>();
  }
  if (v.is_boolean()) {
    return v.get<bool>() ? "true" : "false";
  }
  if (v.is_number_float()) {
    const double d = v.get<double>();
    if (std::isfinite(d) && std::floor(d) == d && std::fabs(d) < 1e15) {
      std::ostringstream oss;
      oss << static_cast<long long>(d);
      return oss.str();
    }
  }
  return v.dump();
}

Value evaluate(const Node& node, const nlohmann::json& context) {
  switch (node.kind) {
    case NodeKind::Literal:
      return node.literal;
    case NodeKind::Name: {
      if (!context.is_object()) {
        return std::nullopt;
      }
      auto it = context.find(node.text);
      if (it == context.end()) {
        return std::nullopt;
      }
      return *it;
    }
    case NodeKind::Lookup:
      return lookup(evaluate(*node.children[0], context), evaluate(*node.children[1], context));
    case NodeKind::List: {
      nlohmann::json out = nlohmann::json::array();
      for (const auto& child : node.children) {
        out.push_back(evaluate(*child, context).value_or(nlohmann::json(nullptr)));
      }
      return out;
    }
    case NodeKind::Object: {
      nlohmann::json out = nlohmann::json::object();
      for (std::size_t i = 0; i + 1 < node.children.size(); i += 2) {
        const Value key = evaluate(*node.children[i], context);
        if (!key.has_value() || !key->is_string()) {
          undefined_operation("object keys must be strings");
        }
        out[key->get<std::string>()] =
            evaluate(*node.children[i + 1], context).value_or(nlohmann::json(nullptr));
      }
      return out;
    }
    case NodeKind::Negate:
    case NodeKind::Positive: {
      const Value operand = evaluate(*node.children[0], context);
      const auto& v = require_value(operand, "unary operator");
      if (!v.is_number()) {
        undefined_operation(std::string("unary operator on ") + v.type_name());
      }
      if (node.kind == NodeKind::Positive) {
        return v;
      }
      if (fits_int(v)) {
        const long long operand_value = as_int(v);
        if (operand_value == std::numeric_limits<long long>::min()) {
          undefined_operation("integer overflow");
        }
        return -operand_value;
      }
      return -v.get<double>();
    }
    case NodeKind::Not:
      return !truthy(evaluate(*node.children[0], context));
    case NodeKind::And: {
      Value lhs = evaluate(*node.children[0], context);
      if (!truthy(lhs)) {
        return lhs;
      }
      return evaluate(*node.children[1], context);
    }
    case NodeKind::Or: {
      Value lhs = evaluate(*node.children[0], context);
      if (truthy(lhs)) {
        return lhs;
      }
      return evaluate(*node.children[1], context);
    }
    case NodeKind::Binary: {
      const Value lhs = evaluate(*node.children[0], context);
      const Value rhs = evaluate(*node.children[1], context);
      if (node.text == "~") {
        return to_display_string(lhs) + to_display_string(rhs);
      }
      return arithmetic(node.text, lhs, rhs);
    }
    case NodeKind::Compare:
      return compare(node.text, evaluate(*node.children[0], context),
                     evaluate(*node.children[1], context));
    case NodeKind::Conditional:
      if (truthy(evaluate(*node.children[1], context))) {
        return evaluate(*node.children[0], context);
      }
      if (node.children.size() > 2) {
        return evaluate(*node.children[2], context);
      }
      return std::nullopt;
    case NodeKind::Test:
      return run_test(node.text, evaluate(*node.children[0], context)) != node.negated;
    case NodeKind::Filter:
      return apply_filter(node, context);
  }
  undefined_operation("unknown node");
}

} // namespace interview::logic
