#include "interview/logic.hpp"

#include "ast.hpp"

#include "interview/errors.hpp"

#include <type_traits>
#include <variant>

namespace interview {

nlohmann::json Expression::evaluate(const nlohmann::json& context) const {
  if (!root_) {
    throw EvaluationError("Expression: evaluating an empty expression");
  }
  return logic::evaluate(*root_, context).value_or(nlohmann::json(nullptr));
}

bool Expression::test(const nlohmann::json& context) const {
  if (!root_) {
    throw EvaluationError("Expression: evaluating an empty expression");
  }
  return logic::truthy(logic::evaluate(*root_, context));
}

std::string Template::render(const nlohmann::json& context) const {
  if (!body_) {
    return source_;
  }
  std::string out;
  for (const auto& part : body_->parts) {
    if (part.expression) {
      out += logic::to_display_string(logic::evaluate(*part.expression, context));
    } else {
      out += part.text;
    }
  }
  return out;
}

bool evaluate_when(const WhenCondition& condition, const nlohmann::json& context) {
  return std::visit(
      [&context](const auto& c) -> bool {
        using T = std::decay_t<decltype(c)>;
        if constexpr (std::is_same_v<T, bool>) {
          return c;
        } else if constexpr (std::is_same_v<T, Expression>) {
          return c.test(context);
        } else if constexpr (std::is_same_v<T, LogicAnd>) {
          for (const auto& sub : c.conditions) {
            if (!evaluate_when(sub, context)) {
              return false;
            }
          }
          return true;
        } else {
          for (const auto& sub : c.conditions) {
            if (evaluate_when(sub, context)) {
              return true;
            }
          }
          return false;
        }
      },
      condition);
}

nlohmann::json evaluate_value(const ValueOrEvaluable& value, const nlohmann::json& context) {
  return std::visit(
      [&context](const auto& v) -> nlohmann::json {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, LiteralValue>) {
          return v.value;
        } else if constexpr (std::is_same_v<T, Expression>) {
          return v.evaluate(context);
        } else {
          return v.render(context);
        }
      },
      value);
}

Environment::Environment(std::size_t cache_size)
    : expressions_(cache_size), templates_(cache_size), pointers_(cache_size) {}

Expression Environment::compile_expression(const std::string& source) {
  auto root = expressions_.get_or_create(source, [&source]() {
    return std::shared_ptr<const logic::Node>(logic::parse_expression(source));
  });
  return Expression(source, std::move(root));
}

Template Environment::compile_template(const std::string& source) {
  auto body = templates_.get_or_create(source, [&source]() {
    return logic::parse_template(source);
  });
  return Template(source, std::move(body));
}

ValuePointer Environment::pointer(const std::string& source) {
  auto pointer = pointers_.get_or_create(source, [&source]() {
    return std::make_shared<const ValuePointer>(parse_pointer(source));
  });
  return *pointer;
}

} // namespace interview
