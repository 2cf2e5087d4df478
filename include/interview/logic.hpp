#pragma once

#include "lru_cache.hpp"
#include "pointer.hpp"

#include <cstddef>
#include <memory>
#include <string>
#include <variant>
#include <vector>

#include <nlohmann/json.hpp>

namespace interview {

namespace logic {
struct Node;
struct TemplateBody;
} // namespace logic

class Environment;

/**
 * A compiled expression, e.g. `registration.preferred_name if use_preferred_name
 * else registration.first_name`. Cheap to copy; the syntax tree is shared.
 */
class Expression {
public:
  Expression() = default;

  const std::string& source() const { return source_; }

  // Undefined results come back as null. Throws EvaluationError.
  nlohmann::json evaluate(const nlohmann::json& context) const;

  // Truthiness of the result; undefined and null are false.
  bool test(const nlohmann::json& context) const;

private:
  friend class Environment;
  Expression(std::string source, std::shared_ptr<const logic::Node> root)
      : source_(std::move(source)), root_(std::move(root)) {}

  std::string source_;
  std::shared_ptr<const logic::Node> root_;
};

// Literal text with `{{ expr }}` interpolations.
class Template {
public:
  Template() = default;

  const std::string& source() const { return source_; }
  std::string render(const nlohmann::json& context) const;

private:
  friend class Environment;
  Template(std::string source, std::shared_ptr<const logic::TemplateBody> body)
      : source_(std::move(source)), body_(std::move(body)) {}

  std::string source_;
  std::shared_ptr<const logic::TemplateBody> body_;
};

struct LogicAnd;
struct LogicOr;

// `when` clause of steps and select options.
using WhenCondition = std::variant<bool, Expression, LogicAnd, LogicOr>;

struct LogicAnd {
  std::vector<WhenCondition> conditions;
};

struct LogicOr {
  std::vector<WhenCondition> conditions;
};

// AND/OR short-circuit left to right; an empty AND holds, an empty OR does not.
bool evaluate_when(const WhenCondition& condition, const nlohmann::json& context);

struct LiteralValue {
  nlohmann::json value;
};

// Value of a set step: a literal, an expression or a template.
using ValueOrEvaluable = std::variant<LiteralValue, Expression, Template>;

nlohmann::json evaluate_value(const ValueOrEvaluable& value, const nlohmann::json& context);

/**
 * Compiles expressions, templates and pointers, memoising each by source text
 * in bounded LRU caches. One environment is shared by every interview loaded
 * into the process.
 */
class Environment {
public:
  static constexpr std::size_t kDefaultCacheSize = 1024;

  explicit Environment(std::size_t cache_size = kDefaultCacheSize);

  // Both throw EvaluationError on syntax errors.
  Expression compile_expression(const std::string& source);
  Template compile_template(const std::string& source);

  // Throws PointerSyntaxError.
  ValuePointer pointer(const std::string& source);

  std::size_t cached_expressions() const { return expressions_.size(); }
  std::size_t cached_templates() const { return templates_.size(); }
  std::size_t cache_capacity() const { return expressions_.capacity(); }

private:
  LruCache<std::shared_ptr<const logic::Node>> expressions_;
  LruCache<std::shared_ptr<const logic::TemplateBody>> templates_;
  LruCache<std::shared_ptr<const ValuePointer>> pointers_;
};

} // namespace interview
