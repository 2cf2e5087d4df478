#pragma once

#include "logic.hpp"

#include <cstddef>
#include <functional>
#include <optional>
#include <string>
#include <variant>
#include <vector>

#include <nlohmann/json.hpp>

namespace interview {

// Attributes every field shares.
struct FieldLabel {
  std::optional<Template> label;
  std::optional<Template> description;
};

struct TextField : FieldLabel {
  bool optional = false;
  std::optional<nlohmann::json> default_value;
  std::size_t min_length = 1;
  std::size_t max_length = 300;
  std::optional<std::string> regex;
  std::optional<std::string> format; // "email" is validated
  std::optional<std::string> component;
};

struct NumberField : FieldLabel {
  bool optional = false;
  std::optional<nlohmann::json> default_value;
  std::optional<double> min;
  std::optional<double> max;
  bool integer = false;
  std::optional<std::string> component;
};

struct DateField : FieldLabel {
  bool optional = false;
  std::optional<nlohmann::json> default_value;
  std::optional<std::string> min; // YYYY-MM-DD
  std::optional<std::string> max;
  std::optional<std::string> component;
};

struct SelectOption {
  Template label;
  nlohmann::json value;
  bool default_selected = false;
  std::optional<Expression> default_expr;
  WhenCondition when = true;
};

struct SelectField : FieldLabel {
  std::vector<SelectOption> options;
  int min = 0;
  int max = 1;
  std::string component = "dropdown";
  std::optional<std::string> autocomplete;

  bool multi() const { return max > 1; }
  bool is_optional() const { return min == 0; }
};

using FieldTemplate = std::variant<TextField, NumberField, DateField, SelectField>;

// Takes a decoded answer and returns the (possibly normalised) value, or
// throws ValidationError.
using FieldValidator = std::function<nlohmann::json(const nlohmann::json&)>;

// "text", "number", "date", "select".
std::string field_type(const FieldTemplate& field);

bool is_optional(const FieldTemplate& field);

// JSON-Schema fragment for the field rendered against `context`.
nlohmann::json field_schema(const FieldTemplate& field, const nlohmann::json& context);

std::vector<FieldValidator> field_validators(const FieldTemplate& field,
                                             const nlohmann::json& context);

// Runs field_validators() in order.
nlohmann::json validate_field(const FieldTemplate& field, const nlohmann::json& value,
                              const nlohmann::json& context);

} // namespace interview
