#include "fields.hpp"

#include <type_traits>

namespace interview {

std::string field_type(const FieldTemplate& field) {
  return std::visit(
      [](const auto& f) -> std::string {
        using T = std::decay_t<decltype(f)>;
        if constexpr (std::is_same_v<T, TextField>) {
          return "text";
        } else if constexpr (std::is_same_v<T, NumberField>) {
          return "number";
        } else if constexpr (std::is_same_v<T, DateField>) {
          return "date";
        } else {
          return "select";
        }
      },
      field);
}

bool is_optional(const FieldTemplate& field) {
  return std::visit(
      [](const auto& f) -> bool {
        using T = std::decay_t<decltype(f)>;
        if constexpr (std::is_same_v<T, SelectField>) {
          return f.is_optional();
        } else {
          return f.optional;
        }
      },
      field);
}

nlohmann::json field_schema(const FieldTemplate& field, const nlohmann::json& context) {
  return std::visit([&context](const auto& f) { return fields::schema(f, context); }, field);
}

std::vector<FieldValidator> field_validators(const FieldTemplate& field,
                                             const nlohmann::json& context) {
  return std::visit([&context](const auto& f) { return fields::validators(f, context); }, field);
}

nlohmann::json validate_field(const FieldTemplate& field, const nlohmann::json& value,
                              const nlohmann::json& context) {
  nlohmann::json current = value;
  for (const auto& validator : field_validators(field, context)) {
    current = validator(current);
  }
  return current;
}

} // namespace interview
