#pragma once

#include "interview/errors.hpp"
#include "interview/field_template.hpp"

#include <algorithm>
#include <cmath>
#include <cctype>
#include <string>
#include <vector>

namespace interview::fields {

nlohmann::json schema(const TextField& field, const nlohmann::json& context);
std::vector<FieldValidator> validators(const TextField& field, const nlohmann::json& context);

nlohmann::json schema(const NumberField& field, const nlohmann::json& context);
std::vector<FieldValidator> validators(const NumberField& field, const nlohmann::json& context);

nlohmann::json schema(const DateField& field, const nlohmann::json& context);
std::vector<FieldValidator> validators(const DateField& field, const nlohmann::json& context);

nlohmann::json schema(const SelectField& field, const nlohmann::json& context);
std::vector<FieldValidator> validators(const SelectField& field, const nlohmann::json& context);

bool is_valid_date(const std::string& text);

// Schema keys shared by every field type.
inline nlohmann::json base_schema(const FieldLabel& field, const char* json_type,
                                  const char* x_type, bool optional,
                                  const nlohmann::json& context) {
  nlohmann::json schema = nlohmann::json::object();
  if (optional) {
    schema["type"] = nlohmann::json::array({json_type, "null"});
  } else {
    schema["type"] = json_type;
  }
  schema["x-type"] = x_type;
  if (field.label) {
    schema["title"] = field.label->render(context);
  }
  if (field.description) {
    schema["description"] = field.description->render(context);
  }
  return schema;
}

// Counts UTF-8 code points by skipping continuation bytes.
inline std::size_t code_point_count(const std::string& text) {
  return static_cast<std::size_t>(std::count_if(text.begin(), text.end(), [](char ch) {
    return (static_cast<unsigned char>(ch) & 0xC0) != 0x80;
  }));
}

inline std::string trim_copy(const std::string& text) {
  const auto begin = std::find_if_not(text.begin(), text.end(), [](unsigned char ch) {
    return std::isspace(ch);
  });
  const auto end = std::find_if_not(text.rbegin(), text.rend(), [](unsigned char ch) {
                     return std::isspace(ch);
                   }).base();
  return begin < end ? std::string(begin, end) : std::string();
}

// Trims strings and turns blank answers into null.
inline nlohmann::json blank_to_null(const nlohmann::json& value) {
  if (!value.is_string()) {
    return value;
  }
  auto trimmed = trim_copy(value.get<std::string>());
  if (trimmed.empty()) {
    return nullptr;
  }
  return trimmed;
}

inline FieldValidator require_value(bool optional) {
  return [optional](const nlohmann::json& value) -> nlohmann::json {
    if (value.is_null() && !optional) {
      throw ValidationError("A value is required");
    }
    return value;
  };
}

inline std::string format_number(double value) {
  nlohmann::json number = value;
  if (std::isfinite(value) && value >= -9223372036854775808.0 && value < 9223372036854775808.0 &&
      value == std::floor(value)) {
    number = static_cast<long long>(value);
  }
  return number.dump();
}

} // namespace interview::fields
