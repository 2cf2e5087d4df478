#include "fields.hpp"

#include <regex>

namespace interview::fields {
namespace {

bool looks_like_email(const std::string& text) {
  const auto at = text.find('@');
  if (at == std::string::npos || at == 0 || text.find('@', at + 1) != std::string::npos) {
    return false;
  }
  const auto domain = text.substr(at + 1);
  const auto dot = domain.find('.');
  if (dot == std::string::npos || dot == 0 || domain.back() == '.') {
    return false;
  }
  return std::none_of(text.begin(), text.end(),
                      [](unsigned char ch) { return std::isspace(ch); });
}

} // namespace

nlohmann::json schema(const TextField& field, const nlohmann::json& context) {
  auto out = base_schema(field, "string", "text", field.optional, context);
  out["minLength"] = field.min_length;
  out["maxLength"] = field.max_length;
  if (field.regex) {
    out["pattern"] = *field.regex;
  }
  if (field.format) {
    out["format"] = *field.format;
  }
  if (field.component) {
    out["x-component"] = *field.component;
  }
  if (field.default_value) {
    out["default"] = *field.default_value;
  }
  return out;
}

std::vector<FieldValidator> validators(const TextField& field, const nlohmann::json&) {
  std::vector<FieldValidator> out;
  out.push_back([](const nlohmann::json& value) -> nlohmann::json {
    if (!value.is_null() && !value.is_string()) {
      throw ValidationError("Must be text");
    }
    return blank_to_null(value);
  });
  out.push_back(require_value(field.optional));
  out.push_back([min = field.min_length, max = field.max_length](const nlohmann::json& value) {
    if (value.is_string()) {
      const auto length = code_point_count(value.get_ref<const std::string&>());
      if (length < min) {
        throw ValidationError("Must be at least " + std::to_string(min) + " characters");
      }
      if (length > max) {
        throw ValidationError("Must be at most " + std::to_string(max) + " characters");
      }
    }
    return value;
  });
  if (field.regex) {
    out.push_back([pattern = *field.regex](const nlohmann::json& value) -> nlohmann::json {
      if (!value.is_string()) {
        return value;
      }
      std::regex re;
      try {
        re = std::regex(pattern);
      } catch (const std::regex_error& ex) {
        throw ConfigurationError("Text field: invalid regex '" + pattern + "': " + ex.what());
      }
      if (!std::regex_search(value.get_ref<const std::string&>(), re)) {
        throw ValidationError("Invalid value");
      }
      return value;
    });
  }
  if (field.format && *field.format == "email") {
    out.push_back([](const nlohmann::json& value) {
      if (value.is_string() && !looks_like_email(value.get<std::string>())) {
        throw ValidationError("Invalid email");
      }
      return value;
    });
  }
  return out;
}

} // namespace interview::fields
