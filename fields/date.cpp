#include "fields.hpp"

namespace interview::fields {
namespace {

bool is_leap(int year) {
  return (year % 4 == 0 && year % 100 != 0) || year % 400 == 0;
}

int days_in_month(int year, int month) {
  static const int days[12] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
  if (month == 2 && is_leap(year)) {
    return 29;
  }
  return days[month - 1];
}

} // namespace

bool is_valid_date(const std::string& text) {
  if (text.size() != 10 || text[4] != '-' || text[7] != '-') {
    return false;
  }
  for (std::size_t i = 0; i < text.size(); ++i) {
    if (i == 4 || i == 7) {
      continue;
    }
    if (!std::isdigit(static_cast<unsigned char>(text[i]))) {
      return false;
    }
  }
  const int year = std::stoi(text.substr(0, 4));
  const int month = std::stoi(text.substr(5, 2));
  const int day = std::stoi(text.substr(8, 2));
  if (year < 1 || month < 1 || month > 12 || day < 1) {
    return false;
  }
  return day <= days_in_month(year, month);
}

nlohmann::json schema(const DateField& field, const nlohmann::json& context) {
  auto out = base_schema(field, "string", "date", field.optional, context);
  out["format"] = "date";
  if (field.min) {
    out["x-minimum"] = *field.min;
  }
  if (field.max) {
    out["x-maximum"] = *field.max;
  }
  if (field.component) {
    out["x-component"] = *field.component;
  }
  if (field.default_value) {
    out["default"] = *field.default_value;
  }
  return out;
}

std::vector<FieldValidator> validators(const DateField& field, const nlohmann::json&) {
  std::vector<FieldValidator> out;
  out.push_back([](const nlohmann::json& value) {
    if (!value.is_null() && !value.is_string()) {
      throw ValidationError("Must be a date");
    }
    return blank_to_null(value);
  });
  out.push_back(require_value(field.optional));
  out.push_back([min = field.min, max = field.max](const nlohmann::json& value) {
    if (!value.is_string()) {
      return value;
    }
    const auto& text = value.get_ref<const std::string&>();
    if (!is_valid_date(text)) {
      throw ValidationError("Invalid date");
    }
    // ISO dates order lexicographically.
    if (min && text < *min) {
      throw ValidationError("Must be on or after " + *min);
    }
    if (max && text > *max) {
      throw ValidationError("Must be on or before " + *max);
    }
    return value;
  });
  return out;
}

} // namespace interview::fields
