#include "fields.hpp"

#include <cmath>

namespace interview::fields {

nlohmann::json schema(const NumberField& field, const nlohmann::json& context) {
  auto out = base_schema(field, field.integer ? "integer" : "number", "number", field.optional,
                         context);
  if (field.min) {
    out["minimum"] = *field.min;
  }
  if (field.max) {
    out["maximum"] = *field.max;
  }
  if (field.component) {
    out["x-component"] = *field.component;
  }
  if (field.default_value) {
    out["default"] = *field.default_value;
  }
  return out;
}

std::vector<FieldValidator> validators(const NumberField& field, const nlohmann::json&) {
  std::vector<FieldValidator> out;
  out.push_back([](const nlohmann::json& value) {
    if (!value.is_null() && (!value.is_number() || value.is_boolean())) {
      throw ValidationError("Must be a number");
    }
    return value;
  });
  out.push_back(require_value(field.optional));
  out.push_back([min = field.min, max = field.max](const nlohmann::json& value) {
    if (value.is_number()) {
      const double d = value.get<double>();
      if (min && d < *min) {
        throw ValidationError("Must be at least " + format_number(*min));
      }
      if (max && d > *max) {
        throw ValidationError("Must be at most " + format_number(*max));
      }
    }
    return value;
  });
  if (field.integer) {
    out.push_back([](const nlohmann::json& value) -> nlohmann::json {
      if (value.is_number_float()) {
        const double d = value.get<double>();
        if (!std::isfinite(d) || std::floor(d) != d) {
          throw ValidationError("Must be a whole number");
        }
        // 2^63 is exact as a double; anything at or above it does not fit.
        if (d < -9223372036854775808.0 || d >= 9223372036854775808.0) {
          throw ValidationError("Number is out of range");
        }
        return static_cast<long long>(d);
      }
      return value;
    });
  }
  return out;
}

} // namespace interview::fields
