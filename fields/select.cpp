#include "fields.hpp"

#include <set>

namespace interview::fields {
namespace {

std::string option_id(std::size_t index) {
  return std::to_string(index);
}

// Indices of the options whose `when` holds in `context`.
std::vector<std::size_t> visible_options(const SelectField& field, const nlohmann::json& context) {
  std::vector<std::size_t> out;
  for (std::size_t i = 0; i < field.options.size(); ++i) {
    if (evaluate_when(field.options[i].when, context)) {
      out.push_back(i);
    }
  }
  return out;
}

bool is_default(const SelectOption& option, const nlohmann::json& context) {
  if (option.default_expr) {
    return option.default_expr->test(context);
  }
  return option.default_selected;
}

std::vector<std::string> to_choice_ids(const nlohmann::json& value) {
  std::vector<std::string> ids;
  auto push = [&ids](const nlohmann::json& item) {
    if (item.is_string()) {
      ids.push_back(item.get<std::string>());
    } else if (item.is_number_integer() && item.get<long long>() >= 0) {
      ids.push_back(std::to_string(item.get<long long>()));
    } else {
      throw ValidationError("Invalid choice");
    }
  };
  if (value.is_null()) {
    return ids;
  }
  if (value.is_array()) {
    for (const auto& item : value) {
      push(item);
    }
  } else {
    push(value);
  }
  return ids;
}

} // namespace

nlohmann::json schema(const SelectField& field, const nlohmann::json& context) {
  const bool multi = field.multi();
  auto out = base_schema(field, multi ? "array" : "string", "select", field.is_optional(),
                         context);

  nlohmann::json one_of = nlohmann::json::array();
  std::vector<std::string> defaults;
  for (auto index : visible_options(field, context)) {
    const auto& option = field.options[index];
    one_of.push_back({{"const", option_id(index)}, {"title", option.label.render(context)}});
    if (is_default(option, context)) {
      defaults.push_back(option_id(index));
    }
  }

  if (multi) {
    out["items"] = {{"oneOf", one_of}};
    out["uniqueItems"] = true;
    out["minItems"] = field.min;
    out["maxItems"] = field.max;
    if (!defaults.empty()) {
      out["default"] = defaults;
    }
  } else {
    if (field.is_optional()) {
      one_of.push_back({{"type", "null"}});
    }
    out["oneOf"] = std::move(one_of);
    if (!defaults.empty()) {
      out["default"] = defaults.front();
    }
  }

  if (field.autocomplete) {
    out["x-autoComplete"] = *field.autocomplete;
  }
  out["x-component"] = field.component;
  return out;
}

std::vector<FieldValidator> validators(const SelectField& field, const nlohmann::json& context) {
  const auto visible = visible_options(field, context);
  std::vector<FieldValidator> out;
  out.push_back([](const nlohmann::json& value) -> nlohmann::json {
    return to_choice_ids(value);
  });
  out.push_back([min = field.min, max = field.max](const nlohmann::json& ids) {
    const auto count = static_cast<int>(ids.size());
    if (count < min) {
      throw ValidationError("Choose at least " + std::to_string(min));
    }
    if (count > max) {
      throw ValidationError("Choose at most " + std::to_string(max));
    }
    return ids;
  });
  out.push_back([field, visible](const nlohmann::json& ids) -> nlohmann::json {
    std::set<std::string> seen;
    nlohmann::json values = nlohmann::json::array();
    for (const auto& id_value : ids) {
      const auto id = id_value.get<std::string>();
      if (!seen.insert(id).second) {
        throw ValidationError("Invalid choice");
      }
      auto match = std::find_if(visible.begin(), visible.end(),
                                [&id](std::size_t index) { return option_id(index) == id; });
      if (match == visible.end()) {
        throw ValidationError("Invalid choice");
      }
      values.push_back(field.options[*match].value);
    }
    if (field.multi()) {
      return values;
    }
    return values.empty() ? nlohmann::json(nullptr) : values.front();
  });
  return out;
}

} // namespace interview::fields
