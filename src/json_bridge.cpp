#include "json_bridge.hpp"

#include "../fields/fields.hpp"
#include "interview/errors.hpp"

#include <cstdint>
#include <limits>
#include <regex>
#include <string_view>
#include <type_traits>
#include <utility>

namespace interview::bridge {
namespace {

[[noreturn]] void config_error(std::string_view where, const std::string& detail) {
  throw ConfigurationError(std::string(where) + ": " + detail);
}

std::string json_to_string(const ScriptJson& value, std::string_view key) {
  if (!value.is_string()) {
    config_error(key, "expected string");
  }
  return value.get<std::string>();
}

bool json_to_bool(const ScriptJson& value, std::string_view key) {
  if (!value.is_boolean()) {
    config_error(key, "expected bool");
  }
  return value.get<bool>();
}

int json_to_int(const ScriptJson& value, std::string_view key) {
  if (!value.is_number_integer()) {
    config_error(key, "expected integer");
  }
  if (value.is_number_unsigned()) {
    if (value.get<std::uint64_t>() > static_cast<std::uint64_t>(std::numeric_limits<int>::max())) {
      config_error(key, "integer out of range");
    }
    return static_cast<int>(value.get<std::uint64_t>());
  }
  const auto wide = value.get<std::int64_t>();
  if (wide < std::numeric_limits<int>::min() || wide > std::numeric_limits<int>::max()) {
    config_error(key, "integer out of range");
  }
  return static_cast<int>(wide);
}

double json_to_double(const ScriptJson& value, std::string_view key) {
  if (!value.is_number()) {
    config_error(key, "expected number");
  }
  return value.get<double>();
}

template <typename Setter>
bool assign_if_present(const ScriptJson& obj, const char* key, Setter&& setter) {
  auto it = obj.find(key);
  if (it == obj.end() || it->is_null()) {
    return false;
  }
  setter(*it);
  return true;
}

void read_label(const ScriptJson& obj, FieldLabel& field, Environment& env) {
  assign_if_present(obj, "label", [&](const ScriptJson& v) {
    field.label = env.compile_template(json_to_string(v, "label"));
  });
  assign_if_present(obj, "description", [&](const ScriptJson& v) {
    field.description = env.compile_template(json_to_string(v, "description"));
  });
}

template <typename Field>
void read_common(const ScriptJson& obj, Field& field, Environment& env) {
  read_label(obj, field, env);
  assign_if_present(obj, "optional",
                    [&](const ScriptJson& v) { field.optional = json_to_bool(v, "optional"); });
  assign_if_present(obj, "default",
                    [&](const ScriptJson& v) { field.default_value = nlohmann::json(v); });
  assign_if_present(obj, "component", [&](const ScriptJson& v) {
    field.component = json_to_string(v, "component");
  });
}

TextField text_field_from_json(const ScriptJson& obj, Environment& env) {
  TextField field;
  read_common(obj, field, env);
  assign_if_present(obj, "min", [&](const ScriptJson& v) {
    const int min = json_to_int(v, "min");
    if (min < 0) {
      config_error("min", "must not be negative");
    }
    field.min_length = static_cast<std::size_t>(min);
  });
  assign_if_present(obj, "max", [&](const ScriptJson& v) {
    const int max = json_to_int(v, "max");
    if (max < 0) {
      config_error("max", "must not be negative");
    }
    field.max_length = static_cast<std::size_t>(max);
  });
  if (field.min_length > field.max_length) {
    config_error("text field", "min is greater than max");
  }
  assign_if_present(obj, "regex", [&](const ScriptJson& v) {
    auto pattern = json_to_string(v, "regex");
    try {
      std::regex check(pattern);
    } catch (const std::regex_error& ex) {
      config_error("regex", "invalid pattern '" + pattern + "': " + ex.what());
    }
    field.regex = std::move(pattern);
  });
  assign_if_present(obj, "format",
                    [&](const ScriptJson& v) { field.format = json_to_string(v, "format"); });
  return field;
}

NumberField number_field_from_json(const ScriptJson& obj, Environment& env) {
  NumberField field;
  read_common(obj, field, env);
  assign_if_present(obj, "min", [&](const ScriptJson& v) { field.min = json_to_double(v, "min"); });
  assign_if_present(obj, "max", [&](const ScriptJson& v) { field.max = json_to_double(v, "max"); });
  assign_if_present(obj, "integer",
                    [&](const ScriptJson& v) { field.integer = json_to_bool(v, "integer"); });
  if (field.min && field.max && *field.min > *field.max) {
    config_error("number field", "min is greater than max");
  }
  return field;
}

DateField date_field_from_json(const ScriptJson& obj, Environment& env) {
  DateField field;
  read_common(obj, field, env);
  auto read_date = [](const ScriptJson& v, const char* key) {
    auto text = json_to_string(v, key);
    if (!fields::is_valid_date(text)) {
      config_error(key, "invalid date '" + text + "'");
    }
    return text;
  };
  assign_if_present(obj, "min", [&](const ScriptJson& v) { field.min = read_date(v, "min"); });
  assign_if_present(obj, "max", [&](const ScriptJson& v) { field.max = read_date(v, "max"); });
  return field;
}

SelectOption option_from_json(const ScriptJson& obj, Environment& env) {
  if (!obj.is_object()) {
    config_error("option", "expected object");
  }
  SelectOption option;
  const auto label = obj.contains("label") ? json_to_string(obj["label"], "label") : std::string();
  option.label = env.compile_template(label);
  option.value = obj.contains("value") ? nlohmann::json(obj["value"]) : nlohmann::json(label);
  assign_if_present(obj, "default", [&](const ScriptJson& v) {
    if (v.is_string()) {
      option.default_expr = env.compile_expression(v.get<std::string>());
    } else {
      option.default_selected = json_to_bool(v, "default");
    }
  });
  assign_if_present(obj, "default_expr", [&](const ScriptJson& v) {
    option.default_expr = env.compile_expression(json_to_string(v, "default_expr"));
  });
  assign_if_present(obj, "when", [&](const ScriptJson& v) { option.when = when_from_json(v, env); });
  return option;
}

SelectField select_field_from_json(const ScriptJson& obj, Environment& env) {
  SelectField field;
  read_label(obj, field, env);
  assign_if_present(obj, "options", [&](const ScriptJson& v) {
    if (!v.is_array()) {
      config_error("options", "expected array");
    }
    for (const auto& item : v) {
      field.options.push_back(option_from_json(item, env));
    }
  });
  assign_if_present(obj, "min", [&](const ScriptJson& v) { field.min = json_to_int(v, "min"); });
  assign_if_present(obj, "max", [&](const ScriptJson& v) { field.max = json_to_int(v, "max"); });
  assign_if_present(obj, "component", [&](const ScriptJson& v) {
    field.component = json_to_string(v, "component");
  });
  assign_if_present(obj, "autocomplete", [&](const ScriptJson& v) {
    field.autocomplete = json_to_string(v, "autocomplete");
  });
  if (field.min < 0 || field.max < 1 || field.min > field.max) {
    config_error("select field", "invalid bounds min=" + std::to_string(field.min) +
                                     " max=" + std::to_string(field.max));
  }
  return field;
}

nlohmann::json sorted_ids(const std::set<std::string>& ids) {
  nlohmann::json out = nlohmann::json::array();
  for (const auto& id : ids) {
    out.push_back(id);
  }
  return out;
}

} // namespace

WhenCondition when_from_json(const ScriptJson& json_when, Environment& env) {
  if (json_when.is_boolean()) {
    return json_when.get<bool>();
  }
  if (json_when.is_string()) {
    return env.compile_expression(json_when.get<std::string>());
  }
  auto read_list = [&env](const ScriptJson& items) {
    std::vector<WhenCondition> out;
    if (!items.is_array()) {
      config_error("when", "expected a list of conditions");
    }
    for (const auto& item : items) {
      out.push_back(when_from_json(item, env));
    }
    return out;
  };
  if (json_when.is_array()) {
    return LogicAnd{read_list(json_when)};
  }
  if (json_when.is_object() && json_when.size() == 1) {
    if (json_when.contains("and")) {
      return LogicAnd{read_list(json_when["and"])};
    }
    if (json_when.contains("or")) {
      return LogicOr{read_list(json_when["or"])};
    }
  }
  config_error("when", "invalid condition " + json_when.dump());
}

ValueOrEvaluable value_from_json(const ScriptJson& json_value, Environment& env) {
  if (json_value.is_string()) {
    return env.compile_expression(json_value.get<std::string>());
  }
  if (json_value.is_object() && json_value.size() == 1) {
    if (json_value.contains("expr")) {
      return env.compile_expression(json_to_string(json_value["expr"], "expr"));
    }
    if (json_value.contains("template")) {
      return env.compile_template(json_to_string(json_value["template"], "template"));
    }
    if (json_value.contains("value")) {
      return LiteralValue{nlohmann::json(json_value["value"])};
    }
  }
  return LiteralValue{nlohmann::json(json_value)};
}

FieldTemplate field_from_json(const ScriptJson& json_field, Environment& env) {
  if (!json_field.is_object() || !json_field.contains("type")) {
    config_error("field", "expected an object with a 'type'");
  }
  const auto type = json_to_string(json_field["type"], "type");
  if (type == "text") {
    return text_field_from_json(json_field, env);
  }
  if (type == "number") {
    return number_field_from_json(json_field, env);
  }
  if (type == "date") {
    return date_field_from_json(json_field, env);
  }
  if (type == "select") {
    return select_field_from_json(json_field, env);
  }
  config_error("field", "unknown field type '" + type + "'");
}

QuestionTemplate question_from_json(const ScriptJson& json_question, Environment& env) {
  if (!json_question.is_object() || !json_question.contains("id")) {
    config_error("question", "expected an object with an 'id'");
  }
  QuestionTemplate question;
  question.id = json_to_string(json_question["id"], "id");
  try {
    assign_if_present(json_question, "title", [&](const ScriptJson& v) {
      question.title = env.compile_template(json_to_string(v, "title"));
    });
    assign_if_present(json_question, "description", [&](const ScriptJson& v) {
      question.description = env.compile_template(json_to_string(v, "description"));
    });
    assign_if_present(json_question, "fields", [&](const ScriptJson& v) {
      if (!v.is_object()) {
        config_error("fields", "expected an object of pointer -> field");
      }
      for (const auto& item : v.items()) {
        question.fields.push_back({env.pointer(item.key()), field_from_json(item.value(), env)});
      }
    });
  } catch (const InterviewError& ex) {
    throw ConfigurationError("Question '" + question.id + "': " + ex.what());
  }
  return question;
}

Step step_from_json(const ScriptJson& json_step, Environment& env) {
  if (!json_step.is_object()) {
    config_error("step", "invalid step " + json_step.dump());
  }
  WhenCondition when = true;
  assign_if_present(json_step, "when", [&](const ScriptJson& v) { when = when_from_json(v, env); });

  if (json_step.contains("ask")) {
    return AskStep{json_to_string(json_step["ask"], "ask"), std::move(when)};
  }
  if (json_step.contains("exit")) {
    ExitStep step;
    step.exit = env.compile_template(json_to_string(json_step["exit"], "exit"));
    assign_if_present(json_step, "description", [&](const ScriptJson& v) {
      step.description = env.compile_template(json_to_string(v, "description"));
    });
    step.when = std::move(when);
    return step;
  }
  if (json_step.contains("set")) {
    if (!json_step.contains("value")) {
      config_error("set", "missing 'value'");
    }
    SetStep step;
    step.set = env.pointer(json_to_string(json_step["set"], "set"));
    step.value = value_from_json(json_step["value"], env);
    step.when = std::move(when);
    return step;
  }
  config_error("step", "invalid step " + json_step.dump());
}

std::shared_ptr<const Interview> interview_from_json(const ScriptJson& json_interview,
                                                     Environment& env) {
  if (!json_interview.is_object() || !json_interview.contains("id")) {
    config_error("interview", "expected an object with an 'id'");
  }
  auto interview = std::make_shared<Interview>();
  interview->id = json_to_string(json_interview["id"], "id");
  assign_if_present(json_interview, "title",
                    [&](const ScriptJson& v) { interview->title = json_to_string(v, "title"); });

  assign_if_present(json_interview, "questions", [&](const ScriptJson& v) {
    if (!v.is_array()) {
      config_error("Interview '" + interview->id + "'", "'questions' must be a list");
    }
    for (const auto& item : v) {
      auto question = question_from_json(item, env);
      const auto id = question.id;
      if (!interview->questions.emplace(id, std::move(question)).second) {
        config_error("Interview '" + interview->id + "'", "duplicate question id '" + id + "'");
      }
    }
  });

  assign_if_present(json_interview, "steps", [&](const ScriptJson& v) {
    if (!v.is_array()) {
      config_error("Interview '" + interview->id + "'", "'steps' must be a list");
    }
    for (std::size_t i = 0; i < v.size(); ++i) {
      try {
        interview->steps.push_back(step_from_json(v[i], env));
      } catch (const InterviewError& ex) {
        throw ConfigurationError("Interview '" + interview->id + "' step " + std::to_string(i) +
                                 ": " + ex.what());
      }
    }
  });

  for (const auto& step : interview->steps) {
    if (const auto* ask = std::get_if<AskStep>(&step)) {
      if (!interview->find_question(ask->ask)) {
        config_error("Interview '" + interview->id + "'",
                     "step asks unknown question '" + ask->ask + "'");
      }
    }
  }
  return interview;
}

nlohmann::json to_json(const InterviewState& state) {
  nlohmann::json out = nlohmann::json::object();
  out["data"] = state.data;
  out["context"] = state.context;
  out["answered_question_ids"] = sorted_ids(state.answered_question_ids);
  out["current_question_id"] =
      state.current_question_id ? nlohmann::json(*state.current_question_id) : nlohmann::json();
  out["target"] = state.target ? nlohmann::json(*state.target) : nlohmann::json();
  out["completed"] = state.completed;
  return out;
}

InterviewState interview_state_from_json(const nlohmann::json& json_state) {
  if (!json_state.is_object()) {
    throw InterviewError("State: expected object");
  }
  InterviewState state;
  auto read = [&json_state](const char* key) -> const nlohmann::json* {
    auto it = json_state.find(key);
    return it == json_state.end() || it->is_null() ? nullptr : &*it;
  };
  if (const auto* data = read("data")) {
    if (!data->is_object()) {
      throw InterviewError("State: 'data' must be an object");
    }
    state.data = *data;
  }
  if (const auto* context = read("context")) {
    if (!context->is_object()) {
      throw InterviewError("State: 'context' must be an object");
    }
    state.context = *context;
  }
  if (const auto* ids = read("answered_question_ids")) {
    if (!ids->is_array()) {
      throw InterviewError("State: 'answered_question_ids' must be a list");
    }
    for (const auto& id : *ids) {
      if (!id.is_string()) {
        throw InterviewError("State: question ids must be strings");
      }
      state.answered_question_ids.insert(id.get<std::string>());
    }
  }
  if (const auto* current = read("current_question_id")) {
    if (!current->is_string()) {
      throw InterviewError("State: 'current_question_id' must be a string");
    }
    state.current_question_id = current->get<std::string>();
  }
  if (const auto* target = read("target")) {
    if (!target->is_string()) {
      throw InterviewError("State: 'target' must be a string");
    }
    state.target = target->get<std::string>();
  }
  if (const auto* completed = read("completed")) {
    if (!completed->is_boolean()) {
      throw InterviewError("State: 'completed' must be a bool");
    }
    state.completed = completed->get<bool>();
  }
  return state;
}

nlohmann::json to_json(const InterviewContext& context) {
  nlohmann::json out = nlohmann::json::object();
  out["interview"] = context.interview ? context.interview->id : std::string();
  out["state"] = to_json(context.state);
  return out;
}

std::optional<InterviewContext> interview_context_from_json(const nlohmann::json& json_context,
                                                            const InterviewLookup& lookup) {
  if (!json_context.is_object() || !json_context.contains("interview") ||
      !json_context["interview"].is_string()) {
    throw InterviewError("State: missing interview id");
  }
  auto interview = lookup(json_context["interview"].get<std::string>());
  if (!interview) {
    return std::nullopt;
  }
  InterviewContext context;
  context.interview = std::move(interview);
  context.state = interview_state_from_json(json_context.value("state", nlohmann::json::object()));
  return context;
}

nlohmann::json to_json(const Question& question) {
  nlohmann::json out = nlohmann::json::object();
  out["type"] = "question";
  out["schema"] = question.schema;
  return out;
}

nlohmann::json to_json(const UpdateContent& content) {
  return std::visit(
      [](const auto& c) -> nlohmann::json {
        using T = std::decay_t<decltype(c)>;
        if constexpr (std::is_same_v<T, AskResult>) {
          return to_json(c.question);
        } else {
          nlohmann::json out = nlohmann::json::object();
          out["type"] = "exit";
          out["title"] = c.title;
          if (c.description) {
            out["description"] = *c.description;
          }
          return out;
        }
      },
      content);
}

nlohmann::json to_json(const InterviewResponse& response) {
  nlohmann::json out = nlohmann::json::object();
  out["state"] = response.state;
  out["completed"] = response.completed;
  out["content"] = response.content ? to_json(*response.content) : nlohmann::json();
  return out;
}

StartRequest start_request_from_json(const nlohmann::json& json_request) {
  StartRequest request;
  if (json_request.is_null()) {
    return request;
  }
  if (!json_request.is_object()) {
    throw ValidationError("Start request must be an object");
  }
  if (json_request.contains("target") && !json_request["target"].is_null()) {
    if (!json_request["target"].is_string()) {
      throw ValidationError("'target' must be a string");
    }
    request.target = json_request["target"].get<std::string>();
  }
  auto read_object = [&json_request](const char* key, nlohmann::json& out) {
    auto it = json_request.find(key);
    if (it == json_request.end() || it->is_null()) {
      return;
    }
    if (!it->is_object()) {
      throw ValidationError(std::string("'") + key + "' must be an object");
    }
    out = *it;
  };
  read_object("context", request.context);
  read_object("data", request.data);
  return request;
}

} // namespace interview::bridge
