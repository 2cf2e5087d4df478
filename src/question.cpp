#include "interview/question.hpp"

#include "interview/errors.hpp"

namespace interview {

std::string field_name(std::size_t index) {
  return "field_" + std::to_string(index);
}

Question QuestionTemplate::get_question(const nlohmann::json& context) const {
  Question question;
  question.id = id;
  question.title = title ? title->render(context) : std::string();
  if (description) {
    question.description = description->render(context);
  }

  nlohmann::json properties = nlohmann::json::object();
  nlohmann::json required = nlohmann::json::array();
  for (std::size_t i = 0; i < fields.size(); ++i) {
    const auto name = field_name(i);
    properties[name] = field_schema(fields[i].field, context);
    if (!is_optional(fields[i].field)) {
      required.push_back(name);
    }
    question.field_names.push_back(name);
  }

  nlohmann::json schema = nlohmann::json::object();
  schema["type"] = "object";
  schema["title"] = question.title;
  if (question.description) {
    schema["description"] = *question.description;
  }
  schema["properties"] = std::move(properties);
  schema["required"] = std::move(required);
  question.schema = std::move(schema);
  return question;
}

std::vector<std::pair<ValuePointer, nlohmann::json>> QuestionTemplate::parse_responses(
    const nlohmann::json& responses, const nlohmann::json& context) const {
  if (!responses.is_object()) {
    throw ValidationError("Responses must be an object");
  }
  std::vector<std::pair<ValuePointer, nlohmann::json>> values;
  values.reserve(fields.size());
  for (std::size_t i = 0; i < fields.size(); ++i) {
    const auto name = field_name(i);
    auto it = responses.find(name);
    const nlohmann::json raw = it == responses.end() ? nlohmann::json(nullptr) : *it;
    try {
      values.emplace_back(fields[i].pointer, validate_field(fields[i].field, raw, context));
    } catch (const ValidationError& ex) {
      throw ValidationError(ex.detail(), name);
    }
  }
  return values;
}

std::set<DirectPath> QuestionTemplate::provides() const {
  std::set<DirectPath> out;
  for (const auto& field : fields) {
    if (auto path = field.pointer.direct_path()) {
      out.insert(std::move(*path));
    }
  }
  return out;
}

} // namespace interview
