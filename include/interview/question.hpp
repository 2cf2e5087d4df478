#pragma once

#include "field_template.hpp"
#include "logic.hpp"
#include "pointer.hpp"

#include <cstddef>
#include <optional>
#include <set>
#include <string>
#include <utility>
#include <vector>

#include <nlohmann/json.hpp>

namespace interview {

// A rendered question: what the client shows and the schema it validates with.
struct Question {
  std::string id;
  std::string title;
  std::optional<std::string> description;
  nlohmann::json schema;
  std::vector<std::string> field_names;
};

struct QuestionField {
  ValuePointer pointer;
  FieldTemplate field;
};

// Synthetic wire name of the field at `index`: "field_0", "field_1", ...
std::string field_name(std::size_t index);

struct QuestionTemplate {
  std::string id;
  std::optional<Template> title;
  std::optional<Template> description;
  std::vector<QuestionField> fields;

  Question get_question(const nlohmann::json& context) const;

  // Validates `responses` (keyed by synthetic field name, unknown keys ignored)
  // and returns the values to write, paired with their pointers, in field
  // order. Throws ValidationError naming the first failing field.
  std::vector<std::pair<ValuePointer, nlohmann::json>> parse_responses(
      const nlohmann::json& responses, const nlohmann::json& context) const;

  // Literal paths this question writes; fields with indirect pointers are
  // not reported.
  std::set<DirectPath> provides() const;
};

} // namespace interview
