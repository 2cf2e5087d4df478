#include "interview/errors.hpp"
#include "interview/field_template.hpp"
#include "interview/question.hpp"

#include "json_bridge.hpp"

#include <iostream>
#include <set>
#include <string>

#include <nlohmann/json.hpp>

namespace {

struct TestSuite {
  bool ok = true;
  void require(bool condition, const std::string& message) {
    if (!condition) {
      std::cerr << "[FAIL] " << message << std::endl;
      ok = false;
    }
  }
};

using nlohmann::json;

// Runs `fn` and returns the ValidationError's field and detail, or "" if none was thrown.
template <typename Fn>
std::string validation_message(Fn&& fn) {
  try {
    fn();
  } catch (const interview::ValidationError& ex) {
    return ex.what();
  }
  return "";
}

template <typename Error, typename Fn>
bool throws(Fn&& fn) {
  try {
    fn();
  } catch (const Error&) {
    return true;
  }
  return false;
}

interview::TextField text_field(interview::Environment& env, const std::string& label,
                                bool optional = false) {
  interview::TextField field;
  field.label = env.compile_template(label);
  field.optional = optional;
  return field;
}

interview::SelectField select_field(interview::Environment& env, int min, int max) {
  interview::SelectField field;
  field.label = env.compile_template("Pick");
  field.min = min;
  field.max = max;
  for (const char* label : {"Basic", "Sponsor", "Patron"}) {
    interview::SelectOption option;
    option.label = env.compile_template(label);
    option.value = std::string(label);
    field.options.push_back(std::move(option));
  }
  return field;
}

void test_schema(TestSuite& suite, interview::Environment& env) {
  interview::QuestionTemplate question;
  question.id = "q";
  question.title = env.compile_template("{{ title }}");
  question.description = env.compile_template("desc");
  question.fields.push_back({interview::parse_pointer("text"), text_field(env, "field")});
  question.fields.push_back({interview::parse_pointer("text2"), text_field(env, "field2", true)});

  auto rendered = question.get_question(json{{"title", "Test"}});
  const auto expected = json::parse(R"({
    "type": "object",
    "title": "Test",
    "description": "desc",
    "properties": {
      "field_0": {
        "type": "string",
        "x-type": "text",
        "title": "field",
        "minLength": 1,
        "maxLength": 300
      },
      "field_1": {
        "type": ["string", "null"],
        "x-type": "text",
        "title": "field2",
        "minLength": 1,
        "maxLength": 300
      }
    },
    "required": ["field_0"]
  })");
  suite.require(rendered.schema == expected, "text question schema: " + rendered.schema.dump());
  suite.require(rendered.title == "Test" && rendered.description == std::string("desc"),
                "rendered title and description");
  suite.require(rendered.field_names.size() == 2 && rendered.field_names[1] == "field_1",
                "synthetic field names follow field order");
}

void test_provides(TestSuite& suite, interview::Environment& env) {
  interview::QuestionTemplate question;
  question.id = "q";
  question.fields.push_back({interview::parse_pointer("user.name"), text_field(env, "field")});
  question.fields.push_back({interview::parse_pointer("other"), text_field(env, "field2", true)});
  question.fields.push_back({interview::parse_pointer("item[n][0]"), text_field(env, "field3")});

  const std::set<interview::DirectPath> expected = {
      {std::string("user"), std::string("name")},
      {std::string("other")},
  };
  suite.require(question.provides() == expected, "provides lists only direct paths");
}

void test_parse_responses(TestSuite& suite, interview::Environment& env) {
  interview::QuestionTemplate question;
  question.id = "q";
  question.fields.push_back({interview::parse_pointer("name"), text_field(env, "Name")});
  question.fields.push_back({interview::parse_pointer("nick"), text_field(env, "Nick", true)});

  auto values = question.parse_responses(json{{"field_0", "  Ann "}, {"extra", 1}}, json::object());
  suite.require(values.size() == 2, "one value per field");
  suite.require(values[0].first == interview::parse_pointer("name") && values[0].second == "Ann",
                "text answers are trimmed");
  suite.require(values[1].second.is_null(), "missing optional answers become null");

  auto message = validation_message(
      [&] { question.parse_responses(json{{"field_0", "   "}}, json::object()); });
  suite.require(message == "field_0: A value is required", "blank required text: " + message);

  message = validation_message([&] { question.parse_responses(json::array(), json::object()); });
  suite.require(!message.empty(), "non-object responses are rejected");

  try {
    question.parse_responses(json{{"field_0", 5}}, json::object());
    suite.require(false, "non-string text should be rejected");
  } catch (const interview::ValidationError& ex) {
    suite.require(ex.field() == "field_0" && ex.detail() == "Must be text",
                  "validation errors carry the field name");
  }
}

void test_text_validation(TestSuite& suite, interview::Environment& env) {
  const json ctx = json::object();
  auto field = text_field(env, "Code");
  field.min_length = 2;
  field.max_length = 4;
  field.regex = std::string("^[A-Z]+$");
  interview::FieldTemplate tpl = field;
  suite.require(interview::validate_field(tpl, "AB", ctx) == "AB", "valid text passes");
  suite.require(validation_message([&] { interview::validate_field(tpl, "A", ctx); }) ==
                    "Must be at least 2 characters",
                "min length");
  suite.require(validation_message([&] { interview::validate_field(tpl, "ABCDE", ctx); }) ==
                    "Must be at most 4 characters",
                "max length");
  suite.require(validation_message([&] { interview::validate_field(tpl, "ab", ctx); }) ==
                    "Invalid value",
                "regex mismatch");

  auto accented = text_field(env, "Nickname");
  accented.min_length = 2;
  accented.max_length = 3;
  interview::FieldTemplate accented_tpl = accented;
  suite.require(interview::validate_field(accented_tpl, "\u00e9\u00e9\u00e9", ctx) ==
                    "\u00e9\u00e9\u00e9",
                "lengths count characters, not bytes");
  suite.require(validation_message([&] {
                  interview::validate_field(accented_tpl, "\u65e5", ctx);
                }) == "Must be at least 2 characters",
                "a single multibyte character is one character");
  auto schema = interview::field_schema(tpl, ctx);
  suite.require(schema["pattern"] == "^[A-Z]+$" && schema["minLength"] == 2, "regex in schema");

  auto email = text_field(env, "Email");
  email.format = std::string("email");
  interview::FieldTemplate email_tpl = email;
  suite.require(interview::validate_field(email_tpl, "a@example.com", ctx) == "a@example.com",
                "valid email passes");
  suite.require(validation_message([&] { interview::validate_field(email_tpl, "nope", ctx); }) ==
                    "Invalid email",
                "invalid email is rejected");
}

void test_number_and_date(TestSuite& suite, interview::Environment& env) {
  const json ctx = json::object();
  interview::NumberField number;
  number.label = env.compile_template("Age");
  number.min = 0;
  number.max = 150;
  number.integer = true;
  interview::FieldTemplate number_tpl = number;
  suite.require(interview::validate_field(number_tpl, 30.0, ctx) == 30, "whole floats become ints");
  suite.require(validation_message([&] { interview::validate_field(number_tpl, 1.5, ctx); }) ==
                    "Must be a whole number",
                "integer constraint");
  suite.require(validation_message([&] { interview::validate_field(number_tpl, 200, ctx); }) ==
                    "Must be at most 150",
                "number max");
  suite.require(validation_message([&] { interview::validate_field(number_tpl, 1e300, ctx); }) ==
                    "Must be at most 150",
                "huge floats are caught by the bounds");
  interview::NumberField unbounded;
  unbounded.label = env.compile_template("Count");
  unbounded.integer = true;
  interview::FieldTemplate unbounded_tpl = unbounded;
  suite.require(validation_message([&] {
                  interview::validate_field(unbounded_tpl, 1e300, ctx);
                }) == "Number is out of range",
                "whole floats beyond the integer range are rejected");
  suite.require(validation_message([&] {
                  interview::validate_field(unbounded_tpl, -9223372036854775808.0, ctx);
                }).empty(),
                "the smallest integer is still accepted");
  suite.require(validation_message([&] { interview::validate_field(number_tpl, "3", ctx); }) ==
                    "Must be a number",
                "strings are not numbers");
  auto number_schema = interview::field_schema(number_tpl, ctx);
  suite.require(number_schema["x-type"] == "number" && number_schema["maximum"] == 150.0,
                "number schema bounds");

  interview::DateField date;
  date.min = std::string("2000-01-01");
  date.max = std::string("2030-12-31");
  interview::FieldTemplate date_tpl = date;
  suite.require(interview::validate_field(date_tpl, "2024-02-29", ctx) == "2024-02-29",
                "leap day is a valid date");
  suite.require(validation_message([&] { interview::validate_field(date_tpl, "2023-02-29", ctx); }) ==
                    "Invalid date",
                "invalid calendar date");
  suite.require(validation_message([&] { interview::validate_field(date_tpl, "1999-12-31", ctx); }) ==
                    "Must be on or after 2000-01-01",
                "date min");
  auto date_schema = interview::field_schema(date_tpl, ctx);
  suite.require(date_schema["format"] == "date" && date_schema["x-minimum"] == "2000-01-01",
                "date schema bounds");
}

void test_select(TestSuite& suite, interview::Environment& env) {
  const json ctx = json{{"vip", false}};

  interview::FieldTemplate single = select_field(env, 1, 1);
  suite.require(interview::validate_field(single, "1", ctx) == "Sponsor", "single select by id");
  suite.require(interview::validate_field(single, json::array({"2"}), ctx) == "Patron",
                "single select accepts a one-element list");
  suite.require(validation_message([&] { interview::validate_field(single, nullptr, ctx); }) ==
                    "Choose at least 1",
                "required single select");
  suite.require(validation_message([&] { interview::validate_field(single, "9", ctx); }) ==
                    "Invalid choice",
                "unknown option id");
  suite.require(validation_message([&] {
                  interview::validate_field(single, json::array({"0", "1"}), ctx);
                }) == "Choose at most 1",
                "single select rejects two choices");

  auto multi_field = select_field(env, 1, 2);
  multi_field.options[2].when = env.compile_expression("vip");
  multi_field.options[0].default_selected = true;
  interview::FieldTemplate multi = multi_field;
  suite.require(interview::validate_field(multi, json::array({"0", "1"}), ctx) ==
                    json::array({"Basic", "Sponsor"}),
                "multi select returns values in answer order");
  suite.require(validation_message([&] {
                  interview::validate_field(multi, json::array({"0", "1", "2"}), ctx);
                }) == "Choose at most 2",
                "multi select max");
  suite.require(validation_message([&] { interview::validate_field(multi, "2", ctx); }) ==
                    "Invalid choice",
                "hidden options cannot be chosen");
  suite.require(validation_message([&] {
                  interview::validate_field(multi, json::array({"0", "0"}), ctx);
                }) == "Invalid choice",
                "duplicate choices are rejected");

  auto schema = interview::field_schema(multi, ctx);
  suite.require(schema["type"] == "array" && schema["maxItems"] == 2 && schema["minItems"] == 1,
                "multi select schema bounds");
  suite.require(schema["items"]["oneOf"].size() == 2, "hidden options are not listed");
  suite.require(schema["default"] == json::array({"0"}), "default options are listed");
  suite.require(schema["x-component"] == "dropdown", "default component");

  interview::FieldTemplate optional = select_field(env, 0, 1);
  auto optional_schema = interview::field_schema(optional, ctx);
  suite.require(optional_schema["type"] == json::array({"string", "null"}),
                "optional single select is nullable");
  suite.require(optional_schema["oneOf"].back() == json{{"type", "null"}},
                "optional single select accepts null");
  suite.require(interview::validate_field(optional, nullptr, ctx).is_null(),
                "optional single select may be left empty");
}

void test_script_fields(TestSuite& suite, interview::Environment& env) {
  const auto document = interview::bridge::ScriptJson::parse(R"({
    "id": "profile",
    "title": "About {{ name }}",
    "fields": {
      "zeta": {"type": "text", "label": "Z"},
      "alpha": {"type": "number", "label": "A", "optional": true},
      "level": {
        "type": "select",
        "min": 1,
        "options": [
          {"label": "Basic", "default": "vip is not defined"},
          {"label": "Sponsor", "value": "sponsor", "when": "vip"}
        ]
      }
    }
  })");
  auto question = interview::bridge::question_from_json(document, env);
  suite.require(question.fields.size() == 3, "all fields are loaded");
  suite.require(question.fields[0].pointer == interview::parse_pointer("zeta"),
                "fields keep document order");

  auto rendered = question.get_question(json{{"name", "Ann"}});
  suite.require(rendered.title == "About Ann", "question title is a template");
  suite.require(rendered.schema["required"] == json::array({"field_0", "field_2"}),
                "required lists non-optional fields");
  suite.require(rendered.schema["properties"]["field_2"]["default"] == "0",
                "expression defaults are evaluated");
  auto values = question.parse_responses(json{{"field_0", "z"}, {"field_2", "0"}},
                                         json::object());
  suite.require(values[2].second == "Basic", "option value defaults to its label");

  for (const char* bad : {R"({"id": "x", "fields": {"a": {"type": "color"}}})",
                          R"({"id": "x", "fields": {"a b": {"type": "text"}}})",
                          R"({"id": "x", "fields": {"a": {"type": "text", "regex": "("}}})",
                          R"({"id": "x", "fields": {"a": {"type": "select", "min": 2, "max": 1}}})",
                          R"({"id": "x", "fields": {"a": {"type": "select", "max": 4294967297}}})",
                          R"({"id": "x", "fields": {"a": {"type": "text", "max": -4294967296}}})",
                          R"({"id": "x", "fields": {"a": {"type": "date", "min": "2020-13-01"}}})",
                          R"({"id": "x", "title": "{{ oops"})"}) {
    suite.require(throws<interview::ConfigurationError>([&] {
                    interview::bridge::question_from_json(interview::bridge::ScriptJson::parse(bad),
                                                          env);
                  }),
                  std::string("should reject question ") + bad);
  }
}

} // namespace

int main() {
  TestSuite suite;
  interview::Environment env;

  test_schema(suite, env);
  test_provides(suite, env);
  test_parse_responses(suite, env);
  test_text_validation(suite, env);
  test_number_and_date(suite, env);
  test_select(suite, env);
  test_script_fields(suite, env);

  if (!suite.ok) {
    std::cerr << "Question tests FAILED" << std::endl;
    return 1;
  }

  std::cout << "Question tests passed" << std::endl;
  return 0;
}
