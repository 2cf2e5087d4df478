#pragma once

#include "interview/interview.hpp"
#include "interview/logic.hpp"

#include <functional>
#include <memory>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

namespace interview::bridge {

// Script documents keep key order: field order decides the synthetic names.
using ScriptJson = nlohmann::ordered_json;

// ---- Script (configuration) structuring; all throw ConfigurationError. ----

WhenCondition when_from_json(const ScriptJson& json_when, Environment& env);
ValueOrEvaluable value_from_json(const ScriptJson& json_value, Environment& env);
FieldTemplate field_from_json(const ScriptJson& json_field, Environment& env);
QuestionTemplate question_from_json(const ScriptJson& json_question, Environment& env);
Step step_from_json(const ScriptJson& json_step, Environment& env);
std::shared_ptr<const Interview> interview_from_json(const ScriptJson& json_interview,
                                                     Environment& env);

// ---- State and wire shapes. ----

nlohmann::json to_json(const InterviewState& state);
InterviewState interview_state_from_json(const nlohmann::json& json_state);

using InterviewLookup = std::function<std::shared_ptr<const Interview>(const std::string&)>;

// {"interview": id, "state": {...}}
nlohmann::json to_json(const InterviewContext& context);
// Returns std::nullopt when the interview id is no longer known.
std::optional<InterviewContext> interview_context_from_json(const nlohmann::json& json_context,
                                                            const InterviewLookup& lookup);

nlohmann::json to_json(const Question& question);
nlohmann::json to_json(const UpdateContent& content);
nlohmann::json to_json(const InterviewResponse& response);

StartRequest start_request_from_json(const nlohmann::json& json_request);

} // namespace interview::bridge
