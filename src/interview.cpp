#include "interview/interview.hpp"

#include "interview/errors.hpp"
#include "log.hpp"

namespace interview {
namespace {

InterviewState apply_responses(const InterviewContext& context, const nlohmann::json& responses) {
  const auto& state = context.state;
  const auto& question_id = *state.current_question_id;
  const auto* question_template = context.interview->find_question(question_id);
  if (!question_template) {
    throw ConfigurationError("Interview '" + context.interview->id + "': no question with id '" +
                             question_id + "'");
  }
  const auto template_context = state.template_context();
  auto values = question_template->parse_responses(responses, template_context);

  InterviewState next = state;
  for (auto& [pointer, value] : values) {
    next.data = set(pointer, next.data, std::move(value), template_context);
  }
  next.current_question_id.reset();
  next.answered_question_ids.insert(question_id);
  debug_log("interview", "answered " + question_id);
  return next;
}

} // namespace

nlohmann::json InterviewState::template_context() const {
  nlohmann::json out = nlohmann::json::object();
  out["data"] = data;
  out["context"] = context;
  out["target"] = target ? nlohmann::json(*target) : nlohmann::json(nullptr);
  out["answered_question_ids"] = answered_question_ids;
  if (context.is_object()) {
    for (const auto& item : context.items()) {
      out[item.key()] = item.value();
    }
  }
  if (data.is_object()) {
    for (const auto& item : data.items()) {
      out[item.key()] = item.value();
    }
  }
  return out;
}

const QuestionTemplate* Interview::find_question(const std::string& question_id) const {
  auto it = questions.find(question_id);
  return it == questions.end() ? nullptr : &it->second;
}

InterviewStatus UpdateResult::status() const {
  if (content) {
    return std::holds_alternative<AskResult>(*content) ? InterviewStatus::AwaitingAnswer
                                                      : InterviewStatus::Exited;
  }
  return context.state.completed ? InterviewStatus::Completed : InterviewStatus::Running;
}

UpdateResult update_interview(const InterviewContext& context,
                              const std::optional<nlohmann::json>& responses) {
  if (!context.interview) {
    throw ConfigurationError("Interview context has no interview");
  }
  InterviewContext current = context;
  const bool pending = context.state.current_question_id.has_value();
  if (pending && responses.has_value()) {
    current = current.with_state(apply_responses(current, *responses));
  } else if (pending) {
    throw ValidationError("Question '" + *context.state.current_question_id +
                          "' must be answered");
  } else if (responses.has_value()) {
    throw ValidationError("No question is awaiting a response");
  }

  for (const auto& step : current.interview->steps) {
    auto result = run_step(step, current);
    if (result.halts()) {
      return result;
    }
    current = std::move(result.context);
  }

  InterviewState state = current.state;
  state.completed = true;
  debug_log("interview", "interview '" + current.interview->id + "' completed");
  return {current.with_state(std::move(state)), std::nullopt};
}

} // namespace interview
