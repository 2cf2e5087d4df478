#include "interview/interview.hpp"

#include "interview/errors.hpp"
#include "log.hpp"

#include <type_traits>

namespace interview {
namespace {

UpdateResult run_ask(const AskStep& step, const InterviewContext& context) {
  // An answered question stays answered even if its condition flips later.
  if (context.state.is_answered(step.ask)) {
    return {context, std::nullopt};
  }
  const auto template_context = context.state.template_context();
  if (!evaluate_when(step.when, template_context)) {
    return {context, std::nullopt};
  }
  const auto* question_template = context.interview->find_question(step.ask);
  if (!question_template) {
    throw ConfigurationError("Interview '" + context.interview->id + "': no question with id '" +
                             step.ask + "'");
  }
  auto question = question_template->get_question(template_context);
  InterviewState state = context.state;
  state.current_question_id = step.ask;
  state.completed = false;
  debug_log("interview", "ask " + step.ask);
  return {context.with_state(std::move(state)), UpdateContent{AskResult{std::move(question)}}};
}

UpdateResult run_set(const SetStep& step, const InterviewContext& context) {
  const auto template_context = context.state.template_context();
  if (!evaluate_when(step.when, template_context)) {
    return {context, std::nullopt};
  }
  auto value = evaluate_value(step.value, template_context);
  InterviewState state = context.state;
  state.data = set(step.set, state.data, std::move(value), template_context);
  debug_log("interview", "set " + step.set.to_string());
  return {context.with_state(std::move(state)), std::nullopt};
}

UpdateResult run_exit(const ExitStep& step, const InterviewContext& context) {
  const auto template_context = context.state.template_context();
  if (!evaluate_when(step.when, template_context)) {
    return {context, std::nullopt};
  }
  ExitResult result;
  result.title = step.exit.render(template_context);
  if (step.description) {
    result.description = step.description->render(template_context);
  }
  debug_log("interview", "exit: " + result.title);
  return {context, UpdateContent{std::move(result)}};
}

} // namespace

UpdateResult run_step(const Step& step, const InterviewContext& context) {
  return std::visit(
      [&context](const auto& s) -> UpdateResult {
        using T = std::decay_t<decltype(s)>;
        if constexpr (std::is_same_v<T, AskStep>) {
          return run_ask(s, context);
        } else if constexpr (std::is_same_v<T, SetStep>) {
          return run_set(s, context);
        } else {
          return run_exit(s, context);
        }
      },
      step);
}

} // namespace interview
