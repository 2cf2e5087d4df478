#pragma once

#include "question.hpp"
#include "step.hpp"
#include "types.hpp"

#include <map>
#include <memory>
#include <optional>
#include <utility>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace interview {

// A script: ordered steps plus the questions they may ask. Immutable once
// loaded and shared between every run of the interview.
struct Interview {
  std::string id;
  std::optional<std::string> title;
  std::vector<Step> steps;
  std::map<std::string, QuestionTemplate> questions;

  const QuestionTemplate* find_question(const std::string& question_id) const;
};

struct InterviewContext {
  std::shared_ptr<const Interview> interview;
  InterviewState state;

  InterviewContext with_state(InterviewState next) const { return {interview, std::move(next)}; }
};

struct UpdateResult {
  InterviewContext context;
  std::optional<UpdateContent> content;

  // True when the content stops the step loop.
  bool halts() const { return content.has_value(); }
  InterviewStatus status() const;
};

// Applies one step. Throws ConfigurationError for unknown question ids and
// propagates EvaluationError / PointerError.
UpdateResult run_step(const Step& step, const InterviewContext& context);

/**
 * Applies `responses` to the pending question (if any), then replays the
 * steps from the top until one halts. Without a halt the state is marked
 * completed. Throws ValidationError when responses are rejected or do not
 * match the pending-question state.
 */
UpdateResult update_interview(const InterviewContext& context,
                              const std::optional<nlohmann::json>& responses = std::nullopt);

} // namespace interview
