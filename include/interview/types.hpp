#pragma once

#include "question.hpp"

#include <optional>
#include <set>
#include <string>
#include <variant>

#include <nlohmann/json.hpp>

namespace interview {

/**
 * Everything an interview has collected so far. Treated as a value: every
 * transition produces a new state and the caller persists it.
 */
struct InterviewState {
  nlohmann::json data = nlohmann::json::object();
  nlohmann::json context = nlohmann::json::object();
  std::set<std::string> answered_question_ids;
  std::optional<std::string> current_question_id;
  std::optional<std::string> target;
  bool completed = false;

  // Metadata (`data`, `context`, `target`, `answered_question_ids`), overlaid
  // with the keys of `context`, overlaid with the keys of `data`.
  nlohmann::json template_context() const;

  bool is_answered(const std::string& question_id) const {
    return answered_question_ids.count(question_id) != 0;
  }
};

struct AskResult {
  Question question;
};

struct ExitResult {
  std::string title;
  std::optional<std::string> description;
};

// Content that halts an update.
using UpdateContent = std::variant<AskResult, ExitResult>;

enum class InterviewStatus {
  Running,
  AwaitingAnswer,
  Exited,
  Completed
};

inline std::string to_string(InterviewStatus status) {
  switch (status) {
    case InterviewStatus::Running: return "running";
    case InterviewStatus::AwaitingAnswer: return "awaiting_answer";
    case InterviewStatus::Exited: return "exited";
    case InterviewStatus::Completed: return "completed";
  }
  return "running";
}

struct StartRequest {
  std::optional<std::string> target;
  nlohmann::json context = nlohmann::json::object();
  nlohmann::json data = nlohmann::json::object();
};

struct InterviewResponse {
  std::string state;
  bool completed = false;
  std::optional<UpdateContent> content;
};

} // namespace interview
