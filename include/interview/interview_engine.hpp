#pragma once

#include "config.hpp"
#include "storage.hpp"
#include "types.hpp"

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace interview {

class InterviewEngine {
public:
  virtual ~InterviewEngine() = default;

  // Creates and stores a fresh state. Throws NotFoundError for unknown ids.
  virtual InterviewResponse start_interview(const std::string& interview_id,
                                            const StartRequest& request) = 0;

  // Loads the state behind `state_key`, applies `responses` and stores the
  // result under a new key. Throws NotFoundError for unknown keys and
  // ValidationError for rejected responses.
  virtual InterviewResponse update_interview(const std::string& state_key,
                                             const std::optional<nlohmann::json>& responses) = 0;

  // The state behind `state_key` if it exists and is completed.
  virtual std::optional<InterviewState> get_completed_interview(const std::string& state_key) = 0;

  virtual std::vector<std::string> interview_ids() const = 0;
};

std::unique_ptr<InterviewEngine> make_engine(const InterviewRegistry& registry,
                                             StorageService& storage);

} // namespace interview
