#pragma once

#include "logic.hpp"
#include "pointer.hpp"

#include <optional>
#include <string>
#include <variant>

namespace interview {

// Presents a question unless it has been answered.
struct AskStep {
  std::string ask;
  WhenCondition when = true;
};

// Writes a value into the interview data.
struct SetStep {
  ValuePointer set;
  ValueOrEvaluable value;
  WhenCondition when = true;
};

// Ends the interview without completing it.
struct ExitStep {
  Template exit;
  std::optional<Template> description;
  WhenCondition when = true;
};

using Step = std::variant<AskStep, SetStep, ExitStep>;

} // namespace interview
