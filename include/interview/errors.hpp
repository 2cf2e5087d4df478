#pragma once

#include <stdexcept>
#include <string>
#include <utility>

namespace interview {

// Base for every error raised by the engine.
class InterviewError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

// Malformed pointer text.
class PointerSyntaxError : public InterviewError {
public:
  using InterviewError::InterviewError;
};

// A pointer could not be written (index past the end, scalar in the path...).
class PointerError : public InterviewError {
public:
  using InterviewError::InterviewError;
};

// Expression or template failed to compile or hit an undefined operation.
class EvaluationError : public InterviewError {
public:
  using InterviewError::InterviewError;
};

// The script is inconsistent: unknown question id, bad field template, ...
class ConfigurationError : public InterviewError {
public:
  using InterviewError::InterviewError;
};

// Unknown interview id or state key.
class NotFoundError : public InterviewError {
public:
  using InterviewError::InterviewError;
};

/**
 * User input was rejected. These are the only errors meant to be shown to the
 * person taking the interview; `field()` names the synthetic field
 * ("field_0", ...) when the failure is tied to one.
 */
class ValidationError : public InterviewError {
public:
  explicit ValidationError(const std::string& message, std::string field = {})
      : InterviewError(field.empty() ? message : field + ": " + message),
        field_(std::move(field)),
        detail_(message) {}

  const std::string& field() const { return field_; }
  const std::string& detail() const { return detail_; }

private:
  std::string field_;
  std::string detail_;
};

} // namespace interview
