#include "interview/interview_engine.hpp"

#include "interview/errors.hpp"
#include "interview/interview.hpp"
#include "log.hpp"

#include <utility>

namespace interview {

class InterviewEngineImpl : public InterviewEngine {
public:
  InterviewEngineImpl(const InterviewRegistry& registry, StorageService& storage)
      : registry_(registry), storage_(storage) {}

  InterviewResponse start_interview(const std::string& interview_id,
                                    const StartRequest& request) override {
    auto interview = registry_.find(interview_id);
    if (!interview) {
      throw NotFoundError("Engine: unknown interview id '" + interview_id + "'");
    }
    InterviewContext context;
    context.interview = std::move(interview);
    context.state.target = request.target;
    context.state.context = request.context.is_object() ? request.context
                                                        : nlohmann::json::object();
    context.state.data = request.data.is_object() ? request.data : nlohmann::json::object();

    InterviewResponse response;
    response.state = storage_.put(context);
    response.completed = false;
    debug_log("interview", "started '" + interview_id + "' as " + response.state);
    return response;
  }

  InterviewResponse update_interview(const std::string& state_key,
                                     const std::optional<nlohmann::json>& responses) override {
    if (responses && !responses->is_object()) {
      throw ValidationError("Responses must be an object");
    }
    auto context = load(state_key);
    auto result = interview::update_interview(context, responses);

    InterviewResponse response;
    response.state = storage_.put(result.context);
    response.completed = result.context.state.completed;
    response.content = std::move(result.content);
    debug_log("interview", "updated " + state_key + " -> " + response.state + " (" +
                               to_string(result.status()) + ")");
    return response;
  }

  std::optional<InterviewState> get_completed_interview(const std::string& state_key) override {
    auto context = storage_.get(state_key);
    if (!context || !context->state.completed) {
      return std::nullopt;
    }
    return context->state;
  }

  std::vector<std::string> interview_ids() const override { return registry_.ids(); }

private:
  InterviewContext load(const std::string& state_key) {
    auto context = storage_.get(state_key);
    if (!context) {
      throw NotFoundError("Engine: unknown state key '" + state_key + "'");
    }
    return *context;
  }

  const InterviewRegistry& registry_;
  StorageService& storage_;
};

std::unique_ptr<InterviewEngine> make_engine(const InterviewRegistry& registry,
                                             StorageService& storage) {
  return std::make_unique<InterviewEngineImpl>(registry, storage);
}

} // namespace interview
