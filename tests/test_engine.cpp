#include "interview/config.hpp"
#include "interview/errors.hpp"
#include "interview/interview_engine.hpp"
#include "interview/storage.hpp"

#include "json_bridge.hpp"

#include <algorithm>
#include <chrono>
#include <cstdlib>
#include <iostream>
#include <set>
#include <string>
#include <variant>
#include <vector>

#include <nlohmann/json.hpp>

#ifndef INTERVIEW_TEST_CONFIG_DIR
#define INTERVIEW_TEST_CONFIG_DIR "tests/config"
#endif

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

template <typename Error, typename Fn>
bool throws(Fn&& fn) {
  try {
    fn();
  } catch (const Error&) {
    return true;
  }
  return false;
}

const std::string kConfigFile = std::string(INTERVIEW_TEST_CONFIG_DIR) + "/interviews.json";

std::string question_title(const interview::InterviewResponse& response) {
  if (!response.content) {
    return "";
  }
  const auto* ask = std::get_if<interview::AskResult>(&*response.content);
  return ask ? ask->question.title : "";
}

void test_config_loading(TestSuite& suite) {
  interview::Environment env;
  interview::InterviewRegistry registry;
  interview::load_config_file(kConfigFile, env, registry);

  suite.require(registry.ids() == std::vector<std::string>({"registration", "upgrade"}),
                "inline and file-referenced interviews are loaded");
  auto registration = registry.find("registration");
  suite.require(registration && registration->find_question("name") != nullptr,
                "question files are resolved relative to the config");
  suite.require(registration && registration->find_question("name")->fields.size() == 3,
                "questions from files keep their fields");
  suite.require(registration && registration->title == std::string("Registration"),
                "interview title is loaded");
  suite.require(registry.find("missing") == nullptr, "unknown ids are absent");

  auto duplicate = interview::bridge::ScriptJson::parse(R"({
    "interviews": [{"id": "dup", "steps": []}, {"id": "dup", "steps": []}]
  })");
  suite.require(throws<interview::ConfigurationError>([&] {
                  interview::InterviewRegistry fresh;
                  interview::load_config(duplicate, INTERVIEW_TEST_CONFIG_DIR, env, fresh);
                }),
                "duplicate interview ids are rejected");
  suite.require(throws<interview::ConfigurationError>([&] {
                  interview::InterviewRegistry fresh;
                  interview::load_config_file(std::string(INTERVIEW_TEST_CONFIG_DIR) + "/nope.json",
                                              env, fresh);
                }),
                "missing config files are rejected");
  suite.require(throws<interview::ConfigurationError>([&] {
                  interview::InterviewRegistry fresh;
                  interview::load_config(interview::bridge::ScriptJson::parse(R"({"items": []})"),
                                         INTERVIEW_TEST_CONFIG_DIR, env, fresh);
                }),
                "documents without an interviews list are rejected");
}

void test_settings(TestSuite& suite) {
  ::unsetenv("INTERVIEW_CONFIG_FILE");
  ::unsetenv("INTERVIEW_CACHE_SIZE");
  ::unsetenv("INTERVIEW_STATE_TTL");
  auto defaults = interview::EngineSettings::from_env();
  suite.require(defaults.config_file == "interviews.json" && defaults.state_ttl.count() == 3600 &&
                    defaults.cache_size == 1024,
                "default settings");

  ::setenv("INTERVIEW_CONFIG_FILE", "other.json", 1);
  ::setenv("INTERVIEW_STATE_TTL", "60", 1);
  ::setenv("INTERVIEW_CACHE_SIZE", "16", 1);
  auto configured = interview::EngineSettings::from_env();
  suite.require(configured.config_file == "other.json" && configured.state_ttl.count() == 60 &&
                    configured.cache_size == 16,
                "settings from the environment");

  ::setenv("INTERVIEW_STATE_TTL", "soon", 1);
  suite.require(throws<interview::ConfigurationError>([] { interview::EngineSettings::from_env(); }),
                "malformed numbers are rejected");
  ::setenv("INTERVIEW_STATE_TTL", "-5", 1);
  suite.require(throws<interview::ConfigurationError>([] { interview::EngineSettings::from_env(); }),
                "negative ttl is rejected");

  ::unsetenv("INTERVIEW_CONFIG_FILE");
  ::unsetenv("INTERVIEW_CACHE_SIZE");
  ::unsetenv("INTERVIEW_STATE_TTL");
}

void test_storage(TestSuite& suite) {
  interview::Environment env;
  interview::InterviewRegistry registry;
  interview::load_config_file(kConfigFile, env, registry);

  auto now = std::chrono::steady_clock::time_point{};
  interview::InMemoryStorage storage(registry, std::chrono::seconds(10), [&now] { return now; });

  interview::InterviewContext context;
  context.interview = registry.find("registration");
  context.state.data = json{{"a", 1}};
  auto key = storage.put(context);
  auto other = storage.put(context);
  suite.require(key.size() == 32 && key.find_first_not_of("0123456789abcdef") == std::string::npos,
                "keys are 32 lowercase hex characters");
  suite.require(key != other, "every put returns a fresh key");

  auto loaded = storage.get(key);
  suite.require(loaded && loaded->interview == context.interview &&
                    loaded->state.data == context.state.data,
                "stored contexts load back");
  suite.require(!storage.get("0123").has_value(), "unknown keys are absent");

  now += std::chrono::seconds(9);
  suite.require(storage.get(key).has_value(), "entries live until their ttl");
  now += std::chrono::seconds(1);
  suite.require(!storage.get(key).has_value(), "expired entries are absent");
  suite.require(storage.size() == 1 && storage.purge_expired() == 1 && storage.size() == 0,
                "purge drops expired entries");

  std::set<std::string> keys;
  bool all_hex = true;
  for (int i = 0; i < 1000; ++i) {
    const auto fresh = storage.put(context);
    all_hex = all_hex && fresh.size() == 32 &&
              fresh.find_first_not_of("0123456789abcdef") == std::string::npos;
    keys.insert(fresh);
  }
  suite.require(all_hex && keys.size() == 1000, "a thousand keys are distinct hex strings");

  interview::InMemoryStorage abandoned(registry, std::chrono::seconds(10), [&now] { return now; });
  std::size_t largest = 0;
  for (int i = 0; i < 1000; ++i) {
    abandoned.put(context);
    now += std::chrono::seconds(11);
    largest = std::max(largest, abandoned.size());
  }
  suite.require(largest <= 2, "put sweeps expired entries so abandoned sessions do not pile up");

  interview::InterviewRegistry empty;
  interview::InMemoryStorage orphaned(empty);
  auto orphan_key = orphaned.put(context);
  suite.require(!orphaned.get(orphan_key).has_value(),
                "states of unknown interviews are absent");
}

void test_engine_flow(TestSuite& suite) {
  interview::Environment env;
  interview::InterviewRegistry registry;
  interview::load_config_file(kConfigFile, env, registry);
  interview::InMemoryStorage storage(registry);
  auto engine = interview::make_engine(registry, storage);

  suite.require(engine->interview_ids().size() == 2, "engine lists interview ids");

  interview::StartRequest request;
  request.target = std::string("user-1");
  auto started = engine->start_interview("registration", request);
  suite.require(!started.completed && !started.content.has_value(), "start returns only a key");

  auto name = engine->update_interview(started.state, std::nullopt);
  suite.require(question_title(name) == "Your Name", "first question is asked");
  suite.require(name.state != started.state, "updates store under a new key");

  auto email = engine->update_interview(name.state, json{{"field_0", "Ann"}, {"field_1", "Lee"}});
  suite.require(question_title(email) == "Contact for Ann", "titles render collected data");

  auto age = engine->update_interview(email.state, json{{"field_0", "ann@example.com"}});
  suite.require(question_title(age) == "Age", "conditional question is asked");

  suite.require(throws<interview::ValidationError>(
                    [&] { engine->update_interview(age.state, json{{"field_0", 12.5}}); }),
                "invalid answers are rejected");
  suite.require(throws<interview::ValidationError>(
                    [&] { engine->update_interview(age.state, json::array()); }),
                "responses must be an object");

  auto young = engine->update_interview(age.state, json{{"field_0", 10}});
  const auto* ended = young.content ? std::get_if<interview::ExitResult>(&*young.content) : nullptr;
  suite.require(ended && ended->title == "Too young to register", "exit step ends the interview");
  suite.require(!young.completed, "exit is not completion");
  suite.require(!engine->get_completed_interview(young.state).has_value(),
                "exited interviews are not completed");

  auto adult = engine->update_interview(age.state, json{{"field_0", 30}});
  suite.require(adult.completed && !adult.content.has_value(), "interview completes");
  auto completed = engine->get_completed_interview(adult.state);
  suite.require(completed && completed->target == std::string("user-1"),
                "completed interview keeps its target");
  suite.require(completed && completed->data["display_name"] == "Ann" &&
                    completed->data["checked_in"] == false &&
                    completed->data["registration"]["email"] == "ann@example.com",
                "completed interview holds the collected data");
  suite.require(!engine->get_completed_interview(age.state).has_value(),
                "unfinished interviews are not completed");

  auto wire = interview::bridge::to_json(name);
  suite.require(wire["content"]["type"] == "question" && wire["content"]["schema"]["type"] == "object",
                "question wire shape");
  auto exit_wire = interview::bridge::to_json(young);
  suite.require(exit_wire["content"] == json::parse(R"({
                  "type": "exit", "title": "Too young to register",
                  "description": "You must be 13 or older."})"),
                "exit wire shape");

  suite.require(throws<interview::NotFoundError>(
                    [&] { engine->start_interview("missing", interview::StartRequest{}); }),
                "unknown interview ids are not found");
  suite.require(throws<interview::NotFoundError>(
                    [&] { engine->update_interview("feedface", std::nullopt); }),
                "unknown state keys are not found");
}

void test_upgrade_flow(TestSuite& suite) {
  interview::Environment env;
  interview::InterviewRegistry registry;
  interview::load_config_file(kConfigFile, env, registry);
  interview::InMemoryStorage storage(registry);
  auto engine = interview::make_engine(registry, storage);

  auto request = interview::bridge::start_request_from_json(
      json::parse(R"({"data": {"registration": {"options": ["basic"]}}})"));
  auto started = engine->start_interview("upgrade", request);
  auto asked = engine->update_interview(started.state, std::nullopt);
  const auto* ask = asked.content ? std::get_if<interview::AskResult>(&*asked.content) : nullptr;
  suite.require(ask && ask->question.schema["properties"]["field_0"]["default"] == "1",
                "default option is preselected");

  auto done = engine->update_interview(asked.state, json{{"field_0", "1"}});
  auto state = engine->get_completed_interview(done.state);
  suite.require(state && state->data["registration"]["options"] == json::array({"basic", "sponsor"}),
                "chosen level is appended once");

  auto again = engine->update_interview(done.state, std::nullopt);
  state = engine->get_completed_interview(again.state);
  suite.require(state && state->data["registration"]["options"] == json::array({"basic", "sponsor"}),
                "replaying does not append twice");

  suite.require(throws<interview::ValidationError>([] {
                  interview::bridge::start_request_from_json(json{{"data", 3}});
                }),
                "start request data must be an object");
}

} // namespace

int main() {
  TestSuite suite;

  test_config_loading(suite);
  test_settings(suite);
  test_storage(suite);
  test_engine_flow(suite);
  test_upgrade_flow(suite);

  if (!suite.ok) {
    std::cerr << "Engine tests FAILED" << std::endl;
    return 1;
  }

  std::cout << "Engine tests passed" << std::endl;
  return 0;
}
