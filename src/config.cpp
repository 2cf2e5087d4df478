#include "interview/config.hpp"

#include "interview/errors.hpp"
#include "json_bridge.hpp"
#include "log.hpp"

#include <cerrno>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <utility>

namespace interview {
namespace {

namespace fs = std::filesystem;
using bridge::ScriptJson;

long long env_integer(const char* name, long long fallback) {
  const char* raw = std::getenv(name);
  if (!raw || *raw == '\0') {
    return fallback;
  }
  errno = 0;
  char* end = nullptr;
  const long long value = std::strtoll(raw, &end, 10);
  if (errno != 0 || *end != '\0' || value <= 0) {
    throw ConfigurationError(std::string("Settings: ") + name + " must be a positive integer, got '" +
                             raw + "'");
  }
  return value;
}

fs::path resolve_path(const fs::path& base_dir, const std::string& entry) {
  fs::path path(entry);
  if (path.is_absolute()) {
    return path;
  }
  return base_dir / path;
}

ScriptJson read_json_file(const fs::path& path) {
  if (!fs::exists(path)) {
    throw ConfigurationError("Config: file not found: " + path.string());
  }
  std::ifstream stream(path);
  if (!stream) {
    throw ConfigurationError("Config: failed to open " + path.string());
  }
  std::string content((std::istreambuf_iterator<char>(stream)), std::istreambuf_iterator<char>());
  try {
    return ScriptJson::parse(content);
  } catch (const nlohmann::json::parse_error& ex) {
    throw ConfigurationError("Config: " + path.string() + ": " + ex.what());
  }
}

// Replaces question path entries with the question objects they hold.
ScriptJson resolve_questions(const ScriptJson& questions, const fs::path& base_dir) {
  if (!questions.is_array()) {
    return questions;
  }
  ScriptJson resolved = ScriptJson::array();
  for (const auto& entry : questions) {
    if (!entry.is_string()) {
      resolved.push_back(entry);
      continue;
    }
    const auto path = resolve_path(base_dir, entry.get<std::string>());
    debug_log("interview", "loading questions from " + path.string());
    auto loaded = read_json_file(path);
    if (loaded.is_array()) {
      for (auto& question : loaded) {
        resolved.push_back(std::move(question));
      }
    } else {
      resolved.push_back(std::move(loaded));
    }
  }
  return resolved;
}

void load_interview(ScriptJson document, const fs::path& base_dir, Environment& env,
                    InterviewRegistry& registry) {
  if (document.is_object() && document.contains("questions")) {
    document["questions"] = resolve_questions(document["questions"], base_dir);
  }
  auto interview = bridge::interview_from_json(document, env);
  debug_log("interview", "loaded interview '" + interview->id + "' (" +
                             std::to_string(interview->questions.size()) + " questions, " +
                             std::to_string(interview->steps.size()) + " steps)");
  registry.add(std::move(interview));
}

} // namespace

EngineSettings EngineSettings::from_env() {
  EngineSettings settings;
  if (const char* file = std::getenv("INTERVIEW_CONFIG_FILE"); file && *file != '\0') {
    settings.config_file = file;
  }
  settings.state_ttl = std::chrono::seconds(
      env_integer("INTERVIEW_STATE_TTL", static_cast<long long>(settings.state_ttl.count())));
  settings.cache_size = static_cast<std::size_t>(
      env_integer("INTERVIEW_CACHE_SIZE", static_cast<long long>(settings.cache_size)));
  return settings;
}

void InterviewRegistry::add(std::shared_ptr<const Interview> interview) {
  if (!interview) {
    throw ConfigurationError("Config: null interview");
  }
  const auto id = interview->id;
  if (!interviews_.emplace(id, std::move(interview)).second) {
    throw ConfigurationError("Config: duplicate interview id '" + id + "'");
  }
}

std::shared_ptr<const Interview> InterviewRegistry::find(const std::string& interview_id) const {
  auto it = interviews_.find(interview_id);
  if (it == interviews_.end()) {
    return nullptr;
  }
  return it->second;
}

std::vector<std::string> InterviewRegistry::ids() const {
  std::vector<std::string> out;
  out.reserve(interviews_.size());
  for (const auto& entry : interviews_) {
    out.push_back(entry.first);
  }
  return out;
}

void load_config(const nlohmann::ordered_json& document, const std::string& base_dir,
                 Environment& env, InterviewRegistry& registry) {
  if (!document.is_object() || !document.contains("interviews") ||
      !document["interviews"].is_array()) {
    throw ConfigurationError("Config: expected {\"interviews\": [...]}");
  }
  const fs::path base(base_dir);
  for (const auto& entry : document["interviews"]) {
    if (entry.is_string()) {
      const auto path = resolve_path(base, entry.get<std::string>());
      debug_log("interview", "loading interview from " + path.string());
      load_interview(read_json_file(path), path.parent_path(), env, registry);
    } else {
      load_interview(entry, base, env, registry);
    }
  }
}

void load_config_file(const std::string& path, Environment& env, InterviewRegistry& registry) {
  const fs::path config_path(path);
  debug_log("interview", "loading config " + config_path.string());
  load_config(read_json_file(config_path), config_path.parent_path().string(), env, registry);
}

} // namespace interview
