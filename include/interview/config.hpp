#pragma once

#include "interview.hpp"
#include "logic.hpp"

#include <chrono>
#include <cstddef>
#include <map>
#include <memory>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace interview {

struct EngineSettings {
  std::string config_file = "interviews.json";
  std::chrono::seconds state_ttl{3600};
  std::size_t cache_size = Environment::kDefaultCacheSize;

  // INTERVIEW_CONFIG_FILE, INTERVIEW_STATE_TTL, INTERVIEW_CACHE_SIZE.
  // Throws ConfigurationError on malformed numbers.
  static EngineSettings from_env();
};

// Loaded interviews by id.
class InterviewRegistry {
public:
  // Throws ConfigurationError on a duplicate id.
  void add(std::shared_ptr<const Interview> interview);

  std::shared_ptr<const Interview> find(const std::string& interview_id) const;
  std::vector<std::string> ids() const;
  std::size_t size() const { return interviews_.size(); }

private:
  std::map<std::string, std::shared_ptr<const Interview>> interviews_;
};

/**
 * Reads `{"interviews": [...]}`. Entries are interview objects or paths to
 * JSON files holding one; question entries may likewise be paths to a file
 * holding a question or a list of questions. Relative paths resolve against
 * the directory of the file that names them (`base_dir` for `document`).
 */
void load_config(const nlohmann::ordered_json& document, const std::string& base_dir,
                 Environment& env, InterviewRegistry& registry);

void load_config_file(const std::string& path, Environment& env, InterviewRegistry& registry);

} // namespace interview
