#include "interview/storage.hpp"

#include "interview/errors.hpp"
#include "json_bridge.hpp"
#include "log.hpp"
#include "rng.hpp"

#include <utility>

namespace interview {

InMemoryStorage::InMemoryStorage(const InterviewRegistry& registry, std::chrono::seconds ttl,
                                 Clock clock)
    : registry_(registry), ttl_(ttl), clock_(std::move(clock)) {
  if (ttl_.count() <= 0) {
    throw ConfigurationError("Storage: ttl must be positive");
  }
}

std::string InMemoryStorage::put(const InterviewContext& context) {
  auto payload = bridge::to_json(context).dump();
  const auto now = clock_();
  const auto expires_at = now + ttl_;
  std::scoped_lock guard(mutex_);
  if (now >= next_sweep_) {
    erase_expired(now);
    next_sweep_ = now + ttl_;
  }
  std::string key = random_key();
  while (entries_.count(key) != 0) {
    key = random_key();
  }
  entries_.emplace(key, Entry{std::move(payload), expires_at});
  debug_log("interview", "stored state " + key);
  return key;
}

std::optional<InterviewContext> InMemoryStorage::get(const std::string& key) {
  std::string payload;
  {
    std::scoped_lock guard(mutex_);
    auto it = entries_.find(key);
    if (it == entries_.end()) {
      return std::nullopt;
    }
    if (clock_() >= it->second.expires_at) {
      debug_log("interview", "state " + key + " expired");
      entries_.erase(it);
      return std::nullopt;
    }
    payload = it->second.payload;
  }
  return bridge::interview_context_from_json(
      nlohmann::json::parse(payload),
      [this](const std::string& interview_id) { return registry_.find(interview_id); });
}

std::size_t InMemoryStorage::purge_expired() {
  const auto now = clock_();
  std::scoped_lock guard(mutex_);
  return erase_expired(now);
}

std::size_t InMemoryStorage::erase_expired(std::chrono::steady_clock::time_point now) {
  std::size_t removed = 0;
  for (auto it = entries_.begin(); it != entries_.end();) {
    if (now >= it->second.expires_at) {
      it = entries_.erase(it);
      ++removed;
    } else {
      ++it;
    }
  }
  if (removed > 0) {
    debug_log("interview", "purged " + std::to_string(removed) + " expired states");
  }
  return removed;
}

std::size_t InMemoryStorage::size() const {
  std::scoped_lock guard(mutex_);
  return entries_.size();
}

} // namespace interview
