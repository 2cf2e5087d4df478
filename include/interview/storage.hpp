#pragma once

#include "config.hpp"
#include "interview.hpp"

#include <chrono>
#include <cstddef>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

namespace interview {

// Persists interview contexts under opaque keys.
class StorageService {
public:
  virtual ~StorageService() = default;

  // Stores a snapshot and returns a fresh key.
  virtual std::string put(const InterviewContext& context) = 0;

  // Absent when the key is unknown, expired, or names an interview that no
  // longer exists.
  virtual std::optional<InterviewContext> get(const std::string& key) = 0;
};

class InMemoryStorage : public StorageService {
public:
  using Clock = std::function<std::chrono::steady_clock::time_point()>;

  InMemoryStorage(const InterviewRegistry& registry,
                  std::chrono::seconds ttl = std::chrono::seconds(3600),
                  Clock clock = [] { return std::chrono::steady_clock::now(); });

  std::string put(const InterviewContext& context) override;
  std::optional<InterviewContext> get(const std::string& key) override;

  // Drops expired entries; returns how many were removed. put() also sweeps
  // at most once per ttl, so abandoned sessions do not accumulate.
  std::size_t purge_expired();
  std::size_t size() const;

private:
  struct Entry {
    std::string payload;
    std::chrono::steady_clock::time_point expires_at;
  };

  // Caller holds mutex_.
  std::size_t erase_expired(std::chrono::steady_clock::time_point now);

  const InterviewRegistry& registry_;
  std::chrono::seconds ttl_;
  Clock clock_;
  mutable std::mutex mutex_;
  std::unordered_map<std::string, Entry> entries_;
  std::chrono::steady_clock::time_point next_sweep_{};
};

} // namespace interview
