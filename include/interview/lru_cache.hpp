#pragma once

#include <cstddef>
#include <list>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <utility>

namespace interview {

/**
 * Size-bounded least-recently-used map from source text to an immutable
 * compiled value. Safe to share between threads; values are never replaced
 * once inserted, so two threads racing on the same key only duplicate work.
 */
template <typename Value>
class LruCache {
public:
  explicit LruCache(std::size_t capacity) : capacity_(capacity == 0 ? 1 : capacity) {}

  std::optional<Value> find(const std::string& key) {
    std::scoped_lock guard(mutex_);
    auto it = index_.find(key);
    if (it == index_.end()) {
      return std::nullopt;
    }
    entries_.splice(entries_.begin(), entries_, it->second);
    return it->second->second;
  }

  // Inserts `value` unless the key is already present; returns the cached value.
  Value insert(const std::string& key, Value value) {
    std::scoped_lock guard(mutex_);
    auto it = index_.find(key);
    if (it != index_.end()) {
      entries_.splice(entries_.begin(), entries_, it->second);
      return it->second->second;
    }
    entries_.emplace_front(key, std::move(value));
    index_[key] = entries_.begin();
    while (entries_.size() > capacity_) {
      index_.erase(entries_.back().first);
      entries_.pop_back();
    }
    return entries_.front().second;
  }

  template <typename Make>
  Value get_or_create(const std::string& key, Make&& make) {
    if (auto cached = find(key)) {
      return *cached;
    }
    return insert(key, make());
  }

  std::size_t size() const {
    std::scoped_lock guard(mutex_);
    return entries_.size();
  }

  std::size_t capacity() const { return capacity_; }

private:
  using Entry = std::pair<std::string, Value>;

  std::size_t capacity_;
  mutable std::mutex mutex_;
  std::list<Entry> entries_;
  std::unordered_map<std::string, typename std::list<Entry>::iterator> index_;
};

} // namespace interview
