#include "conductor/session/session_cache.hpp"

#include "conductor/common/hash.hpp"
#include "conductor/observability/global.hpp"

#include <algorithm>

namespace conductor::session {

SessionCache::SessionCache(const std::size_t capacity, const std::chrono::seconds ttl,
                           Clock clock)
    : capacity_(std::max<std::size_t>(1, capacity)), ttl_(ttl), clock_(std::move(clock)) {}

std::string SessionCache::make_key(const std::string &agent, const std::string &query) {
  return agent + ":" + common::sha256_hex(query);
}

std::chrono::steady_clock::time_point SessionCache::now() const {
  return clock_ ? clock_() : std::chrono::steady_clock::now();
}

bool SessionCache::expired(const Entry &entry) const {
  return ttl_.count() > 0 && now() - entry.stored_at >= ttl_;
}

std::optional<std::string> SessionCache::get(const std::string &key) {
  std::lock_guard<std::mutex> lock(mutex_);
  const auto it = index_.find(key);
  if (it == index_.end()) {
    return std::nullopt;
  }
  if (expired(*it->second)) {
    order_.erase(it->second);
    index_.erase(it);
    return std::nullopt;
  }
  order_.splice(order_.begin(), order_, it->second);
  return it->second->value;
}

void SessionCache::put(const std::string &key, std::string value) {
  std::size_t entries = 0;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (const auto it = index_.find(key); it != index_.end()) {
      it->second->value = std::move(value);
      it->second->stored_at = now();
      order_.splice(order_.begin(), order_, it->second);
    } else {
      order_.push_front(Entry{.key = key, .value = std::move(value), .stored_at = now()});
      index_[key] = order_.begin();
      while (order_.size() > capacity_) {
        index_.erase(order_.back().key);
        order_.pop_back();
      }
    }
    entries = order_.size();
  }
  observability::record_metric(observability::SessionCacheSizeMetric{.entries = entries});
}

void SessionCache::clear() {
  std::lock_guard<std::mutex> lock(mutex_);
  order_.clear();
  index_.clear();
}

std::size_t SessionCache::size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return order_.size();
}

} // namespace conductor::session
