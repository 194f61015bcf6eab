#pragma once

#include <chrono>
#include <functional>
#include <list>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

namespace conductor::session {

/// Composed prompts keyed by `agent:sha256(query)`. Bounded by capacity with
/// least-recently-used eviction; entries older than the TTL read as misses.
/// Safe for concurrent use.
class SessionCache {
public:
  using Clock = std::function<std::chrono::steady_clock::time_point()>;

  /// A zero `ttl` disables expiry. `capacity` is at least 1.
  SessionCache(std::size_t capacity, std::chrono::seconds ttl, Clock clock = {});

  [[nodiscard]] std::optional<std::string> get(const std::string &key);
  void put(const std::string &key, std::string value);
  void clear();
  [[nodiscard]] std::size_t size() const;
  [[nodiscard]] std::size_t capacity() const { return capacity_; }

  [[nodiscard]] static std::string make_key(const std::string &agent, const std::string &query);

private:
  struct Entry {
    std::string key;
    std::string value;
    std::chrono::steady_clock::time_point stored_at;
  };

  [[nodiscard]] std::chrono::steady_clock::time_point now() const;
  [[nodiscard]] bool expired(const Entry &entry) const;

  std::size_t capacity_;
  std::chrono::seconds ttl_;
  Clock clock_;
  mutable std::mutex mutex_;
  /// Most recently used first.
  std::list<Entry> order_;
  std::unordered_map<std::string, std::list<Entry>::iterator> index_;
};

} // namespace conductor::session
