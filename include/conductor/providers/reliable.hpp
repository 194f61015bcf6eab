#pragma once

#include "conductor/providers/traits.hpp"

#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <random>
#include <vector>

namespace conductor::providers {

/// Retries each provider with exponential backoff plus random jitter, then
/// moves down the fallback list. Validation-kind failures (bad key, unknown
/// model) skip the remaining retries for that provider.
class ReliableProvider final : public Provider {
public:
  using Sleeper = std::function<void(std::chrono::milliseconds)>;

  ReliableProvider(std::shared_ptr<Provider> primary, std::vector<std::shared_ptr<Provider>> fallbacks,
                   std::uint32_t max_retries, std::uint64_t backoff_ms, Sleeper sleeper = {});

  [[nodiscard]] common::Result<std::string> chat(const ChatRequest &request) override;
  [[nodiscard]] std::string name() const override;

  /// Delay before retry number `attempt` (0-based): backoff * 2^attempt plus
  /// up to half of that again.
  [[nodiscard]] std::chrono::milliseconds backoff_for(std::uint32_t attempt);

private:
  [[nodiscard]] common::Result<std::string>
  execute_with_provider(const std::shared_ptr<Provider> &provider, const ChatRequest &request);

  std::shared_ptr<Provider> primary_;
  std::vector<std::shared_ptr<Provider>> fallbacks_;
  std::uint32_t max_retries_;
  std::uint64_t backoff_ms_;
  Sleeper sleeper_;
  std::mutex rng_mutex_;
  std::mt19937_64 rng_;
};

} // namespace conductor::providers
