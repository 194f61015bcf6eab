#include "conductor/providers/reliable.hpp"

#include "conductor/observability/global.hpp"

#include <algorithm>
#include <thread>

namespace conductor::providers {

ReliableProvider::ReliableProvider(std::shared_ptr<Provider> primary,
                                   std::vector<std::shared_ptr<Provider>> fallbacks,
                                   const std::uint32_t max_retries, const std::uint64_t backoff_ms,
                                   Sleeper sleeper)
    : primary_(std::move(primary)), fallbacks_(std::move(fallbacks)), max_retries_(max_retries),
      backoff_ms_(backoff_ms), sleeper_(std::move(sleeper)), rng_(std::random_device{}()) {
  if (!sleeper_) {
    sleeper_ = [](std::chrono::milliseconds delay) { std::this_thread::sleep_for(delay); };
  }
}

std::chrono::milliseconds ReliableProvider::backoff_for(const std::uint32_t attempt) {
  const std::uint64_t base = backoff_ms_ * (1ULL << std::min<std::uint32_t>(attempt, 16));
  if (base == 0) {
    return std::chrono::milliseconds(0);
  }
  std::uniform_int_distribution<std::uint64_t> jitter(0, base / 2);
  std::lock_guard<std::mutex> lock(rng_mutex_);
  return std::chrono::milliseconds(base + jitter(rng_));
}

common::Result<std::string>
ReliableProvider::execute_with_provider(const std::shared_ptr<Provider> &provider,
                                        const ChatRequest &request) {
  auto result = common::Result<std::string>::failure("provider not configured");
  for (std::uint32_t attempt = 0; attempt <= max_retries_; ++attempt) {
    result = provider->chat(request);
    if (result.ok() || result.kind() == common::ErrorKind::Validation) {
      return result;
    }
    if (attempt < max_retries_) {
      observability::record_warning("provider." + provider->name(),
                                    "attempt " + std::to_string(attempt + 1) +
                                        " failed: " + result.error());
      sleeper_(backoff_for(attempt));
    }
  }
  return result;
}

common::Result<std::string> ReliableProvider::chat(const ChatRequest &request) {
  if (!primary_) {
    return common::Result<std::string>::failure("no primary provider configured",
                                                common::ErrorKind::Validation);
  }
  auto result = execute_with_provider(primary_, request);
  for (const auto &fallback : fallbacks_) {
    if (result.ok()) {
      break;
    }
    if (fallback) {
      result = execute_with_provider(fallback, request);
    }
  }
  return result;
}

std::string ReliableProvider::name() const {
  return primary_ ? "reliable(" + primary_->name() + ")" : "reliable";
}

} // namespace conductor::providers
