#include "conductor/providers/factory.hpp"

#include "conductor/common/fs.hpp"
#include "conductor/observability/global.hpp"
#include "conductor/providers/compatible.hpp"
#include "conductor/providers/reliable.hpp"

#include <cctype>
#include <cstdlib>
#include <unordered_map>

namespace conductor::providers {

namespace {

struct CompatibleRoute {
  std::string base_url;
  const char *api_key_env = nullptr;
  bool require_api_key = true;
};

const std::unordered_map<std::string, CompatibleRoute> &compatible_routes() {
  static const std::unordered_map<std::string, CompatibleRoute> routes = {
      {"openai", {"https://api.openai.com/v1", "OPENAI_API_KEY", true}},
      {"openrouter", {"https://openrouter.ai/api/v1", "OPENROUTER_API_KEY", true}},
      {"groq", {"https://api.groq.com/openai/v1", "GROQ_API_KEY", true}},
      {"together", {"https://api.together.xyz/v1", "TOGETHER_API_KEY", true}},
      {"mistral", {"https://api.mistral.ai/v1", "MISTRAL_API_KEY", true}},
      {"deepseek", {"https://api.deepseek.com/v1", "DEEPSEEK_API_KEY", true}},
      {"fireworks", {"https://api.fireworks.ai/inference/v1", "FIREWORKS_API_KEY", true}},
      {"ollama", {"http://127.0.0.1:11434/v1", "OLLAMA_API_KEY", false}},
  };
  return routes;
}

std::optional<std::string> read_env(const std::string &name) {
  const char *value = std::getenv(name.c_str());
  if (value == nullptr) {
    return std::nullopt;
  }
  std::string trimmed = common::trim(value);
  if (trimmed.empty()) {
    return std::nullopt;
  }
  return trimmed;
}

std::string provider_env_prefix(const std::string &provider) {
  std::string prefix;
  for (const char ch : provider) {
    prefix.push_back(std::isalnum(static_cast<unsigned char>(ch)) != 0
                         ? static_cast<char>(std::toupper(static_cast<unsigned char>(ch)))
                         : '_');
  }
  return prefix;
}

// `<NAME>_BASE_URL` and `CONDUCTOR_<NAME>_BASE_URL` redirect a known provider.
std::string resolve_base_url(const std::string &provider, const std::string &default_base_url) {
  const std::string prefix = provider_env_prefix(provider);
  if (auto local = read_env(prefix + "_BASE_URL"); local.has_value()) {
    return *local;
  }
  if (auto global = read_env("CONDUCTOR_" + prefix + "_BASE_URL"); global.has_value()) {
    return *global;
  }
  return default_base_url;
}

std::optional<std::string> resolve_api_key(const CompatibleRoute &route,
                                           const std::optional<std::string> &api_key) {
  if (api_key.has_value() && !common::trim(*api_key).empty()) {
    return common::trim(*api_key);
  }
  if (route.api_key_env != nullptr) {
    return read_env(route.api_key_env);
  }
  return std::nullopt;
}

} // namespace

common::Result<std::shared_ptr<Provider>>
create_provider(const std::string &name, const std::optional<std::string> &api_key,
                std::shared_ptr<HttpClient> http_client) {
  const std::string trimmed = common::trim(name);
  const std::string normalized = common::to_lower(trimmed);

  if (const auto it = compatible_routes().find(normalized); it != compatible_routes().end()) {
    const auto &route = it->second;
    return common::Result<std::shared_ptr<Provider>>::success(std::make_shared<CompatibleProvider>(
        normalized, resolve_base_url(normalized, route.base_url),
        resolve_api_key(route, api_key).value_or(""), std::move(http_client),
        route.require_api_key));
  }

  if (common::starts_with(normalized, "custom:")) {
    const std::string url = common::trim(trimmed.substr(7));
    if (!common::starts_with(url, "http://") && !common::starts_with(url, "https://")) {
      return common::Result<std::shared_ptr<Provider>>::failure(
          "Custom provider requires URL format custom:https://...", common::ErrorKind::Validation);
    }
    const CompatibleRoute route{.base_url = url};
    return common::Result<std::shared_ptr<Provider>>::success(std::make_shared<CompatibleProvider>(
        "custom", url, resolve_api_key(route, api_key).value_or(""), std::move(http_client),
        false));
  }

  return common::Result<std::shared_ptr<Provider>>::failure("Unknown provider: " + name,
                                                            common::ErrorKind::Validation);
}

common::Result<std::shared_ptr<Provider>>
create_reliable_provider(const config::Config &config, std::shared_ptr<HttpClient> http_client) {
  auto primary = create_provider(config.default_provider, config.api_key, http_client);
  if (!primary.ok()) {
    return primary;
  }

  std::vector<std::shared_ptr<Provider>> fallbacks;
  const std::string primary_id = common::to_lower(common::trim(config.default_provider));
  for (const auto &fallback_name : config.reliability.fallback_providers) {
    if (common::to_lower(common::trim(fallback_name)) == primary_id) {
      continue;
    }
    auto fallback = create_provider(fallback_name, std::nullopt, http_client);
    if (!fallback.ok()) {
      observability::record_warning("providers", "skipping fallback: " + fallback.error());
      continue;
    }
    fallbacks.push_back(fallback.value());
  }

  return common::Result<std::shared_ptr<Provider>>::success(std::make_shared<ReliableProvider>(
      primary.value(), std::move(fallbacks), config.reliability.provider_retries,
      config.reliability.provider_backoff_ms));
}

} // namespace conductor::providers
