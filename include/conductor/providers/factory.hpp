#pragma once

#include "conductor/common/result.hpp"
#include "conductor/config/schema.hpp"
#include "conductor/providers/traits.hpp"

#include <memory>
#include <optional>
#include <string>

namespace conductor::providers {

/// Build a provider by id (`openai`, `groq`, `ollama`, ... or `custom:<url>`).
/// A missing explicit key falls back to the provider's `<NAME>_API_KEY`.
[[nodiscard]] common::Result<std::shared_ptr<Provider>>
create_provider(const std::string &name, const std::optional<std::string> &api_key,
                std::shared_ptr<HttpClient> http_client = std::make_shared<CurlHttpClient>());

[[nodiscard]] common::Result<std::shared_ptr<Provider>>
create_reliable_provider(const config::Config &config,
                         std::shared_ptr<HttpClient> http_client =
                             std::make_shared<CurlHttpClient>());

} // namespace conductor::providers
