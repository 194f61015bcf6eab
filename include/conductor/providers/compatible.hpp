#pragma once

#include "conductor/providers/traits.hpp"

#include <memory>
#include <string>
#include <unordered_map>

namespace conductor::providers {

/// Any endpoint speaking the OpenAI `/chat/completions` protocol.
class CompatibleProvider : public Provider {
public:
  CompatibleProvider(std::string name, std::string base_url, std::string api_key,
                     std::shared_ptr<HttpClient> http_client = std::make_shared<CurlHttpClient>(),
                     bool require_api_key = true,
                     std::unordered_map<std::string, std::string> extra_headers = {});

  [[nodiscard]] common::Result<std::string> chat(const ChatRequest &request) override;
  [[nodiscard]] std::string name() const override;

  [[nodiscard]] const std::string &base_url() const { return base_url_; }

private:
  [[nodiscard]] std::unordered_map<std::string, std::string> request_headers() const;
  [[nodiscard]] static std::optional<ProviderError>
  classify_response_status(const HttpResponse &response);

  std::string name_;
  std::string base_url_;
  std::string api_key_;
  std::shared_ptr<HttpClient> http_client_;
  bool require_api_key_ = true;
  std::unordered_map<std::string, std::string> extra_headers_;
};

} // namespace conductor::providers
