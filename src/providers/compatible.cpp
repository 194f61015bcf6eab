#include "conductor/providers/compatible.hpp"

#include "conductor/common/fs.hpp"

#include <charconv>

namespace conductor::providers {

namespace {

// Auth and model errors are configuration problems; everything else is worth
// a retry upstream.
common::Result<std::string> provider_error_result(const ProviderError &error) {
  return common::Result<std::string>::failure(
      error.to_string(), error.retryable() ? common::ErrorKind::Upstream
                                           : common::ErrorKind::Validation);
}

std::optional<std::uint64_t> parse_retry_after(const std::string &value) {
  const std::string trimmed = common::trim(value);
  std::uint64_t seconds = 0;
  const auto [ptr, ec] = std::from_chars(trimmed.data(), trimmed.data() + trimmed.size(), seconds);
  if (ec != std::errc() || ptr != trimmed.data() + trimmed.size()) {
    return std::nullopt;
  }
  return seconds;
}

} // namespace

CompatibleProvider::CompatibleProvider(std::string name, std::string base_url, std::string api_key,
                                       std::shared_ptr<HttpClient> http_client,
                                       const bool require_api_key,
                                       std::unordered_map<std::string, std::string> extra_headers)
    : name_(std::move(name)), base_url_(std::move(base_url)), api_key_(std::move(api_key)),
      http_client_(std::move(http_client)), require_api_key_(require_api_key),
      extra_headers_(std::move(extra_headers)) {
  while (!base_url_.empty() && base_url_.back() == '/') {
    base_url_.pop_back();
  }
}

std::unordered_map<std::string, std::string> CompatibleProvider::request_headers() const {
  std::unordered_map<std::string, std::string> headers = {{"Content-Type", "application/json"}};
  if (!api_key_.empty()) {
    headers["Authorization"] = "Bearer " + api_key_;
  }
  for (const auto &[key, value] : extra_headers_) {
    headers[key] = value;
  }
  return headers;
}

std::optional<ProviderError>
CompatibleProvider::classify_response_status(const HttpResponse &response) {
  if (response.timeout) {
    return ProviderError{.code = ProviderErrorCode::Timeout, .message = "request timed out"};
  }
  if (response.network_error) {
    return ProviderError{.code = ProviderErrorCode::NetworkError,
                         .message = response.network_error_message};
  }
  if (response.status == 401 || response.status == 403) {
    return ProviderError{
        .code = ProviderErrorCode::AuthError, .status = response.status, .message = response.body};
  }
  if (response.status == 404) {
    return ProviderError{.code = ProviderErrorCode::ModelNotFound,
                         .status = response.status,
                         .message = response.body};
  }
  if (response.status == 429) {
    ProviderError error{.code = ProviderErrorCode::RateLimitError,
                        .status = response.status,
                        .message = response.body};
    if (const auto it = response.headers.find("retry-after"); it != response.headers.end()) {
      error.retry_after = parse_retry_after(it->second);
    }
    return error;
  }
  if (response.status < 200 || response.status >= 300) {
    return ProviderError{
        .code = ProviderErrorCode::ApiError, .status = response.status, .message = response.body};
  }
  return std::nullopt;
}

common::Result<std::string> CompatibleProvider::chat(const ChatRequest &request) {
  if (require_api_key_ && api_key_.empty()) {
    return provider_error_result(
        {.code = ProviderErrorCode::AuthError, .message = "missing API key"});
  }
  if (request.messages.empty()) {
    return provider_error_result(
        {.code = ProviderErrorCode::InvalidResponse, .message = "no messages to send"});
  }

  const auto response = http_client_->post_json(base_url_ + "/chat/completions",
                                                request_headers(), build_chat_body(request),
                                                request.timeout_ms);
  if (auto error = classify_response_status(response); error.has_value()) {
    return provider_error_result(*error);
  }

  auto parsed = parse_openai_content(response.body);
  if (!parsed.ok()) {
    return provider_error_result(
        {.code = ProviderErrorCode::InvalidResponse, .message = parsed.error()});
  }
  return parsed;
}

std::string CompatibleProvider::name() const { return name_; }

} // namespace conductor::providers
