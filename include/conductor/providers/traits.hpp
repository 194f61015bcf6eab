#pragma once

#include "conductor/common/result.hpp"

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace conductor::providers {

enum class ProviderErrorCode {
  ApiError,
  NetworkError,
  AuthError,
  RateLimitError,
  ModelNotFound,
  InvalidResponse,
  Timeout,
};

struct ProviderError {
  ProviderErrorCode code = ProviderErrorCode::ApiError;
  std::uint16_t status = 0;
  std::string message;
  std::optional<std::uint64_t> retry_after;

  [[nodiscard]] std::string to_string() const;
  /// Auth and unknown-model failures will not improve on retry.
  [[nodiscard]] bool retryable() const;
};

struct ChatMessage {
  std::string role;
  std::string content;
};

struct ChatRequest {
  std::string model;
  std::vector<ChatMessage> messages;
  double temperature = 0.7;
  std::optional<std::uint32_t> max_tokens;
  /// Ask for `response_format: json_object`.
  bool json_response = false;
  std::uint64_t timeout_ms = 30'000;
};

struct HttpResponse {
  std::uint16_t status = 0;
  std::string body;
  std::unordered_map<std::string, std::string> headers;
  bool timeout = false;
  bool network_error = false;
  std::string network_error_message;
};

class HttpClient {
public:
  virtual ~HttpClient() = default;
  [[nodiscard]] virtual HttpResponse
  post_json(const std::string &url, const std::unordered_map<std::string, std::string> &headers,
            const std::string &body, std::uint64_t timeout_ms) = 0;
};

class CurlHttpClient final : public HttpClient {
public:
  CurlHttpClient();
  ~CurlHttpClient() override;

  [[nodiscard]] HttpResponse
  post_json(const std::string &url, const std::unordered_map<std::string, std::string> &headers,
            const std::string &body, std::uint64_t timeout_ms) override;
};

class Provider {
public:
  virtual ~Provider() = default;

  [[nodiscard]] virtual common::Result<std::string> chat(const ChatRequest &request) = 0;

  [[nodiscard]] virtual common::Result<std::string>
  chat_with_system(const std::optional<std::string> &system_prompt, const std::string &message,
                   const std::string &model, double temperature) {
    ChatRequest request{.model = model, .temperature = temperature};
    if (system_prompt.has_value()) {
      request.messages.push_back({.role = "system", .content = *system_prompt});
    }
    request.messages.push_back({.role = "user", .content = message});
    return chat(request);
  }

  [[nodiscard]] virtual std::string name() const = 0;
};

/// Serialize a chat request into an OpenAI `/chat/completions` body.
[[nodiscard]] std::string build_chat_body(const ChatRequest &request);
[[nodiscard]] common::Result<std::string> parse_openai_content(const std::string &response);

} // namespace conductor::providers
