#pragma once

#include "conductor/providers/traits.hpp"
#include "conductor/vectorstore/embedder.hpp"

#include <memory>

namespace conductor::vectorstore {

/// Client for an OpenAI-style `/embeddings` endpoint.
class OpenAiEmbedder final : public IEmbedder {
public:
  OpenAiEmbedder(std::string api_key, std::string model, std::size_t dimensions,
                 std::string base_url = "https://api.openai.com/v1",
                 std::shared_ptr<providers::HttpClient> http_client =
                     std::make_shared<providers::CurlHttpClient>());

  [[nodiscard]] std::string_view name() const override;
  [[nodiscard]] common::Result<std::vector<float>> embed(std::string_view text) override;
  [[nodiscard]] common::Result<std::vector<std::vector<float>>>
  embed_batch(const std::vector<std::string> &texts) override;
  [[nodiscard]] std::size_t dimensions() const override;

private:
  [[nodiscard]] common::Result<std::string> post(const std::string &input_json);

  std::string api_key_;
  std::string model_;
  std::string name_;
  std::size_t dimensions_;
  std::string base_url_;
  std::shared_ptr<providers::HttpClient> http_client_;
};

/// Parse every `embedding` array of an embeddings response, in `index` order.
[[nodiscard]] common::Result<std::vector<std::vector<float>>>
parse_embedding_response(const std::string &body);

} // namespace conductor::vectorstore
