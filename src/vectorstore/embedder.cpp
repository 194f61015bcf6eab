#include "conductor/vectorstore/embedder.hpp"

#include "conductor/common/fs.hpp"
#include "conductor/vectorstore/embedder_local.hpp"
#include "conductor/vectorstore/embedder_noop.hpp"
#include "conductor/vectorstore/embedder_openai.hpp"

#include <cstdlib>

namespace conductor::vectorstore {

common::Result<std::vector<std::vector<float>>>
IEmbedder::embed_batch(const std::vector<std::string> &texts) {
  std::vector<std::vector<float>> out;
  out.reserve(texts.size());
  for (const auto &text : texts) {
    auto embedded = embed(text);
    if (!embedded.ok()) {
      return common::Result<std::vector<std::vector<float>>>::failure(embedded.status());
    }
    out.push_back(std::move(embedded.value()));
  }
  return common::Result<std::vector<std::vector<float>>>::success(std::move(out));
}

common::Result<std::unique_ptr<IEmbedder>> create_embedder(const config::Config &config) {
  const auto &store = config.vector_store;
  const std::string provider = common::to_lower(common::trim(store.embedding_provider));
  const auto dims = static_cast<std::size_t>(store.embedding_dimensions);

  if (provider.empty() || provider == "local") {
    return common::Result<std::unique_ptr<IEmbedder>>::success(
        std::make_unique<LocalEmbedder>(dims));
  }
  if (provider == "noop" || provider == "none") {
    return common::Result<std::unique_ptr<IEmbedder>>::success(
        std::make_unique<NoopEmbedder>(dims));
  }

  std::string api_key = config.api_key.value_or("");
  if (api_key.empty()) {
    if (const char *env = std::getenv("OPENAI_API_KEY"); env != nullptr) {
      api_key = env;
    }
  }
  if (provider == "openai") {
    return common::Result<std::unique_ptr<IEmbedder>>::success(
        std::make_unique<OpenAiEmbedder>(api_key, store.embedding_model, dims));
  }
  if (common::starts_with(provider, "custom:")) {
    const std::string url = common::trim(common::trim(store.embedding_provider).substr(7));
    return common::Result<std::unique_ptr<IEmbedder>>::success(
        std::make_unique<OpenAiEmbedder>(api_key, store.embedding_model, dims, url));
  }
  return common::Result<std::unique_ptr<IEmbedder>>::failure(
      "Unknown embedding provider: " + store.embedding_provider, common::ErrorKind::Validation);
}

} // namespace conductor::vectorstore
