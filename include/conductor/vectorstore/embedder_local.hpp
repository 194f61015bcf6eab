#pragma once

#include "conductor/vectorstore/embedder.hpp"

namespace conductor::vectorstore {

/// Offline feature-hashing embedder: lowercase word unigrams plus character
/// trigrams, signed-hashed into `dimensions` buckets and L2-normalised.
/// Texts that differ only in case or punctuation embed identically.
class LocalEmbedder final : public IEmbedder {
public:
  explicit LocalEmbedder(std::size_t dimensions = 384);

  [[nodiscard]] std::string_view name() const override;
  [[nodiscard]] common::Result<std::vector<float>> embed(std::string_view text) override;
  [[nodiscard]] std::size_t dimensions() const override;

private:
  std::size_t dimensions_;
};

} // namespace conductor::vectorstore
