#pragma once

#include "conductor/vectorstore/embedder.hpp"

namespace conductor::vectorstore {

/// All-zero vectors. Every cosine similarity is 0, so nothing ever matches.
class NoopEmbedder final : public IEmbedder {
public:
  explicit NoopEmbedder(std::size_t dimensions = 384) : dimensions_(dimensions) {}

  [[nodiscard]] std::string_view name() const override { return "noop"; }
  [[nodiscard]] common::Result<std::vector<float>> embed(std::string_view) override {
    return common::Result<std::vector<float>>::success(std::vector<float>(dimensions_, 0.0F));
  }
  [[nodiscard]] std::size_t dimensions() const override { return dimensions_; }

private:
  std::size_t dimensions_;
};

} // namespace conductor::vectorstore
