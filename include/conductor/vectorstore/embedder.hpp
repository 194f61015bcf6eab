#pragma once

#include "conductor/common/result.hpp"
#include "conductor/config/schema.hpp"

#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace conductor::vectorstore {

/// Deterministic text -> fixed-dimension vector mapping used for cosine search.
class IEmbedder {
public:
  virtual ~IEmbedder() = default;

  /// Stable identifier; part of the embedding cache key.
  [[nodiscard]] virtual std::string_view name() const = 0;
  [[nodiscard]] virtual common::Result<std::vector<float>> embed(std::string_view text) = 0;
  [[nodiscard]] virtual common::Result<std::vector<std::vector<float>>>
  embed_batch(const std::vector<std::string> &texts);
  [[nodiscard]] virtual std::size_t dimensions() const = 0;
};

[[nodiscard]] common::Result<std::unique_ptr<IEmbedder>>
create_embedder(const config::Config &config);

} // namespace conductor::vectorstore
