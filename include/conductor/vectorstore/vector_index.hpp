#pragma once

#include "conductor/common/result.hpp"

#include <string>
#include <unordered_map>
#include <vector>

namespace conductor::vectorstore {

struct VectorSearchResult {
  std::string key;
  /// Cosine distance, `1 - cosine_similarity`, in [0, 2].
  float distance = 0.0F;
};

/// Exact (brute force) cosine nearest-neighbour index over one collection.
/// Not synchronised; the owning store serialises access.
class VectorIndex {
public:
  explicit VectorIndex(std::size_t dimensions);

  [[nodiscard]] common::Status add(const std::string &key, const std::vector<float> &embedding);

  /// Nearest first; ties break on key so results are reproducible.
  [[nodiscard]] common::Result<std::vector<VectorSearchResult>>
  search(const std::vector<float> &query, std::size_t limit) const;

  [[nodiscard]] std::size_t size() const;
  [[nodiscard]] bool contains(const std::string &key) const;
  [[nodiscard]] std::size_t dimensions() const { return dimensions_; }

private:
  std::size_t dimensions_;
  std::unordered_map<std::string, std::vector<float>> vectors_;
};

[[nodiscard]] float cosine_similarity(const std::vector<float> &a, const std::vector<float> &b);

} // namespace conductor::vectorstore
