#include "conductor/vectorstore/vector_index.hpp"

#include <algorithm>
#include <cmath>

namespace conductor::vectorstore {

float cosine_similarity(const std::vector<float> &a, const std::vector<float> &b) {
  if (a.empty() || a.size() != b.size()) {
    return 0.0F;
  }
  double dot = 0.0;
  double norm_a = 0.0;
  double norm_b = 0.0;
  for (std::size_t i = 0; i < a.size(); ++i) {
    dot += static_cast<double>(a[i]) * static_cast<double>(b[i]);
    norm_a += static_cast<double>(a[i]) * static_cast<double>(a[i]);
    norm_b += static_cast<double>(b[i]) * static_cast<double>(b[i]);
  }
  if (norm_a < 1e-12 || norm_b < 1e-12) {
    return 0.0F;
  }
  const double similarity = dot / (std::sqrt(norm_a) * std::sqrt(norm_b));
  return static_cast<float>(std::clamp(similarity, -1.0, 1.0));
}

VectorIndex::VectorIndex(const std::size_t dimensions) : dimensions_(dimensions) {}

common::Status VectorIndex::add(const std::string &key, const std::vector<float> &embedding) {
  if (embedding.size() != dimensions_) {
    return common::Status::error("embedding dimensions mismatch: expected " +
                                     std::to_string(dimensions_) + ", got " +
                                     std::to_string(embedding.size()),
                                 common::ErrorKind::Validation);
  }
  vectors_[key] = embedding;
  return common::Status::success();
}

common::Result<std::vector<VectorSearchResult>>
VectorIndex::search(const std::vector<float> &query, const std::size_t limit) const {
  if (query.size() != dimensions_) {
    return common::Result<std::vector<VectorSearchResult>>::failure(
        "query dimensions mismatch", common::ErrorKind::Validation);
  }

  std::vector<VectorSearchResult> results;
  results.reserve(vectors_.size());
  for (const auto &[key, embedding] : vectors_) {
    results.push_back({.key = key, .distance = 1.0F - cosine_similarity(query, embedding)});
  }

  const auto nearer = [](const VectorSearchResult &lhs, const VectorSearchResult &rhs) {
    if (lhs.distance != rhs.distance) {
      return lhs.distance < rhs.distance;
    }
    return lhs.key < rhs.key;
  };
  if (results.size() > limit) {
    std::partial_sort(results.begin(), results.begin() + static_cast<std::ptrdiff_t>(limit),
                      results.end(), nearer);
    results.resize(limit);
  } else {
    std::sort(results.begin(), results.end(), nearer);
  }
  return common::Result<std::vector<VectorSearchResult>>::success(std::move(results));
}

std::size_t VectorIndex::size() const { return vectors_.size(); }

bool VectorIndex::contains(const std::string &key) const { return vectors_.contains(key); }

} // namespace conductor::vectorstore
