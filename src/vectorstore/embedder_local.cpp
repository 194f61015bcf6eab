#include "conductor/vectorstore/embedder_local.hpp"

#include <cctype>
#include <cmath>
#include <cstdint>

namespace conductor::vectorstore {

namespace {

constexpr float kWordWeight = 1.0F;
constexpr float kTrigramWeight = 0.5F;

// FNV-1a, so persisted embeddings stay valid across builds and platforms.
std::uint64_t fnv1a(std::string_view text) {
  std::uint64_t hash = 1469598103934665603ULL;
  for (const char ch : text) {
    hash ^= static_cast<unsigned char>(ch);
    hash *= 1099511628211ULL;
  }
  return hash;
}

std::vector<std::string> tokenize(std::string_view text) {
  std::vector<std::string> words;
  std::string current;
  for (const char ch : text) {
    const auto uch = static_cast<unsigned char>(ch);
    // Bytes >= 0x80 belong to UTF-8 sequences; keep them inside words.
    if (std::isalnum(uch) != 0 || uch >= 0x80) {
      current.push_back(static_cast<char>(std::tolower(uch)));
    } else if (!current.empty()) {
      words.push_back(std::move(current));
      current.clear();
    }
  }
  if (!current.empty()) {
    words.push_back(std::move(current));
  }
  return words;
}

void add_feature(std::vector<float> &values, std::string_view feature, float weight) {
  const std::uint64_t hash = fnv1a(feature);
  const std::size_t bucket = static_cast<std::size_t>(hash % values.size());
  values[bucket] += ((hash >> 63) != 0U ? -weight : weight);
}

void normalize(std::vector<float> &values) {
  double norm = 0.0;
  for (const float v : values) {
    norm += static_cast<double>(v) * static_cast<double>(v);
  }
  norm = std::sqrt(norm);
  if (norm < 1e-9) {
    return;
  }
  for (float &v : values) {
    v = static_cast<float>(static_cast<double>(v) / norm);
  }
}

} // namespace

LocalEmbedder::LocalEmbedder(const std::size_t dimensions)
    : dimensions_(dimensions == 0 ? 384 : dimensions) {}

std::string_view LocalEmbedder::name() const { return "local"; }

common::Result<std::vector<float>> LocalEmbedder::embed(const std::string_view text) {
  std::vector<float> values(dimensions_, 0.0F);
  for (const auto &word : tokenize(text)) {
    add_feature(values, "w:" + word, kWordWeight);
    const std::string padded = "#" + word + "#";
    for (std::size_t i = 0; i + 3 <= padded.size(); ++i) {
      add_feature(values, "t:" + padded.substr(i, 3), kTrigramWeight);
    }
  }
  normalize(values);
  return common::Result<std::vector<float>>::success(std::move(values));
}

std::size_t LocalEmbedder::dimensions() const { return dimensions_; }

} // namespace conductor::vectorstore
