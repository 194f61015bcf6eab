#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace conductor::config {

constexpr const char *DEFAULT_PROVIDER = "openai";
constexpr const char *DEFAULT_MODEL = "gpt-4o-mini";
constexpr const char *DEFAULT_AGENT = "universal_agent";

struct RouterConfig {
  double similarity_threshold = 0.95;
  double write_back_confidence = 0.8;
  std::uint64_t history_window_chars = 200;
  std::string fallback_agent = DEFAULT_AGENT;
  std::string collection = "router_cache";
  std::string agents_directory = ".cursor/agents";
  /// Empty means `default_model`.
  std::string classifier_model;
  std::uint64_t classifier_timeout_ms = 30000;
  double classifier_temperature = 0.0;
};

/// One RelevanceRetriever instance (skills or implants).
struct RetrieverConfig {
  std::string directory;
  std::string collection;
  double threshold = 0.5;
  std::uint64_t default_results = 2;
};

struct VectorStoreConfig {
  /// SQLite file; empty keeps everything in memory.
  std::string path = "~/.conductor/vector_store.db";
  std::string embedding_provider = "local";
  std::string embedding_model = "text-embedding-3-small";
  std::uint64_t embedding_dimensions = 384;
  std::uint64_t worker_threads = 4;
};

struct SessionCacheConfig {
  std::uint64_t capacity = 256;
  /// 0 disables expiry.
  std::uint64_t ttl_seconds = 0;
};

struct ReliabilityConfig {
  std::uint32_t provider_retries = 2;
  std::uint64_t provider_backoff_ms = 500;
  std::vector<std::string> fallback_providers;
};

struct ObservabilityConfig {
  std::string backend = "log";
};

struct Config {
  /// Sandbox root holding `.cursor/`. Empty means the current directory.
  std::string root;
  std::optional<std::string> api_key;
  std::string default_provider = DEFAULT_PROVIDER;
  std::string default_model = DEFAULT_MODEL;
  double default_temperature = 0.7;

  RouterConfig router;
  RetrieverConfig skills{
      .directory = ".cursor/skills",
      .collection = "skills_store",
      .threshold = 0.45,
      .default_results = 2,
  };
  RetrieverConfig implants{
      .directory = ".cursor/implants",
      .collection = "implants_store",
      .threshold = 0.73,
      .default_results = 3,
  };
  VectorStoreConfig vector_store;
  SessionCacheConfig session_cache;
  ReliabilityConfig reliability;
  ObservabilityConfig observability;
};

} // namespace conductor::config
