#pragma once

#include "conductor/config/schema.hpp"
#include "conductor/router/classifier.hpp"
#include "conductor/router/types.hpp"
#include "conductor/vectorstore/vector_store.hpp"

#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace conductor::router {

struct RouterOptions {
  /// Cosine similarity a cached query must exceed; the distance cut-off is
  /// `1 - similarity_threshold`.
  double similarity_threshold = 0.95;
  /// Classifier decisions strictly above this are written back.
  double write_back_confidence = 0.8;
  std::size_t history_window_chars = 200;
  std::string fallback_agent = config::DEFAULT_AGENT;
};

[[nodiscard]] RouterOptions router_options(const config::RouterConfig &config);

/// Picks the agent for a query: approximate-match cache first, then the
/// classifier, writing confident classifier decisions back to the cache.
/// Never fails; upstream problems degrade to the fallback agent.
class SemanticRouter {
public:
  /// An empty `known_agents` becomes `{options.fallback_agent}`. A null
  /// classifier makes every cache miss a degraded decision.
  SemanticRouter(std::shared_ptr<vectorstore::IVectorCollection> cache,
                 std::shared_ptr<IClassifier> classifier, std::vector<std::string> known_agents,
                 RouterOptions options = {});

  [[nodiscard]] RoutingDecision route(const Query &query, const Context &context);

  /// Cache-only check; nullopt on a miss or a store error.
  [[nodiscard]] std::optional<RoutingDecision> lookup_cache(const std::string &query,
                                                            const Context &context);

  /// Record `agent` as the answer for `query` under a fresh id. Agents outside
  /// the known set are refused and false is returned.
  bool update_cache(const std::string &query, const std::string &agent,
                    const std::string &reasoning);

  [[nodiscard]] const std::vector<std::string> &available_agents() const { return agents_; }
  [[nodiscard]] bool is_known_agent(const std::string &agent) const;
  [[nodiscard]] const RouterOptions &options() const { return options_; }

  /// Instruction sent to the classifier, listing the known agents.
  [[nodiscard]] std::string system_instruction() const;

private:
  [[nodiscard]] RoutingDecision classify(const std::string &query, const Context &context);
  [[nodiscard]] RoutingDecision degraded(const std::string &reason) const;
  [[nodiscard]] std::string cache_search_text(const std::string &query,
                                              const Context &context) const;

  std::shared_ptr<vectorstore::IVectorCollection> cache_;
  std::shared_ptr<IClassifier> classifier_;
  std::vector<std::string> agents_;
  RouterOptions options_;
};

} // namespace conductor::router
