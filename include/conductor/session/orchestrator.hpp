#pragma once

#include "conductor/common/result.hpp"
#include "conductor/common/worker_pool.hpp"
#include "conductor/context/context_builder.hpp"
#include "conductor/prompt/resolver.hpp"
#include "conductor/providers/traits.hpp"
#include "conductor/retrieval/relevance_retriever.hpp"
#include "conductor/router/semantic_router.hpp"
#include "conductor/session/responses.hpp"
#include "conductor/session/session_cache.hpp"

#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace conductor::session {

constexpr const char *FALLBACK_SYSTEM_PROMPT = "You are a helpful assistant.";

/// Everything the orchestrator composes. Built by `build_orchestrator` in
/// production and by hand in tests.
struct OrchestratorParts {
  std::shared_ptr<router::SemanticRouter> router;
  std::shared_ptr<retrieval::RelevanceRetriever> skills;
  std::shared_ptr<retrieval::RelevanceRetriever> implants;
  std::shared_ptr<prompt::PromptResolver> resolver;
  std::shared_ptr<context::ContextBuilder> context_builder;
  std::shared_ptr<SessionCache> session_cache;
  /// Optional; needed only to execute composed prompts.
  std::shared_ptr<providers::Provider> provider;
  std::string model;
  double temperature = 0.7;
  /// Kept alive for the collections and classifier that run on them.
  std::vector<std::shared_ptr<common::WorkerPool>> pools;
};

/// Task type -> implant ids used by `reasoning_strategy`.
[[nodiscard]] const std::map<std::string, std::vector<std::string>> &task_implant_map();

/// Greetings, capability questions and very short queries.
[[nodiscard]] bool is_meta_query(const std::string &query);

/// Search text for implant retrieval: query, optional role and the last 300
/// characters of history.
[[nodiscard]] std::string implant_search_text(const std::string &query,
                                              const std::optional<std::string> &role,
                                              const std::string &history_text);

/// Composes routing, prompt resolution and retrieval into the system prompt
/// for one request. Fragment failures are logged and skipped; only a missing
/// top-level agent profile fails an operation.
class Orchestrator {
public:
  explicit Orchestrator(OrchestratorParts parts);

  /// Full pipeline. With `execute` the composed prompt is sent to the
  /// provider and the reply returned in `content`.
  [[nodiscard]] common::Result<ProcessResult>
  process(const std::string &query, const std::vector<std::string> &history = {},
          bool execute = false);

  /// Routing decision only: cache, then classifier.
  [[nodiscard]] router::RoutingDecision route(const std::string &query,
                                              const std::vector<std::string> &history = {});

  /// Cache-only routing with meta-query fallback; never calls the classifier.
  [[nodiscard]] RoutingInfoResponse routing_info(const std::string &query,
                                                 const std::vector<std::string> &history = {});

  /// Prompt for an explicitly chosen agent, enriched with skills and implants.
  /// The choice is recorded in the router cache.
  [[nodiscard]] AgentContextResponse
  agent_context(const std::string &agent, const std::string &query,
                const std::string &reasoning = "Selected by Cursor Model",
                const std::vector<std::string> &history = {});

  /// Skills block and implants block joined by a blank line.
  [[nodiscard]] std::string dynamic_context(const std::string &agent, const std::string &query,
                                            const std::vector<std::string> &history = {},
                                            const std::vector<std::string> &preferred_skills = {});

  [[nodiscard]] std::string relevant_implants(const std::string &query,
                                              const std::optional<std::string> &role = std::nullopt,
                                              std::size_t limit = 5);

  [[nodiscard]] std::string reasoning_strategy(const std::string &task_type);

  [[nodiscard]] std::string clear_session_cache();

  /// Re-index skills and implants from disk. Returns {skills, implants}.
  [[nodiscard]] common::Result<std::pair<std::size_t, std::size_t>> reindex();

  [[nodiscard]] const std::vector<std::string> &available_agents() const;
  [[nodiscard]] router::SemanticRouter &router() { return *parts_.router; }
  [[nodiscard]] SessionCache &session_cache() { return *parts_.session_cache; }

private:
  [[nodiscard]] std::vector<std::string> preferred_skills_for(const std::string &agent) const;
  [[nodiscard]] std::string enrich(const std::string &agent, const std::string &base_prompt,
                                   const std::string &query,
                                   const std::vector<std::string> &history,
                                   const std::vector<std::string> &preferred_skills);

  OrchestratorParts parts_;
};

} // namespace conductor::session
