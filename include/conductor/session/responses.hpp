#pragma once

#include "conductor/router/types.hpp"

#include <optional>
#include <string>
#include <vector>

namespace conductor::session {

/// Outcome of `Orchestrator::agent_context`.
struct AgentContextResponse {
  /// "SUCCESS" or "ERROR".
  std::string status;
  std::string agent;
  std::string request_id;
  std::string system_prompt;
  /// "SESSION_CACHE" when served from the session cache.
  std::string source;
  std::string message;

  [[nodiscard]] bool ok() const { return status == "SUCCESS"; }
  [[nodiscard]] std::string to_json() const;
};

/// Outcome of `Orchestrator::routing_info`.
struct RoutingInfoResponse {
  /// "CACHE_HIT", "SUCCESS" (meta query answered by the fallback agent),
  /// "CACHE_MISS" or "ERROR".
  std::string status;
  std::string agent;
  std::string reasoning;
  std::string system_prompt;
  std::string request_id;
  std::vector<std::string> available_agents;
  std::string default_fallback;
  std::string instruction;
  std::string message;

  [[nodiscard]] std::string to_json() const;
};

struct ProcessResult {
  std::string request_id;
  std::string agent;
  router::RoutingDecision decision;
  std::string detected_language;
  std::string system_prompt;
  std::vector<std::string> implants_loaded;
  /// Model reply, present when the request was executed.
  std::optional<std::string> content;

  [[nodiscard]] std::string to_json() const;
};

[[nodiscard]] std::string decision_to_json(const router::RoutingDecision &decision);

} // namespace conductor::session
