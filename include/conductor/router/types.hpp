#pragma once

#include <string>
#include <vector>

namespace conductor::router {

/// Raw request text plus prior turns, most recent last.
struct Query {
  std::string text;
  std::vector<std::string> history;
};

/// Per-request derived values, built once by the ContextBuilder.
struct Context {
  /// History joined with newlines.
  std::string history_text;
  std::vector<std::string> history;
  std::string detected_language;
};

struct RoutingDecision {
  std::string target_agent;
  double confidence = 0.0;
  std::string reasoning;
  bool is_cached = false;
};

} // namespace conductor::router
