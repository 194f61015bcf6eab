#include "conductor/router/semantic_router.hpp"

#include "conductor/common/fs.hpp"
#include "conductor/common/hash.hpp"
#include "conductor/common/json_util.hpp"
#include "conductor/observability/global.hpp"

#include <algorithm>
#include <chrono>
#include <cstdio>

namespace conductor::router {

namespace {

std::string format_distance(const double distance) {
  char buffer[32];
  std::snprintf(buffer, sizeof(buffer), "%.4f", distance);
  return buffer;
}

std::string unix_timestamp() {
  return std::to_string(std::chrono::duration_cast<std::chrono::seconds>(
                            std::chrono::system_clock::now().time_since_epoch())
                            .count());
}

} // namespace

RouterOptions router_options(const config::RouterConfig &config) {
  return RouterOptions{
      .similarity_threshold = config.similarity_threshold,
      .write_back_confidence = config.write_back_confidence,
      .history_window_chars = static_cast<std::size_t>(config.history_window_chars),
      .fallback_agent = config.fallback_agent,
  };
}

SemanticRouter::SemanticRouter(std::shared_ptr<vectorstore::IVectorCollection> cache,
                               std::shared_ptr<IClassifier> classifier,
                               std::vector<std::string> known_agents, RouterOptions options)
    : cache_(std::move(cache)), classifier_(std::move(classifier)),
      agents_(std::move(known_agents)), options_(std::move(options)) {
  if (agents_.empty()) {
    observability::record_warning("router", "agent scan returned empty, falling back to " +
                                                options_.fallback_agent);
    agents_.push_back(options_.fallback_agent);
  }
}

bool SemanticRouter::is_known_agent(const std::string &agent) const {
  return std::find(agents_.begin(), agents_.end(), agent) != agents_.end();
}

std::string SemanticRouter::cache_search_text(const std::string &query,
                                              const Context &context) const {
  if (context.history_text.empty()) {
    return query;
  }
  return common::tail_chars(context.history_text, options_.history_window_chars) + "\n" + query;
}

std::optional<RoutingDecision> SemanticRouter::lookup_cache(const std::string &query,
                                                            const Context &context) {
  const std::string collection(cache_->name());
  auto matches = cache_->query(cache_search_text(query, context), 1);
  if (!matches.ok()) {
    observability::record_error("router", "cache lookup failed: " + matches.error());
    return std::nullopt;
  }
  if (matches.value().empty()) {
    observability::record_cache_lookup(collection, false, -1.0);
    return std::nullopt;
  }

  const auto &nearest = matches.value().front();
  const auto agent = nearest.metadata.find("target_agent");
  const bool hit = nearest.distance < (1.0 - options_.similarity_threshold) &&
                   agent != nearest.metadata.end() && !agent->second.empty();
  observability::record_cache_lookup(collection, hit, nearest.distance);
  if (!hit) {
    return std::nullopt;
  }
  return RoutingDecision{
      .target_agent = agent->second,
      .confidence = 1.0,
      .reasoning = "Cached result (distance: " + format_distance(nearest.distance) + ")",
      .is_cached = true,
  };
}

bool SemanticRouter::update_cache(const std::string &query, const std::string &agent,
                                  const std::string &reasoning) {
  if (!is_known_agent(agent)) {
    observability::record_warning("router", "not caching unknown agent '" + agent + "'");
    return false;
  }
  auto status = cache_->upsert({common::generate_uuid()}, {query},
                               {{{"target_agent", agent},
                                 {"reasoning", reasoning},
                                 {"timestamp", unix_timestamp()}}});
  if (!status.ok()) {
    observability::record_error("router", "failed to update cache: " + status.error());
    return false;
  }
  return true;
}

std::string SemanticRouter::system_instruction() const {
  return "You are the Master Router for the Agents system.\n"
         "Your job is to classify the user's request into one of the following agent profiles:\n" +
         common::json_string_array(agents_) +
         "\n\n"
         "Analyze the intent and complexity.\n"
         "Return a JSON object with the following fields:\n"
         "- \"target_agent\": (string) One of the available agents.\n"
         "- \"confidence\": (float) 0.0 to 1.0.\n"
         "- \"reasoning\": (string) Explanation for the choice.\n\n"
         "Example:\n"
         "{\n"
         "    \"target_agent\": \"security_expert\",\n"
         "    \"confidence\": 0.95,\n"
         "    \"reasoning\": \"User is asking about SQL injection prevention.\"\n"
         "}\n";
}

RoutingDecision SemanticRouter::degraded(const std::string &reason) const {
  return RoutingDecision{
      .target_agent = options_.fallback_agent,
      .confidence = 0.0,
      .reasoning = reason,
      .is_cached = false,
  };
}

RoutingDecision SemanticRouter::classify(const std::string &query, const Context &context) {
  if (classifier_ == nullptr) {
    return degraded("Classifier unavailable: no provider configured");
  }

  std::vector<providers::ChatMessage> messages;
  if (!context.history_text.empty()) {
    messages.push_back({.role = "user", .content = "Context/History:\n" + context.history_text});
  }
  messages.push_back({.role = "user", .content = query});

  auto decision = classifier_->classify(system_instruction(), messages);
  if (!decision.ok()) {
    observability::record_error("router", "routing error: " + decision.error());
    return degraded("Error in routing: " + decision.error());
  }
  return decision.value();
}

RoutingDecision SemanticRouter::route(const Query &query, const Context &context) {
  const auto started = std::chrono::steady_clock::now();
  auto decision = lookup_cache(query.text, context);
  if (!decision.has_value()) {
    decision = classify(query.text, context);
    if (decision->confidence > options_.write_back_confidence) {
      update_cache(query.text, decision->target_agent, decision->reasoning);
    }
  }

  observability::record_route_decision(decision->target_agent, decision->confidence,
                                       decision->is_cached);
  observability::record_latency("router.route",
                                std::chrono::duration_cast<std::chrono::milliseconds>(
                                    std::chrono::steady_clock::now() - started));
  return *decision;
}

} // namespace conductor::router
