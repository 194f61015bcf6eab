#include "conductor/session/orchestrator.hpp"

#include "conductor/common/fs.hpp"
#include "conductor/common/hash.hpp"
#include "conductor/observability/global.hpp"
#include "conductor/prompt/agent_profile.hpp"

#include <array>
#include <chrono>

namespace conductor::session {

namespace {

constexpr std::size_t IMPLANT_CONTEXT_CHARS = 300;
constexpr std::size_t PROCESS_IMPLANTS = 3;

constexpr std::array<const char *, 11> META_QUERY_PATTERNS = {
    "what tools",  "what can you", "help me", "hello", "hi ", "hey ",
    "who are you", "what are you", "introduce yourself",
    // ambiguous
    "?", "test",
};

std::string join_lines(const std::vector<std::string> &lines) {
  std::string out;
  for (std::size_t i = 0; i < lines.size(); ++i) {
    if (i > 0) {
      out += "\n";
    }
    out += lines[i];
  }
  return out;
}

std::chrono::milliseconds since(const std::chrono::steady_clock::time_point started) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() -
                                                               started);
}

} // namespace

const std::map<std::string, std::vector<std::string>> &task_implant_map() {
  static const std::map<std::string, std::vector<std::string>> map = {
      {"debugging", {"implant-chain-of-code", "implant-reflexion"}},
      {"analysis", {"implant-step-back-prompting", "implant-chain-of-verification"}},
      {"creative", {"implant-analogical-prompting", "implant-generated-knowledge"}},
      {"planning", {"implant-plan-and-solve-plus", "implant-skeleton-of-thought"}},
  };
  return map;
}

bool is_meta_query(const std::string &query) {
  const std::string lowered = common::to_lower(common::trim(query));
  if (common::utf8_length(lowered) < 10) {
    return true;
  }
  for (const char *pattern : META_QUERY_PATTERNS) {
    if (lowered.find(pattern) != std::string::npos) {
      return true;
    }
  }
  return false;
}

std::string implant_search_text(const std::string &query, const std::optional<std::string> &role,
                                const std::string &history_text) {
  std::string text = "Query: " + query;
  if (role.has_value() && !role->empty()) {
    text += "\nRole: " + *role;
  }
  if (!history_text.empty()) {
    text += "\nContext: " + common::tail_chars(history_text, IMPLANT_CONTEXT_CHARS);
  }
  return text;
}

Orchestrator::Orchestrator(OrchestratorParts parts) : parts_(std::move(parts)) {}

const std::vector<std::string> &Orchestrator::available_agents() const {
  return parts_.router->available_agents();
}

std::vector<std::string> Orchestrator::preferred_skills_for(const std::string &agent) const {
  auto profile = prompt::load_agent_profile(*parts_.resolver, agent);
  if (!profile.ok()) {
    observability::record_warning("orchestrator",
                                  "no metadata for agent '" + agent + "': " + profile.error());
    return {};
  }
  return profile.value().preferred_skills;
}

std::string Orchestrator::dynamic_context(const std::string &agent, const std::string &query,
                                          const std::vector<std::string> &history,
                                          const std::vector<std::string> &preferred_skills) {
  std::vector<std::string> parts;

  const auto skills = parts_.skills->retrieve(query, std::nullopt, std::nullopt, preferred_skills);
  if (!skills.empty()) {
    parts.push_back(parts_.skills->format(skills));
  }

  const auto implants = parts_.implants->retrieve(
      implant_search_text(query, agent, join_lines(history)), PROCESS_IMPLANTS);
  if (!implants.empty()) {
    parts.push_back(parts_.implants->format(implants));
  }

  std::string out;
  for (std::size_t i = 0; i < parts.size(); ++i) {
    if (i > 0) {
      out += "\n\n";
    }
    out += parts[i];
  }
  return out;
}

std::string Orchestrator::enrich(const std::string &agent, const std::string &base_prompt,
                                 const std::string &query,
                                 const std::vector<std::string> &history,
                                 const std::vector<std::string> &preferred_skills) {
  const std::string dynamic = dynamic_context(agent, query, history, preferred_skills);
  if (dynamic.empty()) {
    return base_prompt;
  }
  return base_prompt + "\n\n" + dynamic;
}

router::RoutingDecision Orchestrator::route(const std::string &query,
                                            const std::vector<std::string> &history) {
  const router::Query request{.text = query, .history = history};
  return parts_.router->route(request, parts_.context_builder->build(request));
}

common::Result<ProcessResult> Orchestrator::process(const std::string &query,
                                                    const std::vector<std::string> &history,
                                                    const bool execute) {
  const auto started = std::chrono::steady_clock::now();
  ProcessResult result;
  result.request_id = common::generate_uuid();

  const router::Query request{.text = query, .history = history};
  const router::Context context = parts_.context_builder->build(request);
  result.detected_language = context.detected_language;

  result.decision = parts_.router->route(request, context);
  result.agent = result.decision.target_agent;

  try {
    result.system_prompt = parts_.resolver->load_agent_prompt(result.agent);
  } catch (const prompt::SecurityError &e) {
    observability::record_error("orchestrator", e.what());
    result.system_prompt = FALLBACK_SYSTEM_PROMPT;
  } catch (const prompt::NotFoundError &e) {
    observability::record_warning("orchestrator", e.what());
    result.system_prompt = FALLBACK_SYSTEM_PROMPT;
  }

  const auto implants = parts_.implants->retrieve(
      implant_search_text(query, result.agent, context.history_text), PROCESS_IMPLANTS);
  for (const auto &implant : implants) {
    const auto filename = implant.metadata.find("filename");
    result.implants_loaded.push_back(filename == implant.metadata.end() ? implant.id
                                                                        : filename->second);
  }
  const std::string formatted = parts_.implants->format(implants);
  if (!formatted.empty()) {
    result.system_prompt += "\n\n" + formatted;
  }

  if (execute) {
    if (parts_.provider == nullptr) {
      return common::Result<ProcessResult>::failure("no provider configured",
                                                    common::ErrorKind::Validation);
    }
    auto reply = parts_.provider->chat_with_system(result.system_prompt, query, parts_.model,
                                                   parts_.temperature);
    if (!reply.ok()) {
      return common::Result<ProcessResult>::failure(reply.status());
    }
    result.content = reply.value();
  }

  observability::record_latency("orchestrator.process", since(started));
  return common::Result<ProcessResult>::success(std::move(result));
}

AgentContextResponse Orchestrator::agent_context(const std::string &agent,
                                                 const std::string &query,
                                                 const std::string &reasoning,
                                                 const std::vector<std::string> &history) {
  AgentContextResponse response;
  response.agent = agent;

  const std::string key = SessionCache::make_key(agent, query);
  if (auto cached = parts_.session_cache->get(key); cached.has_value()) {
    response.status = "SUCCESS";
    response.request_id = common::generate_uuid();
    response.system_prompt = std::move(*cached);
    response.source = "SESSION_CACHE";
    return response;
  }

  std::string base_prompt;
  try {
    base_prompt = parts_.resolver->load_agent_prompt(agent);
  } catch (const prompt::SecurityError &e) {
    response.status = "ERROR";
    response.message = e.what();
    return response;
  } catch (const prompt::NotFoundError &e) {
    response.status = "ERROR";
    response.message = e.what();
    return response;
  }

  response.system_prompt = enrich(agent, base_prompt, query, history, preferred_skills_for(agent));
  parts_.session_cache->put(key, response.system_prompt);
  parts_.router->update_cache(query, agent, reasoning);

  response.status = "SUCCESS";
  response.request_id = common::generate_uuid();
  return response;
}

RoutingInfoResponse Orchestrator::routing_info(const std::string &query,
                                               const std::vector<std::string> &history) {
  RoutingInfoResponse response;
  const router::Context context =
      parts_.context_builder->build(router::Query{.text = query, .history = history});

  if (auto cached = parts_.router->lookup_cache(query, context); cached.has_value()) {
    try {
      const std::string base_prompt = parts_.resolver->load_agent_prompt(cached->target_agent);
      response.status = "CACHE_HIT";
      response.agent = cached->target_agent;
      response.reasoning = cached->reasoning;
      response.system_prompt = enrich(cached->target_agent, base_prompt, query, history,
                                      preferred_skills_for(cached->target_agent));
    } catch (const prompt::SecurityError &e) {
      response.status = "ERROR";
      response.message = std::string("Cache hit but failed to load prompt: ") + e.what();
    } catch (const prompt::NotFoundError &e) {
      response.status = "ERROR";
      response.message = std::string("Cache hit but failed to load prompt: ") + e.what();
    }
    return response;
  }

  const std::string &fallback = parts_.router->options().fallback_agent;
  if (is_meta_query(query)) {
    auto context_response = agent_context(
        fallback, query, "Auto-fallback: Meta-Query detected (greeting/capabilities/ambiguous)",
        history);
    response.status = context_response.status;
    response.agent = context_response.agent;
    response.request_id = context_response.request_id;
    response.system_prompt = context_response.system_prompt;
    response.message = context_response.message;
    return response;
  }

  response.status = "CACHE_MISS";
  response.available_agents = parts_.router->available_agents();
  response.default_fallback = fallback;
  response.instruction = "Select the best agent from the list. If the domain is unclear or "
                         "ambiguous, use '" +
                         fallback + "' as the safe default.";
  return response;
}

std::string Orchestrator::relevant_implants(const std::string &query,
                                            const std::optional<std::string> &role,
                                            const std::size_t limit) {
  return parts_.implants->format(
      parts_.implants->retrieve(implant_search_text(query, role, ""), limit));
}

std::string Orchestrator::reasoning_strategy(const std::string &task_type) {
  const auto &map = task_implant_map();
  const auto it = map.find(task_type);
  if (it == map.end()) {
    return "Unknown task type: " + task_type;
  }
  return parts_.implants->format(parts_.implants->get_by_ids(it->second));
}

std::string Orchestrator::clear_session_cache() {
  parts_.session_cache->clear();
  return "Session cache cleared";
}

common::Result<std::pair<std::size_t, std::size_t>> Orchestrator::reindex() {
  using R = common::Result<std::pair<std::size_t, std::size_t>>;
  auto skills = parts_.skills->index();
  if (!skills.ok()) {
    return R::failure(skills.status());
  }
  auto implants = parts_.implants->index();
  if (!implants.ok()) {
    return R::failure(implants.status());
  }
  return R::success({skills.value(), implants.value()});
}

} // namespace conductor::session
