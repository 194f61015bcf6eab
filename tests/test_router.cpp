#include "test_framework.hpp"

#include "conductor/common/worker_pool.hpp"
#include "conductor/router/classifier.hpp"
#include "conductor/router/semantic_router.hpp"
#include "conductor/vectorstore/embedder_local.hpp"
#include "conductor/vectorstore/sqlite_store.hpp"
#include "tests/helpers/test_helpers.hpp"

namespace {

namespace rt = conductor::router;
using conductor::common::Result;
using conductor::testing::StubCollection;

class FakeClassifier final : public rt::IClassifier {
public:
  explicit FakeClassifier(Result<rt::RoutingDecision> result) : result_(std::move(result)) {}

  [[nodiscard]] Result<rt::RoutingDecision>
  classify(const std::string &system_instruction,
           const std::vector<conductor::providers::ChatMessage> &messages) override {
    ++calls;
    last_instruction = system_instruction;
    last_messages = messages;
    return result_;
  }

  std::size_t calls = 0;
  std::string last_instruction;
  std::vector<conductor::providers::ChatMessage> last_messages;

private:
  Result<rt::RoutingDecision> result_;
};

std::shared_ptr<FakeClassifier> classifier_returning(const std::string &agent,
                                                     const double confidence) {
  return std::make_shared<FakeClassifier>(Result<rt::RoutingDecision>::success(
      rt::RoutingDecision{.target_agent = agent, .confidence = confidence, .reasoning = "because"}));
}

conductor::vectorstore::QueryMatch cached_route(const std::string &agent, const double distance) {
  return conductor::vectorstore::QueryMatch{
      .id = "route-1",
      .distance = distance,
      .document = "earlier query",
      .metadata = {{"target_agent", agent}, {"reasoning", "earlier"}}};
}

std::vector<conductor::providers::ChatMessage> user_turn(const std::string &text) {
  return {conductor::providers::ChatMessage{.role = "user", .content = text}};
}

std::shared_ptr<conductor::vectorstore::IVectorCollection> sqlite_router_cache() {
  namespace vs = conductor::vectorstore;
  auto store = vs::SqliteVectorStore::open(":memory:", std::make_shared<vs::LocalEmbedder>(64));
  if (!store.ok()) {
    throw std::runtime_error(store.error());
  }
  auto collection = store.value()->collection("router_cache");
  if (!collection.ok()) {
    throw std::runtime_error(collection.error());
  }
  return collection.value();
}

const std::vector<std::string> &agents() {
  static const std::vector<std::string> list = {"python_architect", "security_expert",
                                                "universal_agent"};
  return list;
}

} // namespace

void register_router_tests(std::vector<conductor::tests::TestCase> &tests) {
  using conductor::tests::require;

  tests.push_back({"router_cache_hit_skips_classifier", [] {
                     auto cache = std::make_shared<StubCollection>("router_cache");
                     cache->scripted_matches = {cached_route("python_architect", 0.02)};
                     auto classifier = classifier_returning("security_expert", 0.99);
                     rt::SemanticRouter router(cache, classifier, agents());
                     const auto decision = router.route({.text = "refactor my django app"}, {});
                     require(decision.is_cached, "cached decision expected");
                     require(decision.target_agent == "python_architect", "cached agent");
                     require(decision.confidence == 1.0, "cached confidence is 1.0");
                     require(decision.reasoning == "Cached result (distance: 0.0200)",
                             "reasoning: " + decision.reasoning);
                     require(classifier->calls == 0, "classifier must not be called");
                     require(cache->upsert_calls == 0, "hits are not written back");
                   }});

  tests.push_back({"router_distance_at_cutoff_is_a_miss", [] {
                     auto cache = std::make_shared<StubCollection>("router_cache");
                     cache->scripted_matches = {cached_route("python_architect", 0.06)};
                     auto classifier = classifier_returning("security_expert", 0.5);
                     rt::SemanticRouter router(cache, classifier, agents());
                     const auto decision = router.route({.text = "is this query safe"}, {});
                     require(!decision.is_cached, "0.06 is beyond the 0.05 cut-off");
                     require(decision.target_agent == "security_expert", "classifier agent");
                     require(classifier->calls == 1, "classifier called once");
                   }});

  tests.push_back({"router_ignores_hit_without_agent", [] {
                     auto cache = std::make_shared<StubCollection>("router_cache");
                     auto match = cached_route("", 0.0);
                     cache->scripted_matches = {match};
                     rt::SemanticRouter router(cache, nullptr, agents());
                     require(!router.lookup_cache("q", {}).has_value(),
                             "empty agent metadata is not a hit");
                   }});

  tests.push_back({"router_writes_back_confident_decisions_only", [] {
                     auto cache = std::make_shared<StubCollection>("router_cache");
                     rt::SemanticRouter confident(cache, classifier_returning("security_expert", 0.9),
                                                  agents());
                     (void)confident.route({.text = "how do I prevent SQL injection"}, {});
                     require(cache->upsert_calls == 1, "confidence 0.9 should be written back");
                     const auto &stored = cache->upserted.back();
                     require(stored.document == "how do I prevent SQL injection",
                             "raw query text stored");
                     require(stored.metadata.at("target_agent") == "security_expert",
                             "agent stored");
                     require(stored.metadata.at("reasoning") == "because", "reasoning stored");
                     require(stored.metadata.count("timestamp") == 1, "timestamp stored");
                     require(stored.id.size() == 36, "uuid id");

                     rt::SemanticRouter borderline(cache, classifier_returning("security_expert", 0.8),
                                                   agents());
                     (void)borderline.route({.text = "another question"}, {});
                     require(cache->upsert_calls == 1, "0.8 is not above the gate");
                   }});

  tests.push_back({"router_repeated_query_hits_sqlite_cache", [] {
                     auto cache = sqlite_router_cache();
                     auto classifier = classifier_returning("security_expert", 0.95);
                     rt::SemanticRouter router(cache, classifier, agents());
                     const rt::Query query{.text = "How do I prevent SQL injection?"};

                     const auto first = router.route(query, {});
                     require(!first.is_cached, "first query goes to the classifier");
                     require(first.target_agent == "security_expert", "classifier agent");
                     require(first.confidence == 0.95, "classifier confidence");
                     auto stored = cache->count();
                     require(stored.ok() && stored.value() == 1, "decision written back");

                     const auto repeat = router.route(query, {});
                     require(repeat.is_cached, "repeat served from cache");
                     require(repeat.target_agent == "security_expert", "same agent");
                     require(repeat.confidence == 1.0, "cached confidence is 1.0");
                     require(classifier->calls == 1, "classifier called once");
                   }});

  tests.push_back({"router_borderline_confidence_is_not_cached_in_sqlite", [] {
                     auto cache = sqlite_router_cache();
                     auto classifier = classifier_returning("security_expert", 0.8);
                     rt::SemanticRouter router(cache, classifier, agents());
                     const rt::Query query{.text = "How do I prevent SQL injection?"};

                     (void)router.route(query, {});
                     auto stored = cache->count();
                     require(stored.ok() && stored.value() == 0, "0.8 is not written back");

                     const auto repeat = router.route(query, {});
                     require(!repeat.is_cached, "repeat still misses");
                     require(classifier->calls == 2, "classifier called again");
                   }});

  tests.push_back({"router_refuses_unknown_agents_in_cache", [] {
                     auto cache = std::make_shared<StubCollection>("router_cache");
                     rt::SemanticRouter router(cache, classifier_returning("made_up_agent", 0.99),
                                               agents());
                     const auto decision = router.route({.text = "something odd"}, {});
                     require(decision.target_agent == "made_up_agent",
                             "decision is still returned");
                     require(cache->upsert_calls == 0, "unknown agent must not be cached");
                     require(!router.update_cache("q", "made_up_agent", "r"),
                             "explicit update refused");
                     require(router.update_cache("q", "python_architect", "r"),
                             "known agent accepted");
                   }});

  tests.push_back({"router_classifier_error_degrades_to_fallback", [] {
                     auto cache = std::make_shared<StubCollection>("router_cache");
                     auto classifier = std::make_shared<FakeClassifier>(
                         Result<rt::RoutingDecision>::failure("503 from upstream"));
                     rt::SemanticRouter router(cache, classifier, agents());
                     const auto decision = router.route({.text = "anything at all"}, {});
                     require(decision.target_agent == "universal_agent", "fallback agent");
                     require(decision.confidence == 0.0, "zero confidence");
                     require(decision.reasoning.rfind("Error in routing: ", 0) == 0,
                             "reasoning: " + decision.reasoning);
                     require(!decision.is_cached, "not cached");
                     require(cache->upsert_calls == 0, "degraded decisions are not cached");
                   }});

  tests.push_back({"router_without_classifier_degrades", [] {
                     auto cache = std::make_shared<StubCollection>("router_cache");
                     rt::SemanticRouter router(cache, nullptr, agents());
                     const auto decision = router.route({.text = "hello there friend"}, {});
                     require(decision.target_agent == "universal_agent", "fallback agent");
                     require(decision.reasoning ==
                                 "Classifier unavailable: no provider configured",
                             "reasoning: " + decision.reasoning);
                   }});

  tests.push_back({"router_store_failure_falls_through_to_classifier", [] {
                     auto cache = std::make_shared<StubCollection>("router_cache");
                     cache->fail_with = "database is locked";
                     auto classifier = classifier_returning("python_architect", 0.7);
                     rt::SemanticRouter router(cache, classifier, agents());
                     const auto decision = router.route({.text = "write a python cli"}, {});
                     require(decision.target_agent == "python_architect", "classifier answer");
                     require(classifier->calls == 1, "classifier used");
                   }});

  tests.push_back({"router_cache_text_uses_history_window", [] {
                     auto cache = std::make_shared<StubCollection>("router_cache");
                     auto classifier = classifier_returning("python_architect", 0.5);
                     rt::SemanticRouter router(cache, classifier, agents());
                     const std::string history(250, 'h');
                     rt::Context context{.history_text = history + "TAIL", .history = {history}};
                     (void)router.route({.text = "and now?", .history = {history}}, context);
                     require(cache->queried_texts.size() == 1, "one lookup");
                     const std::string expected = std::string(196, 'h') + "TAIL\nand now?";
                     require(cache->queried_texts[0] == expected, "last 200 chars + query");

                     require(classifier->last_messages.size() == 2, "history and query messages");
                     require(classifier->last_messages[0].content ==
                                 "Context/History:\n" + history + "TAIL",
                             "history message");
                     require(classifier->last_messages[1].content == "and now?", "query message");
                     require(cache->upserted.empty(), "0.5 not written back");
                   }});

  tests.push_back({"router_history_window_counts_characters", [] {
                     auto cache = std::make_shared<StubCollection>("router_cache");
                     rt::SemanticRouter router(cache, classifier_returning("python_architect", 0.5),
                                               agents());
                     std::string history;
                     for (int i = 0; i < 250; ++i) {
                       history += "ж";
                     }
                     rt::Context context{.history_text = "x" + history, .history = {history}};
                     (void)router.route({.text = "дальше?", .history = {history}}, context);
                     std::string window;
                     for (int i = 0; i < 200; ++i) {
                       window += "ж";
                     }
                     require(cache->queried_texts.size() == 1 &&
                                 cache->queried_texts[0] == window + "\nдальше?",
                             "last 200 characters, cut between characters");
                   }});

  tests.push_back({"router_empty_agent_list_uses_fallback", [] {
                     rt::SemanticRouter router(std::make_shared<StubCollection>(), nullptr, {});
                     require(router.available_agents() ==
                                 std::vector<std::string>({"universal_agent"}),
                             "fallback agent only");
                     require(router.is_known_agent("universal_agent"), "fallback known");
                   }});

  tests.push_back({"router_instruction_lists_agents", [] {
                     rt::SemanticRouter router(std::make_shared<StubCollection>(), nullptr,
                                               agents());
                     const auto instruction = router.system_instruction();
                     require(instruction.find("Master Router") != std::string::npos, "role");
                     require(instruction.find(
                                 R"(["python_architect","security_expert","universal_agent"])") !=
                                 std::string::npos,
                             "agent list: " + instruction);
                   }});

  tests.push_back({"router_options_follow_config", [] {
                     conductor::config::RouterConfig config;
                     config.similarity_threshold = 0.9;
                     config.fallback_agent = "generalist";
                     const auto options = rt::router_options(config);
                     require(options.similarity_threshold == 0.9, "threshold");
                     require(options.fallback_agent == "generalist", "fallback");
                     require(options.history_window_chars == 200, "window");
                   }});

  tests.push_back({"parse_routing_decision_accepts_fenced_json", [] {
                     auto decision = rt::parse_routing_decision(
                         "```json\n{\"target_agent\": \"security_expert\", \"confidence\": 0.95, "
                         "\"reasoning\": \"SQL injection\"}\n```");
                     require(decision.ok(), decision.ok() ? "" : decision.error());
                     require(decision.value().target_agent == "security_expert", "agent");
                     require(decision.value().confidence == 0.95, "confidence");
                     require(decision.value().reasoning == "SQL injection", "reasoning");
                     require(!decision.value().is_cached, "fresh decision");
                   }});

  tests.push_back({"parse_routing_decision_rejects_invalid", [] {
                     using conductor::common::ErrorKind;
                     auto no_agent = rt::parse_routing_decision(R"({"confidence": 0.5})");
                     require(!no_agent.ok() && no_agent.kind() == ErrorKind::Validation,
                             "missing agent");
                     auto high = rt::parse_routing_decision(
                         R"({"target_agent": "a", "confidence": 1.5})");
                     require(!high.ok(), "confidence above 1");
                     auto word = rt::parse_routing_decision(
                         R"({"target_agent": "a", "confidence": "high"})");
                     require(!word.ok(), "non-numeric confidence");
                     require(!rt::parse_routing_decision("I think python_architect").ok(),
                             "prose only");
                   }});

  tests.push_back({"provider_classifier_sends_json_request", [] {
                     auto provider = std::make_shared<conductor::testing::MockProvider>();
                     provider->set_response(
                         R"({"target_agent":"python_architect","confidence":0.9,"reasoning":"py"})");
                     rt::ProviderClassifier classifier(
                         provider, {.model = "gpt-4o-mini", .temperature = 0.0,
                                    .timeout = std::chrono::milliseconds(5000)});
                     auto decision = classifier.classify("route it", user_turn("django help"));
                     require(decision.ok(), decision.ok() ? "" : decision.error());
                     require(decision.value().target_agent == "python_architect", "agent");
                     const auto request = provider->last_request();
                     require(request.json_response, "json mode");
                     require(request.model == "gpt-4o-mini", "model");
                     require(request.messages.size() == 2 && request.messages[0].role == "system" &&
                                 request.messages[0].content == "route it",
                             "system instruction first");
                     require(request.timeout_ms == 5000, "timeout forwarded");
                   }});

  tests.push_back({"provider_classifier_times_out_on_pool", [] {
                     auto provider = std::make_shared<conductor::testing::MockProvider>();
                     provider->set_response(R"({"target_agent":"a","confidence":0.9})");
                     provider->set_delay(std::chrono::milliseconds(400));
                     auto pool = std::make_shared<conductor::common::WorkerPool>(1);
                     rt::ProviderClassifier classifier(
                         provider, {.model = "m", .timeout = std::chrono::milliseconds(50)}, pool);
                     const auto started = std::chrono::steady_clock::now();
                     auto decision = classifier.classify("x", user_turn("q"));
                     const auto waited = std::chrono::steady_clock::now() - started;
                     require(!decision.ok(), "timeout expected");
                     require(decision.kind() == conductor::common::ErrorKind::Upstream,
                             "timeout is upstream");
                     require(decision.error().find("timed out") != std::string::npos,
                             decision.error());
                     require(waited < std::chrono::milliseconds(350), "caller must not wait");
                   }});

  tests.push_back({"provider_classifier_surfaces_provider_errors", [] {
                     auto provider = std::make_shared<conductor::testing::MockProvider>();
                     provider->set_error("connection refused");
                     rt::ProviderClassifier classifier(provider, {.model = "m"});
                     auto decision = classifier.classify("x", user_turn("q"));
                     require(!decision.ok() && decision.error() == "connection refused",
                             "provider error returned");
                   }});
}
