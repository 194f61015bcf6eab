#include "conductor/session/bootstrap.hpp"

#include "conductor/common/fs.hpp"
#include "conductor/config/config.hpp"
#include "conductor/context/language.hpp"
#include "conductor/observability/global.hpp"
#include "conductor/prompt/agent_profile.hpp"
#include "conductor/providers/factory.hpp"
#include "conductor/vectorstore/embedder.hpp"
#include "conductor/vectorstore/pooled_collection.hpp"
#include "conductor/vectorstore/sqlite_store.hpp"

namespace conductor::session {

namespace {

constexpr std::size_t CLASSIFIER_THREADS = 2;

template <typename T> common::Result<std::unique_ptr<Orchestrator>> fail(const common::Result<T> &r) {
  return common::Result<std::unique_ptr<Orchestrator>>::failure(r.status());
}

} // namespace

common::Result<std::unique_ptr<Orchestrator>>
build_orchestrator(const config::Config &config,
                   std::shared_ptr<providers::HttpClient> http_client) {
  const auto root = config::resolve_root(config);

  auto embedder = vectorstore::create_embedder(config);
  if (!embedder.ok()) {
    return fail(embedder);
  }
  const std::string store_path = config.vector_store.path.empty()
                                     ? std::string(":memory:")
                                     : common::expand_path(config.vector_store.path);
  auto sqlite = vectorstore::SqliteVectorStore::open(
      store_path, std::shared_ptr<vectorstore::IEmbedder>(std::move(embedder.value())));
  if (!sqlite.ok()) {
    return fail(sqlite);
  }

  auto store_pool = std::make_shared<common::WorkerPool>(
      static_cast<std::size_t>(config.vector_store.worker_threads));
  vectorstore::PooledVectorStore store(sqlite.value(), store_pool);

  auto router_collection = store.collection(config.router.collection);
  if (!router_collection.ok()) {
    return fail(router_collection);
  }
  auto skills_collection = store.collection(config.skills.collection);
  if (!skills_collection.ok()) {
    return fail(skills_collection);
  }
  auto implants_collection = store.collection(config.implants.collection);
  if (!implants_collection.ok()) {
    return fail(implants_collection);
  }

  OrchestratorParts parts;
  parts.pools.push_back(store_pool);
  parts.model = config.default_model;
  parts.temperature = config.default_temperature;

  parts.skills = std::make_shared<retrieval::RelevanceRetriever>(
      retrieval::skills_options(config.skills, root), skills_collection.value());
  parts.implants = std::make_shared<retrieval::RelevanceRetriever>(
      retrieval::implants_options(config.implants, root), implants_collection.value());
  for (const auto &retriever : {parts.skills, parts.implants}) {
    if (auto indexed = retriever->ensure_indexed(); !indexed.ok()) {
      observability::record_error(retriever->options().component,
                                  "initial index failed: " + indexed.error());
    }
  }

  std::shared_ptr<router::IClassifier> classifier;
  auto provider = providers::create_reliable_provider(config, std::move(http_client));
  if (provider.ok()) {
    parts.provider = provider.value();
    auto classifier_pool = std::make_shared<common::WorkerPool>(CLASSIFIER_THREADS);
    parts.pools.push_back(classifier_pool);
    classifier = std::make_shared<router::ProviderClassifier>(
        parts.provider,
        router::ClassifierOptions{
            .model = config.router.classifier_model.empty() ? config.default_model
                                                             : config.router.classifier_model,
            .temperature = config.router.classifier_temperature,
            .timeout = std::chrono::milliseconds(config.router.classifier_timeout_ms),
        },
        classifier_pool);
  } else {
    observability::record_warning("router", "classifier disabled: " + provider.error());
  }

  const std::filesystem::path agents_dir(config.router.agents_directory);
  parts.router = std::make_shared<router::SemanticRouter>(
      router_collection.value(), classifier,
      prompt::scan_agents(agents_dir.is_absolute() ? agents_dir : root / agents_dir),
      router::router_options(config.router));
  parts.resolver = std::make_shared<prompt::PromptResolver>(root);
  parts.context_builder =
      std::make_shared<context::ContextBuilder>(std::make_shared<context::ScriptLanguageDetector>());
  parts.session_cache = std::make_shared<SessionCache>(
      static_cast<std::size_t>(config.session_cache.capacity),
      std::chrono::seconds(config.session_cache.ttl_seconds));

  return common::Result<std::unique_ptr<Orchestrator>>::success(
      std::make_unique<Orchestrator>(std::move(parts)));
}

} // namespace conductor::session
