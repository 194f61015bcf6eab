#include "conductor/vectorstore/pooled_collection.hpp"

#include "conductor/observability/global.hpp"

#include <exception>

namespace conductor::vectorstore {

namespace {

template <typename R, typename Fn>
R run_pooled(common::WorkerPool &pool, const std::string &collection, Fn &&fn) {
  observability::record_metric(observability::WorkerQueueDepthMetric{.depth = pool.pending()});
  try {
    return pool.submit(std::forward<Fn>(fn)).get();
  } catch (const std::exception &e) {
    observability::record_error("vector_store", collection + ": " + e.what());
    return R::failure(std::string("vector store job failed: ") + e.what(),
                      common::ErrorKind::Upstream);
  }
}

} // namespace

PooledVectorCollection::PooledVectorCollection(std::shared_ptr<IVectorCollection> inner,
                                               std::shared_ptr<common::WorkerPool> pool)
    : inner_(std::move(inner)), pool_(std::move(pool)) {}

std::string_view PooledVectorCollection::name() const { return inner_->name(); }

common::Status PooledVectorCollection::upsert(const std::vector<std::string> &ids,
                                              const std::vector<std::string> &documents,
                                              const std::vector<Metadata> &metadatas) {
  auto inner = inner_;
  auto result = run_pooled<common::Result<bool>>(
      *pool_, std::string(inner_->name()), [inner, ids, documents, metadatas] {
        auto status = inner->upsert(ids, documents, metadatas);
        return status.ok() ? common::Result<bool>::success(true)
                           : common::Result<bool>::failure(status);
      });
  return result.status();
}

common::Result<std::vector<QueryMatch>> PooledVectorCollection::query(const std::string &text,
                                                                      const std::size_t k) {
  auto inner = inner_;
  return run_pooled<common::Result<std::vector<QueryMatch>>>(
      *pool_, std::string(inner_->name()), [inner, text, k] { return inner->query(text, k); });
}

common::Result<std::vector<StoredDocument>>
PooledVectorCollection::get(const std::vector<std::string> &ids) {
  auto inner = inner_;
  return run_pooled<common::Result<std::vector<StoredDocument>>>(
      *pool_, std::string(inner_->name()), [inner, ids] { return inner->get(ids); });
}

common::Result<std::size_t> PooledVectorCollection::count() {
  auto inner = inner_;
  return run_pooled<common::Result<std::size_t>>(*pool_, std::string(inner_->name()),
                                                 [inner] { return inner->count(); });
}

PooledVectorStore::PooledVectorStore(std::shared_ptr<IVectorStore> inner,
                                     std::shared_ptr<common::WorkerPool> pool)
    : inner_(std::move(inner)), pool_(std::move(pool)) {}

common::Result<std::shared_ptr<IVectorCollection>>
PooledVectorStore::collection(const std::string &name) {
  auto opened = inner_->collection(name);
  if (!opened.ok()) {
    return opened;
  }
  return common::Result<std::shared_ptr<IVectorCollection>>::success(
      std::make_shared<PooledVectorCollection>(opened.value(), pool_));
}

} // namespace conductor::vectorstore
