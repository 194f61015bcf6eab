#pragma once

#include "conductor/common/worker_pool.hpp"
#include "conductor/vectorstore/vector_store.hpp"

#include <memory>

namespace conductor::vectorstore {

/// Runs every call of the wrapped collection on a shared WorkerPool and waits
/// for the result, so blocking SQLite and embedding work stays off the
/// request thread. A job that throws becomes an Upstream failure.
class PooledVectorCollection final : public IVectorCollection {
public:
  PooledVectorCollection(std::shared_ptr<IVectorCollection> inner,
                         std::shared_ptr<common::WorkerPool> pool);

  [[nodiscard]] std::string_view name() const override;
  [[nodiscard]] common::Status upsert(const std::vector<std::string> &ids,
                                      const std::vector<std::string> &documents,
                                      const std::vector<Metadata> &metadatas) override;
  [[nodiscard]] common::Result<std::vector<QueryMatch>> query(const std::string &text,
                                                              std::size_t k) override;
  [[nodiscard]] common::Result<std::vector<StoredDocument>>
  get(const std::vector<std::string> &ids) override;
  [[nodiscard]] common::Result<std::size_t> count() override;

private:
  std::shared_ptr<IVectorCollection> inner_;
  std::shared_ptr<common::WorkerPool> pool_;
};

/// Store adapter handing out PooledVectorCollection wrappers.
class PooledVectorStore final : public IVectorStore {
public:
  PooledVectorStore(std::shared_ptr<IVectorStore> inner, std::shared_ptr<common::WorkerPool> pool);

  [[nodiscard]] common::Result<std::shared_ptr<IVectorCollection>>
  collection(const std::string &name) override;

private:
  std::shared_ptr<IVectorStore> inner_;
  std::shared_ptr<common::WorkerPool> pool_;
};

} // namespace conductor::vectorstore
