#pragma once

#include "conductor/vectorstore/embedder.hpp"
#include "conductor/vectorstore/vector_index.hpp"
#include "conductor/vectorstore/vector_store.hpp"

#include <filesystem>
#include <mutex>
#include <optional>
#include <sqlite3.h>
#include <unordered_map>

namespace conductor::vectorstore {

/// Persistent vector store in one SQLite file. Documents, metadata and
/// embeddings live in SQLite; each collection also keeps an in-memory
/// VectorIndex rebuilt from the stored embeddings when first opened.
/// Embeddings are cached by SHA-256 of (embedder name, text).
///
/// All access is serialised on one mutex; callers that must not block run the
/// calls through a PooledVectorCollection.
class SqliteVectorStore final : public IVectorStore,
                                public std::enable_shared_from_this<SqliteVectorStore> {
  struct Passkey {
    explicit Passkey() = default;
  };

public:
  /// `db_path` of ":memory:" (or empty) keeps the database in memory.
  [[nodiscard]] static common::Result<std::shared_ptr<SqliteVectorStore>>
  open(const std::filesystem::path &db_path, std::shared_ptr<IEmbedder> embedder);

  /// Only callable from open(); takes ownership of `db`.
  SqliteVectorStore(Passkey, sqlite3 *db, std::shared_ptr<IEmbedder> embedder);
  ~SqliteVectorStore() override;
  SqliteVectorStore(const SqliteVectorStore &) = delete;
  SqliteVectorStore &operator=(const SqliteVectorStore &) = delete;

  [[nodiscard]] common::Result<std::shared_ptr<IVectorCollection>>
  collection(const std::string &name) override;

  [[nodiscard]] common::Status upsert(const std::string &collection,
                                      const std::vector<std::string> &ids,
                                      const std::vector<std::string> &documents,
                                      const std::vector<Metadata> &metadatas);
  [[nodiscard]] common::Result<std::vector<QueryMatch>>
  query(const std::string &collection, const std::string &text, std::size_t k);
  [[nodiscard]] common::Result<std::vector<StoredDocument>>
  get(const std::string &collection, const std::vector<std::string> &ids);
  [[nodiscard]] common::Result<std::size_t> count(const std::string &collection);

  [[nodiscard]] std::size_t embedding_cache_hits() const;

private:
  [[nodiscard]] common::Status init_schema();
  [[nodiscard]] common::Result<VectorIndex *> index_for(const std::string &collection);
  [[nodiscard]] common::Result<std::vector<float>> embedding_for_text(const std::string &text);
  [[nodiscard]] common::Result<std::optional<std::vector<float>>>
  cached_embedding(const std::string &hash);
  [[nodiscard]] common::Status cache_embedding(const std::string &hash,
                                               const std::vector<float> &embedding);
  [[nodiscard]] common::Result<std::optional<StoredDocument>>
  load_document(const std::string &collection, const std::string &id);

  sqlite3 *db_ = nullptr;
  std::shared_ptr<IEmbedder> embedder_;
  mutable std::mutex mutex_;
  std::unordered_map<std::string, VectorIndex> indexes_;
  std::size_t cache_hits_ = 0;
};

} // namespace conductor::vectorstore
