#include "conductor/vectorstore/sqlite_store.hpp"

#include "conductor/common/fs.hpp"
#include "conductor/common/hash.hpp"
#include "conductor/common/json_util.hpp"
#include "conductor/observability/global.hpp"

#include <chrono>
#include <cstring>

namespace conductor::vectorstore {

namespace {

std::vector<unsigned char> vector_to_blob(const std::vector<float> &values) {
  std::vector<unsigned char> blob(values.size() * sizeof(float));
  std::memcpy(blob.data(), values.data(), blob.size());
  return blob;
}

std::vector<float> blob_to_vector(const void *blob, const int bytes) {
  if (blob == nullptr || bytes <= 0 || (bytes % static_cast<int>(sizeof(float)) != 0)) {
    return {};
  }
  std::vector<float> values(static_cast<std::size_t>(bytes) / sizeof(float));
  std::memcpy(values.data(), blob, static_cast<std::size_t>(bytes));
  return values;
}

std::string column_text(sqlite3_stmt *stmt, const int column) {
  const auto *text = reinterpret_cast<const char *>(sqlite3_column_text(stmt, column));
  return text == nullptr ? std::string() : std::string(text);
}

std::int64_t now_unix() {
  return std::chrono::duration_cast<std::chrono::seconds>(
             std::chrono::system_clock::now().time_since_epoch())
      .count();
}

common::Status exec_sql(sqlite3 *db, const std::string &sql) {
  char *err = nullptr;
  const int rc = sqlite3_exec(db, sql.c_str(), nullptr, nullptr, &err);
  if (rc != SQLITE_OK) {
    const std::string msg = err == nullptr ? "sqlite error" : err;
    sqlite3_free(err);
    return common::Status::error(msg, common::ErrorKind::Io);
  }
  return common::Status::success();
}

class SqliteCollection final : public IVectorCollection {
public:
  SqliteCollection(std::shared_ptr<SqliteVectorStore> store, std::string name)
      : store_(std::move(store)), name_(std::move(name)) {}

  [[nodiscard]] std::string_view name() const override { return name_; }

  [[nodiscard]] common::Status upsert(const std::vector<std::string> &ids,
                                      const std::vector<std::string> &documents,
                                      const std::vector<Metadata> &metadatas) override {
    return store_->upsert(name_, ids, documents, metadatas);
  }

  [[nodiscard]] common::Result<std::vector<QueryMatch>> query(const std::string &text,
                                                              const std::size_t k) override {
    return store_->query(name_, text, k);
  }

  [[nodiscard]] common::Result<std::vector<StoredDocument>>
  get(const std::vector<std::string> &ids) override {
    return store_->get(name_, ids);
  }

  [[nodiscard]] common::Result<std::size_t> count() override { return store_->count(name_); }

private:
  std::shared_ptr<SqliteVectorStore> store_;
  std::string name_;
};

} // namespace

common::Result<std::shared_ptr<SqliteVectorStore>>
SqliteVectorStore::open(const std::filesystem::path &db_path, std::shared_ptr<IEmbedder> embedder) {
  using R = common::Result<std::shared_ptr<SqliteVectorStore>>;
  if (embedder == nullptr) {
    return R::failure("vector store requires an embedder", common::ErrorKind::Validation);
  }

  const std::string path_text = db_path.empty() ? ":memory:" : db_path.string();
  if (path_text != ":memory:" && !db_path.parent_path().empty()) {
    if (auto dir = common::ensure_dir(db_path.parent_path()); !dir.ok()) {
      return R::failure(dir.status());
    }
  }

  sqlite3 *db = nullptr;
  if (sqlite3_open(path_text.c_str(), &db) != SQLITE_OK) {
    const std::string message = db == nullptr ? "out of memory" : sqlite3_errmsg(db);
    sqlite3_close(db);
    return R::failure("Failed to open vector store " + path_text + ": " + message,
                      common::ErrorKind::Io);
  }
  sqlite3_busy_timeout(db, 5000);

  auto store = std::make_shared<SqliteVectorStore>(Passkey{}, db, std::move(embedder));
  if (auto status = store->init_schema(); !status.ok()) {
    return R::failure(status);
  }
  return R::success(std::move(store));
}

SqliteVectorStore::SqliteVectorStore(Passkey, sqlite3 *db, std::shared_ptr<IEmbedder> embedder)
    : db_(db), embedder_(std::move(embedder)) {}

SqliteVectorStore::~SqliteVectorStore() {
  if (db_ != nullptr) {
    sqlite3_close(db_);
  }
}

common::Status SqliteVectorStore::init_schema() {
  // WAL is unavailable for in-memory databases; the pragma then reports "memory".
  auto status = exec_sql(db_, "PRAGMA journal_mode=WAL;");
  if (!status.ok()) {
    return status;
  }
  status = exec_sql(db_, R"(
CREATE TABLE IF NOT EXISTS documents (
  collection TEXT NOT NULL,
  id TEXT NOT NULL,
  document TEXT NOT NULL,
  metadata TEXT NOT NULL DEFAULT '{}',
  embedding BLOB,
  embedder TEXT NOT NULL DEFAULT '',
  updated_at INTEGER NOT NULL,
  PRIMARY KEY (collection, id)
);
)");
  if (!status.ok()) {
    return status;
  }
  return exec_sql(db_, R"(
CREATE TABLE IF NOT EXISTS embedding_cache (
  text_hash TEXT PRIMARY KEY,
  embedding BLOB NOT NULL,
  created_at INTEGER NOT NULL
);
)");
}

common::Result<std::shared_ptr<IVectorCollection>>
SqliteVectorStore::collection(const std::string &name) {
  using R = common::Result<std::shared_ptr<IVectorCollection>>;
  if (common::trim(name).empty()) {
    return R::failure("collection name must not be empty", common::ErrorKind::Validation);
  }
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto index = index_for(name);
    if (!index.ok()) {
      return R::failure(index.status());
    }
  }
  return R::success(std::make_shared<SqliteCollection>(shared_from_this(), name));
}

common::Result<std::optional<std::vector<float>>>
SqliteVectorStore::cached_embedding(const std::string &hash) {
  using R = common::Result<std::optional<std::vector<float>>>;
  sqlite3_stmt *stmt = nullptr;
  if (sqlite3_prepare_v2(db_, "SELECT embedding FROM embedding_cache WHERE text_hash = ?1", -1,
                         &stmt, nullptr) != SQLITE_OK) {
    return R::failure(sqlite3_errmsg(db_), common::ErrorKind::Io);
  }
  sqlite3_bind_text(stmt, 1, hash.c_str(), -1, SQLITE_TRANSIENT);

  std::optional<std::vector<float>> found;
  if (sqlite3_step(stmt) == SQLITE_ROW) {
    auto values = blob_to_vector(sqlite3_column_blob(stmt, 0), sqlite3_column_bytes(stmt, 0));
    if (values.size() == embedder_->dimensions()) {
      found = std::move(values);
    }
  }
  sqlite3_finalize(stmt);
  return R::success(std::move(found));
}

common::Status SqliteVectorStore::cache_embedding(const std::string &hash,
                                                  const std::vector<float> &embedding) {
  sqlite3_stmt *stmt = nullptr;
  const char *sql =
      "INSERT OR REPLACE INTO embedding_cache(text_hash, embedding, created_at) VALUES(?1, ?2, ?3)";
  if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
    return common::Status::error(sqlite3_errmsg(db_), common::ErrorKind::Io);
  }
  const auto blob = vector_to_blob(embedding);
  sqlite3_bind_text(stmt, 1, hash.c_str(), -1, SQLITE_TRANSIENT);
  sqlite3_bind_blob(stmt, 2, blob.data(), static_cast<int>(blob.size()), SQLITE_TRANSIENT);
  sqlite3_bind_int64(stmt, 3, now_unix());
  const int rc = sqlite3_step(stmt);
  sqlite3_finalize(stmt);
  if (rc != SQLITE_DONE) {
    return common::Status::error(sqlite3_errmsg(db_), common::ErrorKind::Io);
  }
  return common::Status::success();
}

common::Result<std::vector<float>> SqliteVectorStore::embedding_for_text(const std::string &text) {
  const std::string hash = common::sha256_hex(std::string(embedder_->name()) + "\n" + text);
  auto cached = cached_embedding(hash);
  if (!cached.ok()) {
    return common::Result<std::vector<float>>::failure(cached.status());
  }
  if (cached.value().has_value()) {
    ++cache_hits_;
    return common::Result<std::vector<float>>::success(std::move(*cached.value()));
  }

  auto embedded = embedder_->embed(text);
  if (!embedded.ok()) {
    return embedded;
  }
  if (auto status = cache_embedding(hash, embedded.value()); !status.ok()) {
    observability::record_warning("vector_store", "embedding cache write failed: " + status.error());
  }
  return embedded;
}

common::Result<VectorIndex *> SqliteVectorStore::index_for(const std::string &collection) {
  if (auto it = indexes_.find(collection); it != indexes_.end()) {
    return common::Result<VectorIndex *>::success(&it->second);
  }

  VectorIndex index(embedder_->dimensions());
  sqlite3_stmt *stmt = nullptr;
  const char *sql =
      "SELECT id, document, embedding, embedder FROM documents WHERE collection = ?1";
  if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
    return common::Result<VectorIndex *>::failure(sqlite3_errmsg(db_), common::ErrorKind::Io);
  }
  sqlite3_bind_text(stmt, 1, collection.c_str(), -1, SQLITE_TRANSIENT);

  std::vector<std::pair<std::string, std::string>> stale;
  while (sqlite3_step(stmt) == SQLITE_ROW) {
    std::string id = column_text(stmt, 0);
    auto values = blob_to_vector(sqlite3_column_blob(stmt, 2), sqlite3_column_bytes(stmt, 2));
    if (column_text(stmt, 3) != embedder_->name() || !index.add(id, values).ok()) {
      stale.emplace_back(std::move(id), column_text(stmt, 1));
    }
  }
  sqlite3_finalize(stmt);

  // Rows written by a different embedder are re-embedded in memory.
  for (const auto &[id, document] : stale) {
    auto embedded = embedding_for_text(document);
    if (!embedded.ok()) {
      return common::Result<VectorIndex *>::failure(embedded.status());
    }
    if (auto status = index.add(id, embedded.value()); !status.ok()) {
      return common::Result<VectorIndex *>::failure(status);
    }
  }
  if (!stale.empty()) {
    observability::record_warning("vector_store", "re-embedded " + std::to_string(stale.size()) +
                                                      " documents in " + collection);
  }

  auto [it, _] = indexes_.emplace(collection, std::move(index));
  return common::Result<VectorIndex *>::success(&it->second);
}

common::Status SqliteVectorStore::upsert(const std::string &collection,
                                         const std::vector<std::string> &ids,
                                         const std::vector<std::string> &documents,
                                         const std::vector<Metadata> &metadatas) {
  if (ids.size() != documents.size() || ids.size() != metadatas.size()) {
    return common::Status::error("upsert: ids, documents and metadatas differ in length",
                                 common::ErrorKind::Validation);
  }
  std::lock_guard<std::mutex> lock(mutex_);
  auto index = index_for(collection);
  if (!index.ok()) {
    return index.status();
  }

  std::vector<std::vector<float>> embeddings;
  embeddings.reserve(ids.size());
  for (const auto &document : documents) {
    auto embedded = embedding_for_text(document);
    if (!embedded.ok()) {
      return embedded.status();
    }
    embeddings.push_back(std::move(embedded.value()));
  }

  if (auto status = exec_sql(db_, "BEGIN IMMEDIATE;"); !status.ok()) {
    return status;
  }
  sqlite3_stmt *stmt = nullptr;
  const char *sql = R"(
INSERT INTO documents(collection, id, document, metadata, embedding, embedder, updated_at)
VALUES(?1, ?2, ?3, ?4, ?5, ?6, ?7)
ON CONFLICT(collection, id) DO UPDATE SET
  document=excluded.document,
  metadata=excluded.metadata,
  embedding=excluded.embedding,
  embedder=excluded.embedder,
  updated_at=excluded.updated_at
)";
  if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
    const std::string message = sqlite3_errmsg(db_);
    if (auto rollback = exec_sql(db_, "ROLLBACK;"); !rollback.ok()) {
      observability::record_error("vector_store", "rollback failed: " + rollback.error());
    }
    return common::Status::error(message, common::ErrorKind::Io);
  }

  const std::string embedder_name(embedder_->name());
  const std::int64_t now = now_unix();
  for (std::size_t i = 0; i < ids.size(); ++i) {
    const std::string metadata = common::json_serialize_flat(metadatas[i]);
    const auto blob = vector_to_blob(embeddings[i]);
    sqlite3_bind_text(stmt, 1, collection.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 2, ids[i].c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 3, documents[i].c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 4, metadata.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_blob(stmt, 5, blob.data(), static_cast<int>(blob.size()), SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 6, embedder_name.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_int64(stmt, 7, now);
    if (sqlite3_step(stmt) != SQLITE_DONE) {
      const std::string message = sqlite3_errmsg(db_);
      sqlite3_finalize(stmt);
      if (auto rollback = exec_sql(db_, "ROLLBACK;"); !rollback.ok()) {
        observability::record_error("vector_store", "rollback failed: " + rollback.error());
      }
      return common::Status::error(message, common::ErrorKind::Io);
    }
    sqlite3_reset(stmt);
    sqlite3_clear_bindings(stmt);
  }
  sqlite3_finalize(stmt);
  if (auto status = exec_sql(db_, "COMMIT;"); !status.ok()) {
    return status;
  }

  for (std::size_t i = 0; i < ids.size(); ++i) {
    if (auto status = index.value()->add(ids[i], embeddings[i]); !status.ok()) {
      return status;
    }
  }
  return common::Status::success();
}

common::Result<std::optional<StoredDocument>>
SqliteVectorStore::load_document(const std::string &collection, const std::string &id) {
  using R = common::Result<std::optional<StoredDocument>>;
  sqlite3_stmt *stmt = nullptr;
  const char *sql = "SELECT document, metadata FROM documents WHERE collection = ?1 AND id = ?2";
  if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
    return R::failure(sqlite3_errmsg(db_), common::ErrorKind::Io);
  }
  sqlite3_bind_text(stmt, 1, collection.c_str(), -1, SQLITE_TRANSIENT);
  sqlite3_bind_text(stmt, 2, id.c_str(), -1, SQLITE_TRANSIENT);

  std::optional<StoredDocument> found;
  const int rc = sqlite3_step(stmt);
  if (rc == SQLITE_ROW) {
    found = StoredDocument{
        .id = id,
        .document = column_text(stmt, 0),
        .metadata = common::json_parse_flat(column_text(stmt, 1)),
    };
  }
  sqlite3_finalize(stmt);
  if (rc != SQLITE_ROW && rc != SQLITE_DONE) {
    return R::failure(sqlite3_errmsg(db_), common::ErrorKind::Io);
  }
  return R::success(std::move(found));
}

common::Result<std::vector<QueryMatch>>
SqliteVectorStore::query(const std::string &collection, const std::string &text,
                         const std::size_t k) {
  using R = common::Result<std::vector<QueryMatch>>;
  std::lock_guard<std::mutex> lock(mutex_);
  auto index = index_for(collection);
  if (!index.ok()) {
    return R::failure(index.status());
  }
  if (index.value()->size() == 0 || k == 0) {
    return R::success({});
  }

  auto embedded = embedding_for_text(text);
  if (!embedded.ok()) {
    return R::failure(embedded.status());
  }
  auto hits = index.value()->search(embedded.value(), k);
  if (!hits.ok()) {
    return R::failure(hits.status());
  }

  std::vector<QueryMatch> matches;
  matches.reserve(hits.value().size());
  for (const auto &hit : hits.value()) {
    auto stored = load_document(collection, hit.key);
    if (!stored.ok()) {
      return R::failure(stored.status());
    }
    if (!stored.value().has_value()) {
      continue;
    }
    matches.push_back(QueryMatch{
        .id = hit.key,
        .distance = static_cast<double>(hit.distance),
        .document = std::move(stored.value()->document),
        .metadata = std::move(stored.value()->metadata),
    });
  }
  return R::success(std::move(matches));
}

common::Result<std::vector<StoredDocument>>
SqliteVectorStore::get(const std::string &collection, const std::vector<std::string> &ids) {
  using R = common::Result<std::vector<StoredDocument>>;
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<StoredDocument> out;
  for (const auto &id : ids) {
    auto stored = load_document(collection, id);
    if (!stored.ok()) {
      return R::failure(stored.status());
    }
    if (stored.value().has_value()) {
      out.push_back(std::move(*stored.value()));
    }
  }
  return R::success(std::move(out));
}

common::Result<std::size_t> SqliteVectorStore::count(const std::string &collection) {
  std::lock_guard<std::mutex> lock(mutex_);
  sqlite3_stmt *stmt = nullptr;
  if (sqlite3_prepare_v2(db_, "SELECT COUNT(*) FROM documents WHERE collection = ?1", -1, &stmt,
                         nullptr) != SQLITE_OK) {
    return common::Result<std::size_t>::failure(sqlite3_errmsg(db_), common::ErrorKind::Io);
  }
  sqlite3_bind_text(stmt, 1, collection.c_str(), -1, SQLITE_TRANSIENT);
  std::size_t total = 0;
  if (sqlite3_step(stmt) == SQLITE_ROW) {
    total = static_cast<std::size_t>(sqlite3_column_int64(stmt, 0));
  }
  sqlite3_finalize(stmt);
  return common::Result<std::size_t>::success(total);
}

std::size_t SqliteVectorStore::embedding_cache_hits() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return cache_hits_;
}

} // namespace conductor::vectorstore
