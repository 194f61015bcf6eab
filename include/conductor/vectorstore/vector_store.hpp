#pragma once

#include "conductor/common/result.hpp"

#include <map>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace conductor::vectorstore {

using Metadata = std::map<std::string, std::string>;

struct StoredDocument {
  std::string id;
  std::string document;
  Metadata metadata;
};

struct QueryMatch {
  std::string id;
  /// Cosine distance to the query text.
  double distance = 0.0;
  std::string document;
  Metadata metadata;
};

/// One named collection: documents keyed by id, searched by cosine distance
/// between embeddings of the stored document text and the query text.
class IVectorCollection {
public:
  virtual ~IVectorCollection() = default;

  [[nodiscard]] virtual std::string_view name() const = 0;

  /// Insert or overwrite by id. The three sequences are parallel.
  [[nodiscard]] virtual common::Status upsert(const std::vector<std::string> &ids,
                                              const std::vector<std::string> &documents,
                                              const std::vector<Metadata> &metadatas) = 0;

  /// Up to `k` nearest documents, nearest first.
  [[nodiscard]] virtual common::Result<std::vector<QueryMatch>> query(const std::string &text,
                                                                      std::size_t k) = 0;

  /// Documents present in the collection, in the order requested. Unknown ids
  /// are skipped.
  [[nodiscard]] virtual common::Result<std::vector<StoredDocument>>
  get(const std::vector<std::string> &ids) = 0;

  [[nodiscard]] virtual common::Result<std::size_t> count() = 0;
};

class IVectorStore {
public:
  virtual ~IVectorStore() = default;

  /// Open (creating if needed) the named collection.
  [[nodiscard]] virtual common::Result<std::shared_ptr<IVectorCollection>>
  collection(const std::string &name) = 0;
};

} // namespace conductor::vectorstore
