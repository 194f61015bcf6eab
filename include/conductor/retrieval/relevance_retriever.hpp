#pragma once

#include "conductor/common/result.hpp"
#include "conductor/config/schema.hpp"
#include "conductor/vectorstore/vector_store.hpp"

#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace conductor::retrieval {

/// What distinguishes one retriever instance from another. Indexing and
/// filtering logic is shared.
struct RetrieverOptions {
  /// "skills" or "implants"; used in logs and events.
  std::string component;
  std::filesystem::path directory;
  double threshold = 0.5;
  std::size_t default_results = 2;
  /// Prompt block heading, e.g. "## Dynamic Skills (Contextually Loaded)".
  std::string heading;
  std::string intro;
  /// Per-entry label: "Skill" or "Implant".
  std::string label;
};

[[nodiscard]] RetrieverOptions skills_options(const config::RetrieverConfig &config,
                                              const std::filesystem::path &root);
[[nodiscard]] RetrieverOptions implants_options(const config::RetrieverConfig &config,
                                                const std::filesystem::path &root);

struct RetrievedDocument {
  std::string id;
  /// Clean body (frontmatter stripped), falling back to the indexed text.
  std::string content;
  vectorstore::Metadata metadata;
  double distance = 0.0;
};

/// Indexes a flat directory of `.mdc` documents into one vector collection and
/// returns the entries relevant to a query.
class RelevanceRetriever {
public:
  RelevanceRetriever(RetrieverOptions options,
                     std::shared_ptr<vectorstore::IVectorCollection> collection);

  /// Index `options().directory` when the collection is empty. Returns the
  /// number of documents indexed (0 when nothing was needed).
  [[nodiscard]] common::Result<std::size_t> ensure_indexed();

  /// Upsert every `*.mdc` in `directory`, keyed by file name. Unreadable files
  /// are logged and skipped.
  [[nodiscard]] common::Result<std::size_t> index(const std::filesystem::path &directory);
  [[nodiscard]] common::Result<std::size_t> index() { return index(options_.directory); }

  /// With `preferred_ids`, fetch those ids (normalised to `<id>.mdc`) in
  /// request order at distance 0, falling through to similarity search when
  /// none come back. Otherwise the `n` nearest documents strictly below
  /// `threshold`. Store failures are logged and yield an empty sequence.
  [[nodiscard]] std::vector<RetrievedDocument>
  retrieve(const std::string &query, std::optional<std::size_t> n = std::nullopt,
           std::optional<double> threshold = std::nullopt,
           const std::vector<std::string> &preferred_ids = {});

  /// Exact fetch by id; no similarity fallback.
  [[nodiscard]] std::vector<RetrievedDocument> get_by_ids(const std::vector<std::string> &ids);

  /// Markdown block for the system prompt; empty for no documents.
  [[nodiscard]] std::string format(const std::vector<RetrievedDocument> &documents) const;

  [[nodiscard]] const RetrieverOptions &options() const { return options_; }

private:
  [[nodiscard]] std::optional<std::vector<RetrievedDocument>>
  fetch_ids(const std::vector<std::string> &ids);

  RetrieverOptions options_;
  std::shared_ptr<vectorstore::IVectorCollection> collection_;
};

/// `foo` -> `foo.mdc`; ids already carrying the extension are unchanged.
[[nodiscard]] std::string normalize_document_id(const std::string &id);

} // namespace conductor::retrieval
