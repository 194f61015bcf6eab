#pragma once

#include "conductor/config/schema.hpp"
#include "conductor/providers/traits.hpp"
#include "conductor/vectorstore/embedder_local.hpp"
#include "conductor/vectorstore/vector_store.hpp"

#include <atomic>
#include <chrono>
#include <filesystem>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace conductor::testing {

/// Offline config: in-memory vector store, local embedder, no logging.
config::Config mock_config();

class MockProvider final : public providers::Provider {
public:
  void set_response(std::string response);
  void set_error(std::string error_message,
                 common::ErrorKind kind = common::ErrorKind::Upstream);
  void set_delay(std::chrono::milliseconds delay) { delay_ = delay; }

  [[nodiscard]] common::Result<std::string> chat(const providers::ChatRequest &request) override;
  [[nodiscard]] std::string name() const override { return "mock"; }

  [[nodiscard]] std::size_t calls() const { return calls_.load(); }
  [[nodiscard]] providers::ChatRequest last_request() const;

private:
  std::optional<std::string> response_;
  std::optional<std::string> error_;
  common::ErrorKind error_kind_ = common::ErrorKind::Upstream;
  std::chrono::milliseconds delay_{0};
  std::atomic<std::size_t> calls_{0};
  mutable std::mutex mutex_;
  providers::ChatRequest last_request_;
};

class TempWorkspace {
public:
  TempWorkspace();
  ~TempWorkspace();

  TempWorkspace(const TempWorkspace &) = delete;
  TempWorkspace &operator=(const TempWorkspace &) = delete;

  [[nodiscard]] const std::filesystem::path &path() const { return path_; }
  void create_file(const std::string &name, const std::string &content) const;

  /// `.cursor/agents/<agent>/system_prompt.mdc`
  void create_agent(const std::string &agent, const std::string &content) const;
  /// `.cursor/skills/<file>` or `.cursor/implants/<file>` with a description.
  void create_skill(const std::string &file, const std::string &description,
                    const std::string &body) const;
  void create_implant(const std::string &file, const std::string &description,
                      const std::string &body) const;

private:
  std::filesystem::path path_;
};

config::Config temp_config(const TempWorkspace &workspace);

/// Agent prompt with the minimal valid frontmatter.
std::string agent_document(const std::string &name, const std::string &body,
                           const std::vector<std::string> &preferred_skills = {});

/// In-memory collection with scripted query results and call counters.
class StubCollection final : public vectorstore::IVectorCollection {
public:
  explicit StubCollection(std::string name = "stub") : name_(std::move(name)) {}

  [[nodiscard]] std::string_view name() const override { return name_; }
  [[nodiscard]] common::Status upsert(const std::vector<std::string> &ids,
                                      const std::vector<std::string> &documents,
                                      const std::vector<vectorstore::Metadata> &metadatas) override;
  [[nodiscard]] common::Result<std::vector<vectorstore::QueryMatch>>
  query(const std::string &text, std::size_t k) override;
  [[nodiscard]] common::Result<std::vector<vectorstore::StoredDocument>>
  get(const std::vector<std::string> &ids) override;
  [[nodiscard]] common::Result<std::size_t> count() override;

  void add_document(const std::string &id, const std::string &document,
                    vectorstore::Metadata metadata = {});

  /// Returned by `query`, truncated to k.
  std::vector<vectorstore::QueryMatch> scripted_matches;
  std::optional<std::string> fail_with;

  std::size_t query_calls = 0;
  std::size_t upsert_calls = 0;
  std::vector<std::string> queried_texts;
  std::vector<vectorstore::StoredDocument> upserted;

private:
  std::string name_;
  std::map<std::string, vectorstore::StoredDocument> documents_;
};

/// LocalEmbedder that counts the texts it embeds.
class CountingEmbedder final : public vectorstore::IEmbedder {
public:
  explicit CountingEmbedder(std::size_t dimensions = 64) : inner_(dimensions) {}

  [[nodiscard]] std::string_view name() const override { return inner_.name(); }
  [[nodiscard]] common::Result<std::vector<float>> embed(std::string_view text) override {
    ++calls;
    return inner_.embed(text);
  }
  [[nodiscard]] std::size_t dimensions() const override { return inner_.dimensions(); }

  std::atomic<std::size_t> calls{0};

private:
  vectorstore::LocalEmbedder inner_;
};

} // namespace conductor::testing
