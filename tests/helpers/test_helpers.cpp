#include "tests/helpers/test_helpers.hpp"

#include <fstream>
#include <random>
#include <thread>

namespace conductor::testing {

config::Config mock_config() {
  config::Config config;
  config.default_provider = "openai";
  config.default_model = "gpt-4o-mini";
  config.api_key = "test-key";
  config.vector_store.path = "";
  config.vector_store.embedding_provider = "local";
  config.vector_store.embedding_dimensions = 64;
  config.vector_store.worker_threads = 2;
  config.observability.backend = "none";
  return config;
}

void MockProvider::set_response(std::string response) {
  std::lock_guard<std::mutex> lock(mutex_);
  response_ = std::move(response);
  error_.reset();
}

void MockProvider::set_error(std::string error_message, const common::ErrorKind kind) {
  std::lock_guard<std::mutex> lock(mutex_);
  error_ = std::move(error_message);
  error_kind_ = kind;
  response_.reset();
}

common::Result<std::string> MockProvider::chat(const providers::ChatRequest &request) {
  ++calls_;
  if (delay_.count() > 0) {
    std::this_thread::sleep_for(delay_);
  }
  std::lock_guard<std::mutex> lock(mutex_);
  last_request_ = request;
  if (error_.has_value()) {
    return common::Result<std::string>::failure(*error_, error_kind_);
  }
  return common::Result<std::string>::success(response_.value_or("mock-response"));
}

providers::ChatRequest MockProvider::last_request() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return last_request_;
}


TempWorkspace::TempWorkspace() {
  static std::mt19937_64 rng{std::random_device{}()};
  path_ = std::filesystem::temp_directory_path() /
          ("conductor-test-workspace-" + std::to_string(rng()));
  std::filesystem::create_directories(path_);
}

TempWorkspace::~TempWorkspace() {
  std::error_code ec;
  std::filesystem::remove_all(path_, ec);
}

void TempWorkspace::create_file(const std::string &name, const std::string &content) const {
  const auto file_path = path_ / name;
  std::error_code ec;
  std::filesystem::create_directories(file_path.parent_path(), ec);
  std::ofstream out(file_path, std::ios::trunc | std::ios::binary);
  out << content;
}

void TempWorkspace::create_agent(const std::string &agent, const std::string &content) const {
  create_file(".cursor/agents/" + agent + "/system_prompt.mdc", content);
}

void TempWorkspace::create_skill(const std::string &file, const std::string &description,
                                 const std::string &body) const {
  create_file(".cursor/skills/" + file, "---\ndescription: " + description + "\n---\n" + body);
}

void TempWorkspace::create_implant(const std::string &file, const std::string &description,
                                   const std::string &body) const {
  create_file(".cursor/implants/" + file, "---\ndescription: " + description + "\n---\n" + body);
}

config::Config temp_config(const TempWorkspace &workspace) {
  auto config = mock_config();
  config.root = workspace.path().string();
  return config;
}

std::string agent_document(const std::string &name, const std::string &body,
                           const std::vector<std::string> &preferred_skills) {
  std::string out = "---\nname: " + name + "\ndescription: Test agent " + name + "\n";
  if (!preferred_skills.empty()) {
    out += "preferred_skills:\n";
    for (const auto &skill : preferred_skills) {
      out += "  - " + skill + "\n";
    }
  }
  out += "---\n" + body;
  return out;
}

common::Status StubCollection::upsert(const std::vector<std::string> &ids,
                                      const std::vector<std::string> &documents,
                                      const std::vector<vectorstore::Metadata> &metadatas) {
  ++upsert_calls;
  if (fail_with.has_value()) {
    return common::Status::error(*fail_with);
  }
  for (std::size_t i = 0; i < ids.size(); ++i) {
    vectorstore::StoredDocument doc{.id = ids[i], .document = documents[i], .metadata = metadatas[i]};
    upserted.push_back(doc);
    documents_[ids[i]] = std::move(doc);
  }
  return common::Status::success();
}

common::Result<std::vector<vectorstore::QueryMatch>>
StubCollection::query(const std::string &text, const std::size_t k) {
  ++query_calls;
  queried_texts.push_back(text);
  if (fail_with.has_value()) {
    return common::Result<std::vector<vectorstore::QueryMatch>>::failure(*fail_with);
  }
  std::vector<vectorstore::QueryMatch> out;
  for (std::size_t i = 0; i < scripted_matches.size() && i < k; ++i) {
    out.push_back(scripted_matches[i]);
  }
  return common::Result<std::vector<vectorstore::QueryMatch>>::success(std::move(out));
}

common::Result<std::vector<vectorstore::StoredDocument>>
StubCollection::get(const std::vector<std::string> &ids) {
  if (fail_with.has_value()) {
    return common::Result<std::vector<vectorstore::StoredDocument>>::failure(*fail_with);
  }
  std::vector<vectorstore::StoredDocument> out;
  for (const auto &id : ids) {
    if (const auto it = documents_.find(id); it != documents_.end()) {
      out.push_back(it->second);
    }
  }
  return common::Result<std::vector<vectorstore::StoredDocument>>::success(std::move(out));
}

common::Result<std::size_t> StubCollection::count() {
  if (fail_with.has_value()) {
    return common::Result<std::size_t>::failure(*fail_with);
  }
  return common::Result<std::size_t>::success(documents_.size());
}

void StubCollection::add_document(const std::string &id, const std::string &document,
                                  vectorstore::Metadata metadata) {
  documents_[id] = vectorstore::StoredDocument{
      .id = id, .document = document, .metadata = std::move(metadata)};
}

} // namespace conductor::testing
