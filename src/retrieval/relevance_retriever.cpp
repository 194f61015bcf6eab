#include "conductor/retrieval/relevance_retriever.hpp"

#include "conductor/common/frontmatter.hpp"
#include "conductor/common/fs.hpp"
#include "conductor/observability/global.hpp"

#include <algorithm>
#include <chrono>
#include <sstream>

namespace conductor::retrieval {

namespace {

constexpr const char *DOCUMENT_EXTENSION = ".mdc";

RetrievedDocument to_retrieved(std::string id, const std::string &document,
                               vectorstore::Metadata metadata, const double distance) {
  RetrievedDocument out;
  out.id = std::move(id);
  const auto body = metadata.find("body");
  out.content = body == metadata.end() ? document : body->second;
  out.metadata = std::move(metadata);
  out.distance = distance;
  return out;
}

RetrieverOptions make_options(std::string component, const config::RetrieverConfig &config,
                              const std::filesystem::path &root) {
  RetrieverOptions options;
  options.component = std::move(component);
  const std::filesystem::path directory(common::expand_path(config.directory));
  options.directory = directory.is_absolute() ? directory : root / directory;
  options.threshold = config.threshold;
  options.default_results = static_cast<std::size_t>(config.default_results);
  return options;
}

} // namespace

RetrieverOptions skills_options(const config::RetrieverConfig &config,
                                const std::filesystem::path &root) {
  auto options = make_options("skills", config, root);
  options.heading = "## Dynamic Skills (Contextually Loaded)";
  options.intro = "The following specialized skills have been loaded to help with the request:";
  options.label = "Skill";
  return options;
}

RetrieverOptions implants_options(const config::RetrieverConfig &config,
                                  const std::filesystem::path &root) {
  auto options = make_options("implants", config, root);
  options.heading = "## Dynamic Implants (Contextually Loaded)";
  options.intro = "The following cognitive implants have been loaded to augment reasoning:";
  options.label = "Implant";
  return options;
}

std::string normalize_document_id(const std::string &id) {
  if (common::ends_with(id, DOCUMENT_EXTENSION)) {
    return id;
  }
  return id + DOCUMENT_EXTENSION;
}

RelevanceRetriever::RelevanceRetriever(RetrieverOptions options,
                                       std::shared_ptr<vectorstore::IVectorCollection> collection)
    : options_(std::move(options)), collection_(std::move(collection)) {}

common::Result<std::size_t> RelevanceRetriever::ensure_indexed() {
  auto count = collection_->count();
  if (!count.ok()) {
    return count;
  }
  if (count.value() > 0) {
    return common::Result<std::size_t>::success(0);
  }
  return index(options_.directory);
}

common::Result<std::size_t> RelevanceRetriever::index(const std::filesystem::path &directory) {
  std::error_code ec;
  if (!std::filesystem::is_directory(directory, ec)) {
    observability::record_warning(options_.component,
                                  "no " + options_.component + " directory at " + directory.string());
    return common::Result<std::size_t>::success(0);
  }

  std::vector<std::filesystem::path> files;
  for (const auto &entry : std::filesystem::directory_iterator(directory, ec)) {
    if (entry.is_regular_file(ec) && entry.path().extension() == DOCUMENT_EXTENSION) {
      files.push_back(entry.path());
    }
  }
  if (ec) {
    return common::Result<std::size_t>::failure(
        "failed to list " + directory.string() + ": " + ec.message(), common::ErrorKind::Io);
  }
  std::sort(files.begin(), files.end());

  std::vector<std::string> ids;
  std::vector<std::string> documents;
  std::vector<vectorstore::Metadata> metadatas;
  for (const auto &file : files) {
    auto content = common::read_text_file(file);
    if (!content.ok()) {
      observability::record_error(options_.component,
                                  "skipping " + file.string() + ": " + content.error());
      continue;
    }
    const auto split = common::split_frontmatter(content.value());
    const std::string description = split.frontmatter.get("description");
    const std::string filename = file.filename().string();

    ids.push_back(filename);
    documents.push_back(description + "\n\n" + split.body);
    metadatas.push_back({
        {"filename", filename},
        {"description", description},
        {"path", file.string()},
        {"body", split.body},
    });
  }

  if (ids.empty()) {
    observability::record_warning(options_.component,
                                  "no " + options_.component + " files found in " +
                                      directory.string());
    return common::Result<std::size_t>::success(0);
  }
  if (auto status = collection_->upsert(ids, documents, metadatas); !status.ok()) {
    return common::Result<std::size_t>::failure(status);
  }
  observability::record_index(options_.component, ids.size());
  return common::Result<std::size_t>::success(ids.size());
}

std::optional<std::vector<RetrievedDocument>>
RelevanceRetriever::fetch_ids(const std::vector<std::string> &ids) {
  std::vector<std::string> target_ids;
  target_ids.reserve(ids.size());
  for (const auto &id : ids) {
    target_ids.push_back(normalize_document_id(id));
  }

  auto fetched = collection_->get(target_ids);
  if (!fetched.ok()) {
    observability::record_warning(options_.component,
                                  "failed to fetch preferred " + options_.component + ": " +
                                      fetched.error());
    return std::nullopt;
  }

  std::vector<RetrievedDocument> out;
  out.reserve(fetched.value().size());
  for (auto &stored : fetched.value()) {
    out.push_back(to_retrieved(stored.id, stored.document, std::move(stored.metadata), 0.0));
  }
  return out;
}

std::vector<RetrievedDocument>
RelevanceRetriever::retrieve(const std::string &query, const std::optional<std::size_t> n,
                             const std::optional<double> threshold,
                             const std::vector<std::string> &preferred_ids) {
  const auto started = std::chrono::steady_clock::now();
  auto count = collection_->count();
  if (!count.ok()) {
    observability::record_error(options_.component, "count failed: " + count.error());
    return {};
  }
  if (count.value() == 0) {
    observability::record_retrieval(options_.component, 0, false);
    return {};
  }

  if (!preferred_ids.empty()) {
    auto preferred = fetch_ids(preferred_ids);
    if (preferred.has_value() && !preferred->empty()) {
      observability::record_retrieval(options_.component, preferred->size(), true);
      return std::move(*preferred);
    }
  }

  const double limit = threshold.value_or(options_.threshold);
  auto matches = collection_->query(query, n.value_or(options_.default_results));
  if (!matches.ok()) {
    observability::record_error(options_.component, "query failed: " + matches.error());
    return {};
  }

  std::vector<RetrievedDocument> out;
  for (auto &match : matches.value()) {
    if (match.distance < limit) {
      out.push_back(
          to_retrieved(match.id, match.document, std::move(match.metadata), match.distance));
    }
  }
  observability::record_retrieval(options_.component, out.size(), false);
  observability::record_latency(options_.component + ".retrieve",
                                std::chrono::duration_cast<std::chrono::milliseconds>(
                                    std::chrono::steady_clock::now() - started));
  return out;
}

std::vector<RetrievedDocument> RelevanceRetriever::get_by_ids(const std::vector<std::string> &ids) {
  if (ids.empty()) {
    return {};
  }
  auto fetched = fetch_ids(ids);
  if (!fetched.has_value()) {
    return {};
  }
  observability::record_retrieval(options_.component, fetched->size(), true);
  return std::move(*fetched);
}

std::string RelevanceRetriever::format(const std::vector<RetrievedDocument> &documents) const {
  if (documents.empty()) {
    return "";
  }
  std::ostringstream out;
  out << options_.heading << "\n" << options_.intro << "\n\n";
  for (const auto &document : documents) {
    const auto filename = document.metadata.find("filename");
    const auto description = document.metadata.find("description");
    out << "### " << options_.label << ": "
        << (filename == document.metadata.end() ? document.id : filename->second) << "\n";
    out << "**Description**: "
        << (description == document.metadata.end() ? std::string("No description")
                                                   : description->second)
        << "\n";
    out << document.content << "\n\n";
  }
  return out.str();
}

} // namespace conductor::retrieval
