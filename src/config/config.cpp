#include "conductor/config/config.hpp"

#include "conductor/common/fs.hpp"
#include "conductor/common/toml.hpp"

#include <cctype>
#include <cstdlib>
#include <fstream>
#include <sstream>

namespace conductor::config {

namespace {

constexpr const char *CONFIG_FOLDER = ".conductor";
constexpr const char *CONFIG_FILENAME = "config.toml";
std::optional<std::filesystem::path> g_config_path_override;

std::optional<std::filesystem::path> resolved_config_path_override() {
  if (g_config_path_override.has_value()) {
    return g_config_path_override;
  }
  if (const char *env = std::getenv("CONDUCTOR_CONFIG_PATH"); env != nullptr && *env != '\0') {
    return std::filesystem::path(common::expand_path(env));
  }
  return std::nullopt;
}

std::string expand_config_value(const std::string &value) {
  if (value.find('$') == std::string::npos && value.find('~') == std::string::npos) {
    return value;
  }
  return common::expand_path(value);
}

std::string strip_env_quotes(const std::string &raw) {
  const std::string value = common::trim(raw);
  if (value.size() < 2) {
    return value;
  }
  const char quote = value.front();
  if ((quote != '"' && quote != '\'') || value.back() != quote) {
    return value;
  }
  std::string inner = value.substr(1, value.size() - 2);
  if (quote == '\'') {
    return inner;
  }
  std::string out;
  for (std::size_t i = 0; i < inner.size(); ++i) {
    if (inner[i] == '\\' && i + 1 < inner.size()) {
      const char next = inner[++i];
      out.push_back(next == 'n' ? '\n' : next == 't' ? '\t' : next);
    } else {
      out.push_back(inner[i]);
    }
  }
  return out;
}

bool is_valid_env_name(const std::string &name) {
  if (name.empty() || std::isdigit(static_cast<unsigned char>(name.front())) != 0) {
    return false;
  }
  for (const char ch : name) {
    if (std::isalnum(static_cast<unsigned char>(ch)) == 0 && ch != '_') {
      return false;
    }
  }
  return true;
}

void set_env_if_missing(const std::string &name, const std::string &value) {
  if (!is_valid_env_name(name)) {
    return;
  }
  if (const char *existing = std::getenv(name.c_str()); existing != nullptr && *existing != '\0') {
    return;
  }
  setenv(name.c_str(), value.c_str(), 0);
}

void load_dotenv_file(const std::filesystem::path &path) {
  std::error_code ec;
  if (!std::filesystem::is_regular_file(path, ec)) {
    return;
  }
  std::ifstream file(path);
  std::string line;
  while (std::getline(file, line)) {
    std::string trimmed = common::trim(line);
    if (trimmed.empty() || trimmed.front() == '#') {
      continue;
    }
    if (common::starts_with(trimmed, "export ")) {
      trimmed = common::trim(trimmed.substr(7));
    }
    const auto eq = trimmed.find('=');
    if (eq == std::string::npos) {
      continue;
    }
    set_env_if_missing(common::trim(trimmed.substr(0, eq)), strip_env_quotes(trimmed.substr(eq + 1)));
  }
}

void load_dotenv_files() {
  if (const char *env_file = std::getenv("CONDUCTOR_ENV_FILE");
      env_file != nullptr && *env_file != '\0') {
    load_dotenv_file(common::expand_path(env_file));
  }
  if (auto dir = config_dir(); dir.ok()) {
    load_dotenv_file(dir.value() / ".env");
  }
  std::error_code ec;
  const auto cwd = std::filesystem::current_path(ec);
  if (!ec) {
    load_dotenv_file(cwd / ".env");
  }
}

void load_retriever(RetrieverConfig &target, const common::TomlDocument &doc,
                    const std::string &section) {
  target.directory = doc.get_string(section + ".directory", target.directory);
  target.collection = doc.get_string(section + ".collection", target.collection);
  target.threshold = doc.get_double(section + ".threshold", target.threshold);
  target.default_results = doc.get_u64(section + ".default_results", target.default_results);
}

const std::vector<std::string> &known_providers() {
  static const std::vector<std::string> providers = {
      "openai", "openrouter", "groq", "together", "mistral", "deepseek", "fireworks", "ollama",
  };
  return providers;
}

std::string string_array_to_toml(const std::vector<std::string> &values) {
  std::ostringstream stream;
  stream << '[';
  for (std::size_t index = 0; index < values.size(); ++index) {
    if (index > 0) {
      stream << ", ";
    }
    stream << common::quote_toml_string(values[index]);
  }
  stream << ']';
  return stream.str();
}

void write_retriever(std::ostream &out, const std::string &section, const RetrieverConfig &cfg) {
  out << "\n[" << section << "]\n";
  out << "directory = " << common::quote_toml_string(cfg.directory) << "\n";
  out << "collection = " << common::quote_toml_string(cfg.collection) << "\n";
  out << "threshold = " << cfg.threshold << "\n";
  out << "default_results = " << cfg.default_results << "\n";
}

common::Result<std::vector<std::string>> invalid(const std::string &message) {
  return common::Result<std::vector<std::string>>::failure(message, common::ErrorKind::Validation);
}

} // namespace

common::Result<std::filesystem::path> config_dir() {
  if (const auto override_path = resolved_config_path_override(); override_path.has_value()) {
    std::error_code ec;
    if (std::filesystem::is_directory(*override_path, ec) || override_path->filename().empty()) {
      return common::Result<std::filesystem::path>::success(*override_path);
    }
    auto parent = override_path->parent_path();
    if (parent.empty()) {
      parent = std::filesystem::current_path(ec);
    }
    return common::Result<std::filesystem::path>::success(parent);
  }
  const auto home = common::home_dir();
  if (!home.ok()) {
    return common::Result<std::filesystem::path>::failure(home.status());
  }
  return common::Result<std::filesystem::path>::success(home.value() / CONFIG_FOLDER);
}

common::Result<std::filesystem::path> config_path() {
  if (const auto override_path = resolved_config_path_override(); override_path.has_value()) {
    std::error_code ec;
    if (std::filesystem::is_directory(*override_path, ec) || override_path->filename().empty()) {
      return common::Result<std::filesystem::path>::success(*override_path / CONFIG_FILENAME);
    }
    return common::Result<std::filesystem::path>::success(*override_path);
  }
  const auto dir = config_dir();
  if (!dir.ok()) {
    return dir;
  }
  return common::Result<std::filesystem::path>::success(dir.value() / CONFIG_FILENAME);
}

bool config_exists() {
  const auto path = config_path();
  std::error_code ec;
  return path.ok() && std::filesystem::exists(path.value(), ec);
}

void set_config_path_override(std::optional<std::filesystem::path> path) {
  if (!path.has_value()) {
    g_config_path_override = std::nullopt;
    return;
  }
  g_config_path_override = std::filesystem::path(common::expand_path(path->string()));
}

std::optional<std::filesystem::path> config_path_override() {
  return resolved_config_path_override();
}

void apply_env_overrides(Config &config) {
  load_dotenv_files();

  if (const char *provider = std::getenv("CONDUCTOR_PROVIDER"); provider != nullptr && *provider) {
    config.default_provider = provider;
  }
  if (const char *model = std::getenv("CONDUCTOR_MODEL"); model != nullptr && *model) {
    config.default_model = model;
  }
  if (const char *root = std::getenv("CONDUCTOR_ROOT"); root != nullptr && *root) {
    config.root = common::expand_path(root);
  }
  if (const char *api_key = std::getenv("CONDUCTOR_API_KEY"); api_key != nullptr && *api_key) {
    config.api_key = std::string(api_key);
  }
}

common::Result<Config> parse_config(const std::string &toml_text) {
  const auto parsed = common::parse_toml(toml_text);
  if (!parsed.ok()) {
    return common::Result<Config>::failure(parsed.status());
  }
  const auto &doc = parsed.value();

  Config config;
  config.root = expand_config_value(doc.get_string("root", config.root));
  if (doc.has("api_key")) {
    config.api_key = expand_config_value(doc.get_string("api_key"));
  }
  config.default_provider = doc.get_string("default_provider", config.default_provider);
  config.default_model = doc.get_string("default_model", config.default_model);
  config.default_temperature = doc.get_double("default_temperature", config.default_temperature);

  auto &router = config.router;
  router.similarity_threshold =
      doc.get_double("router.similarity_threshold", router.similarity_threshold);
  router.write_back_confidence =
      doc.get_double("router.write_back_confidence", router.write_back_confidence);
  router.history_window_chars =
      doc.get_u64("router.history_window_chars", router.history_window_chars);
  router.fallback_agent = doc.get_string("router.fallback_agent", router.fallback_agent);
  router.collection = doc.get_string("router.collection", router.collection);
  router.agents_directory = doc.get_string("router.agents_directory", router.agents_directory);
  router.classifier_model = doc.get_string("router.classifier_model", router.classifier_model);
  router.classifier_timeout_ms =
      doc.get_u64("router.classifier_timeout_ms", router.classifier_timeout_ms);
  router.classifier_temperature =
      doc.get_double("router.classifier_temperature", router.classifier_temperature);

  load_retriever(config.skills, doc, "skills");
  load_retriever(config.implants, doc, "implants");

  auto &store = config.vector_store;
  store.path = expand_config_value(doc.get_string("vector_store.path", store.path));
  store.embedding_provider =
      doc.get_string("vector_store.embedding_provider", store.embedding_provider);
  store.embedding_model = doc.get_string("vector_store.embedding_model", store.embedding_model);
  store.embedding_dimensions =
      doc.get_u64("vector_store.embedding_dimensions", store.embedding_dimensions);
  store.worker_threads = doc.get_u64("vector_store.worker_threads", store.worker_threads);

  config.session_cache.capacity =
      doc.get_u64("session_cache.capacity", config.session_cache.capacity);
  config.session_cache.ttl_seconds =
      doc.get_u64("session_cache.ttl_seconds", config.session_cache.ttl_seconds);

  config.reliability.provider_retries = static_cast<std::uint32_t>(
      doc.get_u64("reliability.provider_retries", config.reliability.provider_retries));
  config.reliability.provider_backoff_ms =
      doc.get_u64("reliability.provider_backoff_ms", config.reliability.provider_backoff_ms);
  config.reliability.fallback_providers = doc.get_string_array(
      "reliability.fallback_providers", config.reliability.fallback_providers);

  config.observability.backend =
      doc.get_string("observability.backend", config.observability.backend);

  return common::Result<Config>::success(std::move(config));
}

common::Result<Config> load_config() {
  const auto path = config_path();
  if (!path.ok()) {
    return common::Result<Config>::failure(path.status());
  }

  std::error_code ec;
  if (!std::filesystem::exists(path.value(), ec)) {
    Config config;
    apply_env_overrides(config);
    return common::Result<Config>::success(std::move(config));
  }

  const auto content = common::read_text_file(path.value());
  if (!content.ok()) {
    return common::Result<Config>::failure("Unable to open config file: " + content.error(),
                                           content.kind());
  }
  auto parsed = parse_config(content.value());
  if (!parsed.ok()) {
    return common::Result<Config>::failure(path.value().string() + ": " + parsed.error(),
                                           parsed.kind());
  }
  Config config = std::move(parsed.value());
  apply_env_overrides(config);
  return common::Result<Config>::success(std::move(config));
}

common::Status save_config(const Config &config) {
  const auto path_result = config_path();
  if (!path_result.ok()) {
    return path_result.status();
  }
  const std::filesystem::path path = path_result.value();
  if (!path.parent_path().empty()) {
    if (auto dir = common::ensure_dir(path.parent_path()); !dir.ok()) {
      return dir.status();
    }
  }
  const std::filesystem::path tmp_path = path.string() + ".tmp";

  {
    std::ofstream file(tmp_path, std::ios::trunc);
    if (!file) {
      return common::Status::error("Unable to write temporary config file", common::ErrorKind::Io);
    }

    if (!config.root.empty()) {
      file << "root = " << common::quote_toml_string(config.root) << "\n";
    }
    file << "default_provider = " << common::quote_toml_string(config.default_provider) << "\n";
    file << "default_model = " << common::quote_toml_string(config.default_model) << "\n";
    file << "default_temperature = " << config.default_temperature << "\n";
    if (config.api_key.has_value()) {
      file << "api_key = " << common::quote_toml_string(*config.api_key) << "\n";
    }

    file << "\n[router]\n";
    file << "similarity_threshold = " << config.router.similarity_threshold << "\n";
    file << "write_back_confidence = " << config.router.write_back_confidence << "\n";
    file << "history_window_chars = " << config.router.history_window_chars << "\n";
    file << "fallback_agent = " << common::quote_toml_string(config.router.fallback_agent) << "\n";
    file << "collection = " << common::quote_toml_string(config.router.collection) << "\n";
    file << "agents_directory = " << common::quote_toml_string(config.router.agents_directory)
         << "\n";
    file << "classifier_model = " << common::quote_toml_string(config.router.classifier_model)
         << "\n";
    file << "classifier_timeout_ms = " << config.router.classifier_timeout_ms << "\n";

    write_retriever(file, "skills", config.skills);
    write_retriever(file, "implants", config.implants);

    file << "\n[vector_store]\n";
    file << "path = " << common::quote_toml_string(config.vector_store.path) << "\n";
    file << "embedding_provider = "
         << common::quote_toml_string(config.vector_store.embedding_provider) << "\n";
    file << "embedding_model = " << common::quote_toml_string(config.vector_store.embedding_model)
         << "\n";
    file << "embedding_dimensions = " << config.vector_store.embedding_dimensions << "\n";
    file << "worker_threads = " << config.vector_store.worker_threads << "\n";

    file << "\n[session_cache]\n";
    file << "capacity = " << config.session_cache.capacity << "\n";
    file << "ttl_seconds = " << config.session_cache.ttl_seconds << "\n";

    file << "\n[reliability]\n";
    file << "provider_retries = " << config.reliability.provider_retries << "\n";
    file << "provider_backoff_ms = " << config.reliability.provider_backoff_ms << "\n";
    file << "fallback_providers = "
         << string_array_to_toml(config.reliability.fallback_providers) << "\n";

    file << "\n[observability]\n";
    file << "backend = " << common::quote_toml_string(config.observability.backend) << "\n";

    if (!file) {
      return common::Status::error("Failed to write config file", common::ErrorKind::Io);
    }
  }

  std::error_code ec;
  std::filesystem::rename(tmp_path, path, ec);
  if (ec) {
    return common::Status::error("Failed to atomically replace config: " + ec.message(),
                                 common::ErrorKind::Io);
  }
  return common::Status::success();
}

bool provider_is_known(const std::string &provider) {
  const std::string normalized = common::to_lower(common::trim(provider));
  if (common::starts_with(normalized, "custom:")) {
    return normalized.size() > 7;
  }
  for (const auto &known : known_providers()) {
    if (normalized == known) {
      return true;
    }
  }
  return false;
}

common::Result<std::vector<std::string>> validate_config(const Config &config) {
  std::vector<std::string> warnings;

  if (!provider_is_known(config.default_provider)) {
    return invalid("Unknown default provider: " + config.default_provider);
  }
  for (const auto &fallback : config.reliability.fallback_providers) {
    if (!provider_is_known(fallback)) {
      return invalid("Unknown fallback provider: " + fallback);
    }
  }
  if (config.default_temperature < 0.0 || config.default_temperature > 2.0) {
    return invalid("default_temperature must be between 0.0 and 2.0");
  }

  const auto &router = config.router;
  if (router.similarity_threshold <= 0.0 || router.similarity_threshold > 1.0) {
    return invalid("router.similarity_threshold must be in (0, 1]");
  }
  if (router.write_back_confidence < 0.0 || router.write_back_confidence > 1.0) {
    return invalid("router.write_back_confidence must be in [0, 1]");
  }
  if (common::trim(router.fallback_agent).empty()) {
    return invalid("router.fallback_agent must not be empty");
  }
  if (router.classifier_timeout_ms == 0) {
    return invalid("router.classifier_timeout_ms must be positive");
  }

  for (const auto *section : {&config.skills, &config.implants}) {
    const std::string name = section == &config.skills ? "skills" : "implants";
    if (section->threshold <= 0.0 || section->threshold > 2.0) {
      return invalid(name + ".threshold must be in (0, 2]");
    }
    if (section->default_results == 0) {
      return invalid(name + ".default_results must be at least 1");
    }
    if (common::trim(section->collection).empty()) {
      return invalid(name + ".collection must not be empty");
    }
  }
  if (config.skills.collection == config.implants.collection ||
      config.skills.collection == router.collection ||
      config.implants.collection == router.collection) {
    return invalid("router, skills and implants must use distinct collections");
  }

  const std::string embedder = common::to_lower(config.vector_store.embedding_provider);
  if (embedder != "local" && embedder != "openai" && embedder != "noop" &&
      !common::starts_with(embedder, "custom:")) {
    return invalid("Invalid vector_store.embedding_provider: " +
                   config.vector_store.embedding_provider);
  }
  if (config.vector_store.embedding_dimensions == 0) {
    return invalid("vector_store.embedding_dimensions must be positive");
  }
  if (config.vector_store.worker_threads == 0) {
    return invalid("vector_store.worker_threads must be at least 1");
  }
  if (config.session_cache.capacity == 0) {
    return invalid("session_cache.capacity must be at least 1");
  }

  if (!config.api_key.has_value() || common::trim(*config.api_key).empty()) {
    if (common::to_lower(config.default_provider) != "ollama") {
      warnings.push_back("No api_key configured; routing falls back to " + router.fallback_agent +
                         " on every cache miss");
    }
  }
  if (embedder == "noop") {
    warnings.push_back("vector_store.embedding_provider is noop; similarity search is disabled");
  }
  if (router.similarity_threshold < 0.8) {
    warnings.push_back("router.similarity_threshold below 0.8 may return unrelated cached routes");
  }

  return common::Result<std::vector<std::string>>::success(std::move(warnings));
}

std::filesystem::path resolve_root(const Config &config) {
  std::error_code ec;
  std::filesystem::path root =
      config.root.empty() ? std::filesystem::current_path(ec) : std::filesystem::path(
                                                                    common::expand_path(config.root));
  return common::normalized_absolute(root);
}

} // namespace conductor::config
