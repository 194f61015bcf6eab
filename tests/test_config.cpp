#include "test_framework.hpp"

#include "conductor/common/fs.hpp"
#include "conductor/config/config.hpp"
#include "tests/helpers/test_helpers.hpp"

#include <cstdlib>
#include <filesystem>
#include <optional>

namespace {

struct EnvGuard {
  std::string key;
  std::optional<std::string> old_value;

  EnvGuard(std::string key_, std::optional<std::string> value) : key(std::move(key_)) {
    if (const char *existing = std::getenv(key.c_str()); existing != nullptr) {
      old_value = existing;
    }
    if (value.has_value()) {
      setenv(key.c_str(), value->c_str(), 1);
    } else {
      unsetenv(key.c_str());
    }
  }

  ~EnvGuard() {
    if (old_value.has_value()) {
      setenv(key.c_str(), old_value->c_str(), 1);
    } else {
      unsetenv(key.c_str());
    }
  }
};

struct ConfigOverrideGuard {
  explicit ConfigOverrideGuard(const std::filesystem::path &path) {
    conductor::config::set_config_path_override(path);
  }
  ~ConfigOverrideGuard() { conductor::config::set_config_path_override(std::nullopt); }
};

} // namespace

void register_config_tests(std::vector<conductor::tests::TestCase> &tests) {
  using conductor::tests::require;
  namespace cfg = conductor::config;

  tests.push_back({"config_defaults_match_documented_values", [] {
                     const cfg::Config config;
                     require(config.router.similarity_threshold == 0.95, "router threshold");
                     require(config.router.write_back_confidence == 0.8, "write-back gate");
                     require(config.router.fallback_agent == "universal_agent", "fallback agent");
                     require(config.skills.threshold == 0.45, "skills threshold");
                     require(config.skills.default_results == 2, "skills n");
                     require(config.implants.threshold == 0.73, "implants threshold");
                     require(config.implants.default_results == 3, "implants n");
                     require(config.router.history_window_chars == 200, "history window");
                   }});

  tests.push_back({"config_load_missing_file_uses_defaults", [] {
                     conductor::testing::TempWorkspace ws;
                     ConfigOverrideGuard guard(ws.path() / "missing.toml");
                     EnvGuard provider("CONDUCTOR_PROVIDER", std::nullopt);
                     EnvGuard model("CONDUCTOR_MODEL", std::nullopt);
                     auto loaded = cfg::load_config();
                     require(loaded.ok(), loaded.ok() ? "" : loaded.error());
                     require(loaded.value().default_provider == cfg::DEFAULT_PROVIDER,
                             "default provider expected");
                     require(loaded.value().skills.collection == "skills_store",
                             "default collection expected");
                   }});

  tests.push_back({"config_parse_reads_every_section", [] {
                     auto parsed = cfg::parse_config("root = \"/srv/repo\"\n"
                                                     "default_model = \"gpt-4o\"\n"
                                                     "[router]\n"
                                                     "similarity_threshold = 0.9\n"
                                                     "fallback_agent = \"generalist\"\n"
                                                     "[skills]\n"
                                                     "threshold = 0.4\n"
                                                     "default_results = 4\n"
                                                     "[implants]\n"
                                                     "directory = \"brain/implants\"\n"
                                                     "[vector_store]\n"
                                                     "embedding_provider = \"noop\"\n"
                                                     "[session_cache]\n"
                                                     "capacity = 16\n"
                                                     "ttl_seconds = 60\n");
                     require(parsed.ok(), parsed.ok() ? "" : parsed.error());
                     const auto &config = parsed.value();
                     require(config.root == "/srv/repo", "root");
                     require(config.default_model == "gpt-4o", "model");
                     require(config.router.similarity_threshold == 0.9, "router threshold");
                     require(config.router.fallback_agent == "generalist", "fallback");
                     require(config.skills.threshold == 0.4, "skills threshold");
                     require(config.skills.default_results == 4, "skills n");
                     require(config.implants.directory == "brain/implants", "implants dir");
                     require(config.implants.threshold == 0.73, "untouched default kept");
                     require(config.vector_store.embedding_provider == "noop", "embedder");
                     require(config.session_cache.capacity == 16, "capacity");
                     require(config.session_cache.ttl_seconds == 60, "ttl");
                   }});

  tests.push_back({"config_save_then_load_preserves_values", [] {
                     conductor::testing::TempWorkspace ws;
                     ConfigOverrideGuard guard(ws.path() / "config.toml");
                     EnvGuard provider("CONDUCTOR_PROVIDER", std::nullopt);
                     EnvGuard model("CONDUCTOR_MODEL", std::nullopt);
                     EnvGuard root("CONDUCTOR_ROOT", std::nullopt);

                     cfg::Config config;
                     config.root = ws.path().string();
                     config.router.similarity_threshold = 0.9;
                     config.reliability.fallback_providers = {"groq", "ollama"};
                     config.implants.threshold = 0.6;
                     require(cfg::save_config(config).ok(), "save should succeed");
                     require(cfg::config_exists(), "config file should exist");

                     auto loaded = cfg::load_config();
                     require(loaded.ok(), loaded.ok() ? "" : loaded.error());
                     require(loaded.value().root == ws.path().string(), "root");
                     require(loaded.value().router.similarity_threshold == 0.9, "threshold");
                     require(loaded.value().reliability.fallback_providers.size() == 2,
                             "fallbacks");
                     require(loaded.value().implants.threshold == 0.6, "implants threshold");
                   }});

  tests.push_back({"config_env_overrides_win", [] {
                     EnvGuard model("CONDUCTOR_MODEL", std::string("override-model"));
                     EnvGuard root("CONDUCTOR_ROOT", std::string("/tmp/conductor-root"));
                     cfg::Config config;
                     cfg::apply_env_overrides(config);
                     require(config.default_model == "override-model", "model override");
                     require(config.root == "/tmp/conductor-root", "root override");
                   }});

  tests.push_back({"config_validate_rejects_bad_values", [] {
                     cfg::Config config;
                     config.api_key = "k";
                     require(cfg::validate_config(config).ok(), "defaults should validate");

                     auto bad_threshold = config;
                     bad_threshold.router.similarity_threshold = 1.5;
                     auto result = cfg::validate_config(bad_threshold);
                     require(!result.ok() &&
                                 result.kind() == conductor::common::ErrorKind::Validation,
                             "threshold above 1 should fail");

                     auto shared = config;
                     shared.implants.collection = shared.skills.collection;
                     require(!cfg::validate_config(shared).ok(), "shared collection should fail");

                     auto provider = config;
                     provider.default_provider = "nonexistent";
                     require(!cfg::validate_config(provider).ok(), "unknown provider should fail");

                     auto zero = config;
                     zero.session_cache.capacity = 0;
                     require(!cfg::validate_config(zero).ok(), "zero capacity should fail");
                   }});

  tests.push_back({"config_validate_warns_without_api_key", [] {
                     cfg::Config config;
                     config.api_key.reset();
                     auto result = cfg::validate_config(config);
                     require(result.ok(), "missing key is a warning, not an error");
                     bool found = false;
                     for (const auto &warning : result.value()) {
                       found = found || warning.find("api_key") != std::string::npos;
                     }
                     require(found, "api_key warning expected");
                   }});

  tests.push_back({"config_resolve_root_normalises", [] {
                     conductor::testing::TempWorkspace ws;
                     cfg::Config config;
                     std::filesystem::create_directories(ws.path() / "a" / "b");
                     config.root = (ws.path() / "a" / "c" / ".." / "b").string();
                     const auto root = cfg::resolve_root(config);
                     require(root == conductor::common::normalized_absolute(ws.path() / "a" / "b"),
                             "root should be normalised: " + root.string());
                   }});

  tests.push_back({"config_provider_is_known", [] {
                     require(cfg::provider_is_known("OpenAI"), "case insensitive");
                     require(cfg::provider_is_known("custom:https://llm.local/v1"), "custom url");
                     require(!cfg::provider_is_known("custom:"), "custom without url");
                     require(!cfg::provider_is_known("skynet"), "unknown");
                   }});
}
