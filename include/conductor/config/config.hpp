#pragma once

#include "conductor/common/result.hpp"
#include "conductor/config/schema.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace conductor::config {

[[nodiscard]] common::Result<std::filesystem::path> config_dir();
[[nodiscard]] common::Result<std::filesystem::path> config_path();
[[nodiscard]] bool config_exists();
void set_config_path_override(std::optional<std::filesystem::path> path);
[[nodiscard]] std::optional<std::filesystem::path> config_path_override();

[[nodiscard]] common::Result<Config> load_config();
/// Parse TOML text into a Config without touching the environment.
[[nodiscard]] common::Result<Config> parse_config(const std::string &toml_text);
[[nodiscard]] common::Status save_config(const Config &config);

/// Hard errors fail the result; soft issues come back as warnings.
[[nodiscard]] common::Result<std::vector<std::string>> validate_config(const Config &config);

void apply_env_overrides(Config &config);

/// Sandbox root: `config.root` expanded, else the current directory.
[[nodiscard]] std::filesystem::path resolve_root(const Config &config);

[[nodiscard]] bool provider_is_known(const std::string &provider);

} // namespace conductor::config
