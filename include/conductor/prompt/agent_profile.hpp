#pragma once

#include "conductor/common/frontmatter.hpp"
#include "conductor/common/result.hpp"
#include "conductor/prompt/resolver.hpp"

#include <filesystem>
#include <string>
#include <vector>

namespace conductor::prompt {

struct AgentIdentity {
  std::string name;
  std::string display_name;
  std::string role;
  std::string tone;
};

struct AgentRouting {
  std::vector<std::string> domain_keywords;
  std::string trigger_command;
};

/// Typed frontmatter of `.cursor/agents/<name>/system_prompt.mdc`.
struct AgentProfile {
  std::string name;
  std::string description;
  /// Skill ids to load instead of similarity search, without `.mdc`.
  std::vector<std::string> preferred_skills;
  /// Skill files the prompt always imports, with `.mdc`.
  std::vector<std::string> static_skills;
  AgentIdentity identity;
  AgentRouting routing;
  std::vector<std::string> file_globs;
};

[[nodiscard]] AgentProfile agent_profile_from(const common::Frontmatter &frontmatter);

/// Frontmatter of an agent prompt. Missing agents fail with NotFound, names
/// escaping the root with SecurityViolation.
[[nodiscard]] common::Result<AgentProfile> load_agent_profile(const PromptResolver &resolver,
                                                              const std::string &agent);

struct AgentValidation {
  std::vector<std::string> errors;
  std::vector<std::string> warnings;

  [[nodiscard]] bool valid() const { return errors.empty(); }
};

/// Schema check for an agent's frontmatter.
[[nodiscard]] AgentValidation validate_agent_profile(const common::Frontmatter &frontmatter);

/// Agent names under `agents_dir`: non-hidden subdirectories other than
/// `common` holding `system_prompt.mdc`, sorted. Empty when the directory is
/// missing.
[[nodiscard]] std::vector<std::string> scan_agents(const std::filesystem::path &agents_dir);

} // namespace conductor::prompt
