#include "conductor/prompt/agent_profile.hpp"

#include "conductor/common/fs.hpp"

#include <algorithm>
#include <array>

namespace conductor::prompt {

namespace {

constexpr std::array<const char *, 2> REQUIRED_FIELDS = {"name", "description"};
constexpr std::array<const char *, 4> IDENTITY_FIELDS = {"name", "display_name", "role", "tone"};

} // namespace

AgentProfile agent_profile_from(const common::Frontmatter &frontmatter) {
  AgentProfile profile;
  profile.name = frontmatter.get("name");
  profile.description = frontmatter.get("description");
  profile.preferred_skills = frontmatter.list("preferred_skills");
  profile.static_skills = frontmatter.list("static_skills");
  profile.identity = AgentIdentity{
      .name = frontmatter.get("identity.name"),
      .display_name = frontmatter.get("identity.display_name"),
      .role = frontmatter.get("identity.role"),
      .tone = frontmatter.get("identity.tone"),
  };
  profile.routing = AgentRouting{
      .domain_keywords = frontmatter.list("routing.domain_keywords"),
      .trigger_command = frontmatter.get("routing.trigger_command"),
  };
  profile.file_globs = frontmatter.list("context.file_globs");
  return profile;
}

common::Result<AgentProfile> load_agent_profile(const PromptResolver &resolver,
                                                const std::string &agent) {
  auto path = resolver.resolve_path(PromptResolver::agent_prompt_path(agent));
  if (!path.ok()) {
    return common::Result<AgentProfile>::failure(path.status());
  }
  auto content = common::read_text_file(path.value());
  if (!content.ok()) {
    return common::Result<AgentProfile>::failure(content.status());
  }
  return common::Result<AgentProfile>::success(
      agent_profile_from(common::split_frontmatter(content.value()).frontmatter));
}

AgentValidation validate_agent_profile(const common::Frontmatter &frontmatter) {
  AgentValidation result;
  for (const char *field : REQUIRED_FIELDS) {
    if (!frontmatter.has(field)) {
      result.errors.push_back("Missing required field: '" + std::string(field) + "'");
    }
  }

  if (frontmatter.has("skills")) {
    result.warnings.push_back(
        "DEPRECATED: 'skills' field should be removed (use 'static_skills' and 'preferred_skills')");
  }

  if (frontmatter.has("identity")) {
    for (const char *field : IDENTITY_FIELDS) {
      if (!frontmatter.has("identity." + std::string(field))) {
        result.errors.push_back("Missing identity." + std::string(field));
      }
    }
  }

  if (frontmatter.has("routing")) {
    if (!frontmatter.has("routing.domain_keywords")) {
      result.errors.push_back("Missing routing.domain_keywords");
    }
    if (!frontmatter.has("routing.trigger_command")) {
      result.errors.push_back("Missing routing.trigger_command");
    }
  }

  if (frontmatter.has("context") && !frontmatter.has("context.file_globs")) {
    result.errors.push_back("Missing context.file_globs");
  }

  if (frontmatter.has("static_skills")) {
    if (!frontmatter.lists.contains("static_skills")) {
      result.errors.push_back("static_skills must be an array");
    } else {
      for (const auto &skill : frontmatter.lists.at("static_skills")) {
        if (!common::ends_with(skill, ".mdc")) {
          result.warnings.push_back("static_skills entry '" + skill + "' should end with .mdc");
        }
      }
    }
  }

  if (frontmatter.has("preferred_skills")) {
    if (!frontmatter.lists.contains("preferred_skills")) {
      result.errors.push_back("preferred_skills must be an array");
    } else {
      for (const auto &skill : frontmatter.lists.at("preferred_skills")) {
        if (common::ends_with(skill, ".mdc")) {
          result.warnings.push_back("preferred_skills entry '" + skill +
                                    "' should NOT include .mdc extension");
        }
      }
    }
  }
  return result;
}

std::vector<std::string> scan_agents(const std::filesystem::path &agents_dir) {
  std::vector<std::string> agents;
  std::error_code ec;
  if (!std::filesystem::is_directory(agents_dir, ec)) {
    return agents;
  }
  for (const auto &entry : std::filesystem::directory_iterator(agents_dir, ec)) {
    const std::string name = entry.path().filename().string();
    if (!entry.is_directory(ec) || common::starts_with(name, ".") || name == "common") {
      continue;
    }
    if (std::filesystem::is_regular_file(entry.path() / "system_prompt.mdc", ec)) {
      agents.push_back(name);
    }
  }
  std::sort(agents.begin(), agents.end());
  return agents;
}

} // namespace conductor::prompt
