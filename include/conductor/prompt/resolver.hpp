#pragma once

#include "conductor/common/result.hpp"

#include <filesystem>
#include <set>
#include <stdexcept>
#include <string>
#include <vector>

namespace conductor::prompt {

/// Raised by top-level loads whose path escapes the sandbox root.
class SecurityError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

/// Raised by top-level loads whose document does not exist.
class NotFoundError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

/// One piece of a parsed document: literal text, or an `@path.mdc` import.
struct PromptNode {
  enum class Kind { Literal, Reference };
  Kind kind = Kind::Literal;
  std::string text;
};

/// Split `content` into literal and reference nodes. Adjacent literal text is
/// kept in one node.
[[nodiscard]] std::vector<PromptNode> parse_prompt(const std::string &content);

/// Expands `@path.mdc` references into the referenced documents' bodies,
/// confined to one sandbox root. Fragment-level failures become inline
/// markers; only the top-level document can throw.
class PromptResolver {
public:
  explicit PromptResolver(const std::filesystem::path &root);

  [[nodiscard]] const std::filesystem::path &root() const { return root_; }

  /// Map a reference (with or without the `@` sigil) to an absolute path
  /// inside the root. Escapes fail with ErrorKind::SecurityViolation.
  [[nodiscard]] common::Result<std::filesystem::path>
  resolve_path(const std::string &reference) const;

  /// Expand every reference in `content`. A document is expanded at most once
  /// per import chain: `seen` holds every document already imported by an
  /// ancestor or an earlier sibling, and a repeat becomes a circular marker.
  [[nodiscard]] std::string expand(const std::string &content,
                                   const std::set<std::filesystem::path> &seen = {}) const;

  /// Load a top-level document by root-relative path and expand it.
  /// Throws SecurityError or NotFoundError.
  [[nodiscard]] std::string resolve(const std::string &document_path) const;

  /// `.cursor/agents/<agent>/system_prompt.mdc`, expanded.
  /// Throws SecurityError or NotFoundError.
  [[nodiscard]] std::string load_agent_prompt(const std::string &agent) const;

  /// Root-relative path of an agent's system prompt.
  [[nodiscard]] static std::string agent_prompt_path(const std::string &agent);

private:
  [[nodiscard]] std::string expand_nodes(const std::vector<PromptNode> &nodes,
                                         std::set<std::filesystem::path> seen) const;
  [[nodiscard]] std::string expand_reference(const std::string &reference,
                                             std::set<std::filesystem::path> &seen) const;

  std::filesystem::path root_;
};

/// Number of degraded-substitution markers in an expanded prompt.
[[nodiscard]] std::size_t count_markers(const std::string &expanded);

} // namespace conductor::prompt
