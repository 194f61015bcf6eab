#pragma once

#include <map>
#include <set>
#include <string>
#include <vector>

namespace conductor::common {

/// Parsed `---` metadata block of an `.mdc` document. Nested mappings are
/// flattened to dotted keys (`identity.role`); sequences, block or inline,
/// land in `lists`.
struct Frontmatter {
  std::map<std::string, std::string> values;
  std::map<std::string, std::vector<std::string>> lists;
  /// Every key seen, including mapping parents such as `identity`.
  std::set<std::string> keys;

  [[nodiscard]] bool has(const std::string &key) const { return keys.contains(key); }
  [[nodiscard]] std::string get(const std::string &key, const std::string &fallback = "") const;
  [[nodiscard]] std::vector<std::string> list(const std::string &key) const;
};

struct FrontmatterSplit {
  Frontmatter frontmatter;
  std::string body;
  bool has_frontmatter = false;
};

/// Parse the YAML subset used by agent, skill and implant documents.
[[nodiscard]] Frontmatter parse_frontmatter(const std::string &yaml);

/// Split a leading `---` block from `content`. Without a closing marker the
/// whole content is the body. The body is trimmed when a block was present.
[[nodiscard]] FrontmatterSplit split_frontmatter(const std::string &content);

} // namespace conductor::common
