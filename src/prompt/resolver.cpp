#include "conductor/prompt/resolver.hpp"

#include "conductor/common/frontmatter.hpp"
#include "conductor/common/fs.hpp"
#include "conductor/observability/global.hpp"

#include <array>
#include <regex>

namespace conductor::prompt {

namespace {

constexpr const char *CURSOR_DIR = ".cursor";

const std::regex &reference_pattern() {
  static const std::regex pattern(R"(@[\w./-]+\.mdc)");
  return pattern;
}

std::string security_message(const std::string &reference) {
  return "Security Error: Access denied for path '" + reference +
         "'. Cannot access outside repository.";
}

/// Reads a document and strips its frontmatter; failures become markers.
std::string load_body(const std::filesystem::path &path) {
  auto content = common::read_text_file(path);
  if (!content.ok()) {
    if (content.kind() == common::ErrorKind::NotFound) {
      return "[MISSING FILE: " + path.string() + "]";
    }
    return "[ERROR LOADING FILE: " + path.string() + " - " + content.error() + "]";
  }
  return common::split_frontmatter(content.value()).body;
}

} // namespace

std::vector<PromptNode> parse_prompt(const std::string &content) {
  std::vector<PromptNode> nodes;
  auto begin = std::sregex_iterator(content.begin(), content.end(), reference_pattern());
  std::size_t cursor = 0;
  for (auto it = begin; it != std::sregex_iterator(); ++it) {
    const auto position = static_cast<std::size_t>(it->position());
    if (position > cursor) {
      nodes.push_back({.kind = PromptNode::Kind::Literal,
                       .text = content.substr(cursor, position - cursor)});
    }
    nodes.push_back({.kind = PromptNode::Kind::Reference, .text = it->str()});
    cursor = position + static_cast<std::size_t>(it->length());
  }
  if (cursor < content.size()) {
    nodes.push_back({.kind = PromptNode::Kind::Literal, .text = content.substr(cursor)});
  }
  return nodes;
}

PromptResolver::PromptResolver(const std::filesystem::path &root)
    : root_(common::normalized_absolute(root)) {}

common::Result<std::filesystem::path>
PromptResolver::resolve_path(const std::string &reference) const {
  std::filesystem::path candidate;
  if (common::starts_with(reference, "@")) {
    const std::string clean = reference.substr(1);
    if (common::starts_with(clean, CURSOR_DIR)) {
      candidate = root_ / clean;
    } else if (common::starts_with(clean, "agents")) {
      candidate = root_ / CURSOR_DIR / clean;
    } else {
      const auto under_cursor = root_ / CURSOR_DIR / clean;
      std::error_code ec;
      candidate = std::filesystem::exists(under_cursor, ec) ? under_cursor : root_ / clean;
    }
  } else {
    candidate = root_ / reference;
  }

  const auto absolute = common::normalized_absolute(candidate);
  if (!common::is_subpath(absolute, root_)) {
    return common::Result<std::filesystem::path>::failure(security_message(reference),
                                                          common::ErrorKind::SecurityViolation);
  }
  return common::Result<std::filesystem::path>::success(absolute);
}

std::string PromptResolver::expand(const std::string &content,
                                   const std::set<std::filesystem::path> &seen) const {
  return expand_nodes(parse_prompt(content), seen);
}

std::string PromptResolver::expand_nodes(const std::vector<PromptNode> &nodes,
                                         std::set<std::filesystem::path> seen) const {
  std::string out;
  for (const auto &node : nodes) {
    if (node.kind == PromptNode::Kind::Literal) {
      out += node.text;
    } else {
      out += expand_reference(node.text, seen);
    }
  }
  return out;
}

std::string PromptResolver::expand_reference(const std::string &reference,
                                             std::set<std::filesystem::path> &seen) const {
  auto path = resolve_path(reference);
  if (!path.ok()) {
    observability::record_warning("prompt", path.error());
    return "[SECURITY BLOCK: " + path.error() + "]";
  }
  if (seen.contains(path.value())) {
    return "[CIRCULAR REFERENCE: " + reference + "]";
  }

  // Later siblings see this document; the nested expansion gets a snapshot.
  seen.insert(path.value());
  return expand(load_body(path.value()), seen);
}

std::string PromptResolver::resolve(const std::string &document_path) const {
  auto path = resolve_path(document_path);
  if (!path.ok()) {
    throw SecurityError(path.error());
  }
  std::error_code ec;
  if (!std::filesystem::is_regular_file(path.value(), ec)) {
    throw NotFoundError("Document not found: " + path.value().string());
  }
  return expand(load_body(path.value()));
}

std::string PromptResolver::agent_prompt_path(const std::string &agent) {
  return std::string(CURSOR_DIR) + "/agents/" + agent + "/system_prompt.mdc";
}

std::string PromptResolver::load_agent_prompt(const std::string &agent) const {
  const std::string relative = agent_prompt_path(agent);
  auto path = resolve_path(relative);
  if (!path.ok()) {
    throw SecurityError("Invalid agent name: " + agent);
  }
  std::error_code ec;
  if (!std::filesystem::is_regular_file(path.value(), ec)) {
    throw NotFoundError("Agent prompt not found for '" + agent + "' at " +
                        path.value().string());
  }
  std::string expanded = expand(load_body(path.value()));
  observability::record_prompt_resolved(agent, expanded.size(), count_markers(expanded));
  return expanded;
}

std::size_t count_markers(const std::string &expanded) {
  static const std::array<const char *, 4> markers = {
      "[MISSING FILE: ", "[CIRCULAR REFERENCE: ", "[SECURITY BLOCK: ", "[ERROR LOADING FILE: "};
  std::size_t total = 0;
  for (const char *marker : markers) {
    for (auto pos = expanded.find(marker); pos != std::string::npos;
         pos = expanded.find(marker, pos + 1)) {
      ++total;
    }
  }
  return total;
}

} // namespace conductor::prompt
