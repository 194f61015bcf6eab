#include "conductor/common/frontmatter.hpp"

#include "conductor/common/fs.hpp"

#include <sstream>
#include <utility>

namespace conductor::common {

namespace {

constexpr const char *MARKER = "---";

std::string strip_quotes(std::string value) {
  value = trim(value);
  if (value.size() >= 2 && ((value.front() == '"' && value.back() == '"') ||
                            (value.front() == '\'' && value.back() == '\''))) {
    return value.substr(1, value.size() - 2);
  }
  return value;
}

std::string strip_comment(const std::string &line) {
  char quote = '\0';
  for (std::size_t i = 0; i < line.size(); ++i) {
    const char ch = line[i];
    if ((ch == '"' || ch == '\'') && (quote == '\0' || quote == ch)) {
      quote = quote == '\0' ? ch : '\0';
      continue;
    }
    if (quote == '\0' && ch == '#' && (i == 0 || line[i - 1] == ' ' || line[i - 1] == '\t')) {
      return line.substr(0, i);
    }
  }
  return line;
}

std::vector<std::string> parse_inline_list(const std::string &value) {
  std::vector<std::string> out;
  const std::string inner = trim(value.substr(1, value.size() - 2));
  std::string current;
  char quote = '\0';
  for (const char ch : inner) {
    if ((ch == '"' || ch == '\'') && (quote == '\0' || quote == ch)) {
      quote = quote == '\0' ? ch : '\0';
    }
    if (quote == '\0' && ch == ',') {
      if (auto item = strip_quotes(current); !item.empty()) {
        out.push_back(std::move(item));
      }
      current.clear();
      continue;
    }
    current.push_back(ch);
  }
  if (auto item = strip_quotes(current); !item.empty()) {
    out.push_back(std::move(item));
  }
  return out;
}

std::size_t indent_of(const std::string &line) {
  std::size_t indent = 0;
  while (indent < line.size() && (line[indent] == ' ' || line[indent] == '\t')) {
    ++indent;
  }
  return indent;
}

struct OpenKey {
  std::size_t indent = 0;
  std::string key;
};

} // namespace

std::string Frontmatter::get(const std::string &key, const std::string &fallback) const {
  const auto it = values.find(key);
  return it == values.end() ? fallback : it->second;
}

std::vector<std::string> Frontmatter::list(const std::string &key) const {
  const auto it = lists.find(key);
  if (it != lists.end()) {
    return it->second;
  }
  // A scalar where a list was expected reads as a single entry.
  const auto scalar = values.find(key);
  if (scalar != values.end() && !scalar->second.empty()) {
    return {scalar->second};
  }
  return {};
}

Frontmatter parse_frontmatter(const std::string &yaml) {
  Frontmatter doc;
  std::vector<OpenKey> open;

  std::string block_key;
  std::size_t block_indent = 0;
  bool block_folded = false;

  std::istringstream stream(yaml);
  std::string raw;
  while (std::getline(stream, raw)) {
    if (!raw.empty() && raw.back() == '\r') {
      raw.pop_back();
    }
    const std::size_t indent = indent_of(raw);

    if (!block_key.empty()) {
      const std::string text = trim(raw);
      if (text.empty() || indent > block_indent) {
        std::string &target = doc.values[block_key];
        if (!target.empty() && !text.empty()) {
          target += block_folded ? " " : "\n";
        }
        target += text;
        continue;
      }
      block_key.clear();
    }

    const std::string line = trim(strip_comment(raw));
    if (line.empty()) {
      continue;
    }

    if (line == "-" || starts_with(line, "- ")) {
      while (!open.empty() && open.back().indent > indent) {
        open.pop_back();
      }
      if (open.empty()) {
        continue;
      }
      doc.lists[open.back().key].push_back(strip_quotes(line.substr(1)));
      continue;
    }

    while (!open.empty() && open.back().indent >= indent) {
      open.pop_back();
    }

    const auto colon = line.find(':');
    if (colon == std::string::npos) {
      continue;
    }
    const std::string name = trim(line.substr(0, colon));
    const std::string value = trim(line.substr(colon + 1));
    if (name.empty()) {
      continue;
    }
    const std::string key = open.empty() ? name : open.back().key + "." + name;
    doc.keys.insert(key);

    if (value.empty()) {
      open.push_back({.indent = indent, .key = key});
      continue;
    }
    if (value == ">" || value == ">-" || value == "|" || value == "|-") {
      block_key = key;
      block_indent = indent;
      block_folded = value.front() == '>';
      doc.values[key].clear();
      continue;
    }
    if (value.size() >= 2 && value.front() == '[' && value.back() == ']') {
      doc.lists[key] = parse_inline_list(value);
      continue;
    }
    doc.values[key] = strip_quotes(value);
  }
  return doc;
}

FrontmatterSplit split_frontmatter(const std::string &content) {
  FrontmatterSplit split;
  split.body = content;
  if (!starts_with(content, MARKER)) {
    return split;
  }
  const std::size_t close = content.find(MARKER, 3);
  if (close == std::string::npos) {
    return split;
  }
  split.frontmatter = parse_frontmatter(content.substr(3, close - 3));
  split.body = trim(content.substr(close + 3));
  split.has_frontmatter = true;
  return split;
}

} // namespace conductor::common
