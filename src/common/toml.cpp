#include "conductor/common/toml.hpp"

#include "conductor/common/fs.hpp"

#include <charconv>
#include <sstream>

namespace conductor::common {

namespace {

std::string strip_comment(const std::string &line) {
  char quote = '\0';
  for (std::size_t i = 0; i < line.size(); ++i) {
    const char ch = line[i];
    if (quote != '\0') {
      if (ch == '\\' && quote == '"') {
        ++i;
      } else if (ch == quote) {
        quote = '\0';
      }
      continue;
    }
    if (ch == '"' || ch == '\'') {
      quote = ch;
    } else if (ch == '#') {
      return line.substr(0, i);
    }
  }
  return line;
}

std::vector<std::string> split_array_elements(const std::string &body) {
  std::vector<std::string> result;
  std::string current;
  char quote = '\0';
  for (std::size_t i = 0; i < body.size(); ++i) {
    const char ch = body[i];
    if (quote != '\0') {
      current.push_back(ch);
      if (ch == '\\' && quote == '"' && i + 1 < body.size()) {
        current.push_back(body[++i]);
      } else if (ch == quote) {
        quote = '\0';
      }
      continue;
    }
    if (ch == '"' || ch == '\'') {
      quote = ch;
      current.push_back(ch);
    } else if (ch == ',') {
      result.push_back(trim(current));
      current.clear();
    } else {
      current.push_back(ch);
    }
  }
  if (!trim(current).empty()) {
    result.push_back(trim(current));
  }
  return result;
}

std::string unquote(const std::string &raw) {
  const std::string value = trim(raw);
  if (value.size() < 2) {
    return value;
  }
  if (value.front() == '\'' && value.back() == '\'') {
    return value.substr(1, value.size() - 2);
  }
  if (value.front() != '"' || value.back() != '"') {
    return value;
  }
  std::string out;
  for (std::size_t i = 1; i + 1 < value.size(); ++i) {
    const char ch = value[i];
    if (ch != '\\' || i + 2 >= value.size()) {
      out.push_back(ch);
      continue;
    }
    const char next = value[++i];
    switch (next) {
    case 'n':
      out.push_back('\n');
      break;
    case 't':
      out.push_back('\t');
      break;
    case 'r':
      out.push_back('\r');
      break;
    default:
      out.push_back(next);
      break;
    }
  }
  return out;
}

template <typename T> bool parse_number(const std::string &raw, T &out) {
  std::string text = trim(raw);
  std::erase(text, '_');
  if (!text.empty() && text.front() == '+') {
    text.erase(0, 1);
  }
  const char *first = text.data();
  const char *last = first + text.size();
  auto [ptr, ec] = std::from_chars(first, last, out);
  return ec == std::errc() && ptr == last && first != last;
}

// True while a value opened with '[' still lacks its closing bracket.
bool array_is_open(const std::string &value) {
  if (value.empty() || value.front() != '[') {
    return false;
  }
  int depth = 0;
  char quote = '\0';
  for (std::size_t i = 0; i < value.size(); ++i) {
    const char ch = value[i];
    if (quote != '\0') {
      if (ch == '\\' && quote == '"') {
        ++i;
      } else if (ch == quote) {
        quote = '\0';
      }
      continue;
    }
    if (ch == '"' || ch == '\'') {
      quote = ch;
    } else if (ch == '[') {
      ++depth;
    } else if (ch == ']') {
      --depth;
    }
  }
  return depth > 0;
}

} // namespace

bool TomlDocument::has(const std::string &key) const { return values.contains(key); }

std::string TomlDocument::get_string(const std::string &key, const std::string &fallback) const {
  const auto it = values.find(key);
  return it == values.end() ? fallback : unquote(it->second);
}

bool TomlDocument::get_bool(const std::string &key, const bool fallback) const {
  const auto it = values.find(key);
  if (it == values.end()) {
    return fallback;
  }
  const std::string normalized = to_lower(trim(it->second));
  if (normalized == "true") {
    return true;
  }
  if (normalized == "false") {
    return false;
  }
  return fallback;
}

std::uint64_t TomlDocument::get_u64(const std::string &key, const std::uint64_t fallback) const {
  const auto it = values.find(key);
  std::uint64_t parsed = 0;
  if (it == values.end() || !parse_number(it->second, parsed)) {
    return fallback;
  }
  return parsed;
}

double TomlDocument::get_double(const std::string &key, const double fallback) const {
  const auto it = values.find(key);
  double parsed = 0.0;
  if (it == values.end() || !parse_number(it->second, parsed)) {
    return fallback;
  }
  return parsed;
}

std::vector<std::string>
TomlDocument::get_string_array(const std::string &key,
                               const std::vector<std::string> &fallback) const {
  const auto it = values.find(key);
  if (it == values.end()) {
    return fallback;
  }
  const std::string raw = trim(it->second);
  if (raw.size() < 2 || raw.front() != '[' || raw.back() != ']') {
    return fallback;
  }
  std::vector<std::string> out;
  for (const auto &element : split_array_elements(raw.substr(1, raw.size() - 2))) {
    if (!element.empty()) {
      out.push_back(unquote(element));
    }
  }
  return out;
}

Result<TomlDocument> parse_toml(const std::string &content) {
  TomlDocument document;
  std::istringstream stream(content);
  std::string line;
  std::string section;
  std::string pending_key;
  std::string pending_value;
  std::size_t line_number = 0;

  while (std::getline(stream, line)) {
    ++line_number;
    const std::string clean = trim(strip_comment(line));

    if (!pending_key.empty()) {
      pending_value += " " + clean;
      if (!array_is_open(pending_value)) {
        document.values[pending_key] = pending_value;
        pending_key.clear();
        pending_value.clear();
      }
      continue;
    }
    if (clean.empty()) {
      continue;
    }

    if (clean.front() == '[' && clean.back() == ']') {
      section = trim(clean.substr(1, clean.size() - 2));
      if (section.empty()) {
        return Result<TomlDocument>::failure(
            "Invalid empty section at line " + std::to_string(line_number), ErrorKind::Validation);
      }
      continue;
    }

    const std::size_t equals = clean.find('=');
    if (equals == std::string::npos) {
      return Result<TomlDocument>::failure(
          "Invalid key/value at line " + std::to_string(line_number), ErrorKind::Validation);
    }
    const std::string key = unquote(clean.substr(0, equals));
    const std::string value = trim(clean.substr(equals + 1));
    if (key.empty()) {
      return Result<TomlDocument>::failure("Missing key at line " + std::to_string(line_number),
                                           ErrorKind::Validation);
    }

    const std::string full_key = section.empty() ? key : section + "." + key;
    if (array_is_open(value)) {
      pending_key = full_key;
      pending_value = value;
      continue;
    }
    document.values[full_key] = value;
  }

  if (!pending_key.empty()) {
    return Result<TomlDocument>::failure("Unterminated array for key " + pending_key,
                                         ErrorKind::Validation);
  }
  return Result<TomlDocument>::success(std::move(document));
}

std::string quote_toml_string(const std::string &value) {
  std::string escaped = "\"";
  for (const char ch : value) {
    if (ch == '"' || ch == '\\') {
      escaped.push_back('\\');
      escaped.push_back(ch);
    } else if (ch == '\n') {
      escaped += "\\n";
    } else {
      escaped.push_back(ch);
    }
  }
  escaped.push_back('"');
  return escaped;
}

} // namespace conductor::common
