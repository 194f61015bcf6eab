#include "conductor/common/fs.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <regex>
#include <sstream>

namespace conductor::common {

std::string_view error_kind_to_string(const ErrorKind kind) {
  switch (kind) {
  case ErrorKind::None:
    return "none";
  case ErrorKind::NotFound:
    return "not_found";
  case ErrorKind::SecurityViolation:
    return "security_violation";
  case ErrorKind::CycleDetected:
    return "cycle_detected";
  case ErrorKind::Upstream:
    return "upstream_failure";
  case ErrorKind::Validation:
    return "validation_failure";
  case ErrorKind::Io:
    return "io_error";
  }
  return "unknown";
}

std::string trim(const std::string &input) {
  const auto is_space = [](unsigned char c) { return std::isspace(c) != 0; };
  const auto first = std::find_if_not(input.begin(), input.end(), is_space);
  const auto last = std::find_if_not(input.rbegin(), input.rend(), is_space).base();
  if (first >= last) {
    return "";
  }
  return std::string(first, last);
}

bool starts_with(const std::string &value, const std::string &prefix) {
  return value.rfind(prefix, 0) == 0;
}

bool ends_with(const std::string &value, const std::string &suffix) {
  return value.size() >= suffix.size() &&
         value.compare(value.size() - suffix.size(), suffix.size(), suffix) == 0;
}

std::string to_lower(std::string value) {
  std::transform(value.begin(), value.end(), value.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return value;
}

Result<std::filesystem::path> home_dir() {
  if (const char *home = std::getenv("HOME"); home != nullptr && *home != '\0') {
    return Result<std::filesystem::path>::success(std::filesystem::path(home));
  }
  return Result<std::filesystem::path>::failure("HOME is not set", ErrorKind::NotFound);
}

Result<std::filesystem::path> ensure_dir(const std::filesystem::path &path) {
  std::error_code ec;
  std::filesystem::create_directories(path, ec);
  if (ec) {
    return Result<std::filesystem::path>::failure(
        "Failed to create directory: " + path.string() + ": " + ec.message(), ErrorKind::Io);
  }
  return Result<std::filesystem::path>::success(path);
}

std::string expand_path(std::string value) {
  if (value.empty()) {
    return value;
  }
  if (value[0] == '~') {
    if (auto home = home_dir(); home.ok()) {
      value.replace(0, 1, home.value().string());
    }
  }

  static const std::regex env_pattern(R"(\$\{?([A-Za-z_][A-Za-z0-9_]*)\}?)");
  std::smatch match;
  std::string expanded;
  std::string remaining = value;
  while (std::regex_search(remaining, match, env_pattern)) {
    expanded += match.prefix().str();
    if (const char *var = std::getenv(match[1].str().c_str()); var != nullptr) {
      expanded += var;
    }
    remaining = match.suffix().str();
  }
  return expanded + remaining;
}

bool is_subpath(const std::filesystem::path &candidate, const std::filesystem::path &parent) {
  auto c_it = candidate.begin();
  for (auto p_it = parent.begin(); p_it != parent.end(); ++p_it, ++c_it) {
    // A trailing separator shows up as an empty final element.
    if (p_it->empty() && std::next(p_it) == parent.end()) {
      break;
    }
    if (c_it == candidate.end() || *c_it != *p_it) {
      return false;
    }
  }
  return true;
}

Result<std::string> read_text_file(const std::filesystem::path &path) {
  std::error_code ec;
  if (!std::filesystem::exists(path, ec)) {
    return Result<std::string>::failure("File not found: " + path.string(), ErrorKind::NotFound);
  }
  if (std::filesystem::is_directory(path, ec)) {
    return Result<std::string>::failure("Is a directory: " + path.string(), ErrorKind::Io);
  }
  std::ifstream in(path, std::ios::binary);
  if (!in) {
    return Result<std::string>::failure("Failed to open file: " + path.string(), ErrorKind::Io);
  }
  std::stringstream buffer;
  buffer << in.rdbuf();
  if (in.bad()) {
    return Result<std::string>::failure("Failed to read file: " + path.string(), ErrorKind::Io);
  }
  return Result<std::string>::success(buffer.str());
}

std::filesystem::path normalized_absolute(const std::filesystem::path &path) {
  std::error_code ec;
  auto absolute = std::filesystem::absolute(path, ec);
  if (ec) {
    absolute = path;
  }
  auto canonical = std::filesystem::weakly_canonical(absolute.lexically_normal(), ec);
  if (ec) {
    return absolute.lexically_normal();
  }
  return canonical;
}

namespace {

bool is_continuation_byte(const char ch) {
  return (static_cast<unsigned char>(ch) & 0xC0U) == 0x80U;
}

} // namespace

std::size_t utf8_length(std::string_view value) {
  return static_cast<std::size_t>(
      std::count_if(value.begin(), value.end(), [](char ch) { return !is_continuation_byte(ch); }));
}

std::string tail_chars(const std::string &value, const std::size_t max_chars) {
  if (max_chars == 0) {
    return "";
  }
  std::size_t seen = 0;
  for (std::size_t pos = value.size(); pos > 0; --pos) {
    if (!is_continuation_byte(value[pos - 1]) && ++seen == max_chars) {
      return value.substr(pos - 1);
    }
  }
  return value;
}

} // namespace conductor::common
