#pragma once

#include "conductor/common/result.hpp"
#include <filesystem>
#include <string>
#include <string_view>

namespace conductor::common {

[[nodiscard]] std::string trim(const std::string &input);
[[nodiscard]] bool starts_with(const std::string &value, const std::string &prefix);
[[nodiscard]] bool ends_with(const std::string &value, const std::string &suffix);
[[nodiscard]] std::string to_lower(std::string value);
[[nodiscard]] Result<std::filesystem::path> home_dir();
[[nodiscard]] Result<std::filesystem::path> ensure_dir(const std::filesystem::path &path);
[[nodiscard]] std::string expand_path(std::string value);
[[nodiscard]] bool is_subpath(const std::filesystem::path &candidate,
                             const std::filesystem::path &parent);

/// Read a whole file as bytes. Missing files fail with ErrorKind::NotFound.
[[nodiscard]] Result<std::string> read_text_file(const std::filesystem::path &path);

/// Absolute, lexically normalised and (where the prefix exists) symlink-resolved path.
[[nodiscard]] std::filesystem::path normalized_absolute(const std::filesystem::path &path);

/// Number of UTF-8 code points; stray continuation bytes are not counted.
[[nodiscard]] std::size_t utf8_length(std::string_view value);

/// Last `max_chars` code points of UTF-8 `value`, cut on a code-point boundary.
[[nodiscard]] std::string tail_chars(const std::string &value, std::size_t max_chars);

} // namespace conductor::common
