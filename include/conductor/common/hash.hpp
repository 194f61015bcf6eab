#pragma once

#include <cstddef>
#include <string>
#include <string_view>

namespace conductor::common {

/// Lowercase hex SHA-256 digest of `text`.
[[nodiscard]] std::string sha256_hex(std::string_view text);

/// `bytes` random bytes as lowercase hex.
[[nodiscard]] std::string random_hex(std::size_t bytes);

/// Random RFC 4122 version-4 id, e.g. for cache entries and request ids.
[[nodiscard]] std::string generate_uuid();

} // namespace conductor::common
