#pragma once

#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace conductor::common {

/// Escape a string for embedding inside a JSON string literal.
[[nodiscard]] std::string json_escape(const std::string &value);

/// Decode a JSON string body, including \uXXXX escapes (emitted as UTF-8).
[[nodiscard]] std::string json_unescape(const std::string &raw);

[[nodiscard]] std::size_t json_skip_ws(const std::string &text, std::size_t pos);
[[nodiscard]] std::size_t json_find_string_end(const std::string &json, std::size_t quote_pos);
[[nodiscard]] std::size_t json_find_matching_token(const std::string &json, std::size_t open_pos,
                                                    char open_ch, char close_ch);

[[nodiscard]] std::string json_get_string(const std::string &json, const std::string &field);
/// Numeric (or boolean) literal of `field`, unparsed.
[[nodiscard]] std::string json_get_number(const std::string &json, const std::string &field);
[[nodiscard]] std::string json_get_object(const std::string &json, const std::string &field);
[[nodiscard]] std::string json_get_array(const std::string &json, const std::string &field);
[[nodiscard]] std::vector<std::string> json_get_string_array(const std::string &json,
                                                              const std::string &field);

/// Top-level members of a JSON object. String values are unescaped, nested
/// values are kept as raw JSON text.
using JsonFlatMap = std::map<std::string, std::string>;
[[nodiscard]] JsonFlatMap json_parse_flat(const std::string &json);

/// Serialize a string map as a JSON object of string members.
[[nodiscard]] std::string json_serialize_flat(const JsonFlatMap &values);

[[nodiscard]] std::string json_string_array(const std::vector<std::string> &values);

/// Decode a raw JSON array of strings such as ["a","b"].
[[nodiscard]] std::vector<std::string> json_parse_string_array(const std::string &array_json);

[[nodiscard]] std::vector<std::string> json_split_top_level_objects(const std::string &array_json);

/// First balanced {...} object found in free text (model output with prose
/// or code fences around it).
[[nodiscard]] std::optional<std::string> json_extract_object(const std::string &text);

} // namespace conductor::common
