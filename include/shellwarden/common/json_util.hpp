#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace shellwarden::common {

/// Escape a string for embedding inside a JSON string literal.
[[nodiscard]] std::string json_escape(const std::string &value);

/// Unescape the body of a JSON string literal. \uXXXX escapes are emitted as UTF-8.
[[nodiscard]] std::string json_unescape(const std::string &raw);

/// Skip whitespace starting at pos, returning the first non-whitespace position.
[[nodiscard]] std::size_t json_skip_ws(const std::string &text, std::size_t pos);

/// Find the closing quote of a JSON string starting at quote_pos.
[[nodiscard]] std::size_t json_find_string_end(const std::string &json, std::size_t quote_pos);

/// Find matching bracket/brace for nested JSON structures.
[[nodiscard]] std::size_t json_find_matching_token(const std::string &json, std::size_t open_pos,
                                                    char open_ch, char close_ch);

/// Top-level members of a JSON object. String values are unescaped; objects, arrays,
/// numbers, booleans and null are kept as raw JSON text.
using JsonFlatMap = std::unordered_map<std::string, std::string>;
[[nodiscard]] JsonFlatMap json_parse_flat(const std::string &json);

/// Parse ["a","b"]. Returns nullopt when the text is not an array of strings.
[[nodiscard]] std::optional<std::vector<std::string>>
json_parse_string_array(const std::string &array_json);

/// Serialize a list of strings as a JSON array.
[[nodiscard]] std::string json_string_array(const std::vector<std::string> &values);

/// Split a JSON array of objects into individual object strings.
[[nodiscard]] std::vector<std::string> json_split_top_level_objects(const std::string &array_json);

/// First balanced {...} in free text, e.g. a model reply wrapped in prose or code fences.
[[nodiscard]] std::string json_extract_first_object(const std::string &text);

} // namespace shellwarden::common
