#pragma once

#include <string>
#include <unordered_map>
#include <vector>

namespace hostgate::common {

/// Escape a string for embedding inside a JSON string literal.
[[nodiscard]] std::string json_escape(const std::string &value);

/// Unescape a JSON-encoded string body (handles \n, \r, \t, \uXXXX and pass-through).
[[nodiscard]] std::string json_unescape(const std::string &raw);

/// Extract a nested JSON object field (including braces) from a JSON document.
[[nodiscard]] std::string json_get_object(const std::string &json, const std::string &field);

/// Extract a nested JSON array field (including brackets) from a JSON document.
[[nodiscard]] std::string json_get_array(const std::string &json, const std::string &field);

/// Extract the string members of an array field like "deny": ["a","b"].
[[nodiscard]] std::vector<std::string> json_get_string_array(const std::string &json,
                                                             const std::string &field);

/// Parse a flat JSON object into a key→value map. Nested values are kept as raw text.
using JsonFlatMap = std::unordered_map<std::string, std::string>;
[[nodiscard]] JsonFlatMap json_parse_flat(const std::string &json);

} // namespace hostgate::common
