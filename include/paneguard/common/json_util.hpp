#pragma once

#include <map>
#include <string>
#include <vector>

namespace paneguard::common {

/// String value of a top-level field of a JSON object, unescaped. Empty when
/// the field is absent or not a string.
[[nodiscard]] std::string json_get_string(const std::string &json, const std::string &field);

/// Raw text of a top-level numeric (or literal) field. Empty when absent or a string.
[[nodiscard]] std::string json_get_number(const std::string &json, const std::string &field);

/// Raw text of a top-level object field, braces included. Empty when absent.
[[nodiscard]] std::string json_get_object(const std::string &json, const std::string &field);

/// Quoted JSON string literal. Bytes below 0x20 become \u escapes so the
/// output never spans lines.
[[nodiscard]] std::string json_quote(const std::string &value);

/// Render a flat string map as a JSON object, keys in map order.
[[nodiscard]] std::string json_object(const std::map<std::string, std::string> &fields);

/// Render a list of already-serialized JSON values as an array.
[[nodiscard]] std::string json_array(const std::vector<std::string> &values);

} // namespace paneguard::common
