#pragma once

#include "paneguard/common/result.hpp"
#include <cstdint>
#include <string>
#include <unordered_map>

namespace paneguard::common {

/// Flat view of a TOML document: `section.key` -> raw value text.
struct TomlDocument {
  std::unordered_map<std::string, std::string> values;

  [[nodiscard]] std::string get_string(const std::string &key,
                                       const std::string &fallback = "") const;
  [[nodiscard]] bool get_bool(const std::string &key, bool fallback) const;
  /// Fallback when absent; failure when present but not an unsigned integer.
  [[nodiscard]] Result<std::uint64_t> require_u64(const std::string &key,
                                                  std::uint64_t fallback) const;
};

/// Rejects duplicate keys, open strings and malformed lines, naming the line.
[[nodiscard]] Result<TomlDocument> parse_toml(const std::string &content);

} // namespace paneguard::common
