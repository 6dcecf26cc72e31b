#include "paneguard/common/toml.hpp"

#include "paneguard/common/fs.hpp"

#include <charconv>
#include <sstream>

namespace paneguard::common {

namespace {

// Cuts a trailing `#` comment unless it sits inside a quoted string. Returns
// false when a string is left open.
bool cut_comment(const std::string &line, std::string &out) {
  bool quoted = false;
  bool escaped = false;
  out.clear();
  for (const char ch : line) {
    if (quoted) {
      if (escaped) {
        escaped = false;
      } else if (ch == '\\') {
        escaped = true;
      } else if (ch == '"') {
        quoted = false;
      }
    } else if (ch == '"') {
      quoted = true;
    } else if (ch == '#') {
      break;
    }
    out.push_back(ch);
  }
  return !quoted;
}

std::string unquote(const std::string &raw) {
  const std::string value = trim(raw);
  if (value.size() < 2 || value.front() != '"' || value.back() != '"') {
    return value;
  }
  std::string out;
  out.reserve(value.size() - 2);
  for (std::size_t i = 1; i + 1 < value.size(); ++i) {
    if (value[i] == '\\' && i + 2 < value.size()) {
      const char next = value[++i];
      out.push_back(next == 't' ? '\t' : next == 'n' ? '\n' : next);
      continue;
    }
    out.push_back(value[i]);
  }
  return out;
}

// TOML allows `_` between digits: 10_000.
bool parse_unsigned(const std::string &text, std::uint64_t &out) {
  std::string digits;
  for (const char ch : trim(text)) {
    if (ch != '_') {
      digits.push_back(ch);
    }
  }
  if (digits.empty()) {
    return false;
  }
  const char *end = digits.data() + digits.size();
  const auto [ptr, ec] = std::from_chars(digits.data(), end, out);
  return ec == std::errc() && ptr == end;
}

std::string at_line(std::size_t line_number) { return " at line " + std::to_string(line_number); }

} // namespace

std::string TomlDocument::get_string(const std::string &key, const std::string &fallback) const {
  const auto it = values.find(key);
  return it == values.end() ? fallback : unquote(it->second);
}

bool TomlDocument::get_bool(const std::string &key, bool fallback) const {
  const auto it = values.find(key);
  if (it == values.end()) {
    return fallback;
  }
  const std::string text = to_lower(trim(it->second));
  if (text == "true" || text == "false") {
    return text == "true";
  }
  return fallback;
}

Result<std::uint64_t> TomlDocument::require_u64(const std::string &key,
                                                std::uint64_t fallback) const {
  const auto it = values.find(key);
  if (it == values.end()) {
    return Result<std::uint64_t>::success(fallback);
  }
  std::uint64_t parsed = 0;
  if (!parse_unsigned(it->second, parsed)) {
    return Result<std::uint64_t>::failure(key + " must be a non-negative integer");
  }
  return Result<std::uint64_t>::success(parsed);
}

Result<TomlDocument> parse_toml(const std::string &content) {
  TomlDocument document;
  std::istringstream stream(content);
  std::string raw;
  std::string line;
  std::string section;
  std::size_t line_number = 0;

  while (std::getline(stream, raw)) {
    ++line_number;
    if (!cut_comment(raw, line)) {
      return Result<TomlDocument>::failure("Unterminated string" + at_line(line_number));
    }
    line = trim(line);
    if (line.empty()) {
      continue;
    }

    if (line.front() == '[') {
      if (line.back() != ']') {
        return Result<TomlDocument>::failure("Unclosed section header" + at_line(line_number));
      }
      section = trim(line.substr(1, line.size() - 2));
      if (section.empty()) {
        return Result<TomlDocument>::failure("Invalid empty section" + at_line(line_number));
      }
      continue;
    }

    const auto eq = line.find('=');
    if (eq == std::string::npos) {
      return Result<TomlDocument>::failure("Invalid key/value" + at_line(line_number));
    }
    const std::string key = trim(line.substr(0, eq));
    if (key.empty()) {
      return Result<TomlDocument>::failure("Missing key" + at_line(line_number));
    }

    const std::string full_key = section.empty() ? key : section + "." + key;
    if (!document.values.emplace(full_key, trim(line.substr(eq + 1))).second) {
      return Result<TomlDocument>::failure("Duplicate key '" + full_key + "'" + at_line(line_number));
    }
  }

  return Result<TomlDocument>::success(std::move(document));
}

} // namespace paneguard::common
