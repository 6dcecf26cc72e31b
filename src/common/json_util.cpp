#include "paneguard/common/json_util.hpp"

#include <array>
#include <cctype>
#include <cstdio>

namespace paneguard::common {

namespace {

int hex_digit(const char ch) {
  if (ch >= '0' && ch <= '9') {
    return ch - '0';
  }
  if (ch >= 'a' && ch <= 'f') {
    return ch - 'a' + 10;
  }
  if (ch >= 'A' && ch <= 'F') {
    return ch - 'A' + 10;
  }
  return -1;
}

bool is_space(const char ch) { return std::isspace(static_cast<unsigned char>(ch)) != 0; }

std::size_t skip_space(const std::string &text, std::size_t pos) {
  while (pos < text.size() && is_space(text[pos])) {
    ++pos;
  }
  return pos;
}

// Index of the quote closing the string opened at `open`, or npos.
std::size_t closing_quote(const std::string &json, const std::size_t open) {
  for (std::size_t i = open + 1; i < json.size(); ++i) {
    if (json[i] == '\\') {
      ++i;
    } else if (json[i] == '"') {
      return i;
    }
  }
  return std::string::npos;
}

std::string unescape(const std::string &raw) {
  std::string out;
  out.reserve(raw.size());
  for (std::size_t i = 0; i < raw.size(); ++i) {
    if (raw[i] != '\\' || i + 1 >= raw.size()) {
      out.push_back(raw[i]);
      continue;
    }
    const char next = raw[++i];
    if (next == 'n') {
      out.push_back('\n');
    } else if (next == 'r') {
      out.push_back('\r');
    } else if (next == 't') {
      out.push_back('\t');
    } else if (next == 'u') {
      int code = 0;
      bool valid = i + 4 < raw.size();
      for (std::size_t k = 1; valid && k <= 4; ++k) {
        const int digit = hex_digit(raw[i + k]);
        valid = digit >= 0;
        code = code * 16 + digit;
      }
      // Only the control range is ever written with \u; anything wider stays escaped.
      if (valid && code < 0x80) {
        out.push_back(static_cast<char>(code));
        i += 4;
      } else {
        out += "\\u";
      }
    } else {
      out.push_back(next);
    }
  }
  return out;
}

// Position of the value belonging to `field` in the outermost object, or npos.
// Keys of nested objects and string values that happen to equal `field` do not match.
std::size_t value_position(const std::string &json, const std::string &field) {
  int depth = 0;
  bool expect_key = false;
  for (std::size_t i = 0; i < json.size(); ++i) {
    const char ch = json[i];
    if (ch == '"') {
      const auto end = closing_quote(json, i);
      if (end == std::string::npos) {
        return std::string::npos;
      }
      if (depth == 1 && expect_key) {
        const auto colon = skip_space(json, end + 1);
        if (colon < json.size() && json[colon] == ':' &&
            unescape(json.substr(i + 1, end - i - 1)) == field) {
          return skip_space(json, colon + 1);
        }
      }
      expect_key = false;
      i = end;
    } else if (ch == '{' || ch == '[') {
      ++depth;
      expect_key = ch == '{' && depth == 1;
    } else if (ch == '}' || ch == ']') {
      --depth;
    } else if (ch == ',' && depth == 1) {
      expect_key = true;
    }
  }
  return std::string::npos;
}

std::string escape(const std::string &value) {
  std::string escaped;
  escaped.reserve(value.size() + 8);
  for (const char ch : value) {
    if (ch == '"') {
      escaped += "\\\"";
    } else if (ch == '\\') {
      escaped += "\\\\";
    } else if (ch == '\n') {
      escaped += "\\n";
    } else if (ch == '\r') {
      escaped += "\\r";
    } else if (ch == '\t') {
      escaped += "\\t";
    } else if (static_cast<unsigned char>(ch) < 0x20U || ch == 0x7F) {
      std::array<char, 8> buffer{};
      std::snprintf(buffer.data(), buffer.size(), "\\u%04x",
                    static_cast<unsigned int>(static_cast<unsigned char>(ch)));
      escaped += buffer.data();
    } else {
      escaped.push_back(ch);
    }
  }
  return escaped;
}

} // namespace

std::string json_get_string(const std::string &json, const std::string &field) {
  const auto pos = value_position(json, field);
  if (pos >= json.size() || json[pos] != '"') {
    return "";
  }
  const auto end = closing_quote(json, pos);
  if (end == std::string::npos) {
    return "";
  }
  return unescape(json.substr(pos + 1, end - pos - 1));
}

std::string json_get_number(const std::string &json, const std::string &field) {
  const auto start = value_position(json, field);
  if (start >= json.size() || json[start] == '"') {
    return "";
  }
  std::size_t pos = start;
  while (pos < json.size() && json[pos] != ',' && json[pos] != '}' && json[pos] != ']' &&
         !is_space(json[pos])) {
    ++pos;
  }
  return json.substr(start, pos - start);
}

std::string json_get_object(const std::string &json, const std::string &field) {
  const auto start = value_position(json, field);
  if (start >= json.size() || json[start] != '{') {
    return "";
  }
  int depth = 0;
  for (std::size_t i = start; i < json.size(); ++i) {
    if (json[i] == '"') {
      i = closing_quote(json, i);
      if (i == std::string::npos) {
        return "";
      }
    } else if (json[i] == '{') {
      ++depth;
    } else if (json[i] == '}' && --depth == 0) {
      return json.substr(start, i - start + 1);
    }
  }
  return "";
}

std::string json_quote(const std::string &value) { return "\"" + escape(value) + "\""; }

std::string json_object(const std::map<std::string, std::string> &fields) {
  std::string out = "{";
  for (const auto &[key, value] : fields) {
    if (out.size() > 1) {
      out.push_back(',');
    }
    out += json_quote(key) + ":" + json_quote(value);
  }
  return out + "}";
}

std::string json_array(const std::vector<std::string> &values) {
  std::string out = "[";
  for (const auto &value : values) {
    if (out.size() > 1) {
      out.push_back(',');
    }
    out += value;
  }
  return out + "]";
}

} // namespace paneguard::common
