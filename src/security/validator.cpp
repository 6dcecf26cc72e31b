#include "paneguard/security/validator.hpp"

#include <array>
#include <charconv>
#include <vector>

namespace paneguard::security {

namespace {

bool is_name_char(const char ch) {
  return (ch >= 'a' && ch <= 'z') || (ch >= 'A' && ch <= 'Z') || (ch >= '0' && ch <= '9') ||
         ch == '_' || ch == '-';
}

bool is_digit_char(const char ch) { return ch >= '0' && ch <= '9'; }

bool is_path_char(const char ch) { return is_name_char(ch) || ch == '/' || ch == '.'; }

const std::array<IdentifierRule, 5> kIdentifierRules = {
    IdentifierRule{IdentifierKind::SessionName, "Session name", '\0', 1, 64, is_name_char, false,
                   "1-64 characters of [A-Za-z0-9_-]"},
    IdentifierRule{IdentifierKind::SessionId, "Session ID", '$', 1, 20, is_digit_char, false,
                   "$[0-9]+"},
    IdentifierRule{IdentifierKind::PaneId, "Pane ID", '%', 1, 20, is_digit_char, false,
                   "%[0-9]+"},
    IdentifierRule{IdentifierKind::WindowId, "Window ID", '@', 1, 20, is_digit_char, false,
                   "@[0-9]+"},
    IdentifierRule{IdentifierKind::SocketPath, "Socket path", '/', 1, 256, is_path_char, true,
                   "an absolute path of [A-Za-z0-9_/.-]"},
};

// A single check that fired. Rejections report the highest-priority finding
// and the worst tier among all of them.
struct Finding {
  ValidationIssue issue;
  RiskTier risk;
  std::string reason;
};

int issue_priority(const ValidationIssue issue) {
  switch (issue) {
  case ValidationIssue::NullByte:
    return 0;
  case ValidationIssue::ControlCharacter:
    return 1;
  case ValidationIssue::PathTraversal:
    return 2;
  case ValidationIssue::ShellMetacharacter:
    return 3;
  case ValidationIssue::Empty:
    return 4;
  case ValidationIssue::TooLong:
    return 5;
  case ValidationIssue::FormatMismatch:
    return 6;
  case ValidationIssue::NotNumeric:
    return 7;
  case ValidationIssue::OutOfRange:
    return 8;
  case ValidationIssue::None:
    break;
  }
  return 9;
}

ValidationResult reject_with(const std::vector<Finding> &findings) {
  const Finding *primary = &findings.front();
  RiskTier worst = RiskTier::Medium;
  for (const auto &finding : findings) {
    worst = max_tier(worst, finding.risk);
    if (issue_priority(finding.issue) < issue_priority(primary->issue)) {
      primary = &finding;
    }
  }
  return ValidationResult::reject(primary->issue, primary->reason, worst);
}

void check_bytes(const std::string_view input, const std::string_view label,
                 std::vector<Finding> &findings) {
  if (contains_null_byte(input)) {
    findings.push_back({ValidationIssue::NullByte, RiskTier::Critical,
                        std::string(label) + " contains null bytes"});
  }
  if (contains_control_character(input)) {
    findings.push_back({ValidationIssue::ControlCharacter, RiskTier::Critical,
                        std::string(label) + " contains control characters"});
  }
}

bool decode_utf8_codepoint(const std::string_view input, std::size_t &index, std::uint32_t &cp) {
  if (index >= input.size()) {
    return false;
  }

  const unsigned char lead = static_cast<unsigned char>(input[index]);
  if (lead < 0x80U) {
    cp = lead;
    ++index;
    return true;
  }

  std::size_t extra = 0;
  std::uint32_t value = 0;
  if ((lead & 0xE0U) == 0xC0U) {
    extra = 1;
    value = lead & 0x1FU;
  } else if ((lead & 0xF0U) == 0xE0U) {
    extra = 2;
    value = lead & 0x0FU;
  } else if ((lead & 0xF8U) == 0xF0U) {
    extra = 3;
    value = lead & 0x07U;
  } else {
    cp = lead;
    ++index;
    return true;
  }

  if (index + extra >= input.size()) {
    cp = lead;
    ++index;
    return true;
  }

  for (std::size_t i = 1; i <= extra; ++i) {
    const unsigned char cont = static_cast<unsigned char>(input[index + i]);
    if ((cont & 0xC0U) != 0x80U) {
      cp = lead;
      ++index;
      return true;
    }
    value = (value << 6U) | static_cast<std::uint32_t>(cont & 0x3FU);
  }

  index += extra + 1;
  cp = value;
  return true;
}

} // namespace

std::string validation_issue_to_string(const ValidationIssue issue) {
  switch (issue) {
  case ValidationIssue::None:
    return "none";
  case ValidationIssue::Empty:
    return "empty";
  case ValidationIssue::TooLong:
    return "too_long";
  case ValidationIssue::NullByte:
    return "null_bytes";
  case ValidationIssue::ControlCharacter:
    return "control_characters";
  case ValidationIssue::PathTraversal:
    return "path_traversal";
  case ValidationIssue::ShellMetacharacter:
    return "shell_metacharacters";
  case ValidationIssue::FormatMismatch:
    return "format_mismatch";
  case ValidationIssue::NotNumeric:
    return "not_numeric";
  case ValidationIssue::OutOfRange:
    return "out_of_range";
  }
  return "none";
}

ValidationResult ValidationResult::accept(std::string value, const RiskTier risk,
                                          std::string note) {
  ValidationResult result;
  result.valid = true;
  result.sanitized_value = std::move(value);
  result.reason = std::move(note);
  result.risk = risk;
  return result;
}

ValidationResult ValidationResult::reject(const ValidationIssue issue, std::string reason,
                                          const RiskTier risk) {
  ValidationResult result;
  result.valid = false;
  result.issue = issue;
  result.reason = reason.empty() ? validation_issue_to_string(issue) : std::move(reason);
  result.risk = max_tier(risk, RiskTier::Medium);
  return result;
}

const IdentifierRule &identifier_rule(const IdentifierKind kind) {
  for (const auto &rule : kIdentifierRules) {
    if (rule.kind == kind) {
      return rule;
    }
  }
  return kIdentifierRules.front();
}

std::string identifier_kind_to_string(const IdentifierKind kind) {
  switch (kind) {
  case IdentifierKind::SessionName:
    return "session-name";
  case IdentifierKind::SessionId:
    return "session-id";
  case IdentifierKind::PaneId:
    return "pane-id";
  case IdentifierKind::WindowId:
    return "window-id";
  case IdentifierKind::SocketPath:
    return "socket-path";
  }
  return "session-name";
}

ValidationResult validate_identifier(const IdentifierKind kind, const std::string_view input) {
  const IdentifierRule &rule = identifier_rule(kind);
  const std::string label(rule.label);

  if (input.empty()) {
    return ValidationResult::reject(ValidationIssue::Empty, label + " must be a non-empty string",
                                    RiskTier::High);
  }

  std::vector<Finding> findings;
  check_bytes(input, label, findings);

  if (rule.path_shaped && input.find("..") != std::string_view::npos) {
    findings.push_back({ValidationIssue::PathTraversal, RiskTier::Critical,
                        label + " contains path traversal sequences"});
  }

  // The sigil itself may be a metacharacter ($), so only the body is scanned.
  const bool has_sigil = rule.sigil != '\0' && input.front() == rule.sigil;
  const std::string_view body = has_sigil ? input.substr(1) : input;
  if (contains_shell_metacharacter(body)) {
    findings.push_back({ValidationIssue::ShellMetacharacter, RiskTier::Critical,
                        label + " contains dangerous shell metacharacters"});
  }

  if (body.size() > rule.max_body) {
    findings.push_back({ValidationIssue::TooLong, RiskTier::Medium,
                        label + " exceeds " + std::to_string(rule.max_body) + " characters"});
  }

  bool shape_ok = (rule.sigil == '\0' || has_sigil) && body.size() >= rule.min_body;
  for (const char ch : body) {
    if (!rule.body_char(ch)) {
      shape_ok = false;
      break;
    }
  }
  if (!shape_ok) {
    findings.push_back({ValidationIssue::FormatMismatch, RiskTier::High,
                        label + " must match " + std::string(rule.format_hint)});
  }

  if (!findings.empty()) {
    return reject_with(findings);
  }
  return ValidationResult::accept(std::string(input));
}

ValidationResult validate_session_name(const std::string_view input) {
  return validate_identifier(IdentifierKind::SessionName, input);
}

ValidationResult validate_session_id(const std::string_view input) {
  return validate_identifier(IdentifierKind::SessionId, input);
}

ValidationResult validate_pane_id(const std::string_view input) {
  return validate_identifier(IdentifierKind::PaneId, input);
}

ValidationResult validate_window_id(const std::string_view input) {
  return validate_identifier(IdentifierKind::WindowId, input);
}

ValidationResult validate_socket_path(const std::string_view input) {
  return validate_identifier(IdentifierKind::SocketPath, input);
}

ValidationResult validate_target(const std::string_view input) {
  if (input.empty()) {
    return ValidationResult::reject(ValidationIssue::Empty, "Target must be a non-empty string",
                                    RiskTier::High);
  }
  switch (input.front()) {
  case '$':
    return validate_session_id(input);
  case '%':
    return validate_pane_id(input);
  case '@':
    return validate_window_id(input);
  default:
    return validate_session_name(input);
  }
}

ValidationResult validate_command_text(const std::string_view input) {
  if (input.empty()) {
    return ValidationResult::reject(ValidationIssue::Empty, "Command cannot be empty",
                                    RiskTier::High);
  }

  std::vector<Finding> findings;
  check_bytes(input, "Command", findings);
  if (input.size() > kMaxCommandLength) {
    findings.push_back({ValidationIssue::TooLong, RiskTier::High,
                        "Command exceeds maximum length (" + std::to_string(kMaxCommandLength) +
                            " characters)"});
  }
  if (!findings.empty()) {
    return reject_with(findings);
  }

  if (contains_shell_metacharacter(input)) {
    return ValidationResult::accept(escape_shell_word(input), RiskTier::Medium,
                                    "Command contains shell metacharacters - will be escaped");
  }
  return ValidationResult::accept(escape_shell_word(input));
}

ValidationResult validate_bounded_number(const std::string_view input, const std::int64_t min,
                                         const std::int64_t max) {
  if (input.empty()) {
    return ValidationResult::reject(ValidationIssue::Empty, "Parameter must be a valid number",
                                    RiskTier::Medium);
  }

  std::vector<Finding> findings;
  check_bytes(input, "Parameter", findings);
  if (!findings.empty()) {
    return reject_with(findings);
  }

  std::int64_t parsed = 0;
  const char *first = input.data();
  const char *last = input.data() + input.size();
  const auto [ptr, ec] = std::from_chars(first, last, parsed);
  if (ec == std::errc::result_out_of_range) {
    return ValidationResult::reject(ValidationIssue::OutOfRange,
                                    "Parameter must be <= " + std::to_string(max),
                                    RiskTier::Medium);
  }
  if (ec != std::errc() || ptr != last) {
    return ValidationResult::reject(ValidationIssue::NotNumeric,
                                    "Parameter must be a valid number", RiskTier::Medium);
  }
  if (parsed < min) {
    return ValidationResult::reject(ValidationIssue::OutOfRange,
                                    "Parameter must be >= " + std::to_string(min),
                                    RiskTier::Medium);
  }
  if (parsed > max) {
    return ValidationResult::reject(ValidationIssue::OutOfRange,
                                    "Parameter must be <= " + std::to_string(max),
                                    RiskTier::Medium);
  }
  return ValidationResult::accept(std::to_string(parsed));
}

std::string escape_shell_word(const std::string_view input) {
  std::string out;
  out.reserve(input.size() + 2);
  out.push_back('\'');
  for (const char ch : input) {
    if (ch == '\'') {
      out += "'\\''";
    } else {
      out.push_back(ch);
    }
  }
  out.push_back('\'');
  return out;
}

bool contains_shell_metacharacter(const std::string_view input) {
  return input.find_first_of(kShellMetacharacters) != std::string_view::npos;
}

bool contains_null_byte(const std::string_view input) {
  return input.find('\0') != std::string_view::npos;
}

bool contains_control_character(const std::string_view input) {
  std::size_t index = 0;
  std::uint32_t cp = 0;
  while (decode_utf8_codepoint(input, index, cp)) {
    if (cp < 0x20U || (cp >= 0x7FU && cp <= 0x9FU)) {
      return true;
    }
  }
  return false;
}

} // namespace paneguard::security
