#pragma once

#include "paneguard/security/risk.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace paneguard::security {

/// Characters that change meaning when a shell re-parses a word.
inline constexpr std::string_view kShellMetacharacters = ";&|`$(){}[]<>'\"\\*?~";

inline constexpr std::size_t kMaxCommandLength = 8192;

enum class ValidationIssue : std::uint8_t {
  None,
  Empty,
  TooLong,
  NullByte,
  ControlCharacter,
  PathTraversal,
  ShellMetacharacter,
  FormatMismatch,
  NotNumeric,
  OutOfRange,
};

[[nodiscard]] std::string validation_issue_to_string(ValidationIssue issue);

/// Outcome of classifying one untrusted value. A rejected result always has
/// a non-empty reason and a risk of at least Medium. An accepted result may
/// still carry a reason when the value was transformed.
struct ValidationResult {
  bool valid = false;
  std::optional<std::string> sanitized_value;
  std::string reason;
  ValidationIssue issue = ValidationIssue::None;
  RiskTier risk = RiskTier::Low;

  [[nodiscard]] static ValidationResult accept(std::string value, RiskTier risk = RiskTier::Low,
                                               std::string note = "");
  [[nodiscard]] static ValidationResult reject(ValidationIssue issue, std::string reason,
                                               RiskTier risk);
};

enum class IdentifierKind : std::uint8_t { SessionName, SessionId, PaneId, WindowId, SocketPath };

/// Shape of one identifier class: optional leading sigil, body length and
/// charset, and whether the value names a filesystem path.
struct IdentifierRule {
  IdentifierKind kind;
  std::string_view label;
  char sigil;
  std::size_t min_body;
  std::size_t max_body;
  bool (*body_char)(char);
  bool path_shaped;
  std::string_view format_hint;
};

[[nodiscard]] const IdentifierRule &identifier_rule(IdentifierKind kind);
[[nodiscard]] std::string identifier_kind_to_string(IdentifierKind kind);

[[nodiscard]] ValidationResult validate_identifier(IdentifierKind kind, std::string_view input);

[[nodiscard]] ValidationResult validate_session_name(std::string_view input);
[[nodiscard]] ValidationResult validate_session_id(std::string_view input);
[[nodiscard]] ValidationResult validate_pane_id(std::string_view input);
[[nodiscard]] ValidationResult validate_window_id(std::string_view input);
[[nodiscard]] ValidationResult validate_socket_path(std::string_view input);

/// Dispatches on the leading sigil ($ session id, % pane id, @ window id);
/// anything else is checked as a session name.
[[nodiscard]] ValidationResult validate_target(std::string_view input);

/// Free-form text destined for a pane. Metacharacters raise the risk but do
/// not reject; the sanitized value is always a single-quoted shell word.
[[nodiscard]] ValidationResult validate_command_text(std::string_view input);

/// Decimal integer within [min, max]; the sanitized value is its canonical form.
[[nodiscard]] ValidationResult validate_bounded_number(std::string_view input, std::int64_t min,
                                                       std::int64_t max);

/// Wraps in single quotes and rewrites each embedded ' as '\''.
[[nodiscard]] std::string escape_shell_word(std::string_view input);

[[nodiscard]] bool contains_shell_metacharacter(std::string_view input);
[[nodiscard]] bool contains_null_byte(std::string_view input);
/// C0 controls, DEL and the C1 range U+0080..U+009F (UTF-8 decoded; stray
/// bytes in 0x80..0x9F count as C1 as well).
[[nodiscard]] bool contains_control_character(std::string_view input);

} // namespace paneguard::security
