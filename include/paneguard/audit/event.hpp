#pragma once

#include "paneguard/common/result.hpp"
#include "paneguard/security/rate_limiter.hpp"
#include "paneguard/security/risk.hpp"

#include <chrono>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>

namespace paneguard::audit {

enum class EventType : std::uint8_t {
  InputValidationFailed,
  InputSanitized,
  CommandBlocked,
  CommandExecuted,
  CommandFailed,
  InjectionAttempt,
  AccessDenied,
  RateLimitExceeded,
  ConfigViolation,
  SecurityPolicyViolation,
  SuspiciousActivity,
  SecurityInit,
  SecurityShutdown,
  AuditLogTamper,
};

enum class Severity : std::uint8_t { Info, Low, Medium, High, Critical };

enum class Outcome : std::uint8_t { Success, Failure, Blocked };

[[nodiscard]] std::string event_type_to_string(EventType type);
[[nodiscard]] common::Result<EventType> event_type_from_string(const std::string &value);
[[nodiscard]] std::string severity_to_string(Severity severity);
[[nodiscard]] common::Result<Severity> severity_from_string(const std::string &value);
[[nodiscard]] std::string outcome_to_string(Outcome outcome);
[[nodiscard]] common::Result<Outcome> outcome_from_string(const std::string &value);

[[nodiscard]] Severity severity_for_tier(security::RiskTier tier);

using Metadata = std::map<std::string, std::string>;

/// One append-only audit record. Build with make_event so metadata is
/// redacted before the record exists.
struct SecurityEvent {
  std::chrono::system_clock::time_point timestamp;
  EventType type = EventType::SuspiciousActivity;
  Severity severity = Severity::Info;
  std::string source_component;
  std::string description;
  Metadata metadata;
  std::optional<security::SourceIdentity> source;
  Outcome outcome = Outcome::Success;
  int risk_score = 1;

  /// Critical events and anything scored 8 or above bypass the flush timer.
  [[nodiscard]] bool is_urgent() const { return severity == Severity::Critical || risk_score >= 8; }
};

[[nodiscard]] SecurityEvent make_event(EventType type, Severity severity,
                                       std::string source_component, std::string description,
                                       Outcome outcome, int risk_score, Metadata metadata = {},
                                       std::optional<security::SourceIdentity> source = std::nullopt);

inline constexpr std::size_t kMaxLoggedValueLength = 1000;

/// Truncates past kMaxLoggedValueLength, then masks password=, token=, key=
/// and secret= assignments.
[[nodiscard]] std::string redact_for_log(std::string_view value);

[[nodiscard]] std::string format_timestamp(std::chrono::system_clock::time_point when);

/// Comma-separated JSON members, without the enclosing braces.
[[nodiscard]] std::string event_fields_json(const SecurityEvent &event);
[[nodiscard]] std::string event_to_json(const SecurityEvent &event);

/// Single-line human rendering used for console mirroring and fallback output.
[[nodiscard]] std::string event_to_text(const SecurityEvent &event);

} // namespace paneguard::audit
