#include "paneguard/audit/event.hpp"

#include "paneguard/common/fs.hpp"
#include "paneguard/common/json_util.hpp"

#include <algorithm>
#include <array>
#include <ctime>
#include <iomanip>
#include <regex>
#include <sstream>
#include <unistd.h>

namespace paneguard::audit {

namespace {

constexpr std::array<std::pair<EventType, std::string_view>, 14> kEventTypeNames = {{
    {EventType::InputValidationFailed, "input_validation_failed"},
    {EventType::InputSanitized, "input_sanitized"},
    {EventType::CommandBlocked, "command_blocked"},
    {EventType::CommandExecuted, "command_executed"},
    {EventType::CommandFailed, "command_failed"},
    {EventType::InjectionAttempt, "injection_attempt"},
    {EventType::AccessDenied, "access_denied"},
    {EventType::RateLimitExceeded, "rate_limit_exceeded"},
    {EventType::ConfigViolation, "config_violation"},
    {EventType::SecurityPolicyViolation, "security_policy_violation"},
    {EventType::SuspiciousActivity, "suspicious_activity"},
    {EventType::SecurityInit, "security_init"},
    {EventType::SecurityShutdown, "security_shutdown"},
    {EventType::AuditLogTamper, "audit_log_tamper"},
}};

std::string source_json(const security::SourceIdentity &source) {
  std::map<std::string, std::string> fields;
  if (source.session_id.has_value()) {
    fields["session_id"] = redact_for_log(*source.session_id);
  }
  if (source.client_address.has_value()) {
    fields["client_address"] = redact_for_log(*source.client_address);
  }
  if (source.user_id.has_value()) {
    fields["user_id"] = redact_for_log(*source.user_id);
  }
  return common::json_object(fields);
}

} // namespace

std::string event_type_to_string(const EventType type) {
  for (const auto &[value, name] : kEventTypeNames) {
    if (value == type) {
      return std::string(name);
    }
  }
  return "suspicious_activity";
}

common::Result<EventType> event_type_from_string(const std::string &value) {
  const std::string normalized = common::to_lower(common::trim(value));
  for (const auto &[type, name] : kEventTypeNames) {
    if (normalized == name) {
      return common::Result<EventType>::success(type);
    }
  }
  return common::Result<EventType>::failure("Unknown event type: " + value);
}

std::string severity_to_string(const Severity severity) {
  switch (severity) {
  case Severity::Info:
    return "info";
  case Severity::Low:
    return "low";
  case Severity::Medium:
    return "medium";
  case Severity::High:
    return "high";
  case Severity::Critical:
    return "critical";
  }
  return "critical";
}

common::Result<Severity> severity_from_string(const std::string &value) {
  const std::string normalized = common::to_lower(common::trim(value));
  if (normalized == "info") {
    return common::Result<Severity>::success(Severity::Info);
  }
  if (normalized == "low") {
    return common::Result<Severity>::success(Severity::Low);
  }
  if (normalized == "medium") {
    return common::Result<Severity>::success(Severity::Medium);
  }
  if (normalized == "high") {
    return common::Result<Severity>::success(Severity::High);
  }
  if (normalized == "critical") {
    return common::Result<Severity>::success(Severity::Critical);
  }
  return common::Result<Severity>::failure("Invalid severity: " + value);
}

std::string outcome_to_string(const Outcome outcome) {
  switch (outcome) {
  case Outcome::Success:
    return "success";
  case Outcome::Failure:
    return "failure";
  case Outcome::Blocked:
    return "blocked";
  }
  return "failure";
}

common::Result<Outcome> outcome_from_string(const std::string &value) {
  const std::string normalized = common::to_lower(common::trim(value));
  if (normalized == "success") {
    return common::Result<Outcome>::success(Outcome::Success);
  }
  if (normalized == "failure") {
    return common::Result<Outcome>::success(Outcome::Failure);
  }
  if (normalized == "blocked") {
    return common::Result<Outcome>::success(Outcome::Blocked);
  }
  return common::Result<Outcome>::failure("Invalid outcome: " + value);
}

Severity severity_for_tier(const security::RiskTier tier) {
  switch (tier) {
  case security::RiskTier::Low:
    return Severity::Low;
  case security::RiskTier::Medium:
    return Severity::Medium;
  case security::RiskTier::High:
    return Severity::High;
  case security::RiskTier::Critical:
    return Severity::Critical;
  }
  return Severity::Critical;
}

SecurityEvent make_event(const EventType type, const Severity severity,
                         std::string source_component, std::string description,
                         const Outcome outcome, const int risk_score, Metadata metadata,
                         std::optional<security::SourceIdentity> source) {
  SecurityEvent event;
  event.timestamp = std::chrono::system_clock::now();
  event.type = type;
  event.severity = severity;
  event.source_component = std::move(source_component);
  event.description = redact_for_log(description);
  for (auto &[key, value] : metadata) {
    value = redact_for_log(value);
  }
  event.metadata = std::move(metadata);
  event.source = std::move(source);
  event.outcome = outcome;
  event.risk_score = std::clamp(risk_score, 1, 10);
  return event;
}

std::string redact_for_log(const std::string_view value) {
  static const std::regex kCredential(R"((password|token|key|secret)\s*=\s*\S+)",
                                      std::regex::ECMAScript | std::regex::icase);
  std::string text(value.substr(0, std::min(value.size(), kMaxLoggedValueLength)));
  if (value.size() > kMaxLoggedValueLength) {
    text += "...[TRUNCATED]";
  }
  return std::regex_replace(text, kCredential, "$1=[REDACTED]");
}

std::string format_timestamp(const std::chrono::system_clock::time_point when) {
  const auto millis =
      std::chrono::duration_cast<std::chrono::milliseconds>(when.time_since_epoch()).count();
  const std::time_t seconds = static_cast<std::time_t>(millis / 1000);
  std::tm utc{};
  gmtime_r(&seconds, &utc);
  std::ostringstream out;
  out << std::put_time(&utc, "%Y-%m-%dT%H:%M:%S") << '.' << std::setw(3) << std::setfill('0')
      << (millis % 1000) << 'Z';
  return out.str();
}

std::string event_fields_json(const SecurityEvent &event) {
  const auto millis =
      std::chrono::duration_cast<std::chrono::milliseconds>(event.timestamp.time_since_epoch())
          .count();
  std::string out;
  out += "\"timestamp\":" + common::json_quote(format_timestamp(event.timestamp));
  out += ",\"timestamp_ms\":" + std::to_string(millis);
  out += ",\"event_type\":" + common::json_quote(event_type_to_string(event.type));
  out += ",\"severity\":" + common::json_quote(severity_to_string(event.severity));
  out += ",\"outcome\":" + common::json_quote(outcome_to_string(event.outcome));
  out += ",\"risk_score\":" + std::to_string(event.risk_score);
  out += ",\"source_component\":" + common::json_quote(event.source_component);
  out += ",\"description\":" + common::json_quote(event.description);
  out += ",\"pid\":" + std::to_string(static_cast<long long>(::getpid()));
  if (event.source.has_value()) {
    out += ",\"client\":" + source_json(*event.source);
  }
  out += ",\"metadata\":" + common::json_object(event.metadata);
  return out;
}

std::string event_to_json(const SecurityEvent &event) { return "{" + event_fields_json(event) + "}"; }

std::string event_to_text(const SecurityEvent &event) {
  std::string line = format_timestamp(event.timestamp) + " " +
                     severity_to_string(event.severity) + " " +
                     event_type_to_string(event.type) + " [" + event.source_component + "] " +
                     event.description + " outcome=" + outcome_to_string(event.outcome) +
                     " risk=" + std::to_string(event.risk_score);
  if (event.source.has_value()) {
    line += " source=" + redact_for_log(event.source->key());
  }
  return line;
}

} // namespace paneguard::audit
