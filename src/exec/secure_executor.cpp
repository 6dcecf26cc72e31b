#include "paneguard/exec/secure_executor.hpp"

#include "paneguard/common/fs.hpp"
#include "paneguard/common/json_util.hpp"
#include "paneguard/config/config.hpp"
#include "paneguard/observability/global.hpp"

#include <algorithm>
#include <filesystem>

namespace paneguard::exec {

namespace {

constexpr std::string_view kComponent = "secure_executor";
constexpr std::string_view kUnlistedOperation = "<unlisted>";

std::string join(const std::vector<std::string> &values, const std::string &separator) {
  std::string out;
  for (const auto &value : values) {
    if (!out.empty()) {
      out += separator;
    }
    out += value;
  }
  return out;
}

bool is_injection_shaped(const security::ValidationIssue issue) {
  switch (issue) {
  case security::ValidationIssue::NullByte:
  case security::ValidationIssue::ControlCharacter:
  case security::ValidationIssue::PathTraversal:
  case security::ValidationIssue::ShellMetacharacter:
    return true;
  default:
    return false;
  }
}

// A clean run is reported a notch below the tier it carried.
audit::Severity success_severity(const security::RiskTier tier) {
  switch (tier) {
  case security::RiskTier::Low:
    return audit::Severity::Info;
  case security::RiskTier::Medium:
    return audit::Severity::Low;
  case security::RiskTier::High:
  case security::RiskTier::Critical:
    return audit::Severity::Medium;
  }
  return audit::Severity::Medium;
}

int success_risk(const security::RiskTier tier) {
  return std::max(1, security::risk_score(tier) - 2);
}

std::string parameter_json(const ParameterCheck &check) {
  std::string out = "{\"name\":" + common::json_quote(check.name) +
                    ",\"role\":" + common::json_quote(security::param_role_to_string(check.role)) +
                    ",\"valid\":" + (check.result.valid ? "true" : "false") +
                    ",\"risk\":" + common::json_quote(security::risk_tier_to_string(check.result.risk));
  if (check.result.sanitized_value.has_value()) {
    out += ",\"sanitized\":" + common::json_quote(*check.result.sanitized_value);
  }
  if (!check.result.reason.empty()) {
    out += ",\"reason\":" + common::json_quote(check.result.reason);
  }
  if (check.result.issue != security::ValidationIssue::None) {
    out += ",\"issue\":" + common::json_quote(security::validation_issue_to_string(check.result.issue));
  }
  out += "}";
  return out;
}

} // namespace

std::string execution_outcome_to_string(const ExecutionOutcome outcome) {
  switch (outcome) {
  case ExecutionOutcome::Success:
    return "success";
  case ExecutionOutcome::RateLimited:
    return "rate_limited";
  case ExecutionOutcome::CapacityExceeded:
    return "capacity_exceeded";
  case ExecutionOutcome::UnknownOperation:
    return "unknown_operation";
  case ExecutionOutcome::MissingParameter:
    return "missing_parameter";
  case ExecutionOutcome::UnexpectedParameter:
    return "unexpected_parameter";
  case ExecutionOutcome::ValidationFailed:
    return "validation_failed";
  case ExecutionOutcome::FinalValidationFailed:
    return "final_validation_failed";
  case ExecutionOutcome::SpawnFailed:
    return "spawn_failed";
  case ExecutionOutcome::NonZeroExit:
    return "non_zero_exit";
  case ExecutionOutcome::Timeout:
    return "timeout";
  }
  return "unknown_operation";
}

std::string execution_result_to_json(const ExecutionResult &result) {
  std::vector<std::string> params;
  params.reserve(result.parameter_results.size());
  for (const auto &check : result.parameter_results) {
    params.push_back(parameter_json(check));
  }
  std::vector<std::string> argv;
  argv.reserve(result.argv.size());
  for (const auto &arg : result.argv) {
    argv.push_back(common::json_quote(arg));
  }

  std::string out = "{\"success\":" + std::string(result.success ? "true" : "false");
  out += ",\"outcome\":" + common::json_quote(execution_outcome_to_string(result.outcome));
  out += ",\"operation\":" + common::json_quote(result.operation);
  out += ",\"command\":" + common::json_quote(result.final_command);
  out += ",\"argv\":" + common::json_array(argv);
  out += ",\"execution_time_ms\":" + std::to_string(result.execution_time.count());
  if (result.exit_code.has_value()) {
    out += ",\"exit_code\":" + std::to_string(*result.exit_code);
  }
  if (result.stdout_text.has_value()) {
    out += ",\"stdout\":" + common::json_quote(*result.stdout_text);
  }
  if (result.stderr_text.has_value()) {
    out += ",\"stderr\":" + common::json_quote(*result.stderr_text);
  }
  if (result.error_reason.has_value()) {
    out += ",\"error\":" + common::json_quote(*result.error_reason);
  }
  out += ",\"parameters\":" + common::json_array(params) + "}";
  return out;
}

common::Result<std::unique_ptr<SecureExecutor>>
SecureExecutor::create(const config::Config &config, security::TemplateRegistry templates,
                       std::shared_ptr<IProcessRunner> runner,
                       std::shared_ptr<audit::AuditLogger> audit) {
  const auto validated = config::validate_config(config);
  if (!validated.ok()) {
    return common::Result<std::unique_ptr<SecureExecutor>>::failure(validated.error());
  }
  if (runner == nullptr || audit == nullptr) {
    return common::Result<std::unique_ptr<SecureExecutor>>::failure(
        "executor needs a process runner and an audit logger");
  }
  const auto socket = security::validate_socket_path(config.tmux.socket_path);
  if (!socket.valid || !socket.sanitized_value.has_value()) {
    return common::Result<std::unique_ptr<SecureExecutor>>::failure(
        "tmux.socket_path is invalid: " + socket.reason);
  }
  for (const auto &warning : validated.value()) {
    observability::record_error("config", warning);
  }

  return common::Result<std::unique_ptr<SecureExecutor>>::success(std::make_unique<SecureExecutor>(
      ConstructionTag{}, config, std::move(templates), std::move(runner), std::move(audit),
      *socket.sanitized_value));
}

common::Result<std::unique_ptr<SecureExecutor>> SecureExecutor::create(const config::Config &config) {
  auto templates = security::TemplateRegistry::builtin();
  if (!templates.ok()) {
    return common::Result<std::unique_ptr<SecureExecutor>>::failure(templates.error());
  }
  const auto validated = config::validate_config(config);
  if (!validated.ok()) {
    return common::Result<std::unique_ptr<SecureExecutor>>::failure(validated.error());
  }

  const auto socket_dir = std::filesystem::path(config.tmux.socket_path).parent_path();
  if (const auto dir = common::ensure_private_dir(socket_dir); !dir.ok()) {
    return common::Result<std::unique_ptr<SecureExecutor>>::failure(dir.error());
  }

  auto logger = audit::AuditLogger::create(config.audit);
  if (!logger.ok()) {
    return common::Result<std::unique_ptr<SecureExecutor>>::failure(logger.error());
  }
  std::shared_ptr<audit::AuditLogger> audit = logger.take();
  return create(config, templates.take(), std::make_shared<PosixProcessRunner>(), std::move(audit));
}

SecureExecutor::SecureExecutor(ConstructionTag /*tag*/, const config::Config &config,
                               security::TemplateRegistry templates,
                               std::shared_ptr<IProcessRunner> runner,
                               std::shared_ptr<audit::AuditLogger> audit, std::string socket_path)
    : config_(config), templates_(std::move(templates)), runner_(std::move(runner)),
      audit_(std::move(audit)), socket_path_(std::move(socket_path)),
      rate_limiter_(config.rate_limit), gate_(config.execution.max_concurrent_commands) {}

void SecureExecutor::audit_event(const audit::EventType type, const audit::Severity severity,
                                 std::string description, const audit::Outcome outcome,
                                 const int risk_score, audit::Metadata metadata,
                                 const std::optional<security::SourceIdentity> &source) {
  audit_->record(audit::make_event(type, severity, std::string(kComponent), std::move(description),
                                   outcome, risk_score, std::move(metadata), source));
}

std::string SecureExecutor::log_label(const std::string &operation) const {
  return templates_.contains(operation) ? operation : std::string(kUnlistedOperation);
}

void SecureExecutor::finish(ExecutionResult &result, const std::chrono::steady_clock::time_point started,
                            const ExecutionOutcome outcome, std::optional<std::string> reason) const {
  result.outcome = outcome;
  result.success = outcome == ExecutionOutcome::Success;
  result.error_reason = std::move(reason);
  result.execution_time = std::chrono::duration_cast<std::chrono::milliseconds>(
      std::chrono::steady_clock::now() - started);
  observability::record_execution(log_label(result.operation), result.execution_time,
                                  result.success, execution_outcome_to_string(outcome));
}

void SecureExecutor::reject(ExecutionResult &result, const std::chrono::steady_clock::time_point started,
                            Rejection rejection) const {
  observability::record_rejection(log_label(result.operation), rejection.stage, rejection.reason);
  finish(result, started, rejection.outcome, std::move(rejection.reason));
}

std::optional<SecureExecutor::Rejection>
SecureExecutor::prepare(const std::string &operation, const security::ParamMap &parameters,
                        const std::optional<security::SourceIdentity> &source,
                        ExecutionResult &result, Prepared &prepared) {
  // Gate before anything looks at the operation or its parameters.
  const security::SourceIdentity identity = source.value_or(security::SourceIdentity{});
  const auto rate = rate_limiter_.check_and_record(identity);
  if (!rate.allowed()) {
    rate_limited_.fetch_add(1);
    const bool fresh = rate.decision == security::RateDecision::QuotaExceeded;
    const auto remaining =
        rate.blocked_until.has_value()
            ? std::chrono::duration_cast<std::chrono::milliseconds>(*rate.blocked_until -
                                                                    std::chrono::steady_clock::now())
                  .count()
            : 0;
    audit_event(audit::EventType::RateLimitExceeded, audit::Severity::High,
                fresh ? "Rate limit exceeded; source blocked" : "Request from blocked source",
                audit::Outcome::Blocked, 7,
                {{"operation", operation},
                 {"source_key", rate.source_key},
                 {"window_count", std::to_string(rate.window_count)},
                 {"blocked_for_ms", std::to_string(std::max<long long>(0, remaining))}},
                source);
    return Rejection{ExecutionOutcome::RateLimited, "rate_limit",
                     fresh ? "Rate limit exceeded" : "Source is temporarily blocked"};
  }

  prepared.permit = gate_.try_acquire();
  if (!prepared.permit) {
    capacity_rejected_.fetch_add(1);
    observability::record_metric(observability::InFlightMetric{.count = gate_.in_flight()});
    return Rejection{ExecutionOutcome::CapacityExceeded, "capacity",
                     "Too many concurrent commands (limit " + std::to_string(gate_.limit()) + ")"};
  }
  accepted_.fetch_add(1);

  const security::CommandTemplate *tmpl = templates_.find(operation);
  if (tmpl == nullptr) {
    audit_event(audit::EventType::InjectionAttempt, audit::Severity::Critical,
                "Unknown or disallowed tmux operation", audit::Outcome::Blocked, 10,
                {{"operation", operation}, {"stage", "allow_list"}}, source);
    return Rejection{ExecutionOutcome::UnknownOperation, "allow_list",
                     "Operation is not in the allowed whitelist"};
  }
  prepared.tmpl = tmpl;

  std::vector<std::string> missing;
  for (const auto &name : tmpl->required_params()) {
    if (parameters.find(name) == parameters.end()) {
      missing.push_back(name);
    }
  }
  if (!missing.empty()) {
    audit_event(audit::EventType::CommandBlocked, audit::Severity::Critical,
                "Missing required parameters", audit::Outcome::Blocked, 8,
                {{"operation", operation}, {"missing", join(missing, ",")}}, source);
    return Rejection{ExecutionOutcome::MissingParameter, "parameters",
                     "Missing required parameter(s): " + join(missing, ", ")};
  }

  std::vector<std::string> unexpected;
  for (const auto &[name, value] : parameters) {
    if (tmpl->find_param(name) == nullptr) {
      unexpected.push_back(name);
    }
  }
  if (!unexpected.empty()) {
    audit_event(audit::EventType::CommandBlocked, audit::Severity::High,
                "Parameters not declared by the template", audit::Outcome::Blocked, 7,
                {{"operation", operation}, {"unexpected", join(unexpected, ",")}}, source);
    return Rejection{ExecutionOutcome::UnexpectedParameter, "parameters",
                     "Unexpected parameter(s): " + audit::redact_for_log(join(unexpected, ", "))};
  }

  // Every supplied value is checked before any of them is used.
  security::ParamMap sanitized;
  security::RiskTier effective = tmpl->risk;
  const ParameterCheck *first_failure = nullptr;
  result.parameter_results.reserve(tmpl->params.size());
  for (const auto &spec : tmpl->params) {
    const auto supplied = parameters.find(spec.name);
    if (supplied == parameters.end()) {
      continue;
    }
    result.parameter_results.push_back(ParameterCheck{
        .name = spec.name, .role = spec.role,
        .result = security::validate_parameter(spec, supplied->second)});
    const auto &check = result.parameter_results.back();
    effective = security::max_tier(effective, check.result.risk);
    if (check.result.valid && check.result.sanitized_value.has_value()) {
      sanitized[spec.name] = *check.result.sanitized_value;
    }
  }
  for (const auto &check : result.parameter_results) {
    if (!check.result.valid) {
      first_failure = &check;
      break;
    }
  }

  if (first_failure != nullptr) {
    validation_failures_.fetch_add(1);
    const auto &failed = first_failure->result;
    const std::string reason = "Parameter '" + first_failure->name + "': " + failed.reason;
    audit::Metadata metadata{{"operation", operation},
                             {"parameter", first_failure->name},
                             {"issue", security::validation_issue_to_string(failed.issue)},
                             {"reason", failed.reason},
                             {"value", parameters.at(first_failure->name)}};
    if (is_injection_shaped(failed.issue)) {
      audit_event(audit::EventType::InjectionAttempt, audit::Severity::Critical,
                  "Potential injection blocked: " + reason, audit::Outcome::Blocked, 10,
                  std::move(metadata), source);
    } else {
      const auto tier = security::max_tier(failed.risk, tmpl->risk);
      audit_event(audit::EventType::InputValidationFailed, audit::severity_for_tier(tier),
                  "Parameter validation failed: " + reason, audit::Outcome::Blocked,
                  security::risk_score(tier), std::move(metadata), source);
    }
    return Rejection{ExecutionOutcome::ValidationFailed, "validation", reason};
  }

  for (const auto &check : result.parameter_results) {
    if (check.role == security::ParamRole::Command &&
        check.result.risk != security::RiskTier::Low) {
      audit_event(audit::EventType::InputSanitized, audit::severity_for_tier(check.result.risk),
                  "Command text escaped before binding", audit::Outcome::Success,
                  security::risk_score(check.result.risk),
                  {{"operation", operation},
                   {"parameter", check.name},
                   {"value", parameters.at(check.name)}},
                  source);
    }
  }

  auto bound = security::bind_template(*tmpl, sanitized);
  if (!bound.ok()) {
    audit_event(audit::EventType::InjectionAttempt, audit::Severity::Critical,
                "Template binding failed: " + bound.error(), audit::Outcome::Blocked, 10,
                {{"operation", operation}, {"stage", "bind"}}, source);
    return Rejection{ExecutionOutcome::FinalValidationFailed, "bind", bound.error()};
  }
  result.final_command = bound.take();

  const auto final_check = templates_.revalidate(result.final_command, *tmpl);
  if (!final_check.valid) {
    audit_event(audit::EventType::InjectionAttempt, audit::Severity::Critical,
                "Final command validation failed: " + final_check.reason, audit::Outcome::Blocked,
                10, {{"operation", operation}, {"command", result.final_command}}, source);
    return Rejection{ExecutionOutcome::FinalValidationFailed, "final_validation",
                     final_check.reason};
  }

  auto words = security::split_command_words(result.final_command);
  if (!words.ok()) {
    audit_event(audit::EventType::InjectionAttempt, audit::Severity::Critical,
                "Composed command could not be split: " + words.error(), audit::Outcome::Blocked,
                10, {{"operation", operation}, {"command", result.final_command}}, source);
    return Rejection{ExecutionOutcome::FinalValidationFailed, "final_validation", words.error()};
  }
  result.argv = {config_.tmux.binary, "-S", socket_path_};
  for (auto &word : words.value()) {
    result.argv.push_back(std::move(word));
  }

  prepared.effective = effective;
  prepared.metadata = {{"operation", operation},
                       {"command", result.final_command},
                       {"risk_tier", security::risk_tier_to_string(effective)},
                       {"template_risk", security::risk_tier_to_string(tmpl->risk)},
                       {"free_form", tmpl->accepts_free_form() ? "true" : "false"}};
  return std::nullopt;
}

ExecutionResult SecureExecutor::execute(const std::string &operation,
                                        const security::ParamMap &parameters,
                                        const std::optional<security::SourceIdentity> &source) {
  const auto started = std::chrono::steady_clock::now();
  ExecutionResult result;
  result.operation = operation;

  Prepared prepared;
  if (auto rejection = prepare(operation, parameters, source, result, prepared)) {
    reject(result, started, std::move(*rejection));
    return result;
  }
  const security::CommandTemplate &tmpl = *prepared.tmpl;
  audit::Metadata &metadata = prepared.metadata;

  const auto budget = std::min(
      tmpl.max_duration,
      std::chrono::milliseconds(static_cast<std::chrono::milliseconds::rep>(
          config_.execution.command_timeout_ms)));
  const ProcessOptions options{.timeout = budget,
                               .max_output_bytes = config_.execution.max_output_bytes};

  auto run = runner_->run(result.argv, options);
  if (!run.ok()) {
    failed_.fetch_add(1);
    metadata["error"] = run.error();
    const auto tier = security::max_tier(security::RiskTier::Medium, tmpl.risk);
    audit_event(audit::EventType::CommandFailed, audit::severity_for_tier(tier),
                "tmux could not be started", audit::Outcome::Failure, security::risk_score(tier) - 1,
                std::move(metadata), source);
    finish(result, started, ExecutionOutcome::SpawnFailed, "Failed to start tmux: " + run.error());
    return result;
  }

  const ProcessResult process = run.take();
  metadata["duration_ms"] = std::to_string(process.duration.count());

  if (process.timed_out) {
    failed_.fetch_add(1);
    timeouts_.fetch_add(1);
    const bool escalate = tmpl.risk >= security::RiskTier::High;
    metadata["timeout_ms"] = std::to_string(budget.count());
    audit_event(audit::EventType::CommandFailed,
                escalate ? audit::Severity::High : audit::Severity::Medium,
                "Command timed out after " + std::to_string(budget.count()) + "ms",
                audit::Outcome::Failure, escalate ? 8 : 4, std::move(metadata), source);
    finish(result, started, ExecutionOutcome::Timeout,
           "Command timed out after " + std::to_string(budget.count()) + "ms");
    return result;
  }

  result.exit_code = process.exit_code;
  result.stdout_text = process.stdout_text;
  result.stderr_text = process.stderr_text;
  metadata["exit_code"] = std::to_string(process.exit_code);
  if (process.output_truncated) {
    metadata["output_truncated"] = "true";
  }

  if (process.exit_code != 0) {
    failed_.fetch_add(1);
    audit_event(audit::EventType::CommandFailed, audit::Severity::Medium,
                "Command exited with status " + std::to_string(process.exit_code),
                audit::Outcome::Failure, 4, std::move(metadata), source);
    const std::string detail = common::trim(process.stderr_text);
    finish(result, started, ExecutionOutcome::NonZeroExit,
           "Command exited with status " + std::to_string(process.exit_code) +
               (detail.empty() ? "" : ": " + audit::redact_for_log(detail)));
    return result;
  }

  succeeded_.fetch_add(1);
  audit_event(audit::EventType::CommandExecuted, success_severity(prepared.effective),
              "Command executed", audit::Outcome::Success, success_risk(prepared.effective),
              std::move(metadata), source);
  finish(result, started, ExecutionOutcome::Success, std::nullopt);
  return result;
}

SpawnedCommand SecureExecutor::spawn(const std::string &operation,
                                     const security::ParamMap &parameters,
                                     const std::optional<security::SourceIdentity> &source) {
  const auto started = std::chrono::steady_clock::now();
  SpawnedCommand spawned;
  ExecutionResult &result = spawned.result;
  result.operation = operation;

  Prepared prepared;
  if (auto rejection = prepare(operation, parameters, source, result, prepared)) {
    reject(result, started, std::move(*rejection));
    return spawned;
  }
  audit::Metadata &metadata = prepared.metadata;
  metadata["mode"] = "spawn";

  auto child = runner_->spawn(result.argv);
  if (!child.ok()) {
    failed_.fetch_add(1);
    metadata["error"] = child.error();
    audit_event(audit::EventType::CommandBlocked, audit::Severity::High,
                "Spawned process could not be started", audit::Outcome::Failure, 6,
                std::move(metadata), source);
    finish(result, started, ExecutionOutcome::SpawnFailed, "Failed to start tmux: " + child.error());
    return spawned;
  }

  spawned.process = child.take();
  metadata["pid"] = std::to_string(static_cast<long long>(spawned.process->pid()));
  succeeded_.fetch_add(1);
  audit_event(audit::EventType::CommandExecuted, success_severity(prepared.effective),
              "Long-running command started", audit::Outcome::Success,
              success_risk(prepared.effective), std::move(metadata), source);
  finish(result, started, ExecutionOutcome::Success, std::nullopt);
  return spawned;
}

ExecutorMetrics SecureExecutor::metrics() const {
  ExecutorMetrics out;
  out.active_commands = gate_.in_flight();
  out.peak_in_flight = gate_.peak();
  out.max_concurrent = gate_.limit();
  out.blocked_sources = rate_limiter_.blocked_sources();
  out.tracked_sources = rate_limiter_.tracked_sources();
  out.accepted = accepted_.load();
  out.rate_limited = rate_limited_.load();
  out.capacity_rejected = capacity_rejected_.load();
  out.validation_failures = validation_failures_.load();
  out.succeeded = succeeded_.load();
  out.failed = failed_.load();
  out.timeouts = timeouts_.load();
  out.audit = audit_->stats();
  return out;
}

void SecureExecutor::shutdown() { audit_->shutdown(); }

} // namespace paneguard::exec
