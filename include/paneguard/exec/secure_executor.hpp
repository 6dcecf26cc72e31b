#pragma once

#include "paneguard/audit/audit_logger.hpp"
#include "paneguard/common/result.hpp"
#include "paneguard/config/schema.hpp"
#include "paneguard/exec/process_runner.hpp"
#include "paneguard/security/rate_limiter.hpp"
#include "paneguard/security/templates.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace paneguard::exec {

enum class ExecutionOutcome : std::uint8_t {
  Success,
  RateLimited,
  CapacityExceeded,
  UnknownOperation,
  MissingParameter,
  UnexpectedParameter,
  ValidationFailed,
  FinalValidationFailed,
  SpawnFailed,
  NonZeroExit,
  Timeout,
};

[[nodiscard]] std::string execution_outcome_to_string(ExecutionOutcome outcome);

struct ParameterCheck {
  std::string name;
  security::ParamRole role = security::ParamRole::SessionName;
  security::ValidationResult result;
};

struct ExecutionResult {
  bool success = false;
  ExecutionOutcome outcome = ExecutionOutcome::Success;
  std::string operation;
  std::optional<std::string> stdout_text;
  std::optional<std::string> stderr_text;
  std::optional<int> exit_code;
  std::chrono::milliseconds execution_time{0};
  /// The bound command as re-validated; empty when the call never got that far.
  std::string final_command;
  std::vector<std::string> argv;
  std::vector<ParameterCheck> parameter_results;
  std::optional<std::string> error_reason;
};

[[nodiscard]] std::string execution_result_to_json(const ExecutionResult &result);

/// A started long-running command. `process` is set only when `result.success`.
struct SpawnedCommand {
  ExecutionResult result;
  std::unique_ptr<IChildProcess> process;
};

struct ExecutorMetrics {
  std::uint32_t active_commands = 0;
  std::uint32_t peak_in_flight = 0;
  std::uint32_t max_concurrent = 0;
  std::size_t blocked_sources = 0;
  std::size_t tracked_sources = 0;
  std::uint64_t accepted = 0;
  std::uint64_t rate_limited = 0;
  std::uint64_t capacity_rejected = 0;
  std::uint64_t validation_failures = 0;
  std::uint64_t succeeded = 0;
  std::uint64_t failed = 0;
  std::uint64_t timeouts = 0;
  audit::AuditStats audit;
};

/// validate -> bind -> re-validate -> bounded spawn -> audit. Every call
/// returns a result; nothing a caller passes in can make it throw.
class SecureExecutor {
public:
  [[nodiscard]] static common::Result<std::unique_ptr<SecureExecutor>>
  create(const config::Config &config, security::TemplateRegistry templates,
         std::shared_ptr<IProcessRunner> runner, std::shared_ptr<audit::AuditLogger> audit);

  /// Production wiring: built-in templates, the POSIX runner and an audit
  /// logger built from `config.audit`.
  [[nodiscard]] static common::Result<std::unique_ptr<SecureExecutor>>
  create(const config::Config &config);

  class ConstructionTag {
    friend class SecureExecutor;
    ConstructionTag() = default;
  };

  SecureExecutor(ConstructionTag tag, const config::Config &config,
                 security::TemplateRegistry templates, std::shared_ptr<IProcessRunner> runner,
                 std::shared_ptr<audit::AuditLogger> audit, std::string socket_path);

  SecureExecutor(const SecureExecutor &) = delete;
  SecureExecutor &operator=(const SecureExecutor &) = delete;

  [[nodiscard]] ExecutionResult execute(const std::string &operation,
                                        const security::ParamMap &parameters,
                                        const std::optional<security::SourceIdentity> &source =
                                            std::nullopt);

  /// Same checks as execute(), then starts the command without waiting for it
  /// (pipe-pane and other streaming operations). The concurrency permit covers
  /// the checks and the start, not the lifetime of the child.
  [[nodiscard]] SpawnedCommand spawn(const std::string &operation,
                                     const security::ParamMap &parameters,
                                     const std::optional<security::SourceIdentity> &source =
                                         std::nullopt);

  [[nodiscard]] ExecutorMetrics metrics() const;

  /// Flushes and stops the audit logger.
  void shutdown();

  [[nodiscard]] const security::TemplateRegistry &templates() const { return templates_; }
  [[nodiscard]] audit::AuditLogger &audit() { return *audit_; }
  [[nodiscard]] const std::string &socket_path() const { return socket_path_; }

private:
  struct Rejection {
    ExecutionOutcome outcome;
    std::string stage;
    std::string reason;
  };

  /// A call that passed every check and is ready to start.
  struct Prepared {
    const security::CommandTemplate *tmpl = nullptr;
    security::RiskTier effective = security::RiskTier::Low;
    security::ConcurrencyGate::Permit permit;
    audit::Metadata metadata;
  };

  /// Rate limit, concurrency permit, allow-list, parameter validation, bind and
  /// re-validation. Fills the checks, command and argv of `result`; every
  /// rejection is audited before it is returned.
  [[nodiscard]] std::optional<Rejection>
  prepare(const std::string &operation, const security::ParamMap &parameters,
          const std::optional<security::SourceIdentity> &source, ExecutionResult &result,
          Prepared &prepared);

  /// The operation name as the operational log may show it.
  [[nodiscard]] std::string log_label(const std::string &operation) const;

  void finish(ExecutionResult &result, std::chrono::steady_clock::time_point started,
              ExecutionOutcome outcome, std::optional<std::string> reason) const;
  void reject(ExecutionResult &result, std::chrono::steady_clock::time_point started,
              Rejection rejection) const;

  void audit_event(audit::EventType type, audit::Severity severity, std::string description,
                   audit::Outcome outcome, int risk_score, audit::Metadata metadata,
                   const std::optional<security::SourceIdentity> &source);

  config::Config config_;
  security::TemplateRegistry templates_;
  std::shared_ptr<IProcessRunner> runner_;
  std::shared_ptr<audit::AuditLogger> audit_;
  std::string socket_path_;
  mutable security::RateLimiter rate_limiter_;
  security::ConcurrencyGate gate_;

  std::atomic<std::uint64_t> accepted_{0};
  std::atomic<std::uint64_t> rate_limited_{0};
  std::atomic<std::uint64_t> capacity_rejected_{0};
  std::atomic<std::uint64_t> validation_failures_{0};
  std::atomic<std::uint64_t> succeeded_{0};
  std::atomic<std::uint64_t> failed_{0};
  std::atomic<std::uint64_t> timeouts_{0};
};

} // namespace paneguard::exec
