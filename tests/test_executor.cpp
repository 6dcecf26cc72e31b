#include "test_framework.hpp"
#include "tests/helpers/test_helpers.hpp"

#include "paneguard/common/json_util.hpp"
#include "paneguard/exec/secure_executor.hpp"

#include <algorithm>
#include <atomic>
#include <thread>

namespace {

using paneguard::exec::ExecutionOutcome;
using paneguard::testing::count_events;
using paneguard::testing::events_of;

std::string field(const std::string &line, const std::string &name) {
  return paneguard::common::json_get_string(line, name);
}

std::string meta(const std::string &line, const std::string &name) {
  return paneguard::common::json_get_string(paneguard::common::json_get_object(line, "metadata"), name);
}

std::size_t count_severity(const std::vector<std::string> &lines, const std::string &severity) {
  return static_cast<std::size_t>(std::count_if(
      lines.begin(), lines.end(),
      [&severity](const std::string &line) { return field(line, "severity") == severity; }));
}

paneguard::security::SourceIdentity client(std::string address) {
  paneguard::security::SourceIdentity source;
  source.client_address = std::move(address);
  return source;
}

} // namespace

void register_executor_tests(std::vector<paneguard::tests::TestCase> &tests) {
  using paneguard::tests::require;
  using paneguard::testing::audit_lines;
  using paneguard::testing::make_fixture;

  tests.push_back({"executor_new_session_runs_bound_argv", [] {
                     auto fx = make_fixture();
                     const auto result = fx->executor->execute("new-session", {{"sessionName", "dev-box"}});
                     require(result.success, result.error_reason.value_or("no reason"));
                     require(result.outcome == ExecutionOutcome::Success, "success outcome");
                     require(result.final_command == R"(new-session -d -s dev-box -P -F "#{session_id}")",
                             result.final_command);
                     const std::vector<std::string> expected{"tmux", "-S", fx->config.tmux.socket_path,
                                                             "new-session", "-d", "-s", "dev-box",
                                                             "-P", "-F", "#{session_id}"};
                     require(fx->runner->invocations().size() == 1, "one spawn");
                     require(fx->runner->invocations().front() == expected, "argv passed verbatim");
                     require(result.exit_code == 0, "exit code reported");

                     const auto lines = audit_lines(fx->executor->audit());
                     const auto executed = events_of(lines, "command_executed");
                     require(executed.size() == 1, "one command_executed event");
                     require(field(executed.front(), "severity") == "low", "medium tier reported low");
                     require(meta(executed.front(), "risk_tier") == "medium", "risk tier in metadata");
                   }});

  tests.push_back({"executor_injection_in_target_spawns_nothing", [] {
                     auto fx = make_fixture();
                     const auto result = fx->executor->execute(
                         "send-keys", {{"target", "; rm -rf /"}, {"command", "ls"}});
                     require(!result.success, "rejected");
                     require(result.outcome == ExecutionOutcome::ValidationFailed, "validation outcome");
                     require(result.error_reason->find("target") != std::string::npos,
                             "reason names the parameter");
                     require(fx->runner->calls() == 0, "zero subprocesses");

                     const auto lines = audit_lines(fx->executor->audit());
                     const auto attempts = events_of(lines, "injection_attempt");
                     require(attempts.size() == 1, "one injection_attempt");
                     require(field(attempts.front(), "severity") == "critical", "critical");
                     require(field(attempts.front(), "outcome") == "blocked", "blocked outcome");
                     require(count_events(lines, "command_executed") == 0, "nothing executed");
                   }});

  tests.push_back({"executor_unknown_operation_is_one_critical_event", [] {
                     auto fx = make_fixture();
                     for (const char *operation : {"kill-server", "run-shell", "", "list-sessions;id"}) {
                       const auto result = fx->executor->execute(operation, {});
                       require(!result.success, "rejected");
                       require(result.outcome == ExecutionOutcome::UnknownOperation,
                               std::string("unknown: ") + operation);
                     }
                     require(fx->runner->calls() == 0, "zero subprocesses");
                     const auto lines = audit_lines(fx->executor->audit());
                     require(count_severity(lines, "critical") == 4, "exactly one per call");
                     require(count_events(lines, "injection_attempt") == 4, "typed as an injection attempt");
                   }});

  tests.push_back({"executor_missing_and_unexpected_parameters", [] {
                     auto fx = make_fixture();
                     const auto missing = fx->executor->execute("kill-session", {});
                     require(missing.outcome == ExecutionOutcome::MissingParameter, "missing");
                     require(missing.error_reason->find("sessionId") != std::string::npos,
                             "missing name reported");

                     const auto extra =
                         fx->executor->execute("list-sessions", {{"format", "#{session_name}"}});
                     require(extra.outcome == ExecutionOutcome::UnexpectedParameter, "unexpected");
                     require(fx->runner->calls() == 0, "zero subprocesses");

                     const auto lines = audit_lines(fx->executor->audit());
                     const auto blocked = events_of(lines, "command_blocked");
                     require(blocked.size() == 2, "both audited");
                     require(field(blocked[0], "severity") == "critical", "missing is critical");
                     require(field(blocked[1], "severity") == "high", "unexpected is high");
                   }});

  tests.push_back({"executor_send_keys_escapes_free_form_text", [] {
                     auto fx = make_fixture();
                     const auto result = fx->executor->execute(
                         "send-keys", {{"target", "%3"}, {"command", "echo it's; rm -rf /"}});
                     require(result.success, result.error_reason.value_or("no reason"));
                     require(result.final_command == R"(send-keys -t %3 'echo it'\''s; rm -rf /' Enter)",
                             result.final_command);
                     const auto argv = fx->runner->invocations().front();
                     require(argv[argv.size() - 2] == "echo it's; rm -rf /",
                             "text reaches tmux as one literal argument");
                     require(argv.back() == "Enter", "Enter appended");

                     const auto lines = audit_lines(fx->executor->audit());
                     require(count_events(lines, "input_sanitized") == 1, "escape audited");
                     const auto executed = events_of(lines, "command_executed");
                     require(meta(executed.front(), "free_form") == "true", "free-form flagged");
                   }});

  tests.push_back({"executor_capture_pane_bounds_lines", [] {
                     auto fx = make_fixture();
                     const auto defaulted = fx->executor->execute("capture-pane", {{"target", "dev"}});
                     require(defaulted.success, defaulted.error_reason.value_or("no reason"));
                     require(defaulted.final_command == "capture-pane -t dev -p -S -100",
                             defaulted.final_command);

                     const auto too_many = fx->executor->execute(
                         "capture-pane", {{"target", "dev"}, {"lines", "50000"}});
                     require(too_many.outcome == ExecutionOutcome::ValidationFailed, "out of range");
                     const auto lines = audit_lines(fx->executor->audit());
                     const auto failed = events_of(lines, "input_validation_failed");
                     require(failed.size() == 1, "validation failure audited");
                     require(field(failed.front(), "severity") == "medium", "tier is the max");
                   }});

  tests.push_back({"executor_rate_limit_blocks_then_recovers", [] {
                     auto fx = make_fixture([](paneguard::config::Config &config) {
                       config.rate_limit.max_requests = 3;
                       config.rate_limit.window_ms = 60'000;
                       config.rate_limit.block_duration_ms = 150;
                     });
                     const auto source = client("10.9.9.9");
                     for (int i = 0; i < 3; ++i) {
                       require(fx->executor->execute("list-sessions", {}, source).success, "in quota");
                     }
                     const auto over = fx->executor->execute("list-sessions", {}, source);
                     require(over.outcome == ExecutionOutcome::RateLimited, "quota exceeded");
                     require(*over.error_reason == "Rate limit exceeded", *over.error_reason);
                     const auto again = fx->executor->execute("list-sessions", {}, source);
                     require(*again.error_reason == "Source is temporarily blocked", *again.error_reason);
                     require(fx->executor->execute("list-sessions", {}, client("10.9.9.10")).success,
                             "other sources unaffected");
                     require(fx->executor->metrics().blocked_sources == 1, "one blocked source");
                     require(fx->runner->calls() == 4, "blocked calls never spawn");

                     std::this_thread::sleep_for(std::chrono::milliseconds(300));
                     require(fx->executor->execute("list-sessions", {}, source).success,
                             "accepted after the block expires");

                     const auto lines = audit_lines(fx->executor->audit());
                     const auto limited = events_of(lines, "rate_limit_exceeded");
                     require(limited.size() == 2, "both rejections audited");
                     const auto client = paneguard::common::json_get_object(limited.front(), "client");
                     require(paneguard::common::json_get_string(client, "client_address") == "10.9.9.9",
                             "source recorded");
                   }});

  tests.push_back({"executor_concurrency_ceiling_holds", [] {
                     auto fx = make_fixture([](paneguard::config::Config &config) {
                       config.execution.max_concurrent_commands = 10;
                       config.rate_limit.max_requests = 100'000;
                     });
                     fx->runner->set_delay(std::chrono::milliseconds(5));
                     std::atomic<std::size_t> succeeded{0};
                     std::atomic<std::size_t> rejected{0};
                     std::atomic<std::size_t> other{0};
                     std::atomic<std::uint32_t> observed_max{0};

                     std::vector<std::thread> threads;
                     for (int t = 0; t < 100; ++t) {
                       threads.emplace_back([&] {
                         for (int i = 0; i < 10; ++i) {
                           const auto result = fx->executor->execute("list-sessions", {});
                           const auto in_flight = fx->executor->metrics().active_commands;
                           std::uint32_t seen = observed_max.load();
                           while (in_flight > seen && !observed_max.compare_exchange_weak(seen, in_flight)) {
                           }
                           if (result.success) {
                             succeeded.fetch_add(1);
                           } else if (result.outcome == ExecutionOutcome::CapacityExceeded) {
                             rejected.fetch_add(1);
                           } else {
                             other.fetch_add(1);
                           }
                         }
                       });
                     }
                     for (auto &thread : threads) {
                       thread.join();
                     }

                     require(succeeded.load() + rejected.load() == 1'000, "every call answered");
                     require(other.load() == 0, "only success or capacity outcomes");
                     require(fx->runner->max_concurrent() <= 10, "spawns never exceed the ceiling");
                     require(observed_max.load() <= 10, "in-flight never exceeds the ceiling");
                     const auto metrics = fx->executor->metrics();
                     require(metrics.peak_in_flight <= 10, "peak within the ceiling");
                     require(metrics.active_commands == 0, "all permits released");
                     require(metrics.capacity_rejected == rejected.load(), "rejections counted");

                     const auto lines = audit_lines(fx->executor->audit());
                     require(count_events(lines, "command_executed") == succeeded.load(),
                             "capacity rejections are not audited");
                   }});

  tests.push_back({"executor_timeout_is_distinguished", [] {
                     auto fx = make_fixture();
                     paneguard::exec::ProcessResult hung;
                     hung.timed_out = true;
                     hung.exit_code = -1;
                     fx->runner->set_result(hung);

                     const auto low = fx->executor->execute("list-sessions", {});
                     require(low.outcome == ExecutionOutcome::Timeout, "timeout outcome");
                     require(low.error_reason->find("timed out") != std::string::npos, "reason");
                     require(!low.stdout_text.has_value(), "output of a killed process is dropped");
                     const auto high = fx->executor->execute("kill-session", {{"sessionId", "$4"}});
                     require(high.outcome == ExecutionOutcome::Timeout, "timeout outcome");
                     require(fx->runner->last_options().timeout == std::chrono::milliseconds(5'000),
                             "template budget applied");

                     const auto lines = audit_lines(fx->executor->audit());
                     const auto failed = events_of(lines, "command_failed");
                     require(failed.size() == 2, "both audited");
                     require(field(failed[0], "severity") == "medium", "low-risk timeout");
                     require(field(failed[1], "severity") == "high", "high-risk timeout escalates");
                     require(fx->executor->metrics().timeouts == 2, "timeouts counted");
                   }});

  tests.push_back({"executor_budget_capped_by_config", [] {
                     auto fx = make_fixture(
                         [](paneguard::config::Config &config) { config.execution.command_timeout_ms = 500; });
                     (void)fx->executor->execute("new-session", {{"sessionName", "dev"}});
                     require(fx->runner->last_options().timeout == std::chrono::milliseconds(500),
                             "global cap wins over the template budget");
                   }});

  tests.push_back({"executor_non_zero_exit_and_spawn_failure", [] {
                     auto fx = make_fixture();
                     paneguard::exec::ProcessResult failed;
                     failed.exit_code = 1;
                     failed.stderr_text = "can't find session: ghost\n";
                     fx->runner->set_result(failed);
                     const auto result = fx->executor->execute("kill-session", {{"sessionId", "$9"}});
                     require(result.outcome == ExecutionOutcome::NonZeroExit, "non-zero exit");
                     require(result.exit_code == 1, "exit code kept");
                     require(result.error_reason->find("can't find session") != std::string::npos,
                             *result.error_reason);

                     fx->runner->set_spawn_error("execvp failed: No such file or directory");
                     const auto spawn = fx->executor->execute("start-server", {});
                     require(spawn.outcome == ExecutionOutcome::SpawnFailed, "spawn failure");
                     require(!spawn.exit_code.has_value(), "no exit code without a process");

                     const auto lines = audit_lines(fx->executor->audit());
                     require(count_events(lines, "command_failed") == 2, "both audited");
                     const auto metrics = fx->executor->metrics();
                     require(metrics.failed == 2 && metrics.succeeded == 0, "metrics");
                   }});

  tests.push_back({"executor_result_json", [] {
                     auto fx = make_fixture();
                     fx->runner->set_result(paneguard::exec::ProcessResult{
                         .exit_code = 0, .stdout_text = "$1:dev:1700000000:0\n"});
                     const auto result = fx->executor->execute("list-sessions", {});
                     const auto json = paneguard::exec::execution_result_to_json(result);
                     require(paneguard::common::json_get_string(json, "outcome") == "success", json);
                     require(paneguard::common::json_get_string(json, "stdout") ==
                                 "$1:dev:1700000000:0\n",
                             json);

                     const auto rejected =
                         fx->executor->execute("kill-session", {{"sessionId", "1; reboot"}});
                     const auto rejected_json = paneguard::exec::execution_result_to_json(rejected);
                     require(rejected_json.find("\"valid\":false") != std::string::npos, rejected_json);
                     require(paneguard::common::json_get_string(rejected_json, "outcome") ==
                                 "validation_failed",
                             rejected_json);
                   }});

  tests.push_back({"executor_with_custom_templates", [] {
                     paneguard::testing::TempDir dir;
                     const auto config = paneguard::testing::test_config(dir);
                     paneguard::security::CommandTemplate tmpl;
                     tmpl.operation = "display-message";
                     tmpl.shape = "display-message -t {target} -p ok";
                     tmpl.params = {{.name = "target", .role = paneguard::security::ParamRole::Target}};
                     auto registry = paneguard::security::TemplateRegistry::create({tmpl});
                     require(registry.ok(), registry.ok() ? "" : registry.error());
                     auto logger = paneguard::audit::AuditLogger::create(config.audit);
                     require(logger.ok(), "logger");
                     auto runner = std::make_shared<paneguard::testing::FakeProcessRunner>();
                     auto executor = paneguard::exec::SecureExecutor::create(
                         config, registry.take(), runner,
                         std::shared_ptr<paneguard::audit::AuditLogger>(logger.take()));
                     require(executor.ok(), executor.ok() ? "" : executor.error());

                     require(executor.value()->execute("display-message", {{"target", "dev"}}).success,
                             "custom operation runs");
                     require(executor.value()->execute("list-sessions", {}).outcome ==
                                 ExecutionOutcome::UnknownOperation,
                             "built-ins absent from an isolated registry");
                     executor.value()->shutdown();
                   }});

  tests.push_back({"executor_spawn_starts_once_and_hands_back_the_child", [] {
                     auto fx = make_fixture();
                     fx->runner->set_result(paneguard::exec::ProcessResult{.stdout_text = "streamed\n"});
                     auto spawned = fx->executor->spawn("pipe-pane", {{"target", "%3"}});
                     require(spawned.result.success, spawned.result.error_reason.value_or("no reason"));
                     require(spawned.process != nullptr, "child handle returned");
                     require(fx->runner->spawns() == 1, "started exactly once");
                     require(fx->runner->calls() == 1, "no separate run() before the spawn");
                     const std::vector<std::string> expected{"tmux", "-S", fx->config.tmux.socket_path,
                                                             "pipe-pane", "-t", "%3", "-o", "cat"};
                     require(fx->runner->invocations().front() == expected, "bound argv");

                     auto output = spawned.process->read_output(64, std::chrono::milliseconds(0));
                     require(output.ok() && output.value() == "streamed\n", "child output");
                     require(spawned.process->is_running(), "still running");
                     require(spawned.process->terminate(std::chrono::milliseconds(10)) == 143, "terminated");
                     require(!spawned.process->is_running(), "stopped");
                     require(fx->executor->metrics().active_commands == 0, "permit released after start");

                     const auto lines = audit_lines(fx->executor->audit());
                     const auto executed = events_of(lines, "command_executed");
                     require(executed.size() == 1, "one command_executed event");
                     require(meta(executed.front(), "mode") == "spawn", "spawn mode recorded");
                     require(meta(executed.front(), "pid") == "4242", "pid recorded");
                   }});

  tests.push_back({"executor_spawn_runs_the_same_checks", [] {
                     auto fx = make_fixture();
                     auto injected = fx->executor->spawn("pipe-pane", {{"target", "%3; cat /etc/shadow"}});
                     require(!injected.result.success, "rejected");
                     require(injected.result.outcome == ExecutionOutcome::ValidationFailed, "validation");
                     require(injected.process == nullptr, "no child");

                     auto unknown = fx->executor->spawn("run-shell", {{"command", "id"}});
                     require(unknown.result.outcome == ExecutionOutcome::UnknownOperation, "allow-list");
                     require(unknown.process == nullptr, "no child");
                     require(fx->runner->spawns() == 0, "nothing started");

                     const auto lines = audit_lines(fx->executor->audit());
                     require(count_events(lines, "injection_attempt") == 2, "both audited");
                   }});

  tests.push_back({"executor_spawn_failure_is_audited_as_blocked", [] {
                     auto fx = make_fixture();
                     fx->runner->set_spawn_error("failed to execute tmux: No such file or directory");
                     auto spawned = fx->executor->spawn("pipe-pane", {{"target", "%3"}});
                     require(!spawned.result.success, "failed");
                     require(spawned.result.outcome == ExecutionOutcome::SpawnFailed, "spawn failed");
                     require(spawned.process == nullptr, "no child");
                     require(spawned.result.error_reason->find("No such file") != std::string::npos,
                             *spawned.result.error_reason);

                     const auto lines = audit_lines(fx->executor->audit());
                     const auto blocked = events_of(lines, "command_blocked");
                     require(blocked.size() == 1, "one command_blocked event");
                     require(field(blocked.front(), "severity") == "high", "high severity");
                     require(field(blocked.front(), "outcome") == "failure", "failure outcome");
                     require(paneguard::common::json_get_number(blocked.front(), "risk_score") == "6", "risk 6");
                     require(meta(blocked.front(), "error").find("No such file") != std::string::npos,
                             "error kept in metadata");
                     require(fx->executor->metrics().failed == 1, "counted as failed");
                   }});

  tests.push_back({"executor_rejects_bad_construction", [] {
                     paneguard::testing::TempDir dir;
                     auto config = paneguard::testing::test_config(dir);
                     auto logger = paneguard::audit::AuditLogger::create(config.audit);
                     require(logger.ok(), "logger");
                     std::shared_ptr<paneguard::audit::AuditLogger> audit = logger.take();
                     auto runner = std::make_shared<paneguard::testing::FakeProcessRunner>();

                     config.tmux.socket_path = "relative/tmux.sock";
                     require(!paneguard::exec::SecureExecutor::create(
                                  config, paneguard::security::TemplateRegistry::builtin().take(),
                                  runner, audit)
                                  .ok(),
                             "relative socket path");
                     config.tmux.socket_path = "/tmp/../etc/tmux.sock";
                     require(!paneguard::exec::SecureExecutor::create(
                                  config, paneguard::security::TemplateRegistry::builtin().take(),
                                  runner, audit)
                                  .ok(),
                             "traversal in socket path");
                     config = paneguard::testing::test_config(dir);
                     config.execution.max_concurrent_commands = 0;
                     require(!paneguard::exec::SecureExecutor::create(
                                  config, paneguard::security::TemplateRegistry::builtin().take(),
                                  runner, audit)
                                  .ok(),
                             "zero concurrency");
                     audit->shutdown();
                   }});
}
