#include "test_framework.hpp"

#include "paneguard/exec/process_runner.hpp"

#include <chrono>
#include <string>
#include <thread>

namespace {

paneguard::exec::ProcessOptions options_with(const std::chrono::milliseconds timeout,
                                             const std::size_t max_output = 1024 * 1024) {
  return paneguard::exec::ProcessOptions{.timeout = timeout, .max_output_bytes = max_output};
}

} // namespace

void register_process_integration_tests(std::vector<paneguard::tests::TestCase> &tests) {
  using paneguard::tests::require;
  using namespace std::chrono_literals;

  tests.push_back({"process_captures_both_streams", [] {
                     paneguard::exec::PosixProcessRunner runner;
                     const auto result = runner.run(
                         {"/bin/sh", "-c", "printf hello; printf oops >&2"}, options_with(5s));
                     require(result.ok(), result.ok() ? "" : result.error());
                     require(result.value().exit_code == 0, "clean exit");
                     require(result.value().stdout_text == "hello", result.value().stdout_text);
                     require(result.value().stderr_text == "oops", result.value().stderr_text);
                     require(!result.value().timed_out, "no timeout");
                   }});

  tests.push_back({"process_arguments_are_never_shell_parsed", [] {
                     paneguard::exec::PosixProcessRunner runner;
                     const auto result =
                         runner.run({"/bin/echo", "a; rm -rf /", "$(id)", "`whoami`"}, options_with(5s));
                     require(result.ok(), result.ok() ? "" : result.error());
                     require(result.value().stdout_text == "a; rm -rf / $(id) `whoami`\n",
                             result.value().stdout_text);
                   }});

  tests.push_back({"process_reports_exit_status", [] {
                     paneguard::exec::PosixProcessRunner runner;
                     const auto exited = runner.run({"/bin/sh", "-c", "exit 3"}, options_with(5s));
                     require(exited.ok() && exited.value().exit_code == 3, "exit status 3");
                     const auto killed = runner.run({"/bin/sh", "-c", "kill -9 $$"}, options_with(5s));
                     require(killed.ok() && killed.value().exit_code == 137, "signal mapped to 128+n");
                   }});

  tests.push_back({"process_stdin_is_closed", [] {
                     paneguard::exec::PosixProcessRunner runner;
                     const auto result = runner.run({"/bin/cat"}, options_with(2s));
                     require(result.ok(), result.ok() ? "" : result.error());
                     require(!result.value().timed_out, "cat sees EOF at once");
                     require(result.value().stdout_text.empty(), "nothing read");
                   }});

  tests.push_back({"process_timeout_kills_process_group", [] {
                     paneguard::exec::PosixProcessRunner runner;
                     const auto started = std::chrono::steady_clock::now();
                     const auto result = runner.run(
                         {"/bin/sh", "-c", "echo partial; sleep 10 & sleep 10"}, options_with(200ms));
                     const auto elapsed = std::chrono::steady_clock::now() - started;
                     require(result.ok(), result.ok() ? "" : result.error());
                     require(result.value().timed_out, "timed out");
                     require(result.value().exit_code == -1, "no exit status after a kill");
                     require(result.value().stdout_text.empty(), "output of a killed process dropped");
                     require(elapsed < 5s, "returned promptly");
                   }});

  tests.push_back({"process_output_is_capped", [] {
                     paneguard::exec::PosixProcessRunner runner;
                     const auto result = runner.run({"/bin/sh", "-c", "head -c 200000 /dev/zero"},
                                                    options_with(5s, 1'000));
                     require(result.ok(), result.ok() ? "" : result.error());
                     require(result.value().stdout_text.size() == 1'000, "capped at the limit");
                     require(result.value().output_truncated, "truncation flagged");
                     require(result.value().exit_code == 0, "child not blocked by a full pipe");
                   }});

  tests.push_back({"process_missing_binary_is_a_spawn_error", [] {
                     paneguard::exec::PosixProcessRunner runner;
                     const auto missing =
                         runner.run({"/nonexistent/paneguard/tmux", "-V"}, options_with(2s));
                     require(!missing.ok(), "spawn failure");
                     require(missing.error().find("No such file") != std::string::npos,
                             missing.error());
                     require(!runner.run({}, options_with(1s)).ok(), "empty argv");
                   }});

  tests.push_back({"process_spawned_child_streams_and_terminates", [] {
                     paneguard::exec::PosixProcessRunner runner;
                     auto child = runner.spawn({"/bin/sh", "-c", "echo ready; sleep 10"});
                     require(child.ok(), child.ok() ? "" : child.error());
                     auto process = child.take();
                     require(process->pid() > 0, "pid reported");

                     std::string seen;
                     const auto deadline = std::chrono::steady_clock::now() + 5s;
                     while (seen.find("ready") == std::string::npos &&
                            std::chrono::steady_clock::now() < deadline) {
                       auto chunk = process->read_output(64, 100ms);
                       require(chunk.ok(), chunk.ok() ? "" : chunk.error());
                       seen += chunk.value();
                     }
                     require(seen == "ready\n", seen);
                     require(process->is_running(), "still sleeping");

                     const auto started = std::chrono::steady_clock::now();
                     require(process->terminate(2s) == 143, "stopped by SIGTERM");
                     require(std::chrono::steady_clock::now() - started < 3s, "no wait for sleep");
                     require(!process->is_running(), "reaped");
                   }});

  tests.push_back({"process_spawned_child_exit_is_observed", [] {
                     paneguard::exec::PosixProcessRunner runner;
                     auto child = runner.spawn({"/bin/sh", "-c", "exit 5"});
                     require(child.ok(), child.ok() ? "" : child.error());
                     auto process = child.take();
                     const auto deadline = std::chrono::steady_clock::now() + 5s;
                     while (process->is_running() && std::chrono::steady_clock::now() < deadline) {
                       std::this_thread::sleep_for(10ms);
                     }
                     require(!process->is_running(), "exited on its own");
                     require(process->terminate(0ms) == 5, "exit status kept");

                     const auto missing = runner.spawn({"/nonexistent/paneguard/tmux"});
                     require(!missing.ok(), "missing binary is a start error");
                     require(!runner.spawn({}).ok(), "empty argv");
                   }});
}
