#pragma once

#include "paneguard/common/result.hpp"

#include <chrono>
#include <cstddef>
#include <memory>
#include <string>
#include <sys/types.h>
#include <vector>

namespace paneguard::exec {

struct ProcessOptions {
  std::chrono::milliseconds timeout{30'000};
  std::size_t max_output_bytes = 1024 * 1024;
};

struct ProcessResult {
  int exit_code = 0;
  std::string stdout_text;
  std::string stderr_text;
  bool timed_out = false;
  bool output_truncated = false;
  std::chrono::milliseconds duration{0};
};

/// A long-running child started by IProcessRunner::spawn. stdout and stderr
/// share one pipe. Dropping a handle whose process still runs terminates it.
class IChildProcess {
public:
  virtual ~IChildProcess() = default;

  [[nodiscard]] virtual pid_t pid() const = 0;
  [[nodiscard]] virtual bool is_running() = 0;

  /// Output available now, waiting up to `wait` for the first byte. Never more
  /// than `max_bytes`; the rest stays in the pipe for the next read.
  [[nodiscard]] virtual common::Result<std::string> read_output(std::size_t max_bytes,
                                                                std::chrono::milliseconds wait) = 0;

  /// SIGTERM to the process group, SIGKILL once `grace` runs out. Returns the
  /// exit code, 128 + signal for a killed process.
  virtual int terminate(std::chrono::milliseconds grace) = 0;
};

/// Runs an argument vector directly; no shell ever sees it. A failed Result
/// means the process could not be started at all.
class IProcessRunner {
public:
  virtual ~IProcessRunner() = default;

  [[nodiscard]] virtual common::Result<ProcessResult> run(const std::vector<std::string> &argv,
                                                          const ProcessOptions &options) = 0;

  /// Starts `argv` and returns without waiting for it.
  [[nodiscard]] virtual common::Result<std::unique_ptr<IChildProcess>>
  spawn(const std::vector<std::string> &argv) = 0;
};

/// fork/execvp runner. The child gets its own process group so a timeout can
/// SIGKILL everything it started; stdin is /dev/null.
class PosixProcessRunner final : public IProcessRunner {
public:
  [[nodiscard]] common::Result<ProcessResult> run(const std::vector<std::string> &argv,
                                                  const ProcessOptions &options) override;
  [[nodiscard]] common::Result<std::unique_ptr<IChildProcess>>
  spawn(const std::vector<std::string> &argv) override;
};

} // namespace paneguard::exec
