#include "paneguard/exec/process_runner.hpp"

#include <algorithm>
#include <array>
#include <cerrno>
#include <csignal>
#include <cstring>
#include <fcntl.h>
#include <optional>
#include <poll.h>
#include <sys/wait.h>
#include <thread>
#include <unistd.h>

namespace paneguard::exec {

namespace {

void set_non_blocking(const int fd) {
  const int flags = fcntl(fd, F_GETFL, 0);
  if (flags >= 0) {
    (void)fcntl(fd, F_SETFL, flags | O_NONBLOCK);
  }
}

void close_fd(int &fd) {
  if (fd >= 0) {
    close(fd);
    fd = -1;
  }
}

int decode_status(const int status) {
  if (WIFEXITED(status)) {
    return WEXITSTATUS(status);
  }
  if (WIFSIGNALED(status)) {
    return 128 + WTERMSIG(status);
  }
  return -1;
}

// Keeps draining past the cap so the child never blocks on a full pipe.
void read_into_buffer(const int fd, std::string &buffer, const std::size_t cap, bool &truncated) {
  std::array<char, 4096> chunk{};
  while (true) {
    const ssize_t bytes = read(fd, chunk.data(), chunk.size());
    if (bytes <= 0) {
      return;
    }
    const auto count = static_cast<std::size_t>(bytes);
    if (buffer.size() < cap) {
      const std::size_t room = cap - buffer.size();
      buffer.append(chunk.data(), std::min(room, count));
      if (count > room) {
        truncated = true;
      }
    } else {
      truncated = true;
    }
  }
}

// Forks and execs `argv` in a new process group with stdin on /dev/null and
// stdout/stderr on the given write ends. Every pipe is close-on-exec, so only
// the dup2'd descriptors survive into the child. An exec failure comes back
// through a dedicated pipe as errno.
common::Result<pid_t> start_child(const std::vector<std::string> &argv, const int out_fd,
                                  const int err_fd) {
  int exec_pipe[2] = {-1, -1};
  if (pipe2(exec_pipe, O_CLOEXEC) != 0) {
    return common::Result<pid_t>::failure("failed to create pipes for " + argv.front());
  }

  std::vector<char *> args;
  args.reserve(argv.size() + 1);
  for (const auto &arg : argv) {
    args.push_back(const_cast<char *>(arg.c_str()));
  }
  args.push_back(nullptr);

  const pid_t pid = fork();
  if (pid < 0) {
    close_fd(exec_pipe[0]);
    close_fd(exec_pipe[1]);
    return common::Result<pid_t>::failure("failed to fork " + argv.front());
  }

  if (pid == 0) {
    (void)setpgid(0, 0);
    const int null_fd = open("/dev/null", O_RDONLY);
    if (null_fd >= 0) {
      (void)dup2(null_fd, STDIN_FILENO);
      close(null_fd);
    }
    (void)dup2(out_fd, STDOUT_FILENO);
    (void)dup2(err_fd, STDERR_FILENO);

    execvp(args[0], args.data());
    const int error = errno;
    (void)write(exec_pipe[1], &error, sizeof(error));
    _exit(127);
  }

  (void)setpgid(pid, pid);
  close_fd(exec_pipe[1]);
  int exec_errno = 0;
  const bool exec_failed =
      read(exec_pipe[0], &exec_errno, sizeof(exec_errno)) == static_cast<ssize_t>(sizeof(exec_errno));
  close_fd(exec_pipe[0]);
  if (exec_failed) {
    int status = 0;
    (void)waitpid(pid, &status, 0);
    return common::Result<pid_t>::failure("failed to execute " + argv.front() + ": " +
                                          std::strerror(exec_errno));
  }
  return common::Result<pid_t>::success(pid);
}

class PosixChildProcess final : public IChildProcess {
public:
  PosixChildProcess(const pid_t pid, const int output_fd) : pid_(pid), output_fd_(output_fd) {
    set_non_blocking(output_fd_);
  }

  ~PosixChildProcess() override {
    if (!reap().has_value()) {
      (void)terminate(std::chrono::milliseconds(0));
    }
    close_fd(output_fd_);
  }

  PosixChildProcess(const PosixChildProcess &) = delete;
  PosixChildProcess &operator=(const PosixChildProcess &) = delete;

  [[nodiscard]] pid_t pid() const override { return pid_; }

  [[nodiscard]] bool is_running() override { return !reap().has_value(); }

  [[nodiscard]] common::Result<std::string> read_output(const std::size_t max_bytes,
                                                        const std::chrono::milliseconds wait) override {
    std::string out;
    struct pollfd poll_fd = {.fd = output_fd_, .events = POLLIN, .revents = 0};
    const int ready = poll(&poll_fd, 1, static_cast<int>(wait.count()));
    if (ready < 0 && errno != EINTR) {
      return common::Result<std::string>::failure(std::string("poll failed: ") +
                                                  std::strerror(errno));
    }
    std::array<char, 4096> chunk{};
    while (ready > 0 && out.size() < max_bytes) {
      const ssize_t bytes =
          read(output_fd_, chunk.data(), std::min(chunk.size(), max_bytes - out.size()));
      if (bytes <= 0) {
        break;
      }
      out.append(chunk.data(), static_cast<std::size_t>(bytes));
    }
    return common::Result<std::string>::success(std::move(out));
  }

  int terminate(const std::chrono::milliseconds grace) override {
    if (const auto code = reap(); code.has_value()) {
      return *code;
    }
    (void)kill(-pid_, SIGTERM);
    const auto deadline = std::chrono::steady_clock::now() + grace;
    while (std::chrono::steady_clock::now() < deadline) {
      if (const auto code = reap(); code.has_value()) {
        return *code;
      }
      std::this_thread::sleep_for(std::chrono::milliseconds(20));
    }
    (void)kill(-pid_, SIGKILL);
    int status = 0;
    if (waitpid(pid_, &status, 0) == pid_) {
      exit_code_ = decode_status(status);
    } else {
      exit_code_ = -1;
    }
    return *exit_code_;
  }

private:
  std::optional<int> reap() {
    if (exit_code_.has_value()) {
      return exit_code_;
    }
    int status = 0;
    const pid_t done = waitpid(pid_, &status, WNOHANG);
    if (done == pid_) {
      exit_code_ = decode_status(status);
    } else if (done < 0) {
      exit_code_ = -1;
    }
    return exit_code_;
  }

  pid_t pid_;
  int output_fd_;
  std::optional<int> exit_code_;
};

} // namespace

common::Result<ProcessResult> PosixProcessRunner::run(const std::vector<std::string> &argv,
                                                      const ProcessOptions &options) {
  if (argv.empty() || argv.front().empty()) {
    return common::Result<ProcessResult>::failure("process argument vector is empty");
  }

  int stdout_pipe[2] = {-1, -1};
  int stderr_pipe[2] = {-1, -1};
  auto close_all = [&] {
    for (int *fds : {stdout_pipe, stderr_pipe}) {
      close_fd(fds[0]);
      close_fd(fds[1]);
    }
  };
  if (pipe2(stdout_pipe, O_CLOEXEC) != 0 || pipe2(stderr_pipe, O_CLOEXEC) != 0) {
    close_all();
    return common::Result<ProcessResult>::failure("failed to create pipes for " + argv.front());
  }

  const auto started = std::chrono::steady_clock::now();
  const auto child = start_child(argv, stdout_pipe[1], stderr_pipe[1]);
  close_fd(stdout_pipe[1]);
  close_fd(stderr_pipe[1]);
  if (!child.ok()) {
    close_all();
    return common::Result<ProcessResult>::failure(child.error());
  }
  const pid_t pid = child.value();

  set_non_blocking(stdout_pipe[0]);
  set_non_blocking(stderr_pipe[0]);

  ProcessResult result;
  int status = 0;

  while (true) {
    read_into_buffer(stdout_pipe[0], result.stdout_text, options.max_output_bytes,
                     result.output_truncated);
    read_into_buffer(stderr_pipe[0], result.stderr_text, options.max_output_bytes,
                     result.output_truncated);

    const pid_t waited = waitpid(pid, &status, WNOHANG);
    if (waited == pid) {
      break;
    }

    if (std::chrono::steady_clock::now() - started > options.timeout) {
      result.timed_out = true;
      (void)kill(-pid, SIGKILL);
      (void)kill(pid, SIGKILL);
      (void)waitpid(pid, &status, 0);
      break;
    }

    struct pollfd poll_fds[2] = {
        {.fd = stdout_pipe[0], .events = POLLIN, .revents = 0},
        {.fd = stderr_pipe[0], .events = POLLIN, .revents = 0},
    };
    (void)poll(poll_fds, 2, 20);
  }

  if (!result.timed_out) {
    read_into_buffer(stdout_pipe[0], result.stdout_text, options.max_output_bytes,
                     result.output_truncated);
    read_into_buffer(stderr_pipe[0], result.stderr_text, options.max_output_bytes,
                     result.output_truncated);
  }
  close_all();

  result.duration = std::chrono::duration_cast<std::chrono::milliseconds>(
      std::chrono::steady_clock::now() - started);
  if (result.timed_out) {
    // Whatever a killed process printed is not trusted.
    result.stdout_text.clear();
    result.stderr_text.clear();
    result.exit_code = -1;
  } else {
    result.exit_code = decode_status(status);
  }
  return common::Result<ProcessResult>::success(std::move(result));
}

common::Result<std::unique_ptr<IChildProcess>>
PosixProcessRunner::spawn(const std::vector<std::string> &argv) {
  using SpawnResult = common::Result<std::unique_ptr<IChildProcess>>;
  if (argv.empty() || argv.front().empty()) {
    return SpawnResult::failure("process argument vector is empty");
  }

  int output_pipe[2] = {-1, -1};
  if (pipe2(output_pipe, O_CLOEXEC) != 0) {
    return SpawnResult::failure("failed to create pipes for " + argv.front());
  }
  const auto child = start_child(argv, output_pipe[1], output_pipe[1]);
  close_fd(output_pipe[1]);
  if (!child.ok()) {
    close_fd(output_pipe[0]);
    return SpawnResult::failure(child.error());
  }
  return SpawnResult::success(std::make_unique<PosixChildProcess>(child.value(), output_pipe[0]));
}

} // namespace paneguard::exec
