#include "hostgate/common/process.hpp"

#include <algorithm>
#include <array>
#include <cerrno>
#include <csignal>
#include <cstring>
#include <fcntl.h>
#include <poll.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

namespace hostgate::common {

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

// Drains whatever is currently readable, keeping at most `limit` bytes.
// Returns false once the writer side has closed.
bool read_into_buffer(const int fd, std::string &buffer, const std::size_t limit,
                      bool &truncated) {
  std::array<char, 4096> chunk{};
  while (true) {
    const ssize_t bytes = read(fd, chunk.data(), chunk.size());
    if (bytes > 0) {
      const std::size_t remaining = limit > buffer.size() ? limit - buffer.size() : 0;
      const std::size_t to_copy = std::min(remaining, static_cast<std::size_t>(bytes));
      buffer.append(chunk.data(), to_copy);
      if (to_copy < static_cast<std::size_t>(bytes)) {
        truncated = true;
      }
      continue;
    }
    if (bytes < 0 && (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR)) {
      return true;
    }
    return false;
  }
}

} // namespace

std::string format_duration(const std::chrono::milliseconds duration) {
  const auto ms = duration.count();
  if (ms % 1000 == 0) {
    return std::to_string(ms / 1000) + "s";
  }
  return std::to_string(ms) + "ms";
}

std::string truncation_marker(const std::size_t limit) {
  return "[output truncated at " + std::to_string(limit) + " bytes]";
}

Result<ProcessResult> PosixProcessRunner::run(const std::vector<std::string> &argv,
                                              const ProcessOptions &options) {
  if (argv.empty() || argv.front().empty()) {
    return Result<ProcessResult>::failure("command is empty", ErrorKind::InvalidArgument);
  }

  int stdout_pipe[2] = {-1, -1};
  int stderr_pipe[2] = {-1, -1};
  int exec_pipe[2] = {-1, -1};
  if (pipe(stdout_pipe) != 0 || pipe(stderr_pipe) != 0 || pipe(exec_pipe) != 0) {
    for (int *fd : {&stdout_pipe[0], &stdout_pipe[1], &stderr_pipe[0], &stderr_pipe[1],
                    &exec_pipe[0], &exec_pipe[1]}) {
      close_fd(*fd);
    }
    return Result<ProcessResult>::failure("failed to create pipes for " + argv.front());
  }
  (void)fcntl(exec_pipe[1], F_SETFD, FD_CLOEXEC);

  const pid_t pid = fork();
  if (pid < 0) {
    for (int *fd : {&stdout_pipe[0], &stdout_pipe[1], &stderr_pipe[0], &stderr_pipe[1],
                    &exec_pipe[0], &exec_pipe[1]}) {
      close_fd(*fd);
    }
    return Result<ProcessResult>::failure("failed to fork process for " + argv.front());
  }

  if (pid == 0) {
    (void)setpgid(0, 0);
    (void)dup2(stdout_pipe[1], STDOUT_FILENO);
    (void)dup2(stderr_pipe[1], STDERR_FILENO);
    const int devnull = open("/dev/null", O_RDONLY);
    if (devnull >= 0) {
      (void)dup2(devnull, STDIN_FILENO);
      close(devnull);
    }
    close(stdout_pipe[0]);
    close(stdout_pipe[1]);
    close(stderr_pipe[0]);
    close(stderr_pipe[1]);
    close(exec_pipe[0]);

    if (!options.working_dir.empty() && chdir(options.working_dir.c_str()) != 0) {
      const int err = errno;
      (void)write(exec_pipe[1], &err, sizeof(err));
      _exit(126);
    }

    std::vector<char *> args;
    args.reserve(argv.size() + 1);
    for (const auto &arg : argv) {
      args.push_back(const_cast<char *>(arg.c_str()));
    }
    args.push_back(nullptr);

    execvp(args[0], args.data());
    const int err = errno;
    (void)write(exec_pipe[1], &err, sizeof(err));
    _exit(127);
  }

  close(stdout_pipe[1]);
  close(stderr_pipe[1]);
  close(exec_pipe[1]);

  // The exec pipe is close-on-exec: EOF means exec succeeded, data is the errno.
  int exec_errno = 0;
  ssize_t got = 0;
  do {
    got = read(exec_pipe[0], &exec_errno, sizeof(exec_errno));
  } while (got < 0 && errno == EINTR);
  close(exec_pipe[0]);
  if (got == static_cast<ssize_t>(sizeof(exec_errno))) {
    int status = 0;
    (void)waitpid(pid, &status, 0);
    close(stdout_pipe[0]);
    close(stderr_pipe[0]);
    return Result<ProcessResult>::failure("failed to start " + argv.front() + ": " +
                                          std::strerror(exec_errno));
  }

  set_non_blocking(stdout_pipe[0]);
  set_non_blocking(stderr_pipe[0]);

  ProcessResult result;
  result.output_limit = options.max_output_bytes;
  int status = 0;
  bool timed_out = false;
  const auto started = std::chrono::steady_clock::now();

  while (true) {
    read_into_buffer(stdout_pipe[0], result.stdout_text, options.max_output_bytes,
                     result.truncated);
    read_into_buffer(stderr_pipe[0], result.stderr_text, options.max_output_bytes,
                     result.truncated);

    const pid_t waited = waitpid(pid, &status, WNOHANG);
    if (waited == pid) {
      break;
    }

    const auto elapsed = std::chrono::steady_clock::now() - started;
    if (elapsed > options.timeout) {
      timed_out = true;
      (void)kill(-pid, SIGKILL);
      (void)kill(pid, SIGKILL);
      (void)waitpid(pid, &status, 0);
      break;
    }

    struct pollfd poll_fds[2] = {
        {.fd = stdout_pipe[0], .events = POLLIN, .revents = 0},
        {.fd = stderr_pipe[0], .events = POLLIN, .revents = 0},
    };
    (void)poll(poll_fds, 2, 50);
  }

  read_into_buffer(stdout_pipe[0], result.stdout_text, options.max_output_bytes,
                   result.truncated);
  read_into_buffer(stderr_pipe[0], result.stderr_text, options.max_output_bytes,
                   result.truncated);
  close(stdout_pipe[0]);
  close(stderr_pipe[0]);

  if (timed_out) {
    return Result<ProcessResult>::failure("execution timed out after " +
                                              format_duration(options.timeout),
                                          ErrorKind::Timeout);
  }

  if (WIFEXITED(status)) {
    result.exit_code = WEXITSTATUS(status);
  } else if (WIFSIGNALED(status)) {
    result.exit_code = 128 + WTERMSIG(status);
  } else {
    result.exit_code = -1;
  }
  return Result<ProcessResult>::success(std::move(result));
}

} // namespace hostgate::common
