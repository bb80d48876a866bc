#include "execai/executor/process.hpp"

#include <array>
#include <cerrno>
#include <csignal>
#include <cstring>
#include <fcntl.h>
#include <sys/resource.h>
#include <sys/syscall.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>
#include <vector>

extern char **environ;

namespace execai::executor {

namespace {

enum class ChildStage : int { Chdir = 1, Exec = 2 };

struct ChildError {
  ChildStage stage;
  int error_number;
};

void close_fd(int &fd) {
  if (fd >= 0) {
    close(fd);
    fd = -1;
  }
}

void close_pipe(int (&fds)[2]) {
  close_fd(fds[0]);
  close_fd(fds[1]);
}

int open_pidfd(const pid_t pid) {
#ifdef SYS_pidfd_open
  const long fd = syscall(SYS_pidfd_open, pid, 0);
  return fd < 0 ? -1 : static_cast<int>(fd);
#else
  (void)pid;
  return -1;
#endif
}

void set_nonblocking(const int fd) {
  const int flags = fcntl(fd, F_GETFL, 0);
  if (flags >= 0) {
    fcntl(fd, F_SETFL, flags | O_NONBLOCK);
  }
}

std::vector<std::string> merged_environment(const std::map<std::string, std::string> &overrides) {
  std::map<std::string, std::string> merged;
  for (char **entry = environ; entry != nullptr && *entry != nullptr; ++entry) {
    const std::string item(*entry);
    const auto eq = item.find('=');
    if (eq == std::string::npos) {
      continue;
    }
    merged[item.substr(0, eq)] = item.substr(eq + 1);
  }
  for (const auto &[key, value] : overrides) {
    merged[key] = value;
  }

  std::vector<std::string> out;
  out.reserve(merged.size());
  for (const auto &[key, value] : merged) {
    out.push_back(key + "=" + value);
  }
  return out;
}

// Only async-signal-safe calls between fork and exec.
[[noreturn]] void report_child_error(const int error_fd, const ChildStage stage) {
  const ChildError error{.stage = stage, .error_number = errno};
  const ssize_t ignored = write(error_fd, &error, sizeof(error));
  (void)ignored;
  _exit(127);
}

ExitInfo exit_info_from(const int status, const rusage &usage) {
  ExitInfo info;
  if (WIFEXITED(status)) {
    info.exit_code = WEXITSTATUS(status);
  } else if (WIFSIGNALED(status)) {
    info.signal = WTERMSIG(status);
    info.exit_code = 128 + WTERMSIG(status);
  } else {
    info.exit_code = 1;
  }
  // ru_maxrss is reported in kilobytes on Linux.
  info.max_rss_mb = static_cast<double>(usage.ru_maxrss) / 1024.0;
  info.cpu_seconds = static_cast<double>(usage.ru_utime.tv_sec + usage.ru_stime.tv_sec) +
                     static_cast<double>(usage.ru_utime.tv_usec + usage.ru_stime.tv_usec) / 1e6;
  return info;
}

} // namespace

common::Result<ChildProcess> ChildProcess::spawn(const SpawnOptions &options) {
  using SpawnResult = common::Result<ChildProcess>;

  const std::vector<std::string> env_strings = merged_environment(options.environment);
  std::vector<char *> envp;
  envp.reserve(env_strings.size() + 1);
  for (const auto &entry : env_strings) {
    envp.push_back(const_cast<char *>(entry.c_str()));
  }
  envp.push_back(nullptr);

  const std::string shell = options.shell.empty() ? std::string("/bin/sh") : options.shell;
  std::string arg0 = shell.substr(shell.find_last_of('/') + 1);
  std::string flag = "-c";
  std::string command_line = options.command_line;
  std::array<char *, 4> argv = {arg0.data(), flag.data(), command_line.data(), nullptr};
  const std::string cwd = options.working_directory.value_or("");

  int out_pipe[2] = {-1, -1};
  int err_pipe[2] = {-1, -1};
  int status_pipe[2] = {-1, -1};
  if (pipe2(out_pipe, O_CLOEXEC) != 0 || pipe2(err_pipe, O_CLOEXEC) != 0 ||
      pipe2(status_pipe, O_CLOEXEC) != 0) {
    const std::string reason = std::strerror(errno);
    close_pipe(out_pipe);
    close_pipe(err_pipe);
    close_pipe(status_pipe);
    return SpawnResult::failure(common::ErrorCode::Launch, "Failed to create pipe: " + reason);
  }

  const pid_t pid = fork();
  if (pid < 0) {
    const std::string reason = std::strerror(errno);
    close_pipe(out_pipe);
    close_pipe(err_pipe);
    close_pipe(status_pipe);
    return SpawnResult::failure(common::ErrorCode::Launch, "Failed to fork: " + reason);
  }

  if (pid == 0) {
    setpgid(0, 0);

    sigset_t empty;
    sigemptyset(&empty);
    sigprocmask(SIG_SETMASK, &empty, nullptr);
    signal(SIGPIPE, SIG_DFL);

    const int null_fd = open("/dev/null", O_RDONLY);
    if (null_fd >= 0) {
      dup2(null_fd, STDIN_FILENO);
      close(null_fd);
    }
    dup2(out_pipe[1], STDOUT_FILENO);
    dup2(err_pipe[1], STDERR_FILENO);

    if (!cwd.empty() && chdir(cwd.c_str()) != 0) {
      report_child_error(status_pipe[1], ChildStage::Chdir);
    }
    execve(shell.c_str(), argv.data(), envp.data());
    report_child_error(status_pipe[1], ChildStage::Exec);
  }

  // Both sides set the group to close the race with an early kill(-pid). EACCES here means
  // the child already exec'd after its own setpgid.
  (void)setpgid(pid, pid);

  close_fd(out_pipe[1]);
  close_fd(err_pipe[1]);
  close_fd(status_pipe[1]);

  ChildError child_error{};
  ssize_t got = 0;
  do {
    got = read(status_pipe[0], &child_error, sizeof(child_error));
  } while (got < 0 && errno == EINTR);
  close_fd(status_pipe[0]);

  if (got == static_cast<ssize_t>(sizeof(child_error))) {
    int status = 0;
    while (waitpid(pid, &status, 0) < 0 && errno == EINTR) {
    }
    close_fd(out_pipe[0]);
    close_fd(err_pipe[0]);
    const std::string reason = std::strerror(child_error.error_number);
    if (child_error.stage == ChildStage::Chdir) {
      return SpawnResult::failure(common::ErrorCode::Launch,
                                  "Failed to change directory to '" + cwd + "': " + reason);
    }
    return SpawnResult::failure(common::ErrorCode::Launch,
                                "Failed to execute '" + shell + "': " + reason);
  }

  set_nonblocking(out_pipe[0]);
  set_nonblocking(err_pipe[0]);

  ChildProcess child;
  child.pid_ = pid;
  child.stdout_fd_ = out_pipe[0];
  child.stderr_fd_ = err_pipe[0];
  child.pidfd_ = open_pidfd(pid);
  return SpawnResult::success(std::move(child));
}

ChildProcess::ChildProcess(ChildProcess &&other) noexcept
    : pid_(other.pid_), stdout_fd_(other.stdout_fd_), stderr_fd_(other.stderr_fd_),
      pidfd_(other.pidfd_), reaped_(other.reaped_) {
  other.pid_ = -1;
  other.stdout_fd_ = -1;
  other.stderr_fd_ = -1;
  other.pidfd_ = -1;
  other.reaped_ = true;
}

ChildProcess &ChildProcess::operator=(ChildProcess &&other) noexcept {
  if (this != &other) {
    release();
    pid_ = other.pid_;
    stdout_fd_ = other.stdout_fd_;
    stderr_fd_ = other.stderr_fd_;
    pidfd_ = other.pidfd_;
    reaped_ = other.reaped_;
    other.pid_ = -1;
    other.stdout_fd_ = -1;
    other.stderr_fd_ = -1;
    other.pidfd_ = -1;
    other.reaped_ = true;
  }
  return *this;
}

ChildProcess::~ChildProcess() { release(); }

void ChildProcess::release() {
  if (pid_ > 0 && !reaped_) {
    signal_group(SIGKILL);
    const ExitInfo ignored = reap();
    (void)ignored;
  }
  close_fd(stdout_fd_);
  close_fd(stderr_fd_);
  close_fd(pidfd_);
  pid_ = -1;
}

void ChildProcess::close_stdout() { close_fd(stdout_fd_); }

void ChildProcess::close_stderr() { close_fd(stderr_fd_); }

void ChildProcess::signal_group(const int signal_number) const {
  if (pid_ <= 0) {
    return;
  }
  // The pgid is not handed out again while any member is left, so this stays safe after the
  // leader has been reaped.
  if (kill(-pid_, signal_number) != 0 && !reaped_) {
    // The group may already be gone; fall back to the leader itself.
    kill(pid_, signal_number);
  }
}

bool ChildProcess::group_alive() const { return pid_ > 0 && kill(-pid_, 0) == 0; }

std::optional<ExitInfo> ChildProcess::try_reap() {
  if (pid_ <= 0 || reaped_) {
    return std::nullopt;
  }
  int status = 0;
  rusage usage{};
  const pid_t done = wait4(pid_, &status, WNOHANG, &usage);
  if (done != pid_) {
    return std::nullopt;
  }
  reaped_ = true;
  return exit_info_from(status, usage);
}

ExitInfo ChildProcess::reap() {
  int status = 0;
  rusage usage{};
  pid_t done = -1;
  do {
    done = wait4(pid_, &status, 0, &usage);
  } while (done < 0 && errno == EINTR);
  reaped_ = true;
  if (done != pid_) {
    ExitInfo lost;
    lost.exit_code = 1;
    return lost;
  }
  return exit_info_from(status, usage);
}

bool drain_fd(const int fd, std::string &buffer, const std::uint64_t limit, bool &truncated) {
  std::array<char, 4096> chunk{};
  while (true) {
    const ssize_t bytes = read(fd, chunk.data(), chunk.size());
    if (bytes > 0) {
      std::size_t to_copy = static_cast<std::size_t>(bytes);
      if (limit > 0) {
        const std::size_t remaining = limit > buffer.size() ? limit - buffer.size() : 0;
        if (to_copy > remaining) {
          to_copy = remaining;
          truncated = true;
        }
      }
      buffer.append(chunk.data(), to_copy);
      continue;
    }
    if (bytes == 0) {
      return false;
    }
    if (errno == EINTR) {
      continue;
    }
    // EAGAIN: nothing more right now. Any other error ends the stream.
    return errno == EAGAIN || errno == EWOULDBLOCK;
  }
}

} // namespace execai::executor
