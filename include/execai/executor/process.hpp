#pragma once

#include "execai/common/result.hpp"

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <sys/types.h>

namespace execai::executor {

struct SpawnOptions {
  std::string shell = "/bin/sh";
  std::string command_line;
  std::optional<std::string> working_directory;
  /// Merged over the inherited environment; these entries win.
  std::map<std::string, std::string> environment;
};

struct ExitInfo {
  /// Exit status, or 128 + signal number for a signalled child.
  int exit_code = 0;
  std::optional<int> signal;
  double max_rss_mb = 0.0;
  double cpu_seconds = 0.0;
};

/// `sh -c` child running as the leader of its own process group, with stdout and
/// stderr on separate non-blocking pipes. Destroying a live child kills its group.
class ChildProcess {
public:
  [[nodiscard]] static common::Result<ChildProcess> spawn(const SpawnOptions &options);

  ChildProcess(const ChildProcess &) = delete;
  ChildProcess &operator=(const ChildProcess &) = delete;
  ChildProcess(ChildProcess &&other) noexcept;
  ChildProcess &operator=(ChildProcess &&other) noexcept;
  ~ChildProcess();

  [[nodiscard]] pid_t pid() const { return pid_; }
  [[nodiscard]] int stdout_fd() const { return stdout_fd_; }
  [[nodiscard]] int stderr_fd() const { return stderr_fd_; }
  /// Readable once the child has exited; -1 when the kernel has no pidfd support.
  [[nodiscard]] int exit_fd() const { return pidfd_; }
  [[nodiscard]] bool reaped() const { return reaped_; }

  void close_stdout();
  void close_stderr();

  /// Signal the whole process group, including descendants that outlived the leader.
  void signal_group(int signal_number) const;
  /// True while any member of the child's process group remains.
  [[nodiscard]] bool group_alive() const;

  /// Non-blocking reap; nullopt while the child is still running.
  [[nodiscard]] std::optional<ExitInfo> try_reap();
  /// Blocking reap.
  [[nodiscard]] ExitInfo reap();

private:
  ChildProcess() = default;
  void release();

  pid_t pid_ = -1;
  int stdout_fd_ = -1;
  int stderr_fd_ = -1;
  int pidfd_ = -1;
  bool reaped_ = false;
};

/// Appends whatever is currently readable from a non-blocking fd. Returns false on EOF.
bool drain_fd(int fd, std::string &buffer, std::uint64_t limit, bool &truncated);

} // namespace execai::executor
