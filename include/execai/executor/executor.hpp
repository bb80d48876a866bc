#pragma once

#include "execai/common/result.hpp"
#include "execai/common/time.hpp"
#include "execai/domain/command.hpp"
#include "execai/domain/execution_result.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <sys/types.h>

namespace execai::executor {

constexpr std::chrono::milliseconds DEFAULT_GRACE_PERIOD{5000};

class IExecutor {
public:
  virtual ~IExecutor() = default;

  /// Runs `command` to completion. Only contract violations fail; a non-zero exit,
  /// timeout, launch failure or cancellation comes back as data in the result.
  [[nodiscard]] virtual common::Result<domain::ExecutionResult>
  execute(domain::Command &command) = 0;
};

struct ExecutorOptions {
  std::chrono::milliseconds grace_period = DEFAULT_GRACE_PERIOD;
  /// Per-stream capture limit; 0 keeps everything.
  std::uint64_t max_output_bytes = 0;
  std::string shell = "/bin/sh";
};

/// Live view of one in-flight execution.
struct ProcessTelemetry {
  pid_t pid = -1;
  std::string command_id;
  std::string command_line;
  /// Kernel state letter from /proc, e.g. "S" or "R".
  std::string status;
  double cpu_percent = 0.0;
  std::uint64_t memory_rss_bytes = 0;
  common::Timestamp started_at{};
};

class Executor final : public IExecutor {
public:
  explicit Executor(ExecutorOptions options = {});
  ~Executor() override;

  Executor(const Executor &) = delete;
  Executor &operator=(const Executor &) = delete;

  [[nodiscard]] common::Result<domain::ExecutionResult>
  execute(domain::Command &command) override;

  /// Terminate the execution identified by `handle` (its command id): SIGTERM to the
  /// process group, SIGKILL after the grace period. Waits for the owner to reap the child.
  /// False when nothing with that handle is still running.
  bool cancel(const std::string &handle);

  /// Keyed by handle. Processes that exit while being inspected are left out.
  [[nodiscard]] std::map<std::string, ProcessTelemetry> list_running() const;
  [[nodiscard]] std::size_t running_count() const;

  /// Terminates everything in flight, waits for the owners to finish, and rejects any
  /// later execute() with an invalid-state error.
  void shutdown();
  [[nodiscard]] bool is_shut_down() const { return shutting_down_.load(); }

  [[nodiscard]] const ExecutorOptions &options() const { return options_; }

private:
  struct Execution;

  domain::ExecutionResult finish_launch_failure(domain::Command &command,
                                                domain::ExecutionResult result,
                                                const std::string &reason,
                                                std::chrono::steady_clock::time_point started);

  ExecutorOptions options_;
  std::atomic<bool> shutting_down_{false};
  mutable std::mutex registry_mutex_;
  std::condition_variable registry_cv_;
  std::map<std::string, std::shared_ptr<Execution>> running_;
};

} // namespace execai::executor
