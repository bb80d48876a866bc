#pragma once

#include "execai/common/result.hpp"
#include "execai/config/schema.hpp"
#include "execai/domain/command.hpp"
#include "execai/domain/schedule.hpp"
#include "execai/executor/executor.hpp"
#include "execai/observability/observer.hpp"

#include <atomic>
#include <chrono>
#include <functional>
#include <filesystem>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include <sys/types.h>

namespace execai::testing {

config::Config quiet_config();

class TempWorkspace {
public:
  TempWorkspace();
  ~TempWorkspace();

  TempWorkspace(const TempWorkspace &) = delete;
  TempWorkspace &operator=(const TempWorkspace &) = delete;

  [[nodiscard]] const std::filesystem::path &path() const { return path_; }
  void create_file(const std::string &name, const std::string &content) const;

private:
  std::filesystem::path path_;
};

struct EnvGuard {
  std::string key;
  std::optional<std::string> old_value;

  EnvGuard(std::string key_, std::optional<std::string> value);
  ~EnvGuard();
};

struct ConfigOverrideGuard {
  explicit ConfigOverrideGuard(std::optional<std::filesystem::path> next);
  ~ConfigOverrideGuard();
};

/// Command with safe defaults and the given command line; throws on validation failure.
domain::Command make_command(const std::string &command_line, std::int64_t timeout_secs = 10);

/// Schedule template running `command_line`.
domain::ScheduleSpec make_schedule_spec(const std::string &name, const std::string &command_line);

/// Records every command it is asked to run and completes it with a fixed exit code,
/// or fails the call outright while `fail_dispatch` is set.
class FakeExecutor final : public executor::IExecutor {
public:
  [[nodiscard]] common::Result<domain::ExecutionResult>
  execute(domain::Command &command) override;

  [[nodiscard]] std::vector<std::string> executed() const;
  [[nodiscard]] std::size_t calls() const { return calls_.load(); }

  std::atomic<bool> fail_dispatch{false};
  std::atomic<int> exit_code{0};

private:
  mutable std::mutex mutex_;
  std::vector<std::string> executed_;
  std::atomic<std::size_t> calls_{0};
};

class CapturingObserver final : public observability::IObserver {
public:
  void record_event(const observability::ObserverEvent &event) override;
  void record_metric(const observability::ObserverMetric &metric) override;
  [[nodiscard]] std::string_view name() const override { return "capture"; }

  [[nodiscard]] std::vector<observability::ObserverEvent> events() const;
  [[nodiscard]] std::size_t metric_count() const;
  /// "from->to" for every transition reported for `schedule_id`, in order.
  [[nodiscard]] std::vector<std::string> transitions(const std::string &schedule_id) const;

private:
  mutable std::mutex mutex_;
  std::vector<observability::ObserverEvent> events_;
  std::size_t metrics_ = 0;
};

/// Installs a CapturingObserver globally for the guard's lifetime.
class ObserverCapture {
public:
  ObserverCapture();
  ~ObserverCapture();

  ObserverCapture(const ObserverCapture &) = delete;
  ObserverCapture &operator=(const ObserverCapture &) = delete;

  [[nodiscard]] CapturingObserver &observer() { return *observer_; }

private:
  CapturingObserver *observer_ = nullptr;
};

/// Polls `condition` every 10ms until it holds or `timeout` passes.
bool wait_until(const std::function<bool()> &condition, std::chrono::milliseconds timeout);

/// False once the pid is gone or only a zombie is left.
bool process_exists(pid_t pid);

/// Reads a pid written by a test command; waits up to `timeout` for the file to appear.
pid_t read_pid_file(const std::filesystem::path &path, std::chrono::milliseconds timeout);

} // namespace execai::testing
