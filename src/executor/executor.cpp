#include "execai/executor/executor.hpp"

#include "execai/executor/process.hpp"
#include "execai/observability/global.hpp"
#include "execai/security/policy.hpp"

#include <algorithm>
#include <cerrno>
#include <csignal>
#include <fcntl.h>
#include <fstream>
#include <poll.h>
#include <sstream>
#include <thread>
#include <unistd.h>
#include <vector>

namespace execai::executor {

namespace {

constexpr std::chrono::milliseconds FALLBACK_POLL_INTERVAL{50};
constexpr std::chrono::milliseconds CANCEL_WAIT_MARGIN{2000};
constexpr std::chrono::milliseconds GROUP_POLL_INTERVAL{10};

enum class Termination { None, Timeout, Cancel };

int poll_timeout_ms(const std::chrono::steady_clock::time_point now,
                    const std::chrono::steady_clock::time_point until, const bool has_exit_fd) {
  auto wait = std::chrono::ceil<std::chrono::milliseconds>(until - now);
  if (wait < std::chrono::milliseconds(0)) {
    wait = std::chrono::milliseconds(0);
  }
  if (!has_exit_fd) {
    wait = std::min(wait, FALLBACK_POLL_INTERVAL);
  }
  return static_cast<int>(std::min<std::chrono::milliseconds::rep>(wait.count(), 60'000));
}

// Saturates instead of overflowing the clock's representation for huge timeouts.
std::chrono::steady_clock::time_point
deadline_after(const std::chrono::steady_clock::time_point start, const std::int64_t timeout_secs) {
  using Clock = std::chrono::steady_clock;
  const auto headroom =
      std::chrono::duration_cast<std::chrono::seconds>(Clock::time_point::max() - start);
  if (timeout_secs >= headroom.count()) {
    return Clock::time_point::max();
  }
  return start + std::chrono::seconds(timeout_secs);
}

// False if members of the group are still around at `until`.
bool wait_group_gone(const ChildProcess &child, const std::chrono::steady_clock::time_point until) {
  while (child.group_alive()) {
    if (std::chrono::steady_clock::now() >= until) {
      return false;
    }
    std::this_thread::sleep_for(GROUP_POLL_INTERVAL);
  }
  return true;
}

std::string timeout_message(const std::int64_t timeout_secs) {
  return "Command timed out after " + std::to_string(timeout_secs) + " seconds";
}

std::string with_truncation_marker(std::string text, const bool truncated) {
  if (truncated) {
    text += "\n[output truncated]";
  }
  return text;
}

std::chrono::milliseconds to_millis(const double seconds) {
  return std::chrono::milliseconds(static_cast<std::int64_t>(seconds * 1000.0));
}

struct ProcStat {
  std::string state;
  double cpu_seconds = 0.0;
};

std::optional<ProcStat> read_proc_stat(const pid_t pid) {
  std::ifstream file("/proc/" + std::to_string(pid) + "/stat");
  if (!file) {
    return std::nullopt;
  }
  std::string content;
  std::getline(file, content);

  // The command name may contain spaces or parentheses; fields resume after the last ')'.
  const auto paren = content.rfind(')');
  if (paren == std::string::npos) {
    return std::nullopt;
  }
  std::istringstream fields(content.substr(paren + 1));
  std::vector<std::string> tokens;
  std::string token;
  while (fields >> token) {
    tokens.push_back(token);
  }
  // tokens[0] is field 3 (state); utime and stime are fields 14 and 15.
  if (tokens.size() < 13) {
    return std::nullopt;
  }

  ProcStat stat;
  stat.state = tokens[0];
  const long ticks = sysconf(_SC_CLK_TCK);
  try {
    const double cpu_ticks = std::stod(tokens[11]) + std::stod(tokens[12]);
    stat.cpu_seconds = ticks > 0 ? cpu_ticks / static_cast<double>(ticks) : 0.0;
  } catch (const std::exception &) {
    return std::nullopt;
  }
  return stat;
}

std::optional<std::uint64_t> read_proc_rss(const pid_t pid) {
  std::ifstream statm("/proc/" + std::to_string(pid) + "/statm");
  if (!statm) {
    return std::nullopt;
  }
  std::uint64_t size = 0;
  std::uint64_t resident = 0;
  if (!(statm >> size >> resident)) {
    return std::nullopt;
  }
  return resident * static_cast<std::uint64_t>(sysconf(_SC_PAGESIZE));
}

} // namespace

struct Executor::Execution {
  std::string command_id;
  std::string command_line;
  pid_t pid = -1;
  common::Timestamp started_at{};
  int wake_read = -1;
  int wake_write = -1;

  std::mutex mutex;
  std::condition_variable cv;
  bool cancel_requested = false;
  bool exited = false;

  Execution() {
    int fds[2] = {-1, -1};
    if (pipe2(fds, O_CLOEXEC | O_NONBLOCK) == 0) {
      wake_read = fds[0];
      wake_write = fds[1];
    }
  }

  ~Execution() {
    if (wake_read >= 0) {
      close(wake_read);
    }
    if (wake_write >= 0) {
      close(wake_write);
    }
  }

  Execution(const Execution &) = delete;
  Execution &operator=(const Execution &) = delete;

  void wake() const {
    if (wake_write >= 0) {
      const char byte = 'x';
      const ssize_t ignored = write(wake_write, &byte, 1);
      (void)ignored;
    }
  }

  void drain_wake() const {
    char buffer[64];
    while (wake_read >= 0 && read(wake_read, buffer, sizeof(buffer)) > 0) {
    }
  }

  bool cancel_pending() {
    std::lock_guard<std::mutex> lock(mutex);
    return cancel_requested;
  }
};

Executor::Executor(ExecutorOptions options) : options_(std::move(options)) {}

Executor::~Executor() { shutdown(); }

common::Result<domain::ExecutionResult> Executor::execute(domain::Command &command) {
  using ExecResult = common::Result<domain::ExecutionResult>;

  if (shutting_down_.load()) {
    return ExecResult::failure(common::ErrorCode::InvalidState, "executor has been shut down");
  }
  if (!command.can_execute()) {
    if (command.status() != domain::CommandStatus::Pending) {
      return ExecResult::failure(common::ErrorCode::InvalidState,
                                 "command " + command.id() + " is not pending (state " +
                                     domain::label(domain::to_string(command.status())) + ")");
    }
    const auto pattern = security::find_dangerous_pattern(command.parsed_command());
    return ExecResult::failure(common::ErrorCode::InvalidState,
                               "command rejected in safe mode: matches '" +
                                   pattern.value_or("deny-list") + "'");
  }

  domain::ExecutionResult result = domain::ExecutionResult::begin(command);
  if (auto begun = command.start_execution(); !begun.ok()) {
    return ExecResult::failure(begun);
  }
  observability::record_execution_start(command.id(), command.parsed_command());
  const auto started = std::chrono::steady_clock::now();

  auto spawned = ChildProcess::spawn(SpawnOptions{
      .shell = options_.shell,
      .command_line = command.parsed_command(),
      .working_directory = command.working_directory(),
      .environment = command.environment(),
  });
  if (!spawned.ok()) {
    return ExecResult::success(
        finish_launch_failure(command, std::move(result), spawned.error(), started));
  }
  ChildProcess child = std::move(spawned.value());

  auto entry = std::make_shared<Execution>();
  entry->command_id = command.id();
  entry->command_line = command.parsed_command();
  entry->pid = child.pid();
  entry->started_at = result.started_at;

  {
    std::lock_guard<std::mutex> lock(registry_mutex_);
    if (shutting_down_.load()) {
      entry->cancel_requested = true;
    }
    running_[command.id()] = entry;
    observability::record_metric(
        observability::RunningExecutionsMetric{.count = running_.size()});
  }

  // Only this call removes the entry it inserted.
  struct Deregister {
    Executor &self;
    const std::string &handle;
    ~Deregister() {
      std::lock_guard<std::mutex> lock(self.registry_mutex_);
      self.running_.erase(handle);
      self.registry_cv_.notify_all();
    }
  } deregister{*this, entry->command_id};

  const auto deadline = deadline_after(started, command.timeout_secs());
  Termination termination = Termination::None;
  std::optional<std::chrono::steady_clock::time_point> kill_at;
  bool killed = false;

  std::string out;
  std::string err;
  bool out_truncated = false;
  bool err_truncated = false;
  std::optional<ExitInfo> exit;

  while (!exit.has_value()) {
    const auto now = std::chrono::steady_clock::now();
    if (termination == Termination::None) {
      if (entry->cancel_pending()) {
        termination = Termination::Cancel;
      } else if (now >= deadline) {
        termination = Termination::Timeout;
      }
      if (termination != Termination::None) {
        child.signal_group(SIGTERM);
        kill_at = now + options_.grace_period;
      }
    }
    if (kill_at.has_value() && !killed && now >= *kill_at) {
      child.signal_group(SIGKILL);
      killed = true;
    }

    const auto until = termination == Termination::None
                           ? deadline
                           : (killed ? now + FALLBACK_POLL_INTERVAL : *kill_at);

    std::vector<pollfd> fds;
    fds.reserve(4);
    if (child.stdout_fd() >= 0) {
      fds.push_back(pollfd{.fd = child.stdout_fd(), .events = POLLIN, .revents = 0});
    }
    if (child.stderr_fd() >= 0) {
      fds.push_back(pollfd{.fd = child.stderr_fd(), .events = POLLIN, .revents = 0});
    }
    if (child.exit_fd() >= 0) {
      fds.push_back(pollfd{.fd = child.exit_fd(), .events = POLLIN, .revents = 0});
    }
    if (entry->wake_read >= 0) {
      fds.push_back(pollfd{.fd = entry->wake_read, .events = POLLIN, .revents = 0});
    }

    const int ready = poll(fds.data(), static_cast<nfds_t>(fds.size()),
                           poll_timeout_ms(now, until, child.exit_fd() >= 0));
    if (ready < 0 && errno != EINTR) {
      std::this_thread::sleep_for(FALLBACK_POLL_INTERVAL);
    }

    for (const auto &pfd : fds) {
      if (pfd.revents == 0) {
        continue;
      }
      if (pfd.fd == child.stdout_fd()) {
        if (!drain_fd(pfd.fd, out, options_.max_output_bytes, out_truncated)) {
          child.close_stdout();
        }
      } else if (pfd.fd == child.stderr_fd()) {
        if (!drain_fd(pfd.fd, err, options_.max_output_bytes, err_truncated)) {
          child.close_stderr();
        }
      } else if (pfd.fd == entry->wake_read) {
        entry->drain_wake();
      }
    }

    std::lock_guard<std::mutex> lock(entry->mutex);
    exit = child.try_reap();
    if (exit.has_value()) {
      entry->exited = true;
      if (termination == Termination::None && entry->cancel_requested) {
        termination = Termination::Cancel;
      }
    }
  }
  entry->cv.notify_all();

  if (termination != Termination::None) {
    // Descendants that ignore SIGTERM can outlive the leader. They get what is left of the
    // grace period, then the whole group is killed.
    const auto grace_end = kill_at.value_or(std::chrono::steady_clock::now());
    if (!wait_group_gone(child, grace_end)) {
      child.signal_group(SIGKILL);
      if (!wait_group_gone(child, std::chrono::steady_clock::now() + options_.grace_period)) {
        observability::record_warning("executor", "process group of " + command.id() +
                                                      " still has members after SIGKILL");
      }
    }
  }

  // Whatever the child wrote before exiting; descendants holding the pipe are not waited for.
  if (child.stdout_fd() >= 0) {
    drain_fd(child.stdout_fd(), out, options_.max_output_bytes, out_truncated);
    child.close_stdout();
  }
  if (child.stderr_fd() >= 0) {
    drain_fd(child.stderr_fd(), err, options_.max_output_bytes, err_truncated);
    child.close_stderr();
  }

  const double elapsed =
      std::chrono::duration<double>(std::chrono::steady_clock::now() - started).count();
  result.completed_at = common::utc_now();
  result.memory_usage_mb = exit->max_rss_mb;
  result.cpu_usage_percent = elapsed > 0.0 ? exit->cpu_seconds / elapsed * 100.0 : 0.0;

  common::Status transition = common::Status::success();
  switch (termination) {
  case Termination::Timeout:
    result.success = false;
    result.exit_code = -1;
    result.timed_out = true;
    result.stdout_text.clear();
    result.stderr_text = timeout_message(command.timeout_secs());
    transition = command.complete_execution(-1, "", result.stderr_text, elapsed);
    break;
  case Termination::Cancel:
    result.success = false;
    result.exit_code = -1;
    result.cancelled = true;
    result.stdout_text = with_truncation_marker(std::move(out), out_truncated);
    result.stderr_text = with_truncation_marker(std::move(err), err_truncated);
    if (!result.stderr_text.empty()) {
      result.stderr_text += "\n";
    }
    result.stderr_text += "Command was cancelled";
    transition = command.cancel_execution();
    observability::record_execution_cancelled(command.id());
    break;
  case Termination::None:
    result.exit_code = exit->exit_code;
    result.success = exit->exit_code == 0;
    result.stdout_text = with_truncation_marker(std::move(out), out_truncated);
    result.stderr_text = with_truncation_marker(std::move(err), err_truncated);
    transition = command.complete_execution(exit->exit_code, result.stdout_text,
                                            result.stderr_text, elapsed);
    break;
  }

  observability::record_execution_end(command.id(), to_millis(elapsed), result.exit_code,
                                      result.success, result.timed_out);
  if (!transition.ok()) {
    return ExecResult::failure(transition);
  }
  return ExecResult::success(std::move(result));
}

domain::ExecutionResult
Executor::finish_launch_failure(domain::Command &command, domain::ExecutionResult result,
                                const std::string &reason,
                                const std::chrono::steady_clock::time_point started) {
  const double elapsed =
      std::chrono::duration<double>(std::chrono::steady_clock::now() - started).count();
  result.success = false;
  result.exit_code.reset();
  result.stderr_text = reason;
  result.completed_at = common::utc_now();

  observability::record_error("executor", command.id() + ": " + reason);
  if (auto status = command.complete_execution(1, "", reason, elapsed); !status.ok()) {
    observability::record_error("executor", status.error());
  }
  observability::record_execution_end(command.id(), to_millis(elapsed), std::nullopt, false,
                                      false);
  return result;
}

bool Executor::cancel(const std::string &handle) {
  std::shared_ptr<Execution> entry;
  {
    std::lock_guard<std::mutex> lock(registry_mutex_);
    const auto it = running_.find(handle);
    if (it == running_.end()) {
      return false;
    }
    entry = it->second;
  }

  std::unique_lock<std::mutex> lock(entry->mutex);
  if (entry->exited) {
    return false;
  }
  entry->cancel_requested = true;
  entry->wake();
  entry->cv.wait_for(lock, options_.grace_period + CANCEL_WAIT_MARGIN,
                     [&] { return entry->exited; });
  return true;
}

std::map<std::string, ProcessTelemetry> Executor::list_running() const {
  std::vector<std::shared_ptr<Execution>> entries;
  {
    std::lock_guard<std::mutex> lock(registry_mutex_);
    entries.reserve(running_.size());
    for (const auto &[handle, entry] : running_) {
      entries.push_back(entry);
    }
  }

  std::map<std::string, ProcessTelemetry> telemetry;
  const auto now = common::utc_now();
  for (const auto &entry : entries) {
    // Holding the entry lock keeps the owner from reaping (and the pid from being reused).
    std::lock_guard<std::mutex> lock(entry->mutex);
    if (entry->exited) {
      continue;
    }
    const auto stat = read_proc_stat(entry->pid);
    const auto rss = read_proc_rss(entry->pid);
    if (!stat.has_value() || !rss.has_value() || stat->state == "Z") {
      continue;
    }
    const double wall = common::seconds_between(entry->started_at, now);
    telemetry[entry->command_id] = ProcessTelemetry{
        .pid = entry->pid,
        .command_id = entry->command_id,
        .command_line = entry->command_line,
        .status = stat->state,
        .cpu_percent = wall > 0.0 ? stat->cpu_seconds / wall * 100.0 : 0.0,
        .memory_rss_bytes = *rss,
        .started_at = entry->started_at,
    };
  }
  return telemetry;
}

std::size_t Executor::running_count() const {
  std::lock_guard<std::mutex> lock(registry_mutex_);
  return running_.size();
}

void Executor::shutdown() {
  shutting_down_.store(true);

  std::unique_lock<std::mutex> lock(registry_mutex_);
  for (const auto &[handle, entry] : running_) {
    std::lock_guard<std::mutex> entry_lock(entry->mutex);
    if (!entry->exited) {
      entry->cancel_requested = true;
      entry->wake();
    }
  }

  const auto limit = options_.grace_period * 2 + CANCEL_WAIT_MARGIN;
  if (!registry_cv_.wait_for(lock, limit, [this] { return running_.empty(); })) {
    observability::record_warning("executor", std::to_string(running_.size()) +
                                                  " execution(s) still running after shutdown");
  }
}

} // namespace execai::executor
