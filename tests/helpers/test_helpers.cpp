#include "tests/helpers/test_helpers.hpp"

#include "execai/config/config.hpp"
#include "execai/observability/global.hpp"

#include <cerrno>
#include <csignal>
#include <cstdlib>
#include <fstream>
#include <random>
#include <stdexcept>
#include <thread>
#include <variant>

namespace execai::testing {

config::Config quiet_config() {
  config::Config config;
  config.observability.backend = "none";
  config.scheduler.poll_interval_ms = 50;
  config.scheduler.error_backoff_ms = 100;
  config.executor.default_timeout_secs = 10;
  return config;
}

TempWorkspace::TempWorkspace() {
  static std::mt19937_64 rng{std::random_device{}()};
  path_ = std::filesystem::temp_directory_path() / ("execai-test-workspace-" + std::to_string(rng()));
  std::filesystem::create_directories(path_);
}

TempWorkspace::~TempWorkspace() {
  std::error_code ec;
  std::filesystem::remove_all(path_, ec);
}

void TempWorkspace::create_file(const std::string &name, const std::string &content) const {
  const auto file_path = path_ / name;
  std::error_code ec;
  std::filesystem::create_directories(file_path.parent_path(), ec);
  std::ofstream out(file_path, std::ios::trunc);
  out << content;
}

EnvGuard::EnvGuard(std::string key_, std::optional<std::string> value) : key(std::move(key_)) {
  if (const char *existing = std::getenv(key.c_str()); existing != nullptr) {
    old_value = existing;
  }
  if (value.has_value()) {
    setenv(key.c_str(), value->c_str(), 1);
  } else {
    unsetenv(key.c_str());
  }
}

EnvGuard::~EnvGuard() {
  if (old_value.has_value()) {
    setenv(key.c_str(), old_value->c_str(), 1);
  } else {
    unsetenv(key.c_str());
  }
}

ConfigOverrideGuard::ConfigOverrideGuard(std::optional<std::filesystem::path> next) {
  config::set_config_path_override(std::move(next));
}

ConfigOverrideGuard::~ConfigOverrideGuard() { config::clear_config_path_override(); }

domain::Command make_command(const std::string &command_line, const std::int64_t timeout_secs) {
  domain::CommandSpec spec;
  spec.original_request = command_line;
  spec.parsed_command = command_line;
  spec.timeout_secs = timeout_secs;
  auto command = domain::Command::create(std::move(spec));
  if (!command.ok()) {
    throw std::runtime_error(command.error());
  }
  return std::move(command.value());
}

domain::ScheduleSpec make_schedule_spec(const std::string &name, const std::string &command_line) {
  domain::ScheduleSpec spec;
  spec.name = name;
  spec.command_template.original_request = command_line;
  spec.command_template.parsed_commands = {command_line};
  return spec;
}

common::Result<domain::ExecutionResult> FakeExecutor::execute(domain::Command &command) {
  calls_.fetch_add(1);
  if (fail_dispatch.load()) {
    return common::Result<domain::ExecutionResult>::failure(common::ErrorCode::Dispatch,
                                                            "executor unavailable");
  }
  {
    std::lock_guard<std::mutex> lock(mutex_);
    executed_.push_back(command.parsed_command());
  }

  auto result = domain::ExecutionResult::begin(command);
  if (auto started = command.start_execution(); !started.ok()) {
    return common::Result<domain::ExecutionResult>::failure(started);
  }
  const int code = exit_code.load();
  if (auto done = command.complete_execution(code, "fake", "", 0.0); !done.ok()) {
    return common::Result<domain::ExecutionResult>::failure(done);
  }
  result.exit_code = code;
  result.success = code == 0;
  result.stdout_text = "fake";
  result.completed_at = common::utc_now();
  return common::Result<domain::ExecutionResult>::success(std::move(result));
}

std::vector<std::string> FakeExecutor::executed() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return executed_;
}

void CapturingObserver::record_event(const observability::ObserverEvent &event) {
  std::lock_guard<std::mutex> lock(mutex_);
  events_.push_back(event);
}

void CapturingObserver::record_metric(const observability::ObserverMetric &) {
  std::lock_guard<std::mutex> lock(mutex_);
  ++metrics_;
}

std::vector<observability::ObserverEvent> CapturingObserver::events() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return events_;
}

std::size_t CapturingObserver::metric_count() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return metrics_;
}

std::vector<std::string> CapturingObserver::transitions(const std::string &schedule_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<std::string> out;
  for (const auto &event : events_) {
    if (const auto *transition = std::get_if<observability::ScheduleTransitionEvent>(&event);
        transition != nullptr && transition->schedule_id == schedule_id) {
      out.push_back(transition->from + "->" + transition->to);
    }
  }
  return out;
}

ObserverCapture::ObserverCapture() {
  auto observer = std::make_unique<CapturingObserver>();
  observer_ = observer.get();
  observability::set_global_observer(std::move(observer));
}

ObserverCapture::~ObserverCapture() { observability::set_global_observer(nullptr); }

bool wait_until(const std::function<bool()> &condition, const std::chrono::milliseconds timeout) {
  const auto deadline = std::chrono::steady_clock::now() + timeout;
  while (std::chrono::steady_clock::now() < deadline) {
    if (condition()) {
      return true;
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(10));
  }
  return condition();
}

bool process_exists(const pid_t pid) {
  if (pid <= 0) {
    return false;
  }
  if (kill(pid, 0) != 0 && errno != EPERM) {
    return false;
  }
  // Orphans are reparented to whatever reaps them; until then they linger as zombies.
  std::ifstream stat("/proc/" + std::to_string(pid) + "/stat");
  std::string line;
  if (!std::getline(stat, line)) {
    return false;
  }
  const auto close_paren = line.rfind(')');
  return close_paren == std::string::npos || close_paren + 2 >= line.size() ||
         line[close_paren + 2] != 'Z';
}

pid_t read_pid_file(const std::filesystem::path &path, const std::chrono::milliseconds timeout) {
  pid_t pid = -1;
  const bool found = wait_until(
      [&] {
        std::ifstream in(path);
        return static_cast<bool>(in >> pid) && pid > 0;
      },
      timeout);
  if (!found) {
    throw std::runtime_error("no pid written to " + path.string());
  }
  return pid;
}

} // namespace execai::testing
