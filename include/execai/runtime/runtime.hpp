#pragma once

#include "execai/common/result.hpp"
#include "execai/config/schema.hpp"
#include "execai/domain/command.hpp"
#include "execai/executor/executor.hpp"
#include "execai/scheduler/scheduler.hpp"

#include <memory>
#include <string>

namespace execai::runtime {

[[nodiscard]] executor::ExecutorOptions executor_options(const config::Config &config);
[[nodiscard]] scheduler::SchedulerOptions scheduler_options(const config::Config &config);
[[nodiscard]] scheduler::MaterializerOptions materializer_options(const config::Config &config);

/// Owns the executor and the scheduler built from one configuration.
/// Teardown order: scheduler loop, then executor, then outstanding dispatches.
class Runtime {
public:
  explicit Runtime(config::Config config);
  ~Runtime();

  Runtime(const Runtime &) = delete;
  Runtime &operator=(const Runtime &) = delete;

  [[nodiscard]] static common::Result<std::unique_ptr<Runtime>> from_disk();

  [[nodiscard]] const config::Config &config() const { return config_; }
  [[nodiscard]] executor::Executor &executor() { return *executor_; }
  [[nodiscard]] scheduler::Scheduler &scheduler() { return *scheduler_; }

  /// Installs the configured observer as the process-wide one.
  void install_observer() const;

  /// Starts the scheduler loop unless `[scheduler] enabled = false`. Returns whether it runs.
  bool start();
  void shutdown();

  /// Command defaults taken from the configuration; the allow-list flag is precomputed.
  [[nodiscard]] domain::CommandSpec command_spec(const std::string &command_line) const;

private:
  config::Config config_;
  std::unique_ptr<executor::Executor> executor_;
  std::unique_ptr<scheduler::Scheduler> scheduler_;
  bool shut_down_ = false;
};

} // namespace execai::runtime
