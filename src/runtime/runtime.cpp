#include "execai/runtime/runtime.hpp"

#include "execai/config/config.hpp"
#include "execai/observability/factory.hpp"
#include "execai/observability/global.hpp"
#include "execai/security/policy.hpp"

namespace execai::runtime {

executor::ExecutorOptions executor_options(const config::Config &config) {
  return executor::ExecutorOptions{
      .grace_period = executor::DEFAULT_GRACE_PERIOD,
      .max_output_bytes = config.executor.max_output_bytes,
      .shell = config.executor.shell,
  };
}

scheduler::SchedulerOptions scheduler_options(const config::Config &config) {
  return scheduler::SchedulerOptions{
      .poll_interval = std::chrono::milliseconds(config.scheduler.poll_interval_ms),
      .error_backoff = std::chrono::milliseconds(config.scheduler.error_backoff_ms),
  };
}

scheduler::MaterializerOptions materializer_options(const config::Config &config) {
  return scheduler::MaterializerOptions{
      .default_timeout_secs = config.executor.default_timeout_secs,
      .safe_mode = config.safety.safe_mode,
      .allowed_commands = config.safety.allowed_commands,
  };
}

Runtime::Runtime(config::Config config)
    : config_(std::move(config)),
      executor_(std::make_unique<executor::Executor>(executor_options(config_))),
      scheduler_(std::make_unique<scheduler::Scheduler>(
          *executor_, scheduler_options(config_),
          scheduler::make_default_materializer(materializer_options(config_)))) {}

Runtime::~Runtime() { shutdown(); }

common::Result<std::unique_ptr<Runtime>> Runtime::from_disk() {
  auto loaded = config::load_config();
  if (!loaded.ok()) {
    return common::Result<std::unique_ptr<Runtime>>::failure(loaded.code(), loaded.error());
  }
  auto validated = config::validate_config(loaded.value());
  if (!validated.ok()) {
    return common::Result<std::unique_ptr<Runtime>>::failure(validated.code(), validated.error());
  }
  return common::Result<std::unique_ptr<Runtime>>::success(
      std::make_unique<Runtime>(std::move(loaded.value())));
}

void Runtime::install_observer() const {
  observability::set_global_observer(observability::create_observer(config_));
}

bool Runtime::start() {
  if (!config_.scheduler.enabled || shut_down_) {
    return false;
  }
  scheduler_->start();
  return true;
}

void Runtime::shutdown() {
  if (shut_down_) {
    return;
  }
  shut_down_ = true;
  scheduler_->stop();
  executor_->shutdown();
  scheduler_->drain();
}

domain::CommandSpec Runtime::command_spec(const std::string &command_line) const {
  domain::CommandSpec spec;
  spec.original_request = command_line;
  spec.parsed_command = command_line;
  spec.timeout_secs = config_.executor.default_timeout_secs;
  spec.requires_confirmation = config_.safety.confirmation_required;
  spec.safe_mode = config_.safety.safe_mode;
  spec.allowed_in_safe_mode =
      security::is_command_allowlisted(command_line, config_.safety.allowed_commands);
  return spec;
}

} // namespace execai::runtime
