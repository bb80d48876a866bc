#include "execai/domain/command.hpp"

#include "execai/common/fs.hpp"
#include "execai/common/id.hpp"
#include "execai/security/policy.hpp"

namespace execai::domain {

common::Result<Command> Command::create(CommandSpec spec) {
  const std::string parsed = common::trim(spec.parsed_command);
  if (parsed.empty()) {
    return common::Result<Command>::failure(common::ErrorCode::Validation,
                                            "parsed command must not be empty");
  }
  if (spec.timeout_secs <= 0) {
    return common::Result<Command>::failure(common::ErrorCode::Validation,
                                            "timeout must be a positive number of seconds");
  }
  for (const auto &entry : spec.environment) {
    const std::string &key = entry.first;
    if (key.empty() || key.find('=') != std::string::npos) {
      return common::Result<Command>::failure(common::ErrorCode::Validation,
                                              "invalid environment variable name: '" + key + "'");
    }
  }

  Command command;
  command.id_ = common::generate_uuid();
  command.original_request_ = std::move(spec.original_request);
  command.parsed_command_ = parsed;
  command.command_type_ = spec.command_type;
  command.working_directory_ = std::move(spec.working_directory);
  command.environment_ = std::move(spec.environment);
  command.timeout_secs_ = spec.timeout_secs;
  command.requires_confirmation_ = spec.requires_confirmation;
  command.safe_mode_ = spec.safe_mode;
  command.allowed_in_safe_mode_ = spec.allowed_in_safe_mode;
  command.schedule_id_ = std::move(spec.schedule_id);
  command.parent_command_id_ = std::move(spec.parent_command_id);
  command.created_at_ = common::utc_now();
  command.updated_at_ = command.created_at_;
  return common::Result<Command>::success(std::move(command));
}

bool Command::is_safe_command() const { return security::is_safe_command(parsed_command_); }

bool Command::can_execute() const {
  return status_ == CommandStatus::Pending && (!safe_mode_ || is_safe_command());
}

common::Status Command::start_execution() {
  if (status_ != CommandStatus::Pending) {
    return common::Status::error(common::ErrorCode::InvalidState,
                                 "cannot start command in state " +
                                     label(to_string(status_)));
  }
  status_ = CommandStatus::Running;
  executed_at_ = common::utc_now();
  touch();
  return common::Status::success();
}

common::Status Command::complete_execution(const int exit_code, std::string stdout_text,
                                           std::string stderr_text,
                                           const double execution_time_secs) {
  if (status_ != CommandStatus::Running) {
    return common::Status::error(common::ErrorCode::InvalidState,
                                 "cannot complete command in state " +
                                     label(to_string(status_)));
  }
  exit_code_ = exit_code;
  stdout_ = std::move(stdout_text);
  stderr_ = std::move(stderr_text);
  execution_time_ = execution_time_secs;
  status_ = exit_code == 0 ? CommandStatus::Completed : CommandStatus::Failed;
  completed_at_ = common::utc_now();
  touch();
  return common::Status::success();
}

common::Status Command::cancel_execution() {
  if (status_ != CommandStatus::Pending && status_ != CommandStatus::Running) {
    return common::Status::error(common::ErrorCode::InvalidState,
                                 "cannot cancel command in state " +
                                     label(to_string(status_)));
  }
  status_ = CommandStatus::Cancelled;
  completed_at_ = common::utc_now();
  touch();
  return common::Status::success();
}

void Command::set_safe_mode(const bool enabled) {
  safe_mode_ = enabled;
  touch();
}

std::string Command::describe() const {
  return "Command(id=" + id_ + ", cmd='" + parsed_command_ + "', status=" +
         label(to_string(status_)) + ")";
}

void Command::touch() { updated_at_ = common::utc_now(); }

} // namespace execai::domain
