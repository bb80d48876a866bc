#include "execai/scheduler/materializer.hpp"

#include "execai/security/policy.hpp"

namespace execai::scheduler {

common::Result<std::vector<domain::Command>>
materialize_commands(const domain::Schedule &schedule, const MaterializerOptions &options) {
  using CommandsResult = common::Result<std::vector<domain::Command>>;

  const auto &command_template = schedule.command_template();
  if (command_template.parsed_commands.empty()) {
    return CommandsResult::failure(common::ErrorCode::Dispatch,
                                   "schedule " + schedule.id() + " has no commands to run");
  }

  const domain::CommandType type = schedule.schedule_type() == domain::ScheduleType::Cron
                                       ? domain::CommandType::Cron
                                       : domain::CommandType::Scheduled;
  const bool safe_mode = command_template.safe_mode.value_or(options.safe_mode);
  const std::int64_t timeout =
      command_template.timeout_secs.value_or(options.default_timeout_secs);

  std::vector<domain::Command> commands;
  commands.reserve(command_template.parsed_commands.size());
  for (const auto &parsed : command_template.parsed_commands) {
    auto command = domain::Command::create(domain::CommandSpec{
        .original_request = command_template.original_request,
        .parsed_command = parsed,
        .command_type = type,
        .working_directory = command_template.working_directory,
        .environment = command_template.environment,
        .timeout_secs = timeout,
        // Confirmation happened when the schedule was accepted.
        .requires_confirmation = false,
        .safe_mode = safe_mode,
        .allowed_in_safe_mode = security::is_command_allowlisted(parsed, options.allowed_commands),
        .schedule_id = schedule.id(),
        .parent_command_id = std::nullopt,
    });
    if (!command.ok()) {
      return CommandsResult::failure(common::ErrorCode::Dispatch,
                                     "cannot materialize '" + parsed + "': " + command.error());
    }
    commands.push_back(std::move(command.value()));
  }
  return CommandsResult::success(std::move(commands));
}

CommandMaterializer make_default_materializer(MaterializerOptions options) {
  return [options = std::move(options)](const domain::Schedule &schedule) {
    return materialize_commands(schedule, options);
  };
}

} // namespace execai::scheduler
