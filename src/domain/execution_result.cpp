#include "execai/domain/execution_result.hpp"

#include "execai/common/id.hpp"
#include "execai/domain/command.hpp"

namespace execai::domain {

ExecutionResult ExecutionResult::begin(const Command &command) {
  ExecutionResult result;
  result.id = common::generate_uuid();
  result.command_id = command.id();
  result.schedule_id = command.schedule_id();
  result.started_at = common::utc_now();
  result.environment = command.environment();
  result.working_directory = command.working_directory();
  return result;
}

std::optional<double> ExecutionResult::duration() const {
  if (!completed_at.has_value()) {
    return std::nullopt;
  }
  return common::seconds_between(started_at, *completed_at);
}

bool ExecutionResult::is_successful() const {
  return success && (!exit_code.has_value() || *exit_code == 0);
}

std::string ExecutionResult::describe() const {
  return "ExecutionResult(id=" + id + ", command_id=" + command_id +
         ", status=" + (is_successful() ? "SUCCESS" : "FAILED") + ")";
}

} // namespace execai::domain
