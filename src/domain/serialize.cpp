#include "execai/domain/serialize.hpp"

#include "execai/common/json_util.hpp"

#include <cstdio>
#include <sstream>

namespace execai::domain {

namespace {

std::string json_timestamp(const std::optional<common::Timestamp> &instant) {
  return instant.has_value() ? common::json_quote(common::format_iso8601(*instant)) : "null";
}

std::string json_timestamp(const common::Timestamp instant) {
  return common::json_quote(common::format_iso8601(instant));
}

std::string json_number(const std::optional<double> &value) {
  if (!value.has_value()) {
    return "null";
  }
  char buffer[64];
  std::snprintf(buffer, sizeof(buffer), "%.6f", *value);
  return buffer;
}

template <typename Int> std::string json_int(const std::optional<Int> &value) {
  return value.has_value() ? std::to_string(*value) : "null";
}

std::string json_bool(const bool value) { return value ? "true" : "false"; }

std::string json_environment(const std::map<std::string, std::string> &environment) {
  return common::json_string_map(environment);
}

} // namespace

std::string to_json(const Command &command) {
  std::ostringstream out;
  out << "{";
  out << "\"id\":" << common::json_quote(command.id());
  out << ",\"original_request\":" << common::json_quote(command.original_request());
  out << ",\"parsed_command\":" << common::json_quote(command.parsed_command());
  out << ",\"command_type\":" << common::json_quote(std::string(to_string(command.command_type())));
  out << ",\"status\":" << common::json_quote(std::string(to_string(command.status())));
  out << ",\"working_directory\":" << common::json_optional(command.working_directory());
  out << ",\"environment_variables\":" << json_environment(command.environment());
  out << ",\"timeout\":" << command.timeout_secs();
  out << ",\"requires_confirmation\":" << json_bool(command.requires_confirmation());
  out << ",\"safe_mode\":" << json_bool(command.safe_mode());
  out << ",\"allowed_in_safe_mode\":" << json_bool(command.allowed_in_safe_mode());
  out << ",\"created_at\":" << json_timestamp(command.created_at());
  out << ",\"updated_at\":" << json_timestamp(command.updated_at());
  out << ",\"executed_at\":" << json_timestamp(command.executed_at());
  out << ",\"completed_at\":" << json_timestamp(command.completed_at());
  out << ",\"exit_code\":" << json_int(command.exit_code());
  out << ",\"stdout\":" << common::json_quote(command.stdout_text());
  out << ",\"stderr\":" << common::json_quote(command.stderr_text());
  out << ",\"execution_time\":" << json_number(command.execution_time());
  out << ",\"schedule_id\":" << common::json_optional(command.schedule_id());
  out << ",\"parent_command_id\":" << common::json_optional(command.parent_command_id());
  out << "}";
  return out.str();
}

std::string to_json(const ExecutionResult &result) {
  std::ostringstream out;
  out << "{";
  out << "\"id\":" << common::json_quote(result.id);
  out << ",\"command_id\":" << common::json_quote(result.command_id);
  out << ",\"schedule_id\":" << common::json_optional(result.schedule_id);
  out << ",\"started_at\":" << json_timestamp(result.started_at);
  out << ",\"completed_at\":" << json_timestamp(result.completed_at);
  out << ",\"duration\":" << json_number(result.duration());
  out << ",\"success\":" << json_bool(result.success);
  out << ",\"exit_code\":" << json_int(result.exit_code);
  out << ",\"stdout\":" << common::json_quote(result.stdout_text);
  out << ",\"stderr\":" << common::json_quote(result.stderr_text);
  out << ",\"environment\":" << json_environment(result.environment);
  out << ",\"working_directory\":" << common::json_optional(result.working_directory);
  out << ",\"memory_usage\":" << json_number(result.memory_usage_mb);
  out << ",\"cpu_usage\":" << json_number(result.cpu_usage_percent);
  out << ",\"timed_out\":" << json_bool(result.timed_out);
  out << ",\"cancelled\":" << json_bool(result.cancelled);
  out << "}";
  return out.str();
}

std::string to_json(const CommandTemplate &command_template) {
  std::ostringstream out;
  out << "{";
  out << "\"original_request\":" << common::json_quote(command_template.original_request);
  out << ",\"parsed_commands\":" << common::json_string_array(command_template.parsed_commands);
  out << ",\"working_directory\":" << common::json_optional(command_template.working_directory);
  out << ",\"environment\":" << json_environment(command_template.environment);
  out << ",\"timeout_secs\":" << json_int(command_template.timeout_secs);
  out << ",\"safe_mode\":"
      << (command_template.safe_mode.has_value() ? json_bool(*command_template.safe_mode)
                                                 : "null");
  out << "}";
  return out.str();
}

std::string to_json(const Schedule &schedule) {
  std::ostringstream out;
  out << "{";
  out << "\"id\":" << common::json_quote(schedule.id());
  out << ",\"name\":" << common::json_quote(schedule.name());
  out << ",\"description\":" << common::json_optional(schedule.description());
  out << ",\"schedule_type\":"
      << common::json_quote(std::string(to_string(schedule.schedule_type())));
  out << ",\"status\":" << common::json_quote(std::string(to_string(schedule.status())));
  out << ",\"cron_expression\":" << common::json_optional(schedule.cron_expression());
  out << ",\"start_time\":" << json_timestamp(schedule.start_time());
  out << ",\"end_time\":" << json_timestamp(schedule.end_time());
  out << ",\"next_run\":" << json_timestamp(schedule.next_run());
  out << ",\"last_run\":" << json_timestamp(schedule.last_run());
  out << ",\"max_executions\":" << json_int(schedule.max_executions());
  out << ",\"execution_count\":" << schedule.execution_count();
  out << ",\"retry_count\":" << schedule.retry_count();
  out << ",\"max_retries\":" << schedule.max_retries();
  out << ",\"command_template\":" << to_json(schedule.command_template());
  out << ",\"created_at\":" << json_timestamp(schedule.created_at());
  out << ",\"updated_at\":" << json_timestamp(schedule.updated_at());
  out << "}";
  return out.str();
}

} // namespace execai::domain
