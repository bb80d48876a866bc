#pragma once

#include "execai/common/result.hpp"

#include <string>
#include <string_view>

namespace execai::domain {

enum class CommandType { System, Script, Scheduled, Cron };
enum class CommandStatus { Pending, Running, Completed, Failed, Cancelled };
enum class ScheduleType { Once, Recurring, Cron };
enum class ScheduleStatus { Active, Inactive, Paused, Completed, Failed };

/// Lower-case tags used on every external boundary ("pending", "cron", ...).
[[nodiscard]] std::string_view to_string(CommandType type);
[[nodiscard]] std::string_view to_string(CommandStatus status);
[[nodiscard]] std::string_view to_string(ScheduleType type);
[[nodiscard]] std::string_view to_string(ScheduleStatus status);

[[nodiscard]] common::Result<CommandType> parse_command_type(std::string_view tag);
[[nodiscard]] common::Result<CommandStatus> parse_command_status(std::string_view tag);
[[nodiscard]] common::Result<ScheduleType> parse_schedule_type(std::string_view tag);
[[nodiscard]] common::Result<ScheduleStatus> parse_schedule_status(std::string_view tag);

/// Upper-case label for human-readable output ("PENDING").
[[nodiscard]] std::string label(std::string_view tag);

} // namespace execai::domain
