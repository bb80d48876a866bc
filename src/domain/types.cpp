#include "execai/domain/types.hpp"

#include "execai/common/fs.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <utility>

namespace execai::domain {

namespace {

template <typename Enum, std::size_t N>
common::Result<Enum> parse_tag(std::string_view tag,
                               const std::array<std::pair<std::string_view, Enum>, N> &table,
                               const std::string &kind) {
  const std::string normalized = common::to_lower(common::trim(std::string(tag)));
  for (const auto &[name, value] : table) {
    if (name == normalized) {
      return common::Result<Enum>::success(value);
    }
  }
  return common::Result<Enum>::failure(common::ErrorCode::Validation,
                                       "unknown " + kind + ": '" + std::string(tag) + "'");
}

constexpr std::array<std::pair<std::string_view, CommandType>, 4> COMMAND_TYPES = {{
    {"system", CommandType::System},
    {"script", CommandType::Script},
    {"scheduled", CommandType::Scheduled},
    {"cron", CommandType::Cron},
}};

constexpr std::array<std::pair<std::string_view, CommandStatus>, 5> COMMAND_STATUSES = {{
    {"pending", CommandStatus::Pending},
    {"running", CommandStatus::Running},
    {"completed", CommandStatus::Completed},
    {"failed", CommandStatus::Failed},
    {"cancelled", CommandStatus::Cancelled},
}};

constexpr std::array<std::pair<std::string_view, ScheduleType>, 3> SCHEDULE_TYPES = {{
    {"once", ScheduleType::Once},
    {"recurring", ScheduleType::Recurring},
    {"cron", ScheduleType::Cron},
}};

constexpr std::array<std::pair<std::string_view, ScheduleStatus>, 5> SCHEDULE_STATUSES = {{
    {"active", ScheduleStatus::Active},
    {"inactive", ScheduleStatus::Inactive},
    {"paused", ScheduleStatus::Paused},
    {"completed", ScheduleStatus::Completed},
    {"failed", ScheduleStatus::Failed},
}};

} // namespace

std::string_view to_string(const CommandType type) {
  switch (type) {
  case CommandType::System:
    return "system";
  case CommandType::Script:
    return "script";
  case CommandType::Scheduled:
    return "scheduled";
  case CommandType::Cron:
    return "cron";
  }
  return "system";
}

std::string_view to_string(const CommandStatus status) {
  switch (status) {
  case CommandStatus::Pending:
    return "pending";
  case CommandStatus::Running:
    return "running";
  case CommandStatus::Completed:
    return "completed";
  case CommandStatus::Failed:
    return "failed";
  case CommandStatus::Cancelled:
    return "cancelled";
  }
  return "pending";
}

std::string_view to_string(const ScheduleType type) {
  switch (type) {
  case ScheduleType::Once:
    return "once";
  case ScheduleType::Recurring:
    return "recurring";
  case ScheduleType::Cron:
    return "cron";
  }
  return "once";
}

std::string_view to_string(const ScheduleStatus status) {
  switch (status) {
  case ScheduleStatus::Active:
    return "active";
  case ScheduleStatus::Inactive:
    return "inactive";
  case ScheduleStatus::Paused:
    return "paused";
  case ScheduleStatus::Completed:
    return "completed";
  case ScheduleStatus::Failed:
    return "failed";
  }
  return "active";
}

common::Result<CommandType> parse_command_type(std::string_view tag) {
  return parse_tag(tag, COMMAND_TYPES, "command type");
}

common::Result<CommandStatus> parse_command_status(std::string_view tag) {
  return parse_tag(tag, COMMAND_STATUSES, "command status");
}

common::Result<ScheduleType> parse_schedule_type(std::string_view tag) {
  return parse_tag(tag, SCHEDULE_TYPES, "schedule type");
}

common::Result<ScheduleStatus> parse_schedule_status(std::string_view tag) {
  return parse_tag(tag, SCHEDULE_STATUSES, "schedule status");
}

std::string label(std::string_view tag) {
  std::string out(tag);
  std::transform(out.begin(), out.end(), out.begin(),
                 [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
  return out;
}

} // namespace execai::domain
