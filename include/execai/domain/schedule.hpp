#pragma once

#include "execai/common/result.hpp"
#include "execai/common/time.hpp"
#include "execai/domain/types.hpp"
#include "execai/scheduler/cron.hpp"

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace execai::domain {

constexpr std::int64_t DEFAULT_MAX_RETRIES = 3;

/// Everything needed to rebuild the commands each time a schedule fires.
struct CommandTemplate {
  std::string original_request;
  std::vector<std::string> parsed_commands;
  std::optional<std::string> working_directory;
  std::map<std::string, std::string> environment;
  std::optional<std::int64_t> timeout_secs;
  std::optional<bool> safe_mode;
};

struct ScheduleSpec {
  std::string name;
  std::optional<std::string> description;
  ScheduleType schedule_type = ScheduleType::Once;
  ScheduleStatus status = ScheduleStatus::Active;
  std::optional<std::string> cron_expression;
  std::optional<common::Timestamp> start_time;
  std::optional<common::Timestamp> end_time;
  std::optional<std::int64_t> max_executions;
  std::int64_t max_retries = DEFAULT_MAX_RETRIES;
  CommandTemplate command_template;
};

class Schedule {
public:
  /// Validates the spec and computes the first next_run relative to `now`.
  [[nodiscard]] static common::Result<Schedule> create(ScheduleSpec spec,
                                                       common::Timestamp now = common::utc_now());

  [[nodiscard]] const std::string &id() const { return id_; }
  [[nodiscard]] const std::string &name() const { return name_; }
  [[nodiscard]] const std::optional<std::string> &description() const { return description_; }
  [[nodiscard]] ScheduleType schedule_type() const { return schedule_type_; }
  [[nodiscard]] ScheduleStatus status() const { return status_; }
  [[nodiscard]] const std::optional<std::string> &cron_expression() const {
    return cron_expression_;
  }
  [[nodiscard]] const std::optional<common::Timestamp> &start_time() const { return start_time_; }
  [[nodiscard]] const std::optional<common::Timestamp> &end_time() const { return end_time_; }
  [[nodiscard]] const std::optional<common::Timestamp> &next_run() const { return next_run_; }
  [[nodiscard]] const std::optional<common::Timestamp> &last_run() const { return last_run_; }
  [[nodiscard]] const std::optional<std::int64_t> &max_executions() const {
    return max_executions_;
  }
  [[nodiscard]] std::int64_t execution_count() const { return execution_count_; }
  [[nodiscard]] std::int64_t retry_count() const { return retry_count_; }
  [[nodiscard]] std::int64_t max_retries() const { return max_retries_; }
  [[nodiscard]] const CommandTemplate &command_template() const { return command_template_; }
  [[nodiscard]] common::Timestamp created_at() const { return created_at_; }
  [[nodiscard]] common::Timestamp updated_at() const { return updated_at_; }

  [[nodiscard]] bool is_active() const { return status_ == ScheduleStatus::Active; }
  [[nodiscard]] bool is_terminal() const;
  /// False once retry_count has gone past max_retries.
  [[nodiscard]] bool has_retries_left() const { return retry_count_ <= max_retries_; }
  [[nodiscard]] bool is_expired(common::Timestamp now) const;

  [[nodiscard]] bool should_execute(common::Timestamp now) const;
  [[nodiscard]] std::optional<common::Timestamp> calculate_next_run(common::Timestamp now) const;
  void update_next_run(common::Timestamp now);

  /// One dispatch cycle finished: bump counters, reschedule, complete when exhausted.
  void record_successful_run(common::Timestamp now);
  /// Dispatch itself failed: count a retry. The failed attempt that takes retry_count past
  /// max_retries (the first one when max_retries is 0) turns the schedule FAILED.
  void record_failed_dispatch();

  /// ACTIVE -> PAUSED; false (no-op) from any other state.
  bool pause();
  /// PAUSED -> ACTIVE with next_run recomputed; false (no-op) from any other state.
  bool resume(common::Timestamp now);
  void complete();
  void fail();

  [[nodiscard]] std::string describe() const;

private:
  Schedule() = default;
  void touch();

  std::string id_;
  std::string name_;
  std::optional<std::string> description_;
  ScheduleType schedule_type_ = ScheduleType::Once;
  ScheduleStatus status_ = ScheduleStatus::Active;
  std::optional<std::string> cron_expression_;
  std::optional<scheduler::CronExpression> cron_;
  std::optional<common::Timestamp> start_time_;
  std::optional<common::Timestamp> end_time_;
  std::optional<common::Timestamp> next_run_;
  std::optional<common::Timestamp> last_run_;
  std::optional<std::int64_t> max_executions_;
  std::int64_t execution_count_ = 0;
  std::int64_t retry_count_ = 0;
  std::int64_t max_retries_ = DEFAULT_MAX_RETRIES;
  CommandTemplate command_template_;
  common::Timestamp created_at_{};
  common::Timestamp updated_at_{};
};

} // namespace execai::domain
