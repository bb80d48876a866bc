#include "execai/domain/schedule.hpp"

#include "execai/common/fs.hpp"
#include "execai/common/id.hpp"

namespace execai::domain {

common::Result<Schedule> Schedule::create(ScheduleSpec spec, const common::Timestamp now) {
  using ScheduleResult = common::Result<Schedule>;

  const std::string name = common::trim(spec.name);
  if (name.empty()) {
    return ScheduleResult::failure(common::ErrorCode::Validation,
                                   "schedule name must not be empty");
  }
  if (spec.max_executions.has_value() && *spec.max_executions <= 0) {
    return ScheduleResult::failure(common::ErrorCode::Validation,
                                   "max_executions must be positive");
  }
  if (spec.max_retries < 0) {
    return ScheduleResult::failure(common::ErrorCode::Validation,
                                   "max_retries must be non-negative");
  }
  if (spec.start_time.has_value() && spec.end_time.has_value() &&
      *spec.end_time < *spec.start_time) {
    return ScheduleResult::failure(common::ErrorCode::Validation,
                                   "end_time must not precede start_time");
  }

  std::optional<scheduler::CronExpression> cron;
  if (spec.cron_expression.has_value()) {
    auto parsed = scheduler::CronExpression::parse(*spec.cron_expression);
    if (!parsed.ok()) {
      return ScheduleResult::failure(common::ErrorCode::Validation,
                                     "invalid cron expression '" + *spec.cron_expression +
                                         "': " + parsed.error());
    }
    cron = std::move(parsed.value());
  }

  Schedule schedule;
  schedule.id_ = common::generate_uuid();
  schedule.name_ = name;
  schedule.description_ = std::move(spec.description);
  schedule.schedule_type_ = spec.schedule_type;
  schedule.status_ = spec.status;
  schedule.cron_expression_ = std::move(spec.cron_expression);
  schedule.cron_ = std::move(cron);
  schedule.start_time_ = spec.start_time;
  schedule.end_time_ = spec.end_time;
  schedule.max_executions_ = spec.max_executions;
  schedule.max_retries_ = spec.max_retries;
  schedule.command_template_ = std::move(spec.command_template);
  schedule.created_at_ = common::utc_now();
  schedule.updated_at_ = schedule.created_at_;
  schedule.next_run_ = schedule.calculate_next_run(now);
  return ScheduleResult::success(std::move(schedule));
}

bool Schedule::is_terminal() const {
  return status_ == ScheduleStatus::Completed || status_ == ScheduleStatus::Failed;
}

bool Schedule::is_expired(const common::Timestamp now) const {
  return end_time_.has_value() && now > *end_time_;
}

bool Schedule::should_execute(const common::Timestamp now) const {
  if (status_ != ScheduleStatus::Active || !next_run_.has_value() || now < *next_run_) {
    return false;
  }
  if (max_executions_.has_value() && execution_count_ >= *max_executions_) {
    return false;
  }
  return !is_expired(now);
}

std::optional<common::Timestamp> Schedule::calculate_next_run(const common::Timestamp now) const {
  switch (schedule_type_) {
  case ScheduleType::Once:
    if (execution_count_ > 0) {
      return std::nullopt;
    }
    return start_time_;
  case ScheduleType::Recurring:
  case ScheduleType::Cron:
    if (!cron_.has_value()) {
      return std::nullopt;
    }
    if (start_time_.has_value() && *start_time_ > now) {
      return cron_->next_occurrence_from(*start_time_);
    }
    return cron_->next_occurrence(now);
  }
  return std::nullopt;
}

void Schedule::update_next_run(const common::Timestamp now) {
  next_run_ = calculate_next_run(now);
  touch();
}

void Schedule::record_successful_run(const common::Timestamp now) {
  ++execution_count_;
  last_run_ = now;
  retry_count_ = 0;
  if (schedule_type_ == ScheduleType::Once) {
    next_run_.reset();
    status_ = ScheduleStatus::Completed;
  } else {
    next_run_ = calculate_next_run(now);
    if (max_executions_.has_value() && execution_count_ >= *max_executions_) {
      status_ = ScheduleStatus::Completed;
    }
  }
  touch();
}

void Schedule::record_failed_dispatch() {
  ++retry_count_;
  if (!has_retries_left()) {
    status_ = ScheduleStatus::Failed;
  }
  touch();
}

bool Schedule::pause() {
  if (status_ != ScheduleStatus::Active) {
    return false;
  }
  status_ = ScheduleStatus::Paused;
  touch();
  return true;
}

bool Schedule::resume(const common::Timestamp now) {
  if (status_ != ScheduleStatus::Paused) {
    return false;
  }
  status_ = ScheduleStatus::Active;
  update_next_run(now);
  return true;
}

void Schedule::complete() {
  status_ = ScheduleStatus::Completed;
  touch();
}

void Schedule::fail() {
  status_ = ScheduleStatus::Failed;
  touch();
}

std::string Schedule::describe() const {
  return "Schedule(id=" + id_ + ", name='" + name_ + "', type=" +
         label(to_string(schedule_type_)) + ", status=" + label(to_string(status_)) +
         ", next_run=" + common::format_iso8601(next_run_, "none") + ")";
}

void Schedule::touch() { updated_at_ = common::utc_now(); }

} // namespace execai::domain
