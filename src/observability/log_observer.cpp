#include "execai/observability/log_observer.hpp"

#include "execai/common/fs.hpp"

#include <iostream>
#include <type_traits>

namespace execai::observability {

namespace {

std::string bool_text(const bool value) { return value ? "true" : "false"; }

} // namespace

std::optional<LogLevel> parse_log_level(const std::string &value) {
  const std::string normalized = common::to_lower(common::trim(value));
  if (normalized == "debug") {
    return LogLevel::Debug;
  }
  if (normalized == "info") {
    return LogLevel::Info;
  }
  if (normalized == "warn" || normalized == "warning") {
    return LogLevel::Warn;
  }
  if (normalized == "error") {
    return LogLevel::Error;
  }
  return std::nullopt;
}

std::string_view log_level_name(const LogLevel level) {
  switch (level) {
  case LogLevel::Debug:
    return "DEBUG";
  case LogLevel::Info:
    return "INFO";
  case LogLevel::Warn:
    return "WARN";
  case LogLevel::Error:
    return "ERROR";
  }
  return "INFO";
}

LogObserver::LogObserver(const LogLevel min_level) : LogObserver(min_level, std::cerr) {}

LogObserver::LogObserver(const LogLevel min_level, std::ostream &out)
    : min_level_(min_level), out_(&out) {}

void LogObserver::log_line(const LogLevel level, const std::string &message) {
  if (static_cast<int>(level) < static_cast<int>(min_level_)) {
    return;
  }
  std::lock_guard<std::mutex> lock(mutex_);
  *out_ << "[" << log_level_name(level) << "] " << message << "\n";
}

void LogObserver::record_event(const ObserverEvent &event) {
  std::visit(
      [this](auto &&evt) {
        using T = std::decay_t<decltype(evt)>;
        if constexpr (std::is_same_v<T, ExecutionStartEvent>) {
          log_line(LogLevel::Info,
                   "execution.start id=" + evt.command_id + " cmd='" + evt.command_line + "'");
        } else if constexpr (std::is_same_v<T, ExecutionEndEvent>) {
          log_line(evt.success ? LogLevel::Info : LogLevel::Warn,
                   "execution.end id=" + evt.command_id +
                       " duration_ms=" + std::to_string(evt.duration.count()) + " exit_code=" +
                       (evt.exit_code.has_value() ? std::to_string(*evt.exit_code)
                                                  : std::string("none")) +
                       " success=" + bool_text(evt.success) +
                       " timed_out=" + bool_text(evt.timed_out));
        } else if constexpr (std::is_same_v<T, ExecutionCancelEvent>) {
          log_line(LogLevel::Info, "execution.cancel id=" + evt.command_id);
        } else if constexpr (std::is_same_v<T, ScheduleAddedEvent>) {
          log_line(LogLevel::Info, "schedule.added id=" + evt.schedule_id + " name=" + evt.name);
        } else if constexpr (std::is_same_v<T, ScheduleRemovedEvent>) {
          log_line(LogLevel::Info, "schedule.removed id=" + evt.schedule_id);
        } else if constexpr (std::is_same_v<T, ScheduleFiredEvent>) {
          log_line(LogLevel::Info, "schedule.fired id=" + evt.schedule_id +
                                       " commands=" + std::to_string(evt.command_count));
        } else if constexpr (std::is_same_v<T, ScheduleTransitionEvent>) {
          log_line(LogLevel::Info, "schedule.transition id=" + evt.schedule_id + " " + evt.from +
                                       " -> " + evt.to);
        } else if constexpr (std::is_same_v<T, SchedulerTickEvent>) {
          log_line(LogLevel::Debug, "scheduler.tick due=" + std::to_string(evt.due));
        } else if constexpr (std::is_same_v<T, WarningEvent>) {
          log_line(LogLevel::Warn, evt.component + ": " + evt.message);
        } else if constexpr (std::is_same_v<T, ErrorEvent>) {
          log_line(LogLevel::Error, evt.component + ": " + evt.message);
        }
      },
      event);
}

void LogObserver::record_metric(const ObserverMetric &metric) {
  std::visit(
      [this](auto &&m) {
        using T = std::decay_t<decltype(m)>;
        if constexpr (std::is_same_v<T, ExecutionLatencyMetric>) {
          log_line(LogLevel::Debug,
                   "metric.execution_latency_ms=" + std::to_string(m.latency.count()));
        } else if constexpr (std::is_same_v<T, RunningExecutionsMetric>) {
          log_line(LogLevel::Debug, "metric.running_executions=" + std::to_string(m.count));
        } else if constexpr (std::is_same_v<T, RegisteredSchedulesMetric>) {
          log_line(LogLevel::Debug, "metric.registered_schedules=" + std::to_string(m.count));
        }
      },
      metric);
}

void LogObserver::flush() {
  std::lock_guard<std::mutex> lock(mutex_);
  out_->flush();
}

} // namespace execai::observability
