#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

namespace execai::observability {

struct ExecutionStartEvent {
  std::string command_id;
  std::string command_line;
};

struct ExecutionEndEvent {
  std::string command_id;
  std::chrono::milliseconds duration{0};
  std::optional<int> exit_code;
  bool success = false;
  bool timed_out = false;
};

struct ExecutionCancelEvent {
  std::string command_id;
};

struct ScheduleAddedEvent {
  std::string schedule_id;
  std::string name;
};

struct ScheduleRemovedEvent {
  std::string schedule_id;
};

struct ScheduleFiredEvent {
  std::string schedule_id;
  std::size_t command_count = 0;
};

struct ScheduleTransitionEvent {
  std::string schedule_id;
  std::string from;
  std::string to;
};

struct SchedulerTickEvent {
  std::size_t due = 0;
};

struct WarningEvent {
  std::string component;
  std::string message;
};

struct ErrorEvent {
  std::string component;
  std::string message;
};

using ObserverEvent =
    std::variant<ExecutionStartEvent, ExecutionEndEvent, ExecutionCancelEvent, ScheduleAddedEvent,
                 ScheduleRemovedEvent, ScheduleFiredEvent, ScheduleTransitionEvent,
                 SchedulerTickEvent, WarningEvent, ErrorEvent>;

struct ExecutionLatencyMetric {
  std::chrono::milliseconds latency{0};
};

struct RunningExecutionsMetric {
  std::uint64_t count = 0;
};

struct RegisteredSchedulesMetric {
  std::uint64_t count = 0;
};

using ObserverMetric =
    std::variant<ExecutionLatencyMetric, RunningExecutionsMetric, RegisteredSchedulesMetric>;

class IObserver {
public:
  virtual ~IObserver() = default;

  virtual void record_event(const ObserverEvent &event) = 0;
  virtual void record_metric(const ObserverMetric &metric) = 0;
  virtual void flush() {}
  [[nodiscard]] virtual std::string_view name() const = 0;
};

} // namespace execai::observability
