#include "execai/observability/global.hpp"

#include <mutex>

namespace execai::observability {

namespace {

std::mutex g_observer_mutex;
std::unique_ptr<IObserver> g_observer;

} // namespace

void set_global_observer(std::unique_ptr<IObserver> observer) {
  std::lock_guard<std::mutex> lock(g_observer_mutex);
  g_observer = std::move(observer);
}

IObserver *get_global_observer() {
  std::lock_guard<std::mutex> lock(g_observer_mutex);
  return g_observer.get();
}

// Dispatch happens under the slot mutex so an observer cannot be destroyed mid-call.
void record_event(const ObserverEvent &event) {
  std::lock_guard<std::mutex> lock(g_observer_mutex);
  if (g_observer != nullptr) {
    g_observer->record_event(event);
  }
}

void record_metric(const ObserverMetric &metric) {
  std::lock_guard<std::mutex> lock(g_observer_mutex);
  if (g_observer != nullptr) {
    g_observer->record_metric(metric);
  }
}

void record_execution_start(const std::string &command_id, const std::string &command_line) {
  record_event(ExecutionStartEvent{.command_id = command_id, .command_line = command_line});
}

void record_execution_end(const std::string &command_id, std::chrono::milliseconds duration,
                          std::optional<int> exit_code, const bool success,
                          const bool timed_out) {
  record_event(ExecutionEndEvent{.command_id = command_id,
                                 .duration = duration,
                                 .exit_code = exit_code,
                                 .success = success,
                                 .timed_out = timed_out});
  record_metric(ExecutionLatencyMetric{.latency = duration});
}

void record_execution_cancelled(const std::string &command_id) {
  record_event(ExecutionCancelEvent{.command_id = command_id});
}

void record_schedule_added(const std::string &schedule_id, const std::string &name) {
  record_event(ScheduleAddedEvent{.schedule_id = schedule_id, .name = name});
}

void record_schedule_removed(const std::string &schedule_id) {
  record_event(ScheduleRemovedEvent{.schedule_id = schedule_id});
}

void record_schedule_fired(const std::string &schedule_id, const std::size_t command_count) {
  record_event(ScheduleFiredEvent{.schedule_id = schedule_id, .command_count = command_count});
}

void record_schedule_transition(const std::string &schedule_id, const std::string &from,
                                const std::string &to) {
  record_event(ScheduleTransitionEvent{.schedule_id = schedule_id, .from = from, .to = to});
}

void record_scheduler_tick(const std::size_t due) { record_event(SchedulerTickEvent{.due = due}); }

void record_warning(const std::string &component, const std::string &message) {
  record_event(WarningEvent{.component = component, .message = message});
}

void record_error(const std::string &component, const std::string &message) {
  record_event(ErrorEvent{.component = component, .message = message});
}

} // namespace execai::observability
